#include <flowcore/core/runtime/runtime.hpp>
#include <flowcore/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace FlowCore {

Runtime::Runtime(AppConfig::AppConfiguration config, ObservabilitySinkPtr sink)
    : config_(std::move(config)),
      sink_(sink ? std::move(sink) : std::make_shared<SpdlogObservability>()),
      execution_id_("exec-" + std::to_string(Clock::epoch_ms())),
      timers_("runtime") {
    spdlog::info("[Runtime] initialized (tenant={}, execution={}, sink={})",
                 config_.tenant_id, execution_id_, sink_->name());
}

Runtime::~Runtime() noexcept {
    spdlog::info("[DESTRUCTOR] Runtime being destroyed...");
    timers_.shutdown();
}

} // namespace FlowCore
