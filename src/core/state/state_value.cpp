#include <flowcore/core/state/state_value.hpp>

#include <type_traits>

namespace FlowCore {

size_t estimateValueSize(const StateValue& value) {
    return std::visit([](const auto& v) -> size_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0;
        } else if constexpr (std::is_same_v<T, bool>) {
            return 4;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return 8;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v.size() * 2;
        } else {
            return v.size();
        }
    }, value);
}

size_t estimateNamespaceSize(const std::string& ns, const std::map<std::string, StateValue>& entries) {
    size_t total = ns.size() * 2;
    for (const auto& [key, value] : entries) {
        total += key.size() * 2 + estimateValueSize(value);
    }
    return total;
}

} // namespace FlowCore
