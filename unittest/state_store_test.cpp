// ============================================================================
// STATE STORE UNIT TESTS
// ============================================================================
// Tests for the concurrent and simple state stores, capacity ceilings, size
// estimation and the store registry
// ============================================================================

#include <gtest/gtest.h>
#include <flowcore/core/errors.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <flowcore/core/runtime/runtime.hpp>
#include <flowcore/core/state/concurrent_state_store.hpp>
#include <flowcore/core/state/simple_state_store.hpp>
#include <flowcore/core/state/state_store_registry.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace FlowCore;
using namespace std::chrono_literals;

namespace {

StateStoreOptions smallOptions(size_t max_namespaces, size_t max_keys) {
    StateStoreOptions options;
    options.maxNamespaces = max_namespaces;
    options.maxKeysPerNamespace = max_keys;
    options.gcInterval = 0ms;
    return options;
}

class StateStoreTest : public ::testing::Test {
protected:
    StateStoreTest() : runtime_(AppConfig::AppConfiguration{}, std::make_shared<NullObservability>()) {}

    std::vector<std::unique_ptr<StateStore>> bothStores(const StateStoreOptions& options) {
        std::vector<std::unique_ptr<StateStore>> stores;
        stores.push_back(std::make_unique<ConcurrentStateStore>(runtime_, options));
        stores.push_back(std::make_unique<SimpleStateStore>(options));
        return stores;
    }

    Runtime runtime_;
};

} // namespace

// ============================================================================
// VALUE TESTS
// ============================================================================

TEST(StateValue, EstimatesSizeByType) {
    EXPECT_EQ(estimateValueSize(StateValue{}), 0u);
    EXPECT_EQ(estimateValueSize(StateValue{true}), 4u);
    EXPECT_EQ(estimateValueSize(StateValue{int64_t{42}}), 8u);
    EXPECT_EQ(estimateValueSize(StateValue{2.5}), 8u);
    EXPECT_EQ(estimateValueSize(StateValue{std::string("hello")}), 10u);
    EXPECT_EQ(estimateValueSize(StateValue{StateBlob{1, 2, 3}}), 3u);
}

TEST(StateValue, EstimatesNamespaceSize) {
    std::map<std::string, StateValue> entries{
        {"k", StateValue{std::string("xyz")}},
        {"n", StateValue{int64_t{1}}},
    };
    // "ab" 4 + "k" 2 + "xyz" 6 + "n" 2 + int 8
    EXPECT_EQ(estimateNamespaceSize("ab", entries), 22u);
}

// ============================================================================
// COMMON BEHAVIOUR (BOTH STORES)
// ============================================================================

TEST_F(StateStoreTest, SetGetHasErase) {
    for (auto& store : bothStores(smallOptions(10, 10))) {
        SCOPED_TRACE(store->name());

        store->set("session", "user", StateValue{std::string("alice")});
        store->set("session", "visits", StateValue{int64_t{3}});

        auto user = store->get("session", "user");
        ASSERT_TRUE(user.has_value());
        EXPECT_EQ(std::get<std::string>(*user), "alice");
        EXPECT_TRUE(store->has("session", "visits"));
        EXPECT_FALSE(store->has("session", "missing"));
        EXPECT_FALSE(store->get("other", "user").has_value());

        EXPECT_EQ(store->keys("session"), (std::vector<std::string>{"user", "visits"}));
        EXPECT_EQ(store->size("session"), 2u);
        EXPECT_EQ(store->size(), 2u);

        EXPECT_TRUE(store->erase("session", "user"));
        EXPECT_FALSE(store->erase("session", "user"));
        EXPECT_FALSE(store->erase("nowhere", "user"));
        EXPECT_EQ(store->size(), 1u);
    }
}

TEST_F(StateStoreTest, OverwriteIsAlwaysAllowed) {
    for (auto& store : bothStores(smallOptions(1, 1))) {
        SCOPED_TRACE(store->name());

        store->set("ns", "k", StateValue{int64_t{1}});
        EXPECT_NO_THROW(store->set("ns", "k", StateValue{int64_t{2}}));
        EXPECT_EQ(std::get<int64_t>(*store->get("ns", "k")), 2);
    }
}

TEST_F(StateStoreTest, KeyCeilingRejectsNewKeys) {
    for (auto& store : bothStores(smallOptions(10, 2))) {
        SCOPED_TRACE(store->name());

        store->set("ns", "a", StateValue{true});
        store->set("ns", "b", StateValue{false});
        EXPECT_THROW(store->set("ns", "c", StateValue{true}), StateCapacityError);
        EXPECT_FALSE(store->has("ns", "c"));
        EXPECT_EQ(store->size("ns"), 2u);
    }
}

TEST_F(StateStoreTest, NamespaceCeilingRejectsNewNamespaces) {
    for (auto& store : bothStores(smallOptions(2, 10))) {
        SCOPED_TRACE(store->name());

        store->set("one", "k", StateValue{int64_t{1}});
        store->set("two", "k", StateValue{int64_t{2}});
        EXPECT_THROW(store->set("three", "k", StateValue{int64_t{3}}), StateCapacityError);
        EXPECT_EQ(store->getStats().namespaceCount, 2u);

        // Emptying a namespace frees its slot
        EXPECT_TRUE(store->erase("one", "k"));
        EXPECT_NO_THROW(store->set("three", "k", StateValue{int64_t{3}}));
        EXPECT_EQ(store->keys("one"), std::vector<std::string>{});
    }
}

TEST_F(StateStoreTest, ClearNamespaceAndClearAll) {
    for (auto& store : bothStores(smallOptions(10, 10))) {
        SCOPED_TRACE(store->name());

        store->set("a", "x", StateValue{1.5});
        store->set("a", "y", StateValue{1.5});
        store->set("b", "x", StateValue{1.5});

        store->clear("a");
        EXPECT_EQ(store->size("a"), 0u);
        EXPECT_EQ(store->size(), 1u);

        store->clear();
        EXPECT_EQ(store->size(), 0u);
        EXPECT_EQ(store->getStats().namespaceCount, 0u);
    }
}

TEST_F(StateStoreTest, StatsEstimateMemory) {
    for (auto& store : bothStores(smallOptions(10, 10))) {
        SCOPED_TRACE(store->name());

        store->set("ab", "k", StateValue{std::string("xyz")});
        store->set("cd", "blob", StateValue{StateBlob(16, 0)});

        auto stats = store->getStats();
        EXPECT_EQ(stats.namespaceCount, 2u);
        EXPECT_EQ(stats.totalKeys, 2u);
        EXPECT_EQ(stats.namespaces.at("ab").estimatedSize, 12u);
        // "cd" 4 + "blob" 8 + 16 bytes
        EXPECT_EQ(stats.namespaces.at("cd").estimatedSize, 28u);
        EXPECT_EQ(stats.memoryUsage, 40u);
    }
}

// ============================================================================
// CONCURRENT STORE TESTS
// ============================================================================

TEST_F(StateStoreTest, ConcurrentStoreReleasesLockEntries) {
    ConcurrentStateStore store(runtime_, smallOptions(10, 1));

    store.set("ns", "k", StateValue{true});
    EXPECT_EQ(store.lockTableSize(), 1u);

    // A rejected write must not leave an empty slot behind
    EXPECT_THROW(store.set("ns", "other", StateValue{true}), StateCapacityError);
    EXPECT_EQ(store.lockTableSize(), 1u);

    store.erase("ns", "k");
    EXPECT_EQ(store.lockTableSize(), 0u);
    EXPECT_EQ(store.collectGarbage(), 0u);

    auto& metrics = runtime_.metrics().getMetrics(MetricNames::STATE_STORE);
    EXPECT_EQ(metrics.total_gc_runs.load(), 1u);
    EXPECT_EQ(metrics.total_capacity_rejections.load(), 1u);
}

TEST_F(StateStoreTest, ConcurrentWritersRespectNamespaceCeiling) {
    ConcurrentStateStore store(runtime_, smallOptions(8, 100));
    std::atomic<int> rejected{0};

    std::vector<std::thread> writers;
    for (int t = 0; t < 16; ++t) {
        writers.emplace_back([&store, &rejected, t] {
            try {
                store.set("ns-" + std::to_string(t), "k", StateValue{int64_t{t}});
            } catch (const StateCapacityError&) {
                rejected.fetch_add(1);
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(rejected.load(), 8);
    EXPECT_EQ(store.getStats().namespaceCount, 8u);
    EXPECT_EQ(store.lockTableSize(), 8u);
}

TEST_F(StateStoreTest, ConcurrentWritersOnDifferentNamespaces) {
    ConcurrentStateStore store(runtime_, smallOptions(10, 1000));

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&store, t] {
            for (int i = 0; i < 200; ++i) {
                store.set("ns-" + std::to_string(t), "k" + std::to_string(i), StateValue{int64_t{i}});
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(store.size(), 800u);
    EXPECT_EQ(store.size("ns-2"), 200u);
}

TEST_F(StateStoreTest, SimpleStoreHasNoLockTable) {
    SimpleStateStore store(smallOptions(10, 10));
    store.set("ns", "k", StateValue{true});
    EXPECT_EQ(store.getStats().lockTableSize, 0u);
    EXPECT_STREQ(store.name(), "SimpleStateStore");
}

// ============================================================================
// REGISTRY TESTS
// ============================================================================

TEST_F(StateStoreTest, RegistryReturnsExistingStore) {
    StateStoreRegistry registry(runtime_);

    auto first = registry.getOrCreate("agents", StateStoreKind::CONCURRENT, smallOptions(10, 10));
    auto again = registry.getOrCreate("agents", StateStoreKind::SIMPLE);
    auto simple = registry.getOrCreate("cache", StateStoreKind::SIMPLE);

    EXPECT_EQ(first, again);
    EXPECT_STREQ(again->name(), "ConcurrentStateStore");
    EXPECT_STREQ(simple->name(), "SimpleStateStore");
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"agents", "cache"}));
    EXPECT_STREQ(toString(StateStoreKind::SIMPLE), "simple");
}

TEST_F(StateStoreTest, RegistryRemoveAndCleanup) {
    StateStoreRegistry registry(runtime_);
    auto store = registry.getOrCreate("agents", StateStoreKind::CONCURRENT, smallOptions(10, 10));
    store->set("ns", "k", StateValue{int64_t{1}});
    registry.getOrCreate("cache", StateStoreKind::SIMPLE);

    EXPECT_TRUE(registry.remove("cache"));
    EXPECT_FALSE(registry.remove("cache"));

    registry.cleanup();
    EXPECT_TRUE(registry.names().empty());
    // Handles held elsewhere see the cleared store
    EXPECT_EQ(store->size(), 0u);
}
