// EventBus, ThreadPool and Config behaviour the service relies on.

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/ThreadPool.hpp"
#include "support/TestDoubles.hpp"

namespace reelq::test {
namespace {

using reelq::core::EventBus;
using reelq::core::ScopedSubscription;
using reelq::core::ThreadPool;

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------

TEST(EventBusTest, DeliversInSubscriptionOrderPerTopic) {
    EventBus bus;
    std::vector<std::string> seen;

    bus.subscribe("download", [&](const nlohmann::json& e) { seen.push_back("a:" + e.value("id", "")); });
    bus.subscribe("other", [&](const nlohmann::json&) { seen.push_back("other"); });
    bus.subscribe("download", [&](const nlohmann::json& e) { seen.push_back("b:" + e.value("id", "")); });

    EXPECT_EQ(bus.emit("download", {{"id", "X"}}), 2u);
    EXPECT_EQ(seen, (std::vector<std::string>{"a:X", "b:X"}));
    EXPECT_EQ(bus.subscriberCount("download"), 2u);
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopDelivery) {
    EventBus bus;
    int calls = 0;

    bus.subscribe("t", [](const nlohmann::json&) { throw std::runtime_error("boom"); });
    bus.subscribe("t", [&](const nlohmann::json&) { ++calls; });

    EXPECT_EQ(bus.emit("t"), 1u);
    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, UnsubscribeFromInsideHandler) {
    EventBus bus;
    int calls = 0;
    core::SubscriptionId id = 0;

    id = bus.subscribe("t", [&](const nlohmann::json&) {
        ++calls;
        bus.unsubscribe(id);
    });

    bus.emit("t");
    bus.emit("t");

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(bus.unsubscribe(id));
}

TEST(EventBusTest, ScopedSubscriptionUnsubscribesOnExit) {
    EventBus bus;
    {
        ScopedSubscription scoped(bus, "t", [](const nlohmann::json&) {});
        EXPECT_EQ(bus.subscriberCount("t"), 1u);

        ScopedSubscription moved(std::move(scoped));
        EXPECT_EQ(bus.subscriberCount("t"), 1u);
    }
    EXPECT_EQ(bus.subscriberCount("t"), 0u);
}

// -----------------------------------------------------------------------------
// ThreadPool
// -----------------------------------------------------------------------------

TEST(ThreadPoolTest, ShutdownRunsQueuedTasks) {
    std::atomic<int> ran{0};
    ThreadPool pool(2);
    EXPECT_EQ(pool.workerCount(), 2u);

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pool.post([&ran] { ++ran; }));
    }
    pool.shutdown();

    EXPECT_EQ(ran.load(), 20);
    EXPECT_EQ(pool.queuedTasks(), 0u);
    EXPECT_EQ(pool.workerCount(), 0u);
}

TEST(ThreadPoolTest, PostAfterShutdownIsRejected) {
    ThreadPool pool(1);
    pool.shutdown();
    pool.shutdown();

    bool ran = false;
    EXPECT_FALSE(pool.post([&ran] { ran = true; }));
    EXPECT_FALSE(ran);
}

TEST(ThreadPoolTest, ThrowingTaskKeepsWorkerAlive) {
    std::atomic<bool> ran{false};
    ThreadPool pool(1);

    pool.post([] { throw std::runtime_error("task failed"); });
    pool.post([&ran] { ran = true; });

    EXPECT_TRUE(waitUntil([&] { return ran.load(); }));
}

// -----------------------------------------------------------------------------
// Config
// -----------------------------------------------------------------------------

TEST(ConfigTest, DefaultsAreValid) {
    auto& config = core::Config::instance();
    config.setDefaults();

    EXPECT_TRUE(config.validate().empty());
    EXPECT_EQ(config.get<int>("downloads.maxConcurrent", 0), 3);
}

TEST(ConfigTest, ValidateReportsBadValues) {
    auto& config = core::Config::instance();
    config.setDefaults();
    config.set("downloads.maxConcurrent", 0);
    config.set("network.allowCellular", std::string("yes"));

    auto problems = config.validate();
    EXPECT_EQ(problems.size(), 2u);

    config.setDefaults();
}

TEST(ConfigTest, LoadMergesOverDefaults) {
    TempDir dir("config_merge");
    auto path = dir.touch("config.json", R"({"downloads": {"maxConcurrent": 5}})");

    auto& config = core::Config::instance();
    config.setDefaults();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent", 0), 5);
    EXPECT_EQ(config.get<int>("persistence.flushIntervalMs", 0), 1000);
    EXPECT_EQ(config.get<std::string>("downloads.maxConcurrent", "fallback"), "fallback");

    config.setDefaults();
}

TEST(ConfigTest, LoadRejectsMalformedFile) {
    TempDir dir("config_bad");
    auto path = dir.touch("config.json", "{ not json");

    EXPECT_FALSE(core::Config::instance().load(path));
}

} // namespace
} // namespace reelq::test
