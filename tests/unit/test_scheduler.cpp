// ============================================================================
// VIGIL - Timeframe Scheduler Unit Tests
// ============================================================================

#include "vigil/scheduler/timeframe_scheduler.hpp"

#include "vigil/network/rate_limiter.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <boost/asio/thread_pool.hpp>

using namespace vigil;
using namespace vigil::scheduler;
using namespace std::chrono_literals;
using vigil::testing::ScriptedStrategy;
using vigil::testing::at_seconds;
using vigil::testing::make_signal;

namespace {

std::shared_ptr<ScriptedStrategy> buying(std::string name, double strength = 0.8) {
    return std::make_shared<ScriptedStrategy>(std::move(name), [strength](const Symbol& coin) {
        return std::optional<Signal>(make_signal(coin.view(), Action::Buy, strength));
    });
}

}  // namespace

class SchedulerTest : public ::testing::Test {
protected:
    SchedulerTest()
        : clock(at_seconds(0)),
          workers(4),
          queue(64),
          sink(std::make_shared<vigil::testing::RecordingSink>()),
          scheduler(SchedulerConfig{10ms}, workers, queue, sink, clock) {}

    ~SchedulerTest() override {
        scheduler.stop();
        workers.join();
    }

    size_t tick_at(int64_t seconds) {
        clock.set(at_seconds(seconds));
        const size_t dispatched = scheduler.tick();
        scheduler.wait_idle();
        return dispatched;
    }

    ManualClock clock;
    boost::asio::thread_pool workers;
    SignalQueue queue;
    std::shared_ptr<vigil::testing::RecordingSink> sink;
    TimeframeScheduler scheduler;
};

// ============================================================================
// Cadence
// ============================================================================

TEST_F(SchedulerTest, RunsAtIntervalBoundariesOnly) {
    auto strategy = buying("rsi_5min");
    scheduler.register_entry(strategy, Symbol("BTC"), 300s);

    EXPECT_EQ(tick_at(0), 1u);
    for (int64_t t : {1, 100, 200, 299}) {
        EXPECT_EQ(tick_at(t), 0u) << "t=" << t;
    }
    EXPECT_EQ(tick_at(300), 1u);
    EXPECT_EQ(tick_at(450), 0u);
    EXPECT_EQ(tick_at(599), 0u);
    EXPECT_EQ(tick_at(600), 1u);

    EXPECT_EQ(strategy->calls(), 3);
}

TEST_F(SchedulerTest, EntriesKeepIndependentCadences) {
    auto fast = buying("rsi_1min");
    auto slow = buying("rsi_5min");
    scheduler.register_entry(fast, Symbol("BTC"), 60s);
    scheduler.register_entry(slow, Symbol("BTC"), 300s);

    for (int64_t t = 0; t <= 600; t += 60) {
        tick_at(t);
    }
    EXPECT_EQ(fast->calls(), 11);
    EXPECT_EQ(slow->calls(), 3);
}

TEST_F(SchedulerTest, EachCoinIsItsOwnEntry) {
    auto strategy = buying("rsi_5min");
    scheduler.register_entry(strategy, Symbol("BTC"), 300s);
    scheduler.register_entry(strategy, Symbol("ETH"), 300s);

    EXPECT_EQ(tick_at(0), 2u);
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(scheduler.entries().size(), 2u);
}

// ============================================================================
// Signal Routing
// ============================================================================

TEST_F(SchedulerTest, HoldIsPublishedButNotQueued) {
    auto strategy = std::make_shared<ScriptedStrategy>("sma_5min", [](const Symbol& coin) {
        return std::optional<Signal>(make_hold(coin, "sma_5min", now()));
    });
    scheduler.register_entry(strategy, Symbol("BTC"), 60s);

    tick_at(0);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(sink->signal_count(), 1u);
    EXPECT_EQ(scheduler.stats().holds, 1u);
}

TEST_F(SchedulerTest, NoOpinionProducesNothing) {
    auto strategy = std::make_shared<ScriptedStrategy>(
        "macd_15min", [](const Symbol&) { return std::optional<Signal>(); });
    scheduler.register_entry(strategy, Symbol("BTC"), 60s);

    tick_at(0);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(sink->signal_count(), 0u);
    EXPECT_EQ(scheduler.stats().no_opinion, 1u);
}

TEST_F(SchedulerTest, SignalsAreStampedWithStrategyName) {
    scheduler.register_entry(buying("scalping_1min"), Symbol("SOL"), 60s);
    tick_at(0);

    auto signal = queue.try_pop();
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->source, "scalping_1min");
    EXPECT_EQ(signal->coin, Symbol("SOL"));
}

TEST_F(SchedulerTest, FullQueueDropsOldest) {
    SignalQueue small(2);
    TimeframeScheduler bounded(SchedulerConfig{}, workers, small, sink, clock);
    auto strategy = buying("rsi_1min");
    for (const char* coin : {"A", "B", "C", "D", "E"}) {
        bounded.register_entry(strategy, Symbol(coin), 60s);
    }

    bounded.tick();
    bounded.wait_idle();

    EXPECT_EQ(small.size(), 2u);
    EXPECT_EQ(bounded.stats().signals, 5u);
    EXPECT_EQ(bounded.stats().dropped_signals, 3u);
}

TEST_F(SchedulerTest, ClosedQueueDiscardsWithoutCountingDrops) {
    scheduler.register_entry(buying("rsi_1min"), Symbol("BTC"), 60s);
    queue.close();

    tick_at(0);

    const auto stats = scheduler.stats();
    EXPECT_EQ(stats.signals, 1u);
    EXPECT_EQ(stats.discarded_signals, 1u);
    EXPECT_EQ(stats.dropped_signals, 0u);
}

// ============================================================================
// Failure Isolation
// ============================================================================

TEST_F(SchedulerTest, FailingEntryDoesNotAffectOthers) {
    auto flaky = std::make_shared<ScriptedStrategy>("rsi_1h", [](const Symbol& coin) -> std::optional<Signal> {
        if (coin == Symbol("BTC")) throw TransientFetchError("klines timed out");
        if (coin == Symbol("ETH")) throw std::runtime_error("division by zero");
        return make_signal(coin.view(), Action::Sell, 0.9);
    });
    scheduler.register_entry(flaky, Symbol("BTC"), 60s);
    scheduler.register_entry(flaky, Symbol("ETH"), 60s);
    scheduler.register_entry(flaky, Symbol("SOL"), 60s);

    EXPECT_EQ(tick_at(0), 3u);
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_EQ(scheduler.stats().failures, 2u);
    EXPECT_EQ(sink->error_count(), 2u);

    // Failed entries are retried on their next interval, not immediately
    EXPECT_EQ(tick_at(30), 0u);
    EXPECT_EQ(tick_at(60), 3u);
    EXPECT_EQ(scheduler.stats().failures, 4u);
}

TEST_F(SchedulerTest, ThrowingSinkIsContained) {
    auto throwing = std::make_shared<vigil::testing::ThrowingSink>();
    TimeframeScheduler guarded(SchedulerConfig{}, workers, queue, throwing, clock);
    guarded.register_entry(buying("rsi_1min"), Symbol("BTC"), 60s);

    guarded.tick();
    guarded.wait_idle();
    EXPECT_EQ(queue.size(), 1u);
}

// ============================================================================
// Overlap Policy
// ============================================================================

TEST_F(SchedulerTest, OverlappingInvocationIsSkippedAndCounted) {
    auto slow = buying("rsi_1min");
    slow->block();
    scheduler.register_entry(slow, Symbol("BTC"), 60s);

    clock.set(at_seconds(0));
    EXPECT_EQ(scheduler.tick(), 1u);
    ASSERT_TRUE(slow->wait_started(1));

    clock.set(at_seconds(60));
    EXPECT_EQ(scheduler.tick(), 0u);
    clock.set(at_seconds(120));
    EXPECT_EQ(scheduler.tick(), 0u);
    EXPECT_EQ(scheduler.stats().overlap_skips, 2u);
    EXPECT_EQ(scheduler.entries()[0].overlap_skips, 2u);
    EXPECT_TRUE(scheduler.entries()[0].in_flight);

    slow->unblock();
    scheduler.wait_idle();

    // Due again right away: the skipped ticks did not advance last_run_at
    clock.set(at_seconds(121));
    EXPECT_EQ(scheduler.tick(), 1u);
    scheduler.wait_idle();
    EXPECT_EQ(slow->calls(), 2);
}

TEST_F(SchedulerTest, SlowStrategyDoesNotDelayOthers) {
    auto slow = buying("rsi_4h");
    auto fast = buying("scalping_1min");
    slow->block();
    scheduler.register_entry(slow, Symbol("BTC"), 60s);
    scheduler.register_entry(fast, Symbol("BTC"), 60s);

    clock.set(at_seconds(0));
    EXPECT_EQ(scheduler.tick(), 2u);
    EXPECT_TRUE(vigil::testing::eventually([&] { return fast->calls() == 1; }));
    EXPECT_EQ(slow->calls(), 0);

    slow->unblock();
    scheduler.wait_idle();
}

TEST_F(SchedulerTest, RateLimitedStrategyHoldsOneWorker) {
    // Six coins behind one 200 ms limiter would occupy every worker for
    // over a second if they were dispatched side by side
    auto limiter = network::RateLimiter::min_interval(200ms);
    std::atomic<int> concurrent{0};
    std::atomic<int> peak{0};
    auto throttled = std::make_shared<ScriptedStrategy>(
        "rsi_1min", [&](const Symbol& coin) -> std::optional<Signal> {
            const int now_running = ++concurrent;
            int seen = peak.load();
            while (now_running > seen && !peak.compare_exchange_weak(seen, now_running)) {
            }
            limiter->acquire();
            --concurrent;
            return make_signal(coin.view(), Action::Hold, 0.0);
        });
    for (const char* coin : {"A", "B", "C", "D", "E", "F"}) {
        scheduler.register_entry(throttled, Symbol(coin), 60s);
    }

    std::atomic<int64_t> independent_started_ms{-1};
    const auto dispatched_at = std::chrono::steady_clock::now();
    auto independent = std::make_shared<ScriptedStrategy>(
        "sma_5min", [&](const Symbol& coin) -> std::optional<Signal> {
            independent_started_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - dispatched_at)
                                         .count();
            return make_signal(coin.view(), Action::Buy, 0.8);
        });
    scheduler.register_entry(independent, Symbol("BTC"), 60s);

    clock.set(at_seconds(0));
    EXPECT_EQ(scheduler.tick(), 7u);
    ASSERT_TRUE(vigil::testing::eventually([&] { return independent->calls() == 1; }));
    EXPECT_LT(independent_started_ms.load(), 150);

    scheduler.wait_idle();
    EXPECT_EQ(throttled->calls(), 6);
    EXPECT_EQ(peak.load(), 1);
}

// ============================================================================
// Registration and Control
// ============================================================================

TEST_F(SchedulerTest, RegisterRejectsBadArguments) {
    EXPECT_THROW(scheduler.register_entry(nullptr, Symbol("BTC"), 60s), std::invalid_argument);
    EXPECT_THROW(scheduler.register_entry(buying("x"), Symbol("BTC"), 0s), std::invalid_argument);
}

TEST_F(SchedulerTest, DisabledStrategyIsNotDispatched) {
    auto strategy = buying("rsi_5min");
    scheduler.register_entry(strategy, Symbol("BTC"), 60s);
    scheduler.register_entry(strategy, Symbol("ETH"), 60s);

    EXPECT_EQ(scheduler.set_enabled("rsi_5min", false), 2u);
    EXPECT_EQ(scheduler.set_enabled("unknown", false), 0u);
    EXPECT_EQ(tick_at(0), 0u);

    scheduler.set_enabled("rsi_5min", true);
    EXPECT_EQ(tick_at(1), 2u);
}

TEST_F(SchedulerTest, BackgroundLoopDispatches) {
    auto strategy = buying("rsi_1min");
    scheduler.register_entry(strategy, Symbol("BTC"), 60s);

    scheduler.start();
    EXPECT_TRUE(vigil::testing::eventually([&] { return strategy->calls() == 1; }));
    scheduler.stop();

    EXPECT_GE(scheduler.stats().ticks, 1u);
    EXPECT_EQ(strategy->calls(), 1);
}
