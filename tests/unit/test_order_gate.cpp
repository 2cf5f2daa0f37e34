// ============================================================================
// VIGIL - Order Gate Unit Tests
// ============================================================================

#include "vigil/order/order_gate.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace vigil;
using namespace vigil::order;
using namespace std::chrono_literals;
using vigil::testing::at_seconds;
using vigil::testing::make_signal;

namespace {

risk::RiskConfig test_risk() {
    risk::RiskConfig config;
    config.max_positions = 2;
    config.position_size = 20.0;
    config.min_signal_strength = 0.6;
    config.cooldown_seconds = 0;
    config.check_balance = false;
    config.allow_short = true;
    config.stop_loss_percent = 2.0;
    config.take_profit_percent = 5.0;
    config.trailing_stop_percent = 0.5;
    return config;
}

}  // namespace

class OrderGateTest : public ::testing::Test {
protected:
    OrderGateTest()
        : clock(at_seconds(0)),
          exchange(std::make_shared<vigil::testing::ScriptedExchange>()),
          sink(std::make_shared<vigil::testing::RecordingSink>()),
          workers(4),
          caller(4, 500ms),
          risk(test_risk()),
          lifecycle(LifecycleConfig{}, exchange, caller, workers, sink, clock),
          gate(lifecycle, exchange, risk, caller, sink, clock) {
        exchange->set_price("BTC", 50000.0);
        exchange->set_price("ETH", 3000.0);
        exchange->set_price("SOL", 100.0);
    }

    ~OrderGateTest() override {
        gate.stop();
        lifecycle.stop();
        exchange->release_orders();
        workers.join();
    }

    void reload(void (*mutate)(risk::RiskConfig&)) {
        auto next = *risk.current();
        mutate(next);
        risk.reload(next);
    }

    ManualClock clock;
    std::shared_ptr<vigil::testing::ScriptedExchange> exchange;
    std::shared_ptr<vigil::testing::RecordingSink> sink;
    boost::asio::thread_pool workers;
    TimedCaller caller;
    risk::RiskConfigStore risk;
    PositionLifecycleManager lifecycle;
    OrderGate gate;
};

// ============================================================================
// Admission Rules
// ============================================================================

TEST_F(OrderGateTest, AdmitsStrongSignalAndOpensPosition) {
    auto result = gate.submit(make_signal("BTC", Action::Buy, 0.8, "rsi_5min"));

    ASSERT_TRUE(result.admitted()) << result.reason;
    ASSERT_TRUE(result.position.has_value());
    EXPECT_EQ(result.position->status, PositionStatus::Open);
    EXPECT_EQ(result.position->side, PositionSide::Long);
    EXPECT_EQ(result.position->source, "rsi_5min");
    EXPECT_EQ(result.position->entry_price, Price::from_double(50000.0));
    EXPECT_DOUBLE_EQ(result.position->size.to_double(), 0.0004);
    EXPECT_EQ(result.position->levels.stop_loss, Price::from_double(49000.0));
    EXPECT_EQ(result.position->levels.take_profit, Price::from_double(52500.0));

    const auto orders = exchange->orders();
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].side, Side::Buy);

    EXPECT_EQ(lifecycle.book().size(), 1u);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 1);
}

TEST_F(OrderGateTest, SellOpensShort) {
    auto result = gate.submit(make_signal("ETH", Action::Sell, 0.9));
    ASSERT_TRUE(result.admitted());
    EXPECT_EQ(result.position->side, PositionSide::Short);
    EXPECT_EQ(exchange->orders().at(0).side, Side::Sell);
    EXPECT_EQ(result.position->levels.stop_loss, Price::from_double(3060.0));
}

TEST_F(OrderGateTest, RejectsHoldWeakAndInvalidSignals) {
    EXPECT_EQ(gate.submit(make_signal("BTC", Action::Hold, 0.0)).decision,
              AdmissionDecision::RejectedHold);
    EXPECT_EQ(gate.submit(make_signal("BTC", Action::Buy, 0.5)).decision,
              AdmissionDecision::RejectedWeak);
    EXPECT_EQ(gate.submit(make_signal("BTC", Action::Buy, 1.5)).decision,
              AdmissionDecision::RejectedInvalid);

    auto bad_action = make_signal("BTC", Action::Buy, 0.8);
    bad_action.action = static_cast<Action>(9);
    EXPECT_EQ(gate.submit(bad_action).decision, AdmissionDecision::RejectedInvalid);

    EXPECT_EQ(exchange->place_calls(), 0);
    EXPECT_EQ(lifecycle.book().size(), 0u);
    EXPECT_EQ(gate.stats().rejected, 4u);
}

TEST_F(OrderGateTest, EveryAdmittedSignalIsActionableAndInRange) {
    const std::vector<Signal> signals = {
        make_signal("BTC", Action::Buy, 0.7),  make_signal("ETH", Action::Hold, 0.0),
        make_signal("SOL", Action::Sell, 2.0), make_signal("SOL", Action::Buy, -1.0),
        make_signal("ETH", Action::Sell, 1.0),
    };

    for (const auto& signal : signals) {
        auto result = gate.submit(signal);
        if (result.admitted()) {
            EXPECT_NE(signal.action, Action::Hold);
            EXPECT_GE(signal.strength, 0.0);
            EXPECT_LE(signal.strength, 1.0);
        }
    }
    EXPECT_EQ(gate.stats().admitted, 2u);
}

TEST_F(OrderGateTest, RejectsDuplicateCoin) {
    ASSERT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8, "a")).admitted());
    auto second = gate.submit(make_signal("BTC", Action::Sell, 0.9, "b"));
    EXPECT_EQ(second.decision, AdmissionDecision::RejectedDuplicate);
    EXPECT_EQ(exchange->place_calls(), 1);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 1);
}

TEST_F(OrderGateTest, RejectsBeyondMaxPositions) {
    ASSERT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8)).admitted());
    ASSERT_TRUE(gate.submit(make_signal("ETH", Action::Buy, 0.8)).admitted());

    auto third = gate.submit(make_signal("SOL", Action::Buy, 0.9));
    EXPECT_EQ(third.decision, AdmissionDecision::RejectedMaxPositions);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 2);
    EXPECT_EQ(lifecycle.book().find(Symbol("SOL")), nullptr);
}

TEST_F(OrderGateTest, ShortDisabledReleasesReservation) {
    reload([](risk::RiskConfig& c) { c.allow_short = false; });

    auto result = gate.submit(make_signal("BTC", Action::Sell, 0.9));
    EXPECT_EQ(result.decision, AdmissionDecision::RejectedShortDisabled);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 0);
    EXPECT_EQ(lifecycle.book().size(), 0u);
}

TEST_F(OrderGateTest, CooldownAfterOpen) {
    reload([](risk::RiskConfig& c) { c.cooldown_seconds = 300; });

    ASSERT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8)).admitted());

    // Close it: price through the stop-loss
    exchange->set_price("BTC", 48000.0);
    lifecycle.check_position(lifecycle.book().find(Symbol("BTC")));
    ASSERT_EQ(lifecycle.book().size(), 0u);

    clock.advance(100s);
    auto early = gate.submit(make_signal("BTC", Action::Buy, 0.8));
    EXPECT_EQ(early.decision, AdmissionDecision::RejectedCooldown);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 0);

    // Another coin is unaffected
    EXPECT_TRUE(gate.submit(make_signal("ETH", Action::Buy, 0.8)).admitted());

    clock.advance(201s);
    EXPECT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8)).admitted());
}

TEST_F(OrderGateTest, InsufficientBalanceRejects) {
    reload([](risk::RiskConfig& c) { c.check_balance = true; });
    exchange->set_balance(5.0);

    auto result = gate.submit(make_signal("BTC", Action::Buy, 0.8));
    EXPECT_EQ(result.decision, AdmissionDecision::RejectedInsufficientBalance);
    EXPECT_EQ(exchange->place_calls(), 0);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 0);
    EXPECT_EQ(lifecycle.book().size(), 0u);
}

TEST_F(OrderGateTest, RiskReloadAppliesToNextAdmission) {
    reload([](risk::RiskConfig& c) { c.max_positions = 1; });
    ASSERT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8)).admitted());
    EXPECT_EQ(gate.submit(make_signal("ETH", Action::Buy, 0.8)).decision,
              AdmissionDecision::RejectedMaxPositions);
}

// ============================================================================
// Exchange Failures
// ============================================================================

TEST_F(OrderGateTest, PlaceFailureMarksFailedAndReleasesSlot) {
    exchange->fail_places(1);

    auto result = gate.submit(make_signal("BTC", Action::Buy, 0.8));
    EXPECT_EQ(result.decision, AdmissionDecision::ExchangeFailed);
    EXPECT_EQ(lifecycle.book().size(), 0u);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 0);
    EXPECT_EQ(gate.stats().exchange_failures, 1u);

    const bool saw_failed = sink->read([](const auto& s) {
        for (const auto& update : s.updates) {
            if (update.coin == Symbol("BTC") && update.status == PositionStatus::Failed) return true;
        }
        return false;
    });
    EXPECT_TRUE(saw_failed);
    EXPECT_GE(sink->error_count(), 1u);

    // The coin is free again
    EXPECT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8)).admitted());
}

TEST_F(OrderGateTest, TimedOutCallIsAFailure) {
    exchange->set_delay(std::chrono::milliseconds(1500));

    auto result = gate.submit(make_signal("BTC", Action::Buy, 0.8));
    EXPECT_EQ(result.decision, AdmissionDecision::ExchangeFailed);
    EXPECT_NE(result.reason.find("timed out"), std::string::npos);
    EXPECT_EQ(lifecycle.book().slots_in_use(), 0);
    EXPECT_GE(caller.timeouts(), 1u);

    exchange->set_delay(std::chrono::milliseconds(0));
}

TEST_F(OrderGateTest, FailingSinkDoesNotBlockAdmission) {
    auto throwing = std::make_shared<vigil::testing::ThrowingSink>();
    PositionLifecycleManager other_lifecycle(LifecycleConfig{}, exchange, caller, workers, throwing,
                                             clock);
    OrderGate other_gate(other_lifecycle, exchange, risk, caller, throwing, clock);

    EXPECT_TRUE(other_gate.submit(make_signal("SOL", Action::Buy, 0.8)).admitted());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(OrderGateTest, ConcurrentSameCoinAdmitsExactlyOne) {
    for (int round = 0; round < 5; ++round) {
        const std::string coin = round % 2 == 0 ? "BTC" : "ETH";
        exchange->hold_orders();

        std::atomic<int> admitted{0};
        std::atomic<int> duplicates{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&, i] {
                auto result = gate.submit(
                    make_signal(coin, i % 2 == 0 ? Action::Buy : Action::Sell, 0.9,
                                "strategy_" + std::to_string(i)));
                if (result.admitted()) admitted.fetch_add(1);
                if (result.decision == AdmissionDecision::RejectedDuplicate) duplicates.fetch_add(1);
            });
        }

        ASSERT_TRUE(exchange->wait_for_orders(round + 1));
        std::this_thread::sleep_for(20ms);
        exchange->release_orders();
        for (auto& t : threads) t.join();

        EXPECT_EQ(admitted.load(), 1);
        EXPECT_EQ(duplicates.load(), 7);

        // Free the coin for the next round
        auto tracked = lifecycle.book().find(Symbol(coin));
        ASSERT_NE(tracked, nullptr);
        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            tracked->position.status = PositionStatus::Closing;
        }
        lifecycle.check_position(tracked);
        ASSERT_EQ(lifecycle.book().size(), 0u);
    }
    EXPECT_EQ(exchange->place_calls(), 5);
}

TEST_F(OrderGateTest, DifferentCoinsAdmitInParallel) {
    exchange->hold_orders();

    std::thread btc([&] { EXPECT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8)).admitted()); });
    std::thread eth([&] { EXPECT_TRUE(gate.submit(make_signal("ETH", Action::Buy, 0.8)).admitted()); });

    // Both orders are in flight at the same time
    EXPECT_TRUE(exchange->wait_for_orders(2));
    exchange->release_orders();
    btc.join();
    eth.join();

    EXPECT_EQ(lifecycle.book().size(), 2u);
}

// ============================================================================
// Statistics and Queue Consumer
// ============================================================================

TEST_F(OrderGateTest, DailyCountersResetOnNewDay) {
    ASSERT_TRUE(gate.submit(make_signal("BTC", Action::Buy, 0.8)).admitted());
    auto stats = gate.stats();
    EXPECT_EQ(stats.trades_today, 1u);
    EXPECT_EQ(stats.trades_today_by_coin["BTC"], 1u);

    clock.advance(std::chrono::hours(24));
    (void)gate.submit(make_signal("ETH", Action::Hold, 0.0));
    stats = gate.stats();
    EXPECT_EQ(stats.trades_today, 0u);
    EXPECT_TRUE(stats.trades_today_by_coin.empty());
    EXPECT_EQ(stats.admitted, 1u);
}

TEST_F(OrderGateTest, ConsumesQueuedSignals) {
    SignalQueue queue(16);
    gate.start(queue, workers);

    queue.push(make_signal("BTC", Action::Buy, 0.8, "rsi_1min"));
    queue.push(make_signal("BTC", Action::Buy, 0.8, "rsi_1min"));
    queue.push(make_signal("ETH", Action::Sell, 0.9, "sma_5min"));

    EXPECT_TRUE(vigil::testing::eventually([&] { return gate.stats().received == 3; }));
    gate.wait_idle();
    gate.stop();

    const auto stats = gate.stats();
    EXPECT_EQ(stats.admitted, 2u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(lifecycle.book().size(), 2u);
}

TEST_F(OrderGateTest, SignalsFromOneSourceAreAdmittedInGenerationOrder) {
    reload([](risk::RiskConfig& r) { r.max_positions = 10; });
    const std::vector<std::string> ordered = {"BTC", "ETH", "SOL", "ADA", "XRP", "DOT"};
    for (const auto& coin : ordered) {
        exchange->set_price(coin, 10.0);
    }
    exchange->set_price("AVAX", 10.0);
    exchange->set_price("LINK", 10.0);
    // Slow fills give parallel admissions every chance to overtake each other
    exchange->set_delay(5ms);

    SignalQueue queue(32);
    gate.start(queue, workers);
    for (size_t i = 0; i < ordered.size(); ++i) {
        queue.push(make_signal(ordered[i], Action::Buy, 0.8, "rsi_1min"));
        if (i == 1) queue.push(make_signal("AVAX", Action::Buy, 0.8, "sma_5min"));
        if (i == 3) queue.push(make_signal("LINK", Action::Buy, 0.8, "sma_5min"));
    }

    ASSERT_TRUE(vigil::testing::eventually([&] { return gate.stats().received == 8; }));
    gate.wait_idle();
    gate.stop();

    std::vector<std::string> placed;
    for (const auto& order : exchange->orders()) {
        if (std::find(ordered.begin(), ordered.end(), order.coin.str()) != ordered.end()) {
            placed.push_back(order.coin.str());
        }
    }
    EXPECT_EQ(placed, ordered);
    EXPECT_EQ(gate.stats().admitted, 8u);
}
