#pragma once
// ============================================================================
// VIGIL - Trading Session
// ============================================================================
// Wires scheduler, order gate, lifecycle manager and sink together once per
// session. Collaborators (market data, exchange) are injected so the same
// session runs against live data, the paper exchange or test doubles.
// Position checks run on their own pool and market data calls on their own
// timed pool, so strategy work can never delay a stop-loss check.
// ============================================================================

#include "vigil/app/app_config.hpp"
#include "vigil/app/strategy_factory.hpp"
#include "vigil/core/bounded_queue.hpp"
#include "vigil/core/clock.hpp"
#include "vigil/core/timed_call.hpp"
#include "vigil/exchange/exchange_client.hpp"
#include "vigil/order/lifecycle_manager.hpp"
#include "vigil/order/order_gate.hpp"
#include "vigil/risk/risk_config.hpp"
#include "vigil/scheduler/timeframe_scheduler.hpp"
#include "vigil/sink/state_sink.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vigil::app {

struct SessionDependencies {
    MarketSources market;
    std::shared_ptr<exchange::IExchangeClient> exchange;
    std::shared_ptr<sink::IStateSink> sink;     // Null = LoggingStateSink
    const IClock* clock = nullptr;              // Null = system clock
};

struct SessionStatus {
    bool running = false;
    bool executing = false;
    std::shared_ptr<const risk::RiskConfig> risk;
    scheduler::SchedulerStats scheduler;
    order::GateStats gate;
    order::LifecycleStats lifecycle;
    std::vector<scheduler::EntryStatus> entries;
    std::vector<order::Position> positions;
    uint64_t queued_signals = 0;
    uint64_t dropped_signals = 0;
    uint64_t call_timeouts = 0;     // Exchange and market data calls
};

class TradingSession {
public:
    /// Validates the configuration and registers every enabled strategy for
    /// every coin. Throws ConfigurationError.
    TradingSession(AppConfig config, SessionDependencies deps);
    ~TradingSession();

    TradingSession(const TradingSession&) = delete;
    TradingSession& operator=(const TradingSession&) = delete;

    /// Register an additional strategy for every configured coin
    void add_strategy(std::shared_ptr<strategy::IStrategy> strategy, Duration interval);

    void start();

    /// Stop the loops; open positions stay open on the exchange
    void stop();

    /// Stop the loops, then close every active position with reason EMERGENCY.
    /// Returns the number closed.
    size_t emergency_stop();

    /// Throws ConfigurationError; the previous snapshot stays active on failure
    void reload_risk(const risk::RiskConfig& next);

    /// Returns false when no strategy with that name is registered
    bool set_strategy_enabled(std::string_view name, bool enabled);

    [[nodiscard]] SessionStatus status() const;

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    /// Configuration the session was built with; risk reloads are not written back
    [[nodiscard]] const AppConfig& config() const noexcept { return config_; }

    /// Active risk snapshot, including reloads
    [[nodiscard]] std::shared_ptr<const risk::RiskConfig> risk() const { return risk_.current(); }

    [[nodiscard]] scheduler::TimeframeScheduler& scheduler() noexcept { return *scheduler_; }
    [[nodiscard]] order::OrderGate& gate() noexcept { return *gate_; }
    [[nodiscard]] order::PositionLifecycleManager& lifecycle() noexcept { return *lifecycle_; }
    [[nodiscard]] sink::IStateSink& sink() noexcept { return *sink_; }

private:
    void observe_signals();

    AppConfig config_;
    SystemClock system_clock_;
    const IClock& clock_;
    MarketSources market_;
    std::shared_ptr<exchange::IExchangeClient> exchange_;
    std::shared_ptr<sink::IStateSink> sink_;

    boost::asio::thread_pool workers_;
    boost::asio::thread_pool monitor_workers_;
    TimedCaller caller_;            // Exchange calls
    TimedCaller fetch_caller_;      // Market data calls
    scheduler::SignalQueue queue_;
    risk::RiskConfigStore risk_;

    std::unique_ptr<order::PositionLifecycleManager> lifecycle_;
    std::unique_ptr<order::OrderGate> gate_;
    std::unique_ptr<scheduler::TimeframeScheduler> scheduler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> observing_{false};
    std::thread observer_;
};

}  // namespace vigil::app
