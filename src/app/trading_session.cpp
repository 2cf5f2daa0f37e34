// ============================================================================
// VIGIL - Trading Session Implementation
// ============================================================================

#include "vigil/app/trading_session.hpp"

#include "vigil/core/errors.hpp"
#include "vigil/utils/logger.hpp"

#include <chrono>

namespace vigil::app {

namespace {

AppConfig validated(AppConfig config) {
    config.validate();
    return config;
}

}  // namespace

TradingSession::TradingSession(AppConfig config, SessionDependencies deps)
    : config_(validated(std::move(config))),
      clock_(deps.clock ? *deps.clock : static_cast<const IClock&>(system_clock_)),
      market_(std::move(deps.market)),
      exchange_(std::move(deps.exchange)),
      sink_(deps.sink ? std::move(deps.sink) : std::make_shared<sink::LoggingStateSink>()),
      workers_(config_.session.worker_threads),
      monitor_workers_(config_.session.monitor_threads),
      caller_(config_.session.io_threads, config_.session.call_timeout),
      fetch_caller_(config_.session.io_threads, config_.session.call_timeout),
      queue_(config_.session.signal_queue_capacity),
      risk_(config_.risk) {
    if (config_.session.execute_orders && !exchange_) {
        throw ConfigurationError("execute_orders requires an exchange client");
    }

    order::LifecycleConfig lifecycle_config;
    lifecycle_config.monitor_interval = config_.session.monitor_interval;
    lifecycle_config.max_close_retries = config_.session.max_close_retries;

    lifecycle_ = std::make_unique<order::PositionLifecycleManager>(
        lifecycle_config, exchange_, caller_, monitor_workers_, sink_, clock_);
    gate_ = std::make_unique<order::OrderGate>(*lifecycle_, exchange_, risk_, caller_, sink_, clock_);

    scheduler::SchedulerConfig scheduler_config;
    scheduler_config.tick = config_.session.scheduler_tick;
    scheduler_ = std::make_unique<scheduler::TimeframeScheduler>(
        scheduler_config, workers_, queue_, sink_, clock_);

    FetchLimits fetch_limits;
    fetch_limits.min_request_interval = config_.market.min_request_interval;
    fetch_limits.timeout = config_.session.call_timeout;
    fetch_limits.caller = &fetch_caller_;

    size_t registered = 0;
    for (const auto& strategy_config : config_.strategies) {
        if (!strategy_config.enabled) {
            continue;
        }
        if (!market_.candles) {
            throw ConfigurationError("strategy '" + strategy_config.name +
                                     "' enabled without a candle source");
        }
        auto strategy = make_strategy(strategy_config, market_, fetch_limits, clock_);
        for (const auto& coin : config_.coins) {
            scheduler_->register_entry(strategy, coin, strategy_config.interval);
            ++registered;
        }
    }

    LOG_INFO("Session configured: {} coins, {} schedule entries, {}",
             config_.coins.size(), registered,
             config_.session.execute_orders ? "executing orders" : "monitoring only");
}

TradingSession::~TradingSession() {
    stop();
    fetch_caller_.shutdown();
    caller_.shutdown();
    workers_.join();
    monitor_workers_.join();
}

void TradingSession::add_strategy(std::shared_ptr<strategy::IStrategy> strategy, Duration interval) {
    for (const auto& coin : config_.coins) {
        scheduler_->register_entry(strategy, coin, interval);
    }
}

void TradingSession::start() {
    if (running_.exchange(true)) {
        return;
    }

    lifecycle_->start();
    if (config_.session.execute_orders) {
        gate_->start(queue_, workers_);
    } else {
        observing_.store(true);
        observer_ = std::thread([this] { observe_signals(); });
    }
    scheduler_->start();

    LOG_INFO("Trading session started");
}

void TradingSession::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    scheduler_->stop();
    gate_->stop();
    observing_.store(false);
    if (observer_.joinable()) {
        observer_.join();
    }
    lifecycle_->stop();

    const auto lifecycle_stats = lifecycle_->stats();
    if (lifecycle_stats.open_positions > 0 || lifecycle_stats.failed_positions > 0) {
        LOG_WARN("Session stopped with {} open and {} failed positions left on the exchange",
                 lifecycle_stats.open_positions, lifecycle_stats.failed_positions);
    }
    LOG_INFO("Trading session stopped");
}

size_t TradingSession::emergency_stop() {
    LOG_CRITICAL("EMERGENCY STOP");
    stop();
    if (!exchange_) {
        return 0;
    }
    return lifecycle_->force_close_all();
}

void TradingSession::reload_risk(const risk::RiskConfig& next) {
    try {
        risk_.reload(next);
    } catch (const ConfigurationError& e) {
        sink::publish_safely("risk reload", [&] { sink_->publish_error("risk reload", e.what()); });
        throw;
    }
    LOG_INFO("Risk configuration reloaded: max_positions={} size={} SL={}% TP={}% trail={}%",
             next.max_positions, next.position_size, next.stop_loss_percent,
             next.take_profit_percent, next.trailing_stop_percent);
}

bool TradingSession::set_strategy_enabled(std::string_view name, bool enabled) {
    const size_t affected = scheduler_->set_enabled(name, enabled);
    if (affected == 0) {
        LOG_WARN("No strategy named {}", name);
        return false;
    }
    return true;
}

SessionStatus TradingSession::status() const {
    SessionStatus status;
    status.running = running_.load();
    status.executing = config_.session.execute_orders;
    status.risk = risk_.current();
    status.scheduler = scheduler_->stats();
    status.gate = gate_->stats();
    status.lifecycle = lifecycle_->stats();
    status.entries = scheduler_->entries();
    status.positions = lifecycle_->positions();
    status.queued_signals = queue_.size();
    status.dropped_signals = queue_.dropped();
    status.call_timeouts = caller_.timeouts() + fetch_caller_.timeouts();
    return status;
}

void TradingSession::observe_signals() {
    while (observing_.load()) {
        auto next = queue_.pop_for(std::chrono::milliseconds(100));
        if (next) {
            LOG_INFO("[MONITOR] {} (not executed)", describe(*next));
        }
    }
}

}  // namespace vigil::app
