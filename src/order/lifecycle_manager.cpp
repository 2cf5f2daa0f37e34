// ============================================================================
// VIGIL - Position Lifecycle Manager Implementation
// ============================================================================

#include "vigil/order/lifecycle_manager.hpp"

#include "vigil/utils/logger.hpp"

#include <boost/asio/post.hpp>

#include <string>

namespace vigil::order {

PositionLifecycleManager::PositionLifecycleManager(
    LifecycleConfig config, std::shared_ptr<exchange::IExchangeClient> exchange,
    TimedCaller& caller, boost::asio::thread_pool& workers,
    std::shared_ptr<sink::IStateSink> sink, const IClock& clock)
    : config_(config),
      exchange_(std::move(exchange)),
      caller_(caller),
      workers_(workers),
      sink_(sink ? std::move(sink) : std::make_shared<sink::NullStateSink>()),
      clock_(clock) {
    if (config_.max_close_retries < 1) {
        config_.max_close_retries = 1;
    }
}

PositionLifecycleManager::~PositionLifecycleManager() {
    stop();
}

void PositionLifecycleManager::adopt(const TrackedPositionPtr& tracked) {
    const Position snapshot = tracked->snapshot();

    LOG_INFO("Monitoring {} (SL {:.8f}, TP {:.8f}, trail {:.2f}% from +{:.2f}%)",
             describe(snapshot), snapshot.levels.stop_loss.to_double(),
             snapshot.levels.take_profit.to_double(), snapshot.exit_params.trailing_stop_percent,
             snapshot.exit_params.trailing_activation_percent);

    sink::publish_safely("position update", [&] { sink_->publish_position_update(snapshot); });
}

// ============================================================================
// Monitoring Loop
// ============================================================================

void PositionLifecycleManager::run_forever() {
    running_.store(true, std::memory_order_release);
    loop();
}

void PositionLifecycleManager::loop() {
    LOG_INFO("Position monitor running (interval {} ms)",
             std::chrono::duration_cast<std::chrono::milliseconds>(config_.monitor_interval).count());

    while (running_.load(std::memory_order_acquire)) {
        tick();

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, config_.monitor_interval,
                          [this] { return !running_.load(std::memory_order_acquire); });
    }

    LOG_INFO("Position monitor stopped");
}

void PositionLifecycleManager::start() {
    if (loop_thread_.joinable()) {
        return;
    }
    running_.store(true, std::memory_order_release);
    loop_thread_ = std::thread([this] { loop(); });
}

void PositionLifecycleManager::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_.store(false, std::memory_order_release);
    }
    loop_cv_.notify_all();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    wait_idle();
}

size_t PositionLifecycleManager::tick() {
    size_t dispatched = 0;

    for (const auto& tracked : book_.all()) {
        PositionStatus status;
        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            status = tracked->position.status;
        }
        if (status != PositionStatus::Open && status != PositionStatus::Closing) {
            continue;
        }

        bool expected = false;
        if (!tracked->check_in_flight.compare_exchange_strong(expected, true)) {
            skipped_checks_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            ++in_flight_;
        }

        boost::asio::post(workers_, [this, tracked] {
            try {
                run_check(tracked);
            } catch (const std::exception& e) {
                LOG_ERROR("Position check for {} failed: {}", tracked->snapshot().coin.view(),
                          e.what());
            }
            tracked->check_in_flight.store(false, std::memory_order_release);
            finish_check();
        });
        ++dispatched;
    }

    return dispatched;
}

void PositionLifecycleManager::wait_idle() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void PositionLifecycleManager::finish_check() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        --in_flight_;
    }
    idle_cv_.notify_all();
}

void PositionLifecycleManager::check_position(const TrackedPositionPtr& tracked) {
    bool expected = false;
    if (!tracked->check_in_flight.compare_exchange_strong(expected, true)) {
        skipped_checks_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    try {
        run_check(tracked);
    } catch (...) {
        tracked->check_in_flight.store(false, std::memory_order_release);
        throw;
    }
    tracked->check_in_flight.store(false, std::memory_order_release);
}

void PositionLifecycleManager::run_check(const TrackedPositionPtr& tracked) {
    SCOPED_TIMER("lifecycle.check");
    PositionStatus status;
    Symbol coin;
    {
        std::lock_guard<std::mutex> lock(tracked->mutex);
        status = tracked->position.status;
        coin = tracked->position.coin;
    }
    checks_.fetch_add(1, std::memory_order_relaxed);

    if (status == PositionStatus::Closing) {
        attempt_close(tracked);
        return;
    }
    if (status != PositionStatus::Open) {
        return;
    }

    Price mark;
    try {
        mark = caller_.call("get_mark_price",
                            [exchange = exchange_, coin] { return exchange->get_mark_price(coin); });
    } catch (const std::exception& e) {
        LOG_WARN("Mark price for {} unavailable, retrying next tick: {}", coin.view(), e.what());
        sink::publish_safely("error", [&] { sink_->publish_error("lifecycle", e.what()); });
        return;
    }
    if (!mark.is_valid()) {
        LOG_WARN("Ignoring non-positive mark price for {}", coin.view());
        return;
    }

    Position snapshot;
    CloseReason reason = CloseReason::None;
    {
        std::lock_guard<std::mutex> lock(tracked->mutex);
        auto& pos = tracked->position;
        if (pos.status != PositionStatus::Open) {
            return;
        }
        reason = risk::evaluate_exit(pos.levels, pos.entry_price, pos.side, pos.exit_params, mark);
        pos.last_mark_price = mark;
        if (reason != CloseReason::None) {
            pos.status = PositionStatus::Closing;
            pos.close_reason = reason;
        }
        snapshot = pos;
    }

    sink::publish_safely("position update", [&] { sink_->publish_position_update(snapshot); });

    if (reason == CloseReason::None) {
        LOG_TRACE("{} mark {:.8f} trailing {:.8f}", coin.view(), mark.to_double(),
                  snapshot.levels.trailing_stop.to_double());
        return;
    }

    LOG_INFO("{} {} triggered at {:.8f} (entry {:.8f})", coin.view(), risk::to_string(reason),
             mark.to_double(), snapshot.entry_price.to_double());
    attempt_close(tracked);
}

void PositionLifecycleManager::attempt_close(const TrackedPositionPtr& tracked) {
    Position snapshot;
    {
        std::lock_guard<std::mutex> lock(tracked->mutex);
        if (tracked->position.status != PositionStatus::Closing) {
            return;
        }
        ++tracked->position.close_attempts;
        snapshot = tracked->position;
    }

    exchange::CloseFill fill;
    try {
        fill = caller_.call("close_position",
                            [exchange = exchange_, snapshot] { return exchange->close_position(snapshot); });
    } catch (const std::exception& e) {
        bool escalated = false;
        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            auto& pos = tracked->position;
            pos.last_error = e.what();
            if (pos.close_attempts >= config_.max_close_retries) {
                pos.status = PositionStatus::Failed;
                escalated = true;
            }
            snapshot = pos;
        }

        if (escalated) {
            LOG_CRITICAL("Closing {} failed {} times, manual intervention required: {}",
                         snapshot.coin.view(), snapshot.close_attempts, e.what());
        } else {
            LOG_WARN("Closing {} failed (attempt {}/{}), retrying next tick: {}",
                     snapshot.coin.view(), snapshot.close_attempts, config_.max_close_retries,
                     e.what());
        }
        sink::publish_safely("error", [&] {
            sink_->publish_error("close_position " + snapshot.coin.str(), e.what());
        });
        sink::publish_safely("position update", [&] { sink_->publish_position_update(snapshot); });
        return;
    }

    const Symbol coin = snapshot.coin;
    {
        auto coin_guard = book_.lock_coin(coin);
        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            auto& pos = tracked->position;
            pos.status = PositionStatus::Closed;
            pos.exit_price = fill.exit_price;
            pos.closed_at = fill.closed_at.time_since_epoch().count() != 0 ? fill.closed_at
                                                                             : clock_.now();
            pos.realized_pnl = risk::calculate_pnl(pos.side, pos.entry_price, pos.exit_price, pos.size);
            pos.last_error.clear();
            snapshot = pos;
        }
        if (book_.find(coin) == tracked) {
            book_.erase(coin);
            book_.release_slot();
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        realized_pnl_ += snapshot.realized_pnl;
        ++closed_trades_;
        if (snapshot.realized_pnl > 0) {
            ++wins_;
        } else if (snapshot.realized_pnl < 0) {
            ++losses_;
        }
    }

    LOG_INFO("Closed {} {} at {:.8f}: {} pnl={:.4f}", coin.view(), to_string(snapshot.side),
             snapshot.exit_price.to_double(), risk::to_string(snapshot.close_reason),
             snapshot.realized_pnl);

    sink::publish_safely("position update", [&] { sink_->publish_position_update(snapshot); });
    sink::publish_safely("trade", [&] { sink_->publish_trade(snapshot, snapshot.close_reason); });
}

// ============================================================================
// Manual Intervention
// ============================================================================

size_t PositionLifecycleManager::force_close_all() {
    size_t closed = 0;
    LOG_WARN("Emergency close of all positions requested");

    for (const auto& tracked : book_.all()) {
        bool expected = false;
        while (!tracked->check_in_flight.compare_exchange_weak(expected, true)) {
            expected = false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        bool closing = false;
        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            auto& pos = tracked->position;
            if (pos.status == PositionStatus::Open) {
                pos.status = PositionStatus::Closing;
                pos.close_reason = CloseReason::Emergency;
            }
            closing = pos.status == PositionStatus::Closing;
        }

        while (closing) {
            attempt_close(tracked);
            std::lock_guard<std::mutex> lock(tracked->mutex);
            closing = tracked->position.status == PositionStatus::Closing;
        }

        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            if (tracked->position.status == PositionStatus::Closed) {
                ++closed;
            }
        }
        tracked->check_in_flight.store(false, std::memory_order_release);
    }

    LOG_WARN("Emergency close finished: {} position(s) closed", closed);
    return closed;
}

std::vector<Position> PositionLifecycleManager::positions() const {
    std::vector<Position> result;
    for (const auto& tracked : book_.all()) {
        result.push_back(tracked->snapshot());
    }
    return result;
}

std::vector<Position> PositionLifecycleManager::failed_positions() const {
    std::vector<Position> result;
    for (const auto& tracked : book_.all()) {
        auto snapshot = tracked->snapshot();
        if (snapshot.status == PositionStatus::Failed) {
            result.push_back(std::move(snapshot));
        }
    }
    return result;
}

bool PositionLifecycleManager::release_failed(const Symbol& coin) {
    Position snapshot;
    {
        auto coin_guard = book_.lock_coin(coin);
        auto tracked = book_.find(coin);
        if (!tracked) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            if (tracked->position.status != PositionStatus::Failed) {
                return false;
            }
            snapshot = tracked->position;
        }
        book_.erase(coin);
        book_.release_slot();
    }

    // Resolved by the operator; the published view no longer carries exposure
    snapshot.status = PositionStatus::Closed;
    snapshot.closed_at = clock_.now();

    LOG_WARN("Released FAILED position {} (last error: {})", coin.view(), snapshot.last_error);
    sink::publish_safely("position update", [&] { sink_->publish_position_update(snapshot); });
    return true;
}

LifecycleStats PositionLifecycleManager::stats() const {
    LifecycleStats stats;
    for (const auto& tracked : book_.all()) {
        const auto snapshot = tracked->snapshot();
        switch (snapshot.status) {
            case PositionStatus::Open:
                ++stats.open_positions;
                stats.unrealized_pnl += snapshot.unrealized_pnl();
                break;
            case PositionStatus::Closing:
                ++stats.closing_positions;
                stats.unrealized_pnl += snapshot.unrealized_pnl();
                break;
            case PositionStatus::Failed:
                ++stats.failed_positions;
                break;
            default:
                break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats.realized_pnl = realized_pnl_;
        stats.closed_trades = closed_trades_;
        stats.wins = wins_;
        stats.losses = losses_;
    }
    stats.checks = checks_.load(std::memory_order_relaxed);
    stats.skipped_checks = skipped_checks_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace vigil::order
