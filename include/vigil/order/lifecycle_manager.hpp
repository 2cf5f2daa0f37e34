#pragma once
// ============================================================================
// VIGIL - Position Lifecycle Manager
// ============================================================================
// Polls mark prices for every OPEN position on a fixed cadence, applies
// stop-loss / take-profit / trailing-stop rules and closes positions.
// Checks for different positions run concurrently on the worker pool; a
// position is never checked twice at the same time.
// ============================================================================

#include "vigil/core/clock.hpp"
#include "vigil/core/timed_call.hpp"
#include "vigil/exchange/exchange_client.hpp"
#include "vigil/order/position.hpp"
#include "vigil/order/position_book.hpp"
#include "vigil/sink/state_sink.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace vigil::order {

struct LifecycleConfig {
    Duration monitor_interval = std::chrono::seconds(3);
    int max_close_retries = 5;      // Close attempts before a position is marked FAILED
};

struct LifecycleStats {
    size_t open_positions = 0;
    size_t closing_positions = 0;
    size_t failed_positions = 0;
    double unrealized_pnl = 0.0;
    double realized_pnl = 0.0;
    uint64_t closed_trades = 0;
    uint64_t wins = 0;
    uint64_t losses = 0;
    uint64_t checks = 0;
    uint64_t skipped_checks = 0;    // Tick found the previous check still running

    [[nodiscard]] double win_rate() const {
        const uint64_t total = wins + losses;
        return total > 0 ? static_cast<double>(wins) / static_cast<double>(total) : 0.0;
    }
};

class PositionLifecycleManager {
public:
    PositionLifecycleManager(LifecycleConfig config,
                             std::shared_ptr<exchange::IExchangeClient> exchange,
                             TimedCaller& caller,
                             boost::asio::thread_pool& workers,
                             std::shared_ptr<sink::IStateSink> sink,
                             const IClock& clock);
    ~PositionLifecycleManager();

    PositionLifecycleManager(const PositionLifecycleManager&) = delete;
    PositionLifecycleManager& operator=(const PositionLifecycleManager&) = delete;

    [[nodiscard]] PositionBook& book() noexcept { return book_; }

    /// Take over monitoring of a position the gate just confirmed OPEN
    void adopt(const TrackedPositionPtr& tracked);

    // ========================================================================
    // Monitoring Loop
    // ========================================================================

    /// Blocking loop: tick() every monitor_interval until stop()
    void run_forever();

    /// run_forever() on an owned thread
    void start();

    /// Stop the loop and wait for in-flight checks
    void stop();

    /// Dispatch one check per OPEN or CLOSING position; returns the number dispatched
    size_t tick();

    /// Block until no check is in flight
    void wait_idle();

    /// One synchronous check of a single position
    void check_position(const TrackedPositionPtr& tracked);

    // ========================================================================
    // Manual Intervention
    // ========================================================================

    /// Close every active position with reason EMERGENCY, retrying each up to
    /// max_close_retries. Returns the number closed.
    size_t force_close_all();

    [[nodiscard]] std::vector<Position> positions() const;

    [[nodiscard]] std::vector<Position> failed_positions() const;

    /// Drop a FAILED position from the book and free its slot after the
    /// operator resolved it on the exchange
    bool release_failed(const Symbol& coin);

    [[nodiscard]] LifecycleStats stats() const;

    [[nodiscard]] const LifecycleConfig& config() const noexcept { return config_; }

private:
    void loop();
    void run_check(const TrackedPositionPtr& tracked);
    void attempt_close(const TrackedPositionPtr& tracked);
    void finish_check();

    LifecycleConfig config_;
    std::shared_ptr<exchange::IExchangeClient> exchange_;
    TimedCaller& caller_;
    boost::asio::thread_pool& workers_;
    std::shared_ptr<sink::IStateSink> sink_;
    const IClock& clock_;

    PositionBook book_;

    // Realized statistics
    mutable std::mutex stats_mutex_;
    double realized_pnl_ = 0.0;
    uint64_t closed_trades_ = 0;
    uint64_t wins_ = 0;
    uint64_t losses_ = 0;
    std::atomic<uint64_t> checks_{0};
    std::atomic<uint64_t> skipped_checks_{0};

    // In-flight tracking
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;

    // Loop control
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::atomic<bool> running_{false};
    std::thread loop_thread_;
};

}  // namespace vigil::order
