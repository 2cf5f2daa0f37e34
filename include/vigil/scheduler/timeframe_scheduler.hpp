#pragma once
// ============================================================================
// VIGIL - Timeframe Scheduler
// ============================================================================
// Runs every (strategy, coin) pair at its own cadence
// A fixed tick finds the due entries and dispatches them to the worker pool;
// produced non-HOLD signals go to the order gate queue, never blocking.
// Invocations of one strategy share a strand, so a strategy waiting on its own
// rate limiter holds at most one worker and never starves the others.
//
// Overlap policy: an entry whose previous invocation is still running is
// skipped (and counted) on that tick. Its last_run_at is left untouched so it
// runs on the first tick after the slow call returns. Other entries are
// unaffected.
// ============================================================================

#include "vigil/core/bounded_queue.hpp"
#include "vigil/core/clock.hpp"
#include "vigil/signal/signal.hpp"
#include "vigil/sink/state_sink.hpp"
#include "vigil/strategy/strategy.hpp"

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vigil::scheduler {

using SignalQueue = BoundedQueue<Signal>;

struct SchedulerConfig {
    Duration tick = std::chrono::seconds(1);
};

/// Read-only view of one schedule entry
struct EntryStatus {
    std::string source;
    Symbol coin;
    Duration interval{};
    std::optional<Timestamp> last_run_at;
    bool enabled = true;
    bool in_flight = false;
    uint64_t runs = 0;
    uint64_t failures = 0;
    uint64_t overlap_skips = 0;
};

struct SchedulerStats {
    uint64_t ticks = 0;
    uint64_t dispatched = 0;
    uint64_t signals = 0;           // Non-HOLD signals pushed to the gate
    uint64_t holds = 0;
    uint64_t no_opinion = 0;
    uint64_t failures = 0;
    uint64_t overlap_skips = 0;
    uint64_t dropped_signals = 0;   // Evicted from the full gate queue
    uint64_t discarded_signals = 0; // Produced after the gate queue was closed
};

class TimeframeScheduler {
public:
    TimeframeScheduler(SchedulerConfig config,
                       boost::asio::thread_pool& workers,
                       SignalQueue& queue,
                       std::shared_ptr<sink::IStateSink> sink,
                       const IClock& clock);
    ~TimeframeScheduler();

    TimeframeScheduler(const TimeframeScheduler&) = delete;
    TimeframeScheduler& operator=(const TimeframeScheduler&) = delete;

    /// Add a (strategy, coin) pair; it first runs on the next tick
    void register_entry(std::shared_ptr<strategy::IStrategy> strategy, const Symbol& coin,
                        Duration interval);

    /// Enable or disable every entry of one strategy; returns entries affected
    size_t set_enabled(std::string_view source, bool enabled);

    // ========================================================================
    // Control Loop
    // ========================================================================

    /// Blocking loop: tick() every config.tick until stop()
    void run_forever();

    /// run_forever() on an owned thread
    void start();

    /// Stop dispatching and wait for invocations in flight
    void stop();

    /// Dispatch every due entry at clock.now(); returns the number dispatched
    size_t tick();

    /// Block until no invocation is in flight
    void wait_idle();

    [[nodiscard]] std::vector<EntryStatus> entries() const;
    [[nodiscard]] SchedulerStats stats() const;

private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    struct Entry {
        explicit Entry(Strand s) : strand(std::move(s)) {}

        Strand strand;
        std::shared_ptr<strategy::IStrategy> strategy;
        Symbol coin;
        Duration interval;
        std::optional<Timestamp> last_run_at;
        bool enabled = true;
        std::atomic<bool> in_flight{false};
        std::atomic<uint64_t> runs{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<uint64_t> overlap_skips{0};
    };

    void loop();
    void invoke(Entry& entry);
    void finish_invocation();

    SchedulerConfig config_;
    boost::asio::thread_pool& workers_;
    SignalQueue& queue_;
    std::shared_ptr<sink::IStateSink> sink_;
    const IClock& clock_;

    mutable std::mutex entries_mutex_;
    std::vector<std::unique_ptr<Entry>> entries_;
    std::unordered_map<std::string, Strand> strands_;   // One per strategy name

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> signals_{0};
    std::atomic<uint64_t> holds_{0};
    std::atomic<uint64_t> no_opinion_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> overlap_skips_{0};
    std::atomic<uint64_t> discarded_{0};

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::atomic<bool> running_{false};
    std::thread loop_thread_;
};

}  // namespace vigil::scheduler
