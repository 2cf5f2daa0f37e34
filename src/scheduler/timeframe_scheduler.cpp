// ============================================================================
// VIGIL - Timeframe Scheduler Implementation
// ============================================================================

#include "vigil/scheduler/timeframe_scheduler.hpp"

#include "vigil/core/errors.hpp"
#include "vigil/utils/logger.hpp"

#include <boost/asio/post.hpp>

namespace vigil::scheduler {

TimeframeScheduler::TimeframeScheduler(SchedulerConfig config, boost::asio::thread_pool& workers,
                                       SignalQueue& queue, std::shared_ptr<sink::IStateSink> sink,
                                       const IClock& clock)
    : config_(config),
      workers_(workers),
      queue_(queue),
      sink_(sink ? std::move(sink) : std::make_shared<sink::NullStateSink>()),
      clock_(clock) {}

TimeframeScheduler::~TimeframeScheduler() {
    stop();
}

void TimeframeScheduler::register_entry(std::shared_ptr<strategy::IStrategy> strategy,
                                        const Symbol& coin, Duration interval) {
    if (!strategy) {
        throw std::invalid_argument("register_entry: null strategy");
    }
    if (interval <= Duration::zero()) {
        throw std::invalid_argument("register_entry: interval must be positive");
    }

    std::lock_guard<std::mutex> lock(entries_mutex_);

    const Strand& strand =
        strands_.try_emplace(strategy->name(), boost::asio::make_strand(workers_)).first->second;
    auto entry = std::make_unique<Entry>(strand);
    entry->strategy = std::move(strategy);
    entry->coin = coin;
    entry->interval = interval;

    LOG_DEBUG("Scheduled {} for {} every {} s", entry->strategy->name(), coin.view(),
              std::chrono::duration_cast<std::chrono::seconds>(interval).count());

    entries_.push_back(std::move(entry));
}

size_t TimeframeScheduler::set_enabled(std::string_view source, bool enabled) {
    size_t affected = 0;
    std::lock_guard<std::mutex> lock(entries_mutex_);
    for (auto& entry : entries_) {
        if (entry->strategy->name() == source) {
            entry->enabled = enabled;
            ++affected;
        }
    }
    if (affected > 0) {
        LOG_INFO("Strategy {} {} ({} entries)", source, enabled ? "enabled" : "disabled", affected);
    }
    return affected;
}

// ============================================================================
// Control Loop
// ============================================================================

void TimeframeScheduler::run_forever() {
    running_.store(true, std::memory_order_release);
    loop();
}

void TimeframeScheduler::start() {
    if (loop_thread_.joinable()) {
        return;
    }
    running_.store(true, std::memory_order_release);
    loop_thread_ = std::thread([this] { loop(); });
}

void TimeframeScheduler::loop() {
    LOG_INFO("Scheduler running (tick {} ms)",
             std::chrono::duration_cast<std::chrono::milliseconds>(config_.tick).count());

    while (running_.load(std::memory_order_acquire)) {
        tick();

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, config_.tick,
                          [this] { return !running_.load(std::memory_order_acquire); });
    }

    LOG_INFO("Scheduler stopped");
}

void TimeframeScheduler::stop() {
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

size_t TimeframeScheduler::tick() {
    const Timestamp now = clock_.now();
    ticks_.fetch_add(1, std::memory_order_relaxed);

    size_t dispatched = 0;
    std::lock_guard<std::mutex> lock(entries_mutex_);

    for (auto& owned : entries_) {
        Entry& entry = *owned;
        if (!entry.enabled) {
            continue;
        }
        if (entry.last_run_at && now - *entry.last_run_at < entry.interval) {
            continue;
        }

        bool expected = false;
        if (!entry.in_flight.compare_exchange_strong(expected, true)) {
            entry.overlap_skips.fetch_add(1, std::memory_order_relaxed);
            overlap_skips_.fetch_add(1, std::memory_order_relaxed);
            LOG_DEBUG("{} for {} still running, skipping this tick", entry.strategy->name(),
                      entry.coin.view());
            continue;
        }

        // Stamped before the call so a slow invocation is not re-dispatched
        entry.last_run_at = now;
        {
            std::lock_guard<std::mutex> idle_lock(idle_mutex_);
            ++in_flight_;
        }

        boost::asio::post(entry.strand, [this, &entry] {
            invoke(entry);
            entry.in_flight.store(false, std::memory_order_release);
            finish_invocation();
        });
        ++dispatched;
    }

    dispatched_.fetch_add(dispatched, std::memory_order_relaxed);
    return dispatched;
}

void TimeframeScheduler::invoke(Entry& entry) {
    const std::string& source = entry.strategy->name();

    std::optional<Signal> signal;
    try {
        signal = entry.strategy->generate(entry.coin);
    } catch (const TransientError& e) {
        entry.failures.fetch_add(1, std::memory_order_relaxed);
        failures_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("{} {}: market data unavailable: {}", source, entry.coin.view(), e.what());
        sink::publish_safely("error", [&] { sink_->publish_error(source, e.what()); });
        return;
    } catch (const std::exception& e) {
        entry.failures.fetch_add(1, std::memory_order_relaxed);
        failures_.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("{} {}: strategy failed: {}", source, entry.coin.view(), e.what());
        sink::publish_safely("error", [&] { sink_->publish_error(source, e.what()); });
        return;
    }

    entry.runs.fetch_add(1, std::memory_order_relaxed);

    if (!signal) {
        no_opinion_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    sink::publish_safely("signal", [&] { sink_->publish_signal(*signal); });

    if (signal->is_hold()) {
        holds_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    LOG_INFO("{}", describe(*signal));
    signals_.fetch_add(1, std::memory_order_relaxed);
    switch (queue_.push(*signal)) {
        case PushResult::Queued:
            break;
        case PushResult::EvictedOldest:
            LOG_WARN("Signal queue full, oldest signal dropped ({} dropped so far)",
                     queue_.dropped());
            break;
        case PushResult::Closed:
            discarded_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("Signal queue closed, discarded {}", describe(*signal));
            break;
    }
}

void TimeframeScheduler::finish_invocation() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        --in_flight_;
    }
    idle_cv_.notify_all();
}

void TimeframeScheduler::wait_idle() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

std::vector<EntryStatus> TimeframeScheduler::entries() const {
    std::vector<EntryStatus> result;
    std::lock_guard<std::mutex> lock(entries_mutex_);
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        EntryStatus status;
        status.source = entry->strategy->name();
        status.coin = entry->coin;
        status.interval = entry->interval;
        status.last_run_at = entry->last_run_at;
        status.enabled = entry->enabled;
        status.in_flight = entry->in_flight.load(std::memory_order_acquire);
        status.runs = entry->runs.load(std::memory_order_relaxed);
        status.failures = entry->failures.load(std::memory_order_relaxed);
        status.overlap_skips = entry->overlap_skips.load(std::memory_order_relaxed);
        result.push_back(std::move(status));
    }
    return result;
}

SchedulerStats TimeframeScheduler::stats() const {
    SchedulerStats stats;
    stats.ticks = ticks_.load(std::memory_order_relaxed);
    stats.dispatched = dispatched_.load(std::memory_order_relaxed);
    stats.signals = signals_.load(std::memory_order_relaxed);
    stats.holds = holds_.load(std::memory_order_relaxed);
    stats.no_opinion = no_opinion_.load(std::memory_order_relaxed);
    stats.failures = failures_.load(std::memory_order_relaxed);
    stats.overlap_skips = overlap_skips_.load(std::memory_order_relaxed);
    stats.dropped_signals = queue_.dropped();
    stats.discarded_signals = discarded_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace vigil::scheduler
