// ============================================================================
// VIGIL - Logging State Sink Implementation
// ============================================================================

#include "vigil/sink/state_sink.hpp"

#include <chrono>
#include <type_traits>

namespace vigil::sink {

namespace {

std::string signal_key(const Signal& signal) {
    return signal.source + "/" + signal.coin.str();
}

template <typename T>
void push_bounded(std::deque<T>& history, T value, size_t limit) {
    history.push_back(std::move(value));
    while (history.size() > limit) {
        history.pop_front();
    }
}

}  // namespace

LoggingStateSink::LoggingStateSink() : LoggingStateSink(Config{}) {}

LoggingStateSink::LoggingStateSink(Config config)
    : config_(config), queue_(config.queue_capacity), worker_([this] { run(); }) {}

LoggingStateSink::~LoggingStateSink() {
    stop();
}

void LoggingStateSink::publish_signal(const Signal& signal) {
    enqueue(signal);
}

void LoggingStateSink::publish_position_update(const order::Position& position) {
    enqueue(position);
}

void LoggingStateSink::publish_trade(const order::Position& closed, order::CloseReason reason) {
    enqueue(TradeEvent{closed, reason});
}

void LoggingStateSink::publish_error(std::string_view context, std::string_view message) {
    enqueue(ErrorEvent{std::string(context), std::string(message)});
}

void LoggingStateSink::enqueue(Event event) {
    enqueued_.fetch_add(1, std::memory_order_acq_rel);
    switch (queue_.push(std::move(event))) {
        case PushResult::Queued:
            break;
        case PushResult::EvictedOldest:
            LOG_DEBUG("State sink queue full, oldest event dropped");
            break;
        case PushResult::Closed:
            enqueued_.fetch_sub(1, std::memory_order_acq_rel);
            break;
    }
}

void LoggingStateSink::drain() {
    while (applied_.load(std::memory_order_acquire) + queue_.dropped() <
           enqueued_.load(std::memory_order_acquire)) {
        if (!running_.load(std::memory_order_acquire) && queue_.empty()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void LoggingStateSink::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

SinkSnapshot LoggingStateSink::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    SinkSnapshot copy = state_;
    copy.trades.assign(trades_.begin(), trades_.end());
    copy.errors.assign(errors_.begin(), errors_.end());
    copy.dropped_events = queue_.dropped();
    return copy;
}

void LoggingStateSink::run() {
    for (;;) {
        auto event = queue_.pop_for(std::chrono::milliseconds(100));
        if (!event) {
            if (!running_.load(std::memory_order_acquire) && queue_.empty()) {
                return;
            }
            continue;
        }

        try {
            apply(*event);
        } catch (const std::exception& e) {
            LOG_WARN("State sink failed to apply event: {}", e.what());
        }
        applied_.fetch_add(1, std::memory_order_acq_rel);
    }
}

void LoggingStateSink::apply(const Event& event) {
    std::visit(
        [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            std::lock_guard<std::mutex> lock(state_mutex_);

            if constexpr (std::is_same_v<T, Signal>) {
                state_.latest_signals[signal_key(e)] = e;
                LOG_DEBUG("[sink] signal {}", describe(e));
            } else if constexpr (std::is_same_v<T, order::Position>) {
                const std::string key = e.coin.str();
                if (e.holds_exposure()) {
                    state_.positions[key] = e;
                } else {
                    state_.positions.erase(key);
                }
                LOG_DEBUG("[sink] position {}", order::describe(e));
            } else if constexpr (std::is_same_v<T, TradeEvent>) {
                auto trade = order::make_trade_record(e.position);
                trade.reason = e.reason;
                LOG_INFO("[sink] trade {} {} {} pnl={:.4f} ({:.2f}%)", trade.coin.view(),
                         to_string(trade.side), risk::to_string(trade.reason), trade.pnl,
                         trade.pnl_percent);
                push_bounded(trades_, std::move(trade), config_.history_limit);
            } else {
                LOG_WARN("[sink] error in {}: {}", e.context, e.message);
                push_bounded(errors_, e.context + ": " + e.message, config_.history_limit);
            }
        },
        event);
}

}  // namespace vigil::sink
