#pragma once
// ============================================================================
// VIGIL - State Sink
// ============================================================================
// Outward channel for signals, position updates, trades and errors
// Publishing is best-effort: a failing sink never affects trading
// ============================================================================

#include "vigil/core/bounded_queue.hpp"
#include "vigil/order/position.hpp"
#include "vigil/signal/signal.hpp"
#include "vigil/utils/logger.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace vigil::sink {

// ============================================================================
// Sink Interface
// ============================================================================

class IStateSink {
public:
    virtual ~IStateSink() = default;

    virtual void publish_signal(const Signal& signal) = 0;
    virtual void publish_position_update(const order::Position& position) = 0;
    virtual void publish_trade(const order::Position& closed, order::CloseReason reason) = 0;
    virtual void publish_error(std::string_view context, std::string_view message) = 0;
};

/// Discards everything
class NullStateSink final : public IStateSink {
public:
    void publish_signal(const Signal&) override {}
    void publish_position_update(const order::Position&) override {}
    void publish_trade(const order::Position&, order::CloseReason) override {}
    void publish_error(std::string_view, std::string_view) override {}
};

// ============================================================================
// Logging Sink (bounded queue + dedicated thread)
// ============================================================================

struct SinkSnapshot {
    std::unordered_map<std::string, Signal> latest_signals;     // Keyed "source/coin"
    // Keyed by coin: active positions and failed closes still on the exchange
    std::unordered_map<std::string, order::Position> positions;
    std::vector<order::TradeRecord> trades;                     // Most recent last
    std::vector<std::string> errors;                            // Most recent last
    uint64_t dropped_events = 0;
};

class LoggingStateSink final : public IStateSink {
public:
    struct Config {
        size_t queue_capacity = 1024;
        size_t history_limit = 200;
    };

    LoggingStateSink();
    explicit LoggingStateSink(Config config);
    ~LoggingStateSink() override;

    LoggingStateSink(const LoggingStateSink&) = delete;
    LoggingStateSink& operator=(const LoggingStateSink&) = delete;

    void publish_signal(const Signal& signal) override;
    void publish_position_update(const order::Position& position) override;
    void publish_trade(const order::Position& closed, order::CloseReason reason) override;
    void publish_error(std::string_view context, std::string_view message) override;

    /// Block until every event queued so far has been applied
    void drain();

    /// Stop the worker after draining the queue
    void stop();

    [[nodiscard]] SinkSnapshot snapshot() const;

private:
    struct ErrorEvent {
        std::string context;
        std::string message;
    };
    struct TradeEvent {
        order::Position position;
        order::CloseReason reason;
    };
    using Event = std::variant<Signal, order::Position, TradeEvent, ErrorEvent>;

    void enqueue(Event event);
    void run();
    void apply(const Event& event);

    Config config_;
    BoundedQueue<Event> queue_;

    mutable std::mutex state_mutex_;
    SinkSnapshot state_;
    std::deque<order::TradeRecord> trades_;
    std::deque<std::string> errors_;

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> applied_{0};
    std::atomic<bool> running_{true};
    std::thread worker_;
};

// ============================================================================
// Guarded Publishing
// ============================================================================

/// Invoke a sink call and log instead of propagating any failure
template <typename F>
void publish_safely(std::string_view what, F&& fn) noexcept {
    try {
        fn();
    } catch (const std::exception& e) {
        try {
            LOG_WARN("State sink {} failed: {}", what, e.what());
        } catch (const std::exception&) {
            // Logging itself failed; nothing left to report to
        }
    }
}

}  // namespace vigil::sink
