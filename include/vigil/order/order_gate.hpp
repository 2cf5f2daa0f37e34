#pragma once
// ============================================================================
// VIGIL - Order Gate
// ============================================================================
// Admission control between strategy signals and the exchange
//
// Two-phase admission:
//   1. Under the coin lock: duplicate, cooldown and capacity checks, then an
//      OPENING placeholder and a reserved slot
//   2. Outside any lock: mark price, sizing, balance check, place_order
//   3. Under the coin lock again: confirm OPEN, or drop the placeholder and
//      release the slot
// Admission for different coins proceeds in parallel.
// ============================================================================

#include "vigil/core/bounded_queue.hpp"
#include "vigil/core/clock.hpp"
#include "vigil/core/timed_call.hpp"
#include "vigil/exchange/exchange_client.hpp"
#include "vigil/order/lifecycle_manager.hpp"
#include "vigil/order/position.hpp"
#include "vigil/risk/risk_config.hpp"
#include "vigil/signal/signal.hpp"
#include "vigil/sink/state_sink.hpp"

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace vigil::order {

using SignalQueue = BoundedQueue<Signal>;

// ============================================================================
// Admission Result
// ============================================================================

enum class AdmissionDecision : uint8_t {
    Admitted = 0,
    RejectedInvalid,
    RejectedHold,
    RejectedWeak,
    RejectedShortDisabled,
    RejectedDuplicate,
    RejectedCooldown,
    RejectedMaxPositions,
    RejectedInsufficientBalance,
    ExchangeFailed
};

[[nodiscard]] constexpr std::string_view to_string(AdmissionDecision decision) noexcept {
    switch (decision) {
        case AdmissionDecision::Admitted:                    return "ADMITTED";
        case AdmissionDecision::RejectedInvalid:             return "REJECTED_INVALID";
        case AdmissionDecision::RejectedHold:                return "REJECTED_HOLD";
        case AdmissionDecision::RejectedWeak:                return "REJECTED_WEAK";
        case AdmissionDecision::RejectedShortDisabled:       return "REJECTED_SHORT_DISABLED";
        case AdmissionDecision::RejectedDuplicate:           return "REJECTED_DUPLICATE";
        case AdmissionDecision::RejectedCooldown:            return "REJECTED_COOLDOWN";
        case AdmissionDecision::RejectedMaxPositions:        return "REJECTED_MAX_POSITIONS";
        case AdmissionDecision::RejectedInsufficientBalance: return "REJECTED_INSUFFICIENT_BALANCE";
        case AdmissionDecision::ExchangeFailed:              return "EXCHANGE_FAILED";
    }
    return "UNKNOWN";
}

struct AdmissionResult {
    AdmissionDecision decision = AdmissionDecision::RejectedInvalid;
    std::string reason;
    std::optional<Position> position;   // Set when admitted

    [[nodiscard]] bool admitted() const noexcept {
        return decision == AdmissionDecision::Admitted;
    }
};

struct GateStats {
    uint64_t received = 0;
    uint64_t admitted = 0;
    uint64_t rejected = 0;
    uint64_t exchange_failures = 0;
    uint64_t trades_today = 0;
    std::map<std::string, uint64_t> trades_today_by_coin;
};

// ============================================================================
// Order Gate
// ============================================================================

class OrderGate {
public:
    OrderGate(PositionLifecycleManager& lifecycle,
              std::shared_ptr<exchange::IExchangeClient> exchange,
              risk::RiskConfigStore& risk,
              TimedCaller& caller,
              std::shared_ptr<sink::IStateSink> sink,
              const IClock& clock);
    ~OrderGate();

    OrderGate(const OrderGate&) = delete;
    OrderGate& operator=(const OrderGate&) = delete;

    /// Run one signal through admission; safe to call from any thread
    AdmissionResult submit(const Signal& signal);

    // ========================================================================
    // Queue Consumer
    // ========================================================================

    /// Consume `queue` on an owned thread. Each signal is submitted on the
    /// strand of its source so one strategy's signals are handled in order
    /// while different strategies run in parallel on `workers`.
    void start(SignalQueue& queue, boost::asio::thread_pool& workers);

    /// Stop consuming and wait for submissions in flight
    void stop();

    /// Block until every dispatched submission has finished
    void wait_idle();

    [[nodiscard]] GateStats stats() const;

private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    void consume(SignalQueue& queue, boost::asio::thread_pool& workers);
    AdmissionResult reject(const Signal& signal, AdmissionDecision decision, std::string reason);
    void abandon(const TrackedPositionPtr& tracked, const std::string& error);
    void record_admission(const Symbol& coin);

    PositionLifecycleManager& lifecycle_;
    std::shared_ptr<exchange::IExchangeClient> exchange_;
    risk::RiskConfigStore& risk_;
    TimedCaller& caller_;
    std::shared_ptr<sink::IStateSink> sink_;
    const IClock& clock_;

    // Cooldowns, keyed by coin, guarded by the coin lock of that coin
    std::mutex cooldown_mutex_;
    std::unordered_map<Symbol, Timestamp> last_open_;

    // Statistics
    mutable std::mutex stats_mutex_;
    GateStats stats_;
    int64_t stats_day_ = -1;

    // Consumer
    std::atomic<bool> running_{false};
    std::thread consumer_;
    std::unordered_map<std::string, Strand> strands_;
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;
};

}  // namespace vigil::order
