#pragma once
// ============================================================================
// VIGIL - Position
// ============================================================================
// A held exposure in one coin, from the OPENING placeholder reserved by the
// order gate through CLOSED (or FAILED)
// ============================================================================

#include "vigil/core/types.hpp"
#include "vigil/risk/exit_levels.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace vigil::order {

using risk::CloseReason;

enum class PositionStatus : uint8_t {
    Opening = 0,    // Reserved, order not yet confirmed
    Open,
    Closing,        // Exit decided, close order pending or being retried
    Closed,
    Failed          // Open failed, or close retries exhausted
};

[[nodiscard]] constexpr std::string_view to_string(PositionStatus status) noexcept {
    switch (status) {
        case PositionStatus::Opening: return "OPENING";
        case PositionStatus::Open:    return "OPEN";
        case PositionStatus::Closing: return "CLOSING";
        case PositionStatus::Closed:  return "CLOSED";
        case PositionStatus::Failed:  return "FAILED";
    }
    return "UNKNOWN";
}

struct Position {
    uint64_t id = 0;
    Symbol coin;
    PositionSide side = PositionSide::Long;
    std::string source;             // Strategy whose signal opened it
    std::string order_id;
    double signal_strength = 0.0;

    Price entry_price;
    Quantity size;
    Timestamp opened_at;

    risk::ExitParameters exit_params;   // Frozen at open; risk reloads do not apply
    risk::ExitLevels levels;

    PositionStatus status = PositionStatus::Opening;
    CloseReason close_reason = CloseReason::None;
    Price last_mark_price;
    Price exit_price;
    Timestamp closed_at;
    double realized_pnl = 0.0;

    int close_attempts = 0;
    std::string last_error;

    [[nodiscard]] bool is_active() const noexcept {
        return status == PositionStatus::Opening || status == PositionStatus::Open ||
               status == PositionStatus::Closing;
    }

    /// Active, or a filled position whose close escalated to FAILED: either
    /// way the exchange may still hold it
    [[nodiscard]] bool holds_exposure() const noexcept {
        return is_active() || (status == PositionStatus::Failed && entry_price.is_valid());
    }

    /// P&L at the last mark price seen (0 before the first tick)
    [[nodiscard]] double unrealized_pnl() const {
        if (!last_mark_price.is_valid() || !entry_price.is_valid()) return 0.0;
        return risk::calculate_pnl(side, entry_price, last_mark_price, size);
    }

    /// Quote-currency value at entry
    [[nodiscard]] double notional() const { return entry_price.to_double() * size.to_double(); }
};

/// A position plus the synchronization the gate and the lifecycle manager share.
/// Lock order: coin lock (PositionBook) before `mutex`.
struct TrackedPosition {
    explicit TrackedPosition(Position p) : position(std::move(p)) {}

    std::mutex mutex;
    Position position;

    /// Set while a lifecycle check for this position is running
    std::atomic<bool> check_in_flight{false};

    [[nodiscard]] Position snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return position;
    }
};

using TrackedPositionPtr = std::shared_ptr<TrackedPosition>;

/// One completed round trip
struct TradeRecord {
    Symbol coin;
    PositionSide side = PositionSide::Long;
    std::string source;
    Price entry_price;
    Price exit_price;
    Quantity size;
    CloseReason reason = CloseReason::None;
    double pnl = 0.0;
    double pnl_percent = 0.0;
    Timestamp opened_at;
    Timestamp closed_at;
};

[[nodiscard]] TradeRecord make_trade_record(const Position& closed);

/// "BTC LONG 0.00040 @ 50000.00 [OPEN]"
[[nodiscard]] std::string describe(const Position& position);

}  // namespace vigil::order
