#pragma once
// ============================================================================
// VIGIL - Signal
// ============================================================================
// Immutable recommendation produced by one strategy for one coin
// Invariant: strength == 0.0 iff action == Hold
// ============================================================================

#include "vigil/core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vigil {

/// Diagnostic scalar attached to a signal (indicator values, reasons)
using MetaValue = std::variant<double, int64_t, bool, std::string>;
using SignalMetadata = std::map<std::string, MetaValue>;

struct Signal {
    Symbol coin;
    Action action = Action::Hold;
    double strength = 0.0;      // [0.0, 1.0]
    Timestamp timestamp;
    std::string source;         // Unique strategy id, e.g. "rsi_5min"
    SignalMetadata metadata;

    [[nodiscard]] bool is_hold() const noexcept { return action == Action::Hold; }

    /// Non-hold and at least `min_strength`
    [[nodiscard]] bool is_actionable(double min_strength) const noexcept {
        return action != Action::Hold && strength >= min_strength;
    }

    /// Position direction a Buy / Sell opens
    [[nodiscard]] PositionSide position_side() const noexcept {
        return action == Action::Sell ? PositionSide::Short : PositionSide::Long;
    }
};

/// Returns a description of the first contract violation, or nullopt if the
/// signal is well formed
[[nodiscard]] std::optional<std::string> validate_signal(const Signal& signal);

/// "rsi_5min: BUY BTC (strength: 0.80)"
[[nodiscard]] std::string describe(const Signal& signal);

/// Render a metadata value for logs
[[nodiscard]] std::string to_string(const MetaValue& value);

/// Build a Hold signal (strength 0)
[[nodiscard]] Signal make_hold(const Symbol& coin, std::string_view source, Timestamp ts);

}  // namespace vigil
