#pragma once
// ============================================================================
// VIGIL - Exit Levels
// ============================================================================
// Stop-loss, take-profit and trailing-stop arithmetic for one position
// Percent units throughout: 0.6 means 0.6 %
// ============================================================================

#include "vigil/core/types.hpp"
#include "vigil/risk/risk_config.hpp"

#include <cstdint>
#include <string_view>

namespace vigil::risk {

// ============================================================================
// Close Reasons
// ============================================================================

enum class CloseReason : uint8_t {
    None = 0,
    StopLoss,
    TakeProfit,
    TrailingStop,
    Emergency
};

[[nodiscard]] constexpr std::string_view to_string(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::None:         return "NONE";
        case CloseReason::StopLoss:     return "STOP_LOSS";
        case CloseReason::TakeProfit:   return "TAKE_PROFIT";
        case CloseReason::TrailingStop: return "TRAILING_STOP";
        case CloseReason::Emergency:    return "EMERGENCY";
    }
    return "UNKNOWN";
}

// ============================================================================
// Exit Parameters (captured when a position opens)
// ============================================================================

struct ExitParameters {
    double stop_loss_percent = 0.0;
    double take_profit_percent = 0.0;       // 0 = disabled
    double trailing_stop_percent = 0.0;     // 0 = disabled
    double trailing_activation_percent = 0.0;

    [[nodiscard]] static ExitParameters from(const RiskConfig& config) {
        return ExitParameters{config.stop_loss_percent, config.take_profit_percent,
                              config.trailing_stop_percent,
                              config.effective_trailing_activation()};
    }

    [[nodiscard]] bool take_profit_enabled() const noexcept { return take_profit_percent > 0.0; }
    [[nodiscard]] bool trailing_enabled() const noexcept { return trailing_stop_percent > 0.0; }
};

// ============================================================================
// Exit Levels (mutable per-position state)
// ============================================================================

struct ExitLevels {
    Price stop_loss;
    Price take_profit;          // Zero when take-profit is disabled
    Price watermark;            // Highest (LONG) / lowest (SHORT) price seen
    Price trailing_stop;        // Never looser than stop_loss; only tightens
    bool trailing_active = false;
};

// ============================================================================
// Level Calculators
// ============================================================================

[[nodiscard]] Price calculate_stop_loss(Price entry_price, PositionSide side, double percent);

[[nodiscard]] Price calculate_take_profit(Price entry_price, PositionSide side, double percent);

/// Candidate stop `percent` behind the watermark, never looser than `current_stop`
[[nodiscard]] Price calculate_trailing_stop(Price watermark, Price current_stop,
                                            PositionSide side, double percent);

/// Levels for a freshly filled position: watermark at entry, trailing floor at stop-loss
[[nodiscard]] ExitLevels initial_exit_levels(Price entry_price, PositionSide side,
                                             const ExitParameters& params);

/// Apply one mark price. Checks stop-loss, then take-profit, then advances the
/// watermark and the trailing stop and checks it. Returns the first exit that
/// fires, or CloseReason::None.
[[nodiscard]] CloseReason evaluate_exit(ExitLevels& levels, Price entry_price, PositionSide side,
                                        const ExitParameters& params, Price mark);

// ============================================================================
// P&L
// ============================================================================

/// (exit - entry) * size for LONG, (entry - exit) * size for SHORT
[[nodiscard]] double calculate_pnl(PositionSide side, Price entry_price, Price exit_price,
                                   Quantity size);

[[nodiscard]] double calculate_pnl_percent(PositionSide side, Price entry_price, Price exit_price);

}  // namespace vigil::risk
