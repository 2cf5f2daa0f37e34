#pragma once
// ============================================================================
// VIGIL - RSI Strategy
// ============================================================================
// RSI(14) threshold strategy, one instance per timeframe
// BUY at or below oversold, SELL at or above overbought; strength grows with
// the distance past the threshold, floored at 0.6
// ============================================================================

#include "vigil/strategy/candle_strategy.hpp"

namespace vigil::strategy {

struct RsiParams {
    double oversold = 30.0;
    double overbought = 70.0;
};

class RsiStrategy final : public CandleStrategy {
public:
    static constexpr size_t CANDLES = 100;

    RsiStrategy(std::string name, market::Timeframe timeframe, RsiParams params,
                std::shared_ptr<market::RateLimitedFetcher> fetcher, const IClock& clock);

    [[nodiscard]] std::optional<Signal> evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) override;

    [[nodiscard]] const RsiParams& params() const noexcept { return params_; }

private:
    RsiParams params_;
};

/// Strength for an RSI reading, 0 when inside the neutral band
[[nodiscard]] double rsi_strength(double rsi, Action action, const RsiParams& params);

}  // namespace vigil::strategy
