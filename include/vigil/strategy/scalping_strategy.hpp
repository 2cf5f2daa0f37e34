#pragma once
// ============================================================================
// VIGIL - Scalping Strategy
// ============================================================================
// 1-minute EMA(5) / EMA(13) crossover confirmed by RSI(7) inside the neutral
// band and a volume spike over the 20-candle average
// ============================================================================

#include "vigil/strategy/candle_strategy.hpp"

namespace vigil::strategy {

struct ScalpingParams {
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;
    double volume_multiplier = 1.5;
};

class ScalpingStrategy final : public CandleStrategy {
public:
    static constexpr size_t VOLUME_WINDOW = 20;
    static constexpr size_t MIN_CANDLES = VOLUME_WINDOW + 5;
    static constexpr size_t CANDLES = 100;

    ScalpingStrategy(std::string name, ScalpingParams params,
                     std::shared_ptr<market::RateLimitedFetcher> fetcher, const IClock& clock);

    [[nodiscard]] std::optional<Signal> evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) override;

private:
    ScalpingParams params_;
};

}  // namespace vigil::strategy
