#pragma once
// ============================================================================
// VIGIL - MACD Strategy
// ============================================================================
// MACD(12, 26, 9) histogram zero-line crossover on 15-minute candles
// ============================================================================

#include "vigil/strategy/candle_strategy.hpp"

namespace vigil::strategy {

class MacdStrategy final : public CandleStrategy {
public:
    static constexpr size_t MIN_CANDLES = 26 + 9 + 10;
    static constexpr size_t CANDLES = 100;

    MacdStrategy(std::string name, std::shared_ptr<market::RateLimitedFetcher> fetcher,
                 const IClock& clock);

    [[nodiscard]] std::optional<Signal> evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) override;
};

/// 0.7 base plus histogram magnitude and momentum boosts
[[nodiscard]] double macd_strength(double histogram, double prev_histogram);

}  // namespace vigil::strategy
