#pragma once
// ============================================================================
// VIGIL - SMA Crossover Strategy
// ============================================================================
// SMA(10) / SMA(20) crossover on 5-minute candles
// A crossover emits immediately; an established trend emits once per coin
// until the trend flips
// ============================================================================

#include "vigil/strategy/candle_strategy.hpp"

#include <mutex>
#include <unordered_map>

namespace vigil::strategy {

class SmaCrossStrategy final : public CandleStrategy {
public:
    static constexpr size_t SHORT_PERIOD = 10;
    static constexpr size_t LONG_PERIOD = 20;
    static constexpr size_t CANDLES = LONG_PERIOD + 50;

    SmaCrossStrategy(std::string name, std::shared_ptr<market::RateLimitedFetcher> fetcher,
                     const IClock& clock);

    [[nodiscard]] std::optional<Signal> evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) override;

private:
    enum class Trend { None, Bullish, Bearish };

    std::mutex mutex_;
    std::unordered_map<Symbol, Trend> last_trend_;
};

}  // namespace vigil::strategy
