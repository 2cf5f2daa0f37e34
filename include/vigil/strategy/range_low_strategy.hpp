#pragma once
// ============================================================================
// VIGIL - 24h Low Range Strategy
// ============================================================================
// Long-only: BUY while the live price sits inside a band anchored on the
// lowest low of the last 24 hourly candles
//   band = [low * (1 + offset%), low * (1 + offset% + tolerance%)]
// Strength 1.0 at the bottom of the band falling to 0.7 at the top
// ============================================================================

#include "vigil/strategy/candle_strategy.hpp"

namespace vigil::strategy {

struct RangeLowParams {
    double long_offset_percent = -1.0;
    double tolerance_percent = 2.0;
};

class RangeLowStrategy final : public CandleStrategy {
public:
    static constexpr size_t CANDLES = 24;

    RangeLowStrategy(std::string name, RangeLowParams params,
                     std::shared_ptr<market::RateLimitedFetcher> fetcher, const IClock& clock);

    /// Fetches the candles and the live price, then decide()
    [[nodiscard]] std::optional<Signal> generate(const Symbol& coin) override;

    /// Uses the last close as the live price
    [[nodiscard]] std::optional<Signal> evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) override;

    [[nodiscard]] std::optional<Signal> decide(const Symbol& coin,
                                               const std::vector<market::Candle>& candles,
                                               double price) const;

private:
    RangeLowParams params_;
};

}  // namespace vigil::strategy
