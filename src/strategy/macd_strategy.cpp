// ============================================================================
// VIGIL - MACD Strategy Implementation
// ============================================================================

#include "vigil/strategy/macd_strategy.hpp"

#include "vigil/strategy/indicators/macd.hpp"

#include <algorithm>
#include <cmath>

namespace vigil::strategy {

double macd_strength(double histogram, double prev_histogram) {
    const double momentum = std::abs(histogram - prev_histogram);
    const double histogram_boost = std::min(0.2, std::abs(histogram) * 0.05);
    const double momentum_boost = std::min(0.1, momentum * 0.02);
    return std::min(1.0, 0.7 + histogram_boost + momentum_boost);
}

MacdStrategy::MacdStrategy(std::string name, std::shared_ptr<market::RateLimitedFetcher> fetcher,
                           const IClock& clock)
    : CandleStrategy(std::move(name), market::Timeframe::Min15, CANDLES, std::move(fetcher), clock) {}

std::optional<Signal> MacdStrategy::evaluate(const Symbol& coin,
                                             const std::vector<market::Candle>& candles) {
    if (candles.size() < MIN_CANDLES) {
        return std::nullopt;
    }

    MACD_12_26_9 macd;
    feed(macd, market::closes(candles));
    if (!macd.is_ready()) {
        return std::nullopt;
    }

    Action action = Action::Hold;
    if (macd.crossed_above_zero()) {
        action = Action::Buy;
    } else if (macd.crossed_below_zero()) {
        action = Action::Sell;
    }

    const double strength =
        action == Action::Hold ? 0.0 : macd_strength(macd.histogram(), macd.previous_histogram());

    return make_signal(coin, action, strength,
                       {{"macd", macd.value()},
                        {"signal", macd.signal_line()},
                        {"histogram", macd.histogram()}});
}

}  // namespace vigil::strategy
