// ============================================================================
// VIGIL - 24h Low Range Strategy Implementation
// ============================================================================

#include "vigil/strategy/range_low_strategy.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace vigil::strategy {

RangeLowStrategy::RangeLowStrategy(std::string name, RangeLowParams params,
                                   std::shared_ptr<market::RateLimitedFetcher> fetcher,
                                   const IClock& clock)
    : CandleStrategy(std::move(name), market::Timeframe::Hour1, CANDLES, std::move(fetcher), clock),
      params_(params) {
    if (params_.tolerance_percent < 0.0) {
        throw std::invalid_argument(this->name() + ": tolerance_percent must be non-negative");
    }
}

std::optional<Signal> RangeLowStrategy::generate(const Symbol& coin) {
    const auto candles = fetcher().fetch_candles(coin, timeframe(), candle_limit());
    if (candles.size() < CANDLES) {
        return std::nullopt;
    }
    const Price price = fetcher().latest_price(coin);
    return decide(coin, candles, price.to_double());
}

std::optional<Signal> RangeLowStrategy::evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) {
    if (candles.empty()) {
        return std::nullopt;
    }
    return decide(coin, candles, candles.back().close);
}

std::optional<Signal> RangeLowStrategy::decide(const Symbol& coin,
                                               const std::vector<market::Candle>& candles,
                                               double price) const {
    if (candles.size() < CANDLES || price <= 0.0) {
        return std::nullopt;
    }

    double low = std::numeric_limits<double>::max();
    double high = 0.0;
    for (const auto& candle : candles) {
        low = std::min(low, candle.low);
        high = std::max(high, candle.high);
    }

    const double offset = params_.long_offset_percent / 100.0;
    const double tolerance = params_.tolerance_percent / 100.0;
    const double band_low = low * (1.0 + offset);
    const double band_high = low * (1.0 + offset + tolerance);
    const bool in_range = price >= band_low && price <= band_high;

    double strength = 0.0;
    if (in_range) {
        const double width = band_high - band_low;
        if (width == 0.0) {
            strength = 0.85;
        } else {
            const double position = (price - band_low) / width;
            strength = std::clamp(1.0 - position * 0.3, 0.7, 1.0);
        }
    }

    return make_signal(coin, in_range ? Action::Buy : Action::Hold, strength,
                       {{"price", price},
                        {"low_24h", low},
                        {"high_24h", high},
                        {"buy_range_low", band_low},
                        {"buy_range_high", band_high},
                        {"in_range", in_range}});
}

}  // namespace vigil::strategy
