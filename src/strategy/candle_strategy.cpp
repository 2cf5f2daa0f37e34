// ============================================================================
// VIGIL - Candle Strategy Base Implementation
// ============================================================================

#include "vigil/strategy/candle_strategy.hpp"

#include "vigil/utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace vigil::strategy {

CandleStrategy::CandleStrategy(std::string name, market::Timeframe timeframe, size_t candle_limit,
                               std::shared_ptr<market::RateLimitedFetcher> fetcher,
                               const IClock& clock)
    : name_(std::move(name)),
      timeframe_(timeframe),
      candle_limit_(candle_limit),
      fetcher_(std::move(fetcher)),
      clock_(clock) {
    if (!fetcher_) {
        throw std::invalid_argument(name_ + ": fetcher required");
    }
}

std::optional<Signal> CandleStrategy::generate(const Symbol& coin) {
    const auto candles = fetcher_->fetch_candles(coin, timeframe_, candle_limit_);
    auto signal = evaluate(coin, candles);
    if (!signal) {
        LOG_DEBUG("{}: insufficient data for {} ({} candles)", name_, coin.view(), candles.size());
    }
    return signal;
}

Signal CandleStrategy::make_signal(const Symbol& coin, Action action, double strength,
                                   SignalMetadata metadata) const {
    Signal signal;
    signal.coin = coin;
    signal.source = name_;
    signal.timestamp = clock_.now();
    signal.metadata = std::move(metadata);
    signal.metadata["timeframe"] = std::string(market::to_string(timeframe_));

    strength = std::clamp(strength, 0.0, 1.0);
    if (action == Action::Hold || strength == 0.0) {
        signal.action = Action::Hold;
        signal.strength = 0.0;
    } else {
        signal.action = action;
        signal.strength = strength;
    }
    return signal;
}

}  // namespace vigil::strategy
