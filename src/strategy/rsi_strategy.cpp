// ============================================================================
// VIGIL - RSI Strategy Implementation
// ============================================================================

#include "vigil/strategy/rsi_strategy.hpp"

#include "vigil/strategy/indicators/rsi.hpp"

#include <algorithm>
#include <stdexcept>

namespace vigil::strategy {

double rsi_strength(double rsi, Action action, const RsiParams& params) {
    if (action == Action::Buy && rsi <= params.oversold && params.oversold > 0.0) {
        return std::clamp(1.0 - rsi / params.oversold, 0.6, 1.0);
    }
    if (action == Action::Sell && rsi >= params.overbought && params.overbought < 100.0) {
        return std::clamp((rsi - params.overbought) / (100.0 - params.overbought), 0.6, 1.0);
    }
    return 0.0;
}

RsiStrategy::RsiStrategy(std::string name, market::Timeframe timeframe, RsiParams params,
                         std::shared_ptr<market::RateLimitedFetcher> fetcher, const IClock& clock)
    : CandleStrategy(std::move(name), timeframe, CANDLES, std::move(fetcher), clock),
      params_(params) {
    if (params_.oversold <= 0.0 || params_.overbought >= 100.0 ||
        params_.oversold >= params_.overbought) {
        throw std::invalid_argument(this->name() + ": need 0 < oversold < overbought < 100");
    }
}

std::optional<Signal> RsiStrategy::evaluate(const Symbol& coin,
                                            const std::vector<market::Candle>& candles) {
    RSI14 rsi;
    feed(rsi, market::closes(candles));
    if (!rsi.is_ready()) {
        return std::nullopt;
    }

    const double value = rsi.value();
    Action action = Action::Hold;
    if (value <= params_.oversold) {
        action = Action::Buy;
    } else if (value >= params_.overbought) {
        action = Action::Sell;
    }

    return make_signal(coin, action, rsi_strength(value, action, params_),
                       {{"rsi", value},
                        {"oversold", params_.oversold},
                        {"overbought", params_.overbought},
                        {"price", candles.back().close}});
}

}  // namespace vigil::strategy
