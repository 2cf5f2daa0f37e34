// ============================================================================
// VIGIL - SMA Crossover Strategy Implementation
// ============================================================================

#include "vigil/strategy/sma_cross_strategy.hpp"

#include "vigil/strategy/indicators/moving_average.hpp"

#include <algorithm>
#include <cmath>

namespace vigil::strategy {

namespace {

/// 0.6 base plus 20x the relative SMA separation, only when price confirms the trend
double crossover_strength(double short_sma, double long_sma, double price, Action action) {
    const double separation = std::abs(short_sma - long_sma) / long_sma;
    if (action == Action::Buy && short_sma > long_sma && price > short_sma) {
        return std::min(1.0, 0.6 + separation * 20.0);
    }
    if (action == Action::Sell && short_sma < long_sma && price < short_sma) {
        return std::min(1.0, 0.6 + separation * 20.0);
    }
    return 0.0;
}

}  // namespace

SmaCrossStrategy::SmaCrossStrategy(std::string name,
                                   std::shared_ptr<market::RateLimitedFetcher> fetcher,
                                   const IClock& clock)
    : CandleStrategy(std::move(name), market::Timeframe::Min5, CANDLES, std::move(fetcher), clock) {}

std::optional<Signal> SmaCrossStrategy::evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) {
    if (candles.size() < LONG_PERIOD + 1) {
        return std::nullopt;
    }

    SMA<SHORT_PERIOD> short_sma;
    SMA<LONG_PERIOD> long_sma;
    for (size_t i = 0; i + 1 < candles.size(); ++i) {
        short_sma.update(candles[i].close);
        long_sma.update(candles[i].close);
    }
    const double prev_short = short_sma.value();
    const double prev_long = long_sma.value();

    const double price = candles.back().close;
    short_sma.update(price);
    long_sma.update(price);
    const double cur_short = short_sma.value();
    const double cur_long = long_sma.value();
    if (cur_long <= 0.0) {
        return std::nullopt;
    }

    Action action = Action::Hold;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Trend& trend = last_trend_[coin];

        if (prev_short <= prev_long && cur_short > cur_long) {
            action = Action::Buy;
            trend = Trend::Bullish;
        } else if (prev_short >= prev_long && cur_short < cur_long) {
            action = Action::Sell;
            trend = Trend::Bearish;
        } else if (cur_short > cur_long && trend != Trend::Bullish) {
            action = Action::Buy;
            trend = Trend::Bullish;
        } else if (cur_short < cur_long && trend != Trend::Bearish) {
            action = Action::Sell;
            trend = Trend::Bearish;
        }
    }

    return make_signal(coin, action, crossover_strength(cur_short, cur_long, price, action),
                       {{"short_sma", cur_short},
                        {"long_sma", cur_long},
                        {"price", price},
                        {"separation_pct", std::abs(cur_short - cur_long) / cur_long * 100.0}});
}

}  // namespace vigil::strategy
