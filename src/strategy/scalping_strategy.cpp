// ============================================================================
// VIGIL - Scalping Strategy Implementation
// ============================================================================

#include "vigil/strategy/scalping_strategy.hpp"

#include "vigil/strategy/indicators/moving_average.hpp"
#include "vigil/strategy/indicators/rolling_window.hpp"
#include "vigil/strategy/indicators/rsi.hpp"

#include <algorithm>
#include <cmath>

namespace vigil::strategy {

ScalpingStrategy::ScalpingStrategy(std::string name, ScalpingParams params,
                                   std::shared_ptr<market::RateLimitedFetcher> fetcher,
                                   const IClock& clock)
    : CandleStrategy(std::move(name), market::Timeframe::Min1, CANDLES, std::move(fetcher), clock),
      params_(params) {}

std::optional<Signal> ScalpingStrategy::evaluate(const Symbol& coin,
                                                 const std::vector<market::Candle>& candles) {
    if (candles.size() < MIN_CANDLES) {
        return std::nullopt;
    }

    EMA5 fast;
    EMA13 slow;
    RSI7 rsi;
    RollingWindow<VOLUME_WINDOW> volume;

    for (size_t i = 0; i + 1 < candles.size(); ++i) {
        fast.update(candles[i].close);
        slow.update(candles[i].close);
        rsi.update(candles[i].close);
        volume.push(candles[i].volume);
    }
    const double prev_fast = fast.value();
    const double prev_slow = slow.value();

    const auto& last = candles.back();
    fast.update(last.close);
    slow.update(last.close);
    rsi.update(last.close);
    volume.push(last.volume);

    const double cur_fast = fast.value();
    const double cur_slow = slow.value();
    const double cur_rsi = rsi.value();
    if (cur_slow <= 0.0) {
        return std::nullopt;
    }

    const bool volume_spike = last.volume > volume.mean() * params_.volume_multiplier;
    const bool bullish_cross = cur_fast > cur_slow && prev_fast <= prev_slow;
    const bool bearish_cross = cur_fast < cur_slow && prev_fast >= prev_slow;
    const bool rsi_neutral = cur_rsi > params_.rsi_oversold && cur_rsi < params_.rsi_overbought;

    Action action = Action::Hold;
    if (bullish_cross && rsi_neutral && volume_spike) {
        action = Action::Buy;
    } else if (bearish_cross && rsi_neutral && volume_spike) {
        action = Action::Sell;
    }

    const double ema_diff_pct = (cur_fast - cur_slow) / cur_slow * 100.0;

    double strength = 0.0;
    if (action != Action::Hold) {
        strength = 0.6;
        if (action == Action::Buy) {
            if (cur_rsi < 35.0) strength += 0.1;
            if (cur_rsi < 30.0) strength += 0.1;
        } else {
            if (cur_rsi > 65.0) strength += 0.1;
            if (cur_rsi > 70.0) strength += 0.1;
        }
        if (std::abs(ema_diff_pct) > 0.5) strength += 0.1;
        if (volume_spike) strength += 0.1;
        strength = std::clamp(strength, 0.0, 1.0);
    }

    return make_signal(coin, action, strength,
                       {{"fast_ema", cur_fast},
                        {"slow_ema", cur_slow},
                        {"ema_diff_pct", ema_diff_pct},
                        {"rsi", cur_rsi},
                        {"volume_spike", volume_spike},
                        {"bullish_cross", bullish_cross},
                        {"bearish_cross", bearish_cross}});
}

}  // namespace vigil::strategy
