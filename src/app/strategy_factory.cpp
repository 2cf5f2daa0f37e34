// ============================================================================
// VIGIL - Strategy Factory Implementation
// ============================================================================

#include "vigil/app/strategy_factory.hpp"

#include "vigil/core/errors.hpp"
#include "vigil/strategy/macd_strategy.hpp"
#include "vigil/strategy/range_low_strategy.hpp"
#include "vigil/strategy/rsi_strategy.hpp"
#include "vigil/strategy/scalping_strategy.hpp"
#include "vigil/strategy/sma_cross_strategy.hpp"

#include <stdexcept>

namespace vigil::app {

using market::Timeframe;

std::shared_ptr<strategy::IStrategy> make_strategy(const StrategyConfig& config,
                                                   const MarketSources& sources,
                                                   const FetchLimits& limits,
                                                   const IClock& clock) {
    auto fetcher = std::make_shared<market::RateLimitedFetcher>(
        sources.candles, sources.prices, limits.min_request_interval, limits.timeout, limits.caller);
    const auto& name = config.name;

    try {
        if (name == "rsi_1min" || name == "rsi_5min" || name == "rsi_1h" || name == "rsi_4h") {
            const Timeframe tf = name == "rsi_1min"   ? Timeframe::Min1
                                 : name == "rsi_5min" ? Timeframe::Min5
                                 : name == "rsi_1h"   ? Timeframe::Hour1
                                                      : Timeframe::Hour4;
            return std::make_shared<strategy::RsiStrategy>(
                name, tf, strategy::RsiParams{config.oversold, config.overbought}, fetcher, clock);
        }
        if (name == "sma_5min") {
            return std::make_shared<strategy::SmaCrossStrategy>(name, fetcher, clock);
        }
        if (name == "macd_15min") {
            return std::make_shared<strategy::MacdStrategy>(name, fetcher, clock);
        }
        if (name == "scalping_1min") {
            strategy::ScalpingParams params;
            params.rsi_oversold = config.oversold;
            params.rsi_overbought = config.overbought;
            params.volume_multiplier = config.volume_multiplier;
            return std::make_shared<strategy::ScalpingStrategy>(name, params, fetcher, clock);
        }
        if (name == "range_24h_low") {
            strategy::RangeLowParams params;
            params.long_offset_percent = config.long_offset_percent;
            params.tolerance_percent = config.tolerance_percent;
            return std::make_shared<strategy::RangeLowStrategy>(name, params, fetcher, clock);
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("strategy '" + name + "': " + e.what());
    }

    throw ConfigurationError("unknown strategy '" + name + "'");
}

}  // namespace vigil::app
