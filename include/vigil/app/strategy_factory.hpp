#pragma once
// ============================================================================
// VIGIL - Strategy Factory
// ============================================================================
// Maps the enumerated strategy names of the configuration to instances.
// Every strategy gets its own rate-limited fetcher over the shared sources.
// ============================================================================

#include "vigil/app/app_config.hpp"
#include "vigil/core/clock.hpp"
#include "vigil/core/timed_call.hpp"
#include "vigil/market/candle.hpp"
#include "vigil/market/rate_limited_fetcher.hpp"
#include "vigil/strategy/strategy.hpp"

#include <chrono>
#include <memory>

namespace vigil::app {

struct MarketSources {
    std::shared_ptr<market::ICandleSource> candles;
    std::shared_ptr<market::IPriceSource> prices;
};

/// Applied to every strategy's own fetcher
struct FetchLimits {
    std::chrono::milliseconds min_request_interval{500};
    Duration timeout = market::RateLimitedFetcher::DEFAULT_TIMEOUT;
    TimedCaller* caller = nullptr;      // Null = requests run on the invoking worker
};

/// Throws ConfigurationError for unknown names or invalid parameters
[[nodiscard]] std::shared_ptr<strategy::IStrategy> make_strategy(
    const StrategyConfig& config,
    const MarketSources& sources,
    const FetchLimits& limits,
    const IClock& clock);

}  // namespace vigil::app
