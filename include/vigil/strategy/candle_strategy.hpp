#pragma once
// ============================================================================
// VIGIL - Candle Strategy Base
// ============================================================================
// Shared plumbing for strategies that decide on a candle series:
// fetch through the strategy's own rate-limited fetcher, then evaluate
// ============================================================================

#include "vigil/core/clock.hpp"
#include "vigil/market/candle.hpp"
#include "vigil/market/rate_limited_fetcher.hpp"
#include "vigil/strategy/strategy.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vigil::strategy {

class CandleStrategy : public IStrategy {
public:
    CandleStrategy(std::string name, market::Timeframe timeframe, size_t candle_limit,
                   std::shared_ptr<market::RateLimitedFetcher> fetcher, const IClock& clock);

    [[nodiscard]] const std::string& name() const override { return name_; }

    /// Fetches `candle_limit` candles, then evaluate(). Fetch failures propagate
    /// as TransientFetchError.
    [[nodiscard]] std::optional<Signal> generate(const Symbol& coin) override;

    /// Decision on candles ordered oldest first; nullopt when there is not enough data
    [[nodiscard]] virtual std::optional<Signal> evaluate(const Symbol& coin,
                                                         const std::vector<market::Candle>& candles) = 0;

    [[nodiscard]] market::Timeframe timeframe() const noexcept { return timeframe_; }
    [[nodiscard]] size_t candle_limit() const noexcept { return candle_limit_; }

protected:
    /// Signal stamped with this strategy's name and the clock; a non-HOLD action
    /// with zero strength is downgraded to HOLD
    [[nodiscard]] Signal make_signal(const Symbol& coin, Action action, double strength,
                                     SignalMetadata metadata) const;

    [[nodiscard]] market::RateLimitedFetcher& fetcher() { return *fetcher_; }

private:
    std::string name_;
    market::Timeframe timeframe_;
    size_t candle_limit_;
    std::shared_ptr<market::RateLimitedFetcher> fetcher_;
    const IClock& clock_;
};

}  // namespace vigil::strategy
