#pragma once
// ============================================================================
// VIGIL - Rate-Limited Fetcher
// ============================================================================
// Per-strategy throttle in front of a shared market data source
// Calls from one strategy are spaced by its own limiter; different strategies
// never wait on each other. Every fetch carries a deadline covering both the
// permit wait and the request: a miss raises TimeoutError, any other failure
// surfaces as TransientFetchError.
// ============================================================================

#include "vigil/core/timed_call.hpp"
#include "vigil/market/candle.hpp"
#include "vigil/network/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vigil::market {

class RateLimitedFetcher final : public ICandleSource, public IPriceSource {
public:
    static constexpr Duration DEFAULT_TIMEOUT = std::chrono::seconds(10);

    /// With a caller the request runs on its I/O pool and is abandoned at the
    /// deadline; without one it runs inline and only the permit wait is bounded.
    RateLimitedFetcher(std::shared_ptr<ICandleSource> candles,
                       std::shared_ptr<IPriceSource> prices,
                       std::unique_ptr<network::RateLimiter> limiter,
                       Duration timeout = DEFAULT_TIMEOUT,
                       TimedCaller* caller = nullptr);

    /// Convenience: one request per `min_request_interval`
    RateLimitedFetcher(std::shared_ptr<ICandleSource> candles,
                       std::shared_ptr<IPriceSource> prices,
                       std::chrono::milliseconds min_request_interval,
                       Duration timeout = DEFAULT_TIMEOUT,
                       TimedCaller* caller = nullptr);

    /// Waits for a permit; throws TimeoutError past the deadline and
    /// TransientFetchError on failure or empty data
    [[nodiscard]] std::vector<Candle> fetch_candles(const Symbol& coin, Timeframe tf,
                                                    size_t limit) override;

    [[nodiscard]] Price latest_price(const Symbol& coin) override;

    [[nodiscard]] uint64_t requests() const noexcept { return requests_.load(); }
    [[nodiscard]] uint64_t failures() const noexcept { return failures_.load(); }
    [[nodiscard]] Duration timeout() const noexcept { return timeout_; }

private:
    using Deadline = std::chrono::steady_clock::time_point;

    [[nodiscard]] Deadline wait_for_permit(const std::string& what);

    template <typename F>
    auto run_request(const std::string& what, Deadline deadline, F&& request);

    std::shared_ptr<ICandleSource> candles_;
    std::shared_ptr<IPriceSource> prices_;
    std::unique_ptr<network::RateLimiter> limiter_;
    Duration timeout_;
    TimedCaller* caller_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> failures_{0};
};

}  // namespace vigil::market
