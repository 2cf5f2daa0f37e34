// ============================================================================
// VIGIL - Rate-Limited Fetcher Implementation
// ============================================================================

#include "vigil/market/rate_limited_fetcher.hpp"

#include "vigil/core/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace vigil::market {

RateLimitedFetcher::RateLimitedFetcher(std::shared_ptr<ICandleSource> candles,
                                       std::shared_ptr<IPriceSource> prices,
                                       std::unique_ptr<network::RateLimiter> limiter,
                                       Duration timeout, TimedCaller* caller)
    : candles_(std::move(candles)),
      prices_(std::move(prices)),
      limiter_(std::move(limiter)),
      timeout_(timeout),
      caller_(caller) {
    if (!limiter_) {
        throw std::invalid_argument("RateLimitedFetcher requires a rate limiter");
    }
    if (timeout_ <= Duration::zero()) {
        throw std::invalid_argument("RateLimitedFetcher timeout must be positive");
    }
}

RateLimitedFetcher::RateLimitedFetcher(std::shared_ptr<ICandleSource> candles,
                                       std::shared_ptr<IPriceSource> prices,
                                       std::chrono::milliseconds min_request_interval,
                                       Duration timeout, TimedCaller* caller)
    : RateLimitedFetcher(std::move(candles), std::move(prices),
                         network::RateLimiter::min_interval(min_request_interval), timeout,
                         caller) {}

RateLimitedFetcher::Deadline RateLimitedFetcher::wait_for_permit(const std::string& what) {
    const Deadline deadline = std::chrono::steady_clock::now() + timeout_;
    if (!limiter_->acquire_for(std::chrono::duration_cast<std::chrono::milliseconds>(timeout_))) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw TimeoutError(what + ": no request permit within " +
                           std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                              timeout_).count()) +
                           " ms");
    }
    requests_.fetch_add(1, std::memory_order_relaxed);
    return deadline;
}

template <typename F>
auto RateLimitedFetcher::run_request(const std::string& what, Deadline deadline, F&& request) {
    if (!caller_) {
        return request();
    }
    // The permit wait already spent part of the budget
    const auto remaining = std::max<Duration>(
        std::chrono::duration_cast<Duration>(deadline - std::chrono::steady_clock::now()),
        std::chrono::milliseconds(1));
    return caller_->call(what, std::forward<F>(request), remaining);
}

std::vector<Candle> RateLimitedFetcher::fetch_candles(const Symbol& coin, Timeframe tf,
                                                      size_t limit) {
    if (!candles_) {
        throw TransientFetchError("no candle source configured");
    }

    const std::string what = coin.str() + " " + std::string(to_string(tf)) + " candles";
    const Deadline deadline = wait_for_permit(what);

    std::vector<Candle> result;
    try {
        // Captured by value: a request abandoned at the deadline outlives this frame
        result = run_request(what, deadline, [source = candles_, coin, tf, limit] {
            return source->fetch_candles(coin, tf, limit);
        });
    } catch (const TransientError&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw TransientFetchError(what + ": " + e.what());
    }

    if (result.empty()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw TransientFetchError("empty " + std::string(to_string(tf)) + " candle response for " +
                                  coin.str());
    }
    return result;
}

Price RateLimitedFetcher::latest_price(const Symbol& coin) {
    if (!prices_) {
        throw TransientFetchError("no price source configured");
    }

    const std::string what = coin.str() + " price";
    const Deadline deadline = wait_for_permit(what);

    Price price;
    try {
        price = run_request(what, deadline,
                            [source = prices_, coin] { return source->latest_price(coin); });
    } catch (const TransientError&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw TransientFetchError(what + ": " + e.what());
    }

    if (!price.is_valid()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw TransientFetchError("invalid price for " + coin.str());
    }
    return price;
}

}  // namespace vigil::market
