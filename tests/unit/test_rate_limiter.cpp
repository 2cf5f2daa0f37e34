// ============================================================================
// VIGIL - Rate Limiter Unit Tests
// ============================================================================

#include "vigil/core/errors.hpp"
#include "vigil/market/rate_limited_fetcher.hpp"
#include "vigil/network/rate_limiter.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace vigil;
using namespace std::chrono_literals;
using vigil::network::RateLimiter;
using vigil::market::RateLimitedFetcher;
using vigil::market::Timeframe;

// ============================================================================
// RateLimiter
// ============================================================================

TEST(RateLimiterTest, AllowsUpToLimitWithinWindow) {
    RateLimiter limiter(3, 10s);
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_EQ(limiter.remaining(), 1);
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_FALSE(limiter.try_acquire());
    EXPECT_EQ(limiter.remaining(), 0);
    EXPECT_GT(limiter.time_until_reset().count(), 0);
}

TEST(RateLimiterTest, PermitsReturnAfterWindow) {
    RateLimiter limiter(1, 30ms);
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_FALSE(limiter.try_acquire());
    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(limiter.try_acquire());
}

TEST(RateLimiterTest, AcquireWaitsForMinimumSpacing) {
    auto limiter = RateLimiter::min_interval(50ms);
    const auto start = std::chrono::steady_clock::now();
    limiter->acquire();
    limiter->acquire();
    limiter->acquire();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 100ms);
}

TEST(RateLimiterTest, AcquireForGivesUpWhenPermitIsTooFar) {
    auto limiter = RateLimiter::min_interval(10s);
    EXPECT_TRUE(limiter->acquire_for(50ms));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(limiter->acquire_for(50ms));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_EQ(limiter->remaining(), 0);
}

TEST(RateLimiterTest, AcquireForWaitsForNearPermit) {
    auto limiter = RateLimiter::min_interval(30ms);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter->acquire_for(500ms));
    EXPECT_TRUE(limiter->acquire_for(500ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST(RateLimiterTest, RejectsNonPositiveLimit) {
    EXPECT_THROW(RateLimiter(0, 1s), std::invalid_argument);
}

TEST(RateLimiterTest, EmptyLimiterHasNoResetDelay) {
    RateLimiter limiter(5, 1s);
    EXPECT_EQ(limiter.time_until_reset(), 0ms);
    EXPECT_EQ(limiter.remaining(), 5);
}

// ============================================================================
// RateLimitedFetcher
// ============================================================================

class RateLimitedFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        market = std::make_shared<vigil::testing::FakeMarket>();
        market->set_closes("BTC", {100.0, 101.0, 102.0});
        market->set_price("BTC", 102.5);
    }

    RateLimitedFetcher make(std::chrono::milliseconds spacing = 1ms) {
        return RateLimitedFetcher(market, market, spacing);
    }

    std::shared_ptr<vigil::testing::FakeMarket> market;
};

TEST_F(RateLimitedFetcherTest, PassesThroughData) {
    auto fetcher = make();
    auto candles = fetcher.fetch_candles(Symbol("BTC"), Timeframe::Min1, 2);
    ASSERT_EQ(candles.size(), 2u);
    EXPECT_DOUBLE_EQ(candles.back().close, 102.0);
    EXPECT_DOUBLE_EQ(fetcher.latest_price(Symbol("BTC")).to_double(), 102.5);
    EXPECT_EQ(fetcher.requests(), 2u);
    EXPECT_EQ(fetcher.failures(), 0u);
}

TEST_F(RateLimitedFetcherTest, EmptySeriesIsTransient) {
    auto fetcher = make();
    EXPECT_THROW((void)fetcher.fetch_candles(Symbol("DOGE"), Timeframe::Min5, 10),
                 TransientFetchError);
    EXPECT_EQ(fetcher.failures(), 1u);
}

TEST_F(RateLimitedFetcherTest, MissingPriceIsTransient) {
    auto fetcher = make();
    EXPECT_THROW((void)fetcher.latest_price(Symbol("DOGE")), TransientFetchError);
}

TEST_F(RateLimitedFetcherTest, SourceErrorsAreWrapped) {
    auto fetcher = make();
    market->fail_all(true);
    try {
        (void)fetcher.fetch_candles(Symbol("BTC"), Timeframe::Hour1, 5);
        FAIL() << "expected TransientFetchError";
    } catch (const TransientFetchError& e) {
        EXPECT_NE(std::string(e.what()).find("connection reset"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("1h"), std::string::npos);
    }
    EXPECT_THROW((void)fetcher.latest_price(Symbol("BTC")), TransientFetchError);
    EXPECT_EQ(fetcher.failures(), 2u);
}

TEST_F(RateLimitedFetcherTest, SpacesRequests) {
    auto fetcher = make(40ms);
    const auto start = std::chrono::steady_clock::now();
    (void)fetcher.latest_price(Symbol("BTC"));
    (void)fetcher.latest_price(Symbol("BTC"));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST_F(RateLimitedFetcherTest, PermitWaitIsBoundedByTimeout) {
    RateLimitedFetcher fetcher(market, market, 10s, 50ms);
    (void)fetcher.latest_price(Symbol("BTC"));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW((void)fetcher.fetch_candles(Symbol("BTC"), Timeframe::Min1, 2), TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(fetcher.requests(), 1u);
    EXPECT_EQ(fetcher.failures(), 1u);
}

TEST_F(RateLimitedFetcherTest, HungSourceIsAbandonedAtDeadline) {
    class HangingCandles final : public market::ICandleSource {
    public:
        std::vector<market::Candle> fetch_candles(const Symbol&, Timeframe, size_t) override {
            std::this_thread::sleep_for(500ms);
            return {};
        }
    };

    TimedCaller caller(2, 10s);
    RateLimitedFetcher fetcher(std::make_shared<HangingCandles>(), market, 1ms, 50ms, &caller);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW((void)fetcher.fetch_candles(Symbol("BTC"), Timeframe::Min5, 10), TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);
    EXPECT_EQ(caller.timeouts(), 1u);
    EXPECT_EQ(fetcher.failures(), 1u);

    // Prices still flow through the caller within the deadline
    EXPECT_DOUBLE_EQ(fetcher.latest_price(Symbol("BTC")).to_double(), 102.5);
}

TEST_F(RateLimitedFetcherTest, MissingSourcesAreTransient) {
    RateLimitedFetcher fetcher(nullptr, nullptr, 1ms);
    EXPECT_THROW((void)fetcher.fetch_candles(Symbol("BTC"), Timeframe::Min1, 1),
                 TransientFetchError);
    EXPECT_THROW((void)fetcher.latest_price(Symbol("BTC")), TransientFetchError);
}

TEST_F(RateLimitedFetcherTest, RequiresLimiter) {
    EXPECT_THROW(RateLimitedFetcher(market, market, std::unique_ptr<network::RateLimiter>{}),
                 std::invalid_argument);
    EXPECT_THROW(RateLimitedFetcher(market, market, 1ms, Duration::zero()), std::invalid_argument);
}
