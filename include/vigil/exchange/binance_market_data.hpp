#pragma once
// ============================================================================
// VIGIL - Binance Market Data
// ============================================================================
// Public spot endpoints: /api/v3/klines and /api/v3/ticker/price
// Coins are traded against a single quote asset ("BTC" -> "BTCUSDT")
// ============================================================================

#include "vigil/market/candle.hpp"
#include "vigil/network/rest_client.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::exchange {

class BinanceMarketData final : public market::ICandleSource, public market::IPriceSource {
public:
    BinanceMarketData(std::shared_ptr<network::IRestClient> rest, std::string quote_asset = "USDT");

    [[nodiscard]] std::vector<market::Candle> fetch_candles(const Symbol& coin, market::Timeframe tf,
                                                            size_t limit) override;

    [[nodiscard]] Price latest_price(const Symbol& coin) override;

    /// "BTC" -> "BTCUSDT"
    [[nodiscard]] std::string pair_of(const Symbol& coin) const;

private:
    std::shared_ptr<network::IRestClient> rest_;
    std::string quote_asset_;
};

// ============================================================================
// Payload Parsers (throw TransientFetchError on malformed input)
// ============================================================================

/// Array of [open_time, "open", "high", "low", "close", "volume", close_time, ...]
[[nodiscard]] std::vector<market::Candle> parse_klines(std::string_view body);

/// {"symbol": "BTCUSDT", "price": "50000.00"}
[[nodiscard]] Price parse_ticker_price(std::string_view body);

}  // namespace vigil::exchange
