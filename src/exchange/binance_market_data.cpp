// ============================================================================
// VIGIL - Binance Market Data Implementation
// ============================================================================

#include "vigil/exchange/binance_market_data.hpp"

#include "vigil/core/errors.hpp"
#include "vigil/utils/logger.hpp"

#include <simdjson.h>

#include <cstdlib>
#include <map>

namespace vigil::exchange {

namespace {

double parse_decimal(std::string_view text) {
    // strtod needs a terminated buffer; the view points into the JSON document
    const std::string copy(text);
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (end == copy.c_str()) {
        throw TransientFetchError("malformed decimal \"" + copy + "\"");
    }
    return value;
}

void require_success(const network::HttpResponse& response, std::string_view what) {
    if (response.is_success()) {
        return;
    }
    if (response.status_code < 0) {
        throw TransientFetchError(std::string(what) + ": " + response.body);
    }
    if (response.is_rate_limited()) {
        throw TransientFetchError(std::string(what) + ": rate limited (HTTP " +
                                  std::to_string(response.status_code) + ")");
    }
    throw TransientFetchError(std::string(what) + ": HTTP " + std::to_string(response.status_code));
}

}  // namespace

std::vector<market::Candle> parse_klines(std::string_view body) {
    std::vector<market::Candle> candles;

    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(body);
        auto doc = parser.iterate(padded);

        // simdjson on-demand is forward-only: read each row in field order
        for (auto row : doc.get_array()) {
            auto arr = row.get_array();
            auto it = arr.begin();

            market::Candle candle;
            candle.open_time = from_epoch_ms((*it).get_int64().value());
            ++it;
            candle.open = parse_decimal((*it).get_string().value());
            ++it;
            candle.high = parse_decimal((*it).get_string().value());
            ++it;
            candle.low = parse_decimal((*it).get_string().value());
            ++it;
            candle.close = parse_decimal((*it).get_string().value());
            ++it;
            candle.volume = parse_decimal((*it).get_string().value());

            candles.push_back(candle);
        }
    } catch (const simdjson::simdjson_error& e) {
        throw TransientFetchError(std::string("malformed klines payload: ") + e.what());
    }

    return candles;
}

Price parse_ticker_price(std::string_view body) {
    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(body);
        auto doc = parser.iterate(padded);
        return Price::from_double(parse_decimal(doc["price"].get_string().value()));
    } catch (const simdjson::simdjson_error& e) {
        throw TransientFetchError(std::string("malformed ticker payload: ") + e.what());
    }
}

BinanceMarketData::BinanceMarketData(std::shared_ptr<network::IRestClient> rest,
                                     std::string quote_asset)
    : rest_(std::move(rest)), quote_asset_(std::move(quote_asset)) {}

std::string BinanceMarketData::pair_of(const Symbol& coin) const {
    return coin.str() + quote_asset_;
}

std::vector<market::Candle> BinanceMarketData::fetch_candles(const Symbol& coin,
                                                             market::Timeframe tf, size_t limit) {
    const std::map<std::string, std::string> params{
        {"symbol", pair_of(coin)},
        {"interval", std::string(market::to_string(tf))},
        {"limit", std::to_string(limit)},
    };

    auto response = rest_->get("/api/v3/klines", params);
    require_success(response, "klines " + pair_of(coin));

    auto candles = parse_klines(response.body);
    LOG_TRACE("Fetched {} {} candles for {}", candles.size(), market::to_string(tf), pair_of(coin));
    return candles;
}

Price BinanceMarketData::latest_price(const Symbol& coin) {
    auto response = rest_->get("/api/v3/ticker/price", {{"symbol", pair_of(coin)}});
    require_success(response, "ticker " + pair_of(coin));
    return parse_ticker_price(response.body);
}

}  // namespace vigil::exchange
