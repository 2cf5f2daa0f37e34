// ============================================================================
// VIGIL - Market Data Types Implementation
// ============================================================================

#include "vigil/market/candle.hpp"

namespace vigil::market {

std::optional<Timeframe> parse_timeframe(std::string_view code) {
    for (auto tf : {Timeframe::Min1, Timeframe::Min5, Timeframe::Min15, Timeframe::Hour1,
                    Timeframe::Hour4}) {
        if (to_string(tf) == code) {
            return tf;
        }
    }
    return std::nullopt;
}

std::vector<double> closes(const std::vector<Candle>& candles) {
    std::vector<double> result;
    result.reserve(candles.size());
    for (const auto& candle : candles) {
        result.push_back(candle.close);
    }
    return result;
}

std::vector<double> volumes(const std::vector<Candle>& candles) {
    std::vector<double> result;
    result.reserve(candles.size());
    for (const auto& candle : candles) {
        result.push_back(candle.volume);
    }
    return result;
}

}  // namespace vigil::market
