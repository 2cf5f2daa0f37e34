#pragma once
// ============================================================================
// VIGIL - Market Data Types
// ============================================================================
// Candles and the read-only market data interfaces strategies depend on
// ============================================================================

#include "vigil/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace vigil::market {

// ============================================================================
// Timeframes
// ============================================================================

enum class Timeframe : uint8_t {
    Min1 = 0,
    Min5,
    Min15,
    Hour1,
    Hour4
};

/// Exchange interval code: "1m", "5m", "15m", "1h", "4h"
[[nodiscard]] constexpr std::string_view to_string(Timeframe tf) noexcept {
    switch (tf) {
        case Timeframe::Min1:  return "1m";
        case Timeframe::Min5:  return "5m";
        case Timeframe::Min15: return "15m";
        case Timeframe::Hour1: return "1h";
        case Timeframe::Hour4: return "4h";
    }
    return "1m";
}

[[nodiscard]] constexpr std::chrono::seconds duration_of(Timeframe tf) noexcept {
    switch (tf) {
        case Timeframe::Min1:  return std::chrono::seconds(60);
        case Timeframe::Min5:  return std::chrono::seconds(300);
        case Timeframe::Min15: return std::chrono::seconds(900);
        case Timeframe::Hour1: return std::chrono::seconds(3600);
        case Timeframe::Hour4: return std::chrono::seconds(14400);
    }
    return std::chrono::seconds(60);
}

[[nodiscard]] std::optional<Timeframe> parse_timeframe(std::string_view code);

// ============================================================================
// Candle
// ============================================================================

/// OHLCV bar, oldest first in every series
struct Candle {
    Timestamp open_time;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

[[nodiscard]] std::vector<double> closes(const std::vector<Candle>& candles);
[[nodiscard]] std::vector<double> volumes(const std::vector<Candle>& candles);

// ============================================================================
// Market Data Interfaces (for mocking)
// ============================================================================

class ICandleSource {
public:
    virtual ~ICandleSource() = default;

    /// Most recent `limit` candles, oldest first. Throws TransientFetchError.
    [[nodiscard]] virtual std::vector<Candle> fetch_candles(const Symbol& coin, Timeframe tf,
                                                            size_t limit) = 0;
};

class IPriceSource {
public:
    virtual ~IPriceSource() = default;

    /// Latest traded price. Throws TransientFetchError.
    [[nodiscard]] virtual Price latest_price(const Symbol& coin) = 0;
};

}  // namespace vigil::market
