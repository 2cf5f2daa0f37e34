#pragma once
// ============================================================================
// VIGIL - Core Types
// ============================================================================
// Fundamental type definitions shared by the scheduler, the order gate and
// the position lifecycle manager
// Prices and quantities are fixed-point to keep stored levels exact
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>

namespace vigil {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision wall-clock timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

// ============================================================================
// Price and Quantity Types (Fixed-Point Arithmetic)
// ============================================================================

/// Price with 8 decimal places precision
/// 1 Price unit = 0.00000001 actual price
class Price {
public:
    static constexpr int64_t PRECISION = 100000000LL;  // 10^8
    static constexpr int DECIMAL_PLACES = 8;

    constexpr Price() noexcept : value_(0) {}
    constexpr explicit Price(int64_t raw_value) noexcept : value_(raw_value) {}

    [[nodiscard]] static Price from_double(double price) noexcept {
        if (!std::isfinite(price)) return Price{0};
        return Price{static_cast<int64_t>(std::llround(price * PRECISION))};
    }

    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / PRECISION;
    }

    [[nodiscard]] constexpr int64_t raw() const noexcept { return value_; }

    constexpr Price operator+(Price other) const noexcept { return Price{value_ + other.value_}; }
    constexpr Price operator-(Price other) const noexcept { return Price{value_ - other.value_}; }

    constexpr auto operator<=>(const Price&) const noexcept = default;

    /// Valid prices are strictly positive
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ > 0; }

private:
    int64_t value_;
};

/// Quantity with 8 decimal places precision
class Quantity {
public:
    static constexpr int64_t PRECISION = 100000000LL;  // 10^8
    static constexpr int DECIMAL_PLACES = 8;

    constexpr Quantity() noexcept : value_(0) {}
    constexpr explicit Quantity(int64_t raw_value) noexcept : value_(raw_value) {}

    [[nodiscard]] static Quantity from_double(double qty) noexcept {
        if (!std::isfinite(qty)) return Quantity{0};
        if (qty > 9.2e10) return Quantity{std::numeric_limits<int64_t>::max()};
        if (qty < -9.2e10) return Quantity{std::numeric_limits<int64_t>::min() + 1};
        return Quantity{static_cast<int64_t>(std::llround(qty * PRECISION))};
    }

    /// Coin units bought by a notional at a price, rounded down to `decimals`
    /// e.g. $20 at $50,000 with 5 decimals = 0.00040
    [[nodiscard]] static Quantity from_notional(double notional, double price,
                                                int decimals = 5) noexcept {
        if (price <= 0.0 || notional <= 0.0) return Quantity{0};
        const double scale = std::pow(10.0, decimals);
        return from_double(std::floor(notional / price * scale + 1e-9) / scale);
    }

    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / PRECISION;
    }

    [[nodiscard]] constexpr int64_t raw() const noexcept { return value_; }

    constexpr auto operator<=>(const Quantity&) const noexcept = default;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ > 0; }

private:
    int64_t value_;
};

// ============================================================================
// Trading Types
// ============================================================================

/// Order side sent to the exchange
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

/// Direction of a held position
enum class PositionSide : uint8_t {
    Long = 0,
    Short = 1
};

/// Strategy recommendation
enum class Action : uint8_t {
    Buy = 0,
    Sell = 1,
    Hold = 2
};

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "BUY" : "SELL";
}

[[nodiscard]] constexpr std::string_view to_string(PositionSide side) noexcept {
    return side == PositionSide::Long ? "LONG" : "SHORT";
}

[[nodiscard]] constexpr std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::Buy:  return "BUY";
        case Action::Sell: return "SELL";
        case Action::Hold: return "HOLD";
    }
    return "INVALID";
}

/// Order side that opens a position in the given direction
[[nodiscard]] constexpr Side opening_side(PositionSide side) noexcept {
    return side == PositionSide::Long ? Side::Buy : Side::Sell;
}

/// Order side that flattens a position in the given direction
[[nodiscard]] constexpr Side closing_side(PositionSide side) noexcept {
    return side == PositionSide::Long ? Side::Sell : Side::Buy;
}

// ============================================================================
// Symbol Type
// ============================================================================

/// Instrument identifier (e.g., "BTC" or "BTCUSDT")
/// Fixed inline storage so it can be copied freely between threads
class Symbol {
public:
    static constexpr size_t MAX_LENGTH = 15;

    Symbol() noexcept : length_(0) { data_[0] = '\0'; }

    explicit Symbol(std::string_view symbol) noexcept {
        length_ = static_cast<uint8_t>(std::min(symbol.size(), MAX_LENGTH));
        std::copy_n(symbol.data(), length_, data_);
        data_[length_] = '\0';
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, length_};
    }

    [[nodiscard]] std::string str() const { return std::string(view()); }
    [[nodiscard]] const char* c_str() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    bool operator==(const Symbol& other) const noexcept {
        return view() == other.view();
    }

    bool operator!=(const Symbol& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Symbol& other) const noexcept {
        return view() < other.view();
    }

private:
    char data_[MAX_LENGTH + 1];
    uint8_t length_;
};

}  // namespace vigil

// ============================================================================
// Hash specializations for use with containers
// ============================================================================
template <>
struct std::hash<vigil::Symbol> {
    size_t operator()(const vigil::Symbol& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};
