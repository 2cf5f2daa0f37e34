#pragma once
// ============================================================================
// VIGIL - Exchange Client Interface
// ============================================================================
// Order execution surface used by the order gate and the lifecycle manager
// Every method may block; failures are reported as TransientExchangeError
// ============================================================================

#include "vigil/core/types.hpp"
#include "vigil/order/position.hpp"

#include <string>

namespace vigil::exchange {

// ============================================================================
// Exchange Types
// ============================================================================

struct OrderFill {
    std::string order_id;
    Price entry_price;
    Quantity filled_size;       // Zero means "as requested"
    Timestamp filled_at;
};

struct CloseFill {
    Price exit_price;
    Timestamp closed_at;
};

struct AccountState {
    double total_equity = 0.0;
    double available_balance = 0.0;
    double unrealized_pnl = 0.0;
    int open_positions = 0;
};

// ============================================================================
// Exchange Client Interface (for mocking)
// ============================================================================

class IExchangeClient {
public:
    virtual ~IExchangeClient() = default;

    /// Market order opening a position of `size` coin units
    virtual OrderFill place_order(const Symbol& coin, Side side, Quantity size) = 0;

    /// Flatten the given position at market
    virtual CloseFill close_position(const order::Position& position) = 0;

    [[nodiscard]] virtual Price get_mark_price(const Symbol& coin) = 0;

    [[nodiscard]] virtual AccountState get_account_state() = 0;
};

}  // namespace vigil::exchange
