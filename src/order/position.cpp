// ============================================================================
// VIGIL - Position Implementation
// ============================================================================

#include "vigil/order/position.hpp"

#include <iomanip>
#include <sstream>

namespace vigil::order {

TradeRecord make_trade_record(const Position& closed) {
    TradeRecord trade;
    trade.coin = closed.coin;
    trade.side = closed.side;
    trade.source = closed.source;
    trade.entry_price = closed.entry_price;
    trade.exit_price = closed.exit_price;
    trade.size = closed.size;
    trade.reason = closed.close_reason;
    trade.pnl = risk::calculate_pnl(closed.side, closed.entry_price, closed.exit_price, closed.size);
    trade.pnl_percent =
        risk::calculate_pnl_percent(closed.side, closed.entry_price, closed.exit_price);
    trade.opened_at = closed.opened_at;
    trade.closed_at = closed.closed_at;
    return trade;
}

std::string describe(const Position& position) {
    std::ostringstream ss;
    ss << position.coin.view() << ' ' << to_string(position.side) << ' ' << std::fixed
       << std::setprecision(5) << position.size.to_double() << " @ " << std::setprecision(2)
       << position.entry_price.to_double() << " [" << to_string(position.status) << ']';
    return ss.str();
}

}  // namespace vigil::order
