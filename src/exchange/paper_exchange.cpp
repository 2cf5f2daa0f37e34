// ============================================================================
// VIGIL - Paper Exchange Implementation
// ============================================================================

#include "vigil/exchange/paper_exchange.hpp"

#include "vigil/core/errors.hpp"
#include "vigil/risk/exit_levels.hpp"
#include "vigil/utils/logger.hpp"

#include <string>

namespace vigil::exchange {

PaperExchange::PaperExchange(PaperExchangeConfig config,
                             std::shared_ptr<market::IPriceSource> prices)
    : config_(config), prices_(std::move(prices)), balance_(config.initial_balance) {}

Price PaperExchange::price_of(const Symbol& coin) {
    try {
        const Price price = prices_->latest_price(coin);
        if (!price.is_valid()) {
            throw TransientExchangeError("no valid price for " + coin.str());
        }
        return price;
    } catch (const TransientExchangeError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransientExchangeError("price for " + coin.str() + " unavailable: " + e.what());
    }
}

OrderFill PaperExchange::place_order(const Symbol& coin, Side side, Quantity size) {
    if (!size.is_valid()) {
        throw TransientExchangeError("order size must be positive");
    }

    const Price price = price_of(coin);
    const double notional = price.to_double() * size.to_double();
    const double fee = notional * config_.fee_percent / 100.0;

    std::lock_guard<std::mutex> lock(mutex_);
    if (holdings_.count(coin) > 0) {
        throw TransientExchangeError("paper position already open for " + coin.str());
    }
    if (notional + fee > balance_) {
        throw TransientExchangeError("insufficient paper balance for " + coin.str());
    }

    balance_ -= notional + fee;
    const PositionSide pos_side = side == Side::Buy ? PositionSide::Long : PositionSide::Short;
    holdings_.emplace(coin, Holding{pos_side, size, price, notional});

    OrderFill fill;
    fill.order_id = "paper-" + std::to_string(next_order_id_.fetch_add(1));
    fill.entry_price = price;
    fill.filled_size = size;
    fill.filled_at = now();

    LOG_INFO("[paper] {} {} {:.5f} @ {:.8f} (balance {:.2f})", to_string(side), coin.view(),
             size.to_double(), price.to_double(), balance_);
    return fill;
}

CloseFill PaperExchange::close_position(const order::Position& position) {
    const Price price = price_of(position.coin);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holdings_.find(position.coin);
    if (it == holdings_.end()) {
        throw TransientExchangeError("no paper position for " + position.coin.str());
    }

    const Holding& holding = it->second;
    const double pnl = risk::calculate_pnl(holding.side, holding.entry_price, price, holding.size);
    const double fee = price.to_double() * holding.size.to_double() * config_.fee_percent / 100.0;

    balance_ += holding.margin + pnl - fee;
    realized_pnl_ += pnl - fee;
    holdings_.erase(it);

    LOG_INFO("[paper] closed {} @ {:.8f} pnl={:.4f} (balance {:.2f})", position.coin.view(),
             price.to_double(), pnl - fee, balance_);
    return CloseFill{price, now()};
}

Price PaperExchange::get_mark_price(const Symbol& coin) {
    return price_of(coin);
}

AccountState PaperExchange::get_account_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    AccountState state;
    state.available_balance = balance_;
    state.open_positions = static_cast<int>(holdings_.size());

    double margin = 0.0;
    for (const auto& [coin, holding] : holdings_) {
        margin += holding.margin;
    }
    state.total_equity = balance_ + margin;
    return state;
}

double PaperExchange::realized_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return realized_pnl_;
}

}  // namespace vigil::exchange
