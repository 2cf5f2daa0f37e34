#pragma once
// ============================================================================
// VIGIL - Paper Exchange
// ============================================================================
// Simulated execution against live prices: market orders fill at the latest
// price, notional is locked as margin until the position closes
// ============================================================================

#include "vigil/exchange/exchange_client.hpp"
#include "vigil/market/candle.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace vigil::exchange {

struct PaperExchangeConfig {
    double initial_balance = 1000.0;
    double fee_percent = 0.0;       // Charged on notional at open and at close
};

class PaperExchange final : public IExchangeClient {
public:
    PaperExchange(PaperExchangeConfig config, std::shared_ptr<market::IPriceSource> prices);

    OrderFill place_order(const Symbol& coin, Side side, Quantity size) override;
    CloseFill close_position(const order::Position& position) override;
    [[nodiscard]] Price get_mark_price(const Symbol& coin) override;
    [[nodiscard]] AccountState get_account_state() override;

    [[nodiscard]] double realized_pnl() const;

private:
    struct Holding {
        PositionSide side;
        Quantity size;
        Price entry_price;
        double margin;
    };

    Price price_of(const Symbol& coin);

    PaperExchangeConfig config_;
    std::shared_ptr<market::IPriceSource> prices_;

    mutable std::mutex mutex_;
    double balance_;                    // Free cash
    double realized_pnl_ = 0.0;
    std::unordered_map<Symbol, Holding> holdings_;
    std::atomic<uint64_t> next_order_id_{1};
};

}  // namespace vigil::exchange
