// ============================================================================
// VIGIL - Paper Exchange Unit Tests
// ============================================================================

#include "vigil/core/errors.hpp"
#include "vigil/exchange/paper_exchange.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace vigil;
using namespace vigil::exchange;

class PaperExchangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        market = std::make_shared<vigil::testing::FakeMarket>();
        market->set_price("BTC", 50000.0);
        market->set_price("ETH", 2000.0);
    }

    PaperExchange make(double balance = 1000.0, double fee_percent = 0.0) {
        return PaperExchange(PaperExchangeConfig{balance, fee_percent}, market);
    }

    static order::Position position_for(std::string_view coin) {
        order::Position p;
        p.coin = Symbol(coin);
        return p;
    }

    std::shared_ptr<vigil::testing::FakeMarket> market;
};

TEST_F(PaperExchangeTest, FillsAtLatestPriceAndLocksMargin) {
    auto paper = make();
    auto fill = paper.place_order(Symbol("BTC"), Side::Buy, Quantity::from_double(0.01));

    EXPECT_FALSE(fill.order_id.empty());
    EXPECT_DOUBLE_EQ(fill.entry_price.to_double(), 50000.0);
    EXPECT_DOUBLE_EQ(fill.filled_size.to_double(), 0.01);

    auto account = paper.get_account_state();
    EXPECT_NEAR(account.available_balance, 500.0, 1e-9);
    EXPECT_NEAR(account.total_equity, 1000.0, 1e-9);
    EXPECT_EQ(account.open_positions, 1);
}

TEST_F(PaperExchangeTest, LongCloseRealizesGain) {
    auto paper = make();
    (void)paper.place_order(Symbol("BTC"), Side::Buy, Quantity::from_double(0.01));
    market->set_price("BTC", 51000.0);

    auto close = paper.close_position(position_for("BTC"));
    EXPECT_DOUBLE_EQ(close.exit_price.to_double(), 51000.0);
    EXPECT_NEAR(paper.realized_pnl(), 10.0, 1e-9);
    EXPECT_NEAR(paper.get_account_state().available_balance, 1010.0, 1e-9);
    EXPECT_EQ(paper.get_account_state().open_positions, 0);
}

TEST_F(PaperExchangeTest, ShortCloseRealizesGainOnDrop) {
    auto paper = make();
    (void)paper.place_order(Symbol("ETH"), Side::Sell, Quantity::from_double(0.2));
    market->set_price("ETH", 1900.0);

    (void)paper.close_position(position_for("ETH"));
    EXPECT_NEAR(paper.realized_pnl(), 20.0, 1e-9);
}

TEST_F(PaperExchangeTest, FeesChargedBothWays) {
    auto paper = make(1000.0, 0.1);
    (void)paper.place_order(Symbol("BTC"), Side::Buy, Quantity::from_double(0.01));
    EXPECT_NEAR(paper.get_account_state().available_balance, 1000.0 - 500.0 - 0.5, 1e-9);

    (void)paper.close_position(position_for("BTC"));
    EXPECT_NEAR(paper.realized_pnl(), -0.5, 1e-9);
    EXPECT_NEAR(paper.get_account_state().available_balance, 999.0, 1e-9);
}

TEST_F(PaperExchangeTest, RejectsInsufficientBalance) {
    auto paper = make(100.0);
    EXPECT_THROW((void)paper.place_order(Symbol("BTC"), Side::Buy, Quantity::from_double(0.01)),
                 TransientExchangeError);
    EXPECT_EQ(paper.get_account_state().open_positions, 0);
}

TEST_F(PaperExchangeTest, RejectsSecondPositionOnSameCoin) {
    auto paper = make();
    (void)paper.place_order(Symbol("ETH"), Side::Buy, Quantity::from_double(0.1));
    EXPECT_THROW((void)paper.place_order(Symbol("ETH"), Side::Sell, Quantity::from_double(0.1)),
                 TransientExchangeError);
}

TEST_F(PaperExchangeTest, RejectsZeroSize) {
    auto paper = make();
    EXPECT_THROW((void)paper.place_order(Symbol("ETH"), Side::Buy, Quantity{}),
                 TransientExchangeError);
}

TEST_F(PaperExchangeTest, CloseWithoutHoldingFails) {
    auto paper = make();
    EXPECT_THROW((void)paper.close_position(position_for("BTC")), TransientExchangeError);
}

TEST_F(PaperExchangeTest, PriceFailuresAreTransient) {
    auto paper = make();
    EXPECT_THROW((void)paper.get_mark_price(Symbol("DOGE")), TransientExchangeError);

    market->fail_all(true);
    EXPECT_THROW((void)paper.get_mark_price(Symbol("BTC")), TransientExchangeError);
    EXPECT_THROW((void)paper.place_order(Symbol("BTC"), Side::Buy, Quantity::from_double(0.001)),
                 TransientExchangeError);
}

TEST_F(PaperExchangeTest, MarkPriceTracksSource) {
    auto paper = make();
    EXPECT_DOUBLE_EQ(paper.get_mark_price(Symbol("ETH")).to_double(), 2000.0);
    market->set_price("ETH", 2100.5);
    EXPECT_DOUBLE_EQ(paper.get_mark_price(Symbol("ETH")).to_double(), 2100.5);
}
