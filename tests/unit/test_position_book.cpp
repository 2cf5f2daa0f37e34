// ============================================================================
// VIGIL - Position Book Unit Tests
// ============================================================================

#include "vigil/order/position_book.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace vigil;
using namespace vigil::order;

namespace {

Position make_position(std::string_view coin, PositionStatus status = PositionStatus::Open) {
    Position p;
    p.coin = Symbol(coin);
    p.status = status;
    return p;
}

}  // namespace

TEST(PositionBookTest, InsertFindErase) {
    PositionBook book;
    {
        auto guard = book.lock_coin(Symbol("BTC"));
        auto tracked = book.insert(make_position("BTC"));
        ASSERT_NE(tracked, nullptr);
    }

    EXPECT_EQ(book.size(), 1u);
    ASSERT_NE(book.find(Symbol("BTC")), nullptr);
    EXPECT_EQ(book.find(Symbol("ETH")), nullptr);

    auto guard = book.lock_coin(Symbol("BTC"));
    EXPECT_TRUE(book.erase(Symbol("BTC")));
    EXPECT_FALSE(book.erase(Symbol("BTC")));
    EXPECT_EQ(book.size(), 0u);
}

TEST(PositionBookTest, SlotsNeverExceedMaximum) {
    PositionBook book;
    constexpr int MAX = 3;
    std::atomic<int> granted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            if (book.try_reserve_slot(MAX)) {
                granted.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(granted.load(), MAX);
    EXPECT_EQ(book.slots_in_use(), MAX);

    book.release_slot();
    EXPECT_TRUE(book.try_reserve_slot(MAX));
    EXPECT_FALSE(book.try_reserve_slot(MAX));
}

TEST(PositionBookTest, CoinLockIsPerCoin) {
    PositionBook book;
    auto btc = book.lock_coin(Symbol("BTC"));

    // A different coin is not blocked by the BTC lock
    std::atomic<bool> locked_eth{false};
    std::thread other([&] {
        auto eth = book.lock_coin(Symbol("ETH"));
        locked_eth = true;
    });
    other.join();
    EXPECT_TRUE(locked_eth.load());
}

TEST(PositionBookTest, IdsAreUnique) {
    PositionBook book;
    const auto a = book.next_id();
    const auto b = book.next_id();
    EXPECT_NE(a, b);
}

TEST(PositionTest, UnrealizedPnlUsesLastMark) {
    Position p = make_position("BTC");
    p.entry_price = Price::from_double(100.0);
    p.size = Quantity::from_double(2.0);
    EXPECT_DOUBLE_EQ(p.unrealized_pnl(), 0.0);

    p.last_mark_price = Price::from_double(103.0);
    EXPECT_DOUBLE_EQ(p.unrealized_pnl(), 6.0);

    p.side = PositionSide::Short;
    EXPECT_DOUBLE_EQ(p.unrealized_pnl(), -6.0);
    EXPECT_DOUBLE_EQ(p.notional(), 200.0);
}

TEST(PositionTest, TradeRecordFromClosedPosition) {
    Position p = make_position("ETH", PositionStatus::Closed);
    p.side = PositionSide::Short;
    p.entry_price = Price::from_double(2000.0);
    p.exit_price = Price::from_double(1900.0);
    p.size = Quantity::from_double(0.5);
    p.close_reason = CloseReason::TakeProfit;
    p.realized_pnl = 50.0;

    const auto record = make_trade_record(p);
    EXPECT_EQ(record.coin, Symbol("ETH"));
    EXPECT_EQ(record.reason, CloseReason::TakeProfit);
    EXPECT_DOUBLE_EQ(record.pnl, 50.0);
    EXPECT_DOUBLE_EQ(record.pnl_percent, 5.0);
}

TEST(PositionTest, ActiveStatuses) {
    EXPECT_TRUE(make_position("A", PositionStatus::Opening).is_active());
    EXPECT_TRUE(make_position("A", PositionStatus::Open).is_active());
    EXPECT_TRUE(make_position("A", PositionStatus::Closing).is_active());
    EXPECT_FALSE(make_position("A", PositionStatus::Closed).is_active());
    EXPECT_FALSE(make_position("A", PositionStatus::Failed).is_active());
}
