// =============================================================================
// position_book_test.cpp
// =============================================================================
// Unit tests for tradeguard::PositionBook.
//
// Validates:
//   - Weighted average entry when adding to a position
//   - Realized PnL on partial close, full close and reversal
//   - Equity = initial + realized - commission + unrealized
//   - Marks survive a reconciliation replaceAll()
// =============================================================================

#include "tradeguard/risk/position_book.hpp"

#include <gtest/gtest.h>

using tradeguard::domain::Side;

class PositionBookTest : public ::testing::Test {
 protected:
  tradeguard::PositionBook book{10'000.0};
};

// -----------------------------------------------------------------------------
// 1. Two buys: 1 @ 100 and 3 @ 104 → 4 @ 103.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, AddingAveragesEntry) {
  EXPECT_DOUBLE_EQ(book.applyFill("BTCUSDT", Side::Buy, 1.0, 100.0, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(book.applyFill("BTCUSDT", Side::Buy, 3.0, 104.0, 0.0), 0.0);

  auto pos = book.position("BTCUSDT");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->net_quantity, 4.0);
  EXPECT_DOUBLE_EQ(pos->average_price, 103.0);
}

// -----------------------------------------------------------------------------
// 2. Partial then full close of a long realizes PnL on the closed quantity.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ClosingRealizesPnl) {
  book.applyFill("BTCUSDT", Side::Buy, 4.0, 100.0, 0.0);

  EXPECT_DOUBLE_EQ(book.applyFill("BTCUSDT", Side::Sell, 1.0, 110.0, 0.0),
                   10.0);
  EXPECT_DOUBLE_EQ(book.position("BTCUSDT")->average_price, 100.0);

  EXPECT_DOUBLE_EQ(book.applyFill("BTCUSDT", Side::Sell, 3.0, 90.0, 0.0),
                   -30.0);
  auto pos = book.position("BTCUSDT");
  EXPECT_DOUBLE_EQ(pos->net_quantity, 0.0);
  EXPECT_DOUBLE_EQ(pos->average_price, 0.0);
  EXPECT_DOUBLE_EQ(pos->realized_pnl, -20.0);
  EXPECT_TRUE(book.openPositions().empty());
}

// -----------------------------------------------------------------------------
// 3. A sell bigger than a long closes it and opens a short at the fill.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ReversalOpensRemainder) {
  book.applyFill("ETHUSDT", Side::Buy, 2.0, 50.0, 0.0);
  EXPECT_DOUBLE_EQ(book.applyFill("ETHUSDT", Side::Sell, 5.0, 40.0, 0.0),
                   -20.0);

  auto pos = book.position("ETHUSDT");
  EXPECT_DOUBLE_EQ(pos->net_quantity, -3.0);
  EXPECT_DOUBLE_EQ(pos->average_price, 40.0);
}

// -----------------------------------------------------------------------------
// 4. Closing a short profits when the price fell.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ShortCloseProfit) {
  book.applyFill("ETHUSDT", Side::Sell, 2.0, 50.0, 0.0);
  EXPECT_DOUBLE_EQ(book.applyFill("ETHUSDT", Side::Buy, 2.0, 45.0, 0.0), 10.0);
}

// -----------------------------------------------------------------------------
// 5. Equity tracks realized, commission and mark-to-market.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, EquityIncludesUnrealizedAndCommission) {
  book.applyFill("BTCUSDT", Side::Buy, 2.0, 100.0, 1.5);
  EXPECT_DOUBLE_EQ(book.markPrice("BTCUSDT").value(), 100.0);
  EXPECT_DOUBLE_EQ(book.currentEquity(), 9'998.5);

  book.updateMark("BTCUSDT", 120.0);
  EXPECT_DOUBLE_EQ(book.currentEquity(), 9'998.5 + 40.0);

  book.applyFill("BTCUSDT", Side::Sell, 1.0, 120.0, 0.5);
  EXPECT_DOUBLE_EQ(book.totalRealizedPnl(), 20.0);
  EXPECT_DOUBLE_EQ(book.totalCommission(), 2.0);
  EXPECT_DOUBLE_EQ(book.currentEquity(), 10'000.0 - 2.0 + 20.0 + 20.0);
}

// -----------------------------------------------------------------------------
// 6. replaceAll() installs venue truth and keeps known marks.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ReplaceAllKeepsMarks) {
  book.updateMark("BTCUSDT", 100.0);
  book.applyFill("ETHUSDT", Side::Buy, 1.0, 10.0, 0.0);

  tradeguard::domain::Position venue_pos;
  venue_pos.symbol = "BTCUSDT";
  venue_pos.net_quantity = 0.5;
  venue_pos.average_price = 95.0;
  book.replaceAll({venue_pos});

  auto btc = book.position("BTCUSDT");
  ASSERT_TRUE(btc.has_value());
  EXPECT_DOUBLE_EQ(btc->net_quantity, 0.5);
  EXPECT_DOUBLE_EQ(btc->mark_price, 100.0);

  auto eth = book.position("ETHUSDT");
  ASSERT_TRUE(eth.has_value());
  EXPECT_DOUBLE_EQ(eth->net_quantity, 0.0);
  EXPECT_DOUBLE_EQ(eth->mark_price, 10.0);
  EXPECT_EQ(book.openPositions().size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. No mark known → no markPrice.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, UnknownSymbolHasNoMark) {
  EXPECT_FALSE(book.markPrice("XRPUSDT").has_value());
  EXPECT_FALSE(book.position("XRPUSDT").has_value());
}
