// =============================================================================
// position_book_test.cpp
// =============================================================================
// Unit tests for capital::PositionBook.
//
// Validates:
//   - open() copies the proposal's levels and records the fill as cost basis
//   - close() realizes signed P&L for both directions, exactly once
//   - Sector notional and open counts only see OPEN positions of the account
// =============================================================================

#include "capital/risk/position_book.hpp"

#include <gtest/gtest.h>

namespace {

capital::domain::TradeProposal makeProposal(
    const std::string& account, const std::string& symbol,
    const std::string& sector,
    capital::domain::Direction direction = capital::domain::Direction::Long) {
  capital::domain::TradeProposal p;
  p.id = 7;
  p.account_id = account;
  p.signal_id = "sig-" + symbol;
  p.symbol = symbol;
  p.sector = sector;
  p.direction = direction;
  p.quantity = 20.0;
  p.entry_price = 2450.0;
  p.stop_loss = 2350.0;
  p.take_profit = 2650.0;
  return p;
}

}  // namespace

class PositionBookTest : public ::testing::Test {
 protected:
  capital::PositionBook book;
};

// -----------------------------------------------------------------------------
// 1. open() carries the proposal's levels and the actual fill.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, OpenRecordsFill) {
  const auto pos =
      book.open(makeProposal("acct-1", "RELIANCE", "ENERGY"), 18.0, 2448.0);

  EXPECT_NE(pos.id, 0u);
  EXPECT_EQ(pos.account_id, "acct-1");
  EXPECT_EQ(pos.sector, "ENERGY");
  EXPECT_DOUBLE_EQ(pos.quantity, 18.0);
  EXPECT_DOUBLE_EQ(pos.entry_price, 2448.0);
  EXPECT_DOUBLE_EQ(pos.cost_basis, 18.0 * 2448.0);
  EXPECT_DOUBLE_EQ(pos.stop_loss, 2350.0);
  EXPECT_DOUBLE_EQ(pos.take_profit, 2650.0);
  EXPECT_EQ(pos.status, capital::domain::PositionStatus::Open);

  const auto stored = book.position(pos.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->cost_basis, pos.cost_basis);
}

// -----------------------------------------------------------------------------
// 2. Realized P&L is signed by direction.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, CloseRealizesSignedPnl) {
  const auto long_pos =
      book.open(makeProposal("acct-1", "INFY", "IT"), 10.0, 1500.0);
  const auto short_pos = book.open(
      makeProposal("acct-1", "TCS", "IT", capital::domain::Direction::Short),
      10.0, 3500.0);

  // realizedPnl() previews the close without touching the book.
  EXPECT_DOUBLE_EQ(capital::PositionBook::realizedPnl(short_pos, 3600.0),
                   -1'000.0);
  EXPECT_EQ(book.position(short_pos.id)->status,
            capital::domain::PositionStatus::Open);

  const auto long_closed = book.close(long_pos.id, 1550.0);
  ASSERT_TRUE(long_closed.has_value());
  EXPECT_DOUBLE_EQ(long_closed->realized_pnl, 500.0);
  EXPECT_EQ(long_closed->status, capital::domain::PositionStatus::Closed);
  EXPECT_DOUBLE_EQ(long_closed->exit_price, 1550.0);

  const auto short_closed = book.close(short_pos.id, 3600.0);
  ASSERT_TRUE(short_closed.has_value());
  EXPECT_DOUBLE_EQ(short_closed->realized_pnl, -1'000.0);
}

// -----------------------------------------------------------------------------
// 3. A position closes once; unknown ids are ignored.
// Why: a duplicated close event must not return capital to the ledger twice.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, CloseIsOneShot) {
  const auto pos = book.open(makeProposal("acct-1", "INFY", "IT"), 10.0, 1500.0);
  ASSERT_TRUE(book.close(pos.id, 1600.0).has_value());
  EXPECT_FALSE(book.close(pos.id, 1700.0).has_value());
  EXPECT_FALSE(book.close(9'999, 100.0).has_value());
  EXPECT_DOUBLE_EQ(book.position(pos.id)->realized_pnl, 1'000.0);
}

// -----------------------------------------------------------------------------
// 4. Exposure queries only see OPEN positions of the requested account.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, ExposureCountsOpenPositionsPerAccount) {
  book.open(makeProposal("acct-1", "INFY", "IT"), 10.0, 1500.0);
  const auto tcs = book.open(makeProposal("acct-1", "TCS", "IT"), 5.0, 3000.0);
  book.open(makeProposal("acct-1", "SBIN", "BANKING"), 100.0, 600.0);
  book.open(makeProposal("acct-2", "WIPRO", "IT"), 100.0, 400.0);

  EXPECT_DOUBLE_EQ(book.sectorNotional("acct-1", "IT"), 30'000.0);
  EXPECT_EQ(book.openCount("acct-1"), 3u);
  EXPECT_EQ(book.openCount("acct-2"), 1u);

  book.close(tcs.id, 3100.0);
  EXPECT_DOUBLE_EQ(book.sectorNotional("acct-1", "IT"), 15'000.0);
  EXPECT_EQ(book.openCount("acct-1"), 2u);
  EXPECT_EQ(book.openPositions("acct-1").size(), 2u);
  EXPECT_EQ(book.getSnapshots().size(), 4u);
}

// -----------------------------------------------------------------------------
// 5. hydratePosition() assigns an id and cost basis when missing.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, HydrateFillsMissingFields) {
  capital::domain::Position carried;
  carried.account_id = "acct-1";
  carried.symbol = "HDFCBANK";
  carried.sector = "BANKING";
  carried.quantity = 10.0;
  carried.entry_price = 1600.0;
  carried.status = capital::domain::PositionStatus::Closed;

  const auto pos = book.hydratePosition(carried);
  EXPECT_NE(pos.id, 0u);
  EXPECT_DOUBLE_EQ(pos.cost_basis, 16'000.0);
  EXPECT_EQ(pos.status, capital::domain::PositionStatus::Open);
  EXPECT_DOUBLE_EQ(book.sectorNotional("acct-1", "BANKING"), 16'000.0);
}
