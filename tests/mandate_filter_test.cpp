// =============================================================================
// mandate_filter_test.cpp
// =============================================================================
// Unit tests for capital::MandateFilter.
//
// Validates every rejection rule and its reason code, that the first failing
// rule wins, and that empty allow-lists mean "unrestricted".
// =============================================================================

#include "capital/allocation/mandate_filter.hpp"

#include <gtest/gtest.h>

#include <limits>

class MandateFilterTest : public ::testing::Test {
 protected:
  MandateFilterTest() {
    mandate.account_id = "acct-1";
    mandate.min_horizon_days = 2;
    mandate.max_horizon_days = 20;

    account.id = "acct-1";
    account.total_capital = 100'000.0;
    account.available_cash = 100'000.0;

    signal.id = "sig-1";
    signal.symbol = "INFY";
    signal.edge_estimate = 4.0;
    signal.confidence = 0.7;
    signal.horizon_days = 5;
    signal.sector = "IT";
    signal.strategy = "swing";
  }

  std::string reason() const {
    return filter.evaluate(signal, mandate, account).reason;
  }

  capital::MandateFilter filter;
  capital::domain::Mandate mandate;
  capital::domain::Account account;
  capital::domain::Signal signal;
};

// -----------------------------------------------------------------------------
// 1. A signal inside every limit is eligible; empty allow-lists do not
//    restrict.
// -----------------------------------------------------------------------------
TEST_F(MandateFilterTest, UnrestrictedMandateAcceptsSignal) {
  EXPECT_TRUE(filter.eligible(signal, mandate, account));
  const auto verdict = filter.evaluate(signal, mandate, account);
  EXPECT_TRUE(verdict.eligible);
  EXPECT_TRUE(verdict.reason.empty());
}

// -----------------------------------------------------------------------------
// 2. Horizon bounds are inclusive.
// -----------------------------------------------------------------------------
TEST_F(MandateFilterTest, HorizonBoundsAreInclusive) {
  signal.horizon_days = 2;
  EXPECT_TRUE(filter.eligible(signal, mandate, account));
  signal.horizon_days = 20;
  EXPECT_TRUE(filter.eligible(signal, mandate, account));
  signal.horizon_days = 1;
  EXPECT_EQ(reason(), "HORIZON_OUT_OF_RANGE");
  signal.horizon_days = 21;
  EXPECT_EQ(reason(), "HORIZON_OUT_OF_RANGE");
}

// -----------------------------------------------------------------------------
// 3. Sector allow-list, ban-list and strategy allow-list.
// -----------------------------------------------------------------------------
TEST_F(MandateFilterTest, SectorAndStrategyRules) {
  mandate.allowed_sectors = {"BANKING", "PHARMA"};
  EXPECT_EQ(reason(), "SECTOR_NOT_ALLOWED");

  mandate.allowed_sectors.clear();
  mandate.banned_sectors = {"IT"};
  EXPECT_EQ(reason(), "SECTOR_BANNED");

  mandate.banned_sectors.clear();
  mandate.allowed_strategies = {"momentum"};
  EXPECT_EQ(reason(), "STRATEGY_NOT_ALLOWED");

  mandate.allowed_strategies.insert("swing");
  EXPECT_TRUE(filter.eligible(signal, mandate, account));
}

// -----------------------------------------------------------------------------
// 4. Malformed signals never pass.
// -----------------------------------------------------------------------------
TEST_F(MandateFilterTest, MalformedSignalsAreRejected) {
  signal.confidence = 1.2;
  EXPECT_EQ(reason(), "INVALID_CONFIDENCE");
  signal.confidence = -0.1;
  EXPECT_EQ(reason(), "INVALID_CONFIDENCE");
  signal.confidence = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(reason(), "INVALID_CONFIDENCE");

  signal.confidence = 0.7;
  signal.symbol.clear();
  EXPECT_EQ(reason(), "INVALID_SIGNAL");

  signal.symbol = "INFY";
  signal.id.clear();
  EXPECT_EQ(reason(), "INVALID_SIGNAL");

  signal.id = "sig-1";
  signal.overrides.push_back(capital::domain::TrancheSplit{
      {{60.0, 0}, {50.0, 3}}});  // sums to 110%
  EXPECT_EQ(reason(), "INVALID_OVERRIDE");

  signal.overrides.clear();
  signal.overrides.push_back(capital::domain::PriorityBoost{0.0});
  EXPECT_EQ(reason(), "INVALID_OVERRIDE");
}

// -----------------------------------------------------------------------------
// 5. A paused account rejects everything, ahead of every other rule.
// -----------------------------------------------------------------------------
TEST_F(MandateFilterTest, PausedAccountWinsOverOtherReasons) {
  account.paused = true;
  signal.horizon_days = 99;
  signal.confidence = 3.0;
  EXPECT_EQ(reason(), "ACCOUNT_PAUSED");
  EXPECT_FALSE(filter.eligible(signal, mandate, account));
}
