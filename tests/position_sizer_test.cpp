// =============================================================================
// position_sizer_test.cpp
// =============================================================================
// Unit tests for capital::PositionSizer.
//
// Validates:
//   - The reference case: 100,000 capital, 2% risk, entry 2450, stop 2350
//     → 20 shares, risk budget binding
//   - Each cap (position size, Kelly-lite, deployable cash) binds when it is
//     the tightest
//   - ATR-derived stop and target, for both directions
//   - Monotonic in max_risk_per_trade_pct
//   - TrancheSplit: only the first tranche is capped by cash, and a deferred
//     tranche is capped again when it is released
// =============================================================================

#include "capital/allocation/playbook.hpp"
#include "capital/allocation/position_sizer.hpp"

#include <gtest/gtest.h>

class PositionSizerTest : public ::testing::Test {
 protected:
  PositionSizerTest() {
    limits.kelly_cap = 0.5;
    limits.assumed_variance = 0.04;

    mandate.account_id = "acct-1";
    mandate.max_risk_per_trade_pct = 2.0;
    mandate.max_position_size.kind =
        capital::domain::PositionSizeLimit::Kind::PercentOfCapital;
    mandate.max_position_size.value = 50.0;

    account.id = "acct-1";
    account.total_capital = 100'000.0;
    account.available_cash = 100'000.0;

    signal.id = "sig-1";
    signal.symbol = "RELIANCE";
    signal.edge_estimate = 5.0;
    signal.confidence = 0.8;
    signal.horizon_days = 10;
    signal.entry_price = 2450.0;
    signal.stop_loss = 2350.0;

    market.symbol = "RELIANCE";
    market.price = 2450.0;
    market.atr = 50.0;
  }

  capital::SizingResult size(double deployable = 95'000.0) const {
    capital::PositionSizer sizer(limits);
    return sizer.size(signal, mandate, account, market,
                      capital::applyPlaybook(signal, mandate), deployable);
  }

  capital::domain::SizingLimits limits;
  capital::domain::Mandate mandate;
  capital::domain::Account account;
  capital::domain::Signal signal;
  capital::domain::MarketSnapshot market;
};

// -----------------------------------------------------------------------------
// 1. Reference case: 2,000 risk budget / 100 per share = 20 shares.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, RiskBudgetReferenceCase) {
  const auto r = size();
  EXPECT_DOUBLE_EQ(r.quantity, 20.0);
  EXPECT_EQ(r.binding, capital::BindingConstraint::RiskBudget);
  EXPECT_DOUBLE_EQ(r.entry_price, 2450.0);
  EXPECT_DOUBLE_EQ(r.stop_loss, 2350.0);
  EXPECT_DOUBLE_EQ(r.risk_per_unit, 100.0);
  EXPECT_DOUBLE_EQ(r.risk_amount, 2'000.0);
  EXPECT_DOUBLE_EQ(r.notional(), 49'000.0);

  ASSERT_EQ(r.tranches.size(), 1u);
  EXPECT_DOUBLE_EQ(r.firstTrancheQuantity(), 20.0);
  EXPECT_EQ(r.tranches[0].release_condition, "immediate");
}

// -----------------------------------------------------------------------------
// 2. Target from ATR × take-profit multiplier feeds reward:risk.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, RewardRiskFromAtrTarget) {
  const auto r = size();
  EXPECT_DOUBLE_EQ(r.take_profit, 2650.0);  // 2450 + 50 × 4
  EXPECT_DOUBLE_EQ(r.reward_amount, 4'000.0);
  EXPECT_DOUBLE_EQ(r.reward_risk_ratio, 2.0);
}

// -----------------------------------------------------------------------------
// 3. Without a stop hint the stop comes from ATR × stop multiplier, on the
//    correct side for each direction.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, AtrDerivedStopForBothDirections) {
  signal.stop_loss.reset();
  mandate.stop_loss_atr_multiplier = 1.0;

  auto long_result = size();
  EXPECT_DOUBLE_EQ(long_result.stop_loss, 2400.0);
  EXPECT_DOUBLE_EQ(long_result.risk_per_unit, 50.0);

  signal.direction = capital::domain::Direction::Short;
  auto short_result = size();
  EXPECT_DOUBLE_EQ(short_result.stop_loss, 2500.0);
  EXPECT_DOUBLE_EQ(short_result.take_profit, 2450.0 - 50.0 * 4.0);
}

// -----------------------------------------------------------------------------
// 4. Each cap binds when it is the tightest.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, TightestCapBinds) {
  mandate.max_position_size.kind =
      capital::domain::PositionSizeLimit::Kind::Absolute;
  mandate.max_position_size.value = 24'500.0;  // 10 shares
  auto by_position = size();
  EXPECT_DOUBLE_EQ(by_position.quantity, 10.0);
  EXPECT_EQ(by_position.binding, capital::BindingConstraint::MaxPositionSize);

  mandate.max_position_size.value = 1'000'000.0;
  limits.kelly_cap = 0.1;  // 10,000 / 2450 = 4.08 → 4
  auto by_kelly = size();
  EXPECT_DOUBLE_EQ(by_kelly.quantity, 4.0);
  EXPECT_EQ(by_kelly.binding, capital::BindingConstraint::KellyCap);

  limits.kelly_cap = 0.5;
  auto by_cash = size(7'400.0);  // 3.02 → 3
  EXPECT_DOUBLE_EQ(by_cash.quantity, 3.0);
  EXPECT_EQ(by_cash.binding, capital::BindingConstraint::Cash);
}

// -----------------------------------------------------------------------------
// 5. Nothing fits → quantity 0, no tranches.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, ZeroWhenNothingFits) {
  const auto no_cash = size(1'000.0);
  EXPECT_DOUBLE_EQ(no_cash.quantity, 0.0);
  EXPECT_TRUE(no_cash.tranches.empty());

  signal.edge_estimate = 0.0;  // Kelly fraction 0
  const auto no_edge = size();
  EXPECT_DOUBLE_EQ(no_edge.quantity, 0.0);
  EXPECT_EQ(no_edge.binding, capital::BindingConstraint::KellyCap);
}

// -----------------------------------------------------------------------------
// 6. No usable price or zero stop distance.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, InvalidPriceYieldsZero) {
  signal.entry_price.reset();
  market.price = 0.0;
  auto no_price = size();
  EXPECT_DOUBLE_EQ(no_price.quantity, 0.0);
  EXPECT_EQ(no_price.binding, capital::BindingConstraint::InvalidPrice);

  signal.entry_price = 2450.0;
  signal.stop_loss = 2450.0;
  auto flat_stop = size();
  EXPECT_DOUBLE_EQ(flat_stop.quantity, 0.0);
  EXPECT_EQ(flat_stop.binding, capital::BindingConstraint::InvalidPrice);
}

// -----------------------------------------------------------------------------
// 7. Quantity never decreases as max_risk_per_trade_pct grows.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, MonotonicInMaxRisk) {
  double previous = 0.0;
  for (double pct = 0.25; pct <= 10.0; pct += 0.25) {
    mandate.max_risk_per_trade_pct = pct;
    const auto r = size();
    EXPECT_GE(r.quantity, previous) << "quantity fell at max_risk " << pct;
    previous = r.quantity;
  }
  EXPECT_GT(previous, 0.0);
}

// -----------------------------------------------------------------------------
// 8. TrancheSplit: legs share the planned quantity, only the first is
//    capped by deployable cash.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, TrancheSplitCapsOnlyFirstLeg) {
  signal.overrides.push_back(
      capital::domain::TrancheSplit{{{50.0, 0}, {50.0, 3}}});

  const auto roomy = size();
  ASSERT_EQ(roomy.tranches.size(), 2u);
  EXPECT_DOUBLE_EQ(roomy.tranches[0].quantity, 10.0);
  EXPECT_DOUBLE_EQ(roomy.tranches[1].quantity, 10.0);
  EXPECT_EQ(roomy.tranches[1].release_condition, "after_3_days");
  EXPECT_DOUBLE_EQ(roomy.quantity, 20.0);

  const auto tight = size(12'250.0);  // first leg: 5 shares
  ASSERT_EQ(tight.tranches.size(), 2u);
  EXPECT_DOUBLE_EQ(tight.firstTrancheQuantity(), 5.0);
  EXPECT_DOUBLE_EQ(tight.tranches[1].quantity, 10.0);
  EXPECT_DOUBLE_EQ(tight.quantity, 15.0);
  EXPECT_EQ(tight.binding, capital::BindingConstraint::Cash);
}

// -----------------------------------------------------------------------------
// 9. Kelly-lite fraction is clamped to [0, kelly_cap].
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, KellyFractionIsClamped) {
  capital::PositionSizer sizer(limits);
  EXPECT_DOUBLE_EQ(sizer.kellyFraction(signal), 0.5);  // raw 1.0

  signal.confidence = 0.4;
  signal.edge_estimate = 2.0;
  EXPECT_NEAR(sizer.kellyFraction(signal), 0.4 * 0.02 / 0.04, 1e-12);

  signal.edge_estimate = -4.0;
  EXPECT_DOUBLE_EQ(sizer.kellyFraction(signal), 0.0);
}

// -----------------------------------------------------------------------------
// 10. A deferred tranche is re-sized against the cash on hand when it is
//     released.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, DeferredTrancheResizedAgainstCash) {
  capital::PositionSizer sizer(limits);
  EXPECT_DOUBLE_EQ(sizer.sizeTranche(10.0, 2450.0, 95'000.0), 10.0);
  EXPECT_DOUBLE_EQ(sizer.sizeTranche(10.0, 2450.0, 12'250.0), 5.0);
  EXPECT_DOUBLE_EQ(sizer.sizeTranche(10.0, 2450.0, 2'000.0), 0.0);
  EXPECT_DOUBLE_EQ(sizer.sizeTranche(10.0, 0.0, 95'000.0), 0.0);
}
