// =============================================================================
// guardrail_test.cpp
// =============================================================================
// Unit tests for the six guardrail checks and capital::GuardrailEvaluator.
//
// Validates:
//   - A clean proposal passes every check with no warnings
//   - Each check reports its own code at the right severity
//   - CRITICAL opens exactly one BlockRecord per (signal, account)
//   - block_on_warning turns WARNING results into blocks
//   - closeBlock() reopens the pair for evaluation
// =============================================================================

#include "capital/risk/guardrail_evaluator.hpp"
#include "capital/time/simulation_time_provider.hpp"
#include "capital/time/time_utils.hpp"

#include <gtest/gtest.h>

namespace {

constexpr std::int64_t kNow = 1'700'000'000'000LL;

}  // namespace

class GuardrailTest : public ::testing::Test {
 protected:
  GuardrailTest() : clock(kNow) {
    mandate.account_id = "acct-1";
    mandate.max_risk_per_trade_pct = 2.0;
    mandate.max_sector_exposure_pct = 30.0;
    mandate.earnings_blackout_days = 2;
    mandate.risk_posture = capital::domain::RiskPosture::Moderate;

    account.id = "acct-1";
    account.total_capital = 100'000.0;
    account.available_cash = 100'000.0;

    signal.id = "sig-1";
    signal.symbol = "INFY";
    signal.sector = "IT";
    signal.confidence = 0.7;
    signal.edge_estimate = 3.0;
    signal.horizon_days = 5;

    market.symbol = "INFY";
    market.price = 1500.0;
    market.atr = 30.0;
    market.adv_value = 10'000'000.0;
    market.volatility_regime = capital::domain::RegimeLevel::Medium;
    market.liquidity_regime = capital::domain::RegimeLevel::Medium;
    market.as_of_ms = kNow;
  }

  // 20 × 1500 = 30,000 notional (exactly 30% of capital),
  // 20 × 100 = 2,000 risk (exactly 2% of capital).
  capital::GuardrailInput input(double quantity = 20.0) const {
    capital::GuardrailInput in{signal, mandate, account, market};
    in.quantity = quantity;
    in.entry_price = 1500.0;
    in.stop_loss = 1400.0;
    in.now_ms = kNow;
    return in;
  }

  capital::SimulationTimeProvider clock;
  capital::domain::GuardrailLimits limits;
  capital::domain::Mandate mandate;
  capital::domain::Account account;
  capital::domain::Signal signal;
  capital::domain::MarketSnapshot market;
};

// -----------------------------------------------------------------------------
// 1. Sized exactly at the limits, everything passes.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, CleanProposalPassesAll) {
  capital::GuardrailEvaluator evaluator(clock, limits);
  const auto decision = evaluator.evaluate(input());

  EXPECT_TRUE(decision.result.passed_all);
  EXPECT_FALSE(decision.result.has_critical_failure);
  EXPECT_TRUE(decision.result.warnings.empty());
  EXPECT_FALSE(decision.blocked());
  for (std::size_t i = 0; i < capital::domain::kGuardrailCheckCount; ++i) {
    EXPECT_TRUE(decision.result.checks[i]) << "check " << i;
  }
  EXPECT_EQ(decision.result.account_id, "acct-1");
  EXPECT_EQ(decision.result.evaluated_at_ms, kNow);
}

// -----------------------------------------------------------------------------
// 2. Thin liquidity: 30,000 notional against 5% of 100,000 ADV is CRITICAL
//    and opens a block.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, ThinLiquidityIsCriticalAndBlocks) {
  market.adv_value = 100'000.0;
  capital::GuardrailEvaluator evaluator(clock, limits);

  const auto decision = evaluator.evaluate(input());
  EXPECT_TRUE(decision.result.has_critical_failure);
  EXPECT_FALSE(decision.result.passed_all);
  EXPECT_FALSE(decision.result.check(capital::domain::GuardrailCheck::Liquidity));
  EXPECT_TRUE(decision.result.hasWarningCode("LIQUIDITY_BELOW_THRESHOLD"));

  ASSERT_TRUE(decision.blocked());
  EXPECT_TRUE(decision.block_created);
  ASSERT_EQ(decision.block->reason_codes.size(), 1u);
  EXPECT_EQ(decision.block->reason_codes[0], "LIQUIDITY_BELOW_THRESHOLD");
  EXPECT_EQ(decision.block->created_at_ms, kNow);
}

// -----------------------------------------------------------------------------
// 3. Missing ADV is a WARNING, not a block.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, MissingAdvIsWarning) {
  market.adv_value = 0.0;
  capital::GuardrailEvaluator evaluator(clock, limits);

  const auto decision = evaluator.evaluate(input());
  EXPECT_FALSE(decision.result.has_critical_failure);
  EXPECT_FALSE(decision.result.passed_all);
  EXPECT_TRUE(decision.result.hasWarningCode("INSUFFICIENT_VOLUME_DATA"));
  EXPECT_FALSE(decision.blocked());
}

// -----------------------------------------------------------------------------
// 4. Risk and sector limits are CRITICAL once exceeded.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, RiskAndSectorLimits) {
  const auto oversized = capital::checkPositionSizeRisk(input(21.0), limits);
  EXPECT_EQ(oversized.severity, capital::domain::Severity::Critical);
  EXPECT_EQ(oversized.code, "POSITION_SIZE_EXCEEDED");

  auto in = input();
  in.open_sector_notional = 5'000.0;
  const auto crowded = capital::checkSectorExposure(in, limits);
  EXPECT_EQ(crowded.severity, capital::domain::Severity::Critical);
  EXPECT_EQ(crowded.code, "SECTOR_EXPOSURE_EXCEEDED");

  signal.sector.clear();
  const auto unknown = capital::checkSectorExposure(input(), limits);
  EXPECT_EQ(unknown.severity, capital::domain::Severity::Info);
  EXPECT_EQ(unknown.code, "SECTOR_UNKNOWN");
  EXPECT_TRUE(unknown.passed());
}

// -----------------------------------------------------------------------------
// 5. Corporate actions within ± blackout days warn; outside they pass.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, EventWindowIsSymmetric) {
  market.corporate_action_ms = {kNow - capital::kMillisPerDay};
  EXPECT_EQ(capital::checkEventWindow(input(), limits).code,
            "EVENT_WINDOW_WARNING");

  market.corporate_action_ms = {kNow + 2 * capital::kMillisPerDay};
  EXPECT_EQ(capital::checkEventWindow(input(), limits).severity,
            capital::domain::Severity::Warning);

  market.corporate_action_ms = {kNow + 3 * capital::kMillisPerDay,
                                kNow - 10 * capital::kMillisPerDay};
  EXPECT_EQ(capital::checkEventWindow(input(), limits).severity,
            capital::domain::Severity::Pass);
}

// -----------------------------------------------------------------------------
// 6. Regime compatibility depends on the mandate's posture.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, RegimeDependsOnPosture) {
  using capital::domain::RegimeLevel;
  using capital::domain::RiskPosture;
  using capital::domain::Severity;

  market.volatility_regime = RegimeLevel::High;
  market.liquidity_regime = RegimeLevel::Medium;

  mandate.risk_posture = RiskPosture::Conservative;
  EXPECT_EQ(capital::checkRegime(input(), limits).code, "REGIME_INCOMPATIBLE");

  mandate.risk_posture = RiskPosture::Moderate;
  EXPECT_EQ(capital::checkRegime(input(), limits).severity, Severity::Pass);

  market.liquidity_regime = RegimeLevel::Low;
  EXPECT_EQ(capital::checkRegime(input(), limits).severity, Severity::Warning);

  mandate.risk_posture = RiskPosture::Aggressive;
  EXPECT_EQ(capital::checkRegime(input(), limits).severity, Severity::Pass);

  market.volatility_regime = RegimeLevel::Unknown;
  market.liquidity_regime = RegimeLevel::Unknown;
  const auto unknown = capital::checkRegime(input(), limits);
  EXPECT_EQ(unknown.severity, Severity::Info);
  EXPECT_EQ(unknown.code, "REGIME_UNKNOWN");
}

// -----------------------------------------------------------------------------
// 7. Catalyst freshness applies to event-driven signals only.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, CatalystFreshnessForEventDrivenSignals) {
  using capital::domain::Severity;

  market.catalyst_ms = kNow - 48 * capital::kMillisPerHour;
  EXPECT_EQ(capital::checkCatalystFreshness(input(), limits).severity,
            Severity::Pass);  // not event-driven

  signal.event_id = "evt-42";
  const auto stale = capital::checkCatalystFreshness(input(), limits);
  EXPECT_EQ(stale.severity, Severity::Critical);
  EXPECT_EQ(stale.code, "CATALYST_STALE");

  market.catalyst_ms = kNow - 2 * capital::kMillisPerHour;
  EXPECT_EQ(capital::checkCatalystFreshness(input(), limits).severity,
            Severity::Pass);

  market.catalyst_ms.reset();
  const auto undated = capital::checkCatalystFreshness(input(), limits);
  EXPECT_EQ(undated.severity, Severity::Warning);
  EXPECT_EQ(undated.code, "CATALYST_UNDATED");
}

// -----------------------------------------------------------------------------
// 8. Re-evaluating a blocked pair reuses the open block.
// Why: a signal replayed every tick must not flood the audit trail.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, BlocksAreIdempotentPerSignalAndAccount) {
  market.adv_value = 100'000.0;
  capital::GuardrailEvaluator evaluator(clock, limits);

  const auto first = evaluator.evaluate(input());
  const auto second = evaluator.evaluate(input());
  ASSERT_TRUE(first.blocked());
  ASSERT_TRUE(second.blocked());
  EXPECT_TRUE(first.block_created);
  EXPECT_FALSE(second.block_created);
  EXPECT_EQ(first.block->id, second.block->id);
  EXPECT_EQ(evaluator.openBlocks("acct-1").size(), 1u);

  const auto open = evaluator.openBlock("sig-1", "acct-1");
  ASSERT_TRUE(open.has_value());
  EXPECT_EQ(open->id, first.block->id);

  const auto closed = evaluator.closeBlock(first.block->id);
  ASSERT_TRUE(closed.has_value());
  EXPECT_FALSE(closed->open);
  EXPECT_FALSE(evaluator.closeBlock(first.block->id).has_value());
  EXPECT_FALSE(evaluator.openBlock("sig-1", "acct-1").has_value());

  const auto third = evaluator.evaluate(input());
  ASSERT_TRUE(third.blocked());
  EXPECT_TRUE(third.block_created);
  EXPECT_NE(third.block->id, first.block->id);
}

// -----------------------------------------------------------------------------
// 9. block_on_warning escalates WARNING results; INFO never blocks.
// -----------------------------------------------------------------------------
TEST_F(GuardrailTest, BlockOnWarningEscalates) {
  market.corporate_action_ms = {kNow + capital::kMillisPerDay};
  signal.sector.clear();  // INFO only

  capital::GuardrailEvaluator lenient(clock, limits);
  EXPECT_FALSE(lenient.evaluate(input()).blocked());

  limits.block_on_warning = true;
  capital::GuardrailEvaluator strict(clock, limits);
  const auto decision = strict.evaluate(input());
  ASSERT_TRUE(decision.blocked());
  ASSERT_EQ(decision.block->reason_codes.size(), 1u);
  EXPECT_EQ(decision.block->reason_codes[0], "EVENT_WINDOW_WARNING");

  market.corporate_action_ms.clear();
  signal.id = "sig-2";
  const auto info_only = strict.evaluate(input());
  EXPECT_TRUE(info_only.result.passed_all);
  EXPECT_TRUE(info_only.result.hasWarningCode("SECTOR_UNKNOWN"));
  EXPECT_FALSE(info_only.blocked());
}
