// =============================================================================
// objective_ranker_test.cpp
// =============================================================================
// Unit tests for capital::ObjectiveRanker and the playbook transform.
//
// Validates:
//   - The three scoring formulas and the PriorityBoost multiplier
//   - Ordering differs by objective for the same candidates
//   - Tie-break: higher confidence, then lexicographic symbol
//   - applyPlaybook() folds overrides onto the mandate defaults
// =============================================================================

#include "capital/allocation/objective_ranker.hpp"
#include "capital/allocation/playbook.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

namespace {

capital::domain::Signal makeSignal(const std::string& symbol, double edge,
                                   double confidence) {
  capital::domain::Signal s;
  s.id = "sig-" + symbol;
  s.symbol = symbol;
  s.edge_estimate = edge;
  s.confidence = confidence;
  s.horizon_days = 5;
  return s;
}

}  // namespace

class ObjectiveRankerTest : public ::testing::Test {
 protected:
  capital::ObjectiveRanker ranker;
};

// -----------------------------------------------------------------------------
// 1. Scores match the closed-form definitions.
// -----------------------------------------------------------------------------
TEST_F(ObjectiveRankerTest, ScoresFollowObjectiveFormulas) {
  const auto s = makeSignal("INFY", 4.0, 0.5);
  const double e = 0.04;
  const double c = 0.5;
  const double v = 0.02;

  const double max_profit = e * c / (1.0 + v);
  const double risk_min = c * c * std::sqrt(e) / (1.0 + 20.0 * v);

  EXPECT_NEAR(ranker.score(s, capital::domain::Objective::MaxProfit, v),
              max_profit, 1e-12);
  EXPECT_NEAR(ranker.score(s, capital::domain::Objective::RiskMinimized, v),
              risk_min, 1e-12);
  EXPECT_NEAR(ranker.score(s, capital::domain::Objective::Balanced, v),
              std::sqrt(max_profit * risk_min), 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Negative edge scores zero; a PriorityBoost multiplies the score.
// -----------------------------------------------------------------------------
TEST_F(ObjectiveRankerTest, NegativeEdgeAndPriorityBoost) {
  auto bearish = makeSignal("TCS", -3.0, 0.9);
  EXPECT_DOUBLE_EQ(
      ranker.score(bearish, capital::domain::Objective::MaxProfit, 0.01), 0.0);

  auto plain = makeSignal("INFY", 4.0, 0.5);
  auto boosted = plain;
  boosted.overrides.push_back(capital::domain::PriorityBoost{1.5});
  EXPECT_NEAR(ranker.score(boosted, capital::domain::Objective::MaxProfit, 0.01),
              1.5 * ranker.score(plain, capital::domain::Objective::MaxProfit,
                                 0.01),
              1e-12);
}

// -----------------------------------------------------------------------------
// 3. The objective changes the order.
// Why: a high-edge, volatile name should lead for MaxProfit but fall behind
//      a steady, high-confidence name for RiskMinimized.
// -----------------------------------------------------------------------------
TEST_F(ObjectiveRankerTest, ObjectiveChangesOrder) {
  std::vector<capital::RankedCandidate> candidates{
      {makeSignal("VOLATILE", 10.0, 0.6), 0.08, 0.0},
      {makeSignal("STEADY", 3.0, 0.9), 0.01, 0.0},
  };

  const auto by_profit =
      ranker.rank(candidates, capital::domain::Objective::MaxProfit);
  ASSERT_EQ(by_profit.size(), 2u);
  EXPECT_EQ(by_profit[0].signal.symbol, "VOLATILE");

  const auto by_risk =
      ranker.rank(candidates, capital::domain::Objective::RiskMinimized);
  EXPECT_EQ(by_risk[0].signal.symbol, "STEADY");
  EXPECT_GT(by_risk[0].score, by_risk[1].score);
}

// -----------------------------------------------------------------------------
// 4. Equal scores break ties by confidence, then symbol.
// -----------------------------------------------------------------------------
TEST_F(ObjectiveRankerTest, TiesBreakByConfidenceThenSymbol) {
  // Zero edge gives every candidate a score of exactly 0.
  std::vector<capital::RankedCandidate> candidates{
      {makeSignal("WIPRO", 0.0, 0.5), 0.0, 0.0},
      {makeSignal("HCL", 0.0, 0.5), 0.0, 0.0},
      {makeSignal("ZEEL", 0.0, 0.9), 0.0, 0.0},
  };

  const auto ranked =
      ranker.rank(candidates, capital::domain::Objective::Balanced);
  ASSERT_EQ(ranked.size(), 3u);
  EXPECT_EQ(ranked[0].signal.symbol, "ZEEL");
  EXPECT_EQ(ranked[1].signal.symbol, "HCL");
  EXPECT_EQ(ranked[2].signal.symbol, "WIPRO");
}

// -----------------------------------------------------------------------------
// 5. rank() never drops candidates.
// -----------------------------------------------------------------------------
TEST_F(ObjectiveRankerTest, RankNeverRejects) {
  std::vector<capital::RankedCandidate> candidates{
      {makeSignal("A", -5.0, 0.0), 0.5, 0.0},
      {makeSignal("B", 2.0, 0.3), 0.02, 0.0},
  };
  EXPECT_EQ(ranker.rank(candidates, capital::domain::Objective::MaxProfit)
                .size(),
            2u);
}

// -----------------------------------------------------------------------------
// 6. applyPlaybook(): mandate defaults, boosts compound, last override of a
//    kind wins.
// -----------------------------------------------------------------------------
TEST(PlaybookTest, OverridesFoldOntoMandateDefaults) {
  capital::domain::Mandate mandate;
  mandate.stop_loss_atr_multiplier = 1.5;
  mandate.take_profit_atr_multiplier = 3.0;

  auto signal = makeSignal("INFY", 4.0, 0.7);
  auto defaults = capital::applyPlaybook(signal, mandate);
  EXPECT_DOUBLE_EQ(defaults.priority_multiplier, 1.0);
  EXPECT_DOUBLE_EQ(defaults.stop_loss_atr_multiplier, 1.5);
  EXPECT_DOUBLE_EQ(defaults.take_profit_atr_multiplier, 3.0);
  EXPECT_TRUE(defaults.tranche_legs.empty());

  signal.overrides.push_back(capital::domain::PriorityBoost{2.0});
  signal.overrides.push_back(capital::domain::StopTargetOverride{1.0, 2.0});
  signal.overrides.push_back(capital::domain::PriorityBoost{1.5});
  signal.overrides.push_back(capital::domain::StopTargetOverride{2.5, 5.0});
  signal.overrides.push_back(
      capital::domain::TrancheSplit{{{50.0, 0}, {50.0, 2}}});

  const auto params = capital::applyPlaybook(signal, mandate);
  EXPECT_DOUBLE_EQ(params.priority_multiplier, 3.0);
  EXPECT_DOUBLE_EQ(capital::priorityMultiplier(signal), 3.0);
  EXPECT_DOUBLE_EQ(params.stop_loss_atr_multiplier, 2.5);
  EXPECT_DOUBLE_EQ(params.take_profit_atr_multiplier, 5.0);
  ASSERT_EQ(params.tranche_legs.size(), 2u);
  EXPECT_EQ(params.tranche_legs[1].delay_days, 2);
}
