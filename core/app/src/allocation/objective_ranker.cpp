#include "capital/allocation/objective_ranker.hpp"
#include "capital/allocation/playbook.hpp"

#include <algorithm>
#include <cmath>

namespace capital {

namespace {

constexpr double kMaxProfitVolPenalty = 1.0;
constexpr double kRiskMinimizedVolPenalty = 20.0;

double maxProfitScore(double e, double c, double v) {
  return e * c / (1.0 + kMaxProfitVolPenalty * v);
}

double riskMinimizedScore(double e, double c, double v) {
  return c * c * std::sqrt(e) / (1.0 + kRiskMinimizedVolPenalty * v);
}

}  // namespace

double ObjectiveRanker::score(const domain::Signal& signal,
                              domain::Objective objective,
                              double volatility) const {
  const double e = std::max(signal.edge_estimate, 0.0) / 100.0;
  const double c = signal.confidence;
  const double v = std::max(volatility, 0.0);

  double base = 0.0;
  switch (objective) {
    case domain::Objective::MaxProfit:
      base = maxProfitScore(e, c, v);
      break;
    case domain::Objective::RiskMinimized:
      base = riskMinimizedScore(e, c, v);
      break;
    case domain::Objective::Balanced:
      base = std::sqrt(maxProfitScore(e, c, v) * riskMinimizedScore(e, c, v));
      break;
  }
  return base * priorityMultiplier(signal);
}

// -----------------------------------------------------------------------------
// rank: score, then stable deterministic sort
// -----------------------------------------------------------------------------
std::vector<RankedCandidate> ObjectiveRanker::rank(
    std::vector<RankedCandidate> candidates,
    domain::Objective objective) const {
  for (auto& candidate : candidates) {
    candidate.score = score(candidate.signal, objective, candidate.volatility);
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const RankedCandidate& a, const RankedCandidate& b) {
                     if (a.score != b.score) {
                       return a.score > b.score;
                     }
                     if (a.signal.confidence != b.signal.confidence) {
                       return a.signal.confidence > b.signal.confidence;
                     }
                     return a.signal.symbol < b.signal.symbol;
                   });
  return candidates;
}

}  // namespace capital
