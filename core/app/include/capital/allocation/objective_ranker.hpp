#pragma once

#include "capital/domain/account.hpp"
#include "capital/domain/signal.hpp"

#include <vector>

namespace capital {

// One signal awaiting ranking for an account. volatility is ATR / price from
// the latest MarketSnapshot (0 when unknown); score is filled in by rank().
struct RankedCandidate {
  domain::Signal signal;
  double volatility{0.0};
  double score{0.0};
};

// -----------------------------------------------------------------------------
// ObjectiveRanker: evaluation order of eligible signals per account
// -----------------------------------------------------------------------------
//
// @brief  Scores a signal under the account's objective and sorts by score.
//
// @details
// With e = max(edge_estimate, 0) / 100, c = confidence, v = volatility:
//
//   MAX_PROFIT      e * c / (1 + v)
//   RISK_MINIMIZED  c^2 * sqrt(e) / (1 + 20 v)
//   BALANCED        sqrt(MAX_PROFIT * RISK_MINIMIZED)
//
// and the result is multiplied by the signal's PriorityBoost overrides.
// MAX_PROFIT barely notices volatility; RISK_MINIMIZED squares confidence
// and dampens edge, then divides hard by volatility.
//
// Ranking decides which signals get first claim on scarce cash. It never
// rejects: rank() returns every candidate it was given.
//
// Ordering: score descending, then confidence descending, then symbol
// ascending. Deterministic for identical input.
// -----------------------------------------------------------------------------
class ObjectiveRanker {
 public:
  double score(const domain::Signal& signal, domain::Objective objective,
               double volatility) const;

  std::vector<RankedCandidate> rank(std::vector<RankedCandidate> candidates,
                                    domain::Objective objective) const;
};

}  // namespace capital
