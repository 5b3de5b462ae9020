#pragma once

#include "capital/domain/mandate.hpp"
#include "capital/domain/signal.hpp"

#include <vector>

namespace capital {

// -----------------------------------------------------------------------------
// SizingParameters: the knobs a signal's playbook overrides can turn
// -----------------------------------------------------------------------------
//   priority_multiplier  product of every PriorityBoost; scales the ranking
//                        score only, never the size
//   stop/take-profit     ATR multipliers; from the mandate unless a
//                        StopTargetOverride replaces them
//   tranche_legs         empty for a single lot; otherwise the legs of the
//                        last TrancheSplit
// -----------------------------------------------------------------------------
struct SizingParameters {
  double priority_multiplier{1.0};
  double stop_loss_atr_multiplier{2.0};
  double take_profit_atr_multiplier{4.0};
  std::vector<domain::TrancheLeg> tranche_legs;
};

// -----------------------------------------------------------------------------
// applyPlaybook(signal, mandate)
// -----------------------------------------------------------------------------
// @brief  Folds the signal's overrides over the mandate defaults.
//
// @details
// Pure transform: std::visit over each PlaybookOverride in list order.
// PriorityBoosts compound; for StopTargetOverride and TrancheSplit the last
// one wins. Assumes the overrides passed MandateFilter validation.
// -----------------------------------------------------------------------------
SizingParameters applyPlaybook(const domain::Signal& signal,
                               const domain::Mandate& mandate);

// Product of the signal's PriorityBoost multipliers (1.0 when none).
double priorityMultiplier(const domain::Signal& signal);

}  // namespace capital
