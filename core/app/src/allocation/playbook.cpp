#include "capital/allocation/playbook.hpp"

#include <type_traits>
#include <variant>

namespace capital {

SizingParameters applyPlaybook(const domain::Signal& signal,
                               const domain::Mandate& mandate) {
  SizingParameters params;
  params.stop_loss_atr_multiplier = mandate.stop_loss_atr_multiplier;
  params.take_profit_atr_multiplier = mandate.take_profit_atr_multiplier;

  for (const auto& override_ : signal.overrides) {
    std::visit(
        [&params](const auto& o) {
          using T = std::decay_t<decltype(o)>;
          if constexpr (std::is_same_v<T, domain::PriorityBoost>) {
            params.priority_multiplier *= o.multiplier;
          } else if constexpr (std::is_same_v<T, domain::StopTargetOverride>) {
            params.stop_loss_atr_multiplier = o.stop_loss_atr_multiplier;
            params.take_profit_atr_multiplier = o.take_profit_atr_multiplier;
          } else if constexpr (std::is_same_v<T, domain::TrancheSplit>) {
            params.tranche_legs = o.legs;
          }
        },
        override_);
  }
  return params;
}

double priorityMultiplier(const domain::Signal& signal) {
  double multiplier = 1.0;
  for (const auto& override_ : signal.overrides) {
    if (const auto* boost = std::get_if<domain::PriorityBoost>(&override_)) {
      multiplier *= boost->multiplier;
    }
  }
  return multiplier;
}

}  // namespace capital
