#include "capital/allocation/mandate_filter.hpp"

#include <cmath>
#include <type_traits>
#include <variant>

namespace capital {

namespace {

bool positiveFinite(double value) {
  return std::isfinite(value) && value > 0.0;
}

// A malformed override is treated like a malformed signal: it never reaches
// the sizer.
bool overridesWellFormed(const domain::Signal& signal) {
  for (const auto& override_ : signal.overrides) {
    const bool ok = std::visit(
        [](const auto& o) -> bool {
          using T = std::decay_t<decltype(o)>;
          if constexpr (std::is_same_v<T, domain::PriorityBoost>) {
            return positiveFinite(o.multiplier);
          } else if constexpr (std::is_same_v<T, domain::StopTargetOverride>) {
            return positiveFinite(o.stop_loss_atr_multiplier) &&
                   positiveFinite(o.take_profit_atr_multiplier);
          } else {
            if (o.legs.empty()) {
              return false;
            }
            double total = 0.0;
            for (const auto& leg : o.legs) {
              if (!positiveFinite(leg.percent) || leg.delay_days < 0) {
                return false;
              }
              total += leg.percent;
            }
            return total <= 100.0 + 1e-9;
          }
        },
        override_);
    if (!ok) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool MandateFilter::eligible(const domain::Signal& signal,
                             const domain::Mandate& mandate,
                             const domain::Account& account) const {
  return evaluate(signal, mandate, account).eligible;
}

// -----------------------------------------------------------------------------
// evaluate: first failing rule wins
// -----------------------------------------------------------------------------
FilterVerdict MandateFilter::evaluate(const domain::Signal& signal,
                                      const domain::Mandate& mandate,
                                      const domain::Account& account) const {
  auto reject = [](const char* reason) { return FilterVerdict{false, reason}; };

  if (account.paused) {
    return reject("ACCOUNT_PAUSED");
  }
  if (signal.id.empty() || signal.symbol.empty() ||
      !std::isfinite(signal.edge_estimate) ||
      signal.horizon_days < 0) {
    return reject("INVALID_SIGNAL");
  }
  if (!std::isfinite(signal.confidence) || signal.confidence < 0.0 ||
      signal.confidence > 1.0) {
    return reject("INVALID_CONFIDENCE");
  }
  if (!overridesWellFormed(signal)) {
    return reject("INVALID_OVERRIDE");
  }
  if (signal.horizon_days < mandate.min_horizon_days ||
      signal.horizon_days > mandate.max_horizon_days) {
    return reject("HORIZON_OUT_OF_RANGE");
  }
  if (mandate.banned_sectors.count(signal.sector) != 0) {
    return reject("SECTOR_BANNED");
  }
  if (!mandate.allowed_sectors.empty() &&
      mandate.allowed_sectors.count(signal.sector) == 0) {
    return reject("SECTOR_NOT_ALLOWED");
  }
  if (!mandate.allowed_strategies.empty() &&
      mandate.allowed_strategies.count(signal.strategy) == 0) {
    return reject("STRATEGY_NOT_ALLOWED");
  }
  return FilterVerdict{};
}

}  // namespace capital
