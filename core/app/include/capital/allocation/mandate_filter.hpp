#pragma once

#include "capital/domain/account.hpp"
#include "capital/domain/mandate.hpp"
#include "capital/domain/signal.hpp"

#include <string>

namespace capital {

// Result of MandateFilter::evaluate(). reason is empty when eligible.
struct FilterVerdict {
  bool eligible{true};
  std::string reason;
};

// -----------------------------------------------------------------------------
// MandateFilter: does this signal belong in this account at all?
// -----------------------------------------------------------------------------
//
// @brief  Pure predicate over (signal, mandate, account). No state, no I/O.
//
// @details
// Checks run in a fixed order and evaluate() reports the first failure:
//
//   ACCOUNT_PAUSED         kill switch tripped or operator halt
//   INVALID_SIGNAL         empty symbol, non-finite edge, horizon < 0
//   INVALID_CONFIDENCE     confidence outside [0, 1]
//   INVALID_OVERRIDE       malformed playbook override (non-positive
//                          multiplier, tranche legs summing above 100%)
//   HORIZON_OUT_OF_RANGE   horizon_days outside [min, max] holding days
//   SECTOR_BANNED          sector in the mandate's banned list
//   SECTOR_NOT_ALLOWED     allowed list non-empty and sector not in it
//   STRATEGY_NOT_ALLOWED   allowed list non-empty and strategy not in it
//
// Paused comes first so a tripped account is turned away before any other
// work, and its log line says why.
//
// Thread-safety: stateless; any number of threads may call concurrently.
// -----------------------------------------------------------------------------
class MandateFilter {
 public:
  bool eligible(const domain::Signal& signal, const domain::Mandate& mandate,
                const domain::Account& account) const;

  FilterVerdict evaluate(const domain::Signal& signal,
                         const domain::Mandate& mandate,
                         const domain::Account& account) const;
};

}  // namespace capital
