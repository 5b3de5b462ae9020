#pragma once

#include "capital/domain/account.hpp"
#include "capital/domain/guardrail_result.hpp"
#include "capital/domain/mandate.hpp"
#include "capital/domain/market_snapshot.hpp"
#include "capital/domain/risk_limits.hpp"
#include "capital/domain/signal.hpp"

#include <array>
#include <cstdint>

namespace capital {

// -----------------------------------------------------------------------------
// GuardrailInput: everything one evaluation may look at
// -----------------------------------------------------------------------------
// Gathered by the AllocationEngine under the account's allocation lock, so
// open_sector_notional is consistent with the reservation that follows.
// The referenced objects must outlive the evaluation.
// -----------------------------------------------------------------------------
struct GuardrailInput {
  const domain::Signal& signal;
  const domain::Mandate& mandate;
  const domain::Account& account;
  const domain::MarketSnapshot& market;

  double quantity{0.0};  // total planned across tranches
  double entry_price{0.0};
  double stop_loss{0.0};

  double open_sector_notional{0.0};  // OPEN positions in signal.sector
  std::int64_t now_ms{0};

  double notional() const { return quantity * entry_price; }
};

// Uniform shape of every check: pure, no I/O, never throws for bad data
// (bad data is a Warning or Critical outcome).
using GuardrailCheckFn = domain::CheckOutcome (*)(const GuardrailInput&,
                                                  const domain::GuardrailLimits&);

// -----------------------------------------------------------------------------
// The six checks
// -----------------------------------------------------------------------------
//
// checkLiquidity
//   ADV missing or zero                    WARNING  INSUFFICIENT_VOLUME_DATA
//   notional > max_adv_fraction * ADV       CRITICAL LIQUIDITY_BELOW_THRESHOLD
//
// checkPositionSizeRisk
//   qty * |entry - stop| > max_risk% of total capital
//                                           CRITICAL POSITION_SIZE_EXCEEDED
//
// checkSectorExposure
//   sector empty                            INFO     SECTOR_UNKNOWN
//   (open sector notional + notional) / capital > max_sector%
//                                           CRITICAL SECTOR_EXPOSURE_EXCEEDED
//
// checkEventWindow
//   corporate action within +/- blackout days of now
//                                           WARNING  EVENT_WINDOW_WARNING
//
// checkRegime
//   volatility and liquidity labels both unknown
//                                           INFO     REGIME_UNKNOWN
//   labels incompatible with the mandate's risk posture
//                                           WARNING  REGIME_INCOMPATIBLE
//     CONSERVATIVE  rejects HIGH volatility or LOW liquidity
//     MODERATE      rejects LOW liquidity
//     AGGRESSIVE    accepts everything
//
// checkCatalystFreshness (event-driven signals only)
//   no catalyst timestamp                   WARNING  CATALYST_UNDATED
//   catalyst older than freshness hours     CRITICAL CATALYST_STALE
// -----------------------------------------------------------------------------
domain::CheckOutcome checkLiquidity(const GuardrailInput& in,
                                    const domain::GuardrailLimits& limits);
domain::CheckOutcome checkPositionSizeRisk(const GuardrailInput& in,
                                           const domain::GuardrailLimits& limits);
domain::CheckOutcome checkSectorExposure(const GuardrailInput& in,
                                         const domain::GuardrailLimits& limits);
domain::CheckOutcome checkEventWindow(const GuardrailInput& in,
                                      const domain::GuardrailLimits& limits);
domain::CheckOutcome checkRegime(const GuardrailInput& in,
                                 const domain::GuardrailLimits& limits);
domain::CheckOutcome checkCatalystFreshness(
    const GuardrailInput& in, const domain::GuardrailLimits& limits);

// The checks in GuardrailCheck order.
const std::array<GuardrailCheckFn, domain::kGuardrailCheckCount>&
guardrailChecks();

// -----------------------------------------------------------------------------
// reduceOutcomes(outcomes)
// -----------------------------------------------------------------------------
// @brief  Folds six outcomes into a GuardrailResult.
//
// @details
//   checks[i]             outcome i passed (PASS or INFO)
//   warnings              every non-PASS outcome, in check order
//   has_critical_failure  any CRITICAL
//   passed_all            no WARNING and no CRITICAL
//
// Identity fields and timing are left for the caller.
// -----------------------------------------------------------------------------
domain::GuardrailResult reduceOutcomes(
    const std::array<domain::CheckOutcome, domain::kGuardrailCheckCount>&
        outcomes);

}  // namespace capital
