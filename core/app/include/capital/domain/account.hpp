#pragma once

#include <string>

namespace capital {
namespace domain {

// -----------------------------------------------------------------------------
// Objective: what an account optimizes for when capital is scarce
// -----------------------------------------------------------------------------
// Drives the ObjectiveRanker's scoring function. It never rejects a signal by
// itself; it only decides the order in which eligible signals are sized.
// -----------------------------------------------------------------------------
enum class Objective {
  MaxProfit,
  RiskMinimized,
  Balanced,
};

// -----------------------------------------------------------------------------
// Account: capital state of one independent trading account
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of an account's capital buckets and trading status.
//
// @details
// The authoritative copy lives inside the Ledger, one entry per account,
// guarded by that account's mutex. Everything else in the engine works with
// value copies returned by Ledger::snapshot().
//
// Capital buckets:
//   available_cash  Free cash. The only bucket reserve() draws from.
//   reserved_cash   Earmarked for a pending TradeProposal (not yet filled).
//   deployed_cash   Cost basis of filled, still-open positions.
//
// total_capital is contributed capital: the opening deposit plus SIP
// contributions and transfers in, minus transfers out. P&L is tracked
// separately in realized_pnl so the conservation invariant reads:
//
//   available_cash + reserved_cash + deployed_cash
//       == total_capital + realized_pnl
//
// All three cash buckets are non-negative at all times.
//
// paused is set by the KillSwitchMonitor (or an operator HALT) and gates all
// new allocations for the account until a manual reset.
// -----------------------------------------------------------------------------
struct Account {
  std::string id;
  double total_capital{0.0};
  double available_cash{0.0};
  double reserved_cash{0.0};
  double deployed_cash{0.0};
  double realized_pnl{0.0};
  Objective objective{Objective::Balanced};
  bool paused{false};

  // Current equity before unrealized P&L.
  double equity() const { return total_capital + realized_pnl; }
};

const char* objectiveToString(Objective objective);

}  // namespace domain
}  // namespace capital
