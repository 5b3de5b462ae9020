#pragma once

#include "capital/domain/kill_switch.hpp"
#include "capital/ledger/ledger.hpp"
#include "capital/time/i_time_provider.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace capital {

// -----------------------------------------------------------------------------
// KillSwitchMonitor: sticky per-account loss limits
// -----------------------------------------------------------------------------
//
// @brief  Watches P&L updates and pauses an account the moment one of its
//         kill switches is breached.
//
// @details
// Two metrics are computed on every update:
//
//   MAX_DAILY_LOSS  realized_daily_pnl as pushed by the P&L collaborator
//   MAX_DRAWDOWN    equity - peak_equity, where
//                   equity = total_capital + ledger realized P&L
//                            + unrealized_pnl
//                   and peak_equity is the highest equity seen so far
//
// Thresholds are negative. An ABSOLUTE switch trips when metric <=
// threshold; a PERCENT_OF_CAPITAL switch trips when
// metric / total_capital * 100 <= threshold.
//
// Tripping is sticky: the switch records tripped_at and tripped_value, the
// Ledger account is set paused, and nothing but reset() clears either. An
// already-tripped switch is not re-evaluated, so repeated bad updates do not
// produce repeated trips.
//
// pause() is the operator's HALT: it pauses the account without tripping a
// switch. reset() clears both.
//
// Thread model:
//   All methods lock mutex_. The Ledger is called with mutex_ held; the
//   Ledger never calls back into the monitor, so the order is fixed.
//
// Ownership: owned by the AllocationEngine; borrows its Ledger and clock.
// -----------------------------------------------------------------------------
class KillSwitchMonitor {
 public:
  KillSwitchMonitor(Ledger& ledger, const ITimeProvider& clock);

  KillSwitchMonitor(const KillSwitchMonitor&) = delete;
  KillSwitchMonitor& operator=(const KillSwitchMonitor&) = delete;

  // -------------------------------------------------------------------------
  // addSwitch(kill_switch)
  // -------------------------------------------------------------------------
  // @throws ConfigurationError  unknown account, or a threshold that is not
  //                             a negative finite number.
  // -------------------------------------------------------------------------
  void addSwitch(const domain::KillSwitch& kill_switch);

  // -------------------------------------------------------------------------
  // onPnlUpdate(account, realized_daily_pnl, unrealized_pnl)
  // -------------------------------------------------------------------------
  // @return The switches that tripped on this update (empty when none).
  // -------------------------------------------------------------------------
  std::vector<domain::KillSwitch> onPnlUpdate(const std::string& account_id,
                                              double realized_daily_pnl,
                                              double unrealized_pnl);

  // Clears every tripped switch for the account and unpauses it. The peak
  // used for drawdown restarts at the last observed equity. Returns the
  // switches that were cleared.
  std::vector<domain::KillSwitch> reset(const std::string& account_id);

  // Operator halt. Pauses without tripping a switch.
  void pause(const std::string& account_id);

  bool isPaused(const std::string& account_id) const;

  std::vector<domain::KillSwitch> switches(const std::string& account_id) const;

  double peakEquity(const std::string& account_id) const;

 private:
  struct AccountWatch {
    std::vector<domain::KillSwitch> switches;
    double peak_equity{0.0};
    double last_equity{0.0};
    bool seeded{false};
  };

  Ledger& ledger_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, AccountWatch> watches_;
};

}  // namespace capital
