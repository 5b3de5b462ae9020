#include "capital/risk/kill_switch_monitor.hpp"
#include "capital/config/configuration_error.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace capital {

KillSwitchMonitor::KillSwitchMonitor(Ledger& ledger,
                                     const ITimeProvider& clock)
    : ledger_(ledger), clock_(clock) {}

// -----------------------------------------------------------------------------
// addSwitch
// -----------------------------------------------------------------------------
void KillSwitchMonitor::addSwitch(const domain::KillSwitch& kill_switch) {
  if (!ledger_.hasAccount(kill_switch.account_id)) {
    throw ConfigurationError("kill switch for unknown account " +
                             kill_switch.account_id);
  }
  if (!std::isfinite(kill_switch.threshold) || kill_switch.threshold >= 0.0) {
    throw ConfigurationError("kill switch for " + kill_switch.account_id +
                             ": threshold must be negative");
  }

  std::lock_guard lock(mutex_);
  auto& watch = watches_[kill_switch.account_id];
  domain::KillSwitch sw = kill_switch;
  sw.tripped = false;
  sw.tripped_at_ms = 0;
  sw.tripped_value = 0.0;
  watch.switches.push_back(sw);
}

// -----------------------------------------------------------------------------
// onPnlUpdate: compute metrics, trip breached switches, pause the account
// -----------------------------------------------------------------------------
std::vector<domain::KillSwitch> KillSwitchMonitor::onPnlUpdate(
    const std::string& account_id, double realized_daily_pnl,
    double unrealized_pnl) {
  std::vector<domain::KillSwitch> tripped;

  const auto account = ledger_.snapshot(account_id);
  if (!account) {
    std::cerr << "[KillSwitchMonitor] WARNING: P&L update for unknown account "
              << account_id << "\n";
    return tripped;
  }

  std::lock_guard lock(mutex_);
  auto& watch = watches_[account_id];

  const double equity = account->equity() + unrealized_pnl;
  if (!watch.seeded) {
    watch.peak_equity = std::max(account->equity(), equity);
    watch.seeded = true;
  }
  watch.peak_equity = std::max(watch.peak_equity, equity);
  watch.last_equity = equity;

  const double drawdown = equity - watch.peak_equity;
  const double capital = account->total_capital;

  for (auto& sw : watch.switches) {
    if (sw.tripped) {
      continue;
    }
    const double metric = sw.kind == domain::KillSwitchKind::MaxDailyLoss
                              ? realized_daily_pnl
                              : drawdown;
    double measured = metric;
    if (sw.threshold_type == domain::KillSwitch::ThresholdType::PercentOfCapital) {
      measured = capital > 0.0 ? metric / capital * 100.0 : 0.0;
    }
    if (measured > sw.threshold) {
      continue;
    }

    sw.tripped = true;
    sw.tripped_at_ms = clock_.now_ms();
    sw.tripped_value = metric;
    tripped.push_back(sw);

    std::cerr << "[KillSwitchMonitor] CRITICAL: "
              << domain::killSwitchKindToString(sw.kind) << " tripped for "
              << account_id << " (value=" << metric
              << ", threshold=" << sw.threshold << "). ACCOUNT PAUSED.\n";
  }

  if (!tripped.empty()) {
    ledger_.setPaused(account_id, true);
  }
  return tripped;
}

// -----------------------------------------------------------------------------
// reset: manual, clears switches and pause
// -----------------------------------------------------------------------------
std::vector<domain::KillSwitch> KillSwitchMonitor::reset(
    const std::string& account_id) {
  std::vector<domain::KillSwitch> cleared;
  std::lock_guard lock(mutex_);
  auto it = watches_.find(account_id);
  if (it != watches_.end()) {
    for (auto& sw : it->second.switches) {
      if (sw.tripped) {
        sw.tripped = false;
        sw.tripped_at_ms = 0;
        sw.tripped_value = 0.0;
        cleared.push_back(sw);
      }
    }
    it->second.peak_equity = it->second.last_equity;
  }
  ledger_.setPaused(account_id, false);

  std::cout << "[KillSwitchMonitor] Reset " << account_id << " ("
            << cleared.size() << " switch(es) cleared)\n";
  return cleared;
}

void KillSwitchMonitor::pause(const std::string& account_id) {
  std::lock_guard lock(mutex_);
  ledger_.setPaused(account_id, true);
  std::cerr << "[KillSwitchMonitor] Operator HALT for " << account_id << "\n";
}

bool KillSwitchMonitor::isPaused(const std::string& account_id) const {
  const auto account = ledger_.snapshot(account_id);
  return account && account->paused;
}

std::vector<domain::KillSwitch> KillSwitchMonitor::switches(
    const std::string& account_id) const {
  std::lock_guard lock(mutex_);
  auto it = watches_.find(account_id);
  if (it == watches_.end()) {
    return {};
  }
  return it->second.switches;
}

double KillSwitchMonitor::peakEquity(const std::string& account_id) const {
  std::lock_guard lock(mutex_);
  auto it = watches_.find(account_id);
  return it == watches_.end() ? 0.0 : it->second.peak_equity;
}

}  // namespace capital
