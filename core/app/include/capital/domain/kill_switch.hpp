#pragma once

#include <cstdint>
#include <string>

namespace capital {
namespace domain {

enum class KillSwitchKind {
  MaxDailyLoss,
  MaxDrawdown,
};

// -----------------------------------------------------------------------------
// KillSwitch: a loss limit that pauses an account when breached
// -----------------------------------------------------------------------------
//
// @brief  Per-account threshold on daily loss or drawdown.
//
// @details
// threshold is a NEGATIVE number. With ThresholdType::Absolute it is a
// currency amount (-5000 means "trip at a loss of 5,000 or worse"); with
// ThresholdType::PercentOfCapital it is a percentage of the account's total
// capital (-5.0 means "trip at a 5% loss or worse").
//
// Lifecycle: created at account setup, evaluated on every P&L update, and
// once tripped it stays tripped until KillSwitchMonitor::reset(). It never
// auto-clears.
// -----------------------------------------------------------------------------
struct KillSwitch {
  enum class ThresholdType { Absolute, PercentOfCapital };

  std::string account_id;
  KillSwitchKind kind{KillSwitchKind::MaxDailyLoss};
  ThresholdType threshold_type{ThresholdType::Absolute};
  double threshold{0.0};
  bool tripped{false};
  std::int64_t tripped_at_ms{0};
  double tripped_value{0.0};  // Metric value observed at the breach
};

const char* killSwitchKindToString(KillSwitchKind kind);

}  // namespace domain
}  // namespace capital
