#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace capital {
namespace domain {

// -----------------------------------------------------------------------------
// Severity: outcome class of one guardrail check
// -----------------------------------------------------------------------------
//   Pass      Nothing to report.
//   Info      Observation only (e.g. no regime label). Never affects
//             passed_all.
//   Warning   Surfaced to the approver; does not block by default.
//   Critical  Blocks the reservation.
// -----------------------------------------------------------------------------
enum class Severity {
  Pass,
  Info,
  Warning,
  Critical,
};

// The six pre-trade checks, in evaluation order. The numeric value indexes
// GuardrailResult::checks.
enum class GuardrailCheck : std::size_t {
  Liquidity = 0,
  PositionSizeRisk = 1,
  SectorExposure = 2,
  EventWindow = 3,
  Regime = 4,
  CatalystFreshness = 5,
};

constexpr std::size_t kGuardrailCheckCount = 6;

// -----------------------------------------------------------------------------
// CheckOutcome: uniform return contract of every guardrail function
// -----------------------------------------------------------------------------
struct CheckOutcome {
  GuardrailCheck check{GuardrailCheck::Liquidity};
  Severity severity{Severity::Pass};
  std::string code;     // Machine-readable, e.g. "LIQUIDITY_BELOW_THRESHOLD"
  std::string message;  // Human-readable detail

  bool passed() const {
    return severity == Severity::Pass || severity == Severity::Info;
  }
};

// One entry of GuardrailResult::warnings: a non-Pass outcome.
struct GuardrailWarning {
  GuardrailCheck check{GuardrailCheck::Liquidity};
  Severity severity{Severity::Warning};
  std::string code;
  std::string message;
};

// -----------------------------------------------------------------------------
// GuardrailResult: the full picture of one (signal, account) evaluation
// -----------------------------------------------------------------------------
//
// @brief  Write-once record produced by GuardrailEvaluator::evaluate().
//
// @details
// checks[i] is true when check i produced Pass or Info. warnings carries
// every non-Pass outcome (Info, Warning and Critical) in check order.
//
//   has_critical_failure  any check was Critical
//   passed_all            no check was Warning or Critical
//
// All six checks always run; the evaluator never short-circuits, so a
// blocked caller still sees every reason.
// -----------------------------------------------------------------------------
struct GuardrailResult {
  std::string account_id;
  std::string signal_id;
  std::string symbol;

  std::array<bool, kGuardrailCheckCount> checks{};
  std::vector<GuardrailWarning> warnings;

  bool passed_all{false};
  bool has_critical_failure{false};

  std::int64_t evaluated_at_ms{0};
  std::int64_t duration_us{0};

  bool check(GuardrailCheck c) const {
    return checks[static_cast<std::size_t>(c)];
  }

  bool hasWarningCode(const std::string& code) const {
    for (const auto& w : warnings) {
      if (w.code == code) {
        return true;
      }
    }
    return false;
  }
};

const char* severityToString(Severity severity);
const char* guardrailCheckToString(GuardrailCheck check);

}  // namespace domain
}  // namespace capital
