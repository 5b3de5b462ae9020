#include "capital/risk/guardrail_checks.hpp"
#include "capital/time/time_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string>

namespace capital {

namespace {

using domain::CheckOutcome;
using domain::GuardrailCheck;
using domain::Severity;

// Limits are compared with a small relative tolerance so a quantity sized
// exactly to a limit does not fail on float rounding.
bool exceeds(double value, double limit) {
  return value > limit + std::abs(limit) * 1e-9;
}

CheckOutcome pass(GuardrailCheck check) {
  return CheckOutcome{check, Severity::Pass, "", ""};
}

CheckOutcome outcome(GuardrailCheck check, Severity severity, const char* code,
                     const std::string& message) {
  return CheckOutcome{check, severity, code, message};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Liquidity
// -----------------------------------------------------------------------------
CheckOutcome checkLiquidity(const GuardrailInput& in,
                            const domain::GuardrailLimits& limits) {
  const double adv = in.market.adv_value;
  if (!std::isfinite(adv) || adv <= 0.0) {
    return outcome(GuardrailCheck::Liquidity, Severity::Warning,
                   "INSUFFICIENT_VOLUME_DATA",
                   "No average daily value for " + in.signal.symbol);
  }

  const double cap = limits.max_adv_fraction * adv;
  if (exceeds(in.notional(), cap)) {
    std::ostringstream msg;
    msg << "Notional " << in.notional() << " exceeds "
        << limits.max_adv_fraction * 100.0 << "% of ADV (" << cap << ")";
    return outcome(GuardrailCheck::Liquidity, Severity::Critical,
                   "LIQUIDITY_BELOW_THRESHOLD", msg.str());
  }
  return pass(GuardrailCheck::Liquidity);
}

// -----------------------------------------------------------------------------
// 2. Position size risk
// -----------------------------------------------------------------------------
CheckOutcome checkPositionSizeRisk(const GuardrailInput& in,
                                   const domain::GuardrailLimits& /*limits*/) {
  const double capital = in.account.total_capital;
  const double risk = in.quantity * std::abs(in.entry_price - in.stop_loss);
  const double budget = in.mandate.max_risk_per_trade_pct / 100.0 * capital;

  if (capital <= 0.0 || exceeds(risk, budget)) {
    std::ostringstream msg;
    msg << "Risk " << risk << " exceeds " << in.mandate.max_risk_per_trade_pct
        << "% of capital (" << budget << ")";
    return outcome(GuardrailCheck::PositionSizeRisk, Severity::Critical,
                   "POSITION_SIZE_EXCEEDED", msg.str());
  }
  return pass(GuardrailCheck::PositionSizeRisk);
}

// -----------------------------------------------------------------------------
// 3. Sector exposure
// -----------------------------------------------------------------------------
CheckOutcome checkSectorExposure(const GuardrailInput& in,
                                 const domain::GuardrailLimits& limits) {
  if (in.signal.sector.empty()) {
    return outcome(GuardrailCheck::SectorExposure, Severity::Info,
                   "SECTOR_UNKNOWN",
                   "Sector not provided; exposure not checked");
  }

  const double limit_pct = in.mandate.max_sector_exposure_pct > 0.0
                               ? in.mandate.max_sector_exposure_pct
                               : limits.default_sector_exposure_pct;
  const double capital = in.account.total_capital;
  const double exposure = in.open_sector_notional + in.notional();
  const double limit = limit_pct / 100.0 * capital;

  if (capital <= 0.0 || exceeds(exposure, limit)) {
    std::ostringstream msg;
    msg << in.signal.sector << " exposure " << exposure << " exceeds "
        << limit_pct << "% of capital (" << limit << ")";
    return outcome(GuardrailCheck::SectorExposure, Severity::Critical,
                   "SECTOR_EXPOSURE_EXCEEDED", msg.str());
  }
  return pass(GuardrailCheck::SectorExposure);
}

// -----------------------------------------------------------------------------
// 4. Event window
// -----------------------------------------------------------------------------
CheckOutcome checkEventWindow(const GuardrailInput& in,
                              const domain::GuardrailLimits& limits) {
  const int days = in.mandate.earnings_blackout_days > 0
                       ? in.mandate.earnings_blackout_days
                       : limits.default_blackout_days;
  const std::int64_t window_ms = static_cast<std::int64_t>(days) * kMillisPerDay;

  for (std::int64_t event_ms : in.market.corporate_action_ms) {
    if (std::llabs(event_ms - in.now_ms) <= window_ms) {
      std::ostringstream msg;
      msg << "Corporate action for " << in.signal.symbol << " within "
          << days << " day(s)";
      return outcome(GuardrailCheck::EventWindow, Severity::Warning,
                     "EVENT_WINDOW_WARNING", msg.str());
    }
  }
  return pass(GuardrailCheck::EventWindow);
}

// -----------------------------------------------------------------------------
// 5. Regime compatibility
// -----------------------------------------------------------------------------
CheckOutcome checkRegime(const GuardrailInput& in,
                         const domain::GuardrailLimits& /*limits*/) {
  using domain::RegimeLevel;
  const RegimeLevel vol = in.market.volatility_regime;
  const RegimeLevel liq = in.market.liquidity_regime;

  if (vol == RegimeLevel::Unknown && liq == RegimeLevel::Unknown) {
    return outcome(GuardrailCheck::Regime, Severity::Info, "REGIME_UNKNOWN",
                   "No regime label available");
  }

  bool compatible = true;
  switch (in.mandate.risk_posture) {
    case domain::RiskPosture::Conservative:
      compatible = vol != RegimeLevel::High && liq != RegimeLevel::Low;
      break;
    case domain::RiskPosture::Moderate:
      compatible = liq != RegimeLevel::Low;
      break;
    case domain::RiskPosture::Aggressive:
      break;
  }

  if (!compatible) {
    std::ostringstream msg;
    msg << "Volatility " << domain::regimeLevelToString(vol) << ", liquidity "
        << domain::regimeLevelToString(liq) << " incompatible with "
        << domain::riskPostureToString(in.mandate.risk_posture) << " posture";
    return outcome(GuardrailCheck::Regime, Severity::Warning,
                   "REGIME_INCOMPATIBLE", msg.str());
  }
  return pass(GuardrailCheck::Regime);
}

// -----------------------------------------------------------------------------
// 6. Catalyst freshness
// -----------------------------------------------------------------------------
CheckOutcome checkCatalystFreshness(const GuardrailInput& in,
                                    const domain::GuardrailLimits& limits) {
  if (!in.signal.isEventDriven()) {
    return pass(GuardrailCheck::CatalystFreshness);
  }
  if (!in.market.catalyst_ms) {
    return outcome(GuardrailCheck::CatalystFreshness, Severity::Warning,
                   "CATALYST_UNDATED",
                   "Event-driven signal " + in.signal.id +
                       " has no catalyst timestamp");
  }

  const double age_hours =
      static_cast<double>(in.now_ms - *in.market.catalyst_ms) /
      static_cast<double>(kMillisPerHour);
  if (age_hours > limits.catalyst_freshness_hours) {
    std::ostringstream msg;
    msg << "Catalyst is " << age_hours << "h old (limit "
        << limits.catalyst_freshness_hours << "h)";
    return outcome(GuardrailCheck::CatalystFreshness, Severity::Critical,
                   "CATALYST_STALE", msg.str());
  }
  return pass(GuardrailCheck::CatalystFreshness);
}

const std::array<GuardrailCheckFn, domain::kGuardrailCheckCount>&
guardrailChecks() {
  static const std::array<GuardrailCheckFn, domain::kGuardrailCheckCount>
      checks = {
          &checkLiquidity,   &checkPositionSizeRisk, &checkSectorExposure,
          &checkEventWindow, &checkRegime,           &checkCatalystFreshness,
      };
  return checks;
}

// -----------------------------------------------------------------------------
// reduceOutcomes
// -----------------------------------------------------------------------------
domain::GuardrailResult reduceOutcomes(
    const std::array<CheckOutcome, domain::kGuardrailCheckCount>& outcomes) {
  domain::GuardrailResult result;
  bool any_warning = false;

  for (const auto& o : outcomes) {
    result.checks[static_cast<std::size_t>(o.check)] = o.passed();
    if (o.severity == Severity::Pass) {
      continue;
    }
    result.warnings.push_back(
        domain::GuardrailWarning{o.check, o.severity, o.code, o.message});
    if (o.severity == Severity::Critical) {
      result.has_critical_failure = true;
    } else if (o.severity == Severity::Warning) {
      any_warning = true;
    }
  }

  result.passed_all = !result.has_critical_failure && !any_warning;
  return result;
}

}  // namespace capital
