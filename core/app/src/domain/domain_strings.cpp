#include "capital/domain/account.hpp"
#include "capital/domain/capital_transaction.hpp"
#include "capital/domain/guardrail_result.hpp"
#include "capital/domain/kill_switch.hpp"
#include "capital/domain/mandate.hpp"
#include "capital/domain/market_snapshot.hpp"
#include "capital/domain/signal.hpp"

namespace capital {
namespace domain {

// -----------------------------------------------------------------------------
// Enum → string helpers shared by logging, the JSON codec and the IPC server.
// The spellings are the wire spellings; JsonCodec parses the same strings.
// -----------------------------------------------------------------------------

const char* objectiveToString(Objective objective) {
  switch (objective) {
    case Objective::MaxProfit:     return "MAX_PROFIT";
    case Objective::RiskMinimized: return "RISK_MINIMIZED";
    case Objective::Balanced:      return "BALANCED";
  }
  return "UNKNOWN";
}

const char* riskPostureToString(RiskPosture posture) {
  switch (posture) {
    case RiskPosture::Conservative: return "CONSERVATIVE";
    case RiskPosture::Moderate:     return "MODERATE";
    case RiskPosture::Aggressive:   return "AGGRESSIVE";
  }
  return "UNKNOWN";
}

const char* directionToString(Direction direction) {
  switch (direction) {
    case Direction::Long:  return "LONG";
    case Direction::Short: return "SHORT";
  }
  return "UNKNOWN";
}

const char* regimeLevelToString(RegimeLevel level) {
  switch (level) {
    case RegimeLevel::Unknown: return "UNKNOWN";
    case RegimeLevel::Low:     return "LOW";
    case RegimeLevel::Medium:  return "MEDIUM";
    case RegimeLevel::High:    return "HIGH";
  }
  return "UNKNOWN";
}

const char* transactionTypeToString(TransactionType type) {
  using T = TransactionType;
  switch (type) {
    case T::Deposit:         return "DEPOSIT";
    case T::Reserve:         return "RESERVE";
    case T::Release:         return "RELEASE";
    case T::Deploy:          return "DEPLOY";
    case T::Return:          return "RETURN";
    case T::TransferIn:      return "TRANSFER_IN";
    case T::TransferOut:     return "TRANSFER_OUT";
    case T::SipContribution: return "SIP_CONTRIBUTION";
  }
  return "UNKNOWN";
}

const char* killSwitchKindToString(KillSwitchKind kind) {
  switch (kind) {
    case KillSwitchKind::MaxDailyLoss: return "MAX_DAILY_LOSS";
    case KillSwitchKind::MaxDrawdown:  return "MAX_DRAWDOWN";
  }
  return "UNKNOWN";
}

const char* severityToString(Severity severity) {
  switch (severity) {
    case Severity::Pass:     return "PASS";
    case Severity::Info:     return "INFO";
    case Severity::Warning:  return "WARNING";
    case Severity::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

const char* guardrailCheckToString(GuardrailCheck check) {
  using C = GuardrailCheck;
  switch (check) {
    case C::Liquidity:         return "liquidity";
    case C::PositionSizeRisk:  return "position_size";
    case C::SectorExposure:    return "sector_exposure";
    case C::EventWindow:       return "event_window";
    case C::Regime:            return "regime";
    case C::CatalystFreshness: return "catalyst_freshness";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace capital
