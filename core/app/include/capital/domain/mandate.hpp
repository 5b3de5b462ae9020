#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace capital {
namespace domain {

// -----------------------------------------------------------------------------
// PositionSizeLimit: cap on a single position's notional
// -----------------------------------------------------------------------------
// Either an absolute currency amount or a percentage of the account's total
// capital. resolve() turns it into a currency figure for a given capital.
// -----------------------------------------------------------------------------
struct PositionSizeLimit {
  enum class Kind { Absolute, PercentOfCapital };

  Kind kind{Kind::PercentOfCapital};
  double value{10.0};

  double resolve(double total_capital) const {
    return kind == Kind::Absolute ? value : total_capital * value / 100.0;
  }
};

// -----------------------------------------------------------------------------
// RiskPosture: how much market turbulence a mandate tolerates
// -----------------------------------------------------------------------------
// Consulted by the regime guardrail. A conservative mandate is incompatible
// with high-volatility or thin-liquidity regimes; an aggressive one accepts
// any regime.
// -----------------------------------------------------------------------------
enum class RiskPosture {
  Conservative,
  Moderate,
  Aggressive,
};

// -----------------------------------------------------------------------------
// Mandate: the rule set governing what one account may trade
// -----------------------------------------------------------------------------
//
// @brief  Immutable, versioned trading rules for a single account.
//
// @details
// Mandates are never edited in place. MandateStore::publish() appends a new
// version and the previous ones remain available for audit and replay. The
// current mandate is the one with the highest version number.
//
// Percent fields are expressed in percent (2.0 means 2%), matching how
// operators write them in the configuration file.
//
// Empty allowed_sectors / allowed_strategies mean "unrestricted".
// banned_sectors always wins over allowed_sectors.
// -----------------------------------------------------------------------------
struct Mandate {
  std::string account_id;
  std::uint32_t version{0};  // Assigned by MandateStore on publish

  // Holding period window, inclusive on both ends.
  int min_horizon_days{1};
  int max_horizon_days{30};

  std::set<std::string> allowed_sectors;
  std::set<std::string> banned_sectors;
  std::set<std::string> allowed_strategies;

  PositionSizeLimit max_position_size;
  double max_risk_per_trade_pct{2.0};
  double max_sector_exposure_pct{30.0};

  // ATR multipliers used when a signal carries no explicit stop/target.
  double stop_loss_atr_multiplier{2.0};
  double take_profit_atr_multiplier{4.0};

  // Maximum simultaneously OPEN positions. 0 disables the limit.
  int max_open_positions{0};

  // Blackout window for the event guardrail. 0 uses the engine default.
  int earnings_blackout_days{0};

  RiskPosture risk_posture{RiskPosture::Moderate};
};

const char* riskPostureToString(RiskPosture posture);

}  // namespace domain
}  // namespace capital
