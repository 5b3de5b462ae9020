#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace capital {
namespace domain {

enum class Direction {
  Long,
  Short,
};

// -----------------------------------------------------------------------------
// Playbook overrides
// -----------------------------------------------------------------------------
// An event playbook can adjust how a signal is ranked and sized. Each kind of
// adjustment is its own plain struct and a signal carries a list of them as a
// tagged variant. They are applied by applyPlaybook() as a pure transform on
// the sizing parameters before the PositionSizer runs; nothing downstream
// inspects the raw overrides.
// -----------------------------------------------------------------------------

// Multiplies the signal's ranking score (e.g. 1.5 for a buyback playbook).
struct PriorityBoost {
  double multiplier{1.0};
};

// Replaces the mandate's ATR multipliers for stop-loss and take-profit.
struct StopTargetOverride {
  double stop_loss_atr_multiplier{2.0};
  double take_profit_atr_multiplier{4.0};
};

// Staged deployment: each leg is a share of the total quantity plus the
// number of days to wait before it may be released.
struct TrancheLeg {
  double percent{100.0};
  int delay_days{0};
};

struct TrancheSplit {
  std::vector<TrancheLeg> legs;
};

using PlaybookOverride =
    std::variant<PriorityBoost, StopTargetOverride, TrancheSplit>;

// -----------------------------------------------------------------------------
// Signal: a ranked trading idea from the signal generator
// -----------------------------------------------------------------------------
//
// @brief  Immutable description of a trade opportunity.
//
// @details
// edge_estimate is the expected move in percent (4.0 means +4%).
// confidence is in [0, 1]; signals outside that range never pass the
// MandateFilter.
//
// event_id marks an event-driven (hot-path) signal. Those signals are subject
// to the catalyst freshness guardrail.
//
// entry_price / stop_loss / take_profit are optional hints. When absent the
// PositionSizer uses the market price and the ATR multipliers.
// -----------------------------------------------------------------------------
struct Signal {
  std::string id;
  std::string symbol;
  Direction direction{Direction::Long};
  double edge_estimate{0.0};
  double confidence{0.0};
  int horizon_days{0};
  std::string sector;
  std::string strategy;

  std::optional<std::string> event_id;

  std::optional<double> entry_price;
  std::optional<double> stop_loss;
  std::optional<double> take_profit;

  std::vector<PlaybookOverride> overrides;

  bool isEventDriven() const { return event_id.has_value(); }
};

const char* directionToString(Direction direction);

}  // namespace domain
}  // namespace capital
