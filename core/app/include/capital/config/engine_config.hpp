#pragma once

#include "capital/config/configuration_error.hpp"
#include "capital/domain/account.hpp"
#include "capital/domain/kill_switch.hpp"
#include "capital/domain/mandate.hpp"
#include "capital/domain/position.hpp"
#include "capital/domain/risk_limits.hpp"

#include <string>
#include <vector>

namespace capital {

// ZeroMQ endpoints. enabled == false runs the engine without any sockets
// (tests, embedding).
struct EndpointConfig {
  bool enabled{true};
  std::string signal_feed{"tcp://127.0.0.1:5555"};
  std::string command{"tcp://127.0.0.1:5556"};
  std::string telemetry{"tcp://127.0.0.1:5557"};
};

// One account to open at startup. The engine-wide default kill switches are
// installed in addition to kill_switches.
//
// positions are OPEN positions carried over from a previous session. They
// are funded out of initial_capital: the engine reserves and deploys each
// one's cost basis right after the opening DEPOSIT, so closing them later
// returns the capital like any other position.
struct AccountConfig {
  std::string id;
  domain::Objective objective{domain::Objective::Balanced};
  double initial_capital{0.0};
  domain::Mandate mandate;
  std::vector<domain::KillSwitch> kill_switches;
  std::vector<domain::Position> positions;
};

// -----------------------------------------------------------------------------
// EngineConfig: everything the capital_guard process needs at startup
// -----------------------------------------------------------------------------
//
// @brief  Parsed from a JSON file with nlohmann::json. Every section is
//         optional; omitted values keep the defaults declared on the limit
//         structs.
//
// @details
// Layout:
//   {
//     "clock": "live" | "simulation",
//     "guardrails": { max_adv_fraction, adv_lookback_days,
//                     default_blackout_days, catalyst_freshness_hours,
//                     default_sector_exposure_pct, block_on_warning },
//     "sizing":     { kelly_cap, assumed_variance, default_atr_fraction,
//                     whole_units },
//     "treasury":   { emergency_buffer_pct, reservation_ttl_ms,
//                     max_proposals_per_batch },
//     "endpoints":  { enabled, signal_feed, command, telemetry },
//     "default_kill_switches": [ {kind, threshold_type, threshold} ],
//     "accounts": [ { id, objective, initial_capital,
//                     mandate: {...}, kill_switches: [...],
//                     positions: [ {symbol, sector, direction, quantity,
//                                   entry_price, stop_loss, take_profit} ] } ]
//   }
//
// Validation here covers the engine-wide limits and account list shape.
// Mandates are validated again by MandateStore::publish(), kill switches by
// KillSwitchMonitor::addSwitch(), capital by Ledger::openAccount().
// -----------------------------------------------------------------------------
struct EngineConfig {
  bool simulation_clock{false};

  domain::GuardrailLimits guardrails;
  domain::SizingLimits sizing;
  domain::TreasuryLimits treasury;
  EndpointConfig endpoints;

  std::vector<domain::KillSwitch> default_kill_switches;  // account_id empty
  std::vector<AccountConfig> accounts;
};

// Parses and validates a configuration document. Throws ConfigurationError,
// including for JSON syntax and type errors.
EngineConfig parseEngineConfig(const std::string& json_text);

// Reads path and calls parseEngineConfig(). Throws ConfigurationError when
// the file cannot be opened.
EngineConfig loadEngineConfig(const std::string& path);

// Throws ConfigurationError when an engine-wide limit is out of range.
void validateLimits(const EngineConfig& config);

}  // namespace capital
