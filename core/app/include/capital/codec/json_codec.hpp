#pragma once

#include "capital/domain/account.hpp"
#include "capital/domain/capital_transaction.hpp"
#include "capital/domain/guardrail_result.hpp"
#include "capital/domain/kill_switch.hpp"
#include "capital/domain/mandate.hpp"
#include "capital/domain/market_snapshot.hpp"
#include "capital/domain/position.hpp"
#include "capital/domain/signal.hpp"
#include "capital/domain/trade_proposal.hpp"
#include "capital/events/event.hpp"
#include "capital/ledger/ledger.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace capital {

// -----------------------------------------------------------------------------
// JSON codec: the one place domain types meet the wire format
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json conversions for every message the engine receives
//         or emits, and for the configuration file's nested objects.
//
// @details
// Enum spellings are the domain *ToString() spellings (LONG, MAX_PROFIT,
// CRITICAL, ...). Parsers accept exactly those.
//
// Error contract:
//   Missing required keys and type mismatches throw nlohmann::json::exception
//   (out_of_range / type_error). Unknown enum spellings and out-of-range
//   values throw ConfigurationError. Callers at the transport edge catch
//   both, log, and drop the message.
//
// Inbound message types (the "type" field):
//   signal_batch  {timestamp_ms?, signals: [Signal...]}
//   market        MarketSnapshot fields at top level
//   pnl           {account_id, realized_daily_pnl, unrealized_pnl?}
//   fill          {proposal_id, filled_quantity, fill_price}
//   reject        {proposal_id, reason?}
//   close         {position_id, exit_price}
//   release_tranche {proposal_id, tranche_index}
//   unblock       {block_id}
//   heartbeat     {component_id?, status?}
//
// Outbound telemetry types:
//   trade_proposal, block_record, capital_transaction, kill_switch,
//   position_update
// -----------------------------------------------------------------------------

// --- Enum parsing --------------------------------------------------------------
domain::Objective parseObjective(const std::string& text);
domain::RiskPosture parseRiskPosture(const std::string& text);
domain::Direction parseDirection(const std::string& text);
domain::RegimeLevel parseRegimeLevel(const std::string& text);
domain::KillSwitchKind parseKillSwitchKind(const std::string& text);

// --- Domain → JSON -------------------------------------------------------------
nlohmann::json toJson(const domain::Account& account);
nlohmann::json toJson(const domain::Mandate& mandate);
nlohmann::json toJson(const domain::GuardrailResult& result);
nlohmann::json toJson(const domain::TradeProposal& proposal);
nlohmann::json toJson(const domain::BlockRecord& block);
nlohmann::json toJson(const domain::CapitalTransaction& transaction);
nlohmann::json toJson(const domain::KillSwitch& kill_switch);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const PortfolioSummary& summary);

// --- JSON → domain -------------------------------------------------------------
domain::Signal signalFromJson(const nlohmann::json& j);
domain::MarketSnapshot marketSnapshotFromJson(const nlohmann::json& j);

// Optional keys keep the Mandate defaults. account_id comes from the
// enclosing account object.
domain::Mandate mandateFromJson(const nlohmann::json& j,
                                const std::string& account_id);

domain::KillSwitch killSwitchFromJson(const nlohmann::json& j,
                                      const std::string& account_id);

// A carried-over OPEN position. quantity and entry_price must be positive;
// cost_basis is derived from them. Throws ConfigurationError.
domain::Position positionFromJson(const nlohmann::json& j,
                                  const std::string& account_id);

// --- Wire messages -------------------------------------------------------------

// Decodes one inbound collaborator message into an Event. Returns nullopt
// for an unrecognised "type". Throws as described above for malformed ones.
std::optional<Event> decodeInbound(const nlohmann::json& message);

// Serialises an outbound event for the telemetry PUB socket. Returns nullopt
// for inbound-only event types.
std::optional<std::string> encodeTelemetry(const Event& event);

}  // namespace capital
