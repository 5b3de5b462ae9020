#include "capital/codec/json_codec.hpp"
#include "capital/config/configuration_error.hpp"
#include "capital/time/time_utils.hpp"

#include <chrono>
#include <set>
#include <vector>

namespace capital {

namespace {

using nlohmann::json;

template <typename T>
std::optional<T> optionalField(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

std::set<std::string> stringSet(const json& j, const char* key) {
  const auto values = j.value(key, std::vector<std::string>{});
  return std::set<std::string>(values.begin(), values.end());
}

Timestamp messageTime(const json& j) {
  if (auto ms = optionalField<std::int64_t>(j, "timestamp_ms")) {
    return ms_to_timestamp(*ms);
  }
  return std::chrono::system_clock::now();
}

[[noreturn]] void unknownValue(const char* what, const std::string& text) {
  throw ConfigurationError(std::string("unknown ") + what + " '" + text + "'");
}

domain::PlaybookOverride overrideFromJson(const json& j) {
  const auto kind = j.at("kind").get<std::string>();
  if (kind == "priority_boost") {
    return domain::PriorityBoost{j.at("multiplier").get<double>()};
  }
  if (kind == "stop_target") {
    domain::StopTargetOverride o;
    o.stop_loss_atr_multiplier = j.at("stop_loss_atr_multiplier").get<double>();
    o.take_profit_atr_multiplier =
        j.at("take_profit_atr_multiplier").get<double>();
    return o;
  }
  if (kind == "tranche_split") {
    domain::TrancheSplit split;
    for (const auto& leg : j.at("legs")) {
      split.legs.push_back(domain::TrancheLeg{leg.at("percent").get<double>(),
                                              leg.value("delay_days", 0)});
    }
    return split;
  }
  unknownValue("playbook override", kind);
}

const char* positionStatusToString(domain::PositionStatus status) {
  return status == domain::PositionStatus::Open ? "OPEN" : "CLOSED";
}

}  // namespace

// -----------------------------------------------------------------------------
// Enum parsing
// -----------------------------------------------------------------------------
domain::Objective parseObjective(const std::string& text) {
  if (text == "MAX_PROFIT") return domain::Objective::MaxProfit;
  if (text == "RISK_MINIMIZED") return domain::Objective::RiskMinimized;
  if (text == "BALANCED") return domain::Objective::Balanced;
  unknownValue("objective", text);
}

domain::RiskPosture parseRiskPosture(const std::string& text) {
  if (text == "CONSERVATIVE") return domain::RiskPosture::Conservative;
  if (text == "MODERATE") return domain::RiskPosture::Moderate;
  if (text == "AGGRESSIVE") return domain::RiskPosture::Aggressive;
  unknownValue("risk posture", text);
}

domain::Direction parseDirection(const std::string& text) {
  if (text == "LONG") return domain::Direction::Long;
  if (text == "SHORT") return domain::Direction::Short;
  unknownValue("direction", text);
}

domain::RegimeLevel parseRegimeLevel(const std::string& text) {
  if (text == "LOW") return domain::RegimeLevel::Low;
  if (text == "MEDIUM") return domain::RegimeLevel::Medium;
  if (text == "HIGH") return domain::RegimeLevel::High;
  if (text == "UNKNOWN" || text.empty()) return domain::RegimeLevel::Unknown;
  unknownValue("regime level", text);
}

domain::KillSwitchKind parseKillSwitchKind(const std::string& text) {
  if (text == "MAX_DAILY_LOSS") return domain::KillSwitchKind::MaxDailyLoss;
  if (text == "MAX_DRAWDOWN") return domain::KillSwitchKind::MaxDrawdown;
  unknownValue("kill switch kind", text);
}

// -----------------------------------------------------------------------------
// Domain → JSON
// -----------------------------------------------------------------------------
json toJson(const domain::Account& account) {
  json j;
  j["id"] = account.id;
  j["objective"] = domain::objectiveToString(account.objective);
  j["total_capital"] = account.total_capital;
  j["available_cash"] = account.available_cash;
  j["reserved_cash"] = account.reserved_cash;
  j["deployed_cash"] = account.deployed_cash;
  j["realized_pnl"] = account.realized_pnl;
  j["paused"] = account.paused;
  return j;
}

json toJson(const domain::Mandate& mandate) {
  json j;
  j["account_id"] = mandate.account_id;
  j["version"] = mandate.version;
  j["min_horizon_days"] = mandate.min_horizon_days;
  j["max_horizon_days"] = mandate.max_horizon_days;
  j["allowed_sectors"] = mandate.allowed_sectors;
  j["banned_sectors"] = mandate.banned_sectors;
  j["allowed_strategies"] = mandate.allowed_strategies;
  j["max_position_size"] = {
      {"type", mandate.max_position_size.kind ==
                       domain::PositionSizeLimit::Kind::Absolute
                   ? "ABSOLUTE"
                   : "PERCENT_OF_CAPITAL"},
      {"value", mandate.max_position_size.value}};
  j["max_risk_per_trade_pct"] = mandate.max_risk_per_trade_pct;
  j["max_sector_exposure_pct"] = mandate.max_sector_exposure_pct;
  j["stop_loss_atr_multiplier"] = mandate.stop_loss_atr_multiplier;
  j["take_profit_atr_multiplier"] = mandate.take_profit_atr_multiplier;
  j["max_open_positions"] = mandate.max_open_positions;
  j["earnings_blackout_days"] = mandate.earnings_blackout_days;
  j["risk_posture"] = domain::riskPostureToString(mandate.risk_posture);
  return j;
}

json toJson(const domain::GuardrailResult& result) {
  json checks;
  for (std::size_t i = 0; i < domain::kGuardrailCheckCount; ++i) {
    const auto check = static_cast<domain::GuardrailCheck>(i);
    checks[domain::guardrailCheckToString(check)] = result.checks[i];
  }

  json warnings = json::array();
  for (const auto& w : result.warnings) {
    warnings.push_back(json{{"check", domain::guardrailCheckToString(w.check)},
                        {"severity", domain::severityToString(w.severity)},
                        {"code", w.code},
                        {"message", w.message}});
  }

  json j;
  j["account_id"] = result.account_id;
  j["signal_id"] = result.signal_id;
  j["symbol"] = result.symbol;
  j["checks"] = checks;
  j["warnings"] = warnings;
  j["passed_all"] = result.passed_all;
  j["has_critical_failure"] = result.has_critical_failure;
  j["evaluated_at_ms"] = result.evaluated_at_ms;
  j["duration_us"] = result.duration_us;
  return j;
}

json toJson(const domain::TradeProposal& proposal) {
  json tranches = json::array();
  for (const auto& t : proposal.tranches) {
    tranches.push_back(json{{"quantity", t.quantity},
                        {"delay_days", t.delay_days},
                        {"release_condition", t.release_condition}});
  }

  json j;
  j["id"] = proposal.id;
  j["account_id"] = proposal.account_id;
  j["signal_id"] = proposal.signal_id;
  j["symbol"] = proposal.symbol;
  j["sector"] = proposal.sector;
  j["direction"] = domain::directionToString(proposal.direction);
  j["quantity"] = proposal.quantity;
  j["planned_quantity"] = proposal.planned_quantity;
  j["tranches"] = tranches;
  j["tranche_index"] = proposal.tranche_index;
  if (proposal.parent_id != 0) {
    j["parent_id"] = proposal.parent_id;
  }
  j["entry_price"] = proposal.entry_price;
  j["stop_loss"] = proposal.stop_loss;
  j["take_profit"] = proposal.take_profit;
  j["risk_amount"] = proposal.risk_amount;
  j["reward_amount"] = proposal.reward_amount;
  j["score"] = proposal.score;
  j["reserved_amount"] = proposal.reserved_amount;
  j["reservation_id"] = proposal.reservation_id;
  j["expires_at_ms"] = proposal.expires_at_ms;
  j["guardrails"] = toJson(proposal.guardrails);
  return j;
}

json toJson(const domain::BlockRecord& block) {
  json j;
  j["id"] = block.id;
  j["account_id"] = block.account_id;
  j["signal_id"] = block.signal_id;
  j["symbol"] = block.symbol;
  j["reason_codes"] = block.reason_codes;
  j["created_at_ms"] = block.created_at_ms;
  j["open"] = block.open;
  return j;
}

json toJson(const domain::CapitalTransaction& transaction) {
  json j;
  j["id"] = transaction.id;
  j["account_id"] = transaction.account_id;
  j["type"] = domain::transactionTypeToString(transaction.type);
  j["amount"] = transaction.amount;
  j["realized_pnl"] = transaction.realized_pnl;
  j["timestamp_ms"] = transaction.timestamp_ms;
  j["reference"] = transaction.reference;
  if (!transaction.linked_account_id.empty()) {
    j["linked_account_id"] = transaction.linked_account_id;
  }
  return j;
}

json toJson(const domain::KillSwitch& kill_switch) {
  json j;
  j["account_id"] = kill_switch.account_id;
  j["kind"] = domain::killSwitchKindToString(kill_switch.kind);
  j["threshold_type"] =
      kill_switch.threshold_type == domain::KillSwitch::ThresholdType::Absolute
          ? "ABSOLUTE"
          : "PERCENT_OF_CAPITAL";
  j["threshold"] = kill_switch.threshold;
  j["tripped"] = kill_switch.tripped;
  j["tripped_at_ms"] = kill_switch.tripped_at_ms;
  j["tripped_value"] = kill_switch.tripped_value;
  return j;
}

json toJson(const domain::Position& position) {
  json j;
  j["id"] = position.id;
  j["account_id"] = position.account_id;
  j["symbol"] = position.symbol;
  j["sector"] = position.sector;
  j["direction"] = domain::directionToString(position.direction);
  j["quantity"] = position.quantity;
  j["entry_price"] = position.entry_price;
  j["stop_loss"] = position.stop_loss;
  j["take_profit"] = position.take_profit;
  j["cost_basis"] = position.cost_basis;
  j["status"] = positionStatusToString(position.status);
  j["exit_price"] = position.exit_price;
  j["realized_pnl"] = position.realized_pnl;
  return j;
}

json toJson(const PortfolioSummary& summary) {
  json j;
  j["account_count"] = summary.account_count;
  j["paused_accounts"] = summary.paused_accounts;
  j["total_capital"] = summary.total_capital;
  j["available_cash"] = summary.available_cash;
  j["reserved_cash"] = summary.reserved_cash;
  j["deployed_cash"] = summary.deployed_cash;
  j["realized_pnl"] = summary.realized_pnl;
  j["utilization_pct"] = summary.utilization_pct;
  return j;
}

// -----------------------------------------------------------------------------
// JSON → domain
// -----------------------------------------------------------------------------
domain::Signal signalFromJson(const json& j) {
  domain::Signal s;
  s.id = j.at("id").get<std::string>();
  s.symbol = j.at("symbol").get<std::string>();
  s.direction = parseDirection(j.at("direction").get<std::string>());
  s.edge_estimate = j.at("edge_estimate").get<double>();
  s.confidence = j.at("confidence").get<double>();
  s.horizon_days = j.at("horizon_days").get<int>();
  s.sector = j.value("sector", std::string{});
  s.strategy = j.value("strategy", std::string{});
  s.event_id = optionalField<std::string>(j, "event_id");
  s.entry_price = optionalField<double>(j, "entry_price");
  s.stop_loss = optionalField<double>(j, "stop_loss");
  s.take_profit = optionalField<double>(j, "take_profit");

  if (auto it = j.find("overrides"); it != j.end() && it->is_array()) {
    for (const auto& o : *it) {
      s.overrides.push_back(overrideFromJson(o));
    }
  }
  return s;
}

domain::MarketSnapshot marketSnapshotFromJson(const json& j) {
  domain::MarketSnapshot m;
  m.symbol = j.at("symbol").get<std::string>();
  m.price = j.at("price").get<double>();
  m.atr = j.value("atr", 0.0);
  m.adv_value = j.value("adv_value", 0.0);
  m.volatility_regime =
      parseRegimeLevel(j.value("volatility_regime", std::string{"UNKNOWN"}));
  m.liquidity_regime =
      parseRegimeLevel(j.value("liquidity_regime", std::string{"UNKNOWN"}));
  m.corporate_action_ms =
      j.value("corporate_actions_ms", std::vector<std::int64_t>{});
  m.catalyst_ms = optionalField<std::int64_t>(j, "catalyst_ms");
  m.as_of_ms = j.value("timestamp_ms", std::int64_t{0});
  return m;
}

domain::Mandate mandateFromJson(const json& j, const std::string& account_id) {
  domain::Mandate m;
  m.account_id = account_id;
  m.min_horizon_days = j.value("min_horizon_days", m.min_horizon_days);
  m.max_horizon_days = j.value("max_horizon_days", m.max_horizon_days);
  m.allowed_sectors = stringSet(j, "allowed_sectors");
  m.banned_sectors = stringSet(j, "banned_sectors");
  m.allowed_strategies = stringSet(j, "allowed_strategies");

  if (auto it = j.find("max_position_size"); it != j.end()) {
    const auto type = it->value("type", std::string{"PERCENT_OF_CAPITAL"});
    if (type == "ABSOLUTE") {
      m.max_position_size.kind = domain::PositionSizeLimit::Kind::Absolute;
    } else if (type == "PERCENT_OF_CAPITAL") {
      m.max_position_size.kind =
          domain::PositionSizeLimit::Kind::PercentOfCapital;
    } else {
      unknownValue("position size type", type);
    }
    m.max_position_size.value = it->at("value").get<double>();
  }

  m.max_risk_per_trade_pct =
      j.value("max_risk_per_trade_pct", m.max_risk_per_trade_pct);
  m.max_sector_exposure_pct =
      j.value("max_sector_exposure_pct", m.max_sector_exposure_pct);
  m.stop_loss_atr_multiplier =
      j.value("stop_loss_atr_multiplier", m.stop_loss_atr_multiplier);
  m.take_profit_atr_multiplier =
      j.value("take_profit_atr_multiplier", m.take_profit_atr_multiplier);
  m.max_open_positions = j.value("max_open_positions", m.max_open_positions);
  m.earnings_blackout_days =
      j.value("earnings_blackout_days", m.earnings_blackout_days);
  m.risk_posture =
      parseRiskPosture(j.value("risk_posture", std::string{"MODERATE"}));
  return m;
}

domain::KillSwitch killSwitchFromJson(const json& j,
                                      const std::string& account_id) {
  domain::KillSwitch ks;
  ks.account_id = account_id;
  ks.kind = parseKillSwitchKind(j.at("kind").get<std::string>());
  const auto type = j.value("threshold_type", std::string{"ABSOLUTE"});
  if (type == "ABSOLUTE") {
    ks.threshold_type = domain::KillSwitch::ThresholdType::Absolute;
  } else if (type == "PERCENT_OF_CAPITAL") {
    ks.threshold_type = domain::KillSwitch::ThresholdType::PercentOfCapital;
  } else {
    unknownValue("threshold type", type);
  }
  ks.threshold = j.at("threshold").get<double>();
  return ks;
}

domain::Position positionFromJson(const json& j,
                                  const std::string& account_id) {
  domain::Position pos;
  pos.account_id = account_id;
  pos.symbol = j.at("symbol").get<std::string>();
  pos.sector = j.value("sector", std::string{});
  pos.direction = parseDirection(j.value("direction", std::string{"LONG"}));
  pos.quantity = j.at("quantity").get<double>();
  pos.entry_price = j.at("entry_price").get<double>();
  pos.stop_loss = j.value("stop_loss", 0.0);
  pos.take_profit = j.value("take_profit", 0.0);
  if (pos.symbol.empty() || !(pos.quantity > 0.0) ||
      !(pos.entry_price > 0.0)) {
    throw ConfigurationError("position for " + account_id +
                             ": symbol, quantity and entry_price are required");
  }
  pos.cost_basis = pos.quantity * pos.entry_price;
  return pos;
}

// -----------------------------------------------------------------------------
// decodeInbound: dispatch on "type"
// -----------------------------------------------------------------------------
std::optional<Event> decodeInbound(const json& message) {
  const auto type = message.at("type").get<std::string>();
  const Timestamp ts = messageTime(message);

  if (type == "signal_batch") {
    SignalBatchEvent e;
    for (const auto& s : message.at("signals")) {
      e.signals.push_back(signalFromJson(s));
    }
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "market") {
    MarketSnapshotEvent e;
    e.snapshot = marketSnapshotFromJson(message);
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "pnl") {
    PnlUpdateEvent e;
    e.account_id = message.at("account_id").get<std::string>();
    e.realized_daily_pnl = message.at("realized_daily_pnl").get<double>();
    e.unrealized_pnl = message.value("unrealized_pnl", 0.0);
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "fill") {
    ProposalFilledEvent e;
    e.proposal_id = message.at("proposal_id").get<domain::ProposalId>();
    e.filled_quantity = message.at("filled_quantity").get<double>();
    e.fill_price = message.at("fill_price").get<double>();
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "reject") {
    ProposalRejectedEvent e;
    e.proposal_id = message.at("proposal_id").get<domain::ProposalId>();
    e.reason = message.value("reason", std::string{});
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "close") {
    PositionClosedEvent e;
    e.position_id = message.at("position_id").get<domain::PositionId>();
    e.exit_price = message.at("exit_price").get<double>();
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "release_tranche") {
    TrancheReleaseEvent e;
    e.proposal_id = message.at("proposal_id").get<domain::ProposalId>();
    e.tranche_index = message.at("tranche_index").get<std::size_t>();
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "unblock") {
    BlockCloseEvent e;
    e.block_id = message.at("block_id").get<domain::BlockId>();
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  if (type == "heartbeat") {
    HeartbeatEvent e;
    e.component_id = message.value("component_id", std::string{});
    e.status = message.value("status", std::string{"ok"});
    e.timestamp = ts;
    return Event{std::move(e)};
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// encodeTelemetry: outbound events only
// -----------------------------------------------------------------------------
std::optional<std::string> encodeTelemetry(const Event& event) {
  json j;
  if (const auto* e = std::get_if<TradeProposalEvent>(&event)) {
    j = toJson(e->proposal);
    j["type"] = "trade_proposal";
  } else if (const auto* e = std::get_if<BlockRecordEvent>(&event)) {
    j = toJson(e->block);
    j["type"] = "block_record";
  } else if (const auto* e = std::get_if<CapitalTransactionEvent>(&event)) {
    j = toJson(e->transaction);
    j["transaction_type"] = j["type"];
    j["type"] = "capital_transaction";
  } else if (const auto* e = std::get_if<KillSwitchEvent>(&event)) {
    j = toJson(e->kill_switch);
    j["type"] = "kill_switch";
    j["reset"] = e->reset;
  } else if (const auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    j = toJson(e->position);
    j["type"] = "position_update";
  } else {
    return std::nullopt;
  }
  j["sequence_id"] = std::visit([](const auto& e) { return e.sequence_id; },
                                event);
  return j.dump();
}

}  // namespace capital
