// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the nlohmann::json wire codec.
//
// Validates:
//   - decodeInbound() maps every "type" to the matching Event alternative
//   - Optional signal fields and playbook overrides survive decoding
//   - Unknown types decode to nullopt; malformed messages throw
//   - encodeTelemetry() tags outbound events and carries the sequence id
//   - Mandate and kill switch parsing keep defaults and reject bad enums
// =============================================================================

#include "capital/codec/json_codec.hpp"
#include "capital/config/configuration_error.hpp"
#include "capital/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <variant>

using nlohmann::json;

// -----------------------------------------------------------------------------
// 1. A signal batch decodes with hints, event id and overrides.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodesSignalBatch) {
  const auto message = json::parse(R"({
    "type": "signal_batch",
    "timestamp_ms": 1700000000000,
    "signals": [
      {"id": "s1", "symbol": "RELIANCE", "direction": "LONG",
       "edge_estimate": 5.0, "confidence": 0.8, "horizon_days": 10,
       "sector": "ENERGY", "strategy": "swing",
       "entry_price": 2450.0, "stop_loss": 2350.0,
       "overrides": [
         {"kind": "priority_boost", "multiplier": 1.5},
         {"kind": "tranche_split",
          "legs": [{"percent": 60}, {"percent": 40, "delay_days": 2}]}
       ]},
      {"id": "s2", "symbol": "INFY", "direction": "SHORT",
       "edge_estimate": 2.0, "confidence": 0.5, "horizon_days": 3,
       "event_id": "evt-9"}
    ]
  })");

  const auto event = capital::decodeInbound(message);
  ASSERT_TRUE(event.has_value());
  const auto* batch = std::get_if<capital::SignalBatchEvent>(&*event);
  ASSERT_NE(batch, nullptr);
  ASSERT_EQ(batch->signals.size(), 2u);
  EXPECT_EQ(capital::timestamp_to_ms(batch->timestamp), 1'700'000'000'000LL);

  const auto& s1 = batch->signals[0];
  EXPECT_EQ(s1.direction, capital::domain::Direction::Long);
  EXPECT_EQ(s1.sector, "ENERGY");
  ASSERT_TRUE(s1.entry_price.has_value());
  EXPECT_DOUBLE_EQ(*s1.stop_loss, 2350.0);
  EXPECT_FALSE(s1.take_profit.has_value());
  EXPECT_FALSE(s1.isEventDriven());
  ASSERT_EQ(s1.overrides.size(), 2u);
  EXPECT_DOUBLE_EQ(
      std::get<capital::domain::PriorityBoost>(s1.overrides[0]).multiplier,
      1.5);
  const auto& split = std::get<capital::domain::TrancheSplit>(s1.overrides[1]);
  ASSERT_EQ(split.legs.size(), 2u);
  EXPECT_EQ(split.legs[0].delay_days, 0);
  EXPECT_EQ(split.legs[1].delay_days, 2);

  const auto& s2 = batch->signals[1];
  EXPECT_EQ(s2.direction, capital::domain::Direction::Short);
  EXPECT_TRUE(s2.isEventDriven());
  EXPECT_TRUE(s2.sector.empty());
}

// -----------------------------------------------------------------------------
// 2. Every other inbound type lands on its own alternative.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecodesEachInboundType) {
  auto market = capital::decodeInbound(json::parse(R"({
    "type": "market", "symbol": "INFY", "price": 1500.0, "atr": 30.0,
    "adv_value": 5e8, "volatility_regime": "HIGH",
    "corporate_actions_ms": [1700000000000], "catalyst_ms": 1699990000000
  })"));
  ASSERT_TRUE(market.has_value());
  const auto& snap = std::get<capital::MarketSnapshotEvent>(*market).snapshot;
  EXPECT_EQ(snap.volatility_regime, capital::domain::RegimeLevel::High);
  EXPECT_EQ(snap.liquidity_regime, capital::domain::RegimeLevel::Unknown);
  EXPECT_EQ(snap.corporate_action_ms.size(), 1u);
  ASSERT_TRUE(snap.catalyst_ms.has_value());

  auto pnl = capital::decodeInbound(json::parse(
      R"({"type": "pnl", "account_id": "growth", "realized_daily_pnl": -6000})"));
  ASSERT_TRUE(pnl.has_value());
  const auto& p = std::get<capital::PnlUpdateEvent>(*pnl);
  EXPECT_EQ(p.account_id, "growth");
  EXPECT_DOUBLE_EQ(p.realized_daily_pnl, -6'000.0);
  EXPECT_DOUBLE_EQ(p.unrealized_pnl, 0.0);

  auto fill = capital::decodeInbound(json::parse(
      R"({"type": "fill", "proposal_id": 4, "filled_quantity": 20, "fill_price": 2451.5})"));
  ASSERT_TRUE(fill.has_value());
  EXPECT_EQ(std::get<capital::ProposalFilledEvent>(*fill).proposal_id, 4u);

  auto reject = capital::decodeInbound(
      json::parse(R"({"type": "reject", "proposal_id": 4, "reason": "broker"})"));
  ASSERT_TRUE(reject.has_value());
  EXPECT_EQ(std::get<capital::ProposalRejectedEvent>(*reject).reason, "broker");

  auto close = capital::decodeInbound(
      json::parse(R"({"type": "close", "position_id": 2, "exit_price": 2600})"));
  ASSERT_TRUE(close.has_value());
  EXPECT_DOUBLE_EQ(std::get<capital::PositionClosedEvent>(*close).exit_price,
                   2600.0);

  auto release = capital::decodeInbound(json::parse(
      R"({"type": "release_tranche", "proposal_id": 4, "tranche_index": 1})"));
  ASSERT_TRUE(release.has_value());
  const auto& leg = std::get<capital::TrancheReleaseEvent>(*release);
  EXPECT_EQ(leg.proposal_id, 4u);
  EXPECT_EQ(leg.tranche_index, 1u);

  auto unblock = capital::decodeInbound(
      json::parse(R"({"type": "unblock", "block_id": 9})"));
  ASSERT_TRUE(unblock.has_value());
  EXPECT_EQ(std::get<capital::BlockCloseEvent>(*unblock).block_id, 9u);

  auto beat = capital::decodeInbound(json::parse(R"({"type": "heartbeat"})"));
  ASSERT_TRUE(beat.has_value());
  EXPECT_EQ(std::get<capital::HeartbeatEvent>(*beat).status, "ok");
}

// -----------------------------------------------------------------------------
// 3. Unknown types are skipped; malformed messages throw.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, RejectsUnknownAndMalformedMessages) {
  EXPECT_FALSE(
      capital::decodeInbound(json::parse(R"({"type": "order"})")).has_value());

  EXPECT_THROW(capital::decodeInbound(json::parse(R"({"symbol": "INFY"})")),
               json::exception);
  EXPECT_THROW(capital::decodeInbound(
                   json::parse(R"({"type": "fill", "proposal_id": 4})")),
               json::exception);
  EXPECT_THROW(capital::decodeInbound(
                   json::parse(R"({"type": "release_tranche", "proposal_id": 4})")),
               json::exception);
  EXPECT_THROW(capital::decodeInbound(json::parse(R"({
      "type": "signal_batch",
      "signals": [{"id": "s1", "symbol": "X", "direction": "SIDEWAYS",
                   "edge_estimate": 1, "confidence": 0.5, "horizon_days": 1}]
    })")),
               capital::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 4. Outbound events are tagged and carry their sequence id.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, EncodesTelemetry) {
  capital::TradeProposalEvent proposal;
  proposal.proposal.id = 11;
  proposal.proposal.account_id = "growth";
  proposal.proposal.symbol = "RELIANCE";
  proposal.proposal.quantity = 10.0;
  proposal.proposal.planned_quantity = 20.0;
  proposal.proposal.tranches.push_back({10.0, 0, "immediate"});
  proposal.proposal.tranches.push_back({10.0, 3, "after_3_days"});
  proposal.sequence_id = 42;

  const auto text = capital::encodeTelemetry(capital::Event{proposal});
  ASSERT_TRUE(text.has_value());
  const auto j = json::parse(*text);
  EXPECT_EQ(j.at("type"), "trade_proposal");
  EXPECT_EQ(j.at("sequence_id"), 42u);
  EXPECT_EQ(j.at("id"), 11u);
  EXPECT_EQ(j.at("tranches").size(), 2u);
  EXPECT_DOUBLE_EQ(j.at("quantity").get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(j.at("planned_quantity").get<double>(), 20.0);
  EXPECT_EQ(j.at("tranche_index"), 0u);
  EXPECT_FALSE(j.contains("parent_id"));
  EXPECT_TRUE(j.at("guardrails").contains("checks"));

  capital::CapitalTransactionEvent tx;
  tx.transaction.type = capital::domain::TransactionType::Reserve;
  tx.transaction.amount = 49'000.0;
  const auto tx_json =
      json::parse(*capital::encodeTelemetry(capital::Event{tx}));
  EXPECT_EQ(tx_json.at("type"), "capital_transaction");
  EXPECT_EQ(tx_json.at("transaction_type"), "RESERVE");

  capital::KillSwitchEvent ks;
  ks.kill_switch.kind = capital::domain::KillSwitchKind::MaxDailyLoss;
  ks.reset = true;
  const auto ks_json = json::parse(*capital::encodeTelemetry(capital::Event{ks}));
  EXPECT_EQ(ks_json.at("kind"), "MAX_DAILY_LOSS");
  EXPECT_TRUE(ks_json.at("reset").get<bool>());

  // Inbound-only types are not telemetry.
  EXPECT_FALSE(
      capital::encodeTelemetry(capital::Event{capital::HeartbeatEvent{}})
          .has_value());
}

// -----------------------------------------------------------------------------
// 5. Mandate parsing keeps defaults for missing keys and validates enums.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, MandateAndKillSwitchParsing) {
  const capital::domain::Mandate defaults;
  const auto m = capital::mandateFromJson(json::parse(R"({
    "max_horizon_days": 30,
    "banned_sectors": ["TOBACCO"],
    "max_position_size": {"type": "ABSOLUTE", "value": 50000},
    "risk_posture": "CONSERVATIVE"
  })"),
                                          "income");
  EXPECT_EQ(m.account_id, "income");
  EXPECT_EQ(m.max_horizon_days, 30);
  EXPECT_EQ(m.min_horizon_days, defaults.min_horizon_days);
  EXPECT_EQ(m.banned_sectors.count("TOBACCO"), 1u);
  EXPECT_EQ(m.max_position_size.kind,
            capital::domain::PositionSizeLimit::Kind::Absolute);
  EXPECT_DOUBLE_EQ(m.max_risk_per_trade_pct, defaults.max_risk_per_trade_pct);
  EXPECT_EQ(m.risk_posture, capital::domain::RiskPosture::Conservative);

  EXPECT_THROW(capital::mandateFromJson(
                   json::parse(R"({"risk_posture": "YOLO"})"), "income"),
               capital::ConfigurationError);

  const auto ks = capital::killSwitchFromJson(
      json::parse(R"({"kind": "MAX_DRAWDOWN", "threshold_type":
                      "PERCENT_OF_CAPITAL", "threshold": -10})"),
      "income");
  EXPECT_EQ(ks.kind, capital::domain::KillSwitchKind::MaxDrawdown);
  EXPECT_EQ(ks.threshold_type,
            capital::domain::KillSwitch::ThresholdType::PercentOfCapital);
  EXPECT_DOUBLE_EQ(ks.threshold, -10.0);

  EXPECT_THROW(capital::killSwitchFromJson(
                   json::parse(R"({"kind": "MAX_VOLUME", "threshold": -1})"),
                   "income"),
               capital::ConfigurationError);
  EXPECT_THROW(capital::parseObjective("GREEDY"), capital::ConfigurationError);
  EXPECT_EQ(capital::parseObjective("BALANCED"),
            capital::domain::Objective::Balanced);
}
