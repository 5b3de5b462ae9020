#include "capital/config/engine_config.hpp"
#include "capital/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace capital {

namespace {

using nlohmann::json;

void require(bool condition, const std::string& what) {
  if (!condition) {
    throw ConfigurationError("config: " + what);
  }
}

bool positiveFinite(double value) {
  return std::isfinite(value) && value > 0.0;
}

void readGuardrails(const json& j, domain::GuardrailLimits& g) {
  g.max_adv_fraction = j.value("max_adv_fraction", g.max_adv_fraction);
  g.adv_lookback_days = j.value("adv_lookback_days", g.adv_lookback_days);
  g.default_blackout_days =
      j.value("default_blackout_days", g.default_blackout_days);
  g.catalyst_freshness_hours =
      j.value("catalyst_freshness_hours", g.catalyst_freshness_hours);
  g.default_sector_exposure_pct =
      j.value("default_sector_exposure_pct", g.default_sector_exposure_pct);
  g.block_on_warning = j.value("block_on_warning", g.block_on_warning);
}

void readSizing(const json& j, domain::SizingLimits& s) {
  s.kelly_cap = j.value("kelly_cap", s.kelly_cap);
  s.assumed_variance = j.value("assumed_variance", s.assumed_variance);
  s.default_atr_fraction =
      j.value("default_atr_fraction", s.default_atr_fraction);
  s.whole_units = j.value("whole_units", s.whole_units);
}

void readTreasury(const json& j, domain::TreasuryLimits& t) {
  t.emergency_buffer_pct =
      j.value("emergency_buffer_pct", t.emergency_buffer_pct);
  t.reservation_ttl_ms = j.value("reservation_ttl_ms", t.reservation_ttl_ms);
  t.max_proposals_per_batch =
      j.value("max_proposals_per_batch", t.max_proposals_per_batch);
}

void readEndpoints(const json& j, EndpointConfig& e) {
  e.enabled = j.value("enabled", e.enabled);
  e.signal_feed = j.value("signal_feed", e.signal_feed);
  e.command = j.value("command", e.command);
  e.telemetry = j.value("telemetry", e.telemetry);
}

AccountConfig readAccount(const json& j) {
  AccountConfig a;
  a.id = j.at("id").get<std::string>();
  a.objective = parseObjective(j.value("objective", std::string{"BALANCED"}));
  a.initial_capital = j.at("initial_capital").get<double>();
  a.mandate = mandateFromJson(j.value("mandate", json::object()), a.id);
  if (auto it = j.find("kill_switches"); it != j.end()) {
    for (const auto& ks : *it) {
      a.kill_switches.push_back(killSwitchFromJson(ks, a.id));
    }
  }
  if (auto it = j.find("positions"); it != j.end()) {
    for (const auto& pos : *it) {
      a.positions.push_back(positionFromJson(pos, a.id));
    }
  }
  return a;
}

}  // namespace

// -----------------------------------------------------------------------------
// validateLimits
// -----------------------------------------------------------------------------
void validateLimits(const EngineConfig& config) {
  const auto& g = config.guardrails;
  require(positiveFinite(g.max_adv_fraction) && g.max_adv_fraction <= 1.0,
          "guardrails.max_adv_fraction must be in (0, 1]");
  require(g.adv_lookback_days > 0, "guardrails.adv_lookback_days must be > 0");
  require(g.default_blackout_days >= 0,
          "guardrails.default_blackout_days must be >= 0");
  require(positiveFinite(g.catalyst_freshness_hours),
          "guardrails.catalyst_freshness_hours must be positive");
  require(positiveFinite(g.default_sector_exposure_pct) &&
              g.default_sector_exposure_pct <= 100.0,
          "guardrails.default_sector_exposure_pct must be in (0, 100]");

  const auto& s = config.sizing;
  require(std::isfinite(s.kelly_cap) && s.kelly_cap >= 0.0 &&
              s.kelly_cap <= 1.0,
          "sizing.kelly_cap must be in [0, 1]");
  require(positiveFinite(s.assumed_variance),
          "sizing.assumed_variance must be positive");
  require(positiveFinite(s.default_atr_fraction),
          "sizing.default_atr_fraction must be positive");

  const auto& t = config.treasury;
  require(std::isfinite(t.emergency_buffer_pct) &&
              t.emergency_buffer_pct >= 0.0 && t.emergency_buffer_pct < 100.0,
          "treasury.emergency_buffer_pct must be in [0, 100)");
  require(t.reservation_ttl_ms > 0, "treasury.reservation_ttl_ms must be > 0");
  require(t.max_proposals_per_batch > 0,
          "treasury.max_proposals_per_batch must be > 0");
}

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const std::string& json_text) {
  EngineConfig config;
  try {
    const json root = json::parse(json_text);
    require(root.is_object(), "top level must be an object");

    const auto clock = root.value("clock", std::string{"live"});
    require(clock == "live" || clock == "simulation",
            "clock must be 'live' or 'simulation'");
    config.simulation_clock = clock == "simulation";

    if (auto it = root.find("guardrails"); it != root.end()) {
      readGuardrails(*it, config.guardrails);
    }
    if (auto it = root.find("sizing"); it != root.end()) {
      readSizing(*it, config.sizing);
    }
    if (auto it = root.find("treasury"); it != root.end()) {
      readTreasury(*it, config.treasury);
    }
    if (auto it = root.find("endpoints"); it != root.end()) {
      readEndpoints(*it, config.endpoints);
    }
    if (auto it = root.find("default_kill_switches"); it != root.end()) {
      for (const auto& ks : *it) {
        config.default_kill_switches.push_back(killSwitchFromJson(ks, ""));
      }
    }
    if (auto it = root.find("accounts"); it != root.end()) {
      std::set<std::string> seen;
      for (const auto& a : *it) {
        AccountConfig account = readAccount(a);
        require(!account.id.empty(), "account id must not be empty");
        require(seen.insert(account.id).second,
                "duplicate account id " + account.id);
        config.accounts.push_back(std::move(account));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("config: ") + e.what());
  }

  validateLimits(config);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("config: cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace capital
