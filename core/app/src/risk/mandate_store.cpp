#include "capital/risk/mandate_store.hpp"
#include "capital/config/configuration_error.hpp"

#include <cmath>
#include <iostream>
#include <mutex>

namespace capital {

namespace {

void require(bool condition, const domain::Mandate& mandate,
             const std::string& what) {
  if (!condition) {
    throw ConfigurationError("mandate for " + mandate.account_id + ": " + what);
  }
}

bool positiveFinite(double value) {
  return std::isfinite(value) && value > 0.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void MandateStore::validate(const domain::Mandate& mandate) {
  if (mandate.account_id.empty()) {
    throw ConfigurationError("mandate: account id must not be empty");
  }
  require(mandate.min_horizon_days >= 0, mandate,
          "min_horizon_days must be >= 0");
  require(mandate.max_horizon_days >= mandate.min_horizon_days, mandate,
          "max_horizon_days must be >= min_horizon_days");
  require(positiveFinite(mandate.max_position_size.value), mandate,
          "max_position_size must be positive");
  require(mandate.max_position_size.kind !=
                  domain::PositionSizeLimit::Kind::PercentOfCapital ||
              mandate.max_position_size.value <= 100.0,
          mandate, "max_position_size percent must be <= 100");
  require(positiveFinite(mandate.max_risk_per_trade_pct) &&
              mandate.max_risk_per_trade_pct <= 100.0,
          mandate, "max_risk_per_trade_pct must be in (0, 100]");
  require(std::isfinite(mandate.max_sector_exposure_pct) &&
              mandate.max_sector_exposure_pct >= 0.0 &&
              mandate.max_sector_exposure_pct <= 100.0,
          mandate, "max_sector_exposure_pct must be in [0, 100]");
  require(positiveFinite(mandate.stop_loss_atr_multiplier), mandate,
          "stop_loss_atr_multiplier must be positive");
  require(positiveFinite(mandate.take_profit_atr_multiplier), mandate,
          "take_profit_atr_multiplier must be positive");
  require(mandate.max_open_positions >= 0, mandate,
          "max_open_positions must be >= 0");
  require(mandate.earnings_blackout_days >= 0, mandate,
          "earnings_blackout_days must be >= 0");

  for (const auto& sector : mandate.allowed_sectors) {
    require(mandate.banned_sectors.count(sector) == 0, mandate,
            "sector " + sector + " is both allowed and banned");
  }
}

// -----------------------------------------------------------------------------
// publish: validate, stamp, append
// -----------------------------------------------------------------------------
std::uint32_t MandateStore::publish(domain::Mandate mandate) {
  validate(mandate);

  std::unique_lock lock(mutex_);
  auto& chain = versions_[mandate.account_id];
  mandate.version = chain.empty() ? 1 : chain.back().version + 1;
  chain.push_back(mandate);

  std::cout << "[MandateStore] Published " << mandate.account_id << " v"
            << mandate.version << "\n";
  return mandate.version;
}

std::optional<domain::Mandate> MandateStore::current(
    const std::string& account_id) const {
  std::shared_lock lock(mutex_);
  auto it = versions_.find(account_id);
  if (it == versions_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

std::optional<domain::Mandate> MandateStore::version(
    const std::string& account_id, std::uint32_t version) const {
  std::shared_lock lock(mutex_);
  auto it = versions_.find(account_id);
  if (it == versions_.end()) {
    return std::nullopt;
  }
  for (const auto& m : it->second) {
    if (m.version == version) {
      return m;
    }
  }
  return std::nullopt;
}

std::vector<domain::Mandate> MandateStore::history(
    const std::string& account_id) const {
  std::shared_lock lock(mutex_);
  auto it = versions_.find(account_id);
  if (it == versions_.end()) {
    return {};
  }
  return it->second;
}

}  // namespace capital
