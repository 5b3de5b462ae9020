// =============================================================================
// mandate_store_test.cpp
// =============================================================================
// Unit tests for capital::MandateStore.
//
// Validates:
//   - Versions are assigned 1, 2, 3... per account and never rewritten
//   - current() returns the newest version; version() and history() expose
//     the older ones
//   - Malformed mandates throw ConfigurationError and are not stored
// =============================================================================

#include "capital/config/configuration_error.hpp"
#include "capital/risk/mandate_store.hpp"

#include <gtest/gtest.h>

namespace {

capital::domain::Mandate makeMandate(const std::string& account) {
  capital::domain::Mandate m;
  m.account_id = account;
  m.min_horizon_days = 2;
  m.max_horizon_days = 20;
  m.max_risk_per_trade_pct = 2.0;
  return m;
}

}  // namespace

class MandateStoreTest : public ::testing::Test {
 protected:
  capital::MandateStore store;
};

// -----------------------------------------------------------------------------
// 1. Publishing assigns increasing versions per account.
// -----------------------------------------------------------------------------
TEST_F(MandateStoreTest, PublishAssignsIncreasingVersions) {
  EXPECT_EQ(store.publish(makeMandate("acct-1")), 1u);
  EXPECT_EQ(store.publish(makeMandate("acct-2")), 1u);

  auto tighter = makeMandate("acct-1");
  tighter.max_risk_per_trade_pct = 1.0;
  EXPECT_EQ(store.publish(tighter), 2u);

  const auto current = store.current("acct-1");
  ASSERT_TRUE(current.has_value());
  EXPECT_EQ(current->version, 2u);
  EXPECT_DOUBLE_EQ(current->max_risk_per_trade_pct, 1.0);
}

// -----------------------------------------------------------------------------
// 2. Older versions stay readable and unchanged.
// Why: an audit of an old proposal must see the mandate it was sized under.
// -----------------------------------------------------------------------------
TEST_F(MandateStoreTest, OlderVersionsAreImmutable) {
  store.publish(makeMandate("acct-1"));
  auto wider = makeMandate("acct-1");
  wider.max_horizon_days = 60;
  store.publish(wider);

  const auto v1 = store.version("acct-1", 1);
  ASSERT_TRUE(v1.has_value());
  EXPECT_EQ(v1->max_horizon_days, 20);

  const auto history = store.history("acct-1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].version, 1u);
  EXPECT_EQ(history[1].version, 2u);
  EXPECT_EQ(history[1].max_horizon_days, 60);

  EXPECT_FALSE(store.version("acct-1", 3).has_value());
  EXPECT_FALSE(store.current("nobody").has_value());
  EXPECT_TRUE(store.history("nobody").empty());
}

// -----------------------------------------------------------------------------
// 3. Malformed mandates are configuration errors and are never stored.
// -----------------------------------------------------------------------------
TEST_F(MandateStoreTest, MalformedMandatesAreRejected) {
  auto inverted = makeMandate("acct-1");
  inverted.min_horizon_days = 10;
  inverted.max_horizon_days = 5;
  EXPECT_THROW(store.publish(inverted), capital::ConfigurationError);

  auto no_risk = makeMandate("acct-1");
  no_risk.max_risk_per_trade_pct = 0.0;
  EXPECT_THROW(store.publish(no_risk), capital::ConfigurationError);

  auto over_sector = makeMandate("acct-1");
  over_sector.max_sector_exposure_pct = 140.0;
  EXPECT_THROW(store.publish(over_sector), capital::ConfigurationError);

  auto zero_size = makeMandate("acct-1");
  zero_size.max_position_size.value = 0.0;
  EXPECT_THROW(store.publish(zero_size), capital::ConfigurationError);

  auto contradictory = makeMandate("acct-1");
  contradictory.allowed_sectors = {"IT", "PHARMA"};
  contradictory.banned_sectors = {"PHARMA"};
  EXPECT_THROW(store.publish(contradictory), capital::ConfigurationError);

  auto anonymous = makeMandate("");
  EXPECT_THROW(store.publish(anonymous), capital::ConfigurationError);

  EXPECT_FALSE(store.current("acct-1").has_value());
}
