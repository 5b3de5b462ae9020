#pragma once

#include "capital/domain/mandate.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace capital {

// -----------------------------------------------------------------------------
// MandateStore: versioned, append-only mandates per account
// -----------------------------------------------------------------------------
//
// @brief  Holds every mandate version ever published for each account.
//
// @details
// publish() never overwrites. It validates the mandate, stamps it with the
// next version number for its account (1, 2, 3, ...) and appends it. The
// allocation path always reads current(); older versions remain available
// so a TradeProposal can be audited against the mandate that was in force
// when it was produced.
//
// Thread model:
//   publish() takes the write lock; every reader takes the shared lock.
//   Readers receive copies.
// -----------------------------------------------------------------------------
class MandateStore {
 public:
  MandateStore() = default;

  MandateStore(const MandateStore&) = delete;
  MandateStore& operator=(const MandateStore&) = delete;

  // -------------------------------------------------------------------------
  // publish(mandate)
  // -------------------------------------------------------------------------
  // @brief  Validates and appends a new version. Any version number already
  //         on the input is ignored.
  //
  // @return The version assigned.
  //
  // @throws ConfigurationError  the mandate fails validate().
  // -------------------------------------------------------------------------
  std::uint32_t publish(domain::Mandate mandate);

  std::optional<domain::Mandate> current(const std::string& account_id) const;

  std::optional<domain::Mandate> version(const std::string& account_id,
                                         std::uint32_t version) const;

  // Every version for the account, oldest first.
  std::vector<domain::Mandate> history(const std::string& account_id) const;

  // Throws ConfigurationError describing the first malformed field.
  static void validate(const domain::Mandate& mandate);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::vector<domain::Mandate>> versions_;
};

}  // namespace capital
