#pragma once

#include "capital/concurrent/sequence_generator.hpp"
#include "capital/domain/account.hpp"
#include "capital/domain/capital_transaction.hpp"
#include "capital/domain/risk_limits.hpp"
#include "capital/domain/trade_proposal.hpp"
#include "capital/ledger/ledger_errors.hpp"
#include "capital/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace capital {

enum class ReserveStatus {
  Ok,
  InsufficientFunds,
};

// Outcome of Ledger::reserve(). reservation_id and expires_at_ms are only
// meaningful when status == Ok.
struct ReserveResult {
  ReserveStatus status{ReserveStatus::InsufficientFunds};
  domain::ReservationId reservation_id{0};
  std::int64_t expires_at_ms{0};

  bool ok() const { return status == ReserveStatus::Ok; }
};

// Aggregate view across every account, for operators and the STATUS command.
struct PortfolioSummary {
  std::size_t account_count{0};
  std::size_t paused_accounts{0};
  double total_capital{0.0};
  double available_cash{0.0};
  double reserved_cash{0.0};
  double deployed_cash{0.0};
  double realized_pnl{0.0};

  // (reserved + deployed) / equity, in percent. 0 when equity is 0.
  double utilization_pct{0.0};
};

// -----------------------------------------------------------------------------
// Ledger: per-account cash state and its append-only transaction log
// -----------------------------------------------------------------------------
//
// @brief  The single source of truth for how much cash each account has
//         available, reserved and deployed.
//
// @details
// Every balance change goes through one of the operations below, and every
// operation that changes a balance appends exactly one CapitalTransaction
// (transfer appends one to each side). Replaying an account's log with
// Ledger::replay() reproduces its balances.
//
// Cash moves between three buckets:
//
//   available ──reserve──► reserved ──deploy──► deployed
//       ▲                     │                    │
//       └──────release────────┘                    │
//       └──────────return (+ realized P&L)─────────┘
//
// Invariant, per account, after every operation:
//   available + reserved + deployed == total_capital + realized_pnl
//   and all three buckets are >= 0.
//
// Reservations:
//   reserve() returns a handle that expires reservation_ttl_ms after it was
//   issued. deploy() against an expired handle first releases what is left of
//   it and then throws StaleReservationError, so a fill that arrives late
//   can never consume cash that has already gone back to available.
//   expireReservations() does the same for every account without a deploy,
//   and prunes every inactive reservation. A pruned id is remembered in a
//   bounded per-account retired set (kRetiredReservationCapacity, oldest
//   forgotten first), so a deploy against it still throws
//   StaleReservationError and a release of it returns 0.
//
// Thread model:
//   Every account has its own mutex. All mutations of one account are
//   serialized by it; different accounts never contend. reserve() therefore
//   cannot double-spend: the availability check and the debit happen under
//   the same lock. transfer() takes both account locks with std::scoped_lock.
//   The account map itself is guarded by a shared_mutex and only written by
//   openAccount(). Accounts are never removed, so an AccountState reference
//   obtained under the shared lock stays valid.
//
// Listener:
//   The optional TransactionListener is called with every appended
//   transaction, after the account lock is released, on the calling thread.
//   The AllocationEngine uses it to publish CapitalTransactionEvents.
//
// Ownership:
//   Owned by the AllocationEngine. Borrows the ITimeProvider, which must
//   outlive it.
// -----------------------------------------------------------------------------
class Ledger {
 public:
  using TransactionListener =
      std::function<void(const domain::CapitalTransaction&)>;

  Ledger(const ITimeProvider& clock, const domain::TreasuryLimits& limits,
         TransactionListener listener = {});

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;
  Ledger(Ledger&&) = delete;
  Ledger& operator=(Ledger&&) = delete;

  // -------------------------------------------------------------------------
  // openAccount(id, objective, initial_capital)
  // -------------------------------------------------------------------------
  // @brief  Registers a new account funded with initial_capital, recorded as
  //         a DEPOSIT.
  //
  // @throws ConfigurationError  empty id, duplicate id, or a capital that is
  //                             not a positive finite number.
  // -------------------------------------------------------------------------
  void openAccount(const std::string& account_id, domain::Objective objective,
                   double initial_capital);

  bool hasAccount(const std::string& account_id) const;
  std::vector<std::string> accountIds() const;

  // -------------------------------------------------------------------------
  // reserve(account, amount, reference)
  // -------------------------------------------------------------------------
  // @brief  Moves amount from available to reserved if, and only if, the
  //         account has that much available.
  //
  // @return Ok with a reservation handle, or InsufficientFunds with no state
  //         change and no transaction.
  //
  // @throws LedgerContractError  unknown account, amount <= 0 or not finite.
  //
  // Thread-safety: atomic per account. N concurrent reserves whose sum
  //                exceeds available cannot all succeed.
  // -------------------------------------------------------------------------
  ReserveResult reserve(const std::string& account_id, double amount,
                        const std::string& reference);

  // -------------------------------------------------------------------------
  // deploy(account, reservation, amount)
  // -------------------------------------------------------------------------
  // @brief  Moves amount of a live reservation from reserved to deployed.
  //
  // @details
  // A reservation may be deployed in several parts. Whatever is not
  // deployed stays reserved until releaseReservation() or expiry.
  //
  // @throws StaleReservationError  the reservation expired (its remainder is
  //                                released first) or was already released
  //                                or fully deployed.
  // @throws LedgerContractError    unknown account or reservation, amount
  //                                <= 0, or amount above what the
  //                                reservation still holds.
  // -------------------------------------------------------------------------
  void deploy(const std::string& account_id,
              domain::ReservationId reservation_id, double amount);

  // -------------------------------------------------------------------------
  // releaseReservation(account, reservation)
  // -------------------------------------------------------------------------
  // @brief  Returns what is left of a reservation to available.
  //
  // @return The amount released. 0 (and no transaction) when the
  //         reservation is already inactive.
  //
  // @throws LedgerContractError  unknown account or reservation id. A
  //                              retired id is not unknown.
  // -------------------------------------------------------------------------
  double releaseReservation(const std::string& account_id,
                            domain::ReservationId reservation_id);

  // -------------------------------------------------------------------------
  // returnToAvailable(account, amount, realized_pnl, reference)
  // -------------------------------------------------------------------------
  // @brief  Closes out deployed capital: amount leaves deployed and
  //         amount + realized_pnl arrives in available.
  //
  // @throws LedgerContractError  amount <= 0, amount above deployed, or a
  //                              loss larger than the available cash can
  //                              absorb.
  // -------------------------------------------------------------------------
  void returnToAvailable(const std::string& account_id, double amount,
                         double realized_pnl, const std::string& reference);

  // -------------------------------------------------------------------------
  // transfer(from, to, amount, reference)
  // -------------------------------------------------------------------------
  // @brief  Moves available cash (and the matching contributed capital)
  //         between two accounts.
  //
  // @return false, with neither account touched, when the source does not
  //         have amount available.
  //
  // @details
  // Both account locks are held for the whole operation, so the
  // TRANSFER_OUT and TRANSFER_IN records are written together or not at
  // all.
  //
  // @throws LedgerContractError  same account, unknown account, bad amount.
  // -------------------------------------------------------------------------
  bool transfer(const std::string& from_account, const std::string& to_account,
                double amount, const std::string& reference);

  // Adds a periodic contribution to an account's capital and available cash.
  void contributeSip(const std::string& account_id, double amount,
                     const std::string& reference);

  // Releases every reservation whose TTL has passed and prunes the inactive
  // ones into the retired set. Returns how many were released.
  std::size_t expireReservations();

  // Reservations still tracked for the account, active or not yet pruned.
  std::size_t reservationCount(const std::string& account_id) const;

  // How many pruned reservation ids each account remembers.
  static constexpr std::size_t kRetiredReservationCapacity = 4096;

  // True while the reservation still holds cash and has not expired.
  bool reservationActive(const std::string& account_id,
                         domain::ReservationId reservation_id) const;

  void setPaused(const std::string& account_id, bool paused);

  // Point-in-time copy of the account, or nullopt for an unknown id.
  std::optional<domain::Account> snapshot(const std::string& account_id) const;

  // Copy of the account's transaction log in append order.
  std::vector<domain::CapitalTransaction> transactions(
      const std::string& account_id) const;

  // Available cash minus the emergency buffer. This, not available_cash, is
  // what the PositionSizer is allowed to plan against.
  double deployableCash(const std::string& account_id) const;

  PortfolioSummary portfolioSummary() const;

  // -------------------------------------------------------------------------
  // replay(transactions)
  // -------------------------------------------------------------------------
  // @brief  Rebuilds an account's balances from its transaction log.
  //
  // @details
  // Only the cash fields and the id are reconstructed; objective and paused
  // are not part of the log. Used by audits and by the conservation tests.
  //
  // @throws LedgerContractError  the log mixes accounts.
  // -------------------------------------------------------------------------
  static domain::Account replay(
      const std::vector<domain::CapitalTransaction>& transactions);

 private:
  struct Reservation {
    double remaining{0.0};
    std::int64_t expires_at_ms{0};
    std::string reference;
    bool active{true};
  };

  struct AccountState {
    mutable std::mutex mutex;
    domain::Account account;
    std::vector<domain::CapitalTransaction> log;
    std::unordered_map<domain::ReservationId, Reservation> reservations;

    // Pruned ids, oldest first in retired_order.
    std::unordered_set<domain::ReservationId> retired;
    std::deque<domain::ReservationId> retired_order;
  };

  AccountState& state(const std::string& account_id);
  const AccountState& state(const std::string& account_id) const;

  // Appends a transaction to state.log. Caller holds state.mutex.
  domain::CapitalTransaction& append(AccountState& state,
                                     domain::TransactionType type,
                                     double amount,
                                     const std::string& reference);

  // Moves an inactive reservation into the retired set, evicting the oldest
  // retired id past capacity. Caller holds state.mutex.
  static void retire(AccountState& state, domain::ReservationId id);

  // Releases the remainder of one reservation. Caller holds state.mutex.
  // Returns the RELEASE transaction, or nullopt if nothing was left.
  std::optional<domain::CapitalTransaction> releaseLocked(
      AccountState& state, domain::ReservationId id, Reservation& reservation);

  void notify(const std::vector<domain::CapitalTransaction>& appended) const;

  static void requirePositive(double amount, const char* operation);

  const ITimeProvider& clock_;
  domain::TreasuryLimits limits_;
  TransactionListener listener_;

  SequenceGenerator transaction_ids_;
  SequenceGenerator reservation_ids_;

  mutable std::shared_mutex accounts_mutex_;
  std::unordered_map<std::string, std::unique_ptr<AccountState>> accounts_;
};

}  // namespace capital
