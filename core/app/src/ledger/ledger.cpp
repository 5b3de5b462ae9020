#include "capital/ledger/ledger.hpp"
#include "capital/config/configuration_error.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace capital {

namespace {

// Rounding noise below this is treated as zero when comparing balances.
constexpr double kCashEpsilon = 1e-6;

// Snaps tiny negative residue from float subtraction back to zero.
void settle(double& bucket) {
  if (std::abs(bucket) < kCashEpsilon) {
    bucket = 0.0;
  }
}

std::string reservationReference(domain::ReservationId id) {
  return "reservation:" + std::to_string(id);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
Ledger::Ledger(const ITimeProvider& clock,
               const domain::TreasuryLimits& limits,
               TransactionListener listener)
    : clock_(clock), limits_(limits), listener_(std::move(listener)) {}

// -----------------------------------------------------------------------------
// openAccount: register and record the initial DEPOSIT
// -----------------------------------------------------------------------------
void Ledger::openAccount(const std::string& account_id,
                         domain::Objective objective, double initial_capital) {
  if (account_id.empty()) {
    throw ConfigurationError("account id must not be empty");
  }
  if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
    throw ConfigurationError("account " + account_id +
                             ": initial capital must be positive");
  }

  std::vector<domain::CapitalTransaction> appended;
  {
    std::unique_lock lock(accounts_mutex_);
    if (accounts_.count(account_id) != 0) {
      throw ConfigurationError("account " + account_id + " already exists");
    }

    auto fresh = std::make_unique<AccountState>();
    fresh->account.id = account_id;
    fresh->account.objective = objective;
    fresh->account.total_capital = initial_capital;
    fresh->account.available_cash = initial_capital;
    appended.push_back(append(*fresh, domain::TransactionType::Deposit,
                              initial_capital, "account-open"));
    accounts_.emplace(account_id, std::move(fresh));
  }

  std::cout << "[Ledger] Opened " << account_id << " with "
            << initial_capital << " ("
            << domain::objectiveToString(objective) << ")\n";
  notify(appended);
}

bool Ledger::hasAccount(const std::string& account_id) const {
  std::shared_lock lock(accounts_mutex_);
  return accounts_.count(account_id) != 0;
}

std::vector<std::string> Ledger::accountIds() const {
  std::shared_lock lock(accounts_mutex_);
  std::vector<std::string> ids;
  ids.reserve(accounts_.size());
  for (const auto& [id, state] : accounts_) {
    ids.push_back(id);
  }
  return ids;
}

// -----------------------------------------------------------------------------
// reserve: check and debit under one lock
// -----------------------------------------------------------------------------
ReserveResult Ledger::reserve(const std::string& account_id, double amount,
                              const std::string& reference) {
  requirePositive(amount, "reserve");
  AccountState& st = state(account_id);

  ReserveResult result;
  std::vector<domain::CapitalTransaction> appended;
  {
    std::lock_guard lock(st.mutex);
    if (amount > st.account.available_cash + kCashEpsilon) {
      std::cerr << "[Ledger] Insufficient funds in " << account_id
                << ": requested " << amount << ", available "
                << st.account.available_cash << "\n";
      return result;
    }

    st.account.available_cash -= amount;
    settle(st.account.available_cash);
    st.account.reserved_cash += amount;

    const domain::ReservationId id = reservation_ids_.next_id();
    const std::int64_t expires_at = clock_.now_ms() + limits_.reservation_ttl_ms;
    st.reservations.emplace(id, Reservation{amount, expires_at, reference, true});

    auto& txn = append(st, domain::TransactionType::Reserve, amount, reference);
    appended.push_back(txn);

    result.status = ReserveStatus::Ok;
    result.reservation_id = id;
    result.expires_at_ms = expires_at;
  }

  std::cout << "[Ledger] Reserved " << amount << " for " << account_id
            << " (" << reference << ")\n";
  notify(appended);
  return result;
}

// -----------------------------------------------------------------------------
// deploy: reserved -> deployed against a live reservation
// -----------------------------------------------------------------------------
void Ledger::deploy(const std::string& account_id,
                    domain::ReservationId reservation_id, double amount) {
  requirePositive(amount, "deploy");
  AccountState& st = state(account_id);

  std::vector<domain::CapitalTransaction> appended;
  bool stale = false;
  {
    std::lock_guard lock(st.mutex);
    auto it = st.reservations.find(reservation_id);
    if (it == st.reservations.end()) {
      if (st.retired.count(reservation_id) == 0) {
        throw LedgerContractError("deploy: unknown reservation " +
                                  std::to_string(reservation_id) + " in " +
                                  account_id);
      }
      stale = true;
    } else if (!it->second.active) {
      stale = true;
    } else if (clock_.now_ms() >= it->second.expires_at_ms) {
      if (auto released = releaseLocked(st, reservation_id, it->second)) {
        appended.push_back(*released);
      }
      stale = true;
    } else {
      Reservation& res = it->second;
      if (amount > res.remaining + kCashEpsilon) {
        std::ostringstream msg;
        msg << "deploy: amount " << amount << " exceeds reservation "
            << reservation_id << " remaining " << res.remaining;
        throw LedgerContractError(msg.str());
      }

      const double deployed = std::min(amount, res.remaining);
      res.remaining -= deployed;
      settle(res.remaining);
      if (res.remaining == 0.0) {
        res.active = false;
      }
      st.account.reserved_cash -= deployed;
      settle(st.account.reserved_cash);
      st.account.deployed_cash += deployed;

      appended.push_back(append(st, domain::TransactionType::Deploy, deployed,
                                res.reference));
    }
  }

  notify(appended);
  if (stale) {
    std::cerr << "[Ledger] Stale deploy rejected: reservation "
              << reservation_id << " in " << account_id << "\n";
    throw StaleReservationError("reservation " +
                                std::to_string(reservation_id) +
                                " is expired or released");
  }
}

// -----------------------------------------------------------------------------
// releaseReservation: reserved -> available
// -----------------------------------------------------------------------------
double Ledger::releaseReservation(const std::string& account_id,
                                  domain::ReservationId reservation_id) {
  AccountState& st = state(account_id);

  std::vector<domain::CapitalTransaction> appended;
  double released = 0.0;
  {
    std::lock_guard lock(st.mutex);
    auto it = st.reservations.find(reservation_id);
    if (it == st.reservations.end()) {
      if (st.retired.count(reservation_id) != 0) {
        return 0.0;
      }
      throw LedgerContractError("release: unknown reservation " +
                                std::to_string(reservation_id) + " in " +
                                account_id);
    }
    if (auto txn = releaseLocked(st, reservation_id, it->second)) {
      released = txn->amount;
      appended.push_back(*txn);
    }
  }

  notify(appended);
  return released;
}

// -----------------------------------------------------------------------------
// returnToAvailable: deployed -> available, realized P&L booked
// -----------------------------------------------------------------------------
void Ledger::returnToAvailable(const std::string& account_id, double amount,
                               double realized_pnl,
                               const std::string& reference) {
  requirePositive(amount, "return");
  if (!std::isfinite(realized_pnl)) {
    throw LedgerContractError("return: realized P&L must be finite");
  }
  AccountState& st = state(account_id);

  std::vector<domain::CapitalTransaction> appended;
  {
    std::lock_guard lock(st.mutex);
    auto& acct = st.account;
    if (amount > acct.deployed_cash + kCashEpsilon) {
      std::ostringstream msg;
      msg << "return: amount " << amount << " exceeds deployed "
          << acct.deployed_cash << " in " << account_id;
      throw LedgerContractError(msg.str());
    }
    if (acct.available_cash + amount + realized_pnl < -kCashEpsilon) {
      throw LedgerContractError("return: loss exceeds available cash in " +
                                account_id);
    }

    acct.deployed_cash -= std::min(amount, acct.deployed_cash);
    settle(acct.deployed_cash);
    acct.available_cash += amount + realized_pnl;
    settle(acct.available_cash);
    acct.realized_pnl += realized_pnl;

    auto& txn = append(st, domain::TransactionType::Return, amount, reference);
    txn.realized_pnl = realized_pnl;
    appended.push_back(txn);
  }

  std::cout << "[Ledger] Returned " << amount << " to " << account_id
            << " (realized " << realized_pnl << ")\n";
  notify(appended);
}

// -----------------------------------------------------------------------------
// transfer: both records under both locks
// -----------------------------------------------------------------------------
bool Ledger::transfer(const std::string& from_account,
                      const std::string& to_account, double amount,
                      const std::string& reference) {
  requirePositive(amount, "transfer");
  if (from_account == to_account) {
    throw LedgerContractError("transfer: source and destination are both " +
                              from_account);
  }
  AccountState& from = state(from_account);
  AccountState& to = state(to_account);

  std::vector<domain::CapitalTransaction> appended;
  {
    std::scoped_lock lock(from.mutex, to.mutex);
    if (amount > from.account.available_cash + kCashEpsilon) {
      std::cerr << "[Ledger] Transfer of " << amount << " from "
                << from_account << " refused: available "
                << from.account.available_cash << "\n";
      return false;
    }

    from.account.available_cash -= amount;
    settle(from.account.available_cash);
    from.account.total_capital -= amount;
    to.account.available_cash += amount;
    to.account.total_capital += amount;

    auto& out =
        append(from, domain::TransactionType::TransferOut, amount, reference);
    out.linked_account_id = to_account;
    appended.push_back(out);

    auto& in = append(to, domain::TransactionType::TransferIn, amount, reference);
    in.linked_account_id = from_account;
    appended.push_back(in);
  }

  std::cout << "[Ledger] Transferred " << amount << " " << from_account
            << " -> " << to_account << "\n";
  notify(appended);
  return true;
}

// -----------------------------------------------------------------------------
// contributeSip
// -----------------------------------------------------------------------------
void Ledger::contributeSip(const std::string& account_id, double amount,
                           const std::string& reference) {
  requirePositive(amount, "SIP contribution");
  AccountState& st = state(account_id);

  std::vector<domain::CapitalTransaction> appended;
  {
    std::lock_guard lock(st.mutex);
    st.account.available_cash += amount;
    st.account.total_capital += amount;
    appended.push_back(append(st, domain::TransactionType::SipContribution,
                              amount, reference));
  }
  notify(appended);
}

// -----------------------------------------------------------------------------
// expireReservations: sweep every account
// -----------------------------------------------------------------------------
std::size_t Ledger::expireReservations() {
  const std::int64_t now = clock_.now_ms();

  std::vector<AccountState*> states;
  {
    std::shared_lock lock(accounts_mutex_);
    states.reserve(accounts_.size());
    for (auto& [id, st] : accounts_) {
      states.push_back(st.get());
    }
  }

  std::size_t expired = 0;
  std::size_t pruned = 0;
  std::vector<domain::CapitalTransaction> appended;
  for (AccountState* st : states) {
    std::lock_guard lock(st->mutex);
    for (auto it = st->reservations.begin(); it != st->reservations.end();) {
      auto& [id, res] = *it;
      if (res.active && now >= res.expires_at_ms) {
        if (auto txn = releaseLocked(*st, id, res)) {
          appended.push_back(*txn);
        }
        ++expired;
      }
      if (res.active) {
        ++it;
        continue;
      }
      retire(*st, id);
      it = st->reservations.erase(it);
      ++pruned;
    }
  }

  if (expired > 0 || pruned > 0) {
    std::cout << "[Ledger] Expired " << expired << " reservation(s), pruned "
              << pruned << "\n";
  }
  notify(appended);
  return expired;
}

bool Ledger::reservationActive(const std::string& account_id,
                               domain::ReservationId reservation_id) const {
  const AccountState& st = state(account_id);
  std::lock_guard lock(st.mutex);
  auto it = st.reservations.find(reservation_id);
  return it != st.reservations.end() && it->second.active &&
         clock_.now_ms() < it->second.expires_at_ms;
}

std::size_t Ledger::reservationCount(const std::string& account_id) const {
  const AccountState& st = state(account_id);
  std::lock_guard lock(st.mutex);
  return st.reservations.size();
}

void Ledger::setPaused(const std::string& account_id, bool paused) {
  AccountState& st = state(account_id);
  std::lock_guard lock(st.mutex);
  st.account.paused = paused;
}

std::optional<domain::Account> Ledger::snapshot(
    const std::string& account_id) const {
  std::shared_lock map_lock(accounts_mutex_);
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  std::lock_guard lock(it->second->mutex);
  return it->second->account;
}

std::vector<domain::CapitalTransaction> Ledger::transactions(
    const std::string& account_id) const {
  const AccountState& st = state(account_id);
  std::lock_guard lock(st.mutex);
  return st.log;
}

double Ledger::deployableCash(const std::string& account_id) const {
  const AccountState& st = state(account_id);
  std::lock_guard lock(st.mutex);
  const double buffer = limits_.emergency_buffer_pct / 100.0;
  return std::max(0.0, st.account.available_cash * (1.0 - buffer));
}

// -----------------------------------------------------------------------------
// portfolioSummary: totals across accounts
// -----------------------------------------------------------------------------
PortfolioSummary Ledger::portfolioSummary() const {
  PortfolioSummary summary;
  std::shared_lock map_lock(accounts_mutex_);
  for (const auto& [id, st] : accounts_) {
    std::lock_guard lock(st->mutex);
    const auto& acct = st->account;
    ++summary.account_count;
    if (acct.paused) {
      ++summary.paused_accounts;
    }
    summary.total_capital += acct.total_capital;
    summary.available_cash += acct.available_cash;
    summary.reserved_cash += acct.reserved_cash;
    summary.deployed_cash += acct.deployed_cash;
    summary.realized_pnl += acct.realized_pnl;
  }

  const double equity = summary.total_capital + summary.realized_pnl;
  if (equity > 0.0) {
    summary.utilization_pct =
        (summary.reserved_cash + summary.deployed_cash) / equity * 100.0;
  }
  return summary;
}

// -----------------------------------------------------------------------------
// replay: fold the transaction log back into balances
// -----------------------------------------------------------------------------
domain::Account Ledger::replay(
    const std::vector<domain::CapitalTransaction>& transactions) {
  using domain::TransactionType;

  domain::Account acct;
  for (const auto& txn : transactions) {
    if (acct.id.empty()) {
      acct.id = txn.account_id;
    } else if (txn.account_id != acct.id) {
      throw LedgerContractError("replay: log mixes accounts " + acct.id +
                                " and " + txn.account_id);
    }

    switch (txn.type) {
      case TransactionType::Deposit:
      case TransactionType::TransferIn:
      case TransactionType::SipContribution:
        acct.total_capital += txn.amount;
        acct.available_cash += txn.amount;
        break;
      case TransactionType::TransferOut:
        acct.total_capital -= txn.amount;
        acct.available_cash -= txn.amount;
        break;
      case TransactionType::Reserve:
        acct.available_cash -= txn.amount;
        acct.reserved_cash += txn.amount;
        break;
      case TransactionType::Release:
        acct.reserved_cash -= txn.amount;
        acct.available_cash += txn.amount;
        break;
      case TransactionType::Deploy:
        acct.reserved_cash -= txn.amount;
        acct.deployed_cash += txn.amount;
        break;
      case TransactionType::Return:
        acct.deployed_cash -= txn.amount;
        acct.available_cash += txn.amount + txn.realized_pnl;
        acct.realized_pnl += txn.realized_pnl;
        break;
    }
  }

  settle(acct.available_cash);
  settle(acct.reserved_cash);
  settle(acct.deployed_cash);
  return acct;
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
Ledger::AccountState& Ledger::state(const std::string& account_id) {
  std::shared_lock lock(accounts_mutex_);
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    throw LedgerContractError("unknown account " + account_id);
  }
  return *it->second;
}

const Ledger::AccountState& Ledger::state(const std::string& account_id) const {
  std::shared_lock lock(accounts_mutex_);
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    throw LedgerContractError("unknown account " + account_id);
  }
  return *it->second;
}

domain::CapitalTransaction& Ledger::append(AccountState& st,
                                           domain::TransactionType type,
                                           double amount,
                                           const std::string& reference) {
  domain::CapitalTransaction txn;
  txn.id = transaction_ids_.next_id();
  txn.account_id = st.account.id;
  txn.type = type;
  txn.amount = amount;
  txn.timestamp_ms = clock_.now_ms();
  txn.reference = reference;
  st.log.push_back(std::move(txn));
  return st.log.back();
}

void Ledger::retire(AccountState& st, domain::ReservationId id) {
  if (!st.retired.insert(id).second) {
    return;
  }
  st.retired_order.push_back(id);
  while (st.retired_order.size() > kRetiredReservationCapacity) {
    st.retired.erase(st.retired_order.front());
    st.retired_order.pop_front();
  }
}

std::optional<domain::CapitalTransaction> Ledger::releaseLocked(
    AccountState& st, domain::ReservationId id, Reservation& res) {
  if (!res.active) {
    return std::nullopt;
  }
  res.active = false;
  const double amount = res.remaining;
  res.remaining = 0.0;
  if (amount <= 0.0) {
    return std::nullopt;
  }

  st.account.reserved_cash -= amount;
  settle(st.account.reserved_cash);
  st.account.available_cash += amount;
  return append(st, domain::TransactionType::Release, amount,
                reservationReference(id));
}

void Ledger::notify(
    const std::vector<domain::CapitalTransaction>& appended) const {
  if (!listener_) {
    return;
  }
  for (const auto& txn : appended) {
    listener_(txn);
  }
}

void Ledger::requirePositive(double amount, const char* operation) {
  if (!std::isfinite(amount) || amount <= 0.0) {
    std::ostringstream msg;
    msg << operation << ": amount must be a positive finite number, got "
        << amount;
    throw LedgerContractError(msg.str());
  }
}

}  // namespace capital
