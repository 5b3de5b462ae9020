#pragma once

#include <cstdint>
#include <string>

namespace capital {
namespace domain {

// -----------------------------------------------------------------------------
// TransactionType: every way capital can move inside an account
// -----------------------------------------------------------------------------
// Effect of each type on the balances (a = amount, p = realized_pnl):
//
//   Deposit          total += a, available += a   (account opening)
//   SipContribution  total += a, available += a
//   TransferIn       total += a, available += a
//   TransferOut      total -= a, available -= a
//   Reserve          available -= a, reserved += a
//   Release          reserved -= a, available += a
//   Deploy           reserved -= a, deployed += a
//   Return           deployed -= a, available += a + p, realized += p
// -----------------------------------------------------------------------------
enum class TransactionType {
  Deposit,
  Reserve,
  Release,
  Deploy,
  Return,
  TransferIn,
  TransferOut,
  SipContribution,
};

// -----------------------------------------------------------------------------
// CapitalTransaction: one append-only audit entry
// -----------------------------------------------------------------------------
//
// @brief  The Ledger writes exactly one of these per balance transition.
//
// @details
// The per-account transaction log is the audit source of truth: replaying it
// from an empty account with Ledger::replay() reproduces the live balances.
//
// reference carries the signal, proposal or position id that caused the
// movement. linked_account_id is set on TransferIn / TransferOut and names
// the counterparty account.
// -----------------------------------------------------------------------------
struct CapitalTransaction {
  std::uint64_t id{0};
  std::string account_id;
  TransactionType type{TransactionType::Deposit};
  double amount{0.0};
  double realized_pnl{0.0};
  std::int64_t timestamp_ms{0};
  std::string reference;
  std::string linked_account_id;
};

const char* transactionTypeToString(TransactionType type);

}  // namespace domain
}  // namespace capital
