#pragma once

#include <stdexcept>
#include <string>

namespace capital {

// -----------------------------------------------------------------------------
// LedgerContractError
// -----------------------------------------------------------------------------
// Thrown when a caller asks the Ledger for something that can never be valid:
// non-positive or non-finite amounts, deploying more than a reservation still
// holds, returning more than is deployed, transferring to the same account,
// or naming an account or reservation the Ledger never issued. These are
// programming errors in the caller, not market conditions.
// -----------------------------------------------------------------------------
class LedgerContractError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// -----------------------------------------------------------------------------
// StaleReservationError
// -----------------------------------------------------------------------------
// Thrown by Ledger::deploy() when the reservation has expired or was already
// released. The proposal that owned it is dead; the caller discards it. Any
// remainder of an expired reservation has been returned to available cash
// before the throw.
// -----------------------------------------------------------------------------
class StaleReservationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace capital
