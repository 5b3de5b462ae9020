#pragma once

#include <atomic>
#include <cstdint>

namespace capital {

// -----------------------------------------------------------------------------
// SequenceGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids for capital transactions, reservations,
//         proposals, positions and block records.
//
// @details
// Starts at 1; id 0 is the "unset" sentinel in every domain struct. The
// counter is a single atomic so concurrent allocations for different
// accounts can draw ids without sharing a lock. memory_order_relaxed is
// enough because uniqueness is the only guarantee callers rely on.
//
// Owned as a value member by whoever owns the id space (Ledger,
// PositionBook, GuardrailEvaluator, AllocationEngine). Not a singleton.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  // Atomics are not movable, and a copied generator would issue duplicates.
  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace capital
