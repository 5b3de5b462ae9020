#pragma once

#include "capital/concurrent/sequence_generator.hpp"
#include "capital/domain/guardrail_result.hpp"
#include "capital/domain/risk_limits.hpp"
#include "capital/domain/trade_proposal.hpp"
#include "capital/risk/guardrail_checks.hpp"
#include "capital/time/i_time_provider.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace capital {

// Output of GuardrailEvaluator::evaluate().
//   block          set whenever the result blocks: the new record, or the
//                  open one already on file for this (signal, account)
//   block_created  true only when this call created the record
struct GuardrailDecision {
  domain::GuardrailResult result;
  std::optional<domain::BlockRecord> block;
  bool block_created{false};

  bool blocked() const { return block.has_value(); }
};

// -----------------------------------------------------------------------------
// GuardrailEvaluator: six checks, one verdict, idempotent blocks
// -----------------------------------------------------------------------------
//
// @brief  Runs every check from guardrailChecks() against one proposal,
//         reduces the outcomes, and records a BlockRecord when the result
//         blocks.
//
// @details
// A result blocks when has_critical_failure is set, or when
// block_on_warning is configured and passed_all is false. WARNING alone
// never blocks by default; it travels to the approver on the proposal.
//
// All six checks always run, even after a CRITICAL, so the record lists
// every reason.
//
// Block idempotency:
//   Blocks are keyed by (signal_id, account_id). While a block for the pair
//   is open, a blocking re-evaluation returns that record with
//   block_created == false. closeBlock() reopens the pair for a future
//   block.
//
// Thread model:
//   The checks are pure and run without a lock. The block registry is
//   guarded by one mutex; it is touched only on the blocking path and by
//   the query methods.
// -----------------------------------------------------------------------------
class GuardrailEvaluator {
 public:
  GuardrailEvaluator(const ITimeProvider& clock,
                     const domain::GuardrailLimits& limits);

  GuardrailEvaluator(const GuardrailEvaluator&) = delete;
  GuardrailEvaluator& operator=(const GuardrailEvaluator&) = delete;

  GuardrailDecision evaluate(const GuardrailInput& input);

  // True when result must not be reserved under the configured policy.
  bool blocks(const domain::GuardrailResult& result) const;

  std::optional<domain::BlockRecord> openBlock(
      const std::string& signal_id, const std::string& account_id) const;

  // Closes an open block and returns it with open == false. nullopt if the
  // id is unknown or already closed.
  std::optional<domain::BlockRecord> closeBlock(domain::BlockId block_id);

  std::vector<domain::BlockRecord> openBlocks(
      const std::string& account_id) const;

  const domain::GuardrailLimits& limits() const { return limits_; }

 private:
  using BlockKey = std::pair<std::string, std::string>;  // signal, account

  const ITimeProvider& clock_;
  domain::GuardrailLimits limits_;

  SequenceGenerator block_ids_;

  mutable std::mutex blocks_mutex_;
  std::map<BlockKey, domain::BlockRecord> open_blocks_;
};

}  // namespace capital
