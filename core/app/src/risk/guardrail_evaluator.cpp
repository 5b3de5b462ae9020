#include "capital/risk/guardrail_evaluator.hpp"

#include <chrono>
#include <iostream>

namespace capital {

GuardrailEvaluator::GuardrailEvaluator(const ITimeProvider& clock,
                                       const domain::GuardrailLimits& limits)
    : clock_(clock), limits_(limits) {}

bool GuardrailEvaluator::blocks(const domain::GuardrailResult& result) const {
  return result.has_critical_failure ||
         (limits_.block_on_warning && !result.passed_all);
}

// -----------------------------------------------------------------------------
// evaluate: run all checks, reduce, register a block if needed
// -----------------------------------------------------------------------------
GuardrailDecision GuardrailEvaluator::evaluate(const GuardrailInput& input) {
  const auto started = std::chrono::steady_clock::now();

  std::array<domain::CheckOutcome, domain::kGuardrailCheckCount> outcomes;
  const auto& checks = guardrailChecks();
  for (std::size_t i = 0; i < checks.size(); ++i) {
    outcomes[i] = checks[i](input, limits_);
  }

  GuardrailDecision decision;
  decision.result = reduceOutcomes(outcomes);
  decision.result.account_id = input.account.id;
  decision.result.signal_id = input.signal.id;
  decision.result.symbol = input.signal.symbol;
  decision.result.evaluated_at_ms = input.now_ms;
  decision.result.duration_us =
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - started)
          .count();

  if (!blocks(decision.result)) {
    return decision;
  }

  // --- Blocking path: reuse the open record or create one --------------------
  const BlockKey key{input.signal.id, input.account.id};
  std::lock_guard lock(blocks_mutex_);
  auto it = open_blocks_.find(key);
  if (it != open_blocks_.end()) {
    decision.block = it->second;
    return decision;
  }

  domain::BlockRecord record;
  record.id = block_ids_.next_id();
  record.account_id = input.account.id;
  record.signal_id = input.signal.id;
  record.symbol = input.signal.symbol;
  record.created_at_ms = clock_.now_ms();
  for (const auto& w : decision.result.warnings) {
    if (w.severity == domain::Severity::Critical ||
        (limits_.block_on_warning && w.severity == domain::Severity::Warning)) {
      record.reason_codes.push_back(w.code);
    }
  }

  open_blocks_.emplace(key, record);
  decision.block = record;
  decision.block_created = true;

  std::cerr << "[GuardrailEvaluator] BLOCK #" << record.id << " "
            << record.account_id << " " << record.symbol << ":";
  for (const auto& code : record.reason_codes) {
    std::cerr << " " << code;
  }
  std::cerr << "\n";
  return decision;
}

std::optional<domain::BlockRecord> GuardrailEvaluator::openBlock(
    const std::string& signal_id, const std::string& account_id) const {
  std::lock_guard lock(blocks_mutex_);
  auto it = open_blocks_.find(BlockKey{signal_id, account_id});
  if (it == open_blocks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::BlockRecord> GuardrailEvaluator::closeBlock(
    domain::BlockId block_id) {
  std::lock_guard lock(blocks_mutex_);
  for (auto it = open_blocks_.begin(); it != open_blocks_.end(); ++it) {
    if (it->second.id == block_id) {
      domain::BlockRecord closed = std::move(it->second);
      closed.open = false;
      open_blocks_.erase(it);
      std::cout << "[GuardrailEvaluator] Closed block #" << block_id << "\n";
      return closed;
    }
  }
  return std::nullopt;
}

std::vector<domain::BlockRecord> GuardrailEvaluator::openBlocks(
    const std::string& account_id) const {
  std::lock_guard lock(blocks_mutex_);
  std::vector<domain::BlockRecord> result;
  for (const auto& [key, record] : open_blocks_) {
    if (record.account_id == account_id) {
      result.push_back(record);
    }
  }
  return result;
}

}  // namespace capital
