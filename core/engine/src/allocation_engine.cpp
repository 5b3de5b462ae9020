#include "capital/engine/allocation_engine.hpp"
#include "capital/allocation/playbook.hpp"
#include "capital/codec/json_codec.hpp"
#include "capital/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace capital {

const char* allocationOutcomeToString(AllocationOutcome outcome) {
  switch (outcome) {
    case AllocationOutcome::Proposed:
      return "PROPOSED";
    case AllocationOutcome::Blocked:
      return "BLOCKED";
    case AllocationOutcome::Ineligible:
      return "INELIGIBLE";
    case AllocationOutcome::Paused:
      return "PAUSED";
    case AllocationOutcome::ZeroSize:
      return "ZERO_SIZE";
    case AllocationOutcome::InsufficientFunds:
      return "INSUFFICIENT_FUNDS";
    case AllocationOutcome::ConfigurationError:
      return "CONFIGURATION_ERROR";
    case AllocationOutcome::NoMarketData:
      return "NO_MARKET_DATA";
    case AllocationOutcome::PositionLimit:
      return "POSITION_LIMIT";
    case AllocationOutcome::ProposalLimit:
      return "PROPOSAL_LIMIT";
  }
  return "UNKNOWN";
}

namespace {

AllocationDecision makeDecision(const std::string& account_id,
                                const domain::Signal& signal,
                                AllocationOutcome outcome,
                                std::string reason) {
  AllocationDecision d;
  d.account_id = account_id;
  d.signal_id = signal.id;
  d.symbol = signal.symbol;
  d.outcome = outcome;
  d.reason = std::move(reason);
  return d;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AllocationEngine::AllocationEngine(const ITimeProvider& clock,
                                   EngineConfig config,
                                   SimulationTimeProvider* replay_clock)
    : clock_(clock),
      config_(std::move(config)),
      replay_clock_(replay_clock),
      sizer_(config_.sizing) {
  validateLimits(config_);

  ledger_ = std::make_unique<Ledger>(
      clock_, config_.treasury,
      [this](const domain::CapitalTransaction& txn) {
        publish(CapitalTransactionEvent{txn, now(), 0});
      });
  mandates_ = std::make_unique<MandateStore>();
  positions_ = std::make_unique<PositionBook>();
  kill_switches_ = std::make_unique<KillSwitchMonitor>(*ledger_, clock_);
  guardrails_ =
      std::make_unique<GuardrailEvaluator>(clock_, config_.guardrails);

  for (const auto& account : config_.accounts) {
    try {
      addAccount(account);
    } catch (const capital::ConfigurationError& e) {
      std::cerr << "[AllocationEngine] Refused account " << account.id << ": "
                << e.what() << "\n";
      refused_accounts_.push_back(account.id);
    }
  }

  subscribeInbound();

  std::cout << "[AllocationEngine] " << ledger_->accountIds().size()
            << " account(s) open, " << refused_accounts_.size()
            << " refused.\n";
}

AllocationEngine::~AllocationEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void AllocationEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Inbound loop first: it consumes what the feed produces ----------
  inbound_loop_.start();

  if (config_.endpoints.enabled) {
    // ---  2) IpcServer (telemetry + commands) ------------------------------
    {
      std::lock_guard lock(ipc_mutex_);
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          config_.endpoints.command, config_.endpoints.telemetry);
      ipc_server_->start();
    }

    // ---  3) Signal feed LAST (messages begin flowing) ---------------------
    signal_feed_thread_ = std::make_unique<SignalFeedThread>(
        replay_clock_, [this](Event event) { pushEvent(std::move(event)); },
        config_.endpoints.signal_feed);
    signal_feed_thread_->start();
  }

  running_ = true;

  std::cout << "[AllocationEngine] started. Threads: inbound"
            << (signal_feed_thread_ ? ", signal_feed, ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void AllocationEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new inbound messages -------------------------------------------
  signal_feed_thread_.reset();

  // ---  2) Stop the inbound loop (queued events are dropped) ----------------
  inbound_loop_.stop();

  // ---  3) IpcServer last so telemetry from steps 1-2 is still published ----
  std::unique_ptr<IpcServer> server;
  {
    std::lock_guard lock(ipc_mutex_);
    server = std::move(ipc_server_);
  }
  server.reset();

  running_ = false;

  std::cout << "[AllocationEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Inbound wiring
// -----------------------------------------------------------------------------
void AllocationEngine::subscribeInbound() {
  auto& bus = inbound_loop_.eventBus();

  bus.subscribe<SignalBatchEvent>([this](const SignalBatchEvent& e) {
    allocate(e.signals);
  });
  bus.subscribe<MarketSnapshotEvent>([this](const MarketSnapshotEvent& e) {
    updateMarket(e.snapshot);
  });
  bus.subscribe<PnlUpdateEvent>([this](const PnlUpdateEvent& e) {
    onPnlUpdate(e.account_id, e.realized_daily_pnl, e.unrealized_pnl);
  });
  bus.subscribe<ProposalFilledEvent>([this](const ProposalFilledEvent& e) {
    onProposalFilled(e.proposal_id, e.filled_quantity, e.fill_price);
  });
  bus.subscribe<ProposalRejectedEvent>(
      [this](const ProposalRejectedEvent& e) {
        onProposalRejected(e.proposal_id, e.reason);
      });
  bus.subscribe<PositionClosedEvent>([this](const PositionClosedEvent& e) {
    try {
      onPositionClosed(e.position_id, e.exit_price);
    } catch (const LedgerContractError& err) {
      std::cerr << "[AllocationEngine] ERROR: close of position #"
                << e.position_id << " rejected by ledger: " << err.what()
                << "\n";
    }
  });
  bus.subscribe<TrancheReleaseEvent>([this](const TrancheReleaseEvent& e) {
    releaseTranche(e.proposal_id, e.tranche_index);
  });
  bus.subscribe<BlockCloseEvent>([this](const BlockCloseEvent& e) {
    if (!closeBlock(e.block_id)) {
      std::cerr << "[AllocationEngine] WARNING: unblock for unknown or "
                   "closed block #"
                << e.block_id << "\n";
    }
  });
  bus.subscribe<HeartbeatEvent>([this](const HeartbeatEvent&) {
    sweepExpiredReservations();
    releaseDueTranches();
  });
}

void AllocationEngine::pushEvent(Event event) {
  inbound_loop_.push(std::move(event));
}

void AllocationEngine::publish(Event event) {
  std::visit(
      [this](auto& e) {
        if (e.sequence_id == 0) {
          e.sequence_id = outbound_sequence_.next_id();
        }
      },
      event);

  outbound_bus_.publish(event);

  std::lock_guard lock(ipc_mutex_);
  if (ipc_server_) {
    ipc_server_->pushTelemetry(std::move(event));
  }
}

Timestamp AllocationEngine::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// addAccount(): validate everything, then mutate
// -----------------------------------------------------------------------------
void AllocationEngine::addAccount(const AccountConfig& account) {
  domain::Mandate mandate = account.mandate;
  mandate.account_id = account.id;
  MandateStore::validate(mandate);

  std::vector<domain::KillSwitch> switches = account.kill_switches;
  for (auto sw : config_.default_kill_switches) {
    switches.push_back(std::move(sw));
  }
  for (auto& sw : switches) {
    sw.account_id = account.id;
    if (!(sw.threshold < 0.0)) {
      throw ConfigurationError("kill switch for " + account.id +
                               ": threshold must be negative");
    }
  }

  double carried_cost = 0.0;
  for (const auto& pos : account.positions) {
    if (pos.symbol.empty() || !std::isfinite(pos.quantity) ||
        !(pos.quantity > 0.0) || !std::isfinite(pos.entry_price) ||
        !(pos.entry_price > 0.0)) {
      throw ConfigurationError("account " + account.id +
                               ": carried position needs a symbol, quantity "
                               "and entry_price");
    }
    carried_cost += pos.quantity * pos.entry_price;
  }
  if (carried_cost > account.initial_capital) {
    throw ConfigurationError("account " + account.id +
                             ": carried positions cost more than the "
                             "initial capital");
  }

  // The lock exists before the ledger lists the account, so a concurrent
  // allocate() never sees an account it cannot lock.
  bool inserted = false;
  {
    std::unique_lock lock(locks_mutex_);
    inserted = allocation_locks_
                   .try_emplace(account.id, std::make_unique<std::mutex>())
                   .second;
  }
  try {
    ledger_->openAccount(account.id, account.objective,
                         account.initial_capital);
  } catch (const capital::ConfigurationError&) {
    if (inserted) {
      std::unique_lock lock(locks_mutex_);
      allocation_locks_.erase(account.id);
    }
    throw;
  }

  mandates_->publish(std::move(mandate));
  for (const auto& sw : switches) {
    kill_switches_->addSwitch(sw);
  }
  openCarriedPositions(account);

  std::cout << "[AllocationEngine] Account " << account.id << " open: "
            << account.initial_capital << " "
            << domain::objectiveToString(account.objective) << ", "
            << switches.size() << " kill switch(es), "
            << account.positions.size() << " carried position(s)\n";
}

// Each carried position goes through reserve → deploy like a fill would, so
// the transaction log alone explains the deployed balance.
void AllocationEngine::openCarriedPositions(const AccountConfig& account) {
  for (auto pos : account.positions) {
    pos.account_id = account.id;
    pos.cost_basis = pos.quantity * pos.entry_price;

    const auto reserved = ledger_->reserve(account.id, pos.cost_basis,
                                           "carried:" + pos.symbol);
    if (!reserved.ok()) {
      throw LedgerContractError("carried position " + pos.symbol + " in " +
                                account.id + " does not fit the capital");
    }
    ledger_->deploy(account.id, reserved.reservation_id, pos.cost_basis);

    const auto booked = positions_->hydratePosition(std::move(pos));
    std::cout << "[AllocationEngine] Carried position #" << booked.id << " "
              << account.id << " " << booked.quantity << " " << booked.symbol
              << " @ " << booked.entry_price << "\n";
  }
}

std::uint32_t AllocationEngine::publishMandate(domain::Mandate mandate) {
  if (!ledger_->hasAccount(mandate.account_id)) {
    throw ConfigurationError("mandate for unknown account " +
                             mandate.account_id);
  }
  std::lock_guard lock(allocationLock(mandate.account_id));
  return mandates_->publish(std::move(mandate));
}

void AllocationEngine::updateMarket(const domain::MarketSnapshot& snapshot) {
  if (snapshot.symbol.empty()) {
    std::cerr << "[AllocationEngine] WARNING: market snapshot without symbol "
                 "dropped\n";
    return;
  }
  std::lock_guard lock(market_mutex_);
  markets_[snapshot.symbol] = snapshot;
}

std::optional<domain::MarketSnapshot> AllocationEngine::market(
    const std::string& symbol) const {
  std::lock_guard lock(market_mutex_);
  auto it = markets_.find(symbol);
  if (it == markets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::mutex& AllocationEngine::allocationLock(const std::string& account_id) {
  std::shared_lock lock(locks_mutex_);
  auto it = allocation_locks_.find(account_id);
  if (it == allocation_locks_.end()) {
    throw LedgerContractError("unknown account " + account_id);
  }
  return *it->second;
}

// -----------------------------------------------------------------------------
// allocate(): one batch, every account
// -----------------------------------------------------------------------------
std::vector<AllocationDecision> AllocationEngine::allocate(
    const std::vector<domain::Signal>& signals) {
  sweepExpiredReservations();

  auto accounts = ledger_->accountIds();
  std::sort(accounts.begin(), accounts.end());

  std::vector<AllocationDecision> decisions;
  std::size_t proposed = 0;
  for (const auto& account_id : accounts) {
    for (auto& d : allocateForAccount(account_id, signals)) {
      if (d.outcome == AllocationOutcome::Proposed) {
        ++proposed;
      }
      decisions.push_back(std::move(d));
    }
  }

  std::cout << "[AllocationEngine] Batch of " << signals.size()
            << " signal(s) across " << accounts.size() << " account(s): "
            << proposed << " proposal(s)\n";
  return decisions;
}

// -----------------------------------------------------------------------------
// allocateForAccount(): filter → gate → rank → size → evaluate → reserve
// -----------------------------------------------------------------------------
std::vector<AllocationDecision> AllocationEngine::allocateForAccount(
    const std::string& account_id,
    const std::vector<domain::Signal>& signals) {
  std::vector<AllocationDecision> decisions;

  std::lock_guard lock(allocationLock(account_id));

  const auto account = ledger_->snapshot(account_id);
  const auto mandate = mandates_->current(account_id);
  if (!account || !mandate) {
    for (const auto& signal : signals) {
      decisions.push_back(makeDecision(account_id, signal,
                                       AllocationOutcome::ConfigurationError,
                                       "NO_MANDATE"));
    }
    return decisions;
  }

  // --- 1) Mandate filter (includes the kill-switch pause gate) ---------------
  std::vector<RankedCandidate> candidates;
  for (const auto& signal : signals) {
    const auto verdict = filter_.evaluate(signal, *mandate, *account);
    if (!verdict.eligible) {
      const auto outcome = verdict.reason == "ACCOUNT_PAUSED"
                               ? AllocationOutcome::Paused
                               : AllocationOutcome::Ineligible;
      decisions.push_back(
          makeDecision(account_id, signal, outcome, verdict.reason));
      continue;
    }

    auto snapshot = market(signal.symbol);
    if (!snapshot) {
      if (!signal.entry_price) {
        decisions.push_back(makeDecision(account_id, signal,
                                         AllocationOutcome::NoMarketData,
                                         "NO_MARKET_DATA"));
        continue;
      }
      snapshot = domain::MarketSnapshot{};
      snapshot->symbol = signal.symbol;
      snapshot->price = *signal.entry_price;
    }
    candidates.push_back(RankedCandidate{signal, snapshot->volatility(), 0.0});
  }

  // --- 2) Objective ordering -------------------------------------------------
  const auto ranked = ranker_.rank(std::move(candidates), account->objective);

  // --- 3) Size, evaluate, reserve in rank order ------------------------------
  const int max_open = mandate->max_open_positions;
  std::size_t committed =
      positions_->openCount(account_id) + pendingCount(account_id);
  int proposals = 0;

  for (const auto& candidate : ranked) {
    const auto& signal = candidate.signal;

    if (proposals >= config_.treasury.max_proposals_per_batch) {
      auto d = makeDecision(account_id, signal,
                            AllocationOutcome::ProposalLimit,
                            "MAX_PROPOSALS_PER_BATCH");
      d.score = candidate.score;
      decisions.push_back(std::move(d));
      continue;
    }
    if (max_open > 0 && committed >= static_cast<std::size_t>(max_open)) {
      auto d = makeDecision(account_id, signal,
                            AllocationOutcome::PositionLimit,
                            "MAX_OPEN_POSITIONS");
      d.score = candidate.score;
      decisions.push_back(std::move(d));
      continue;
    }

    // Balances move with every reservation; re-read per candidate.
    const auto current = ledger_->snapshot(account_id);
    auto snapshot = market(signal.symbol);
    if (!snapshot) {
      snapshot = domain::MarketSnapshot{};
      snapshot->symbol = signal.symbol;
      snapshot->price = signal.entry_price.value_or(0.0);
    }

    auto d = allocateOne(*current, *mandate, candidate, *snapshot);
    if (d.outcome == AllocationOutcome::Proposed) {
      ++proposals;
      ++committed;
    }
    decisions.push_back(std::move(d));
  }

  return decisions;
}

// -----------------------------------------------------------------------------
// allocateOne(): caller holds the account's allocation lock
// -----------------------------------------------------------------------------
AllocationDecision AllocationEngine::allocateOne(
    const domain::Account& account, const domain::Mandate& mandate,
    const RankedCandidate& candidate, const domain::MarketSnapshot& market) {
  const auto& signal = candidate.signal;

  // An open block short-circuits: no re-sizing, no new record.
  if (auto open = guardrails_->openBlock(signal.id, account.id)) {
    auto d = makeDecision(account.id, signal, AllocationOutcome::Blocked,
                          "BLOCK_OPEN");
    d.score = candidate.score;
    d.block = std::move(open);
    return d;
  }

  const auto params = applyPlaybook(signal, mandate);
  const auto sizing =
      sizer_.size(signal, mandate, account, market, params,
                  ledger_->deployableCash(account.id));

  if (sizing.quantity <= 0.0) {
    auto d = makeDecision(account.id, signal, AllocationOutcome::ZeroSize,
                          bindingConstraintToString(sizing.binding));
    d.score = candidate.score;
    return d;
  }

  const GuardrailInput input{signal,
                             mandate,
                             account,
                             market,
                             sizing.quantity,
                             sizing.entry_price,
                             sizing.stop_loss,
                             positions_->sectorNotional(account.id,
                                                        signal.sector),
                             clock_.now_ms()};
  auto verdict = guardrails_->evaluate(input);

  if (verdict.blocked()) {
    auto d = makeDecision(account.id, signal, AllocationOutcome::Blocked,
                          verdict.block->reason_codes.empty()
                              ? std::string("BLOCKED")
                              : verdict.block->reason_codes.front());
    d.score = candidate.score;
    d.block = verdict.block;
    d.guardrails = verdict.result;
    if (verdict.block_created) {
      publish(BlockRecordEvent{*verdict.block, now(), 0});
    }
    return d;
  }

  // --- Reserve the first tranche ---------------------------------------------
  const double first = sizing.firstTrancheQuantity();
  const double amount = first * sizing.entry_price;
  const auto reserved =
      ledger_->reserve(account.id, amount, "signal:" + signal.id);
  if (!reserved.ok()) {
    auto d = makeDecision(account.id, signal,
                          AllocationOutcome::InsufficientFunds,
                          "INSUFFICIENT_FUNDS");
    d.score = candidate.score;
    d.guardrails = verdict.result;
    return d;
  }

  domain::TradeProposal proposal;
  proposal.id = proposal_ids_.next_id();
  proposal.account_id = account.id;
  proposal.signal_id = signal.id;
  proposal.symbol = signal.symbol;
  proposal.sector = signal.sector;
  proposal.direction = signal.direction;
  proposal.quantity = first;
  proposal.planned_quantity = sizing.quantity;
  proposal.tranches = sizing.tranches;
  proposal.entry_price = sizing.entry_price;
  proposal.stop_loss = sizing.stop_loss;
  proposal.take_profit = sizing.take_profit;
  proposal.risk_amount = first * sizing.risk_per_unit;
  proposal.reward_amount =
      first * std::abs(sizing.take_profit - sizing.entry_price);
  proposal.score = candidate.score;
  proposal.reserved_amount = amount;
  proposal.reservation_id = reserved.reservation_id;
  proposal.expires_at_ms = reserved.expires_at_ms;
  proposal.guardrails = verdict.result;

  {
    std::lock_guard lock(pending_mutex_);
    pending_.emplace(proposal.id, proposal);
    if (proposal.tranches.size() > 1) {
      DeferredTranches later{proposal, clock_.now_ms(), {}};
      for (std::size_t i = 1; i < proposal.tranches.size(); ++i) {
        later.waiting.push_back(i);
      }
      deferred_.emplace(proposal.id, std::move(later));
    }
  }

  std::cout << "[AllocationEngine] PROPOSAL #" << proposal.id << " "
            << account.id << " " << domain::directionToString(signal.direction)
            << " " << proposal.quantity << "/" << proposal.planned_quantity
            << " " << proposal.symbol << " @ " << proposal.entry_price
            << " stop=" << proposal.stop_loss << " reserved=" << amount << " ("
            << bindingConstraintToString(sizing.binding) << ", "
            << proposal.guardrails.warnings.size() << " observation(s))\n";

  publish(TradeProposalEvent{proposal, now(), 0});

  auto d = makeDecision(account.id, signal, AllocationOutcome::Proposed,
                        proposal.guardrails.passed_all ? "PASSED"
                                                       : "PASSED_WITH_WARNINGS");
  d.score = candidate.score;
  d.guardrails = proposal.guardrails;
  d.proposal = std::move(proposal);
  return d;
}

// -----------------------------------------------------------------------------
// Execution feedback
// -----------------------------------------------------------------------------
std::optional<domain::TradeProposal> AllocationEngine::takePending(
    domain::ProposalId proposal_id) {
  std::lock_guard lock(pending_mutex_);
  auto it = pending_.find(proposal_id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  auto proposal = std::move(it->second);
  pending_.erase(it);
  return proposal;
}

std::optional<domain::Position> AllocationEngine::onProposalFilled(
    domain::ProposalId proposal_id, double filled_quantity,
    double fill_price) {
  auto proposal = takePending(proposal_id);
  if (!proposal) {
    std::cerr << "[AllocationEngine] WARNING: fill for unknown proposal #"
              << proposal_id << "\n";
    return std::nullopt;
  }

  const auto& account_id = proposal->account_id;
  std::lock_guard lock(allocationLock(account_id));

  if (!(filled_quantity > 0.0) || !(fill_price > 0.0)) {
    std::cerr << "[AllocationEngine] WARNING: empty fill for proposal #"
              << proposal_id << ", releasing\n";
    ledger_->releaseReservation(account_id, proposal->reservation_id);
    dropDeferred(proposal_id);
    return std::nullopt;
  }

  const double cost = filled_quantity * fill_price;
  try {
    ledger_->deploy(account_id, proposal->reservation_id, cost);
  } catch (const StaleReservationError& e) {
    std::cerr << "[AllocationEngine] Proposal #" << proposal_id
              << " discarded: " << e.what() << "\n";
    dropDeferred(proposal_id);
    return std::nullopt;
  } catch (const LedgerContractError& e) {
    std::cerr << "[AllocationEngine] ERROR: fill for proposal #"
              << proposal_id << " exceeds its reservation: " << e.what()
              << "\n";
    ledger_->releaseReservation(account_id, proposal->reservation_id);
    dropDeferred(proposal_id);
    return std::nullopt;
  }

  // Partial fills hand the unused part of the reservation back.
  ledger_->releaseReservation(account_id, proposal->reservation_id);

  auto position = positions_->open(*proposal, filled_quantity, fill_price);
  publish(PositionUpdateEvent{position, now(), 0});
  return position;
}

bool AllocationEngine::onProposalRejected(domain::ProposalId proposal_id,
                                          const std::string& reason) {
  auto proposal = takePending(proposal_id);
  if (!proposal) {
    std::cerr << "[AllocationEngine] WARNING: reject for unknown proposal #"
              << proposal_id << "\n";
    return false;
  }

  std::lock_guard lock(allocationLock(proposal->account_id));
  const double released =
      ledger_->releaseReservation(proposal->account_id, proposal->reservation_id);
  const std::size_t dropped = dropDeferred(proposal_id);

  std::cerr << "[AllocationEngine] Proposal #" << proposal_id
            << " rejected downstream (" << reason << "), released "
            << released << ", " << dropped << " deferred tranche(s) dropped\n";
  return true;
}

std::optional<domain::Position> AllocationEngine::onPositionClosed(
    domain::PositionId position_id, double exit_price) {
  const auto open = positions_->position(position_id);
  if (!open || open->status != domain::PositionStatus::Open) {
    return std::nullopt;
  }

  std::lock_guard lock(allocationLock(open->account_id));

  // Re-read under the lock: a concurrent close of the same id settles once.
  const auto current = positions_->position(position_id);
  if (!current || current->status != domain::PositionStatus::Open) {
    return std::nullopt;
  }

  // The Ledger settles first. If it refuses, the position is still OPEN.
  ledger_->returnToAvailable(current->account_id, current->cost_basis,
                             PositionBook::realizedPnl(*current, exit_price),
                             "position:" + std::to_string(current->id));

  auto position = positions_->close(position_id, exit_price);
  if (position) {
    publish(PositionUpdateEvent{*position, now(), 0});
  }
  return position;
}

std::vector<domain::KillSwitch> AllocationEngine::onPnlUpdate(
    const std::string& account_id, double realized_daily_pnl,
    double unrealized_pnl) {
  auto tripped =
      kill_switches_->onPnlUpdate(account_id, realized_daily_pnl, unrealized_pnl);
  for (const auto& sw : tripped) {
    publish(KillSwitchEvent{sw, false, now(), 0});
  }
  return tripped;
}

std::size_t AllocationEngine::sweepExpiredReservations() {
  const std::size_t expired = ledger_->expireReservations();

  std::lock_guard lock(pending_mutex_);
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (!ledger_->reservationActive(it->second.account_id,
                                    it->second.reservation_id)) {
      std::cerr << "[AllocationEngine] Proposal #" << it->first
                << " expired unfilled\n";
      deferred_.erase(it->first);
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
  return expired;
}

// -----------------------------------------------------------------------------
// Tranche release
// -----------------------------------------------------------------------------
std::size_t AllocationEngine::dropDeferred(domain::ProposalId proposal_id) {
  std::lock_guard lock(pending_mutex_);
  auto it = deferred_.find(proposal_id);
  if (it == deferred_.end()) {
    return 0;
  }
  const std::size_t dropped = it->second.waiting.size();
  deferred_.erase(it);
  return dropped;
}

std::optional<domain::TradeProposal> AllocationEngine::releaseTranche(
    domain::ProposalId proposal_id, std::size_t tranche_index) {
  std::string account_id;
  {
    std::lock_guard lock(pending_mutex_);
    auto it = deferred_.find(proposal_id);
    if (it != deferred_.end()) {
      account_id = it->second.parent.account_id;
    }
  }
  if (account_id.empty()) {
    std::cerr << "[AllocationEngine] WARNING: no deferred tranches for "
                 "proposal #"
              << proposal_id << "\n";
    return std::nullopt;
  }

  std::lock_guard allocation(allocationLock(account_id));

  // The leg is looked up again under the allocation lock; it may have been
  // released or dropped in between.
  domain::TradeProposal parent;
  {
    std::lock_guard lock(pending_mutex_);
    auto it = deferred_.find(proposal_id);
    if (it == deferred_.end() ||
        std::find(it->second.waiting.begin(), it->second.waiting.end(),
                  tranche_index) == it->second.waiting.end()) {
      std::cerr << "[AllocationEngine] WARNING: tranche " << tranche_index
                << " of proposal #" << proposal_id
                << " is not waiting for release\n";
      return std::nullopt;
    }
    parent = it->second.parent;
  }

  const auto account = ledger_->snapshot(account_id);
  if (!account || account->paused) {
    std::cerr << "[AllocationEngine] Tranche " << tranche_index
              << " of proposal #" << proposal_id << " held: account "
              << account_id << " paused\n";
    return std::nullopt;
  }

  const auto& leg = parent.tranches[tranche_index];
  const double quantity = sizer_.sizeTranche(
      leg.quantity, parent.entry_price, ledger_->deployableCash(account_id));
  if (quantity <= 0.0) {
    std::cerr << "[AllocationEngine] Tranche " << tranche_index
              << " of proposal #" << proposal_id
              << " held: no deployable cash\n";
    return std::nullopt;
  }

  const double amount = quantity * parent.entry_price;
  const auto reserved = ledger_->reserve(
      account_id, amount,
      "signal:" + parent.signal_id + ":tranche:" +
          std::to_string(tranche_index));
  if (!reserved.ok()) {
    return std::nullopt;
  }

  domain::TradeProposal proposal = parent;
  proposal.id = proposal_ids_.next_id();
  proposal.parent_id = parent.id;
  proposal.tranche_index = tranche_index;
  proposal.quantity = quantity;
  const double risk_per_unit = std::abs(parent.entry_price - parent.stop_loss);
  proposal.risk_amount = quantity * risk_per_unit;
  proposal.reward_amount =
      quantity * std::abs(parent.take_profit - parent.entry_price);
  proposal.reserved_amount = amount;
  proposal.reservation_id = reserved.reservation_id;
  proposal.expires_at_ms = reserved.expires_at_ms;

  {
    std::lock_guard lock(pending_mutex_);
    pending_.emplace(proposal.id, proposal);
    auto it = deferred_.find(proposal_id);
    if (it != deferred_.end()) {
      auto& waiting = it->second.waiting;
      waiting.erase(std::remove(waiting.begin(), waiting.end(), tranche_index),
                    waiting.end());
      if (waiting.empty()) {
        deferred_.erase(it);
      }
    }
  }

  std::cout << "[AllocationEngine] PROPOSAL #" << proposal.id << " "
            << account_id << " tranche " << tranche_index << " of #"
            << parent.id << ": " << quantity << " " << proposal.symbol
            << " @ " << proposal.entry_price << " reserved=" << amount
            << "\n";

  publish(TradeProposalEvent{proposal, now(), 0});
  return proposal;
}

std::size_t AllocationEngine::releaseDueTranches() {
  const std::int64_t now_ms = clock_.now_ms();

  std::vector<std::pair<domain::ProposalId, std::size_t>> due;
  {
    std::lock_guard lock(pending_mutex_);
    for (const auto& [id, later] : deferred_) {
      for (std::size_t index : later.waiting) {
        const auto delay =
            static_cast<std::int64_t>(later.parent.tranches[index].delay_days) *
            kMillisPerDay;
        if (now_ms >= later.proposed_at_ms + delay) {
          due.emplace_back(id, index);
        }
      }
    }
  }
  std::sort(due.begin(), due.end());

  std::size_t released = 0;
  for (const auto& [id, index] : due) {
    if (releaseTranche(id, index)) {
      ++released;
    }
  }
  return released;
}

std::size_t AllocationEngine::deferredTrancheCount(
    const std::string& account_id) const {
  std::lock_guard lock(pending_mutex_);
  std::size_t count = 0;
  for (const auto& [id, later] : deferred_) {
    if (later.parent.account_id == account_id) {
      count += later.waiting.size();
    }
  }
  return count;
}

std::optional<domain::TradeProposal> AllocationEngine::pendingProposal(
    domain::ProposalId proposal_id) const {
  std::lock_guard lock(pending_mutex_);
  auto it = pending_.find(proposal_id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t AllocationEngine::pendingCount(const std::string& account_id) const {
  std::lock_guard lock(pending_mutex_);
  return static_cast<std::size_t>(std::count_if(
      pending_.begin(), pending_.end(), [&account_id](const auto& entry) {
        return entry.second.account_id == account_id;
      }));
}

// -----------------------------------------------------------------------------
// Operator actions
// -----------------------------------------------------------------------------
std::vector<domain::KillSwitch> AllocationEngine::resetAccount(
    const std::string& account_id) {
  auto cleared = kill_switches_->reset(account_id);
  for (const auto& sw : cleared) {
    publish(KillSwitchEvent{sw, true, now(), 0});
  }
  return cleared;
}

void AllocationEngine::haltAccount(const std::string& account_id) {
  kill_switches_->pause(account_id);
}

bool AllocationEngine::closeBlock(domain::BlockId block_id) {
  const auto closed = guardrails_->closeBlock(block_id);
  if (!closed) {
    return false;
  }
  std::cout << "[AllocationEngine] Block #" << block_id << " closed ("
            << closed->account_id << ", " << closed->signal_id << ")\n";
  publish(BlockRecordEvent{*closed, now(), 0});
  return true;
}

void AllocationEngine::contributeSip(const std::string& account_id,
                                     double amount) {
  ledger_->contributeSip(account_id, amount, "operator:sip");
}

bool AllocationEngine::transfer(const std::string& from_account,
                                const std::string& to_account, double amount) {
  return ledger_->transfer(from_account, to_account, amount,
                          "operator:transfer");
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string AllocationEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  std::istringstream in(cmd);
  std::string verb;
  std::string account_id;
  in >> verb >> account_id;

  const bool needs_account = verb == "ACCOUNT" || verb == "HALT" ||
                             verb == "RESET" || verb == "SIP" ||
                             verb == "TRANSFER";
  if (needs_account && !ledger_->hasAccount(account_id)) {
    response["status"] = "error";
    response["response"] = "Unknown account: " + account_id;
    return response.dump();
  }

  // --- Treasury commands: argument errors come back as "error" ---------------
  if (verb == "SIP" || verb == "TRANSFER") {
    std::string to_account;
    double amount = 0.0;
    if (verb == "TRANSFER") {
      in >> to_account;
    }
    if (!(in >> amount)) {
      response["status"] = "error";
      response["response"] = "Missing amount: " + cmd;
      return response.dump();
    }
    try {
      if (verb == "SIP") {
        contributeSip(account_id, amount);
        response["status"] = "ok";
      } else {
        response["status"] = transfer(account_id, to_account, amount)
                                  ? "ok"
                                  : "error";
      }
      response["account"] = toJson(*ledger_->snapshot(account_id));
    } catch (const LedgerContractError& e) {
      response["status"] = "error";
      response["response"] = e.what();
    }
    return response.dump();
  }

  // --- Id commands: the second token is a block or proposal id -------------
  if (verb == "CLOSE_BLOCK" || verb == "RELEASE_TRANCHE") {
    std::istringstream args(cmd);
    std::string ignored;
    std::uint64_t id = 0;
    std::size_t index = 0;
    args >> ignored;
    const bool parsed = verb == "CLOSE_BLOCK"
                            ? static_cast<bool>(args >> id)
                            : static_cast<bool>(args >> id >> index);
    if (!parsed) {
      response["status"] = "error";
      response["response"] = "Malformed command: " + cmd;
      return response.dump();
    }

    if (verb == "CLOSE_BLOCK") {
      const bool closed = closeBlock(id);
      response["status"] = closed ? "ok" : "error";
      response["response"] = closed ? "Block " + std::to_string(id) +
                                          " closed"
                                    : "Unknown or closed block: " +
                                          std::to_string(id);
    } else if (auto proposal = releaseTranche(id, index)) {
      response["status"] = "ok";
      response["proposal"] = toJson(*proposal);
    } else {
      response["status"] = "error";
      response["response"] = "Tranche " + std::to_string(index) +
                             " of proposal " + std::to_string(id) +
                             " not released";
    }
    return response.dump();
  }

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    response["status"] = "ok";
    response["portfolio"] = toJson(ledger_->portfolioSummary());

    nlohmann::json accounts = nlohmann::json::array();
    auto ids = ledger_->accountIds();
    std::sort(ids.begin(), ids.end());
    for (const auto& id : ids) {
      if (auto acct = ledger_->snapshot(id)) {
        accounts.push_back(toJson(*acct));
      }
    }
    response["accounts"] = std::move(accounts);

    std::size_t open_positions = 0;
    for (const auto& pos : positions_->getSnapshots()) {
      if (pos.status == domain::PositionStatus::Open) {
        ++open_positions;
      }
    }
    {
      std::lock_guard lock(pending_mutex_);
      response["pending_proposals"] = pending_.size();
      std::size_t deferred = 0;
      for (const auto& [id, later] : deferred_) {
        deferred += later.waiting.size();
      }
      response["deferred_tranches"] = deferred;
    }
    response["open_positions"] = open_positions;
  } else if (verb == "ACCOUNT") {
    response["status"] = "ok";
    response["account"] = toJson(*ledger_->snapshot(account_id));
    if (auto mandate = mandates_->current(account_id)) {
      response["mandate"] = toJson(*mandate);
    }

    nlohmann::json switches = nlohmann::json::array();
    for (const auto& sw : kill_switches_->switches(account_id)) {
      switches.push_back(toJson(sw));
    }
    response["kill_switches"] = std::move(switches);

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& pos : positions_->openPositions(account_id)) {
      positions.push_back(toJson(pos));
    }
    response["positions"] = std::move(positions);

    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& block : guardrails_->openBlocks(account_id)) {
      blocks.push_back(toJson(block));
    }
    response["open_blocks"] = std::move(blocks);
  } else if (verb == "HALT") {
    haltAccount(account_id);
    response["status"] = "ok";
    response["response"] = "Account " + account_id + " halted";
  } else if (verb == "RESET") {
    const auto cleared = resetAccount(account_id);
    response["status"] = "ok";
    response["response"] = "Account " + account_id + " reset";
    response["cleared"] = cleared.size();
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace capital
