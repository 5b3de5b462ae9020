#pragma once

#include "capital/allocation/mandate_filter.hpp"
#include "capital/allocation/objective_ranker.hpp"
#include "capital/allocation/position_sizer.hpp"
#include "capital/concurrent/event_loop_thread.hpp"
#include "capital/concurrent/sequence_generator.hpp"
#include "capital/config/engine_config.hpp"
#include "capital/domain/market_snapshot.hpp"
#include "capital/domain/signal.hpp"
#include "capital/domain/trade_proposal.hpp"
#include "capital/eventbus/event_bus.hpp"
#include "capital/ledger/ledger.hpp"
#include "capital/network/ipc_server.hpp"
#include "capital/network/signal_feed_thread.hpp"
#include "capital/risk/guardrail_evaluator.hpp"
#include "capital/risk/kill_switch_monitor.hpp"
#include "capital/risk/mandate_store.hpp"
#include "capital/risk/position_book.hpp"
#include "capital/time/i_time_provider.hpp"
#include "capital/time/simulation_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace capital {

// -----------------------------------------------------------------------------
// AllocationOutcome: what happened to one (signal, account) pair
// -----------------------------------------------------------------------------
enum class AllocationOutcome {
  Proposed,            // Reserved and emitted as a TradeProposal
  Blocked,             // Guardrail block (new or still open)
  Ineligible,          // Rejected by the mandate filter
  Paused,              // Kill switch tripped or operator HALT
  ZeroSize,            // No quantity fits the caps
  InsufficientFunds,   // Ledger refused the reservation
  ConfigurationError,  // Account has no usable mandate
  NoMarketData,        // No price for the symbol and no entry hint
  PositionLimit,       // Mandate max_open_positions reached
  ProposalLimit,       // max_proposals_per_batch reached for this batch
};

const char* allocationOutcomeToString(AllocationOutcome outcome);

// -----------------------------------------------------------------------------
// AllocationDecision: per-account result for one signal
// -----------------------------------------------------------------------------
struct AllocationDecision {
  std::string account_id;
  std::string signal_id;
  std::string symbol;
  AllocationOutcome outcome{AllocationOutcome::Ineligible};
  std::string reason;
  double score{0.0};

  std::optional<domain::TradeProposal> proposal;
  std::optional<domain::BlockRecord> block;
  std::optional<domain::GuardrailResult> guardrails;
};

// -----------------------------------------------------------------------------
// AllocationEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator. Owns the ledger, the risk components, the
//         inbound event loop and the network I/O threads.
//
// @details
// Per signal batch, for every account in the ledger:
//
//   MandateFilter  →  kill-switch gate  →  ObjectiveRanker ordering
//        →  PositionSizer (reads Ledger deployable cash)
//        →  GuardrailEvaluator
//        →  pass / warnings:  Ledger::reserve(first tranche), TradeProposal
//        →  blocking result:  no ledger mutation, BlockRecord (idempotent)
//
// Thread layout:
//
//   inbound loop thread   → signal batches, market snapshots, P&L updates,
//                           fill / reject / close notices, tranche releases,
//                           block closes, heartbeats (EventLoopThread)
//   signal feed thread    → SignalGateway ZMQ recv loop → pushEvent()
//   ipc thread            → operator commands + telemetry broadcast
//
//   caller threads        → allocate() / allocateForAccount() directly
//
// Accounts are independent. Each one has an allocation mutex held across
// size → evaluate → reserve, so two concurrent batches can never both spend
// the same cash. The Ledger still locks per account inside every mutation.
//
// Split proposals: only tranche 0 is reserved when the batch runs. The later
// legs wait in deferred_ keyed by that proposal's id until they are released
// explicitly (releaseTranche) or their delay_days elapse (releaseDueTranches,
// run on every heartbeat). A parent that is rejected, expires or fails to
// fill takes its waiting legs with it.
//
// Outbound events (TradeProposalEvent, BlockRecordEvent,
// CapitalTransactionEvent, KillSwitchEvent, PositionUpdateEvent) are
// published synchronously on outboundBus() from whichever thread produced
// them, then queued to the IpcServer when it is running.
//
// Ownership:
//   AllocationEngine
//    ├── proposal_ids_, outbound_sequence_  (SequenceGenerator, value)
//    ├── outbound_bus_                      (EventBus, value)
//    ├── ledger_                            (unique_ptr<Ledger>)
//    ├── mandates_                          (unique_ptr<MandateStore>)
//    ├── positions_                         (unique_ptr<PositionBook>)
//    ├── kill_switches_                     (unique_ptr<KillSwitchMonitor>)
//    ├── guardrails_                        (unique_ptr<GuardrailEvaluator>)
//    ├── sizer_, filter_, ranker_           (value members, stateless)
//    ├── inbound_loop_                      (EventLoopThread, value)
//    ├── signal_feed_thread_                (unique_ptr<SignalFeedThread>)
//    └── ipc_server_                        (unique_ptr<IpcServer>)
//
// The clock is a non-owning reference and must outlive the engine.
// -----------------------------------------------------------------------------
class AllocationEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock         Time source for reservations, blocks and trips.
  // @param  config        Parsed engine configuration. Accounts listed in it
  //                       are opened immediately; an account whose mandate,
  //                       capital or kill switches are malformed is refused
  //                       and reported by refusedAccounts().
  // @param  replay_clock  Optional simulation clock advanced by inbound
  //                       message timestamps. Null in live mode.
  //
  // No threads are spawned and no sockets are opened here.
  // -------------------------------------------------------------------------
  AllocationEngine(const ITimeProvider& clock, EngineConfig config,
                   SimulationTimeProvider* replay_clock = nullptr);

  ~AllocationEngine();

  AllocationEngine(const AllocationEngine&) = delete;
  AllocationEngine& operator=(const AllocationEngine&) = delete;
  AllocationEngine(AllocationEngine&&) = delete;
  AllocationEngine& operator=(AllocationEngine&&) = delete;

  // Starts the inbound loop, then (if endpoints are enabled) the IpcServer,
  // then the signal feed LAST so every subscriber is live before the first
  // message arrives. Idempotent.
  void start();

  // Stops the feed, the inbound loop, then the IpcServer. Idempotent.
  void stop();

  // --- Accounts and mandates -------------------------------------------------

  // Opens the account, publishes its first mandate and installs its kill
  // switches plus the configured defaults. Carried positions are funded from
  // initial_capital: their cost basis is reserved and deployed, then they
  // are booked OPEN. Throws ConfigurationError and leaves no state behind
  // when anything is malformed or the carried cost exceeds the capital.
  void addAccount(const AccountConfig& account);

  // Publishes a new mandate version. Throws ConfigurationError.
  std::uint32_t publishMandate(domain::Mandate mandate);

  void updateMarket(const domain::MarketSnapshot& snapshot);
  std::optional<domain::MarketSnapshot> market(const std::string& symbol) const;

  // --- Allocation ------------------------------------------------------------

  // Runs one batch against every account. Sweeps expired reservations first.
  std::vector<AllocationDecision> allocate(
      const std::vector<domain::Signal>& signals);

  // Runs one batch against a single account under its allocation lock.
  std::vector<AllocationDecision> allocateForAccount(
      const std::string& account_id,
      const std::vector<domain::Signal>& signals);

  // --- Execution feedback ----------------------------------------------------

  // Deploys the proposal's reservation at the fill, releases any remainder
  // and opens a Position. A stale or over-notional fill discards the
  // proposal and returns nullopt.
  std::optional<domain::Position> onProposalFilled(
      domain::ProposalId proposal_id, double filled_quantity,
      double fill_price);

  // Releases the proposal's reservation. Returns false for unknown ids.
  bool onProposalRejected(domain::ProposalId proposal_id,
                          const std::string& reason);

  // Returns the position's cost basis plus realized P&L to available cash,
  // then marks it CLOSED. When the Ledger refuses the settlement (a loss
  // larger than available cash) the LedgerContractError propagates and the
  // position stays OPEN with its cash still deployed.
  std::optional<domain::Position> onPositionClosed(
      domain::PositionId position_id, double exit_price);

  std::vector<domain::KillSwitch> onPnlUpdate(const std::string& account_id,
                                              double realized_daily_pnl,
                                              double unrealized_pnl);

  // Releases reservations past their TTL and forgets their proposals, and
  // any legs those proposals were still holding back.
  std::size_t sweepExpiredReservations();

  // --- Tranche release -------------------------------------------------------

  // -------------------------------------------------------------------------
  // releaseTranche(proposal_id, tranche_index)
  // -------------------------------------------------------------------------
  //
  // @brief  Sizes one deferred leg of proposal_id against the account's
  //         deployable cash, reserves it and emits a follow-on proposal.
  //
  // @details
  //   The follow-on carries the parent's prices, parent_id = proposal_id and
  //   tranche_index. Its quantity is the planned leg capped by cash.
  //
  //   Returns nullopt when the leg is unknown (wrong index, already released,
  //   parent gone), or when the account is paused, no quantity fits or the
  //   Ledger refuses the reservation. In the last three cases the leg stays
  //   deferred and can be released again later.
  // -------------------------------------------------------------------------
  std::optional<domain::TradeProposal> releaseTranche(
      domain::ProposalId proposal_id, std::size_t tranche_index);

  // Releases every deferred leg whose delay_days have elapsed since its
  // parent was proposed. Returns how many follow-on proposals were emitted.
  std::size_t releaseDueTranches();

  std::size_t deferredTrancheCount(const std::string& account_id) const;

  // --- Operator actions ------------------------------------------------------

  std::vector<domain::KillSwitch> resetAccount(const std::string& account_id);
  void haltAccount(const std::string& account_id);

  // Closes an open block so the (signal, account) pair can be evaluated
  // again. Publishes the closed BlockRecord. False for unknown or already
  // closed ids.
  bool closeBlock(domain::BlockId block_id);

  // Treasury movements go straight to the Ledger. An allocation running
  // concurrently either sized against the old balance and has its reserve()
  // re-checked, or sees the new one.
  // @throws LedgerContractError  unknown account or non-positive amount.
  void contributeSip(const std::string& account_id, double amount);
  bool transfer(const std::string& from_account, const std::string& to_account,
                double amount);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one IPC command and returns a JSON response string.
  //
  // @details
  //   "PING"          → {"status":"ok","response":"PONG"}
  //   "STATUS"        → {"status":"ok","portfolio":{...},"accounts":[...],
  //                      "pending_proposals":N,"deferred_tranches":N,
  //                      "open_positions":N}
  //   "ACCOUNT <id>"  → account, mandate, kill switches, open positions and
  //                     open blocks
  //   "HALT <id>"     → pauses the account
  //   "RESET <id>"    → clears tripped kill switches and the pause
  //   "SIP <id> <amount>"              → periodic contribution
  //   "TRANSFER <from> <to> <amount>"  → moves available cash
  //   "CLOSE_BLOCK <block_id>"         → closes an open block
  //   "RELEASE_TRANCHE <proposal_id> <index>" → releases a deferred tranche
  //   other           → {"status":"error","response":"..."}
  //
  // Thread model: called on the IPC thread; every component it touches is
  //               internally synchronized.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Enqueues an inbound event on the inbound loop. Safe from any thread.
  void pushEvent(Event event);

  // --- Accessors -------------------------------------------------------------

  EventBus& outboundBus() { return outbound_bus_; }
  EventBus& inboundBus() { return inbound_loop_.eventBus(); }

  const Ledger& ledger() const { return *ledger_; }
  const MandateStore& mandates() const { return *mandates_; }
  const PositionBook& positions() const { return *positions_; }
  const KillSwitchMonitor& killSwitches() const { return *kill_switches_; }
  const GuardrailEvaluator& guardrails() const { return *guardrails_; }

  std::optional<domain::TradeProposal> pendingProposal(
      domain::ProposalId proposal_id) const;
  std::size_t pendingCount(const std::string& account_id) const;

  const std::vector<std::string>& refusedAccounts() const {
    return refused_accounts_;
  }

 private:
  void subscribeInbound();
  void publish(Event event);
  Timestamp now() const;

  std::mutex& allocationLock(const std::string& account_id);

  std::optional<domain::TradeProposal> takePending(
      domain::ProposalId proposal_id);

  // Forgets the legs proposal_id was holding back. Returns how many.
  std::size_t dropDeferred(domain::ProposalId proposal_id);

  void openCarriedPositions(const AccountConfig& account);

  AllocationDecision allocateOne(const domain::Account& account,
                                 const domain::Mandate& mandate,
                                 const RankedCandidate& candidate,
                                 const domain::MarketSnapshot& market);

  const ITimeProvider& clock_;
  EngineConfig config_;
  SimulationTimeProvider* replay_clock_;

  SequenceGenerator proposal_ids_;
  SequenceGenerator outbound_sequence_;
  EventBus outbound_bus_;

  std::unique_ptr<Ledger> ledger_;
  std::unique_ptr<MandateStore> mandates_;
  std::unique_ptr<PositionBook> positions_;
  std::unique_ptr<KillSwitchMonitor> kill_switches_;
  std::unique_ptr<GuardrailEvaluator> guardrails_;

  PositionSizer sizer_;
  MandateFilter filter_;
  ObjectiveRanker ranker_;

  mutable std::shared_mutex locks_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>>
      allocation_locks_;

  mutable std::mutex market_mutex_;
  std::unordered_map<std::string, domain::MarketSnapshot> markets_;

  // Legs of a split proposal still waiting for release. parent is the
  // tranche-0 proposal as emitted; waiting holds the indices into
  // parent.tranches not yet released.
  struct DeferredTranches {
    domain::TradeProposal parent;
    std::int64_t proposed_at_ms{0};
    std::vector<std::size_t> waiting;
  };

  mutable std::mutex pending_mutex_;  // guards pending_ and deferred_
  std::unordered_map<domain::ProposalId, domain::TradeProposal> pending_;
  std::unordered_map<domain::ProposalId, DeferredTranches> deferred_;

  std::vector<std::string> refused_accounts_;

  EventLoopThread inbound_loop_;
  std::unique_ptr<SignalFeedThread> signal_feed_thread_;

  std::mutex ipc_mutex_;  // guards the pointer, not the server
  std::unique_ptr<IpcServer> ipc_server_;

  bool running_{false};
};

}  // namespace capital
