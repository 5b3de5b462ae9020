// -----------------------------------------------------------------------------
// capital_guard: single executable entry point.
//
//   1) Load the engine configuration (JSON) named on the command line.
//   2) Pick the clock: live wall clock, or a SimulationTimeProvider advanced
//      by inbound message timestamps for replays.
//   3) Create the AllocationEngine. Accounts, mandates and kill switches from
//      the configuration are opened here; malformed accounts are refused and
//      logged, the rest keep trading.
//   4) Subscribe logging callbacks to the outbound bus, then start().
//   5) Idle on the main thread until Ctrl-C, then stop cleanly.
//
// Thread layout:
//   main thread        → waits for SIGINT
//   inbound thread     → allocation, fills, closes, P&L updates
//   signal feed thread → SignalGateway ZMQ recv loop
//   ipc thread         → operator commands + telemetry PUB
// -----------------------------------------------------------------------------

#include "capital/config/engine_config.hpp"
#include "capital/engine/allocation_engine.hpp"
#include "capital/events/event.hpp"
#include "capital/time/live_time_provider.hpp"
#include "capital/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// The only global in the program. Written by the SIGINT handler, polled by
// main(); sig_atomic_t keeps the handler async-signal-safe.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void sigint_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/capital_guard.example.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. A malformed file is fatal; nothing has started yet.
  // -------------------------------------------------------------------------
  capital::EngineConfig config;
  try {
    config = capital::loadEngineConfig(config_path);
  } catch (const capital::ConfigurationError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock.
  // -------------------------------------------------------------------------
  capital::LiveTimeProvider live_clock;
  capital::SimulationTimeProvider sim_clock;
  const capital::ITimeProvider& clock =
      config.simulation_clock
          ? static_cast<const capital::ITimeProvider&>(sim_clock)
          : static_cast<const capital::ITimeProvider&>(live_clock);
  capital::SimulationTimeProvider* replay_clock =
      config.simulation_clock ? &sim_clock : nullptr;

  std::cout << "[main] config=" << config_path << " clock="
            << (config.simulation_clock ? "simulation" : "live") << "\n";

  // -------------------------------------------------------------------------
  // 3) Engine.
  // -------------------------------------------------------------------------
  std::unique_ptr<capital::AllocationEngine> engine;
  try {
    engine = std::make_unique<capital::AllocationEngine>(
        clock, std::move(config), replay_clock);
  } catch (const capital::ConfigurationError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Logging callbacks, registered BEFORE start() so nothing is missed.
  // They run on whichever thread produced the event.
  // -------------------------------------------------------------------------
  engine->outboundBus().subscribe<capital::TradeProposalEvent>(
      [](const capital::TradeProposalEvent& e) {
        std::cout << "[TradeProposal] #" << e.proposal.id << " "
                  << e.proposal.account_id << " " << e.proposal.symbol
                  << " qty=" << e.proposal.quantity
                  << " entry=" << e.proposal.entry_price
                  << " reserved=" << e.proposal.reserved_amount << "\n";
      });

  engine->outboundBus().subscribe<capital::BlockRecordEvent>(
      [](const capital::BlockRecordEvent& e) {
        std::cout << "[BlockRecord] #" << e.block.id << " "
                  << e.block.account_id << " " << e.block.symbol << " reasons="
                  << e.block.reason_codes.size() << "\n";
      });

  engine->outboundBus().subscribe<capital::KillSwitchEvent>(
      [](const capital::KillSwitchEvent& e) {
        std::cout << "[KillSwitch] " << e.kill_switch.account_id << " "
                  << capital::domain::killSwitchKindToString(
                         e.kill_switch.kind)
                  << (e.reset ? " reset" : " TRIPPED") << "\n";
      });

  engine->start();

  // -------------------------------------------------------------------------
  // 5) Wait for Ctrl-C, then shut down.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine->stop();
  return 0;
}
