// -----------------------------------------------------------------------------
// paper_engine - single executable entry point.
//
//   paper_engine [config/engine.json] [config/governance_bounds.json]
//
// Startup:
//   1) Load EngineConfig and GovernanceBounds (both JSON) and publish the
//      clamped effective config through a ConfigStore.
//   2) Open the file journal (JSONL, fsync per append).
//   3) Create the PaperEngine and start it: journal replay or initial
//      deposit, worker pool, IPC server, sweep, signal gateway.
//   4) Block until SIGINT, then stop the engine (joins every thread).
//
// Thread layout:
//   main thread        -> start(), waitForShutdown(), stop()
//   workers            -> signal intake
//   sweep thread       -> evaluation + reconciliation
//   gateway / ipc      -> ZMQ I/O
// -----------------------------------------------------------------------------

#include "paper/config/config_store.hpp"
#include "paper/engine/paper_engine.hpp"
#include "paper/journal/file_journal.hpp"
#include "paper/time/live_time_provider.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

// -----------------------------------------------------------------------------
// Global pointer for signal handler access.
// The only global in the program: a raw pointer to the stack-local engine,
// set once before SIGINT is installed and cleared before the engine dies.
// -----------------------------------------------------------------------------
static paper::PaperEngine* g_engine_ptr = nullptr;

// -----------------------------------------------------------------------------
// sigint_handler
// -----------------------------------------------------------------------------
// requestShutdown() takes a mutex and notifies a condition variable; not
// strictly async-signal-safe, acceptable for a paper-trading binary.
// -----------------------------------------------------------------------------
static void sigint_handler(int /*signum*/) {
  if (g_engine_ptr != nullptr) {
    g_engine_ptr->requestShutdown();
  }
}

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/engine.json";
  const std::string bounds_path =
      argc > 2 ? argv[2] : "config/governance_bounds.json";

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  paper::EngineConfig config;
  paper::GovernanceBounds bounds;
  try {
    config = paper::loadEngineConfig(config_path);
    bounds = paper::loadGovernanceBounds(bounds_path);
  } catch (const std::exception& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 1;
  }

  paper::ConfigStore config_store(std::move(config), std::move(bounds),
                                  config_path, bounds_path);
  for (const auto& v : config_store.lastViolations()) {
    std::cerr << "[main] Governance bound applied: " << v.parameter << " "
              << v.requested << " -> " << v.applied << "\n";
  }
  const auto effective = config_store.snapshot();

  // -------------------------------------------------------------------------
  // 2) Journal
  // -------------------------------------------------------------------------
  std::unique_ptr<paper::FileJournal> journal;
  try {
    journal = std::make_unique<paper::FileJournal>(effective->journal_path);
  } catch (const std::exception& e) {
    std::cerr << "[main] CRITICAL: cannot open journal: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  paper::LiveTimeProvider clock;
  paper::PaperEngine engine(config_store, *journal, clock);

  if (!engine.start()) {
    return 1;
  }

  g_engine_ptr = &engine;
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] Listening for signals on "
            << effective->signal_endpoint << ", commands on "
            << effective->ipc_cmd_endpoint << ", telemetry on "
            << effective->ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait, then shut down cleanly.
  // -------------------------------------------------------------------------
  engine.waitForShutdown();

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  std::signal(SIGINT, SIG_DFL);
  g_engine_ptr = nullptr;

  return 0;
}
