#pragma once

#include "paper/capital/capital_ledger.hpp"
#include "paper/concurrent/periodic_task.hpp"
#include "paper/concurrent/worker_pool.hpp"
#include "paper/config/config_store.hpp"
#include "paper/engine/simulator.hpp"
#include "paper/eventbus/event_bus.hpp"
#include "paper/journal/capital_snapshot_file.hpp"
#include "paper/journal/i_journal.hpp"
#include "paper/network/ipc_server.hpp"
#include "paper/network/message_codec.hpp"
#include "paper/network/signal_gateway_thread.hpp"
#include "paper/positions/position_store.hpp"
#include "paper/risk/risk_supervisor.hpp"
#include "paper/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace paper {

// -----------------------------------------------------------------------------
// PaperEngine
// -----------------------------------------------------------------------------
//
// @brief  Process root of the paper-trading engine: owns the capital ledger,
//         position store, risk supervisor and Simulator, and every thread
//         that drives them.
//
// @details
// Provides a start/stop lifecycle so that main() and tests can run the
// engine without wiring internals by hand.
//
// Thread layout:
//
//   worker pool (N)     -> Simulator::submitSignal for incoming signals
//   sweep thread        -> Simulator::evaluateAll every sweep_interval_ms,
//                          Simulator::reconcile every reconcile_every_sweeps
//   signal gateway      -> ZMQ SUB recv loop, decodes and dispatch()es
//   ipc server          -> ZMQ REP commands + PUB telemetry
//
//   main thread         -> start(), waitForShutdown(), stop()
//
// Startup order (start()):
//   1. Simulator::initialize() - journal replay or initial deposit. Nothing
//      runs until the ledger and store agree with the journal.
//   2. Worker pool.
//   3. IpcServer, subscribed to the EventBus for telemetry.
//   4. Sweep task.
//   5. Signal gateway LAST, so every consumer is live before the first
//      signal arrives.
// stop() tears down in the reverse order.
//
// Endpoints and pool sizes are read from the config snapshot taken at
// construction. An empty endpoint disables that component (tests drive the
// engine through dispatch() and executeCommand()).
//
// Ownership:
//   PaperEngine
//    ├── config_         (ConfigStore& - non-owning)
//    ├── journal_        (IJournal& - non-owning)
//    ├── clock_          (const ITimeProvider& - non-owning)
//    ├── bus_, ledger_, store_, risk_   (value members)
//    ├── snapshot_file_  (unique_ptr, absent when snapshot_path is empty)
//    ├── simulator_      (value member, references the above)
//    ├── pool_, sweep_, ipc_server_, gateway_   (unique_ptr, created in start)
//
// Threads are heap-held so stop() controls their teardown order; the value
// members they reference are declared first and destroyed last.
// -----------------------------------------------------------------------------
class PaperEngine {
 public:
  PaperEngine(ConfigStore& config, IJournal& journal,
              const ITimeProvider& clock);

  // Destructor calls stop() for RAII safety.
  ~PaperEngine();

  PaperEngine(const PaperEngine&) = delete;
  PaperEngine& operator=(const PaperEngine&) = delete;
  PaperEngine(PaperEngine&&) = delete;
  PaperEngine& operator=(PaperEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Recovers state and brings every thread up.
  //
  // @return false, with nothing started, if recovery failed (ledger
  //         invariant or unwritable journal). Idempotent.
  // -------------------------------------------------------------------------
  bool start();

  // Joins every thread. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // dispatch(message)
  // -------------------------------------------------------------------------
  // @brief  Entry point for everything the signal gateway decodes.
  //
  // @details
  // Signals go to the worker pool (or run inline if the pool is not up);
  // market updates and resolutions are applied on the calling thread.
  // Returns false if a signal could not be queued.
  // -------------------------------------------------------------------------
  bool dispatch(InboundMessage message);

  // Synchronous intake, bypassing the pool.
  Result<SignalOutcome> submitSignal(const domain::Signal& signal);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  IPC command handler. Returns a JSON reply with "status" ("ok" /
  //         "error") and command-specific fields.
  //
  // Commands: PING, STATUS, HALT [reason], RESUME, RELOAD, RECONCILE,
  //           REPORT, CLOSE <market_id>.
  //
  // Thread-safety: Safe from any thread (the IPC thread in production).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // SIGINT path: main() blocks in waitForShutdown() until requested.
  void requestShutdown();
  void waitForShutdown();

  Simulator& simulator() { return simulator_; }
  const Simulator& simulator() const { return simulator_; }
  EventBus& eventBus() { return bus_; }
  const PositionStore& positions() const { return store_; }

  std::uint64_t sweepCount() const { return sweeps_.load(); }

 private:
  void runSweep();

  ConfigStore& config_;
  IJournal& journal_;
  const ITimeProvider& clock_;

  EventBus bus_;
  CapitalLedger ledger_;
  PositionStore store_;
  RiskSupervisor risk_;
  std::unique_ptr<CapitalSnapshotFile> snapshot_file_;
  Simulator simulator_;

  std::string signal_endpoint_;
  std::string ipc_cmd_endpoint_;
  std::string ipc_pub_endpoint_;

  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<PeriodicTask> sweep_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<SignalGatewayThread> gateway_;
  EventBus::SubscriptionId telemetry_subscription_{0};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sweeps_{0};

  std::mutex shutdown_mutex_;
  std::condition_variable shutdown_cv_;
  bool shutdown_requested_{false};
};

}  // namespace paper
