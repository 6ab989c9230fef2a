#include "paper/engine/paper_engine.hpp"

#include "paper/journal/journal_record.hpp"
#include "paper/reporting/reporting_export.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

namespace paper {

namespace {

std::unique_ptr<CapitalSnapshotFile> makeSnapshotFile(
    const EngineConfig& config) {
  if (config.snapshot_path.empty()) {
    return nullptr;
  }
  return std::make_unique<CapitalSnapshotFile>(config.snapshot_path);
}

nlohmann::json capitalJson(const domain::CapitalSnapshot& capital) {
  return nlohmann::json{{"total", capital.total},
                        {"available", capital.available},
                        {"allocated", capital.allocated}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PaperEngine::PaperEngine(ConfigStore& config, IJournal& journal,
                         const ITimeProvider& clock)
    : config_(config),
      journal_(journal),
      clock_(clock),
      snapshot_file_(makeSnapshotFile(*config.snapshot())),
      simulator_(ledger_, store_, risk_, journal_, config_, clock_, bus_,
                 snapshot_file_.get()) {
  const auto cfg = config_.snapshot();
  signal_endpoint_ = cfg->signal_endpoint;
  ipc_cmd_endpoint_ = cfg->ipc_cmd_endpoint;
  ipc_pub_endpoint_ = cfg->ipc_pub_endpoint;
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
PaperEngine::~PaperEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
bool PaperEngine::start() {
  if (running_.load()) {
    return true;
  }

  const auto cfg = config_.snapshot();

  // ---  1) Recovery gate ------------------------------------------------------
  auto recovered = simulator_.initialize();
  if (!recovered) {
    std::cerr << "[PaperEngine] CRITICAL: startup failed: "
              << errorKindToString(recovered.kind()) << " - "
              << recovered.error().message << "\n";
    return false;
  }

  // ---  2) Worker pool --------------------------------------------------------
  pool_ = std::make_unique<WorkerPool>(
      static_cast<std::size_t>(std::max(1, cfg->worker_threads)));
  pool_->start();

  // ---  3) IpcServer (telemetry + commands) -----------------------------------
  if (!ipc_cmd_endpoint_.empty() && !ipc_pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        ipc_cmd_endpoint_, ipc_pub_endpoint_);
    ipc_server_->start();

    telemetry_subscription_ = bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  4) Sweep --------------------------------------------------------------
  if (cfg->sweep_interval_ms > 0) {
    sweep_ = std::make_unique<PeriodicTask>(
        "sweep", std::chrono::milliseconds(cfg->sweep_interval_ms),
        [this] { runSweep(); });
    sweep_->start();
  }

  // ---  5) Signal gateway LAST ------------------------------------------------
  if (!signal_endpoint_.empty()) {
    gateway_ = std::make_unique<SignalGatewayThread>(
        [this](InboundMessage message) { dispatch(std::move(message)); },
        signal_endpoint_);
    gateway_->start();
  }

  running_.store(true);

  const auto capital = recovered.value();
  std::cout << "[PaperEngine] started. capital=" << capital.total
            << " available=" << capital.available << " workers="
            << pool_->threadCount() << (sweep_ ? ", sweep" : "")
            << (ipc_server_ ? ", ipc" : "")
            << (gateway_ ? ", signal gateway" : "") << ".\n";
  return true;
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PaperEngine::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // ---  1) Stop signal inflow FIRST -------------------------------------------
  gateway_.reset();

  // ---  2) Stop the sweep, then drain the pool --------------------------------
  sweep_.reset();
  if (pool_) {
    pool_->stop();
  }

  // ---  3) IPC last: executeCommand() queries the Simulator --------------------
  if (ipc_server_) {
    bus_.unsubscribe(telemetry_subscription_);
    ipc_server_.reset();
  }
  pool_.reset();

  std::cout << "[PaperEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// dispatch(message)
// -----------------------------------------------------------------------------
bool PaperEngine::dispatch(InboundMessage message) {
  // Rejections are logged and published by the Simulator itself.
  if (auto* signal = std::get_if<domain::Signal>(&message)) {
    if (!pool_) {
      simulator_.submitSignal(*signal);
      return true;
    }
    return pool_->submit(
        [this, s = std::move(*signal)] { simulator_.submitSignal(s); });
  }

  if (const auto* update = std::get_if<domain::MarketUpdate>(&message)) {
    return simulator_.updateMarket(*update);
  }

  if (const auto* res = std::get_if<domain::MarketResolution>(&message)) {
    auto settled = simulator_.resolveMarket(*res);
    if (!settled && settled.kind() != ErrorKind::UnknownMarket) {
      std::cerr << "[PaperEngine] Resolution of " << res->market_id
                << " failed: " << settled.error().message << "\n";
    }
    return true;
  }
  return false;
}

Result<SignalOutcome> PaperEngine::submitSignal(const domain::Signal& signal) {
  return simulator_.submitSignal(signal);
}

// -----------------------------------------------------------------------------
// runSweep(): evaluation every tick, reconciliation every N ticks
// -----------------------------------------------------------------------------
void PaperEngine::runSweep() {
  const SweepSummary summary = simulator_.evaluateAll();
  const std::uint64_t n = sweeps_.fetch_add(1) + 1;

  if (summary.closed > 0 || summary.failed > 0) {
    std::cout << "[PaperEngine] Sweep " << n << ": evaluated "
              << summary.evaluated << ", closed " << summary.closed
              << ", failed " << summary.failed << "\n";
  }

  const int every = config_.snapshot()->reconcile_every_sweeps;
  if (every > 0 && n % static_cast<std::uint64_t>(every) == 0) {
    simulator_.reconcile();
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string PaperEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  in >> verb;
  std::string arg;
  std::getline(in >> std::ws, arg);

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";

  } else if (verb == "STATUS") {
    response["status"] = "ok";
    response["halted"] = simulator_.isHalted();
    response["halt_reason"] = simulator_.haltReason();
    response["capital"] = capitalJson(simulator_.capital());
    response["drawdown"] =
        nlohmann::json{{"peak", risk_.drawdown().peak()},
                       {"current", risk_.drawdown().drawdown()}};
    response["journal_seq"] = journal_.lastSequence();
    response["sweeps"] = sweeps_.load();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : simulator_.activePositions()) {
      positions_json.push_back(pos);
    }
    response["positions"] = std::move(positions_json);

  } else if (verb == "HALT") {
    simulator_.halt(arg.empty() ? "operator HALT" : arg);
    response["status"] = "ok";
    response["response"] = "Trading halted";

  } else if (verb == "RESUME") {
    simulator_.resume();
    response["status"] = "ok";
    response["response"] = "Kill switch cleared";
    response["halted"] = simulator_.isHalted();

  } else if (verb == "RELOAD") {
    auto reloaded = config_.reload();
    if (!reloaded) {
      response["status"] = "error";
      response["response"] = reloaded.error().message;
    } else {
      nlohmann::json clamped = nlohmann::json::array();
      for (const auto& v : reloaded.value()) {
        clamped.push_back(nlohmann::json{{"parameter", v.parameter},
                                         {"requested", v.requested},
                                         {"applied", v.applied}});
        bus_.publish(RiskAlertEvent{AlertKind::GovernanceBound, "",
                                    v.parameter + " clamped", v.requested,
                                    v.applied, clock_.now_ms()});
      }
      response["status"] = "ok";
      response["response"] = "Configuration reloaded";
      response["clamped"] = std::move(clamped);
    }

  } else if (verb == "RECONCILE") {
    const bool ok = simulator_.reconcile();
    response["status"] = "ok";
    response["reconciled"] = ok;
    response["capital"] = capitalJson(simulator_.capital());

  } else if (verb == "REPORT") {
    const auto closed = ReportingExport::closedPositions(store_);
    const PerformanceSummary s = ReportingExport::summarize(closed);
    response["status"] = "ok";
    response["summary"] = nlohmann::json{
        {"closed", s.closed},
        {"wins", s.wins},
        {"losses", s.losses},
        {"win_rate", s.win_rate},
        {"gross_profit", s.gross_profit},
        {"gross_loss", s.gross_loss},
        {"profit_factor", s.profit_factor},
        {"total_realized_pnl", s.total_realized_pnl}};
    nlohmann::json closed_json = nlohmann::json::array();
    for (const auto& pos : closed) {
      closed_json.push_back(pos);
    }
    response["closed"] = std::move(closed_json);

  } else if (verb == "CLOSE") {
    auto closed = simulator_.closePosition(arg, domain::CloseReason::Manual);
    if (closed) {
      response["status"] = "ok";
      response["position"] = closed.value();
    } else {
      response["status"] = "error";
      response["response"] = std::string(errorKindToString(closed.kind())) +
                             ": " + closed.error().message;
    }

  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Shutdown signalling
// -----------------------------------------------------------------------------
void PaperEngine::requestShutdown() {
  {
    std::lock_guard lock(shutdown_mutex_);
    shutdown_requested_ = true;
  }
  shutdown_cv_.notify_all();
}

void PaperEngine::waitForShutdown() {
  std::unique_lock lock(shutdown_mutex_);
  shutdown_cv_.wait(lock, [this] { return shutdown_requested_; });
}

}  // namespace paper
