#include "paper/network/ipc_server.hpp"
#include "paper/journal/journal_record.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace paper {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn the server thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] Started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] Stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REP round trip, or a timeout
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd = request.to_string();
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] Command '" << cmd << "' failed: " << e.what()
              << "\n";
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}
                   .dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): Event variant -> JSON
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<CapitalUpdateEvent>(&event)) {
    return formatCapitalUpdate(*e);
  }
  if (auto* e = std::get_if<RiskAlertEvent>(&event)) {
    return formatRiskAlert(*e);
  }
  if (auto* e = std::get_if<SignalRejectedEvent>(&event)) {
    return formatSignalRejected(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatPositionUpdate(const PositionUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "position_update";
  j["change"] = e.change;
  j["ts_ms"] = e.timestamp_ms;
  j["position"] = e.position;
  return j.dump();
}

std::string IpcServer::formatCapitalUpdate(const CapitalUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "capital_update";
  j["cause"] = e.cause;
  j["market_id"] = e.market_id;
  j["total"] = e.capital.total;
  j["available"] = e.capital.available;
  j["allocated"] = e.capital.allocated;
  j["ts_ms"] = e.timestamp_ms;
  return j.dump();
}

std::string IpcServer::formatRiskAlert(const RiskAlertEvent& e) {
  nlohmann::json j;
  j["type"] = "risk_alert";
  j["kind"] = alertKindToString(e.kind);
  j["market_id"] = e.market_id;
  j["reason"] = e.reason;
  j["current_value"] = e.current_value;
  j["limit_value"] = e.limit_value;
  j["ts_ms"] = e.timestamp_ms;
  return j.dump();
}

std::string IpcServer::formatSignalRejected(const SignalRejectedEvent& e) {
  nlohmann::json j;
  j["type"] = "signal_rejected";
  j["market_id"] = e.market_id;
  j["side"] = domain::sideToString(e.side);
  j["error"] = errorKindToString(e.kind);
  j["message"] = e.message;
  j["ts_ms"] = e.timestamp_ms;
  return j.dump();
}

}  // namespace paper
