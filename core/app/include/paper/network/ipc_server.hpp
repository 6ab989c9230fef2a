#pragma once

#include "paper/concurrent/thread_safe_queue.hpp"
#include "paper/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace paper {

// -----------------------------------------------------------------------------
// IpcServer - operator commands (REP) and telemetry stream (PUB)
// -----------------------------------------------------------------------------
//
// @brief  Binds a REP socket for text commands (PING, STATUS, HALT, RESUME,
//         RELOAD, RECONCILE, REPORT) and a PUB socket on which every Event
//         is published as one JSON message.
//
// @details
// The server does not interpret commands; it passes the raw request to the
// CommandHandler (PaperEngine::executeCommand) and sends back whatever
// string that returns. A handler that throws gets an error reply instead of
// killing the server thread.
//
// Telemetry path:
//   EventBus subscriber -> pushTelemetry() -> telemetry_queue_ ->
//   server thread -> formatTelemetry() -> PUB socket.
// Publishing threads therefore never touch a zmq socket.
//
// Loop:
//   run() alternates draining the telemetry queue and one REP receive with
//   a kPollTimeoutMs timeout, so telemetry latency is bounded by that
//   timeout when no commands arrive.
//
// Thread model:
//   Sockets are created in start() and used only by the server thread.
//   pushTelemetry() is safe from any thread.
//
// Ownership:
//   Owns context, sockets (unique_ptr, created lazily) and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();
  void stop();

  void pushTelemetry(Event event);

  // JSON rendering of one event, std::nullopt for types not published.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatPositionUpdate(const PositionUpdateEvent& e);
  static std::string formatCapitalUpdate(const CapitalUpdateEvent& e);
  static std::string formatRiskAlert(const RiskAlertEvent& e);
  static std::string formatSignalRejected(const SignalRejectedEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace paper
