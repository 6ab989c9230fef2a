#pragma once

#include "paper/network/message_codec.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace paper {

// -----------------------------------------------------------------------------
// SignalGateway - ZeroMQ SUB intake for signals and market data
// -----------------------------------------------------------------------------
//
// @brief  Connects a SUB socket to the upstream model publisher, decodes
//         each JSON payload with MessageCodec and hands the result to a
//         sink.
//
// @details
// The gateway knows nothing about the engine: PaperEngine binds the sink
// to its dispatch function, which routes signals to the WorkerPool and
// applies market updates and resolutions.
//
// Undecodable payloads are logged, counted in malformed() and skipped; the
// loop never stops on bad input.
//
// Shutdown:
//   The socket has a receive timeout (kRecvTimeoutMs) so run() re-checks
//   the running_ flag at least that often; stop() is therefore honoured
//   within one timeout even on a silent feed.
//
// Thread model:
//   run() blocks and must be called from exactly one thread (see
//   SignalGatewayThread). stop() and the counters are safe from any thread.
//
// Ownership:
//   Owns the zmq context and socket (RAII). Holds a copy of the sink.
// -----------------------------------------------------------------------------
class SignalGateway {
 public:
  using MessageSink = std::function<void(InboundMessage)>;

  SignalGateway(MessageSink sink, const std::string& endpoint);
  ~SignalGateway() = default;

  SignalGateway(const SignalGateway&) = delete;
  SignalGateway& operator=(const SignalGateway&) = delete;
  SignalGateway(SignalGateway&&) = delete;
  SignalGateway& operator=(SignalGateway&&) = delete;

  void run();
  void stop();

  std::uint64_t received() const { return received_.load(); }
  std::uint64_t malformed() const { return malformed_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  MessageSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> malformed_{0};
};

}  // namespace paper
