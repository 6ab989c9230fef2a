#include "paper/network/signal_gateway.hpp"

#include <iostream>
#include <utility>

namespace paper {

SignalGateway::SignalGateway(MessageSink sink, const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void SignalGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == ETERM || e.num() == EINTR) {
        break;
      }
      std::cerr << "[SignalGateway] recv failed: " << e.what() << "\n";
      continue;
    }

    if (!result.has_value()) {
      continue;
    }

    ++received_;
    std::string payload = msg.to_string();

    auto decoded = MessageCodec::decode(payload);
    if (!decoded) {
      ++malformed_;
      std::cerr << "[SignalGateway] Dropping payload: "
                << decoded.error().message << " - payload: " << payload
                << "\n";
      continue;
    }

    sink_(std::move(decoded).value());
  }
}

void SignalGateway::stop() { running_.store(false); }

}  // namespace paper
