#include "paper/network/signal_gateway_thread.hpp"

#include <iostream>
#include <utility>

namespace paper {

SignalGatewayThread::SignalGatewayThread(SignalGateway::MessageSink sink,
                                         std::string endpoint)
    : sink_(std::move(sink)), endpoint_(std::move(endpoint)) {}

SignalGatewayThread::~SignalGatewayThread() { stop(); }

void SignalGatewayThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<SignalGateway>(sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[SignalGatewayThread] Subscribed to " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[SignalGatewayThread] Intake loop exited ("
              << gateway_->received() << " received, "
              << gateway_->malformed() << " malformed)\n";
  });
}

void SignalGatewayThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace paper
