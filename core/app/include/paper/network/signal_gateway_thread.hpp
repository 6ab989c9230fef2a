#pragma once

#include "paper/network/signal_gateway.hpp"

#include <memory>
#include <string>
#include <thread>

namespace paper {

// -----------------------------------------------------------------------------
// SignalGatewayThread - owns the intake socket and its thread
// -----------------------------------------------------------------------------
//
// @brief  Creates the SignalGateway in start() (so no socket exists before
//         recovery has finished) and runs its recv loop on a dedicated
//         std::thread.
//
// @details
// start() and stop() are idempotent. stop() signals the gateway, joins the
// thread and destroys the socket; the destructor calls stop().
//
// Thread model:
//   start()/stop() from the owning thread only (PaperEngine).
// -----------------------------------------------------------------------------
class SignalGatewayThread {
 public:
  SignalGatewayThread(SignalGateway::MessageSink sink, std::string endpoint);
  ~SignalGatewayThread();

  SignalGatewayThread(const SignalGatewayThread&) = delete;
  SignalGatewayThread& operator=(const SignalGatewayThread&) = delete;
  SignalGatewayThread(SignalGatewayThread&&) = delete;
  SignalGatewayThread& operator=(SignalGatewayThread&&) = delete;

  void start();
  void stop();

  bool running() const { return thread_.joinable(); }

  // Null before start() and after stop().
  const SignalGateway* gateway() const { return gateway_.get(); }

 private:
  SignalGateway::MessageSink sink_;
  std::string endpoint_;

  std::unique_ptr<SignalGateway> gateway_;
  std::thread thread_;
};

}  // namespace paper
