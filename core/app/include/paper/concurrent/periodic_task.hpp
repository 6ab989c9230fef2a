#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace paper {

// -----------------------------------------------------------------------------
// PeriodicTask - runs a callback on its own thread at a fixed interval
// -----------------------------------------------------------------------------
//
// @brief  Drives the evaluation sweep (stop-loss / take-profit / expiry /
//         edge reversal over all open positions) independently of intake,
//         so sweeps never block new signals and vice versa.
//
// @details
// The thread sleeps on stop_cv_ with wait_for(interval); stop() notifies
// the condition variable so shutdown does not wait out a full interval.
// The first tick fires one interval after start().
//
// Thread model:
//   The callback runs on the task's thread only. start()/stop() from the
//   owning thread.
// -----------------------------------------------------------------------------
class PeriodicTask {
 public:
  using Callback = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               Callback callback);

  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;
  PeriodicTask(PeriodicTask&&) = delete;
  PeriodicTask& operator=(PeriodicTask&&) = delete;

  void start();
  void stop();

  bool running() const { return running_.load(); }

 private:
  void run();

  const std::string name_;
  const std::chrono::milliseconds interval_;
  Callback callback_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace paper
