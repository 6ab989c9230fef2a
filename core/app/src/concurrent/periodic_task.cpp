#include "paper/concurrent/periodic_task.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace paper {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           Callback callback)
    : name_(std::move(name)),
      interval_(interval),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void PeriodicTask::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): sleep for one interval, tick, repeat until stopped
// -----------------------------------------------------------------------------
void PeriodicTask::run() {
  for (;;) {
    {
      std::unique_lock lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, interval_,
                            [this] { return !running_.load(); })) {
        return;
      }
    }

    try {
      callback_();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] CRITICAL: tick threw: " << e.what()
                << "\n";
    }
  }
}

}  // namespace paper
