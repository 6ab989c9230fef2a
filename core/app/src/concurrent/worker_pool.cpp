#include "paper/concurrent/worker_pool.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>

namespace paper {

namespace {

// How long an idle worker waits before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

WorkerPool::WorkerPool(std::size_t threads)
    : thread_count_(threads == 0 ? 1 : threads) {}

WorkerPool::~WorkerPool() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void WorkerPool::start() {
  if (!threads_.empty()) {
    return;
  }

  running_.store(true);

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

// -----------------------------------------------------------------------------
// stop(): workers drain the queue before exiting
// -----------------------------------------------------------------------------
void WorkerPool::stop() {
  if (threads_.empty()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();

  for (auto& t : threads_) {
    t.join();
  }
  threads_.clear();
}

// -----------------------------------------------------------------------------
// submit()
// -----------------------------------------------------------------------------
bool WorkerPool::submit(Task task) {
  if (!running_.load()) {
    dropped_.fetch_add(1);
    return false;
  }
  queue_.push(std::move(task));
  stop_cv_.notify_one();
  return true;
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  for (;;) {
    std::optional<Task> task = queue_.try_pop();

    if (task) {
      // A task must not take the worker down with it. Tasks report their
      // own failures through Result values; anything escaping here is a
      // bug in the task and is logged with its message.
      try {
        (*task)();
      } catch (const std::exception& e) {
        std::cerr << "[WorkerPool] CRITICAL: task threw: " << e.what()
                  << "\n";
      }
      continue;
    }

    if (!running_.load()) {
      return;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load() || !queue_.empty(); });
  }
}

}  // namespace paper
