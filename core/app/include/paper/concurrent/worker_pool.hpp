#pragma once

#include "paper/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace paper {

// -----------------------------------------------------------------------------
// WorkerPool - fixed set of threads draining a shared task queue
// -----------------------------------------------------------------------------
//
// @brief  Runs signal-intake tasks in parallel. Signals for distinct markets
//         are independent, so any worker may take any task; per-market
//         ordering is enforced inside the task by MarketLockTable.
//
// @details
// Each worker loops on try_pop(). When the queue is empty it waits on
// stop_cv_ for a short idle interval, so stop() is observed promptly
// without busy-waiting.
//
// stop() lets workers finish every task already queued, then joins them.
// Tasks submitted after stop() are dropped (and counted).
//
// Thread model:
//   submit() is safe from any thread. start()/stop() are called from the
//   owning thread only (PaperEngine or a test).
//
// Ownership:
//   Owned by PaperEngine as a value member. Owns its threads and queue.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Task = std::function<void()>;

  explicit WorkerPool(std::size_t threads);

  // Joins all workers.
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // Idempotent.
  void start();

  // Drains queued tasks, then joins. Idempotent.
  void stop();

  // Returns false (task dropped) when the pool is not running.
  bool submit(Task task);

  std::size_t threadCount() const { return thread_count_; }
  std::size_t pending() const { return queue_.size(); }
  std::size_t dropped() const { return dropped_.load(); }

 private:
  void run();

  const std::size_t thread_count_;

  ThreadSafeQueue<Task> queue_;

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> dropped_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::vector<std::thread> threads_;
};

}  // namespace paper
