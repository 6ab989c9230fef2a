// =============================================================================
// periodic_task_test.cpp
// =============================================================================
// Unit tests for paper::PeriodicTask (the sweep timer).
//
// Validates:
//   - The callback fires repeatedly at roughly the interval
//   - stop() returns promptly even with a long interval
//   - No tick happens after stop() returns
//   - A throwing callback does not end the task
// =============================================================================

#include "paper/concurrent/periodic_task.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

class PeriodicTaskTest : public ::testing::Test {};

// -----------------------------------------------------------------------------
// 1. Several ticks in a short window.
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, TicksRepeatedly) {
  std::atomic<int> ticks{0};
  paper::PeriodicTask task("test", 5ms, [&ticks] { ticks.fetch_add(1); });

  task.start();
  EXPECT_TRUE(task.running());
  std::this_thread::sleep_for(100ms);
  task.stop();

  EXPECT_FALSE(task.running());
  EXPECT_GE(ticks.load(), 3);
}

// -----------------------------------------------------------------------------
// 2. stop() wakes the wait instead of sleeping out the interval.
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, StopIsPrompt) {
  std::atomic<int> ticks{0};
  paper::PeriodicTask task("slow", 10s, [&ticks] { ticks.fetch_add(1); });
  task.start();

  const auto begin = std::chrono::steady_clock::now();
  task.stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, 1s);
  EXPECT_EQ(ticks.load(), 0);
}

// -----------------------------------------------------------------------------
// 3. Quiet after stop().
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, NoTicksAfterStop) {
  std::atomic<int> ticks{0};
  paper::PeriodicTask task("test", 2ms, [&ticks] { ticks.fetch_add(1); });
  task.start();
  std::this_thread::sleep_for(20ms);
  task.stop();

  const int at_stop = ticks.load();
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(ticks.load(), at_stop);
}

// -----------------------------------------------------------------------------
// 4. A throwing tick is logged and the schedule continues.
// -----------------------------------------------------------------------------
TEST_F(PeriodicTaskTest, ThrowingTickIsContained) {
  std::atomic<int> ticks{0};
  paper::PeriodicTask task("throws", 2ms, [&ticks] {
    ticks.fetch_add(1);
    throw std::runtime_error("tick failed");
  });
  task.start();
  std::this_thread::sleep_for(50ms);
  task.stop();

  EXPECT_GE(ticks.load(), 2);
}
