/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "cfx/timer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

// ============================================================================
// Basic API Tests
// ============================================================================

TEST_CASE("TimerScheduler AddOneShot and Remove", "[timer]") {
  cfx::TimerScheduler sched(4);

  auto result = sched.AddOneShot(100, [] {});
  REQUIRE(result.has_value());
  REQUIRE(result.value().value() > 0U);
  REQUIRE(sched.TaskCount() == 1U);

  auto rm = sched.Remove(result.value());
  REQUIRE(rm.has_value());
  REQUIRE(sched.TaskCount() == 0U);
}

TEST_CASE("TimerScheduler slots full", "[timer]") {
  cfx::TimerScheduler sched(2);
  REQUIRE(sched.Capacity() == 2U);
  auto r1 = sched.AddOneShot(100, [] {});
  auto r2 = sched.AddOneShot(100, [] {});
  REQUIRE(r1.has_value());
  REQUIRE(r2.has_value());

  auto r3 = sched.AddOneShot(100, [] {});
  REQUIRE(!r3.has_value());
  REQUIRE(r3.get_error() == cfx::TimerError::kSlotsFull);
}

TEST_CASE("TimerScheduler remove unknown id", "[timer]") {
  cfx::TimerScheduler sched(2);
  auto r = sched.Remove(cfx::TimerTaskId(999U));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == cfx::TimerError::kNotRunning);
}

TEST_CASE("TimerScheduler Start twice", "[timer]") {
  cfx::TimerScheduler sched(2);
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.IsRunning());

  auto again = sched.Start();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == cfx::TimerError::kAlreadyRunning);

  sched.Stop();
  REQUIRE_FALSE(sched.IsRunning());
}

// ============================================================================
// Firing
// ============================================================================

TEST_CASE("TimerScheduler one-shot fires once and frees its slot", "[timer]") {
  cfx::TimerScheduler sched(1);
  std::atomic<int> fired{0};
  REQUIRE(sched.AddOneShot(5, [&fired] { fired.fetch_add(1); }).has_value());
  REQUIRE(sched.Start().has_value());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (sched.TaskCount() != 0U && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  sched.Stop();

  REQUIRE(fired.load() == 1);
  REQUIRE(sched.TaskCount() == 0U);
  // The freed slot can be reused.
  REQUIRE(sched.AddOneShot(5, [] {}).has_value());
}

TEST_CASE("TimerScheduler removed one-shot never fires", "[timer]") {
  cfx::TimerScheduler sched(2);
  std::atomic<int> fired{0};
  REQUIRE(sched.Start().has_value());
  auto id = sched.AddOneShot(200, [&fired] { fired.fetch_add(1); });
  REQUIRE(id.has_value());
  REQUIRE(sched.Remove(id.value()).has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  sched.Stop();
  REQUIRE(fired.load() == 0);
}

TEST_CASE("TimerScheduler zero-delay one-shot", "[timer]") {
  cfx::TimerScheduler sched(2);
  std::atomic<bool> fired{false};
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.AddOneShot(0, [&fired] { fired.store(true); }).has_value());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!fired.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  sched.Stop();
  REQUIRE(fired.load());
}
