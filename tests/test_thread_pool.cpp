/**
 * @file test_thread_pool.cpp
 * @brief Tests for thread_pool.hpp
 */

#include "cfx/thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static cfx::ThreadPoolConfig SmallPool(uint32_t threads, const char* name = "test") {
  cfx::ThreadPoolConfig cfg;
  cfg.name.assign(cfx::TruncateToCapacity, name);
  cfg.threads = threads;
  return cfg;
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("ThreadPool construction and lifecycle", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(2U, "lifecycle"));
  REQUIRE(pool.ThreadCount() == 2U);
  REQUIRE(std::string(pool.Name()) == "lifecycle");
  REQUIRE_FALSE(pool.IsRunning());

  pool.Start();
  REQUIRE(pool.IsRunning());
  pool.Start();  // idempotent
  REQUIRE(pool.IsRunning());

  pool.Shutdown();
  REQUIRE_FALSE(pool.IsRunning());
  pool.Shutdown();  // idempotent
}

TEST_CASE("ThreadPool with zero threads uses hardware concurrency", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(0U));
  REQUIRE(pool.ThreadCount() >= 1U);
}

// ============================================================================
// Submit / Execute
// ============================================================================

TEST_CASE("ThreadPool Submit returns the value", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(2U));
  pool.Start();

  auto h = pool.Submit([] { return 6 * 7; });
  REQUIRE(h.Valid());
  auto r = h.Get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 42);
  REQUIRE(h.IsReady());

  pool.Shutdown();
}

TEST_CASE("ThreadPool Submit of a void callable", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(2U));
  pool.Start();

  std::atomic<int> hits{0};
  auto h = pool.Submit([&hits] { hits.fetch_add(1); });
  REQUIRE(h.Get().has_value());
  REQUIRE(hits.load() == 1);

  pool.Shutdown();
}

TEST_CASE("ThreadPool runs many tasks", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(4U));
  pool.Start();

  std::vector<cfx::TaskHandle<uint64_t>> handles;
  for (uint64_t i = 0U; i < 200U; ++i) {
    handles.push_back(pool.Submit([i] { return i * i; }));
  }
  uint64_t sum = 0U;
  for (auto& h : handles) sum += h.Get().value();

  uint64_t expected = 0U;
  for (uint64_t i = 0U; i < 200U; ++i) expected += i * i;
  REQUIRE(sum == expected);

  auto stats = pool.GetStats();
  REQUIRE(stats.submitted >= 200U);
  pool.Shutdown();
  REQUIRE(pool.GetStats().completed >= 200U);
}

TEST_CASE("ThreadPool Execute fire-and-forget", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(2U));
  pool.Start();

  std::atomic<int> hits{0};
  for (int i = 0; i < 50; ++i) {
    REQUIRE(pool.Execute([&hits] { hits.fetch_add(1); }));
  }
  pool.Shutdown(cfx::ShutdownPolicy::kDrain);
  REQUIRE(hits.load() == 50);
}

// ============================================================================
// Failure isolation
// ============================================================================

TEST_CASE("ThreadPool isolates a throwing task", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(2U));
  pool.Start();

  auto bad = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  auto r = bad.Get();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kExecutionFailed);
  REQUIRE(std::string(bad.ErrorDetail()) == "boom");

  // The worker survives and keeps serving.
  auto good = pool.Submit([] { return 1; });
  REQUIRE(good.Get().value() == 1);

  pool.Shutdown();
  REQUIRE(pool.GetStats().failed >= 1U);
}

TEST_CASE("ThreadPool rejects work when not running", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(1U));

  auto h = pool.Submit([] { return 1; });
  auto r = h.Get();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kRejected);
  REQUIRE_FALSE(pool.Execute([] {}));
}

// ============================================================================
// Shutdown policies
// ============================================================================

TEST_CASE("ThreadPool kDiscard cancels queued work", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(1U));
  pool.Start();

  std::atomic<bool> release{false};
  std::atomic<bool> started{false};
  auto blocker = pool.Submit([&] {
    started.store(true);
    while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  });
  while (!started.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  std::vector<cfx::TaskHandle<int>> queued;
  for (int i = 0; i < 10; ++i) queued.push_back(pool.Submit([i] { return i; }));

  std::thread releaser([&pool, &release] {
    while (pool.IsRunning()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    release.store(true);
  });
  pool.Shutdown(cfx::ShutdownPolicy::kDiscard);
  releaser.join();

  REQUIRE(blocker.Get().has_value());
  for (auto& h : queued) {
    auto r = h.Get();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == cfx::TaskError::kCancelled);
  }
}

TEST_CASE("ThreadPool kDrain runs queued work and work forked while draining",
          "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(2U));
  pool.Start();

  std::atomic<int> hits{0};
  for (int i = 0; i < 20; ++i) {
    REQUIRE(pool.Execute([&pool, &hits] {
      hits.fetch_add(1);
      (void)pool.Execute([&hits] { hits.fetch_add(1); });
    }));
  }
  pool.Shutdown(cfx::ShutdownPolicy::kDrain);
  REQUIRE(hits.load() == 40);
}

// ============================================================================
// Nested waits and timeouts
// ============================================================================

TEST_CASE("ThreadPool worker drives its own nested task with TryRunPendingTask",
          "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(1U));
  pool.Start();

  std::atomic<bool> on_worker{false};
  auto outer = pool.Submit([&pool, &on_worker] {
    on_worker.store(pool.IsWorkerThread());
    auto inner = pool.Submit([] { return 20; });
    while (!inner.IsReady()) {
      if (!pool.TryRunPendingTask()) std::this_thread::yield();
    }
    return inner.Get().value() + 1;
  });
  REQUIRE(outer.Get().value() == 21);
  REQUIRE(on_worker.load());
  REQUIRE_FALSE(pool.IsWorkerThread());

  pool.Shutdown();
}

TEST_CASE("ThreadPool GetFor times out", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(1U));
  pool.Start();

  std::atomic<bool> release{false};
  auto slow = pool.Submit([&release] {
    while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return 5;
  });
  auto r = slow.GetFor(20U);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kTimeout);

  release.store(true);
  REQUIRE(slow.Get().value() == 5);
  pool.Shutdown();
}

TEST_CASE("TaskHandle OnComplete runs after completion", "[thread_pool]") {
  cfx::ThreadPool pool(SmallPool(2U));
  pool.Start();

  std::atomic<int> calls{0};
  auto h = pool.Submit([] { return 3; });
  h.OnComplete([&calls] { calls.fetch_add(1); });
  REQUIRE(h.Get().value() == 3);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (calls.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::yield();
  }
  REQUIRE(calls.load() == 1);

  // Registering after completion runs immediately.
  h.OnComplete([&calls] { calls.fetch_add(1); });
  REQUIRE(calls.load() == 2);
  pool.Shutdown();
}

TEST_CASE("WithPool scopes a running pool", "[thread_pool]") {
  int v = cfx::WithPool(2U, [](cfx::ThreadPool& pool) {
    REQUIRE(pool.IsRunning());
    return pool.Submit([] { return 9; }).Get().value();
  });
  REQUIRE(v == 9);
}
