/**
 * @file test_fork_join.cpp
 * @brief Tests for fork_join.hpp
 */

#include "cfx/fork_join.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

static cfx::ThreadPoolConfig ForkJoinPool(uint32_t threads) {
  cfx::ThreadPoolConfig cfg;
  cfg.name.assign(cfx::TruncateToCapacity, "fj");
  cfg.threads = threads;
  return cfg;
}

// ============================================================================
// Test tasks
// ============================================================================

/// Counts the leaves of a complete tree with the given branching and depth.
class LeafCounter : public cfx::ForkJoinTask<uint64_t> {
 public:
  LeafCounter(uint32_t branching, uint32_t depth) : branching_(branching), depth_(depth) {}

  void Compute() override {
    if (depth_ == 0U) {
      SetResult(1U);
      return;
    }
    for (uint32_t i = 0U; i < branching_; ++i) Fork<LeafCounter>(branching_, depth_ - 1U);
    auto r = ChildrenResults();
    if (!r) return;
    uint64_t total = 0U;
    for (uint64_t v : r.value()) total += v;
    SetResult(total);
  }

 private:
  uint32_t branching_;
  uint32_t depth_;
};

class Fib : public cfx::ForkJoinTask<uint64_t> {
 public:
  explicit Fib(uint32_t n) : n_(n) {}

  void Compute() override {
    if (n_ < 2U) {
      SetResult(n_);
      return;
    }
    Fork<Fib>(n_ - 1U);
    Fork<Fib>(n_ - 2U);
    auto r = ChildrenResults();
    if (r) SetResult(r.value()[0] + r.value()[1]);
  }

 private:
  uint32_t n_;
};

/// Forks leaves 0..count-1; the leaf numbered @p bad throws.
class FaultyFanOut : public cfx::ForkJoinTask<int> {
 public:
  FaultyFanOut(int count, int bad) : count_(count), bad_(bad), index_(-1) {}

  void Compute() override {
    if (index_ >= 0) {
      if (index_ == bad_) throw std::runtime_error("leaf failed");
      SetResult(index_);
      return;
    }
    for (int i = 0; i < count_; ++i) {
      auto child = std::make_unique<FaultyFanOut>(count_, bad_);
      child->index_ = i;
      ForkOffChild(std::move(child));
    }
    (void)ChildrenResults();
    SetResult(-1);  // ignored when a child failed
  }

 private:
  int count_;
  int bad_;
  int index_;
};

class NoResult : public cfx::ForkJoinTask<int> {
 public:
  void Compute() override {}
};

class Thrower : public cfx::ForkJoinTask<int> {
 public:
  void Compute() override { throw std::runtime_error("root failed"); }
};

class Constant : public cfx::ForkJoinTask<int> {
 public:
  explicit Constant(int v) : v_(v) {}
  void Compute() override { SetResult(v_); }

 private:
  int v_;
};

// ============================================================================
// Results
// ============================================================================

TEST_CASE("Fork/join counts the leaves of a balanced tree", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(4U));
  pool.Start();

  auto h = cfx::OrchestrateAsync(pool, std::make_unique<LeafCounter>(3U, 6U));
  REQUIRE(h.Valid());
  auto r = h.Get();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 729U);
  REQUIRE(h.IsReady());
  // 1 + 3 + 9 + ... + 729
  REQUIRE(h.NodeCount() == 1093U);
}

TEST_CASE("Fork/join computes Fibonacci numbers", "[fork_join]") {
  SECTION("many workers") {
    cfx::ThreadPool pool(ForkJoinPool(4U));
    pool.Start();
    auto r = cfx::Orchestrate(pool, std::make_unique<Fib>(20U));
    REQUIRE(r.has_value());
    REQUIRE(r.value() == 6765U);
  }

  SECTION("single worker runs unstarted children inline") {
    cfx::ThreadPool pool(ForkJoinPool(1U));
    pool.Start();
    auto r = cfx::Orchestrate(pool, std::make_unique<Fib>(15U));
    REQUIRE(r.has_value());
    REQUIRE(r.value() == 610U);
  }
}

TEST_CASE("Fork/join started from a pool task on a single worker", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(1U));
  pool.Start();

  // The only worker waits on the computation; it runs the root itself.
  auto outer = pool.Submit([&pool] {
    auto r = cfx::Orchestrate(pool, std::make_unique<Fib>(12U));
    return r.has_value() ? r.value() : uint64_t{0};
  });
  auto result = outer.GetFor(5000U);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == 144U);
  pool.Shutdown();
}

TEST_CASE("Fork/join leaf without children", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(2U));
  pool.Start();
  auto r = cfx::Orchestrate(pool, std::make_unique<Constant>(7));
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 7);
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("Fork/join child failure propagates to the root", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(3U));
  pool.Start();

  auto h = cfx::OrchestrateAsync(pool, std::make_unique<FaultyFanOut>(8, 5));
  auto r = h.Get();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kExecutionFailed);
  REQUIRE(std::string(h.ErrorDetail()) == "leaf failed");
  REQUIRE(h.NodeCount() == 9U);
}

TEST_CASE("Fork/join root without a result", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(2U));
  pool.Start();
  auto r = cfx::Orchestrate(pool, std::make_unique<NoResult>());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kNoResult);
}

TEST_CASE("Fork/join throwing root", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(2U));
  pool.Start();
  auto h = cfx::OrchestrateAsync(pool, std::make_unique<Thrower>());
  auto r = h.Get();
  REQUIRE(r.get_error() == cfx::TaskError::kExecutionFailed);
  REQUIRE(std::string(h.ErrorDetail()) == "root failed");
}

TEST_CASE("Fork/join children results are handed over once", "[fork_join]") {
  class TakeTwice : public cfx::ForkJoinTask<int> {
   public:
    void Compute() override {
      Fork<Constant>(20);
      Fork<Constant>(22);
      auto first = ChildrenResults();
      auto second = ChildrenResults();
      if (first && !second && second.get_error() == cfx::TaskError::kNoResult) {
        SetResult(first.value()[0] + first.value()[1]);
      }
    }
  };

  cfx::ThreadPool pool(ForkJoinPool(2U));
  pool.Start();
  auto r = cfx::Orchestrate(pool, std::make_unique<TakeTwice>());
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 42);
}

// ============================================================================
// Cancellation and rejection
// ============================================================================

TEST_CASE("Fork/join cancel before the root starts", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(1U));
  pool.Start();

  std::atomic<bool> release{false};
  std::atomic<bool> busy{false};
  REQUIRE(pool.Execute([&] {
    busy.store(true);
    while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }));
  while (!busy.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  auto h = cfx::OrchestrateAsync(pool, std::make_unique<LeafCounter>(2U, 4U));
  h.Cancel();
  release.store(true);

  auto r = h.Get();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kCancelled);
  REQUIRE(h.NodeCount() == 1U);
}

TEST_CASE("Fork/join cancel from inside Compute", "[fork_join]") {
  class SelfCancel : public cfx::ForkJoinTask<int> {
   public:
    void Compute() override {
      Cancel();
      if (!IsCancelled()) return;
      Fork<Constant>(1);
      Fork<Constant>(2);
      auto r = ChildrenResults();
      if (r) SetResult(r.value()[0] + r.value()[1]);
    }
  };

  cfx::ThreadPool pool(ForkJoinPool(2U));
  pool.Start();
  auto r = cfx::Orchestrate(pool, std::make_unique<SelfCancel>());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kCancelled);
}

TEST_CASE("Fork/join on a stopped pool is rejected", "[fork_join]") {
  cfx::ThreadPool pool(ForkJoinPool(1U));
  auto r = cfx::Orchestrate(pool, std::make_unique<Fib>(5U));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::TaskError::kRejected);
}

TEST_CASE("Fork/join default handle", "[fork_join]") {
  cfx::ForkJoinHandle<int> h;
  REQUIRE_FALSE(h.Valid());
  REQUIRE_FALSE(h.IsReady());
  REQUIRE(h.NodeCount() == 0U);
  REQUIRE(h.Get().get_error() == cfx::TaskError::kNoResult);
  h.Cancel();
}
