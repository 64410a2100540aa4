// Copyright (c) 2024 liudegui. MIT License.
//
// map_reduce_demo.cpp -- parallel collections and fork/join.
//
// Demonstrates:
//   1. Word count with Map + Combine
//   2. Filter / Map / Sum over a numeric range
//   3. A hand-written fork/join task summing an array
//   4. Sequential vs parallel timing

#include "cfx/fork_join.hpp"
#include "cfx/log.hpp"
#include "cfx/pipeline.hpp"
#include "cfx/thread_pool.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// ============================================================================
// Timing Helpers
// ============================================================================

using Clock = std::chrono::steady_clock;

static inline uint64_t ElapsedUs(Clock::time_point t0, Clock::time_point t1) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count());
}

// ============================================================================
// Demo 3: Fork/Join Sum
// ============================================================================

class RangeSum : public cfx::ForkJoinTask<uint64_t> {
 public:
  RangeSum(const std::vector<uint32_t>* data, size_t lo, size_t hi)
      : data_(data), lo_(lo), hi_(hi) {}

  void Compute() override {
    if (hi_ - lo_ <= kThreshold) {
      uint64_t sum = 0U;
      for (size_t i = lo_; i < hi_; ++i) sum += (*data_)[i];
      SetResult(sum);
      return;
    }
    const size_t mid = lo_ + (hi_ - lo_) / 2U;
    Fork<RangeSum>(data_, lo_, mid);
    Fork<RangeSum>(data_, mid, hi_);
    auto r = ChildrenResults();
    if (r) SetResult(r.value()[0] + r.value()[1]);
  }

 private:
  static constexpr size_t kThreshold = 4096U;

  const std::vector<uint32_t>* data_;
  size_t lo_;
  size_t hi_;
};

// ============================================================================
// Main
// ============================================================================

int main() {
  cfx::ThreadPoolConfig cfg;
  cfg.name.assign(cfx::TruncateToCapacity, "mapreduce");
  cfg.threads = 4U;
  cfx::ThreadPool pool(cfg);
  pool.Start();

  printf("\n=== Demo 1: word count ===\n");
  const std::vector<std::string> lines{
      "the quick brown fox", "jumps over the lazy dog", "the dog barks",
      "a fox is quick", "over and over again"};
  std::vector<std::pair<std::string, int>> words;
  for (const auto& line : lines) {
    std::istringstream in(line);
    std::string w;
    while (in >> w) words.emplace_back(w, 1);
  }
  auto counts = cfx::AsParallel(pool, std::move(words))
                    .Combine(0, [](int acc, int n) { return acc + n; });
  if (counts.has_value()) {
    for (const char* w : {"the", "fox", "over", "dog"}) {
      printf("  %-5s %d\n", w, counts.value().at(w));
    }
  } else {
    CFX_LOG_ERROR("Demo", "word count failed: %s", cfx::TaskErrorName(counts.get_error()));
  }

  printf("\n=== Demo 2: pipeline ===\n");
  std::vector<int64_t> numbers;
  for (int64_t i = 1; i <= 100000; ++i) numbers.push_back(i);
  auto even_squares = cfx::AsParallel(pool, numbers)
                          .Filter([](int64_t v) { return v % 2 == 0; })
                          .Map([](int64_t v) { return v * v % 1000; })
                          .Sum();
  if (even_squares.has_value()) {
    printf("  sum of even squares mod 1000: %lld\n",
           static_cast<long long>(even_squares.value()));
  }

  printf("\n=== Demo 3/4: fork/join sum ===\n");
  std::vector<uint32_t> data(4U * 1024U * 1024U);
  for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint32_t>(i % 97U);

  auto t0 = Clock::now();
  uint64_t sequential = 0U;
  for (uint32_t v : data) sequential += v;
  auto t1 = Clock::now();
  auto parallel = cfx::Orchestrate(pool, std::make_unique<RangeSum>(&data, 0U, data.size()));
  auto t2 = Clock::now();

  if (parallel.has_value()) {
    printf("  sequential: %llu in %llu us\n", static_cast<unsigned long long>(sequential),
           static_cast<unsigned long long>(ElapsedUs(t0, t1)));
    printf("  fork/join:  %llu in %llu us\n", static_cast<unsigned long long>(parallel.value()),
           static_cast<unsigned long long>(ElapsedUs(t1, t2)));
  } else {
    CFX_LOG_ERROR("Demo", "fork/join failed: %s", cfx::TaskErrorName(parallel.get_error()));
  }

  pool.Shutdown();
  return 0;
}
