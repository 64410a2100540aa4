// Copyright (c) 2024 liudegui. MIT License.
//
// stock_prices_dataflow.cpp -- dataflow variables fed by concurrent producers.
//
// Demonstrates:
//   1. One pool task per symbol binding its quote into a DataflowMap
//   2. A consumer blocking on every quote in a fixed order
//   3. A derived variable computed once its inputs are bound
//
// Quotes are generated locally; nothing is fetched over the network.

#include "cfx/dataflow.hpp"
#include "cfx/log.hpp"
#include "cfx/thread_pool.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Quote Source
// ============================================================================

struct Quote {
  std::string symbol;
  double price;
};

/// Simulated lookup with a symbol-dependent latency.
static Quote FetchQuote(const std::string& symbol) {
  uint32_t h = 2166136261U;
  for (char c : symbol) h = (h ^ static_cast<uint8_t>(c)) * 16777619U;
  std::this_thread::sleep_for(std::chrono::milliseconds(5U + h % 40U));
  return Quote{symbol, 10.0 + static_cast<double>(h % 50000U) / 100.0};
}

// ============================================================================
// Main
// ============================================================================

int main() {
  cfx::log::SetLevel(cfx::log::Level::kInfo);

  const std::vector<std::string> symbols{"AAPL", "MSFT", "GOOG", "AMZN", "NVDA", "IBM", "ORCL"};

  cfx::ThreadPoolConfig cfg;
  cfg.name.assign(cfx::TruncateToCapacity, "quotes");
  cfg.threads = 4U;
  cfx::ThreadPool pool(cfg);
  pool.Start();

  printf("\n=== Demo 1: concurrent producers ===\n");
  cfx::DataflowMap<std::string, Quote> quotes;
  for (const auto& s : symbols) {
    cfx::DataflowVariable<Quote> slot = quotes[s];
    (void)pool.Execute([slot, s] {
      auto r = slot.Bind(FetchQuote(s));
      if (!r.has_value()) CFX_LOG_WARN("Quotes", "%s bound twice", s.c_str());
    });
  }

  printf("\n=== Demo 2: blocking consumer ===\n");
  Quote best{"", 0.0};
  for (const auto& s : symbols) {
    const Quote& q = quotes[s].Get();
    printf("  %-5s %8.2f\n", q.symbol.c_str(), q.price);
    if (q.price > best.price) best = q;
  }
  printf("  top: %s at %.2f\n", best.symbol.c_str(), best.price);

  printf("\n=== Demo 3: derived value ===\n");
  cfx::DataflowVariable<double> spread;
  (void)pool.Execute([&quotes, &symbols, spread] {
    double lo = quotes[symbols.front()].Get().price;
    double hi = lo;
    for (const auto& s : symbols) {
      const double p = quotes[s].Get().price;
      if (p < lo) lo = p;
      if (p > hi) hi = p;
    }
    (void)spread.Bind(hi - lo);
  });
  auto r = spread.GetFor(1000U);
  if (r.has_value()) {
    printf("  spread: %.2f\n", r.value());
  } else {
    CFX_LOG_ERROR("Quotes", "spread not ready");
  }

  pool.Shutdown();
  auto stats = pool.GetStats();
  printf("\n  tasks completed: %llu\n", static_cast<unsigned long long>(stats.completed));
  return 0;
}
