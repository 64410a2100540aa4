// Copyright (c) 2024 liudegui. MIT License.
//
// actor_demo.cpp -- actors sharing one ParallelGroup.
//
// Demonstrates:
//   1. Request/reply with a ReactiveActor
//   2. Type dispatch with a DynamicDispatchActor
//   3. A LoopActor with a receive timeout
//   4. Supervision of a failing actor
//   5. Fair vs non-fair scheduling on a single worker

#include "cfx/actor.hpp"
#include "cfx/dataflow.hpp"
#include "cfx/dispatch_actor.hpp"
#include "cfx/log.hpp"
#include "cfx/loop_actor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// ============================================================================
// Messages
// ============================================================================

struct Deposit {
  int64_t amount;
};
struct Withdraw {
  int64_t amount;
};
struct Balance {};

CFX_MESSAGE(Deposit);
CFX_MESSAGE(Withdraw);
CFX_MESSAGE(Balance);

// ============================================================================
// Account
// ============================================================================

class Account : public cfx::DynamicDispatchActor {
 public:
  Account() {
    When<Deposit>([this](const Deposit& d) { balance_ += d.amount; });
    When<Withdraw>([this](const Withdraw& w) {
      if (w.amount > balance_) {
        Fail(cfx::ActorError::kExecutionFailed, "overdraft");
        return;
      }
      balance_ -= w.amount;
    });
    When<Balance>([this](const Balance&) { (void)Reply(balance_); });
  }

 private:
  int64_t balance_{0};
};

// ============================================================================
// Supervisor
// ============================================================================

class Supervisor : public cfx::StaticDispatchActor<cfx::ActorFailure> {
 public:
  explicit Supervisor(cfx::DataflowVariable<std::string> report)
      : cfx::StaticDispatchActor<cfx::ActorFailure>(
            [report](cfx::StaticDispatchActor<cfx::ActorFailure>&, const cfx::ActorFailure& f) {
              (void)report.Bind(std::string(f.name.c_str()) + ": " + f.detail.c_str());
            }) {}
};

// ============================================================================
// Demo 5: Fairness
// ============================================================================

/// Two actors with four queued messages each on one worker; returns the
/// order in which they were handled.
static std::string Interleaving(bool fair) {
  cfx::ParallelGroupConfig cfg;
  cfg.name.assign(cfx::TruncateToCapacity, fair ? "fair" : "greedy");
  cfg.threads = 1U;
  cfg.fair = fair;
  cfx::ParallelGroup group(cfg);

  std::mutex mutex;
  std::string trace;
  auto tracer = [&mutex, &trace](char tag) {
    return [&mutex, &trace, tag](cfx::StaticDispatchActor<int>&, const int&) {
      std::lock_guard<std::mutex> lock(mutex);
      trace.push_back(tag);
    };
  };
  auto a = group.Spawn<cfx::StaticDispatchActor<int>>(tracer('a'));
  auto b = group.Spawn<cfx::StaticDispatchActor<int>>(tracer('b'));

  // Hold the only worker while both mailboxes fill up.
  std::atomic<bool> release{false};
  (void)group.Pool().Execute([&release] {
    while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  });
  for (int i = 0; i < 4; ++i) {
    (void)a->Send(i);
    (void)b->Send(i);
  }
  release.store(true);

  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (trace.size() == 8U) break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  group.Shutdown();
  return trace;
}

// ============================================================================
// Main
// ============================================================================

int main() {
  cfx::ParallelGroupConfig cfg;
  cfg.name = "demo";
  cfg.threads = 2U;
  cfx::ParallelGroup group(cfg);

  printf("\n=== Demo 1: ReactiveActor ===\n");
  auto square = group.Spawn<cfx::ReactiveActor<int, int>>([](const int& v) { return v * v; });
  for (int i = 1; i <= 5; ++i) {
    auto r = square->SendAndWait<int>(i);
    if (r.has_value()) printf("  %d^2 = %d\n", i, r.value());
  }

  printf("\n=== Demo 2: DynamicDispatchActor ===\n");
  auto account = group.Spawn<Account>();
  account->SetName("account");
  (void)account->Send(Deposit{100});
  (void)account->Send(Withdraw{30});
  (void)account->Send(Deposit{5});
  auto balance = account->SendAndWait<int64_t>(Balance{});
  if (balance.has_value()) {
    printf("  balance: %lld\n", static_cast<long long>(balance.value()));
  }

  printf("\n=== Demo 3: LoopActor with a receive timeout ===\n");
  cfx::DataflowVariable<int> ticks;
  auto counter = group.Spawn<cfx::LoopActor>([ticks](cfx::LoopActor& self) {
    auto count = std::make_shared<int>(0);
    self.Loop([&self, count, ticks] {
      self.React(50U, [&self, count, ticks](const cfx::Message& msg) {
        if (msg.Is<cfx::Timeout>()) {
          (void)ticks.Bind(*count);
          self.Stop();
          return;
        }
        ++*count;
      });
    });
  });
  for (int i = 0; i < 3; ++i) (void)counter->Send(std::string("tick"));
  printf("  counted %d messages before going idle\n", ticks.Get());
  (void)counter->Join();

  printf("\n=== Demo 4: supervision ===\n");
  cfx::DataflowVariable<std::string> report;
  auto supervisor = group.Spawn<Supervisor>(report);
  account->SetSupervisor(supervisor);
  (void)account->Send(Withdraw{1000});
  printf("  supervisor saw %s\n", report.Get().c_str());
  auto end = account->Join();
  printf("  account ended with %s\n",
         end.has_value() ? "success" : cfx::ActorErrorName(end.get_error()));

  group.Shutdown();

  printf("\n=== Demo 5: fairness ===\n");
  printf("  non-fair: %s\n", Interleaving(false).c_str());
  printf("  fair:     %s\n", Interleaving(true).c_str());
  return 0;
}
