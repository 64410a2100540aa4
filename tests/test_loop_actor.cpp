/**
 * @file test_loop_actor.cpp
 * @brief Tests for loop_actor.hpp
 */

#include "cfx/dataflow.hpp"
#include "cfx/loop_actor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>

static cfx::ParallelGroupConfig LoopGroup() {
  cfx::ParallelGroupConfig cfg;
  cfg.name = "loop";
  cfg.threads = 2U;
  cfg.timer_slots = 8U;
  return cfg;
}

TEST_CASE("LoopActor echoes in a loop", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  auto echo = group.Spawn<cfx::LoopActor>([](cfx::LoopActor& self) {
    self.Loop([&self] {
      self.React([&self](const cfx::Message& msg) { (void)self.Reply(msg); });
    });
  });

  REQUIRE(echo->SendAndWait<int>(5).value() == 5);
  REQUIRE(echo->SendAndWait<std::string>(std::string("hi")).value() == "hi");

  echo->Stop();
  REQUIRE(echo->Join().has_value());
  REQUIRE(echo->Iterations() >= 2U);
}

TEST_CASE("LoopActor without a body stops after start-up", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  auto idle = group.Spawn<cfx::LoopActor>();
  REQUIRE(idle->Join().has_value());
  REQUIRE(idle->State() == cfx::ActorState::kStopped);
}

TEST_CASE("LoopActor chained continuations without a loop", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  cfx::DataflowVariable<int> total;
  auto adder = group.Spawn<cfx::LoopActor>([total](cfx::LoopActor& self) {
    self.React([&self, total](const cfx::Message& first) {
      const int a = first.Get<int>();
      self.React([a, total](const cfx::Message& second) {
        (void)total.Bind(a + second.Get<int>());
      });
    });
  });

  REQUIRE(adder->Send(20).has_value());
  REQUIRE(adder->Send(22).has_value());
  REQUIRE(total.Get() == 42);
  REQUIRE(adder->Join().has_value());
  REQUIRE_FALSE(adder->HasContinuation());
}

TEST_CASE("LoopActor Loop with a count", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  std::atomic<int> handled{0};
  auto counter = group.Spawn<cfx::LoopActor>([&handled](cfx::LoopActor& self) {
    self.Loop(3U, [&self, &handled] {
      self.React([&handled](const cfx::Message&) { handled.fetch_add(1); });
    });
  });

  for (int i = 0; i < 5; ++i) (void)counter->Send(i);
  REQUIRE(counter->Join().has_value());
  REQUIRE(handled.load() == 3);
  REQUIRE(counter->Iterations() == 3U);
}

TEST_CASE("LoopActor React with Behavior dispatches by type", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  auto calc = group.Spawn<cfx::LoopActor>([](cfx::LoopActor& self) {
    self.Loop([&self] {
      cfx::Behavior b;
      b.On<int>([&self](const int& v) { (void)self.Reply(v * 2); });
      b.On<std::string>([&self](const std::string& s) { (void)self.Reply(static_cast<int>(s.size())); });
      self.React(std::move(b));
    });
  });

  REQUIRE(calc->SendAndWait<int>(21).value() == 42);
  REQUIRE(calc->SendAndWait<int>(std::string("four")).value() == 4);

  auto miss = calc->SendAndWait(cfx::Message(3.5));
  REQUIRE_FALSE(miss.has_value());
  REQUIRE(miss.get_error() == cfx::ActorError::kDispatchNotFound);

  auto r = calc->Join();
  REQUIRE(r.get_error() == cfx::ActorError::kDispatchNotFound);
  REQUIRE(std::string(calc->TerminationDetail()) == "message");
}

// ============================================================================
// Receive timeouts
// ============================================================================

TEST_CASE("LoopActor React timeout delivers Timeout", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  std::atomic<bool> timed_out{false};
  auto waiter = group.Spawn<cfx::LoopActor>([&timed_out](cfx::LoopActor& self) {
    self.React(20U, [&timed_out](const cfx::Message& msg) {
      timed_out.store(msg.Is<cfx::Timeout>());
    });
  });

  REQUIRE(waiter->JoinFor(5000U).has_value());
  REQUIRE(timed_out.load());
}

TEST_CASE("LoopActor real message wins over a pending timeout", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  std::atomic<int> timeouts{0};
  std::atomic<int> values{0};
  auto waiter = group.Spawn<cfx::LoopActor>([&](cfx::LoopActor& self) {
    self.Loop(2U, [&self, &timeouts, &values] {
      self.React(5000U, [&timeouts, &values](const cfx::Message& msg) {
        if (msg.Is<cfx::Timeout>()) {
          timeouts.fetch_add(1);
        } else {
          values.fetch_add(msg.Get<int>());
        }
      });
    });
  });

  REQUIRE(waiter->Send(1).has_value());
  REQUIRE(waiter->Send(2).has_value());
  REQUIRE(waiter->JoinFor(5000U).has_value());
  REQUIRE(values.load() == 3);
  REQUIRE(timeouts.load() == 0);
}

TEST_CASE("LoopActor Behavior with timeout handles Timeout by type", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  cfx::DataflowVariable<std::string> outcome;
  auto waiter = group.Spawn<cfx::LoopActor>([outcome](cfx::LoopActor& self) {
    cfx::Behavior b;
    b.On<int>([outcome](const int&) { (void)outcome.Bind("value"); });
    b.On<cfx::Timeout>([outcome](const cfx::Timeout&) { (void)outcome.Bind("timeout"); });
    self.React(10U, std::move(b));
  });

  REQUIRE(outcome.Get() == "timeout");
  REQUIRE(waiter->Join().has_value());
}

// ============================================================================
// Subclassing
// ============================================================================

class Accumulator : public cfx::LoopActor {
 public:
  int total{0};  // read after Join()

 protected:
  void Act() override {
    Loop([this] {
      React([this](const cfx::Message& msg) {
        if (msg.Is<std::string>()) {
          (void)Reply(total);
          Stop();
          return;
        }
        total += msg.Get<int>();
      });
    });
  }
};

TEST_CASE("LoopActor subclass overriding Act", "[loop_actor]") {
  cfx::ParallelGroup group(LoopGroup());
  auto acc = group.Spawn<Accumulator>();
  for (int i = 1; i <= 10; ++i) REQUIRE(acc->Send(i).has_value());
  REQUIRE(acc->SendAndWait<int>(std::string("sum")).value() == 55);
  REQUIRE(acc->Join().has_value());
  REQUIRE(acc->total == 55);
}
