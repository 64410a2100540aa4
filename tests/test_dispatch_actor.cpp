/**
 * @file test_dispatch_actor.cpp
 * @brief Tests for dispatch_actor.hpp
 */

#include "cfx/dataflow.hpp"
#include "cfx/dispatch_actor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

struct Animal {
  std::string name;
};
struct Dog : Animal {
  int tricks{0};
};
struct Puppy : Dog {};

CFX_MESSAGE(Animal);
CFX_MESSAGE_DERIVED(Dog, Animal);
CFX_MESSAGE_DERIVED(Puppy, Dog);

static cfx::ParallelGroupConfig DispatchGroup() {
  cfx::ParallelGroupConfig cfg;
  cfg.name = "dispatch";
  cfg.threads = 2U;
  return cfg;
}

// ============================================================================
// DynamicDispatchActor
// ============================================================================

class Classifier : public cfx::DynamicDispatchActor {
 public:
  Classifier() {
    When<Animal>([this](const Animal& a) { (void)Reply(std::string("animal:") + a.name); });
    When<Dog>([this](const Dog& d) { (void)Reply(std::string("dog:") + d.name); });
    When<int>([this](const int& v) { (void)Reply(v); });
  }
};

TEST_CASE("DynamicDispatchActor selects the most specific handler", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto c = group.Spawn<Classifier>();

  Animal cat;
  cat.name = "tom";
  Dog rex;
  rex.name = "rex";
  Puppy bit;
  bit.name = "bit";

  REQUIRE(c->SendAndWait<std::string>(cat).value() == "animal:tom");
  REQUIRE(c->SendAndWait<std::string>(rex).value() == "dog:rex");
  REQUIRE(c->SendAndWait<std::string>(bit).value() == "dog:bit");
  REQUIRE(c->SendAndWait<int>(7).value() == 7);
}

TEST_CASE("DynamicDispatchActor later When overrides earlier", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto c = group.Spawn<Classifier>();
  c->When<int>([](const int&) {});
  c->When<int>([raw = c.get()](const int& v) { (void)raw->Reply(v * 100); });
  REQUIRE(c->SendAndWait<int>(2).value() == 200);
}

TEST_CASE("DynamicDispatchActor without a match terminates", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto c = group.Spawn<Classifier>();

  auto r = c->SendAndWait(cfx::Message(2.5));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::ActorError::kDispatchNotFound);
  REQUIRE(c->Join().get_error() == cfx::ActorError::kDispatchNotFound);

  auto late = c->Send(1);
  REQUIRE(late.get_error() == cfx::ActorError::kMailboxClosed);
}

TEST_CASE("DynamicDispatchActor Otherwise catches unmatched messages", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto c = group.Spawn<Classifier>();
  c->Otherwise([raw = c.get()](const cfx::Message& m) {
    (void)raw->Reply(std::string("other:") + m.TypeName());
  });

  REQUIRE(c->SendAndWait<std::string>(2.5).value() == "other:message");
  REQUIRE(c->SendAndWait<int>(3).value() == 3);
}

TEST_CASE("DynamicDispatchActor built from a Behavior", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  cfx::DataflowVariable<int> got;
  cfx::Behavior b;
  b.On<int>([got](const int& v) { (void)got.Bind(v); });

  auto actor = group.Spawn<cfx::DynamicDispatchActor>(std::move(b));
  REQUIRE(actor->Send(17).has_value());
  REQUIRE(got.Get() == 17);
}

class Toggle : public cfx::DynamicDispatchActor {
 public:
  Toggle() { Become(Positive()); }

 private:
  cfx::Behavior Positive() {
    cfx::Behavior b;
    b.On<int>([this](const int& v) { (void)Reply(v); });
    b.On<std::string>([this](const std::string&) { Become(Negative()); });
    return b;
  }

  cfx::Behavior Negative() {
    cfx::Behavior b;
    b.On<int>([this](const int& v) { (void)Reply(-v); });
    b.On<std::string>([this](const std::string&) { Become(Positive()); });
    return b;
  }
};

TEST_CASE("DynamicDispatchActor Become swaps the handler table", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto t = group.Spawn<Toggle>();

  REQUIRE(t->SendAndWait<int>(5).value() == 5);
  REQUIRE(t->Send(std::string("flip")).has_value());
  REQUIRE(t->SendAndWait<int>(5).value() == -5);
  REQUIRE(t->Send(std::string("flip")).has_value());
  REQUIRE(t->SendAndWait<int>(5).value() == 5);
}

// ============================================================================
// StaticDispatchActor<T>
// ============================================================================

template <typename A, typename M, typename = void>
struct CanSend : std::false_type {};

template <typename A, typename M>
struct CanSend<A, M, std::void_t<decltype(std::declval<A&>().Send(std::declval<M>()))>>
    : std::true_type {};

static_assert(CanSend<cfx::StaticDispatchActor<int>, int>::value, "int is accepted");
static_assert(CanSend<cfx::StaticDispatchActor<int>, const int&>::value, "lvalues too");
static_assert(!CanSend<cfx::StaticDispatchActor<int>, std::string>::value,
              "other types do not compile");
static_assert(!CanSend<cfx::StaticDispatchActor<int>, double>::value,
              "no implicit conversions");

TEST_CASE("StaticDispatchActor handles its one type", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  std::atomic<int> sum{0};
  auto adder = group.Spawn<cfx::StaticDispatchActor<int>>(
      [&sum](cfx::StaticDispatchActor<int>&, const int& v) { sum.fetch_add(v); });

  for (int i = 1; i <= 100; ++i) REQUIRE(adder->Send(i).has_value());
  const int x = 1000;
  REQUIRE((*adder)(x).has_value());

  adder->Stop();
  REQUIRE(adder->Join().has_value());
  REQUIRE(sum.load() == 5050 + 1000);
}

TEST_CASE("StaticDispatchActor rejects other types through the base interface",
          "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto echo = group.Spawn<cfx::StaticDispatchActor<int>>(
      [](cfx::StaticDispatchActor<int>& self, const int& v) { (void)self.Reply(v); });

  cfx::AbstractActor& base = *echo;
  auto r = base.Send(cfx::Message(std::string("nope")));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::ActorError::kDispatchNotFound);

  auto w = base.SendAndWait(cfx::Message(1.5));
  REQUIRE(w.get_error() == cfx::ActorError::kDispatchNotFound);

  // Still alive.
  REQUIRE(echo->State() == cfx::ActorState::kActive);
  REQUIRE(echo->SendAndWait<int>(9).value() == 9);
}

// ============================================================================
// ReactiveActor<In, Out>
// ============================================================================

TEST_CASE("ReactiveActor replies with the function result", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto doubler = group.Spawn<cfx::ReactiveActor<int, int>>([](const int& v) { return v * 2; });
  REQUIRE(doubler->SendAndWait<int>(21).value() == 42);

  auto length = group.Spawn<cfx::ReactiveActor<std::string, size_t>>(
      [](const std::string& s) { return s.size(); });
  REQUIRE(length->SendAndWait<size_t>(std::string("conflux")).value() == 7U);
}

TEST_CASE("ReactiveActor without a reply target drops the result", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  std::atomic<int> calls{0};
  auto counter = group.Spawn<cfx::ReactiveActor<int, int>>([&calls](const int& v) {
    calls.fetch_add(1);
    return v;
  });

  REQUIRE(counter->Send(1).has_value());
  REQUIRE(counter->SendAndWait<int>(2).value() == 2);
  REQUIRE(calls.load() == 2);
  REQUIRE(counter->State() == cfx::ActorState::kActive);
}

TEST_CASE("ReactiveActor chained through SendTo", "[dispatch_actor]") {
  cfx::ParallelGroup group(DispatchGroup());
  auto square = group.Spawn<cfx::ReactiveActor<int, int>>([](const int& v) { return v * v; });

  cfx::DataflowVariable<int> result;
  auto client = group.Spawn<cfx::StaticDispatchActor<int>>(
      [result](cfx::StaticDispatchActor<int>&, const int& v) { (void)result.Bind(v); });

  // The square's reply goes to the client's mailbox.
  REQUIRE(client->SendTo(*square, cfx::Message(12)).has_value());
  REQUIRE(result.Get() == 144);
}
