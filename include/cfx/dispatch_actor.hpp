/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file dispatch_actor.hpp
 * @brief Type-dispatching actors.
 *
 * - DynamicDispatchActor     : runtime tag lookup, most specific handler wins
 * - StaticDispatchActor<T>   : one compile-time message type, no lookup
 * - ReactiveActor<In, Out>   : replies with fn(message) to every sender
 */

#ifndef CFX_DISPATCH_ACTOR_HPP_
#define CFX_DISPATCH_ACTOR_HPP_

#include "cfx/actor.hpp"
#include "cfx/log.hpp"
#include "cfx/message.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

namespace cfx {

// ============================================================================
// DynamicDispatchActor
// ============================================================================

/**
 * @brief Dispatches each message to the handler registered for the most
 *        specific type in its tag chain, else to Otherwise().
 *
 * A message with no matching handler and no catch-all terminates the actor
 * with kDispatchNotFound.
 *
 *   class Printer : public cfx::DynamicDispatchActor {
 *    public:
 *     Printer() {
 *       When<int>([this](const int& v) { (void)Reply(v * 2); });
 *       When<std::string>([](const std::string& s) { Print(s); });
 *     }
 *   };
 */
class DynamicDispatchActor : public AbstractActor {
 public:
  DynamicDispatchActor() : behavior_(std::make_shared<const Behavior>()) {}
  explicit DynamicDispatchActor(Behavior behavior)
      : behavior_(std::make_shared<const Behavior>(std::move(behavior))) {}

  /// @brief Register a handler for T; overrides earlier ones for T.
  template <typename T, typename F>
  DynamicDispatchActor& When(F&& fn) {
    std::lock_guard<std::mutex> lock(behavior_mutex_);
    auto next = std::make_shared<Behavior>(*behavior_);
    next->On<T>(std::forward<F>(fn));
    behavior_ = std::move(next);
    return *this;
  }

  DynamicDispatchActor& Otherwise(Behavior::Handler fn) {
    std::lock_guard<std::mutex> lock(behavior_mutex_);
    auto next = std::make_shared<Behavior>(*behavior_);
    next->Otherwise(std::move(fn));
    behavior_ = std::move(next);
    return *this;
  }

  /**
   * @brief Replace the whole handler table. Takes effect from the next
   *        message; the running handler finishes unaffected.
   */
  void Become(Behavior behavior) {
    std::lock_guard<std::mutex> lock(behavior_mutex_);
    behavior_ = std::make_shared<const Behavior>(std::move(behavior));
  }

 protected:
  void Handle(const Message& msg) override {
    std::shared_ptr<const Behavior> current;
    {
      std::lock_guard<std::mutex> lock(behavior_mutex_);
      current = behavior_;
    }
    if (!current->Dispatch(msg)) {
      Fail(ActorError::kDispatchNotFound, msg.TypeName());
    }
  }

 private:
  std::mutex behavior_mutex_;
  std::shared_ptr<const Behavior> behavior_;
};

// ============================================================================
// StaticDispatchActor<T>
// ============================================================================

/**
 * @brief Actor bound to exactly one message type.
 *
 * Send() only accepts T; other types fail to compile. Messages arriving
 * through the type-erased AbstractActor interface are checked once at
 * enqueue time, so dispatch itself does no type inspection.
 */
template <typename T>
class StaticDispatchActor : public AbstractActor {
 public:
  using Handler = std::function<void(StaticDispatchActor&, const T&)>;

  explicit StaticDispatchActor(Handler handler) : handler_(std::move(handler)) {}

  expected<void, ActorError> Send(const T& msg) { return AbstractActor::Send(Message(msg)); }
  expected<void, ActorError> Send(T&& msg) { return AbstractActor::Send(Message(std::move(msg))); }

  template <typename U, typename = std::enable_if_t<!std::is_same<std::decay_t<U>, T>::value>>
  expected<void, ActorError> Send(U&&) = delete;

  expected<void, ActorError> operator()(const T& msg) { return Send(msg); }
  expected<void, ActorError> operator()(T&& msg) { return Send(std::move(msg)); }

  template <typename U, typename = std::enable_if_t<!std::is_same<std::decay_t<U>, T>::value>>
  expected<void, ActorError> operator()(U&&) = delete;

 protected:
  expected<void, ActorError> Admit(const Message& msg) const override {
    if (msg.Tag() != &TypeOf<T>()) {
      CFX_LOG_WARN("Actor", "[%s] rejected %s", Name(), msg.TypeName());
      return expected<void, ActorError>::error(ActorError::kDispatchNotFound);
    }
    return expected<void, ActorError>::success();
  }

  void Handle(const Message& msg) override { handler_(*this, *static_cast<const T*>(msg.Raw())); }

 private:
  Handler handler_;
};

// ============================================================================
// ReactiveActor<In, Out>
// ============================================================================

/**
 * @brief Replies to every In message with fn(message). Messages sent
 *        without a reply target are processed and their result dropped.
 *
 *   auto doubler = group.Spawn<cfx::ReactiveActor<int, int>>([](const int& v) { return v * 2; });
 *   auto r = doubler->SendAndWait<int>(21);  // 42
 */
template <typename In, typename Out>
class ReactiveActor : public StaticDispatchActor<In> {
 public:
  using Function = std::function<Out(const In&)>;

  explicit ReactiveActor(Function fn)
      : StaticDispatchActor<In>([fn](StaticDispatchActor<In>& self, const In& in) {
          Out result = fn(in);
          auto r = self.Reply(Message(std::move(result)));
          if (!r.has_value() && r.get_error() != ActorError::kNoReplyTarget) {
            CFX_LOG_DEBUG("Actor", "[%s] reply dropped: %s", self.Name(),
                          ActorErrorName(r.get_error()));
          }
        }) {}
};

}  // namespace cfx

#endif  // CFX_DISPATCH_ACTOR_HPP_
