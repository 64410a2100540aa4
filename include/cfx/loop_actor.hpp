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
 * @file loop_actor.hpp
 * @brief LoopActor - behavioral actor driven by stored receive continuations.
 *
 * The body runs once on start-up and registers what to do with the next
 * message through React(). A continuation is one-shot: after it runs, the
 * actor waits again only if a new continuation was registered, or re-runs
 * its Loop() body. With neither, the actor terminates.
 *
 *   auto echo = group.Spawn<cfx::LoopActor>([](cfx::LoopActor& self) {
 *     self.Loop([&self] {
 *       self.React([&self](const cfx::Message& msg) { (void)self.Reply(msg); });
 *     });
 *   });
 */

#ifndef CFX_LOOP_ACTOR_HPP_
#define CFX_LOOP_ACTOR_HPP_

#include "cfx/actor.hpp"
#include "cfx/log.hpp"
#include "cfx/message.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <utility>

namespace cfx {

class LoopActor : public AbstractActor {
 public:
  using Body = std::function<void(LoopActor&)>;
  using Handler = std::function<void(const Message&)>;

  LoopActor() = default;
  explicit LoopActor(Body body) : body_(std::move(body)) {}

  // ======================== Continuations ========================

  /// @brief Handle the next message with @p handler.
  void React(Handler handler) {
    SetContinuation(std::move(handler), nullptr);
  }

  /**
   * @brief Handle the next message with @p handler, or a Timeout message if
   *        none is processed within @p timeout_ms.
   */
  void React(uint32_t timeout_ms, Handler handler) {
    SetContinuation(std::move(handler), nullptr);
    ArmReceiveTimeout(timeout_ms);
  }

  /// @brief Dispatch the next message through @p behavior by type.
  void React(Behavior behavior) {
    SetContinuation(nullptr, std::make_shared<const Behavior>(std::move(behavior)));
  }

  void React(uint32_t timeout_ms, Behavior behavior) {
    SetContinuation(nullptr, std::make_shared<const Behavior>(std::move(behavior)));
    ArmReceiveTimeout(timeout_ms);
  }

  // ======================== Looping ========================

  /// @brief Re-run @p body whenever a continuation completes without
  ///        registering another one.
  void Loop(std::function<void()> body) {
    loop_body_ = std::move(body);
    loop_limited_ = false;
  }

  /// @brief As Loop(body), but run @p body at most @p count times.
  void Loop(uint32_t count, std::function<void()> body) {
    loop_body_ = std::move(body);
    loop_limited_ = true;
    loop_limit_ = count;
    iterations_ = 0U;
  }

  bool HasContinuation() const noexcept { return has_continuation_; }

  /// @brief Loop body executions so far.
  uint32_t Iterations() const noexcept { return iterations_; }

 protected:
  /// @brief Start-up body; subclasses may override instead of passing one.
  virtual void Act() {
    if (body_) body_(*this);
  }

  void OnStart() override {
    Act();
    Continue();
  }

  void Handle(const Message& msg) override {
    CFX_ASSERT(has_continuation_);
    Handler handler = std::move(handler_);
    std::shared_ptr<const Behavior> behavior = std::move(behavior_);
    handler_ = nullptr;
    behavior_.reset();
    has_continuation_ = false;

    if (behavior != nullptr) {
      if (!behavior->Dispatch(msg)) {
        Fail(ActorError::kDispatchNotFound, msg.TypeName());
        return;
      }
    } else if (handler) {
      handler(msg);
    }
    Continue();
  }

 private:
  void SetContinuation(Handler handler, std::shared_ptr<const Behavior> behavior) {
    CFX_ASSERT(InOwnTurn());
    if (has_continuation_) {
      CFX_LOG_DEBUG("Actor", "[%s] replacing pending continuation", Name());
    }
    handler_ = std::move(handler);
    behavior_ = std::move(behavior);
    has_continuation_ = true;
  }

  void Continue() {
    while (!has_continuation_ && !StopRequested()) {
      if (!loop_body_ || (loop_limited_ && iterations_ >= loop_limit_)) {
        Stop();
        return;
      }
      ++iterations_;
      // The body may install a different loop body.
      std::function<void()> body = loop_body_;
      body();
    }
  }

  Body body_;
  Handler handler_;
  std::shared_ptr<const Behavior> behavior_;
  bool has_continuation_{false};

  std::function<void()> loop_body_;
  bool loop_limited_{false};
  uint32_t loop_limit_{0U};
  uint32_t iterations_{0U};
};

}  // namespace cfx

#endif  // CFX_LOOP_ACTOR_HPP_
