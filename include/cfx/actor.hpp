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
 * @file actor.hpp
 * @brief Actor substrate: mailbox, lifecycle, pool scheduling, replies and
 *        supervision, plus the ParallelGroup that binds actors to a pool.
 *
 * Scheduling:
 *   Send() -> mailbox (FIFO) -> one ActorTurn queued on the group's pool
 *   ActorTurn: non-fair actors drain the mailbox; fair actors process one
 *   message and re-queue themselves at the back of the pool's global queue
 *   when more are pending.
 *
 * Lifecycle:  kNew -> kActive -> kTerminating -> kStopped
 *
 * An exception escaping a handler (or a dispatch miss) terminates the actor,
 * records the error as its termination result and, when a supervisor is set,
 * sends the supervisor an ActorFailure message.
 *
 * Concrete strategies live in loop_actor.hpp and dispatch_actor.hpp.
 */

#ifndef CFX_ACTOR_HPP_
#define CFX_ACTOR_HPP_

#include "cfx/config.hpp"
#include "cfx/log.hpp"
#include "cfx/message.hpp"
#include "cfx/platform.hpp"
#include "cfx/thread_pool.hpp"
#include "cfx/timer.hpp"
#include "cfx/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace cfx {

class AbstractActor;
class ParallelGroup;

// ============================================================================
// Errors, state, system messages
// ============================================================================

enum class ActorError : uint8_t {
  kMailboxClosed = 0,
  kDispatchNotFound,
  kExecutionFailed,
  kTimeout,
  kNotInHandler,
  kNoReplyTarget,
  kNotStarted,
};

inline const char* ActorErrorName(ActorError e) noexcept {
  switch (e) {
    case ActorError::kMailboxClosed:
      return "MailboxClosed";
    case ActorError::kDispatchNotFound:
      return "DispatchNotFound";
    case ActorError::kExecutionFailed:
      return "ExecutionFailed";
    case ActorError::kTimeout:
      return "Timeout";
    case ActorError::kNotInHandler:
      return "NotInHandler";
    case ActorError::kNoReplyTarget:
      return "NoReplyTarget";
    case ActorError::kNotStarted:
      return "NotStarted";
    default:
      return "Unknown";
  }
}

enum class ActorState : uint8_t {
  kNew = 0,
  kActive,
  kTerminating,
  kStopped,
};

/// @brief Sent to a supervisor when a supervised actor terminates abnormally.
struct ActorFailure {
  ActorId actor;
  FixedString<32> name;
  ActorError error{ActorError::kExecutionFailed};
  DetailText detail;
};

template <>
struct MessageTraits<ActorFailure> {
  using Parent = void;
  static constexpr const char* kName = "cfx::ActorFailure";
};

// ============================================================================
// MessageSink - anything that can be a reply target
// ============================================================================

class MessageSink {
 public:
  virtual ~MessageSink() = default;

  /// @brief Deliver @p msg; @p sender becomes its reply target.
  /// @return false when the sink no longer accepts messages.
  virtual bool Accept(Message msg, std::shared_ptr<MessageSink> sender) = 0;

  /// @brief A request naming this sink as reply target was dropped.
  virtual void Abandon(ActorError reason) { (void)reason; }
};

namespace detail {

/**
 * @brief One-shot reply slot used by SendAndWait. The first reply wins;
 *        abandonment after a reply is ignored.
 */
class ReplyChannel final : public MessageSink {
 public:
  bool Accept(Message msg, std::shared_ptr<MessageSink>) override {
    return cell_.SetValue(std::move(msg));
  }

  void Abandon(ActorError reason) override { (void)cell_.SetError(reason, ActorErrorName(reason)); }

  expected<Message, ActorError> Wait() const { return cell_.Wait(); }

  expected<Message, ActorError> WaitFor(uint32_t timeout_ms) const {
    return cell_.WaitFor(timeout_ms, ActorError::kTimeout);
  }

 private:
  ResultCell<Message, ActorError> cell_;
};

struct Envelope {
  Message message;
  std::shared_ptr<MessageSink> reply_to;
  uint64_t timeout_gen{0U};  ///< Nonzero marks a receive-timeout entry.
};

inline AbstractActor*& CurrentActorRef() noexcept {
  static thread_local AbstractActor* current = nullptr;
  return current;
}

inline ActorId NextActorId() noexcept {
  static std::atomic<uint32_t> next{1U};
  return ActorId(next.fetch_add(1U, std::memory_order_relaxed));
}

class ActorTurn;

}  // namespace detail

// ============================================================================
// ParallelGroupConfig
// ============================================================================

struct ParallelGroupConfig {
  FixedString<32> name{"group"};
  uint32_t threads{0U};  ///< 0 = hardware concurrency
  int32_t priority{0};
  bool fair{false};            ///< Fairness default for spawned actors.
  uint32_t timer_slots{64U};  ///< Concurrent receive timeouts.
};

// ============================================================================
// AbstractActor
// ============================================================================

class AbstractActor : public MessageSink, public std::enable_shared_from_this<AbstractActor> {
 public:
  ~AbstractActor() override = default;

  AbstractActor(const AbstractActor&) = delete;
  AbstractActor& operator=(const AbstractActor&) = delete;
  AbstractActor(AbstractActor&&) = delete;
  AbstractActor& operator=(AbstractActor&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Bind to @p group and begin processing. Messages sent while kNew
   *        are kept and processed after start-up. The actor must be owned by
   *        a std::shared_ptr.
   */
  expected<void, ActorError> Start(ParallelGroup& group);

  /**
   * @brief Request termination. The message in progress completes; queued
   *        messages are discarded and their SendAndWait callers receive
   *        kMailboxClosed. Idempotent.
   */
  void Stop();

  /// @brief Block until kStopped; returns the termination result.
  expected<void, ActorError> Join() const {
    CFX_ASSERT(!InOwnTurn());
    auto r = done_.Wait();
    if (!r.has_value()) return expected<void, ActorError>::error(r.get_error());
    return expected<void, ActorError>::success();
  }

  /// @brief Bounded Join(); kTimeout if still running after @p timeout_ms.
  expected<void, ActorError> JoinFor(uint32_t timeout_ms) const {
    auto r = done_.WaitFor(timeout_ms, ActorError::kTimeout);
    if (!r.has_value()) return expected<void, ActorError>::error(r.get_error());
    return expected<void, ActorError>::success();
  }

  /// @brief Text attached to an abnormal termination.
  const char* TerminationDetail() const noexcept { return done_.Detail(); }

  // ======================== Messaging ========================

  expected<void, ActorError> Send(Message msg) { return Enqueue(detail::Envelope{std::move(msg), nullptr, 0U}); }

  expected<void, ActorError> operator()(Message msg) { return Send(std::move(msg)); }

  /// @brief Send and block for the reply.
  expected<Message, ActorError> SendAndWait(Message msg) {
    auto channel = std::make_shared<detail::ReplyChannel>();
    auto r = Enqueue(detail::Envelope{std::move(msg), channel, 0U});
    if (!r.has_value()) return expected<Message, ActorError>::error(r.get_error());
    return channel->Wait();
  }

  expected<Message, ActorError> SendAndWait(Message msg, uint32_t timeout_ms) {
    auto channel = std::make_shared<detail::ReplyChannel>();
    auto r = Enqueue(detail::Envelope{std::move(msg), channel, 0U});
    if (!r.has_value()) return expected<Message, ActorError>::error(r.get_error());
    return channel->WaitFor(timeout_ms);
  }

  /// @brief Typed form; a reply of another type yields kDispatchNotFound.
  template <typename R>
  expected<R, ActorError> SendAndWait(Message msg) {
    return Typed<R>(SendAndWait(std::move(msg)));
  }

  template <typename R>
  expected<R, ActorError> SendAndWait(Message msg, uint32_t timeout_ms) {
    return Typed<R>(SendAndWait(std::move(msg), timeout_ms));
  }

  /**
   * @brief Answer the message being processed.
   * @return kNotInHandler outside this actor's handlers, kNoReplyTarget when
   *         the message has no sender, kMailboxClosed when the sender is gone.
   */
  expected<void, ActorError> Reply(Message msg) {
    if (!InOwnTurn() || current_ == nullptr) {
      return expected<void, ActorError>::error(ActorError::kNotInHandler);
    }
    if (current_->reply_to == nullptr) {
      return expected<void, ActorError>::error(ActorError::kNoReplyTarget);
    }
    if (!current_->reply_to->Accept(std::move(msg), shared_from_this())) {
      return expected<void, ActorError>::error(ActorError::kMailboxClosed);
    }
    return expected<void, ActorError>::success();
  }

  /// @brief Reply target of the message being processed, for deferred replies.
  std::shared_ptr<MessageSink> Sender() const {
    return (InOwnTurn() && current_ != nullptr) ? current_->reply_to : nullptr;
  }

  /// @brief Send to @p target with this actor as the reply target.
  expected<void, ActorError> SendTo(MessageSink& target, Message msg) {
    if (!target.Accept(std::move(msg), shared_from_this())) {
      return expected<void, ActorError>::error(ActorError::kMailboxClosed);
    }
    return expected<void, ActorError>::success();
  }

  bool Accept(Message msg, std::shared_ptr<MessageSink> sender) override {
    return Enqueue(detail::Envelope{std::move(msg), std::move(sender), 0U}).has_value();
  }

  // ======================== Configuration / query ========================

  void SetSupervisor(const std::shared_ptr<AbstractActor>& supervisor) {
    std::lock_guard<std::mutex> lock(mutex_);
    supervisor_ = supervisor;
  }

  /// @brief Override the group's fairness default. Call before Start().
  void SetFair(bool fair) noexcept {
    fair_ = fair;
    fair_explicit_ = true;
  }

  bool IsFair() const noexcept { return fair_; }

  /// @brief Rename the actor. Call before Start().
  void SetName(const char* name) { name_.assign(TruncateToCapacity, name); }

  ActorId Id() const noexcept { return id_; }
  const char* Name() const noexcept { return name_.c_str(); }
  ActorState State() const noexcept { return state_.load(std::memory_order_acquire); }

  /// @brief Number of messages waiting in the mailbox.
  uint32_t PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(mailbox_.size());
  }

 protected:
  AbstractActor() : id_(detail::NextActorId()) {
    char buf[32];
    (void)std::snprintf(buf, sizeof(buf), "actor-%u", static_cast<unsigned>(id_.value()));
    name_.assign(TruncateToCapacity, buf);
  }

  /// @brief Runs on the pool before the first message.
  virtual void OnStart() {}

  /// @brief Process one message on the pool.
  virtual void Handle(const Message& msg) = 0;

  /// @brief Gate applied to every message at enqueue time.
  virtual expected<void, ActorError> Admit(const Message& msg) const {
    (void)msg;
    return expected<void, ActorError>::success();
  }

  /**
   * @brief Terminate abnormally with @p error. Called from the actor's own
   *        turn; the first failure wins.
   */
  void Fail(ActorError error, const char* what);

  bool InOwnTurn() const noexcept { return detail::CurrentActorRef() == this; }

  bool StopRequested() const noexcept { return State() != ActorState::kActive; }

  /// @brief Deliver a Timeout message after @p timeout_ms unless a real
  ///        message is processed first.
  void ArmReceiveTimeout(uint32_t timeout_ms);

  void DisarmReceiveTimeout();

  ParallelGroup* Group() const noexcept { return group_; }

 private:
  friend class detail::ActorTurn;
  friend class ParallelGroup;

  template <typename R>
  static expected<R, ActorError> Typed(expected<Message, ActorError>&& r) {
    if (!r.has_value()) return expected<R, ActorError>::error(r.get_error());
    const R* value = r.value().template As<R>();
    if (value == nullptr) return expected<R, ActorError>::error(ActorError::kDispatchNotFound);
    return expected<R, ActorError>::success(*value);
  }

  expected<void, ActorError> Enqueue(detail::Envelope env);
  void Schedule(bool yield = false);
  void RunTurn();
  void AbortTurn(TaskError reason);
  void Process(detail::Envelope& env);
  void Finalize();

  template <typename F>
  void RunIsolated(F&& fn) {
    DetailText text;
    if (!detail::InvokeIsolated(std::forward<F>(fn), text)) {
      Fail(ActorError::kExecutionFailed, text.c_str());
    }
  }

  static void AbandonAll(std::deque<detail::Envelope>& dropped, ActorError reason) {
    for (auto& env : dropped) {
      if (env.reply_to != nullptr) env.reply_to->Abandon(reason);
    }
    dropped.clear();
  }

  const ActorId id_;
  FixedString<32> name_;
  bool fair_{false};
  bool fair_explicit_{false};
  ParallelGroup* group_{nullptr};

  mutable std::mutex mutex_;  ///< Guards mailbox_, scheduled_, state changes.
  std::deque<detail::Envelope> mailbox_;
  std::atomic<ActorState> state_{ActorState::kNew};
  bool scheduled_{false};
  bool start_pending_{false};
  std::weak_ptr<AbstractActor> supervisor_;

  bool failed_{false};
  ActorError term_error_{ActorError::kExecutionFailed};
  DetailText term_detail_;
  detail::ResultCell<detail::Unit, ActorError> done_;

  // Touched only from the actor's own turn.
  detail::Envelope* current_{nullptr};
  uint64_t timeout_seq_{0U};
  uint64_t armed_gen_{0U};
  optional<TimerTaskId> timer_id_;
};

namespace detail {

class ActorTurn final : public Runnable {
 public:
  explicit ActorTurn(std::shared_ptr<AbstractActor> actor) noexcept : actor_(std::move(actor)) {}

  bool Run() noexcept override {
    actor_->RunTurn();
    return true;
  }

  void Cancel(TaskError reason) noexcept override { actor_->AbortTurn(reason); }

 private:
  std::shared_ptr<AbstractActor> actor_;
};

}  // namespace detail

// ============================================================================
// ParallelGroup
// ============================================================================

/**
 * @brief A named pool plus timer scheduler that actors run on.
 *
 * The group must outlive the actors it spawned. Shutdown() (also run by the
 * destructor) stops and joins every live actor before stopping the pool.
 */
class ParallelGroup final {
 public:
  explicit ParallelGroup(const ParallelGroupConfig& cfg = ParallelGroupConfig{})
      : name_(cfg.name), fair_(cfg.fair), pool_(PoolConfigFor(cfg)), timers_(cfg.timer_slots) {
    pool_.Start();
    auto r = timers_.Start();
    if (!r.has_value()) {
      CFX_LOG_ERROR("Group", "[%s] timer scheduler failed to start", name_.c_str());
    }
    CFX_LOG_INFO("Group", "[%s] ready: %u threads, %s actors", name_.c_str(),
                 pool_.ThreadCount(), fair_ ? "fair" : "non-fair");
  }

  ~ParallelGroup() { Shutdown(); }

  ParallelGroup(const ParallelGroup&) = delete;
  ParallelGroup& operator=(const ParallelGroup&) = delete;
  ParallelGroup(ParallelGroup&&) = delete;
  ParallelGroup& operator=(ParallelGroup&&) = delete;

  /// @brief Construct an actor and start it in this group.
  template <typename ActorT, typename... Args>
  std::shared_ptr<ActorT> Spawn(Args&&... args) {
    static_assert(std::is_base_of<AbstractActor, ActorT>::value,
                  "Spawn requires an AbstractActor subclass");
    auto actor = std::make_shared<ActorT>(std::forward<Args>(args)...);
    auto r = actor->Start(*this);
    if (!r.has_value()) {
      CFX_LOG_WARN("Group", "[%s] spawn of %s refused: %s", name_.c_str(), actor->Name(),
                   ActorErrorName(r.get_error()));
    }
    return actor;
  }

  ThreadPool& Pool() noexcept { return pool_; }
  TimerScheduler& Timers() noexcept { return timers_; }
  const char* Name() const noexcept { return name_.c_str(); }
  bool DefaultFair() const noexcept { return fair_; }

  bool IsShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
  }

  /// @brief Stop and join all live actors, then the timers and the pool.
  void Shutdown() {
    std::vector<std::shared_ptr<AbstractActor>> live;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shut_down_) return;
      shut_down_ = true;
      for (auto& w : actors_) {
        if (auto a = w.lock()) live.push_back(std::move(a));
      }
      actors_.clear();
    }
    for (auto& a : live) a->Stop();
    for (auto& a : live) {
      auto r = a->Join();
      if (!r.has_value()) {
        CFX_LOG_DEBUG("Group", "[%s] %s ended with %s", name_.c_str(), a->Name(),
                      ActorErrorName(r.get_error()));
      }
    }
    timers_.Stop();
    pool_.Shutdown(ShutdownPolicy::kDrain);
    CFX_LOG_INFO("Group", "[%s] shut down (%u actors)", name_.c_str(),
                 static_cast<unsigned>(live.size()));
  }

 private:
  friend class AbstractActor;

  static ThreadPoolConfig PoolConfigFor(const ParallelGroupConfig& cfg) {
    ThreadPoolConfig pc;
    pc.name = cfg.name;
    pc.threads = cfg.threads;
    pc.priority = cfg.priority;
    return pc;
  }

  bool Register(const std::shared_ptr<AbstractActor>& actor) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return false;
    // Prune entries of actors that are gone before growing.
    if (actors_.size() == actors_.capacity()) {
      std::vector<std::weak_ptr<AbstractActor>> alive;
      for (auto& w : actors_) {
        if (!w.expired()) alive.push_back(std::move(w));
      }
      actors_.swap(alive);
    }
    actors_.push_back(actor);
    return true;
  }

  FixedString<32> name_;
  const bool fair_;
  ThreadPool pool_;
  TimerScheduler timers_;
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<AbstractActor>> actors_;
  bool shut_down_{false};
};

/**
 * @brief Read a ParallelGroupConfig from keys name, threads, priority, fair
 *        and timer_slots of @p section.
 */
inline ParallelGroupConfig LoadGroupConfig(const ConfigStore& store, const char* section = "group") {
  ParallelGroupConfig cfg;
  if (store.HasKey(section, "name")) {
    cfg.name.assign(TruncateToCapacity, store.GetString(section, "name"));
  }
  cfg.threads = store.GetUint(section, "threads", cfg.threads);
  cfg.priority = store.GetInt(section, "priority", cfg.priority);
  cfg.fair = store.GetBool(section, "fair", cfg.fair);
  cfg.timer_slots = store.GetUint(section, "timer_slots", cfg.timer_slots);
  return cfg;
}

// ============================================================================
// AbstractActor - out-of-line members
// ============================================================================

inline expected<void, ActorError> AbstractActor::Start(ParallelGroup& group) {
  CFX_ASSERT(!weak_from_this().expired());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const ActorState st = state_.load(std::memory_order_acquire);
    if (st == ActorState::kActive) return expected<void, ActorError>::success();
    if (st != ActorState::kNew) return expected<void, ActorError>::error(ActorError::kMailboxClosed);
  }
  if (!group.Register(shared_from_this())) {
    std::deque<detail::Envelope> dropped;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!failed_) {
        failed_ = true;
        term_error_ = ActorError::kNotStarted;
        term_detail_.assign(TruncateToCapacity, "group shut down");
      }
      state_.store(ActorState::kTerminating, std::memory_order_release);
      dropped.swap(mailbox_);
    }
    CFX_LOG_WARN("Actor", "[%s#%u] refused by %s: group shut down", Name(),
                 static_cast<unsigned>(id_.value()), group.Name());
    AbandonAll(dropped, ActorError::kMailboxClosed);
    Finalize();
    return expected<void, ActorError>::error(ActorError::kNotStarted);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    group_ = &group;
    if (!fair_explicit_) fair_ = group.DefaultFair();
    start_pending_ = true;
    scheduled_ = true;
    state_.store(ActorState::kActive, std::memory_order_release);
  }
  CFX_LOG_DEBUG("Actor", "[%s#%u] started in %s", Name(), static_cast<unsigned>(id_.value()),
                group.Name());
  Schedule();
  return expected<void, ActorError>::success();
}

inline void AbstractActor::Stop() {
  std::deque<detail::Envelope> dropped;
  bool idle = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const ActorState st = state_.load(std::memory_order_acquire);
    if (st == ActorState::kTerminating || st == ActorState::kStopped) return;
    state_.store(ActorState::kTerminating, std::memory_order_release);
    dropped.swap(mailbox_);
    idle = !scheduled_;
  }
  if (!dropped.empty()) {
    CFX_LOG_DEBUG("Actor", "[%s] stop discards %u queued messages", Name(),
                  static_cast<unsigned>(dropped.size()));
  }
  AbandonAll(dropped, ActorError::kMailboxClosed);
  if (idle) Finalize();
}

inline void AbstractActor::Fail(ActorError error, const char* what) {
  std::deque<detail::Envelope> dropped;
  std::shared_ptr<AbstractActor> supervisor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_ || state_.load(std::memory_order_acquire) == ActorState::kStopped) return;
    failed_ = true;
    term_error_ = error;
    term_detail_.assign(TruncateToCapacity, what);
    state_.store(ActorState::kTerminating, std::memory_order_release);
    dropped.swap(mailbox_);
    supervisor = supervisor_.lock();
  }
  CFX_LOG_WARN("Actor", "[%s#%u] terminated: %s (%s)", Name(), static_cast<unsigned>(id_.value()),
               ActorErrorName(error), what != nullptr ? what : "");
  AbandonAll(dropped, ActorError::kMailboxClosed);

  if (supervisor != nullptr) {
    ActorFailure failure;
    failure.actor = id_;
    failure.name = name_;
    failure.error = error;
    failure.detail = term_detail_;
    auto r = supervisor->Send(Message(failure));
    if (!r.has_value()) {
      CFX_LOG_WARN("Actor", "[%s] supervisor %s unreachable", Name(), supervisor->Name());
    }
  }
}

inline expected<void, ActorError> AbstractActor::Enqueue(detail::Envelope env) {
  if (env.timeout_gen == 0U) {
    auto admitted = Admit(env.message);
    if (!admitted.has_value()) {
      if (env.reply_to != nullptr) env.reply_to->Abandon(admitted.get_error());
      return admitted;
    }
  }
  bool accepted = false;
  bool schedule = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const ActorState st = state_.load(std::memory_order_acquire);
    if (st == ActorState::kNew || st == ActorState::kActive) {
      mailbox_.push_back(std::move(env));
      accepted = true;
      if (st == ActorState::kActive && !scheduled_) {
        scheduled_ = true;
        schedule = true;
      }
    }
  }
  if (!accepted) {
    if (env.reply_to != nullptr) env.reply_to->Abandon(ActorError::kMailboxClosed);
    return expected<void, ActorError>::error(ActorError::kMailboxClosed);
  }
  if (schedule) Schedule();
  return expected<void, ActorError>::success();
}

inline void AbstractActor::Schedule(bool yield) {
  CFX_ASSERT(group_ != nullptr);
  // A rejected turn is reported through ActorTurn::Cancel.
  auto turn = std::make_unique<detail::ActorTurn>(shared_from_this());
  if (yield) {
    (void)group_->Pool().PostFifo(std::move(turn));
  } else {
    (void)group_->Pool().Post(std::move(turn));
  }
}

inline void AbstractActor::RunTurn() {
  AbstractActor* const previous = detail::CurrentActorRef();
  detail::CurrentActorRef() = this;

  if (start_pending_) {
    start_pending_ = false;
    RunIsolated([this] { OnStart(); });
  }

  bool finalize = false;
  bool resubmit = false;
  while (true) {
    detail::Envelope env;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const ActorState st = state_.load(std::memory_order_acquire);
      if (st != ActorState::kActive || mailbox_.empty()) {
        finalize = (st == ActorState::kTerminating);
        scheduled_ = false;
        break;
      }
      env = std::move(mailbox_.front());
      mailbox_.pop_front();
    }

    Process(env);

    if (fair_) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_.load(std::memory_order_acquire) == ActorState::kActive) {
        resubmit = !mailbox_.empty();
        if (!resubmit) scheduled_ = false;
        break;
      }
    }
  }

  detail::CurrentActorRef() = previous;
  if (resubmit) Schedule(true);
  if (finalize) Finalize();
}

inline void AbstractActor::Process(detail::Envelope& env) {
  current_ = &env;
  if (env.timeout_gen != 0U) {
    if (env.timeout_gen == armed_gen_) {
      armed_gen_ = 0U;
      timer_id_.reset();
      RunIsolated([this] { Handle(Message(Timeout{})); });
    }
  } else {
    DisarmReceiveTimeout();
    RunIsolated([this, &env] { Handle(env.message); });
  }
  current_ = nullptr;

  if (env.reply_to != nullptr && StopRequested()) {
    bool failed = false;
    ActorError error = ActorError::kMailboxClosed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      failed = failed_;
      error = term_error_;
    }
    // Ignored by the sink when a reply was already delivered.
    env.reply_to->Abandon(failed ? error : ActorError::kMailboxClosed);
  }
}

inline void AbstractActor::AbortTurn(TaskError reason) {
  CFX_LOG_WARN("Actor", "[%s] turn not run: %s", Name(), TaskErrorName(reason));
  std::deque<detail::Envelope> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failed_) {
      failed_ = true;
      term_error_ = ActorError::kMailboxClosed;
      term_detail_.assign(TruncateToCapacity, "pool not running");
    }
    if (state_.load(std::memory_order_acquire) != ActorState::kStopped) {
      state_.store(ActorState::kTerminating, std::memory_order_release);
    }
    dropped.swap(mailbox_);
    scheduled_ = false;
  }
  AbandonAll(dropped, ActorError::kMailboxClosed);
  Finalize();
}

inline void AbstractActor::Finalize() {
  bool failed = false;
  ActorError error = ActorError::kExecutionFailed;
  DetailText text;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_acquire) == ActorState::kStopped) return;
    state_.store(ActorState::kStopped, std::memory_order_release);
    failed = failed_;
    error = term_error_;
    text = term_detail_;
  }
  DisarmReceiveTimeout();
  CFX_LOG_DEBUG("Actor", "[%s#%u] stopped", Name(), static_cast<unsigned>(id_.value()));
  if (failed) {
    (void)done_.SetError(error, text.c_str());
  } else {
    (void)done_.SetValue(detail::Unit{});
  }
}

inline void AbstractActor::ArmReceiveTimeout(uint32_t timeout_ms) {
  CFX_ASSERT(group_ != nullptr);
  DisarmReceiveTimeout();
  const uint64_t gen = ++timeout_seq_;
  armed_gen_ = gen;
  std::weak_ptr<AbstractActor> self = weak_from_this();
  auto r = group_->Timers().AddOneShot(timeout_ms, [self, gen]() {
    if (auto actor = self.lock()) {
      // A stopped actor no longer wants its timeout.
      (void)actor->Enqueue(detail::Envelope{Message(), nullptr, gen});
    }
  });
  if (!r.has_value()) {
    armed_gen_ = 0U;
    Fail(ActorError::kTimeout, "no timer slot for receive timeout");
    return;
  }
  timer_id_ = r.value();
}

inline void AbstractActor::DisarmReceiveTimeout() {
  armed_gen_ = 0U;
  if (timer_id_.has_value() && group_ != nullptr) {
    // kNotRunning here only means the entry already fired.
    (void)group_->Timers().Remove(timer_id_.value());
  }
  timer_id_.reset();
}

}  // namespace cfx

#endif  // CFX_ACTOR_HPP_
