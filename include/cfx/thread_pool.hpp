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
 * @file thread_pool.hpp
 * @brief ThreadPool - fixed-size work-stealing worker pool.
 *
 * Architecture:
 *   Submit()/Execute() from a non-worker  -> global FIFO
 *   Submit()/Execute() from worker[i]     -> front of local deque[i]
 *
 *   worker[i]: pop front of deque[i] -> steal back of deque[j] -> global
 *
 * Units of work that throw are isolated: the exception is caught on the
 * worker, logged at WARN and stored in the task's handle as
 * TaskError::kExecutionFailed. A blocking TaskHandle::Get() holds its
 * thread until the result arrives; a unit that waits for work it queued
 * itself can drive the pool meanwhile with TryRunPendingTask().
 *
 * Usage:
 *   cfx::ThreadPoolConfig cfg;
 *   cfg.name = "compute";
 *   cfg.threads = 4;
 *
 *   cfx::ThreadPool pool(cfg);
 *   pool.Start();
 *   auto h = pool.Submit([] { return 6 * 7; });
 *   int v = h.Get().value();
 *   pool.Shutdown();
 */

#ifndef CFX_THREAD_POOL_HPP_
#define CFX_THREAD_POOL_HPP_

#include "cfx/config.hpp"
#include "cfx/log.hpp"
#include "cfx/platform.hpp"
#include "cfx/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace cfx {

class ThreadPool;

// ============================================================================
// Errors and configuration
// ============================================================================

enum class TaskError : uint8_t {
  kExecutionFailed = 0,
  kCancelled,
  kRejected,
  kNoResult,
  kTimeout,
};

inline const char* TaskErrorName(TaskError e) noexcept {
  switch (e) {
    case TaskError::kExecutionFailed:
      return "ExecutionFailed";
    case TaskError::kCancelled:
      return "Cancelled";
    case TaskError::kRejected:
      return "Rejected";
    case TaskError::kNoResult:
      return "NoResult";
    case TaskError::kTimeout:
      return "Timeout";
    default:
      return "Unknown";
  }
}

enum class ShutdownPolicy : uint8_t {
  kDrain = 0,  ///< Run everything already queued, then stop.
  kDiscard,    ///< Cancel queued work; running work completes.
};

/**
 * @brief ThreadPool configuration.
 *
 * priority > 0 selects SCHED_FIFO with that priority, priority < 0 selects
 * SCHED_IDLE (Linux only; silently ignored without the privilege).
 */
struct ThreadPoolConfig {
  FixedString<32> name{"pool"};
  uint32_t threads{0U};  ///< 0 = std::thread::hardware_concurrency()
  int32_t priority{0};
};

struct ThreadPoolStats {
  uint64_t submitted{0U};
  uint64_t completed{0U};
  uint64_t failed{0U};
  uint64_t stolen{0U};
  uint64_t cancelled{0U};
};

/// Short human-readable error text attached to a failed result.
using DetailText = FixedString<127>;

namespace detail {

/// Value slot for tasks returning void.
struct Unit {};

template <typename T>
struct StoredType {
  using type = T;
};
template <>
struct StoredType<void> {
  using type = Unit;
};

// ============================================================================
// Runnable - queue item
// ============================================================================

/**
 * @brief A queued unit of work. Exactly one of Run() or Cancel() is called.
 */
class Runnable {
 public:
  virtual ~Runnable() = default;
  /// @return false if the work failed (counted in ThreadPoolStats::failed).
  virtual bool Run() noexcept = 0;
  virtual void Cancel(TaskError reason) noexcept = 0;
};

/**
 * @brief Run @p fn, converting an escaping exception into a failure.
 *
 * @return true on normal return. On failure @p detail holds the exception
 *         text.
 */
template <typename F>
bool InvokeIsolated(F&& fn, DetailText& detail) noexcept {
#if defined(CFX_HAS_EXCEPTIONS)
  try {
    fn();
    return true;
  } catch (const std::exception& e) {
    detail.assign(TruncateToCapacity, e.what());
  } catch (...) {
    detail.assign(TruncateToCapacity, "non-standard exception");
  }
  return false;
#else
  fn();
  (void)detail;
  return true;
#endif
}

// ============================================================================
// ResultCell - one-shot completion cell
// ============================================================================

/**
 * @brief Thread-safe single-assignment cell holding a value or an error.
 *
 * Completion wakes every waiter and runs the registered callbacks on the
 * completing thread. Waiters block; they never run other queued work.
 */
template <typename T, typename E>
class ResultCell final {
 public:
  using Callback = std::function<void()>;

  ResultCell() = default;
  ResultCell(const ResultCell&) = delete;
  ResultCell& operator=(const ResultCell&) = delete;

  bool SetValue(T value) {
    std::vector<Callback> callbacks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (ready_.load(std::memory_order_relaxed)) return false;
      value_.emplace(std::move(value));
      callbacks.swap(callbacks_);
      ready_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    for (auto& cb : callbacks) cb();
    return true;
  }

  bool SetError(E error, const char* detail = nullptr) {
    std::vector<Callback> callbacks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (ready_.load(std::memory_order_relaxed)) return false;
      error_ = error;
      if (detail != nullptr) detail_.assign(TruncateToCapacity, detail);
      callbacks.swap(callbacks_);
      ready_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    for (auto& cb : callbacks) cb();
    return true;
  }

  bool IsReady() const noexcept { return ready_.load(std::memory_order_acquire); }

  /// @brief Value pointer once ready with a value, nullptr otherwise.
  const T* ValuePtr() const noexcept {
    if (!IsReady() || !value_.has_value()) return nullptr;
    return &value_.value();
  }

  /// @brief Move the value out; only for the cell's single consumer.
  T TakeValue() {
    CFX_ASSERT(IsReady() && value_.has_value());
    return std::move(value_.value());
  }

  /// @brief Error detail text; empty until the cell fails.
  const char* Detail() const noexcept { return IsReady() ? detail_.c_str() : ""; }

  /**
   * @brief Run @p cb once the cell completes; immediately on the calling
   *        thread if it already has.
   */
  void OnComplete(Callback cb) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!ready_.load(std::memory_order_relaxed)) {
        callbacks_.push_back(std::move(cb));
        return;
      }
    }
    cb();
  }

  /// @brief Block until the cell completes.
  void Await() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return ready_.load(std::memory_order_relaxed); });
  }

  /// @brief Block up to @p timeout_ms. @return true if the cell completed.
  bool AwaitFor(uint32_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                        [this] { return ready_.load(std::memory_order_relaxed); });
  }

  expected<T, E> Wait() const {
    Await();
    std::lock_guard<std::mutex> lock(mutex_);
    return ResultLocked();
  }

  expected<T, E> WaitFor(uint32_t timeout_ms, E timeout_error) const {
    if (!AwaitFor(timeout_ms)) return expected<T, E>::error(timeout_error);
    std::lock_guard<std::mutex> lock(mutex_);
    return ResultLocked();
  }

 private:
  expected<T, E> ResultLocked() const {
    if (value_.has_value()) return expected<T, E>::success(value_.value());
    return expected<T, E>::error(error_);
  }

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> ready_{false};
  optional<T> value_;
  E error_{};
  DetailText detail_;
  std::vector<Callback> callbacks_;
};

template <typename T>
using TaskCell = ResultCell<typename StoredType<T>::type, TaskError>;

}  // namespace detail

// ============================================================================
// TaskHandle<T>
// ============================================================================

/**
 * @brief Shared handle to the eventual result of a submitted unit of work.
 *
 * Copyable; all copies observe the same result. Get() may be called any
 * number of times.
 */
template <typename T>
class TaskHandle {
 public:
  using Cell = detail::TaskCell<T>;

  TaskHandle() = default;
  explicit TaskHandle(std::shared_ptr<Cell> cell) noexcept : cell_(std::move(cell)) {}

  bool Valid() const noexcept { return cell_ != nullptr; }
  bool IsReady() const noexcept { return cell_ != nullptr && cell_->IsReady(); }

  expected<T, TaskError> Get() const {
    CFX_ASSERT(cell_ != nullptr);
    return Convert(cell_->Wait());
  }

  expected<T, TaskError> GetFor(uint32_t timeout_ms) const {
    CFX_ASSERT(cell_ != nullptr);
    return Convert(cell_->WaitFor(timeout_ms, TaskError::kTimeout));
  }

  const char* ErrorDetail() const noexcept { return cell_ != nullptr ? cell_->Detail() : ""; }

  /// @brief Run @p cb when the task completes (immediately if it has).
  void OnComplete(std::function<void()> cb) const {
    CFX_ASSERT(cell_ != nullptr);
    cell_->OnComplete(std::move(cb));
  }

 private:
  using Stored = typename detail::StoredType<T>::type;

  static expected<T, TaskError> Convert(expected<Stored, TaskError>&& r) {
    if constexpr (std::is_void<T>::value) {
      return r.has_value() ? expected<void, TaskError>::success()
                           : expected<void, TaskError>::error(r.get_error());
    } else {
      return std::move(r);
    }
  }

  std::shared_ptr<Cell> cell_;
};

namespace detail {

/**
 * @brief Runnable that stores its callable's return value in a TaskCell.
 */
template <typename F, typename R>
class PackagedTask final : public Runnable {
 public:
  PackagedTask(F fn, std::shared_ptr<TaskCell<R>> cell, const char* pool_name)
      : fn_(std::move(fn)), cell_(std::move(cell)), pool_name_(pool_name) {}

  bool Run() noexcept override {
    DetailText detail;
    const bool ok = InvokeIsolated([this] { Complete(); }, detail);
    if (!ok) {
      CFX_LOG_WARN("Pool", "[%s] task failed: %s", pool_name_, detail.c_str());
      (void)cell_->SetError(TaskError::kExecutionFailed, detail.c_str());
    }
    return ok;
  }

  void Cancel(TaskError reason) noexcept override {
    (void)cell_->SetError(reason, TaskErrorName(reason));
  }

 private:
  void Complete() {
    if constexpr (std::is_void<R>::value) {
      fn_();
      (void)cell_->SetValue(Unit{});
    } else {
      (void)cell_->SetValue(fn_());
    }
  }

  F fn_;
  std::shared_ptr<TaskCell<R>> cell_;
  const char* pool_name_;
};

/// Fire-and-forget runnable; failures are only logged.
template <typename F>
class Job final : public Runnable {
 public:
  Job(F fn, const char* pool_name) : fn_(std::move(fn)), pool_name_(pool_name) {}

  bool Run() noexcept override {
    DetailText detail;
    const bool ok = InvokeIsolated(fn_, detail);
    if (!ok) {
      CFX_LOG_WARN("Pool", "[%s] job failed: %s", pool_name_, detail.c_str());
    }
    return ok;
  }

  void Cancel(TaskError) noexcept override {}

 private:
  F fn_;
  const char* pool_name_;
};

struct WorkerSlot {
  ThreadPool* pool{nullptr};
  uint32_t index{0U};
};

inline WorkerSlot& CurrentWorker() noexcept {
  static thread_local WorkerSlot slot;
  return slot;
}

}  // namespace detail

// ============================================================================
// ThreadPool
// ============================================================================

class ThreadPool final {
 public:
  explicit ThreadPool(const ThreadPoolConfig& cfg = ThreadPoolConfig{})
      : name_(cfg.name), thread_num_(ResolveThreads(cfg.threads)), priority_(cfg.priority) {}

  ~ThreadPool() { Shutdown(ShutdownPolicy::kDrain); }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // ======================== Lifecycle ========================

  /// @brief Spawn the worker threads. No-op when already running.
  void Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_acquire) != kStopped) return;
    locals_.clear();
    for (uint32_t i = 0U; i < thread_num_; ++i) {
      locals_.push_back(std::make_unique<LocalQueue>());
    }
    state_.store(kRunning, std::memory_order_release);
    threads_.reserve(thread_num_);
    for (uint32_t i = 0U; i < thread_num_; ++i) {
      threads_.emplace_back(&ThreadPool::WorkerLoop, this, i);
    }
    CFX_LOG_INFO("Pool", "[%s] started %u workers", name_.c_str(), thread_num_);
  }

  /**
   * @brief Stop accepting external work and join the workers.
   *
   * kDrain runs every queued unit (work forked by running units is still
   * accepted); kDiscard completes queued units with kCancelled. Idempotent.
   * Must not be called from one of this pool's workers.
   */
  void Shutdown(ShutdownPolicy policy = ShutdownPolicy::kDrain) {
    CFX_ASSERT(!IsWorkerThread());
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_.load(std::memory_order_acquire) != kRunning) return;
      state_.store(policy == ShutdownPolicy::kDrain ? kDraining : kDiscarding,
                   std::memory_order_release);
    }
    cv_.notify_all();
    if (policy == ShutdownPolicy::kDiscard) CancelQueued(TaskError::kCancelled);

    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
    threads_.clear();
    CancelQueued(TaskError::kCancelled);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_.store(kStopped, std::memory_order_release);
    }
    CFX_LOG_INFO("Pool", "[%s] stopped (%s)", name_.c_str(),
                 policy == ShutdownPolicy::kDrain ? "drain" : "discard");
  }

  bool IsRunning() const noexcept { return state_.load(std::memory_order_acquire) == kRunning; }

  // ======================== Submit API ========================

  /**
   * @brief Queue @p fn and return a handle to its result. A pool that is
   *        not running yields a handle already failed with kRejected.
   */
  template <typename F>
  auto Submit(F&& fn) -> TaskHandle<std::invoke_result_t<std::decay_t<F>&>> {
    using R = std::invoke_result_t<std::decay_t<F>&>;
    auto cell = std::make_shared<detail::TaskCell<R>>();
    (void)Post(std::make_unique<detail::PackagedTask<std::decay_t<F>, R>>(
        std::forward<F>(fn), cell, name_.c_str()));
    return TaskHandle<R>(std::move(cell));
  }

  /// @brief Queue a fire-and-forget job. @return false if rejected.
  template <typename F>
  bool Execute(F&& job) {
    return Post(std::make_unique<detail::Job<std::decay_t<F>>>(std::forward<F>(job),
                                                               name_.c_str()));
  }

  /**
   * @brief Queue a prepared runnable. On rejection the runnable is
   *        cancelled with kRejected and false is returned.
   */
  bool Post(std::unique_ptr<detail::Runnable> task) {
    CFX_ASSERT(task != nullptr);
    const detail::WorkerSlot& self = detail::CurrentWorker();
    if (self.pool != this) return PostGlobal(std::move(task), false);
    if (!AcceptsWorkerPush()) {
      task->Cancel(TaskError::kRejected);
      return false;
    }
    {
      LocalQueue& q = *locals_[self.index];
      std::lock_guard<std::mutex> lock(q.mutex);
      pending_.fetch_add(1U, std::memory_order_release);
      q.tasks.push_front(std::move(task));
    }
    submitted_.fetch_add(1U, std::memory_order_relaxed);
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Queue behind everything already submitted, even from a worker.
   *        Lets a long-running unit of work yield its worker.
   */
  bool PostFifo(std::unique_ptr<detail::Runnable> task) {
    CFX_ASSERT(task != nullptr);
    return PostGlobal(std::move(task), IsWorkerThread());
  }

  /**
   * @brief Run one queued unit on the calling worker thread.
   * @return false off-pool or when nothing was queued.
   */
  bool TryRunPendingTask() {
    const detail::WorkerSlot& self = detail::CurrentWorker();
    if (self.pool != this) return false;
    return RunOne(self.index);
  }

  /// @brief True when called from one of this pool's worker threads.
  bool IsWorkerThread() const noexcept { return detail::CurrentWorker().pool == this; }

  // ======================== Query ========================

  uint32_t ThreadCount() const noexcept { return thread_num_; }

  const char* Name() const noexcept { return name_.c_str(); }

  ThreadPoolStats GetStats() const noexcept {
    ThreadPoolStats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.completed = completed_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.stolen = stolen_.load(std::memory_order_relaxed);
    s.cancelled = cancelled_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  static constexpr uint8_t kStopped = 0U;
  static constexpr uint8_t kRunning = 1U;
  static constexpr uint8_t kDraining = 2U;
  static constexpr uint8_t kDiscarding = 3U;

  struct LocalQueue {
    std::mutex mutex;
    std::deque<std::unique_ptr<detail::Runnable>> tasks;
  };

  bool AcceptsWorkerPush() const noexcept {
    const uint8_t state = state_.load(std::memory_order_acquire);
    return state == kRunning || state == kDraining;
  }

  bool PostGlobal(std::unique_ptr<detail::Runnable> task, bool from_worker) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      const bool open = from_worker ? AcceptsWorkerPush()
                                    : state_.load(std::memory_order_acquire) == kRunning;
      if (!open) {
        lock.unlock();
        task->Cancel(TaskError::kRejected);
        return false;
      }
      pending_.fetch_add(1U, std::memory_order_release);
      global_.push_back(std::move(task));
    }
    submitted_.fetch_add(1U, std::memory_order_relaxed);
    cv_.notify_one();
    return true;
  }

  static uint32_t ResolveThreads(uint32_t requested) noexcept {
    if (requested > 0U) return requested;
    const uint32_t hw = std::thread::hardware_concurrency();
    return hw > 0U ? hw : 1U;
  }

  // ======================== Worker thread ========================

  void WorkerLoop(uint32_t index) {
    SetThreadPriority(priority_);
    detail::CurrentWorker() = detail::WorkerSlot{this, index};

    while (true) {
      if (state_.load(std::memory_order_acquire) == kDiscarding) break;
      if (RunOne(index)) continue;

      std::unique_lock<std::mutex> lock(mutex_);
      const uint8_t state = state_.load(std::memory_order_acquire);
      if (state == kDiscarding) break;
      if (state == kDraining && pending_.load(std::memory_order_acquire) == 0U) break;
      cv_.wait_for(lock, std::chrono::milliseconds(1), [this] {
        return pending_.load(std::memory_order_acquire) > 0U ||
               state_.load(std::memory_order_acquire) != kRunning;
      });
    }

    detail::CurrentWorker() = detail::WorkerSlot{};
    cv_.notify_all();
  }

  bool RunOne(uint32_t index) {
    bool stolen = false;
    std::unique_ptr<detail::Runnable> task = PopLocal(index);
    if (task == nullptr) {
      task = Steal(index);
      stolen = (task != nullptr);
    }
    if (task == nullptr) task = PopGlobal();
    if (task == nullptr) return false;

    pending_.fetch_sub(1U, std::memory_order_acq_rel);
    if (stolen) stolen_.fetch_add(1U, std::memory_order_relaxed);
    if (!task->Run()) failed_.fetch_add(1U, std::memory_order_relaxed);
    completed_.fetch_add(1U, std::memory_order_relaxed);
    return true;
  }

  std::unique_ptr<detail::Runnable> PopLocal(uint32_t index) {
    LocalQueue& q = *locals_[index];
    std::lock_guard<std::mutex> lock(q.mutex);
    if (q.tasks.empty()) return nullptr;
    std::unique_ptr<detail::Runnable> task = std::move(q.tasks.front());
    q.tasks.pop_front();
    return task;
  }

  std::unique_ptr<detail::Runnable> Steal(uint32_t thief) {
    for (uint32_t i = 1U; i < thread_num_; ++i) {
      LocalQueue& q = *locals_[(thief + i) % thread_num_];
      std::lock_guard<std::mutex> lock(q.mutex);
      if (q.tasks.empty()) continue;
      std::unique_ptr<detail::Runnable> task = std::move(q.tasks.back());
      q.tasks.pop_back();
      return task;
    }
    return nullptr;
  }

  std::unique_ptr<detail::Runnable> PopGlobal() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (global_.empty()) return nullptr;
    std::unique_ptr<detail::Runnable> task = std::move(global_.front());
    global_.pop_front();
    return task;
  }

  void CancelQueued(TaskError reason) {
    std::vector<std::unique_ptr<detail::Runnable>> dropped;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& t : global_) dropped.push_back(std::move(t));
      global_.clear();
    }
    for (auto& q : locals_) {
      std::lock_guard<std::mutex> lock(q->mutex);
      for (auto& t : q->tasks) dropped.push_back(std::move(t));
      q->tasks.clear();
    }
    if (dropped.empty()) return;
    pending_.fetch_sub(static_cast<uint32_t>(dropped.size()), std::memory_order_acq_rel);
    cancelled_.fetch_add(dropped.size(), std::memory_order_relaxed);
    CFX_LOG_DEBUG("Pool", "[%s] cancelled %u queued units", name_.c_str(),
                  static_cast<unsigned>(dropped.size()));
    for (auto& t : dropped) t->Cancel(reason);
  }

  static void SetThreadPriority(int32_t prio) noexcept {
#ifdef __linux__
    if (prio > 0) {
      struct sched_param param{};
      param.sched_priority = (prio > 99) ? 99 : prio;
      (void)pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    } else if (prio < 0) {
      struct sched_param param{};
      param.sched_priority = 0;
      (void)pthread_setschedparam(pthread_self(), SCHED_IDLE, &param);
    }
#else
    (void)prio;
#endif
  }

  FixedString<32> name_;
  const uint32_t thread_num_;
  const int32_t priority_;

  std::mutex mutex_;  ///< Guards global_, state transitions and the idle wait.
  std::condition_variable cv_;
  std::deque<std::unique_ptr<detail::Runnable>> global_;
  std::vector<std::unique_ptr<LocalQueue>> locals_;
  std::vector<std::thread> threads_;
  std::atomic<uint8_t> state_{kStopped};
  std::atomic<uint32_t> pending_{0U};

  std::atomic<uint64_t> submitted_{0U};
  std::atomic<uint64_t> completed_{0U};
  std::atomic<uint64_t> failed_{0U};
  std::atomic<uint64_t> stolen_{0U};
  std::atomic<uint64_t> cancelled_{0U};
};

// ============================================================================
// Scoped acquisition and configuration
// ============================================================================

/**
 * @brief Create and start a pool of @p threads, run @p block with it, then
 *        drain and shut the pool down however the block exits.
 */
template <typename F>
auto WithPool(uint32_t threads, F&& block) -> decltype(block(std::declval<ThreadPool&>())) {
  ThreadPoolConfig cfg;
  cfg.name = "with-pool";
  cfg.threads = threads;
  ThreadPool pool(cfg);
  pool.Start();
  CFX_SCOPE_EXIT(pool.Shutdown(ShutdownPolicy::kDrain));
  return block(pool);
}

/**
 * @brief Read a ThreadPoolConfig from keys name, threads and priority of
 *        @p section. Missing keys keep their defaults.
 */
inline ThreadPoolConfig LoadPoolConfig(const ConfigStore& store, const char* section = "pool") {
  ThreadPoolConfig cfg;
  if (store.HasKey(section, "name")) {
    cfg.name.assign(TruncateToCapacity, store.GetString(section, "name"));
  }
  cfg.threads = store.GetUint(section, "threads", cfg.threads);
  cfg.priority = store.GetInt(section, "priority", cfg.priority);
  return cfg;
}

}  // namespace cfx

#endif  // CFX_THREAD_POOL_HPP_
