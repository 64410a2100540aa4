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
 * @file fork_join.hpp
 * @brief Fork/join executor for recursive divide-and-conquer computations.
 *
 * A computation is a tree of ForkJoinTask nodes. Compute() either sets a
 * result directly or forks children, collects their results and combines
 * them. Forked children run on the same ThreadPool; a parent that waits for
 * a child no worker has picked up yet runs that child itself, so recursion
 * depth is not bounded by the pool size.
 *
 * Nodes live in a per-computation arena and reference their children by
 * index. A node completes only after every child it forked has completed,
 * so the root result implies the whole tree has finished.
 *
 *   class Fib : public cfx::ForkJoinTask<uint64_t> {
 *    public:
 *     explicit Fib(uint32_t n) : n_(n) {}
 *     void Compute() override {
 *       if (n_ < 2U) { SetResult(n_); return; }
 *       Fork<Fib>(n_ - 1U);
 *       Fork<Fib>(n_ - 2U);
 *       auto r = ChildrenResults();
 *       if (r) SetResult(r.value()[0] + r.value()[1]);
 *     }
 *    private:
 *     uint32_t n_;
 *   };
 *
 *   auto r = cfx::Orchestrate(pool, std::make_unique<Fib>(20U));
 */

#ifndef CFX_FORK_JOIN_HPP_
#define CFX_FORK_JOIN_HPP_

#include "cfx/log.hpp"
#include "cfx/platform.hpp"
#include "cfx/thread_pool.hpp"
#include "cfx/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace cfx {

template <typename T>
class ForkJoinTask;

namespace detail {

static constexpr uint32_t kNoParent = 0xFFFFFFFFU;

// ============================================================================
// ForkJoinArena - node storage for one computation
// ============================================================================

template <typename T>
class ForkJoinArena final : public std::enable_shared_from_this<ForkJoinArena<T>> {
 public:
  struct Node {
    Node(std::unique_ptr<ForkJoinTask<T>> t, uint32_t p) : task(std::move(t)), parent(p) {}

    std::unique_ptr<ForkJoinTask<T>> task;
    uint32_t parent;
    std::vector<uint32_t> children;  ///< guarded by the arena mutex
    ResultCell<T, TaskError> cell;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> claimed{false};  ///< set by whoever runs or cancels it
  };

  explicit ForkJoinArena(ThreadPool& pool) : pool_(pool) {}

  ForkJoinArena(const ForkJoinArena&) = delete;
  ForkJoinArena& operator=(const ForkJoinArena&) = delete;

  /// @brief Append a node; a child of a cancelled node starts cancelled.
  uint32_t Add(std::unique_ptr<ForkJoinTask<T>> task, uint32_t parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t index = static_cast<uint32_t>(nodes_.size());
    nodes_.emplace_back(std::move(task), parent);
    if (parent != kNoParent) {
      Node& p = nodes_[parent];
      p.children.push_back(index);
      if (p.cancelled.load(std::memory_order_acquire)) {
        nodes_[index].cancelled.store(true, std::memory_order_release);
      }
    }
    return index;
  }

  /// Elements of a deque keep their address across emplace_back.
  Node& At(uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_[index];
  }

  std::vector<uint32_t> ChildrenOf(uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_[index].children;
  }

  uint32_t Size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(nodes_.size());
  }

  /// @brief Mark @p index and every descendant known so far as cancelled.
  void CancelSubtree(uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> stack{index};
    while (!stack.empty()) {
      const uint32_t i = stack.back();
      stack.pop_back();
      nodes_[i].cancelled.store(true, std::memory_order_release);
      for (uint32_t c : nodes_[i].children) stack.push_back(c);
    }
  }

  /// @brief Queue node @p index on the pool; a rejection fails the node.
  void Launch(uint32_t index) {
    (void)pool_.Post(std::make_unique<NodeRunnable>(this->shared_from_this(), index));
  }

  /**
   * @brief Wait for node @p index, running it on the calling thread first if
   *        no worker has picked it up yet. Never runs nodes of other
   *        computations or other queued work.
   */
  void Join(uint32_t index) {
    (void)RunNode(index);
    At(index).cell.Await();
  }

  ThreadPool& Pool() noexcept { return pool_; }

 private:
  class NodeRunnable final : public Runnable {
   public:
    NodeRunnable(std::shared_ptr<ForkJoinArena> arena, uint32_t index)
        : arena_(std::move(arena)), index_(index) {}

    bool Run() noexcept override { return arena_->RunNode(index_); }

    void Cancel(TaskError reason) noexcept override {
      Node& node = arena_->At(index_);
      if (node.claimed.exchange(true, std::memory_order_acq_rel)) return;
      (void)node.cell.SetError(reason, TaskErrorName(reason));
      node.task.reset();
    }

   private:
    std::shared_ptr<ForkJoinArena> arena_;
    uint32_t index_;
  };

  bool RunNode(uint32_t index) {
    Node& node = At(index);
    if (node.claimed.exchange(true, std::memory_order_acq_rel)) return true;
    if (node.cancelled.load(std::memory_order_acquire)) {
      (void)node.cell.SetError(TaskError::kCancelled, "cancelled before start");
      node.task.reset();
      return true;
    }

    ForkJoinTask<T>& task = *node.task;
    task.arena_ = this;
    task.node_ = index;

    DetailText text;
    const bool ok = InvokeIsolated([&task] { task.Compute(); }, text);

    for (uint32_t child : ChildrenOf(index)) Join(child);

    if (!ok) {
      CFX_LOG_WARN("ForkJoin", "[%s] node %u failed: %s", pool_.Name(), index, text.c_str());
      (void)node.cell.SetError(TaskError::kExecutionFailed, text.c_str());
    } else if (task.aborted_) {
      (void)node.cell.SetError(task.abort_error_, task.abort_detail_.c_str());
    } else if (task.result_.has_value()) {
      (void)node.cell.SetValue(std::move(task.result_.value()));
    } else {
      (void)node.cell.SetError(TaskError::kNoResult, "Compute() set no result");
    }
    node.task.reset();
    return ok;
  }

  ThreadPool& pool_;
  std::mutex mutex_;
  std::deque<Node> nodes_;
};

}  // namespace detail

// ============================================================================
// ForkJoinTask<T>
// ============================================================================

/**
 * @brief One node of a fork/join computation producing a T.
 *
 * Fork(), ForkOffChild(), ChildrenResults() and SetResult() may only be
 * called from within Compute().
 */
template <typename T>
class ForkJoinTask {
 public:
  using ResultType = T;

  ForkJoinTask() = default;
  virtual ~ForkJoinTask() = default;

  ForkJoinTask(const ForkJoinTask&) = delete;
  ForkJoinTask& operator=(const ForkJoinTask&) = delete;

  virtual void Compute() = 0;

 protected:
  /// @brief Schedule @p child as the next child of this node.
  void ForkOffChild(std::unique_ptr<ForkJoinTask<T>> child) {
    CFX_ASSERT(arena_ != nullptr);
    CFX_ASSERT(child != nullptr);
    const uint32_t index = arena_->Add(std::move(child), node_);
    arena_->Launch(index);
  }

  template <typename Child, typename... Args>
  void Fork(Args&&... args) {
    static_assert(std::is_base_of<ForkJoinTask<T>, Child>::value,
                  "Child must derive from ForkJoinTask<T>");
    ForkOffChild(std::make_unique<Child>(std::forward<Args>(args)...));
  }

  /**
   * @brief Wait for every forked child and hand over their results in fork
   *        order.
   *
   * If a child failed, this node fails with the same error and the error is
   * returned. Ownership of the results moves to the caller, so only the
   * first call sees them; later calls return kNoResult.
   */
  expected<std::vector<T>, TaskError> ChildrenResults() {
    using Result = expected<std::vector<T>, TaskError>;
    CFX_ASSERT(arena_ != nullptr);
    if (results_taken_) return Result::error(TaskError::kNoResult);
    results_taken_ = true;

    const std::vector<uint32_t> children = arena_->ChildrenOf(node_);
    std::vector<T> out;
    out.reserve(children.size());
    for (uint32_t child : children) {
      arena_->Join(child);
      auto& cell = arena_->At(child).cell;
      if (cell.ValuePtr() == nullptr) {
        const TaskError err = cell.Wait().get_error();
        Abort(err, cell.Detail());
        return Result::error(err);
      }
      out.push_back(cell.TakeValue());
    }
    return Result::success(std::move(out));
  }

  /// @brief Record this node's result. Ignored once the node has failed.
  void SetResult(T value) {
    if (!aborted_) result_.emplace(std::move(value));
  }

  /// @brief Request cancellation of this node and its descendants.
  void Cancel() {
    CFX_ASSERT(arena_ != nullptr);
    arena_->CancelSubtree(node_);
  }

  bool IsCancelled() const noexcept {
    return arena_ != nullptr && arena_->At(node_).cancelled.load(std::memory_order_acquire);
  }

  uint32_t ChildCount() const {
    return arena_ != nullptr ? static_cast<uint32_t>(arena_->ChildrenOf(node_).size()) : 0U;
  }

 private:
  friend class detail::ForkJoinArena<T>;

  void Abort(TaskError err, const char* text) {
    if (aborted_) return;
    aborted_ = true;
    abort_error_ = err;
    abort_detail_.assign(TruncateToCapacity, text);
    result_.reset();
  }

  detail::ForkJoinArena<T>* arena_{nullptr};
  uint32_t node_{0U};
  optional<T> result_;
  bool results_taken_{false};
  bool aborted_{false};
  TaskError abort_error_{TaskError::kExecutionFailed};
  DetailText abort_detail_;
};

// ============================================================================
// ForkJoinHandle<T>
// ============================================================================

/// @brief Handle to a running fork/join computation.
template <typename T>
class ForkJoinHandle {
 public:
  ForkJoinHandle() = default;
  explicit ForkJoinHandle(std::shared_ptr<detail::ForkJoinArena<T>> arena) noexcept
      : arena_(std::move(arena)) {}

  bool Valid() const noexcept { return arena_ != nullptr; }

  bool IsReady() const { return arena_ != nullptr && arena_->At(0U).cell.IsReady(); }

  /**
   * @brief Block until the root completes. On one of the pool's own workers
   *        a root that has not started yet runs on the calling thread.
   */
  expected<T, TaskError> Get() const {
    if (arena_ == nullptr) return expected<T, TaskError>::error(TaskError::kNoResult);
    if (arena_->Pool().IsWorkerThread()) arena_->Join(0U);
    return arena_->At(0U).cell.Wait();
  }

  expected<T, TaskError> GetFor(uint32_t timeout_ms) const {
    if (arena_ == nullptr) return expected<T, TaskError>::error(TaskError::kNoResult);
    return arena_->At(0U).cell.WaitFor(timeout_ms, TaskError::kTimeout);
  }

  const char* ErrorDetail() const {
    return arena_ != nullptr ? arena_->At(0U).cell.Detail() : "";
  }

  /**
   * @brief Cancel the whole tree. Nodes that have not started finish with
   *        kCancelled; running nodes can poll IsCancelled().
   */
  void Cancel() const {
    if (arena_ != nullptr) arena_->CancelSubtree(0U);
  }

  /// @brief Number of nodes created so far, root included.
  uint32_t NodeCount() const { return arena_ != nullptr ? arena_->Size() : 0U; }

 private:
  std::shared_ptr<detail::ForkJoinArena<T>> arena_;
};

// ============================================================================
// Orchestrate
// ============================================================================

/// @brief Start @p root on @p pool and return immediately.
template <typename TaskT>
ForkJoinHandle<typename TaskT::ResultType> OrchestrateAsync(ThreadPool& pool,
                                                            std::unique_ptr<TaskT> root) {
  using T = typename TaskT::ResultType;
  static_assert(std::is_base_of<ForkJoinTask<T>, TaskT>::value,
                "root must derive from ForkJoinTask");
  auto arena = std::make_shared<detail::ForkJoinArena<T>>(pool);
  const uint32_t index =
      arena->Add(std::unique_ptr<ForkJoinTask<T>>(std::move(root)), detail::kNoParent);
  arena->Launch(index);
  return ForkJoinHandle<T>(std::move(arena));
}

/**
 * @brief Run @p root to completion on @p pool.
 *
 * @return The root's result; kNoResult if the root set none, otherwise the
 *         first error propagated up the tree.
 */
template <typename TaskT>
expected<typename TaskT::ResultType, TaskError> Orchestrate(ThreadPool& pool,
                                                           std::unique_ptr<TaskT> root) {
  return OrchestrateAsync(pool, std::move(root)).Get();
}

}  // namespace cfx

#endif  // CFX_FORK_JOIN_HPP_
