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
 * @file pipeline.hpp
 * @brief Parallel collection pipeline over the fork/join executor.
 *
 * AsParallel() copies a collection into a Pipeline that splits it into
 * about threads * 4 segments. Each operation runs as a fork/join tree that
 * halves the index range down to one segment, so chained stages reuse the
 * same segmentation.
 *
 *   auto r = cfx::AsParallel(pool, numbers)
 *                .Filter([](int v) { return v % 2 == 0; })
 *                .Map([](int v) { return std::sqrt(v); })
 *                .Collection();
 *
 * Operation functions must be pure: they may run any number of times per
 * element and in any order across segments. A function that throws fails
 * the stage with TaskError::kExecutionFailed; the error then passes through
 * later stages and comes out of the terminal operation.
 */

#ifndef CFX_PIPELINE_HPP_
#define CFX_PIPELINE_HPP_

#include "cfx/fork_join.hpp"
#include "cfx/thread_pool.hpp"
#include "cfx/vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <functional>
#include <iterator>
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cfx {

template <typename T>
class Pipeline;

namespace detail {

// ============================================================================
// SplitTask - range bisection down to a grain
// ============================================================================

/**
 * @brief Fork/join node over [lo, hi): leaves call @p Leaf, inner nodes feed
 *        their two children's results to @p Join.
 */
template <typename R, typename Leaf, typename Join>
class SplitTask final : public ForkJoinTask<R> {
 public:
  SplitTask(size_t lo, size_t hi, size_t grain, const Leaf* leaf, const Join* join)
      : lo_(lo), hi_(hi), grain_(grain), leaf_(leaf), join_(join) {}

  void Compute() override {
    if (hi_ - lo_ <= grain_) {
      this->SetResult((*leaf_)(lo_, hi_));
      return;
    }
    const size_t mid = lo_ + (hi_ - lo_) / 2U;
    this->template Fork<SplitTask>(lo_, mid, grain_, leaf_, join_);
    this->template Fork<SplitTask>(mid, hi_, grain_, leaf_, join_);
    auto parts = this->ChildrenResults();
    if (!parts.has_value()) return;
    this->SetResult((*join_)(std::move(parts.value())));
  }

 private:
  size_t lo_;
  size_t hi_;
  size_t grain_;
  const Leaf* leaf_;
  const Join* join_;
};

/// @brief Run a SplitTask tree over [0, n); @p leaf and @p join outlive it.
template <typename R, typename Leaf, typename Join>
expected<R, TaskError> RunSplit(ThreadPool& pool, size_t n, size_t grain, const Leaf& leaf,
                                const Join& join) {
  return Orchestrate(pool, std::make_unique<SplitTask<R, Leaf, Join>>(0U, n, grain, &leaf, &join));
}

template <typename U>
std::vector<U> Concat(std::vector<std::vector<U>>&& parts) {
  size_t total = 0U;
  for (const auto& p : parts) total += p.size();
  std::vector<U> out;
  out.reserve(total);
  for (auto& p : parts) {
    std::move(p.begin(), p.end(), std::back_inserter(out));
  }
  return out;
}

template <typename T>
struct IsSharedPtr : std::false_type {};
template <typename T>
struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};

/// Seed for Combine: a zero-argument factory, or a value copied per key.
template <typename Init, bool kFactory = std::is_invocable<const Init&>::value>
struct CombineSeed {
  using type = std::decay_t<Init>;
  static_assert(!std::is_pointer<type>::value && !IsSharedPtr<type>::value,
                "Combine seed must not alias shared state; pass a factory instead");
  static type Make(const Init& init) { return init; }
};

template <typename Init>
struct CombineSeed<Init, true> {
  using type = std::decay_t<std::invoke_result_t<const Init&>>;
  static type Make(const Init& init) { return init(); }
};

}  // namespace detail

// ============================================================================
// Pipeline<T>
// ============================================================================

template <typename T>
class Pipeline {
 public:
  using ValueType = T;

  /// Element count; 0 once a stage has failed.
  size_t Size() const noexcept { return data_.size(); }
  bool Failed() const noexcept { return failed_; }

  /// The error that failed an earlier stage; meaningful only if Failed().
  TaskError Error() const noexcept { return error_; }

  uint32_t SegmentCount() const noexcept { return segments_; }

  // --------------------------------------------------------------------------
  // Chainable stages
  // --------------------------------------------------------------------------

  template <typename F>
  auto Map(F fn) const -> Pipeline<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
    using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    using Part = std::vector<U>;
    if (failed_) return Pipeline<U>::Failure(pool_, segments_, error_);
    auto leaf = [this, &fn](size_t lo, size_t hi) {
      Part out;
      out.reserve(hi - lo);
      for (size_t i = lo; i < hi; ++i) out.push_back(fn(data_[i]));
      return out;
    };
    auto join = [](std::vector<Part>&& parts) { return detail::Concat(std::move(parts)); };
    return Pipeline<U>::From(pool_, segments_, Run<Part>(leaf, join));
  }

  template <typename Pred>
  Pipeline<T> Filter(Pred pred) const {
    using Part = std::vector<T>;
    if (failed_) return Failure(pool_, segments_, error_);
    auto leaf = [this, &pred](size_t lo, size_t hi) {
      Part out;
      for (size_t i = lo; i < hi; ++i) {
        if (pred(data_[i])) out.push_back(data_[i]);
      }
      return out;
    };
    auto join = [](std::vector<Part>&& parts) { return detail::Concat(std::move(parts)); };
    return From(pool_, segments_, Run<Part>(leaf, join));
  }

  /// @brief Sort each segment, then merge pairwise up the fork/join tree.
  template <typename Cmp = std::less<T>>
  Pipeline<T> Sort(Cmp cmp = Cmp{}) const {
    using Part = std::vector<T>;
    if (failed_) return Failure(pool_, segments_, error_);
    auto leaf = [this, &cmp](size_t lo, size_t hi) {
      Part out(data_.begin() + static_cast<std::ptrdiff_t>(lo),
               data_.begin() + static_cast<std::ptrdiff_t>(hi));
      std::stable_sort(out.begin(), out.end(), cmp);
      return out;
    };
    auto join = [&cmp](std::vector<Part>&& parts) {
      Part merged;
      for (auto& p : parts) {
        Part next;
        next.reserve(merged.size() + p.size());
        std::merge(std::make_move_iterator(merged.begin()), std::make_move_iterator(merged.end()),
                   std::make_move_iterator(p.begin()), std::make_move_iterator(p.end()),
                   std::back_inserter(next), cmp);
        merged.swap(next);
      }
      return merged;
    };
    return From(pool_, segments_, Run<Part>(leaf, join));
  }

  // --------------------------------------------------------------------------
  // Terminal operations
  // --------------------------------------------------------------------------

  /// @brief Fold with an associative @p fn. Empty input gives an empty optional.
  template <typename F>
  expected<optional<T>, TaskError> Reduce(F fn) const {
    using Part = optional<T>;
    using Result = expected<Part, TaskError>;
    if (failed_) return Result::error(error_);
    auto leaf = [this, &fn](size_t lo, size_t hi) {
      Part acc;
      for (size_t i = lo; i < hi; ++i) {
        if (acc.has_value()) {
          acc = Part(fn(acc.value(), data_[i]));
        } else {
          acc = Part(data_[i]);
        }
      }
      return acc;
    };
    auto join = [&fn](std::vector<Part>&& parts) {
      Part acc;
      for (auto& p : parts) {
        if (!p.has_value()) continue;
        if (acc.has_value()) {
          acc = Part(fn(acc.value(), p.value()));
        } else {
          acc = std::move(p);
        }
      }
      return acc;
    };
    return Run<Part>(leaf, join);
  }

  /// @brief Sum of all elements; T{} for an empty pipeline.
  expected<T, TaskError> Sum() const {
    auto r = Reduce([](const T& a, const T& b) { return a + b; });
    if (!r.has_value()) return expected<T, TaskError>::error(r.get_error());
    return expected<T, TaskError>::success(r.value().value_or(T{}));
  }

  /// @brief First minimal element under @p cmp.
  template <typename Cmp = std::less<T>>
  expected<optional<T>, TaskError> Min(Cmp cmp = Cmp{}) const {
    return Reduce([cmp](const T& a, const T& b) { return cmp(b, a) ? b : a; });
  }

  /// @brief First maximal element under @p cmp.
  template <typename Cmp = std::less<T>>
  expected<optional<T>, TaskError> Max(Cmp cmp = Cmp{}) const {
    return Reduce([cmp](const T& a, const T& b) { return cmp(a, b) ? b : a; });
  }

  template <typename Pred>
  expected<bool, TaskError> Any(Pred pred) const {
    if (failed_) return expected<bool, TaskError>::error(error_);
    auto leaf = [this, &pred](size_t lo, size_t hi) {
      for (size_t i = lo; i < hi; ++i) {
        if (pred(data_[i])) return true;
      }
      return false;
    };
    auto join = [](std::vector<bool>&& parts) {
      return std::find(parts.begin(), parts.end(), true) != parts.end();
    };
    return Run<bool>(leaf, join);
  }

  template <typename Pred>
  expected<bool, TaskError> All(Pred pred) const {
    if (failed_) return expected<bool, TaskError>::error(error_);
    auto leaf = [this, &pred](size_t lo, size_t hi) {
      for (size_t i = lo; i < hi; ++i) {
        if (!pred(data_[i])) return false;
      }
      return true;
    };
    auto join = [](std::vector<bool>&& parts) {
      return std::find(parts.begin(), parts.end(), false) == parts.end();
    };
    return Run<bool>(leaf, join);
  }

  /**
   * @brief Group elements by @p key_fn. Each group keeps encounter order.
   */
  template <typename KeyFn>
  auto GroupBy(KeyFn key_fn) const
      -> expected<std::unordered_map<std::decay_t<std::invoke_result_t<const KeyFn&, const T&>>,
                                     std::vector<T>>,
                  TaskError> {
    using K = std::decay_t<std::invoke_result_t<const KeyFn&, const T&>>;
    using Part = std::unordered_map<K, std::vector<T>>;
    if (failed_) return expected<Part, TaskError>::error(error_);
    auto leaf = [this, &key_fn](size_t lo, size_t hi) {
      Part out;
      for (size_t i = lo; i < hi; ++i) out[key_fn(data_[i])].push_back(data_[i]);
      return out;
    };
    auto join = [](std::vector<Part>&& parts) {
      Part merged;
      for (auto& p : parts) {
        for (auto& kv : p) {
          auto& dst = merged[kv.first];
          std::move(kv.second.begin(), kv.second.end(), std::back_inserter(dst));
        }
      }
      return merged;
    };
    return Run<Part>(leaf, join);
  }

  /**
   * @brief Fold the values of (key, value) pairs per distinct key.
   *
   * Each key's accumulator starts from a copy of @p initial, or from
   * initial() when it is a zero-argument factory, and is updated as
   * acc = accumulate(acc, value) in encounter order. T must be a std::pair.
   */
  template <typename Init, typename Acc, typename P = T>
  auto Combine(const Init& initial, Acc accumulate) const
      -> expected<std::unordered_map<std::decay_t<typename P::first_type>,
                                     typename detail::CombineSeed<Init>::type>,
                  TaskError> {
    using K = std::decay_t<typename T::first_type>;
    using Seed = detail::CombineSeed<Init>;
    using A = typename Seed::type;
    using Out = std::unordered_map<K, A>;
    using Part = std::vector<std::pair<K, A>>;
    using Result = expected<Out, TaskError>;

    auto groups = GroupBy([](const T& kv) { return kv.first; });
    if (!groups.has_value()) return Result::error(groups.get_error());

    std::vector<std::pair<K, std::vector<T>>> buckets;
    buckets.reserve(groups.value().size());
    for (auto& kv : groups.value()) buckets.emplace_back(kv.first, std::move(kv.second));

    auto leaf = [&buckets, &initial, &accumulate](size_t lo, size_t hi) {
      Part out;
      out.reserve(hi - lo);
      for (size_t i = lo; i < hi; ++i) {
        A acc = Seed::Make(initial);
        for (const T& kv : buckets[i].second) acc = accumulate(acc, kv.second);
        out.emplace_back(buckets[i].first, std::move(acc));
      }
      return out;
    };
    auto join = [](std::vector<Part>&& parts) { return detail::Concat(std::move(parts)); };
    auto folded = detail::RunSplit<Part>(*pool_, buckets.size(), GrainFor(buckets.size()), leaf, join);
    if (!folded.has_value()) return Result::error(folded.get_error());

    Out out;
    out.reserve(folded.value().size());
    for (auto& kv : folded.value()) out.emplace(std::move(kv.first), std::move(kv.second));
    return Result::success(std::move(out));
  }

  /// @brief The elements in pipeline order.
  expected<std::vector<T>, TaskError> Collection() const {
    if (failed_) return expected<std::vector<T>, TaskError>::error(error_);
    return expected<std::vector<T>, TaskError>::success(data_);
  }

  expected<std::vector<T>, TaskError> Values() const { return Collection(); }

 private:
  template <typename U>
  friend class Pipeline;
  template <typename U>
  friend Pipeline<U> AsParallel(ThreadPool& pool, std::vector<U>&& items);

  Pipeline(ThreadPool* pool, uint32_t segments, std::vector<T> data)
      : pool_(pool), segments_(segments), data_(std::move(data)) {}

  static Pipeline Failure(ThreadPool* pool, uint32_t segments, TaskError err) {
    Pipeline p(pool, segments, std::vector<T>{});
    p.failed_ = true;
    p.error_ = err;
    return p;
  }

  static Pipeline From(ThreadPool* pool, uint32_t segments,
                       expected<std::vector<T>, TaskError>&& r) {
    if (!r.has_value()) return Failure(pool, segments, r.get_error());
    return Pipeline(pool, segments, std::move(r.value()));
  }

  size_t GrainFor(size_t n) const noexcept {
    const size_t grain = (n + segments_ - 1U) / segments_;
    return grain == 0U ? 1U : grain;
  }

  template <typename R, typename Leaf, typename Join>
  expected<R, TaskError> Run(const Leaf& leaf, const Join& join) const {
    return detail::RunSplit<R>(*pool_, data_.size(), GrainFor(data_.size()), leaf, join);
  }

  ThreadPool* pool_;
  uint32_t segments_;
  std::vector<T> data_;
  bool failed_{false};
  TaskError error_{TaskError::kExecutionFailed};
};

// ============================================================================
// AsParallel
// ============================================================================

/// @brief Build a pipeline owning @p items, segmented for @p pool.
template <typename T>
Pipeline<T> AsParallel(ThreadPool& pool, std::vector<T>&& items) {
  uint32_t segments = pool.ThreadCount() * 4U;
  if (segments == 0U) segments = 1U;
  return Pipeline<T>(&pool, segments, std::move(items));
}

/// @brief Build a pipeline over a copy of any iterable @p collection.
template <typename C>
auto AsParallel(ThreadPool& pool, const C& collection)
    -> Pipeline<std::decay_t<decltype(*std::begin(collection))>> {
  using T = std::decay_t<decltype(*std::begin(collection))>;
  return AsParallel(pool, std::vector<T>(std::begin(collection), std::end(collection)));
}

}  // namespace cfx

#endif  // CFX_PIPELINE_HPP_
