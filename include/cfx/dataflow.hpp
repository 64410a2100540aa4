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
 * @file dataflow.hpp
 * @brief Single-assignment dataflow variables and a keyed dataflow map.
 *
 * A DataflowVariable is bound at most once. Readers block until the bind and
 * then observe the same immutable value; a read on a pool worker holds that
 * worker until the bind. Copies of a variable share one state, so a
 * producer task and its consumers can each hold their own handle.
 *
 *   cfx::DataflowVariable<int> x;
 *   pool.Execute([x]() mutable { (void)x.Bind(42); });
 *   int v = x.Get();
 */

#ifndef CFX_DATAFLOW_HPP_
#define CFX_DATAFLOW_HPP_

#include "cfx/log.hpp"
#include "cfx/thread_pool.hpp"
#include "cfx/vocabulary.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace cfx {

enum class DataflowError : uint8_t {
  kAlreadyBound = 0,
  kTimeout,
};

// ============================================================================
// DataflowVariable<T>
// ============================================================================

template <typename T>
class DataflowVariable {
 public:
  DataflowVariable() : cell_(std::make_shared<Cell>()) {}

  /**
   * @brief Bind the value. A second bind fails with kAlreadyBound and leaves
   *        the first value in place. Bound-callbacks run on this thread.
   */
  expected<void, DataflowError> Bind(T value) const {
    if (!cell_->SetValue(std::move(value))) {
      CFX_LOG_DEBUG("Dataflow", "rejected second bind");
      return expected<void, DataflowError>::error(DataflowError::kAlreadyBound);
    }
    return expected<void, DataflowError>::success();
  }

  /// @brief Block until bound and return the value.
  const T& Get() const {
    cell_->Await();
    return *cell_->ValuePtr();
  }

  expected<T, DataflowError> GetFor(uint32_t timeout_ms) const {
    return cell_->WaitFor(timeout_ms, DataflowError::kTimeout);
  }

  bool IsBound() const noexcept { return cell_->IsReady(); }

  /**
   * @brief Invoke @p callback once with the value: immediately if already
   *        bound, otherwise on the binding thread.
   */
  void WhenBound(std::function<void(const T&)> callback) const {
    const Cell* cell = cell_.get();
    cell_->OnComplete([cell, callback]() { callback(*cell->ValuePtr()); });
  }

  /// @brief True when both handles refer to the same variable.
  bool SameAs(const DataflowVariable& other) const noexcept { return cell_ == other.cell_; }

 private:
  using Cell = detail::ResultCell<T, DataflowError>;

  std::shared_ptr<Cell> cell_;
};

// ============================================================================
// DataflowMap<K, V>
// ============================================================================

/**
 * @brief Keyed collection of dataflow variables, each created on first
 *        access. Get(key) on a key nobody has bound yet waits for the bind.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class DataflowMap {
 public:
  DataflowMap() = default;
  DataflowMap(const DataflowMap&) = delete;
  DataflowMap& operator=(const DataflowMap&) = delete;

  /// @brief The variable stored under @p key, created unbound if absent.
  DataflowVariable<V> operator[](const K& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return vars_[key];
  }

  expected<void, DataflowError> Bind(const K& key, V value) {
    return (*this)[key].Bind(std::move(value));
  }

  V Get(const K& key) { return (*this)[key].Get(); }

  expected<V, DataflowError> GetFor(const K& key, uint32_t timeout_ms) {
    return (*this)[key].GetFor(timeout_ms);
  }

  /// @brief True when a value is bound under @p key.
  bool Contains(const K& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vars_.find(key);
    return it != vars_.end() && it->second.IsBound();
  }

  /// @brief Number of keys accessed or bound so far.
  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(vars_.size());
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_map<K, DataflowVariable<V>, Hash> vars_;
};

}  // namespace cfx

#endif  // CFX_DATAFLOW_HPP_
