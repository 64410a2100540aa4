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
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all conflux modules.
 *
 * - expected<V, E>   : value-or-error return type (no exceptions)
 * - optional<T>      : nullable value
 * - FixedString<N>   : stack-allocated, bounded string
 * - NewType<T, Tag>  : strong typedef
 * - ScopeGuard       : run a cleanup on scope exit (CFX_SCOPE_EXIT)
 * - and_then/or_else : expected combinators
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef CFX_VOCABULARY_HPP_
#define CFX_VOCABULARY_HPP_

#include "cfx/platform.hpp"

#include <cstdint>
#include <cstring>

#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace cfx {

// ============================================================================
// Common error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

enum class TimerError : uint8_t {
  kSlotsFull = 0,
  kNotRunning,
  kAlreadyRunning,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the named factories success() and error(), which
 * keeps call sites explicit about the path taken.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(kValueTag, v); }
  static expected success(V&& v) { return expected(kValueTag, std::move(v)); }
  static expected error(E e) noexcept { return expected(kErrorTag, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    CFX_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& noexcept {
    CFX_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && noexcept {
    CFX_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    CFX_ASSERT(!has_value_);
    return storage_.err;
  }

  template <typename U>
  V value_or(U&& fallback) const& {
    return has_value_ ? storage_.value : static_cast<V>(std::forward<U>(fallback));
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    ::new (&storage_.value) V(std::forward<U>(v));
  }
  expected(ErrorTag, E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/**
 * @brief expected<void, E>: success carries no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    CFX_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// and_then / or_else
// ============================================================================

/// @brief Chain a fallible step onto a successful result.
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Ret = decltype(fn(r.value()));
  if (!r.has_value()) {
    return Ret::error(r.get_error());
  }
  return fn(r.value());
}

/// @brief Invoke a handler when the result carries an error.
template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_.value) T(v);
  }
  optional(T&& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (&storage_.value) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) T(other.storage_.value);
    }
  }
  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) T(std::move(other.storage_.value));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_.value) T(other.storage_.value);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_.value) T(std::move(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    CFX_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const noexcept {
    CFX_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const { return has_value_ ? storage_.value : fallback; }

  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (&storage_.value) T(std::forward<Args>(args)...);
    has_value_ = true;
    return storage_.value;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() noexcept : dummy(0) {}
    ~Storage() {}
    char dummy;
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Bounded, null-terminated string stored inline.
 *
 * Construction from a literal is checked at compile time; runtime strings
 * must opt into truncation explicitly via TruncateToCapacity.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept : size_(N - 1U) {  // NOLINT(google-explicit-constructor)
    static_assert(N - 1U <= Capacity, "string literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept { assign(TruncateToCapacity, str); }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str, (str != nullptr) ? static_cast<uint32_t>(std::strlen(str)) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    size_ = (len > Capacity) ? Capacity : len;
    std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }
  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }
  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }
  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: same representation, distinct type.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : val_() {}
  constexpr explicit NewType(T v) noexcept : val_(v) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& rhs) const noexcept { return val_ == rhs.val_; }
  constexpr bool operator!=(const NewType& rhs) const noexcept { return val_ != rhs.val_; }
  constexpr bool operator<(const NewType& rhs) const noexcept { return val_ < rhs.val_; }

 private:
  T val_;
};

struct TimerTaskIdTag {};
struct ActorIdTag {};

using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;
using ActorId = NewType<uint32_t, ActorIdTag>;

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs the stored cleanup when destroyed unless released.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> cleanup) noexcept
      : cleanup_(std::move(cleanup)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  std::function<void()> cleanup_;
  bool active_;
};

#define CFX_SCOPE_EXIT(...) \
  ::cfx::ScopeGuard CFX_CONCAT(cfx_scope_exit_, __LINE__)([&]() { __VA_ARGS__; })

}  // namespace cfx

#endif  // CFX_VOCABULARY_HPP_
