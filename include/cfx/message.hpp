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
 * @file message.hpp
 * @brief Type-erased immutable actor messages and type-tag dispatch tables.
 *
 * Every payload type T gets one static TypeTag. A type may declare a parent
 * type (single inheritance) with CFX_MESSAGE_DERIVED; dispatch then resolves
 * the most specific handler by walking the tag chain towards its root. No
 * RTTI is involved.
 *
 *   struct Shape { int id; };
 *   struct Circle : Shape { double r; };
 *   CFX_MESSAGE(Shape);
 *   CFX_MESSAGE_DERIVED(Circle, Shape);
 *
 *   cfx::Behavior b;
 *   b.On<Shape>([](const Shape& s) { ... });   // also receives Circle
 *   b.On<Circle>([](const Circle& c) { ... }); // preferred for Circle
 */

#ifndef CFX_MESSAGE_HPP_
#define CFX_MESSAGE_HPP_

#include "cfx/platform.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace cfx {

// ============================================================================
// TypeTag
// ============================================================================

/**
 * @brief Per-type discriminator. Tags are compared by address.
 */
struct TypeTag {
  const char* name;
  const TypeTag* parent;                        ///< nullptr for a root type
  const void* (*to_parent)(const void* self);  ///< upcast to the parent subobject
};

/**
 * @brief Message type declaration. Specialize through CFX_MESSAGE or
 *        CFX_MESSAGE_DERIVED; undeclared types are anonymous roots.
 */
template <typename T>
struct MessageTraits {
  using Parent = void;
  static constexpr const char* kName = "message";
};

namespace detail {

template <typename T, typename Parent>
const void* UpcastTo(const void* self) noexcept {
  return static_cast<const Parent*>(static_cast<const T*>(self));
}

}  // namespace detail

template <typename T>
const TypeTag& TypeOf() noexcept;

namespace detail {

template <typename T>
const TypeTag* ParentTag() noexcept {
  using Parent = typename MessageTraits<T>::Parent;
  if constexpr (std::is_void<Parent>::value) {
    return nullptr;
  } else {
    static_assert(std::is_base_of<Parent, T>::value, "message parent must be a base class");
    return &TypeOf<Parent>();
  }
}

template <typename T>
auto ParentCast() noexcept -> const void* (*)(const void*) {
  using Parent = typename MessageTraits<T>::Parent;
  if constexpr (std::is_void<Parent>::value) {
    return nullptr;
  } else {
    return &UpcastTo<T, Parent>;
  }
}

}  // namespace detail

template <typename T>
const TypeTag& TypeOf() noexcept {
  using U = std::remove_cv_t<std::remove_reference_t<T>>;
  if constexpr (!std::is_same<U, T>::value) {
    return TypeOf<U>();
  } else {
    static const TypeTag tag{MessageTraits<T>::kName, detail::ParentTag<T>(),
                             detail::ParentCast<T>()};
    return tag;
  }
}

#define CFX_MESSAGE(Type)                               \
  namespace cfx {                                       \
  template <>                                           \
  struct MessageTraits<Type> {                          \
    using Parent = void;                                \
    static constexpr const char* kName = #Type;         \
  };                                                    \
  }                                                     \
  static_assert(true, "")

#define CFX_MESSAGE_DERIVED(Type, Base)                 \
  namespace cfx {                                       \
  template <>                                           \
  struct MessageTraits<Type> {                          \
    using Parent = Base;                                \
    static constexpr const char* kName = #Type;         \
  };                                                    \
  }                                                     \
  static_assert(true, "")

// ============================================================================
// Message
// ============================================================================

/**
 * @brief Immutable, cheaply copyable, type-erased payload.
 *
 * Any copyable value converts implicitly, so `actor->Send(42)` and
 * `actor->Send(Order{...})` both work.
 */
class Message {
 public:
  Message() noexcept = default;

  template <typename T,
            typename = std::enable_if_t<!std::is_same<std::decay_t<T>, Message>::value>>
  Message(T&& value)  // NOLINT(google-explicit-constructor)
      : payload_(std::make_shared<std::decay_t<T>>(std::forward<T>(value))),
        tag_(&TypeOf<std::decay_t<T>>()) {}

  bool Empty() const noexcept { return tag_ == nullptr; }

  /// @brief Tag of the dynamic payload type; nullptr when empty.
  const TypeTag* Tag() const noexcept { return tag_; }

  const char* TypeName() const noexcept { return tag_ != nullptr ? tag_->name : "empty"; }

  /// @brief True if the payload is a T or declares T as an ancestor.
  template <typename T>
  bool Is() const noexcept {
    return As<T>() != nullptr;
  }

  /// @brief Payload viewed as T (exact type or declared ancestor), else nullptr.
  template <typename T>
  const T* As() const noexcept {
    const TypeTag* want = &TypeOf<T>();
    const void* ptr = payload_.get();
    for (const TypeTag* t = tag_; t != nullptr; t = t->parent) {
      if (t == want) return static_cast<const T*>(ptr);
      if (t->to_parent == nullptr) break;
      ptr = t->to_parent(ptr);
    }
    return nullptr;
  }

  /// @brief Payload as T; the caller guarantees the type.
  template <typename T>
  const T& Get() const noexcept {
    const T* p = As<T>();
    CFX_ASSERT(p != nullptr);
    return *p;
  }

  /// @brief Unchecked payload pointer for statically typed receivers.
  const void* Raw() const noexcept { return payload_.get(); }

 private:
  std::shared_ptr<const void> payload_;
  const TypeTag* tag_ = nullptr;
};

/// @brief Delivered to a receive continuation whose timeout expired.
struct Timeout {};

template <>
struct MessageTraits<Timeout> {
  using Parent = void;
  static constexpr const char* kName = "cfx::Timeout";
};

// ============================================================================
// Behavior - type tag -> handler table
// ============================================================================

/**
 * @brief Handler table keyed by message type.
 *
 * Resolution walks the message's tag chain from the dynamic type towards the
 * root and takes the first type with a handler; among handlers for the same
 * type the latest registration wins. Otherwise() catches the rest.
 */
class Behavior {
 public:
  using Handler = std::function<void(const Message&)>;

  template <typename T, typename F>
  Behavior& On(F&& fn) {
    entries_.push_back(Entry{&TypeOf<T>(), [f = std::forward<F>(fn)](const Message& msg) mutable {
                               f(*static_cast<const T*>(UpcastFromDynamic(msg, &TypeOf<T>())));
                             }});
    return *this;
  }

  Behavior& Otherwise(Handler fn) {
    otherwise_ = std::move(fn);
    return *this;
  }

  /// @brief The handler selected for @p msg, or nullptr.
  const Handler* Find(const Message& msg) const noexcept {
    for (const TypeTag* t = msg.Tag(); t != nullptr; t = t->parent) {
      for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->tag == t) return &it->fn;
      }
    }
    return otherwise_ ? &otherwise_ : nullptr;
  }

  /// @brief Run the selected handler. @return false when nothing matched.
  bool Dispatch(const Message& msg) const {
    const Handler* h = Find(msg);
    if (h == nullptr) return false;
    (*h)(msg);
    return true;
  }

  bool Empty() const noexcept { return entries_.empty() && !otherwise_; }
  uint32_t Size() const noexcept { return static_cast<uint32_t>(entries_.size()); }

 private:
  struct Entry {
    const TypeTag* tag;
    Handler fn;
  };

  static const void* UpcastFromDynamic(const Message& msg, const TypeTag* want) noexcept {
    const void* ptr = msg.Raw();
    for (const TypeTag* t = msg.Tag(); t != want; t = t->parent) {
      ptr = t->to_parent(ptr);
    }
    return ptr;
  }

  std::vector<Entry> entries_;
  Handler otherwise_;
};

}  // namespace cfx

#endif  // CFX_MESSAGE_HPP_
