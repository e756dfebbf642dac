/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
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
 * @brief Vocabulary types for chatrelay: ErrorCode, expected, FixedFunction,
 *        ScopeGuard.
 */

#ifndef CHATRELAY_VOCABULARY_HPP_
#define CHATRELAY_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

#ifndef CHATRELAY_ASSERT
#define CHATRELAY_ASSERT(cond) ((void)(cond))
#endif

namespace chatrelay {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kConnectionClosed = 1,
  kInvalidState = 2,
  kSocketError = 3,
  kTimeout = 4,
  kPoolExhausted = 5,
  kSendFailed = 6,
  kInvalidArgument = 7,
  kInternalError = 255
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kConnectionClosed:
      return "connection closed";
    case ErrorCode::kInvalidState:
      return "invalid state";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kPoolExhausted:
      return "pool exhausted";
    case ErrorCode::kSendFailed:
      return "send failed";
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected e;
    e.construct(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.construct(std::move(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) : err_(other.err_) {
    if (other.has_value_) {
      construct(other.value());
    }
  }

  expected(expected&& other) noexcept : err_(other.err_) {
    if (other.has_value_) {
      construct(std::move(other.value()));
    }
  }

  expected& operator=(expected other) noexcept {
    destroy();
    err_ = other.err_;
    if (other.has_value_) {
      construct(std::move(other.value()));
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    CHATRELAY_ASSERT(has_value_);
    return *std::launder(reinterpret_cast<V*>(&storage_));
  }

  const V& value() const& noexcept {
    CHATRELAY_ASSERT(has_value_);
    return *std::launder(reinterpret_cast<const V*>(&storage_));
  }

  E get_error() const noexcept {
    CHATRELAY_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value() : default_val; }

 private:
  expected() noexcept = default;

  template <typename U>
  void construct(U&& val) {
    ::new (&storage_) V(std::forward<U>(val));
    has_value_ = true;
  }

  void destroy() noexcept {
    if (has_value_) {
      value().~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    CHATRELAY_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept = default;

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// FixedFunction<Sig, BufferSize> - SBO callback
// ============================================================================

template <typename Signature, size_t BufferSize = 2 * sizeof(void*)>
class FixedFunction;

/**
 * @brief Move-only callable wrapper stored inline, never on the heap.
 *
 * The callable must fit in BufferSize bytes; larger captures fail to compile.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  FixedFunction(std::nullptr_t) noexcept {}

  template <typename F, typename = typename std::enable_if<
                            !std::is_same<typename std::decay<F>::type, FixedFunction>::value &&
                            !std::is_same<typename std::decay<F>::type, std::nullptr_t>::value>::type>
  FixedFunction(F&& f) noexcept(std::is_nothrow_constructible<typename std::decay<F>::type, F&&>::value) {  // NOLINT
    using Decay = typename std::decay<F>::type;
    static_assert(sizeof(Decay) <= BufferSize, "Callable too large for FixedFunction buffer");
    static_assert(alignof(Decay) <= alignof(Storage), "Callable alignment exceeds buffer alignment");
    static_assert(std::is_nothrow_move_constructible<Decay>::value, "Callable must be nothrow movable");
    ::new (&storage_) Decay(std::forward<F>(f));
    ops_ = &OpsFor<Decay>::kTable;
  }

  FixedFunction(FixedFunction&& other) noexcept { take(other); }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      reset();
      take(other);
    }
    return *this;
  }

  FixedFunction& operator=(std::nullptr_t) noexcept {
    reset();
    return *this;
  }

  ~FixedFunction() { reset(); }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  Ret operator()(Args... args) {
    CHATRELAY_ASSERT(ops_ != nullptr);
    return ops_->invoke(storage_, std::forward<Args>(args)...);
  }

  explicit operator bool() const noexcept { return ops_ != nullptr; }

 private:
  using Storage = typename std::aligned_storage<BufferSize, alignof(std::max_align_t)>::type;

  struct Ops {
    Ret (*invoke)(Storage&, Args&&...);
    void (*relocate)(Storage& from, Storage& to) noexcept;
    void (*destroy)(Storage&) noexcept;
  };

  template <typename T>
  struct OpsFor {
    static T* get(Storage& s) noexcept { return std::launder(reinterpret_cast<T*>(&s)); }

    static Ret invoke(Storage& s, Args&&... args) { return (*get(s))(std::forward<Args>(args)...); }

    static void relocate(Storage& from, Storage& to) noexcept {
      ::new (&to) T(std::move(*get(from)));
      get(from)->~T();
    }

    static void destroy(Storage& s) noexcept { get(s)->~T(); }

    static constexpr Ops kTable{&invoke, &relocate, &destroy};
  };

  void take(FixedFunction& other) noexcept {
    if (other.ops_ != nullptr) {
      other.ops_->relocate(other.storage_, storage_);
      ops_ = other.ops_;
      other.ops_ = nullptr;
    }
  }

  void reset() noexcept {
    if (ops_ != nullptr) {
      ops_->destroy(storage_);
      ops_ = nullptr;
    }
  }

  Storage storage_;
  const Ops* ops_ = nullptr;
};

// ============================================================================
// ScopeGuard - RAII cleanup guard
// ============================================================================

/**
 * @brief Executes a cleanup callback on scope exit unless released.
 *
 *   ScopeGuard guard([&] { conn->release(); });
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(FixedFunction<void()> cleanup) noexcept : cleanup_(std::move(cleanup)) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  ScopeGuard(ScopeGuard&& other) noexcept : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  FixedFunction<void()> cleanup_;
  bool active_{true};
};

}  // namespace chatrelay

#endif  // CHATRELAY_VOCABULARY_HPP_
