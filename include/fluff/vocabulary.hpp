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
 * @brief Error-return and fixed-capacity vocabulary types.
 *
 * - expected<V, E>  : value-or-error return, no exceptions
 * - optional<T>     : nullable value without heap
 * - FixedString<N>  : stack string with explicit truncation policy
 * - ScopeGuard      : run a cleanup on every exit path
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FLUFF_VOCABULARY_HPP_
#define FLUFF_VOCABULARY_HPP_

#include "fluff/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace fluff {

// ============================================================================
// Shared Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_.value) V(std::move(other.storage_.value));
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
    FLUFF_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& noexcept {
    FLUFF_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && noexcept {
    FLUFF_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

  E get_error() const noexcept {
    FLUFF_ASSERT(!has_value_);
    return storage_.err;
  }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_value_(true) {
    new (&storage_.value) V(v);
  }
  explicit expected(V&& v) : has_value_(true) {
    new (&storage_.value) V(std::move(v));
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

template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    FLUFF_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT implicit
    new (&storage_.value) T(v);
  }
  optional(T&& v) : has_value_(true) {  // NOLINT implicit
    new (&storage_.value) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) new (&storage_.value) T(std::move(other.storage_.value));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) new (&storage_.value) T(other.storage_.value);
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) new (&storage_.value) T(std::move(other.storage_.value));
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    FLUFF_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const noexcept {
    FLUFF_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return has_value_ ? storage_.value : fallback;
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
    uint8_t dummy;
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting silent truncation. Without it, oversized input is rejected
/// by the assertion in debug builds.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

template <uint32_t Capacity>
class FixedString {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&literal)[N]) noexcept : size_(0) {  // NOLINT
    static_assert(N - 1 <= Capacity, "literal exceeds FixedString capacity");
    assign(TruncateToCapacity, literal);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    const uint32_t len =
        (str == nullptr) ? 0U : static_cast<uint32_t>(std::strlen(str));
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    size_ = (len > Capacity) ? Capacity : len;
    if (size_ > 0U) std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }
  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

  template <uint32_t C2>
  bool operator==(const FixedString<C2>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }
  template <uint32_t C2>
  bool operator!=(const FixedString<C2>& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  char buf_[Capacity + 1];
  uint32_t size_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a cleanup callable when leaving scope unless Release()d.
 *
 * @code
 *   transport.Connect(addr, timeout);
 *   auto guard = MakeScopeGuard([&] { transport.Disconnect(); });
 *   if (!Attach()) return error;   // link torn down
 *   guard.Release();               // keep the link
 * @endcode
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept : fn_(std::move(fn)), active_(true) {}
  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  ~ScopeGuard() {
    if (active_) fn_();
  }

  void Release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) noexcept {
  return ScopeGuard<F>(std::move(fn));
}

}  // namespace fluff

#endif  // FLUFF_VOCABULARY_HPP_
