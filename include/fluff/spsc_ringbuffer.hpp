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
 * @file spsc_ringbuffer.hpp
 * @brief Lock-free SPSC ring buffer carrying notification frames from the
 *        radio callback context to the registry dispatcher thread.
 *
 * The producer side (radio callback) never blocks and never allocates. A
 * full buffer rejects the push; the caller counts the drop.
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef FLUFF_SPSC_RINGBUFFER_HPP_
#define FLUFF_SPSC_RINGBUFFER_HPP_

#include "fluff/platform.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>

namespace fluff {

/// @brief Lock-free SPSC ring buffer.
///
/// @tparam T           Element type.
/// @tparam BufferSize  Capacity, a power of 2.
///
/// Exactly one thread may push and exactly one thread may pop. Size queries
/// are valid from either side.
template <typename T, size_t BufferSize = 16, typename IndexT = uint32_t>
class SpscRingbuffer {
 public:
  static_assert(BufferSize != 0, "Buffer size cannot be zero.");
  static_assert((BufferSize & (BufferSize - 1)) == 0,
                "Buffer size must be a power of 2.");
  static_assert(std::is_unsigned<IndexT>::value,
                "Index type must be unsigned.");
  static_assert(BufferSize <= ((std::numeric_limits<IndexT>::max)() >> 1),
                "Buffer size is too large for the given indexing type.");

  SpscRingbuffer() noexcept = default;
  SpscRingbuffer(const SpscRingbuffer&) = delete;
  SpscRingbuffer& operator=(const SpscRingbuffer&) = delete;

  // ==== Producer ====

  bool Push(const T& item) noexcept { return PushImpl(item); }
  bool Push(T&& item) noexcept { return PushImpl(std::move(item)); }

  /// Builds the element in place through @p fill only if a slot is free.
  /// @p fill receives a T& and returns void.
  template <typename Fill>
  bool Emplace(Fill&& fill) noexcept {
    const IndexT head = head_.value.load(std::memory_order_relaxed);
    const IndexT tail = tail_.value.load(std::memory_order_acquire);
    if (static_cast<IndexT>(head - tail) == BufferSize) {
      return false;
    }
    fill(slots_[head & kMask]);
    head_.value.store(static_cast<IndexT>(head + 1U),
                      std::memory_order_release);
    return true;
  }

  // ==== Consumer ====

  bool Pop(T& out) noexcept {
    const IndexT tail = tail_.value.load(std::memory_order_relaxed);
    const IndexT head = head_.value.load(std::memory_order_acquire);
    if (tail == head) {
      return false;
    }
    out = std::move(slots_[tail & kMask]);
    tail_.value.store(static_cast<IndexT>(tail + 1U),
                      std::memory_order_release);
    return true;
  }

  /// Drops everything queued so far. Consumer side only.
  void ConsumerClear() noexcept {
    tail_.value.store(head_.value.load(std::memory_order_acquire),
                      std::memory_order_release);
  }

  // ==== Either side ====

  IndexT Size() const noexcept {
    return static_cast<IndexT>(head_.value.load(std::memory_order_acquire) -
                               tail_.value.load(std::memory_order_acquire));
  }
  IndexT Available() const noexcept {
    return static_cast<IndexT>(BufferSize - Size());
  }
  bool IsEmpty() const noexcept { return Size() == 0U; }
  bool IsFull() const noexcept { return Size() == BufferSize; }
  static constexpr size_t Capacity() noexcept { return BufferSize; }

 private:
  template <typename U>
  bool PushImpl(U&& item) noexcept {
    const IndexT head = head_.value.load(std::memory_order_relaxed);
    const IndexT tail = tail_.value.load(std::memory_order_acquire);
    if (static_cast<IndexT>(head - tail) == BufferSize) {
      return false;
    }
    slots_[head & kMask] = std::forward<U>(item);
    head_.value.store(static_cast<IndexT>(head + 1U),
                      std::memory_order_release);
    return true;
  }

  static constexpr IndexT kMask = static_cast<IndexT>(BufferSize - 1U);

  struct alignas(kCacheLineSize) PaddedIndex {
    std::atomic<IndexT> value{0};
  };

  PaddedIndex head_;  // producer
  PaddedIndex tail_;  // consumer
  alignas(kCacheLineSize) std::array<T, BufferSize> slots_{};
};

}  // namespace fluff

#endif  // FLUFF_SPSC_RINGBUFFER_HPP_
