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
 * @file channel_registry.hpp
 * @brief Logical channel to endpoint binding with multi-consumer fan-out.
 *
 * Inbound path:
 *
 *   radio ctx --copy--> FrameQueue[ch] --dispatcher--> DecodeEvent --> subs
 *
 * The radio callback only copies bytes into the per-channel SPSC queue.
 * Producers on one channel are serialized by a per-channel lock, so a radio
 * stack may deliver from several threads. A frame longer than kMaxFrameSize
 * is forwarded truncated, as a raw event with decode_error set. One
 * dispatcher thread per attached link decodes and delivers to every matching
 * subscriber. Subscriptions outlive Detach()/Attach() cycles.
 *
 * Outbound writes go straight to the transport from the caller's thread.
 * A failed write fires the write-error hook, which the session uses to fail
 * the link.
 */

#ifndef FLUFF_CHANNEL_REGISTRY_HPP_
#define FLUFF_CHANNEL_REGISTRY_HPP_

#include "fluff/log.hpp"
#include "fluff/platform.hpp"
#include "fluff/protocol.hpp"
#include "fluff/spsc_ringbuffer.hpp"
#include "fluff/transport.hpp"
#include "fluff/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#ifndef FLUFF_REGISTRY_MAX_SUBSCRIBERS
#define FLUFF_REGISTRY_MAX_SUBSCRIBERS 16U
#endif

#ifndef FLUFF_REGISTRY_QUEUE_DEPTH
#define FLUFF_REGISTRY_QUEUE_DEPTH 64U
#endif

namespace fluff {

enum class RegistryError : uint8_t {
  kNotConnected,
  kNotWritable,
  kWriteFailed,
  kSubscribersFull,
  kInvalidArgument,
};

inline const char* RegistryErrorName(RegistryError e) noexcept {
  switch (e) {
    case RegistryError::kNotConnected:    return "NotConnected";
    case RegistryError::kNotWritable:     return "NotWritable";
    case RegistryError::kWriteFailed:     return "WriteFailed";
    case RegistryError::kSubscribersFull: return "SubscribersFull";
    case RegistryError::kInvalidArgument: return "InvalidArgument";
    default:                              return "Unknown";
  }
}

using SubscriptionId = uint32_t;
static constexpr SubscriptionId kInvalidSubscription = 0U;

/// Event consumer. Runs on the dispatcher thread.
using EventFn = void (*)(const NotificationEvent& event, void* ctx);

/// Invoked from the writing thread after a transport write failed.
using WriteErrorFn = void (*)(Channel ch, TransportError err, void* ctx);

/**
 * @brief Per-link channel registry.
 *
 * @tparam Transport  Radio transport (see transport.hpp).
 * @tparam MaxSubscribers  Subscriber table capacity.
 * @tparam QueueDepth  Per-channel notification queue depth (power of 2).
 */
template <typename Transport,
          uint32_t MaxSubscribers = FLUFF_REGISTRY_MAX_SUBSCRIBERS,
          uint32_t QueueDepth = FLUFF_REGISTRY_QUEUE_DEPTH>
class ChannelRegistry final {
 public:
  explicit ChannelRegistry(Transport& transport) noexcept
      : transport_(transport) {
    for (uint32_t i = 0; i < kChannelCount; ++i) {
      routes_[i].self = this;
      routes_[i].channel = static_cast<Channel>(i);
    }
  }

  ~ChannelRegistry() {
    Detach();
    JoinDispatcher();
  }

  ChannelRegistry(const ChannelRegistry&) = delete;
  ChannelRegistry& operator=(const ChannelRegistry&) = delete;

  // --------------------------------------------------------------------------
  // Link binding
  // --------------------------------------------------------------------------

  /**
   * @brief Subscribe to every notify endpoint and start the dispatcher.
   *
   * On failure all endpoints subscribed so far are released again.
   */
  TransportResult Attach() {
    if (attached_.load(std::memory_order_acquire)) {
      return TransportResult::success();
    }
    if (dispatcher_.joinable() && OnDispatcherThread()) {
      FLUFF_LOG_ERROR("Registry", "Attach() called from a subscriber callback");
      return TransportResult::error(TransportError::kRejected);
    }
    JoinDispatcher();
    for (auto& q : queues_) q.ConsumerClear();

    uint32_t bound = 0;
    for (uint32_t i = 0; i < kChannelCount; ++i) {
      const ChannelBinding& b = kChannelBindings[i];
      if (!b.notifies) continue;
      auto r = transport_.Subscribe(b.notify_endpoint, &ChannelRegistry::OnNotify,
                                    &routes_[i]);
      if (!r.has_value()) {
        FLUFF_LOG_WARN("Registry", "subscribe %s failed: %s",
                       ChannelName(b.channel), TransportErrorName(r.get_error()));
        UnsubscribeEndpoints(i);
        return r;
      }
      ++bound;
    }

    running_.store(true, std::memory_order_release);
    dispatcher_ = std::thread([this]() { DispatchLoop(); });
    attached_.store(true, std::memory_order_release);
    FLUFF_LOG_DEBUG("Registry", "attached %u notify endpoints", bound);
    return TransportResult::success();
  }

  /// Release every endpoint and stop the dispatcher. Idempotent.
  void Detach() {
    if (!attached_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    UnsubscribeEndpoints(kChannelCount);
    {
      std::lock_guard<std::mutex> lock(wake_mtx_);
      running_.store(false, std::memory_order_release);
    }
    wake_cv_.notify_all();
    // A subscriber may tear the link down from inside a callback; the
    // dispatcher then exits on its own and is joined on the next Attach().
    if (dispatcher_.joinable() &&
        dispatcher_.get_id() != std::this_thread::get_id()) {
      dispatcher_.join();
    }
    FLUFF_LOG_DEBUG("Registry", "detached");
  }

  bool IsAttached() const noexcept {
    return attached_.load(std::memory_order_acquire);
  }

  // --------------------------------------------------------------------------
  // Outbound
  // --------------------------------------------------------------------------

  /// Write @p data verbatim to the channel's write endpoint.
  expected<void, RegistryError> Publish(Channel ch, const uint8_t* data,
                                        uint32_t len) {
    if (data == nullptr || len == 0U) {
      return expected<void, RegistryError>::error(
          RegistryError::kInvalidArgument);
    }
    if (!attached_.load(std::memory_order_acquire)) {
      return expected<void, RegistryError>::error(RegistryError::kNotConnected);
    }
    const ChannelBinding& b = BindingFor(ch);
    if (!b.writable) {
      return expected<void, RegistryError>::error(RegistryError::kNotWritable);
    }
    auto r = transport_.Write(b.write_endpoint, data, len);
    if (!r.has_value()) {
      write_failures_.fetch_add(1U, std::memory_order_relaxed);
      FLUFF_LOG_ERROR("Registry", "write on %s failed: %s", ChannelName(ch),
                      TransportErrorName(r.get_error()));
      WriteErrorFn hook = nullptr;
      void* hook_ctx = nullptr;
      {
        std::lock_guard<std::mutex> lock(subs_mtx_);
        hook = write_error_fn_;
        hook_ctx = write_error_ctx_;
      }
      if (hook != nullptr) hook(ch, r.get_error(), hook_ctx);
      return expected<void, RegistryError>::error(
          r.get_error() == TransportError::kNotConnected
              ? RegistryError::kNotConnected
              : RegistryError::kWriteFailed);
    }
    return expected<void, RegistryError>::success();
  }

  expected<void, RegistryError> Publish(Channel ch, const Frame& frame) {
    return Publish(ch, frame.data(), frame.size());
  }

  /// Encode @p cmd and write it to its channel.
  expected<void, RegistryError> Issue(const Command& cmd) {
    const Frame frame = EncodeCommand(cmd);
    FLUFF_LOG_DEBUG("Registry", "issue %s (%u bytes) on %s", CommandName(cmd),
                    frame.size(), ChannelName(CommandChannel(cmd)));
    return Publish(CommandChannel(cmd), frame);
  }

  void SetWriteErrorHook(WriteErrorFn fn, void* ctx) noexcept {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    write_error_fn_ = fn;
    write_error_ctx_ = ctx;
  }

  // --------------------------------------------------------------------------
  // Subscriptions
  // --------------------------------------------------------------------------

  expected<SubscriptionId, RegistryError> Subscribe(Channel ch, EventFn fn,
                                                    void* ctx) {
    return AddSubscriber(true, ch, fn, ctx);
  }

  /// Receives events from every channel.
  expected<SubscriptionId, RegistryError> SubscribeAll(EventFn fn, void* ctx) {
    return AddSubscriber(false, Channel::kBehavior, fn, ctx);
  }

  /**
   * @brief Remove a subscription.
   *
   * When called from a thread other than the dispatcher, returns only after
   * any in-flight delivery to this subscriber has finished.
   * @return false if @p id was not registered.
   */
  bool Unsubscribe(SubscriptionId id) {
    bool found = false;
    {
      std::lock_guard<std::mutex> lock(subs_mtx_);
      for (auto& s : subs_) {
        if (s.id == id && s.fn != nullptr) {
          s = Subscriber{};
          --sub_count_;
          found = true;
          break;
        }
      }
    }
    if (found && !OnDispatcherThread()) {
      std::lock_guard<std::mutex> barrier(deliver_mtx_);
    }
    return found;
  }

  uint32_t SubscriberCount() const {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    return sub_count_;
  }

  // --------------------------------------------------------------------------
  // Statistics
  // --------------------------------------------------------------------------

  uint64_t DroppedCount() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
  }
  uint64_t DeliveredCount() const noexcept {
    return delivered_.load(std::memory_order_relaxed);
  }
  uint64_t DecodeErrorCount() const noexcept {
    return decode_errors_.load(std::memory_order_relaxed);
  }
  uint64_t TruncatedCount() const noexcept {
    return truncated_.load(std::memory_order_relaxed);
  }
  uint64_t WriteFailureCount() const noexcept {
    return write_failures_.load(std::memory_order_relaxed);
  }

 private:
  struct Route {
    ChannelRegistry* self = nullptr;
    Channel channel = Channel::kBehavior;
  };

  struct Inbound {
    Frame frame;
    bool truncated = false;
  };

  struct Subscriber {
    SubscriptionId id = kInvalidSubscription;
    bool filtered = false;
    Channel channel = Channel::kBehavior;
    EventFn fn = nullptr;
    void* ctx = nullptr;
  };

  // --- radio context ---

  static void OnNotify(const uint8_t* data, uint32_t len, void* ctx) {
    auto* route = static_cast<Route*>(ctx);
    route->self->Enqueue(route->channel, data, len);
  }

  void Enqueue(Channel ch, const uint8_t* data, uint32_t len) {
    if (!running_.load(std::memory_order_acquire)) return;
    if (FLUFF_UNLIKELY(len > kMaxFrameSize)) {
      truncated_.fetch_add(1U, std::memory_order_relaxed);
      FLUFF_LOG_WARN("Registry", "%u-byte frame on %s truncated to %u", len,
                     ChannelName(ch), kMaxFrameSize);
    }
    const uint32_t idx = static_cast<uint32_t>(ch);
    bool pushed = false;
    {
      std::lock_guard<std::mutex> lock(produce_mtx_[idx]);
      pushed = queues_[idx].Emplace([data, len](Inbound& slot) {
        slot.truncated = !slot.frame.Assign(data, len);
      });
    }
    if (FLUFF_UNLIKELY(!pushed)) {
      dropped_.fetch_add(1U, std::memory_order_relaxed);
      FLUFF_LOG_WARN("Registry", "%s queue full, frame dropped",
                     ChannelName(ch));
      return;
    }
    {
      std::lock_guard<std::mutex> lock(wake_mtx_);
    }
    wake_cv_.notify_one();
  }

  // --- dispatcher thread ---

  void DispatchLoop() {
    while (running_.load(std::memory_order_acquire)) {
      {
        std::unique_lock<std::mutex> lock(wake_mtx_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(100), [this]() {
          return !running_.load(std::memory_order_acquire) || HasPending();
        });
      }
      DrainQueues();
    }
  }

  bool HasPending() const noexcept {
    for (const auto& q : queues_) {
      if (!q.IsEmpty()) return true;
    }
    return false;
  }

  void DrainQueues() {
    Inbound in;
    for (uint32_t i = 0; i < kChannelCount; ++i) {
      const Channel ch = static_cast<Channel>(i);
      while (running_.load(std::memory_order_acquire) &&
             queues_[i].Pop(in)) {
        const Frame& frame = in.frame;
        if (in.truncated) {
          decode_errors_.fetch_add(1U, std::memory_order_relaxed);
          Deliver(MakeRawEvent(ch, frame.data(), frame.size(), true));
          continue;
        }
        auto decoded = DecodeEvent(ch, frame);
        if (FLUFF_LIKELY(decoded.has_value())) {
          Deliver(decoded.value());
        } else {
          decode_errors_.fetch_add(1U, std::memory_order_relaxed);
          FLUFF_LOG_WARN("Registry", "decode on %s (tag 0x%02x, %u bytes): %s",
                         ChannelName(ch),
                         frame.empty() ? 0U : static_cast<unsigned>(frame.bytes[0]),
                         frame.size(), CodecErrorName(decoded.get_error()));
          Deliver(MakeRawEvent(ch, frame.data(), frame.size(), true));
        }
      }
    }
  }

  void Deliver(const NotificationEvent& ev) {
    Subscriber snapshot[MaxSubscribers];
    uint32_t n = 0;
    std::lock_guard<std::mutex> deliver_lock(deliver_mtx_);
    {
      std::lock_guard<std::mutex> lock(subs_mtx_);
      for (const auto& s : subs_) {
        if (s.fn == nullptr) continue;
        if (s.filtered && s.channel != ev.channel) continue;
        snapshot[n++] = s;
      }
    }
    for (uint32_t i = 0; i < n; ++i) {
      snapshot[i].fn(ev, snapshot[i].ctx);
    }
    delivered_.fetch_add(1U, std::memory_order_relaxed);
  }

  // --- helpers ---

  expected<SubscriptionId, RegistryError> AddSubscriber(bool filtered,
                                                        Channel ch, EventFn fn,
                                                        void* ctx) {
    if (fn == nullptr) {
      return expected<SubscriptionId, RegistryError>::error(
          RegistryError::kInvalidArgument);
    }
    std::lock_guard<std::mutex> lock(subs_mtx_);
    for (auto& s : subs_) {
      if (s.fn != nullptr) continue;
      s.id = next_id_++;
      if (next_id_ == kInvalidSubscription) next_id_ = 1U;
      s.filtered = filtered;
      s.channel = ch;
      s.fn = fn;
      s.ctx = ctx;
      ++sub_count_;
      return expected<SubscriptionId, RegistryError>::success(s.id);
    }
    FLUFF_LOG_WARN("Registry", "subscriber table full (%u)", MaxSubscribers);
    return expected<SubscriptionId, RegistryError>::error(
        RegistryError::kSubscribersFull);
  }

  // Releases the notify endpoints of channels [0, upto).
  void UnsubscribeEndpoints(uint32_t upto) {
    for (uint32_t i = 0; i < upto; ++i) {
      const ChannelBinding& b = kChannelBindings[i];
      if (b.notifies) transport_.Unsubscribe(b.notify_endpoint);
    }
  }

  void JoinDispatcher() {
    if (dispatcher_.joinable() && !OnDispatcherThread()) {
      dispatcher_.join();
    }
  }

  bool OnDispatcherThread() const noexcept {
    return dispatcher_.get_id() == std::this_thread::get_id();
  }

  Transport& transport_;
  Route routes_[kChannelCount];
  SpscRingbuffer<Inbound, QueueDepth> queues_[kChannelCount];
  std::mutex produce_mtx_[kChannelCount];

  std::atomic<bool> attached_{false};
  std::atomic<bool> running_{false};
  std::thread dispatcher_;
  std::mutex wake_mtx_;
  std::condition_variable wake_cv_;

  mutable std::mutex subs_mtx_;
  std::mutex deliver_mtx_;
  Subscriber subs_[MaxSubscribers];
  uint32_t sub_count_ = 0;
  SubscriptionId next_id_ = 1U;
  WriteErrorFn write_error_fn_ = nullptr;
  void* write_error_ctx_ = nullptr;

  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> decode_errors_{0};
  std::atomic<uint64_t> truncated_{0};
  std::atomic<uint64_t> write_failures_{0};
};

}  // namespace fluff

#endif  // FLUFF_CHANNEL_REGISTRY_HPP_
