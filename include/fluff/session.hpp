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
 * @file session.hpp
 * @brief Device discovery and the lifecycle of one radio link.
 *
 * Session states:
 *
 *   Idle ──Connect──> Connecting ──link up──> Connected
 *                         │                     │    │
 *                      give up          Disconnect  keepalive / write error
 *                         v                     v    v
 *                       Failed <────────── Disconnected  Failed
 *
 *   Disconnected / Failed ──Connect──> Connecting
 *
 * Connect() and Disconnect() are serialized by one transition lock and
 * return SessionError::kBusy instead of waiting for each other. Link loss
 * detected on a background thread waits for that lock only while the link
 * is still up and nobody else is tearing it down.
 */

#ifndef FLUFF_SESSION_HPP_
#define FLUFF_SESSION_HPP_

#include "fluff/channel_registry.hpp"
#include "fluff/device.hpp"
#include "fluff/log.hpp"
#include "fluff/protocol.hpp"
#include "fluff/state_machine.hpp"
#include "fluff/transport.hpp"
#include "fluff/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#ifndef FLUFF_SESSION_MAX_LISTENERS
#define FLUFF_SESSION_MAX_LISTENERS 8U
#endif

namespace fluff {

// ============================================================================
// Types
// ============================================================================

enum class SessionState : uint8_t {
  kIdle = 0,
  kConnecting,
  kConnected,
  kDisconnected,
  kFailed,
};

static constexpr uint32_t kSessionStateCount = 5U;

inline const char* SessionStateName(SessionState s) noexcept {
  switch (s) {
    case SessionState::kIdle:         return "Idle";
    case SessionState::kConnecting:   return "Connecting";
    case SessionState::kConnected:    return "Connected";
    case SessionState::kDisconnected: return "Disconnected";
    case SessionState::kFailed:       return "Failed";
    default:                          return "?";
  }
}

enum class SessionError : uint8_t {
  kConnectionFailed,  ///< every attempt failed
  kNoDeviceFound,     ///< discovery found no matching device
  kBusy,              ///< another connect/disconnect is in progress
  kInvalidAddress,
  kListenersFull,
  kNotConnected,
};

inline const char* SessionErrorName(SessionError e) noexcept {
  switch (e) {
    case SessionError::kConnectionFailed: return "ConnectionFailed";
    case SessionError::kNoDeviceFound:    return "NoDeviceFound";
    case SessionError::kBusy:             return "Busy";
    case SessionError::kInvalidAddress:   return "InvalidAddress";
    case SessionError::kListenersFull:    return "ListenersFull";
    case SessionError::kNotConnected:     return "NotConnected";
    default:                              return "Unknown";
  }
}

struct ConnectOptions {
  uint32_t timeout_ms = 15000U;     ///< per attempt
  uint32_t retries = 3U;            ///< total attempts, 0 is treated as 1
  uint32_t retry_delay_ms = 1000U;  ///< pause between attempts
};

struct SessionOptions {
  uint32_t keepalive_interval_ms = 3000U;  ///< 0 disables keepalive
  uint32_t scan_timeout_ms = 10000U;
  DeviceName name_filter{"Furby"};
};

using StateListenerFn = void (*)(SessionState from, SessionState to,
                                 void* ctx);

// ============================================================================
// DiscoveryScan
// ============================================================================

/**
 * @brief Lazy, finite, restartable discovery pass.
 *
 * The radio scan starts on the first Next() and stops when the deadline
 * passes or the scan object is destroyed. Each address is yielded at most
 * once per pass. Restart() begins a fresh pass with a fresh deadline.
 */
template <typename Transport>
class DiscoveryScan final {
 public:
  static constexpr uint32_t kMaxDevicesPerPass = 32U;
  static constexpr uint32_t kPollIntervalMs = 100U;

  DiscoveryScan(Transport& transport, const char* name_filter,
                uint32_t timeout_ms) noexcept
      : transport_(transport),
        filter_(TruncateToCapacity, name_filter),
        timeout_ms_(timeout_ms) {}

  ~DiscoveryScan() { StopRadio(); }

  DiscoveryScan(const DiscoveryScan&) = delete;
  DiscoveryScan& operator=(const DiscoveryScan&) = delete;

  /// Blocks until the next new matching device or the end of the pass.
  optional<DeviceIdentity> Next() {
    if (finished_) return optional<DeviceIdentity>();
    if (!scanning_) {
      auto r = transport_.StartScan();
      if (!r.has_value()) {
        FLUFF_LOG_WARN("Session", "scan start failed: %s",
                       TransportErrorName(r.get_error()));
        finished_ = true;
        return optional<DeviceIdentity>();
      }
      scanning_ = true;
      deadline_us_ = SteadyNowUs() + static_cast<uint64_t>(timeout_ms_) * 1000U;
      FLUFF_LOG_DEBUG("Session", "scanning for '%s' (%u ms)", filter_.c_str(),
                      timeout_ms_);
    }

    for (;;) {
      const uint64_t now = SteadyNowUs();
      if (now >= deadline_us_) {
        StopRadio();
        finished_ = true;
        FLUFF_LOG_DEBUG("Session", "scan pass over, %u device(s)", seen_count_);
        return optional<DeviceIdentity>();
      }
      const uint64_t left_ms = (deadline_us_ - now) / 1000U + 1U;
      const uint32_t wait_ms = static_cast<uint32_t>(
          std::min<uint64_t>(left_ms, kPollIntervalMs));

      Advertisement adv;
      if (!transport_.NextAdvertisement(adv, wait_ms)) continue;
      if (!NameMatches(adv.name.c_str(), filter_.c_str())) continue;
      if (AlreadySeen(adv.address)) continue;
      if (seen_count_ == kMaxDevicesPerPass) continue;
      seen_[seen_count_++] = adv.address;
      FLUFF_LOG_INFO("Session", "found %s '%s' rssi %d", adv.address.c_str(),
                     adv.name.c_str(), static_cast<int>(adv.rssi));
      return optional<DeviceIdentity>(DeviceIdentity::FromAdvertisement(adv));
    }
  }

  void Restart() noexcept {
    StopRadio();
    finished_ = false;
    seen_count_ = 0;
  }

  bool Finished() const noexcept { return finished_; }
  uint32_t FoundCount() const noexcept { return seen_count_; }

 private:
  bool AlreadySeen(const DeviceAddress& addr) const noexcept {
    for (uint32_t i = 0; i < seen_count_; ++i) {
      if (seen_[i] == addr) return true;
    }
    return false;
  }

  void StopRadio() noexcept {
    if (scanning_) {
      transport_.StopScan();
      scanning_ = false;
    }
  }

  Transport& transport_;
  DeviceName filter_;
  uint32_t timeout_ms_;
  uint64_t deadline_us_ = 0;
  bool scanning_ = false;
  bool finished_ = false;
  DeviceAddress seen_[kMaxDevicesPerPass];
  uint32_t seen_count_ = 0;
};

// ============================================================================
// Session state machine
// ============================================================================

namespace detail {

enum SessionEvent : uint32_t {
  kEvConnect = 1,
  kEvLinkUp,
  kEvGiveUp,
  kEvDisconnect,
  kEvLinkLost,
};

struct SessionFsmContext {
  StateMachine<SessionFsmContext, SessionState, kSessionStateCount>* sm =
      nullptr;
};

inline TransitionResult SessionIdleHandler(SessionFsmContext& ctx,
                                           const Event& ev) {
  if (ev.id == kEvConnect) {
    return ctx.sm->RequestTransition(SessionState::kConnecting);
  }
  return TransitionResult::kUnhandled;
}

inline TransitionResult SessionConnectingHandler(SessionFsmContext& ctx,
                                                 const Event& ev) {
  switch (ev.id) {
    case kEvLinkUp:
      return ctx.sm->RequestTransition(SessionState::kConnected);
    case kEvGiveUp:
      return ctx.sm->RequestTransition(SessionState::kFailed);
    default:
      return TransitionResult::kUnhandled;
  }
}

inline TransitionResult SessionConnectedHandler(SessionFsmContext& ctx,
                                                const Event& ev) {
  switch (ev.id) {
    case kEvDisconnect:
      return ctx.sm->RequestTransition(SessionState::kDisconnected);
    case kEvLinkLost:
      return ctx.sm->RequestTransition(SessionState::kFailed);
    case kEvConnect:
      return TransitionResult::kHandled;
    default:
      return TransitionResult::kUnhandled;
  }
}

// Shared by Disconnected and Failed: only a new connect leaves them.
inline TransitionResult SessionClosedHandler(SessionFsmContext& ctx,
                                             const Event& ev) {
  if (ev.id == kEvConnect) {
    return ctx.sm->RequestTransition(SessionState::kConnecting);
  }
  if (ev.id == kEvDisconnect) {
    return TransitionResult::kHandled;
  }
  return TransitionResult::kUnhandled;
}

struct InfoFieldRead {
  Endpoint endpoint;
  InfoString DeviceInfo::*field;
  const char* label;
};

static constexpr InfoFieldRead kInfoFields[] = {
    {Endpoint::kManufacturerName, &DeviceInfo::manufacturer, "manufacturer"},
    {Endpoint::kModelNumber, &DeviceInfo::model_number, "model number"},
    {Endpoint::kSerialNumber, &DeviceInfo::serial_number, "serial number"},
    {Endpoint::kHardwareRevision, &DeviceInfo::hardware_revision,
     "hardware revision"},
    {Endpoint::kFirmwareRevision, &DeviceInfo::firmware_revision,
     "firmware revision"},
    {Endpoint::kSoftwareRevision, &DeviceInfo::software_revision,
     "software revision"},
};

}  // namespace detail

// ============================================================================
// SessionManager
// ============================================================================

/**
 * @brief Owns one link to one device and all of its channel bindings.
 *
 * @tparam Transport  Radio transport (see transport.hpp). Must outlive the
 *                    session.
 */
template <typename Transport>
class SessionManager final {
 public:
  using Registry = ChannelRegistry<Transport>;

  explicit SessionManager(Transport& transport,
                          const SessionOptions& options = SessionOptions{})
      : transport_(transport),
        options_(options),
        registry_(transport),
        fsm_(fsm_ctx_) {
    fsm_ctx_.sm = &fsm_;
    fsm_.AddState(SessionState::kIdle,
                  {"Idle", detail::SessionIdleHandler, nullptr, nullptr});
    fsm_.AddState(SessionState::kConnecting,
                  {"Connecting", detail::SessionConnectingHandler, nullptr,
                   nullptr});
    fsm_.AddState(SessionState::kConnected,
                  {"Connected", detail::SessionConnectedHandler, nullptr,
                   nullptr});
    fsm_.AddState(SessionState::kDisconnected,
                  {"Disconnected", detail::SessionClosedHandler, nullptr,
                   nullptr});
    fsm_.AddState(SessionState::kFailed,
                  {"Failed", detail::SessionClosedHandler, nullptr, nullptr});
    fsm_.Start(SessionState::kIdle);

    registry_.SetWriteErrorHook(&SessionManager::OnWriteError, this);
    auto sub = registry_.Subscribe(Channel::kControl,
                                   &SessionManager::OnControlEvent, this);
    if (sub.has_value()) {
      control_sub_ = sub.value();
    } else {
      FLUFF_LOG_WARN("Session", "firmware listener not registered: %s",
                     RegistryErrorName(sub.get_error()));
    }
  }

  ~SessionManager() {
    tearing_down_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(transition_mtx_);
    StopKeepalive();
    registry_.Detach();
    if (state_.load(std::memory_order_acquire) == SessionState::kConnected) {
      transport_.Disconnect();
    }
    registry_.SetWriteErrorHook(nullptr, nullptr);
    if (control_sub_ != kInvalidSubscription) {
      (void)registry_.Unsubscribe(control_sub_);
    }
  }

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // --------------------------------------------------------------------------
  // Discovery
  // --------------------------------------------------------------------------

  DiscoveryScan<Transport> Discover(const char* name_filter,
                                    uint32_t timeout_ms) {
    return DiscoveryScan<Transport>(transport_, name_filter, timeout_ms);
  }

  DiscoveryScan<Transport> Discover() {
    return Discover(options_.name_filter.c_str(), options_.scan_timeout_ms);
  }

  // --------------------------------------------------------------------------
  // Connect / Disconnect
  // --------------------------------------------------------------------------

  /// Discover the first matching device, then connect to it.
  expected<DeviceIdentity, SessionError> Connect(
      const ConnectOptions& opts = ConnectOptions{}) {
    return Connect(DeviceIdentity{}, opts);
  }

  /// Connect by address, bypassing discovery.
  expected<DeviceIdentity, SessionError> ConnectAddress(
      const char* address, const ConnectOptions& opts = ConnectOptions{}) {
    auto id = DeviceIdentity::FromAddress(address);
    if (!id.has_value()) {
      FLUFF_LOG_WARN("Session", "invalid address '%s'",
                     address != nullptr ? address : "(null)");
      return expected<DeviceIdentity, SessionError>::error(
          SessionError::kInvalidAddress);
    }
    return Connect(id.value(), opts);
  }

  /**
   * @brief Establish the link with bounded retries.
   *
   * A target with an address is connected directly; otherwise one discovery
   * pass picks the first match. Up to @c opts.retries independent attempts
   * are made, each releasing its partial link before the next one starts.
   * Returns the identity of the connected device. Already connected is a
   * successful no-op.
   */
  expected<DeviceIdentity, SessionError> Connect(
      const DeviceIdentity& target,
      const ConnectOptions& opts = ConnectOptions{}) {
    using Result = expected<DeviceIdentity, SessionError>;
    std::unique_lock<std::mutex> lock(transition_mtx_, std::try_to_lock);
    if (!lock.owns_lock()) {
      FLUFF_LOG_WARN("Session", "connect rejected: transition in progress");
      return Result::error(SessionError::kBusy);
    }
    if (state_.load(std::memory_order_acquire) == SessionState::kConnected) {
      return Result::success(Identity());
    }
    JoinKeepalive();
    Fire(detail::kEvConnect);

    DeviceIdentity resolved = target;
    if (resolved.HasAddress()) {
      FLUFF_LOG_INFO("Session", "direct connect to %s",
                     resolved.address.c_str());
    } else {
      auto scan = Discover();
      auto found = scan.Next();
      if (!found.has_value()) {
        FLUFF_LOG_ERROR("Session", "no device matching '%s'",
                        options_.name_filter.c_str());
        Fire(detail::kEvGiveUp);
        return Result::error(SessionError::kNoDeviceFound);
      }
      resolved = found.value();
    }

    const uint32_t max_attempts = (opts.retries == 0U) ? 1U : opts.retries;
    bool linked = false;
    for (uint32_t attempt = 1U; attempt <= max_attempts; ++attempt) {
      if (attempt > 1U && opts.retry_delay_ms > 0U) {
        SleepMs(opts.retry_delay_ms);
      }
      last_attempts_.store(attempt, std::memory_order_relaxed);
      if (AttemptConnect(resolved, attempt, max_attempts, opts.timeout_ms)) {
        linked = true;
        break;
      }
    }
    if (!linked) {
      FLUFF_LOG_ERROR("Session", "connect to %s failed after %u attempt(s)",
                      resolved.address.c_str(), max_attempts);
      Fire(detail::kEvGiveUp);
      return Result::error(SessionError::kConnectionFailed);
    }

    resolved.last_seen_us = SteadyNowUs();
    {
      std::lock_guard<std::mutex> id_lock(identity_mtx_);
      if (identity_.address == resolved.address && identity_.has_firmware &&
          !resolved.has_firmware) {
        resolved.SetFirmware(identity_.firmware);
      }
      identity_ = resolved;
    }
    Fire(detail::kEvLinkUp);
    StartKeepalive();
    return Result::success(resolved);
  }

  /// Idempotent. Releases every channel binding.
  expected<void, SessionError> Disconnect() {
    std::unique_lock<std::mutex> lock(transition_mtx_, std::try_to_lock);
    if (!lock.owns_lock()) {
      FLUFF_LOG_WARN("Session", "disconnect rejected: transition in progress");
      return expected<void, SessionError>::error(SessionError::kBusy);
    }
    if (state_.load(std::memory_order_acquire) != SessionState::kConnected) {
      JoinKeepalive();
      return expected<void, SessionError>::success();
    }
    tearing_down_.store(true, std::memory_order_release);
    StopKeepalive();
    registry_.Detach();
    transport_.Disconnect();
    Fire(detail::kEvDisconnect);
    tearing_down_.store(false, std::memory_order_release);
    return expected<void, SessionError>::success();
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  SessionState State() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

  bool IsConnected() const noexcept {
    return State() == SessionState::kConnected;
  }

  DeviceIdentity Identity() const {
    std::lock_guard<std::mutex> lock(identity_mtx_);
    return identity_;
  }

  Registry& Channels() noexcept { return registry_; }

  /**
   * @brief Read the Device Information Service strings.
   *
   * Each field is read on its own; one that fails is logged and left empty.
   */
  expected<DeviceInfo, SessionError> ReadDeviceInfo() {
    if (!IsConnected()) {
      return expected<DeviceInfo, SessionError>::error(
          SessionError::kNotConnected);
    }
    DeviceInfo info;
    uint8_t buf[kInfoFieldMaxLen];
    for (const auto& f : detail::kInfoFields) {
      auto r = transport_.Read(f.endpoint, buf, kInfoFieldMaxLen);
      if (!r.has_value()) {
        FLUFF_LOG_WARN("Session", "could not read %s: %s", f.label,
                       TransportErrorName(r.get_error()));
        continue;
      }
      const uint32_t n =
          (r.value() > kInfoFieldMaxLen) ? kInfoFieldMaxLen : r.value();
      AssignInfoString(info.*(f.field), buf, n);
      ++info.fields_read;
    }
    FLUFF_LOG_DEBUG("Session", "device info: %u/%u fields", info.fields_read,
                    static_cast<uint32_t>(sizeof(detail::kInfoFields) /
                                          sizeof(detail::kInfoFields[0])));
    return expected<DeviceInfo, SessionError>::success(info);
  }

  const SessionOptions& Options() const noexcept { return options_; }

  /// Attempts used by the most recent Connect().
  uint32_t LastAttemptCount() const noexcept {
    return last_attempts_.load(std::memory_order_relaxed);
  }

  uint64_t KeepalivesSent() const noexcept {
    return keepalives_sent_.load(std::memory_order_relaxed);
  }

  // --------------------------------------------------------------------------
  // State listeners
  // --------------------------------------------------------------------------

  /**
   * @brief Register a state-change listener.
   *
   * Listeners run on whichever thread performed the transition, with the
   * transition lock held. They must not call Connect() or Disconnect().
   */
  expected<void, SessionError> AddStateListener(StateListenerFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    for (auto& l : listeners_) {
      if (l.fn == nullptr) {
        l.fn = fn;
        l.ctx = ctx;
        return expected<void, SessionError>::success();
      }
    }
    return expected<void, SessionError>::error(SessionError::kListenersFull);
  }

  bool RemoveStateListener(StateListenerFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    for (auto& l : listeners_) {
      if (l.fn == fn && l.ctx == ctx) {
        l = Listener{};
        return true;
      }
    }
    return false;
  }

  /**
   * @brief Fail the session after an unrecoverable link error.
   *
   * Safe from any thread, including the keepalive thread and registry
   * subscriber callbacks. No-op unless the session is Connected. Concurrent
   * callers do not wait for each other: the first one tears the link down
   * and the rest return.
   */
  void HandleLinkLoss(const char* reason) {
    std::unique_lock<std::mutex> lock(transition_mtx_, std::defer_lock);
    while (!lock.try_lock()) {
      if (tearing_down_.load(std::memory_order_acquire) ||
          State() != SessionState::kConnected) {
        return;
      }
      SleepMs(1U);
    }
    if (State() != SessionState::kConnected) return;

    // The keepalive thread may itself be failing a write and waiting above.
    tearing_down_.store(true, std::memory_order_release);
    FLUFF_LOG_ERROR("Session", "link lost: %s", reason);
    RequestKeepaliveStop();
    JoinKeepalive();
    registry_.Detach();
    transport_.Disconnect();
    Fire(detail::kEvLinkLost);
    tearing_down_.store(false, std::memory_order_release);
  }

 private:
  struct Listener {
    StateListenerFn fn = nullptr;
    void* ctx = nullptr;
  };

  bool AttemptConnect(const DeviceIdentity& target, uint32_t attempt,
                      uint32_t max_attempts, uint32_t timeout_ms) {
    FLUFF_LOG_INFO("Session", "connecting to %s, attempt %u/%u (%u ms)",
                   target.address.c_str(), attempt, max_attempts, timeout_ms);
    auto linked = transport_.Connect(target.address.c_str(), timeout_ms);
    if (!linked.has_value()) {
      FLUFF_LOG_WARN("Session", "attempt %u failed: %s", attempt,
                     TransportErrorName(linked.get_error()));
      transport_.Disconnect();
      return false;
    }

    auto release = MakeScopeGuard([this]() {
      registry_.Detach();
      transport_.Disconnect();
    });
    auto attached = registry_.Attach();
    if (!attached.has_value()) {
      FLUFF_LOG_WARN("Session", "attempt %u: channel setup failed: %s",
                     attempt, TransportErrorName(attached.get_error()));
      return false;
    }
    release.Release();
    return true;
  }

  // Caller holds transition_mtx_.
  bool Fire(uint32_t event_id) {
    const SessionState from = fsm_.Current();
    if (fsm_.Dispatch(Event{event_id, nullptr}) !=
        TransitionResult::kTransition) {
      return false;
    }
    const SessionState to = fsm_.Current();
    state_.store(to, std::memory_order_release);
    FLUFF_LOG_INFO("Session", "%s -> %s", SessionStateName(from),
                   SessionStateName(to));
    NotifyListeners(from, to);
    return true;
  }

  void NotifyListeners(SessionState from, SessionState to) {
    Listener snapshot[FLUFF_SESSION_MAX_LISTENERS];
    {
      std::lock_guard<std::mutex> lock(listeners_mtx_);
      for (uint32_t i = 0; i < FLUFF_SESSION_MAX_LISTENERS; ++i) {
        snapshot[i] = listeners_[i];
      }
    }
    for (const auto& l : snapshot) {
      if (l.fn != nullptr) l.fn(from, to, l.ctx);
    }
  }

  // --- keepalive ---

  void StartKeepalive() {
    if (options_.keepalive_interval_ms == 0U) return;
    {
      std::lock_guard<std::mutex> lock(ka_mtx_);
      ka_stop_ = false;
    }
    keepalive_ = std::thread([this]() { KeepaliveLoop(); });
  }

  void RequestKeepaliveStop() {
    {
      std::lock_guard<std::mutex> lock(ka_mtx_);
      ka_stop_ = true;
    }
    ka_cv_.notify_all();
  }

  void JoinKeepalive() {
    if (keepalive_.joinable() &&
        keepalive_.get_id() != std::this_thread::get_id()) {
      keepalive_.join();
    }
  }

  void StopKeepalive() {
    RequestKeepaliveStop();
    JoinKeepalive();
  }

  void KeepaliveLoop() {
    const auto interval =
        std::chrono::milliseconds(options_.keepalive_interval_ms);
    std::unique_lock<std::mutex> lock(ka_mtx_);
    while (!ka_stop_) {
      if (ka_cv_.wait_for(lock, interval, [this]() { return ka_stop_; })) {
        break;
      }
      lock.unlock();
      // A write failure reaches HandleLinkLoss() through the write hook.
      auto r = registry_.Issue(Command(KeepAlive{}));
      lock.lock();
      if (!r.has_value()) {
        FLUFF_LOG_WARN("Session", "keepalive failed: %s",
                       RegistryErrorName(r.get_error()));
        break;
      }
      keepalives_sent_.fetch_add(1U, std::memory_order_relaxed);
    }
  }

  // --- registry callbacks ---

  // A failed upload chunk aborts only its job. The session fails on bulk
  // writes only when the transport reports the link itself gone.
  static void OnWriteError(Channel ch, TransportError err, void* ctx) {
    if (ch == Channel::kBulk && err != TransportError::kNotConnected) {
      FLUFF_LOG_WARN("Session", "bulk write failed (%s), link kept",
                     TransportErrorName(err));
      return;
    }
    auto* self = static_cast<SessionManager*>(ctx);
    char reason[64];
    (void)std::snprintf(reason, sizeof(reason), "write on %s: %s",
                        ChannelName(ch), TransportErrorName(err));
    self->HandleLinkLoss(reason);
  }

  static void OnControlEvent(const NotificationEvent& ev, void* ctx) {
    if (ev.type != EventType::kFirmwareVersion) return;
    auto* self = static_cast<SessionManager*>(ctx);
    char version[24];
    {
      std::lock_guard<std::mutex> lock(self->identity_mtx_);
      self->identity_.SetFirmware(ev.payload.data());
      self->identity_.FormatFirmware(version, sizeof(version));
    }
    FLUFF_LOG_INFO("Session", "firmware %s", version);
  }

  Transport& transport_;
  SessionOptions options_;
  Registry registry_;

  detail::SessionFsmContext fsm_ctx_;
  StateMachine<detail::SessionFsmContext, SessionState, kSessionStateCount>
      fsm_;
  std::mutex transition_mtx_;
  std::atomic<SessionState> state_{SessionState::kIdle};
  std::atomic<bool> tearing_down_{false};
  std::atomic<uint32_t> last_attempts_{0};

  mutable std::mutex identity_mtx_;
  DeviceIdentity identity_;

  std::mutex listeners_mtx_;
  Listener listeners_[FLUFF_SESSION_MAX_LISTENERS];

  std::thread keepalive_;
  std::mutex ka_mtx_;
  std::condition_variable ka_cv_;
  bool ka_stop_ = false;
  std::atomic<uint64_t> keepalives_sent_{0};

  SubscriptionId control_sub_ = kInvalidSubscription;
};

}  // namespace fluff

#endif  // FLUFF_SESSION_HPP_
