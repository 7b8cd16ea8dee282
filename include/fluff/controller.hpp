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
 * @file controller.hpp
 * @brief Caller-facing facade over one device: link, commands, uploads.
 *
 * @code
 *   BluezTransport radio;
 *   fluff::Controller<BluezTransport> furby(radio);
 *   if (furby.ConnectAddress("AA:BB:CC:DD:EE:FF").has_value()) {
 *     furby.SetIndicatorColor(255, 0, 0);
 *     furby.TriggerBehavior(55, 2, 14, 0);
 *   }
 * @endcode
 */

#ifndef FLUFF_CONTROLLER_HPP_
#define FLUFF_CONTROLLER_HPP_

#include "fluff/channel_registry.hpp"
#include "fluff/device.hpp"
#include "fluff/log.hpp"
#include "fluff/protocol.hpp"
#include "fluff/session.hpp"
#include "fluff/upload.hpp"
#include "fluff/vocabulary.hpp"

#include <cstdint>

namespace fluff {

enum class ControlError : uint8_t {
  kInvalidCommand,  ///< argument rejected before any I/O
  kNotConnected,
  kNotWritable,
  kWriteFailed,
};

inline const char* ControlErrorName(ControlError e) noexcept {
  switch (e) {
    case ControlError::kInvalidCommand: return "InvalidCommand";
    case ControlError::kNotConnected:   return "NotConnected";
    case ControlError::kNotWritable:    return "NotWritable";
    case ControlError::kWriteFailed:    return "WriteFailed";
    default:                            return "Unknown";
  }
}

using ControlResult = expected<void, ControlError>;

/// Behavior input that makes the device speak its configured name.
static constexpr uint8_t kSpeakNameInput = 0x21U;

template <typename Transport>
class Controller final {
 public:
  using Session = SessionManager<Transport>;
  using Uploader = UploadController<Transport>;

  explicit Controller(Transport& transport,
                      const SessionOptions& options = SessionOptions{})
      : session_(transport, options), uploads_(session_) {}

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  // --------------------------------------------------------------------------
  // Link
  // --------------------------------------------------------------------------

  expected<DeviceIdentity, SessionError> Connect(
      const ConnectOptions& opts = ConnectOptions{}) {
    return session_.Connect(opts);
  }

  expected<DeviceIdentity, SessionError> ConnectAddress(
      const char* address, const ConnectOptions& opts = ConnectOptions{}) {
    return session_.ConnectAddress(address, opts);
  }

  expected<DeviceIdentity, SessionError> Connect(
      const DeviceIdentity& target,
      const ConnectOptions& opts = ConnectOptions{}) {
    return session_.Connect(target, opts);
  }

  expected<void, SessionError> Disconnect() { return session_.Disconnect(); }

  DiscoveryScan<Transport> Discover() { return session_.Discover(); }
  DiscoveryScan<Transport> Discover(const char* name_filter,
                                    uint32_t timeout_ms) {
    return session_.Discover(name_filter, timeout_ms);
  }

  bool IsConnected() const noexcept { return session_.IsConnected(); }
  SessionState State() const noexcept { return session_.State(); }
  DeviceIdentity Identity() const { return session_.Identity(); }

  expected<DeviceInfo, SessionError> ReadDeviceInfo() {
    return session_.ReadDeviceInfo();
  }

  // --------------------------------------------------------------------------
  // Commands
  // --------------------------------------------------------------------------

  ControlResult Issue(const Command& cmd) {
    auto r = session_.Channels().Issue(cmd);
    if (r.has_value()) return ControlResult::success();
    FLUFF_LOG_WARN("Session", "%s not sent: %s", CommandName(cmd),
                   RegistryErrorName(r.get_error()));
    return ControlResult::error(MapRegistryError(r.get_error()));
  }

  ControlResult Issue(const CommandResult& cmd) {
    if (!cmd.has_value()) {
      FLUFF_LOG_WARN("Codec", "command rejected: %s",
                     CommandErrorName(cmd.get_error()));
      return ControlResult::error(ControlError::kInvalidCommand);
    }
    return Issue(cmd.value());
  }

  ControlResult SetIndicatorColor(int32_t r, int32_t g, int32_t b) {
    return Issue(MakeSetIndicatorColor(r, g, b));
  }

  ControlResult TriggerBehavior(int32_t input, int32_t index,
                                int32_t subindex, int32_t specific) {
    return Issue(MakeTriggerBehavior(input, index, subindex, specific));
  }

  /// @p absolute sets the meter, otherwise @p value is added to it.
  ControlResult SetMood(MoodType type, int32_t value, bool absolute = true) {
    const MoodAction action = absolute ? MoodAction::kSet : MoodAction::kAdd;
    return Issue(MakeSetInternalValue(static_cast<int32_t>(action),
                                      static_cast<int32_t>(type), value));
  }

  /// Sets the name and has the device say it.
  ControlResult SetName(int32_t id) {
    auto r = Issue(MakeSetName(id));
    if (!r.has_value()) return r;
    return TriggerBehavior(kSpeakNameInput, 0, 0, id);
  }

  ControlResult SetLcdBacklight(bool on) {
    return Issue(MakeSetLcdBacklight(on));
  }

  ControlResult CycleDebugMenu() { return Issue(MakeCycleDebugMenu()); }

  // --------------------------------------------------------------------------
  // Notifications
  // --------------------------------------------------------------------------

  expected<SubscriptionId, RegistryError> Subscribe(Channel ch, EventFn fn,
                                                    void* ctx) {
    return session_.Channels().Subscribe(ch, fn, ctx);
  }

  expected<SubscriptionId, RegistryError> SubscribeAll(EventFn fn, void* ctx) {
    return session_.Channels().SubscribeAll(fn, ctx);
  }

  bool Unsubscribe(SubscriptionId id) {
    return session_.Channels().Unsubscribe(id);
  }

  expected<void, SessionError> AddStateListener(StateListenerFn fn,
                                                void* ctx) {
    return session_.AddStateListener(fn, ctx);
  }

  bool RemoveStateListener(StateListenerFn fn, void* ctx) {
    return session_.RemoveStateListener(fn, ctx);
  }

  // --------------------------------------------------------------------------
  // Uploads and slots
  // --------------------------------------------------------------------------

  expected<JobId, UploadError> StartUpload(
      uint8_t slot, const uint8_t* data, uint32_t size,
      const UploadOptions& options = UploadOptions{}) {
    return uploads_.StartUpload(slot, data, size, options);
  }

  expected<void, UploadError> CancelUpload(JobId id) {
    return uploads_.CancelUpload(id);
  }

  optional<UploadJob> GetJob(JobId id) const { return uploads_.GetJob(id); }

  optional<UploadJob> WaitForJob(JobId id, uint32_t timeout_ms) const {
    return uploads_.WaitForJob(id, timeout_ms);
  }

  expected<void, UploadError> LoadAndActivate(uint8_t slot) {
    return uploads_.LoadAndActivate(slot);
  }

  expected<void, UploadError> Deactivate(uint8_t slot) {
    return uploads_.Deactivate(slot);
  }

  expected<void, UploadError> Delete(uint8_t slot) {
    return uploads_.Delete(slot);
  }

  expected<void, UploadError> QuerySlot(uint8_t slot) {
    return uploads_.QuerySlot(slot);
  }

  Session& GetSession() noexcept { return session_; }
  Uploader& Uploads() noexcept { return uploads_; }

 private:
  static ControlError MapRegistryError(RegistryError e) noexcept {
    switch (e) {
      case RegistryError::kNotConnected: return ControlError::kNotConnected;
      case RegistryError::kNotWritable:  return ControlError::kNotWritable;
      default:                           return ControlError::kWriteFailed;
    }
  }

  Session session_;
  Uploader uploads_;
};

}  // namespace fluff

#endif  // FLUFF_CONTROLLER_HPP_
