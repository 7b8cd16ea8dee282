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
 * @file protocol.hpp
 * @brief Tag-prefixed command and notification codec.
 *
 * Control-channel frames are variable length with byte 0 as the tag:
 *
 *   +-----+-------------------+
 *   | tag | payload (0..N-1)  |
 *   +-----+-------------------+
 *
 * The bulk channel carries raw upload chunks with no framing and the signal
 * channel carries raw strength samples; neither is decoded here.
 *
 * Everything in this header is pure: no I/O, no threads, no allocation.
 */

#ifndef FLUFF_PROTOCOL_HPP_
#define FLUFF_PROTOCOL_HPP_

#include "fluff/platform.hpp"
#include "fluff/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <variant>

namespace fluff {

// ============================================================================
// Constants
// ============================================================================

/// Largest control frame handled by the codec and the notification queues.
static constexpr uint32_t kMaxFrameSize = 32U;

/// Bulk-channel chunk size (default ATT payload).
static constexpr uint32_t kChunkSize = 20U;

/// AnnounceUpload carries the size as a 24-bit big-endian integer.
static constexpr uint32_t kMaxUploadSize = 0xFFFFFFU;

/// Upload name field width in the announce frame.
static constexpr uint32_t kUploadNameSize = 12U;

/// Highest name id accepted by SetName.
static constexpr uint8_t kMaxNameId = 128U;

namespace tag {

// Outbound.
static constexpr uint8_t kKeepAlive = 0x00U;
static constexpr uint8_t kEnableTransferAck = 0x09U;
static constexpr uint8_t kTriggerBehavior = 0x13U;
static constexpr uint8_t kSetIndicatorColor = 0x14U;
static constexpr uint8_t kSetName = 0x21U;
static constexpr uint8_t kSetInternalValue = 0x24U;
static constexpr uint8_t kAnnounceUpload = 0x50U;
static constexpr uint8_t kLoadSlot = 0x60U;
static constexpr uint8_t kActivateSlot = 0x61U;
static constexpr uint8_t kDeactivateSlot = 0x62U;
static constexpr uint8_t kQuerySlotInfo = 0x73U;
static constexpr uint8_t kDeleteSlot = 0x74U;
static constexpr uint8_t kLcdBacklight = 0xCDU;
static constexpr uint8_t kDebugMenu = 0xDBU;

// Inbound.
static constexpr uint8_t kFirmwareVersion = 0x01U;
static constexpr uint8_t kTransferAck = 0x09U;
static constexpr uint8_t kTransferOverload = 0x0AU;
static constexpr uint8_t kGenericAck = 0x20U;
static constexpr uint8_t kTransferStatus = 0x24U;
static constexpr uint8_t kSlotInfo = 0x73U;

}  // namespace tag

// ============================================================================
// Channel
// ============================================================================

enum class Channel : uint8_t {
  kBehavior = 0,  ///< behavior commands, device status
  kControl = 1,   ///< transfer-ack control, firmware
  kBulk = 2,      ///< raw upload chunks, write only
  kSignal = 3,    ///< signal strength, notify only
};

static constexpr uint32_t kChannelCount = 4U;

inline const char* ChannelName(Channel ch) noexcept {
  switch (ch) {
    case Channel::kBehavior: return "behavior";
    case Channel::kControl:  return "control";
    case Channel::kBulk:     return "bulk";
    case Channel::kSignal:   return "signal";
    default:                 return "?";
  }
}

// ============================================================================
// Errors
// ============================================================================

/// Rejected at command construction, before any I/O.
enum class CommandError : uint8_t {
  kOutOfRange,    ///< numeric field outside its documented range
  kInvalidName,   ///< upload name too long or not printable ASCII
  kSizeTooLarge,  ///< upload size does not fit 24 bits
  kUnknownTag,    ///< DecodeCommand: tag is not a known command
  kMalformed,     ///< DecodeCommand: wrong length or fixed byte mismatch
};

enum class CodecError : uint8_t {
  kEmptyFrame,
  kPayloadTooShort,
  kInvalidValue,
};

inline const char* CommandErrorName(CommandError e) noexcept {
  switch (e) {
    case CommandError::kOutOfRange:   return "OutOfRange";
    case CommandError::kInvalidName:  return "InvalidName";
    case CommandError::kSizeTooLarge: return "SizeTooLarge";
    case CommandError::kUnknownTag:   return "UnknownTag";
    case CommandError::kMalformed:    return "Malformed";
    default:                          return "Unknown";
  }
}

inline const char* CodecErrorName(CodecError e) noexcept {
  switch (e) {
    case CodecError::kEmptyFrame:      return "EmptyFrame";
    case CodecError::kPayloadTooShort: return "PayloadTooShort";
    case CodecError::kInvalidValue:    return "InvalidValue";
    default:                           return "Unknown";
  }
}

// ============================================================================
// Frame
// ============================================================================

/**
 * @brief Fixed-capacity byte frame.
 *
 * Used for encoded commands, decoded payloads and the notification queues.
 */
struct Frame {
  uint8_t bytes[kMaxFrameSize];
  uint8_t len;

  Frame() noexcept : bytes{}, len(0) {}

  /// Copies at most kMaxFrameSize bytes. Returns false if @p n was larger.
  bool Assign(const uint8_t* src, uint32_t n) noexcept {
    const bool fits = (n <= kMaxFrameSize);
    len = static_cast<uint8_t>(fits ? n : kMaxFrameSize);
    if (len > 0U) std::memcpy(bytes, src, len);
    return fits;
  }

  void PushBack(uint8_t b) noexcept {
    FLUFF_ASSERT(len < kMaxFrameSize);
    bytes[len++] = b;
  }

  const uint8_t* data() const noexcept { return bytes; }
  uint32_t size() const noexcept { return len; }
  bool empty() const noexcept { return len == 0U; }

  bool operator==(const Frame& rhs) const noexcept {
    return len == rhs.len && std::memcmp(bytes, rhs.bytes, len) == 0;
  }
  bool operator!=(const Frame& rhs) const noexcept { return !(*this == rhs); }
};

// ============================================================================
// Commands
// ============================================================================

struct SetIndicatorColor {
  uint8_t r;
  uint8_t g;
  uint8_t b;
};

struct TriggerBehavior {
  uint8_t input;
  uint8_t index;
  uint8_t subindex;
  uint8_t specific;
};

/// Mood meter adjustment. action 0 adds, 1 sets.
struct SetInternalValue {
  uint8_t action;
  uint8_t type;
  uint8_t value;
};

enum class MoodAction : uint8_t { kAdd = 0, kSet = 1 };

enum class MoodType : uint8_t {
  kExcitedness = 0,
  kDispleasedness = 1,
  kTiredness = 2,
  kFullness = 3,
  kWellness = 4,
};

struct EnableTransferAck {
  bool on;
};

struct AnnounceUpload {
  uint8_t slot;
  uint32_t size;
  FixedString<kUploadNameSize> name;
};

struct LoadSlot {
  uint8_t slot;
};

struct ActivateSlot {};

struct DeactivateSlot {
  uint8_t slot;
};

struct DeleteSlot {
  uint8_t slot;
};

struct SetName {
  uint8_t id;
};

struct SetLcdBacklight {
  bool on;
};

struct CycleDebugMenu {};

struct QuerySlotInfo {
  uint8_t slot;
};

struct KeepAlive {};

inline bool operator==(const SetIndicatorColor& a, const SetIndicatorColor& b) noexcept {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator==(const TriggerBehavior& a, const TriggerBehavior& b) noexcept {
  return a.input == b.input && a.index == b.index &&
         a.subindex == b.subindex && a.specific == b.specific;
}
inline bool operator==(const SetInternalValue& a, const SetInternalValue& b) noexcept {
  return a.action == b.action && a.type == b.type && a.value == b.value;
}
inline bool operator==(const EnableTransferAck& a, const EnableTransferAck& b) noexcept {
  return a.on == b.on;
}
inline bool operator==(const AnnounceUpload& a, const AnnounceUpload& b) noexcept {
  return a.slot == b.slot && a.size == b.size && a.name == b.name;
}
inline bool operator==(const LoadSlot& a, const LoadSlot& b) noexcept {
  return a.slot == b.slot;
}
inline bool operator==(const ActivateSlot&, const ActivateSlot&) noexcept {
  return true;
}
inline bool operator==(const DeactivateSlot& a, const DeactivateSlot& b) noexcept {
  return a.slot == b.slot;
}
inline bool operator==(const DeleteSlot& a, const DeleteSlot& b) noexcept {
  return a.slot == b.slot;
}
inline bool operator==(const SetName& a, const SetName& b) noexcept {
  return a.id == b.id;
}
inline bool operator==(const SetLcdBacklight& a, const SetLcdBacklight& b) noexcept {
  return a.on == b.on;
}
inline bool operator==(const CycleDebugMenu&, const CycleDebugMenu&) noexcept {
  return true;
}
inline bool operator==(const QuerySlotInfo& a, const QuerySlotInfo& b) noexcept {
  return a.slot == b.slot;
}
inline bool operator==(const KeepAlive&, const KeepAlive&) noexcept {
  return true;
}

using Command =
    std::variant<SetIndicatorColor, TriggerBehavior, SetInternalValue,
                 EnableTransferAck, AnnounceUpload, LoadSlot, ActivateSlot,
                 DeactivateSlot, DeleteSlot, SetName, SetLcdBacklight,
                 CycleDebugMenu, QuerySlotInfo, KeepAlive>;

using CommandResult = expected<Command, CommandError>;

// ============================================================================
// Command Factories
// ============================================================================

namespace detail {

inline bool InRange(int32_t v, int32_t lo, int32_t hi) noexcept {
  return v >= lo && v <= hi;
}

inline bool IsByte(int32_t v) noexcept { return InRange(v, 0, 255); }

inline bool IsUploadNameChar(char c) noexcept {
  return c >= 0x20 && c <= 0x7E;
}

}  // namespace detail

inline CommandResult MakeSetIndicatorColor(int32_t r, int32_t g, int32_t b) {
  if (!detail::IsByte(r) || !detail::IsByte(g) || !detail::IsByte(b)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(Command(SetIndicatorColor{
      static_cast<uint8_t>(r), static_cast<uint8_t>(g),
      static_cast<uint8_t>(b)}));
}

inline CommandResult MakeTriggerBehavior(int32_t input, int32_t index,
                                         int32_t subindex, int32_t specific) {
  if (!detail::IsByte(input) || !detail::IsByte(index) ||
      !detail::IsByte(subindex) || !detail::IsByte(specific)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(Command(TriggerBehavior{
      static_cast<uint8_t>(input), static_cast<uint8_t>(index),
      static_cast<uint8_t>(subindex), static_cast<uint8_t>(specific)}));
}

inline CommandResult MakeSetInternalValue(int32_t action, int32_t type,
                                          int32_t value) {
  if (!detail::InRange(action, 0, 1) || !detail::InRange(type, 0, 4) ||
      !detail::InRange(value, 0, 100)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(Command(SetInternalValue{
      static_cast<uint8_t>(action), static_cast<uint8_t>(type),
      static_cast<uint8_t>(value)}));
}

inline CommandResult MakeEnableTransferAck(bool on) {
  return CommandResult::success(Command(EnableTransferAck{on}));
}

/**
 * @brief Build an upload announcement.
 * @param slot  Destination slot (0-255).
 * @param size  Content length in bytes, at most kMaxUploadSize.
 * @param name  Printable ASCII, at most kUploadNameSize characters.
 *              nullptr is treated as an empty name.
 */
inline CommandResult MakeAnnounceUpload(int32_t slot, uint32_t size,
                                        const char* name) {
  if (!detail::IsByte(slot)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  if (size > kMaxUploadSize) {
    return CommandResult::error(CommandError::kSizeTooLarge);
  }
  const char* n = (name != nullptr) ? name : "";
  const size_t name_len = std::strlen(n);
  if (name_len > kUploadNameSize) {
    return CommandResult::error(CommandError::kInvalidName);
  }
  for (size_t i = 0; i < name_len; ++i) {
    if (!detail::IsUploadNameChar(n[i])) {
      return CommandResult::error(CommandError::kInvalidName);
    }
  }
  AnnounceUpload cmd{static_cast<uint8_t>(slot), size, {}};
  cmd.name.assign(TruncateToCapacity, n, static_cast<uint32_t>(name_len));
  return CommandResult::success(Command(cmd));
}

inline CommandResult MakeLoadSlot(int32_t slot) {
  if (!detail::IsByte(slot)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(Command(LoadSlot{static_cast<uint8_t>(slot)}));
}

inline CommandResult MakeActivateSlot() {
  return CommandResult::success(Command(ActivateSlot{}));
}

inline CommandResult MakeDeactivateSlot(int32_t slot) {
  if (!detail::IsByte(slot)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(
      Command(DeactivateSlot{static_cast<uint8_t>(slot)}));
}

inline CommandResult MakeDeleteSlot(int32_t slot) {
  if (!detail::IsByte(slot)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(
      Command(DeleteSlot{static_cast<uint8_t>(slot)}));
}

inline CommandResult MakeSetName(int32_t id) {
  if (!detail::InRange(id, 0, kMaxNameId)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(Command(SetName{static_cast<uint8_t>(id)}));
}

inline CommandResult MakeSetLcdBacklight(bool on) {
  return CommandResult::success(Command(SetLcdBacklight{on}));
}

inline CommandResult MakeCycleDebugMenu() {
  return CommandResult::success(Command(CycleDebugMenu{}));
}

inline CommandResult MakeQuerySlotInfo(int32_t slot) {
  if (!detail::IsByte(slot)) {
    return CommandResult::error(CommandError::kOutOfRange);
  }
  return CommandResult::success(
      Command(QuerySlotInfo{static_cast<uint8_t>(slot)}));
}

inline CommandResult MakeKeepAlive() {
  return CommandResult::success(Command(KeepAlive{}));
}

// ============================================================================
// Command Encoding
// ============================================================================

namespace detail {

struct CommandEncoder {
  Frame& out;

  void operator()(const SetIndicatorColor& c) const noexcept {
    out.PushBack(tag::kSetIndicatorColor);
    out.PushBack(c.r);
    out.PushBack(c.g);
    out.PushBack(c.b);
  }
  void operator()(const TriggerBehavior& c) const noexcept {
    out.PushBack(tag::kTriggerBehavior);
    out.PushBack(0x00U);
    out.PushBack(c.input);
    out.PushBack(c.index);
    out.PushBack(c.subindex);
    out.PushBack(c.specific);
  }
  void operator()(const SetInternalValue& c) const noexcept {
    out.PushBack(tag::kSetInternalValue);
    out.PushBack(c.action);
    out.PushBack(c.type);
    out.PushBack(c.value);
  }
  void operator()(const EnableTransferAck& c) const noexcept {
    out.PushBack(tag::kEnableTransferAck);
    out.PushBack(c.on ? 0x01U : 0x00U);
    out.PushBack(0x00U);
  }
  // 0x50 00 S2 S1 S0 slot name[12] 00 00 (20 bytes)
  void operator()(const AnnounceUpload& c) const noexcept {
    out.PushBack(tag::kAnnounceUpload);
    out.PushBack(0x00U);
    out.PushBack(static_cast<uint8_t>((c.size >> 16U) & 0xFFU));
    out.PushBack(static_cast<uint8_t>((c.size >> 8U) & 0xFFU));
    out.PushBack(static_cast<uint8_t>(c.size & 0xFFU));
    out.PushBack(c.slot);
    for (uint32_t i = 0; i < kUploadNameSize; ++i) {
      out.PushBack(i < c.name.size()
                       ? static_cast<uint8_t>(c.name.c_str()[i])
                       : 0x00U);
    }
    out.PushBack(0x00U);
    out.PushBack(0x00U);
  }
  void operator()(const LoadSlot& c) const noexcept {
    out.PushBack(tag::kLoadSlot);
    out.PushBack(c.slot);
  }
  void operator()(const ActivateSlot&) const noexcept {
    out.PushBack(tag::kActivateSlot);
  }
  void operator()(const DeactivateSlot& c) const noexcept {
    out.PushBack(tag::kDeactivateSlot);
    out.PushBack(c.slot);
  }
  void operator()(const DeleteSlot& c) const noexcept {
    out.PushBack(tag::kDeleteSlot);
    out.PushBack(c.slot);
  }
  void operator()(const SetName& c) const noexcept {
    out.PushBack(tag::kSetName);
    out.PushBack(c.id);
  }
  void operator()(const SetLcdBacklight& c) const noexcept {
    out.PushBack(tag::kLcdBacklight);
    out.PushBack(c.on ? 0x01U : 0x00U);
  }
  void operator()(const CycleDebugMenu&) const noexcept {
    out.PushBack(tag::kDebugMenu);
  }
  void operator()(const QuerySlotInfo& c) const noexcept {
    out.PushBack(tag::kQuerySlotInfo);
    out.PushBack(c.slot);
  }
  void operator()(const KeepAlive&) const noexcept {
    out.PushBack(tag::kKeepAlive);
  }
};

struct CommandNamer {
  const char* operator()(const SetIndicatorColor&) const noexcept { return "SetIndicatorColor"; }
  const char* operator()(const TriggerBehavior&) const noexcept { return "TriggerBehavior"; }
  const char* operator()(const SetInternalValue&) const noexcept { return "SetInternalValue"; }
  const char* operator()(const EnableTransferAck&) const noexcept { return "EnableTransferAck"; }
  const char* operator()(const AnnounceUpload&) const noexcept { return "AnnounceUpload"; }
  const char* operator()(const LoadSlot&) const noexcept { return "LoadSlot"; }
  const char* operator()(const ActivateSlot&) const noexcept { return "ActivateSlot"; }
  const char* operator()(const DeactivateSlot&) const noexcept { return "DeactivateSlot"; }
  const char* operator()(const DeleteSlot&) const noexcept { return "DeleteSlot"; }
  const char* operator()(const SetName&) const noexcept { return "SetName"; }
  const char* operator()(const SetLcdBacklight&) const noexcept { return "SetLcdBacklight"; }
  const char* operator()(const CycleDebugMenu&) const noexcept { return "CycleDebugMenu"; }
  const char* operator()(const QuerySlotInfo&) const noexcept { return "QuerySlotInfo"; }
  const char* operator()(const KeepAlive&) const noexcept { return "KeepAlive"; }
};

}  // namespace detail

/// Serializes a command into its wire frame (tag first).
inline Frame EncodeCommand(const Command& cmd) noexcept {
  Frame out;
  std::visit(detail::CommandEncoder{out}, cmd);
  return out;
}

/// Logical channel a command is written to.
inline Channel CommandChannel(const Command& cmd) noexcept {
  return std::holds_alternative<EnableTransferAck>(cmd) ? Channel::kControl
                                                        : Channel::kBehavior;
}

inline const char* CommandName(const Command& cmd) noexcept {
  return std::visit(detail::CommandNamer{}, cmd);
}

// ============================================================================
// Command Decoding
// ============================================================================

/**
 * @brief Parse a frame produced by EncodeCommand().
 *
 * Frames must match the encoded length exactly and every fixed byte must
 * carry its documented value. Field ranges are re-validated.
 */
inline CommandResult DecodeCommand(const uint8_t* data, uint32_t len) {
  if (data == nullptr || len == 0U) {
    return CommandResult::error(CommandError::kMalformed);
  }
  const uint8_t* p = data + 1;
  const uint32_t n = len - 1U;

  switch (data[0]) {
    case tag::kSetIndicatorColor:
      if (n != 3U) break;
      return MakeSetIndicatorColor(p[0], p[1], p[2]);
    case tag::kTriggerBehavior:
      if (n != 5U || p[0] != 0x00U) break;
      return MakeTriggerBehavior(p[1], p[2], p[3], p[4]);
    case tag::kSetInternalValue:
      if (n != 3U) break;
      return MakeSetInternalValue(p[0], p[1], p[2]);
    case tag::kEnableTransferAck:
      if (n != 2U || p[0] > 1U || p[1] != 0x00U) break;
      return MakeEnableTransferAck(p[0] == 1U);
    case tag::kAnnounceUpload: {
      if (n != 19U || p[0] != 0x00U || p[17] != 0x00U || p[18] != 0x00U) {
        break;
      }
      const uint32_t size = (static_cast<uint32_t>(p[1]) << 16U) |
                            (static_cast<uint32_t>(p[2]) << 8U) |
                            static_cast<uint32_t>(p[3]);
      char name[kUploadNameSize + 1U] = {};
      std::memcpy(name, p + 5, kUploadNameSize);
      return MakeAnnounceUpload(p[4], size, name);
    }
    case tag::kLoadSlot:
      if (n != 1U) break;
      return MakeLoadSlot(p[0]);
    case tag::kActivateSlot:
      if (n != 0U) break;
      return MakeActivateSlot();
    case tag::kDeactivateSlot:
      if (n != 1U) break;
      return MakeDeactivateSlot(p[0]);
    case tag::kDeleteSlot:
      if (n != 1U) break;
      return MakeDeleteSlot(p[0]);
    case tag::kSetName:
      if (n != 1U) break;
      return MakeSetName(p[0]);
    case tag::kLcdBacklight:
      if (n != 1U || p[0] > 1U) break;
      return MakeSetLcdBacklight(p[0] == 1U);
    case tag::kDebugMenu:
      if (n != 0U) break;
      return MakeCycleDebugMenu();
    case tag::kQuerySlotInfo:
      if (n != 1U) break;
      return MakeQuerySlotInfo(p[0]);
    case tag::kKeepAlive:
      if (n != 0U) break;
      return MakeKeepAlive();
    default:
      return CommandResult::error(CommandError::kUnknownTag);
  }
  return CommandResult::error(CommandError::kMalformed);
}

inline CommandResult DecodeCommand(const Frame& frame) {
  return DecodeCommand(frame.data(), frame.size());
}

// ============================================================================
// Notification Events
// ============================================================================

enum class EventType : uint8_t {
  kFirmwareVersion,
  kGenericAck,        ///< device status message (0x20)
  kTransferAck,       ///< chunks received since the previous report
  kTransferOverload,  ///< device asks the sender to slow down
  kTransferStatus,
  kSlotInfo,
  kRaw,               ///< unrecognized or undecodable
};

enum class TransferStatus : uint8_t {
  kExists = 1,
  kReady = 2,
  kTimeout = 3,
  kAppend = 4,
  kComplete = 5,
  kError = 6,
};

/// Slot states as reported by the device. These are authoritative.
enum class SlotState : uint8_t {
  kEmpty = 0,
  kInProgress = 1,
  kDownloaded = 2,
  kActive = 3,
};

inline const char* EventTypeName(EventType t) noexcept {
  switch (t) {
    case EventType::kFirmwareVersion:  return "FirmwareVersion";
    case EventType::kGenericAck:       return "GenericAck";
    case EventType::kTransferAck:      return "TransferAck";
    case EventType::kTransferOverload: return "TransferOverload";
    case EventType::kTransferStatus:   return "TransferStatus";
    case EventType::kSlotInfo:         return "SlotInfo";
    case EventType::kRaw:              return "Raw";
    default:                           return "?";
  }
}

inline const char* TransferStatusName(uint8_t code) noexcept {
  switch (code) {
    case 1: return "FileExists";
    case 2: return "ReadyToReceive";
    case 3: return "TransferTimeout";
    case 4: return "ReadyToAppend";
    case 5: return "ReceivedOk";
    case 6: return "ReceivedError";
    default: return "Unknown";
  }
}

inline const char* SlotStateName(SlotState s) noexcept {
  switch (s) {
    case SlotState::kEmpty:      return "Empty";
    case SlotState::kInProgress: return "InProgress";
    case SlotState::kDownloaded: return "Downloaded";
    case SlotState::kActive:     return "Active";
    default:                     return "?";
  }
}

/// Human-readable name of a generic-ack status code, for logs.
inline const char* DeviceMessageName(uint8_t code) noexcept {
  switch (code) {
    case 0x01: return "EnteredNamingMode";
    case 0x02: return "ExitedNamingMode";
    case 0x03: return "Named";
    case 0x04: return "EnteredAppMode";
    case 0x05: return "ExitedAppMode";
    case 0x06: return "ResponsePlayed";
    case 0x07: return "SpeechPlaying";
    case 0x08: return "SlaveAck";
    case 0x0A: return "MaskAdded";
    case 0x0B: return "MaskRemoved";
    case 0x0C: return "SequencePlaying";
    case 0x0D: return "SequenceCancelled";
    case 0x0E: return "SequenceEnded";
    case 0x0F: return "InputOutOfRange";
    case 0x10: return "IndexOutOfRange";
    case 0x11: return "SubindexOutOfRange";
    case 0x12: return "SpecificOutOfRange";
    case 0x13: return "SleepMaskAdded";
    case 0x14: return "SleepMaskRemoved";
    case 0x15: return "BodycamOn";
    case 0x16: return "BodycamOff";
    case 0x17: return "LcdOn";
    case 0x18: return "LcdOff";
    case 0x19: return "GroupNotActive";
    case 0x1A: return "TimedGroupSet";
    case 0x1B: return "CustomNotificationSet";
    default:   return "Unknown";
  }
}

/**
 * @brief Decoded inbound notification.
 *
 * For tagged channels @c payload holds the bytes after the tag. For the
 * signal channel, or an empty frame, @c tag is 0 and @c payload holds the
 * whole frame. The decoded fields below are valid only for the listed type:
 *
 *   - value      : kTransferAck (count), kGenericAck / kTransferStatus (code)
 *   - slot       : kSlotInfo
 *   - slot_state : kSlotInfo
 *   - payload[0..3] : kFirmwareVersion
 */
struct NotificationEvent {
  Channel channel;
  EventType type;
  uint8_t tag;
  bool decode_error;
  Frame payload;
  uint8_t value;
  uint8_t slot;
  SlotState slot_state;

  NotificationEvent() noexcept
      : channel(Channel::kBehavior),
        type(EventType::kRaw),
        tag(0),
        decode_error(false),
        payload(),
        value(0),
        slot(0),
        slot_state(SlotState::kEmpty) {}

  bool operator==(const NotificationEvent& rhs) const noexcept {
    return channel == rhs.channel && type == rhs.type && tag == rhs.tag &&
           decode_error == rhs.decode_error && payload == rhs.payload &&
           value == rhs.value && slot == rhs.slot &&
           slot_state == rhs.slot_state;
  }
  bool operator!=(const NotificationEvent& rhs) const noexcept {
    return !(*this == rhs);
  }
};

using EventResult = expected<NotificationEvent, CodecError>;

namespace detail {

struct DecodeRule {
  Channel channel;
  uint8_t tag;
  uint8_t min_payload;
  EventType type;
};

static constexpr DecodeRule kDecodeTable[] = {
    {Channel::kControl, tag::kFirmwareVersion, 4U, EventType::kFirmwareVersion},
    {Channel::kControl, tag::kTransferAck, 1U, EventType::kTransferAck},
    {Channel::kControl, tag::kTransferOverload, 0U, EventType::kTransferOverload},
    {Channel::kBehavior, tag::kGenericAck, 1U, EventType::kGenericAck},
    {Channel::kBehavior, tag::kTransferStatus, 1U, EventType::kTransferStatus},
    {Channel::kBehavior, tag::kSlotInfo, 2U, EventType::kSlotInfo},
};

inline const DecodeRule* FindRule(Channel ch, uint8_t t) noexcept {
  for (const auto& rule : kDecodeTable) {
    if (rule.channel == ch && rule.tag == t) return &rule;
  }
  return nullptr;
}

inline bool IsTagged(Channel ch) noexcept {
  return ch == Channel::kBehavior || ch == Channel::kControl;
}

}  // namespace detail

/**
 * @brief Wrap a frame as a raw event without interpreting it.
 * @param decode_error Set when the frame matched a known tag but failed to
 *                     decode.
 */
inline NotificationEvent MakeRawEvent(Channel ch, const uint8_t* data,
                                      uint32_t len,
                                      bool decode_error) noexcept {
  NotificationEvent ev;
  ev.channel = ch;
  ev.type = EventType::kRaw;
  ev.decode_error = decode_error;
  if (detail::IsTagged(ch) && len > 0U) {
    ev.tag = data[0];
    (void)ev.payload.Assign(data + 1, len - 1U);
  } else {
    (void)ev.payload.Assign(data, len);
  }
  return ev;
}

/**
 * @brief Table-driven decode by (channel, tag).
 *
 * Unknown tags and untagged channels decode to kRaw successfully. A known
 * tag with a payload shorter than its table minimum yields
 * CodecError::kPayloadTooShort.
 */
inline EventResult DecodeEvent(Channel ch, const uint8_t* data,
                               uint32_t len) noexcept {
  if (!detail::IsTagged(ch)) {
    return EventResult::success(MakeRawEvent(ch, data, len, false));
  }
  if (data == nullptr || len == 0U) {
    return EventResult::error(CodecError::kEmptyFrame);
  }

  const detail::DecodeRule* rule = detail::FindRule(ch, data[0]);
  if (rule == nullptr) {
    return EventResult::success(MakeRawEvent(ch, data, len, false));
  }
  const uint32_t payload_len = len - 1U;
  if (payload_len < rule->min_payload) {
    return EventResult::error(CodecError::kPayloadTooShort);
  }

  NotificationEvent ev;
  ev.channel = ch;
  ev.type = rule->type;
  ev.tag = data[0];
  (void)ev.payload.Assign(data + 1, payload_len);

  switch (rule->type) {
    case EventType::kTransferAck:
    case EventType::kGenericAck:
    case EventType::kTransferStatus:
      ev.value = data[1];
      break;
    case EventType::kSlotInfo:
      if (data[2] > static_cast<uint8_t>(SlotState::kActive)) {
        return EventResult::error(CodecError::kInvalidValue);
      }
      ev.slot = data[1];
      ev.slot_state = static_cast<SlotState>(data[2]);
      break;
    default:
      break;
  }
  return EventResult::success(ev);
}

inline EventResult DecodeEvent(Channel ch, const Frame& frame) noexcept {
  return DecodeEvent(ch, frame.data(), frame.size());
}

/// Rebuilds the wire frame of an event (tag, then payload).
inline Frame EncodeEvent(const NotificationEvent& ev) noexcept {
  Frame out;
  if (detail::IsTagged(ev.channel)) {
    out.PushBack(ev.tag);
  }
  for (uint32_t i = 0; i < ev.payload.size() && out.size() < kMaxFrameSize;
       ++i) {
    out.PushBack(ev.payload.bytes[i]);
  }
  return out;
}

}  // namespace fluff

#endif  // FLUFF_PROTOCOL_HPP_
