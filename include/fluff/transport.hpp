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
 * @file transport.hpp
 * @brief Radio transport contract, GATT endpoints and channel bindings.
 *
 * The radio stack is injected as a template parameter. A Transport type must
 * provide:
 *
 * @code
 *   expected<void, TransportError> Connect(const char* address,
 *                                          uint32_t timeout_ms);
 *   void Disconnect();                                    // idempotent
 *   expected<void, TransportError> Write(Endpoint ep, const uint8_t* data,
 *                                        uint32_t len);
 *   expected<uint32_t, TransportError> Read(Endpoint ep, uint8_t* buf,
 *                                           uint32_t cap);  // bytes read
 *   expected<void, TransportError> Subscribe(Endpoint ep, NotifyFn fn,
 *                                            void* ctx);
 *   void Unsubscribe(Endpoint ep);
 *   expected<void, TransportError> StartScan();
 *   bool NextAdvertisement(Advertisement& out, uint32_t wait_ms);
 *   void StopScan();
 * @endcode
 *
 * Notification callbacks run on the radio stack's own context and must only
 * copy the bytes out. They may arrive on any thread, also concurrently for
 * the same endpoint; the registry serializes its producers per channel.
 * Write() and Read() must be safe to call from several threads.
 */

#ifndef FLUFF_TRANSPORT_HPP_
#define FLUFF_TRANSPORT_HPP_

#include "fluff/device.hpp"
#include "fluff/protocol.hpp"
#include "fluff/vocabulary.hpp"

#include <cstdint>

namespace fluff {

// ============================================================================
// Transport Error
// ============================================================================

enum class TransportError : uint8_t {
  kNotConnected,
  kTimeout,
  kRejected,
  kWriteFailed,
  kSubscribeFailed,
  kScanFailed,
  kReadFailed,
};

inline const char* TransportErrorName(TransportError e) noexcept {
  switch (e) {
    case TransportError::kNotConnected:    return "NotConnected";
    case TransportError::kTimeout:         return "Timeout";
    case TransportError::kRejected:        return "Rejected";
    case TransportError::kWriteFailed:     return "WriteFailed";
    case TransportError::kSubscribeFailed: return "SubscribeFailed";
    case TransportError::kScanFailed:      return "ScanFailed";
    case TransportError::kReadFailed:      return "ReadFailed";
    default:                               return "Unknown";
  }
}

using TransportResult = expected<void, TransportError>;

/// Notification callback. @p data is only valid for the duration of the call.
using NotifyFn = void (*)(const uint8_t* data, uint32_t len, void* ctx);

// ============================================================================
// Endpoint
// ============================================================================

/// GATT characteristics of the device.
enum class Endpoint : uint8_t {
  kGeneralPlusWrite = 0,
  kGeneralPlusListen,
  kNordicWrite,
  kNordicListen,
  kFileWrite,
  kRssiListen,
  // Device Information Service, read only.
  kManufacturerName,
  kModelNumber,
  kSerialNumber,
  kHardwareRevision,
  kFirmwareRevision,
  kSoftwareRevision,
};

static constexpr uint32_t kEndpointCount = 12U;

/// Characteristic UUID (128-bit, hex without dashes).
inline const char* EndpointUuid(Endpoint ep) noexcept {
  switch (ep) {
    case Endpoint::kGeneralPlusWrite:  return "dab91383b5a1e29cb041bcd562613bde";
    case Endpoint::kGeneralPlusListen: return "dab91382b5a1e29cb041bcd562613bde";
    case Endpoint::kNordicWrite:       return "dab90757b5a1e29cb041bcd562613bde";
    case Endpoint::kNordicListen:      return "dab90756b5a1e29cb041bcd562613bde";
    case Endpoint::kFileWrite:         return "dab90758b5a1e29cb041bcd562613bde";
    case Endpoint::kRssiListen:        return "dab90755b5a1e29cb041bcd562613bde";
    case Endpoint::kManufacturerName:  return "00002a2900001000800000805f9b34fb";
    case Endpoint::kModelNumber:       return "00002a2400001000800000805f9b34fb";
    case Endpoint::kSerialNumber:      return "00002a2500001000800000805f9b34fb";
    case Endpoint::kHardwareRevision:  return "00002a2700001000800000805f9b34fb";
    case Endpoint::kFirmwareRevision:  return "00002a2600001000800000805f9b34fb";
    case Endpoint::kSoftwareRevision:  return "00002a2800001000800000805f9b34fb";
    default:                           return "";
  }
}

// ============================================================================
// Channel Bindings
// ============================================================================

struct ChannelBinding {
  Channel channel;
  bool writable;
  Endpoint write_endpoint;
  bool notifies;
  Endpoint notify_endpoint;
};

static constexpr ChannelBinding kChannelBindings[kChannelCount] = {
    {Channel::kBehavior, true, Endpoint::kGeneralPlusWrite, true,
     Endpoint::kGeneralPlusListen},
    {Channel::kControl, true, Endpoint::kNordicWrite, true,
     Endpoint::kNordicListen},
    {Channel::kBulk, true, Endpoint::kFileWrite, false, Endpoint::kFileWrite},
    {Channel::kSignal, false, Endpoint::kRssiListen, true,
     Endpoint::kRssiListen},
};

inline const ChannelBinding& BindingFor(Channel ch) noexcept {
  return kChannelBindings[static_cast<uint32_t>(ch)];
}

}  // namespace fluff

#endif  // FLUFF_TRANSPORT_HPP_
