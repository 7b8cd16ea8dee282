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
 * @file device.hpp
 * @brief Device identity and advertisement records.
 */

#ifndef FLUFF_DEVICE_HPP_
#define FLUFF_DEVICE_HPP_

#include "fluff/platform.hpp"
#include "fluff/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>

namespace fluff {

/// Holds either a MAC ("AA:BB:CC:DD:EE:FF") or a platform UUID (36 chars).
static constexpr uint32_t kAddressMaxLen = 36U;
static constexpr uint32_t kDeviceNameMaxLen = 31U;

/// Advertised name prefix of the device.
static constexpr const char* kDefaultNameFilter = "Furby";

/// Longest Device Information string kept per field.
static constexpr uint32_t kInfoFieldMaxLen = 32U;

using DeviceAddress = FixedString<kAddressMaxLen>;
using DeviceName = FixedString<kDeviceNameMaxLen>;
using InfoString = FixedString<kInfoFieldMaxLen>;

enum class DeviceError : uint8_t {
  kInvalidAddress,
};

namespace detail {

inline bool IsHexDigit(char c) noexcept {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

/// True if every character of @p s matches @p pattern, where 'x' stands
/// for a hex digit and any other character must match literally.
inline bool MatchesHexPattern(const char* s, const char* pattern) noexcept {
  size_t i = 0;
  for (; pattern[i] != '\0'; ++i) {
    if (s[i] == '\0') return false;
    if (pattern[i] == 'x') {
      if (!IsHexDigit(s[i])) return false;
    } else if (s[i] != pattern[i]) {
      return false;
    }
  }
  return s[i] == '\0';
}

}  // namespace detail

/// Accepts a colon-separated MAC or a dashed 8-4-4-4-12 UUID.
inline bool IsValidAddress(const char* addr) noexcept {
  if (addr == nullptr) return false;
  return detail::MatchesHexPattern(addr, "xx:xx:xx:xx:xx:xx") ||
         detail::MatchesHexPattern(addr,
                                   "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
}

/**
 * @brief One discovery result as reported by the radio stack.
 */
struct Advertisement {
  DeviceAddress address;
  DeviceName name;
  int16_t rssi = 0;
};

/**
 * @brief Stable identity of one physical device.
 *
 * Created by discovery or supplied by the caller (FromAddress). The session
 * refreshes last_seen_us on connect and fills in the firmware version when
 * the device reports it. Persisting identities is left to the caller.
 */
struct DeviceIdentity {
  DeviceAddress address;
  DeviceName name;
  int16_t rssi = 0;
  uint64_t last_seen_us = 0;  ///< monotonic, SteadyNowUs()
  bool has_firmware = false;
  uint8_t firmware[4] = {};

  bool HasAddress() const noexcept { return !address.empty(); }

  static expected<DeviceIdentity, DeviceError> FromAddress(const char* addr) {
    if (!IsValidAddress(addr)) {
      return expected<DeviceIdentity, DeviceError>::error(
          DeviceError::kInvalidAddress);
    }
    DeviceIdentity id;
    id.address.assign(TruncateToCapacity, addr);
    return expected<DeviceIdentity, DeviceError>::success(id);
  }

  static DeviceIdentity FromAdvertisement(const Advertisement& adv) noexcept {
    DeviceIdentity id;
    id.address = adv.address;
    id.name = adv.name;
    id.rssi = adv.rssi;
    id.last_seen_us = SteadyNowUs();
    return id;
  }

  void SetFirmware(const uint8_t* version) noexcept {
    std::memcpy(firmware, version, sizeof(firmware));
    has_firmware = true;
  }

  /// Formats the firmware version as "a.b.c.d" into @p buf.
  void FormatFirmware(char* buf, size_t buf_size) const noexcept {
    if (!has_firmware) {
      (void)std::snprintf(buf, buf_size, "unknown");
      return;
    }
    (void)std::snprintf(buf, buf_size, "%u.%u.%u.%u",
                        static_cast<unsigned>(firmware[0]),
                        static_cast<unsigned>(firmware[1]),
                        static_cast<unsigned>(firmware[2]),
                        static_cast<unsigned>(firmware[3]));
  }
};

/**
 * @brief Device Information Service strings.
 *
 * A field the device did not answer stays empty.
 */
struct DeviceInfo {
  InfoString manufacturer;
  InfoString model_number;
  InfoString serial_number;
  InfoString hardware_revision;
  InfoString firmware_revision;
  InfoString software_revision;
  uint32_t fields_read = 0;
};

/// Stores a characteristic value as text, without NUL padding at either end.
inline void AssignInfoString(InfoString& out, const uint8_t* data,
                             uint32_t len) noexcept {
  uint32_t begin = 0;
  while (begin < len && data[begin] == 0U) ++begin;
  uint32_t end = len;
  while (end > begin && data[end - 1U] == 0U) --end;
  out.assign(TruncateToCapacity, reinterpret_cast<const char*>(data + begin),
             end - begin);
}

/// Substring match on the advertised name. An empty filter matches all.
inline bool NameMatches(const char* name, const char* filter) noexcept {
  if (filter == nullptr || filter[0] == '\0') return true;
  if (name == nullptr) return false;
  return std::strstr(name, filter) != nullptr;
}

}  // namespace fluff

#endif  // FLUFF_DEVICE_HPP_
