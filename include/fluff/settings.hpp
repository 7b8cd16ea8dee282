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
 * @file settings.hpp
 * @brief Maps a loaded ConfigStore onto session, connect and upload options.
 *
 * Recognized keys (all optional, defaults as in the option structs):
 *
 * @code
 *   [session]
 *   keepalive_interval_ms = 3000
 *   scan_timeout_ms = 10000
 *   name_filter = Furby
 *
 *   [connect]
 *   address = AA:BB:CC:DD:EE:FF
 *   timeout_ms = 15000
 *   retries = 3              ; 1..10
 *   retry_delay_ms = 1000
 *
 *   [upload]
 *   slot = 2                 ; 0..255
 *   filename = UPLOAD.DLC    ; up to 12 printable ASCII characters
 *   enable_ack = true
 *   activate = false
 *   ready_timeout_ms = 10000
 *   chunk_delay_ms = 5
 *   stall_timeout_ms = 5000
 *   max_unacked_chunks = 0
 *   overload_delay_ms = 200
 *   completion_timeout_ms = 60000
 *
 *   [log]
 *   level = info             ; debug | info | warn | error | off
 * @endcode
 */

#ifndef FLUFF_SETTINGS_HPP_
#define FLUFF_SETTINGS_HPP_

#include "fluff/config.hpp"
#include "fluff/device.hpp"
#include "fluff/log.hpp"
#include "fluff/protocol.hpp"
#include "fluff/session.hpp"
#include "fluff/upload.hpp"
#include "fluff/vocabulary.hpp"

#include <cstdint>

namespace fluff {

static constexpr uint32_t kMinConnectRetries = 1U;
static constexpr uint32_t kMaxConnectRetries = 10U;
static constexpr uint8_t kDefaultUploadSlot = 2U;

struct Settings {
  SessionOptions session;
  ConnectOptions connect;
  DeviceAddress address;  ///< empty: discover by name filter
  UploadOptions upload;
  uint8_t upload_slot = kDefaultUploadSlot;
  log::Level log_level = log::Level::kInfo;
};

/// Case-insensitive level name to Level.
inline optional<log::Level> ParseLogLevel(const char* name) noexcept {
  if (name == nullptr) return {};
  if (detail::CaseEqual(name, "debug")) return log::Level::kDebug;
  if (detail::CaseEqual(name, "info")) return log::Level::kInfo;
  if (detail::CaseEqual(name, "warn") || detail::CaseEqual(name, "warning")) {
    return log::Level::kWarn;
  }
  if (detail::CaseEqual(name, "error")) return log::Level::kError;
  if (detail::CaseEqual(name, "off")) return log::Level::kOff;
  return {};
}

namespace detail {

inline void ReadUint(const ConfigStore& cfg, const char* section,
                     const char* key, uint32_t& out) {
  auto v = cfg.FindUint(section, key);
  if (v.has_value()) out = v.value();
}

inline void ReadBool(const ConfigStore& cfg, const char* section,
                     const char* key, bool& out) {
  auto v = cfg.FindBool(section, key);
  if (v.has_value()) out = v.value();
}

inline expected<void, ConfigError> Reject(const char* section,
                                          const char* key) {
  FLUFF_LOG_WARN("Config", "[%s] %s: invalid value", section, key);
  return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
}

}  // namespace detail

/**
 * @brief Overlay the values present in @p cfg onto @p out.
 *
 * Keys that are absent keep the value already in @p out. On kInvalidValue
 * the fields read before the offending key have been applied.
 */
inline expected<void, ConfigError> LoadSettings(const ConfigStore& cfg,
                                                Settings& out) {
  // [session]
  detail::ReadUint(cfg, "session", "keepalive_interval_ms",
                   out.session.keepalive_interval_ms);
  detail::ReadUint(cfg, "session", "scan_timeout_ms",
                   out.session.scan_timeout_ms);
  if (cfg.HasKey("session", "name_filter")) {
    const char* filter = cfg.GetString("session", "name_filter");
    if (std::strlen(filter) > DeviceName::capacity()) {
      return detail::Reject("session", "name_filter");
    }
    out.session.name_filter.assign(TruncateToCapacity, filter);
  }

  // [connect]
  if (cfg.HasKey("connect", "address")) {
    const char* addr = cfg.GetString("connect", "address");
    if (addr[0] != '\0' && !IsValidAddress(addr)) {
      return detail::Reject("connect", "address");
    }
    out.address.assign(TruncateToCapacity, addr);
  }
  detail::ReadUint(cfg, "connect", "timeout_ms", out.connect.timeout_ms);
  auto retries = cfg.FindIntInRange(
      "connect", "retries", static_cast<int32_t>(kMinConnectRetries),
      static_cast<int32_t>(kMaxConnectRetries));
  if (!retries.has_value()) return detail::Reject("connect", "retries");
  if (retries.value().has_value()) {
    out.connect.retries = static_cast<uint32_t>(retries.value().value());
  }
  detail::ReadUint(cfg, "connect", "retry_delay_ms",
                   out.connect.retry_delay_ms);

  // [upload]
  auto slot = cfg.FindIntInRange("upload", "slot", 0, 255);
  if (!slot.has_value()) return detail::Reject("upload", "slot");
  if (slot.value().has_value()) {
    out.upload_slot = static_cast<uint8_t>(slot.value().value());
  }
  if (cfg.HasKey("upload", "filename")) {
    const char* name = cfg.GetString("upload", "filename");
    if (!MakeAnnounceUpload(0, 1U, name).has_value()) {
      return detail::Reject("upload", "filename");
    }
    out.upload.filename.assign(TruncateToCapacity, name);
  }
  detail::ReadBool(cfg, "upload", "enable_ack", out.upload.enable_ack);
  detail::ReadBool(cfg, "upload", "activate", out.upload.activate);
  detail::ReadUint(cfg, "upload", "ready_timeout_ms",
                   out.upload.ready_timeout_ms);
  detail::ReadUint(cfg, "upload", "chunk_delay_ms", out.upload.chunk_delay_ms);
  detail::ReadUint(cfg, "upload", "stall_timeout_ms",
                   out.upload.stall_timeout_ms);
  detail::ReadUint(cfg, "upload", "max_unacked_chunks",
                   out.upload.max_unacked_chunks);
  detail::ReadUint(cfg, "upload", "overload_delay_ms",
                   out.upload.overload_delay_ms);
  detail::ReadUint(cfg, "upload", "completion_timeout_ms",
                   out.upload.completion_timeout_ms);

  // [log]
  if (cfg.HasKey("log", "level")) {
    auto level = ParseLogLevel(cfg.GetString("log", "level"));
    if (!level.has_value()) return detail::Reject("log", "level");
    out.log_level = level.value();
  }
  return expected<void, ConfigError>::success();
}

/// Applies the process-wide parts of @p s (currently the log level).
inline void ApplySettings(const Settings& s) noexcept {
  log::SetLevel(s.log_level);
}

}  // namespace fluff

#endif  // FLUFF_SETTINGS_HPP_
