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
 * @file config.hpp
 * @brief Multi-format configuration store with compile-time backends.
 *
 * Files are flattened into (section, key, value) string triples held in a
 * fixed table; typed getters parse on demand. Backends are opt-in:
 *
 *   FLUFF_CONFIG_INI_ENABLED   INI via inih        (.ini .cfg .conf)
 *   FLUFF_CONFIG_JSON_ENABLED  JSON via nlohmann   (.json)
 *   FLUFF_CONFIG_YAML_ENABLED  YAML via fkYAML     (.yaml .yml)
 *
 * JSON and YAML documents map one level of nesting onto sections; scalars at
 * the top level land in the "" section.
 *
 * @code
 *   fluff::IniConfig cfg;
 *   if (cfg.LoadFile("furby.ini").has_value()) {
 *     uint32_t ka = cfg.GetUint("session", "keepalive_interval_ms", 3000);
 *   }
 * @endcode
 */

#ifndef FLUFF_CONFIG_HPP_
#define FLUFF_CONFIG_HPP_

#include "fluff/log.hpp"
#include "fluff/platform.hpp"
#include "fluff/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <tuple>

#ifdef FLUFF_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef FLUFF_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef FLUFF_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#include <string>
#endif

namespace fluff {

// ============================================================================
// ConfigFormat
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "FileNotFound";
    case ConfigError::kParseError:         return "ParseError";
    case ConfigError::kFormatNotSupported: return "FormatNotSupported";
    case ConfigError::kBufferFull:         return "BufferFull";
    case ConfigError::kInvalidValue:       return "InvalidValue";
    default:                               return "Unknown";
  }
}

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef FLUFF_CONFIG_MAX_FILE_SIZE
#define FLUFF_CONFIG_MAX_FILE_SIZE 8192U
#endif

class ConfigStore {
 public:
  // --- Typed getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  /// Negative values clamp to 0.
  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0U) const {
    auto v = FindUint(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  // --- Optional getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    const long val = std::strtol(e->value, &end, 0);
    return (end == e->value) ? optional<int32_t>{}
                             : optional<int32_t>{static_cast<int32_t>(val)};
  }

  optional<uint32_t> FindUint(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    const long long val = std::strtoll(e->value, &end, 0);
    if (end == e->value) return {};
    if (val < 0) return optional<uint32_t>{0U};
    if (val > 0xFFFFFFFFLL) return optional<uint32_t>{0xFFFFFFFFU};
    return optional<uint32_t>{static_cast<uint32_t>(val)};
  }

  /// Value in [lo, hi], or kInvalidValue when present but out of range.
  expected<optional<int32_t>, ConfigError> FindIntInRange(
      const char* section, const char* key, int32_t lo, int32_t hi) const {
    using Result = expected<optional<int32_t>, ConfigError>;
    if (FindEntry(section, key) == nullptr) {
      return Result::success(optional<int32_t>{});
    }
    auto v = FindInt(section, key);
    if (!v.has_value() || v.value() < lo || v.value() > hi) {
      return Result::error(ConfigError::kInvalidValue);
    }
    return Result::success(v);
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>{}
                          : optional<bool>{ParseBool(e->value)};
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    FLUFF_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  void Clear() noexcept { count_ = 0; }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 128;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  // Later entries for the same (section, key) replace earlier ones.
  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) {
      FLUFF_LOG_WARN("Config", "table full, dropped [%s] %s", section, key);
      return false;
    }
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path,
                                                          char* buf,
                                                          uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    FLUFF_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backends compiled out report kFormatNotSupported.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef FLUFF_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    const int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      FLUFF_LOG_WARN("Config", "%s: parse error at line %d", path, result);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    const int result = ini_parse_string(data, Handler, &store);
    if (result != 0) {
      FLUFF_LOG_WARN("Config", "parse error at line %d", result);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section != nullptr ? section : "",
                       name != nullptr ? name : "",
                       value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef FLUFF_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[FLUFF_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          char val[ConfigStore::kMaxValueLen];
          ToStr(*kit, val, sizeof(val));
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(), val)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else {
        char val[ConfigStore::kMaxValueLen];
        ToStr(*it, val, sizeof(val));
        if (!store.AddEntry("", it.key().c_str(), val)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static void ToStr(const nlohmann::json& n, char* b, uint32_t sz) {
    if (n.is_string()) {
      ConfigStore::SafeCopy(b, n.get_ref<const std::string&>().c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get<bool>() ? "true" : "false", sz);
    } else if (n.is_number_integer()) {
      (void)std::snprintf(b, sz, "%lld", static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      (void)std::snprintf(b, sz, "%g", n.get<double>());
    } else {
      const std::string s = n.dump();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    }
  }
};
#endif

#ifdef FLUFF_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[FLUFF_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    const std::string text(data, size);
    auto root = fkyaml::node::deserialize(text);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const auto key = kit.key().get_value<std::string>();
          char val[ConfigStore::kMaxValueLen];
          ToStr(*kit, val, sizeof(val));
          if (!store.AddEntry(sec.c_str(), key.c_str(), val)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else {
        char val[ConfigStore::kMaxValueLen];
        ToStr(node, val, sizeof(val));
        if (!store.AddEntry("", sec.c_str(), val)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static void ToStr(const fkyaml::node& n, char* b, uint32_t sz) {
    if (n.is_string()) {
      const auto s = n.get_value<std::string>();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get_value<bool>() ? "true" : "false", sz);
    } else if (n.is_integer()) {
      (void)std::snprintf(b, sz, "%lld",
                          static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      (void)std::snprintf(b, sz, "%g", n.get_value<double>());
    } else {
      b[0] = '\0';
    }
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  /// @p format kAuto picks the backend from the file extension.
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    FLUFF_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    auto r = DispatchFile<Backends...>(path, format);
    if (r.has_value()) {
      FLUFF_LOG_INFO("Config", "loaded %s (%u entries)", path, EntryCount());
    } else {
      FLUFF_LOG_WARN("Config", "%s: %s", path,
                     ConfigErrorName(r.get_error()));
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    FLUFF_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  // Unknown or missing extension falls back to the first backend.
  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Aliases
// ============================================================================

#ifdef FLUFF_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef FLUFF_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef FLUFF_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

#if defined(FLUFF_CONFIG_INI_ENABLED) || defined(FLUFF_CONFIG_JSON_ENABLED) || \
    defined(FLUFF_CONFIG_YAML_ENABLED)
using MultiConfig = Config<
#ifdef FLUFF_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(FLUFF_CONFIG_INI_ENABLED) && \
    (defined(FLUFF_CONFIG_JSON_ENABLED) || defined(FLUFF_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef FLUFF_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(FLUFF_CONFIG_JSON_ENABLED) && defined(FLUFF_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef FLUFF_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

}  // namespace fluff

#endif  // FLUFF_CONFIG_HPP_
