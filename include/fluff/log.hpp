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
 * @file log.hpp
 * @brief Synchronous tagged logging to stderr.
 *
 * Output format:
 *   [<monotonic s.us>] [LEVEL] [category] message (file:line)
 * The file:line suffix is omitted in NDEBUG builds.
 *
 * Two filters apply:
 *   - FLUFF_LOG_MIN_LEVEL (compile time, 0=DEBUG .. 4=FATAL)
 *   - log::SetLevel()     (run time)
 *
 * Usage:
 * @code
 *   FLUFF_LOG_INFO("Session", "connected to %s", addr.c_str());
 * @endcode
 */

#ifndef FLUFF_LOG_HPP_
#define FLUFF_LOG_HPP_

#include "fluff/platform.hpp"

#include <atomic>
#include <cinttypes>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#ifndef FLUFF_LOG_MIN_LEVEL
#ifdef NDEBUG
#define FLUFF_LOG_MIN_LEVEL 1
#else
#define FLUFF_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef FLUFF_LOG_LINE_MAX
#define FLUFF_LOG_LINE_MAX 512U
#endif

namespace fluff {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& SinkMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO ";
    case Level::kWarn:  return "WARN ";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?????";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// Marks the sink ready. Logging before Init() still works.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/// Flushes stderr and marks the sink closed.
inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::SinkMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  char msg[FLUFF_LOG_LINE_MAX];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  const uint64_t now_us = SteadyNowUs();
  std::lock_guard<std::mutex> lock(detail::SinkMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%" PRIu64 ".%06" PRIu64 "] [%s] [%s] %s\n",
                     now_us / 1000000U, now_us % 1000000U,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr,
                     "[%" PRIu64 ".%06" PRIu64 "] [%s] [%s] %s (%s:%d)\n",
                     now_us / 1000000U, now_us % 1000000U,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace fluff

// ============================================================================
// Macros
// ============================================================================

#define FLUFF_LOG_DEBUG(cat, fmt, ...)                                     \
  do {                                                                     \
    if (FLUFF_LOG_MIN_LEVEL <= 0) {                                        \
      ::fluff::log::LogWrite(::fluff::log::Level::kDebug, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define FLUFF_LOG_INFO(cat, fmt, ...)                                      \
  do {                                                                     \
    if (FLUFF_LOG_MIN_LEVEL <= 1) {                                        \
      ::fluff::log::LogWrite(::fluff::log::Level::kInfo, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define FLUFF_LOG_WARN(cat, fmt, ...)                                      \
  do {                                                                     \
    if (FLUFF_LOG_MIN_LEVEL <= 2) {                                        \
      ::fluff::log::LogWrite(::fluff::log::Level::kWarn, cat, __FILE__,    \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define FLUFF_LOG_ERROR(cat, fmt, ...)                                     \
  do {                                                                     \
    if (FLUFF_LOG_MIN_LEVEL <= 3) {                                        \
      ::fluff::log::LogWrite(::fluff::log::Level::kError, cat, __FILE__,   \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    }                                                                      \
  } while (0)

#define FLUFF_LOG_FATAL(cat, fmt, ...)                                     \
  do {                                                                     \
    ::fluff::log::LogWrite(::fluff::log::Level::kFatal, cat, __FILE__,     \
                           __LINE__, fmt, ##__VA_ARGS__);                  \
    std::abort();                                                          \
  } while (0)

#endif  // FLUFF_LOG_HPP_
