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
 * @brief Synchronous printf-style logging to stderr.
 *
 * Usage:
 *   CFX_LOG_INFO("Pool", "started %u workers", n);
 *
 * Two gates apply: the compile-time floor CFX_LOG_MIN_LEVEL removes
 * statements entirely, the runtime level set via log::SetLevel() filters
 * the rest. Each record is formatted on the caller's stack and emitted with a
 * single fprintf so lines from different threads do not interleave.
 */

#ifndef CFX_LOG_HPP_
#define CFX_LOG_HPP_

#include "cfx/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(CFX_PLATFORM_LINUX) || defined(CFX_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef CFX_LOG_MIN_LEVEL
#define CFX_LOG_MIN_LEVEL 0
#endif

namespace cfx {
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

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO ";
    case Level::kWarn:
      return "WARN ";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "?????";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format the current wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(CFX_PLATFORM_LINUX) || defined(CFX_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                        tm_local->tm_mday, tm_local->tm_hour,
                        tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "----");
  }
#endif
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// @brief Mark the logger initialized. Output works without it.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/// @brief Flush stderr and mark the logger uninitialized.
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Format and emit one record. FATAL flushes and aborts.
 */
inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(std::memory_order_relaxed))) {
    return;
  }

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
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
}  // namespace cfx

// ============================================================================
// Macros
// ============================================================================

#define CFX_LOG_DEBUG(cat, fmt, ...)                                      \
  do {                                                                    \
    if (CFX_LOG_MIN_LEVEL <= 0) {                                         \
      ::cfx::log::LogWrite(::cfx::log::Level::kDebug, cat, __FILE__,      \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define CFX_LOG_INFO(cat, fmt, ...)                                       \
  do {                                                                    \
    if (CFX_LOG_MIN_LEVEL <= 1) {                                         \
      ::cfx::log::LogWrite(::cfx::log::Level::kInfo, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define CFX_LOG_WARN(cat, fmt, ...)                                       \
  do {                                                                    \
    if (CFX_LOG_MIN_LEVEL <= 2) {                                         \
      ::cfx::log::LogWrite(::cfx::log::Level::kWarn, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define CFX_LOG_ERROR(cat, fmt, ...)                                      \
  do {                                                                    \
    if (CFX_LOG_MIN_LEVEL <= 3) {                                         \
      ::cfx::log::LogWrite(::cfx::log::Level::kError, cat, __FILE__,      \
                           __LINE__, fmt, ##__VA_ARGS__);                 \
    }                                                                     \
  } while (0)

#define CFX_LOG_FATAL(cat, fmt, ...)                                      \
  ::cfx::log::LogWrite(::cfx::log::Level::kFatal, cat, __FILE__, __LINE__, \
                       fmt, ##__VA_ARGS__)

#endif  // CFX_LOG_HPP_
