/**
 * @file log.h
 * @brief Text logger for console diagnostics (link state, network, HTTP, TSIP dumps).
 */
#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace tbolt::platform {

enum class LogLevel : uint8_t {
  kDebug = 0,  ///< Hex dumps of unhandled reports.
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

/**
 * @brief Line-oriented logger.
 */
struct ILogger {
  virtual ~ILogger() = default;

  /**
   * @param tag Short component tag ("tsip", "net", "http", "app").
   * @param msg One line, without newline.
   */
  virtual void log(LogLevel level, const char* tag, const char* msg) = 0;
};

/// Longest formatted line; longer output is cut.
constexpr size_t kLogLineMax = 192;

/**
 * @brief printf-style wrapper around ILogger::log.
 */
#if defined(__GNUC__)
__attribute__((format(printf, 4, 5)))
#endif
inline void log_printf(ILogger& logger, LogLevel level, const char* tag, const char* fmt, ...) {
  char line[kLogLineMax] = {0};
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  logger.log(level, tag, line);
}

} // namespace tbolt::platform
