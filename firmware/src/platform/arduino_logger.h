/**
 * @file arduino_logger.h
 * @brief Serial console logger.
 */
#pragma once

#include "tbolt/platform/log.h"

namespace tbolt::platform {

/**
 * @brief Prints "[L] tag: msg" lines to Serial.
 *
 * Messages below min_level are dropped. The default hides kDebug, which
 * carries the hex dumps of unhandled receiver reports.
 */
class ArduinoLogger final : public ILogger {
 public:
  explicit ArduinoLogger(LogLevel min_level = LogLevel::kInfo);

  void log(LogLevel level, const char* tag, const char* msg) override;
  void set_min_level(LogLevel level);

 private:
  LogLevel min_level_;
};

} // namespace tbolt::platform
