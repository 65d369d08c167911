/**
 * @file arduino_logger.cpp
 * @brief Serial console logger.
 */
#include "platform/arduino_logger.h"

#include <Arduino.h>

namespace tbolt::platform {

namespace {

char level_char(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return 'D';
    case LogLevel::kInfo:
      return 'I';
    case LogLevel::kWarn:
      return 'W';
    case LogLevel::kError:
    default:
      return 'E';
  }
}

} // namespace

ArduinoLogger::ArduinoLogger(LogLevel min_level) : min_level_(min_level) {}

void ArduinoLogger::set_min_level(LogLevel level) {
  min_level_ = level;
}

void ArduinoLogger::log(LogLevel level, const char* tag, const char* msg) {
  if (!msg || static_cast<uint8_t>(level) < static_cast<uint8_t>(min_level_)) {
    return;
  }
  if (!Serial) {
    return;
  }
  Serial.print('[');
  Serial.print(level_char(level));
  Serial.print("] ");
  if (tag && tag[0] != '\0') {
    Serial.print(tag);
    Serial.print(": ");
  }
  Serial.println(msg);
}

} // namespace tbolt::platform
