#include "platform/arduino_clock.h"

#include <Arduino.h>

namespace tbolt::platform {

millis_t ArduinoClock::uptime_ms() const {
  return ::millis();
}

} // namespace tbolt::platform
