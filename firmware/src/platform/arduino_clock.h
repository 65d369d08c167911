/**
 * @file arduino_clock.h
 * @brief Arduino-backed uptime clock for the monitor loop.
 */
#pragma once

#include "tbolt/platform/clock.h"

namespace tbolt::platform {

/**
 * @brief millis() clock. Shared by loop() and the ingest task.
 */
class ArduinoClock final : public IClock {
 public:
  millis_t uptime_ms() const override;
};

} // namespace tbolt::platform
