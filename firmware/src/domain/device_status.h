#pragma once

#include <cstdint>

#include "../../protocol/tsip_reports.h"

namespace tbolt {
namespace domain {

/**
 * Latest known receiver state. Each field keeps the value from the most
 * recent report that carries it; reports of other kinds leave it alone.
 */
struct DeviceStatus {
  // 8F-AC secondary timing.
  uint8_t  receiver_mode = protocol::kModeUnknown;
  uint8_t  discipline_mode = protocol::kModeUnknown;
  uint8_t  survey_progress = 0;
  uint32_t holdover_duration_s = 0;
  uint16_t critical_alarms = 0;
  uint16_t minor_alarms = 0;
  uint8_t  gps_status = protocol::kModeUnknown;
  uint8_t  discipline_activity = 0;
  float    pps_offset_ns = 0.0f;
  float    osc_offset_ppb = 0.0f;
  uint32_t dac_value = 0;
  float    dac_voltage = 0.0f;
  float    temperature_c = 0.0f;

  // 8F-AC stored position or 0x84.
  double latitude_rad = 0.0;
  double longitude_rad = 0.0;
  double altitude_m = 0.0;

  // 0x6D.
  uint8_t satellites_used = 0;
  uint8_t fix_dimension = 0;
  float   pdop = 0.0f;

  // 8F-AB.
  bool has_time = false;
  protocol::UtcTimestamp utc_time{};
  uint8_t timing_flags = 0;

  bool has_update = false;
  uint32_t last_update_ms = 0;  ///< Uptime of the last applied report.
  bool connected = false;
};

/** Oscillator locked to GPS. No smoothing: follows the last 8F-AC. */
inline bool is_disciplined(const DeviceStatus& status) {
  return status.discipline_mode == protocol::kDisciplineNormal;
}

} // namespace domain
} // namespace tbolt
