#pragma once

#include <cstddef>

#include "domain/device_status.h"
#include "domain/monitor_config.h"

namespace tbolt {

/** Large enough for every field at its widest. */
constexpr size_t kStatusJsonMaxLen = 512;

/**
 * Serialize a snapshot as the /api/status document.
 * Angles stay in radians; the page converts them for display.
 * Returns the number of bytes written (without the terminator), or 0 when
 * out is null or too small for the whole document.
 */
size_t render_status_json(const domain::DeviceStatus& status, bool connected, char* out, size_t out_len);

/**
 * Serialize the config for GET /api/config. The Wi-Fi secret is never
 * included. Same return convention as render_status_json.
 */
size_t render_config_json(const domain::MonitorConfig& config, char* out, size_t out_len);

/** "YYYY-MM-DDTHH:MM:SSZ", or "" before the first time report. */
void format_iso8601(const domain::DeviceStatus& status, char* out, size_t out_len);

/** "HH:MM:SS", or "" before the first time report. */
void format_clock(const domain::DeviceStatus& status, char* out, size_t out_len);

} // namespace tbolt
