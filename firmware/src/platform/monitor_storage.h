#pragma once

#include <cstdint>

#include "domain/monitor_config.h"

namespace tbolt {

/**
 * Load MonitorConfig from NVS (namespace "tbolt").
 * Missing keys take their defaults; out-of-range values are replaced by
 * sanitize_config. *replaced receives the ConfigFieldFlag mask of fields
 * that were missing or invalid (all bits set when NVS could not be opened).
 * Returns true if NVS was opened and read; out is always filled.
 */
bool load_monitor_config(domain::MonitorConfig* out, uint32_t* replaced);

/**
 * Save every field. Caller validates first (validate_config).
 * Returns true on success.
 */
bool save_monitor_config(const domain::MonitorConfig& config);

} // namespace tbolt
