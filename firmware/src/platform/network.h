#pragma once

#include <cstdint>

#include "domain/monitor_config.h"
#include "tbolt/platform/log.h"

namespace tbolt::platform {

/**
 * Bring up Wi-Fi. In station mode, join config.ssid, blocking up to
 * timeout_ms. With ap_mode set, host config.ssid/secret as an access point
 * instead. Applies the hostname, and the static address when dhcp is off.
 * Returns false (and logs why) on failure.
 */
bool connect_network(const domain::MonitorConfig& config, ILogger& logger, uint32_t timeout_ms);

} // namespace tbolt::platform
