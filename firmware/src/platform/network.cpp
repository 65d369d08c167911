#include "platform/network.h"

#include <Arduino.h>
#include <WiFi.h>

#include "tbolt/platform/clock.h"

namespace tbolt::platform {

namespace {

constexpr const char* kLogTag = "net";
constexpr uint32_t kPollIntervalMs = 250U;

IPAddress to_ip(const char* text) {
  uint8_t octets[4] = {};
  if (!domain::parse_ipv4(text, octets)) {
    return IPAddress(0, 0, 0, 0);
  }
  return IPAddress(octets[0], octets[1], octets[2], octets[3]);
}

// Host config.ssid ourselves; clients reach the web page at the AP address.
bool start_access_point(const domain::MonitorConfig& config, ILogger& logger) {
  WiFi.mode(WIFI_AP);
  if (!config.dhcp &&
      !WiFi.softAPConfig(to_ip(config.ip_address), to_ip(config.gateway), to_ip(config.netmask))) {
    logger.log(LogLevel::kError, kLogTag, "access point address rejected");
    return false;
  }
  WiFi.softAPsetHostname(config.hostname);
  if (!WiFi.softAP(config.ssid, config.secret)) {
    log_printf(logger, LogLevel::kError, kLogTag, "access point ssid=%s failed", config.ssid);
    return false;
  }
  const IPAddress ip = WiFi.softAPIP();
  log_printf(logger, LogLevel::kInfo, kLogTag, "access point ssid=%s ip=%u.%u.%u.%u", config.ssid, ip[0], ip[1],
             ip[2], ip[3]);
  return true;
}

} // namespace

bool connect_network(const domain::MonitorConfig& config, ILogger& logger, uint32_t timeout_ms) {
  if (config.ap_mode) {
    return start_access_point(config, logger);
  }

  WiFi.mode(WIFI_STA);
  WiFi.setHostname(config.hostname);
  if (!config.dhcp) {
    if (!WiFi.config(to_ip(config.ip_address), to_ip(config.gateway), to_ip(config.netmask),
                     to_ip(config.dns_server))) {
      logger.log(LogLevel::kError, kLogTag, "static address rejected");
      return false;
    }
  }

  log_printf(logger, LogLevel::kInfo, kLogTag, "joining ssid=%s host=%s dhcp=%d", config.ssid,
             config.hostname, config.dhcp ? 1 : 0);
  WiFi.begin(config.ssid, config.secret);

  const uint32_t start_ms = ::millis();
  while (WiFi.status() != WL_CONNECTED) {
    if (elapsed_ms(::millis(), start_ms) >= timeout_ms) {
      log_printf(logger, LogLevel::kError, kLogTag, "join failed status=%d", static_cast<int>(WiFi.status()));
      WiFi.disconnect();
      return false;
    }
    ::delay(kPollIntervalMs);
  }

  const IPAddress ip = WiFi.localIP();
  log_printf(logger, LogLevel::kInfo, kLogTag, "ip=%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
  return true;
}

} // namespace tbolt::platform
