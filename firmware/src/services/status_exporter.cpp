#include "services/status_exporter.h"

#include <cstdio>

#include <ArduinoJson.h>

namespace tbolt {

namespace {

// 14 members plus the two copied time strings.
constexpr size_t kJsonCapacity = JSON_OBJECT_SIZE(14) + 64;

} // namespace

void format_iso8601(const domain::DeviceStatus& status, char* out, size_t out_len) {
  if (!out || out_len == 0) {
    return;
  }
  out[0] = '\0';
  if (!status.has_time) {
    return;
  }
  const protocol::UtcTimestamp& t = status.utc_time;
  std::snprintf(out, out_len, "%04u-%02u-%02uT%02u:%02u:%02uZ",
                static_cast<unsigned>(t.year), static_cast<unsigned>(t.month),
                static_cast<unsigned>(t.day), static_cast<unsigned>(t.hour),
                static_cast<unsigned>(t.minute), static_cast<unsigned>(t.second));
}

void format_clock(const domain::DeviceStatus& status, char* out, size_t out_len) {
  if (!out || out_len == 0) {
    return;
  }
  out[0] = '\0';
  if (!status.has_time) {
    return;
  }
  const protocol::UtcTimestamp& t = status.utc_time;
  std::snprintf(out, out_len, "%02u:%02u:%02u", static_cast<unsigned>(t.hour),
                static_cast<unsigned>(t.minute), static_cast<unsigned>(t.second));
}

size_t render_status_json(const domain::DeviceStatus& status, bool connected, char* out, size_t out_len) {
  if (!out || out_len == 0) {
    return 0;
  }

  char unixtime[24] = {0};
  char clock[12] = {0};
  format_iso8601(status, unixtime, sizeof(unixtime));
  format_clock(status, clock, sizeof(clock));

  StaticJsonDocument<kJsonCapacity> doc;
  doc["connected"] = connected;
  doc["receiver_mode"] = status.receiver_mode;
  doc["discipline_mode"] = status.discipline_mode;
  doc["holdover_duration"] = status.holdover_duration_s;
  doc["gps_status"] = status.gps_status;
  doc["minor_alarms"] = status.minor_alarms;
  doc["critical_alarms"] = status.critical_alarms;
  doc["latitude"] = status.latitude_rad;
  doc["longitude"] = status.longitude_rad;
  doc["altitude"] = status.altitude_m;
  doc["satellites"] = status.satellites_used;
  doc["fix_dim"] = status.fix_dimension;
  // Non-const char* so the document stores copies of the stack buffers.
  doc["unixtime"] = static_cast<char*>(unixtime);
  doc["time"] = static_cast<char*>(clock);

  if (measureJson(doc) + 1 > out_len) {
    out[0] = '\0';
    return 0;
  }
  return serializeJson(doc, out, out_len);
}

size_t render_config_json(const domain::MonitorConfig& config, char* out, size_t out_len) {
  if (!out || out_len == 0) {
    return 0;
  }

  // Strings are const char* into config, so the document stores pointers only.
  StaticJsonDocument<JSON_OBJECT_SIZE(10)> doc;
  doc["SSID"] = static_cast<const char*>(config.ssid);
  doc["hostname"] = static_cast<const char*>(config.hostname);
  doc["web_port"] = config.web_port;
  doc["dhcp"] = config.dhcp;
  doc["ap_mode"] = config.ap_mode;
  doc["ip_address"] = static_cast<const char*>(config.ip_address);
  doc["netmask"] = static_cast<const char*>(config.netmask);
  doc["gateway"] = static_cast<const char*>(config.gateway);
  doc["dns_server"] = static_cast<const char*>(config.dns_server);
  doc["liveness_ms"] = config.liveness_threshold_ms;

  if (measureJson(doc) + 1 > out_len) {
    out[0] = '\0';
    return 0;
  }
  return serializeJson(doc, out, out_len);
}

} // namespace tbolt
