#include "platform/monitor_storage.h"

#include <Preferences.h>

namespace tbolt {

namespace {

constexpr char kNamespace[] = "tbolt";
constexpr char kKeySsid[] = "ssid";
constexpr char kKeySecret[] = "secret";
constexpr char kKeyHostname[] = "hostname";
constexpr char kKeyWebPort[] = "web_port";
constexpr char kKeyDhcp[] = "dhcp";
constexpr char kKeyApMode[] = "ap_mode";
constexpr char kKeyIp[] = "ip";
constexpr char kKeyNetmask[] = "netmask";
constexpr char kKeyGateway[] = "gateway";
constexpr char kKeyDns[] = "dns";
constexpr char kKeyLivenessMs[] = "live_ms";

constexpr uint32_t kAllFields = domain::kConfigSsid | domain::kConfigSecret | domain::kConfigHostname |
                                domain::kConfigWebPort | domain::kConfigStaticIp | domain::kConfigLiveness;

// Keeps the default when the key is absent; reports it as replaced.
void load_string(Preferences& prefs, const char* key, char* dst, size_t dst_size,
                 uint32_t flag, uint32_t* missing) {
  if (!prefs.isKey(key)) {
    *missing |= flag;
    return;
  }
  const size_t len = prefs.getString(key, dst, dst_size);
  if (len == 0) {
    *missing |= flag;
  }
}

} // namespace

bool load_monitor_config(domain::MonitorConfig* out, uint32_t* replaced) {
  if (!out || !replaced) {
    return false;
  }
  domain::default_monitor_config(out);
  *replaced = 0;

  Preferences prefs;
  if (!prefs.begin(kNamespace, true)) {  // read-only
    *replaced = kAllFields;
    return false;
  }

  uint32_t missing = 0;
  load_string(prefs, kKeySsid, out->ssid, sizeof(out->ssid), domain::kConfigSsid, &missing);
  load_string(prefs, kKeySecret, out->secret, sizeof(out->secret), domain::kConfigSecret, &missing);
  load_string(prefs, kKeyHostname, out->hostname, sizeof(out->hostname), domain::kConfigHostname, &missing);

  if (prefs.isKey(kKeyWebPort)) {
    out->web_port = prefs.getUShort(kKeyWebPort, out->web_port);
  } else {
    missing |= domain::kConfigWebPort;
  }

  out->dhcp = prefs.getBool(kKeyDhcp, true);
  out->ap_mode = prefs.getBool(kKeyApMode, false);
  load_string(prefs, kKeyIp, out->ip_address, sizeof(out->ip_address), 0, &missing);
  load_string(prefs, kKeyNetmask, out->netmask, sizeof(out->netmask), 0, &missing);
  load_string(prefs, kKeyGateway, out->gateway, sizeof(out->gateway), 0, &missing);
  load_string(prefs, kKeyDns, out->dns_server, sizeof(out->dns_server), 0, &missing);

  if (prefs.isKey(kKeyLivenessMs)) {
    out->liveness_threshold_ms = prefs.getUInt(kKeyLivenessMs, out->liveness_threshold_ms);
  } else {
    missing |= domain::kConfigLiveness;
  }

  prefs.end();
  *replaced = missing | domain::sanitize_config(out);
  return true;
}

bool save_monitor_config(const domain::MonitorConfig& config) {
  Preferences prefs;
  if (!prefs.begin(kNamespace, false)) {  // read-write
    return false;
  }

  bool ok = true;
  ok = prefs.putString(kKeySsid, config.ssid) > 0 && ok;
  ok = prefs.putString(kKeySecret, config.secret) > 0 && ok;
  ok = prefs.putString(kKeyHostname, config.hostname) > 0 && ok;
  ok = prefs.putUShort(kKeyWebPort, config.web_port) > 0 && ok;
  ok = prefs.putBool(kKeyDhcp, config.dhcp) > 0 && ok;
  ok = prefs.putBool(kKeyApMode, config.ap_mode) > 0 && ok;
  ok = prefs.putString(kKeyIp, config.ip_address) > 0 && ok;
  ok = prefs.putString(kKeyNetmask, config.netmask) > 0 && ok;
  ok = prefs.putString(kKeyGateway, config.gateway) > 0 && ok;
  ok = prefs.putString(kKeyDns, config.dns_server) > 0 && ok;
  ok = prefs.putUInt(kKeyLivenessMs, config.liveness_threshold_ms) > 0 && ok;

  prefs.end();
  return ok;
}

} // namespace tbolt
