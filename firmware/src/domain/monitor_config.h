#pragma once

#include <cstddef>
#include <cstdint>

namespace tbolt {
namespace domain {

constexpr size_t kSsidMaxLen = 63;
constexpr size_t kSecretMinLen = 8;
constexpr size_t kSecretMaxLen = 31;
constexpr size_t kHostnameMaxLen = 16;
constexpr size_t kIpv4TextMaxLen = 15;

constexpr uint16_t kDefaultWebPort = 80;
constexpr uint32_t kMinLivenessThresholdMs = 2000;
constexpr uint32_t kMaxLivenessThresholdMs = 30000;

/** Runtime settings persisted in NVS. Strings are null-terminated. */
struct MonitorConfig {
  char ssid[kSsidMaxLen + 1] = {0};
  char secret[kSecretMaxLen + 1] = {0};
  char hostname[kHostnameMaxLen + 1] = {0};
  uint16_t web_port = kDefaultWebPort;
  bool dhcp = true;
  bool ap_mode = false;  ///< Host ssid/secret as an access point instead of joining it.
  char ip_address[kIpv4TextMaxLen + 1] = {0};
  char netmask[kIpv4TextMaxLen + 1] = {0};
  char gateway[kIpv4TextMaxLen + 1] = {0};
  char dns_server[kIpv4TextMaxLen + 1] = {0};
  uint32_t liveness_threshold_ms = 0;
};

/** One bit per field group that failed validation. */
enum ConfigFieldFlag : uint32_t {
  kConfigSsid = 1u << 0,
  kConfigSecret = 1u << 1,
  kConfigHostname = 1u << 2,
  kConfigWebPort = 1u << 3,
  kConfigStaticIp = 1u << 4,
  kConfigLiveness = 1u << 5,
};

void default_monitor_config(MonitorConfig* out);

/** Mask of ConfigFieldFlag bits for every invalid field; 0 when valid. */
uint32_t validate_config(const MonitorConfig& cfg);

/**
 * Replace every out-of-range field with its default.
 * A static-IP setup with any unparsable address falls back to DHCP.
 * Returns a mask of ConfigFieldFlag bits for the fields that were replaced;
 * 0 means the config was already valid.
 */
uint32_t sanitize_config(MonitorConfig* cfg);

enum class ConfigFieldResult : uint8_t {
  Applied = 0,
  UnknownKey,
  OutOfRange,
};

/**
 * Set one field from its text form, as posted to /api/config.
 * Keys: SSID, secret, hostname, web_port, dhcp ("1"/"0"), ap_mode ("1"/"0"),
 * ip_address, netmask, gateway, dns_server, liveness_ms. cfg is untouched unless the
 * result is Applied.
 */
ConfigFieldResult apply_config_field(MonitorConfig* cfg, const char* key, const char* value);

/** Reset-button long press: switch between station and access-point mode. */
void toggle_ap_mode(MonitorConfig* cfg);

/** Parse dotted-quad IPv4 text. */
bool parse_ipv4(const char* text, uint8_t out[4]);

/** Bounded copy that always terminates; returns false if src was truncated. */
bool copy_config_string(char* dst, size_t dst_size, const char* src);

} // namespace domain
} // namespace tbolt
