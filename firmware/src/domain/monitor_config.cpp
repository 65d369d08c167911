#include "domain/monitor_config.h"

#include <cstring>

#include "domain/liveness_monitor.h"

namespace tbolt {
namespace domain {

namespace {

constexpr const char* kDefaultSsid = "thunderbolt";
constexpr const char* kDefaultSecret = "thunderbolt";
constexpr const char* kDefaultHostname = "thunderbolt";
constexpr const char* kDefaultIp = "192.168.1.73";
constexpr const char* kDefaultNetmask = "255.255.255.0";
constexpr const char* kDefaultGateway = "192.168.1.1";
constexpr const char* kDefaultDns = "8.8.8.8";

size_t bounded_len(const char* s, size_t max_len) {
  size_t n = 0;
  while (n < max_len && s[n] != '\0') {
    ++n;
  }
  return n;
}

bool length_in_range(const char* s, size_t capacity, size_t min_len, size_t max_len) {
  const size_t n = bounded_len(s, capacity);
  if (n == capacity) {
    return false;  // unterminated
  }
  return n >= min_len && n <= max_len;
}

bool parse_u32(const char* text, uint32_t* out) {
  if (!text || *text == '\0') {
    return false;
  }
  uint32_t value = 0;
  for (const char* p = text; *p != '\0'; ++p) {
    if (*p < '0' || *p > '9') {
      return false;
    }
    const uint32_t digit = static_cast<uint32_t>(*p - '0');
    if (value > (0xFFFFFFFFU - digit) / 10U) {
      return false;
    }
    value = value * 10U + digit;
  }
  *out = value;
  return true;
}

bool parse_flag(const char* text, bool* out) {
  if (std::strcmp(text, "1") == 0) {
    *out = true;
  } else if (std::strcmp(text, "0") == 0) {
    *out = false;
  } else {
    return false;
  }
  return true;
}

} // namespace

bool copy_config_string(char* dst, size_t dst_size, const char* src) {
  if (!dst || dst_size == 0) {
    return false;
  }
  if (!src) {
    dst[0] = '\0';
    return true;
  }
  const size_t n = std::strlen(src);
  const size_t to_copy = n < dst_size ? n : dst_size - 1;
  std::memcpy(dst, src, to_copy);
  dst[to_copy] = '\0';
  return to_copy == n;
}

void default_monitor_config(MonitorConfig* out) {
  if (!out) {
    return;
  }
  *out = MonitorConfig{};
  copy_config_string(out->ssid, sizeof(out->ssid), kDefaultSsid);
  copy_config_string(out->secret, sizeof(out->secret), kDefaultSecret);
  copy_config_string(out->hostname, sizeof(out->hostname), kDefaultHostname);
  out->web_port = kDefaultWebPort;
  out->dhcp = true;
  out->ap_mode = false;
  copy_config_string(out->ip_address, sizeof(out->ip_address), kDefaultIp);
  copy_config_string(out->netmask, sizeof(out->netmask), kDefaultNetmask);
  copy_config_string(out->gateway, sizeof(out->gateway), kDefaultGateway);
  copy_config_string(out->dns_server, sizeof(out->dns_server), kDefaultDns);
  out->liveness_threshold_ms = kDefaultLivenessThresholdMs;
}

void toggle_ap_mode(MonitorConfig* cfg) {
  if (cfg) {
    cfg->ap_mode = !cfg->ap_mode;
  }
}

bool parse_ipv4(const char* text, uint8_t out[4]) {
  if (!text || !out) {
    return false;
  }
  const char* p = text;
  for (int octet = 0; octet < 4; ++octet) {
    if (*p < '0' || *p > '9') {
      return false;
    }
    uint32_t value = 0;
    int digits = 0;
    while (*p >= '0' && *p <= '9') {
      value = value * 10U + static_cast<uint32_t>(*p - '0');
      ++digits;
      ++p;
      if (digits > 3 || value > 255U) {
        return false;
      }
    }
    out[octet] = static_cast<uint8_t>(value);
    if (octet < 3) {
      if (*p != '.') {
        return false;
      }
      ++p;
    }
  }
  return *p == '\0';
}

uint32_t validate_config(const MonitorConfig& cfg) {
  uint32_t invalid = 0;
  if (!length_in_range(cfg.ssid, sizeof(cfg.ssid), 1, kSsidMaxLen)) {
    invalid |= kConfigSsid;
  }
  if (!length_in_range(cfg.secret, sizeof(cfg.secret), kSecretMinLen, kSecretMaxLen)) {
    invalid |= kConfigSecret;
  }
  if (!length_in_range(cfg.hostname, sizeof(cfg.hostname), 1, kHostnameMaxLen)) {
    invalid |= kConfigHostname;
  }
  if (cfg.web_port == 0) {
    invalid |= kConfigWebPort;
  }
  if (!cfg.dhcp) {
    uint8_t scratch[4] = {};
    const bool ok = parse_ipv4(cfg.ip_address, scratch) &&
                    parse_ipv4(cfg.netmask, scratch) &&
                    parse_ipv4(cfg.gateway, scratch) &&
                    parse_ipv4(cfg.dns_server, scratch);
    if (!ok) {
      invalid |= kConfigStaticIp;
    }
  }
  if (cfg.liveness_threshold_ms < kMinLivenessThresholdMs ||
      cfg.liveness_threshold_ms > kMaxLivenessThresholdMs) {
    invalid |= kConfigLiveness;
  }
  return invalid;
}

uint32_t sanitize_config(MonitorConfig* cfg) {
  if (!cfg) {
    return 0;
  }
  const uint32_t invalid = validate_config(*cfg);
  if (invalid == 0) {
    return 0;
  }
  MonitorConfig defaults{};
  default_monitor_config(&defaults);

  if (invalid & kConfigSsid) {
    std::memcpy(cfg->ssid, defaults.ssid, sizeof(cfg->ssid));
  }
  if (invalid & kConfigSecret) {
    std::memcpy(cfg->secret, defaults.secret, sizeof(cfg->secret));
  }
  if (invalid & kConfigHostname) {
    std::memcpy(cfg->hostname, defaults.hostname, sizeof(cfg->hostname));
  }
  if (invalid & kConfigWebPort) {
    cfg->web_port = defaults.web_port;
  }
  if (invalid & kConfigStaticIp) {
    cfg->dhcp = true;
  }
  if (invalid & kConfigLiveness) {
    cfg->liveness_threshold_ms = defaults.liveness_threshold_ms;
  }
  return invalid;
}

ConfigFieldResult apply_config_field(MonitorConfig* cfg, const char* key, const char* value) {
  if (!cfg || !key || !value) {
    return ConfigFieldResult::UnknownKey;
  }
  const size_t len = std::strlen(value);

  if (std::strcmp(key, "SSID") == 0) {
    if (len < 1 || len > kSsidMaxLen) {
      return ConfigFieldResult::OutOfRange;
    }
    copy_config_string(cfg->ssid, sizeof(cfg->ssid), value);
    return ConfigFieldResult::Applied;
  }
  if (std::strcmp(key, "secret") == 0) {
    if (len < kSecretMinLen || len > kSecretMaxLen) {
      return ConfigFieldResult::OutOfRange;
    }
    copy_config_string(cfg->secret, sizeof(cfg->secret), value);
    return ConfigFieldResult::Applied;
  }
  if (std::strcmp(key, "hostname") == 0) {
    if (len < 1 || len > kHostnameMaxLen) {
      return ConfigFieldResult::OutOfRange;
    }
    copy_config_string(cfg->hostname, sizeof(cfg->hostname), value);
    return ConfigFieldResult::Applied;
  }
  if (std::strcmp(key, "web_port") == 0) {
    uint32_t port = 0;
    if (!parse_u32(value, &port) || port < 1 || port > 65535U) {
      return ConfigFieldResult::OutOfRange;
    }
    cfg->web_port = static_cast<uint16_t>(port);
    return ConfigFieldResult::Applied;
  }
  if (std::strcmp(key, "liveness_ms") == 0) {
    uint32_t ms = 0;
    if (!parse_u32(value, &ms) || ms < kMinLivenessThresholdMs || ms > kMaxLivenessThresholdMs) {
      return ConfigFieldResult::OutOfRange;
    }
    cfg->liveness_threshold_ms = ms;
    return ConfigFieldResult::Applied;
  }
  if (std::strcmp(key, "dhcp") == 0) {
    return parse_flag(value, &cfg->dhcp) ? ConfigFieldResult::Applied : ConfigFieldResult::OutOfRange;
  }
  if (std::strcmp(key, "ap_mode") == 0) {
    return parse_flag(value, &cfg->ap_mode) ? ConfigFieldResult::Applied : ConfigFieldResult::OutOfRange;
  }

  struct AddressField {
    const char* key;
    char* dst;
  };
  const AddressField addresses[] = {
      {"ip_address", cfg->ip_address},
      {"netmask", cfg->netmask},
      {"gateway", cfg->gateway},
      {"dns_server", cfg->dns_server},
  };
  for (const AddressField& field : addresses) {
    if (std::strcmp(key, field.key) != 0) {
      continue;
    }
    uint8_t octets[4] = {};
    if (!parse_ipv4(value, octets)) {
      return ConfigFieldResult::OutOfRange;
    }
    copy_config_string(field.dst, kIpv4TextMaxLen + 1, value);
    return ConfigFieldResult::Applied;
  }
  return ConfigFieldResult::UnknownKey;
}

} // namespace domain
} // namespace tbolt
