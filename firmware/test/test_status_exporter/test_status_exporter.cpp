#include <unity.h>

#include <cstdint>
#include <cstring>

#include <ArduinoJson.h>

#include "domain/device_status.h"
#include "domain/monitor_config.h"
#include "services/status_exporter.h"

using tbolt::domain::DeviceStatus;
using tbolt::domain::MonitorConfig;
using tbolt::domain::default_monitor_config;
using tbolt::kStatusJsonMaxLen;
using tbolt::render_config_json;
using tbolt::render_status_json;

namespace {

DeviceStatus sample_status() {
  DeviceStatus s{};
  s.receiver_mode = 7;
  s.discipline_mode = 0;
  s.holdover_duration_s = 15;
  s.gps_status = 0;
  s.minor_alarms = 0x0008;
  s.critical_alarms = 0;
  s.latitude_rad = 0.75;
  s.longitude_rad = -1.5;
  s.altitude_m = 123.5;
  s.satellites_used = 9;
  s.fix_dimension = 3;
  s.has_update = true;
  return s;
}

} // namespace

void test_status_fields_and_names() {
  char out[kStatusJsonMaxLen] = {0};
  const size_t len = render_status_json(sample_status(), true, out, sizeof(out));
  TEST_ASSERT_TRUE(len > 0);
  TEST_ASSERT_EQUAL_UINT32(std::strlen(out), len);

  StaticJsonDocument<768> doc;
  TEST_ASSERT_FALSE(deserializeJson(doc, out));
  TEST_ASSERT_TRUE(doc["connected"].as<bool>());
  TEST_ASSERT_EQUAL_INT(7, doc["receiver_mode"].as<int>());
  TEST_ASSERT_EQUAL_INT(0, doc["discipline_mode"].as<int>());
  TEST_ASSERT_EQUAL_INT(15, doc["holdover_duration"].as<int>());
  TEST_ASSERT_EQUAL_INT(0, doc["gps_status"].as<int>());
  TEST_ASSERT_EQUAL_INT(8, doc["minor_alarms"].as<int>());
  TEST_ASSERT_EQUAL_INT(0, doc["critical_alarms"].as<int>());
  TEST_ASSERT_EQUAL_FLOAT(0.75f, doc["latitude"].as<float>());
  TEST_ASSERT_EQUAL_FLOAT(-1.5f, doc["longitude"].as<float>());
  TEST_ASSERT_EQUAL_FLOAT(123.5f, doc["altitude"].as<float>());
  TEST_ASSERT_EQUAL_INT(9, doc["satellites"].as<int>());
  TEST_ASSERT_EQUAL_INT(3, doc["fix_dim"].as<int>());
}

void test_time_strings_empty_before_time_report() {
  char out[kStatusJsonMaxLen] = {0};
  TEST_ASSERT_TRUE(render_status_json(sample_status(), false, out, sizeof(out)) > 0);

  StaticJsonDocument<768> doc;
  TEST_ASSERT_FALSE(deserializeJson(doc, out));
  TEST_ASSERT_FALSE(doc["connected"].as<bool>());
  TEST_ASSERT_EQUAL_STRING("", doc["unixtime"].as<const char*>());
  TEST_ASSERT_EQUAL_STRING("", doc["time"].as<const char*>());
}

void test_time_string_formats() {
  DeviceStatus s = sample_status();
  s.has_time = true;
  s.utc_time.year = 2024;
  s.utc_time.month = 2;
  s.utc_time.day = 29;
  s.utc_time.hour = 7;
  s.utc_time.minute = 5;
  s.utc_time.second = 9;

  char out[kStatusJsonMaxLen] = {0};
  TEST_ASSERT_TRUE(render_status_json(s, true, out, sizeof(out)) > 0);
  StaticJsonDocument<768> doc;
  TEST_ASSERT_FALSE(deserializeJson(doc, out));
  TEST_ASSERT_EQUAL_STRING("2024-02-29T07:05:09Z", doc["unixtime"].as<const char*>());
  TEST_ASSERT_EQUAL_STRING("07:05:09", doc["time"].as<const char*>());
}

void test_unknown_mode_exported_as_255() {
  DeviceStatus s{};
  char out[kStatusJsonMaxLen] = {0};
  TEST_ASSERT_TRUE(render_status_json(s, false, out, sizeof(out)) > 0);
  StaticJsonDocument<768> doc;
  TEST_ASSERT_FALSE(deserializeJson(doc, out));
  TEST_ASSERT_EQUAL_INT(255, doc["discipline_mode"].as<int>());
}

void test_small_buffer_returns_zero() {
  char out[32] = {'x'};
  TEST_ASSERT_EQUAL_UINT32(0, render_status_json(sample_status(), true, out, sizeof(out)));
  TEST_ASSERT_EQUAL_CHAR('\0', out[0]);
  TEST_ASSERT_EQUAL_UINT32(0, render_status_json(sample_status(), true, nullptr, 64));
}

void test_config_json_omits_secret() {
  MonitorConfig config{};
  default_monitor_config(&config);
  char out[kStatusJsonMaxLen] = {0};
  TEST_ASSERT_TRUE(render_config_json(config, out, sizeof(out)) > 0);
  TEST_ASSERT_NULL(std::strstr(out, "secret"));

  StaticJsonDocument<768> doc;
  TEST_ASSERT_FALSE(deserializeJson(doc, out));
  TEST_ASSERT_EQUAL_STRING("thunderbolt", doc["SSID"].as<const char*>());
  TEST_ASSERT_EQUAL_STRING("thunderbolt", doc["hostname"].as<const char*>());
  TEST_ASSERT_EQUAL_INT(80, doc["web_port"].as<int>());
  TEST_ASSERT_TRUE(doc["dhcp"].as<bool>());
  TEST_ASSERT_FALSE(doc["ap_mode"].as<bool>());
  TEST_ASSERT_EQUAL_INT(5000, doc["liveness_ms"].as<int>());

  config.ap_mode = true;
  TEST_ASSERT_TRUE(render_config_json(config, out, sizeof(out)) > 0);
  TEST_ASSERT_NOT_NULL(std::strstr(out, "\"ap_mode\":true"));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_status_fields_and_names);
  RUN_TEST(test_time_strings_empty_before_time_report);
  RUN_TEST(test_time_string_formats);
  RUN_TEST(test_unknown_mode_exported_as_255);
  RUN_TEST(test_small_buffer_returns_zero);
  RUN_TEST(test_config_json_omits_secret);
  return UNITY_END();
}
