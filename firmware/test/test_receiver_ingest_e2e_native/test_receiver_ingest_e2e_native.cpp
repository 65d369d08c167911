#include <unity.h>

#include <cstdint>
#include <cstring>
#include <vector>

#include "domain/event_log.h"
#include "domain/liveness_monitor.h"
#include "domain/status_aggregator.h"
#include "services/indicator_service.h"
#include "services/receiver_ingest_service.h"
#include "services/status_exporter.h"
#include "tbolt/hal/mocks/mock_indicator_outputs.h"
#include "tbolt/hal/mocks/mock_logger.h"
#include "tbolt/hal/mocks/mock_serial_source.h"

using tbolt::IndicatorService;
using tbolt::IngestDiag;
using tbolt::MockIndicatorOutputs;
using tbolt::MockLogger;
using tbolt::MockSerialSource;
using tbolt::ReceiverIngestService;
using tbolt::domain::DeviceStatus;
using tbolt::domain::EventLog;
using tbolt::domain::EventRecord;
using tbolt::domain::LivenessMonitor;
using tbolt::domain::LogEventId;
using tbolt::domain::StatusAggregator;
using tbolt::platform::LogLevel;

namespace {

constexpr int8_t kRxPin = 16;
constexpr int8_t kTxPin = 17;

void put_u16_be(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v >> 8);
  p[1] = static_cast<uint8_t>(v & 0xFF);
}

void put_f64_be(uint8_t* p, double v) {
  uint64_t raw = 0;
  std::memcpy(&raw, &v, sizeof(raw));
  for (int i = 0; i < 8; ++i) {
    p[i] = static_cast<uint8_t>(raw >> (56 - 8 * i));
  }
}

std::vector<uint8_t> stuff(const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> out;
  out.push_back(0x10);
  for (uint8_t b : payload) {
    out.push_back(b);
    if (b == 0x10) {
      out.push_back(0x10);
    }
  }
  out.push_back(0x10);
  out.push_back(0x03);
  return out;
}

// 8F-AC with holdover 0x10 so the frame carries a stuffed DLE.
std::vector<uint8_t> secondary_timing_frame(uint8_t discipline_mode, uint16_t minor_alarms) {
  std::vector<uint8_t> p(69, 0);
  p[0] = 0x8F;
  p[1] = 0xAC;
  p[2] = 7;
  p[3] = discipline_mode;
  p[8] = 0x10;
  put_u16_be(&p[11], minor_alarms);
  put_f64_be(&p[37], 0.6);
  put_f64_be(&p[45], -1.4);
  put_f64_be(&p[53], 250.0);
  return stuff(p);
}

struct Rig {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  EventLog events;
  MockLogger logger;
  MockSerialSource serial;
  MockIndicatorOutputs outputs;
  ReceiverIngestService ingest{aggregator, &events, &logger};
  IndicatorService indicators{aggregator, liveness, &outputs, &events};

  Rig() {
    ingest.set_io(&serial);
    ingest.init(kRxPin, kTxPin);
  }

  void inject(const std::vector<uint8_t>& bytes) {
    TEST_ASSERT_TRUE(serial.inject(bytes.data(), bytes.size()));
  }
};

struct EventCapture {
  LogEventId ids[16] = {};
  uint32_t args[16] = {};
  size_t count = 0;
};

void capture_event(void* ctx, const EventRecord& record) {
  auto* capture = static_cast<EventCapture*>(ctx);
  if (capture->count < 16) {
    capture->ids[capture->count] = record.event_id;
    capture->args[capture->count] = record.arg;
    ++capture->count;
  }
}

} // namespace

void test_init_opens_serial_at_9600() {
  Rig rig;
  TEST_ASSERT_TRUE(rig.serial.begun());
  TEST_ASSERT_EQUAL_UINT32(9600, rig.serial.baud());
  TEST_ASSERT_TRUE(rig.ingest.uart_ready());
}

void test_disciplined_frame_lights_both_indicators() {
  Rig rig;
  rig.inject(secondary_timing_frame(0, 0x0008));
  TEST_ASSERT_TRUE(rig.ingest.tick(1000));
  rig.indicators.tick(1100);

  TEST_ASSERT_TRUE(rig.outputs.connected());
  TEST_ASSERT_TRUE(rig.outputs.disciplined());

  const DeviceStatus s = rig.aggregator.snapshot();
  TEST_ASSERT_EQUAL_UINT16(8, s.minor_alarms);
  TEST_ASSERT_EQUAL_UINT32(0x10, s.holdover_duration_s);
  TEST_ASSERT_TRUE(s.altitude_m == 250.0);

  char json[tbolt::kStatusJsonMaxLen] = {0};
  TEST_ASSERT_TRUE(tbolt::render_status_json(s, s.connected, json, sizeof(json)) > 0);
  TEST_ASSERT_NOT_NULL(std::strstr(json, "\"minor_alarms\":8"));
  TEST_ASSERT_NOT_NULL(std::strstr(json, "\"connected\":true"));
}

void test_frame_split_across_ticks() {
  Rig rig;
  const std::vector<uint8_t> wire = secondary_timing_frame(0, 0);
  const size_t half = wire.size() / 2;
  rig.inject(std::vector<uint8_t>(wire.begin(), wire.begin() + half));
  TEST_ASSERT_FALSE(rig.ingest.tick(100));
  TEST_ASSERT_FALSE(rig.aggregator.snapshot().has_update);

  rig.inject(std::vector<uint8_t>(wire.begin() + half, wire.end()));
  TEST_ASSERT_TRUE(rig.ingest.tick(200));
  TEST_ASSERT_EQUAL_UINT32(200, rig.aggregator.snapshot().last_update_ms);
}

void test_link_lost_after_silence() {
  Rig rig;
  rig.inject(secondary_timing_frame(0, 0));
  rig.ingest.tick(1000);
  rig.indicators.tick(1000);
  TEST_ASSERT_TRUE(rig.outputs.disciplined());

  rig.indicators.tick(1000 + rig.liveness.threshold_ms() + 1);
  TEST_ASSERT_FALSE(rig.outputs.connected());
  TEST_ASSERT_FALSE(rig.outputs.disciplined());
}

void test_read_capped_per_tick() {
  Rig rig;
  std::vector<uint8_t> wire;
  while (wire.size() < ReceiverIngestService::kMaxReadPerTick + 50) {
    const std::vector<uint8_t> frame = secondary_timing_frame(0, 0);
    wire.insert(wire.end(), frame.begin(), frame.end());
  }
  rig.inject(wire);
  rig.ingest.tick(10);

  IngestDiag diag{};
  TEST_ASSERT_TRUE(rig.ingest.get_diag(&diag));
  TEST_ASSERT_EQUAL_UINT32(ReceiverIngestService::kMaxReadPerTick, diag.bytes_rx);
  TEST_ASSERT_EQUAL_INT(static_cast<int>(wire.size() - ReceiverIngestService::kMaxReadPerTick),
                        rig.serial.available());
}

void test_unrecognized_reported_once_per_id() {
  Rig rig;
  const std::vector<uint8_t> health = stuff({0x46, 0x00, 0x00});
  rig.inject(health);
  rig.inject(health);
  rig.inject(stuff({0x8F, 0xA7, 0x01}));
  rig.ingest.tick(10);

  IngestDiag diag{};
  rig.ingest.get_diag(&diag);
  TEST_ASSERT_EQUAL_UINT32(3, diag.unrecognized);
  TEST_ASSERT_EQUAL_UINT32(0, diag.reports_applied);
  TEST_ASSERT_FALSE(rig.aggregator.snapshot().has_update);

  EventCapture capture{};
  rig.events.drain(capture_event, &capture);
  TEST_ASSERT_EQUAL_UINT32(2, capture.count);
  TEST_ASSERT_EQUAL(LogEventId::REPORT_UNRECOGNIZED, capture.ids[0]);
  TEST_ASSERT_EQUAL_HEX32(0x4600, capture.args[0]);
  TEST_ASSERT_EQUAL_HEX32(0x8FA7, capture.args[1]);

  TEST_ASSERT_EQUAL_UINT32(2, rig.logger.count_at(LogLevel::kDebug));
  TEST_ASSERT_NOT_NULL(std::strstr(rig.logger.last_msg(), "8F A7 01"));
}

void test_truncated_report_counted_and_dropped() {
  Rig rig;
  std::vector<uint8_t> short_timing(30, 0);
  short_timing[0] = 0x8F;
  short_timing[1] = 0xAC;
  rig.inject(stuff(short_timing));
  TEST_ASSERT_FALSE(rig.ingest.tick(10));

  IngestDiag diag{};
  rig.ingest.get_diag(&diag);
  TEST_ASSERT_EQUAL_UINT32(1, diag.frames_ok);
  TEST_ASSERT_EQUAL_UINT32(1, diag.decode_too_short);
  TEST_ASSERT_FALSE(rig.aggregator.snapshot().has_update);

  EventCapture capture{};
  rig.events.drain(capture_event, &capture);
  TEST_ASSERT_EQUAL_UINT32(1, capture.count);
  TEST_ASSERT_EQUAL(LogEventId::DECODE_TOO_SHORT, capture.ids[0]);
}

void test_garbage_then_valid_frame_resyncs() {
  Rig rig;
  std::vector<uint8_t> wire = {0x55, 0xAA, 0x10, 0x8F, 0x01};  // partial frame
  const std::vector<uint8_t> good = secondary_timing_frame(0, 0);
  wire.insert(wire.end(), good.begin(), good.end());
  rig.inject(wire);
  TEST_ASSERT_TRUE(rig.ingest.tick(10));

  IngestDiag diag{};
  rig.ingest.get_diag(&diag);
  TEST_ASSERT_EQUAL_UINT32(2, diag.desync_bytes);
  TEST_ASSERT_EQUAL_UINT32(1, diag.frames_dropped);
  TEST_ASSERT_EQUAL_UINT32(1, diag.reports_applied);
}

void test_no_serial_pin_leaves_service_idle() {
  StatusAggregator aggregator;
  MockSerialSource serial;
  ReceiverIngestService ingest(aggregator, nullptr, nullptr);
  ingest.set_io(&serial);
  ingest.init(-1, -1);
  TEST_ASSERT_FALSE(ingest.uart_ready());
  TEST_ASSERT_FALSE(serial.begun());

  const std::vector<uint8_t> frame = secondary_timing_frame(0, 0);
  serial.inject(frame.data(), frame.size());
  TEST_ASSERT_FALSE(ingest.tick(10));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_init_opens_serial_at_9600);
  RUN_TEST(test_disciplined_frame_lights_both_indicators);
  RUN_TEST(test_frame_split_across_ticks);
  RUN_TEST(test_link_lost_after_silence);
  RUN_TEST(test_read_capped_per_tick);
  RUN_TEST(test_unrecognized_reported_once_per_id);
  RUN_TEST(test_truncated_report_counted_and_dropped);
  RUN_TEST(test_garbage_then_valid_frame_resyncs);
  RUN_TEST(test_no_serial_pin_leaves_service_idle);
  return UNITY_END();
}
