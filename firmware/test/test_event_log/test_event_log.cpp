#include <unity.h>

#include <cstdint>

#include "domain/event_log.h"

using tbolt::domain::EventLog;
using tbolt::domain::EventRecord;
using tbolt::domain::LogEventId;
using tbolt::domain::LogLevel;
using tbolt::domain::event_name;

namespace {

struct TimeCapture {
  uint32_t t_ms[EventLog::kCapacity] = {};
  size_t count = 0;
};

void capture_time(void* ctx, const EventRecord& record) {
  auto* capture = static_cast<TimeCapture*>(ctx);
  if (capture->count < EventLog::kCapacity) {
    capture->t_ms[capture->count++] = record.t_ms;
  }
}

} // namespace

void test_records_kept_in_order() {
  EventLog log;
  log.log(10, LogEventId::LINK_CONNECTED, LogLevel::kInfo);
  log.log(20, LogEventId::FRAME_DROPPED, LogLevel::kWarn, 3);
  log.log(30, LogEventId::LINK_LOST, LogLevel::kWarn, 5001);
  TEST_ASSERT_EQUAL_UINT32(3, log.size());

  TimeCapture capture{};
  log.for_each_record(capture_time, &capture);
  TEST_ASSERT_EQUAL_UINT32(3, capture.count);
  TEST_ASSERT_EQUAL_UINT32(10, capture.t_ms[0]);
  TEST_ASSERT_EQUAL_UINT32(30, capture.t_ms[2]);
  TEST_ASSERT_EQUAL_UINT32(3, log.size());
}

void test_wraparound_overwrites_oldest() {
  EventLog log;
  const size_t total = EventLog::kCapacity + 5;
  for (size_t i = 0; i < total; ++i) {
    log.log(static_cast<uint32_t>(i), LogEventId::FRAME_DROPPED, LogLevel::kWarn);
  }
  TEST_ASSERT_EQUAL_UINT32(EventLog::kCapacity, log.size());
  TEST_ASSERT_EQUAL_UINT32(5, log.dropped());

  TimeCapture capture{};
  log.for_each_record(capture_time, &capture);
  TEST_ASSERT_EQUAL_UINT32(EventLog::kCapacity, capture.count);
  TEST_ASSERT_EQUAL_UINT32(5, capture.t_ms[0]);
  TEST_ASSERT_EQUAL_UINT32(total - 1, capture.t_ms[EventLog::kCapacity - 1]);
}

void test_partial_drain_keeps_newest() {
  EventLog log;
  for (uint32_t i = 0; i < 6; ++i) {
    log.log(i * 100, LogEventId::HTTP_STATUS, LogLevel::kWarn, 404);
  }
  TimeCapture first{};
  TEST_ASSERT_EQUAL_UINT32(4, log.drain(capture_time, &first, 4));
  TEST_ASSERT_EQUAL_UINT32(0, first.t_ms[0]);
  TEST_ASSERT_EQUAL_UINT32(300, first.t_ms[3]);
  TEST_ASSERT_EQUAL_UINT32(2, log.size());

  log.log(600, LogEventId::HTTP_STATUS, LogLevel::kWarn, 400);
  TimeCapture rest{};
  TEST_ASSERT_EQUAL_UINT32(3, log.drain(capture_time, &rest));
  TEST_ASSERT_EQUAL_UINT32(400, rest.t_ms[0]);
  TEST_ASSERT_EQUAL_UINT32(600, rest.t_ms[2]);
  TEST_ASSERT_EQUAL_UINT32(0, log.size());
}

void test_clear_empties_ring() {
  EventLog log;
  log.log(1, LogEventId::CONFIG_LOADED, LogLevel::kInfo);
  log.clear();
  TEST_ASSERT_EQUAL_UINT32(0, log.size());
  TimeCapture capture{};
  TEST_ASSERT_EQUAL_UINT32(0, log.drain(capture_time, &capture));
  TEST_ASSERT_EQUAL_UINT32(0, capture.count);
}

void test_event_names() {
  TEST_ASSERT_EQUAL_STRING("LINK_LOST", event_name(LogEventId::LINK_LOST));
  TEST_ASSERT_EQUAL_STRING("DECODE_TOO_SHORT", event_name(LogEventId::DECODE_TOO_SHORT));
  TEST_ASSERT_EQUAL_STRING("UNKNOWN", event_name(static_cast<LogEventId>(0x7777)));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_records_kept_in_order);
  RUN_TEST(test_wraparound_overwrites_oldest);
  RUN_TEST(test_partial_drain_keeps_newest);
  RUN_TEST(test_clear_empties_ring);
  RUN_TEST(test_event_names);
  return UNITY_END();
}
