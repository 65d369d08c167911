#include <unity.h>

#include <cstdint>

#include "domain/event_log.h"
#include "domain/liveness_monitor.h"
#include "domain/status_aggregator.h"
#include "services/indicator_service.h"
#include "tbolt/hal/mocks/mock_indicator_outputs.h"

using tbolt::IndicatorService;
using tbolt::MockIndicatorOutputs;
using tbolt::domain::EventLog;
using tbolt::domain::EventRecord;
using tbolt::domain::LivenessMonitor;
using tbolt::domain::LogEventId;
using tbolt::domain::StatusAggregator;
using tbolt::protocol::DecodedReport;
using tbolt::protocol::ReportKind;

namespace {

DecodedReport timing(uint8_t discipline_mode) {
  DecodedReport r{};
  r.kind = ReportKind::Timing;
  r.report_id = 0x8F;
  r.subcode = 0xAC;
  r.timing.discipline_mode = discipline_mode;
  return r;
}

struct EventCapture {
  LogEventId ids[8] = {};
  size_t count = 0;
};

void capture_event(void* ctx, const EventRecord& record) {
  auto* capture = static_cast<EventCapture*>(ctx);
  if (capture->count < 8) {
    capture->ids[capture->count++] = record.event_id;
  }
}

} // namespace

void test_both_off_before_any_report() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  MockIndicatorOutputs outputs;
  IndicatorService service(aggregator, liveness, &outputs, nullptr);

  service.tick(100);
  TEST_ASSERT_EQUAL_UINT32(1, outputs.write_count());
  TEST_ASSERT_FALSE(outputs.connected());
  TEST_ASSERT_FALSE(outputs.disciplined());
}

void test_disciplined_and_connected() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  MockIndicatorOutputs outputs;
  IndicatorService service(aggregator, liveness, &outputs, nullptr);

  aggregator.apply(timing(0), 1000);
  service.tick(1250);
  TEST_ASSERT_TRUE(outputs.connected());
  TEST_ASSERT_TRUE(outputs.disciplined());
}

void test_connected_but_not_disciplined() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  MockIndicatorOutputs outputs;
  IndicatorService service(aggregator, liveness, &outputs, nullptr);

  aggregator.apply(timing(3), 1000);  // holdover
  service.tick(1250);
  TEST_ASSERT_TRUE(outputs.connected());
  TEST_ASSERT_FALSE(outputs.disciplined());
}

void test_stale_turns_both_off_and_clears_aggregator_flag() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  MockIndicatorOutputs outputs;
  IndicatorService service(aggregator, liveness, &outputs, nullptr);

  aggregator.apply(timing(0), 1000);
  service.tick(1000);
  service.tick(1000 + liveness.threshold_ms() + 1);
  TEST_ASSERT_FALSE(outputs.connected());
  TEST_ASSERT_FALSE(outputs.disciplined());
  TEST_ASSERT_FALSE(aggregator.snapshot().connected);
  // Last known mode is kept for the exporter.
  TEST_ASSERT_EQUAL_UINT8(0, aggregator.snapshot().discipline_mode);
}

void test_recovers_on_next_report() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  MockIndicatorOutputs outputs;
  IndicatorService service(aggregator, liveness, &outputs, nullptr);

  aggregator.apply(timing(0), 1000);
  service.tick(10000);
  TEST_ASSERT_FALSE(outputs.connected());

  aggregator.apply(timing(0), 10100);
  TEST_ASSERT_TRUE(aggregator.snapshot().connected);
  service.tick(10250);
  TEST_ASSERT_TRUE(outputs.connected());
  TEST_ASSERT_TRUE(outputs.disciplined());
}

void test_link_events_logged_on_edges() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  MockIndicatorOutputs outputs;
  EventLog events;
  IndicatorService service(aggregator, liveness, &outputs, &events);

  aggregator.apply(timing(0), 1000);
  service.tick(1000);
  service.tick(1250);
  service.tick(7000);
  service.tick(7250);

  EventCapture capture{};
  events.drain(capture_event, &capture);
  TEST_ASSERT_EQUAL_UINT32(2, capture.count);
  TEST_ASSERT_EQUAL(LogEventId::LINK_CONNECTED, capture.ids[0]);
  TEST_ASSERT_EQUAL(LogEventId::LINK_LOST, capture.ids[1]);
}

void test_null_outputs_tolerated() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  IndicatorService service(aggregator, liveness, nullptr, nullptr);
  aggregator.apply(timing(0), 0);
  service.tick(10);
  TEST_ASSERT_TRUE(service.connected());
  TEST_ASSERT_TRUE(service.disciplined());
}

void test_no_reconnect_after_uptime_wrap() {
  StatusAggregator aggregator;
  LivenessMonitor liveness;
  MockIndicatorOutputs outputs;
  EventLog events;
  IndicatorService service(aggregator, liveness, &outputs, &events);

  aggregator.apply(timing(0), 1000);
  service.tick(1000);
  service.tick(7000);
  TEST_ASSERT_FALSE(outputs.connected());

  // millis() wrapped: 2^32 + 2000 ms since the last report.
  service.tick(3000);
  TEST_ASSERT_FALSE(outputs.connected());
  TEST_ASSERT_FALSE(outputs.disciplined());

  EventCapture capture{};
  events.drain(capture_event, &capture);
  TEST_ASSERT_EQUAL_UINT32(2, capture.count);
  TEST_ASSERT_EQUAL(LogEventId::LINK_LOST, capture.ids[1]);
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_both_off_before_any_report);
  RUN_TEST(test_disciplined_and_connected);
  RUN_TEST(test_connected_but_not_disciplined);
  RUN_TEST(test_stale_turns_both_off_and_clears_aggregator_flag);
  RUN_TEST(test_recovers_on_next_report);
  RUN_TEST(test_link_events_logged_on_edges);
  RUN_TEST(test_null_outputs_tolerated);
  RUN_TEST(test_no_reconnect_after_uptime_wrap);
  return UNITY_END();
}
