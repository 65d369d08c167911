#include "domain/status_aggregator.h"

#include "domain/liveness_monitor.h"

namespace tbolt {
namespace domain {

void StatusAggregator::apply(const protocol::DecodedReport& report, uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (report.kind) {
    case protocol::ReportKind::Timing:
      apply_timing(report.timing);
      break;
    case protocol::ReportKind::Time:
      apply_time(report.time);
      break;
    case protocol::ReportKind::Position:
      apply_position(report.position);
      break;
    case protocol::ReportKind::Satellite:
      apply_satellites(report.satellites);
      break;
    case protocol::ReportKind::Unrecognized:
    default:
      return;
  }
  status_.has_update = true;
  status_.last_update_ms = now_ms;
  // A fresh report is proof of life; going stale is the liveness tick's job.
  status_.connected = true;
  ++apply_count_;
}

DeviceStatus StatusAggregator::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

bool StatusAggregator::expire_if_stale(uint32_t now_ms, uint32_t threshold_ms, DeviceStatus* out) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool expired = false;
  if (status_.connected &&
      !is_connected(status_.has_update, status_.last_update_ms, now_ms, threshold_ms)) {
    status_.connected = false;
    expired = true;
  }
  if (out) {
    *out = status_;
  }
  return expired;
}

uint32_t StatusAggregator::apply_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return apply_count_;
}

void StatusAggregator::apply_timing(const protocol::TimingReport& timing) {
  status_.receiver_mode = timing.receiver_mode;
  status_.discipline_mode = timing.discipline_mode;
  status_.survey_progress = timing.survey_progress;
  status_.holdover_duration_s = timing.holdover_duration_s;
  status_.critical_alarms = timing.critical_alarms;
  status_.minor_alarms = timing.minor_alarms;
  status_.gps_status = timing.gps_status;
  status_.discipline_activity = timing.discipline_activity;
  status_.pps_offset_ns = timing.pps_offset_ns;
  status_.osc_offset_ppb = timing.osc_offset_ppb;
  status_.dac_value = timing.dac_value;
  status_.dac_voltage = timing.dac_voltage;
  status_.temperature_c = timing.temperature_c;
  apply_position(timing.position);
}

void StatusAggregator::apply_time(const protocol::TimeReport& time) {
  status_.has_time = true;
  status_.utc_time = time.utc_time;
  status_.timing_flags = time.timing_flags;
}

void StatusAggregator::apply_position(const protocol::PositionReport& position) {
  status_.latitude_rad = position.latitude_rad;
  status_.longitude_rad = position.longitude_rad;
  status_.altitude_m = position.altitude_m;
}

void StatusAggregator::apply_satellites(const protocol::SatelliteReport& satellites) {
  status_.satellites_used = satellites.satellites_used;
  status_.fix_dimension = satellites.fix_dimension;
  status_.pdop = satellites.pdop;
}

} // namespace domain
} // namespace tbolt
