#pragma once

#include <cstdint>
#include <mutex>

#include "../../protocol/tsip_reports.h"
#include "domain/device_status.h"

namespace tbolt {
namespace domain {

/**
 * Owner of the single DeviceStatus. The ingest path is the only caller of
 * apply(); readers get copies from snapshot(). One mutex covers every call,
 * so a snapshot never mixes fields from two applies.
 */
class StatusAggregator {
 public:
  /** Merge the report's fields and stamp now_ms. Unrecognized is a no-op. */
  void apply(const protocol::DecodedReport& report, uint32_t now_ms);

  DeviceStatus snapshot() const;

  /**
   * Clear connected when no report arrived within threshold_ms of now_ms.
   * Check and clear share the lock with apply(), so a report landing during
   * the liveness tick is never overwritten. Once cleared, only apply() sets
   * connected again. out, if given, receives the state after the check.
   * Returns true when this call cleared it.
   */
  bool expire_if_stale(uint32_t now_ms, uint32_t threshold_ms, DeviceStatus* out = nullptr);

  uint32_t apply_count() const;

 private:
  void apply_timing(const protocol::TimingReport& timing);
  void apply_time(const protocol::TimeReport& time);
  void apply_position(const protocol::PositionReport& position);
  void apply_satellites(const protocol::SatelliteReport& satellites);

  mutable std::mutex mutex_;
  DeviceStatus status_{};
  uint32_t apply_count_ = 0;
};

} // namespace domain
} // namespace tbolt
