#pragma once

#include <cstdint>

#include "domain/device_status.h"

namespace tbolt {
namespace domain {

/** Five missed reports at the receiver's 1 Hz cadence. */
constexpr uint32_t kDefaultLivenessThresholdMs = 5000;

/**
 * True once a report has been applied and no more than threshold_ms have
 * passed since. Unsigned difference: correct across an uptime wrap, but a
 * silence of 2^32 ms or more aliases to a short one. Callers that track a
 * link use LivenessMonitor, which also requires DeviceStatus::connected.
 */
bool is_connected(bool has_update, uint32_t last_update_ms, uint32_t now_ms, uint32_t threshold_ms);

enum class LinkState : uint8_t {
  Disconnected = 0,
  Connected,
};

enum class LinkTransition : uint8_t {
  None = 0,
  Connected,
  Lost,
};

class LivenessMonitor {
 public:
  void set_threshold_ms(uint32_t threshold_ms);
  uint32_t threshold_ms() const;

  /** Requires status.connected, so an expired link stays down until the next apply. */
  bool is_connected(const DeviceStatus& status, uint32_t now_ms) const;

  /** Re-evaluate against a snapshot; reports the edge, if any. */
  LinkTransition evaluate(const DeviceStatus& status, uint32_t now_ms);
  LinkState state() const;

 private:
  uint32_t threshold_ms_ = kDefaultLivenessThresholdMs;
  LinkState state_ = LinkState::Disconnected;
};

} // namespace domain
} // namespace tbolt
