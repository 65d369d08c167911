#include "domain/liveness_monitor.h"

#include "tbolt/platform/clock.h"

namespace tbolt {
namespace domain {

bool is_connected(bool has_update, uint32_t last_update_ms, uint32_t now_ms, uint32_t threshold_ms) {
  if (!has_update) {
    return false;
  }
  return platform::elapsed_ms(now_ms, last_update_ms) <= threshold_ms;
}

void LivenessMonitor::set_threshold_ms(uint32_t threshold_ms) {
  threshold_ms_ = threshold_ms;
}

uint32_t LivenessMonitor::threshold_ms() const {
  return threshold_ms_;
}

bool LivenessMonitor::is_connected(const DeviceStatus& status, uint32_t now_ms) const {
  return status.connected &&
         domain::is_connected(status.has_update, status.last_update_ms, now_ms, threshold_ms_);
}

LinkTransition LivenessMonitor::evaluate(const DeviceStatus& status, uint32_t now_ms) {
  const LinkState next = is_connected(status, now_ms) ? LinkState::Connected : LinkState::Disconnected;
  if (next == state_) {
    return LinkTransition::None;
  }
  state_ = next;
  return next == LinkState::Connected ? LinkTransition::Connected : LinkTransition::Lost;
}

LinkState LivenessMonitor::state() const {
  return state_;
}

} // namespace domain
} // namespace tbolt
