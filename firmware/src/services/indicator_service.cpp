#include "services/indicator_service.h"

#include "tbolt/platform/clock.h"

namespace tbolt {

constexpr uint32_t IndicatorService::kTickIntervalMs;

IndicatorService::IndicatorService(domain::StatusAggregator& aggregator,
                                   domain::LivenessMonitor& liveness,
                                   IIndicatorOutputs* outputs,
                                   domain::EventLog* events)
    : aggregator_(aggregator), liveness_(liveness), outputs_(outputs), events_(events) {}

void IndicatorService::set_outputs(IIndicatorOutputs* outputs) {
  outputs_ = outputs;
}

void IndicatorService::tick(uint32_t now_ms) {
  domain::DeviceStatus status{};
  aggregator_.expire_if_stale(now_ms, liveness_.threshold_ms(), &status);
  const domain::LinkTransition transition = liveness_.evaluate(status, now_ms);
  connected_ = liveness_.state() == domain::LinkState::Connected;

  if (events_ && transition == domain::LinkTransition::Connected) {
    events_->log(now_ms, domain::LogEventId::LINK_CONNECTED, domain::LogLevel::kInfo);
  } else if (events_ && transition == domain::LinkTransition::Lost) {
    events_->log(now_ms, domain::LogEventId::LINK_LOST, domain::LogLevel::kWarn,
                 platform::elapsed_ms(now_ms, status.last_update_ms));
  }

  // Stale data must not keep the disciplined light on.
  disciplined_ = connected_ && domain::is_disciplined(status);
  if (outputs_) {
    outputs_->set_indicators(disciplined_, connected_);
  }
}

bool IndicatorService::disciplined() const {
  return disciplined_;
}

bool IndicatorService::connected() const {
  return connected_;
}

} // namespace tbolt
