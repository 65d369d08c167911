#pragma once

#include <cstdint>

#include "domain/event_log.h"
#include "domain/liveness_monitor.h"
#include "domain/status_aggregator.h"
#include "tbolt/hal/interfaces.h"

namespace tbolt {

/**
 * Periodic liveness check plus the two status LEDs.
 * Runs from loop(); the ingest task never touches the outputs.
 */
class IndicatorService {
 public:
  static constexpr uint32_t kTickIntervalMs = 250U;

  IndicatorService(domain::StatusAggregator& aggregator,
                   domain::LivenessMonitor& liveness,
                   IIndicatorOutputs* outputs,
                   domain::EventLog* events);

  void set_outputs(IIndicatorOutputs* outputs);

  /** Expire a stale link in the aggregator, then drive the LEDs from the result. */
  void tick(uint32_t now_ms);

  bool disciplined() const;
  bool connected() const;

 private:
  domain::StatusAggregator& aggregator_;
  domain::LivenessMonitor& liveness_;
  IIndicatorOutputs* outputs_ = nullptr;
  domain::EventLog* events_ = nullptr;
  bool disciplined_ = false;
  bool connected_ = false;
};

} // namespace tbolt
