#pragma once

#include <cstdint>

#include "domain/event_log.h"
#include "domain/liveness_monitor.h"
#include "domain/monitor_config.h"
#include "domain/reset_button.h"
#include "domain/status_aggregator.h"
#include "services/indicator_service.h"
#include "services/receiver_ingest_service.h"

namespace tbolt {

namespace platform {
class StatusHttpServer;
}

class AppServices {
 public:
  AppServices();
  ~AppServices();
  AppServices(const AppServices&) = delete;
  AppServices& operator=(const AppServices&) = delete;
  void init();

  /** loop() side: HTTP, indicators, reset button, console summary. */
  void tick(uint32_t now_ms);

 private:
  void log_summary();
  void restart();

  uint32_t last_indicator_ms_ = 0;
  uint32_t last_summary_ms_ = 0;
  bool ingest_running_ = false;
  domain::MonitorConfig config_{};
  domain::EventLog events_;
  domain::StatusAggregator aggregator_;
  domain::LivenessMonitor liveness_;
  domain::ResetButton reset_button_;
  ReceiverIngestService ingest_;
  IndicatorService indicators_;
  platform::StatusHttpServer* http_ = nullptr;
};

} // namespace tbolt
