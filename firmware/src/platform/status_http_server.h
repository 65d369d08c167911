#pragma once

#include <cstdint>

#include <WebServer.h>

#include "domain/event_log.h"
#include "domain/monitor_config.h"
#include "domain/status_aggregator.h"
#include "tbolt/platform/log.h"

namespace tbolt::platform {

/**
 * HTTP front end on the ESP32 WebServer. Runs from loop() only.
 *
 *   GET  /                  301 -> /thunderbolt.html
 *   GET  /thunderbolt.html  status page
 *   GET  /api/status        render_status_json
 *   GET  /api/config        render_config_json (no secret)
 *   POST /api/config        form fields via apply_config_field, saved to NVS
 *   POST /api/restart       reboot after the response is sent
 *   anything else           404
 */
class StatusHttpServer {
 public:
  StatusHttpServer(domain::StatusAggregator& aggregator,
                   domain::MonitorConfig& config,
                   domain::EventLog* events,
                   ILogger& logger);

  void begin();
  void handle_client();
  bool restart_requested() const;

 private:
  void handle_root();
  void handle_page();
  void handle_status();
  void handle_config_get();
  void handle_config_post();
  void handle_restart();
  void handle_not_found();
  void send_text(int code, const char* body);

  WebServer server_;
  domain::StatusAggregator& aggregator_;
  domain::MonitorConfig& config_;
  domain::EventLog* events_ = nullptr;
  ILogger& logger_;
  bool restart_requested_ = false;
};

} // namespace tbolt::platform
