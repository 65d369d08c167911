#include "platform/status_http_server.h"

#include <Arduino.h>

#include "platform/monitor_storage.h"
#include "services/status_exporter.h"

namespace tbolt::platform {

namespace {

constexpr const char* kLogTag = "http";
constexpr const char* kCtJson = "application/json";
constexpr const char* kCtText = "text/plain";
constexpr const char* kCtHtml = "text/html";

const char kStatusPage[] PROGMEM = R"HTML(<!DOCTYPE html>
<html><head><meta charset="utf-8"><title>Thunderbolt</title>
<style>body{font-family:monospace}td{padding:2px 10px}</style></head>
<body><h3>Thunderbolt monitor</h3><table id="t"></table>
<script>
const deg = r => (r * 180 / Math.PI).toFixed(6);
async function poll() {
  try {
    const s = await (await fetch('/api/status')).json();
    const rows = [
      ['connected', s.connected], ['utc', s.unixtime], ['receiver mode', s.receiver_mode],
      ['discipline mode', s.discipline_mode], ['gps status', s.gps_status],
      ['holdover (s)', s.holdover_duration],
      ['minor alarms', '0x' + s.minor_alarms.toString(16).padStart(4, '0')],
      ['critical alarms', '0x' + s.critical_alarms.toString(16).padStart(4, '0')],
      ['latitude', deg(s.latitude)], ['longitude', deg(s.longitude)],
      ['altitude (m)', s.altitude.toFixed(1)], ['satellites', s.satellites], ['fix', s.fix_dim + 'D']];
    document.getElementById('t').innerHTML =
      rows.map(r => '<tr><td>' + r[0] + '</td><td>' + r[1] + '</td></tr>').join('');
  } catch (e) {}
  setTimeout(poll, 2000);
}
poll();
</script></body></html>
)HTML";

} // namespace

StatusHttpServer::StatusHttpServer(domain::StatusAggregator& aggregator,
                                   domain::MonitorConfig& config,
                                   domain::EventLog* events,
                                   ILogger& logger)
    : server_(config.web_port),
      aggregator_(aggregator),
      config_(config),
      events_(events),
      logger_(logger) {}

void StatusHttpServer::begin() {
  server_.on("/", HTTP_GET, [this]() { handle_root(); });
  server_.on("/thunderbolt.html", HTTP_GET, [this]() { handle_page(); });
  server_.on("/api/status", HTTP_GET, [this]() { handle_status(); });
  server_.on("/api/config", HTTP_GET, [this]() { handle_config_get(); });
  server_.on("/api/config", HTTP_POST, [this]() { handle_config_post(); });
  server_.on("/api/restart", HTTP_POST, [this]() { handle_restart(); });
  server_.onNotFound([this]() { handle_not_found(); });
  server_.begin();

  log_printf(logger_, LogLevel::kInfo, kLogTag, "listening on port %u", static_cast<unsigned>(config_.web_port));
}

void StatusHttpServer::handle_client() {
  server_.handleClient();
}

bool StatusHttpServer::restart_requested() const {
  return restart_requested_;
}

void StatusHttpServer::send_text(int code, const char* body) {
  server_.send(code, kCtText, body);
  if (events_ && code >= 400) {
    events_->log(::millis(), domain::LogEventId::HTTP_STATUS, domain::LogLevel::kWarn,
                 static_cast<uint32_t>(code));
  }
}

void StatusHttpServer::handle_root() {
  server_.sendHeader("Location", "/thunderbolt.html");
  server_.send(301, kCtText, "");
}

void StatusHttpServer::handle_page() {
  server_.send_P(200, kCtHtml, kStatusPage);
}

void StatusHttpServer::handle_status() {
  const domain::DeviceStatus status = aggregator_.snapshot();
  char body[kStatusJsonMaxLen] = {0};
  if (render_status_json(status, status.connected, body, sizeof(body)) == 0) {
    send_text(500, "status too large\r\n");
    return;
  }
  server_.send(200, kCtJson, body);
}

void StatusHttpServer::handle_config_get() {
  char body[kStatusJsonMaxLen] = {0};
  if (render_config_json(config_, body, sizeof(body)) == 0) {
    send_text(500, "config too large\r\n");
    return;
  }
  server_.send(200, kCtJson, body);
}

void StatusHttpServer::handle_config_post() {
  domain::MonitorConfig updated = config_;
  bool dirty = false;
  for (int i = 0; i < server_.args(); ++i) {
    const String key = server_.argName(i);
    const String value = server_.arg(i);
    const domain::ConfigFieldResult result =
        domain::apply_config_field(&updated, key.c_str(), value.c_str());
    if (result == domain::ConfigFieldResult::OutOfRange) {
      send_text(400, "parameter out of range\r\n");
      return;
    }
    if (result == domain::ConfigFieldResult::Applied) {
      dirty = true;
    }
  }

  if (dirty) {
    if (!save_monitor_config(updated)) {
      logger_.log(LogLevel::kError, kLogTag, "config save failed");
      send_text(500, "save failed\r\n");
      return;
    }
    // Network and port changes take effect after a restart.
    config_ = updated;
    logger_.log(LogLevel::kInfo, kLogTag, "config saved");
  }
  send_text(200, "ok\r\n");
}

void StatusHttpServer::handle_restart() {
  send_text(200, "ok\r\n");
  restart_requested_ = true;
}

void StatusHttpServer::handle_not_found() {
  send_text(404, "not found\r\n");
}

} // namespace tbolt::platform
