#include "app/app_services.h"

#include <Arduino.h>

#include "hw_profile.h"
#include "platform/arduino_clock.h"
#include "platform/arduino_gpio.h"
#include "platform/arduino_logger.h"
#include "platform/ingest_task.h"
#include "platform/log_export_uart.h"
#include "platform/monitor_storage.h"
#include "platform/network.h"
#include "platform/status_http_server.h"
#include "platform/tsip_uart_source.h"

namespace tbolt {

namespace {

constexpr const char* kFirmwareVersion = "tbolt-mon-1.0";
constexpr const char* kLogTag = "app";
constexpr uint32_t kSummaryPeriodMs = 5000U;
constexpr uint32_t kNetworkTimeoutMs = 20000U;

platform::ArduinoClock clock_;
#if defined(TBOLT_LOG_DEBUG)
platform::ArduinoLogger logger_{platform::LogLevel::kDebug};
#else
platform::ArduinoLogger logger_;
#endif

inline void log_line(const char* msg) {
  logger_.log(platform::LogLevel::kInfo, kLogTag, msg);
}

inline void log_kv(const char* key, const char* value) {
  platform::log_printf(logger_, platform::LogLevel::kInfo, kLogTag, "%s%s", key, value ? value : "-");
}

platform::TsipUartSource& tsip_source() {
  static platform::TsipUartSource source(static_cast<uint8_t>(get_hw_profile().caps.tsip_uart));
  return source;
}

platform::ArduinoIndicatorOutputs& indicator_outputs() {
  const auto& pins = get_hw_profile().pins;
  static platform::ArduinoIndicatorOutputs outputs(pins.led_disciplined, pins.led_connected);
  return outputs;
}

}  // namespace

AppServices::AppServices()
    : ingest_(aggregator_, &events_, &logger_),
      indicators_(aggregator_, liveness_, nullptr, &events_) {}

AppServices::~AppServices() {
  delete http_;
  http_ = nullptr;
}

void AppServices::init() {
  last_indicator_ms_ = 0;
  last_summary_ms_ = 0;

  const auto& profile = get_hw_profile();
  log_line("");
  log_line("=== Thunderbolt monitor ===");
  log_kv("fw: ", kFirmwareVersion);
  log_kv("hw_profile: ", profile.name);

  // --- Config ---
  uint32_t replaced = 0;
  const uint32_t now_ms = clock_.uptime_ms();
  if (!load_monitor_config(&config_, &replaced)) {
    log_line("config: NVS unavailable, using defaults");
  }
  if (replaced != 0) {
    platform::log_printf(logger_, platform::LogLevel::kWarn, kLogTag, "config: defaults applied mask=0x%02lX",
                         static_cast<unsigned long>(replaced));
    events_.log(now_ms, domain::LogEventId::CONFIG_DEFAULTED, domain::LogLevel::kWarn, replaced);
  } else {
    events_.log(now_ms, domain::LogEventId::CONFIG_LOADED, domain::LogLevel::kInfo);
  }
  liveness_.set_threshold_ms(config_.liveness_threshold_ms);

  // --- Indicators and reset button ---
  indicator_outputs().begin();
  indicators_.set_outputs(&indicator_outputs());
  if (profile.caps.has_reset_button && profile.pins.reset_button >= 0) {
    platform::configure_input_pullup(profile.pins.reset_button);
  }

  // --- Receiver ingest ---
  ingest_.set_io(&tsip_source());
  ingest_.init(static_cast<int8_t>(profile.pins.tsip_rx), static_cast<int8_t>(profile.pins.tsip_tx));
  if (!ingest_.uart_ready()) {
    log_line("tsip: serial not available");
  } else {
    ingest_running_ = platform::start_ingest_task(ingest_, clock_);
    log_line(ingest_running_ ? "tsip: ingest task started" : "tsip: ingest task failed");
  }

  // --- Network and HTTP ---
  if (platform::connect_network(config_, logger_, kNetworkTimeoutMs)) {
    http_ = new platform::StatusHttpServer(aggregator_, config_, &events_, logger_);
    http_->begin();
  } else {
    log_line("net: no connection, HTTP disabled");
  }
}

void AppServices::restart() {
  log_line("restarting");
  Serial.flush();
  ESP.restart();
}

void AppServices::log_summary() {
  IngestDiag diag{};
  if (!ingest_.get_diag(&diag)) {
    return;
  }
  const domain::DeviceStatus status = aggregator_.snapshot();
  platform::log_printf(logger_, platform::LogLevel::kInfo, kLogTag,
                       "tsip: rx=%lu ok=%lu drop=%lu desync=%lu short=%lu unk=%lu applied=%lu "
                       "conn=%d disc=%d mode=%u minor=0x%04X crit=0x%04X sats=%u",
                       static_cast<unsigned long>(diag.bytes_rx),
                       static_cast<unsigned long>(diag.frames_ok),
                       static_cast<unsigned long>(diag.frames_dropped),
                       static_cast<unsigned long>(diag.desync_bytes),
                       static_cast<unsigned long>(diag.decode_too_short),
                       static_cast<unsigned long>(diag.unrecognized),
                       static_cast<unsigned long>(diag.reports_applied),
                       indicators_.connected() ? 1 : 0,
                       indicators_.disciplined() ? 1 : 0,
                       static_cast<unsigned>(status.discipline_mode),
                       static_cast<unsigned>(status.minor_alarms),
                       static_cast<unsigned>(status.critical_alarms),
                       static_cast<unsigned>(status.satellites_used));
}

void AppServices::tick(uint32_t now_ms) {
  if (http_) {
    http_->handle_client();
    if (http_->restart_requested()) {
      restart();
    }
  }

  if (platform::elapsed_ms(now_ms, last_indicator_ms_) >= IndicatorService::kTickIntervalMs) {
    last_indicator_ms_ = now_ms;
    indicators_.tick(now_ms);

    const auto& profile = get_hw_profile();
    if (profile.caps.has_reset_button && profile.pins.reset_button >= 0) {
      const bool pressed = !platform::read_digital(profile.pins.reset_button);
      if (reset_button_.sample(pressed)) {
        domain::toggle_ap_mode(&config_);
        log_line(config_.ap_mode ? "reset button held: switching to access point"
                                 : "reset button held: switching to station");
        if (!save_monitor_config(config_)) {
          log_line("config: save failed");
        }
        restart();
      }
    }
  }

  if (platform::elapsed_ms(now_ms, last_summary_ms_) >= kSummaryPeriodMs) {
    last_summary_ms_ = now_ms;
    log_summary();
    platform::drain_events_uart(events_);
  }
}

} // namespace tbolt
