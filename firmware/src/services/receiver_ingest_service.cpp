#include "services/receiver_ingest_service.h"

#include <cstring>

#include "utils/hex_dump.h"

namespace tbolt {

namespace {

constexpr const char* kLogTag = "tsip";
constexpr size_t kHexDumpChars = 96;

} // namespace

constexpr uint32_t ReceiverIngestService::kUartBaud;
constexpr uint16_t ReceiverIngestService::kMaxReadPerTick;

ReceiverIngestService::ReceiverIngestService(domain::StatusAggregator& aggregator,
                                             domain::EventLog* events,
                                             platform::ILogger* logger)
    : aggregator_(aggregator), events_(events), logger_(logger) {}

void ReceiverIngestService::set_io(ISerialSource* io) {
  io_ = io;
}

void ReceiverIngestService::init(int8_t rx_pin, int8_t tx_pin) {
  framer_.reset();
  bytes_rx_ = 0;
  frames_ok_ = 0;
  frames_dropped_ = 0;
  decode_too_short_ = 0;
  unrecognized_ = 0;
  reports_applied_ = 0;
  last_frame_ms_ = 0;
  std::memset(seen_ids_, 0, sizeof(seen_ids_));
  std::memset(seen_subcodes_, 0, sizeof(seen_subcodes_));

  if (!io_ || rx_pin < 0) {
    uart_ready_ = false;
    return;
  }
  uart_ready_ = io_->begin(kUartBaud, rx_pin, tx_pin);
}

bool ReceiverIngestService::uart_ready() const {
  return uart_ready_;
}

bool ReceiverIngestService::mark_seen(uint8_t report_id, uint8_t subcode) {
  uint8_t* bits = seen_ids_;
  uint8_t key = report_id;
  if (report_id == protocol::kIdSuperPacket) {
    bits = seen_subcodes_;
    key = subcode;
  }
  const uint8_t mask = static_cast<uint8_t>(1U << (key & 0x07));
  uint8_t& slot = bits[key >> 3];
  if (slot & mask) {
    return false;
  }
  slot = static_cast<uint8_t>(slot | mask);
  return true;
}

void ReceiverIngestService::note_unrecognized(const protocol::DecodedReport& report,
                                              const protocol::TsipFrameView& frame,
                                              uint32_t now_ms) {
  ++unrecognized_;
  if (!mark_seen(report.report_id, report.subcode)) {
    return;
  }
  const uint32_t key = (static_cast<uint32_t>(report.report_id) << 8) | report.subcode;
  if (events_) {
    events_->log(now_ms, domain::LogEventId::REPORT_UNRECOGNIZED, domain::LogLevel::kDebug, key);
  }

  char hex[kHexDumpChars] = {0};
  format_hex(frame.data, frame.len, hex, sizeof(hex));
  if (logger_) {
    platform::log_printf(*logger_, platform::LogLevel::kDebug, kLogTag, "unhandled id=0x%04lX len=%u: %s",
                         static_cast<unsigned long>(key), static_cast<unsigned>(frame.len), hex);
  }
}

void ReceiverIngestService::handle_frame(const protocol::TsipFrameView& frame, uint32_t now_ms) {
  ++frames_ok_;
  last_frame_ms_ = now_ms;

  protocol::DecodedReport report{};
  const protocol::DecodeError err =
      protocol::decode_report(protocol::ConstByteSpan{frame.data, frame.len}, &report);
  if (err == protocol::DecodeError::TooShort) {
    ++decode_too_short_;
    if (events_) {
      const uint32_t arg = (static_cast<uint32_t>(report.report_id) << 8) | frame.len;
      events_->log(now_ms, domain::LogEventId::DECODE_TOO_SHORT, domain::LogLevel::kWarn, arg);
    }
    return;
  }
  if (err != protocol::DecodeError::Ok) {
    return;
  }
  if (report.kind == protocol::ReportKind::Unrecognized) {
    note_unrecognized(report, frame, now_ms);
    return;
  }

  aggregator_.apply(report, now_ms);
  ++reports_applied_;
}

bool ReceiverIngestService::tick(uint32_t now_ms) {
  if (!uart_ready_ || !io_) {
    return false;
  }

  const int available = io_->available();
  if (available <= 0) {
    return false;
  }

  uint16_t to_read = static_cast<uint16_t>(available > kMaxReadPerTick ? kMaxReadPerTick : available);

  const uint32_t applied_before = reports_applied_;
  for (uint16_t i = 0; i < to_read; ++i) {
    const int c = io_->read_byte();
    if (c < 0) {
      break;
    }
    ++bytes_rx_;

    protocol::TsipFrameView frame{};
    const protocol::TsipFrameStatus status = framer_.push_byte(static_cast<uint8_t>(c), &frame);
    switch (status) {
      case protocol::TsipFrameStatus::FrameOk:
        handle_frame(frame, now_ms);
        break;
      case protocol::TsipFrameStatus::FrameDropped:
      case protocol::TsipFrameStatus::FrameTooShort:
        ++frames_dropped_;
        if (events_) {
          events_->log(now_ms, domain::LogEventId::FRAME_DROPPED, domain::LogLevel::kWarn,
                       static_cast<uint32_t>(status));
        }
        break;
      case protocol::TsipFrameStatus::Overflow:
        ++frames_dropped_;
        if (events_) {
          events_->log(now_ms, domain::LogEventId::FRAME_OVERFLOW, domain::LogLevel::kWarn,
                       protocol::TsipFramer::kMaxFrameLen);
        }
        break;
      case protocol::TsipFrameStatus::None:
      default:
        break;
    }
  }
  return reports_applied_ != applied_before;
}

bool ReceiverIngestService::get_diag(IngestDiag* out) const {
  if (!out) {
    return false;
  }
  out->bytes_rx = bytes_rx_;
  out->frames_ok = frames_ok_;
  out->frames_dropped = frames_dropped_;
  out->desync_bytes = framer_.diag().desync_bytes;
  out->decode_too_short = decode_too_short_;
  out->unrecognized = unrecognized_;
  out->reports_applied = reports_applied_;
  out->last_frame_ms = last_frame_ms_;
  return true;
}

} // namespace tbolt
