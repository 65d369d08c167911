#pragma once

#include <cstddef>
#include <cstdint>

#include "../../protocol/tsip_decoder.h"
#include "../../protocol/tsip_framer.h"
#include "domain/event_log.h"
#include "domain/status_aggregator.h"
#include "tbolt/hal/interfaces.h"
#include "tbolt/platform/log.h"

namespace tbolt {

struct IngestDiag {
  uint32_t bytes_rx = 0;
  uint32_t frames_ok = 0;
  uint32_t frames_dropped = 0;  ///< Abandoned, empty or oversized frames.
  uint32_t desync_bytes = 0;
  uint32_t decode_too_short = 0;
  uint32_t unrecognized = 0;
  uint32_t reports_applied = 0;
  uint32_t last_frame_ms = 0;
};

/**
 * Serial bytes -> framer -> decoder -> aggregator.
 * Runs on the ingest task; the only writer of report data into the aggregator.
 */
class ReceiverIngestService {
 public:
  static constexpr uint32_t kUartBaud = 9600U;
  static constexpr uint16_t kMaxReadPerTick = 256U;

  ReceiverIngestService(domain::StatusAggregator& aggregator,
                        domain::EventLog* events,
                        platform::ILogger* logger);

  void set_io(ISerialSource* io);

  /** Open the serial port at 8N1; a negative pin leaves the service idle. */
  void init(int8_t rx_pin, int8_t tx_pin);

  /** Returns true if at least one report was applied. */
  bool tick(uint32_t now_ms);

  bool get_diag(IngestDiag* out) const;
  bool uart_ready() const;

 private:
  void handle_frame(const protocol::TsipFrameView& frame, uint32_t now_ms);
  void note_unrecognized(const protocol::DecodedReport& report,
                         const protocol::TsipFrameView& frame,
                         uint32_t now_ms);
  bool mark_seen(uint8_t report_id, uint8_t subcode);

  domain::StatusAggregator& aggregator_;
  domain::EventLog* events_ = nullptr;
  platform::ILogger* logger_ = nullptr;
  ISerialSource* io_ = nullptr;
  bool uart_ready_ = false;
  protocol::TsipFramer framer_{};

  uint32_t bytes_rx_ = 0;
  uint32_t frames_ok_ = 0;
  uint32_t frames_dropped_ = 0;
  uint32_t decode_too_short_ = 0;
  uint32_t unrecognized_ = 0;
  uint32_t reports_applied_ = 0;
  uint32_t last_frame_ms_ = 0;

  // One bit per plain report id, one per 0x8F subcode.
  uint8_t seen_ids_[32] = {};
  uint8_t seen_subcodes_[32] = {};
};

} // namespace tbolt
