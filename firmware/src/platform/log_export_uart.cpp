#include "platform/log_export_uart.h"

#include <Arduino.h>

#include <cstdio>
#include <cstring>

namespace tbolt {
namespace platform {

namespace {

size_t count_digits_u32(uint32_t value) {
  size_t digits = 1;
  while (value >= 10U) {
    value /= 10U;
    ++digits;
  }
  return digits;
}

struct DrainBudget {
  size_t bytes_left = 0;
  size_t records = 0;
  bool full = false;
};

size_t record_line_len(const domain::EventRecord& record) {
  // "EVT t_ms=" + t_ms + " event=" + name + " level=" + level +
  // " arg=0x" + 8 hex digits + "\r\n"
  size_t len = 0;
  len += 9;  // "EVT t_ms="
  len += count_digits_u32(record.t_ms);
  len += 7;  // " event="
  len += std::strlen(domain::event_name(record.event_id));
  len += 7;  // " level="
  len += 1;
  len += 7;  // " arg=0x"
  len += 8;
  len += 2;  // "\r\n"
  return len;
}

void emit_record(void* /*ctx*/, const domain::EventRecord& record) {
  char arg_hex[9] = {0};
  std::snprintf(arg_hex, sizeof(arg_hex), "%08lX", static_cast<unsigned long>(record.arg));
  Serial.print("EVT t_ms=");
  Serial.print(record.t_ms);
  Serial.print(" event=");
  Serial.print(domain::event_name(record.event_id));
  Serial.print(" level=");
  Serial.print(static_cast<uint8_t>(record.level));
  Serial.print(" arg=0x");
  Serial.println(arg_hex);
}

} // namespace

void drain_events_uart(domain::EventLog& events) {
  if (!Serial) {
    return;
  }
  const int writable = Serial.availableForWrite();
  if (writable <= 0) {
    return;
  }

  DrainBudget budget{};
  budget.bytes_left = static_cast<size_t>(writable);
  events.for_each_record(
      [](void* ctx, const domain::EventRecord& record) {
        auto* b = static_cast<DrainBudget*>(ctx);
        if (b->full) {
          return;
        }
        const size_t len = record_line_len(record);
        if (len > b->bytes_left) {
          b->full = true;
          return;
        }
        b->bytes_left -= len;
        ++b->records;
      },
      &budget);

  if (budget.records == 0) {
    return;
  }
  events.drain(emit_record, nullptr, budget.records);
}

} // namespace platform
} // namespace tbolt
