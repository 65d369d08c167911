#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>

#include "domain/log_events.h"

namespace tbolt {
namespace domain {

enum class LogLevel : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct EventRecord {
  uint32_t t_ms = 0;
  LogEventId event_id = LogEventId::FRAME_DROPPED;
  LogLevel level = LogLevel::kInfo;
  uint32_t arg = 0;  ///< Event-specific: report id, byte count, status code.
};

/** Short upper-case name for console output; "UNKNOWN" for unlisted ids. */
const char* event_name(LogEventId event_id);

using EventCallback = void (*)(void* ctx, const EventRecord& record);

/**
 * Fixed-capacity ring of diagnostic events. When full, the oldest record is
 * overwritten. Written from both the ingest task and loop(); every call
 * takes the internal lock, so callbacks must not log back into the ring.
 */
class EventLog {
 public:
  static constexpr size_t kCapacity = 64;

  void log(uint32_t t_ms, LogEventId event_id, LogLevel level, uint32_t arg = 0);

  size_t size() const;
  size_t capacity() const;
  uint32_t dropped() const;
  void clear();

  void for_each_record(EventCallback cb, void* ctx) const;
  /** Pass up to max_records oldest records to cb and remove them. Returns the count. */
  size_t drain(EventCallback cb, void* ctx, size_t max_records = kCapacity);

 private:
  void visit_locked(EventCallback cb, void* ctx, size_t max_records) const;

  mutable std::mutex mutex_;
  EventRecord records_[kCapacity] = {};
  size_t head_ = 0;  // next write slot
  size_t size_ = 0;
  uint32_t dropped_ = 0;
};

} // namespace domain
} // namespace tbolt
