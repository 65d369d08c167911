#include "domain/event_log.h"

namespace tbolt {
namespace domain {

constexpr size_t EventLog::kCapacity;

const char* event_name(LogEventId event_id) {
  switch (event_id) {
    case LogEventId::FRAME_DROPPED:
      return "FRAME_DROPPED";
    case LogEventId::FRAME_OVERFLOW:
      return "FRAME_OVERFLOW";
    case LogEventId::DECODE_TOO_SHORT:
      return "DECODE_TOO_SHORT";
    case LogEventId::REPORT_UNRECOGNIZED:
      return "REPORT_UNRECOGNIZED";
    case LogEventId::LINK_CONNECTED:
      return "LINK_CONNECTED";
    case LogEventId::LINK_LOST:
      return "LINK_LOST";
    case LogEventId::CONFIG_LOADED:
      return "CONFIG_LOADED";
    case LogEventId::CONFIG_DEFAULTED:
      return "CONFIG_DEFAULTED";
    case LogEventId::HTTP_STATUS:
      return "HTTP_STATUS";
  }
  return "UNKNOWN";
}

void EventLog::log(uint32_t t_ms, LogEventId event_id, LogLevel level, uint32_t arg) {
  std::lock_guard<std::mutex> lock(mutex_);
  EventRecord& slot = records_[head_];
  slot.t_ms = t_ms;
  slot.event_id = event_id;
  slot.level = level;
  slot.arg = arg;
  head_ = (head_ + 1) % kCapacity;
  if (size_ < kCapacity) {
    ++size_;
  } else {
    ++dropped_;
  }
}

size_t EventLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return size_;
}

size_t EventLog::capacity() const {
  return kCapacity;
}

uint32_t EventLog::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

void EventLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  head_ = 0;
  size_ = 0;
}

void EventLog::visit_locked(EventCallback cb, void* ctx, size_t max_records) const {
  if (!cb) {
    return;
  }
  const size_t tail = (head_ + kCapacity - size_) % kCapacity;
  const size_t count = max_records < size_ ? max_records : size_;
  for (size_t i = 0; i < count; ++i) {
    cb(ctx, records_[(tail + i) % kCapacity]);
  }
}

void EventLog::for_each_record(EventCallback cb, void* ctx) const {
  std::lock_guard<std::mutex> lock(mutex_);
  visit_locked(cb, ctx, size_);
}

size_t EventLog::drain(EventCallback cb, void* ctx, size_t max_records) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t count = max_records < size_ ? max_records : size_;
  visit_locked(cb, ctx, count);
  // Oldest records sit at the tail; dropping them only shrinks size_.
  size_ -= count;
  return count;
}

} // namespace domain
} // namespace tbolt
