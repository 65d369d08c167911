/**
 * @file clock.h
 * @brief Millisecond uptime clock shared by the ingest task and loop().
 */
#pragma once

#include <cstdint>

namespace tbolt::platform {

/// Uptime in milliseconds. Wraps after ~49.7 days.
using millis_t = uint32_t;

/**
 * @brief Time elapsed from `since` to `now`, correct across one wrap of millis_t.
 */
inline millis_t elapsed_ms(millis_t now, millis_t since) {
  return static_cast<millis_t>(now - since);
}

/**
 * @brief Uptime source. Implementations must be callable from any task.
 */
struct IClock {
  virtual ~IClock() = default;

  /**
   * @brief Milliseconds since boot.
   */
  virtual millis_t uptime_ms() const = 0;
};

} // namespace tbolt::platform
