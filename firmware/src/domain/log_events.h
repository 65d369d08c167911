#pragma once

#include <cstdint>

namespace tbolt {
namespace domain {

enum class LogEventId : uint16_t {
  FRAME_DROPPED = 0x0101,
  FRAME_OVERFLOW = 0x0102,
  DECODE_TOO_SHORT = 0x0201,
  REPORT_UNRECOGNIZED = 0x0202,
  LINK_CONNECTED = 0x0301,
  LINK_LOST = 0x0302,
  CONFIG_LOADED = 0x0401,
  CONFIG_DEFAULTED = 0x0402,
  HTTP_STATUS = 0x0501,
};

} // namespace domain
} // namespace tbolt
