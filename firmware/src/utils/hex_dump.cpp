#include "utils/hex_dump.h"

namespace tbolt {

size_t format_hex(const uint8_t* data, size_t len, char* out, size_t out_len) {
  if (!out || out_len == 0) {
    return 0;
  }
  out[0] = '\0';
  if (!data || len == 0) {
    return 0;
  }

  static const char kDigits[] = "0123456789ABCDEF";
  constexpr size_t kEllipsisLen = 2;
  size_t pos = 0;
  for (size_t i = 0; i < len; ++i) {
    const size_t needed = (i == 0) ? 2 : 3;
    const bool last = (i + 1 == len);
    // Leave room for " .." unless this byte is the final one.
    const size_t reserve = last ? 0 : kEllipsisLen + 1;
    if (pos + needed + reserve >= out_len) {
      if (pos + kEllipsisLen + 1 < out_len) {
        if (pos > 0) {
          out[pos++] = ' ';
        }
        out[pos++] = '.';
        out[pos++] = '.';
      }
      break;
    }
    if (i > 0) {
      out[pos++] = ' ';
    }
    out[pos++] = kDigits[(data[i] >> 4) & 0x0F];
    out[pos++] = kDigits[data[i] & 0x0F];
  }
  out[pos] = '\0';
  return pos;
}

} // namespace tbolt
