#pragma once

// Big-endian field readers shared by the TSIP codecs.
// This header is included only from .cpp files; not part of the public API.

#include <cstdint>
#include <cstring>

namespace tbolt {
namespace protocol {
namespace wire {

inline uint16_t read_u16_be(const uint8_t* src) {
  return static_cast<uint16_t>((static_cast<uint16_t>(src[0]) << 8) |
                               static_cast<uint16_t>(src[1]));
}

inline int16_t read_i16_be(const uint8_t* src) {
  return static_cast<int16_t>(read_u16_be(src));
}

inline uint32_t read_u32_be(const uint8_t* src) {
  return (static_cast<uint32_t>(src[0]) << 24) |
         (static_cast<uint32_t>(src[1]) << 16) |
         (static_cast<uint32_t>(src[2]) << 8) |
         static_cast<uint32_t>(src[3]);
}

inline uint64_t read_u64_be(const uint8_t* src) {
  return (static_cast<uint64_t>(read_u32_be(src)) << 32) |
         static_cast<uint64_t>(read_u32_be(src + 4));
}

// TSIP "Single": IEEE-754 binary32, most significant byte first.
inline float read_f32_be(const uint8_t* src) {
  const uint32_t raw = read_u32_be(src);
  float value = 0.0f;
  std::memcpy(&value, &raw, sizeof(value));
  return value;
}

// TSIP "Double": IEEE-754 binary64, most significant byte first.
inline double read_f64_be(const uint8_t* src) {
  const uint64_t raw = read_u64_be(src);
  double value = 0.0;
  std::memcpy(&value, &raw, sizeof(value));
  return value;
}

} // namespace wire
} // namespace protocol
} // namespace tbolt
