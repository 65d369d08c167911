#pragma once

#include <cstddef>
#include <cstdint>

namespace tbolt {

/**
 * Format bytes as space-separated upper-case hex ("8F AB 00").
 * Output is always null-terminated; bytes that do not fit are replaced by
 * a trailing "..". Returns the number of characters written.
 */
size_t format_hex(const uint8_t* data, size_t len, char* out, size_t out_len);

} // namespace tbolt
