#pragma once

#include <cstddef>
#include <cstdint>

#include "tsip_reports.h"

namespace tbolt {
namespace protocol {

enum class DecodeError {
  Ok = 0,
  ShortBuffer,  ///< Null or empty frame.
  TooShort,     ///< Frame shorter than the fixed layout of its report id.
};

struct ConstByteSpan {
  const uint8_t* data;
  size_t         size;
};

/** Minimum frame lengths (report id byte included). */
constexpr size_t kPrimaryTimingLen   = 18;  ///< 8F-AB
constexpr size_t kSecondaryTimingLen = 61;  ///< 8F-AC up to altitude; 8 reserved bytes follow.
constexpr size_t kDoubleLlaLen       = 25;  ///< 0x84 up to altitude.
constexpr size_t kSatelliteListLen   = 18;  ///< 0x6D without PRN list.

/**
 * Decode one unstuffed TSIP frame.
 *
 * Dispatches on frame[0] (and frame[1] for 0x8F super-packets). Ids outside
 * the handled set are not an error: they return Ok with
 * kind = ReportKind::Unrecognized and report_id/subcode filled in.
 * Fields are read big-endian at fixed offsets; bytes past the layout are
 * ignored.
 */
DecodeError decode_report(ConstByteSpan frame, DecodedReport* out);

/** Map the 0x6D dimension code (bits 0..2) to 0/1/2/3. */
uint8_t fix_dimension_from_code(uint8_t code);

/**
 * Seconds since 1970-01-01 for a proleptic Gregorian UTC date.
 * No range validation; callers check month/day first.
 */
int64_t unix_seconds_from_civil(uint16_t year, uint8_t month, uint8_t day,
                                uint8_t hour, uint8_t minute, uint8_t second);

/** Fill the calendar fields of out from out->unix_seconds. */
void civil_from_unix_seconds(UtcTimestamp* out);

} // namespace protocol
} // namespace tbolt
