#pragma once

#include <cstddef>
#include <cstdint>

namespace tbolt {
namespace protocol {

/**
 * Report identifiers handled by the monitor (Thunderbolt TSIP).
 *
 * 0x8F is a super-packet id; the byte after it selects the report.
 * Every other id on the wire decodes to ReportKind::Unrecognized.
 */
constexpr uint8_t kIdSatelliteSelection = 0x6D;
constexpr uint8_t kIdDoubleLlaPosition  = 0x84;
constexpr uint8_t kIdSuperPacket        = 0x8F;
constexpr uint8_t kSubPrimaryTiming     = 0xAB;
constexpr uint8_t kSubSecondaryTiming   = 0xAC;

/** Placeholder for mode fields that no report has set yet. */
constexpr uint8_t kModeUnknown = 0xFF;

/** discipline_mode value meaning the oscillator is locked to GPS. */
constexpr uint8_t kDisciplineNormal = 0;

/** 8F-AB timing flag bits. */
constexpr uint8_t kTimingFlagUtc        = 0x01;  ///< 1 = calendar fields are UTC, 0 = GPS time.
constexpr uint8_t kTimingFlagTimeNotSet = 0x04;
constexpr uint8_t kTimingFlagNoUtcInfo  = 0x08;

/**
 * Alarm bitmasks from 8F-AC. Each bit is an independent condition; several
 * may be raised at once.
 */
namespace alarms {

constexpr uint16_t kMinorOscRail              = 0x0001;
constexpr uint16_t kMinorAntennaOpen          = 0x0002;
constexpr uint16_t kMinorAntennaShorted       = 0x0004;
constexpr uint16_t kMinorNoSatellites         = 0x0008;
constexpr uint16_t kMinorUndisciplined        = 0x0010;
constexpr uint16_t kMinorSurveyInProgress     = 0x0020;
constexpr uint16_t kMinorNoStoredPosition     = 0x0040;
constexpr uint16_t kMinorLeapSecondPending    = 0x0080;
constexpr uint16_t kMinorTestMode             = 0x0100;
constexpr uint16_t kMinorPositionQuestionable = 0x0200;
constexpr uint16_t kMinorStorageError         = 0x0400;
constexpr uint16_t kMinorNoAlmanac            = 0x0800;

constexpr uint16_t kCriticalRomChecksum    = 0x0001;
constexpr uint16_t kCriticalRam            = 0x0002;
constexpr uint16_t kCriticalPowerSupply    = 0x0004;
constexpr uint16_t kCriticalFpga           = 0x0008;
constexpr uint16_t kCriticalOscillatorRail = 0x0010;

} // namespace alarms

struct UtcTimestamp {
  uint16_t year = 0;
  uint8_t  month = 0;
  uint8_t  day = 0;
  uint8_t  hour = 0;
  uint8_t  minute = 0;
  uint8_t  second = 0;
  int64_t  unix_seconds = 0;
};

struct PositionReport {
  double latitude_rad = 0.0;
  double longitude_rad = 0.0;
  double altitude_m = 0.0;
};

/** 8F-AC secondary timing: receiver health, alarms and stored position. */
struct TimingReport {
  uint8_t  receiver_mode = 0;
  uint8_t  discipline_mode = 0;
  uint8_t  survey_progress = 0;      ///< Self-survey progress, percent.
  uint32_t holdover_duration_s = 0;
  uint16_t critical_alarms = 0;
  uint16_t minor_alarms = 0;
  uint8_t  gps_status = 0;
  uint8_t  discipline_activity = 0;
  float    pps_offset_ns = 0.0f;
  float    osc_offset_ppb = 0.0f;
  uint32_t dac_value = 0;
  float    dac_voltage = 0.0f;
  float    temperature_c = 0.0f;
  PositionReport position{};
};

/** 8F-AB primary timing. */
struct TimeReport {
  UtcTimestamp utc_time{};
  uint32_t time_of_week_s = 0;
  uint16_t week_number = 0;
  int16_t  utc_offset_s = 0;
  uint8_t  timing_flags = 0;
};

/** 0x6D all-in-view satellite selection. */
struct SatelliteReport {
  static constexpr size_t kMaxPrns = 12;

  uint8_t satellites_used = 0;
  uint8_t fix_dimension = 0;  ///< 0 = none, 1 = clock-only, 2 = 2-D, 3 = 3-D.
  float   pdop = 0.0f;
  float   hdop = 0.0f;
  float   vdop = 0.0f;
  float   tdop = 0.0f;
  uint8_t prn_count = 0;
  int8_t  prns[kMaxPrns] = {};  ///< Negative PRN = tracked but not used.
};

enum class ReportKind : uint8_t {
  Unrecognized = 0,
  Timing,
  Time,
  Position,
  Satellite,
};

/**
 * One decoded TSIP report. Only the member matching kind is meaningful;
 * the others keep their defaults.
 */
struct DecodedReport {
  ReportKind kind = ReportKind::Unrecognized;
  uint8_t report_id = 0;
  uint8_t subcode = 0;  ///< Second byte of 0x8F super-packets, else 0.

  TimingReport timing{};
  TimeReport time{};
  PositionReport position{};
  SatelliteReport satellites{};
};

} // namespace protocol
} // namespace tbolt
