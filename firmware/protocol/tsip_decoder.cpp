#include "tsip_decoder.h"
#include "tsip_wire.h"

namespace tbolt {
namespace protocol {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Days since 1970-01-01 (H. Hinnant's days_from_civil).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool calendar_fields_valid(const UtcTimestamp& t) {
  return t.month >= 1 && t.month <= 12 && t.day >= 1 && t.day <= 31 &&
         t.hour <= 23 && t.minute <= 59 && t.second <= 60;
}

DecodeError decode_primary_timing(ConstByteSpan in, TimeReport* out) {
  if (in.size < kPrimaryTimingLen) {
    return DecodeError::TooShort;
  }
  const uint8_t* p = in.data;
  out->time_of_week_s = wire::read_u32_be(p + 2);
  out->week_number = wire::read_u16_be(p + 6);
  out->utc_offset_s = wire::read_i16_be(p + 8);
  out->timing_flags = p[10];

  UtcTimestamp& t = out->utc_time;
  t.second = p[11];
  t.minute = p[12];
  t.hour = p[13];
  t.day = p[14];
  t.month = p[15];
  t.year = wire::read_u16_be(p + 16);
  if (!calendar_fields_valid(t)) {
    // Receiver has no time yet; keep the raw fields, no absolute value.
    t.unix_seconds = 0;
    return DecodeError::Ok;
  }

  t.unix_seconds = unix_seconds_from_civil(t.year, t.month, t.day, t.hour, t.minute, t.second);
  if ((out->timing_flags & kTimingFlagUtc) == 0) {
    // Calendar fields are GPS time, which runs ahead of UTC by the leap offset.
    t.unix_seconds -= out->utc_offset_s;
    civil_from_unix_seconds(&t);
  }
  return DecodeError::Ok;
}

DecodeError decode_secondary_timing(ConstByteSpan in, TimingReport* out) {
  if (in.size < kSecondaryTimingLen) {
    return DecodeError::TooShort;
  }
  const uint8_t* p = in.data;
  out->receiver_mode = p[2];
  out->discipline_mode = p[3];
  out->survey_progress = p[4];
  out->holdover_duration_s = wire::read_u32_be(p + 5);
  out->critical_alarms = wire::read_u16_be(p + 9);
  out->minor_alarms = wire::read_u16_be(p + 11);
  out->gps_status = p[13];
  out->discipline_activity = p[14];
  // p[15], p[16]: spare status bytes.
  out->pps_offset_ns = wire::read_f32_be(p + 17);
  out->osc_offset_ppb = wire::read_f32_be(p + 21);
  out->dac_value = wire::read_u32_be(p + 25);
  out->dac_voltage = wire::read_f32_be(p + 29);
  out->temperature_c = wire::read_f32_be(p + 33);
  out->position.latitude_rad = wire::read_f64_be(p + 37);
  out->position.longitude_rad = wire::read_f64_be(p + 45);
  out->position.altitude_m = wire::read_f64_be(p + 53);
  return DecodeError::Ok;
}

DecodeError decode_double_lla(ConstByteSpan in, PositionReport* out) {
  if (in.size < kDoubleLlaLen) {
    return DecodeError::TooShort;
  }
  out->latitude_rad = wire::read_f64_be(in.data + 1);
  out->longitude_rad = wire::read_f64_be(in.data + 9);
  out->altitude_m = wire::read_f64_be(in.data + 17);
  return DecodeError::Ok;
}

DecodeError decode_satellite_list(ConstByteSpan in, SatelliteReport* out) {
  if (in.size < kSatelliteListLen) {
    return DecodeError::TooShort;
  }
  const uint8_t* p = in.data;
  // Bits 0..2 fix dimension, bit 3 auto/manual, bits 4..7 satellite count.
  out->fix_dimension = fix_dimension_from_code(static_cast<uint8_t>(p[1] & 0x07));
  out->satellites_used = static_cast<uint8_t>(p[1] >> 4);
  out->pdop = wire::read_f32_be(p + 2);
  out->hdop = wire::read_f32_be(p + 6);
  out->vdop = wire::read_f32_be(p + 10);
  out->tdop = wire::read_f32_be(p + 14);

  size_t available = in.size - kSatelliteListLen;
  size_t count = out->satellites_used;
  if (count > available) {
    count = available;
  }
  if (count > SatelliteReport::kMaxPrns) {
    count = SatelliteReport::kMaxPrns;
  }
  for (size_t i = 0; i < count; ++i) {
    out->prns[i] = static_cast<int8_t>(p[kSatelliteListLen + i]);
  }
  out->prn_count = static_cast<uint8_t>(count);
  return DecodeError::Ok;
}

} // namespace

uint8_t fix_dimension_from_code(uint8_t code) {
  switch (code) {
    case 1:  // 1-D clock fix
    case 5:  // over-determined clock
      return 1;
    case 3:
      return 2;
    case 4:
      return 3;
    default:
      return 0;
  }
}

int64_t unix_seconds_from_civil(uint16_t year, uint8_t month, uint8_t day,
                                uint8_t hour, uint8_t minute, uint8_t second) {
  return days_from_civil(year, month, day) * kSecondsPerDay +
         static_cast<int64_t>(hour) * 3600 +
         static_cast<int64_t>(minute) * 60 +
         static_cast<int64_t>(second);
}

void civil_from_unix_seconds(UtcTimestamp* out) {
  if (!out) {
    return;
  }
  int64_t days = out->unix_seconds / kSecondsPerDay;
  int64_t secs = out->unix_seconds % kSecondsPerDay;
  if (secs < 0) {
    secs += kSecondsPerDay;
    --days;
  }
  out->hour = static_cast<uint8_t>(secs / 3600);
  out->minute = static_cast<uint8_t>((secs % 3600) / 60);
  out->second = static_cast<uint8_t>(secs % 60);

  // H. Hinnant's civil_from_days.
  const int64_t z = days + 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const int64_t y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
  out->year = static_cast<uint16_t>(y);
  out->month = static_cast<uint8_t>(m);
  out->day = static_cast<uint8_t>(d);
}

DecodeError decode_report(ConstByteSpan frame, DecodedReport* out) {
  if (!frame.data || !out || frame.size == 0) {
    return DecodeError::ShortBuffer;
  }

  *out = DecodedReport{};
  out->report_id = frame.data[0];

  switch (out->report_id) {
    case kIdSuperPacket: {
      if (frame.size < 2) {
        return DecodeError::TooShort;
      }
      out->subcode = frame.data[1];
      if (out->subcode == kSubPrimaryTiming) {
        out->kind = ReportKind::Time;
        return decode_primary_timing(frame, &out->time);
      }
      if (out->subcode == kSubSecondaryTiming) {
        out->kind = ReportKind::Timing;
        return decode_secondary_timing(frame, &out->timing);
      }
      return DecodeError::Ok;
    }
    case kIdDoubleLlaPosition:
      out->kind = ReportKind::Position;
      return decode_double_lla(frame, &out->position);
    case kIdSatelliteSelection:
      out->kind = ReportKind::Satellite;
      return decode_satellite_list(frame, &out->satellites);
    default:
      return DecodeError::Ok;
  }
}

} // namespace protocol
} // namespace tbolt
