#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace synth {

// Utilities for datetime columns.
//
// Convention:
//   Datetimes are carried as int64 seconds since 1970-01-01T00:00:00 (UTC,
//   no leap seconds). Display strings use "M/D/YYYY" with no zero padding.
//
// This header provides:
//   - Conversion between calendar fields and epoch seconds (<chrono>)
//   - Day truncation of epoch seconds
//   - Parsing of common date / date-time spellings
//   - Formatting back to the display string (and an ISO form for I/O)

using SysSeconds = std::chrono::sys_time<std::chrono::seconds>;

// Simple POD struct for broken-down datetime fields.
struct DateTimeParts {
  int year;         // four-digit year
  unsigned month;   // 1–12
  unsigned day;     // 1–31
  int hour;         // 0–23
  int minute;       // 0–59
  int second;       // 0–59
};

// Calendar fields -> epoch seconds. Fields must describe a valid date.
inline std::int64_t to_epoch_seconds(const DateTimeParts& p) {
  using namespace std::chrono;
  const year_month_day ymd{year{p.year}, month{p.month}, day{p.day}};
  const SysSeconds tp = sys_days{ymd} + hours{p.hour} + minutes{p.minute} +
                        seconds{p.second};
  return tp.time_since_epoch().count();
}

// Epoch seconds -> calendar fields.
inline DateTimeParts from_epoch_seconds(std::int64_t secs) {
  using namespace std::chrono;
  const SysSeconds tp{seconds{secs}};
  const auto d = floor<days>(tp);
  const hh_mm_ss<seconds> tod{tp - d};
  const year_month_day ymd{d};

  DateTimeParts p{};
  p.year   = static_cast<int>(ymd.year());
  p.month  = static_cast<unsigned>(ymd.month());
  p.day    = static_cast<unsigned>(ymd.day());
  p.hour   = static_cast<int>(tod.hours().count());
  p.minute = static_cast<int>(tod.minutes().count());
  p.second = static_cast<int>(tod.seconds().count());
  return p;
}

// Drop the time of day (floor to midnight), also for pre-1970 values.
inline std::int64_t truncate_to_day(std::int64_t secs) {
  using namespace std::chrono;
  const auto d = floor<days>(SysSeconds{seconds{secs}});
  return duration_cast<seconds>(d.time_since_epoch()).count();
}

// Parse a date or date-time string into epoch seconds.
//
// Accepted date spellings:
//   YYYY-MM-DD, YYYY/MM/DD, M/D/YYYY, MM-DD-YYYY
// optionally followed by ' ' or 'T' and HH:MM or HH:MM:SS.
// Returns std::nullopt for anything else, including out-of-range fields.
std::optional<std::int64_t> parse_datetime(std::string_view s);

// True if parse_datetime accepts the string.
bool is_datetime(std::string_view s);

// Epoch seconds -> "M/D/YYYY".
std::string format_date(std::int64_t secs);

// Epoch seconds -> "YYYY-MM-DD HH:MM:SS".
std::string format_iso_datetime(std::int64_t secs);

}  // namespace synth
