// time_utils.cpp
//
// Date recognition and formatting for datetime columns.

#include "synth/time_utils.hpp"

#include <cctype>
#include <cstdio>
#include <string>

namespace synth {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

// Reads 1..max_len digits starting at pos; advances pos.
bool read_number(std::string_view s, std::size_t& pos, std::size_t min_len,
                 std::size_t max_len, int& out) {
  std::size_t n = 0;
  int value = 0;
  while (pos + n < s.size() && n < max_len &&
         std::isdigit(static_cast<unsigned char>(s[pos + n]))) {
    value = value * 10 + (s[pos + n] - '0');
    ++n;
  }
  if (n < min_len) return false;
  pos += n;
  out = value;
  return true;
}

bool expect(std::string_view s, std::size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

bool valid_date(int y, int m, int d) {
  using namespace std::chrono;
  if (m < 1 || m > 12 || d < 1 || d > 31) return false;
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(m)},
                           day{static_cast<unsigned>(d)}};
  return ymd.ok();
}

bool parse_date_part(std::string_view s, int& y, int& m, int& d) {
  std::size_t pos = 0;
  int a = 0;
  if (!read_number(s, pos, 1, 4, a)) return false;
  const std::size_t first_len = pos;
  if (pos >= s.size()) return false;
  const char sep = s[pos];
  if (sep != '-' && sep != '/') return false;
  ++pos;

  if (first_len == 4) {
    // YYYY-MM-DD or YYYY/MM/DD
    y = a;
    if (!read_number(s, pos, 1, 2, m)) return false;
    if (!expect(s, pos, sep)) return false;
    if (!read_number(s, pos, 1, 2, d)) return false;
  } else if (first_len <= 2) {
    // M/D/YYYY or MM-DD-YYYY
    m = a;
    if (!read_number(s, pos, 1, 2, d)) return false;
    if (!expect(s, pos, sep)) return false;
    if (!read_number(s, pos, 4, 4, y)) return false;
  } else {
    return false;
  }
  return pos == s.size() && valid_date(y, m, d);
}

bool parse_time_part(std::string_view s, int& hh, int& mm, int& ss) {
  std::size_t pos = 0;
  hh = mm = ss = 0;
  if (!read_number(s, pos, 1, 2, hh)) return false;
  if (!expect(s, pos, ':')) return false;
  if (!read_number(s, pos, 2, 2, mm)) return false;
  if (pos < s.size()) {
    if (!expect(s, pos, ':')) return false;
    if (!read_number(s, pos, 2, 2, ss)) return false;
  }
  if (pos != s.size()) return false;
  return hh <= 23 && mm <= 59 && ss <= 59;
}

}  // namespace

std::optional<std::int64_t> parse_datetime(std::string_view raw) {
  const std::string_view s = trim(raw);
  if (s.empty()) return std::nullopt;

  std::string_view date_part = s;
  std::string_view time_part;
  const std::size_t sep = s.find_first_of(" T");
  if (sep != std::string_view::npos) {
    date_part = s.substr(0, sep);
    time_part = trim(s.substr(sep + 1));
  }

  int y = 0, m = 0, d = 0;
  if (!parse_date_part(date_part, y, m, d)) return std::nullopt;

  int hh = 0, mm = 0, ss = 0;
  if (!time_part.empty() && !parse_time_part(time_part, hh, mm, ss)) {
    return std::nullopt;
  }

  DateTimeParts p{};
  p.year   = y;
  p.month  = static_cast<unsigned>(m);
  p.day    = static_cast<unsigned>(d);
  p.hour   = hh;
  p.minute = mm;
  p.second = ss;
  return to_epoch_seconds(p);
}

bool is_datetime(std::string_view s) { return parse_datetime(s).has_value(); }

std::string format_date(std::int64_t secs) {
  const DateTimeParts p = from_epoch_seconds(secs);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%u/%u/%d", p.month, p.day, p.year);
  return std::string(buf);
}

std::string format_iso_datetime(std::int64_t secs) {
  const DateTimeParts p = from_epoch_seconds(secs);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d", p.year,
                p.month, p.day, p.hour, p.minute, p.second);
  return std::string(buf);
}

}  // namespace synth
