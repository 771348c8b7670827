#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>

#include "internal/util/errors.hpp"

namespace refinery::util {

namespace {

bool ParseDigits(std::string_view s, std::size_t pos, std::size_t count, int* out) {
  if (pos + count > s.size()) return false;
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    value = value * 10 + (s[i] - '0');
  }
  *out = value;
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::string FormatRfc3339(TimePoint tp) {
  const std::time_t secs = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                utc.tm_sec);
  return buf;
}

std::optional<TimePoint> ParseRfc3339(std::string_view s) {
  // YYYY-MM-DDTHH:MM:SS
  int year, month, day, hour, minute, second;
  if (s.size() < 20) return std::nullopt;
  if (!ParseDigits(s, 0, 4, &year) || s[4] != '-' || !ParseDigits(s, 5, 2, &month) || s[7] != '-' || !ParseDigits(s, 8, 2, &day) ||
      (s[10] != 'T' && s[10] != 't') || !ParseDigits(s, 11, 2, &hour) || s[13] != ':' || !ParseDigits(s, 14, 2, &minute) || s[16] != ':' ||
      !ParseDigits(s, 17, 2, &second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  std::size_t pos   = 19;
  int64_t     nanos = 0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (digits < 9) {
        nanos = nanos * 10 + (s[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (; digits < 9; ++digits) nanos *= 10;
  }

  if (pos >= s.size()) return std::nullopt;

  int offset_seconds = 0;
  if (s[pos] == 'Z' || s[pos] == 'z') {
    ++pos;
  } else if (s[pos] == '+' || s[pos] == '-') {
    const int sign = s[pos] == '-' ? -1 : 1;
    int       off_h, off_m;
    if (!ParseDigits(s, pos + 1, 2, &off_h) || pos + 3 >= s.size() || s[pos + 3] != ':' || !ParseDigits(s, pos + 4, 2, &off_m)) {
      return std::nullopt;
    }
    offset_seconds = sign * (off_h * 3600 + off_m * 60);
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  const std::time_t secs = timegm(&tm);
  return Clock::from_time_t(secs - offset_seconds) + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

Duration ParseDuration(std::string_view value) {
  if (value.empty()) {
    throw InvalidArgument("empty duration");
  }

  std::size_t pos      = 0;
  bool        negative = false;
  if (value[0] == '-' || value[0] == '+') {
    negative = value[0] == '-';
    pos      = 1;
  }
  if (value.substr(pos) == "0") {
    return Duration::zero();
  }

  double total_ns = 0;
  bool   any      = false;
  while (pos < value.size()) {
    std::size_t start = pos;
    while (pos < value.size() && (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.')) ++pos;
    if (start == pos) {
      throw InvalidArgument("invalid duration " + std::string(value));
    }
    double number = 0;
    try {
      number = std::stod(std::string(value.substr(start, pos - start)));
    } catch (const std::exception&) {
      throw InvalidArgument("invalid duration " + std::string(value));
    }

    std::size_t unit_start = pos;
    while (pos < value.size() && std::isalpha(static_cast<unsigned char>(value[pos]))) ++pos;
    const auto unit = value.substr(unit_start, pos - unit_start);

    double scale = 0;
    if (unit == "ns") {
      scale = 1;
    } else if (unit == "us") {
      scale = 1e3;
    } else if (unit == "ms") {
      scale = 1e6;
    } else if (unit == "s") {
      scale = 1e9;
    } else if (unit == "m") {
      scale = 60e9;
    } else if (unit == "h") {
      scale = 3600e9;
    } else {
      throw InvalidArgument("unknown unit in duration " + std::string(value));
    }
    total_ns += number * scale;
    any = true;
  }
  if (!any) {
    throw InvalidArgument("invalid duration " + std::string(value));
  }

  auto d = Duration(static_cast<int64_t>(total_ns));
  return negative ? -d : d;
}

std::string FormatDuration(Duration d) {
  using namespace std::chrono;
  std::ostringstream out;
  if (d < Duration::zero()) {
    out << '-';
    d = -d;
  }
  if (d < seconds(1)) {
    out << duration_cast<milliseconds>(d).count() << "ms";
    return out.str();
  }
  const auto h = duration_cast<hours>(d);
  const auto m = duration_cast<minutes>(d - h);
  const auto s = duration_cast<seconds>(d - h - m);
  if (h.count() > 0) out << h.count() << 'h';
  if (h.count() > 0 || m.count() > 0) out << m.count() << 'm';
  out << s.count() << 's';
  return out.str();
}

} // namespace refinery::util
