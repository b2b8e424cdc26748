#include "cairn/common/time.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cairn::common {

namespace {

bool read_digits(const std::string &text, std::size_t pos, std::size_t count, int &out) {
  if (pos + count > text.size()) {
    return false;
  }
  const char *first = text.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + count, out);
  return ec == std::errc() && ptr == first + count;
}

bool expect(const std::string &text, std::size_t pos, char ch) {
  return pos < text.size() && text[pos] == ch;
}

} // namespace

Timestamp system_now() { return std::chrono::system_clock::now(); }

std::string format_iso8601(const Timestamp at) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
  auto seconds = millis / 1000;
  auto fraction = millis % 1000;
  if (fraction < 0) {
    fraction += 1000;
    seconds -= 1;
  }
  const auto t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << fraction << 'Z';
  return out.str();
}

std::string now_iso8601() { return format_iso8601(system_now()); }

std::optional<Timestamp> parse_iso8601(const std::string &text) {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!read_digits(text, 0, 4, year) || !expect(text, 4, '-') ||
      !read_digits(text, 5, 2, month) || !expect(text, 7, '-') ||
      !read_digits(text, 8, 2, day) || !(expect(text, 10, 'T') || expect(text, 10, 't')) ||
      !read_digits(text, 11, 2, hour) || !expect(text, 13, ':') ||
      !read_digits(text, 14, 2, minute) || !expect(text, 16, ':') ||
      !read_digits(text, 17, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  long long nanos = 0;
  if (expect(text, pos, '.')) {
    ++pos;
    const std::size_t start = pos;
    long long scale = 100000000;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      nanos += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
    if (pos == start) {
      return std::nullopt;
    }
  }

  int offset_seconds = 0;
  if (expect(text, pos, 'Z') || expect(text, pos, 'z')) {
    ++pos;
  } else if (expect(text, pos, '+') || expect(text, pos, '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    int off_hours = 0;
    int off_minutes = 0;
    if (!read_digits(text, pos + 1, 2, off_hours) || !expect(text, pos + 3, ':') ||
        !read_digits(text, pos + 4, 2, off_minutes) || off_hours > 23 || off_minutes > 59) {
      return std::nullopt;
    }
    offset_seconds = sign * (off_hours * 3600 + off_minutes * 60);
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const std::time_t utc = timegm(&tm);
  // timegm normalises out-of-range days (Feb 31); reject those.
  if (tm.tm_mday != day || tm.tm_mon != month - 1) {
    return std::nullopt;
  }

  return std::chrono::system_clock::from_time_t(utc - offset_seconds) +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(
             std::chrono::nanoseconds(nanos));
}

} // namespace cairn::common
