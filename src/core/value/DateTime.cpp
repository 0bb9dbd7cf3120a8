#include "DateTime.hpp"

#include <cstdio>
#include <ctime>

#include "core/errors/Errors.hpp"

namespace filemeta {

// ---------- helpers ----------

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Reads exactly n digits at pos; advances pos.
static bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (size_t i = 0; i < n; ++i) {
    char c = s[pos + i];
    if (!is_digit(c)) return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  pos += n;
  return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
  if (pos < s.size() && s[pos] == c) { ++pos; return true; }
  return false;
}

static int days_in_month(int year, int month) {
  static const int k[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return (month == 2 && leap) ? 29 : k[month - 1];
}

[[noreturn]] static void bad_date(const std::string& text) {
  throw TypeMismatch("not an ISO-8601 date/time: '" + text + "'");
}

static std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

// ---------- parse / format ----------

DateTime parseIsoDateTime(const std::string& text) {
  DateTime dt;
  size_t pos = 0;
  if (!read_digits(text, pos, 4, dt.year) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, dt.month) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, dt.day)) {
    bad_date(text);
  }

  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    ++pos;
    if (!read_digits(text, pos, 2, dt.hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, dt.minute)) {
      bad_date(text);
    }
    if (expect(text, pos, ':')) {
      if (!read_digits(text, pos, 2, dt.second)) bad_date(text);
      if (expect(text, pos, '.')) {
        // up to 6 fractional digits are kept, the rest truncated
        size_t start = pos;
        int micros = 0, ndigits = 0;
        while (pos < text.size() && is_digit(text[pos])) {
          if (ndigits < 6) { micros = micros * 10 + (text[pos] - '0'); ++ndigits; }
          ++pos;
        }
        if (pos == start) bad_date(text);
        while (ndigits++ < 6) micros *= 10;
        dt.microsecond = micros;
      }
    }

    if (pos < text.size()) {
      char c = text[pos];
      if (c == 'Z' || c == 'z') {
        dt.utcOffsetMinutes = 0;
        ++pos;
      } else if (c == '+' || c == '-') {
        ++pos;
        int oh = 0, om = 0;
        if (!read_digits(text, pos, 2, oh)) bad_date(text);
        expect(text, pos, ':');
        if (!read_digits(text, pos, 2, om)) bad_date(text);
        if (oh > 23 || om > 59) bad_date(text);
        int off = oh * 60 + om;
        dt.utcOffsetMinutes = (c == '-') ? -off : off;
      }
    }
  }

  if (pos != text.size()) bad_date(text);
  if (dt.month < 1 || dt.month > 12 || dt.day < 1 ||
      dt.day > days_in_month(dt.year, dt.month) || dt.hour > 23 ||
      dt.minute > 59 || dt.second > 60) {
    bad_date(text);
  }
  return dt;
}

std::string formatIsoDateTime(const DateTime& dt) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                        dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
  std::string out(buf, static_cast<size_t>(n));
  if (dt.microsecond != 0) {
    n = std::snprintf(buf, sizeof(buf), ".%06d", dt.microsecond);
    out.append(buf, static_cast<size_t>(n));
  }
  if (dt.utcOffsetMinutes) {
    int off = *dt.utcOffsetMinutes;
    char sign = off < 0 ? '-' : '+';
    if (off < 0) off = -off;
    n = std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, off / 60, off % 60);
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

// ---------- absolute time ----------

std::int64_t toUnixMicros(const DateTime& dt, bool assumeUtc) {
  std::tm tm{};
  tm.tm_year = dt.year - 1900;
  tm.tm_mon  = dt.month - 1;
  tm.tm_mday = dt.day;
  tm.tm_hour = dt.hour;
  tm.tm_min  = dt.minute;
  tm.tm_sec  = dt.second;

  std::int64_t secs = 0;
  if (dt.utcOffsetMinutes) {
    secs = static_cast<std::int64_t>(timegm(&tm)) -
           static_cast<std::int64_t>(*dt.utcOffsetMinutes) * 60;
  } else if (assumeUtc) {
    secs = static_cast<std::int64_t>(timegm(&tm));
  } else {
    tm.tm_isdst = -1;
    secs = static_cast<std::int64_t>(mktime(&tm));
  }
  return secs * 1000000 + dt.microsecond;
}

DateTime fromUnixMicros(std::int64_t micros, bool utcAware) {
  std::int64_t secs = floor_div(micros, 1000000);
  int frac = static_cast<int>(micros - secs * 1000000);
  std::time_t t = static_cast<std::time_t>(secs);

  std::tm tm{};
  if (utcAware) {
    gmtime_r(&t, &tm);
  } else {
    localtime_r(&t, &tm);
  }

  DateTime dt;
  dt.year = tm.tm_year + 1900;
  dt.month = tm.tm_mon + 1;
  dt.day = tm.tm_mday;
  dt.hour = tm.tm_hour;
  dt.minute = tm.tm_min;
  dt.second = tm.tm_sec;
  dt.microsecond = frac;
  if (utcAware) dt.utcOffsetMinutes = 0;
  return dt;
}

} // namespace filemeta
