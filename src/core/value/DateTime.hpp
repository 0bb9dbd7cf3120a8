#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace filemeta {

// Civil date-time. Without utcOffsetMinutes the value is naive and its zone
// is decided by the caller (local time unless told to assume UTC).
struct DateTime {
  int year = 1970;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int microsecond = 0;
  std::optional<int> utcOffsetMinutes;

  bool isNaive() const { return !utcOffsetMinutes.has_value(); }

  bool operator==(const DateTime& o) const {
    return year == o.year && month == o.month && day == o.day &&
           hour == o.hour && minute == o.minute && second == o.second &&
           microsecond == o.microsecond && utcOffsetMinutes == o.utcOffsetMinutes;
  }
  bool operator!=(const DateTime& o) const { return !(*this == o); }
};

// Accepts YYYY-MM-DD with optional [T| ]HH:MM[:SS[.ffffff]] and an optional
// Z / +HH:MM / +HHMM suffix. Throws TypeMismatch on anything else.
DateTime parseIsoDateTime(const std::string& text);

// isoformat-style output; fraction only when non-zero, offset only when aware.
std::string formatIsoDateTime(const DateTime& dt);

// Microseconds since the Unix epoch. Naive values are read as local time,
// or as UTC when assumeUtc is set.
std::int64_t toUnixMicros(const DateTime& dt, bool assumeUtc);

// Inverse of toUnixMicros: aware UTC (+00:00) when utcAware, else naive local.
DateTime fromUnixMicros(std::int64_t micros, bool utcAware);

} // namespace filemeta
