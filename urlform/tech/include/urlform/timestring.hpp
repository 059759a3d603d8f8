#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "urlform/simple-charconv.hpp"
#include "urlform/timedef.hpp"

namespace urlform {

/// Writes chars of the representation of a given time point in ISO 8601 UTC format and return
/// a pointer after the last char written. The written format will be:
///   - 'YYYY-MM-DD'
/// The buffer should have a space of at least 10 chars.
constexpr auto DateISO8601UTC(SysTimePoint timePoint, auto out) {
  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{daysFloor};
  out = write4(out, static_cast<int>(ymd.year()));
  *out = '-';
  out = write2(++out, static_cast<unsigned>(ymd.month()));
  *out = '-';
  return write2(++out, static_cast<unsigned>(ymd.day()));
}

/// Writes chars of the representation of a given time point in ISO 8601 UTC format (in millisecond precision) and
/// return a pointer after the last char written. The written format will be:
///   - 'YYYY-MM-DDTHH:MM:SS.sssZ'
/// The buffer should have a space of at least kISO8601WithMsStrLen chars.
constexpr auto TimeToStringISO8601UTCWithMs(SysTimePoint timePoint, auto out) {
  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::milliseconds>(timePoint - daysFloor)};
  out = DateISO8601UTC(timePoint, out);
  *out = 'T';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = '.';
  out = write3(++out, hms.subseconds().count());
  *out = 'Z';
  return ++out;
}

inline constexpr std::size_t kISO8601WithMsStrLen = 24;

inline std::string TimeToStringISO8601UTCWithMs(SysTimePoint timePoint) {
  std::string ret(kISO8601WithMsStrLen, '\0');
  TimeToStringISO8601UTCWithMs(timePoint, ret.data());
  return ret;
}

/// Parse a string representation of a given time point in ISO 8601 (RFC 3339 extended form) and return a
/// time_point. Accepted formats are the following (without offset, the time is considered UTC):
///  - YYYY
///  - YYYY-MM
///  - YYYY-MM-DD
///  - YYYY-MM-DDTHH
///  - YYYY-MM-DDTHH:MM
///  - YYYY-MM-DDTHH:MM:SS
///  - YYYY-MM-DDTHH:MM:SS.s (1 to 9 fractional digits, extra ones ignored)
///  - any of the time forms followed by 'Z', '+HH:MM', '-HH:MM', '+HHMM' or '-HHMM'
/// A space is accepted in place of 'T'.
/// Throws std::invalid_argument if the string does not follow one of these forms or holds an invalid date or time.
SysTimePoint StringToTimeISO8601UTC(std::string_view timeStr);

}  // namespace urlform
