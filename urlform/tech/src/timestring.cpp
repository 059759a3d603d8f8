#include "urlform/timestring.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "urlform/cctype.hpp"
#include "urlform/log.hpp"
#include "urlform/simple-charconv.hpp"
#include "urlform/timedef.hpp"

namespace urlform {

namespace {

// Reads a 2-digit field preceded by 'sep' at 'ptr', advancing it. Returns -1 if absent or malformed.
int ReadSeparatedField(const char*& ptr, const char* endPtr, char sep) {
  if (endPtr - ptr < 3 || *ptr != sep || !AllDigits(ptr + 1, 2)) {
    return -1;
  }
  const int value = read2(ptr + 1);
  ptr += 3;
  return value;
}

[[noreturn]] void ThrowInvalid(std::string_view timeStr, const char* reason) {
  log::error("Invalid ISO8601 time string '{}': {}", timeStr, reason);
  throw std::invalid_argument(reason);
}

}  // namespace

SysTimePoint StringToTimeISO8601UTC(std::string_view timeStr) {
  const char* ptr = timeStr.data();
  const char* endPtr = timeStr.data() + timeStr.size();
  if (timeStr.size() < 4 || !AllDigits(ptr, 4)) [[unlikely]] {
    ThrowInvalid(timeStr, "ISO8601 Time string too short");
  }

  std::chrono::year year(read4(ptr));
  ptr += 4;

  int month = 1;
  int day = 1;
  int hours = 0;
  int minutes = 0;
  int seconds = 0;
  bool hasTime = false;

  if (ptr != endPtr && *ptr == '-') {
    month = ReadSeparatedField(ptr, endPtr, '-');
    if (month < 0) {
      ThrowInvalid(timeStr, "Invalid month in ISO8601 Time string");
    }
    if (ptr != endPtr && *ptr == '-') {
      day = ReadSeparatedField(ptr, endPtr, '-');
      if (day < 0) {
        ThrowInvalid(timeStr, "Invalid day in ISO8601 Time string");
      }
      if (ptr != endPtr && (*ptr == 'T' || *ptr == 't' || *ptr == ' ')) {
        hours = ReadSeparatedField(ptr, endPtr, *ptr);
        if (hours < 0) {
          ThrowInvalid(timeStr, "Invalid hours in ISO8601 Time string");
        }
        hasTime = true;
        if (ptr != endPtr && *ptr == ':') {
          minutes = ReadSeparatedField(ptr, endPtr, ':');
          if (ptr != endPtr && *ptr == ':' && minutes >= 0) {
            seconds = ReadSeparatedField(ptr, endPtr, ':');
          }
          if (minutes < 0 || seconds < 0) {
            ThrowInvalid(timeStr, "Invalid minutes or seconds in ISO8601 Time string");
          }
        }
      }
    }
  }

  const std::chrono::year_month_day ymd{year, std::chrono::month(static_cast<unsigned>(month)),
                                        std::chrono::day(static_cast<unsigned>(day))};

  // NOLINTNEXTLINE(readability-simplify-boolean-expr)
  if (!ymd.ok() || hours > 23 || minutes > 59 || seconds > 60) [[unlikely]] {  // 60 is possible with leap second
    ThrowInvalid(timeStr, "Invalid date or time in ISO8601 Time string");
  }

  SysTimePoint ts = std::chrono::sys_days{ymd} + std::chrono::hours{hours} + std::chrono::minutes{minutes} +
                    std::chrono::seconds{seconds};

  if (hasTime && ptr != endPtr && (*ptr == '.' || *ptr == ',')) {
    ++ptr;
    int64_t nanos = 0;
    int nbDigits = 0;
    for (; ptr != endPtr && isdigit(*ptr); ++ptr) {
      if (nbDigits < 9) {
        nanos = (nanos * 10) + (*ptr - '0');
        ++nbDigits;
      }
    }
    if (nbDigits == 0) {
      ThrowInvalid(timeStr, "Missing fractional seconds in ISO8601 Time string");
    }
    for (; nbDigits < 9; ++nbDigits) {
      nanos *= 10;
    }
    ts += std::chrono::duration_cast<SysDuration>(std::chrono::nanoseconds{nanos});
  }

  if (hasTime && ptr != endPtr) {
    if (*ptr == 'Z' || *ptr == 'z') {
      ++ptr;
    } else if (*ptr == '+' || *ptr == '-') {
      const bool ahead = *ptr == '+';
      const auto remaining = endPtr - ptr;
      int offsetHours = -1;
      int offsetMinutes = -1;
      if (remaining == 6 && ptr[3] == ':' && AllDigits(ptr + 1, 2) && AllDigits(ptr + 4, 2)) {
        offsetHours = read2(ptr + 1);
        offsetMinutes = read2(ptr + 4);
      } else if (remaining == 5 && AllDigits(ptr + 1, 4)) {
        offsetHours = read2(ptr + 1);
        offsetMinutes = read2(ptr + 3);
      }
      if (offsetHours < 0 || offsetHours > 23 || offsetMinutes > 59) {
        ThrowInvalid(timeStr, "Invalid offset in ISO8601 Time string");
      }
      const auto offset = std::chrono::hours{offsetHours} + std::chrono::minutes{offsetMinutes};
      // local time ahead of UTC means UTC is earlier
      ts = ahead ? ts - offset : ts + offset;
      ptr = endPtr;
    }
  }

  if (ptr != endPtr) {
    ThrowInvalid(timeStr, "Unexpected trailing characters in ISO8601 Time string");
  }

  return ts;
}

}  // namespace urlform
