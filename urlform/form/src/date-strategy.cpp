#include "urlform/date-strategy.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <optional>
#include <ratio>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "urlform/log.hpp"
#include "urlform/stringconv.hpp"
#include "urlform/timedef.hpp"
#include "urlform/timestring.hpp"

namespace urlform {

namespace {

template <class Strategy>
void ValidateDateStrategy(const Strategy& strategy, bool hasCustomFunc) {
  using Type = typename Strategy::Type;
  if (strategy.type() == Type::Formatted && strategy.pattern().empty()) {
    log::critical("Formatted date strategy requires a non empty pattern");
    throw std::invalid_argument("Formatted date strategy with empty pattern");
  }
  if (strategy.type() == Type::Custom && !hasCustomFunc) {
    log::critical("Custom date strategy requires a function");
    throw std::invalid_argument("Custom date strategy without function");
  }
}

std::tm ToUtcTm(SysTimePoint timePoint) {
  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{daysFloor};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(timePoint - daysFloor)};
  const std::chrono::weekday weekday{daysFloor};
  const std::chrono::year_month_day yearStart{ymd.year() / std::chrono::January / 1};

  std::tm tm{};
  tm.tm_year = static_cast<int>(ymd.year()) - 1900;
  tm.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
  tm.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
  tm.tm_hour = static_cast<int>(hms.hours().count());
  tm.tm_min = static_cast<int>(hms.minutes().count());
  tm.tm_sec = static_cast<int>(hms.seconds().count());
  tm.tm_wday = static_cast<int>(weekday.c_encoding());
  tm.tm_yday = static_cast<int>((daysFloor - std::chrono::sys_days{yearStart}).count());
  return tm;
}

std::optional<SysTimePoint> FromUtcTm(const std::tm& tm) {
  const std::chrono::year_month_day ymd{std::chrono::year{tm.tm_year + 1900},
                                        std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                                        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return std::chrono::sys_days{ymd} + std::chrono::hours{tm.tm_hour} + std::chrono::minutes{tm.tm_min} +
         std::chrono::seconds{tm.tm_sec};
}

template <class Period>
std::optional<SysTimePoint> FromFractionalCount(std::string_view value) {
  const auto count = TryStringToFloating<double>(value);
  if (!count) {
    return std::nullopt;
  }
  using Ticks = std::chrono::duration<double, SysDuration::period>;
  using Rep = SysDuration::rep;
  const double ticks = std::chrono::duration_cast<Ticks>(std::chrono::duration<double, Period>{*count}).count();
  // nan fails both comparisons, infinities fall outside the range
  if (!(ticks > static_cast<double>(std::numeric_limits<Rep>::min()) &&
        ticks < static_cast<double>(std::numeric_limits<Rep>::max()))) {
    log::error("Date count '{}' out of range", value);
    return std::nullopt;
  }
  return SysTimePoint{std::chrono::round<SysDuration>(Ticks{ticks})};
}

}  // namespace

void DateEncodingStrategy::validate() const { ValidateDateStrategy(*this, static_cast<bool>(_custom)); }

std::string DateEncodingStrategy::encode(SysTimePoint timePoint) const {
  switch (_type) {
    case Type::SecondsSinceEpoch:
      return IntegralToString(std::chrono::duration_cast<std::chrono::seconds>(timePoint.time_since_epoch()).count());
    case Type::MillisecondsSinceEpoch:
      return IntegralToString(
          std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count());
    case Type::ISO8601:
      return TimeToStringISO8601UTCWithMs(timePoint);
    case Type::Formatted: {
      const std::tm tm = ToUtcTm(timePoint);
      std::ostringstream oss;
      oss << std::put_time(&tm, _pattern.c_str());
      return oss.str();
    }
    case Type::Custom:
      return _custom(timePoint);
    default:
      return IntegralToString(timePoint.time_since_epoch().count());
  }
}

void DateDecodingStrategy::validate() const { ValidateDateStrategy(*this, static_cast<bool>(_custom)); }

std::optional<SysTimePoint> DateDecodingStrategy::decode(std::string_view value) const {
  switch (_type) {
    case Type::SecondsSinceEpoch:
      return FromFractionalCount<std::ratio<1>>(value);
    case Type::MillisecondsSinceEpoch:
      return FromFractionalCount<std::milli>(value);
    case Type::ISO8601:
      try {
        return StringToTimeISO8601UTC(value);
      } catch (const std::invalid_argument&) {
        return std::nullopt;
      }
    case Type::Formatted: {
      std::tm tm{};
      tm.tm_mday = 1;
      std::istringstream iss{std::string(value)};
      iss >> std::get_time(&tm, _pattern.c_str());
      if (iss.fail() || iss.peek() != std::istringstream::traits_type::eof()) {
        return std::nullopt;
      }
      return FromUtcTm(tm);
    }
    case Type::Custom:
      return _custom(value);
    default: {
      const auto count = TryStringToIntegral<SysDuration::rep>(value);
      if (!count) {
        return std::nullopt;
      }
      return SysTimePoint{SysDuration{*count}};
    }
  }
}

}  // namespace urlform
