#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "urlform/timedef.hpp"

namespace urlform {

// Text representation of SysTimePoint values written by the encoder.
class DateEncodingStrategy {
 public:
  enum class Type : std::uint8_t { Deferred, SecondsSinceEpoch, MillisecondsSinceEpoch, ISO8601, Formatted, Custom };

  using CustomFunc = std::function<std::string(SysTimePoint)>;

  // The time point's own decomposition: its integral count of SysDuration ticks since epoch (default).
  static DateEncodingStrategy deferred() { return DateEncodingStrategy(Type::Deferred); }

  // Whole seconds since epoch, truncated toward zero.
  static DateEncodingStrategy secondsSinceEpoch() { return DateEncodingStrategy(Type::SecondsSinceEpoch); }

  // Whole milliseconds since epoch, truncated toward zero.
  static DateEncodingStrategy millisecondsSinceEpoch() { return DateEncodingStrategy(Type::MillisecondsSinceEpoch); }

  // 'YYYY-MM-DDTHH:MM:SS.sssZ'
  static DateEncodingStrategy iso8601() { return DateEncodingStrategy(Type::ISO8601); }

  // strftime like pattern applied to the UTC broken down time, for instance "%Y-%m-%d %H:%M:%S".
  static DateEncodingStrategy formatted(std::string pattern) {
    DateEncodingStrategy ret(Type::Formatted);
    ret._pattern = std::move(pattern);
    return ret;
  }

  static DateEncodingStrategy custom(CustomFunc func) {
    DateEncodingStrategy ret(Type::Custom);
    ret._custom = std::move(func);
    return ret;
  }

  DateEncodingStrategy() noexcept = default;

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  // Throws std::invalid_argument for a formatted strategy with an empty pattern or a custom one without function.
  void validate() const;

  [[nodiscard]] std::string encode(SysTimePoint timePoint) const;

 private:
  explicit DateEncodingStrategy(Type type) noexcept : _type(type) {}

  Type _type{Type::Deferred};
  std::string _pattern;
  CustomFunc _custom;
};

// Parsing of SysTimePoint values by the decoder, mirroring DateEncodingStrategy.
class DateDecodingStrategy {
 public:
  enum class Type : std::uint8_t { Deferred, SecondsSinceEpoch, MillisecondsSinceEpoch, ISO8601, Formatted, Custom };

  using CustomFunc = std::function<std::optional<SysTimePoint>(std::string_view)>;

  // Integral count of SysDuration ticks since epoch (default).
  static DateDecodingStrategy deferred() { return DateDecodingStrategy(Type::Deferred); }

  // Seconds since epoch, fractional part accepted ("1700000000.5").
  static DateDecodingStrategy secondsSinceEpoch() { return DateDecodingStrategy(Type::SecondsSinceEpoch); }

  // Milliseconds since epoch, fractional part accepted.
  static DateDecodingStrategy millisecondsSinceEpoch() { return DateDecodingStrategy(Type::MillisecondsSinceEpoch); }

  // ISO 8601 with or without milliseconds, 'Z' or numeric offset.
  static DateDecodingStrategy iso8601() { return DateDecodingStrategy(Type::ISO8601); }

  // std::get_time pattern, the parsed broken down time being considered UTC. The whole value should be consumed.
  static DateDecodingStrategy formatted(std::string pattern) {
    DateDecodingStrategy ret(Type::Formatted);
    ret._pattern = std::move(pattern);
    return ret;
  }

  // The function returns std::nullopt for values it cannot parse.
  static DateDecodingStrategy custom(CustomFunc func) {
    DateDecodingStrategy ret(Type::Custom);
    ret._custom = std::move(func);
    return ret;
  }

  DateDecodingStrategy() noexcept = default;

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  void validate() const;

  // Returns std::nullopt if 'value' is not valid for this strategy.
  [[nodiscard]] std::optional<SysTimePoint> decode(std::string_view value) const;

 private:
  explicit DateDecodingStrategy(Type type) noexcept : _type(type) {}

  Type _type{Type::Deferred};
  std::string _pattern;
  CustomFunc _custom;
};

}  // namespace urlform
