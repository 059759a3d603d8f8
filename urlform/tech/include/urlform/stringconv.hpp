#pragma once

#include <charconv>
#include <concepts>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "urlform/cctype.hpp"
#include "urlform/log.hpp"

namespace urlform {

inline std::string IntegralToString(std::integral auto val) {
  using Int = decltype(val);

  // +1 for minus, +1 for additional partial ranges coverage
  static constexpr auto kMaxSize = std::numeric_limits<Int>::digits10 + 1 + static_cast<int>(std::is_signed_v<Int>);

  char buf[kMaxSize];

  // no need to check the return value here, it cannot fail as we sized the buffer accordingly
  const auto [ptr, errc] = std::to_chars(buf, buf + kMaxSize, val);
  return {buf, ptr};
}

/// Shortest decimal representation of 'val' that parses back to the same value.
inline std::string FloatingToString(std::floating_point auto val) {
  // large enough for the shortest round trip representation of a long double in scientific notation
  char buf[64];
  const auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), val);
  if (errc != std::errc()) {
    log::critical("Unable to convert floating point value to string");
    throw std::invalid_argument("FloatingToString conversion failed");
  }
  return {buf, ptr};
}

/// Strict conversion: the whole string should be consumed and the value should fit in 'Integral'.
/// A leading '+' is accepted for signed and unsigned types. Returns std::nullopt otherwise.
template <std::integral Integral>
std::optional<Integral> TryStringToIntegral(std::string_view str) {
  if (!str.empty() && str.front() == '+') {
    str.remove_prefix(1);
    if (str.empty() || str.front() == '-') {
      return std::nullopt;
    }
  }
  Integral ret;
  const char* endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);
  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

template <std::integral Integral>
Integral StringToIntegral(std::string_view str) {
  const auto ret = TryStringToIntegral<Integral>(str);
  if (!ret) {
    log::critical("Unable to decode '{}' into integral", str);
    throw std::invalid_argument("StringToIntegral conversion failed");
  }
  return *ret;
}

/// Strict conversion of a decimal floating point string ('inf' and 'nan' are accepted as from_chars does).
template <std::floating_point Floating>
std::optional<Floating> TryStringToFloating(std::string_view str) {
  if (!str.empty() && str.front() == '+') {
    str.remove_prefix(1);
    if (str.empty() || str.front() == '-') {
      return std::nullopt;
    }
  }
  Floating ret;
  const char* endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret, std::chars_format::general);
  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

/// Boolean form values: "true", "1", "on" and "false", "0", "off", case insensitive.
constexpr std::optional<bool> TryStringToBool(std::string_view str) {
  constexpr std::string_view kTrueValues[] = {"true", "1", "on"};
  constexpr std::string_view kFalseValues[] = {"false", "0", "off"};

  const auto equalsIgnoreCase = [str](std::string_view ref) {
    if (str.size() != ref.size()) {
      return false;
    }
    for (std::string_view::size_type pos = 0; pos < str.size(); ++pos) {
      if (tolower(str[pos]) != ref[pos]) {
        return false;
      }
    }
    return true;
  };

  for (std::string_view ref : kTrueValues) {
    if (equalsIgnoreCase(ref)) {
      return true;
    }
  }
  for (std::string_view ref : kFalseValues) {
    if (equalsIgnoreCase(ref)) {
      return false;
    }
  }
  return std::nullopt;
}

}  // namespace urlform
