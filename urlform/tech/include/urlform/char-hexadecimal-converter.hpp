#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "urlform/blob.hpp"

namespace urlform {

/// Writes to 'buf' the 2-char lower case hexadecimal code of given char 'ch'.
/// Given buffer should have space for at least two chars.
/// Return a pointer to the char immediately positioned after the written hexadecimal code.
/// Examples:
///  ',' -> "2c"
///  '?' -> "3f"
constexpr char *to_lower_hex(unsigned char ch, char *buf) {
  constexpr const char *const kHexits = "0123456789abcdef";

  buf[0] = kHexits[ch >> 4U];
  buf[1] = kHexits[ch & 0x0F];

  return buf + 2;
}

/// Same as to_lower_hex, with upper case letters, which is the form percent escapes are emitted in.
///  '=' -> "3D"
///  '~' -> "7E"
constexpr char *to_upper_hex(unsigned char ch, char *buf) {
  constexpr const char *const kHexits = "0123456789ABCDEF";

  buf[0] = kHexits[ch >> 4U];
  buf[1] = kHexits[ch & 0x0F];

  return buf + 2;
}

constexpr char *to_upper_hex(char ch, char *buf) { return to_upper_hex(static_cast<unsigned char>(ch), buf); }

/// Decode a single hexadecimal digit (both cases accepted). Returns -1 if invalid.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

/// Lower case hexadecimal dump of given bytes, two chars per byte.
inline std::string HexEncode(std::span<const std::byte> data) {
  std::string ret;
  ret.resize_and_overwrite(data.size() * 2U, [data](char *out, std::size_t n) {
    for (std::byte byte : data) {
      out = to_lower_hex(static_cast<unsigned char>(byte), out);
    }
    return n;
  });
  return ret;
}

/// Inverse of HexEncode. Returns std::nullopt for odd lengths or non hexadecimal digits.
inline std::optional<Blob> TryHexDecode(std::string_view hex) {
  if (hex.size() % 2U != 0) {
    return std::nullopt;
  }
  Blob ret;
  ret.reserve(hex.size() / 2U);
  for (std::size_t pos = 0; pos < hex.size(); pos += 2U) {
    const int high = from_hex_digit(hex[pos]);
    const int low = from_hex_digit(hex[pos + 1U]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    ret.push_back(static_cast<std::byte>((high << 4) | low));
  }
  return ret;
}

}  // namespace urlform
