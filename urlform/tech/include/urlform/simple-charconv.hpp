#pragma once

#include <concepts>
#include <cstddef>

#include "urlform/cctype.hpp"

namespace urlform {

// Fixed width decimal writers and readers used by the ISO 8601 date helpers.
// Readers do not check their input, use AllDigits beforehand on untrusted data.

constexpr auto write2(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto write3(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 100));
  *++buf = static_cast<char>('0' + ((value / 10) % 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto write4(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 1000));
  *++buf = static_cast<char>('0' + ((value / 100) % 10));
  *++buf = static_cast<char>('0' + ((value / 10) % 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto read2(const char* ptr) { return ((ptr[0] - '0') * 10) + (ptr[1] - '0'); }

constexpr auto read3(const char* ptr) { return ((ptr[0] - '0') * 100) + ((ptr[1] - '0') * 10) + (ptr[2] - '0'); }

constexpr auto read4(const char* ptr) {
  return ((ptr[0] - '0') * 1000) + ((ptr[1] - '0') * 100) + ((ptr[2] - '0') * 10) + (ptr[3] - '0');
}

constexpr bool AllDigits(const char* ptr, std::size_t nbChars) {
  for (std::size_t pos = 0; pos < nbChars; ++pos) {
    if (!isdigit(ptr[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace urlform
