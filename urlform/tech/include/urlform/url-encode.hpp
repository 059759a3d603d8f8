#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "urlform/char-hexadecimal-converter.hpp"

namespace urlform {

/// Characters left untouched by the application/x-www-form-urlencoded serializer (WHATWG URL standard).
/// Unlike RFC 3986, '~' is not part of this set while '*' is.
struct IsFormUnreserved {
  constexpr bool operator()(char ch) const noexcept {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' ||
           ch == '.' || ch == '_' || ch == '*';
  }
};

template <class IsNotEncodedFunc>
constexpr auto URLEncodedSize(std::string_view data, IsNotEncodedFunc isNotEncodedFunc) {
  std::string_view::size_type nbChars = 0;

  // not using std::ranges::count_if to avoid <algorithm> include in a header file
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      ++nbChars;
    } else {
      nbChars += 3UL;
    }
  }

  return nbChars;
}

/// This function converts the given input string to a URL encoded string.
/// All input characters 'ch' for which isNotEncodedFunc(ch) is false are converted in upper case hexadecimal.
/// (%NN where NN is a two-digit hexadecimal number).
/// The output is written to the provided 'buf' buffer, which should have enough space to hold the result (at least
/// URLEncodedSize(data, isNotEncodedFunc) bytes). The function returns a pointer to the char immediately after the last
/// written char in the buffer.
template <class IsNotEncodedFunc>
constexpr char* URLEncode(std::string_view data, IsNotEncodedFunc isNotEncodedFunc, char* buf) {
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      *buf++ = ch;
    } else {
      *buf = '%';
      buf = to_upper_hex(ch, ++buf);
    }
  }
  return buf;
}

namespace url {

/// Size of FormEncode(token, spaceAsPlus) output.
constexpr std::size_t FormEncodedSize(std::string_view token, bool spaceAsPlus = true) {
  const IsFormUnreserved isFormUnreserved;
  return URLEncodedSize(token, [spaceAsPlus, isFormUnreserved](char ch) {
    return isFormUnreserved(ch) || (spaceAsPlus && ch == ' ');
  });
}

/// Appends the form encoding of 'token' to 'out'.
/// If spaceAsPlus is true, ' ' is written as '+', otherwise as "%20". '+' itself is always escaped.
inline void AppendFormEncoded(std::string& out, std::string_view token, bool spaceAsPlus = true) {
  const auto oldSize = out.size();
  const auto addedSize = FormEncodedSize(token, spaceAsPlus);
  out.resize_and_overwrite(oldSize + addedSize, [token, spaceAsPlus, oldSize](char* data, std::size_t n) {
    const IsFormUnreserved isFormUnreserved;
    char* buf = data + oldSize;
    for (char ch : token) {
      if (spaceAsPlus && ch == ' ') {
        *buf++ = '+';
      } else if (isFormUnreserved(ch)) {
        *buf++ = ch;
      } else {
        *buf = '%';
        buf = to_upper_hex(ch, ++buf);
      }
    }
    return n;
  });
}

/// Percent-encodes a single key or value token of an application/x-www-form-urlencoded body.
inline std::string FormEncode(std::string_view token, bool spaceAsPlus = true) {
  std::string ret;
  AppendFormEncoded(ret, token, spaceAsPlus);
  return ret;
}

}  // namespace url

}  // namespace urlform
