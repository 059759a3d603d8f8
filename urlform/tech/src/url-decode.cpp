#include "urlform/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "urlform/char-hexadecimal-converter.hpp"
#include "urlform/log.hpp"

namespace urlform::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        const int v1 = first + 1 < last ? from_hex_digit(first[1]) : -1;
        const int v2 = first + 2 < last ? from_hex_digit(first[2]) : -1;
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          // keep the '%' literal, the following chars are decoded normally
          *out++ = '%';
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        first += 2;
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::string FormDecode(std::string_view token) {
  std::string ret(token);
  if (ret.find_first_of("%+") == std::string::npos) {
    return ret;
  }
  if (HasMalformedEscape(token)) {
    log::debug("Malformed percent escape in form token '{}', keeping it literally", token);
  }
  const char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), ' ', /*strictInvalid*/ false);
  ret.resize(static_cast<std::size_t>(newEnd - ret.data()));
  return ret;
}

bool HasMalformedEscape(std::string_view token) noexcept {
  for (auto pos = token.find('%'); pos != std::string_view::npos; pos = token.find('%', pos + 1)) {
    if (pos + 2 >= token.size() || from_hex_digit(token[pos + 1]) < 0 || from_hex_digit(token[pos + 2]) < 0) {
      return true;
    }
    pos += 2;
  }
  return false;
}

}  // namespace urlform::url
