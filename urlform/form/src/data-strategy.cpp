#include "urlform/data-strategy.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "urlform/base64-decode.hpp"
#include "urlform/base64-encode.hpp"
#include "urlform/blob.hpp"
#include "urlform/char-hexadecimal-converter.hpp"
#include "urlform/log.hpp"

namespace urlform {

void DataEncodingStrategy::validate() const {
  if (_type == Type::Custom && !_custom) {
    log::critical("Custom data encoding strategy requires a function");
    throw std::invalid_argument("Custom data encoding strategy without function");
  }
}

std::string DataEncodingStrategy::encode(std::span<const std::byte> data) const {
  switch (_type) {
    case Type::Base64:
      return B64Encode(data);
    case Type::Hex:
      return HexEncode(data);
    case Type::Custom:
      return _custom(data);
    default:
      log::critical("Deferred data encoding strategy has no text form");
      throw std::logic_error("Deferred data encoding strategy has no text form");
  }
}

void DataDecodingStrategy::validate() const {
  if (_type == Type::Custom && !_custom) {
    log::critical("Custom data decoding strategy requires a function");
    throw std::invalid_argument("Custom data decoding strategy without function");
  }
}

std::optional<Blob> DataDecodingStrategy::decode(std::string_view value) const {
  switch (_type) {
    case Type::Base64:
      try {
        return B64Decode(value);
      } catch (const std::invalid_argument&) {
        return std::nullopt;
      }
    case Type::Hex:
      return TryHexDecode(value);
    case Type::Custom:
      return _custom(value);
    default:
      log::critical("Deferred data decoding strategy has no text form");
      throw std::logic_error("Deferred data decoding strategy has no text form");
  }
}

}  // namespace urlform
