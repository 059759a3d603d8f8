#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "urlform/blob.hpp"

namespace urlform {

// Representation of Blob values written by the encoder.
class DataEncodingStrategy {
 public:
  enum class Type : std::uint8_t { Deferred, Base64, Hex, Custom };

  using CustomFunc = std::function<std::string(std::span<const std::byte>)>;

  // The blob's own decomposition: a sequence of its byte values (default).
  static DataEncodingStrategy deferred() { return DataEncodingStrategy(Type::Deferred); }

  // Standard padded base64.
  static DataEncodingStrategy base64() { return DataEncodingStrategy(Type::Base64); }

  // Lower case hexadecimal, two chars per byte.
  static DataEncodingStrategy hex() { return DataEncodingStrategy(Type::Hex); }

  static DataEncodingStrategy custom(CustomFunc func) {
    DataEncodingStrategy ret(Type::Custom);
    ret._custom = std::move(func);
    return ret;
  }

  DataEncodingStrategy() noexcept = default;

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] bool isDeferred() const noexcept { return _type == Type::Deferred; }

  void validate() const;

  // Text form of 'data'. Should not be called for the deferred strategy, which is not a single value.
  [[nodiscard]] std::string encode(std::span<const std::byte> data) const;

 private:
  explicit DataEncodingStrategy(Type type) noexcept : _type(type) {}

  Type _type{Type::Deferred};
  CustomFunc _custom;
};

// Parsing of Blob values by the decoder, mirroring DataEncodingStrategy.
class DataDecodingStrategy {
 public:
  enum class Type : std::uint8_t { Deferred, Base64, Hex, Custom };

  using CustomFunc = std::function<std::optional<Blob>(std::string_view)>;

  static DataDecodingStrategy deferred() { return DataDecodingStrategy(Type::Deferred); }

  static DataDecodingStrategy base64() { return DataDecodingStrategy(Type::Base64); }

  static DataDecodingStrategy hex() { return DataDecodingStrategy(Type::Hex); }

  // The function returns std::nullopt for values it cannot parse.
  static DataDecodingStrategy custom(CustomFunc func) {
    DataDecodingStrategy ret(Type::Custom);
    ret._custom = std::move(func);
    return ret;
  }

  DataDecodingStrategy() noexcept = default;

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] bool isDeferred() const noexcept { return _type == Type::Deferred; }

  void validate() const;

  // Returns std::nullopt if 'value' is not valid for this strategy. Should not be called for the deferred strategy.
  [[nodiscard]] std::optional<Blob> decode(std::string_view value) const;

 private:
  explicit DataDecodingStrategy(Type type) noexcept : _type(type) {}

  Type _type{Type::Deferred};
  CustomFunc _custom;
};

}  // namespace urlform
