#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "urlform/blob.hpp"
#include "urlform/data-strategy.hpp"
#include "urlform/date-strategy.hpp"
#include "urlform/decimal.hpp"
#include "urlform/form-codable.hpp"
#include "urlform/form-config.hpp"
#include "urlform/form-container.hpp"
#include "urlform/form-error.hpp"
#include "urlform/stringconv.hpp"
#include "urlform/timedef.hpp"

namespace urlform {

class FormDecoder;
class SequenceDecodingContainer;

// Reads the fields of a record from a Mapping node.
// Containers are views on the tree owned by the caller of FormDecoder::decode and should not outlive it.
class KeyedDecodingContainer {
 public:
  [[nodiscard]] bool contains(std::string_view key) const noexcept { return _mapping->find(key) != nullptr; }

  // Keys in wire order of first appearance.
  [[nodiscard]] std::vector<std::string_view> allKeys() const;

  // Decodes the value under 'key'. Throws DecodingError (KeyNotFound) if absent, unless T is a std::optional.
  template <class T>
  T decode(std::string_view key);

  // Returns std::nullopt if 'key' is absent, or if its value is empty and T is not std::string.
  template <class T>
  std::optional<T> decodeIfPresent(std::string_view key);

  // True if 'key' is absent or holds an empty value.
  [[nodiscard]] bool decodeNil(std::string_view key) const;

  KeyedDecodingContainer nestedKeyed(std::string_view key);

  SequenceDecodingContainer nestedSequence(std::string_view key);

  // Not supported by the form format, always throws DecodingError (Unsupported).
  [[noreturn]] void superDecoder() const;

  [[nodiscard]] const CodingPath& codingPath() const noexcept { return _codingPath; }

 private:
  friend class FormDecoder;
  friend class SequenceDecodingContainer;

  KeyedDecodingContainer(const FormDecoder& decoder, const FormContainer& mapping, CodingPath codingPath) noexcept
      : _decoder(&decoder), _mapping(&mapping), _codingPath(std::move(codingPath)) {}

  const FormContainer& child(std::string_view key) const;

  const FormDecoder* _decoder;
  const FormContainer* _mapping;
  CodingPath _codingPath;
};

// Reads the elements of a Sequence node in order.
class SequenceDecodingContainer {
 public:
  [[nodiscard]] std::size_t count() const noexcept { return _elements.size(); }

  [[nodiscard]] bool isAtEnd() const noexcept { return _currentIndex >= _elements.size(); }

  [[nodiscard]] std::size_t currentIndex() const noexcept { return _currentIndex; }

  // Decodes the current element and advances. Throws DecodingError (EndOfSequence) past the last element.
  template <class T>
  T decode();

  // Returns std::nullopt (and advances) if the current element is empty and T is not std::string.
  template <class T>
  std::optional<T> decodeIfPresent();

  // Advances and returns true if the current element is an empty value, returns false otherwise.
  bool decodeNil();

  KeyedDecodingContainer nestedKeyed();

  SequenceDecodingContainer nestedSequence();

  [[noreturn]] void superDecoder() const;

  [[nodiscard]] const CodingPath& codingPath() const noexcept { return _codingPath; }

 private:
  friend class FormDecoder;
  friend class KeyedDecodingContainer;

  SequenceDecodingContainer(const FormDecoder& decoder, std::span<const FormContainer> elements,
                            CodingPath codingPath) noexcept
      : _decoder(&decoder), _elements(elements), _codingPath(std::move(codingPath)) {}

  const FormContainer& current() const;

  const FormDecoder* _decoder;
  std::span<const FormContainer> _elements;
  std::size_t _currentIndex{0};
  CodingPath _codingPath;
};

// Decodes application/x-www-form-urlencoded bodies into values (see FormEncoder for the supported types).
// Decoding does not modify the instance.
class FormDecoder {
 public:
  // Throws std::invalid_argument if the configuration is invalid.
  explicit FormDecoder(FormDecoderConfig config = {});

  [[nodiscard]] const FormDecoderConfig& config() const noexcept { return _config; }

  // Parses 'body' with the configured array strategy and decodes its root as a T.
  // Throws DecodingError if the body does not match T.
  template <class T>
  T decode(std::string_view body) const {
    const FormContainer root = _config.arrayStrategy.parse(body);
    return decodeContainer<T>(root);
  }

  template <class T>
  T decodeContainer(const FormContainer& root) const {
    CodingPath codingPath;
    return unbox<T>(root, codingPath);
  }

  // Decodes 'body' with an array strategy detected from its keys.
  template <class T>
  static T decodeWithAutoDetection(std::string_view body, DateDecodingStrategy dateStrategy = {},
                                   DataDecodingStrategy dataStrategy = {}) {
    const FormDecoder decoder(
        FormDecoderConfig::WithAutoDetectedStrategy(body, std::move(dateStrategy), std::move(dataStrategy)));
    return decoder.decode<T>(body);
  }

 private:
  friend class KeyedDecodingContainer;
  friend class SequenceDecodingContainer;

  template <class T>
  T unbox(const FormContainer& node, CodingPath& codingPath) const;

  // An empty leaf stands for an absent value, except for strings.
  template <class T>
  static bool isNil(const FormContainer& node) noexcept {
    return !std::same_as<T, std::string> && node.isScalar() && node.scalarValue().empty();
  }

  const std::string& scalarText(const FormContainer& node, const CodingPath& codingPath) const;

  const std::string& nonEmptyText(const FormContainer& node, const CodingPath& codingPath,
                                  std::string_view typeName) const;

  KeyedDecodingContainer keyedOver(const FormContainer& node, CodingPath codingPath) const;

  SequenceDecodingContainer sequenceOver(const FormContainer& node, CodingPath codingPath) const;

  bool unboxBool(const FormContainer& node, const CodingPath& codingPath) const;

  SysTimePoint unboxDate(const FormContainer& node, const CodingPath& codingPath) const;

  Blob unboxBlob(const FormContainer& node, CodingPath& codingPath) const;

  Decimal unboxDecimal(const FormContainer& node, const CodingPath& codingPath) const;

  FormDecoderConfig _config;
};

template <class T>
T FormDecoder::unbox(const FormContainer& node, CodingPath& codingPath) const {
  if constexpr (std::same_as<T, bool>) {
    return unboxBool(node, codingPath);
  } else if constexpr (std::is_enum_v<T>) {
    return static_cast<T>(unbox<std::underlying_type_t<T>>(node, codingPath));
  } else if constexpr (std::integral<T>) {
    const std::string& text = nonEmptyText(node, codingPath, "integer");
    const auto value = TryStringToIntegral<T>(text);
    if (!value) {
      throw DecodingError::invalidValue("integer", text, codingPath);
    }
    return *value;
  } else if constexpr (std::floating_point<T>) {
    const std::string& text = nonEmptyText(node, codingPath, "floating point");
    const auto value = TryStringToFloating<T>(text);
    if (!value) {
      throw DecodingError::invalidValue("floating point", text, codingPath);
    }
    return *value;
  } else if constexpr (std::same_as<T, std::string>) {
    return scalarText(node, codingPath);
  } else if constexpr (std::same_as<T, SysTimePoint>) {
    return unboxDate(node, codingPath);
  } else if constexpr (std::same_as<T, Blob>) {
    return unboxBlob(node, codingPath);
  } else if constexpr (std::same_as<T, Decimal>) {
    return unboxDecimal(node, codingPath);
  } else if constexpr (FormOptional<T>) {
    using Value = typename T::value_type;
    if (isNil<Value>(node)) {
      return std::nullopt;
    }
    return T(unbox<Value>(node, codingPath));
  } else if constexpr (FormDecodableRecord<T>) {
    KeyedDecodingContainer container = keyedOver(node, codingPath);
    return FormCodable<T>::decode(container);
  } else if constexpr (FormStringKeyedMap<T>) {
    if (!node.isMapping()) {
      throw DecodingError::typeMismatch(FormContainer::Kind::Mapping, node.kind(), codingPath);
    }
    T ret;
    for (const auto& [key, value] : node.entries()) {
      if constexpr (FormOptional<typename T::mapped_type>) {
        if (isNil<typename T::mapped_type::value_type>(value)) {
          continue;
        }
      }
      CodingPathGuard guard(codingPath, key);
      ret.emplace(typename T::key_type(key), unbox<typename T::mapped_type>(value, codingPath));
    }
    return ret;
  } else if constexpr (FormStdArray<T>) {
    SequenceDecodingContainer container = sequenceOver(node, codingPath);
    T ret{};
    if (container.count() != ret.size()) {
      throw DecodingError(DecodingError::Reason::InvalidValue,
                          "Expected " + IntegralToString(ret.size()) + " elements but found " +
                              IntegralToString(container.count()),
                          codingPath);
    }
    for (auto& elem : ret) {
      elem = container.decode<typename T::value_type>();
    }
    return ret;
  } else if constexpr (FormAppendableRange<T>) {
    SequenceDecodingContainer container = sequenceOver(node, codingPath);
    T ret;
    while (!container.isAtEnd()) {
      ret.insert(ret.end(), container.decode<typename T::value_type>());
    }
    return ret;
  } else {
    static_assert(detail::kAlwaysFalse<T>, "Type cannot be decoded from a form value, specialize FormCodable for it");
  }
}

template <class T>
T KeyedDecodingContainer::decode(std::string_view key) {
  if constexpr (FormOptional<T>) {
    return decodeIfPresent<typename T::value_type>(key);
  } else {
    const FormContainer& node = child(key);
    CodingPathGuard guard(_codingPath, key);
    return _decoder->unbox<T>(node, _codingPath);
  }
}

template <class T>
std::optional<T> KeyedDecodingContainer::decodeIfPresent(std::string_view key) {
  const FormContainer* node = _mapping->find(key);
  if (node == nullptr || FormDecoder::isNil<T>(*node)) {
    return std::nullopt;
  }
  CodingPathGuard guard(_codingPath, key);
  return _decoder->unbox<T>(*node, _codingPath);
}

template <class T>
T SequenceDecodingContainer::decode() {
  if constexpr (FormOptional<T>) {
    return decodeIfPresent<typename T::value_type>();
  } else {
    const FormContainer& node = current();
    CodingPathGuard guard(_codingPath, _currentIndex);
    T ret = _decoder->unbox<T>(node, _codingPath);
    ++_currentIndex;
    return ret;
  }
}

template <class T>
std::optional<T> SequenceDecodingContainer::decodeIfPresent() {
  const FormContainer& node = current();
  if (FormDecoder::isNil<T>(node)) {
    ++_currentIndex;
    return std::nullopt;
  }
  CodingPathGuard guard(_codingPath, _currentIndex);
  std::optional<T> ret(_decoder->unbox<T>(node, _codingPath));
  ++_currentIndex;
  return ret;
}

// Decodes 'body' with a temporary decoder.
template <class T>
T Decode(std::string_view body, FormDecoderConfig config = {}) {
  const FormDecoder decoder(std::move(config));
  return decoder.decode<T>(body);
}

}  // namespace urlform
