#include "urlform/form-decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "urlform/blob.hpp"
#include "urlform/decimal.hpp"
#include "urlform/form-config.hpp"
#include "urlform/form-container.hpp"
#include "urlform/form-error.hpp"
#include "urlform/stringconv.hpp"
#include "urlform/timedef.hpp"

namespace urlform {

FormDecoder::FormDecoder(FormDecoderConfig config) : _config(std::move(config)) { _config.validate(); }

const std::string& FormDecoder::scalarText(const FormContainer& node, const CodingPath& codingPath) const {
  if (node.isScalar()) {
    return node.scalarValue();
  }
  // fields sent several times with accumulateValues, later values win
  if (node.isSequence() && _config.arrayStrategy.handleSingleValue() && !node.elements().empty()) {
    return scalarText(node.elements().back(), codingPath);
  }
  throw DecodingError::typeMismatch(FormContainer::Kind::Scalar, node.kind(), codingPath);
}

const std::string& FormDecoder::nonEmptyText(const FormContainer& node, const CodingPath& codingPath,
                                             std::string_view typeName) const {
  const std::string& text = scalarText(node, codingPath);
  if (text.empty()) {
    throw DecodingError::emptyValue(typeName, codingPath);
  }
  return text;
}

KeyedDecodingContainer FormDecoder::keyedOver(const FormContainer& node, CodingPath codingPath) const {
  if (!node.isMapping()) {
    throw DecodingError::typeMismatch(FormContainer::Kind::Mapping, node.kind(), std::move(codingPath));
  }
  return {*this, node, std::move(codingPath)};
}

SequenceDecodingContainer FormDecoder::sequenceOver(const FormContainer& node, CodingPath codingPath) const {
  if (node.isSequence()) {
    return {*this, node.elements(), std::move(codingPath)};
  }
  if (node.isScalar() && _config.arrayStrategy.handleSingleValue()) {
    // a field sent once cannot be told apart from a one element array
    return {*this, std::span<const FormContainer>(&node, 1U), std::move(codingPath)};
  }
  throw DecodingError::typeMismatch(FormContainer::Kind::Sequence, node.kind(), std::move(codingPath));
}

bool FormDecoder::unboxBool(const FormContainer& node, const CodingPath& codingPath) const {
  const std::string& text = nonEmptyText(node, codingPath, "bool");
  const auto value = TryStringToBool(text);
  if (!value) {
    throw DecodingError::invalidValue("bool", text, codingPath);
  }
  return *value;
}

SysTimePoint FormDecoder::unboxDate(const FormContainer& node, const CodingPath& codingPath) const {
  const std::string& text = nonEmptyText(node, codingPath, "date");
  const auto timePoint = _config.dateStrategy.decode(text);
  if (!timePoint) {
    throw DecodingError::invalidValue("date", text, codingPath);
  }
  return *timePoint;
}

Blob FormDecoder::unboxBlob(const FormContainer& node, CodingPath& codingPath) const {
  if (_config.dataStrategy.isDeferred()) {
    const auto bytes = unbox<std::vector<std::uint8_t>>(node, codingPath);
    Blob blob(bytes.size());
    for (std::size_t pos = 0; pos < bytes.size(); ++pos) {
      blob[pos] = static_cast<std::byte>(bytes[pos]);
    }
    return blob;
  }
  const std::string& text = scalarText(node, codingPath);
  auto blob = _config.dataStrategy.decode(text);
  if (!blob) {
    throw DecodingError::invalidValue("data", text, codingPath);
  }
  return std::move(*blob);
}

Decimal FormDecoder::unboxDecimal(const FormContainer& node, const CodingPath& codingPath) const {
  const std::string& text = nonEmptyText(node, codingPath, "decimal");
  auto decimal = Decimal::parse(text);
  if (!decimal) {
    throw DecodingError::invalidValue("decimal", text, codingPath);
  }
  return std::move(*decimal);
}

std::vector<std::string_view> KeyedDecodingContainer::allKeys() const {
  std::vector<std::string_view> keys;
  keys.reserve(_mapping->size());
  for (const auto& [key, value] : _mapping->entries()) {
    keys.emplace_back(key);
  }
  return keys;
}

const FormContainer& KeyedDecodingContainer::child(std::string_view key) const {
  const FormContainer* node = _mapping->find(key);
  if (node == nullptr) {
    throw DecodingError::keyNotFound(key, _codingPath);
  }
  return *node;
}

bool KeyedDecodingContainer::decodeNil(std::string_view key) const {
  const FormContainer* node = _mapping->find(key);
  return node == nullptr || (node->isScalar() && node->scalarValue().empty());
}

KeyedDecodingContainer KeyedDecodingContainer::nestedKeyed(std::string_view key) {
  const FormContainer& node = child(key);
  CodingPath codingPath = _codingPath;
  codingPath.emplace_back(key);
  return _decoder->keyedOver(node, std::move(codingPath));
}

SequenceDecodingContainer KeyedDecodingContainer::nestedSequence(std::string_view key) {
  const FormContainer& node = child(key);
  CodingPath codingPath = _codingPath;
  codingPath.emplace_back(key);
  return _decoder->sequenceOver(node, std::move(codingPath));
}

void KeyedDecodingContainer::superDecoder() const {
  throw DecodingError(DecodingError::Reason::Unsupported, "superDecoder is not supported by form decoding",
                      _codingPath);
}

const FormContainer& SequenceDecodingContainer::current() const {
  if (isAtEnd()) {
    throw DecodingError::endOfSequence(_elements.size(), _codingPath);
  }
  return _elements[_currentIndex];
}

bool SequenceDecodingContainer::decodeNil() {
  const FormContainer& node = current();
  if (node.isScalar() && node.scalarValue().empty()) {
    ++_currentIndex;
    return true;
  }
  return false;
}

KeyedDecodingContainer SequenceDecodingContainer::nestedKeyed() {
  const FormContainer& node = current();
  CodingPath codingPath = _codingPath;
  codingPath.push_back(IntegralToString(_currentIndex));
  KeyedDecodingContainer container = _decoder->keyedOver(node, std::move(codingPath));
  ++_currentIndex;
  return container;
}

SequenceDecodingContainer SequenceDecodingContainer::nestedSequence() {
  const FormContainer& node = current();
  CodingPath codingPath = _codingPath;
  codingPath.push_back(IntegralToString(_currentIndex));
  SequenceDecodingContainer container = _decoder->sequenceOver(node, std::move(codingPath));
  ++_currentIndex;
  return container;
}

void SequenceDecodingContainer::superDecoder() const {
  throw DecodingError(DecodingError::Reason::Unsupported, "superDecoder is not supported by form decoding",
                      _codingPath);
}

}  // namespace urlform
