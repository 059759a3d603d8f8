#include "urlform/form-error.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "urlform/form-container.hpp"
#include "urlform/stringconv.hpp"

namespace urlform {

namespace {

constexpr std::string_view kSequenceMismatchHint =
    "This might be an array strategy mismatch. Arrays encoded with 'bracketsWithIndices' (tags[0]=value) need to "
    "be decoded with the same strategy, not with 'accumulateValues' (tags=value).";

constexpr std::string_view kMissingArrayHint =
    "Array fields require matching encoding and decoding strategies. Check that the encoder and the decoder both "
    "use 'bracketsWithIndices' (or both 'accumulateValues').";

// Field names that are commonly used for arrays.
constexpr std::string_view kArrayLikeNames[] = {"tags", "items", "ids", "values", "list", "entries", "elements"};

std::string BuildWhat(std::string_view message, std::span<const std::string> codingPath, std::string_view hint) {
  std::string ret(message);
  if (!codingPath.empty()) {
    ret.append(" at path '");
    ret.append(CodingPathString(codingPath));
    ret.push_back('\'');
  }
  if (!hint.empty()) {
    ret.append(". Hint: ");
    ret.append(hint);
  }
  return ret;
}

std::string_view DecodingHint(DecodingError::Reason reason, std::span<const std::string> codingPath,
                              std::optional<FormContainer::Kind> expectedKind) {
  if (reason == DecodingError::Reason::TypeMismatch && expectedKind == FormContainer::Kind::Sequence) {
    return kSequenceMismatchHint;
  }
  if (reason == DecodingError::Reason::KeyNotFound && !codingPath.empty() &&
      std::ranges::find(kArrayLikeNames, std::string_view(codingPath.back())) != std::end(kArrayLikeNames)) {
    return kMissingArrayHint;
  }
  return {};
}

CodingPath Appended(CodingPath codingPath, std::string_view segment) {
  codingPath.emplace_back(segment);
  return codingPath;
}

}  // namespace

std::string CodingPathString(std::span<const std::string> codingPath) {
  std::string ret;
  for (const std::string& segment : codingPath) {
    if (!ret.empty()) {
      ret.push_back('.');
    }
    ret.append(segment);
  }
  return ret;
}

FormError::FormError(std::string message, CodingPath codingPath, std::string_view hint)
    : std::runtime_error(BuildWhat(message, codingPath, hint)),
      _message(std::move(message)),
      _codingPath(std::move(codingPath)),
      _hint(hint) {}

EncodingError::EncodingError(Reason reason, std::string message, CodingPath codingPath)
    : FormError(std::move(message), std::move(codingPath), {}), _reason(reason) {}

DecodingError::DecodingError(Reason reason, std::string message, CodingPath codingPath,
                             std::optional<FormContainer::Kind> expectedKind)
    : FormError(std::move(message), codingPath, DecodingHint(reason, codingPath, expectedKind)),
      _reason(reason),
      _expectedKind(expectedKind) {}

DecodingError DecodingError::typeMismatch(FormContainer::Kind expected, FormContainer::Kind found,
                                          CodingPath codingPath) {
  std::string message("Expected ");
  message.append(KindName(expected));
  message.append(" but found ");
  message.append(KindName(found));
  return {Reason::TypeMismatch, std::move(message), std::move(codingPath), expected};
}

DecodingError DecodingError::keyNotFound(std::string_view key, CodingPath codingPath) {
  std::string message("No value associated with key '");
  message.append(key);
  message.push_back('\'');
  return {Reason::KeyNotFound, std::move(message), Appended(std::move(codingPath), key)};
}

DecodingError DecodingError::emptyValue(std::string_view expectedType, CodingPath codingPath) {
  std::string message("Expected ");
  message.append(expectedType);
  message.append(" value but found an empty string");
  return {Reason::EmptyValue, std::move(message), std::move(codingPath)};
}

DecodingError DecodingError::invalidValue(std::string_view expectedType, std::string_view value,
                                          CodingPath codingPath) {
  std::string message("Cannot convert '");
  message.append(value);
  message.append("' to ");
  message.append(expectedType);
  return {Reason::InvalidValue, std::move(message), std::move(codingPath)};
}

DecodingError DecodingError::endOfSequence(std::size_t count, CodingPath codingPath) {
  std::string message("Unkeyed container is at end (");
  message.append(IntegralToString(count));
  message.append(" elements)");
  return {Reason::EndOfSequence, std::move(message), std::move(codingPath)};
}

std::string_view ReasonName(EncodingError::Reason reason) noexcept {
  switch (reason) {
    case EncodingError::Reason::NoContainer:
      return "NoContainer";
    case EncodingError::Reason::Unsupported:
      return "Unsupported";
    case EncodingError::Reason::UnrepresentableValue:
      return "UnrepresentableValue";
    default:
      return "Unknown";
  }
}

std::string_view ReasonName(DecodingError::Reason reason) noexcept {
  switch (reason) {
    case DecodingError::Reason::TypeMismatch:
      return "TypeMismatch";
    case DecodingError::Reason::KeyNotFound:
      return "KeyNotFound";
    case DecodingError::Reason::EmptyValue:
      return "EmptyValue";
    case DecodingError::Reason::InvalidValue:
      return "InvalidValue";
    case DecodingError::Reason::EndOfSequence:
      return "EndOfSequence";
    case DecodingError::Reason::Unsupported:
      return "Unsupported";
    default:
      return "Unknown";
  }
}

}  // namespace urlform
