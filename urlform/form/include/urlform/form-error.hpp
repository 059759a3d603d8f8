#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "urlform/form-container.hpp"
#include "urlform/stringconv.hpp"

namespace urlform {

// Field path from the root to the value being coded: keys of keyed containers and indices of sequences.
using CodingPath = std::vector<std::string>;

// Dot separated representation of a coding path ("user.pets.0.name").
std::string CodingPathString(std::span<const std::string> codingPath);

// Pushes a segment on a coding path for the lifetime of the guard.
class CodingPathGuard {
 public:
  CodingPathGuard(CodingPath& codingPath, std::string_view key) : _codingPath(codingPath) {
    _codingPath.emplace_back(key);
  }

  CodingPathGuard(CodingPath& codingPath, std::size_t index) : _codingPath(codingPath) {
    _codingPath.push_back(IntegralToString(index));
  }

  CodingPathGuard(const CodingPathGuard&) = delete;
  CodingPathGuard(CodingPathGuard&&) = delete;
  CodingPathGuard& operator=(const CodingPathGuard&) = delete;
  CodingPathGuard& operator=(CodingPathGuard&&) = delete;

  ~CodingPathGuard() { _codingPath.pop_back(); }

 private:
  CodingPath& _codingPath;
};

// Base of all errors raised by the encoder and the decoder.
// what() returns "<message> at path '<a.b.c>'" (without the suffix for an empty path), followed by a hint when
// the failure looks like a mismatch between the array strategies of both sides.
class FormError : public std::runtime_error {
 public:
  [[nodiscard]] std::string_view message() const noexcept { return _message; }

  [[nodiscard]] const CodingPath& codingPath() const noexcept { return _codingPath; }

  // Empty if no hint applies.
  [[nodiscard]] std::string_view hint() const noexcept { return _hint; }

 protected:
  FormError(std::string message, CodingPath codingPath, std::string_view hint);

 private:
  std::string _message;
  CodingPath _codingPath;
  std::string_view _hint;
};

class EncodingError : public FormError {
 public:
  enum class Reason : std::uint8_t { NoContainer, Unsupported, UnrepresentableValue };

  EncodingError(Reason reason, std::string message, CodingPath codingPath = {});

  [[nodiscard]] Reason reason() const noexcept { return _reason; }

 private:
  Reason _reason;
};

class DecodingError : public FormError {
 public:
  enum class Reason : std::uint8_t { TypeMismatch, KeyNotFound, EmptyValue, InvalidValue, EndOfSequence, Unsupported };

  // Generic constructor. Prefer the named factories below which build consistent messages.
  DecodingError(Reason reason, std::string message, CodingPath codingPath = {},
                std::optional<FormContainer::Kind> expectedKind = std::nullopt);

  static DecodingError typeMismatch(FormContainer::Kind expected, FormContainer::Kind found, CodingPath codingPath);

  // 'codingPath' is the path of the container, the missing key is appended to it.
  static DecodingError keyNotFound(std::string_view key, CodingPath codingPath);

  static DecodingError emptyValue(std::string_view expectedType, CodingPath codingPath);

  static DecodingError invalidValue(std::string_view expectedType, std::string_view value, CodingPath codingPath);

  static DecodingError endOfSequence(std::size_t count, CodingPath codingPath);

  [[nodiscard]] Reason reason() const noexcept { return _reason; }

  // Container kind that was expected for a TypeMismatch error.
  [[nodiscard]] std::optional<FormContainer::Kind> expectedKind() const noexcept { return _expectedKind; }

 private:
  Reason _reason;
  std::optional<FormContainer::Kind> _expectedKind;
};

std::string_view ReasonName(EncodingError::Reason reason) noexcept;

std::string_view ReasonName(DecodingError::Reason reason) noexcept;

}  // namespace urlform
