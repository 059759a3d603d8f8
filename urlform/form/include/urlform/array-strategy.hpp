#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "urlform/form-container.hpp"
#include "urlform/form-pairs.hpp"

namespace urlform {

// How the encoder turns its container tree into a form body.
// Immutable value.
class ArrayEncodingStrategy {
 public:
  enum class Type : std::uint8_t { AccumulateValues, Brackets, BracketsWithIndices, Custom };

  using CustomFunc = std::function<std::string(const FormContainer&)>;

  // tags=a&tags=b (default).
  static ArrayEncodingStrategy accumulateValues() { return ArrayEncodingStrategy(Type::AccumulateValues); }

  // tags[]=a&tags[]=b
  static ArrayEncodingStrategy brackets() { return ArrayEncodingStrategy(Type::Brackets); }

  // tags[0]=a&tags[1]=b
  static ArrayEncodingStrategy bracketsWithIndices() { return ArrayEncodingStrategy(Type::BracketsWithIndices); }

  // Caller provided serializer of the whole root container.
  static ArrayEncodingStrategy custom(CustomFunc func) { return ArrayEncodingStrategy(std::move(func)); }

  ArrayEncodingStrategy() noexcept = default;

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] std::string_view name() const noexcept;

  // Throws std::invalid_argument for a custom strategy without function.
  void validate() const;

  // Serializes the root container into a form body.
  // Throws EncodingError if the container cannot be expressed with this strategy.
  [[nodiscard]] std::string serialize(const FormContainer& root) const;

 private:
  explicit ArrayEncodingStrategy(Type type) noexcept : _type(type) {}
  explicit ArrayEncodingStrategy(CustomFunc func) : _type(Type::Custom), _custom(std::move(func)) {}

  Type _type{Type::AccumulateValues};
  CustomFunc _custom;
};

// How the decoder rebuilds its container tree from a form body.
class ArrayParsingStrategy {
 public:
  enum class Type : std::uint8_t { AccumulateValues, Brackets, BracketsWithIndices, Custom };

  using CustomFunc = std::function<FormContainer(std::string_view)>;

  // Repeated keys are grouped in a sequence. Flat structure only (nested mappings are not parsed).
  static ArrayParsingStrategy accumulateValues() { return ArrayParsingStrategy(Type::AccumulateValues); }

  // Nested structures with user[name]=x and tags[]=a.
  static ArrayParsingStrategy brackets() { return ArrayParsingStrategy(Type::Brackets); }

  // Nested structures with explicit indices tags[1]=b&tags[0]=a, sequences ordered by index.
  static ArrayParsingStrategy bracketsWithIndices() { return ArrayParsingStrategy(Type::BracketsWithIndices); }

  // Caller provided parser of the whole body. If 'handleSingleValue' is true, the decoder accepts a lone scalar
  // where a sequence is expected (and reads the last element of a sequence where a scalar is expected).
  static ArrayParsingStrategy custom(CustomFunc func, bool handleSingleValue = false) {
    return ArrayParsingStrategy(std::move(func), handleSingleValue);
  }

  ArrayParsingStrategy() noexcept = default;

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] std::string_view name() const noexcept;

  // True for accumulateValues, where a field sent once cannot be told apart from a one element array.
  [[nodiscard]] bool handleSingleValue() const noexcept { return _handleSingleValue; }

  // Throws std::invalid_argument for a custom strategy without function.
  void validate() const;

  // Parses a form body. Never throws for built-in strategies.
  [[nodiscard]] FormContainer parse(std::string_view body) const;

 private:
  explicit ArrayParsingStrategy(Type type) noexcept
      : _type(type), _handleSingleValue(type == Type::AccumulateValues) {}
  ArrayParsingStrategy(CustomFunc func, bool handleSingleValue)
      : _type(Type::Custom), _handleSingleValue(handleSingleValue), _custom(std::move(func)) {}

  Type _type{Type::AccumulateValues};
  bool _handleSingleValue{true};
  CustomFunc _custom;
};

}  // namespace urlform
