#include "urlform/array-strategy.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include "urlform/form-container.hpp"
#include "urlform/form-pairs.hpp"
#include "urlform/log.hpp"

namespace urlform {

namespace {

template <class Type>
ArrayStyle ToArrayStyle(Type type) {
  switch (type) {
    case Type::Brackets:
      return ArrayStyle::Brackets;
    case Type::BracketsWithIndices:
      return ArrayStyle::BracketsWithIndices;
    default:
      return ArrayStyle::AccumulateValues;
  }
}

}  // namespace

std::string_view ArrayEncodingStrategy::name() const noexcept {
  return _type == Type::Custom ? "custom" : ArrayStyleName(ToArrayStyle(_type));
}

void ArrayEncodingStrategy::validate() const {
  if (_type == Type::Custom && !_custom) {
    log::critical("Custom array encoding strategy requires a function");
    throw std::invalid_argument("Custom array encoding strategy without function");
  }
}

std::string ArrayEncodingStrategy::serialize(const FormContainer& root) const {
  if (_type == Type::Custom) {
    return _custom(root);
  }
  return SerializeFormContainer(root, ToArrayStyle(_type));
}

std::string_view ArrayParsingStrategy::name() const noexcept {
  return _type == Type::Custom ? "custom" : ArrayStyleName(ToArrayStyle(_type));
}

void ArrayParsingStrategy::validate() const {
  if (_type == Type::Custom && !_custom) {
    log::critical("Custom array parsing strategy requires a function");
    throw std::invalid_argument("Custom array parsing strategy without function");
  }
}

FormContainer ArrayParsingStrategy::parse(std::string_view body) const {
  if (_type == Type::Custom) {
    return _custom(body);
  }
  return ParseFormBody(body, ToArrayStyle(_type));
}

}  // namespace urlform
