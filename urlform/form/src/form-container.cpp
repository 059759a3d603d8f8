#include "urlform/form-container.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace urlform {

std::size_t FormContainer::size() const noexcept {
  switch (kind()) {
    case Kind::Sequence:
      return std::get<Sequence>(_node).size();
    case Kind::Mapping:
      return std::get<Mapping>(_node).size();
    default:
      return 1U;
  }
}

bool FormContainer::isEmptyCollection() const noexcept { return !isScalar() && size() == 0; }

const FormContainer* FormContainer::find(std::string_view key) const noexcept {
  const Mapping* mapping = std::get_if<Mapping>(&_node);
  if (mapping == nullptr) {
    return nullptr;
  }
  const auto it = std::ranges::find(*mapping, key, &Entry::first);
  return it == mapping->end() ? nullptr : &it->second;
}

FormContainer* FormContainer::find(std::string_view key) noexcept {
  return const_cast<FormContainer*>(std::as_const(*this).find(key));
}

FormContainer& FormContainer::set(std::string_view key, FormContainer value) {
  if (!isMapping()) {
    _node = Mapping{};
  }
  Mapping& mapping = entries();
  const auto it = std::ranges::find(mapping, key, &Entry::first);
  if (it != mapping.end()) {
    it->second = std::move(value);
    return it->second;
  }
  return mapping.emplace_back(std::string(key), std::move(value)).second;
}

FormContainer& FormContainer::append(FormContainer value) {
  if (!isSequence()) {
    _node = Sequence{};
  }
  return elements().emplace_back(std::move(value));
}

std::string FormContainer::toDebugString() const {
  std::string ret;
  switch (kind()) {
    case Kind::Scalar:
      ret.push_back('"');
      ret.append(scalarValue());
      ret.push_back('"');
      break;
    case Kind::Sequence: {
      ret.push_back('[');
      const char* sep = "";
      for (const FormContainer& elem : elements()) {
        ret.append(sep);
        ret.append(elem.toDebugString());
        sep = ", ";
      }
      ret.push_back(']');
      break;
    }
    case Kind::Mapping: {
      ret.push_back('{');
      const char* sep = "";
      for (const auto& [key, value] : entries()) {
        ret.append(sep);
        ret.append(key);
        ret.append(": ");
        ret.append(value.toDebugString());
        sep = ", ";
      }
      ret.push_back('}');
      break;
    }
  }
  return ret;
}

std::string_view KindName(FormContainer::Kind kind) noexcept {
  switch (kind) {
    case FormContainer::Kind::Scalar:
      return "Scalar";
    case FormContainer::Kind::Sequence:
      return "Sequence";
    case FormContainer::Kind::Mapping:
      return "Mapping";
    default:
      return "Unknown";
  }
}

}  // namespace urlform
