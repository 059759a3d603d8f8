#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "urlform/blob.hpp"
#include "urlform/decimal.hpp"
#include "urlform/form-codable.hpp"
#include "urlform/form-config.hpp"
#include "urlform/form-container.hpp"
#include "urlform/form-error.hpp"
#include "urlform/stringconv.hpp"
#include "urlform/timedef.hpp"

namespace urlform {

class FormEncoder;

// Writes the fields of a record into a Mapping node.
// Nested containers are handed to a callback and stored in their parent when it returns.
class KeyedEncodingContainer {
 public:
  // Encodes 'value' under 'key'. An empty optional omits the key entirely.
  template <class T>
  void encode(std::string_view key, const T& value);

  // Writes an empty value under 'key' ('key=' on the wire).
  void encodeNil(std::string_view key);

  template <class T>
  void encodeIfPresent(std::string_view key, const std::optional<T>& value) {
    if (value) {
      encode(key, *value);
    }
  }

  // Calls 'func(KeyedEncodingContainer&)' to fill a Mapping stored under 'key'.
  template <class Func>
  void nestedKeyed(std::string_view key, Func&& func);

  // Calls 'func(SequenceEncodingContainer&)' to fill a Sequence stored under 'key'.
  template <class Func>
  void nestedSequence(std::string_view key, Func&& func);

  // Not supported by the form format, always throws EncodingError (Unsupported).
  [[noreturn]] void superEncoder() const;

  [[nodiscard]] const CodingPath& codingPath() const noexcept;

  // Number of keys written so far.
  [[nodiscard]] std::size_t count() const noexcept { return _mapping.size(); }

 private:
  friend class FormEncoder;
  friend class SequenceEncodingContainer;

  KeyedEncodingContainer(FormEncoder& encoder, FormContainer& mapping) noexcept
      : _encoder(encoder), _mapping(mapping) {}

  FormEncoder& _encoder;
  FormContainer& _mapping;
};

// Appends values to a Sequence node.
class SequenceEncodingContainer {
 public:
  // An empty optional is written as an empty value.
  template <class T>
  void encode(const T& value);

  void encodeNil();

  template <class Func>
  void nestedKeyed(Func&& func);

  template <class Func>
  void nestedSequence(Func&& func);

  [[noreturn]] void superEncoder() const;

  [[nodiscard]] const CodingPath& codingPath() const noexcept;

  // Number of elements written so far.
  [[nodiscard]] std::size_t count() const noexcept { return _sequence.size(); }

 private:
  friend class FormEncoder;
  friend class KeyedEncodingContainer;

  SequenceEncodingContainer(FormEncoder& encoder, FormContainer& sequence) noexcept
      : _encoder(encoder), _sequence(sequence) {}

  FormEncoder& _encoder;
  FormContainer& _sequence;
};

// Encodes values into application/x-www-form-urlencoded bodies.
// An instance keeps per call state and should not be shared between threads. Distinct instances are independent.
//
// Supported values:
//  - bool ('true' / 'false'), integers, floating points (shortest round trip form), enums (underlying value)
//  - strings, SysTimePoint (date strategy), Blob (data strategy), Decimal
//  - std::optional (absent key in a record, empty value in a sequence)
//  - ranges (std::vector, std::list, std::array...) as sequences
//  - string keyed maps as mappings (unordered maps are written in sorted key order)
//  - records with a FormCodable specialization
class FormEncoder {
 public:
  // Throws std::invalid_argument if the configuration is invalid.
  explicit FormEncoder(FormEncoderConfig config = {});

  [[nodiscard]] const FormEncoderConfig& config() const noexcept { return _config; }

  // Encodes 'value' into a form body.
  // Throws EncodingError if nothing was written (empty optional at the root) or if the value cannot be
  // represented with the configured array strategy.
  template <class T>
  std::string encode(const T& value) {
    FormContainer root = encodeToContainer(value);
    return _config.arrayStrategy.serialize(root);
  }

  // Builds the container tree of 'value' without serializing it.
  template <class T>
  FormContainer encodeToContainer(const T& value) {
    _codingPath.clear();
    _root.reset();
    if constexpr (FormOptional<T>) {
      if (value) {
        _root = box(*value);
      }
    } else {
      _root = box(value);
    }
    return takeRoot();
  }

 private:
  friend class KeyedEncodingContainer;
  friend class SequenceEncodingContainer;

  template <class T>
  FormContainer box(const T& value);

  template <class Map>
  FormContainer boxMap(const Map& map);

  FormContainer boxBlob(const Blob& blob);

  FormContainer takeRoot();

  FormEncoderConfig _config;
  std::optional<FormContainer> _root;
  CodingPath _codingPath;
};

template <class T>
FormContainer FormEncoder::box(const T& value) {
  if constexpr (std::same_as<T, bool>) {
    return FormContainer::scalar(value ? "true" : "false");
  } else if constexpr (std::is_enum_v<T>) {
    return box(static_cast<std::underlying_type_t<T>>(value));
  } else if constexpr (std::integral<T>) {
    return FormContainer::scalar(IntegralToString(value));
  } else if constexpr (std::floating_point<T>) {
    return FormContainer::scalar(FloatingToString(value));
  } else if constexpr (FormStringLike<T>) {
    return FormContainer::scalar(std::string(std::string_view(value)));
  } else if constexpr (std::same_as<T, SysTimePoint>) {
    return FormContainer::scalar(_config.dateStrategy.encode(value));
  } else if constexpr (std::same_as<T, Blob>) {
    return boxBlob(value);
  } else if constexpr (std::same_as<T, Decimal>) {
    return FormContainer::scalar(std::string(value.str()));
  } else if constexpr (FormOptional<T>) {
    return value ? box(*value) : FormContainer::scalar({});
  } else if constexpr (FormEncodableRecord<T>) {
    FormContainer mapping = FormContainer::mapping();
    KeyedEncodingContainer container(*this, mapping);
    FormCodable<T>::encode(value, container);
    return mapping;
  } else if constexpr (FormStringKeyedMap<T>) {
    return boxMap(value);
  } else if constexpr (FormSequenceRange<T>) {
    FormContainer sequence = FormContainer::sequence();
    std::size_t index = 0;
    for (const auto& elem : value) {
      CodingPathGuard guard(_codingPath, index++);
      sequence.append(box(elem));
    }
    return sequence;
  } else {
    static_assert(detail::kAlwaysFalse<T>, "Type cannot be encoded as a form value, specialize FormCodable for it");
  }
}

template <class Map>
FormContainer FormEncoder::boxMap(const Map& map) {
  FormContainer mapping = FormContainer::mapping();
  const auto put = [this, &mapping](std::string_view key, const auto& mapped) {
    if constexpr (FormOptional<std::remove_cvref_t<decltype(mapped)>>) {
      if (!mapped) {
        return;
      }
    }
    CodingPathGuard guard(_codingPath, key);
    mapping.set(key, box(mapped));
  };
  if constexpr (FormUnorderedMap<Map>) {
    std::vector<const typename Map::value_type*> entries;
    entries.reserve(map.size());
    for (const auto& entry : map) {
      entries.push_back(&entry);
    }
    std::ranges::sort(entries, [](const auto* lhs, const auto* rhs) {
      return std::string_view(lhs->first) < std::string_view(rhs->first);
    });
    for (const auto* entry : entries) {
      put(entry->first, entry->second);
    }
  } else {
    for (const auto& [key, mapped] : map) {
      put(key, mapped);
    }
  }
  return mapping;
}

template <class T>
void KeyedEncodingContainer::encode(std::string_view key, const T& value) {
  if constexpr (FormOptional<T>) {
    if (value) {
      encode(key, *value);
    }
  } else {
    CodingPathGuard guard(_encoder._codingPath, key);
    _mapping.set(key, _encoder.box(value));
  }
}

template <class Func>
void KeyedEncodingContainer::nestedKeyed(std::string_view key, Func&& func) {
  CodingPathGuard guard(_encoder._codingPath, key);
  FormContainer nested = FormContainer::mapping();
  KeyedEncodingContainer container(_encoder, nested);
  std::forward<Func>(func)(container);
  _mapping.set(key, std::move(nested));
}

template <class Func>
void KeyedEncodingContainer::nestedSequence(std::string_view key, Func&& func) {
  CodingPathGuard guard(_encoder._codingPath, key);
  FormContainer nested = FormContainer::sequence();
  SequenceEncodingContainer container(_encoder, nested);
  std::forward<Func>(func)(container);
  _mapping.set(key, std::move(nested));
}

template <class T>
void SequenceEncodingContainer::encode(const T& value) {
  CodingPathGuard guard(_encoder._codingPath, count());
  FormContainer elem = _encoder.box(value);
  _sequence.append(std::move(elem));
}

template <class Func>
void SequenceEncodingContainer::nestedKeyed(Func&& func) {
  CodingPathGuard guard(_encoder._codingPath, count());
  FormContainer nested = FormContainer::mapping();
  KeyedEncodingContainer container(_encoder, nested);
  std::forward<Func>(func)(container);
  _sequence.append(std::move(nested));
}

template <class Func>
void SequenceEncodingContainer::nestedSequence(Func&& func) {
  CodingPathGuard guard(_encoder._codingPath, count());
  FormContainer nested = FormContainer::sequence();
  SequenceEncodingContainer container(_encoder, nested);
  std::forward<Func>(func)(container);
  _sequence.append(std::move(nested));
}

// Encodes 'value' with a temporary encoder.
template <class T>
std::string Encode(const T& value, FormEncoderConfig config = {}) {
  FormEncoder encoder(std::move(config));
  return encoder.encode(value);
}

}  // namespace urlform
