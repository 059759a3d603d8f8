#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "urlform/blob.hpp"
#include "urlform/decimal.hpp"
#include "urlform/timedef.hpp"

namespace urlform {

class KeyedEncodingContainer;
class KeyedDecodingContainer;

// Customization point describing how a record is walked field by field.
// Specialize it for each record type:
//
//   template <>
//   struct FormCodable<User> {
//     static void encode(const User& user, KeyedEncodingContainer& container) {
//       container.encode("name", user.name);
//       container.encode("tags", user.tags);
//     }
//     static User decode(KeyedDecodingContainer& container) {
//       return {container.decode<std::string>("name"), container.decode<std::optional<std::vector<std::string>>>("tags")};
//     }
//   };
//
// Fields are written in call order, which is the order of the pairs on the wire.
template <class T>
struct FormCodable;

template <class T>
concept FormEncodableRecord = requires(const T& value, KeyedEncodingContainer& container) {
  FormCodable<T>::encode(value, container);
};

template <class T>
concept FormDecodableRecord = requires(KeyedDecodingContainer& container) {
  { FormCodable<T>::decode(container) } -> std::same_as<T>;
};

namespace detail {

template <class T>
struct IsOptional : std::false_type {};

template <class T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <class T>
struct IsStdArray : std::false_type {};

template <class T, std::size_t N>
struct IsStdArray<std::array<T, N>> : std::true_type {};

template <class>
inline constexpr bool kAlwaysFalse = false;

}  // namespace detail

template <class T>
concept FormOptional = detail::IsOptional<T>::value;

template <class T>
concept FormStringLike = std::convertible_to<const T&, std::string_view>;

// Leaves with a dedicated text form (configured strategy or canonical text).
template <class T>
concept FormLeaf = std::same_as<T, SysTimePoint> || std::same_as<T, Blob> || std::same_as<T, Decimal>;

// Associative containers with string keys, encoded as a Mapping.
template <class T>
concept FormStringKeyedMap = requires {
  typename T::key_type;
  typename T::mapped_type;
} && std::convertible_to<const typename T::key_type&, std::string_view> && std::ranges::input_range<const T>;

// Maps with unspecified iteration order, keys are sorted when encoding.
template <class T>
concept FormUnorderedMap = FormStringKeyedMap<T> && requires { typename T::hasher; };

// Ranges encoded as a Sequence.
template <class T>
concept FormSequenceRange = std::ranges::input_range<const T> && !FormStringLike<T> && !FormLeaf<T> &&
                            !FormStringKeyedMap<T> && !FormEncodableRecord<T>;

// Ranges that can be rebuilt element by element when decoding a Sequence.
template <class T>
concept FormAppendableRange = FormSequenceRange<T> && std::default_initializable<T> &&
                              requires(T& range, typename T::value_type&& value) {
                                range.insert(range.end(), std::move(value));
                              };

template <class T>
concept FormStdArray = detail::IsStdArray<T>::value;

}  // namespace urlform
