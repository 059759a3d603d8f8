#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "urlform/form-container.hpp"

namespace urlform {

// Key convention used to flatten nested containers into form fields.
enum class ArrayStyle : std::uint8_t {
  AccumulateValues,     // tags=a&tags=b, nested mappings as user[name]=x
  Brackets,             // tags[]=a&tags[]=b
  BracketsWithIndices,  // tags[0]=a&tags[1]=b
};

std::string_view ArrayStyleName(ArrayStyle style) noexcept;

// One field of a form body, decoded.
// 'path' holds the field name followed by its bracketed segments, an empty segment standing for '[]'.
// For instance user[pets][][name] is {"user", "pets", "", "name"}.
// An empty path denotes a bare value (only produced when a scalar or a sequence is encoded at the root).
struct FormPair {
  // Raw (not percent encoded) textual key, 'user[pets][][name]'.
  [[nodiscard]] std::string key() const;

  bool operator==(const FormPair&) const = default;

  std::vector<std::string> path;
  std::string value;
};

// Splits a decoded key into its path segments.
// Malformed keys are tolerated: an unterminated '[' takes the rest of the key as its segment, and chars between a
// ']' and the next '[' are ignored.
std::vector<std::string> SplitKeySegments(std::string_view key);

// Splits an application/x-www-form-urlencoded body on '&' then on the first '=' of each field, and percent decodes
// keys and values ('+' as space). Empty fields are skipped, a field without '=' has an empty value.
// With ArrayStyle::AccumulateValues keys are kept whole, otherwise they are split with SplitKeySegments.
std::vector<FormPair> SplitFormPairs(std::string_view body, ArrayStyle style);

// Joins pairs into a body: each key segment and each value is percent encoded individually while the structural
// brackets are kept raw (tags[0]=a%26b).
std::string JoinFormPairs(std::span<const FormPair> pairs);

// Flattens a container into ordered pairs following 'style'.
// Empty collections produce no pair. Throws EncodingError (UnrepresentableValue) for a sequence nested directly in
// another sequence, or holding mappings, under ArrayStyle::AccumulateValues.
std::vector<FormPair> FlattenFormContainer(const FormContainer& root, ArrayStyle style);

// Rebuilds the container tree (rooted at a Mapping) from parsed pairs. Never throws on malformed input.
//  - AccumulateValues: pairs are grouped by exact key, repeated keys giving a Sequence in encounter order.
//  - Brackets / BracketsWithIndices: each '[]' appends a new element, numeric segments are explicit indices.
//    Sequences are ordered by index and compacted. An unkeyed element takes the index following the largest one
//    seen so far in its sequence. A node used both as a leaf and as a container keeps the last written form.
//    Keys nested deeper than 64 bracket segments keep their remaining segments as one literal key.
FormContainer BuildFormContainer(std::span<const FormPair> pairs, ArrayStyle style);

inline std::string SerializeFormContainer(const FormContainer& root, ArrayStyle style) {
  return JoinFormPairs(FlattenFormContainer(root, style));
}

inline FormContainer ParseFormBody(std::string_view body, ArrayStyle style) {
  return BuildFormContainer(SplitFormPairs(body, style), style);
}

}  // namespace urlform
