#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace urlform {

// In-memory tree bridging typed records and the flat key/value wire form.
// A node is either a Scalar leaf (text form of a value), a Sequence (ordered list of nodes) or a Mapping
// (insertion ordered list of uniquely keyed nodes).
class FormContainer {
 public:
  enum class Kind : std::uint8_t { Scalar, Sequence, Mapping };

  using Sequence = std::vector<FormContainer>;
  using Entry = std::pair<std::string, FormContainer>;
  using Mapping = std::vector<Entry>;

  // Default constructed container is an empty Scalar (the nil leaf).
  FormContainer() = default;

  static FormContainer scalar(std::string value) { return FormContainer(std::move(value)); }

  static FormContainer sequence(Sequence elements = {}) { return FormContainer(std::move(elements)); }

  static FormContainer mapping(Mapping entries = {}) { return FormContainer(std::move(entries)); }

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(_node.index()); }

  [[nodiscard]] bool isScalar() const noexcept { return kind() == Kind::Scalar; }
  [[nodiscard]] bool isSequence() const noexcept { return kind() == Kind::Sequence; }
  [[nodiscard]] bool isMapping() const noexcept { return kind() == Kind::Mapping; }

  // Accessors below require the matching kind (checked by std::get, std::bad_variant_access otherwise).
  [[nodiscard]] const std::string& scalarValue() const { return std::get<std::string>(_node); }

  [[nodiscard]] const Sequence& elements() const { return std::get<Sequence>(_node); }
  [[nodiscard]] Sequence& elements() { return std::get<Sequence>(_node); }

  [[nodiscard]] const Mapping& entries() const { return std::get<Mapping>(_node); }
  [[nodiscard]] Mapping& entries() { return std::get<Mapping>(_node); }

  // Number of elements of a Sequence or entries of a Mapping, 1 for a Scalar.
  [[nodiscard]] std::size_t size() const noexcept;

  // Tells whether this is a Sequence or a Mapping without any child.
  [[nodiscard]] bool isEmptyCollection() const noexcept;

  // Returns the value stored under 'key' in a Mapping, or nullptr if absent or if this is not a Mapping.
  [[nodiscard]] const FormContainer* find(std::string_view key) const noexcept;
  [[nodiscard]] FormContainer* find(std::string_view key) noexcept;

  // Sets 'key' to 'value' in a Mapping: an existing key is replaced in place (keeping its position),
  // a new key is appended. Returns a reference to the stored value.
  // If this container is not a Mapping, it is first turned into an empty one.
  FormContainer& set(std::string_view key, FormContainer value);

  // Appends 'value' to a Sequence and returns a reference to the stored value.
  // If this container is not a Sequence, it is first turned into an empty one.
  FormContainer& append(FormContainer value);

  // Compact debug representation, for instance {name: "John", tags: ["a", "b"]}
  [[nodiscard]] std::string toDebugString() const;

  bool operator==(const FormContainer&) const = default;

 private:
  explicit FormContainer(std::string value) : _node(std::move(value)) {}
  explicit FormContainer(Sequence elements) : _node(std::move(elements)) {}
  explicit FormContainer(Mapping entries) : _node(std::move(entries)) {}

  std::variant<std::string, Sequence, Mapping> _node;
};

std::string_view KindName(FormContainer::Kind kind) noexcept;

}  // namespace urlform
