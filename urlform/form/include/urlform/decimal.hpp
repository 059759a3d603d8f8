#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace urlform {

// Exact decimal number kept in canonical text form, for values that should not go through a binary floating point.
// Accepted syntax is [+-]digits[.digits]. The canonical form has no '+' sign, no leading zeros in the integral
// part, no trailing zeros in the fractional part, and zero is "0" (never "-0").
class Decimal {
 public:
  Decimal() = default;

  // Throws std::invalid_argument if 'text' is not a valid decimal.
  explicit Decimal(std::string_view text);

  // Returns std::nullopt if 'text' is not a valid decimal.
  static std::optional<Decimal> parse(std::string_view text);

  [[nodiscard]] std::string_view str() const noexcept { return _canonical; }

  [[nodiscard]] bool isNegative() const noexcept { return _canonical.front() == '-'; }

  bool operator==(const Decimal&) const noexcept = default;

 private:
  struct CanonicalTag {};

  Decimal(CanonicalTag, std::string canonical) : _canonical(std::move(canonical)) {}

  std::string _canonical{"0"};
};

}  // namespace urlform
