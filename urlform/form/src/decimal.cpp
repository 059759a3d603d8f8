#include "urlform/decimal.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "urlform/log.hpp"
#include "urlform/simple-charconv.hpp"

namespace urlform {

namespace {

std::optional<std::string> Canonicalize(std::string_view text) {
  bool negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  const auto dotPos = text.find('.');
  std::string_view integral = text.substr(0, dotPos);
  std::string_view fractional = dotPos == std::string_view::npos ? std::string_view{} : text.substr(dotPos + 1);
  if (integral.empty() || !AllDigits(integral.data(), integral.size()) ||
      (dotPos != std::string_view::npos &&
       (fractional.empty() || !AllDigits(fractional.data(), fractional.size())))) {
    return std::nullopt;
  }

  while (integral.size() > 1U && integral.front() == '0') {
    integral.remove_prefix(1);
  }
  while (!fractional.empty() && fractional.back() == '0') {
    fractional.remove_suffix(1);
  }

  std::string ret;
  if (negative && (integral != "0" || !fractional.empty())) {
    ret.push_back('-');
  }
  ret.append(integral);
  if (!fractional.empty()) {
    ret.push_back('.');
    ret.append(fractional);
  }
  return ret;
}

}  // namespace

Decimal::Decimal(std::string_view text) {
  auto canonical = Canonicalize(text);
  if (!canonical) {
    log::error("Invalid decimal '{}'", text);
    throw std::invalid_argument("Invalid decimal");
  }
  _canonical = std::move(*canonical);
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
  auto canonical = Canonicalize(text);
  if (!canonical) {
    return std::nullopt;
  }
  return Decimal(CanonicalTag{}, std::move(*canonical));
}

}  // namespace urlform
