#pragma once

#include <string_view>

#include "urlform/blob.hpp"

namespace urlform {

// Decodes a standard base64 string. Whitespace and padding are skipped.
// Throws std::invalid_argument on characters outside of the base64 alphabet.
[[nodiscard]] Blob B64Decode(std::string_view ascData);
Blob B64Decode(const char *) = delete;

}  // namespace urlform
