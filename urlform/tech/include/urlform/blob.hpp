#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace urlform {

// Binary leaf type of the codec (opaque bytes, encoded through the configured data strategy).
using Blob = std::vector<std::byte>;

inline Blob MakeBlob(std::string_view bytes) {
  Blob ret(bytes.size());
  for (std::size_t pos = 0; pos < bytes.size(); ++pos) {
    ret[pos] = static_cast<std::byte>(bytes[pos]);
  }
  return ret;
}

inline std::string_view BlobAsChars(std::span<const std::byte> blob) noexcept {
  return {reinterpret_cast<const char*>(blob.data()), blob.size()};
}

}  // namespace urlform
