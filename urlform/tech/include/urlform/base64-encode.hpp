#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace urlform {

constexpr auto B64EncodedLen(auto binDataLen) { return static_cast<std::size_t>((binDataLen + 2) / 3) * 4; }

/// Standard (RFC 4648, with '+' and '/') padded base64 encoding of 'binData' into [out, endOut).
/// The output range should be exactly B64EncodedLen(binData.size()) chars long.
constexpr void B64Encode(std::span<const std::byte> binData, char* out, const char* endOut) {
  int bitsCollected{};
  uint32_t accumulator{};

  constexpr const char kB64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  constexpr auto kB64NbBits = 6;
  constexpr decltype(accumulator) kMask6 = (1U << kB64NbBits) - 1U;

  for (std::byte byte : binData) {
    accumulator = (accumulator << 8) | static_cast<uint8_t>(byte);
    bitsCollected += 8;
    while (bitsCollected >= kB64NbBits) {
      bitsCollected -= kB64NbBits;
      *out++ = kB64Table[(accumulator >> bitsCollected) & kMask6];
    }
  }
  if (bitsCollected > 0) {
    accumulator <<= kB64NbBits - bitsCollected;
    *out++ = kB64Table[accumulator & kMask6];
  }
  while (out != endOut) {
    *out++ = '=';
  }
}

[[nodiscard]] inline std::string B64Encode(std::span<const std::byte> binData) {
  std::string ret;
  ret.resize_and_overwrite(B64EncodedLen(binData.size()), [binData](char* out, std::size_t n) {
    B64Encode(binData, out, static_cast<const char*>(out) + n);
    return n;
  });
  return ret;
}

}  // namespace urlform
