#pragma once

#include <cstdint>
#include <span>

namespace docarc {

// Integrity digest over document bytes
//
// The 64-bit value packs Adler-32 in the high word and CRC-32 in the low word
// (both as computed by zlib). CRC-32 catches every single-bit flip and burst
// errors; Adler-32 makes the digest sensitive to length changes as well.
namespace checksum {

uint64_t compute(std::span<const uint8_t> data) noexcept;

inline bool verify(std::span<const uint8_t> data, uint64_t digest) noexcept {
  return compute(data) == digest;
}

// Individual halves, exposed for diagnostics
inline constexpr uint32_t crcPart(uint64_t digest) noexcept {
  return static_cast<uint32_t>(digest);
}

inline constexpr uint32_t adlerPart(uint64_t digest) noexcept {
  return static_cast<uint32_t>(digest >> 32);
}

} // namespace checksum

} // namespace docarc
