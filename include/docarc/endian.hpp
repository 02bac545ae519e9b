#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace docarc {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return (static_cast<uint64_t>(byteswap(static_cast<uint32_t>(value))) << 32) |
         byteswap(static_cast<uint32_t>(value >> 32));
}

} // namespace detail

inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Host <-> big-endian conversions
inline constexpr uint32_t htobe32(uint32_t value) noexcept {
  if constexpr (is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint64_t htobe64(uint64_t value) noexcept {
  if constexpr (is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t betoh32(uint32_t value) noexcept { return htobe32(value); }
inline constexpr uint64_t betoh64(uint64_t value) noexcept { return htobe64(value); }

// Unaligned big-endian field access on raw archive bytes
inline void storeBE32(uint8_t *dest, uint32_t value) noexcept {
  uint32_t be = htobe32(value);
  std::memcpy(dest, &be, sizeof(be));
}

inline void storeBE64(uint8_t *dest, uint64_t value) noexcept {
  uint64_t be = htobe64(value);
  std::memcpy(dest, &be, sizeof(be));
}

inline uint32_t loadBE32(const uint8_t *src) noexcept {
  uint32_t be;
  std::memcpy(&be, src, sizeof(be));
  return betoh32(be);
}

inline uint64_t loadBE64(const uint8_t *src) noexcept {
  uint64_t be;
  std::memcpy(&be, src, sizeof(be));
  return betoh64(be);
}

} // namespace docarc
