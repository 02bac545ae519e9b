#include <algorithm>
#include <limits>

#include <zlib.h>

#include <docarc/checksum.hpp>

namespace docarc::checksum {

uint64_t compute(std::span<const uint8_t> data) noexcept {
  uLong crc = crc32(0L, Z_NULL, 0);
  uLong adler = adler32(0L, Z_NULL, 0);

  // zlib takes uInt lengths, feed large inputs in chunks
  constexpr size_t maxChunk = std::numeric_limits<uInt>::max();
  size_t pos = 0;
  while (pos < data.size()) {
    uInt len = static_cast<uInt>(std::min(maxChunk, data.size() - pos));
    crc = crc32(crc, reinterpret_cast<const Bytef *>(data.data() + pos), len);
    adler = adler32(adler, reinterpret_cast<const Bytef *>(data.data() + pos), len);
    pos += len;
  }

  return (static_cast<uint64_t>(adler & 0xFFFFFFFFu) << 32) | (crc & 0xFFFFFFFFu);
}

} // namespace docarc::checksum
