#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace docarc {

// Format "DCA", version 1
inline constexpr std::array<char, 4> archiveMagic = {'D', 'C', 'A', '\x01'};

// Archive header (32 bytes, all integers big-endian when stored)
struct ArchiveHeader {
  std::array<char, 4> magic = archiveMagic; // Signature + version
  uint64_t contentLength = 0;               // Byte length of the content section
  uint64_t createdAt = 0;                   // Seconds since epoch
  uint64_t checksum = 0;                    // Digest of the content section
  uint32_t reserved = 0;                    // Written as zero, ignored on read

  static constexpr size_t headerSize = 32;

  static constexpr size_t magicOffset = 0;
  static constexpr size_t contentLengthOffset = 4;
  static constexpr size_t createdAtOffset = 12;
  static constexpr size_t checksumOffset = 20;
  static constexpr size_t reservedOffset = 28;

  bool operator==(const ArchiveHeader &) const = default;
};

// Header plus the recovered document bytes
struct DecodedArchive {
  ArchiveHeader header;
  std::vector<uint8_t> content;
};

// Ceiling inherited from the document content constraint (10 MiB)
inline constexpr uint64_t defaultMaxContentSize = 10ull * 1024 * 1024;

// Extension given to archives produced by the backup and tool layers
inline constexpr const char *archiveExtension = ".dca";

} // namespace docarc
