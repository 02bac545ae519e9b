#pragma once

#include <array>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace docarc::codec {

// Serialize a header into its 32-byte on-disk form
std::array<uint8_t, ArchiveHeader::headerSize> serializeHeader(const ArchiveHeader &header);

// Parse and validate only the fixed header (size and magic)
// Content bytes are neither required nor checked
std::optional<ArchiveHeader> readHeader(std::span<const uint8_t> data, Error *outError = nullptr);

// Build header + content for a document
// Fails with EncodeTooLarge if content exceeds maxContentSize
std::optional<std::vector<uint8_t>> encode(std::span<const uint8_t> content, uint64_t createdAt,
                                           uint64_t maxContentSize = defaultMaxContentSize,
                                           Error *outError = nullptr);

// Parse an archive back into header and content
// Fails with CorruptHeader, TruncatedContent or ChecksumMismatch; never pads or truncates
std::optional<DecodedArchive> decode(std::span<const uint8_t> data, Error *outError = nullptr);

} // namespace docarc::codec
