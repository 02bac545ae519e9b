#include <algorithm>
#include <cstring>
#include <format>

#include <docarc/checksum.hpp>
#include <docarc/codec.hpp>
#include <docarc/endian.hpp>

namespace docarc::codec {

namespace {

std::string describeMagic(const void *magic) {
  const auto *bytes = static_cast<const uint8_t *>(magic);
  return std::format("{:02x} {:02x} {:02x} {:02x}", bytes[0], bytes[1], bytes[2], bytes[3]);
}

} // namespace

std::array<uint8_t, ArchiveHeader::headerSize> serializeHeader(const ArchiveHeader &header) {
  std::array<uint8_t, ArchiveHeader::headerSize> out{};

  std::memcpy(out.data() + ArchiveHeader::magicOffset, header.magic.data(), header.magic.size());
  storeBE64(out.data() + ArchiveHeader::contentLengthOffset, header.contentLength);
  storeBE64(out.data() + ArchiveHeader::createdAtOffset, header.createdAt);
  storeBE64(out.data() + ArchiveHeader::checksumOffset, header.checksum);
  storeBE32(out.data() + ArchiveHeader::reservedOffset, 0);

  return out;
}

std::optional<ArchiveHeader> readHeader(std::span<const uint8_t> data, Error *outError) {
  if (data.size() < ArchiveHeader::headerSize) {
    setError(outError, Error::corruptHeader(std::format(
                           "file too small to be an archive (size: {})", data.size())));
    return std::nullopt;
  }

  if (std::memcmp(data.data(), archiveMagic.data(), archiveMagic.size()) != 0) {
    setError(outError, Error::corruptHeader(std::format("invalid magic (expected {}, got {})",
                                                        describeMagic(archiveMagic.data()),
                                                        describeMagic(data.data()))));
    return std::nullopt;
  }

  ArchiveHeader header;
  header.contentLength = loadBE64(data.data() + ArchiveHeader::contentLengthOffset);
  header.createdAt = loadBE64(data.data() + ArchiveHeader::createdAtOffset);
  header.checksum = loadBE64(data.data() + ArchiveHeader::checksumOffset);
  header.reserved = loadBE32(data.data() + ArchiveHeader::reservedOffset);

  return header;
}

std::optional<std::vector<uint8_t>> encode(std::span<const uint8_t> content, uint64_t createdAt,
                                           uint64_t maxContentSize, Error *outError) {
  if (content.size() > maxContentSize) {
    setError(outError, Error::encodeTooLarge(content.size(), maxContentSize));
    return std::nullopt;
  }

  ArchiveHeader header;
  header.contentLength = content.size();
  header.createdAt = createdAt;
  header.checksum = checksum::compute(content);

  std::vector<uint8_t> out(ArchiveHeader::headerSize + content.size());
  auto headerBytes = serializeHeader(header);
  std::copy(headerBytes.begin(), headerBytes.end(), out.begin());
  std::copy(content.begin(), content.end(), out.begin() + ArchiveHeader::headerSize);

  return out;
}

std::optional<DecodedArchive> decode(std::span<const uint8_t> data, Error *outError) {
  auto header = readHeader(data, outError);
  if (!header) {
    return std::nullopt;
  }

  auto body = data.subspan(ArchiveHeader::headerSize);
  if (body.size() < header->contentLength) {
    setError(outError, Error::truncatedContent(header->contentLength, body.size()));
    return std::nullopt;
  }

  if (body.size() > header->contentLength) {
    setError(outError, Error::corruptHeader(std::format(
                           "trailing data after content ({} extra bytes)",
                           body.size() - header->contentLength)));
    return std::nullopt;
  }

  uint64_t actual = checksum::compute(body);
  if (actual != header->checksum) {
    setError(outError, Error::checksumMismatch(header->checksum, actual));
    return std::nullopt;
  }

  DecodedArchive result;
  result.header = *header;
  result.content.assign(body.begin(), body.end());
  return result;
}

} // namespace docarc::codec
