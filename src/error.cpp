#include <format>

#include <docarc/error.hpp>

namespace docarc {

const char *errorKindName(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::SourceNotFound:
    return "SourceNotFound";
  case ErrorKind::EncodeTooLarge:
    return "EncodeTooLarge";
  case ErrorKind::CorruptHeader:
    return "CorruptHeader";
  case ErrorKind::TruncatedContent:
    return "TruncatedContent";
  case ErrorKind::ChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorKind::LockTimeout:
    return "LockTimeout";
  case ErrorKind::IoFailure:
    return "IoFailure";
  }
  return "Unknown";
}

Error Error::sourceNotFound(const std::string &path) {
  return Error(SourceNotFound{path}, std::format("Source file does not exist: {}", path));
}

Error Error::encodeTooLarge(uint64_t size, uint64_t limit) {
  return Error(EncodeTooLarge{size, limit},
               std::format("Document too large to archive ({} bytes, limit {})", size, limit));
}

Error Error::corruptHeader(const std::string &reason) {
  return Error(CorruptHeader{reason}, std::format("Corrupt archive header: {}", reason));
}

Error Error::truncatedContent(uint64_t declared, uint64_t available) {
  return Error(TruncatedContent{declared, available},
               std::format("Truncated archive content (declared {} bytes, found {})", declared,
                           available));
}

Error Error::checksumMismatch(uint64_t expected, uint64_t actual) {
  return Error(ChecksumMismatch{expected, actual},
               std::format("Checksum mismatch (stored {:016x}, computed {:016x})", expected,
                           actual));
}

Error Error::lockTimeout(const std::string &path, std::chrono::milliseconds waited) {
  return Error(LockTimeout{path, waited},
               std::format("Timed out after {} ms waiting for lock on: {}", waited.count(), path));
}

Error Error::ioFailure(const std::string &path, const std::string &operation, int errorCode) {
  return Error(IoFailure{path, operation, errorCode},
               std::format("Failed to {}: {} (errno: {})", operation, path, errorCode));
}

} // namespace docarc
