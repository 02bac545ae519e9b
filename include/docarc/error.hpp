#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace docarc {

// Input document is missing
struct SourceNotFound {
  std::string path;
};

// Content exceeds the configured ceiling
struct EncodeTooLarge {
  uint64_t size = 0;
  uint64_t limit = 0;
};

// Archive is too short, has a bad signature or carries trailing data
struct CorruptHeader {
  std::string reason;
};

// Fewer content bytes than the header declares
struct TruncatedContent {
  uint64_t declared = 0;
  uint64_t available = 0;
};

// Recomputed digest differs from the stored one
struct ChecksumMismatch {
  uint64_t expected = 0; // Stored in the header
  uint64_t actual = 0;   // Recomputed from the content
};

// Lock wait bound exceeded
struct LockTimeout {
  std::string path;
  std::chrono::milliseconds waited{0};
};

// Underlying file-system failure
struct IoFailure {
  std::string path;
  std::string operation;
  int errorCode = 0; // errno (or GetLastError on Windows), 0 if unknown
};

using ErrorDetail = std::variant<SourceNotFound, EncodeTooLarge, CorruptHeader, TruncatedContent,
                                 ChecksumMismatch, LockTimeout, IoFailure>;

// Order matches the alternatives of ErrorDetail
enum class ErrorKind : uint8_t {
  SourceNotFound = 0,
  EncodeTooLarge,
  CorruptHeader,
  TruncatedContent,
  ChecksumMismatch,
  LockTimeout,
  IoFailure,
};

const char *errorKindName(ErrorKind kind) noexcept;

class Error {
public:
  Error() = default;
  Error(ErrorDetail detail, std::string message)
      : detail_(std::move(detail)), message_(std::move(message)) {}

  ErrorKind kind() const { return static_cast<ErrorKind>(detail_.index()); }

  template <typename T> bool is() const { return std::holds_alternative<T>(detail_); }
  template <typename T> const T &get() const { return std::get<T>(detail_); }

  const ErrorDetail &detail() const { return detail_; }
  const std::string &message() const { return message_; }

  // Only lock timeouts are worth retrying (with backoff, by the caller)
  bool isRetryable() const { return is<LockTimeout>(); }

  static Error sourceNotFound(const std::string &path);
  static Error encodeTooLarge(uint64_t size, uint64_t limit);
  static Error corruptHeader(const std::string &reason);
  static Error truncatedContent(uint64_t declared, uint64_t available);
  static Error checksumMismatch(uint64_t expected, uint64_t actual);
  static Error lockTimeout(const std::string &path, std::chrono::milliseconds waited);
  static Error ioFailure(const std::string &path, const std::string &operation, int errorCode);

private:
  ErrorDetail detail_;
  std::string message_;
};

// Store err into outError when the caller asked for it
inline void setError(Error *outError, Error err) {
  if (outError) {
    *outError = std::move(err);
  }
}

} // namespace docarc
