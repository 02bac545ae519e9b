#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "lock.hpp"
#include "types.hpp"

namespace docarc {

// Header summary of an archive on disk (checksum not verified)
struct ArchiveInfo {
  ArchiveHeader header;
  uint64_t fileSize = 0;

  // True if the file holds exactly header + declared content
  bool sizeMatches() const { return fileSize == ArchiveHeader::headerSize + header.contentLength; }
};

// Entry of a case directory listing
struct FileInfo {
  std::string name;
  std::string relativePath; // Forward slashes, relative to the listed directory
  std::filesystem::path fullPath;
  uint64_t size = 0;
  std::filesystem::file_time_type modified;
  std::optional<ArchiveInfo> archive; // Set for readable archives
};

// Archives, extracts and backs up documents with per-path locking
//
// Every operation takes its locks through the shared LockManager, so
// concurrent callers on the same path follow readers-writer ordering. Files
// are only ever replaced through AtomicFile, so a failed or abandoned
// operation leaves no partial artifact behind.
class ArchiveService {
public:
  // Seconds since epoch
  using Clock = std::function<uint64_t()>;

  explicit ArchiveService(LockManager &locks, Config config = {}, Clock clock = {});

  // Delete copy (holds a reference to the lock table)
  ArchiveService(const ArchiveService &) = delete;
  ArchiveService &operator=(const ArchiveService &) = delete;

  // Encode sourcePath into archivePath under an exclusive lock on archivePath
  bool archiveDocument(const std::filesystem::path &sourcePath,
                       const std::filesystem::path &archivePath, Error *outError = nullptr);

  // Decode archivePath into outputPath under a shared lock on archivePath,
  // or an exclusive one when outputPath is the archive itself
  // outputPath is left untouched on any failure
  bool extractDocument(const std::filesystem::path &archivePath,
                       const std::filesystem::path &outputPath, Error *outError = nullptr);

  // Read the header of an archive under a shared lock
  std::optional<ArchiveInfo> inspectArchive(const std::filesystem::path &archivePath,
                                            Error *outError = nullptr);

  // Fully decode an archive under a shared lock, discarding the content
  bool verifyArchive(const std::filesystem::path &archivePath, Error *outError = nullptr);

  // Copy (or archive, depending on config) every file with a backup extension
  // into backupDir, preserving relative directories and tagging names with a
  // timestamp. Returns the number of files backed up.
  std::optional<size_t> backupFiles(const std::filesystem::path &sourceDir,
                                    const std::filesystem::path &backupDir,
                                    Error *outError = nullptr);

  // Recursive listing, newest first, optionally filtered by extension
  std::optional<std::vector<FileInfo>> listCaseFiles(const std::filesystem::path &casePath,
                                                     const std::string &extension = {},
                                                     Error *outError = nullptr);

  const Config &config() const { return config_; }

  static uint64_t systemClock();

  // "<stem>_<YYYYMMDD_HHMMSS><ext>" with the time shown in the local time zone
  static std::string backupName(const std::filesystem::path &fileName, uint64_t timestamp);

private:
  // Caller holds a shared lock on sourcePath
  bool copyFile(const std::filesystem::path &sourcePath, const std::filesystem::path &destPath,
                Error *outError);

  LockManager &locks_;
  Config config_;
  Clock clock_;
};

} // namespace docarc
