#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "error.hpp"

namespace docarc {

// Writes a file through a private temporary in the target's directory and
// publishes it with a single rename. Until commit() succeeds the target keeps
// its previous state (or stays absent); an uncommitted AtomicFile removes its
// temporary when discarded or destroyed.
class AtomicFile {
public:
  AtomicFile();
  ~AtomicFile();

  // Delete copy, enable move
  AtomicFile(const AtomicFile &) = delete;
  AtomicFile &operator=(const AtomicFile &) = delete;
  AtomicFile(AtomicFile &&other) noexcept;
  AtomicFile &operator=(AtomicFile &&other) noexcept;

  // Create the temporary for target (parent directories are created if needed)
  bool open(const std::filesystem::path &target, Error *outError = nullptr);

  // Append bytes to the temporary
  bool write(std::span<const uint8_t> data, Error *outError = nullptr);

  // Flush the temporary and rename it over the target
  bool commit(Error *outError = nullptr);

  // Drop the temporary without touching the target
  void discard() noexcept;

  bool isOpen() const { return !tempPath_.empty(); }

  const std::filesystem::path &targetPath() const { return targetPath_; }
  const std::filesystem::path &tempPath() const { return tempPath_; }

private:
  void closeHandle() noexcept;

#ifdef _WIN32
  void *handle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1;
#endif
  std::filesystem::path targetPath_;
  std::filesystem::path tempPath_;
};

// open + write + commit
bool writeFileAtomic(const std::filesystem::path &path, std::span<const uint8_t> data,
                     Error *outError = nullptr);

} // namespace docarc
