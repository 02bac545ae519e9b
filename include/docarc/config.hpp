#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "log.hpp"
#include "types.hpp"

namespace docarc {

enum class BackupMode : uint8_t {
  Copy = 0, // Byte-for-byte copies
  Archive,  // Each copy encoded as an archive (".dca" appended)
};

// Upper bound accepted for [lock] timeout_ms
constexpr std::chrono::milliseconds maxLockTimeout = std::chrono::hours(24);

struct Config {
  uint64_t maxContentSize = defaultMaxContentSize;
  std::chrono::milliseconds lockTimeout{5000};
  std::vector<std::string> backupExtensions{".json", ".txt"};
  BackupMode backupMode = BackupMode::Copy;
  log::Level logLevel = log::Level::Warn;
};

// Load INI-style settings over the values already in outConfig
//
//   [archive]  max_content_size = <bytes>
//   [lock]     timeout_ms = <milliseconds, at most 24 hours>
//   [backup]   extensions = .json, .txt
//              mode = copy | archive
//   [log]      level = debug | info | warn | error
//
// Unknown sections and keys are ignored
bool loadConfig(const std::filesystem::path &path, Config &outConfig,
                std::string *outError = nullptr);

} // namespace docarc
