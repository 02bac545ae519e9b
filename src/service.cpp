#include <algorithm>
#include <chrono>
#include <ctime>
#include <format>

#include <docarc/atomic_file.hpp>
#include <docarc/codec.hpp>
#include <docarc/log.hpp>
#include <docarc/mmap.hpp>
#include <docarc/service.hpp>

namespace docarc {

namespace fs = std::filesystem;

namespace {

constexpr const char *kTag = "archive";

// True if path is dir or lies inside it (both compared in normalized absolute form)
bool isWithin(const fs::path &path, const fs::path &dir) {
  fs::path rel = fs::path(LockManager::normalizeKey(path))
                     .lexically_relative(LockManager::normalizeKey(dir));
  return !rel.empty() && rel.begin()->string() != "..";
}

bool hasExtension(const fs::path &path, const std::string &extension) {
  std::string name = path.filename().string();
  return name.size() >= extension.size() &&
         name.compare(name.size() - extension.size(), extension.size(), extension) == 0;
}

std::string toGenericRelative(const fs::path &path, const fs::path &base) {
  return path.lexically_relative(base).generic_string();
}

} // namespace

ArchiveService::ArchiveService(LockManager &locks, Config config, Clock clock)
    : locks_(locks), config_(std::move(config)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = &ArchiveService::systemClock;
  }
}

bool ArchiveService::archiveDocument(const fs::path &sourcePath, const fs::path &archivePath,
                                     Error *outError) {
  log::debug(kTag, std::format("Archiving {} -> {}", sourcePath.string(), archivePath.string()));

  auto lock = locks_.acquire(archivePath, LockMode::Exclusive, config_.lockTimeout, outError);
  if (!lock) {
    return false;
  }

  MappedFile source;
  if (!source.openRead(sourcePath, outError)) {
    return false;
  }

  auto encoded = codec::encode(source.data(), clock_(), config_.maxContentSize, outError);
  if (!encoded) {
    return false;
  }
  source.close();

  if (!writeFileAtomic(archivePath, *encoded, outError)) {
    return false;
  }

  log::debug(kTag, std::format("Committed {} ({} bytes)", archivePath.string(), encoded->size()));
  return true;
}

bool ArchiveService::extractDocument(const fs::path &archivePath, const fs::path &outputPath,
                                     Error *outError) {
  log::debug(kTag, std::format("Extracting {} -> {}", archivePath.string(), outputPath.string()));

  // Extracting over the archive itself replaces it, which needs the writer's lock
  LockMode mode = LockManager::normalizeKey(archivePath) == LockManager::normalizeKey(outputPath)
                      ? LockMode::Exclusive
                      : LockMode::Shared;
  auto lock = locks_.acquire(archivePath, mode, config_.lockTimeout, outError);
  if (!lock) {
    return false;
  }

  MappedFile archive;
  if (!archive.openRead(archivePath, outError)) {
    return false;
  }

  Error decodeError;
  auto decoded = codec::decode(archive.data(), &decodeError);
  if (!decoded) {
    log::warn(kTag, std::format("Integrity check failed for {}: {}", archivePath.string(),
                                decodeError.message()));
    setError(outError, std::move(decodeError));
    return false;
  }
  archive.close();

  if (!writeFileAtomic(outputPath, decoded->content, outError)) {
    return false;
  }

  log::debug(kTag, std::format("Extracted {} bytes to {}", decoded->content.size(),
                               outputPath.string()));
  return true;
}

std::optional<ArchiveInfo> ArchiveService::inspectArchive(const fs::path &archivePath,
                                                          Error *outError) {
  auto lock = locks_.acquire(archivePath, LockMode::Shared, config_.lockTimeout, outError);
  if (!lock) {
    return std::nullopt;
  }

  MappedFile archive;
  if (!archive.openRead(archivePath, outError)) {
    return std::nullopt;
  }

  auto header = codec::readHeader(archive.data(), outError);
  if (!header) {
    return std::nullopt;
  }

  ArchiveInfo info;
  info.header = *header;
  info.fileSize = archive.size();
  return info;
}

bool ArchiveService::verifyArchive(const fs::path &archivePath, Error *outError) {
  auto lock = locks_.acquire(archivePath, LockMode::Shared, config_.lockTimeout, outError);
  if (!lock) {
    return false;
  }

  MappedFile archive;
  if (!archive.openRead(archivePath, outError)) {
    return false;
  }

  Error decodeError;
  if (!codec::decode(archive.data(), &decodeError)) {
    log::warn(kTag, std::format("Integrity check failed for {}: {}", archivePath.string(),
                                decodeError.message()));
    setError(outError, std::move(decodeError));
    return false;
  }

  return true;
}

std::optional<size_t> ArchiveService::backupFiles(const fs::path &sourceDir,
                                                  const fs::path &backupDir, Error *outError) {
  std::error_code ec;
  if (!fs::is_directory(sourceDir, ec)) {
    setError(outError, Error::sourceNotFound(sourceDir.string()));
    return std::nullopt;
  }

  fs::create_directories(backupDir, ec);
  if (ec) {
    setError(outError, Error::ioFailure(backupDir.string(), "create directory", ec.value()));
    return std::nullopt;
  }

  // Earlier backups are skipped only when the backup directory is a proper
  // subdirectory of the source; any other layout walks the whole source tree
  bool backupNested =
      LockManager::normalizeKey(backupDir) != LockManager::normalizeKey(sourceDir) &&
      isWithin(backupDir, sourceDir);

  // Collect first so files written below are never picked up by the walk
  std::vector<fs::path> sources;
  fs::recursive_directory_iterator it(sourceDir, ec);
  if (ec) {
    setError(outError, Error::ioFailure(sourceDir.string(), "list directory", ec.value()));
    return std::nullopt;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }

    const fs::path &path = it->path();
    std::error_code entryEc;
    if (it->is_directory(entryEc)) {
      // Never back up earlier backups
      if (backupNested && isWithin(path, backupDir)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!it->is_regular_file(entryEc)) {
      continue;
    }

    bool selected = std::any_of(config_.backupExtensions.begin(), config_.backupExtensions.end(),
                                [&](const std::string &ext) { return hasExtension(path, ext); });
    if (selected) {
      sources.push_back(path);
    }
  }
  if (ec) {
    setError(outError, Error::ioFailure(sourceDir.string(), "list directory", ec.value()));
    return std::nullopt;
  }
  std::sort(sources.begin(), sources.end());

  uint64_t timestamp = clock_();
  size_t count = 0;

  for (const auto &source : sources) {
    fs::path destDir = backupDir / source.parent_path().lexically_relative(sourceDir);
    fs::path dest = destDir / backupName(source.filename(), timestamp);

    // Writers on the source must finish before it is read
    auto sourceLock = locks_.acquire(source, LockMode::Shared, config_.lockTimeout, outError);
    if (!sourceLock) {
      return std::nullopt;
    }

    if (config_.backupMode == BackupMode::Archive) {
      dest += archiveExtension;
      if (!archiveDocument(source, dest, outError)) {
        return std::nullopt;
      }
    } else if (!copyFile(source, dest, outError)) {
      return std::nullopt;
    }

    ++count;
  }

  log::info(kTag, std::format("Backed up {} files from {} to {}", count, sourceDir.string(),
                              backupDir.string()));
  return count;
}

bool ArchiveService::copyFile(const fs::path &sourcePath, const fs::path &destPath,
                              Error *outError) {
  auto destLock = locks_.acquire(destPath, LockMode::Exclusive, config_.lockTimeout, outError);
  if (!destLock) {
    return false;
  }

  MappedFile source;
  if (!source.openRead(sourcePath, outError)) {
    return false;
  }

  if (!writeFileAtomic(destPath, source.data(), outError)) {
    return false;
  }

  // Keep the original modification time on the copy
  std::error_code ec;
  auto mtime = fs::last_write_time(sourcePath, ec);
  if (!ec) {
    fs::last_write_time(destPath, mtime, ec);
  }
  if (ec) {
    log::warn(kTag, std::format("Could not preserve modification time on {}: {}",
                                destPath.string(), ec.message()));
  }

  return true;
}

std::optional<std::vector<FileInfo>> ArchiveService::listCaseFiles(const fs::path &casePath,
                                                                   const std::string &extension,
                                                                   Error *outError) {
  std::error_code ec;
  if (!fs::is_directory(casePath, ec)) {
    setError(outError, Error::sourceNotFound(casePath.string()));
    return std::nullopt;
  }

  std::vector<FileInfo> result;
  fs::recursive_directory_iterator it(casePath, ec);
  if (ec) {
    setError(outError, Error::ioFailure(casePath.string(), "list directory", ec.value()));
    return std::nullopt;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }

    std::error_code entryEc;
    if (!it->is_regular_file(entryEc)) {
      continue;
    }

    const fs::path &path = it->path();
    if (!extension.empty() && !hasExtension(path, extension)) {
      continue;
    }

    FileInfo info;
    info.name = path.filename().string();
    info.relativePath = toGenericRelative(path, casePath);
    info.fullPath = path;
    info.size = it->file_size(entryEc);
    if (!entryEc) {
      info.modified = it->last_write_time(entryEc);
    }
    if (entryEc) {
      // Removed or replaced while listing
      log::debug(kTag, std::format("Skipping {}: {}", path.string(), entryEc.message()));
      continue;
    }

    if (hasExtension(path, archiveExtension)) {
      Error inspectError;
      info.archive = inspectArchive(path, &inspectError);
      if (!info.archive) {
        log::debug(kTag, std::format("Skipping archive details for {}: {}", path.string(),
                                     inspectError.message()));
      }
    }

    result.push_back(std::move(info));
  }
  if (ec) {
    setError(outError, Error::ioFailure(casePath.string(), "list directory", ec.value()));
    return std::nullopt;
  }

  std::stable_sort(result.begin(), result.end(),
                   [](const FileInfo &a, const FileInfo &b) { return a.modified > b.modified; });
  return result;
}

uint64_t ArchiveService::systemClock() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

std::string ArchiveService::backupName(const fs::path &fileName, uint64_t timestamp) {
  std::time_t time = static_cast<std::time_t>(timestamp);
  std::tm local{};
#ifdef _WIN32
  bool converted = localtime_s(&local, &time) == 0;
#else
  bool converted = localtime_r(&time, &local) != nullptr;
#endif

  char stamp[32];
  if (!converted || std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local) == 0) {
    log::warn(kTag, std::format("No local time for {}, using UTC", timestamp));
    std::chrono::sys_seconds utc{std::chrono::seconds(static_cast<int64_t>(timestamp))};
    return std::format("{}_{:%Y%m%d_%H%M%S}{}", fileName.stem().string(), utc,
                       fileName.extension().string());
  }
  return std::format("{}_{}{}", fileName.stem().string(), stamp, fileName.extension().string());
}

} // namespace docarc
