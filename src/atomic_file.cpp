#include <algorithm>
#include <cstdio>
#include <format>
#include <random>

#include <docarc/atomic_file.hpp>
#include <docarc/log.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace docarc {

namespace {

constexpr int kMaxCreateAttempts = 16;

unsigned long currentProcessId() {
#ifdef _WIN32
  return static_cast<unsigned long>(GetCurrentProcessId());
#else
  return static_cast<unsigned long>(getpid());
#endif
}

// ".<name>.tmp-<pid>-<random>" next to the target
std::filesystem::path makeTempPath(const std::filesystem::path &target) {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::string name = std::format(".{}.tmp-{}-{:016x}", target.filename().string(),
                                 currentProcessId(), rng());
  return target.parent_path() / name;
}

} // namespace

AtomicFile::AtomicFile() = default;

AtomicFile::~AtomicFile() {
  discard();
}

AtomicFile::AtomicFile(AtomicFile &&other) noexcept
    :
#ifdef _WIN32
      handle_(other.handle_),
#else
      fd_(other.fd_),
#endif
      targetPath_(std::move(other.targetPath_)), tempPath_(std::move(other.tempPath_)) {
#ifdef _WIN32
  other.handle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.targetPath_.clear();
  other.tempPath_.clear();
}

AtomicFile &AtomicFile::operator=(AtomicFile &&other) noexcept {
  if (this != &other) {
    discard();

#ifdef _WIN32
    handle_ = other.handle_;
    other.handle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    targetPath_ = std::move(other.targetPath_);
    tempPath_ = std::move(other.tempPath_);
    other.targetPath_.clear();
    other.tempPath_.clear();
  }
  return *this;
}

bool AtomicFile::open(const std::filesystem::path &target, Error *outError) {
  discard();

  std::filesystem::path parent = target.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      setError(outError, Error::ioFailure(parent.string(), "create directory", ec.value()));
      return false;
    }
  }

  for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
    std::filesystem::path candidate = makeTempPath(target);

#ifdef _WIN32
    HANDLE h = CreateFileW(candidate.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                           FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
      DWORD err = GetLastError();
      if (err == ERROR_FILE_EXISTS) {
        continue;
      }
      setError(outError,
               Error::ioFailure(candidate.string(), "create temporary file", static_cast<int>(err)));
      return false;
    }
    handle_ = h;
#else
    int fd = ::open(candidate.string().c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
      if (errno == EEXIST) {
        continue;
      }
      setError(outError, Error::ioFailure(candidate.string(), "create temporary file", errno));
      return false;
    }
    fd_ = fd;
#endif

    targetPath_ = target;
    tempPath_ = std::move(candidate);
    return true;
  }

  setError(outError, Error::ioFailure(target.string(), "allocate temporary file name", 0));
  return false;
}

bool AtomicFile::write(std::span<const uint8_t> data, Error *outError) {
  if (!isOpen()) {
    setError(outError, Error::ioFailure(targetPath_.string(), "write to closed file", 0));
    return false;
  }

  size_t pos = 0;
  while (pos < data.size()) {
#ifdef _WIN32
    DWORD chunk = static_cast<DWORD>(std::min<size_t>(data.size() - pos, 1u << 30));
    DWORD written = 0;
    if (!WriteFile(static_cast<HANDLE>(handle_), data.data() + pos, chunk, &written, nullptr)) {
      setError(outError, Error::ioFailure(tempPath_.string(), "write temporary file",
                                          static_cast<int>(GetLastError())));
      return false;
    }
    pos += written;
#else
    ssize_t written = ::write(fd_, data.data() + pos, data.size() - pos);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      setError(outError, Error::ioFailure(tempPath_.string(), "write temporary file", errno));
      return false;
    }
    pos += static_cast<size_t>(written);
#endif
  }

  return true;
}

bool AtomicFile::commit(Error *outError) {
  if (!isOpen()) {
    setError(outError, Error::ioFailure(targetPath_.string(), "commit closed file", 0));
    return false;
  }

#ifdef _WIN32
  if (!FlushFileBuffers(static_cast<HANDLE>(handle_))) {
    setError(outError, Error::ioFailure(tempPath_.string(), "flush temporary file",
                                        static_cast<int>(GetLastError())));
    discard();
    return false;
  }
  closeHandle();

  if (!MoveFileExW(tempPath_.c_str(), targetPath_.c_str(),
                   MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    setError(outError, Error::ioFailure(targetPath_.string(), "replace file",
                                        static_cast<int>(GetLastError())));
    discard();
    return false;
  }
#else
  if (fsync(fd_) < 0) {
    setError(outError, Error::ioFailure(tempPath_.string(), "sync temporary file", errno));
    discard();
    return false;
  }
  closeHandle();

  if (::rename(tempPath_.string().c_str(), targetPath_.string().c_str()) < 0) {
    setError(outError, Error::ioFailure(targetPath_.string(), "replace file", errno));
    discard();
    return false;
  }

  // Persist the directory entry; the rename itself is already visible
  std::string dir = targetPath_.parent_path().string();
  if (dir.empty()) {
    dir = ".";
  }
  int dirFd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dirFd >= 0) {
    if (fsync(dirFd) < 0) {
      log::warn("atomic_file", std::format("Failed to sync directory {} (errno: {})", dir, errno));
    }
    ::close(dirFd);
  }
#endif

  tempPath_.clear();
  return true;
}

void AtomicFile::discard() noexcept {
  closeHandle();
  if (!tempPath_.empty()) {
    std::error_code ec;
    std::filesystem::remove(tempPath_, ec);
    tempPath_.clear();
  }
}

void AtomicFile::closeHandle() noexcept {
#ifdef _WIN32
  if (handle_) {
    CloseHandle(static_cast<HANDLE>(handle_));
    handle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif
}

bool writeFileAtomic(const std::filesystem::path &path, std::span<const uint8_t> data,
                     Error *outError) {
  AtomicFile file;
  if (!file.open(path, outError)) {
    return false;
  }
  if (!file.write(data, outError)) {
    return false;
  }
  return file.commit(outError);
}

} // namespace docarc
