#include <docarc/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace docarc {

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(other.fileHandle_), mappingHandle_(other.mappingHandle_),
#else
      fd_(other.fd_),
#endif
      data_(other.data_), size_(other.size_), open_(other.open_) {
#ifdef _WIN32
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.data_ = nullptr;
  other.size_ = 0;
  other.open_ = false;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();

#ifdef _WIN32
    fileHandle_ = other.fileHandle_;
    mappingHandle_ = other.mappingHandle_;
    other.fileHandle_ = nullptr;
    other.mappingHandle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    data_ = other.data_;
    size_ = other.size_;
    open_ = other.open_;
    other.data_ = nullptr;
    other.size_ = 0;
    other.open_ = false;
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_DELETE,
                            nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);

  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    DWORD err = GetLastError();
    if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND) {
      setError(outError, Error::sourceNotFound(path.string()));
    } else {
      setError(outError, Error::ioFailure(path.string(), "open file for reading",
                                          static_cast<int>(err)));
    }
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    setError(outError, Error::ioFailure(path.string(), "get file size",
                                        static_cast<int>(GetLastError())));
    close();
    return false;
  }

  size_ = static_cast<size_t>(fileSize.QuadPart);
  if (size_ > 0) {
    mappingHandle_ = CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY,
                                        0, 0, nullptr);
    if (!mappingHandle_) {
      setError(outError, Error::ioFailure(path.string(), "create file mapping",
                                          static_cast<int>(GetLastError())));
      close();
      return false;
    }

    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
    if (!data_) {
      setError(outError, Error::ioFailure(path.string(), "map view of file",
                                          static_cast<int>(GetLastError())));
      close();
      return false;
    }
  }

  open_ = true;
  return true;

#else
  fd_ = ::open(path.string().c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    if (errno == ENOENT) {
      setError(outError, Error::sourceNotFound(path.string()));
    } else {
      setError(outError, Error::ioFailure(path.string(), "open file for reading", errno));
    }
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    setError(outError, Error::ioFailure(path.string(), "get file size", errno));
    close();
    return false;
  }

  if (!S_ISREG(st.st_mode)) {
    setError(outError, Error::ioFailure(path.string(), "read non-regular file", EINVAL));
    close();
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);

  // mmap rejects zero-length mappings, an empty file is simply an empty view
  if (size_ > 0) {
    data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (data_ == MAP_FAILED) {
      data_ = nullptr;
      setError(outError, Error::ioFailure(path.string(), "map file", errno));
      close();
      return false;
    }
  }

  open_ = true;
  return true;
#endif
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  open_ = false;
}

} // namespace docarc
