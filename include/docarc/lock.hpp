#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "error.hpp"

namespace docarc {

class LockManager;

enum class LockMode : uint8_t {
  Shared = 0, // Readers, may overlap with other readers
  Exclusive,  // Writers, never overlap with anyone
};

// Claim on one path, released on destruction
class LockHandle {
public:
  LockHandle() = default;
  ~LockHandle() { release(); }

  // Delete copy, enable move
  LockHandle(const LockHandle &) = delete;
  LockHandle &operator=(const LockHandle &) = delete;
  LockHandle(LockHandle &&other) noexcept;
  LockHandle &operator=(LockHandle &&other) noexcept;

  // Safe to call more than once
  void release() noexcept;

  bool isHeld() const { return manager_ != nullptr; }
  LockMode mode() const { return mode_; }
  const std::string &key() const { return key_; }

private:
  friend class LockManager;
  LockHandle(LockManager *manager, std::string key, LockMode mode)
      : manager_(manager), key_(std::move(key)), mode_(mode) {}

  LockManager *manager_ = nullptr;
  std::string key_;
  LockMode mode_ = LockMode::Shared;
};

// Per-path readers-writer table shared by every operation of a process
//
// Queued writers block new readers so a steady stream of readers cannot
// starve them. The manager must outlive every handle it hands out.
class LockManager {
public:
  explicit LockManager(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
  ~LockManager();

  LockManager(const LockManager &) = delete;
  LockManager &operator=(const LockManager &) = delete;

  // Block until the claim is granted or the wait bound elapses (LockTimeout)
  // A zero or negative timeout makes a single non-blocking attempt; very large
  // timeouts wait without bound
  std::optional<LockHandle> acquire(const std::filesystem::path &path, LockMode mode,
                                    Error *outError = nullptr);
  std::optional<LockHandle> acquire(const std::filesystem::path &path, LockMode mode,
                                    std::chrono::milliseconds timeout, Error *outError = nullptr);

  // Same as handle.release()
  void release(LockHandle &handle) noexcept { handle.release(); }

  // Number of paths with holders or waiters
  size_t activeCount() const;

  std::chrono::milliseconds timeout() const { return timeout_; }

  // Key under which a path is tracked (absolute, lexically normalized)
  static std::string normalizeKey(const std::filesystem::path &path);

private:
  friend class LockHandle;

  struct PathState {
    size_t readers = 0;
    bool writer = false;
    size_t waitingReaders = 0;
    size_t waitingWriters = 0;

    bool idle() const {
      return readers == 0 && !writer && waitingReaders == 0 && waitingWriters == 0;
    }
  };

  void unlock(const std::string &key, LockMode mode) noexcept;

  std::chrono::milliseconds timeout_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, PathState> table_;
};

} // namespace docarc
