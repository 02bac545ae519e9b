#include <format>

#include <docarc/lock.hpp>
#include <docarc/log.hpp>

namespace docarc {

namespace {

// start + timeout, saturating at time_point::max(); negative waits count as zero
std::chrono::steady_clock::time_point waitDeadline(std::chrono::steady_clock::time_point start,
                                                   std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  if (timeout <= std::chrono::milliseconds::zero()) {
    return start;
  }
  auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start);
  if (timeout >= remaining) {
    return Clock::time_point::max();
  }
  return start + timeout;
}

} // namespace

LockHandle::LockHandle(LockHandle &&other) noexcept
    : manager_(other.manager_), key_(std::move(other.key_)), mode_(other.mode_) {
  other.manager_ = nullptr;
}

LockHandle &LockHandle::operator=(LockHandle &&other) noexcept {
  if (this != &other) {
    release();
    manager_ = other.manager_;
    key_ = std::move(other.key_);
    mode_ = other.mode_;
    other.manager_ = nullptr;
  }
  return *this;
}

void LockHandle::release() noexcept {
  if (manager_) {
    manager_->unlock(key_, mode_);
    manager_ = nullptr;
  }
}

LockManager::LockManager(std::chrono::milliseconds timeout) : timeout_(timeout) {}

LockManager::~LockManager() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!table_.empty()) {
    log::error("lock", std::format("Lock manager destroyed with {} active paths", table_.size()));
  }
}

std::optional<LockHandle> LockManager::acquire(const std::filesystem::path &path, LockMode mode,
                                               Error *outError) {
  return acquire(path, mode, timeout_, outError);
}

std::optional<LockHandle> LockManager::acquire(const std::filesystem::path &path, LockMode mode,
                                               std::chrono::milliseconds timeout,
                                               Error *outError) {
  std::string key = normalizeKey(path);
  auto start = std::chrono::steady_clock::now();
  auto deadline = waitDeadline(start, timeout);

  std::unique_lock<std::mutex> lock(mutex_);
  // References into the map survive rehashing, and the entry cannot be erased
  // while this thread is counted as a waiter
  PathState &state = table_[key];

  bool granted;
  if (mode == LockMode::Exclusive) {
    ++state.waitingWriters;
    granted = cv_.wait_until(lock, deadline, [&] { return !state.writer && state.readers == 0; });
    --state.waitingWriters;
    if (granted) {
      state.writer = true;
    }
  } else {
    ++state.waitingReaders;
    granted = cv_.wait_until(lock, deadline,
                             [&] { return !state.writer && state.waitingWriters == 0; });
    --state.waitingReaders;
    if (granted) {
      ++state.readers;
    }
  }

  if (!granted) {
    if (state.idle()) {
      table_.erase(key);
    }
    lock.unlock();
    // A writer giving up may unblock readers queued behind it
    cv_.notify_all();

    auto waited =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    log::warn("lock", std::format("Timed out acquiring {} lock on {}",
                                  mode == LockMode::Exclusive ? "exclusive" : "shared", key));
    setError(outError, Error::lockTimeout(path.string(), waited));
    return std::nullopt;
  }

  return LockHandle(this, std::move(key), mode);
}

void LockManager::unlock(const std::string &key, LockMode mode) noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = table_.find(key);
    if (it == table_.end()) {
      return;
    }

    PathState &state = it->second;
    if (mode == LockMode::Exclusive) {
      state.writer = false;
    } else if (state.readers > 0) {
      --state.readers;
    }

    if (state.idle()) {
      table_.erase(it);
    }
  }
  cv_.notify_all();
}

size_t LockManager::activeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return table_.size();
}

std::string LockManager::normalizeKey(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal().string();
  }
  return absolute.lexically_normal().string();
}

} // namespace docarc
