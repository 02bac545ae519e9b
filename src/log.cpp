#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

#include <docarc/log.hpp>

namespace docarc::log {

namespace {

std::mutex g_mutex;
Callback g_callback = nullptr;
void *g_userData = nullptr;
std::atomic<Level> g_level{Level::Warn};

} // namespace

void setCallback(Callback cb, void *userData) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_callback = cb;
  g_userData = userData;
}

void setLevel(Level level) {
  g_level.store(level, std::memory_order_relaxed);
}

Level level() {
  return g_level.load(std::memory_order_relaxed);
}

const char *levelName(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  }
  return "INFO";
}

bool parseLevel(std::string_view text, Level &out) {
  if (text == "debug") {
    out = Level::Debug;
  } else if (text == "info") {
    out = Level::Info;
  } else if (text == "warn" || text == "warning") {
    out = Level::Warn;
  } else if (text == "error") {
    out = Level::Error;
  } else {
    return false;
  }
  return true;
}

void write(Level level, std::string_view tag, std::string_view message) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(g_level.load(std::memory_order_relaxed))) {
    return;
  }

  // Callbacks expect null-terminated strings
  std::string tagStr(tag);
  std::string messageStr(message);

  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_callback) {
    g_callback(level, tagStr.c_str(), messageStr.c_str(), g_userData);
    return;
  }
  std::fprintf(stderr, "[%s] %s: %s\n", levelName(level), tagStr.c_str(), messageStr.c_str());
}

} // namespace docarc::log
