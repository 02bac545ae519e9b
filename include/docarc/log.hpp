#pragma once

#include <cstdint>
#include <string_view>

namespace docarc::log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Receives every record at or above the current level
using Callback = void (*)(Level level, const char *tag, const char *message, void *userData);

// Replace the default stderr sink; nullptr restores it
void setCallback(Callback cb, void *userData);

void setLevel(Level level);
Level level();

const char *levelName(Level level);

// Parse "debug", "info", "warn" or "error"
bool parseLevel(std::string_view text, Level &out);

void write(Level level, std::string_view tag, std::string_view message);

inline void debug(std::string_view tag, std::string_view message) {
  write(Level::Debug, tag, message);
}
inline void info(std::string_view tag, std::string_view message) {
  write(Level::Info, tag, message);
}
inline void warn(std::string_view tag, std::string_view message) {
  write(Level::Warn, tag, message);
}
inline void error(std::string_view tag, std::string_view message) {
  write(Level::Error, tag, message);
}

} // namespace docarc::log
