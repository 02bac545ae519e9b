#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <system_error>

#include <docarc/config.hpp>

namespace docarc {

namespace {

std::string trim(const std::string &input) {
  const auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), isSpace);
  auto end = std::find_if_not(input.rbegin(), input.rend(), isSpace).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string stripComment(const std::string &input) {
  for (size_t i = 0; i < input.size(); ++i) {
    char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 || std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return trim(input.substr(0, i));
    }
  }
  return input;
}

bool parseUint64(const std::string &text, uint64_t &out) {
  if (text.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::vector<std::string> parseExtensions(const std::string &text) {
  std::vector<std::string> result;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) {
      comma = text.size();
    }
    std::string ext = trim(text.substr(start, comma - start));
    if (!ext.empty()) {
      if (ext.front() != '.') {
        ext.insert(ext.begin(), '.');
      }
      result.push_back(std::move(ext));
    }
    start = comma + 1;
  }
  return result;
}

// Returns an empty string on success, otherwise what was wrong with the value
std::string applyKey(const std::string &section, const std::string &key, const std::string &value,
                     Config &config) {
  if (section == "archive" && key == "max_content_size") {
    if (!parseUint64(value, config.maxContentSize)) {
      return std::format("invalid max_content_size '{}'", value);
    }
  } else if (section == "lock" && key == "timeout_ms") {
    uint64_t ms = 0;
    if (!parseUint64(value, ms)) {
      return std::format("invalid timeout_ms '{}'", value);
    }
    if (ms > static_cast<uint64_t>(maxLockTimeout.count())) {
      return std::format("timeout_ms {} exceeds the limit of {}", ms, maxLockTimeout.count());
    }
    config.lockTimeout = std::chrono::milliseconds(ms);
  } else if (section == "backup" && key == "extensions") {
    config.backupExtensions = parseExtensions(value);
  } else if (section == "backup" && key == "mode") {
    if (value == "copy") {
      config.backupMode = BackupMode::Copy;
    } else if (value == "archive") {
      config.backupMode = BackupMode::Archive;
    } else {
      return std::format("invalid backup mode '{}'", value);
    }
  } else if (section == "log" && key == "level") {
    if (!log::parseLevel(value, config.logLevel)) {
      return std::format("invalid log level '{}'", value);
    }
  }
  return {};
}

} // namespace

bool loadConfig(const std::filesystem::path &path, Config &outConfig, std::string *outError) {
  std::ifstream file(path);
  if (!file) {
    if (outError) {
      *outError = std::format("Config file not found: {}", path.string());
    }
    return false;
  }

  // Parse into a copy so a bad file leaves outConfig untouched
  Config config = outConfig;
  std::string section;
  std::string line;
  size_t lineNo = 0;

  while (std::getline(file, line)) {
    ++lineNo;
    std::string trimmed = stripComment(trim(line));
    if (trimmed.empty()) {
      continue;
    }

    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = trim(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }

    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      if (outError) {
        *outError = std::format("{}:{}: expected key = value", path.string(), lineNo);
      }
      return false;
    }

    std::string key = trim(trimmed.substr(0, eq));
    std::string value = trim(trimmed.substr(eq + 1));
    std::string problem = applyKey(section, key, value, config);
    if (!problem.empty()) {
      if (outError) {
        *outError = std::format("{}:{}: {}", path.string(), lineNo, problem);
      }
      return false;
    }
  }

  outConfig = std::move(config);
  return true;
}

} // namespace docarc
