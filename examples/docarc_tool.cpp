#include <cstring>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include <docarc/docarc.hpp>

namespace {

void printUsage(const char *argv0) {
  std::cerr << "Usage: " << argv0 << " [--config <file>] [--verbose] <command> [args]\n"
            << "Commands:\n"
            << "  archive <source> <archive>     Archive a document\n"
            << "  extract <archive> <output>     Restore a document from an archive\n"
            << "  info <archive>                 Show archive header\n"
            << "  verify <archive>               Check archive integrity\n"
            << "  backup <source_dir> <backup_dir>\n"
            << "  list <dir> [extension]\n";
}

int fail(const docarc::Error &error) {
  std::cerr << "Error (" << docarc::errorKindName(error.kind()) << "): " << error.message()
            << "\n";
  return 1;
}

std::string formatTime(uint64_t seconds) {
  std::chrono::sys_seconds time{std::chrono::seconds(static_cast<int64_t>(seconds))};
  return std::format("{:%Y-%m-%d %H:%M:%S} UTC", time);
}

} // namespace

int main(int argc, char *argv[]) {
  docarc::Config config;
  bool verbose = false;

  int argi = 1;
  while (argi < argc && std::strncmp(argv[argi], "--", 2) == 0) {
    if (std::strcmp(argv[argi], "--config") == 0 && argi + 1 < argc) {
      std::string error;
      if (!docarc::loadConfig(argv[argi + 1], config, &error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
      }
      argi += 2;
    } else if (std::strcmp(argv[argi], "--verbose") == 0) {
      verbose = true;
      ++argi;
    } else {
      printUsage(argv[0]);
      return 1;
    }
  }

  if (argi >= argc) {
    printUsage(argv[0]);
    return 1;
  }

  docarc::log::setLevel(verbose ? docarc::log::Level::Debug : config.logLevel);

  std::string command = argv[argi++];
  std::vector<std::string> args(argv + argi, argv + argc);

  docarc::LockManager locks(config.lockTimeout);
  docarc::ArchiveService service(locks, config);
  docarc::Error error;

  if (command == "archive" && args.size() == 2) {
    if (!service.archiveDocument(args[0], args[1], &error)) {
      return fail(error);
    }
    std::cout << "Archived " << args[0] << " to " << args[1] << "\n";
  } else if (command == "extract" && args.size() == 2) {
    if (!service.extractDocument(args[0], args[1], &error)) {
      return fail(error);
    }
    std::cout << "Extracted " << args[0] << " to " << args[1] << "\n";
  } else if (command == "info" && args.size() == 1) {
    auto info = service.inspectArchive(args[0], &error);
    if (!info) {
      return fail(error);
    }
    std::cout << std::format("Content length: {} bytes\n", info->header.contentLength)
              << std::format("Created:        {}\n", formatTime(info->header.createdAt))
              << std::format("Checksum:       {:016x}\n", info->header.checksum)
              << std::format("File size:      {} bytes{}\n", info->fileSize,
                             info->sizeMatches() ? "" : " (size mismatch)");
  } else if (command == "verify" && args.size() == 1) {
    if (!service.verifyArchive(args[0], &error)) {
      return fail(error);
    }
    std::cout << args[0] << ": OK\n";
  } else if (command == "backup" && args.size() == 2) {
    auto count = service.backupFiles(args[0], args[1], &error);
    if (!count) {
      return fail(error);
    }
    std::cout << "Backup completed. " << *count << " files backed up to " << args[1] << "\n";
  } else if (command == "list" && (args.size() == 1 || args.size() == 2)) {
    auto files = service.listCaseFiles(args[0], args.size() == 2 ? args[1] : std::string(), &error);
    if (!files) {
      return fail(error);
    }
    for (const auto &file : *files) {
      std::cout << std::format("{:>10}  {}", file.size, file.relativePath);
      if (file.archive) {
        std::cout << std::format("  [archive, {} bytes content]", file.archive->header.contentLength);
      }
      std::cout << "\n";
    }
    std::cout << files->size() << " files\n";
  } else {
    printUsage(argv[0]);
    return 1;
  }

  return 0;
}
