#pragma once

// Document Archive Library
// Single-document binary archives with checksum verification, per-path
// readers-writer locking and atomic file replacement.

#include "atomic_file.hpp"
#include "checksum.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "lock.hpp"
#include "log.hpp"
#include "service.hpp"
#include "types.hpp"

// Layers, bottom to top:
//
// 1. checksum / codec
//    - Pure functions over byte spans, no file access
//    - codec::encode() builds the 32-byte header + content
//    - codec::decode() validates header, length and checksum
//
// 2. MappedFile / AtomicFile / LockManager
//    - Whole-file reads, temp-then-rename writes, per-path locks
//
// 3. ArchiveService
//    - archiveDocument(), extractDocument(), backupFiles() ...
//
// Example usage:
//
//   docarc::LockManager locks;
//   docarc::ArchiveService service(locks);
//   docarc::Error error;
//   if (!service.archiveDocument("case/brief.txt", "case/brief.txt.dca", &error)) {
//     std::cerr << error.message() << std::endl;
//   }
//   service.extractDocument("case/brief.txt.dca", "restore/brief.txt", &error);

namespace docarc {}
