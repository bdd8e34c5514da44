#pragma once

#include <cstdint>
#include <string>

namespace archive_engine::crawler {

struct MirrorStats {
    std::uint64_t totalBytes = 0;
    std::uint64_t htmlFiles = 0;     // *.html and *.htm, case-insensitive
    std::uint64_t totalFiles = 0;

    bool empty() const { return totalBytes == 0 && htmlFiles == 0; }
};

// Single recursive walk of a mirror directory. A missing directory yields
// zeroes; unreadable entries are skipped and logged.
MirrorStats collectMirrorStats(const std::string& directory);

} // namespace archive_engine::crawler
