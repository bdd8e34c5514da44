#include "../../include/archive_engine/crawler/MirrorStats.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace archive_engine::crawler {

namespace fs = std::filesystem;

namespace {

bool isHtmlFile(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".html" || ext == ".htm";
}

} // namespace

MirrorStats collectMirrorStats(const std::string& directory) {
    MirrorStats stats;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        LOG_DEBUG("Mirror directory does not exist: " + directory);
        return stats;
    }

    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARNING("Cannot walk " + directory + ": " + ec.message());
        return stats;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARNING("Walk of " + directory + " stopped early: " + ec.message());
            break;
        }
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) {
            continue;
        }
        auto size = it->file_size(entryEc);
        if (entryEc) {
            continue;
        }
        stats.totalBytes += size;
        stats.totalFiles++;
        if (isHtmlFile(it->path())) {
            stats.htmlFiles++;
        }
    }

    LOG_DEBUG("Mirror stats for " + directory + ": " + std::to_string(stats.totalBytes) + " bytes, " +
              std::to_string(stats.htmlFiles) + " html of " + std::to_string(stats.totalFiles) + " files");
    return stats;
}

} // namespace archive_engine::crawler
