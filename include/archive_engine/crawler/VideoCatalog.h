#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "models/CatalogItem.h"
#include "models/Job.h"

namespace archive_engine::crawler {

// Reads what yt-dlp leaves behind: one directory per video holding the media
// file, its thumbnail and a .info.json sidecar.
class VideoCatalog {
public:
    /**
     * @brief Build catalog rows from the sidecars under a channel directory
     * @param channelDirectory <mirrors>/youtube/<channelId>
     * @param jobId Owner of the rows
     * @return One item per parseable sidecar, ordered by item id
     */
    static std::vector<CatalogItem> scan(const std::string& channelDirectory, const std::string& jobId);

    // One sidecar document to a catalog row; fallbackId is the directory name
    static CatalogItem fromInfoJson(const nlohmann::json& info, const std::string& fallbackId, const std::string& jobId);

    // Channel metadata from `yt-dlp --dump-json` output. Non-JSON lines
    // (warnings on the merged stream) are skipped.
    static std::optional<VideoChannel> parseChannelProbe(const std::vector<std::string>& outputLines);

    // "20240131" -> "2024-01-31"; anything else -> ""
    static std::string formatUploadDate(const std::string& raw);

    static bool isMediaFile(const std::string& filename);
    static bool isThumbnailFile(const std::string& filename);
};

} // namespace archive_engine::crawler
