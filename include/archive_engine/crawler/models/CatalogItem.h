#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace archive_engine::crawler {

using json = nlohmann::json;

// One downloaded video, recorded from its yt-dlp .info.json sidecar
struct CatalogItem {
    std::string jobId;
    std::string itemId;
    std::string title;
    std::string description;
    std::optional<int> durationSeconds;
    std::string uploadDate;         // YYYY-MM-DD, empty when unknown
    std::string mediaFilename;
    std::string thumbnailFilename;
    std::uint64_t sizeBytes = 0;
    std::chrono::system_clock::time_point createdAt;

    json toJson() const;
};

} // namespace archive_engine::crawler
