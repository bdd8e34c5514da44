#include "../../include/archive_engine/crawler/VideoCatalog.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace archive_engine::crawler {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxTitleLength = 500;
const std::string kSidecarSuffix = ".info.json";

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool hasExtension(const std::string& filename, const std::vector<std::string>& extensions) {
    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& ext : extensions) {
        if (endsWith(lower, ext)) {
            return true;
        }
    }
    return false;
}

std::string stringField(const nlohmann::json& info, const char* key) {
    auto it = info.find(key);
    if (it == info.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

bool VideoCatalog::isMediaFile(const std::string& filename) {
    static const std::vector<std::string> extensions = {".mp4", ".webm", ".mkv"};
    return hasExtension(filename, extensions);
}

bool VideoCatalog::isThumbnailFile(const std::string& filename) {
    static const std::vector<std::string> extensions = {".jpg", ".png", ".webp"};
    return hasExtension(filename, extensions);
}

std::string VideoCatalog::formatUploadDate(const std::string& raw) {
    if (raw.size() != 8 || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return "";
    }
    return raw.substr(0, 4) + "-" + raw.substr(4, 2) + "-" + raw.substr(6, 2);
}

CatalogItem VideoCatalog::fromInfoJson(const nlohmann::json& info, const std::string& fallbackId, const std::string& jobId) {
    CatalogItem item;
    item.jobId = jobId;
    item.itemId = stringField(info, "id");
    if (item.itemId.empty()) {
        item.itemId = fallbackId;
    }
    item.title = stringField(info, "title").substr(0, kMaxTitleLength);
    item.description = stringField(info, "description");
    item.uploadDate = formatUploadDate(stringField(info, "upload_date"));

    auto duration = info.find("duration");
    if (duration != info.end() && duration->is_number()) {
        item.durationSeconds = static_cast<int>(duration->get<double>());
    }

    item.createdAt = std::chrono::system_clock::now();
    return item;
}

std::vector<CatalogItem> VideoCatalog::scan(const std::string& channelDirectory, const std::string& jobId) {
    std::vector<CatalogItem> items;
    std::error_code ec;
    if (!fs::is_directory(channelDirectory, ec)) {
        LOG_DEBUG("Channel directory does not exist: " + channelDirectory);
        return items;
    }

    for (const auto& videoDir : fs::directory_iterator(channelDirectory, ec)) {
        std::error_code entryEc;
        if (!videoDir.is_directory(entryEc)) {
            continue;
        }

        // Collect the directory listing once; sidecar, media and thumbnail
        // all live side by side.
        std::vector<fs::directory_entry> files;
        for (const auto& file : fs::directory_iterator(videoDir.path(), entryEc)) {
            std::error_code fileEc;
            if (file.is_regular_file(fileEc)) {
                files.push_back(file);
            }
        }

        for (const auto& sidecar : files) {
            const std::string sidecarName = sidecar.path().filename().string();
            if (!endsWith(sidecarName, kSidecarSuffix)) {
                continue;
            }

            nlohmann::json info;
            try {
                std::ifstream in(sidecar.path());
                info = nlohmann::json::parse(in);
            } catch (const nlohmann::json::exception& e) {
                LOG_WARNING("Skipping unreadable sidecar " + sidecar.path().string() + ": " + std::string(e.what()));
                continue;
            }
            if (!info.is_object()) {
                LOG_WARNING("Skipping sidecar without an object: " + sidecar.path().string());
                continue;
            }
            // yt-dlp also writes one for the playlist itself
            if (stringField(info, "_type") == "playlist") {
                continue;
            }

            CatalogItem item = fromInfoJson(info, videoDir.path().filename().string(), jobId);
            for (const auto& file : files) {
                const std::string name = file.path().filename().string();
                if (isMediaFile(name)) {
                    std::error_code sizeEc;
                    item.mediaFilename = name;
                    item.sizeBytes = file.file_size(sizeEc);
                    if (sizeEc) {
                        item.sizeBytes = 0;
                    }
                } else if (isThumbnailFile(name)) {
                    item.thumbnailFilename = name;
                }
            }
            items.push_back(std::move(item));
        }
    }

    if (ec) {
        LOG_WARNING("Error listing " + channelDirectory + ": " + ec.message());
    }

    std::sort(items.begin(), items.end(), [](const CatalogItem& a, const CatalogItem& b) {
        return a.itemId < b.itemId;
    });
    LOG_INFO("Found " + std::to_string(items.size()) + " catalog sidecars in " + channelDirectory);
    return items;
}

std::optional<VideoChannel> VideoCatalog::parseChannelProbe(const std::vector<std::string>& outputLines) {
    for (const auto& line : outputLines) {
        if (line.empty() || line.front() != '{') {
            continue;
        }
        auto data = nlohmann::json::parse(line, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            continue;
        }

        VideoChannel channel;
        channel.channelId = stringField(data, "channel_id");
        if (channel.channelId.empty()) {
            continue;
        }
        channel.channelTitle = stringField(data, "channel");
        if (channel.channelTitle.empty()) {
            channel.channelTitle = stringField(data, "uploader");
        }
        channel.thumbnailUrl = stringField(data, "thumbnail");
        return channel;
    }
    return std::nullopt;
}

} // namespace archive_engine::crawler
