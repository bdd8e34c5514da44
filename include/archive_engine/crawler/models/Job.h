#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace archive_engine::crawler {

using json = nlohmann::json;

enum class JobStatus {
    PENDING = 0,
    CRAWLING = 1,
    READY = 2,
    RETRY_PENDING = 3,
    ERR = 4,     // ERROR collides with system macros
    DEAD = 5
};

std::string jobStatusToString(JobStatus status);
JobStatus jobStatusFromString(const std::string& status);

// Recursive mirror of a website with wget
struct PageMirror {
    int depth = 0;                  // 0 = unlimited
    bool includeExternal = false;
};

// Full download of a YouTube channel or playlist with yt-dlp
struct VideoChannel {
    std::string channelId;          // resolved on first crawl
    std::string channelTitle;
    std::string thumbnailUrl;
};

// Single-page capture of the live URL with a headless browser
struct BrowserSnapshot {
};

using JobKind = std::variant<PageMirror, VideoChannel, BrowserSnapshot>;

std::string jobKindName(const JobKind& kind);
json jobKindToJson(const JobKind& kind);
JobKind jobKindFromJson(const json& j);

struct Job {
    std::string id;
    std::string url;
    std::string name;
    JobKind kind = PageMirror{};
    int crawlIntervalDays = 30;

    JobStatus status = JobStatus::PENDING;
    std::string lastError;
    int retryCount = 0;
    std::uint64_t sizeBytes = 0;
    std::uint64_t itemCount = 0;

    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<std::chrono::system_clock::time_point> lastCrawlAt;
    std::optional<std::chrono::system_clock::time_point> nextCrawlAt;

    json toJson() const;
    static Job fromJson(const json& j);
};

// Partial update of a job record; unset fields are left untouched
struct JobUpdate {
    std::optional<JobStatus> status;
    std::optional<std::string> lastError;
    std::optional<int> retryCount;
    std::optional<std::uint64_t> sizeBytes;
    std::optional<std::uint64_t> itemCount;
    std::optional<std::chrono::system_clock::time_point> lastCrawlAt;
    std::optional<std::chrono::system_clock::time_point> nextCrawlAt;
    bool clearNextCrawlAt = false;
    std::optional<VideoChannel> channel;

    // Apply this update to an in-memory copy of the job
    void applyTo(Job& job) const;
};

} // namespace archive_engine::crawler
