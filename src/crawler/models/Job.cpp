#include "../../../include/archive_engine/crawler/models/Job.h"

#include <stdexcept>

namespace archive_engine::crawler {

namespace {

long long toEpochSeconds(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochSeconds(long long seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

json optionalTime(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) {
        return nullptr;
    }
    return toEpochSeconds(*tp);
}

std::optional<std::chrono::system_clock::time_point> optionalTimeFrom(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return fromEpochSeconds(j[key].get<long long>());
}

// Exhaustive over JobKind: a new alternative fails to compile here first
struct KindToJson {
    json operator()(const PageMirror& mirror) const {
        return json{{"type", "page_mirror"}, {"depth", mirror.depth}, {"includeExternal", mirror.includeExternal}};
    }
    json operator()(const VideoChannel& channel) const {
        return json{{"type", "video_channel"},
                    {"channelId", channel.channelId},
                    {"channelTitle", channel.channelTitle},
                    {"thumbnailUrl", channel.thumbnailUrl}};
    }
    json operator()(const BrowserSnapshot&) const {
        return json{{"type", "browser_snapshot"}};
    }
};

JobKind parseKind(const json& j) {
    std::string type = j.value("type", "page_mirror");
    if (type == "page_mirror") {
        PageMirror mirror;
        mirror.depth = j.value("depth", 0);
        mirror.includeExternal = j.value("includeExternal", false);
        return mirror;
    }
    if (type == "video_channel") {
        VideoChannel channel;
        channel.channelId = j.value("channelId", "");
        channel.channelTitle = j.value("channelTitle", "");
        channel.thumbnailUrl = j.value("thumbnailUrl", "");
        return channel;
    }
    if (type == "browser_snapshot") {
        return BrowserSnapshot{};
    }
    throw std::invalid_argument("Unknown job kind: " + type);
}

} // namespace

std::string jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::CRAWLING: return "crawling";
        case JobStatus::READY: return "ready";
        case JobStatus::RETRY_PENDING: return "retry_pending";
        case JobStatus::ERR: return "error";
        case JobStatus::DEAD: return "dead";
    }
    return "pending";
}

JobStatus jobStatusFromString(const std::string& status) {
    if (status == "pending") return JobStatus::PENDING;
    if (status == "crawling") return JobStatus::CRAWLING;
    if (status == "ready") return JobStatus::READY;
    if (status == "retry_pending") return JobStatus::RETRY_PENDING;
    if (status == "error") return JobStatus::ERR;
    if (status == "dead") return JobStatus::DEAD;
    throw std::invalid_argument("Unknown job status: " + status);
}

json jobKindToJson(const JobKind& kind) {
    return std::visit(KindToJson{}, kind);
}

JobKind jobKindFromJson(const json& j) {
    return parseKind(j);
}

std::string jobKindName(const JobKind& kind) {
    return std::visit(KindToJson{}, kind)["type"].get<std::string>();
}

json Job::toJson() const {
    return json{
        {"id", id},
        {"url", url},
        {"name", name},
        {"kind", std::visit(KindToJson{}, kind)},
        {"crawlIntervalDays", crawlIntervalDays},
        {"status", jobStatusToString(status)},
        {"lastError", lastError},
        {"retryCount", retryCount},
        {"sizeBytes", sizeBytes},
        {"itemCount", itemCount},
        {"createdAt", toEpochSeconds(createdAt)},
        {"updatedAt", toEpochSeconds(updatedAt)},
        {"lastCrawlAt", optionalTime(lastCrawlAt)},
        {"nextCrawlAt", optionalTime(nextCrawlAt)}
    };
}

Job Job::fromJson(const json& j) {
    Job job;
    job.id = j.at("id").get<std::string>();
    job.url = j.at("url").get<std::string>();
    job.name = j.value("name", "");
    job.kind = j.contains("kind") ? parseKind(j["kind"]) : JobKind{PageMirror{}};
    job.crawlIntervalDays = j.value("crawlIntervalDays", 30);
    job.status = jobStatusFromString(j.value("status", "pending"));
    job.lastError = j.value("lastError", "");
    job.retryCount = j.value("retryCount", 0);
    job.sizeBytes = j.value("sizeBytes", static_cast<std::uint64_t>(0));
    job.itemCount = j.value("itemCount", static_cast<std::uint64_t>(0));
    job.createdAt = fromEpochSeconds(j.value("createdAt", 0LL));
    job.updatedAt = fromEpochSeconds(j.value("updatedAt", 0LL));
    job.lastCrawlAt = optionalTimeFrom(j, "lastCrawlAt");
    job.nextCrawlAt = optionalTimeFrom(j, "nextCrawlAt");
    return job;
}

void JobUpdate::applyTo(Job& job) const {
    if (status) job.status = *status;
    if (lastError) job.lastError = *lastError;
    if (retryCount) job.retryCount = *retryCount;
    if (sizeBytes) job.sizeBytes = *sizeBytes;
    if (itemCount) job.itemCount = *itemCount;
    if (lastCrawlAt) job.lastCrawlAt = *lastCrawlAt;
    if (clearNextCrawlAt) {
        job.nextCrawlAt.reset();
    } else if (nextCrawlAt) {
        job.nextCrawlAt = *nextCrawlAt;
    }
    if (channel && std::holds_alternative<VideoChannel>(job.kind)) {
        job.kind = *channel;
    }
}

} // namespace archive_engine::crawler
