#include "../../../include/archive_engine/crawler/models/CrawlAttempt.h"
#include "../../../include/archive_engine/crawler/models/CatalogItem.h"

#include <stdexcept>

namespace archive_engine::crawler {

namespace {

long long toEpochSeconds(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

std::string attemptOutcomeToString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::RUNNING: return "running";
        case AttemptOutcome::SUCCESS: return "success";
        case AttemptOutcome::ERR: return "error";
        case AttemptOutcome::CANCELLED: return "cancelled";
    }
    return "running";
}

AttemptOutcome attemptOutcomeFromString(const std::string& outcome) {
    if (outcome == "running") return AttemptOutcome::RUNNING;
    if (outcome == "success") return AttemptOutcome::SUCCESS;
    if (outcome == "error") return AttemptOutcome::ERR;
    if (outcome == "cancelled") return AttemptOutcome::CANCELLED;
    throw std::invalid_argument("Unknown attempt outcome: " + outcome);
}

json CrawlAttempt::toJson() const {
    return json{
        {"id", id},
        {"jobId", jobId},
        {"startedAt", toEpochSeconds(startedAt)},
        {"finishedAt", finishedAt ? json(toEpochSeconds(*finishedAt)) : json(nullptr)},
        {"outcome", attemptOutcomeToString(outcome)},
        {"errorKind", crawlErrorKindToString(errorKind)},
        {"errorClass", errorClass ? json(errorClassToString(*errorClass)) : json(nullptr)},
        {"itemsCrawled", itemsCrawled},
        {"bytesTransferred", bytesTransferred},
        {"logTail", logTail},
        {"errorMessage", errorMessage}
    };
}

json CatalogItem::toJson() const {
    return json{
        {"jobId", jobId},
        {"itemId", itemId},
        {"title", title},
        {"description", description},
        {"durationSeconds", durationSeconds ? json(*durationSeconds) : json(nullptr)},
        {"uploadDate", uploadDate},
        {"mediaFilename", mediaFilename},
        {"thumbnailFilename", thumbnailFilename},
        {"sizeBytes", sizeBytes},
        {"createdAt", toEpochSeconds(createdAt)}
    };
}

} // namespace archive_engine::crawler
