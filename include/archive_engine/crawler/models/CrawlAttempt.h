#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "ErrorClass.h"

namespace archive_engine::crawler {

using json = nlohmann::json;

enum class AttemptOutcome {
    RUNNING = 0,
    SUCCESS = 1,
    ERR = 2,
    CANCELLED = 3
};

std::string attemptOutcomeToString(AttemptOutcome outcome);
AttemptOutcome attemptOutcomeFromString(const std::string& outcome);

// Audit trail of one dispatch. Created when the dispatch starts and
// finalized exactly once.
struct CrawlAttempt {
    std::string id;
    std::string jobId;
    std::chrono::system_clock::time_point startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;
    AttemptOutcome outcome = AttemptOutcome::RUNNING;
    CrawlErrorKind errorKind = CrawlErrorKind::NONE;
    std::optional<ErrorClass> errorClass;
    std::uint64_t itemsCrawled = 0;
    std::uint64_t bytesTransferred = 0;
    std::string logTail;
    std::string errorMessage;

    json toJson() const;
};

// Fields written when an attempt is finalized
struct AttemptResult {
    AttemptOutcome outcome = AttemptOutcome::SUCCESS;
    CrawlErrorKind errorKind = CrawlErrorKind::NONE;
    std::optional<ErrorClass> errorClass;
    std::uint64_t itemsCrawled = 0;
    std::uint64_t bytesTransferred = 0;
    std::string logTail;
    std::string errorMessage;
    std::chrono::system_clock::time_point finishedAt;
};

} // namespace archive_engine::crawler
