#pragma once

#include <string>

namespace archive_engine::crawler {

// Retry routing label applied to any crawl failure
enum class ErrorClass {
    PERMANENT,    // Never retry (404, 403, DNS does not exist, bad certificate)
    RECOVERABLE,  // Retry along the backoff ladder
    UNKNOWN       // Unrecognized; the retry policy treats it as recoverable
};

// What went wrong during one dispatch
enum class CrawlErrorKind {
    NONE,
    TIMEOUT,       // Total wall-clock budget exceeded
    STALLED,       // Tool alive but silent beyond the stall budget
    TOOL_FAILURE,  // Unexpected exit code, spawn failure or probe failure
    EMPTY_RESULT,  // Clean exit but nothing usable on disk
    CANCELLED      // Terminated through the cancellation path
};

inline std::string errorClassToString(ErrorClass errorClass) {
    switch (errorClass) {
        case ErrorClass::PERMANENT: return "permanent";
        case ErrorClass::RECOVERABLE: return "recoverable";
        case ErrorClass::UNKNOWN: return "unknown";
    }
    return "unknown";
}

inline ErrorClass errorClassFromString(const std::string& value) {
    if (value == "permanent") return ErrorClass::PERMANENT;
    if (value == "recoverable") return ErrorClass::RECOVERABLE;
    return ErrorClass::UNKNOWN;
}

inline std::string crawlErrorKindToString(CrawlErrorKind kind) {
    switch (kind) {
        case CrawlErrorKind::NONE: return "none";
        case CrawlErrorKind::TIMEOUT: return "timeout";
        case CrawlErrorKind::STALLED: return "stalled";
        case CrawlErrorKind::TOOL_FAILURE: return "tool_failure";
        case CrawlErrorKind::EMPTY_RESULT: return "empty_result";
        case CrawlErrorKind::CANCELLED: return "cancelled";
    }
    return "none";
}

inline CrawlErrorKind crawlErrorKindFromString(const std::string& value) {
    if (value == "timeout") return CrawlErrorKind::TIMEOUT;
    if (value == "stalled") return CrawlErrorKind::STALLED;
    if (value == "tool_failure") return CrawlErrorKind::TOOL_FAILURE;
    if (value == "empty_result") return CrawlErrorKind::EMPTY_RESULT;
    if (value == "cancelled") return CrawlErrorKind::CANCELLED;
    return CrawlErrorKind::NONE;
}

} // namespace archive_engine::crawler
