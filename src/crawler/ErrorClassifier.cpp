#include "../../include/archive_engine/crawler/ErrorClassifier.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>

namespace archive_engine::crawler {

const std::vector<std::string>& ErrorClassifier::permanentMarkers() {
    static const std::vector<std::string> markers = {
        // HTTP client errors
        "401",
        "403",
        "404",
        "not found",
        "forbidden",
        // DNS resolution failures
        "name or service not known",
        "unable to resolve host",
        "could not resolve host",
        "no such host",
        "nxdomain",
        // TLS certificate failures
        "certificate"
    };
    return markers;
}

const std::vector<std::string>& ErrorClassifier::recoverableMarkers() {
    static const std::vector<std::string> markers = {
        "timeout",
        "timed out",
        "connection reset",
        "connection refused",
        "429",
        "502",
        "503",
        "504",
        "temporary failure"
    };
    return markers;
}

ErrorClass ErrorClassifier::classify(const std::string& errorMessage) {
    if (errorMessage.empty()) {
        LOG_DEBUG("Classified as UNKNOWN (empty error message)");
        return ErrorClass::UNKNOWN;
    }

    std::string lowerError = errorMessage;
    std::transform(lowerError.begin(), lowerError.end(), lowerError.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string matched;
    if (containsAny(lowerError, permanentMarkers(), matched)) {
        LOG_DEBUG("Classified as PERMANENT (matched \"" + matched + "\")");
        return ErrorClass::PERMANENT;
    }

    if (containsAny(lowerError, recoverableMarkers(), matched)) {
        LOG_DEBUG("Classified as RECOVERABLE (matched \"" + matched + "\")");
        return ErrorClass::RECOVERABLE;
    }

    LOG_DEBUG("Classified as UNKNOWN (unrecognized error pattern)");
    return ErrorClass::UNKNOWN;
}

bool ErrorClassifier::isRetryable(ErrorClass errorClass) {
    return errorClass != ErrorClass::PERMANENT;
}

bool ErrorClassifier::containsAny(const std::string& haystack, const std::vector<std::string>& needles, std::string& matched) {
    for (const auto& needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            matched = needle;
            return true;
        }
    }
    return false;
}

} // namespace archive_engine::crawler
