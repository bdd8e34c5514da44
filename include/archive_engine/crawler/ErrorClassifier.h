#pragma once

#include <string>
#include <vector>
#include "models/ErrorClass.h"

namespace archive_engine::crawler {

class ErrorClassifier {
public:
    /**
     * Classify a crawl failure from its error text
     * @param errorMessage Error message or captured tool output (may be empty)
     * @return PERMANENT if a permanent marker matches, otherwise RECOVERABLE
     *         if a recoverable marker matches, otherwise UNKNOWN
     */
    static ErrorClass classify(const std::string& errorMessage);

    /**
     * Whether a classification should be routed to the retry ladder
     * @param errorClass The classification
     * @return false only for PERMANENT
     */
    static bool isRetryable(ErrorClass errorClass);

    // Markers checked in order; the first match wins
    static const std::vector<std::string>& permanentMarkers();
    static const std::vector<std::string>& recoverableMarkers();

private:
    static bool containsAny(const std::string& haystack, const std::vector<std::string>& needles, std::string& matched);
};

} // namespace archive_engine::crawler
