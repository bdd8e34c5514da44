#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "models/Job.h"
#include "models/ErrorClass.h"
#include "../common/EngineConfig.h"

namespace archive_engine::crawler {

struct RetryDecision {
    JobStatus nextStatus = JobStatus::RETRY_PENDING;   // RETRY_PENDING, ERR or DEAD
    int retryCount = 0;
    ErrorClass errorClass = ErrorClass::UNKNOWN;
    std::optional<std::chrono::system_clock::time_point> nextAttemptAt;
};

// Backoff state machine applied to every non-success outcome. The delay
// ladder is fixed, with no jitter.
class RetryPolicy {
public:
    explicit RetryPolicy(const common::EngineConfig& config);
    RetryPolicy(int maxAttempts, std::vector<std::chrono::minutes> delays);

    RetryDecision onFailure(int currentRetryCount,
                            const std::string& errorMessage,
                            std::chrono::system_clock::time_point now) const;

    // Retry count after a successful crawl
    static int onSuccess() { return 0; }

    // Delay before attempt `retryCount` (1-based); the last step repeats
    std::chrono::minutes delayFor(int retryCount) const;

    int maxAttempts() const { return maxAttempts_; }

private:
    int maxAttempts_;
    std::vector<std::chrono::minutes> delays_;
};

} // namespace archive_engine::crawler
