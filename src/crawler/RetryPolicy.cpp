#include "../../include/archive_engine/crawler/RetryPolicy.h"
#include "../../include/archive_engine/crawler/ErrorClassifier.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace archive_engine::crawler {

RetryPolicy::RetryPolicy(const common::EngineConfig& config)
    : RetryPolicy(config.maxAttempts, config.retryDelays) {}

RetryPolicy::RetryPolicy(int maxAttempts, std::vector<std::chrono::minutes> delays)
    : maxAttempts_(maxAttempts), delays_(std::move(delays)) {
    if (maxAttempts_ <= 0) {
        throw std::invalid_argument("maxAttempts must be positive");
    }
    if (delays_.empty()) {
        throw std::invalid_argument("retry delay ladder must not be empty");
    }
}

RetryDecision RetryPolicy::onFailure(int currentRetryCount,
                                     const std::string& errorMessage,
                                     std::chrono::system_clock::time_point now) const {
    RetryDecision decision;
    decision.retryCount = std::min(std::max(currentRetryCount, 0) + 1, maxAttempts_);
    decision.errorClass = ErrorClassifier::classify(errorMessage);

    if (decision.errorClass == ErrorClass::PERMANENT) {
        decision.nextStatus = JobStatus::DEAD;
        LOG_INFO("Permanent failure, no further attempts: " + errorMessage.substr(0, 200));
        return decision;
    }

    if (decision.retryCount >= maxAttempts_) {
        decision.nextStatus = JobStatus::ERR;
        LOG_INFO("Retry budget exhausted after " + std::to_string(decision.retryCount) + " attempts");
        return decision;
    }

    auto delay = delayFor(decision.retryCount);
    decision.nextStatus = JobStatus::RETRY_PENDING;
    decision.nextAttemptAt = now + delay;
    LOG_INFO("Scheduling retry " + std::to_string(decision.retryCount) + "/" + std::to_string(maxAttempts_) +
             " in " + std::to_string(delay.count()) + " minutes (" + errorClassToString(decision.errorClass) + ")");
    return decision;
}

std::chrono::minutes RetryPolicy::delayFor(int retryCount) const {
    if (retryCount <= 0) {
        return delays_.front();
    }
    size_t index = std::min(static_cast<size_t>(retryCount - 1), delays_.size() - 1);
    return delays_[index];
}

} // namespace archive_engine::crawler
