#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "models/Job.h"
#include "../common/EngineConfig.h"

namespace archive_engine::crawler {

// Chooses the wall-clock budget of one dispatch. A coarse bound on how long
// a single job may hold resources, not an SLA.
class TimeoutPolicy {
public:
    explicit TimeoutPolicy(const common::EngineConfig& config);

    std::chrono::seconds budgetFor(const Job& job) const;

    std::chrono::seconds budgetFor(const JobKind& kind, std::uint64_t sizeHintBytes, const std::string& url) const;

    // Large by size hint or by the known-large domain allow-list
    bool isLargeSite(std::uint64_t sizeHintBytes, const std::string& url) const;

private:
    std::chrono::seconds shortBudget_;
    std::chrono::seconds longBudget_;
    std::chrono::seconds snapshotBudget_;
    int videoMultiplier_;
    std::uint64_t largeThresholdBytes_;
    std::vector<std::string> knownLargeDomains_;
};

} // namespace archive_engine::crawler
