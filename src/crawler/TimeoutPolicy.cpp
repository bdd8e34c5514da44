#include "../../include/archive_engine/crawler/TimeoutPolicy.h"
#include "../../include/archive_engine/common/UrlUtils.h"
#include "../../include/Logger.h"

namespace archive_engine::crawler {

TimeoutPolicy::TimeoutPolicy(const common::EngineConfig& config)
    : shortBudget_(config.shortBudget)
    , longBudget_(config.longBudget)
    , snapshotBudget_(config.snapshotBudget)
    , videoMultiplier_(config.videoBudgetMultiplier)
    , largeThresholdBytes_(config.largeSiteThresholdBytes)
    , knownLargeDomains_(config.knownLargeDomains) {}

std::chrono::seconds TimeoutPolicy::budgetFor(const Job& job) const {
    return budgetFor(job.kind, job.sizeBytes, job.url);
}

std::chrono::seconds TimeoutPolicy::budgetFor(const JobKind& kind, std::uint64_t sizeHintBytes, const std::string& url) const {
    struct Visitor {
        const TimeoutPolicy& policy;
        std::uint64_t sizeHint;
        const std::string& url;

        std::chrono::seconds operator()(const PageMirror&) const {
            return policy.isLargeSite(sizeHint, url) ? policy.longBudget_ : policy.shortBudget_;
        }
        std::chrono::seconds operator()(const VideoChannel&) const {
            // Channels download many videos in one run
            return policy.longBudget_ * policy.videoMultiplier_;
        }
        std::chrono::seconds operator()(const BrowserSnapshot&) const {
            return policy.snapshotBudget_;
        }
    };

    auto budget = std::visit(Visitor{*this, sizeHintBytes, url}, kind);
    LOG_DEBUG("Timeout budget for " + url + " (" + jobKindName(kind) + "): " + std::to_string(budget.count()) + "s");
    return budget;
}

bool TimeoutPolicy::isLargeSite(std::uint64_t sizeHintBytes, const std::string& url) const {
    if (sizeHintBytes > largeThresholdBytes_) {
        return true;
    }
    common::UrlParts parts;
    if (!common::parseUrl(url, parts)) {
        return false;
    }
    return common::hostMatchesDomain(parts.host, knownLargeDomains_);
}

} // namespace archive_engine::crawler
