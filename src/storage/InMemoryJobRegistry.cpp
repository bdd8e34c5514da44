#include "../../include/archive_engine/storage/InMemoryJobRegistry.h"
#include "../../include/archive_engine/common/IdGenerator.h"
#include "../../include/Logger.h"

#include <algorithm>

namespace archive_engine::storage {

using crawler::AttemptOutcome;
using crawler::CatalogItem;
using crawler::CrawlAttempt;
using crawler::Job;
using crawler::JobStatus;

namespace {

bool isDueForCrawl(const Job& job, std::chrono::system_clock::time_point now) {
    if (job.status == JobStatus::PENDING) {
        return true;
    }
    if (job.status == JobStatus::READY || job.status == JobStatus::ERR) {
        return job.nextCrawlAt && *job.nextCrawlAt <= now;
    }
    return false;
}

std::vector<Job> byDueTime(std::vector<Job> jobs, int limit) {
    std::stable_sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        auto aDue = a.nextCrawlAt.value_or(a.createdAt);
        auto bDue = b.nextCrawlAt.value_or(b.createdAt);
        return aDue < bDue;
    });
    if (limit > 0 && jobs.size() > static_cast<size_t>(limit)) {
        jobs.resize(static_cast<size_t>(limit));
    }
    return jobs;
}

} // namespace

std::string InMemoryJobRegistry::createJob(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    Job stored = job;
    if (stored.id.empty()) {
        stored.id = common::generateId();
    }
    if (jobs_.count(stored.id) > 0) {
        throw RegistryError("Job already exists: " + stored.id);
    }
    auto now = std::chrono::system_clock::now();
    stored.createdAt = now;
    stored.updatedAt = now;
    jobs_[stored.id] = stored;
    LOG_DEBUG("Created job " + stored.id + " for " + stored.url);
    return stored.id;
}

std::optional<Job> InMemoryJobRegistry::loadJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryJobRegistry::saveJobStatus(const std::string& jobId, const crawler::JobUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        throw RegistryError("Cannot update missing job " + jobId);
    }
    update.applyTo(it->second);
    it->second.updatedAt = std::chrono::system_clock::now();
}

std::string InMemoryJobRegistry::appendAttemptRecord(const CrawlAttempt& attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    CrawlAttempt stored = attempt;
    if (stored.id.empty()) {
        stored.id = common::generateId();
    }
    stored.outcome = AttemptOutcome::RUNNING;
    attempts_.push_back(stored);
    return stored.id;
}

void InMemoryJobRegistry::finalizeAttemptRecord(const std::string& attemptId, const crawler::AttemptResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(attempts_.begin(), attempts_.end(),
                           [&](const CrawlAttempt& a) { return a.id == attemptId; });
    if (it == attempts_.end()) {
        throw RegistryError("Cannot finalize missing attempt " + attemptId);
    }
    if (it->outcome != AttemptOutcome::RUNNING) {
        throw RegistryError("Attempt " + attemptId + " already finalized as " +
                            crawler::attemptOutcomeToString(it->outcome));
    }
    it->outcome = result.outcome;
    it->errorKind = result.errorKind;
    it->errorClass = result.errorClass;
    it->itemsCrawled = result.itemsCrawled;
    it->bytesTransferred = result.bytesTransferred;
    it->logTail = result.logTail;
    it->errorMessage = result.errorMessage;
    it->finishedAt = result.finishedAt;
}

std::optional<CrawlAttempt> InMemoryJobRegistry::latestAttempt(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = attempts_.rbegin(); it != attempts_.rend(); ++it) {
        if (it->jobId == jobId) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<CrawlAttempt> InMemoryJobRegistry::listAttempts(const std::string& jobId, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CrawlAttempt> result;
    for (auto it = attempts_.rbegin(); it != attempts_.rend(); ++it) {
        if (limit > 0 && result.size() >= static_cast<size_t>(limit)) {
            break;
        }
        if (it->jobId == jobId) {
            result.push_back(*it);
        }
    }
    return result;
}

bool InMemoryJobRegistry::upsertCatalogItem(const CatalogItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = catalog_.emplace(std::make_pair(item.jobId, item.itemId), item);
    return inserted.second;
}

std::uint64_t InMemoryJobRegistry::countCatalogItems(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::uint64_t>(std::count_if(catalog_.begin(), catalog_.end(),
        [&](const auto& entry) { return entry.first.first == jobId; }));
}

std::vector<Job> InMemoryJobRegistry::findJobsDueForCrawl(std::chrono::system_clock::time_point now, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> due;
    for (const auto& [id, job] : jobs_) {
        if (isDueForCrawl(job, now)) {
            due.push_back(job);
        }
    }
    return byDueTime(std::move(due), limit);
}

std::vector<Job> InMemoryJobRegistry::findJobsDueForRetry(std::chrono::system_clock::time_point now, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> due;
    for (const auto& [id, job] : jobs_) {
        if (job.status == JobStatus::RETRY_PENDING && job.nextCrawlAt && *job.nextCrawlAt <= now) {
            due.push_back(job);
        }
    }
    return byDueTime(std::move(due), limit);
}

std::vector<Job> InMemoryJobRegistry::findJobsByStatus(JobStatus status, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> result;
    for (const auto& [id, job] : jobs_) {
        if (limit > 0 && result.size() >= static_cast<size_t>(limit)) {
            break;
        }
        if (job.status == status) {
            result.push_back(job);
        }
    }
    return result;
}

std::vector<CatalogItem> InMemoryJobRegistry::catalogItems(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CatalogItem> items;
    for (const auto& [key, item] : catalog_) {
        if (key.first == jobId) {
            items.push_back(item);
        }
    }
    return items;
}

void InMemoryJobRegistry::setUpdatedAt(const std::string& jobId, std::chrono::system_clock::time_point updatedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        throw RegistryError("Cannot update missing job " + jobId);
    }
    it->second.updatedAt = updatedAt;
}

} // namespace archive_engine::storage
