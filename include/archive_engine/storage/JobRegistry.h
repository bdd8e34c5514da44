#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../crawler/models/Job.h"
#include "../crawler/models/CrawlAttempt.h"
#include "../crawler/models/CatalogItem.h"

namespace archive_engine::storage {

// Raised for any persistence failure. Crawl failures are never reported
// this way; seeing one means the engine itself is in trouble.
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persistent store of jobs, attempt records and catalog items
class JobRegistry {
public:
    virtual ~JobRegistry() = default;

    // Insert a new job; an empty id is generated. Returns the id.
    virtual std::string createJob(const crawler::Job& job) = 0;

    virtual std::optional<crawler::Job> loadJob(const std::string& jobId) = 0;

    // Partial update; always bumps updatedAt. Throws when the job is missing.
    virtual void saveJobStatus(const std::string& jobId, const crawler::JobUpdate& update) = 0;

    // Open a new attempt record (outcome RUNNING). Returns its id.
    virtual std::string appendAttemptRecord(const crawler::CrawlAttempt& attempt) = 0;

    // Close a RUNNING attempt. Throws when it is missing or already closed.
    virtual void finalizeAttemptRecord(const std::string& attemptId, const crawler::AttemptResult& result) = 0;

    virtual std::optional<crawler::CrawlAttempt> latestAttempt(const std::string& jobId) = 0;

    virtual std::vector<crawler::CrawlAttempt> listAttempts(const std::string& jobId, int limit) = 0;

    // Insert unless (jobId, itemId) already exists. Returns true when inserted.
    virtual bool upsertCatalogItem(const crawler::CatalogItem& item) = 0;

    virtual std::uint64_t countCatalogItems(const std::string& jobId) = 0;

    // pending jobs, plus ready/error jobs whose nextCrawlAt has passed
    virtual std::vector<crawler::Job> findJobsDueForCrawl(std::chrono::system_clock::time_point now, int limit) = 0;

    // retry_pending jobs whose nextCrawlAt has passed, oldest first
    virtual std::vector<crawler::Job> findJobsDueForRetry(std::chrono::system_clock::time_point now, int limit) = 0;

    virtual std::vector<crawler::Job> findJobsByStatus(crawler::JobStatus status, int limit) = 0;
};

} // namespace archive_engine::storage
