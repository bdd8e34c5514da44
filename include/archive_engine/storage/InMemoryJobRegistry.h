#pragma once

#include <map>
#include <mutex>
#include <utility>
#include "JobRegistry.h"

namespace archive_engine::storage {

// Process-local registry for tests and single-run tools. Same semantics as
// the MongoDB registry, nothing survives a restart.
class InMemoryJobRegistry : public JobRegistry {
public:
    InMemoryJobRegistry() = default;

    std::string createJob(const crawler::Job& job) override;
    std::optional<crawler::Job> loadJob(const std::string& jobId) override;
    void saveJobStatus(const std::string& jobId, const crawler::JobUpdate& update) override;

    std::string appendAttemptRecord(const crawler::CrawlAttempt& attempt) override;
    void finalizeAttemptRecord(const std::string& attemptId, const crawler::AttemptResult& result) override;
    std::optional<crawler::CrawlAttempt> latestAttempt(const std::string& jobId) override;
    std::vector<crawler::CrawlAttempt> listAttempts(const std::string& jobId, int limit) override;

    bool upsertCatalogItem(const crawler::CatalogItem& item) override;
    std::uint64_t countCatalogItems(const std::string& jobId) override;

    std::vector<crawler::Job> findJobsDueForCrawl(std::chrono::system_clock::time_point now, int limit) override;
    std::vector<crawler::Job> findJobsDueForRetry(std::chrono::system_clock::time_point now, int limit) override;
    std::vector<crawler::Job> findJobsByStatus(crawler::JobStatus status, int limit) override;

    // Test hooks
    std::vector<crawler::CatalogItem> catalogItems(const std::string& jobId) const;
    void setUpdatedAt(const std::string& jobId, std::chrono::system_clock::time_point updatedAt);

private:
    mutable std::mutex mutex_;
    std::map<std::string, crawler::Job> jobs_;
    std::vector<crawler::CrawlAttempt> attempts_;       // append order
    std::map<std::pair<std::string, std::string>, crawler::CatalogItem> catalog_;
};

} // namespace archive_engine::storage
