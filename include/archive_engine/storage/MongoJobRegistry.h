#pragma once

#include <memory>
#include <mutex>
#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/collection.hpp>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include "JobRegistry.h"
#include "../common/Result.h"

namespace archive_engine::storage {

/**
 * JobRegistry backed by MongoDB.
 *
 * Collections:
 *  - jobs            one document per job, _id is a UUID string
 *  - crawl_attempts  append-only attempt records
 *  - catalog_items   one document per (jobId, itemId), unique index
 *
 * A single client is shared by all dispatcher tasks, so every operation is
 * serialized on an internal mutex.
 */
class MongoJobRegistry : public JobRegistry {
public:
    explicit MongoJobRegistry(const std::string& connectionString = "mongodb://localhost:27017",
                              const std::string& databaseName = "archive-engine");

    ~MongoJobRegistry() override = default;

    MongoJobRegistry(const MongoJobRegistry&) = delete;
    MongoJobRegistry& operator=(const MongoJobRegistry&) = delete;

    // Round trip to the server
    common::Result<bool> testConnection();

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

private:
    void ensureIndexes();

    static bsoncxx::document::value jobToBson(const crawler::Job& job);
    static crawler::Job bsonToJob(const bsoncxx::document::view& doc);
    static bsoncxx::document::value attemptToBson(const crawler::CrawlAttempt& attempt);
    static crawler::CrawlAttempt bsonToAttempt(const bsoncxx::document::view& doc);

    std::vector<crawler::Job> findJobs(const bsoncxx::document::view& filter, int limit);

    std::mutex mutex_;
    std::unique_ptr<mongocxx::client> client_;
    mongocxx::database database_;
    mongocxx::collection jobsCollection_;
    mongocxx::collection attemptsCollection_;
    mongocxx::collection catalogCollection_;
};

} // namespace archive_engine::storage
