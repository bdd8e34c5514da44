#include "../../include/archive_engine/storage/MongoJobRegistry.h"
#include "../../include/archive_engine/storage/MongoDBInstance.h"
#include "../../include/archive_engine/common/IdGenerator.h"
#include "../../include/Logger.h"
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/builder/stream/array.hpp>
#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/builder/stream/helpers.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/index.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/exception/operation_exception.hpp>

using namespace bsoncxx::builder::stream;
using bsoncxx::builder::basic::kvp;

namespace archive_engine::storage {

using crawler::AttemptOutcome;
using crawler::CatalogItem;
using crawler::CrawlAttempt;
using crawler::Job;
using crawler::JobStatus;

namespace {

constexpr int kDuplicateKeyError = 11000;

bsoncxx::types::b_date timePointToBsonDate(const std::chrono::system_clock::time_point& tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return bsoncxx::types::b_date{std::chrono::milliseconds{millis}};
}

std::chrono::system_clock::time_point bsonDateToTimePoint(const bsoncxx::types::b_date& date) {
    return std::chrono::system_clock::time_point{date.value};
}

void appendOptionalDate(bsoncxx::builder::basic::document& doc, const char* key,
                        const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (tp) {
        doc.append(kvp(key, timePointToBsonDate(*tp)));
    } else {
        doc.append(kvp(key, bsoncxx::types::b_null{}));
    }
}

std::string getString(const bsoncxx::document::view& doc, const char* key, const std::string& fallback = "") {
    auto element = doc[key];
    if (!element || element.type() != bsoncxx::type::k_string) {
        return fallback;
    }
    return std::string(element.get_string().value);
}

std::int64_t getInteger(const bsoncxx::document::view& doc, const char* key, std::int64_t fallback = 0) {
    auto element = doc[key];
    if (!element) {
        return fallback;
    }
    switch (element.type()) {
        case bsoncxx::type::k_int32: return element.get_int32().value;
        case bsoncxx::type::k_int64: return element.get_int64().value;
        case bsoncxx::type::k_double: return static_cast<std::int64_t>(element.get_double().value);
        default: return fallback;
    }
}

std::optional<std::chrono::system_clock::time_point> getDate(const bsoncxx::document::view& doc, const char* key) {
    auto element = doc[key];
    if (!element || element.type() != bsoncxx::type::k_date) {
        return std::nullopt;
    }
    return bsonDateToTimePoint(element.get_date());
}

} // namespace

MongoJobRegistry::MongoJobRegistry(const std::string& connectionString, const std::string& databaseName) {
    LOG_DEBUG("MongoJobRegistry constructor called with database: " + databaseName);
    try {
        LOG_INFO("Initializing MongoDB connection to: " + connectionString);
        MongoDBInstance::getInstance();

        mongocxx::uri uri{connectionString};
        client_ = std::make_unique<mongocxx::client>(uri);
        database_ = (*client_)[databaseName];
        jobsCollection_ = database_["jobs"];
        attemptsCollection_ = database_["crawl_attempts"];
        catalogCollection_ = database_["catalog_items"];
        LOG_INFO("Connected to MongoDB database: " + databaseName);

        ensureIndexes();
        LOG_DEBUG("MongoDB indexes ensured");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to initialize MongoDB connection: " + std::string(e.what()));
        throw RegistryError("Failed to initialize MongoDB connection: " + std::string(e.what()));
    }
}

common::Result<bool> MongoJobRegistry::testConnection() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto ping = document{} << "ping" << 1 << finalize;
        database_.run_command(ping.view());
        return common::Result<bool>::Success(true, "MongoDB connection is healthy");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB ping failed: " + std::string(e.what()));
        return common::Result<bool>::Failure("MongoDB ping failed: " + std::string(e.what()));
    }
}

void MongoJobRegistry::ensureIndexes() {
    // Due-job scans by the trigger service
    {
        bsoncxx::builder::stream::document keys;
        keys << "status" << 1 << "nextCrawlAt" << 1;
        jobsCollection_.create_index(keys.view());
    }
    // Latest attempt per job
    {
        bsoncxx::builder::stream::document keys;
        keys << "jobId" << 1 << "startedAt" << -1;
        attemptsCollection_.create_index(keys.view());
    }
    // One catalog row per item and job
    {
        bsoncxx::builder::stream::document keys;
        keys << "jobId" << 1 << "itemId" << 1;
        mongocxx::options::index idx_opts{};
        idx_opts.unique(true);
        catalogCollection_.create_index(keys.view(), idx_opts);
    }
}

bsoncxx::document::value MongoJobRegistry::jobToBson(const Job& job) {
    auto kind = bsoncxx::from_json(crawler::jobKindToJson(job.kind).dump());

    bsoncxx::builder::basic::document doc;
    doc.append(kvp("_id", job.id),
               kvp("url", job.url),
               kvp("name", job.name),
               kvp("kind", kind.view()),
               kvp("crawlIntervalDays", job.crawlIntervalDays),
               kvp("status", crawler::jobStatusToString(job.status)),
               kvp("lastError", job.lastError),
               kvp("retryCount", job.retryCount),
               kvp("sizeBytes", static_cast<std::int64_t>(job.sizeBytes)),
               kvp("itemCount", static_cast<std::int64_t>(job.itemCount)),
               kvp("createdAt", timePointToBsonDate(job.createdAt)),
               kvp("updatedAt", timePointToBsonDate(job.updatedAt)));
    appendOptionalDate(doc, "lastCrawlAt", job.lastCrawlAt);
    appendOptionalDate(doc, "nextCrawlAt", job.nextCrawlAt);
    return doc.extract();
}

Job MongoJobRegistry::bsonToJob(const bsoncxx::document::view& doc) {
    Job job;
    job.id = getString(doc, "_id");
    job.url = getString(doc, "url");
    job.name = getString(doc, "name");

    auto kind = doc["kind"];
    if (kind && kind.type() == bsoncxx::type::k_document) {
        job.kind = crawler::jobKindFromJson(nlohmann::json::parse(bsoncxx::to_json(kind.get_document().view())));
    }

    job.crawlIntervalDays = static_cast<int>(getInteger(doc, "crawlIntervalDays", 30));
    job.status = crawler::jobStatusFromString(getString(doc, "status", "pending"));
    job.lastError = getString(doc, "lastError");
    job.retryCount = static_cast<int>(getInteger(doc, "retryCount"));
    job.sizeBytes = static_cast<std::uint64_t>(getInteger(doc, "sizeBytes"));
    job.itemCount = static_cast<std::uint64_t>(getInteger(doc, "itemCount"));
    job.createdAt = getDate(doc, "createdAt").value_or(std::chrono::system_clock::time_point{});
    job.updatedAt = getDate(doc, "updatedAt").value_or(job.createdAt);
    job.lastCrawlAt = getDate(doc, "lastCrawlAt");
    job.nextCrawlAt = getDate(doc, "nextCrawlAt");
    return job;
}

bsoncxx::document::value MongoJobRegistry::attemptToBson(const CrawlAttempt& attempt) {
    bsoncxx::builder::basic::document doc;
    doc.append(kvp("_id", attempt.id),
               kvp("jobId", attempt.jobId),
               kvp("startedAt", timePointToBsonDate(attempt.startedAt)),
               kvp("outcome", crawler::attemptOutcomeToString(attempt.outcome)),
               kvp("errorKind", crawler::crawlErrorKindToString(attempt.errorKind)),
               kvp("itemsCrawled", static_cast<std::int64_t>(attempt.itemsCrawled)),
               kvp("bytesTransferred", static_cast<std::int64_t>(attempt.bytesTransferred)),
               kvp("logTail", attempt.logTail),
               kvp("errorMessage", attempt.errorMessage));
    appendOptionalDate(doc, "finishedAt", attempt.finishedAt);
    if (attempt.errorClass) {
        doc.append(kvp("errorClass", crawler::errorClassToString(*attempt.errorClass)));
    } else {
        doc.append(kvp("errorClass", bsoncxx::types::b_null{}));
    }
    return doc.extract();
}

CrawlAttempt MongoJobRegistry::bsonToAttempt(const bsoncxx::document::view& doc) {
    CrawlAttempt attempt;
    attempt.id = getString(doc, "_id");
    attempt.jobId = getString(doc, "jobId");
    attempt.startedAt = getDate(doc, "startedAt").value_or(std::chrono::system_clock::time_point{});
    attempt.finishedAt = getDate(doc, "finishedAt");
    attempt.outcome = crawler::attemptOutcomeFromString(getString(doc, "outcome", "running"));
    attempt.errorKind = crawler::crawlErrorKindFromString(getString(doc, "errorKind", "none"));
    std::string errorClass = getString(doc, "errorClass");
    if (!errorClass.empty()) {
        attempt.errorClass = crawler::errorClassFromString(errorClass);
    }
    attempt.itemsCrawled = static_cast<std::uint64_t>(getInteger(doc, "itemsCrawled"));
    attempt.bytesTransferred = static_cast<std::uint64_t>(getInteger(doc, "bytesTransferred"));
    attempt.logTail = getString(doc, "logTail");
    attempt.errorMessage = getString(doc, "errorMessage");
    return attempt;
}

std::string MongoJobRegistry::createJob(const Job& job) {
    Job stored = job;
    if (stored.id.empty()) {
        stored.id = common::generateId();
    }
    auto now = std::chrono::system_clock::now();
    stored.createdAt = now;
    stored.updatedAt = now;

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        jobsCollection_.insert_one(jobToBson(stored).view());
        LOG_INFO("Created job " + stored.id + " for " + stored.url);
        return stored.id;
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to create job for " + stored.url + ": " + std::string(e.what()));
        throw RegistryError("Failed to create job: " + std::string(e.what()));
    }
}

std::optional<Job> MongoJobRegistry::loadJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto filter = document{} << "_id" << jobId << finalize;
        auto result = jobsCollection_.find_one(filter.view());
        if (!result) {
            return std::nullopt;
        }
        return bsonToJob(result->view());
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to load job " + jobId + ": " + std::string(e.what()));
        throw RegistryError("Failed to load job " + jobId + ": " + std::string(e.what()));
    }
}

void MongoJobRegistry::saveJobStatus(const std::string& jobId, const crawler::JobUpdate& update) {
    bsoncxx::builder::basic::document fields;
    if (update.status) {
        fields.append(kvp("status", crawler::jobStatusToString(*update.status)));
    }
    if (update.lastError) {
        fields.append(kvp("lastError", *update.lastError));
    }
    if (update.retryCount) {
        fields.append(kvp("retryCount", *update.retryCount));
    }
    if (update.sizeBytes) {
        fields.append(kvp("sizeBytes", static_cast<std::int64_t>(*update.sizeBytes)));
    }
    if (update.itemCount) {
        fields.append(kvp("itemCount", static_cast<std::int64_t>(*update.itemCount)));
    }
    if (update.lastCrawlAt) {
        fields.append(kvp("lastCrawlAt", timePointToBsonDate(*update.lastCrawlAt)));
    }
    if (update.clearNextCrawlAt) {
        fields.append(kvp("nextCrawlAt", bsoncxx::types::b_null{}));
    } else if (update.nextCrawlAt) {
        fields.append(kvp("nextCrawlAt", timePointToBsonDate(*update.nextCrawlAt)));
    }
    if (update.channel) {
        fields.append(kvp("kind.channelId", update.channel->channelId),
                      kvp("kind.channelTitle", update.channel->channelTitle),
                      kvp("kind.thumbnailUrl", update.channel->thumbnailUrl));
    }
    fields.append(kvp("updatedAt", timePointToBsonDate(std::chrono::system_clock::now())));

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto filter = document{} << "_id" << jobId << finalize;
        auto field_values = fields.extract();
        bsoncxx::builder::basic::document update_doc;
        update_doc.append(kvp("$set", field_values.view()));
        auto result = jobsCollection_.update_one(filter.view(), update_doc.view());
        if (!result || result->matched_count() == 0) {
            throw RegistryError("Cannot update missing job " + jobId);
        }
        LOG_DEBUG("Saved job " + jobId + (update.status ? " status=" + crawler::jobStatusToString(*update.status) : ""));
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to save job " + jobId + ": " + std::string(e.what()));
        throw RegistryError("Failed to save job " + jobId + ": " + std::string(e.what()));
    }
}

std::string MongoJobRegistry::appendAttemptRecord(const CrawlAttempt& attempt) {
    CrawlAttempt stored = attempt;
    if (stored.id.empty()) {
        stored.id = common::generateId();
    }
    stored.outcome = AttemptOutcome::RUNNING;

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        attemptsCollection_.insert_one(attemptToBson(stored).view());
        return stored.id;
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to open attempt for job " + stored.jobId + ": " + std::string(e.what()));
        throw RegistryError("Failed to open attempt record: " + std::string(e.what()));
    }
}

void MongoJobRegistry::finalizeAttemptRecord(const std::string& attemptId, const crawler::AttemptResult& result) {
    bsoncxx::builder::basic::document fields;
    fields.append(kvp("outcome", crawler::attemptOutcomeToString(result.outcome)),
                  kvp("errorKind", crawler::crawlErrorKindToString(result.errorKind)),
                  kvp("itemsCrawled", static_cast<std::int64_t>(result.itemsCrawled)),
                  kvp("bytesTransferred", static_cast<std::int64_t>(result.bytesTransferred)),
                  kvp("logTail", result.logTail),
                  kvp("errorMessage", result.errorMessage),
                  kvp("finishedAt", timePointToBsonDate(result.finishedAt)));
    if (result.errorClass) {
        fields.append(kvp("errorClass", crawler::errorClassToString(*result.errorClass)));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        // Only a RUNNING attempt can be closed
        auto filter = document{} << "_id" << attemptId << "outcome" << "running" << finalize;
        auto field_values = fields.extract();
        bsoncxx::builder::basic::document update_doc;
        update_doc.append(kvp("$set", field_values.view()));
        auto updated = attemptsCollection_.update_one(filter.view(), update_doc.view());
        if (!updated || updated->matched_count() == 0) {
            throw RegistryError("Attempt " + attemptId + " is missing or already finalized");
        }
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to finalize attempt " + attemptId + ": " + std::string(e.what()));
        throw RegistryError("Failed to finalize attempt " + attemptId + ": " + std::string(e.what()));
    }
}

std::optional<CrawlAttempt> MongoJobRegistry::latestAttempt(const std::string& jobId) {
    auto attempts = listAttempts(jobId, 1);
    if (attempts.empty()) {
        return std::nullopt;
    }
    return attempts.front();
}

std::vector<CrawlAttempt> MongoJobRegistry::listAttempts(const std::string& jobId, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CrawlAttempt> attempts;
    try {
        auto filter = document{} << "jobId" << jobId << finalize;
        mongocxx::options::find opts{};
        opts.sort(document{} << "startedAt" << -1 << finalize);
        if (limit > 0) {
            opts.limit(limit);
        }
        auto cursor = attemptsCollection_.find(filter.view(), opts);
        for (const auto& doc : cursor) {
            attempts.push_back(bsonToAttempt(doc));
        }
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to list attempts of job " + jobId + ": " + std::string(e.what()));
        throw RegistryError("Failed to list attempts: " + std::string(e.what()));
    }
    return attempts;
}

bool MongoJobRegistry::upsertCatalogItem(const CatalogItem& item) {
    bsoncxx::builder::basic::document fields;
    fields.append(kvp("jobId", item.jobId),
                  kvp("itemId", item.itemId),
                  kvp("title", item.title),
                  kvp("description", item.description),
                  kvp("uploadDate", item.uploadDate),
                  kvp("mediaFilename", item.mediaFilename),
                  kvp("thumbnailFilename", item.thumbnailFilename),
                  kvp("sizeBytes", static_cast<std::int64_t>(item.sizeBytes)),
                  kvp("createdAt", timePointToBsonDate(item.createdAt)));
    if (item.durationSeconds) {
        fields.append(kvp("durationSeconds", *item.durationSeconds));
    } else {
        fields.append(kvp("durationSeconds", bsoncxx::types::b_null{}));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto filter = document{} << "jobId" << item.jobId << "itemId" << item.itemId << finalize;
        auto field_values = fields.extract();
        bsoncxx::builder::basic::document update_doc;
        update_doc.append(kvp("$setOnInsert", field_values.view()));
        mongocxx::options::update opts;
        opts.upsert(true);
        auto result = catalogCollection_.update_one(filter.view(), update_doc.view(), opts);
        return result && result->upserted_id();
    } catch (const mongocxx::operation_exception& e) {
        // Two writers raced on the unique index; the row exists either way
        if (e.code().value() == kDuplicateKeyError) {
            return false;
        }
        LOG_ERROR("Failed to upsert catalog item " + item.itemId + ": " + std::string(e.what()));
        throw RegistryError("Failed to upsert catalog item: " + std::string(e.what()));
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to upsert catalog item " + item.itemId + ": " + std::string(e.what()));
        throw RegistryError("Failed to upsert catalog item: " + std::string(e.what()));
    }
}

std::uint64_t MongoJobRegistry::countCatalogItems(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto filter = document{} << "jobId" << jobId << finalize;
        return static_cast<std::uint64_t>(catalogCollection_.count_documents(filter.view()));
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to count catalog items of job " + jobId + ": " + std::string(e.what()));
        throw RegistryError("Failed to count catalog items: " + std::string(e.what()));
    }
}

std::vector<Job> MongoJobRegistry::findJobs(const bsoncxx::document::view& filter, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> jobs;
    try {
        mongocxx::options::find opts{};
        opts.sort(document{} << "nextCrawlAt" << 1 << "createdAt" << 1 << finalize);
        if (limit > 0) {
            opts.limit(limit);
        }
        auto cursor = jobsCollection_.find(filter, opts);
        for (const auto& doc : cursor) {
            jobs.push_back(bsonToJob(doc));
        }
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to query jobs: " + std::string(e.what()));
        throw RegistryError("Failed to query jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::vector<Job> MongoJobRegistry::findJobsDueForCrawl(std::chrono::system_clock::time_point now, int limit) {
    auto filter = document{}
        << "$or" << open_array
            << open_document << "status" << "pending" << close_document
            << open_document
                << "status" << open_document << "$in" << open_array << "ready" << "error" << close_array << close_document
                << "nextCrawlAt" << open_document << "$lte" << timePointToBsonDate(now) << close_document
            << close_document
        << close_array
        << finalize;
    return findJobs(filter.view(), limit);
}

std::vector<Job> MongoJobRegistry::findJobsDueForRetry(std::chrono::system_clock::time_point now, int limit) {
    auto filter = document{}
        << "status" << "retry_pending"
        << "nextCrawlAt" << open_document << "$lte" << timePointToBsonDate(now) << close_document
        << finalize;
    return findJobs(filter.view(), limit);
}

std::vector<Job> MongoJobRegistry::findJobsByStatus(JobStatus status, int limit) {
    auto filter = document{} << "status" << crawler::jobStatusToString(status) << finalize;
    return findJobs(filter.view(), limit);
}

} // namespace archive_engine::storage
