#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_session.hpp>
#include "../../include/archive_engine/storage/MongoJobRegistry.h"
#include "../../include/archive_engine/storage/MongoDBInstance.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <random>
#include <mongocxx/client.hpp>
#include <mongocxx/uri.hpp>

using namespace archive_engine;
using namespace archive_engine::crawler;
using namespace archive_engine::storage;
using namespace std::chrono_literals;

// Runs against the server in MONGODB_URI (default localhost). Every test
// case gets its own database, dropped afterwards.
namespace {

std::string testUri() {
    const char* env = std::getenv("MONGODB_URI");
    std::string uri = env && *env ? env : "mongodb://localhost:27017";
    // Fail fast when no server is running
    if (uri.find('?') != std::string::npos) {
        uri += "&";
    } else {
        uri += uri.back() == '/' ? "?" : "/?";
    }
    uri += "serverSelectionTimeoutMS=2000";
    return uri;
}

class TestDatabase {
public:
    TestDatabase() {
        std::random_device rd;
        name_ = "archive-engine-test-" + std::to_string(rd());
        try {
            registry_ = std::make_unique<MongoJobRegistry>(testUri(), name_);
        } catch (const RegistryError& e) {
            reason_ = e.what();
            return;
        }
        auto ping = registry_->testConnection();
        if (!ping.success) {
            reason_ = ping.message;
            registry_.reset();
        }
    }

    ~TestDatabase() {
        if (!registry_) {
            return;
        }
        try {
            MongoDBInstance::getInstance();
            mongocxx::client client{mongocxx::uri{testUri()}};
            client[name_].drop();
        } catch (const std::exception& e) {
            WARN("Could not drop " + name_ + ": " + e.what());
        }
    }

    bool available() const { return registry_ != nullptr; }
    const std::string& reason() const { return reason_; }
    MongoJobRegistry& registry() { return *registry_; }

private:
    std::string name_;
    std::string reason_;
    std::unique_ptr<MongoJobRegistry> registry_;
};

Job makeJob(const std::string& url, JobKind kind = PageMirror{}) {
    Job job;
    job.url = url;
    job.name = url;
    job.kind = kind;
    job.crawlIntervalDays = 7;
    return job;
}

bool near(std::chrono::system_clock::time_point actual, std::chrono::system_clock::time_point expected) {
    return actual > expected - 1s && actual < expected + 1s;
}

bool containsJob(const std::vector<Job>& jobs, const std::string& id) {
    return std::any_of(jobs.begin(), jobs.end(), [&](const Job& job) { return job.id == id; });
}

} // namespace

TEST_CASE("MongoJobRegistry - Connection", "[mongodb][storage]") {
    SECTION("Unreachable server is reported as RegistryError or a failed ping") {
        try {
            MongoJobRegistry registry("mongodb://127.0.0.1:1/?serverSelectionTimeoutMS=500", "archive-engine-unreachable");
            REQUIRE_FALSE(registry.testConnection().success);
        } catch (const RegistryError& e) {
            REQUIRE(std::string(e.what()).find("MongoDB") != std::string::npos);
        }
    }

    SECTION("Configured server") {
        TestDatabase db;
        if (!db.available()) {
            WARN("MongoDB not available: " + db.reason());
            return;
        }
        auto result = db.registry().testConnection();
        REQUIRE(result.success);
        REQUIRE(result.message == "MongoDB connection is healthy");
    }
}

TEST_CASE("MongoJobRegistry - Job documents", "[mongodb][storage][crud]") {
    TestDatabase db;
    if (!db.available()) {
        WARN("Skipping MongoDB tests - MongoDB not available: " + db.reason());
        return;
    }
    auto& registry = db.registry();

    SECTION("Create and load round trip") {
        PageMirror mirror;
        mirror.depth = 2;
        mirror.includeExternal = true;
        auto id = registry.createJob(makeJob("https://example.com/", mirror));
        REQUIRE_FALSE(id.empty());

        auto job = registry.loadJob(id);
        REQUIRE(job.has_value());
        REQUIRE(job->url == "https://example.com/");
        REQUIRE(job->status == JobStatus::PENDING);
        REQUIRE(job->crawlIntervalDays == 7);
        REQUIRE_FALSE(job->nextCrawlAt.has_value());
        REQUIRE_FALSE(job->lastCrawlAt.has_value());
        const auto& stored = std::get<PageMirror>(job->kind);
        REQUIRE(stored.depth == 2);
        REQUIRE(stored.includeExternal);

        REQUIRE_FALSE(registry.loadJob("no-such-job").has_value());
    }

    SECTION("Partial updates leave other fields alone") {
        auto id = registry.createJob(makeJob("https://example.org/"));
        auto now = std::chrono::system_clock::now();

        JobUpdate update;
        update.status = JobStatus::READY;
        update.sizeBytes = 50000;
        update.itemCount = 3;
        update.lastCrawlAt = now;
        update.nextCrawlAt = now + 24h * 7;
        registry.saveJobStatus(id, update);

        JobUpdate failure;
        failure.status = JobStatus::RETRY_PENDING;
        failure.lastError = "connection refused";
        failure.retryCount = 1;
        registry.saveJobStatus(id, failure);

        auto job = registry.loadJob(id);
        REQUIRE(job->status == JobStatus::RETRY_PENDING);
        REQUIRE(job->lastError == "connection refused");
        REQUIRE(job->retryCount == 1);
        REQUIRE(job->sizeBytes == 50000);
        REQUIRE(job->itemCount == 3);
        REQUIRE(job->lastCrawlAt.has_value());
        REQUIRE(near(*job->lastCrawlAt, now));
        REQUIRE(near(*job->nextCrawlAt, now + 24h * 7));
        REQUIRE(job->updatedAt >= job->createdAt);
    }

    SECTION("clearNextCrawlAt stores null") {
        auto id = registry.createJob(makeJob("https://example.net/"));
        JobUpdate schedule;
        schedule.nextCrawlAt = std::chrono::system_clock::now();
        registry.saveJobStatus(id, schedule);
        REQUIRE(registry.loadJob(id)->nextCrawlAt.has_value());

        JobUpdate reset;
        reset.status = JobStatus::PENDING;
        reset.clearNextCrawlAt = true;
        registry.saveJobStatus(id, reset);
        REQUIRE_FALSE(registry.loadJob(id)->nextCrawlAt.has_value());
    }

    SECTION("Resolved channel is written into the kind document") {
        auto id = registry.createJob(makeJob("https://www.youtube.com/@channel", VideoChannel{}));

        JobUpdate update;
        update.channel = VideoChannel{"UC123", "Some Channel", "https://i.ytimg.com/t.jpg"};
        registry.saveJobStatus(id, update);

        auto job = registry.loadJob(id);
        REQUIRE(std::holds_alternative<VideoChannel>(job->kind));
        const auto& channel = std::get<VideoChannel>(job->kind);
        REQUIRE(channel.channelId == "UC123");
        REQUIRE(channel.channelTitle == "Some Channel");
        REQUIRE(channel.thumbnailUrl == "https://i.ytimg.com/t.jpg");
        REQUIRE(job->url == "https://www.youtube.com/@channel");
    }

    SECTION("Updating a missing job throws") {
        JobUpdate update;
        update.status = JobStatus::CRAWLING;
        REQUIRE_THROWS_AS(registry.saveJobStatus("no-such-job", update), RegistryError);
    }
}

TEST_CASE("MongoJobRegistry - Attempt records", "[mongodb][storage]") {
    TestDatabase db;
    if (!db.available()) {
        WARN("Skipping MongoDB tests - MongoDB not available: " + db.reason());
        return;
    }
    auto& registry = db.registry();
    auto jobId = registry.createJob(makeJob("https://example.com/"));
    auto now = std::chrono::system_clock::now();

    CrawlAttempt first;
    first.jobId = jobId;
    first.startedAt = now - 1h;
    auto firstId = registry.appendAttemptRecord(first);

    CrawlAttempt second;
    second.jobId = jobId;
    second.startedAt = now;
    second.outcome = AttemptOutcome::SUCCESS;  // ignored, attempts open as running
    auto secondId = registry.appendAttemptRecord(second);

    SECTION("Latest attempt is the newest and still running") {
        auto latest = registry.latestAttempt(jobId);
        REQUIRE(latest.has_value());
        REQUIRE(latest->id == secondId);
        REQUIRE(latest->outcome == AttemptOutcome::RUNNING);
        REQUIRE_FALSE(latest->finishedAt.has_value());
        REQUIRE(registry.listAttempts(jobId, 0).size() == 2);
        REQUIRE_FALSE(registry.latestAttempt("no-such-job").has_value());
    }

    SECTION("An attempt is finalized exactly once") {
        AttemptResult result;
        result.outcome = AttemptOutcome::ERR;
        result.errorKind = CrawlErrorKind::TOOL_FAILURE;
        result.errorClass = ErrorClass::RECOVERABLE;
        result.errorMessage = "wget exited with code 4: connection refused";
        result.logTail = "Connecting to example.com... failed: Connection refused.";
        result.finishedAt = now;
        registry.finalizeAttemptRecord(firstId, result);

        auto attempts = registry.listAttempts(jobId, 0);
        auto it = std::find_if(attempts.begin(), attempts.end(), [&](const CrawlAttempt& a) { return a.id == firstId; });
        REQUIRE(it != attempts.end());
        REQUIRE(it->outcome == AttemptOutcome::ERR);
        REQUIRE(it->errorKind == CrawlErrorKind::TOOL_FAILURE);
        REQUIRE(it->errorClass == std::optional<ErrorClass>(ErrorClass::RECOVERABLE));
        REQUIRE(it->finishedAt.has_value());
        REQUIRE(it->logTail == result.logTail);

        AttemptResult again;
        again.outcome = AttemptOutcome::CANCELLED;
        again.finishedAt = now;
        REQUIRE_THROWS_AS(registry.finalizeAttemptRecord(firstId, again), RegistryError);
        REQUIRE_THROWS_AS(registry.finalizeAttemptRecord("no-such-attempt", again), RegistryError);
    }
}

TEST_CASE("MongoJobRegistry - Catalog items", "[mongodb][storage]") {
    TestDatabase db;
    if (!db.available()) {
        WARN("Skipping MongoDB tests - MongoDB not available: " + db.reason());
        return;
    }
    auto& registry = db.registry();
    auto jobId = registry.createJob(makeJob("https://www.youtube.com/@channel", VideoChannel{}));

    CatalogItem item;
    item.jobId = jobId;
    item.itemId = "vid1";
    item.title = "First";
    item.durationSeconds = 61;
    item.createdAt = std::chrono::system_clock::now();

    REQUIRE(registry.upsertCatalogItem(item));

    SECTION("A second upsert of the same item is a no-op") {
        item.title = "Renamed";
        REQUIRE_FALSE(registry.upsertCatalogItem(item));
        REQUIRE(registry.countCatalogItems(jobId) == 1);
    }

    SECTION("Items are unique per job, not globally") {
        auto otherJob = registry.createJob(makeJob("https://www.youtube.com/@other", VideoChannel{}));
        CatalogItem shared = item;
        shared.jobId = otherJob;
        REQUIRE(registry.upsertCatalogItem(shared));

        CatalogItem second = item;
        second.itemId = "vid2";
        second.durationSeconds.reset();
        REQUIRE(registry.upsertCatalogItem(second));

        REQUIRE(registry.countCatalogItems(jobId) == 2);
        REQUIRE(registry.countCatalogItems(otherJob) == 1);
    }
}

TEST_CASE("MongoJobRegistry - Due job queries", "[mongodb][storage]") {
    TestDatabase db;
    if (!db.available()) {
        WARN("Skipping MongoDB tests - MongoDB not available: " + db.reason());
        return;
    }
    auto& registry = db.registry();
    auto now = std::chrono::system_clock::now();

    auto withStatus = [&](const std::string& url, JobStatus status,
                          std::optional<std::chrono::system_clock::time_point> next) {
        auto id = registry.createJob(makeJob(url));
        JobUpdate update;
        update.status = status;
        if (next) {
            update.nextCrawlAt = *next;
        }
        registry.saveJobStatus(id, update);
        return id;
    };

    auto pending = registry.createJob(makeJob("https://pending.example/"));
    auto readyDue = withStatus("https://ready-due.example/", JobStatus::READY, now - 1h);
    auto readyLater = withStatus("https://ready-later.example/", JobStatus::READY, now + 1h);
    auto readyUnscheduled = withStatus("https://ready-null.example/", JobStatus::READY, std::nullopt);
    auto errorDue = withStatus("https://error-due.example/", JobStatus::ERR, now - 2h);
    auto crawling = withStatus("https://crawling.example/", JobStatus::CRAWLING, now - 3h);
    auto dead = withStatus("https://dead.example/", JobStatus::DEAD, now - 3h);
    auto retryDue = withStatus("https://retry-due.example/", JobStatus::RETRY_PENDING, now - 5min);
    auto retryLater = withStatus("https://retry-later.example/", JobStatus::RETRY_PENDING, now + 5min);

    SECTION("Scheduled crawls") {
        auto due = registry.findJobsDueForCrawl(now, 0);
        REQUIRE(due.size() == 3);
        REQUIRE(containsJob(due, pending));
        REQUIRE(containsJob(due, readyDue));
        REQUIRE(containsJob(due, errorDue));
        REQUIRE_FALSE(containsJob(due, readyLater));
        REQUIRE_FALSE(containsJob(due, readyUnscheduled));
        REQUIRE_FALSE(containsJob(due, crawling));
        REQUIRE_FALSE(containsJob(due, dead));
        REQUIRE_FALSE(containsJob(due, retryDue));

        REQUIRE(registry.findJobsDueForCrawl(now, 1).size() == 1);
    }

    SECTION("Retries") {
        auto due = registry.findJobsDueForRetry(now, 10);
        REQUIRE(due.size() == 1);
        REQUIRE(due[0].id == retryDue);
        REQUIRE_FALSE(containsJob(due, retryLater));
    }

    SECTION("By status") {
        auto rows = registry.findJobsByStatus(JobStatus::CRAWLING, 0);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].id == crawling);
        REQUIRE(registry.findJobsByStatus(JobStatus::READY, 0).size() == 3);
    }
}

int main(int argc, char* argv[]) {
    const char* logLevelEnv = std::getenv("LOG_LEVEL");
    LogLevel logLevel = Logger::parseLogLevel(logLevelEnv ? logLevelEnv : "", LogLevel::WARNING);
    Logger::getInstance().init(logLevel, true);

    return Catch::Session().run(argc, argv);
}
