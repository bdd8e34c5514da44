#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "LiveJobRegistry.h"
#include "ProcessRunner.h"
#include "RetryPolicy.h"
#include "TimeoutPolicy.h"
#include "ToolCommands.h"
#include "models/Job.h"
#include "models/ErrorClass.h"
#include "../common/EngineConfig.h"
#include "../common/Result.h"
#include "../storage/JobRegistry.h"

namespace archive_engine::crawler {

// What a dispatch task resolves to. Callers normally only watch job status
// in the registry; this is for tests and logging.
struct CrawlOutcome {
    std::string jobId;
    std::string attemptId;
    bool success = false;
    bool persisted = false;      // false when cancellation claimed the outcome or the engine faulted
    bool engineFault = false;
    JobStatus finalStatus = JobStatus::PENDING;
    CrawlErrorKind errorKind = CrawlErrorKind::NONE;
    std::optional<ErrorClass> errorClass;
    std::string errorMessage;
    std::uint64_t sizeBytes = 0;
    std::uint64_t itemCount = 0;
};

/**
 * Runs one background task per active job: registers it live, drives the
 * external tools for its kind, computes statistics from disk and commits
 * the outcome through the retry policy. Crawl failures never escape a task;
 * registry failures are logged as engine faults.
 */
class CrawlDispatcher {
public:
    CrawlDispatcher(const common::EngineConfig& config,
                    std::shared_ptr<storage::JobRegistry> registry,
                    std::shared_ptr<LiveJobRegistry> liveJobs);

    // Blocks until every task has finished
    ~CrawlDispatcher();

    CrawlDispatcher(const CrawlDispatcher&) = delete;
    CrawlDispatcher& operator=(const CrawlDispatcher&) = delete;

    // Start a crawl; returns the running task when the job is already active
    std::shared_future<CrawlOutcome> enqueueCrawl(const std::string& jobId);

    // Same path as enqueueCrawl, used for retry_pending jobs
    std::shared_future<CrawlOutcome> enqueueRetry(const std::string& jobId);

    common::Result<bool> cancelCrawl(const std::string& jobId);

    std::vector<LiveJobSnapshot> listLiveCrawls() const;

    std::optional<ProgressSnapshot> getProgress(const std::string& jobId) const;

    // Live buffer while running, else the captured log of the latest attempt
    std::optional<std::vector<std::string>> getLiveLogTail(const std::string& jobId, size_t lines) const;

    size_t activeTaskCount();

    bool isActive(const std::string& jobId);

    void waitForAll();

    // Cancel every live crawl, then wait for the tasks to wind down
    void shutdown();

private:
    // Per-dispatch state shared by the kind handlers
    struct JobContext {
        std::string jobId;
        std::shared_ptr<CancellationToken> token;
        std::chrono::steady_clock::time_point deadline;
        std::chrono::seconds budget{0};
        std::deque<std::string> capturedLog;
    };

    // Result of the kind handler, before the retry policy is consulted
    struct KindResult {
        bool ok = false;
        CrawlErrorKind errorKind = CrawlErrorKind::NONE;
        std::string errorMessage;
        std::uint64_t sizeBytes = 0;
        std::uint64_t itemCount = 0;

        static KindResult success(std::uint64_t bytes, std::uint64_t items);
        static KindResult failure(CrawlErrorKind kind, const std::string& message);
    };

    std::shared_future<CrawlOutcome> enqueue(const std::string& jobId, const std::string& reason);
    void pruneFinishedLocked();

    CrawlOutcome runJob(const std::string& jobId);

    KindResult crawlPageMirror(const Job& job, const PageMirror& mirror, JobContext& ctx);
    KindResult crawlVideoChannel(const Job& job, const VideoChannel& channel, JobContext& ctx);
    KindResult crawlBrowserSnapshot(const Job& job, JobContext& ctx);

    // Lines reach the live buffer and the attempt log clipped to the default
    // limit; the returned result keeps them as long as maxLineBytes allows.
    RunResult runTool(JobContext& ctx, const std::vector<std::string>& argv,
                      std::chrono::milliseconds budget, size_t maxLineBytes = kDefaultMaxLineBytes);

    // nullopt when the run counts as success
    std::optional<KindResult> classifyRun(const RunResult& run, const std::string& tool,
                                          std::initializer_list<int> successCodes) const;

    std::optional<std::chrono::milliseconds> remainingBudget(const JobContext& ctx) const;
    KindResult budgetExhausted(const JobContext& ctx, const std::string& tool) const;

    void commitOutcome(const Job& job, const std::string& attemptId, JobContext& ctx,
                       const KindResult& result, CrawlOutcome& outcome);

    std::string joinCapturedLog(const JobContext& ctx) const;

    common::EngineConfig config_;
    std::shared_ptr<storage::JobRegistry> registry_;
    std::shared_ptr<LiveJobRegistry> liveJobs_;
    ProcessRunner runner_;
    TimeoutPolicy timeoutPolicy_;
    RetryPolicy retryPolicy_;
    ToolCommands tools_;

    std::mutex tasksMutex_;
    std::unordered_map<std::string, std::shared_future<CrawlOutcome>> tasks_;
};

} // namespace archive_engine::crawler
