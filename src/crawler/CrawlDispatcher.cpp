#include "../../include/archive_engine/crawler/CrawlDispatcher.h"
#include "../../include/archive_engine/crawler/MirrorStats.h"
#include "../../include/archive_engine/crawler/VideoCatalog.h"
#include "../../include/archive_engine/common/IdGenerator.h"
#include "../../include/archive_engine/common/UrlUtils.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace archive_engine::crawler {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxErrorLength = 1000;
constexpr size_t kFailureTailLines = 5;
const std::string kManuallyInterrupted = "manually interrupted";
const std::string kNoContent = "no content downloaded";

std::string truncate(const std::string& value, size_t maxLength) {
    return value.size() > maxLength ? value.substr(0, maxLength) : value;
}

std::chrono::system_clock::duration intervalDays(int days) {
    return std::chrono::hours(24) * std::max(days, 1);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& line : lines) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += line;
    }
    return joined;
}

// Unregisters the live entry however the task ends
class LiveEntryGuard {
public:
    LiveEntryGuard(LiveJobRegistry& liveJobs, std::string jobId)
        : liveJobs_(liveJobs), jobId_(std::move(jobId)) {}
    ~LiveEntryGuard() { liveJobs_.unregisterJob(jobId_); }

    LiveEntryGuard(const LiveEntryGuard&) = delete;
    LiveEntryGuard& operator=(const LiveEntryGuard&) = delete;

private:
    LiveJobRegistry& liveJobs_;
    std::string jobId_;
};

} // namespace

CrawlDispatcher::KindResult CrawlDispatcher::KindResult::success(std::uint64_t bytes, std::uint64_t items) {
    KindResult result;
    result.ok = true;
    result.sizeBytes = bytes;
    result.itemCount = items;
    return result;
}

CrawlDispatcher::KindResult CrawlDispatcher::KindResult::failure(CrawlErrorKind kind, const std::string& message) {
    KindResult result;
    result.ok = false;
    result.errorKind = kind;
    result.errorMessage = message;
    return result;
}

CrawlDispatcher::CrawlDispatcher(const common::EngineConfig& config,
                                 std::shared_ptr<storage::JobRegistry> registry,
                                 std::shared_ptr<LiveJobRegistry> liveJobs)
    : config_(config)
    , registry_(std::move(registry))
    , liveJobs_(std::move(liveJobs))
    , runner_(config)
    , timeoutPolicy_(config)
    , retryPolicy_(config)
    , tools_(config) {
    if (!registry_ || !liveJobs_) {
        throw std::invalid_argument("CrawlDispatcher requires a job registry and a live job registry");
    }
    LOG_INFO("CrawlDispatcher initialized, mirrors at " + config_.mirrorsPath);
}

CrawlDispatcher::~CrawlDispatcher() {
    waitForAll();
}

// ---------------------------------------------------------------------------
// Entry points

std::shared_future<CrawlOutcome> CrawlDispatcher::enqueueCrawl(const std::string& jobId) {
    return enqueue(jobId, "crawl");
}

std::shared_future<CrawlOutcome> CrawlDispatcher::enqueueRetry(const std::string& jobId) {
    return enqueue(jobId, "retry");
}

std::shared_future<CrawlOutcome> CrawlDispatcher::enqueue(const std::string& jobId, const std::string& reason) {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    pruneFinishedLocked();

    auto it = tasks_.find(jobId);
    if (it != tasks_.end()) {
        LOG_INFO("Job " + jobId + " already has a running task, not starting another " + reason);
        return it->second;
    }

    LOG_INFO("Enqueueing " + reason + " for job " + jobId);
    auto future = std::async(std::launch::async, [this, jobId]() { return runJob(jobId); }).share();
    tasks_.emplace(jobId, future);
    return future;
}

void CrawlDispatcher::pruneFinishedLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t CrawlDispatcher::activeTaskCount() {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    pruneFinishedLocked();
    return tasks_.size();
}

bool CrawlDispatcher::isActive(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    pruneFinishedLocked();
    return tasks_.count(jobId) > 0;
}

void CrawlDispatcher::waitForAll() {
    while (true) {
        std::vector<std::shared_future<CrawlOutcome>> pending;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            pruneFinishedLocked();
            for (const auto& [jobId, future] : tasks_) {
                pending.push_back(future);
            }
        }
        if (pending.empty()) {
            return;
        }
        for (auto& future : pending) {
            future.wait();
        }
    }
}

void CrawlDispatcher::shutdown() {
    auto live = liveJobs_->snapshot();
    LOG_INFO("Shutting down dispatcher, cancelling " + std::to_string(live.size()) + " live crawls");
    for (const auto& entry : live) {
        auto result = cancelCrawl(entry.jobId);
        if (!result.success) {
            LOG_WARNING("Cancel during shutdown: " + result.message);
        }
    }
    waitForAll();
}

common::Result<bool> CrawlDispatcher::cancelCrawl(const std::string& jobId) {
    auto terminated = liveJobs_->terminate(jobId);
    if (!terminated.success) {
        LOG_INFO(terminated.message);
        return common::Result<bool>::Failure(terminated.message);
    }

    auto now = std::chrono::system_clock::now();
    try {
        JobUpdate update;
        update.status = JobStatus::ERR;
        update.lastError = kManuallyInterrupted;
        if (auto job = registry_->loadJob(jobId)) {
            // Not picked up again before the next regular crawl
            update.nextCrawlAt = now + intervalDays(job->crawlIntervalDays);
        }
        registry_->saveJobStatus(jobId, update);

        AttemptResult attempt;
        attempt.outcome = AttemptOutcome::CANCELLED;
        attempt.errorKind = CrawlErrorKind::CANCELLED;
        attempt.logTail = joinLines(terminated.value.logTail);
        attempt.errorMessage = kManuallyInterrupted;
        attempt.finishedAt = now;
        registry_->finalizeAttemptRecord(terminated.value.attemptId, attempt);
    } catch (const storage::RegistryError& e) {
        LOG_ERROR("Engine fault: job " + jobId + " was terminated but its cancellation was not persisted: " + std::string(e.what()));
        return common::Result<bool>::Failure("Job " + jobId + " terminated, persisting the cancellation failed: " + std::string(e.what()));
    }

    LOG_INFO("Job " + jobId + " cancelled");
    return common::Result<bool>::Success(true, "Job " + jobId + " cancelled");
}

std::vector<LiveJobSnapshot> CrawlDispatcher::listLiveCrawls() const {
    return liveJobs_->snapshot();
}

std::optional<ProgressSnapshot> CrawlDispatcher::getProgress(const std::string& jobId) const {
    return liveJobs_->progress(jobId);
}

std::optional<std::vector<std::string>> CrawlDispatcher::getLiveLogTail(const std::string& jobId, size_t lines) const {
    if (auto live = liveJobs_->tailLog(jobId, lines)) {
        return live;
    }

    try {
        auto attempt = registry_->latestAttempt(jobId);
        if (!attempt) {
            return std::nullopt;
        }
        auto all = splitLines(attempt->logTail);
        size_t start = all.size() > lines ? all.size() - lines : 0;
        return std::vector<std::string>(all.begin() + static_cast<std::ptrdiff_t>(start), all.end());
    } catch (const storage::RegistryError& e) {
        LOG_ERROR("Failed to read captured log of job " + jobId + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// Dispatch task

CrawlOutcome CrawlDispatcher::runJob(const std::string& jobId) {
    CrawlOutcome outcome;
    outcome.jobId = jobId;

    try {
        auto job = registry_->loadJob(jobId);
        if (!job) {
            LOG_WARNING("Job " + jobId + " not found, nothing to dispatch");
            outcome.errorMessage = "job not found";
            return outcome;
        }
        outcome.finalStatus = job->status;

        if (job->status == JobStatus::DEAD) {
            LOG_WARNING("Job " + jobId + " is dead, reset it before crawling again");
            outcome.errorMessage = "job is dead";
            return outcome;
        }
        if (liveJobs_->contains(jobId)) {
            LOG_WARNING("Job " + jobId + " is already live");
            outcome.errorMessage = "job is already live";
            return outcome;
        }

        const std::string url = common::sanitizeUrl(job->url);
        const auto started = std::chrono::system_clock::now();

        JobUpdate crawling;
        crawling.status = JobStatus::CRAWLING;
        crawling.lastError = "";
        registry_->saveJobStatus(jobId, crawling);
        outcome.finalStatus = JobStatus::CRAWLING;

        CrawlAttempt attempt;
        attempt.id = common::generateId();
        attempt.jobId = jobId;
        attempt.startedAt = started;
        attempt.outcome = AttemptOutcome::RUNNING;
        outcome.attemptId = registry_->appendAttemptRecord(attempt);

        JobContext ctx;
        ctx.jobId = jobId;
        ctx.token = liveJobs_->registerJob(jobId, url, outcome.attemptId);
        if (!ctx.token) {
            // Lost a registration race; close the attempt we opened
            AttemptResult refused;
            refused.outcome = AttemptOutcome::ERR;
            refused.errorKind = CrawlErrorKind::TOOL_FAILURE;
            refused.errorMessage = "job is already live";
            refused.finishedAt = std::chrono::system_clock::now();
            registry_->finalizeAttemptRecord(outcome.attemptId, refused);
            outcome.errorMessage = refused.errorMessage;
            return outcome;
        }
        LiveEntryGuard guard(*liveJobs_, jobId);

        ctx.budget = timeoutPolicy_.budgetFor(*job);
        ctx.deadline = std::chrono::steady_clock::now() + ctx.budget;
        LOG_INFO("Dispatching " + jobKindName(job->kind) + " job " + jobId + " for " + url +
                 " with a " + std::to_string(ctx.budget.count()) + "s budget");

        Job target = *job;
        target.url = url;

        struct KindDispatch {
            CrawlDispatcher& self;
            const Job& job;
            JobContext& ctx;

            KindResult operator()(const PageMirror& mirror) const { return self.crawlPageMirror(job, mirror, ctx); }
            KindResult operator()(const VideoChannel& channel) const { return self.crawlVideoChannel(job, channel, ctx); }
            KindResult operator()(const BrowserSnapshot&) const { return self.crawlBrowserSnapshot(job, ctx); }
        };

        KindResult result;
        try {
            result = std::visit(KindDispatch{*this, target, ctx}, target.kind);
        } catch (const storage::RegistryError&) {
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR("Unexpected error while crawling job " + jobId + ": " + std::string(e.what()));
            result = KindResult::failure(CrawlErrorKind::TOOL_FAILURE, "Unexpected error: " + std::string(e.what()));
        }

        commitOutcome(*job, outcome.attemptId, ctx, result, outcome);
    } catch (const storage::RegistryError& e) {
        LOG_ERROR("Engine fault while dispatching job " + jobId + ": " + std::string(e.what()));
        outcome.engineFault = true;
        outcome.persisted = false;
        outcome.errorMessage = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("Engine fault while dispatching job " + jobId + ": " + std::string(e.what()));
        outcome.engineFault = true;
        outcome.persisted = false;
        outcome.errorMessage = e.what();
    }

    return outcome;
}

void CrawlDispatcher::commitOutcome(const Job& job, const std::string& attemptId, JobContext& ctx,
                                    const KindResult& result, CrawlOutcome& outcome) {
    outcome.sizeBytes = result.sizeBytes;
    outcome.itemCount = result.itemCount;

    // The canceller persists its own outcome when it wins the claim
    if (ctx.token->isCancelled() || !liveJobs_->claimOutcome(job.id)) {
        LOG_INFO("Outcome of job " + job.id + " was claimed by cancellation");
        outcome.errorKind = CrawlErrorKind::CANCELLED;
        outcome.errorMessage = kManuallyInterrupted;
        outcome.finalStatus = JobStatus::ERR;
        outcome.persisted = false;
        return;
    }

    const auto now = std::chrono::system_clock::now();
    AttemptResult attempt;
    attempt.itemsCrawled = result.itemCount;
    attempt.bytesTransferred = result.sizeBytes;
    attempt.logTail = joinCapturedLog(ctx);
    attempt.finishedAt = now;

    JobUpdate update;
    if (result.ok) {
        update.status = JobStatus::READY;
        update.lastError = "";
        update.retryCount = RetryPolicy::onSuccess();
        update.sizeBytes = result.sizeBytes;
        update.itemCount = result.itemCount;
        update.lastCrawlAt = now;
        update.nextCrawlAt = now + intervalDays(job.crawlIntervalDays);

        attempt.outcome = AttemptOutcome::SUCCESS;

        outcome.success = true;
        outcome.finalStatus = JobStatus::READY;
        LOG_INFO("Job " + job.id + " ready: " + std::to_string(result.itemCount) + " items, " +
                 std::to_string(result.sizeBytes) + " bytes");
    } else {
        auto decision = retryPolicy_.onFailure(job.retryCount, result.errorMessage, now);
        update.status = decision.nextStatus;
        update.retryCount = decision.retryCount;
        update.lastError = truncate(result.errorMessage, kMaxErrorLength);
        if (decision.nextStatus == JobStatus::RETRY_PENDING) {
            update.nextCrawlAt = decision.nextAttemptAt;
        } else if (decision.nextStatus == JobStatus::ERR) {
            update.nextCrawlAt = now + intervalDays(job.crawlIntervalDays);
        } else {
            update.clearNextCrawlAt = true;
        }

        attempt.outcome = AttemptOutcome::ERR;
        attempt.errorKind = result.errorKind;
        attempt.errorClass = decision.errorClass;
        attempt.errorMessage = truncate(result.errorMessage, kMaxErrorLength);

        outcome.finalStatus = decision.nextStatus;
        outcome.errorKind = result.errorKind;
        outcome.errorClass = decision.errorClass;
        outcome.errorMessage = result.errorMessage;
        LOG_WARNING("Job " + job.id + " failed (" + crawlErrorKindToString(result.errorKind) + ", " +
                    errorClassToString(decision.errorClass) + "), now " + jobStatusToString(decision.nextStatus) +
                    ": " + truncate(result.errorMessage, 200));
    }

    registry_->saveJobStatus(job.id, update);
    registry_->finalizeAttemptRecord(attemptId, attempt);
    outcome.persisted = true;
}

// ---------------------------------------------------------------------------
// Kind handlers

CrawlDispatcher::KindResult CrawlDispatcher::crawlPageMirror(const Job& job, const PageMirror& mirror, JobContext& ctx) {
    std::error_code ec;
    fs::create_directories(config_.mirrorsPath, ec);
    if (ec) {
        return KindResult::failure(CrawlErrorKind::TOOL_FAILURE, "Cannot create " + config_.mirrorsPath + ": " + ec.message());
    }

    // The root first so the homepage is always captured
    std::vector<std::string> targets = {common::rootUrl(job.url)};
    if (common::isDeepUrl(job.url) && job.url != targets.front()) {
        targets.push_back(job.url);
    }

    for (const auto& target : targets) {
        auto remaining = remainingBudget(ctx);
        if (!remaining) {
            return budgetExhausted(ctx, "wget");
        }
        LOG_INFO("Mirroring " + target + " for job " + ctx.jobId);
        auto run = runTool(ctx, tools_.wgetMirror(target, mirror), *remaining);
        if (auto failure = classifyRun(run, "wget", {0, 8})) {
            return *failure;
        }
    }

    auto stats = collectMirrorStats(tools_.mirrorDirectory(job.url));
    if (stats.empty()) {
        return KindResult::failure(CrawlErrorKind::EMPTY_RESULT, kNoContent);
    }
    return KindResult::success(stats.totalBytes, stats.htmlFiles);
}

CrawlDispatcher::KindResult CrawlDispatcher::crawlVideoChannel(const Job& job, const VideoChannel& channel, JobContext& ctx) {
    VideoChannel resolved = channel;

    if (resolved.channelId.empty()) {
        auto remaining = remainingBudget(ctx);
        if (!remaining) {
            return budgetExhausted(ctx, "yt-dlp");
        }
        auto probeBudget = std::min<std::chrono::milliseconds>(*remaining, config_.channelProbeBudget);
        LOG_INFO("Resolving channel id of " + job.url);
        // --dump-json prints the whole info document on one line
        auto probe = runTool(ctx, tools_.ytDlpChannelProbe(job.url), probeBudget, 0);
        if (auto failure = classifyRun(probe, "yt-dlp channel probe", {0})) {
            return *failure;
        }
        auto parsed = VideoCatalog::parseChannelProbe(probe.logLines);
        if (!parsed) {
            return KindResult::failure(CrawlErrorKind::TOOL_FAILURE,
                                       "Could not resolve channel id for " + job.url + ": " + probe.tail(kFailureTailLines));
        }
        resolved = *parsed;

        JobUpdate update;
        update.channel = resolved;
        registry_->saveJobStatus(job.id, update);
        LOG_INFO("Job " + job.id + " resolved to channel " + resolved.channelId + " (" + resolved.channelTitle + ")");
    }

    const std::string outputDir = tools_.channelDirectory(resolved.channelId);
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        return KindResult::failure(CrawlErrorKind::TOOL_FAILURE, "Cannot create " + outputDir + ": " + ec.message());
    }

    auto remaining = remainingBudget(ctx);
    if (!remaining) {
        return budgetExhausted(ctx, "yt-dlp");
    }
    auto run = runTool(ctx, tools_.ytDlpChannel(job.url, outputDir), *remaining);

    // Whatever finished downloading is catalogued, even after a failed run
    if (run.status != RunStatus::TIMED_OUT && run.status != RunStatus::CANCELLED) {
        size_t inserted = 0;
        for (const auto& item : VideoCatalog::scan(outputDir, job.id)) {
            if (registry_->upsertCatalogItem(item)) {
                inserted++;
            }
        }
        LOG_INFO("Job " + job.id + ": " + std::to_string(inserted) + " new catalog items");
    }

    if (auto failure = classifyRun(run, "yt-dlp", {0})) {
        return *failure;
    }

    auto stats = collectMirrorStats(outputDir);
    auto items = registry_->countCatalogItems(job.id);
    if (stats.totalBytes == 0 && items == 0) {
        return KindResult::failure(CrawlErrorKind::EMPTY_RESULT, kNoContent);
    }
    return KindResult::success(stats.totalBytes, items);
}

CrawlDispatcher::KindResult CrawlDispatcher::crawlBrowserSnapshot(const Job& job, JobContext& ctx) {
    const std::string outputDir = tools_.snapshotDirectory(job.url);
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        return KindResult::failure(CrawlErrorKind::TOOL_FAILURE, "Cannot create " + outputDir + ": " + ec.message());
    }

    auto remaining = remainingBudget(ctx);
    if (!remaining) {
        return budgetExhausted(ctx, "single-file");
    }
    auto run = runTool(ctx, tools_.singleFileSnapshot(job.url, outputDir), *remaining);
    if (auto failure = classifyRun(run, "single-file", {0})) {
        return *failure;
    }

    auto stats = collectMirrorStats(outputDir);
    if (stats.empty()) {
        return KindResult::failure(CrawlErrorKind::EMPTY_RESULT, kNoContent);
    }
    return KindResult::success(stats.totalBytes, stats.htmlFiles);
}

// ---------------------------------------------------------------------------
// Helpers

RunResult CrawlDispatcher::runTool(JobContext& ctx, const std::vector<std::string>& argv,
                                   std::chrono::milliseconds budget, size_t maxLineBytes) {
    RunRequest request;
    request.argv = argv;
    request.totalTimeout = budget;
    request.stallTimeout = config_.stallTimeout;
    request.cancellation = ctx.token;
    request.maxLineBytes = maxLineBytes;

    const std::string jobId = ctx.jobId;
    auto result = runner_.run(
        request,
        [this, &jobId](const std::string& line) { liveJobs_->appendLog(jobId, truncate(line, kDefaultMaxLineBytes)); },
        [this, &jobId](const std::shared_ptr<ChildProcess>& child) {
            if (!liveJobs_->attachProcess(jobId, child)) {
                LOG_DEBUG("Job " + jobId + " was cancelled before its process could be attached");
            }
        });
    liveJobs_->detachProcess(jobId);

    for (const auto& line : result.logLines) {
        ctx.capturedLog.push_back(truncate(line, kDefaultMaxLineBytes));
        if (ctx.capturedLog.size() > config_.capturedLogLines) {
            ctx.capturedLog.pop_front();
        }
    }
    return result;
}

std::optional<CrawlDispatcher::KindResult> CrawlDispatcher::classifyRun(const RunResult& run, const std::string& tool,
                                                                        std::initializer_list<int> successCodes) const {
    switch (run.status) {
        case RunStatus::EXITED:
            if (run.exitedWith(successCodes)) {
                return std::nullopt;
            }
            return KindResult::failure(CrawlErrorKind::TOOL_FAILURE,
                                       tool + " exited with code " + std::to_string(run.exitCode) + ": " + run.tail(kFailureTailLines));
        case RunStatus::TIMED_OUT:
            return KindResult::failure(CrawlErrorKind::TIMEOUT,
                                       tool + " timed out after " +
                                       std::to_string(std::chrono::duration_cast<std::chrono::seconds>(run.elapsed).count()) + " seconds");
        case RunStatus::STALLED:
            // Worded so the classifier files it as unknown, not as a timeout
            return KindResult::failure(CrawlErrorKind::STALLED,
                                       "Stalled: no output received for " + std::to_string(config_.stallTimeout.count()) + " seconds");
        case RunStatus::CANCELLED:
            return KindResult::failure(CrawlErrorKind::CANCELLED, kManuallyInterrupted);
        case RunStatus::SPAWN_FAILED:
            return KindResult::failure(CrawlErrorKind::TOOL_FAILURE, tool + " could not be started: " + run.error);
    }
    return KindResult::failure(CrawlErrorKind::TOOL_FAILURE, tool + " ended in an unknown state");
}

std::optional<std::chrono::milliseconds> CrawlDispatcher::remainingBudget(const JobContext& ctx) const {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return std::nullopt;
    }
    return remaining;
}

CrawlDispatcher::KindResult CrawlDispatcher::budgetExhausted(const JobContext& ctx, const std::string& tool) const {
    return KindResult::failure(CrawlErrorKind::TIMEOUT,
                               tool + " timed out: job budget of " + std::to_string(ctx.budget.count()) + " seconds used up");
}

std::string CrawlDispatcher::joinCapturedLog(const JobContext& ctx) const {
    return joinLines(std::vector<std::string>(ctx.capturedLog.begin(), ctx.capturedLog.end()));
}

} // namespace archive_engine::crawler
