#include "CrawlTriggerService.h"
#include "../../include/Logger.h"

namespace archive_engine::services {

using crawler::Job;
using crawler::JobStatus;
using crawler::JobUpdate;

namespace {

constexpr auto kLoopGranularity = std::chrono::seconds(1);

} // namespace

CrawlTriggerService::CrawlTriggerService(const common::EngineConfig& config,
                                         std::shared_ptr<storage::JobRegistry> registry,
                                         std::shared_ptr<crawler::CrawlDispatcher> dispatcher,
                                         std::shared_ptr<crawler::LiveJobRegistry> liveJobs)
    : config_(config)
    , registry_(std::move(registry))
    , dispatcher_(std::move(dispatcher))
    , liveJobs_(std::move(liveJobs)) {
    LOG_INFO("CrawlTriggerService created: schedule every " + std::to_string(config_.scheduleCheckInterval.count()) +
             "s, retries every " + std::to_string(config_.retryCheckInterval.count()) +
             "s, stuck check every " + std::to_string(config_.stuckCheckInterval.count()) + "s");
}

CrawlTriggerService::~CrawlTriggerService() {
    stop();
}

bool CrawlTriggerService::start() {
    if (running_) {
        LOG_WARNING("CrawlTriggerService already running");
        return true;
    }

    LOG_INFO("Starting CrawlTriggerService...");
    shouldStop_ = false;
    startedAt_ = std::chrono::system_clock::now();
    running_ = true;
    monitoringThread_ = std::thread(&CrawlTriggerService::monitoringLoop, this);

    LOG_INFO("CrawlTriggerService started successfully");
    return true;
}

void CrawlTriggerService::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping CrawlTriggerService...");
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        shouldStop_ = true;
    }
    wakeCv_.notify_all();

    if (monitoringThread_.joinable()) {
        monitoringThread_.join();
    }
    LOG_INFO("CrawlTriggerService stopped");
}

void CrawlTriggerService::monitoringLoop() {
    LOG_INFO("Trigger monitoring loop started");

    // Everything runs once right after startup
    auto lastSchedule = std::chrono::steady_clock::time_point{};
    auto lastRetry = std::chrono::steady_clock::time_point{};
    auto lastStuck = std::chrono::steady_clock::time_point{};
    bool first = true;

    while (!shouldStop_) {
        auto tick = std::chrono::steady_clock::now();
        auto now = std::chrono::system_clock::now();

        try {
            if (first || tick - lastStuck >= config_.stuckCheckInterval) {
                reconcileStuckCrawls(now);
                lastStuck = tick;
            }
            if (first || tick - lastRetry >= config_.retryCheckInterval) {
                dispatchDueRetries(now);
                lastRetry = tick;
            }
            if (first || tick - lastSchedule >= config_.scheduleCheckInterval) {
                dispatchDueCrawls(now);
                lastSchedule = tick;
            }
        } catch (const storage::RegistryError& e) {
            LOG_ERROR("Trigger pass failed, will try again next interval: " + std::string(e.what()));
        }
        first = false;

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeCv_.wait_for(lock, kLoopGranularity, [this] { return shouldStop_.load(); });
    }

    LOG_INFO("Trigger monitoring loop stopped");
}

bool CrawlTriggerService::isBusy(const std::string& jobId) {
    return liveJobs_->contains(jobId) || dispatcher_->isActive(jobId);
}

size_t CrawlTriggerService::dispatchDueCrawls(std::chrono::system_clock::time_point now) {
    auto due = registry_->findJobsDueForCrawl(now, config_.scheduleBatchLimit);
    size_t dispatched = 0;
    for (const auto& job : due) {
        if (isBusy(job.id)) {
            continue;
        }
        LOG_INFO("Scheduled crawl due for " + job.url + " (" + crawler::jobStatusToString(job.status) + ")");
        dispatcher_->enqueueCrawl(job.id);
        dispatched++;
    }
    if (dispatched > 0) {
        LOG_INFO("Dispatched " + std::to_string(dispatched) + " scheduled crawls");
    }
    crawlsDispatched_ += dispatched;
    return dispatched;
}

size_t CrawlTriggerService::dispatchDueRetries(std::chrono::system_clock::time_point now) {
    auto due = registry_->findJobsDueForRetry(now, config_.retryBatchLimit);
    size_t dispatched = 0;
    for (const auto& job : due) {
        if (isBusy(job.id)) {
            continue;
        }
        LOG_INFO("Processing retry for " + job.url + " (attempt " + std::to_string(job.retryCount + 1) + ")");
        dispatcher_->enqueueRetry(job.id);
        dispatched++;
    }
    retriesDispatched_ += dispatched;
    return dispatched;
}

size_t CrawlTriggerService::reconcileStuckCrawls(std::chrono::system_clock::time_point now) {
    auto crawling = registry_->findJobsByStatus(JobStatus::CRAWLING, 0);
    auto threshold = now - config_.stuckCrawlThreshold;
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(config_.stuckCrawlThreshold).count();

    size_t reconciled = 0;
    for (const auto& job : crawling) {
        if (isBusy(job.id) || job.updatedAt > threshold) {
            continue;
        }
        LOG_WARNING("Resetting stuck crawl for " + job.url);

        JobUpdate update;
        update.status = JobStatus::ERR;
        update.lastError = "Crawl stuck for more than " + std::to_string(hours) + " hours, reset automatically";
        update.retryCount = job.retryCount + 1;
        registry_->saveJobStatus(job.id, update);
        reconciled++;
    }
    if (reconciled > 0) {
        LOG_INFO("Reset " + std::to_string(reconciled) + " stuck crawls");
    }
    stuckReconciled_ += reconciled;
    return reconciled;
}

common::Result<bool> CrawlTriggerService::resetJob(const std::string& jobId) {
    try {
        auto job = registry_->loadJob(jobId);
        if (!job) {
            return common::Result<bool>::Failure("Job not found: " + jobId);
        }
        if (job->status != JobStatus::ERR && job->status != JobStatus::DEAD && job->status != JobStatus::RETRY_PENDING) {
            return common::Result<bool>::Failure("Job " + jobId + " is " + crawler::jobStatusToString(job->status) +
                                                 ", only error, dead or retry_pending jobs can be reset");
        }

        JobUpdate update;
        update.status = JobStatus::PENDING;
        update.lastError = "";
        update.retryCount = 0;
        update.clearNextCrawlAt = true;
        registry_->saveJobStatus(jobId, update);
        LOG_INFO("Job " + jobId + " reset to pending");
        return common::Result<bool>::Success(true, "Job " + jobId + " reset to pending");
    } catch (const storage::RegistryError& e) {
        LOG_ERROR("Failed to reset job " + jobId + ": " + std::string(e.what()));
        return common::Result<bool>::Failure("Failed to reset job " + jobId + ": " + std::string(e.what()));
    }
}

CrawlTriggerService::ServiceStats CrawlTriggerService::getStats() const {
    ServiceStats stats;
    stats.running = running_;
    stats.crawlsDispatched = crawlsDispatched_;
    stats.retriesDispatched = retriesDispatched_;
    stats.stuckReconciled = stuckReconciled_;
    stats.startedAt = startedAt_;
    stats.uptime = running_
        ? std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - startedAt_)
        : std::chrono::seconds(0);
    return stats;
}

} // namespace archive_engine::services
