#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include "../../include/archive_engine/common/EngineConfig.h"
#include "../../include/archive_engine/common/Result.h"
#include "../../include/archive_engine/crawler/CrawlDispatcher.h"
#include "../../include/archive_engine/crawler/LiveJobRegistry.h"
#include "../../include/archive_engine/storage/JobRegistry.h"

namespace archive_engine::services {

/**
 * Background service that decides when jobs run. On its own intervals it
 * hands due crawls and due retries to the dispatcher and returns orphaned
 * `crawling` rows (left behind by a restart) to `error`.
 */
class CrawlTriggerService {
public:
    CrawlTriggerService(const common::EngineConfig& config,
                        std::shared_ptr<storage::JobRegistry> registry,
                        std::shared_ptr<crawler::CrawlDispatcher> dispatcher,
                        std::shared_ptr<crawler::LiveJobRegistry> liveJobs);
    ~CrawlTriggerService();

    CrawlTriggerService(const CrawlTriggerService&) = delete;
    CrawlTriggerService& operator=(const CrawlTriggerService&) = delete;

    // Service lifecycle
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Single passes, each returning how many jobs it touched
    size_t dispatchDueCrawls(std::chrono::system_clock::time_point now);
    size_t dispatchDueRetries(std::chrono::system_clock::time_point now);
    size_t reconcileStuckCrawls(std::chrono::system_clock::time_point now);

    // error, dead or retry_pending -> pending, with error and retry count cleared
    common::Result<bool> resetJob(const std::string& jobId);

    struct ServiceStats {
        bool running;
        size_t crawlsDispatched;
        size_t retriesDispatched;
        size_t stuckReconciled;
        std::chrono::system_clock::time_point startedAt;
        std::chrono::seconds uptime;
    };
    ServiceStats getStats() const;

private:
    void monitoringLoop();
    bool isBusy(const std::string& jobId);

    common::EngineConfig config_;
    std::shared_ptr<storage::JobRegistry> registry_;
    std::shared_ptr<crawler::CrawlDispatcher> dispatcher_;
    std::shared_ptr<crawler::LiveJobRegistry> liveJobs_;

    std::atomic<bool> running_{false};
    std::chrono::system_clock::time_point startedAt_;

    std::atomic<size_t> crawlsDispatched_{0};
    std::atomic<size_t> retriesDispatched_{0};
    std::atomic<size_t> stuckReconciled_{0};

    // Monitoring thread
    std::thread monitoringThread_;
    std::atomic<bool> shouldStop_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
};

} // namespace archive_engine::services
