#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <vector>

namespace archive_engine::common {

struct EngineConfig {
    // Filesystem layout
    std::string mirrorsPath = "/mirrors";

    // External tool binaries
    std::string wgetBinary = "wget";
    std::string ytDlpBinary = "yt-dlp";
    std::string singleFileBinary = "single-file";
    std::string userAgent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

    // Wall-clock budgets
    std::chrono::seconds shortBudget{3600};
    std::chrono::seconds longBudget{4 * 3600};
    int videoBudgetMultiplier = 3;
    std::chrono::seconds snapshotBudget{300};
    std::chrono::seconds channelProbeBudget{60};
    std::uint64_t largeSiteThresholdBytes = 100ULL * 1024 * 1024;
    std::vector<std::string> knownLargeDomains = {
        "wikipedia.org", "wikimedia.org", "wiktionary.org", "archive.org", "gutenberg.org"
    };

    // Process supervision
    std::chrono::seconds stallTimeout{300};
    std::chrono::milliseconds terminateGrace{5000};
    std::chrono::milliseconds pollInterval{250};
    size_t liveLogLines = 500;
    size_t capturedLogLines = 1000;
    size_t progressLines = 20;

    // Retry ladder
    int maxAttempts = 3;
    std::vector<std::chrono::minutes> retryDelays = {
        std::chrono::minutes(5), std::chrono::minutes(15), std::chrono::minutes(45)
    };

    // Trigger service
    std::chrono::seconds scheduleCheckInterval{3600};
    std::chrono::seconds retryCheckInterval{300};
    std::chrono::seconds stuckCheckInterval{1800};
    std::chrono::hours stuckCrawlThreshold{6};
    int retryBatchLimit = 10;
    int scheduleBatchLimit = 100;

    // Job registry
    std::string mongoUri = "mongodb://localhost:27017";
    std::string mongoDatabase = "archive-engine";

    // Override defaults from environment variables; unknown or malformed
    // values keep the default and are logged.
    static EngineConfig fromEnvironment();
};

} // namespace archive_engine::common
