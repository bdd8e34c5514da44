#include "../../include/archive_engine/common/EngineConfig.h"
#include "../../include/Logger.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace archive_engine::common {

namespace {

bool readString(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return false;
    }
    target = value;
    return true;
}

template <typename Duration>
void readDuration(const char* name, Duration& target) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return;
    }
    try {
        long long parsed = std::stoll(value);
        if (parsed <= 0) {
            LOG_WARNING(std::string("Ignoring non-positive value for ") + name + ": " + value);
            return;
        }
        target = Duration(parsed);
    } catch (const std::exception&) {
        LOG_WARNING(std::string("Ignoring malformed value for ") + name + ": " + value);
    }
}

void readInt(const char* name, int& target) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return;
    }
    try {
        int parsed = std::stoi(value);
        if (parsed <= 0) {
            LOG_WARNING(std::string("Ignoring non-positive value for ") + name + ": " + value);
            return;
        }
        target = parsed;
    } catch (const std::exception&) {
        LOG_WARNING(std::string("Ignoring malformed value for ") + name + ": " + value);
    }
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start == std::string::npos) continue;
        items.push_back(item.substr(start, end - start + 1));
    }
    return items;
}

} // namespace

EngineConfig EngineConfig::fromEnvironment() {
    EngineConfig config;

    readString("MIRRORS_PATH", config.mirrorsPath);
    readString("WGET_BIN", config.wgetBinary);
    readString("YTDLP_BIN", config.ytDlpBinary);
    readString("SINGLEFILE_BIN", config.singleFileBinary);
    readString("CRAWL_USER_AGENT", config.userAgent);
    readString("MONGODB_URI", config.mongoUri);
    readString("MONGODB_DATABASE", config.mongoDatabase);

    // Durations are given in seconds
    readDuration("CRAWL_SHORT_BUDGET", config.shortBudget);
    readDuration("CRAWL_LONG_BUDGET", config.longBudget);
    readDuration("CRAWL_SNAPSHOT_BUDGET", config.snapshotBudget);
    readDuration("CRAWL_STALL_TIMEOUT", config.stallTimeout);
    readDuration("SCHEDULE_CHECK_INTERVAL", config.scheduleCheckInterval);
    readDuration("RETRY_CHECK_INTERVAL", config.retryCheckInterval);
    readDuration("STUCK_CHECK_INTERVAL", config.stuckCheckInterval);

    readInt("CRAWL_MAX_ATTEMPTS", config.maxAttempts);
    readInt("RETRY_BATCH_LIMIT", config.retryBatchLimit);

    std::string domains;
    if (readString("KNOWN_LARGE_DOMAINS", domains)) {
        config.knownLargeDomains = splitList(domains);
    }

    LOG_INFO("Engine configuration loaded: mirrors=" + config.mirrorsPath +
             ", stallTimeout=" + std::to_string(config.stallTimeout.count()) + "s" +
             ", shortBudget=" + std::to_string(config.shortBudget.count()) + "s" +
             ", longBudget=" + std::to_string(config.longBudget.count()) + "s");
    return config;
}

} // namespace archive_engine::common
