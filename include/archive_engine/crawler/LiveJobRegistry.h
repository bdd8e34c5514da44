#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ProcessRunner.h"
#include "../common/EngineConfig.h"
#include "../common/Result.h"

namespace archive_engine::crawler {

struct LiveJobSnapshot {
    std::string jobId;
    std::string target;
    std::chrono::system_clock::time_point startedAt;
    std::int64_t elapsedSeconds = 0;
    std::uint64_t logLineCount = 0;

    nlohmann::json toJson() const;
};

struct ProgressSnapshot {
    std::string jobId;
    std::int64_t elapsedSeconds = 0;
    std::string currentFileGuess;
    std::uint64_t itemsSoFarGuess = 0;
    std::uint64_t outputBytes = 0;
    std::vector<std::string> recentLines;

    nlohmann::json toJson() const;
};

// What a successful terminate() hands back to the canceller
struct TerminatedJob {
    std::string attemptId;
    std::vector<std::string> logTail;
};

/**
 * In-memory table of crawls running in this process. One mutex guards
 * everything; process signalling always happens outside it. Owned by the
 * composition root and shared with the dispatcher.
 */
class LiveJobRegistry {
public:
    explicit LiveJobRegistry(const common::EngineConfig& config);
    LiveJobRegistry(size_t logCapacity,
                    std::chrono::milliseconds terminateGrace,
                    size_t progressLines);

    LiveJobRegistry(const LiveJobRegistry&) = delete;
    LiveJobRegistry& operator=(const LiveJobRegistry&) = delete;

    // Returns nullptr when the job already has a live entry
    std::shared_ptr<CancellationToken> registerJob(const std::string& jobId,
                                                   const std::string& target,
                                                   const std::string& attemptId);

    // False when the entry is gone or already cancelled
    bool attachProcess(const std::string& jobId, std::shared_ptr<ChildProcess> process);
    void detachProcess(const std::string& jobId);

    void appendLog(const std::string& jobId, const std::string& line);

    std::vector<LiveJobSnapshot> snapshot() const;

    std::optional<std::vector<std::string>> tailLog(const std::string& jobId, size_t lines) const;

    std::optional<ProgressSnapshot> progress(const std::string& jobId) const;

    bool contains(const std::string& jobId) const;
    size_t size() const;

    /**
     * @brief Reserve the right to persist this job's outcome.
     * Exactly one of the dispatcher (on completion) and terminate() (on
     * cancel) wins; the loser must not write the attempt record.
     * @return true for the winner
     */
    bool claimOutcome(const std::string& jobId);

    void unregisterJob(const std::string& jobId);

    // Cancel and remove the entry, then tear down its process tree
    common::Result<TerminatedJob> terminate(const std::string& jobId);

    // Parses "Saving to: 'x'" and "[download] Destination: x" lines
    static std::optional<std::string> extractOutputFile(const std::string& line);

private:
    struct Entry {
        std::string jobId;
        std::string target;
        std::string attemptId;
        std::chrono::system_clock::time_point startedAt;
        std::chrono::steady_clock::time_point startedSteady;
        std::shared_ptr<ChildProcess> process;
        std::shared_ptr<CancellationToken> token;
        std::deque<std::string> logBuffer;
        std::uint64_t lineCount = 0;
        std::uint64_t outputBytes = 0;
        bool outcomeClaimed = false;
    };

    static std::int64_t elapsedSeconds(const Entry& entry);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    size_t logCapacity_;
    std::chrono::milliseconds terminateGrace_;
    size_t progressLines_;
};

} // namespace archive_engine::crawler
