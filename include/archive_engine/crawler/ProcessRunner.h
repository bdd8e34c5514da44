#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>
#include "../common/EngineConfig.h"

namespace archive_engine::crawler {

// Set by the canceller, polled by the supervising loop.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Handle to a spawned tool. The child leads its own process group so the
// whole tree (wget workers, ffmpeg under yt-dlp, a headless browser) can be
// signalled at once. Safe to share between the supervisor and a canceller.
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid);

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Non-blocking reap. Returns true once the group leader has exited.
    bool poll();

    bool hasExited() const;

    // Exit status of the leader; 128 + signal number when it was killed,
    // -1 while still running.
    int exitCode() const;

    // True while any member of the process group is still alive. Once the
    // leader is reaped and the group is seen empty the handle goes inert:
    // the pid may be reused, so it is never signalled again.
    bool groupAlive();

    /**
     * @brief SIGTERM to the process group, wait up to grace, then SIGKILL.
     * Returns once the group leader has been reaped.
     */
    void terminate(std::chrono::milliseconds grace);

    bool terminationRequested() const { return terminationRequested_.load(); }

    // Leader reaped and group seen empty; signals are no longer sent
    bool released() const;

private:
    bool reapLocked(int options);
    bool signalGroupLocked(int signal);

    const pid_t pid_;
    mutable std::mutex mutex_;
    bool exited_ = false;
    bool groupGone_ = false;
    int exitCode_ = -1;
    std::atomic<bool> terminationRequested_{false};
};

enum class RunStatus {
    EXITED,
    TIMED_OUT,
    STALLED,
    CANCELLED,
    SPAWN_FAILED
};

std::string runStatusToString(RunStatus status);

// Longer lines are split so one runaway line cannot grow without bound
constexpr size_t kDefaultMaxLineBytes = 64 * 1024;

struct RunRequest {
    std::vector<std::string> argv;
    std::string workingDirectory;
    std::chrono::milliseconds totalTimeout{std::chrono::hours(1)};
    std::chrono::milliseconds stallTimeout{std::chrono::seconds(300)};
    std::shared_ptr<const CancellationToken> cancellation;
    // 0 keeps every line whole, for tools that print one JSON document per line
    size_t maxLineBytes = kDefaultMaxLineBytes;
};

struct RunResult {
    RunStatus status = RunStatus::SPAWN_FAILED;
    int exitCode = -1;
    std::vector<std::string> logLines;   // last N lines of merged stdout/stderr
    std::string error;                   // set for SPAWN_FAILED
    std::chrono::milliseconds elapsed{0};
    std::uint64_t outputBytes = 0;

    bool exitedWith(std::initializer_list<int> codes) const;

    // Last n captured lines joined by newlines
    std::string tail(size_t n) const;
};

using LineSink = std::function<void(const std::string&)>;
using SpawnObserver = std::function<void(const std::shared_ptr<ChildProcess>&)>;

// Runs one external tool to completion under supervision. The reader thread
// owns the pipe; the calling thread keeps both clocks and decides when to
// kill. Timeouts are reported in the result, never thrown.
class ProcessRunner {
public:
    explicit ProcessRunner(const common::EngineConfig& config);
    ProcessRunner(std::chrono::milliseconds pollInterval,
                  std::chrono::milliseconds terminateGrace,
                  size_t capturedLogLines);

    RunResult run(const RunRequest& request,
                  const LineSink& onLine = nullptr,
                  const SpawnObserver& onSpawn = nullptr) const;

    std::chrono::milliseconds pollInterval() const { return pollInterval_; }
    std::chrono::milliseconds terminateGrace() const { return terminateGrace_; }

private:
    std::shared_ptr<ChildProcess> spawn(const RunRequest& request, int& readFd, std::string& error) const;

    std::chrono::milliseconds pollInterval_;
    std::chrono::milliseconds terminateGrace_;
    size_t capturedLogLines_;
};

} // namespace archive_engine::crawler
