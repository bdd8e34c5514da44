#include "../../include/archive_engine/crawler/ProcessRunner.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace archive_engine::crawler {

namespace {

constexpr size_t kReadChunkBytes = 4096;
constexpr int kReaderPollMillis = 100;
constexpr auto kReapPollInterval = std::chrono::milliseconds(50);
constexpr auto kDrainTimeout = std::chrono::seconds(2);

// Hand-off between the reader thread and the supervising thread
struct LineQueue {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> lines;
    std::uint64_t bytes = 0;
    bool eof = false;
};

// Owns the read end of the output pipe. Splits on '\n' and '\r' so that
// progress bars redrawn in place still arrive as separate lines.
class OutputReader {
public:
    OutputReader(int fd, size_t maxLineBytes, LineQueue& queue)
        : fd_(fd), maxLineBytes_(maxLineBytes), queue_(queue) {
        thread_ = std::thread(&OutputReader::readLoop, this);
    }

    ~OutputReader() { stop(); }

    OutputReader(const OutputReader&) = delete;
    OutputReader& operator=(const OutputReader&) = delete;

    void stop() {
        stop_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    void readLoop() {
        char buffer[kReadChunkBytes];
        while (!stop_.load()) {
            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            int ready = ::poll(&pfd, 1, kReaderPollMillis);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_WARNING("Output reader poll failed: " + std::string(std::strerror(errno)));
                break;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t n = ::read(fd_, buffer, sizeof(buffer));
            if (n > 0) {
                consume(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            break;
        }

        std::lock_guard<std::mutex> lock(queue_.mutex);
        if (!partial_.empty()) {
            queue_.lines.push_back(std::move(partial_));
            partial_.clear();
        }
        queue_.eof = true;
        queue_.cv.notify_all();
    }

    void consume(const char* data, size_t size) {
        std::vector<std::string> complete;
        for (size_t i = 0; i < size; ++i) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                if (!partial_.empty()) {
                    complete.push_back(std::move(partial_));
                    partial_.clear();
                }
                continue;
            }
            partial_.push_back(c);
            if (maxLineBytes_ > 0 && partial_.size() >= maxLineBytes_) {
                complete.push_back(std::move(partial_));
                partial_.clear();
            }
        }

        std::lock_guard<std::mutex> lock(queue_.mutex);
        queue_.bytes += size;
        for (auto& line : complete) {
            queue_.lines.push_back(std::move(line));
        }
        if (!complete.empty()) {
            queue_.cv.notify_one();
        }
    }

    int fd_;
    const size_t maxLineBytes_;
    LineQueue& queue_;
    std::atomic<bool> stop_{false};
    std::string partial_;
    std::thread thread_;
};

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string command;
    for (const auto& arg : argv) {
        if (!command.empty()) {
            command += ' ';
        }
        command += arg;
    }
    return command;
}

} // namespace

std::string runStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::EXITED: return "exited";
        case RunStatus::TIMED_OUT: return "timed_out";
        case RunStatus::STALLED: return "stalled";
        case RunStatus::CANCELLED: return "cancelled";
        case RunStatus::SPAWN_FAILED: return "spawn_failed";
    }
    return "unknown";
}

bool RunResult::exitedWith(std::initializer_list<int> codes) const {
    if (status != RunStatus::EXITED) {
        return false;
    }
    return std::find(codes.begin(), codes.end(), exitCode) != codes.end();
}

std::string RunResult::tail(size_t n) const {
    size_t start = logLines.size() > n ? logLines.size() - n : 0;
    std::string joined;
    for (size_t i = start; i < logLines.size(); ++i) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += logLines[i];
    }
    return joined;
}

// ChildProcess

ChildProcess::ChildProcess(pid_t pid) : pid_(pid) {}

bool ChildProcess::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) {
        return true;
    }
    return reapLocked(WNOHANG);
}

bool ChildProcess::hasExited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
}

int ChildProcess::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitCode_;
}

bool ChildProcess::released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groupGone_;
}

bool ChildProcess::groupAlive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return signalGroupLocked(0);
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    terminationRequested_.store(true);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!signalGroupLocked(SIGTERM) && exited_) {
            return;
        }
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (poll() && !groupAlive()) {
            LOG_DEBUG("Process group " + std::to_string(pid_) + " exited after SIGTERM");
            return;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    LOG_WARNING("Process group " + std::to_string(pid_) + " still alive after " +
                std::to_string(grace.count()) + "ms grace, sending SIGKILL");
    std::lock_guard<std::mutex> lock(mutex_);
    signalGroupLocked(SIGKILL);
    if (!exited_) {
        reapLocked(0);
    }
}

bool ChildProcess::reapLocked(int options) {
    int status = 0;
    pid_t reaped;
    do {
        reaped = ::waitpid(pid_, &status, options);
    } while (reaped < 0 && errno == EINTR);

    if (reaped == pid_) {
        exited_ = true;
        if (WIFEXITED(status)) {
            exitCode_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitCode_ = 128 + WTERMSIG(status);
        }
        return true;
    }
    if (reaped < 0 && errno == ECHILD) {
        LOG_WARNING("Child " + std::to_string(pid_) + " already reaped elsewhere");
        exited_ = true;
        return true;
    }
    return false;
}

bool ChildProcess::signalGroupLocked(int signal) {
    if (groupGone_) {
        return false;
    }
    if (::killpg(pid_, signal) == 0) {
        return true;
    }
    if (errno == ESRCH) {
        // Only final once the leader is reaped; before that the group may
        // not have been created yet.
        groupGone_ = exited_;
    } else {
        LOG_WARNING("Failed to signal process group " + std::to_string(pid_) + ": " + std::string(std::strerror(errno)));
    }
    return false;
}

// ProcessRunner

ProcessRunner::ProcessRunner(const common::EngineConfig& config)
    : ProcessRunner(config.pollInterval, config.terminateGrace, config.capturedLogLines) {}

ProcessRunner::ProcessRunner(std::chrono::milliseconds pollInterval,
                             std::chrono::milliseconds terminateGrace,
                             size_t capturedLogLines)
    : pollInterval_(pollInterval)
    , terminateGrace_(terminateGrace)
    , capturedLogLines_(std::max<size_t>(capturedLogLines, 1)) {}

std::shared_ptr<ChildProcess> ProcessRunner::spawn(const RunRequest& request, int& readFd, std::string& error) const {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        error = "pipe failed: " + std::string(std::strerror(errno));
        return nullptr;
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> args;
    args.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    const char* workdir = request.workingDirectory.empty() ? nullptr : request.workingDirectory.c_str();
    const std::string execFailure = "failed to execute " + request.argv.front() + "\n";
    const std::string chdirFailure = "failed to enter working directory " + request.workingDirectory + "\n";

    pid_t pid = ::fork();
    if (pid < 0) {
        error = "fork failed: " + std::string(std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return nullptr;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        if (workdir != nullptr && ::chdir(workdir) != 0) {
            ssize_t ignored = ::write(STDERR_FILENO, chdirFailure.data(), chdirFailure.size());
            (void)ignored;
            ::_exit(127);
        }
        ::execvp(args[0], args.data());
        ssize_t ignored = ::write(STDERR_FILENO, execFailure.data(), execFailure.size());
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so the group exists before anyone signals it;
    // EACCES after the child has exec'd is expected.
    ::setpgid(pid, pid);
    ::close(fds[1]);
    readFd = fds[0];
    return std::make_shared<ChildProcess>(pid);
}

RunResult ProcessRunner::run(const RunRequest& request, const LineSink& onLine, const SpawnObserver& onSpawn) const {
    RunResult result;
    const auto started = std::chrono::steady_clock::now();

    if (request.argv.empty()) {
        result.status = RunStatus::SPAWN_FAILED;
        result.error = "empty command line";
        return result;
    }
    if (request.cancellation && request.cancellation->isCancelled()) {
        LOG_INFO("Cancelled before spawn: " + request.argv.front());
        result.status = RunStatus::CANCELLED;
        return result;
    }

    int readFd = -1;
    std::string spawnError;
    auto child = spawn(request, readFd, spawnError);
    if (!child) {
        LOG_ERROR("Failed to spawn " + request.argv.front() + ": " + spawnError);
        result.status = RunStatus::SPAWN_FAILED;
        result.error = spawnError;
        return result;
    }

    LOG_INFO("Spawned pid " + std::to_string(child->pid()) + ": " + joinCommand(request.argv));
    if (onSpawn) {
        onSpawn(child);
    }

    LineQueue queue;
    OutputReader reader(readFd, request.maxLineBytes, queue);

    std::deque<std::string> captured;
    auto deliver = [&](std::deque<std::string>& batch) {
        for (auto& line : batch) {
            if (onLine) {
                onLine(line);
            }
            captured.push_back(std::move(line));
            if (captured.size() > capturedLogLines_) {
                captured.pop_front();
            }
        }
        batch.clear();
    };

    auto lastOutput = started;
    bool eofSeen = false;
    result.status = RunStatus::EXITED;

    while (true) {
        std::deque<std::string> batch;
        {
            std::unique_lock<std::mutex> lock(queue.mutex);
            queue.cv.wait_for(lock, pollInterval_, [&] {
                return !queue.lines.empty() || (queue.eof && !eofSeen);
            });
            batch.swap(queue.lines);
            eofSeen = queue.eof;
        }

        const auto now = std::chrono::steady_clock::now();
        if (!batch.empty()) {
            lastOutput = now;
            deliver(batch);
        }

        if (child->poll()) {
            break;
        }

        if (request.cancellation && request.cancellation->isCancelled()) {
            LOG_INFO("Cancellation requested, terminating pid " + std::to_string(child->pid()));
            child->terminate(terminateGrace_);
            result.status = RunStatus::CANCELLED;
            break;
        }

        if (now - started >= request.totalTimeout) {
            LOG_WARNING("Total budget of " + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(request.totalTimeout).count()) +
                        "s exceeded, terminating pid " + std::to_string(child->pid()));
            child->terminate(terminateGrace_);
            result.status = RunStatus::TIMED_OUT;
            break;
        }

        if (now - lastOutput >= request.stallTimeout) {
            LOG_WARNING("No output for " + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(request.stallTimeout).count()) +
                        "s, terminating pid " + std::to_string(child->pid()));
            child->terminate(terminateGrace_);
            result.status = RunStatus::STALLED;
            break;
        }
    }

    // A canceller may have killed the process out of band before the
    // supervisor noticed the token.
    if (result.status == RunStatus::EXITED && request.cancellation && request.cancellation->isCancelled()) {
        result.status = RunStatus::CANCELLED;
    }

    // Same teardown after a normal exit, for helpers left in the group
    if (child->groupAlive()) {
        LOG_DEBUG("Reaping leftover members of process group " + std::to_string(child->pid()));
        child->terminate(terminateGrace_);
    }

    {
        std::unique_lock<std::mutex> lock(queue.mutex);
        queue.cv.wait_for(lock, kDrainTimeout, [&] { return queue.eof; });
    }
    reader.stop();

    std::deque<std::string> remaining;
    {
        std::lock_guard<std::mutex> lock(queue.mutex);
        remaining.swap(queue.lines);
        result.outputBytes = queue.bytes;
    }
    deliver(remaining);

    result.exitCode = child->exitCode();
    result.logLines.assign(std::make_move_iterator(captured.begin()), std::make_move_iterator(captured.end()));
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    LOG_INFO(request.argv.front() + " finished: status=" + runStatusToString(result.status) +
             " exitCode=" + std::to_string(result.exitCode) +
             " elapsed=" + std::to_string(result.elapsed.count()) + "ms" +
             " lines=" + std::to_string(result.logLines.size()));
    return result;
}

} // namespace archive_engine::crawler
