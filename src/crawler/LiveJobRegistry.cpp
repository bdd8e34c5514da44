#include "../../include/archive_engine/crawler/LiveJobRegistry.h"
#include "../../include/Logger.h"

#include <algorithm>

namespace archive_engine::crawler {

namespace {

const std::string kWgetMarker = "Saving to:";
const std::string kYtDlpMarker = "[download] Destination:";

std::string trim(const std::string& value) {
    const char* whitespace = " \t";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

// wget quotes the path with ASCII or typographic quotes depending on locale
std::string stripQuotes(std::string value) {
    static const std::vector<std::string> openers = {"\xE2\x80\x98", "\xE2\x80\x9C", "'", "\"", "`"};
    static const std::vector<std::string> closers = {"\xE2\x80\x99", "\xE2\x80\x9D", "'", "\""};
    for (const auto& quote : openers) {
        if (value.compare(0, quote.size(), quote) == 0) {
            value.erase(0, quote.size());
            break;
        }
    }
    for (const auto& quote : closers) {
        if (value.size() >= quote.size() &&
            value.compare(value.size() - quote.size(), quote.size(), quote) == 0) {
            value.erase(value.size() - quote.size());
            break;
        }
    }
    return value;
}

std::int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

nlohmann::json LiveJobSnapshot::toJson() const {
    return {
        {"jobId", jobId},
        {"target", target},
        {"startedAt", toEpochSeconds(startedAt)},
        {"elapsedSeconds", elapsedSeconds},
        {"logLineCount", logLineCount}
    };
}

nlohmann::json ProgressSnapshot::toJson() const {
    return {
        {"jobId", jobId},
        {"elapsedSeconds", elapsedSeconds},
        {"currentFile", currentFileGuess},
        {"itemsSoFar", itemsSoFarGuess},
        {"outputBytes", outputBytes},
        {"recentLines", recentLines}
    };
}

LiveJobRegistry::LiveJobRegistry(const common::EngineConfig& config)
    : LiveJobRegistry(config.liveLogLines, config.terminateGrace, config.progressLines) {}

LiveJobRegistry::LiveJobRegistry(size_t logCapacity,
                                 std::chrono::milliseconds terminateGrace,
                                 size_t progressLines)
    : logCapacity_(std::max<size_t>(logCapacity, 1))
    , terminateGrace_(terminateGrace)
    , progressLines_(progressLines) {}

std::shared_ptr<CancellationToken> LiveJobRegistry::registerJob(const std::string& jobId,
                                                                const std::string& target,
                                                                const std::string& attemptId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(jobId) > 0) {
        LOG_WARNING("Job " + jobId + " is already live, refusing second registration");
        return nullptr;
    }

    Entry entry;
    entry.jobId = jobId;
    entry.target = target;
    entry.attemptId = attemptId;
    entry.startedAt = std::chrono::system_clock::now();
    entry.startedSteady = std::chrono::steady_clock::now();
    entry.token = std::make_shared<CancellationToken>();
    auto token = entry.token;
    entries_.emplace(jobId, std::move(entry));

    LOG_DEBUG("Registered live job " + jobId + " (" + target + "), " + std::to_string(entries_.size()) + " live");
    return token;
}

bool LiveJobRegistry::attachProcess(const std::string& jobId, std::shared_ptr<ChildProcess> process) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jobId);
    if (it == entries_.end()) {
        return false;
    }
    it->second.process = std::move(process);
    return !it->second.token->isCancelled();
}

void LiveJobRegistry::detachProcess(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jobId);
    if (it != entries_.end()) {
        it->second.process.reset();
    }
}

void LiveJobRegistry::appendLog(const std::string& jobId, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jobId);
    if (it == entries_.end()) {
        return;
    }
    Entry& entry = it->second;
    entry.logBuffer.push_back(line);
    while (entry.logBuffer.size() > logCapacity_) {
        entry.logBuffer.pop_front();
    }
    entry.lineCount++;
    entry.outputBytes += line.size() + 1;
}

std::vector<LiveJobSnapshot> LiveJobRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LiveJobSnapshot> result;
    result.reserve(entries_.size());
    for (const auto& [jobId, entry] : entries_) {
        LiveJobSnapshot item;
        item.jobId = jobId;
        item.target = entry.target;
        item.startedAt = entry.startedAt;
        item.elapsedSeconds = elapsedSeconds(entry);
        item.logLineCount = entry.lineCount;
        result.push_back(std::move(item));
    }
    std::sort(result.begin(), result.end(), [](const LiveJobSnapshot& a, const LiveJobSnapshot& b) {
        return a.startedAt < b.startedAt;
    });
    return result;
}

std::optional<std::vector<std::string>> LiveJobRegistry::tailLog(const std::string& jobId, size_t lines) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jobId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const auto& buffer = it->second.logBuffer;
    size_t start = buffer.size() > lines ? buffer.size() - lines : 0;
    return std::vector<std::string>(buffer.begin() + static_cast<std::ptrdiff_t>(start), buffer.end());
}

std::optional<ProgressSnapshot> LiveJobRegistry::progress(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jobId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const Entry& entry = it->second;

    ProgressSnapshot progress;
    progress.jobId = jobId;
    progress.elapsedSeconds = elapsedSeconds(entry);
    progress.outputBytes = entry.outputBytes;
    for (const auto& line : entry.logBuffer) {
        if (auto file = extractOutputFile(line)) {
            progress.currentFileGuess = *file;
            progress.itemsSoFarGuess++;
        }
    }
    size_t start = entry.logBuffer.size() > progressLines_ ? entry.logBuffer.size() - progressLines_ : 0;
    progress.recentLines.assign(entry.logBuffer.begin() + static_cast<std::ptrdiff_t>(start), entry.logBuffer.end());
    return progress;
}

bool LiveJobRegistry::contains(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(jobId) > 0;
}

size_t LiveJobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool LiveJobRegistry::claimOutcome(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jobId);
    if (it == entries_.end() || it->second.outcomeClaimed) {
        return false;
    }
    it->second.outcomeClaimed = true;
    return true;
}

void LiveJobRegistry::unregisterJob(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(jobId) > 0) {
        LOG_DEBUG("Unregistered live job " + jobId + ", " + std::to_string(entries_.size()) + " live");
    }
}

common::Result<TerminatedJob> LiveJobRegistry::terminate(const std::string& jobId) {
    std::shared_ptr<ChildProcess> process;
    TerminatedJob terminated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(jobId);
        if (it == entries_.end()) {
            return common::Result<TerminatedJob>::Failure("Nothing to cancel: job " + jobId + " is not running");
        }
        Entry& entry = it->second;
        if (entry.outcomeClaimed) {
            return common::Result<TerminatedJob>::Failure("Job " + jobId + " is already finishing");
        }
        entry.outcomeClaimed = true;
        entry.token->cancel();
        process = entry.process;
        terminated.attemptId = entry.attemptId;
        terminated.logTail.assign(entry.logBuffer.begin(), entry.logBuffer.end());
        entries_.erase(it);
    }

    if (process) {
        LOG_INFO("Terminating process group " + std::to_string(process->pid()) + " of job " + jobId);
        process->terminate(terminateGrace_);
    } else {
        LOG_INFO("Job " + jobId + " cancelled between tool runs");
    }

    return common::Result<TerminatedJob>::Success(terminated, "Cancelled job " + jobId);
}

std::optional<std::string> LiveJobRegistry::extractOutputFile(const std::string& line) {
    auto pos = line.find(kWgetMarker);
    size_t markerSize = kWgetMarker.size();
    if (pos == std::string::npos) {
        pos = line.find(kYtDlpMarker);
        markerSize = kYtDlpMarker.size();
    }
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string file = stripQuotes(trim(line.substr(pos + markerSize)));
    if (file.empty()) {
        return std::nullopt;
    }
    return file;
}

std::int64_t LiveJobRegistry::elapsedSeconds(const Entry& entry) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - entry.startedSteady).count();
}

} // namespace archive_engine::crawler
