#include "../../include/archive_engine/crawler/JobArguments.h"
#include "../../include/archive_engine/common/UrlUtils.h"

#include <stdexcept>

namespace archive_engine::crawler {

namespace {

constexpr int kDefaultIntervalDays = 30;

bool parseNonNegative(const std::string& text, int& value) {
    try {
        size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size() && value >= 0;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

common::Result<Job> jobFromArguments(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    bool includeExternal = false;
    for (const auto& arg : args) {
        if (arg == "--external") {
            includeExternal = true;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() < 2 || positional.size() > 4) {
        return common::Result<Job>::Failure("Expected <page|video|snapshot> <url> [intervalDays] [depth]");
    }

    const std::string& kind = positional[0];
    Job job;
    job.url = common::sanitizeUrl(positional[1]);
    common::UrlParts parts;
    if (!common::parseUrl(job.url, parts)) {
        return common::Result<Job>::Failure("Not an http(s) URL: " + positional[1]);
    }
    job.name = parts.netloc;

    job.crawlIntervalDays = kDefaultIntervalDays;
    if (positional.size() > 2 && (!parseNonNegative(positional[2], job.crawlIntervalDays) || job.crawlIntervalDays == 0)) {
        return common::Result<Job>::Failure("Invalid interval in days: " + positional[2]);
    }

    if (kind == "page") {
        PageMirror mirror;
        if (positional.size() > 3 && !parseNonNegative(positional[3], mirror.depth)) {
            return common::Result<Job>::Failure("Invalid depth: " + positional[3]);
        }
        mirror.includeExternal = includeExternal;
        job.kind = mirror;
        return common::Result<Job>::Success(job, "page mirror of " + job.url);
    }

    if (includeExternal) {
        return common::Result<Job>::Failure("--external only applies to page mirrors");
    }
    if (positional.size() > 3) {
        return common::Result<Job>::Failure("Depth only applies to page mirrors");
    }
    if (kind == "video") {
        job.kind = VideoChannel{};
        return common::Result<Job>::Success(job, "video channel " + job.url);
    }
    if (kind == "snapshot") {
        job.kind = BrowserSnapshot{};
        return common::Result<Job>::Success(job, "browser snapshot of " + job.url);
    }
    return common::Result<Job>::Failure("Unknown job kind: " + kind);
}

} // namespace archive_engine::crawler
