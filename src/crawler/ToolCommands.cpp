#include "../../include/archive_engine/crawler/ToolCommands.h"
#include "../../include/archive_engine/common/UrlUtils.h"

#include <filesystem>
#include <stdexcept>

namespace archive_engine::crawler {

namespace fs = std::filesystem;

namespace {

std::string netlocOf(const std::string& url) {
    common::UrlParts parts;
    if (!common::parseUrl(url, parts)) {
        throw std::invalid_argument("Not an http(s) URL: " + url);
    }
    return parts.netloc;
}

} // namespace

ToolCommands::ToolCommands(const common::EngineConfig& config) : config_(config) {}

const std::string& ToolCommands::rejectPatterns() {
    static const std::string patterns = "*.exe,*.zip,*.tar.gz,*.rar,*.7z,*.iso,*.dmg";
    return patterns;
}

const std::string& ToolCommands::rejectRegex() {
    static const std::string regex = "(logout|signout|login|signin|auth|session)";
    return regex;
}

const std::string& ToolCommands::videoFormat() {
    static const std::string format = "bestvideo[height<=1080]+bestaudio/best[height<=1080]/best";
    return format;
}

std::vector<std::string> ToolCommands::wgetMirror(const std::string& url, const PageMirror& options) const {
    std::vector<std::string> cmd = {
        config_.wgetBinary,
        "--mirror",
        "--convert-links",
        "--adjust-extension",
        "--page-requisites",
        "--no-parent",
        "--wait=0.5",
        "--random-wait",
        "--tries=3",
        "--timeout=30",
        "--no-check-certificate",
        "--execute=robots=off",
        "--user-agent=" + config_.userAgent,
        "-P", config_.mirrorsPath
    };

    // --mirror implies infinite depth, so 0 needs no flag
    if (options.depth > 0) {
        cmd.push_back("-l");
        cmd.push_back(std::to_string(options.depth));
    }

    if (options.includeExternal) {
        cmd.push_back("--span-hosts");
        cmd.push_back("--domains=" + netlocOf(url));
    }

    cmd.push_back("--reject");
    cmd.push_back(rejectPatterns());
    cmd.push_back("--reject-regex");
    cmd.push_back(rejectRegex());
    cmd.push_back(url);
    return cmd;
}

std::vector<std::string> ToolCommands::ytDlpChannel(const std::string& url, const std::string& outputDirectory) const {
    return {
        config_.ytDlpBinary,
        "--format", videoFormat(),
        "--merge-output-format", "mp4",
        "--write-info-json",
        "--write-thumbnail",
        "--convert-thumbnails", "jpg",
        "--embed-thumbnail",
        "--add-metadata",
        "--output", (fs::path(outputDirectory) / "%(id)s" / "%(title)s [%(id)s].%(ext)s").string(),
        "--restrict-filenames",
        "--no-overwrites",
        "--ignore-errors",
        "--sleep-interval", "2",
        "--max-sleep-interval", "5",
        "--newline",
        url
    };
}

std::vector<std::string> ToolCommands::ytDlpChannelProbe(const std::string& url) const {
    return {
        config_.ytDlpBinary,
        "--dump-json",
        "--playlist-items", "1",
        url
    };
}

std::vector<std::string> ToolCommands::singleFileSnapshot(const std::string& url, const std::string& outputDirectory) const {
    return {
        config_.singleFileBinary,
        url,
        "--output-directory=" + outputDirectory,
        "--browser-headless=true"
    };
}

std::string ToolCommands::mirrorDirectory(const std::string& url) const {
    return (fs::path(config_.mirrorsPath) / netlocOf(url)).string();
}

std::string ToolCommands::channelDirectory(const std::string& channelId) const {
    if (channelId.empty() || channelId.find('/') != std::string::npos || channelId == "." || channelId == "..") {
        throw std::invalid_argument("Invalid channel id: '" + channelId + "'");
    }
    return (fs::path(config_.mirrorsPath) / "youtube" / channelId).string();
}

std::string ToolCommands::snapshotDirectory(const std::string& url) const {
    return (fs::path(mirrorDirectory(url)) / "_snapshots").string();
}

} // namespace archive_engine::crawler
