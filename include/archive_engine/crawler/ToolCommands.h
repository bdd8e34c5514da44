#pragma once

#include <string>
#include <vector>
#include "models/Job.h"
#include "../common/EngineConfig.h"

namespace archive_engine::crawler {

// Argument vectors for the external archiving tools. The tools are a
// black-box CLI contract; nothing here interprets their output.
class ToolCommands {
public:
    explicit ToolCommands(const common::EngineConfig& config);

    // Recursive mirror into <mirrors>/, wget lays out <netloc>/ itself
    std::vector<std::string> wgetMirror(const std::string& url, const PageMirror& options) const;

    std::vector<std::string> ytDlpChannel(const std::string& url, const std::string& outputDirectory) const;

    // Metadata of the first playlist entry, one JSON document on stdout
    std::vector<std::string> ytDlpChannelProbe(const std::string& url) const;

    std::vector<std::string> singleFileSnapshot(const std::string& url, const std::string& outputDirectory) const;

    // <mirrors>/<netloc>
    std::string mirrorDirectory(const std::string& url) const;

    // <mirrors>/youtube/<channelId>
    std::string channelDirectory(const std::string& channelId) const;

    // <mirrors>/<netloc>/_snapshots
    std::string snapshotDirectory(const std::string& url) const;

    static const std::string& rejectPatterns();
    static const std::string& rejectRegex();
    static const std::string& videoFormat();

private:
    common::EngineConfig config_;
};

} // namespace archive_engine::crawler
