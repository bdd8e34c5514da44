#include <catch2/catch_test_macros.hpp>
#include "../../include/archive_engine/crawler/ToolCommands.h"

#include <algorithm>
#include <stdexcept>

using namespace archive_engine;
using namespace archive_engine::crawler;

namespace {

bool hasArg(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

// Value following a flag, or "" when the flag is absent
std::string argAfter(const std::vector<std::string>& argv, const std::string& flag) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    if (it == argv.end() || it + 1 == argv.end()) {
        return "";
    }
    return *(it + 1);
}

common::EngineConfig testConfig() {
    common::EngineConfig config;
    config.mirrorsPath = "/srv/mirrors";
    config.wgetBinary = "/usr/bin/wget";
    config.ytDlpBinary = "/usr/local/bin/yt-dlp";
    config.singleFileBinary = "single-file";
    return config;
}

} // namespace

TEST_CASE("wget mirror command line", "[ToolCommands]") {
    ToolCommands tools(testConfig());

    SECTION("Default options mirror the whole site") {
        auto argv = tools.wgetMirror("https://example.com/", PageMirror{});
        REQUIRE(argv.front() == "/usr/bin/wget");
        REQUIRE(argv.back() == "https://example.com/");
        REQUIRE(hasArg(argv, "--mirror"));
        REQUIRE(hasArg(argv, "--convert-links"));
        REQUIRE(hasArg(argv, "--adjust-extension"));
        REQUIRE(hasArg(argv, "--page-requisites"));
        REQUIRE(hasArg(argv, "--no-parent"));
        REQUIRE(hasArg(argv, "--execute=robots=off"));
        REQUIRE(argAfter(argv, "-P") == "/srv/mirrors");
        REQUIRE(argAfter(argv, "--reject") == ToolCommands::rejectPatterns());
        REQUIRE(argAfter(argv, "--reject-regex") == ToolCommands::rejectRegex());
        REQUIRE_FALSE(hasArg(argv, "-l"));
        REQUIRE_FALSE(hasArg(argv, "--span-hosts"));
    }

    SECTION("Depth limit and external hosts") {
        PageMirror options;
        options.depth = 2;
        options.includeExternal = true;
        auto argv = tools.wgetMirror("https://Example.com:8080/blog", options);
        REQUIRE(argAfter(argv, "-l") == "2");
        REQUIRE(hasArg(argv, "--span-hosts"));
        REQUIRE(hasArg(argv, "--domains=example.com:8080"));
    }

    SECTION("External hosts need a parseable URL") {
        PageMirror options;
        options.includeExternal = true;
        REQUIRE_THROWS_AS(tools.wgetMirror("example.com", options), std::invalid_argument);
    }
}

TEST_CASE("yt-dlp command lines", "[ToolCommands]") {
    ToolCommands tools(testConfig());

    SECTION("Channel download") {
        auto argv = tools.ytDlpChannel("https://www.youtube.com/@someone", "/srv/mirrors/youtube/UC123");
        REQUIRE(argv.front() == "/usr/local/bin/yt-dlp");
        REQUIRE(argv.back() == "https://www.youtube.com/@someone");
        REQUIRE(argAfter(argv, "--format") == "bestvideo[height<=1080]+bestaudio/best[height<=1080]/best");
        REQUIRE(argAfter(argv, "--output") == "/srv/mirrors/youtube/UC123/%(id)s/%(title)s [%(id)s].%(ext)s");
        REQUIRE(hasArg(argv, "--write-info-json"));
        REQUIRE(hasArg(argv, "--write-thumbnail"));
        REQUIRE(hasArg(argv, "--no-overwrites"));
        REQUIRE(hasArg(argv, "--ignore-errors"));
        REQUIRE(hasArg(argv, "--newline"));
    }

    SECTION("Channel probe fetches one entry") {
        auto argv = tools.ytDlpChannelProbe("https://www.youtube.com/@someone");
        REQUIRE(hasArg(argv, "--dump-json"));
        REQUIRE(argAfter(argv, "--playlist-items") == "1");
    }
}

TEST_CASE("single-file snapshot command line", "[ToolCommands]") {
    ToolCommands tools(testConfig());
    auto argv = tools.singleFileSnapshot("https://example.com/page", "/srv/mirrors/example.com/_snapshots");
    REQUIRE(argv[0] == "single-file");
    REQUIRE(argv[1] == "https://example.com/page");
    REQUIRE(hasArg(argv, "--output-directory=/srv/mirrors/example.com/_snapshots"));
}

TEST_CASE("Output directory layout", "[ToolCommands]") {
    ToolCommands tools(testConfig());

    REQUIRE(tools.mirrorDirectory("https://Example.com/deep/page") == "/srv/mirrors/example.com");
    REQUIRE(tools.snapshotDirectory("https://example.com/") == "/srv/mirrors/example.com/_snapshots");
    REQUIRE(tools.channelDirectory("UC123") == "/srv/mirrors/youtube/UC123");

    REQUIRE_THROWS_AS(tools.mirrorDirectory("not-a-url"), std::invalid_argument);
    REQUIRE_THROWS_AS(tools.channelDirectory(""), std::invalid_argument);
    REQUIRE_THROWS_AS(tools.channelDirectory("../etc"), std::invalid_argument);
    REQUIRE_THROWS_AS(tools.channelDirectory(".."), std::invalid_argument);
}
