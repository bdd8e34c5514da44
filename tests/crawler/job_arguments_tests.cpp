#include <catch2/catch_test_macros.hpp>
#include "../../include/archive_engine/crawler/JobArguments.h"
#include "../../include/archive_engine/crawler/ToolCommands.h"

#include <algorithm>

using namespace archive_engine;
using namespace archive_engine::crawler;

TEST_CASE("Page mirror arguments", "[JobArguments]") {
    SECTION("Defaults") {
        auto result = jobFromArguments({"page", "https://example.com/docs/"});
        REQUIRE(result.success);
        REQUIRE(result.value.name == "example.com");
        REQUIRE(result.value.crawlIntervalDays == 30);
        const auto& mirror = std::get<PageMirror>(result.value.kind);
        REQUIRE(mirror.depth == 0);
        REQUIRE_FALSE(mirror.includeExternal);
    }

    SECTION("Interval, depth and --external in any position") {
        auto result = jobFromArguments({"--external", "page", "https://example.com/", "7", "3"});
        REQUIRE(result.success);
        REQUIRE(result.value.crawlIntervalDays == 7);
        const auto& mirror = std::get<PageMirror>(result.value.kind);
        REQUIRE(mirror.depth == 3);
        REQUIRE(mirror.includeExternal);

        result = jobFromArguments({"page", "https://example.com/", "--external"});
        REQUIRE(result.success);
        REQUIRE(std::get<PageMirror>(result.value.kind).includeExternal);
    }

    SECTION("--external reaches the wget command line") {
        auto result = jobFromArguments({"page", "https://example.com/", "--external"});
        REQUIRE(result.success);

        common::EngineConfig config;
        config.mirrorsPath = "/srv/mirrors";
        ToolCommands tools(config);
        auto argv = tools.wgetMirror(result.value.url, std::get<PageMirror>(result.value.kind));
        REQUIRE(std::find(argv.begin(), argv.end(), "--span-hosts") != argv.end());
        REQUIRE(std::find(argv.begin(), argv.end(), "--domains=example.com") != argv.end());
    }
}

TEST_CASE("Video and snapshot arguments", "[JobArguments]") {
    auto video = jobFromArguments({"video", "https://www.youtube.com/@channel", "1"});
    REQUIRE(video.success);
    REQUIRE(std::holds_alternative<VideoChannel>(video.value.kind));
    REQUIRE(video.value.crawlIntervalDays == 1);

    auto snapshot = jobFromArguments({"snapshot", "https://example.com/page"});
    REQUIRE(snapshot.success);
    REQUIRE(std::holds_alternative<BrowserSnapshot>(snapshot.value.kind));
}

TEST_CASE("Rejected arguments", "[JobArguments]") {
    REQUIRE_FALSE(jobFromArguments({}).success);
    REQUIRE_FALSE(jobFromArguments({"page"}).success);
    REQUIRE_FALSE(jobFromArguments({"feed", "https://example.com/"}).success);
    REQUIRE_FALSE(jobFromArguments({"page", "ftp://example.com/"}).success);
    REQUIRE_FALSE(jobFromArguments({"page", "https://example.com/", "weekly"}).success);
    REQUIRE_FALSE(jobFromArguments({"page", "https://example.com/", "0"}).success);
    REQUIRE_FALSE(jobFromArguments({"page", "https://example.com/", "30", "-1"}).success);
    REQUIRE_FALSE(jobFromArguments({"video", "https://www.youtube.com/@c", "30", "2"}).success);

    auto external = jobFromArguments({"video", "https://www.youtube.com/@c", "--external"});
    REQUIRE_FALSE(external.success);
    REQUIRE(external.message.find("--external") != std::string::npos);
}
