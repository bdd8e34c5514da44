#include <catch2/catch_test_macros.hpp>
#include "../../include/archive_engine/crawler/TimeoutPolicy.h"

using namespace archive_engine;
using namespace archive_engine::crawler;
using std::chrono::seconds;

TEST_CASE("TimeoutPolicy picks a budget per job kind", "[TimeoutPolicy]") {
    common::EngineConfig config;
    TimeoutPolicy policy(config);

    SECTION("Small page mirror gets the short budget") {
        REQUIRE(policy.budgetFor(PageMirror{}, 0, "https://example.com/") == seconds(3600));
    }

    SECTION("Page mirror above the size threshold gets the long budget") {
        std::uint64_t big = 200ULL * 1024 * 1024;
        REQUIRE(policy.budgetFor(PageMirror{}, big, "https://example.com/") == seconds(4 * 3600));
    }

    SECTION("Known large domain gets the long budget without a size hint") {
        REQUIRE(policy.budgetFor(PageMirror{}, 0, "https://en.wikipedia.org/wiki/Cat") == seconds(4 * 3600));
    }

    SECTION("Video channels get a multiple of the long budget") {
        REQUIRE(policy.budgetFor(VideoChannel{}, 0, "https://www.youtube.com/@someone") == seconds(3 * 4 * 3600));
    }

    SECTION("Snapshots get the snapshot budget") {
        REQUIRE(policy.budgetFor(BrowserSnapshot{}, 0, "https://example.com/") == seconds(300));
    }
}

TEST_CASE("TimeoutPolicy reads the size hint from the job", "[TimeoutPolicy]") {
    common::EngineConfig config;
    config.largeSiteThresholdBytes = 1000;
    TimeoutPolicy policy(config);

    Job job;
    job.url = "https://example.com/";
    job.sizeBytes = 1000;
    REQUIRE(policy.budgetFor(job) == config.shortBudget);

    job.sizeBytes = 1001;
    REQUIRE(policy.budgetFor(job) == config.longBudget);
}

TEST_CASE("isLargeSite ignores unparseable URLs", "[TimeoutPolicy]") {
    common::EngineConfig config;
    TimeoutPolicy policy(config);
    REQUIRE_FALSE(policy.isLargeSite(0, "wikipedia.org"));
    REQUIRE(policy.isLargeSite(0, "https://archive.org/details/x"));
}
