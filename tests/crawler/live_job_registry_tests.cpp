#include <catch2/catch_test_macros.hpp>
#include "../../include/archive_engine/crawler/LiveJobRegistry.h"

#include <chrono>
#include <string>
#include <thread>

using namespace archive_engine::crawler;
using namespace std::chrono_literals;

TEST_CASE("LiveJobRegistry tracks registered jobs", "[LiveJobRegistry]") {
    LiveJobRegistry registry(500, 500ms, 20);

    auto token = registry.registerJob("job-1", "https://example.com/", "attempt-1");
    REQUIRE(token);
    REQUIRE_FALSE(token->isCancelled());
    REQUIRE(registry.contains("job-1"));
    REQUIRE(registry.size() == 1);

    SECTION("A second registration of the same job is refused") {
        REQUIRE(registry.registerJob("job-1", "https://example.com/", "attempt-2") == nullptr);
        REQUIRE(registry.size() == 1);
    }

    SECTION("Snapshots are ordered by start time") {
        std::this_thread::sleep_for(5ms);
        registry.registerJob("job-2", "https://other.example/", "attempt-9");
        auto snapshot = registry.snapshot();
        REQUIRE(snapshot.size() == 2);
        REQUIRE(snapshot[0].jobId == "job-1");
        REQUIRE(snapshot[1].jobId == "job-2");
        REQUIRE(snapshot[1].target == "https://other.example/");

        auto json = snapshot[0].toJson();
        REQUIRE(json["jobId"] == "job-1");
        REQUIRE(json.contains("elapsedSeconds"));
    }

    SECTION("Unregistering removes the entry") {
        registry.unregisterJob("job-1");
        REQUIRE_FALSE(registry.contains("job-1"));
        REQUIRE(registry.snapshot().empty());
        REQUIRE_FALSE(registry.tailLog("job-1", 10).has_value());
    }
}

TEST_CASE("LiveJobRegistry keeps a bounded rolling log", "[LiveJobRegistry]") {
    LiveJobRegistry registry(500, 500ms, 20);
    registry.registerJob("job-1", "https://example.com/", "attempt-1");

    for (int i = 1; i <= 1200; ++i) {
        registry.appendLog("job-1", "line " + std::to_string(i));
    }

    auto all = registry.tailLog("job-1", 10000);
    REQUIRE(all);
    REQUIRE(all->size() == 500);
    REQUIRE(all->front() == "line 701");
    REQUIRE(all->back() == "line 1200");

    auto last = registry.tailLog("job-1", 3);
    REQUIRE(*last == std::vector<std::string>{"line 1198", "line 1199", "line 1200"});

    // The counter keeps counting past the buffer
    REQUIRE(registry.snapshot()[0].logLineCount == 1200);

    // Lines for unknown jobs are dropped
    registry.appendLog("ghost", "nobody listens");
    REQUIRE_FALSE(registry.contains("ghost"));
}

TEST_CASE("LiveJobRegistry derives progress from the log", "[LiveJobRegistry]") {
    LiveJobRegistry registry(500, 500ms, 2);
    registry.registerJob("job-1", "https://example.com/", "attempt-1");

    registry.appendLog("job-1", "Resolving example.com... 93.184.216.34");
    registry.appendLog("job-1", "Saving to: 'example.com/index.html'");
    registry.appendLog("job-1", "Saving to: \xE2\x80\x98" "example.com/about.html" "\xE2\x80\x99");
    registry.appendLog("job-1", "2024-01-01 12:00:00 (1.2 MB/s) - saved");

    auto progress = registry.progress("job-1");
    REQUIRE(progress);
    REQUIRE(progress->currentFileGuess == "example.com/about.html");
    REQUIRE(progress->itemsSoFarGuess == 2);
    REQUIRE(progress->recentLines.size() == 2);
    REQUIRE(progress->recentLines.back() == "2024-01-01 12:00:00 (1.2 MB/s) - saved");
    REQUIRE(progress->outputBytes > 0);

    REQUIRE_FALSE(registry.progress("missing").has_value());
}

TEST_CASE("extractOutputFile understands wget and yt-dlp", "[LiveJobRegistry]") {
    REQUIRE(LiveJobRegistry::extractOutputFile("Saving to: 'a/b.html'") == std::optional<std::string>("a/b.html"));
    REQUIRE(LiveJobRegistry::extractOutputFile("Saving to: \"a/b.html\"") == std::optional<std::string>("a/b.html"));
    REQUIRE(LiveJobRegistry::extractOutputFile("[download] Destination: /m/youtube/UC1/abc/Title [abc].mp4") ==
            std::optional<std::string>("/m/youtube/UC1/abc/Title [abc].mp4"));
    REQUIRE_FALSE(LiveJobRegistry::extractOutputFile("[download]  42.0% of 10.00MiB").has_value());
    REQUIRE_FALSE(LiveJobRegistry::extractOutputFile("Saving to: ").has_value());
}

TEST_CASE("claimOutcome has exactly one winner", "[LiveJobRegistry]") {
    LiveJobRegistry registry(500, 500ms, 20);
    registry.registerJob("job-1", "https://example.com/", "attempt-1");

    REQUIRE(registry.claimOutcome("job-1"));
    REQUIRE_FALSE(registry.claimOutcome("job-1"));
    REQUIRE_FALSE(registry.claimOutcome("missing"));

    SECTION("terminate refuses a job that is already finishing") {
        auto result = registry.terminate("job-1");
        REQUIRE_FALSE(result.success);
        REQUIRE(registry.contains("job-1"));
    }
}

TEST_CASE("terminate cancels and removes the entry", "[LiveJobRegistry]") {
    LiveJobRegistry registry(500, 500ms, 20);

    SECTION("Unknown job") {
        auto result = registry.terminate("missing");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message.find("not running") != std::string::npos);
    }

    SECTION("Job between tool runs") {
        auto token = registry.registerJob("job-1", "https://example.com/", "attempt-7");
        registry.appendLog("job-1", "first");
        registry.appendLog("job-1", "second");

        auto result = registry.terminate("job-1");
        REQUIRE(result.success);
        REQUIRE(result.value.attemptId == "attempt-7");
        REQUIRE(result.value.logTail == std::vector<std::string>{"first", "second"});
        REQUIRE(token->isCancelled());
        REQUIRE_FALSE(registry.contains("job-1"));

        // Once cancelled, a process attached late is refused
        REQUIRE_FALSE(registry.claimOutcome("job-1"));
    }

    SECTION("Job with a running process") {
        auto token = registry.registerJob("job-1", "https://example.com/", "attempt-1");
        ProcessRunner runner(50ms, 500ms, 100);

        RunRequest request;
        request.argv = {"/bin/sh", "-c", "echo running; sleep 30"};
        request.cancellation = token;

        RunStatus status = RunStatus::EXITED;
        std::thread worker([&] {
            auto run = runner.run(request,
                                  [&](const std::string& line) { registry.appendLog("job-1", line); },
                                  [&](const std::shared_ptr<ChildProcess>& child) { registry.attachProcess("job-1", child); });
            status = run.status;
        });

        // Wait for the process to be attached and talking
        for (int i = 0; i < 100; ++i) {
            auto tail = registry.tailLog("job-1", 1);
            if (tail && !tail->empty()) {
                break;
            }
            std::this_thread::sleep_for(20ms);
        }

        auto started = std::chrono::steady_clock::now();
        auto result = registry.terminate("job-1");
        worker.join();

        REQUIRE(result.success);
        REQUIRE(status == RunStatus::CANCELLED);
        REQUIRE(result.value.logTail == std::vector<std::string>{"running"});
        REQUIRE(std::chrono::steady_clock::now() - started < 5s);
        REQUIRE(registry.snapshot().empty());
    }
}

TEST_CASE("attachProcess reports cancelled or missing entries", "[LiveJobRegistry]") {
    LiveJobRegistry registry(500, 500ms, 20);
    auto process = std::make_shared<ChildProcess>(-1);

    REQUIRE_FALSE(registry.attachProcess("missing", process));

    auto token = registry.registerJob("job-1", "https://example.com/", "attempt-1");
    REQUIRE(registry.attachProcess("job-1", process));
    registry.detachProcess("job-1");

    token->cancel();
    REQUIRE_FALSE(registry.attachProcess("job-1", process));
}
