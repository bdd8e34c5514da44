#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_session.hpp>
#include "../../include/archive_engine/crawler/ProcessRunner.h"
#include "../../include/Logger.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace archive_engine::crawler;
using namespace std::chrono_literals;

namespace {

RunRequest shellRequest(const std::string& script) {
    RunRequest request;
    request.argv = {"/bin/sh", "-c", script};
    request.totalTimeout = 30s;
    request.stallTimeout = 30s;
    return request;
}

ProcessRunner fastRunner(size_t capturedLines = 1000) {
    return ProcessRunner(50ms, 500ms, capturedLines);
}

} // namespace

TEST_CASE("ProcessRunner captures merged output and the exit code", "[ProcessRunner]") {
    auto runner = fastRunner();

    SECTION("stdout and stderr arrive in one stream") {
        auto result = runner.run(shellRequest("echo out; echo err 1>&2; exit 0"));
        REQUIRE(result.status == RunStatus::EXITED);
        REQUIRE(result.exitCode == 0);
        REQUIRE(result.logLines.size() == 2);
        REQUIRE(result.exitedWith({0}));
        REQUIRE(result.outputBytes == 8);
    }

    SECTION("Non-zero exit codes are reported, not thrown") {
        auto result = runner.run(shellRequest("echo failing; exit 8"));
        REQUIRE(result.status == RunStatus::EXITED);
        REQUIRE(result.exitCode == 8);
        REQUIRE(result.exitedWith({0, 8}));
        REQUIRE_FALSE(result.exitedWith({0}));
        REQUIRE(result.tail(5) == "failing");
    }

    SECTION("Carriage returns split progress redraws into lines") {
        auto result = runner.run(shellRequest("printf '10%%\\r50%%\\r100%%\\n'"));
        REQUIRE(result.logLines == std::vector<std::string>{"10%", "50%", "100%"});
    }

    SECTION("A final line without newline is kept") {
        auto result = runner.run(shellRequest("printf 'no newline'"));
        REQUIRE(result.logLines == std::vector<std::string>{"no newline"});
    }

    SECTION("Working directory is honoured") {
        auto dir = std::filesystem::temp_directory_path();
        auto request = shellRequest("pwd");
        request.workingDirectory = dir.string();
        auto result = runner.run(request);
        REQUIRE(result.logLines.size() == 1);
        REQUIRE(std::filesystem::equivalent(result.logLines[0], dir));
    }
}

TEST_CASE("ProcessRunner reports launch problems", "[ProcessRunner]") {
    auto runner = fastRunner();

    SECTION("Empty command line") {
        RunRequest request;
        auto result = runner.run(request);
        REQUIRE(result.status == RunStatus::SPAWN_FAILED);
        REQUIRE_FALSE(result.error.empty());
    }

    SECTION("Missing binary exits with 127") {
        RunRequest request;
        request.argv = {"/nonexistent/archive-tool-binary"};
        auto result = runner.run(request);
        REQUIRE(result.status == RunStatus::EXITED);
        REQUIRE(result.exitCode == 127);
        REQUIRE(result.tail(1).find("failed to execute") != std::string::npos);
    }

    SECTION("Cancelled before spawn") {
        auto token = std::make_shared<CancellationToken>();
        token->cancel();
        auto request = shellRequest("echo should not run");
        request.cancellation = token;
        bool spawned = false;
        auto result = runner.run(request, nullptr, [&](const std::shared_ptr<ChildProcess>&) { spawned = true; });
        REQUIRE(result.status == RunStatus::CANCELLED);
        REQUIRE_FALSE(spawned);
    }
}

TEST_CASE("ProcessRunner enforces the total budget", "[ProcessRunner]") {
    auto runner = fastRunner();
    auto request = shellRequest("echo started; sleep 30");
    request.totalTimeout = 500ms;

    auto result = runner.run(request);
    REQUIRE(result.status == RunStatus::TIMED_OUT);
    REQUIRE(result.elapsed < 10s);
    REQUIRE(result.logLines == std::vector<std::string>{"started"});
}

TEST_CASE("ProcessRunner detects stalled tools", "[ProcessRunner]") {
    auto runner = fastRunner();
    auto request = shellRequest("echo one; sleep 30");
    request.stallTimeout = 1s;

    auto result = runner.run(request);
    REQUIRE(result.status == RunStatus::STALLED);
    REQUIRE(result.elapsed >= 1s);
    REQUIRE(result.elapsed < 10s);
}

TEST_CASE("Steady output keeps a slow tool alive", "[ProcessRunner]") {
    auto runner = fastRunner();
    auto request = shellRequest("for i in 1 2 3 4 5 6; do echo tick $i; sleep 0.3; done");
    request.stallTimeout = 1s;

    auto result = runner.run(request);
    REQUIRE(result.status == RunStatus::EXITED);
    REQUIRE(result.logLines.size() == 6);
}

TEST_CASE("ProcessRunner escalates to SIGKILL when SIGTERM is ignored", "[ProcessRunner]") {
    ProcessRunner runner(50ms, 300ms, 100);
    auto request = shellRequest("trap '' TERM; echo ready; sleep 30");
    request.totalTimeout = 500ms;

    auto result = runner.run(request);
    REQUIRE(result.status == RunStatus::TIMED_OUT);
    REQUIRE(result.exitCode == 128 + 9);
    REQUIRE(result.elapsed >= 800ms);
    REQUIRE(result.elapsed < 10s);
}

TEST_CASE("ProcessRunner tears down the whole process group", "[ProcessRunner]") {
    auto runner = fastRunner();
    auto marker = std::filesystem::temp_directory_path() /
                  ("archive_engine_helper_" + std::to_string(::getpid()));
    std::filesystem::remove(marker);

    auto request = shellRequest("(sleep 1; touch '" + marker.string() + "') & echo spawned helper; wait");
    request.totalTimeout = 300ms;

    std::shared_ptr<ChildProcess> child;
    auto result = runner.run(request, nullptr, [&](const std::shared_ptr<ChildProcess>& p) { child = p; });
    REQUIRE(result.status == RunStatus::TIMED_OUT);
    REQUIRE(child);
    REQUIRE(child->hasExited());
    REQUIRE(child->terminationRequested());

    // The helper would have created the marker had it survived
    std::this_thread::sleep_for(1500ms);
    REQUIRE_FALSE(std::filesystem::exists(marker));
}

TEST_CASE("ProcessRunner honours cancellation while running", "[ProcessRunner]") {
    auto runner = fastRunner();
    auto token = std::make_shared<CancellationToken>();
    auto request = shellRequest("while true; do echo working; sleep 0.1; done");
    request.cancellation = token;

    std::thread canceller([token] {
        std::this_thread::sleep_for(400ms);
        token->cancel();
    });
    auto result = runner.run(request);
    canceller.join();

    REQUIRE(result.status == RunStatus::CANCELLED);
    REQUIRE_FALSE(result.logLines.empty());
    REQUIRE(result.elapsed < 10s);
}

TEST_CASE("An out-of-band kill with a set token counts as cancelled", "[ProcessRunner]") {
    auto runner = fastRunner();
    auto token = std::make_shared<CancellationToken>();
    auto request = shellRequest("echo waiting; sleep 30");
    request.cancellation = token;

    std::thread killer;
    auto result = runner.run(request, nullptr, [&](const std::shared_ptr<ChildProcess>& child) {
        killer = std::thread([child, token] {
            std::this_thread::sleep_for(200ms);
            token->cancel();
            child->terminate(500ms);
        });
    });
    killer.join();

    REQUIRE(result.status == RunStatus::CANCELLED);
}

TEST_CASE("ProcessRunner keeps only the most recent captured lines", "[ProcessRunner]") {
    auto runner = fastRunner(1000);
    std::atomic<int> delivered{0};

    auto result = runner.run(shellRequest("i=1; while [ $i -le 2000 ]; do echo line $i; i=$((i+1)); done"),
                             [&](const std::string&) { delivered++; });

    REQUIRE(result.status == RunStatus::EXITED);
    REQUIRE(delivered.load() == 2000);
    REQUIRE(result.logLines.size() == 1000);
    REQUIRE(result.logLines.front() == "line 1001");
    REQUIRE(result.logLines.back() == "line 2000");
}

TEST_CASE("ProcessRunner line length limit", "[ProcessRunner]") {
    auto runner = fastRunner();
    const std::string script = "printf '{\"pad\":\"'; head -c 200000 /dev/zero | tr '\\0' a; printf '\"}\\n'";

    SECTION("Default limit splits an oversized line") {
        auto result = runner.run(shellRequest(script));
        REQUIRE(result.status == RunStatus::EXITED);
        REQUIRE(result.logLines.size() == 4);
        REQUIRE(result.logLines.front().size() == kDefaultMaxLineBytes);
    }

    SECTION("No limit keeps a 200 KiB JSON line whole") {
        auto request = shellRequest(script);
        request.maxLineBytes = 0;
        auto result = runner.run(request);
        REQUIRE(result.status == RunStatus::EXITED);
        REQUIRE(result.logLines.size() == 1);
        REQUIRE(result.logLines[0].size() == 200000 + 10);
        REQUIRE(result.logLines[0].back() == '}');
    }
}

TEST_CASE("A finished child is never signalled again", "[ProcessRunner]") {
    auto runner = fastRunner();
    std::shared_ptr<ChildProcess> child;

    auto result = runner.run(shellRequest("echo done"), nullptr,
                             [&](const std::shared_ptr<ChildProcess>& spawned) { child = spawned; });

    REQUIRE(result.status == RunStatus::EXITED);
    REQUIRE(child);
    REQUIRE(child->hasExited());
    REQUIRE(child->released());
    REQUIRE_FALSE(child->groupAlive());

    // A late canceller must return at once instead of waiting out the grace
    auto started = std::chrono::steady_clock::now();
    child->terminate(5s);
    REQUIRE(std::chrono::steady_clock::now() - started < 1s);
    REQUIRE(child->released());
}

int main(int argc, char* argv[]) {
    const char* logLevelEnv = std::getenv("LOG_LEVEL");
    LogLevel logLevel = Logger::parseLogLevel(logLevelEnv ? logLevelEnv : "", LogLevel::WARNING);
    Logger::getInstance().init(logLevel, true);

    return Catch::Session().run(argc, argv);
}
