#include "../include/Logger.h"
#include "../include/archive_engine/common/EngineConfig.h"
#include "../include/archive_engine/crawler/CrawlDispatcher.h"
#include "../include/archive_engine/crawler/JobArguments.h"
#include "../include/archive_engine/crawler/LiveJobRegistry.h"
#include "../include/archive_engine/storage/MongoJobRegistry.h"
#include "services/CrawlTriggerService.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace archive_engine;

namespace {

std::atomic<bool> g_shutdownRequested{false};

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        char** messages = backtrace_symbols(array, size);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        if (messages) {
            for (int i = 0; i < size; ++i) {
                std::cerr << messages[i] << "\n";
            }
        }
        std::cerr.flush();
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

void installShutdownHandler() {
    auto handler = [](int) { g_shutdownRequested.store(true); };
    std::signal(SIGINT, handler);
    std::signal(SIGTERM, handler);
}

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << "                                  run the archive daemon\n"
              << "  " << program << " add <page|video|snapshot> <url> [intervalDays] [depth] [--external]\n"
              << "  " << program << " reset <jobId>\n";
}

int addJob(storage::JobRegistry& registry, int argc, char* argv[]) {
    auto parsed = crawler::jobFromArguments(std::vector<std::string>(argv + 2, argv + argc));
    if (!parsed.success) {
        std::cerr << parsed.message << std::endl;
        return 2;
    }

    std::string id = registry.createJob(parsed.value);
    LOG_INFO("Added " + parsed.message + " as job " + id);
    std::cout << id << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    installCrashHandler();
    Logger::getInstance().initFromEnvironment(LogLevel::INFO);

    auto config = common::EngineConfig::fromEnvironment();

    std::shared_ptr<storage::MongoJobRegistry> registry;
    try {
        registry = std::make_shared<storage::MongoJobRegistry>(config.mongoUri, config.mongoDatabase);
    } catch (const storage::RegistryError& e) {
        LOG_ERROR("Cannot start without the job registry: " + std::string(e.what()));
        return 1;
    }
    auto connection = registry->testConnection();
    if (!connection.success) {
        LOG_ERROR("Cannot start without the job registry: " + connection.message);
        return 1;
    }

    auto liveJobs = std::make_shared<crawler::LiveJobRegistry>(config);
    auto dispatcher = std::make_shared<crawler::CrawlDispatcher>(config, registry, liveJobs);
    services::CrawlTriggerService trigger(config, registry, dispatcher, liveJobs);

    if (argc > 1) {
        const std::string command = argv[1];
        try {
            if (command == "add") {
                int rc = addJob(*registry, argc, argv);
                if (rc != 0) {
                    printUsage(argv[0]);
                }
                return rc;
            }
            if (command == "reset" && argc > 2) {
                auto result = trigger.resetJob(argv[2]);
                std::cout << result.message << std::endl;
                return result.success ? 0 : 1;
            }
        } catch (const std::exception& e) {
            LOG_ERROR(command + " failed: " + std::string(e.what()));
            return 1;
        }
        printUsage(argv[0]);
        return 2;
    }

    installShutdownHandler();
    LOG_INFO("=== Archive engine starting ===");
    if (!trigger.start()) {
        LOG_ERROR("Failed to start the trigger service");
        return 1;
    }

    while (!g_shutdownRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    LOG_INFO("Shutdown requested");
    trigger.stop();
    dispatcher->shutdown();
    LOG_INFO("=== Archive engine stopped ===");
    return 0;
}
