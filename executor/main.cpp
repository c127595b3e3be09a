#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <unistd.h>
#include <grpcpp/grpcpp.h>
#include "cache_reporter.hpp"
#include "fiber_cache_tracker.hpp"

// Global flag for graceful shutdown
std::atomic<bool> running{true};

std::string localHostName() {
    char buffer[256];
    if (gethostname(buffer, sizeof(buffer)) != 0) {
        return "localhost";
    }
    buffer[sizeof(buffer) - 1] = '\0';
    return buffer;
}

int runExecutor(const std::string& executor_id,
                const std::string& host_name,
                const std::string& driver_addr,
                const std::string& manifest_path,
                int report_interval_sec) {

    FiberCacheTracker tracker;

    if (!manifest_path.empty()) {
        try {
            tracker.loadManifest(manifest_path);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "[INFO] Executor " << executor_id << " on host " << host_name << "\n";
    std::cout << "[INFO] Tracking " << tracker.fileCount() << " files\n";
    std::cout << "[INFO] Driver address: " << driver_addr << "\n";

    auto channel = grpc::CreateChannel(driver_addr, grpc::InsecureChannelCredentials());
    CacheReporter reporter(&tracker, channel, executor_id, host_name,
                           std::chrono::seconds(report_interval_sec));
    reporter.start();

    signal(SIGINT, [](int) {
        running = false;
    });

    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[INFO] Shutdown signal received\n";
    reporter.stop();
    std::cout << "[INFO] Executor shutdown complete\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string executor_id;
    std::string host_name = localHostName();
    std::string driver_addr = "localhost:50061";
    std::string manifest_path;
    int report_interval_sec = 10;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--executor-id" && i + 1 < argc) {
            executor_id = argv[++i];
        } else if (arg == "--host-name" && i + 1 < argc) {
            host_name = argv[++i];
        } else if (arg == "--driver-addr" && i + 1 < argc) {
            driver_addr = argv[++i];
        } else if (arg == "--manifest" && i + 1 < argc) {
            manifest_path = argv[++i];
        } else if (arg == "--report-interval" && i + 1 < argc) {
            report_interval_sec = std::stoi(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " --executor-id <id> [options]\n"
                      << "Options:\n"
                      << "  --executor-id <id>         Executor identifier (required)\n"
                      << "  --host-name <name>         Reported host name (default: gethostname)\n"
                      << "  --driver-addr <addr>       Driver address (default: localhost:50061)\n"
                      << "  --manifest <file>          Cached fiber manifest to report\n"
                      << "  --report-interval <sec>    Seconds between reports (default: 10)\n"
                      << "  --help                     Show this help message\n";
            return 0;
        }
    }

    if (executor_id.empty()) {
        std::cerr << "[ERROR] --executor-id is required\n";
        return 1;
    }
    if (report_interval_sec <= 0) {
        std::cerr << "[ERROR] --report-interval must be positive\n";
        return 1;
    }

    return runExecutor(executor_id, host_name, driver_addr, manifest_path, report_interval_sec);
}
