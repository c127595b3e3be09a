#include <string>
#include <iostream>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>
#include "fiber_sensor.hpp"
#include "sensor_service.hpp"
#include <grpcpp/server_builder.h>
#include <grpcpp/server.h>

using ::grpc::ServerBuilder;
using ::grpc::Server;

// Global flag for graceful shutdown
std::atomic<bool> running{true};

void RunServer(const std::string& address, bool verbose) {
    FiberSensor sensor(verbose);
    FiberSensorServiceImpl service(&sensor);

    ServerBuilder server_builder;
    server_builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    server_builder.RegisterService(&service);

    std::unique_ptr<Server> server{server_builder.BuildAndStart()};
    if (!server) {
        std::cerr << "[ERROR] Failed to start FiberSensor driver on " << address << "\n";
        return;
    }

    std::cout << "[INFO] FiberSensor driver listening on " << address << "\n";

    signal(SIGINT, [](int) { running = false; });
    signal(SIGTERM, [](int) { running = false; });

    std::thread server_thread([&server]() { server->Wait(); });

    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[INFO] Shutdown signal received\n";
    server->Shutdown();
    server_thread.join();

    std::cout << "[INFO] Driver shutdown complete, tracked " << sensor.fileCount()
              << " files from " << sensor.executorCount() << " executors\n";
}

int main(int argc, char* argv[]) {
    std::string listen_addr = "0.0.0.0:50061";
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--listen-addr" && i + 1 < argc) {
            listen_addr = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --listen-addr <addr>   Driver listen address (default: 0.0.0.0:50061)\n"
                      << "  --verbose              Log every received report\n"
                      << "  --help                 Show this help message\n";
            return 0;
        } else {
            std::cerr << "[ERROR] Unknown option: " << arg << " (see --help)\n";
            return 1;
        }
    }

    std::cout << "====================================\n";
    std::cout << "     FiberSensor Driver Starting    \n";
    std::cout << "====================================\n";

    RunServer(listen_addr, verbose);
    return 0;
}
