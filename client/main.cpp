#include <string> 
#include <iostream>
#include <sstream>
#include <vector>
#include "sensor_client.hpp"
#include <grpcpp/grpcpp.h>

std::vector<std::string> ParseCommand(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string s;
    while (iss >> s) {
        tokens.push_back(s);
    }
    return tokens;
}

void RunClient(const std::string& address) {
    std::shared_ptr<grpc::ChannelInterface> channel{
        grpc::CreateChannel(address, grpc::InsecureChannelCredentials())
    };
    
    FiberSensorClient client{channel}; 

    std::cout << "FiberSensor Client Started\n";
    std::cout << "Commands:\n";
    std::cout << "  hosts <file>\n";
    std::cout << "  stats [executorId]\n";
    std::cout << "  exit\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) break;
        auto tokens = ParseCommand(line);
        if (tokens.empty()) continue;

        const std::string& cmd = tokens[0];

        if (cmd == "exit") {
            break;
        } else if (cmd == "hosts" && tokens.size() == 2) {
            client.PrintHosts(tokens[1]);
        } else if (cmd == "stats" && tokens.size() <= 2) {
            client.PrintExecutorStats(tokens.size() == 2 ? tokens[1] : "");
        } else {
            std::cout << "[ERROR] Invalid command.\n";
        }
    }
}

int main(int argc, char* argv[]) {
    std::string driver_addr = "localhost:50061";

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--driver-addr" && i + 1 < argc) {
            driver_addr = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [--driver-addr <addr>]\n";
            return 0;
        }
    }

    RunClient(driver_addr);
}
