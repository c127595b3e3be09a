#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <utility>
#include "cache_stats.hpp"
#include "sensor.grpc.pb.h"

struct ExecutorStatsView {
    std::vector<std::pair<std::string, CacheStats>> executors;  // sorted by executor id
    CacheStats total;
};

class FiberSensorClient {
private:
    FiberSensorService::Stub theStub;
public:
    FiberSensorClient(std::shared_ptr<grpc::ChannelInterface> aChannel);

    // Host ids caching the file; nullopt if the driver could not be reached
    std::optional<std::vector<HostLocation>> GetHosts(const std::string& filePath);

    // All executors when executorId is empty
    std::optional<ExecutorStatsView> GetExecutorStats(const std::string& executorId = "");

    void PrintHosts(const std::string& filePath);

    void PrintExecutorStats(const std::string& executorId);
};
