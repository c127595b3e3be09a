#pragma once

#include "fiber_cache_tracker.hpp"
#include "sensor.grpc.pb.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>

// Periodically pushes the tracker's fiber status and cache stats to the driver
class CacheReporter {
private:
    FiberCacheTracker* tracker;
    std::unique_ptr<FiberSensorService::Stub> stub;
    std::string executor_id;
    std::string host_name;
    std::chrono::milliseconds interval;

    std::atomic<bool> running{false};
    std::thread reporter_thread;
    std::mutex wait_mutex;
    std::condition_variable wait_cv;

    bool send(CustomInfoKind kind, const std::string& payload);
    void reportLoop();

public:
    CacheReporter(FiberCacheTracker* tracker,
                  std::shared_ptr<grpc::ChannelInterface> channel,
                  const std::string& executor_id,
                  const std::string& host_name,
                  std::chrono::milliseconds interval = std::chrono::seconds(10));
    ~CacheReporter();

    // Send one FIBER_STATUS then one CACHE_STATS update; true if both were accepted
    bool reportOnce();

    void start();
    void stop();
    bool isRunning() const { return running.load(); }
};
