#include "sensor_client.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <grpcpp/grpcpp.h>

FiberSensorClient::FiberSensorClient(std::shared_ptr<grpc::ChannelInterface> aChannel) : theStub{aChannel} {}

std::optional<std::vector<HostLocation>> FiberSensorClient::GetHosts(const std::string& filePath) {
    HostsRequest request;
    request.set_file_path(filePath);

    HostsResponse response;
    grpc::ClientContext context;
    grpc::Status status = theStub.GetHosts(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to get hosts from driver: " << status.error_message() << "\n";
        return std::nullopt;
    }

    return std::vector<HostLocation>(response.hosts().begin(), response.hosts().end());
}

std::optional<ExecutorStatsView> FiberSensorClient::GetExecutorStats(const std::string& executorId) {
    ExecutorStatsRequest request;
    request.set_executor_id(executorId);

    ExecutorStatsResponse response;
    grpc::ClientContext context;
    grpc::Status status = theStub.GetExecutorStats(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to get executor stats from driver: " << status.error_message() << "\n";
        return std::nullopt;
    }

    ExecutorStatsView view;
    for (const auto& entry : response.executors()) {
        view.executors.emplace_back(entry.executor_id(), CacheStats::fromProto(entry.stats()));
    }
    std::sort(view.executors.begin(), view.executors.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    view.total = CacheStats::fromProto(response.total());
    return view;
}

void FiberSensorClient::PrintHosts(const std::string& filePath) {
    auto hosts = GetHosts(filePath);
    if (!hosts) {
        return;
    }

    if (hosts->empty()) {
        std::cout << "[INFO] No cached copy known for " << filePath << "\n";
        return;
    }

    for (const auto& host : *hosts) {
        std::cout << host.host_id()
                  << " (host " << host.host_name()
                  << ", executor " << host.executor_id()
                  << ", " << host.cached_fiber_count() << " fibers cached)\n";
    }
}

void FiberSensorClient::PrintExecutorStats(const std::string& executorId) {
    auto view = GetExecutorStats(executorId);
    if (!view) {
        return;
    }

    auto printRow = [](const std::string& name, const CacheStats& stats) {
        std::cout << std::left << std::setw(16) << name
                  << std::right << std::setw(10) << stats.cacheCount()
                  << std::setw(14) << stats.cacheSize()
                  << std::setw(10) << stats.hitCount()
                  << std::setw(10) << stats.missCount()
                  << std::setw(10) << std::fixed << std::setprecision(3) << stats.hitRate()
                  << "\n";
    };

    std::cout << std::left << std::setw(16) << "executor"
              << std::right << std::setw(10) << "fibers"
              << std::setw(14) << "bytes"
              << std::setw(10) << "hits"
              << std::setw(10) << "misses"
              << std::setw(10) << "hit rate" << "\n";

    for (const auto& [id, stats] : view->executors) {
        printRow(id, stats);
    }
    if (view->executors.size() > 1) {
        printRow("total", view->total);
    }
}
