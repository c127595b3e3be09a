#include "sensor_service.hpp"
#include "status_serde.hpp"
#include <iostream>

using ::grpc::ServerContext;
using ::grpc::Status;
using ::grpc::StatusCode;

Status FiberSensorServiceImpl::ReportCustomInfo(ServerContext* context,
                                                const ::CustomInfoUpdate* request,
                                                ::ReportAck* response) {
    switch (request->kind()) {
    case FIBER_STATUS:
        try {
            theSensor->updateLocations(request->host_name(),
                                       request->executor_id(),
                                       request->customized_info());
        } catch (const CacheStatusDecodeError& e) {
            std::cerr << "[WARNING] Rejected fiber status from executor " << request->executor_id()
                      << " on " << request->host_name() << ": " << e.what() << "\n";
            return Status(StatusCode::INVALID_ARGUMENT, e.what());
        }
        response->set_ok(true);
        response->set_message("Fiber status recorded");
        return Status::OK;

    case CACHE_STATS:
        // Bad stats payloads are absorbed by the sensor
        theSensor->updateMetrics(request->executor_id(),
                                 request->host_name(),
                                 request->customized_info());
        response->set_ok(true);
        response->set_message("Cache stats recorded");
        return Status::OK;

    default:
        return Status(StatusCode::INVALID_ARGUMENT,
                      "Unknown custom info kind " + std::to_string(static_cast<int>(request->kind())));
    }
}

Status FiberSensorServiceImpl::GetHosts(ServerContext* context,
                                        const ::HostsRequest* request,
                                        ::HostsResponse* response) {
    auto record = theSensor->getFileCacheStatus(request->file_path());
    if (!record) {
        return Status::OK;
    }

    auto* location = response->add_hosts();
    location->set_host_id(record->host);
    location->set_cached_fiber_count(static_cast<int64_t>(record->status.cachedFiberCount()));

    auto parts = FiberSensor::parseHostId(record->host);
    if (parts) {
        location->set_host_name(parts->first);
        location->set_executor_id(parts->second);
    }

    return Status::OK;
}

Status FiberSensorServiceImpl::GetExecutorStats(ServerContext* context,
                                                const ::ExecutorStatsRequest* request,
                                                ::ExecutorStatsResponse* response) {
    if (!request->executor_id().empty()) {
        auto stats = theSensor->getExecutorCacheStats(request->executor_id());
        if (!stats) {
            // Nothing reported yet: no rows and a zero total
            CacheStats{}.toProto(response->mutable_total());
            return Status::OK;
        }
        auto* entry = response->add_executors();
        entry->set_executor_id(request->executor_id());
        stats->toProto(entry->mutable_stats());
        stats->toProto(response->mutable_total());
        return Status::OK;
    }

    // Sum the same snapshot that is returned so the total always matches the rows
    CacheStats total;
    for (const auto& [executor_id, stats] : theSensor->getExecutorToCacheStats()) {
        auto* entry = response->add_executors();
        entry->set_executor_id(executor_id);
        stats.toProto(entry->mutable_stats());
        total = total + stats;
    }
    total.toProto(response->mutable_total());

    return Status::OK;
}
