#pragma once

#include "fiber_sensor.hpp"
#include "sensor.grpc.pb.h"

// Delivers executor custom info updates to a FiberSensor and answers
// scheduler / monitoring queries against it
class FiberSensorServiceImpl final : public FiberSensorService::Service {
private:
    FiberSensor* theSensor;

public:
    explicit FiberSensorServiceImpl(FiberSensor* aSensor) : theSensor(aSensor) {}

    grpc::Status ReportCustomInfo(grpc::ServerContext* context,
                                  const ::CustomInfoUpdate* request,
                                  ::ReportAck* response) override;

    grpc::Status GetHosts(grpc::ServerContext* context,
                          const ::HostsRequest* request,
                          ::HostsResponse* response) override;

    grpc::Status GetExecutorStats(grpc::ServerContext* context,
                                  const ::ExecutorStatsRequest* request,
                                  ::ExecutorStatsResponse* response) override;
};
