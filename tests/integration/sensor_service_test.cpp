#include <gtest/gtest.h>
#include "../utils/test_utils.hpp"
#include "sensor_client.hpp"
#include "status_serde.hpp"
#include "sensor.grpc.pb.h"
#include <grpcpp/grpcpp.h>

using test_utils::makeStatus;
using test_utils::sendCustomInfo;

class SensorServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Start driver
        driver_ = std::make_unique<test_utils::TestSensorDriver>();
        ASSERT_TRUE(driver_->start()) << "Failed to start FiberSensor driver";
        
        // Create channel for direct RPC calls
        channel_ = grpc::CreateChannel(driver_->address(), grpc::InsecureChannelCredentials());
        stub_ = FiberSensorService::NewStub(channel_);
        client_ = std::make_unique<FiberSensorClient>(channel_);
    }
    
    void TearDown() override {
        if (driver_) {
            driver_->stop();
        }
    }

    CacheStats createStats(uint64_t cached_fibers, uint64_t hits) {
        CacheStats stats;
        stats.data_fiber_count = cached_fibers;
        stats.data_fiber_size = cached_fibers * 1024;
        stats.data_fiber_hit_count = hits;
        return stats;
    }
    
    std::unique_ptr<test_utils::TestSensorDriver> driver_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<FiberSensorService::Stub> stub_;
    std::unique_ptr<FiberSensorClient> client_;
};

TEST_F(SensorServiceTest, FiberStatusReport) {
    std::string payload = CacheStatusSerDe::serialize({makeStatus("/data/t.parquet", 5)});

    CustomInfoUpdate update;
    update.set_executor_id("3");
    update.set_host_name("worker1");
    update.set_kind(FIBER_STATUS);
    update.set_customized_info(payload);

    ReportAck ack;
    grpc::ClientContext context;
    grpc::Status status = stub_->ReportCustomInfo(&context, update, &ack);

    EXPECT_TRUE(status.ok());
    EXPECT_TRUE(ack.ok());
    EXPECT_FALSE(ack.message().empty());

    EXPECT_EQ(driver_->sensor().getHosts("/data/t.parquet"),
              std::vector<std::string>{"OAP_HOST_worker1_OAP_EXECUTOR_3"});
}

TEST_F(SensorServiceTest, GetHostsForUnknownFile) {
    auto hosts = client_->GetHosts("/data/unknown.parquet");

    ASSERT_TRUE(hosts.has_value());
    EXPECT_TRUE(hosts->empty());
}

TEST_F(SensorServiceTest, GetHostsFollowsMostCompleteReport) {
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "3", "worker1", FIBER_STATUS,
        CacheStatusSerDe::serialize({makeStatus("/data/t.parquet", 5)})).ok());
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "7", "worker2", FIBER_STATUS,
        CacheStatusSerDe::serialize({makeStatus("/data/t.parquet", 8)})).ok());
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "9", "worker3", FIBER_STATUS,
        CacheStatusSerDe::serialize({makeStatus("/data/t.parquet", 2)})).ok());

    auto hosts = client_->GetHosts("/data/t.parquet");

    ASSERT_TRUE(hosts.has_value());
    ASSERT_EQ(hosts->size(), 1);
    EXPECT_EQ((*hosts)[0].host_id(), "OAP_HOST_worker2_OAP_EXECUTOR_7");
    EXPECT_EQ((*hosts)[0].host_name(), "worker2");
    EXPECT_EQ((*hosts)[0].executor_id(), "7");
    EXPECT_EQ((*hosts)[0].cached_fiber_count(), 8);
}

TEST_F(SensorServiceTest, MalformedFiberStatusIsRejected) {
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "1", "hostA", FIBER_STATUS,
        CacheStatusSerDe::serialize({makeStatus("/data/a.parquet", 3)})).ok());

    grpc::Status status = sendCustomInfo(stub_.get(), "2", "hostB", FIBER_STATUS, "not a status payload");

    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_FALSE(status.error_message().empty());

    // Driver keeps serving and the earlier record is intact
    auto hosts = client_->GetHosts("/data/a.parquet");
    ASSERT_TRUE(hosts.has_value());
    ASSERT_EQ(hosts->size(), 1);
    EXPECT_EQ((*hosts)[0].host_id(), FiberSensor::hostId("hostA", "1"));
}

TEST_F(SensorServiceTest, MalformedStatsAreAbsorbed) {
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "1", "hostA", CACHE_STATS,
        createStats(4, 10).serialize()).ok());

    // Bad stats never fail the delivery call
    grpc::Status status = sendCustomInfo(stub_.get(), "1", "hostA", CACHE_STATS, "not a stats payload");
    EXPECT_TRUE(status.ok());

    status = sendCustomInfo(stub_.get(), "1", "hostA", CACHE_STATS, "");
    EXPECT_TRUE(status.ok());

    EXPECT_EQ(driver_->sensor().getExecutorCacheStats("1"), createStats(4, 10));
}

TEST_F(SensorServiceTest, UnknownKindIsRejected) {
    grpc::Status status = sendCustomInfo(stub_.get(), "1", "hostA", CUSTOM_INFO_UNKNOWN, "");

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(SensorServiceTest, ExecutorStatsForAllExecutors) {
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "1", "hostA", CACHE_STATS, createStats(4, 10).serialize()).ok());
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "2", "hostB", CACHE_STATS, createStats(6, 1).serialize()).ok());
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "1", "hostA", CACHE_STATS, createStats(5, 12).serialize()).ok());

    auto view = client_->GetExecutorStats();

    ASSERT_TRUE(view.has_value());
    ASSERT_EQ(view->executors.size(), 2);
    EXPECT_EQ(view->executors[0].first, "1");
    EXPECT_EQ(view->executors[0].second, createStats(5, 12));
    EXPECT_EQ(view->executors[1].first, "2");
    EXPECT_EQ(view->executors[1].second, createStats(6, 1));
    EXPECT_EQ(view->total, createStats(5, 12) + createStats(6, 1));
}

TEST_F(SensorServiceTest, ExecutorStatsForOneExecutor) {
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "1", "hostA", CACHE_STATS, createStats(4, 10).serialize()).ok());
    ASSERT_TRUE(sendCustomInfo(stub_.get(), "2", "hostB", CACHE_STATS, createStats(6, 1).serialize()).ok());

    auto view = client_->GetExecutorStats("2");
    ASSERT_TRUE(view.has_value());
    ASSERT_EQ(view->executors.size(), 1);
    EXPECT_EQ(view->executors[0].second, createStats(6, 1));
    EXPECT_EQ(view->total, createStats(6, 1));

    ExecutorStatsRequest request;
    request.set_executor_id("42");
    ExecutorStatsResponse response;
    grpc::ClientContext context;
    grpc::Status status = stub_->GetExecutorStats(&context, request, &response);
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(response.executors_size(), 0);
    EXPECT_EQ(CacheStats::fromProto(response.total()), CacheStats{});

    auto missing = client_->GetExecutorStats("42");
    ASSERT_TRUE(missing.has_value());
    EXPECT_TRUE(missing->executors.empty());
    EXPECT_EQ(missing->total, CacheStats{});
}

TEST_F(SensorServiceTest, ClientReportsUnreachableDriver) {
    auto channel = grpc::CreateChannel(test_utils::createTestAddress(), grpc::InsecureChannelCredentials());
    FiberSensorClient offline{channel};

    EXPECT_FALSE(offline.GetHosts("/data/t.parquet").has_value());
    EXPECT_FALSE(offline.GetExecutorStats().has_value());
}
