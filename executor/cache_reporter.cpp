#include "cache_reporter.hpp"
#include "status_serde.hpp"
#include <iostream>

CacheReporter::CacheReporter(FiberCacheTracker* tracker,
                             std::shared_ptr<grpc::ChannelInterface> channel,
                             const std::string& executor_id,
                             const std::string& host_name,
                             std::chrono::milliseconds interval)
    : tracker(tracker),
      stub(FiberSensorService::NewStub(channel)),
      executor_id(executor_id),
      host_name(host_name),
      interval(interval) {
}

CacheReporter::~CacheReporter() {
    stop();
}

bool CacheReporter::send(CustomInfoKind kind, const std::string& payload) {
    CustomInfoUpdate update;
    update.set_executor_id(executor_id);
    update.set_host_name(host_name);
    update.set_kind(kind);
    update.set_customized_info(payload);

    ReportAck ack;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));

    grpc::Status status = stub->ReportCustomInfo(&context, update, &ack);
    if (!status.ok() || !ack.ok()) {
        std::cerr << "[WARNING] " << (kind == FIBER_STATUS ? "Fiber status" : "Cache stats")
                  << " report failed: " << (status.ok() ? ack.message() : status.error_message()) << "\n";
        return false;
    }
    return true;
}

bool CacheReporter::reportOnce() {
    auto statuses = tracker->statuses();
    bool status_ok = send(FIBER_STATUS, CacheStatusSerDe::serialize(statuses));
    bool stats_ok = send(CACHE_STATS, tracker->statsReport());

    if (status_ok && stats_ok) {
        std::cout << "[HEARTBEAT] Sent successfully - "
                  << "Files: " << statuses.size()
                  << ", Executor: " << executor_id << "@" << host_name << "\n";
    }
    return status_ok && stats_ok;
}

void CacheReporter::reportLoop() {
    while (running.load()) {
        reportOnce();

        std::unique_lock<std::mutex> lock(wait_mutex);
        wait_cv.wait_for(lock, interval, [this] { return !running.load(); });
    }
    std::cout << "[INFO] Reporter thread exiting\n";
}

void CacheReporter::start() {
    if (running.exchange(true)) {
        return;
    }
    reporter_thread = std::thread(&CacheReporter::reportLoop, this);
}

void CacheReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        if (!running.exchange(false)) {
            return;
        }
    }
    wait_cv.notify_all();
    if (reporter_thread.joinable()) {
        reporter_thread.join();
    }
}
