#include "fiber_sensor.hpp"
#include "status_serde.hpp"
#include <functional>
#include <iostream>

FiberSensor::FiberSensor(bool verbose, size_t shard_count) : verbose(verbose) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    fileShards.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        fileShards.push_back(std::make_unique<Shard>());
    }
}

std::string FiberSensor::hostId(const std::string& host_name, const std::string& executor_id) {
    return std::string(OAP_CACHE_HOST_PREFIX) + host_name + OAP_CACHE_EXECUTOR_PREFIX + executor_id;
}

std::optional<std::pair<std::string, std::string>> FiberSensor::parseHostId(const std::string& host_id) {
    const std::string host_prefix(OAP_CACHE_HOST_PREFIX);
    const std::string executor_prefix(OAP_CACHE_EXECUTOR_PREFIX);

    if (host_id.compare(0, host_prefix.size(), host_prefix) != 0) {
        return std::nullopt;
    }

    size_t marker = host_id.rfind(executor_prefix);
    if (marker == std::string::npos || marker < host_prefix.size()) {
        return std::nullopt;
    }

    return std::make_pair(host_id.substr(host_prefix.size(), marker - host_prefix.size()),
                          host_id.substr(marker + executor_prefix.size()));
}

FiberSensor::Shard& FiberSensor::shardFor(const std::string& file) const {
    size_t hash = std::hash<std::string>{}(file);
    return *fileShards[hash % fileShards.size()];
}

FiberSensor::FileSlot* FiberSensor::findSlot(const std::string& file) const {
    Shard& shard = shardFor(file);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.index.find(file);
    if (it == shard.index.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::shared_ptr<const HostFiberCache> FiberSensor::loadRecord(const std::string& file) const {
    FileSlot* slot = findSlot(file);
    if (slot == nullptr) {
        return nullptr;
    }
    return std::atomic_load(&slot->record);
}

bool FiberSensor::offer(std::shared_ptr<const HostFiberCache> candidate) {
    const std::string& file = candidate->status.file();

    FileSlot* slot = findSlot(file);
    if (slot == nullptr) {
        Shard& shard = shardFor(file);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto& entry = shard.index[file];
        if (!entry) {
            // First report for this file, nobody else can see the slot yet
            entry = std::make_unique<FileSlot>();
            entry->record = std::move(candidate);
            return true;
        }
        // Lost the insert race, fall through to compare against the winner
        slot = entry.get();
    }

    // Compare-and-swap so that two racing reports cannot both replace a
    // record the other one already beat
    std::shared_ptr<const HostFiberCache> current = std::atomic_load(&slot->record);
    while (true) {
        if (current && !candidate->status.moreCacheThan(current->status)) {
            return false;
        }
        if (std::atomic_compare_exchange_weak(&slot->record, &current, candidate)) {
            return true;
        }
    }
}

void FiberSensor::updateLocations(const std::string& host_name,
                                  const std::string& executor_id,
                                  const std::string& customized_info) {
    std::string host = hostId(host_name, executor_id);

    // Decode everything before touching the map: a bad payload applies nothing
    std::vector<FiberCacheStatus> fibers_on_executor = CacheStatusSerDe::deserialize(customized_info);

    size_t replaced = 0;
    for (auto& status : fibers_on_executor) {
        auto candidate = std::make_shared<const HostFiberCache>(HostFiberCache{host, std::move(status)});
        if (offer(std::move(candidate))) {
            replaced++;
        }
    }

    if (verbose) {
        std::cout << "[DEBUG] Got updated fiber info from host: " << host_name
                  << ", executorId: " << executor_id
                  << ", host is " << host
                  << ", info array len is " << fibers_on_executor.size()
                  << ", " << replaced << " locations updated\n";
    }
}

void FiberSensor::updateMetrics(const std::string& executor_id,
                                const std::string& host_name,
                                const std::string& customized_info) {
    if (customized_info.empty()) {
        return;
    }

    try {
        CacheStats cache_metrics = CacheStats::parse(customized_info);
        {
            std::unique_lock<std::shared_mutex> lock(stats_mutex);
            executorToCacheStats[executor_id] = cache_metrics;
        }
        if (verbose) {
            std::cout << "[DEBUG] execID: " << executor_id << ", host: " << host_name
                      << ", " << cache_metrics.toDebugString() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] FiberSensor failed to parse cache stats from executor "
                  << executor_id << " on " << host_name << ": " << e.what() << "\n";
    }
}

std::vector<std::string> FiberSensor::getHosts(const std::string& file_path) const {
    auto record = loadRecord(file_path);
    if (!record) {
        return {};
    }
    return {record->host};
}

std::optional<HostFiberCache> FiberSensor::getFileCacheStatus(const std::string& file_path) const {
    auto record = loadRecord(file_path);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::unordered_map<std::string, CacheStats> FiberSensor::getExecutorToCacheStats() const {
    std::shared_lock<std::shared_mutex> lock(stats_mutex);
    return executorToCacheStats;
}

std::optional<CacheStats> FiberSensor::getExecutorCacheStats(const std::string& executor_id) const {
    std::shared_lock<std::shared_mutex> lock(stats_mutex);
    auto it = executorToCacheStats.find(executor_id);
    if (it == executorToCacheStats.end()) {
        return std::nullopt;
    }
    return it->second;
}

CacheStats FiberSensor::totalCacheStats() const {
    std::shared_lock<std::shared_mutex> lock(stats_mutex);
    CacheStats total;
    for (const auto& [executor_id, stats] : executorToCacheStats) {
        total = total + stats;
    }
    return total;
}

size_t FiberSensor::fileCount() const {
    size_t count = 0;
    for (const auto& shard : fileShards) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        count += shard->index.size();
    }
    return count;
}

size_t FiberSensor::executorCount() const {
    std::shared_lock<std::shared_mutex> lock(stats_mutex);
    return executorToCacheStats.size();
}
