#pragma once

#include "cache_stats.hpp"
#include "fiber_status.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Executor (by derived host id) holding the most complete cache of a file
struct HostFiberCache {
    std::string host;
    FiberCacheStatus status;
};

// Fiber cache info recorder on the driver: file -> cache location for
// cache-locality scheduling, executor -> cache stats for monitoring.
// Entries are replaced or left stale, never removed.
class FiberSensor {
public:
    static constexpr char OAP_CACHE_HOST_PREFIX[] = "OAP_HOST_";
    static constexpr char OAP_CACHE_EXECUTOR_PREFIX[] = "_OAP_EXECUTOR_";
    static constexpr size_t DEFAULT_FILE_SHARDS = 64;

private:
    // Holds the current record of one file. Slots are created once and
    // never erased, so a slot pointer stays valid after the shard lock is released.
    struct FileSlot {
        std::shared_ptr<const HostFiberCache> record;
    };

    // The shard mutex guards the index only; records are swapped with
    // atomic shared_ptr operations on the slot.
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::unique_ptr<FileSlot>> index;
    };

    std::vector<std::unique_ptr<Shard>> fileShards;
    bool verbose;

    mutable std::shared_mutex stats_mutex;
    std::unordered_map<std::string, CacheStats> executorToCacheStats;  // executor id -> latest stats

    Shard& shardFor(const std::string& file) const;
    FileSlot* findSlot(const std::string& file) const;
    std::shared_ptr<const HostFiberCache> loadRecord(const std::string& file) const;

    // Keep candidate if the file has no record yet or candidate is strictly
    // more complete. Returns true if candidate was stored.
    bool offer(std::shared_ptr<const HostFiberCache> candidate);

public:
    explicit FiberSensor(bool verbose = false, size_t shard_count = DEFAULT_FILE_SHARDS);

    static std::string hostId(const std::string& host_name, const std::string& executor_id);
    // Inverse of hostId: (host name, executor id), or nullopt if not a host id
    static std::optional<std::pair<std::string, std::string>> parseHostId(const std::string& host_id);

    // Apply a serialized fiber status batch reported by an executor.
    // Throws CacheStatusDecodeError (nothing applied) if the payload is malformed.
    void updateLocations(const std::string& host_name,
                         const std::string& executor_id,
                         const std::string& customized_info);

    // Replace the executor's cache stats. Empty payloads are ignored; parse
    // failures are logged and leave the previous stats in place.
    void updateMetrics(const std::string& executor_id,
                       const std::string& host_name,
                       const std::string& customized_info);

    /**
     * Hosts that have fibers of the file cached.
     * Only the most complete host is tracked, so the result has at most one element.
     */
    std::vector<std::string> getHosts(const std::string& file_path) const;

    std::optional<HostFiberCache> getFileCacheStatus(const std::string& file_path) const;

    // Snapshot of the latest stats per executor
    std::unordered_map<std::string, CacheStats> getExecutorToCacheStats() const;
    std::optional<CacheStats> getExecutorCacheStats(const std::string& executor_id) const;
    CacheStats totalCacheStats() const;

    size_t fileCount() const;
    size_t executorCount() const;
};
