#pragma once

#include "cache_stats.hpp"
#include "fiber_status.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class FiberKind { Data, Index };

struct TrackedFile {
    int32_t group_count;
    int32_t field_count;
    FiberBitSet bitmask;
    std::unordered_map<size_t, uint64_t> fiber_sizes;  // fiber index -> cached bytes
};

// Executor-side view of the local fiber cache, the source of the
// status and stats reports sent to the driver
class FiberCacheTracker {
private:
    mutable std::mutex tracker_mutex;
    std::unordered_map<std::string, TrackedFile> files;  // file path -> cached fibers
    CacheStats counters;

    // Should be called with tracker_mutex locked
    TrackedFile& lookupFile(const std::string& file);
    size_t fiberIndex(const TrackedFile& tracked, int32_t group_id, int32_t field_id) const;

public:
    FiberCacheTracker() = default;

    // Register a file with group_count * field_count fibers.
    // Re-registering with the same layout is a no-op, a different layout throws.
    void registerFile(const std::string& file, int32_t group_count, int32_t field_count);

    // Returns false if the fiber was already cached / not cached
    bool markCached(const std::string& file, int32_t group_id, int32_t field_id, uint64_t size_bytes = 0);
    bool markEvicted(const std::string& file, int32_t group_id, int32_t field_id);

    void recordHit(FiberKind kind);
    void recordMiss(FiberKind kind);
    void recordLoad(FiberKind kind, uint64_t duration_nanos);
    void recordEviction(FiberKind kind);
    void setIndexCache(uint64_t fiber_count, uint64_t size_bytes);
    void setPending(uint64_t fiber_count, uint64_t size_bytes);

    // Files with at least one cached fiber
    std::vector<FiberCacheStatus> statuses() const;
    CacheStats stats() const;

    // Serialized payloads for the driver
    std::string statusReport() const;
    std::string statsReport() const;

    // Load "<file> <groupCount> <fieldCount> [idx,idx,...]" lines; returns files loaded
    size_t loadManifest(const std::string& manifest_path);

    size_t fileCount() const;
};
