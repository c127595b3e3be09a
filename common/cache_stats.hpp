#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

class CacheStatsReport;

// Raised when a stats payload cannot be turned into CacheStats
class CacheStatsParseError : public std::runtime_error {
public:
    explicit CacheStatsParseError(const std::string& what) : std::runtime_error(what) {}
};

// Cache utilization snapshot of one executor
struct CacheStats {
    uint64_t data_fiber_count = 0;
    uint64_t data_fiber_size = 0;
    uint64_t index_fiber_count = 0;
    uint64_t index_fiber_size = 0;
    uint64_t pending_fiber_count = 0;
    uint64_t pending_fiber_size = 0;
    uint64_t data_fiber_hit_count = 0;
    uint64_t data_fiber_miss_count = 0;
    uint64_t data_fiber_load_count = 0;
    uint64_t data_total_load_time = 0;   // nanoseconds
    uint64_t data_eviction_count = 0;
    uint64_t index_fiber_hit_count = 0;
    uint64_t index_fiber_miss_count = 0;
    uint64_t index_fiber_load_count = 0;
    uint64_t index_total_load_time = 0;  // nanoseconds
    uint64_t index_eviction_count = 0;

    // Parse a serialized CacheStatsReport; throws CacheStatsParseError
    static CacheStats parse(const std::string& payload);
    static CacheStats fromProto(const CacheStatsReport& report);

    std::string serialize() const;
    void toProto(CacheStatsReport* report) const;

    uint64_t hitCount() const { return data_fiber_hit_count + index_fiber_hit_count; }
    uint64_t missCount() const { return data_fiber_miss_count + index_fiber_miss_count; }
    uint64_t cacheCount() const { return data_fiber_count + index_fiber_count; }
    uint64_t cacheSize() const { return data_fiber_size + index_fiber_size; }
    double hitRate() const;

    std::string toDebugString() const;

    CacheStats operator+(const CacheStats& other) const;
    // Field-wise difference, clamped at zero
    CacheStats operator-(const CacheStats& other) const;

    bool operator==(const CacheStats& other) const;
    bool operator!=(const CacheStats& other) const { return !(*this == other); }
};
