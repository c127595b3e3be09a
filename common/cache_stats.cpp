#include "cache_stats.hpp"
#include "sensor.pb.h"
#include <sstream>

namespace {

uint64_t saturatingSub(uint64_t a, uint64_t b) {
    return a > b ? a - b : 0;
}

} // namespace

CacheStats CacheStats::parse(const std::string& payload) {
    CacheStatsReport report;
    if (!report.ParseFromString(payload)) {
        throw CacheStatsParseError("malformed cache stats payload (" +
                                   std::to_string(payload.size()) + " bytes)");
    }

    return fromProto(report);
}

CacheStats CacheStats::fromProto(const CacheStatsReport& report) {
    CacheStats stats;
    stats.data_fiber_count = report.data_fiber_count();
    stats.data_fiber_size = report.data_fiber_size();
    stats.index_fiber_count = report.index_fiber_count();
    stats.index_fiber_size = report.index_fiber_size();
    stats.pending_fiber_count = report.pending_fiber_count();
    stats.pending_fiber_size = report.pending_fiber_size();
    stats.data_fiber_hit_count = report.data_fiber_hit_count();
    stats.data_fiber_miss_count = report.data_fiber_miss_count();
    stats.data_fiber_load_count = report.data_fiber_load_count();
    stats.data_total_load_time = report.data_total_load_time();
    stats.data_eviction_count = report.data_eviction_count();
    stats.index_fiber_hit_count = report.index_fiber_hit_count();
    stats.index_fiber_miss_count = report.index_fiber_miss_count();
    stats.index_fiber_load_count = report.index_fiber_load_count();
    stats.index_total_load_time = report.index_total_load_time();
    stats.index_eviction_count = report.index_eviction_count();
    return stats;
}

void CacheStats::toProto(CacheStatsReport* report) const {
    report->set_data_fiber_count(data_fiber_count);
    report->set_data_fiber_size(data_fiber_size);
    report->set_index_fiber_count(index_fiber_count);
    report->set_index_fiber_size(index_fiber_size);
    report->set_pending_fiber_count(pending_fiber_count);
    report->set_pending_fiber_size(pending_fiber_size);
    report->set_data_fiber_hit_count(data_fiber_hit_count);
    report->set_data_fiber_miss_count(data_fiber_miss_count);
    report->set_data_fiber_load_count(data_fiber_load_count);
    report->set_data_total_load_time(data_total_load_time);
    report->set_data_eviction_count(data_eviction_count);
    report->set_index_fiber_hit_count(index_fiber_hit_count);
    report->set_index_fiber_miss_count(index_fiber_miss_count);
    report->set_index_fiber_load_count(index_fiber_load_count);
    report->set_index_total_load_time(index_total_load_time);
    report->set_index_eviction_count(index_eviction_count);
}

std::string CacheStats::serialize() const {
    CacheStatsReport report;
    toProto(&report);
    return report.SerializeAsString();
}

double CacheStats::hitRate() const {
    uint64_t lookups = hitCount() + missCount();
    if (lookups == 0) {
        return 0.0;
    }
    return static_cast<double>(hitCount()) / lookups;
}

std::string CacheStats::toDebugString() const {
    std::ostringstream ss;
    ss << "CacheStats: {"
       << "dataCacheCount: " << data_fiber_count
       << ", dataCacheSize: " << data_fiber_size
       << ", indexCacheCount: " << index_fiber_count
       << ", indexCacheSize: " << index_fiber_size
       << ", pendingFiberCount: " << pending_fiber_count
       << ", pendingFiberSize: " << pending_fiber_size
       << ", hitCount: " << hitCount()
       << ", missCount: " << missCount()
       << ", dataLoadCount: " << data_fiber_load_count
       << ", dataTotalLoadTime: " << data_total_load_time
       << ", dataEvictionCount: " << data_eviction_count
       << ", indexLoadCount: " << index_fiber_load_count
       << ", indexTotalLoadTime: " << index_total_load_time
       << ", indexEvictionCount: " << index_eviction_count
       << "}";
    return ss.str();
}

CacheStats CacheStats::operator+(const CacheStats& other) const {
    CacheStats sum;
    sum.data_fiber_count = data_fiber_count + other.data_fiber_count;
    sum.data_fiber_size = data_fiber_size + other.data_fiber_size;
    sum.index_fiber_count = index_fiber_count + other.index_fiber_count;
    sum.index_fiber_size = index_fiber_size + other.index_fiber_size;
    sum.pending_fiber_count = pending_fiber_count + other.pending_fiber_count;
    sum.pending_fiber_size = pending_fiber_size + other.pending_fiber_size;
    sum.data_fiber_hit_count = data_fiber_hit_count + other.data_fiber_hit_count;
    sum.data_fiber_miss_count = data_fiber_miss_count + other.data_fiber_miss_count;
    sum.data_fiber_load_count = data_fiber_load_count + other.data_fiber_load_count;
    sum.data_total_load_time = data_total_load_time + other.data_total_load_time;
    sum.data_eviction_count = data_eviction_count + other.data_eviction_count;
    sum.index_fiber_hit_count = index_fiber_hit_count + other.index_fiber_hit_count;
    sum.index_fiber_miss_count = index_fiber_miss_count + other.index_fiber_miss_count;
    sum.index_fiber_load_count = index_fiber_load_count + other.index_fiber_load_count;
    sum.index_total_load_time = index_total_load_time + other.index_total_load_time;
    sum.index_eviction_count = index_eviction_count + other.index_eviction_count;
    return sum;
}

CacheStats CacheStats::operator-(const CacheStats& other) const {
    CacheStats diff;
    diff.data_fiber_count = saturatingSub(data_fiber_count, other.data_fiber_count);
    diff.data_fiber_size = saturatingSub(data_fiber_size, other.data_fiber_size);
    diff.index_fiber_count = saturatingSub(index_fiber_count, other.index_fiber_count);
    diff.index_fiber_size = saturatingSub(index_fiber_size, other.index_fiber_size);
    diff.pending_fiber_count = saturatingSub(pending_fiber_count, other.pending_fiber_count);
    diff.pending_fiber_size = saturatingSub(pending_fiber_size, other.pending_fiber_size);
    diff.data_fiber_hit_count = saturatingSub(data_fiber_hit_count, other.data_fiber_hit_count);
    diff.data_fiber_miss_count = saturatingSub(data_fiber_miss_count, other.data_fiber_miss_count);
    diff.data_fiber_load_count = saturatingSub(data_fiber_load_count, other.data_fiber_load_count);
    diff.data_total_load_time = saturatingSub(data_total_load_time, other.data_total_load_time);
    diff.data_eviction_count = saturatingSub(data_eviction_count, other.data_eviction_count);
    diff.index_fiber_hit_count = saturatingSub(index_fiber_hit_count, other.index_fiber_hit_count);
    diff.index_fiber_miss_count = saturatingSub(index_fiber_miss_count, other.index_fiber_miss_count);
    diff.index_fiber_load_count = saturatingSub(index_fiber_load_count, other.index_fiber_load_count);
    diff.index_total_load_time = saturatingSub(index_total_load_time, other.index_total_load_time);
    diff.index_eviction_count = saturatingSub(index_eviction_count, other.index_eviction_count);
    return diff;
}

bool CacheStats::operator==(const CacheStats& other) const {
    return data_fiber_count == other.data_fiber_count &&
           data_fiber_size == other.data_fiber_size &&
           index_fiber_count == other.index_fiber_count &&
           index_fiber_size == other.index_fiber_size &&
           pending_fiber_count == other.pending_fiber_count &&
           pending_fiber_size == other.pending_fiber_size &&
           data_fiber_hit_count == other.data_fiber_hit_count &&
           data_fiber_miss_count == other.data_fiber_miss_count &&
           data_fiber_load_count == other.data_fiber_load_count &&
           data_total_load_time == other.data_total_load_time &&
           data_eviction_count == other.data_eviction_count &&
           index_fiber_hit_count == other.index_fiber_hit_count &&
           index_fiber_miss_count == other.index_fiber_miss_count &&
           index_fiber_load_count == other.index_fiber_load_count &&
           index_total_load_time == other.index_total_load_time &&
           index_eviction_count == other.index_eviction_count;
}
