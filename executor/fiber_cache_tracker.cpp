#include "fiber_cache_tracker.hpp"
#include "status_serde.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

void FiberCacheTracker::registerFile(const std::string& file, int32_t group_count, int32_t field_count) {
    if (file.empty()) {
        throw std::invalid_argument("Cannot register a file with an empty path");
    }
    if (group_count < 0 || field_count < 0) {
        throw std::invalid_argument("Negative fiber layout for " + file);
    }

    std::lock_guard<std::mutex> lock(tracker_mutex);

    auto it = files.find(file);
    if (it != files.end()) {
        if (it->second.group_count != group_count || it->second.field_count != field_count) {
            throw std::invalid_argument("File " + file + " already registered with layout " +
                                        std::to_string(it->second.group_count) + "x" +
                                        std::to_string(it->second.field_count));
        }
        return;
    }

    size_t num_bits = static_cast<size_t>(group_count) * static_cast<size_t>(field_count);
    files.emplace(file, TrackedFile{group_count, field_count, FiberBitSet(num_bits), {}});
}

TrackedFile& FiberCacheTracker::lookupFile(const std::string& file) {
    auto it = files.find(file);
    if (it == files.end()) {
        throw std::out_of_range("File not registered: " + file);
    }
    return it->second;
}

size_t FiberCacheTracker::fiberIndex(const TrackedFile& tracked, int32_t group_id, int32_t field_id) const {
    if (group_id < 0 || group_id >= tracked.group_count ||
        field_id < 0 || field_id >= tracked.field_count) {
        throw std::out_of_range("Fiber (" + std::to_string(group_id) + ", " + std::to_string(field_id) +
                                ") outside of " + std::to_string(tracked.group_count) + "x" +
                                std::to_string(tracked.field_count) + " layout");
    }
    return static_cast<size_t>(group_id) * tracked.field_count + field_id;
}

bool FiberCacheTracker::markCached(const std::string& file, int32_t group_id, int32_t field_id,
                                   uint64_t size_bytes) {
    std::lock_guard<std::mutex> lock(tracker_mutex);

    TrackedFile& tracked = lookupFile(file);
    size_t index = fiberIndex(tracked, group_id, field_id);
    if (tracked.bitmask.get(index)) {
        return false;
    }

    tracked.bitmask.set(index);
    tracked.fiber_sizes[index] = size_bytes;
    counters.data_fiber_count++;
    counters.data_fiber_size += size_bytes;
    return true;
}

bool FiberCacheTracker::markEvicted(const std::string& file, int32_t group_id, int32_t field_id) {
    std::lock_guard<std::mutex> lock(tracker_mutex);

    TrackedFile& tracked = lookupFile(file);
    size_t index = fiberIndex(tracked, group_id, field_id);
    if (!tracked.bitmask.get(index)) {
        return false;
    }

    tracked.bitmask.unset(index);
    counters.data_fiber_count--;
    counters.data_fiber_size -= tracked.fiber_sizes[index];
    tracked.fiber_sizes.erase(index);
    counters.data_eviction_count++;
    return true;
}

void FiberCacheTracker::recordHit(FiberKind kind) {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    if (kind == FiberKind::Data) {
        counters.data_fiber_hit_count++;
    } else {
        counters.index_fiber_hit_count++;
    }
}

void FiberCacheTracker::recordMiss(FiberKind kind) {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    if (kind == FiberKind::Data) {
        counters.data_fiber_miss_count++;
    } else {
        counters.index_fiber_miss_count++;
    }
}

void FiberCacheTracker::recordLoad(FiberKind kind, uint64_t duration_nanos) {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    if (kind == FiberKind::Data) {
        counters.data_fiber_load_count++;
        counters.data_total_load_time += duration_nanos;
    } else {
        counters.index_fiber_load_count++;
        counters.index_total_load_time += duration_nanos;
    }
}

void FiberCacheTracker::recordEviction(FiberKind kind) {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    if (kind == FiberKind::Data) {
        counters.data_eviction_count++;
    } else {
        counters.index_eviction_count++;
    }
}

void FiberCacheTracker::setIndexCache(uint64_t fiber_count, uint64_t size_bytes) {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    counters.index_fiber_count = fiber_count;
    counters.index_fiber_size = size_bytes;
}

void FiberCacheTracker::setPending(uint64_t fiber_count, uint64_t size_bytes) {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    counters.pending_fiber_count = fiber_count;
    counters.pending_fiber_size = size_bytes;
}

std::vector<FiberCacheStatus> FiberCacheTracker::statuses() const {
    std::lock_guard<std::mutex> lock(tracker_mutex);

    std::vector<FiberCacheStatus> result;
    for (const auto& [file, tracked] : files) {
        if (tracked.bitmask.cardinality() == 0) {
            continue;
        }
        result.emplace_back(file, tracked.bitmask, tracked.group_count, tracked.field_count);
    }
    return result;
}

CacheStats FiberCacheTracker::stats() const {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    return counters;
}

std::string FiberCacheTracker::statusReport() const {
    return CacheStatusSerDe::serialize(statuses());
}

std::string FiberCacheTracker::statsReport() const {
    return stats().serialize();
}

size_t FiberCacheTracker::loadManifest(const std::string& manifest_path) {
    std::ifstream manifest(manifest_path);
    if (!manifest.is_open()) {
        throw std::runtime_error("Cannot open manifest: " + manifest_path);
    }

    size_t loaded = 0;
    std::string line;
    int line_number = 0;

    while (std::getline(manifest, line)) {
        line_number++;

        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string file;
        int32_t group_count = 0;
        int32_t field_count = 0;
        if (!(iss >> file >> group_count >> field_count)) {
            throw std::runtime_error(manifest_path + ":" + std::to_string(line_number) +
                                     ": expected '<file> <groupCount> <fieldCount> [indices]'");
        }

        registerFile(file, group_count, field_count);

        std::string indices;
        if (iss >> indices) {
            std::istringstream index_stream(indices);
            std::string token;
            while (std::getline(index_stream, token, ',')) {
                if (token.empty()) {
                    continue;
                }
                long index = 0;
                try {
                    size_t consumed = 0;
                    index = std::stol(token, &consumed);
                    if (consumed != token.size()) {
                        throw std::invalid_argument(token);
                    }
                } catch (const std::logic_error&) {
                    throw std::runtime_error(manifest_path + ":" + std::to_string(line_number) +
                                             ": bad fiber index '" + token + "'");
                }
                if (field_count == 0 || index < 0 ||
                    index >= static_cast<long>(group_count) * field_count) {
                    throw std::runtime_error(manifest_path + ":" + std::to_string(line_number) +
                                             ": fiber index " + token + " out of range");
                }
                markCached(file, static_cast<int32_t>(index / field_count),
                           static_cast<int32_t>(index % field_count));
            }
        }

        loaded++;
    }

    std::cout << "[INFO] Loaded " << loaded << " files from manifest " << manifest_path << "\n";
    return loaded;
}

size_t FiberCacheTracker::fileCount() const {
    std::lock_guard<std::mutex> lock(tracker_mutex);
    return files.size();
}
