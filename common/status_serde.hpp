#pragma once

#include "fiber_status.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Raised when a fiber status payload cannot be decoded
class CacheStatusDecodeError : public std::runtime_error {
public:
    explicit CacheStatusDecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Wire codec for batches of FiberCacheStatus (FiberCacheStatusBatch in sensor.proto)
class CacheStatusSerDe {
public:
    static std::string serialize(const std::vector<FiberCacheStatus>& statuses);

    // Decodes the whole batch or throws CacheStatusDecodeError; never returns a partial batch
    static std::vector<FiberCacheStatus> deserialize(const std::string& payload);
};
