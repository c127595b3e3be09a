#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Fixed-size bit set, one bit per fiber of a file
class FiberBitSet {
private:
    size_t num_bits;
    std::vector<uint64_t> words;

    void checkIndex(size_t index) const;

public:
    explicit FiberBitSet(size_t num_bits = 0);

    // Rebuild from the packed words of a wire payload.
    // words.size() must equal wordsFor(num_bits).
    FiberBitSet(size_t num_bits, std::vector<uint64_t> words);

    static size_t wordsFor(size_t num_bits) { return (num_bits + 63) / 64; }

    void set(size_t index);
    void unset(size_t index);
    bool get(size_t index) const;

    // Number of set bits
    size_t cardinality() const;
    size_t capacity() const { return num_bits; }
    const std::vector<uint64_t>& data() const { return words; }

    bool operator==(const FiberBitSet& other) const {
        return num_bits == other.num_bits && words == other.words;
    }
};

// Cache coverage of one file on one executor at one point in time
class FiberCacheStatus {
private:
    std::string file_;
    FiberBitSet bitmask_;
    int32_t group_count_;
    int32_t field_count_;
    size_t cached_fiber_count_;

public:
    FiberCacheStatus(std::string file, FiberBitSet bitmask,
                     int32_t group_count, int32_t field_count);

    const std::string& file() const { return file_; }
    const FiberBitSet& bitmask() const { return bitmask_; }
    int32_t groupCount() const { return group_count_; }
    int32_t fieldCount() const { return field_count_; }
    size_t cachedFiberCount() const { return cached_fiber_count_; }

    // Strictly more fibers cached than other; equal counts keep the existing entry
    bool moreCacheThan(const FiberCacheStatus& other) const {
        return cached_fiber_count_ > other.cached_fiber_count_;
    }

    bool operator==(const FiberCacheStatus& other) const {
        return file_ == other.file_ && bitmask_ == other.bitmask_ &&
               group_count_ == other.group_count_ && field_count_ == other.field_count_;
    }
};
