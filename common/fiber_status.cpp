#include "fiber_status.hpp"
#include <bitset>
#include <stdexcept>
#include <utility>

FiberBitSet::FiberBitSet(size_t num_bits) : num_bits(num_bits), words(wordsFor(num_bits), 0) {
}

FiberBitSet::FiberBitSet(size_t num_bits, std::vector<uint64_t> words)
    : num_bits(num_bits), words(std::move(words)) {
    if (this->words.size() != wordsFor(num_bits)) {
        throw std::invalid_argument("FiberBitSet: " + std::to_string(this->words.size()) +
                                    " words cannot hold exactly " + std::to_string(num_bits) + " bits");
    }

    // Bits past num_bits must never count towards cardinality
    size_t tail = num_bits % 64;
    if (tail != 0) {
        this->words.back() &= (uint64_t{1} << tail) - 1;
    }
}

void FiberBitSet::checkIndex(size_t index) const {
    if (index >= num_bits) {
        throw std::out_of_range("FiberBitSet: index " + std::to_string(index) +
                                " out of range for " + std::to_string(num_bits) + " bits");
    }
}

void FiberBitSet::set(size_t index) {
    checkIndex(index);
    words[index / 64] |= uint64_t{1} << (index % 64);
}

void FiberBitSet::unset(size_t index) {
    checkIndex(index);
    words[index / 64] &= ~(uint64_t{1} << (index % 64));
}

bool FiberBitSet::get(size_t index) const {
    checkIndex(index);
    return (words[index / 64] >> (index % 64)) & 1;
}

size_t FiberBitSet::cardinality() const {
    size_t count = 0;
    for (uint64_t word : words) {
        count += std::bitset<64>(word).count();
    }
    return count;
}

FiberCacheStatus::FiberCacheStatus(std::string file, FiberBitSet bitmask,
                                   int32_t group_count, int32_t field_count)
    : file_(std::move(file)),
      bitmask_(std::move(bitmask)),
      group_count_(group_count),
      field_count_(field_count) {
    cached_fiber_count_ = bitmask_.cardinality();
}
