#include "status_serde.hpp"
#include "sensor.pb.h"

std::string CacheStatusSerDe::serialize(const std::vector<FiberCacheStatus>& statuses) {
    FiberCacheStatusBatch batch;
    for (const auto& status : statuses) {
        auto* entry = batch.add_statuses();
        entry->set_file(status.file());
        entry->set_num_bits(static_cast<uint32_t>(status.bitmask().capacity()));
        for (uint64_t word : status.bitmask().data()) {
            entry->add_words(word);
        }
        entry->set_group_count(status.groupCount());
        entry->set_field_count(status.fieldCount());
    }
    return batch.SerializeAsString();
}

std::vector<FiberCacheStatus> CacheStatusSerDe::deserialize(const std::string& payload) {
    FiberCacheStatusBatch batch;
    if (!batch.ParseFromString(payload)) {
        throw CacheStatusDecodeError("malformed fiber status payload (" +
                                     std::to_string(payload.size()) + " bytes)");
    }

    std::vector<FiberCacheStatus> statuses;
    statuses.reserve(batch.statuses_size());

    for (int i = 0; i < batch.statuses_size(); ++i) {
        const auto& entry = batch.statuses(i);
        std::string where = "entry " + std::to_string(i);

        if (entry.file().empty()) {
            throw CacheStatusDecodeError(where + ": empty file identifier");
        }
        where += " (" + entry.file() + ")";

        if (entry.group_count() < 0 || entry.field_count() < 0) {
            throw CacheStatusDecodeError(where + ": negative group or field count");
        }

        size_t expected_words = FiberBitSet::wordsFor(entry.num_bits());
        if (static_cast<size_t>(entry.words_size()) != expected_words) {
            throw CacheStatusDecodeError(where + ": bitmask of " + std::to_string(entry.num_bits()) +
                                         " bits needs " + std::to_string(expected_words) +
                                         " words, got " + std::to_string(entry.words_size()));
        }

        std::vector<uint64_t> words(entry.words().begin(), entry.words().end());
        statuses.emplace_back(entry.file(),
                              FiberBitSet(entry.num_bits(), std::move(words)),
                              entry.group_count(),
                              entry.field_count());
    }

    return statuses;
}
