#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>

namespace docledger {

// Tuning knobs for a bulk submission. They change how work is chunked and
// parallelized, never which items succeed.
struct TransportParams {
    std::size_t threadCount = 4;
    std::size_t chunkSize = 500;
    std::size_t maxChunkBytes = 100 * 1024 * 1024;
    std::size_t queueSize = 4;

    static TransportParams defaults() { return TransportParams{}; }

    // Accepts thread_count, chunk_size, max_chunk_bytes, queue_size.
    // Throws ConfigError on unknown keys or values below 1.
    static TransportParams fromJson(const nlohmann::json& j);

    // Applies DOCLEDGER_BULK_THREADS / _CHUNK_SIZE / _MAX_CHUNK_BYTES / _QUEUE_SIZE on top of defaults.
    static TransportParams fromEnvironment();

    nlohmann::json toJson() const;
    void validate() const;

    bool operator==(const TransportParams& other) const {
        return threadCount == other.threadCount && chunkSize == other.chunkSize &&
               maxChunkBytes == other.maxChunkBytes && queueSize == other.queueSize;
    }
    bool operator!=(const TransportParams& other) const { return !(*this == other); }
};

} // namespace docledger
