#include "docledger/TransportParams.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include "docledger/Errors.hpp"

using json = nlohmann::json;

namespace docledger {

namespace {

std::size_t positiveField(const json& val, const std::string& key) {
    if (!val.is_number_integer()) {
        throw ConfigError("bulk parameter '" + key + "' must be an integer");
    }
    if (val.is_number_unsigned()) {
        auto v = val.get<uint64_t>();
        if (v == 0) throw ConfigError("bulk parameter '" + key + "' must be >= 1");
        return static_cast<std::size_t>(v);
    }
    auto v = val.get<int64_t>();
    if (v < 1) throw ConfigError("bulk parameter '" + key + "' must be >= 1");
    return static_cast<std::size_t>(v);
}

void envOverride(const char* name, std::size_t& target) {
    const char* raw = std::getenv(name);
    if (!raw) return;
    try {
        auto v = std::stoull(raw);
        if (v >= 1) {
            target = static_cast<std::size_t>(v);
            return;
        }
    } catch (const std::exception&) {
    }
    std::cerr << "TransportParams: ignoring invalid " << name << "=" << raw << "\n";
}

} // namespace

TransportParams TransportParams::fromJson(const json& j) {
    TransportParams params;
    if (j.is_null()) return params;
    if (!j.is_object()) throw ConfigError("bulk parameters must be a JSON object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& key = it.key();
        if (key == "thread_count") params.threadCount = positiveField(it.value(), key);
        else if (key == "chunk_size") params.chunkSize = positiveField(it.value(), key);
        else if (key == "max_chunk_bytes") params.maxChunkBytes = positiveField(it.value(), key);
        else if (key == "queue_size") params.queueSize = positiveField(it.value(), key);
        else throw ConfigError("unknown bulk parameter: " + key);
    }
    return params;
}

TransportParams TransportParams::fromEnvironment() {
    TransportParams params;
    envOverride("DOCLEDGER_BULK_THREADS", params.threadCount);
    envOverride("DOCLEDGER_BULK_CHUNK_SIZE", params.chunkSize);
    envOverride("DOCLEDGER_BULK_MAX_CHUNK_BYTES", params.maxChunkBytes);
    envOverride("DOCLEDGER_BULK_QUEUE_SIZE", params.queueSize);
    return params;
}

json TransportParams::toJson() const {
    return json{
        {"thread_count", threadCount},
        {"chunk_size", chunkSize},
        {"max_chunk_bytes", maxChunkBytes},
        {"queue_size", queueSize}
    };
}

void TransportParams::validate() const {
    if (threadCount == 0) throw ConfigError("thread_count must be >= 1");
    if (chunkSize == 0) throw ConfigError("chunk_size must be >= 1");
    if (maxChunkBytes == 0) throw ConfigError("max_chunk_bytes must be >= 1");
    if (queueSize == 0) throw ConfigError("queue_size must be >= 1");
}

} // namespace docledger
