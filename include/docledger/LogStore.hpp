#pragma once

#include <cstdint>
#include <functional>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

namespace docledger {

struct LogRecord {
    enum class Op { Put, Del };
    Op op;
    std::string key;
    nlohmann::json doc;
};

// Append-only log with per-record checksums, one file per document index.
// Record framing: u32 length | JSON payload | u32 crc32(payload).
class LogStore {
public:
    explicit LogStore(const std::string& logPath);
    ~LogStore();

    LogStore(const LogStore&) = delete;
    LogStore& operator=(const LogStore&) = delete;

    // Replay all records; returns false on checksum/format failure.
    // Records before the damaged one have already been delivered.
    bool load(const std::function<void(const LogRecord&)>& onRecord);

    // Append and flush a single record. Returns false if the write failed.
    bool append(const LogRecord& record);

    // Truncate after a checkpoint has captured everything in the log.
    bool reset();

    bool good() const { return static_cast<bool>(stream_); }
    uint64_t bytesWritten() const { return bytes_; }

private:
    std::string logPath_;
    std::ofstream stream_;
    uint64_t bytes_ = 0;

    void ensureOpen();
};

} // namespace docledger
