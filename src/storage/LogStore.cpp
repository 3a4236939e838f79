#include "docledger/LogStore.hpp"

#include <filesystem>
#include <iostream>
#include "docledger/Checksum.hpp"

using json = nlohmann::json;

namespace docledger {

namespace {

constexpr uint32_t kMaxRecordBytes = 64u * 1024u * 1024u;

template <typename T>
void writeLE(std::ostream& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        char byte = static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFFu);
        out.write(&byte, 1);
    }
}

template <typename T>
bool readLE(std::istream& in, T& value) {
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        char byte = 0;
        if (!in.read(&byte, 1)) return false;
        v |= static_cast<uint64_t>(static_cast<unsigned char>(byte)) << (8 * i);
    }
    value = static_cast<T>(v);
    return true;
}

} // namespace

LogStore::LogStore(const std::string& logPath) : logPath_(logPath) {
    auto parent = std::filesystem::path(logPath_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "LogStore: failed to create dir " << parent.string() << ": " << ec.message() << "\n";
        }
    }
    ensureOpen();
}

LogStore::~LogStore() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

void LogStore::ensureOpen() {
    if (!stream_.is_open()) {
        stream_.open(logPath_, std::ios::binary | std::ios::app);
        if (!stream_) {
            std::cerr << "LogStore: failed to open " << logPath_ << "\n";
            return;
        }
        stream_.seekp(0, std::ios::end);
        bytes_ = static_cast<uint64_t>(stream_.tellp());
    }
}

bool LogStore::load(const std::function<void(const LogRecord&)>& onRecord) {
    std::ifstream in(logPath_, std::ios::binary);
    if (!in) return true; // nothing to load is not an error

    while (true) {
        uint32_t len = 0;
        if (!readLE(in, len)) break;
        if (len == 0 || len > kMaxRecordBytes) {
            std::cerr << "LogStore: suspicious record length " << len << " in " << logPath_ << "\n";
            return false;
        }

        std::string payload(len, '\0');
        if (!in.read(payload.data(), len)) {
            std::cerr << "LogStore: truncated record tail in " << logPath_ << "\n";
            break;
        }

        uint32_t storedCrc = 0;
        if (!readLE(in, storedCrc)) break;

        if (crc32(payload) != storedCrc) {
            std::cerr << "LogStore: checksum mismatch in " << logPath_ << "; stopping replay\n";
            return false;
        }

        auto rec = json::parse(payload, nullptr, false);
        if (rec.is_discarded() || !rec.is_object()) {
            std::cerr << "LogStore: invalid JSON record; skipping\n";
            continue;
        }

        LogRecord record;
        auto opStr = rec.value("op", "");
        if (opStr == "put") {
            record.op = LogRecord::Op::Put;
        } else if (opStr == "del") {
            record.op = LogRecord::Op::Del;
        } else {
            std::cerr << "LogStore: unknown op '" << opStr << "'; skipping\n";
            continue;
        }
        record.key = rec.value("key", "");
        if (rec.contains("doc")) {
            record.doc = rec["doc"];
        }

        onRecord(record);
    }

    return true;
}

bool LogStore::append(const LogRecord& record) {
    ensureOpen();
    if (!stream_) return false;

    json rec = {
        {"op", record.op == LogRecord::Op::Put ? "put" : "del"},
        {"key", record.key}
    };
    if (record.op == LogRecord::Op::Put) {
        rec["doc"] = record.doc;
    }

    std::string payload = rec.dump();
    uint32_t len = static_cast<uint32_t>(payload.size());

    writeLE(stream_, len);
    stream_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    writeLE(stream_, crc32(payload));
    stream_.flush();
    if (!stream_) {
        std::cerr << "LogStore: write failed for " << logPath_ << "\n";
        return false;
    }
    bytes_ += sizeof(uint32_t) + len + sizeof(uint32_t);
    return true;
}

bool LogStore::reset() {
    if (stream_.is_open()) stream_.close();
    {
        std::ofstream trunc(logPath_, std::ios::binary | std::ios::trunc | std::ios::out);
        if (!trunc) {
            std::cerr << "LogStore: failed to truncate " << logPath_ << "\n";
            return false;
        }
    }
    stream_.clear();
    bytes_ = 0;
    ensureOpen();
    return good();
}

} // namespace docledger
