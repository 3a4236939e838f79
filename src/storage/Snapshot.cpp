#include "docledger/Snapshot.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string_view>
#include <zstd.h>
#include "docledger/Checksum.hpp"

using json = nlohmann::json;

namespace docledger {

namespace {

constexpr uint32_t kSnapshotMagic = 0x4E534C44u; // "DLSN"
constexpr uint64_t kMaxSnapshotBytes = 4ull * 1024ull * 1024ull * 1024ull;

template <typename T>
void writeLE(std::string& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFFu));
    }
}

template <typename T>
bool readLE(std::string_view data, size_t& offset, T& value) {
    if (offset + sizeof(T) > data.size()) return false;
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<uint64_t>(static_cast<unsigned char>(data[offset + i])) << (8 * i);
    }
    value = static_cast<T>(v);
    offset += sizeof(T);
    return true;
}

bool compressZstd(const std::string& in, std::string& out, int level = 3) {
    size_t maxSize = ZSTD_compressBound(in.size());
    out.resize(maxSize);
    size_t written = ZSTD_compress(out.data(), maxSize, in.data(), in.size(), level);
    if (ZSTD_isError(written)) {
        std::cerr << "Snapshot: zstd compress failed: " << ZSTD_getErrorName(written) << "\n";
        return false;
    }
    out.resize(written);
    return true;
}

bool decompressZstd(std::string_view in, uint64_t rawSize, std::string& out) {
    out.resize(static_cast<size_t>(rawSize));
    size_t res = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(res)) {
        std::cerr << "Snapshot: zstd decompress failed: " << ZSTD_getErrorName(res) << "\n";
        return false;
    }
    out.resize(res);
    return true;
}

} // namespace

bool writeSnapshot(const std::string& path, const json& body, bool compress) {
    std::string raw = body.dump();
    std::string payload;
    auto encoding = SnapshotEncoding::Raw;
    if (compress && compressZstd(raw, payload)) {
        encoding = SnapshotEncoding::Zstd;
    } else {
        payload = raw;
    }

    std::string header;
    writeLE(header, kSnapshotMagic);
    writeLE(header, static_cast<uint16_t>(encoding));
    writeLE(header, static_cast<uint64_t>(raw.size()));
    writeLE(header, static_cast<uint32_t>(payload.size()));
    std::string trailer;
    writeLE(trailer, crc32(payload));

    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "Snapshot: failed to open " << tmpPath << "\n";
            return false;
        }
        out.write(header.data(), static_cast<std::streamsize>(header.size()));
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.write(trailer.data(), static_cast<std::streamsize>(trailer.size()));
        out.flush();
        if (!out) {
            std::cerr << "Snapshot: write failed for " << tmpPath << "\n";
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::cerr << "Snapshot: rename to " << path << " failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

std::optional<json> readSnapshot(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buf;
    buf << in.rdbuf();
    const std::string data = buf.str();
    std::string_view view(data);

    size_t cursor = 0;
    uint32_t magic = 0;
    uint16_t encoding = 0;
    uint64_t rawSize = 0;
    uint32_t payloadLen = 0;
    if (!readLE(view, cursor, magic) || magic != kSnapshotMagic) {
        std::cerr << "Snapshot: bad magic in " << path << "\n";
        return std::nullopt;
    }
    if (!readLE(view, cursor, encoding) || !readLE(view, cursor, rawSize) || !readLE(view, cursor, payloadLen)) {
        std::cerr << "Snapshot: truncated header in " << path << "\n";
        return std::nullopt;
    }
    if (rawSize > kMaxSnapshotBytes || cursor + payloadLen + sizeof(uint32_t) > view.size()) {
        std::cerr << "Snapshot: truncated payload in " << path << "\n";
        return std::nullopt;
    }
    std::string_view payload = view.substr(cursor, payloadLen);
    cursor += payloadLen;
    uint32_t storedCrc = 0;
    if (!readLE(view, cursor, storedCrc) || crc32(payload) != storedCrc) {
        std::cerr << "Snapshot: checksum mismatch in " << path << "\n";
        return std::nullopt;
    }

    std::string decoded;
    if (encoding == static_cast<uint16_t>(SnapshotEncoding::Zstd)) {
        if (!decompressZstd(payload, rawSize, decoded)) return std::nullopt;
    } else if (encoding == static_cast<uint16_t>(SnapshotEncoding::Raw)) {
        decoded.assign(payload.begin(), payload.end());
    } else {
        std::cerr << "Snapshot: unsupported encoding=" << encoding << "\n";
        return std::nullopt;
    }

    auto body = json::parse(decoded, nullptr, false);
    if (body.is_discarded()) {
        std::cerr << "Snapshot: invalid JSON body in " << path << "\n";
        return std::nullopt;
    }
    return body;
}

} // namespace docledger
