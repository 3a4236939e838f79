#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace docledger {

enum class SnapshotEncoding : uint16_t { Raw = 0, Zstd = 1 };

// Writes body to path atomically (tmp file + rename).
// Layout: magic | u16 encoding | u64 raw size | u32 payload size | payload | u32 crc32(payload).
bool writeSnapshot(const std::string& path, const nlohmann::json& body, bool compress);

// Returns nullopt when the file is missing, damaged or undecodable.
std::optional<nlohmann::json> readSnapshot(const std::string& path);

} // namespace docledger
