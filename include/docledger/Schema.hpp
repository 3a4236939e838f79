#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace docledger {

enum class ColumnType { Int, Long, Float, Double, Bool, Text };

// Parses "int", "long", "float", "double", "bool", "str" and their aliases.
std::optional<ColumnType> parseColumnType(const std::string& name);
const char* columnTypeName(ColumnType type);

// Typed field layout of one document index. Fields not listed are stored untyped.
struct IndexSchema {
    uint32_t nDim = 0;                          // embedding length, 0 = no embedding
    std::string distance;                       // kept for the record, never evaluated
    std::map<std::string, ColumnType> columns;

    // Returns the rejection reason, or nullopt when the document fits.
    std::optional<std::string> validate(const nlohmann::json& doc) const;

    nlohmann::json toJson() const;
    static IndexSchema fromJson(const nlohmann::json& j);
};

} // namespace docledger
