#include "docledger/Schema.hpp"

#include <cmath>
#include <limits>
#include "docledger/Errors.hpp"

using json = nlohmann::json;

namespace docledger {

std::optional<ColumnType> parseColumnType(const std::string& name) {
    if (name == "int" || name == "integer" || name == "int32") return ColumnType::Int;
    if (name == "long" || name == "int64") return ColumnType::Long;
    if (name == "float") return ColumnType::Float;
    if (name == "double") return ColumnType::Double;
    if (name == "bool" || name == "boolean") return ColumnType::Bool;
    if (name == "str" || name == "text" || name == "keyword") return ColumnType::Text;
    return std::nullopt;
}

const char* columnTypeName(ColumnType type) {
    switch (type) {
    case ColumnType::Int: return "integer";
    case ColumnType::Long: return "long";
    case ColumnType::Float: return "float";
    case ColumnType::Double: return "double";
    case ColumnType::Bool: return "boolean";
    case ColumnType::Text: return "text";
    }
    return "unknown";
}

namespace {

std::string parseFailure(const std::string& field, ColumnType type, const json& val) {
    return "mapper_parsing_exception: failed to parse field [" + field + "] of type [" +
           columnTypeName(type) + "]: value [" + val.dump() + "]";
}

std::string outOfRange(const std::string& field, ColumnType type, const json& val) {
    return "mapper_parsing_exception: value [" + val.dump() + "] is out of range for field [" +
           field + "] of type [" + columnTypeName(type) + "]";
}

std::optional<std::string> checkColumn(const std::string& field, ColumnType type, const json& val) {
    if (val.is_null()) return std::nullopt;
    switch (type) {
    case ColumnType::Int:
        if (val.is_number_unsigned()) {
            if (val.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
                return outOfRange(field, type, val);
            }
            return std::nullopt;
        }
        if (!val.is_number_integer()) return parseFailure(field, type, val);
        {
            auto v = val.get<int64_t>();
            if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
                return outOfRange(field, type, val);
            }
        }
        return std::nullopt;
    case ColumnType::Long:
        if (val.is_number_unsigned()) {
            if (val.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return outOfRange(field, type, val);
            }
            return std::nullopt;
        }
        if (!val.is_number_integer()) return parseFailure(field, type, val);
        return std::nullopt;
    case ColumnType::Float:
        if (!val.is_number()) return parseFailure(field, type, val);
        if (std::fabs(val.get<double>()) > static_cast<double>(std::numeric_limits<float>::max())) {
            return outOfRange(field, type, val);
        }
        return std::nullopt;
    case ColumnType::Double:
        if (!val.is_number()) return parseFailure(field, type, val);
        return std::nullopt;
    case ColumnType::Bool:
        if (!val.is_boolean()) return parseFailure(field, type, val);
        return std::nullopt;
    case ColumnType::Text:
        if (!val.is_string()) return parseFailure(field, type, val);
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> IndexSchema::validate(const json& doc) const {
    if (!doc.is_object()) {
        return std::string("mapper_parsing_exception: document must be a JSON object");
    }
    for (const auto& col : columns) {
        auto it = doc.find(col.first);
        if (it == doc.end()) continue; // optional
        if (auto problem = checkColumn(col.first, col.second, *it)) {
            return problem;
        }
    }
    if (nDim > 0) {
        auto it = doc.find("embedding");
        if (it != doc.end() && !it->is_null()) {
            if (!it->is_array() || it->size() != nDim) {
                return "mapper_parsing_exception: embedding must have " + std::to_string(nDim) + " dimensions";
            }
            for (const auto& v : *it) {
                if (!v.is_number()) return std::string("mapper_parsing_exception: embedding values must be numeric");
            }
        }
    }
    return std::nullopt;
}

json IndexSchema::toJson() const {
    json cols = json::array();
    for (const auto& col : columns) {
        cols.push_back(json::array({col.first, columnTypeName(col.second)}));
    }
    return json{{"n_dim", nDim}, {"distance", distance}, {"columns", cols}};
}

IndexSchema IndexSchema::fromJson(const json& j) {
    IndexSchema schema;
    if (j.is_null()) return schema;
    if (!j.is_object()) throw ConfigError("schema must be a JSON object");
    if (j.contains("n_dim")) {
        const auto& dim = j["n_dim"];
        if (!dim.is_number_integer() || dim.get<int64_t>() < 0) {
            throw ConfigError("n_dim must be a non-negative integer");
        }
        schema.nDim = dim.get<uint32_t>();
    }
    schema.distance = j.value("distance", "");
    if (j.contains("columns")) {
        const auto& cols = j["columns"];
        // accepts [["price","int"], ...] or {"price":"int", ...}
        if (cols.is_array()) {
            for (const auto& c : cols) {
                if (!c.is_array() || c.size() != 2 || !c[0].is_string() || !c[1].is_string()) {
                    throw ConfigError("columns entries must be [name, type] pairs");
                }
                auto type = parseColumnType(c[1].get<std::string>());
                if (!type) throw ConfigError("unsupported column type: " + c[1].get<std::string>());
                schema.columns[c[0].get<std::string>()] = *type;
            }
        } else if (cols.is_object()) {
            for (auto it = cols.begin(); it != cols.end(); ++it) {
                if (!it.value().is_string()) throw ConfigError("column type must be a string: " + it.key());
                auto type = parseColumnType(it.value().get<std::string>());
                if (!type) throw ConfigError("unsupported column type: " + it.value().get<std::string>());
                schema.columns[it.key()] = *type;
            }
        } else {
            throw ConfigError("columns must be a list or an object");
        }
    }
    return schema;
}

} // namespace docledger
