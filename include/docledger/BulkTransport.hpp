#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "docledger/Schema.hpp"
#include "docledger/TransportParams.hpp"

namespace docledger {

struct BulkOperation {
    enum class Type { Index, Delete };
    Type type;
    std::string index;
    std::string id;
    nlohmann::json source;   // ignored for Delete

    // Rough wire size used for max_chunk_bytes accounting.
    std::size_t estimatedBytes() const;
};

// Outcome of one BulkOperation. Every result names the index and id it targeted
// so callers can correlate without relying on position.
struct BulkItemResult {
    enum class Status { Success, Failure };
    Status status;
    std::string index;
    std::string id;
    std::string error;      // empty on success

    static BulkItemResult success(std::string index, std::string id) {
        return BulkItemResult{Status::Success, std::move(index), std::move(id), {}};
    }
    static BulkItemResult failure(std::string index, std::string id, std::string error) {
        return BulkItemResult{Status::Failure, std::move(index), std::move(id), std::move(error)};
    }
};

struct StoredDocument {
    std::string id;
    nlohmann::json source;
};

// Client side of the document index. submitBulk returns one result per
// operation, in no particular order; it throws TransportError when the batch
// as a whole could not be processed.
class BulkTransport {
public:
    virtual ~BulkTransport() = default;

    virtual std::vector<BulkItemResult> submitBulk(const std::vector<BulkOperation>& operations,
                                                   const TransportParams& params) = 0;

    // Creates the index if missing; returns false if it already existed.
    virtual bool ensureIndex(const std::string& index, const IndexSchema& schema) = 0;

    virtual std::vector<StoredDocument> scan(const std::string& index) = 0;
    virtual std::optional<nlohmann::json> fetch(const std::string& index, const std::string& id) = 0;
};

} // namespace docledger
