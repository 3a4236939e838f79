#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "docledger/AppendReconciler.hpp"
#include "docledger/BulkTransport.hpp"
#include "docledger/OffsetIndex.hpp"
#include "docledger/Schema.hpp"
#include "docledger/TransportParams.hpp"

namespace docledger {

struct CollectionConfig {
    std::string indexName;
    IndexSchema schema;

    // Keys: index_name (required), n_dim, columns, distance. Unknown keys throw ConfigError.
    static CollectionConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

// Ordered document collection kept in a document index, with its offset
// ledger in "offset2id__<index_name>". All mutations run under one mutex.
class DocumentCollection {
public:
    // Creates the document and ledger indexes if needed and loads the ledger.
    DocumentCollection(BulkTransport& transport, CollectionConfig config);

    DocumentCollection(const DocumentCollection&) = delete;
    DocumentCollection& operator=(const DocumentCollection&) = delete;

    // Appends the documents not already present. Throws BatchPartialFailure
    // (after committing the accepted ones) if any document was rejected.
    AppendOutcome extend(const std::vector<BatchItem>& items,
                         const TransportParams& params = TransportParams::defaults());

    // Deletes the document and closes the gap it leaves. False if id is unknown.
    bool remove(const std::string& id);

    std::size_t size() const;
    std::vector<std::string> ids() const;
    std::string idAt(std::size_t offset) const;
    std::size_t offsetOf(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::optional<nlohmann::json> get(const std::string& id) const;

    const std::string& name() const { return config_.indexName; }
    const CollectionConfig& config() const { return config_; }
    const std::string& ledgerIndex() const { return offsets_.recordIndex(); }

private:
    BulkTransport& transport_;
    CollectionConfig config_;
    mutable std::mutex mutex_;
    OffsetIndex offsets_;
};

// Converts [{"id": "...", ...fields}] into batch items. Throws ConfigError on shape errors.
std::vector<BatchItem> batchFromJson(const nlohmann::json& docs);

} // namespace docledger
