#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "docledger/BulkTransport.hpp"
#include "docledger/LogStore.hpp"
#include "docledger/Schema.hpp"

namespace docledger {

// In-process document index: named indexes of JSON documents keyed by string
// id, validated against a typed schema. With a data directory every index is
// backed by a checksummed log plus an optional checkpoint snapshot, and the
// set of indexes is kept in manifest.json.
class DocumentStore {
public:
    explicit DocumentStore(const std::string& dataDir = "");
    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // Index management
    bool createIndex(const std::string& name, const IndexSchema& schema);
    bool indexExists(const std::string& name) const;
    std::optional<IndexSchema> schema(const std::string& name) const;
    std::vector<std::string> indexNames() const;

    // Applies operations in order and reports each one. Never throws for
    // item-level problems (unknown index, schema violation, log write failure).
    std::vector<BulkItemResult> applyBulk(const std::vector<BulkOperation>& operations);

    std::optional<nlohmann::json> getDocument(const std::string& index, const std::string& id) const;
    std::vector<StoredDocument> documents(const std::string& index) const;
    std::size_t documentCount(const std::string& index) const;

    // Writes one snapshot per index and truncates the logs it covers.
    bool checkpoint();

    bool persistenceEnabled() const { return !dataDir_.empty(); }
    nlohmann::json config() const;

private:
    struct IndexState {
        IndexSchema schema;
        std::map<std::string, nlohmann::json> documents;
        std::unique_ptr<LogStore> log;
    };

    std::string dataDir_;
    bool compressSnapshots_ = true;
    mutable std::recursive_mutex mutex_;
    std::map<std::string, IndexState> indexes_;

    BulkItemResult applyOne(const BulkOperation& op);

    // --- Persistence helpers ---
    void loadFromDisk();
    bool writeManifest() const;
    std::string logPath(const std::string& index) const;
    std::string snapshotPath(const std::string& index) const;
};

} // namespace docledger
