//DocumentCollection.cpp
#include "docledger/DocumentCollection.hpp"

#include <iostream>
#include "docledger/Errors.hpp"

using json = nlohmann::json;

namespace docledger {

// -----------------------------------------------------------
// Config
// -----------------------------------------------------------
CollectionConfig CollectionConfig::fromJson(const json& j) {
    if (!j.is_object()) throw ConfigError("collection config must be a JSON object");
    json schemaPart = json::object();
    CollectionConfig config;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& key = it.key();
        if (key == "index_name") {
            if (!it.value().is_string()) throw ConfigError("index_name must be a string");
            config.indexName = it.value().get<std::string>();
        } else if (key == "n_dim" || key == "columns" || key == "distance") {
            schemaPart[key] = it.value();
        } else {
            throw ConfigError("unknown collection config key: " + key);
        }
    }
    if (config.indexName.empty()) throw ConfigError("index_name is required");
    if (config.indexName.rfind(OffsetIndex::kRecordIndexPrefix, 0) == 0) {
        throw ConfigError("index_name may not use the reserved prefix " + std::string(OffsetIndex::kRecordIndexPrefix));
    }
    config.schema = IndexSchema::fromJson(schemaPart);
    return config;
}

json CollectionConfig::toJson() const {
    json j = schema.toJson();
    j["index_name"] = indexName;
    return j;
}

std::vector<BatchItem> batchFromJson(const json& docs) {
    if (!docs.is_array()) throw ConfigError("docs must be a JSON array");
    std::vector<BatchItem> items;
    items.reserve(docs.size());
    for (const auto& d : docs) {
        if (!d.is_object() || !d.contains("id") || !d["id"].is_string()) {
            throw ConfigError("every document needs a string id");
        }
        items.push_back(BatchItem{d["id"].get<std::string>(), d});
    }
    return items;
}

// -----------------------------------------------------------
// CTOR
// -----------------------------------------------------------
DocumentCollection::DocumentCollection(BulkTransport& transport, CollectionConfig config)
    : transport_(transport), config_(std::move(config)), offsets_(transport, config_.indexName) {
    if (transport_.ensureIndex(config_.indexName, config_.schema)) {
        std::cerr << "DocumentCollection: created index " << config_.indexName << "\n";
    }
    std::size_t restored = offsets_.load();
    std::cerr << "DocumentCollection: " << config_.indexName << " opened with " << restored << " documents\n";
}

// -----------------------------------------------------------
// PUBLIC: Mutations
// -----------------------------------------------------------
AppendOutcome DocumentCollection::extend(const std::vector<BatchItem>& items, const TransportParams& params) {
    std::lock_guard<std::mutex> lk(mutex_);
    AppendReconciler reconciler(transport_, offsets_, config_.indexName);
    return reconciler.run(items, params);
}

bool DocumentCollection::remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!offsets_.contains(id)) return false;

    auto previous = transport_.fetch(config_.indexName, id);
    auto results = transport_.submitBulk(
        {BulkOperation{BulkOperation::Type::Delete, config_.indexName, id, json()}}, TransportParams::defaults());
    for (const auto& r : results) {
        if (r.status == BulkItemResult::Status::Failure) {
            throw StorageError("delete of [" + id + "] was rejected: " + r.error);
        }
    }

    try {
        offsets_.removeAt(offsets_.offsetOf(id));
    } catch (const StorageError& e) {
        // put the document back so both sides still agree
        if (previous) {
            auto restore = transport_.submitBulk(
                {BulkOperation{BulkOperation::Type::Index, config_.indexName, id, *previous}}, TransportParams::defaults());
            for (const auto& r : restore) {
                if (r.status == BulkItemResult::Status::Failure) {
                    std::cerr << "DocumentCollection: restore of " << id << " failed: " << r.error << "\n";
                }
            }
        }
        throw;
    }
    return true;
}

// -----------------------------------------------------------
// PUBLIC: Reads
// -----------------------------------------------------------
std::size_t DocumentCollection::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return offsets_.count();
}

std::vector<std::string> DocumentCollection::ids() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return offsets_.ids();
}

std::string DocumentCollection::idAt(std::size_t offset) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return offsets_.idAt(offset);
}

std::size_t DocumentCollection::offsetOf(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return offsets_.offsetOf(id);
}

bool DocumentCollection::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return offsets_.contains(id);
}

std::optional<json> DocumentCollection::get(const std::string& id) const {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!offsets_.contains(id)) return std::nullopt;
    }
    return transport_.fetch(config_.indexName, id);
}

} // namespace docledger
