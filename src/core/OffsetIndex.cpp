#include "docledger/OffsetIndex.hpp"

#include <iostream>
#include <map>
#include <unordered_set>
#include "docledger/Errors.hpp"

using json = nlohmann::json;

namespace docledger {

namespace {

bool parseOffset(const std::string& key, std::size_t& out) {
    if (key.empty() || key.size() > 19) return false;
    std::size_t v = 0;
    for (char ch : key) {
        if (ch < '0' || ch > '9') return false;
        v = v * 10 + static_cast<std::size_t>(ch - '0');
    }
    out = v;
    return true;
}

IndexSchema recordSchema() {
    IndexSchema schema;
    schema.columns["blob"] = ColumnType::Text;
    return schema;
}

} // namespace

OffsetIndex::OffsetIndex(BulkTransport& transport, const std::string& collection)
    : transport_(transport), recordIndex_(std::string(kRecordIndexPrefix) + collection) {}

std::size_t OffsetIndex::load() {
    if (transport_.ensureIndex(recordIndex_, recordSchema())) {
        std::cerr << "OffsetIndex: created record index " << recordIndex_ << "\n";
    }

    std::map<std::size_t, std::string> records;
    for (const auto& doc : transport_.scan(recordIndex_)) {
        std::size_t offset = 0;
        if (!parseOffset(doc.id, offset) || !doc.source.is_object() || !doc.source.contains("blob") ||
            !doc.source["blob"].is_string()) {
            std::cerr << "OffsetIndex: ignoring malformed record '" << doc.id << "' in " << recordIndex_ << "\n";
            continue;
        }
        records[offset] = doc.source["blob"].get<std::string>();
    }

    ids_.clear();
    offsets_.clear();
    std::vector<BulkOperation> stale;
    for (const auto& kv : records) {
        bool contiguous = kv.first == ids_.size() && stale.empty();
        if (contiguous && offsets_.count(kv.second) == 0) {
            offsets_[kv.second] = ids_.size();
            ids_.push_back(kv.second);
            continue;
        }
        stale.push_back(deleteRecord(kv.first));
    }

    if (!stale.empty()) {
        std::cerr << "OffsetIndex: " << recordIndex_ << " has " << stale.size()
                  << " records past offset " << ids_.size() << "; deleting\n";
        for (const auto& r : transport_.submitBulk(stale, TransportParams::defaults())) {
            if (r.status == BulkItemResult::Status::Failure) {
                std::cerr << "OffsetIndex: could not delete stale record " << r.id << ": " << r.error << "\n";
            }
        }
    }
    return ids_.size();
}

std::size_t OffsetIndex::append(const std::string& id) {
    appendAll({id});
    return ids_.size() - 1;
}

void OffsetIndex::appendAll(const std::vector<std::string>& ids) {
    if (ids.empty()) return;

    std::unordered_set<std::string> incoming;
    std::vector<BulkOperation> ops;
    ops.reserve(ids.size());
    for (const auto& id : ids) {
        if (offsets_.count(id) || !incoming.insert(id).second) {
            throw DuplicateIdError(id);
        }
        ops.push_back(putRecord(ids_.size() + ops.size(), id));
    }

    const std::size_t base = ids_.size();
    const std::size_t end = base + ids.size();
    std::vector<BulkItemResult> results;
    try {
        results = transport_.submitBulk(ops, TransportParams::defaults());
    } catch (const TransportError&) {
        discardRecords(base, end);
        throw;
    }

    std::unordered_map<std::string, const BulkItemResult*> byKey;
    for (const auto& r : results) byKey[r.id] = &r;

    for (std::size_t i = 0; i < ids.size(); ++i) {
        const std::string key = std::to_string(base + i);
        auto f = byKey.find(key);
        std::string problem;
        if (f == byKey.end()) {
            problem = "offset record " + key + " for id " + ids[i] + " was not acknowledged";
        } else if (f->second->status == BulkItemResult::Status::Failure) {
            problem = "offset record " + key + " for id " + ids[i] + " was rejected: " + f->second->error;
        }
        if (!problem.empty()) {
            // records past the committed prefix would be picked up by the next load()
            discardRecords(base + i, end);
            throw StorageError(problem);
        }
        offsets_[ids[i]] = ids_.size();
        ids_.push_back(ids[i]);
    }
}

void OffsetIndex::removeAt(std::size_t offset) {
    if (offset >= ids_.size()) {
        throw OutOfRangeError("offset " + std::to_string(offset) + " out of range (count " +
                              std::to_string(ids_.size()) + ")");
    }

    std::vector<BulkOperation> ops;
    ops.reserve(ids_.size() - offset);
    for (std::size_t i = offset; i + 1 < ids_.size(); ++i) {
        ops.push_back(putRecord(i, ids_[i + 1]));
    }
    ops.push_back(deleteRecord(ids_.size() - 1));

    std::string problem;
    std::vector<BulkItemResult> results;
    try {
        results = transport_.submitBulk(ops, TransportParams::defaults());
    } catch (const TransportError&) {
        restoreRecordsFrom(offset);
        throw;
    }
    for (const auto& r : results) {
        if (r.status == BulkItemResult::Status::Failure && problem.empty()) {
            problem = "offset record " + r.id + " could not be rewritten: " + r.error;
        }
    }
    if (problem.empty() && results.size() != ops.size()) {
        problem = "offset rewrite acknowledged " + std::to_string(results.size()) + " of " +
                  std::to_string(ops.size()) + " records";
    }
    if (!problem.empty()) {
        restoreRecordsFrom(offset);
        throw StorageError(problem);
    }

    offsets_.erase(ids_[offset]);
    ids_.erase(ids_.begin() + static_cast<std::ptrdiff_t>(offset));
    reindexFrom(offset);
}

const std::string& OffsetIndex::idAt(std::size_t offset) const {
    if (offset >= ids_.size()) {
        throw OutOfRangeError("offset " + std::to_string(offset) + " out of range (count " +
                              std::to_string(ids_.size()) + ")");
    }
    return ids_[offset];
}

std::size_t OffsetIndex::offsetOf(const std::string& id) const {
    auto it = offsets_.find(id);
    if (it == offsets_.end()) throw OutOfRangeError("id not indexed: " + id);
    return it->second;
}

BulkOperation OffsetIndex::putRecord(std::size_t offset, const std::string& id) const {
    return BulkOperation{BulkOperation::Type::Index, recordIndex_, std::to_string(offset), json{{"blob", id}}};
}

BulkOperation OffsetIndex::deleteRecord(std::size_t offset) const {
    return BulkOperation{BulkOperation::Type::Delete, recordIndex_, std::to_string(offset), json()};
}

void OffsetIndex::discardRecords(std::size_t from, std::size_t end) {
    std::vector<BulkOperation> ops;
    for (std::size_t i = from; i < end; ++i) ops.push_back(deleteRecord(i));
    if (ops.empty()) return;
    try {
        for (const auto& r : transport_.submitBulk(ops, TransportParams::defaults())) {
            if (r.status == BulkItemResult::Status::Failure) {
                std::cerr << "OffsetIndex: could not discard record " << r.id << " in " << recordIndex_ << ": " << r.error << "\n";
            }
        }
    } catch (const TransportError& e) {
        std::cerr << "OffsetIndex: discarding " << recordIndex_ << " records " << from << ".." << end << " failed: " << e.what() << "\n";
    }
}

void OffsetIndex::restoreRecordsFrom(std::size_t offset) {
    // put back the records a failed shift may have overwritten
    std::vector<BulkOperation> ops;
    ops.reserve(ids_.size() - offset);
    for (std::size_t i = offset; i < ids_.size(); ++i) {
        ops.push_back(putRecord(i, ids_[i]));
    }
    try {
        for (const auto& r : transport_.submitBulk(ops, TransportParams::defaults())) {
            if (r.status == BulkItemResult::Status::Failure) {
                std::cerr << "OffsetIndex: could not restore record " << r.id << " in " << recordIndex_ << ": " << r.error << "\n";
            }
        }
    } catch (const TransportError& e) {
        std::cerr << "OffsetIndex: restoring " << recordIndex_ << " from offset " << offset << " failed: " << e.what() << "\n";
    }
}

void OffsetIndex::reindexFrom(std::size_t offset) {
    for (std::size_t i = offset; i < ids_.size(); ++i) {
        offsets_[ids_[i]] = i;
    }
}

} // namespace docledger
