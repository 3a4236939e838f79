#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "docledger/BulkTransport.hpp"

namespace docledger {

// Ordered ledger of document ids: offset -> id with a reverse map for O(1)
// lookups. Offsets are always 0..count()-1.
//
// Each mutation is written to the record index "offset2id__<collection>"
// (one record per offset, keyed by the decimal offset, source {"blob": id})
// before the in-memory state changes. Those maintenance writes always use
// default transport parameters.
//
// Not synchronized; the owning collection serializes access.
class OffsetIndex {
public:
    static constexpr const char* kRecordIndexPrefix = "offset2id__";

    OffsetIndex(BulkTransport& transport, const std::string& collection);

    // Creates the record index if needed and rebuilds from it. Only the
    // contiguous run 0..k-1 of distinct ids is kept; stale records past it
    // are deleted. Returns k.
    std::size_t load();

    // Throws DuplicateIdError if id is present, StorageError if the record
    // could not be persisted.
    std::size_t append(const std::string& id);

    // Persists all records in one bulk call, then commits them in order up to
    // the first record that failed to persist or got no result (StorageError
    // in that case). Records written past the committed prefix are deleted.
    void appendAll(const std::vector<std::string>& ids);

    // Removes the id at offset and shifts later ids down by one. If the
    // rewrite is refused, the original records are written back and
    // StorageError is thrown with the ledger unchanged.
    void removeAt(std::size_t offset);

    const std::string& idAt(std::size_t offset) const;
    std::size_t offsetOf(const std::string& id) const;
    bool contains(const std::string& id) const { return offsets_.count(id) > 0; }
    std::size_t count() const { return ids_.size(); }
    const std::vector<std::string>& ids() const { return ids_; }

    const std::string& recordIndex() const { return recordIndex_; }

private:
    BulkTransport& transport_;
    std::string recordIndex_;
    std::vector<std::string> ids_;
    std::unordered_map<std::string, std::size_t> offsets_;

    BulkOperation putRecord(std::size_t offset, const std::string& id) const;
    BulkOperation deleteRecord(std::size_t offset) const;
    void discardRecords(std::size_t from, std::size_t end);
    void restoreRecordsFrom(std::size_t offset);
    void reindexFrom(std::size_t offset);
};

} // namespace docledger
