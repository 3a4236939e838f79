//DocumentStore.cpp
#include "docledger/DocumentStore.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "docledger/Snapshot.hpp"

using json = nlohmann::json;

namespace docledger {

namespace {

bool validIndexName(const std::string& name) {
    if (name.empty() || name.size() > 255 || name == "." || name == "..") return false;
    for (unsigned char ch : name) {
        if (!(std::isalnum(ch) || ch == '_' || ch == '-' || ch == '.')) return false;
    }
    return true;
}

} // namespace

// -----------------------------------------------------------
// CTOR/DTOR
// -----------------------------------------------------------
DocumentStore::DocumentStore(const std::string& dataDir) : dataDir_(dataDir) {
    if (const char* envComp = std::getenv("DOCLEDGER_COMPRESS")) {
        std::string v(envComp);
        compressSnapshots_ = !(v == "0" || v == "false" || v == "off");
    }

    if (!dataDir_.empty()) {
        namespace fs = std::filesystem;
        dataDir_ = fs::absolute(fs::path(dataDir_)).string();
        fs::create_directories(dataDir_);
        std::cerr << "DocumentStore: dataDir=" << dataDir_ << " compress=" << (compressSnapshots_ ? "on" : "off") << "\n";
        loadFromDisk();
        std::cerr << "DocumentStore: init complete; indexes=" << indexes_.size() << "\n";
    }
}

DocumentStore::~DocumentStore() {
    if (persistenceEnabled() && !writeManifest()) {
        std::cerr << "DocumentStore: failed to write manifest on shutdown\n";
    }
}

// -----------------------------------------------------------
// PUBLIC: Index management
// -----------------------------------------------------------
bool DocumentStore::createIndex(const std::string& name, const IndexSchema& schema) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (!validIndexName(name)) return false;
    if (indexes_.count(name)) return false;

    IndexState state;
    state.schema = schema;
    if (persistenceEnabled()) {
        state.log = std::make_unique<LogStore>(logPath(name));
        if (!state.log->reset()) {
            std::cerr << "DocumentStore: cannot initialise log for index " << name << "\n";
            return false;
        }
        std::error_code ec;
        std::filesystem::remove(snapshotPath(name), ec);
    }
    indexes_.emplace(name, std::move(state));
    if (persistenceEnabled() && !writeManifest()) {
        indexes_.erase(name);
        return false;
    }
    return true;
}

bool DocumentStore::indexExists(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return indexes_.count(name) > 0;
}

std::optional<IndexSchema> DocumentStore::schema(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = indexes_.find(name);
    if (it == indexes_.end()) return std::nullopt;
    return it->second.schema;
}

std::vector<std::string> DocumentStore::indexNames() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    std::vector<std::string> out;
    out.reserve(indexes_.size());
    for (const auto& kv : indexes_) out.push_back(kv.first);
    return out;
}

// -----------------------------------------------------------
// PUBLIC: Bulk apply
// -----------------------------------------------------------
std::vector<BulkItemResult> DocumentStore::applyBulk(const std::vector<BulkOperation>& operations) {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    std::vector<BulkItemResult> results;
    results.reserve(operations.size());
    for (const auto& op : operations) {
        results.push_back(applyOne(op));
    }
    return results;
}

BulkItemResult DocumentStore::applyOne(const BulkOperation& op) {
    auto it = indexes_.find(op.index);
    if (it == indexes_.end()) {
        return BulkItemResult::failure(op.index, op.id, "index_not_found_exception: no such index [" + op.index + "]");
    }
    if (op.id.empty()) {
        return BulkItemResult::failure(op.index, op.id, "action_request_validation_exception: id is missing");
    }
    IndexState& idx = it->second;

    switch (op.type) {
    case BulkOperation::Type::Index: {
        if (auto problem = idx.schema.validate(op.source)) {
            return BulkItemResult::failure(op.index, op.id, *problem);
        }
        if (idx.log && !idx.log->append(LogRecord{LogRecord::Op::Put, op.id, op.source})) {
            return BulkItemResult::failure(op.index, op.id, "storage_exception: log append failed");
        }
        idx.documents[op.id] = op.source;
        return BulkItemResult::success(op.index, op.id);
    }
    case BulkOperation::Type::Delete: {
        // deleting an absent document is a no-op
        if (idx.documents.count(op.id) == 0) {
            return BulkItemResult::success(op.index, op.id);
        }
        if (idx.log && !idx.log->append(LogRecord{LogRecord::Op::Del, op.id, {}})) {
            return BulkItemResult::failure(op.index, op.id, "storage_exception: log append failed");
        }
        idx.documents.erase(op.id);
        return BulkItemResult::success(op.index, op.id);
    }
    }
    return BulkItemResult::failure(op.index, op.id, "illegal_argument_exception: unknown operation");
}

// -----------------------------------------------------------
// PUBLIC: Reads
// -----------------------------------------------------------
std::optional<json> DocumentStore::getDocument(const std::string& index, const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = indexes_.find(index);
    if (it == indexes_.end()) return std::nullopt;
    auto d = it->second.documents.find(id);
    if (d == it->second.documents.end()) return std::nullopt;
    return d->second;
}

std::vector<StoredDocument> DocumentStore::documents(const std::string& index) const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    std::vector<StoredDocument> out;
    auto it = indexes_.find(index);
    if (it == indexes_.end()) return out;
    out.reserve(it->second.documents.size());
    for (const auto& kv : it->second.documents) {
        out.push_back({kv.first, kv.second});
    }
    return out;
}

std::size_t DocumentStore::documentCount(const std::string& index) const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = indexes_.find(index);
    if (it == indexes_.end()) return 0;
    return it->second.documents.size();
}

json DocumentStore::config() const {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    uint64_t logBytes = 0;
    for (const auto& kv : indexes_) {
        if (kv.second.log) logBytes += kv.second.log->bytesWritten();
    }
    return json{
        {"data_dir", dataDir_},
        {"compress_snapshots", compressSnapshots_},
        {"indexes", indexes_.size()},
        {"log_bytes", logBytes}
    };
}

// -----------------------------------------------------------
// PUBLIC: Checkpoint
// -----------------------------------------------------------
bool DocumentStore::checkpoint() {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (!persistenceEnabled()) return false;
    bool ok = writeManifest();
    for (auto& kv : indexes_) {
        json docs = json::object();
        for (const auto& d : kv.second.documents) docs[d.first] = d.second;
        json body{{"index", kv.first}, {"documents", docs}};
        if (!writeSnapshot(snapshotPath(kv.first), body, compressSnapshots_)) {
            std::cerr << "DocumentStore: snapshot failed for index " << kv.first << "; keeping log\n";
            ok = false;
            continue;
        }
        if (kv.second.log && !kv.second.log->reset()) {
            std::cerr << "DocumentStore: failed to truncate log for index " << kv.first << "\n";
            ok = false;
        }
    }
    return ok;
}

// -----------------------------------------------------------
// PRIVATE: Persistence helpers
// -----------------------------------------------------------
std::string DocumentStore::logPath(const std::string& index) const {
    return (std::filesystem::path(dataDir_) / (index + ".log")).string();
}

std::string DocumentStore::snapshotPath(const std::string& index) const {
    return (std::filesystem::path(dataDir_) / (index + ".snap")).string();
}

bool DocumentStore::writeManifest() const {
    json idx = json::object();
    for (const auto& kv : indexes_) idx[kv.first] = kv.second.schema.toJson();
    json manifest{{"version", 1}, {"indexes", idx}};

    auto path = std::filesystem::path(dataDir_) / "manifest.json";
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            std::cerr << "DocumentStore: failed to open " << tmp.string() << "\n";
            return false;
        }
        out << manifest.dump(2);
        if (!out) return false;
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "DocumentStore: manifest rename failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

void DocumentStore::loadFromDisk() {
    auto path = std::filesystem::path(dataDir_) / "manifest.json";
    std::ifstream in(path);
    if (!in) return; // fresh directory

    json manifest = json::parse(in, nullptr, false);
    if (manifest.is_discarded() || !manifest.contains("indexes") || !manifest["indexes"].is_object()) {
        std::cerr << "DocumentStore: unreadable manifest " << path.string() << "\n";
        return;
    }

    bool damaged = false;
    for (auto it = manifest["indexes"].begin(); it != manifest["indexes"].end(); ++it) {
        const std::string name = it.key();
        if (!validIndexName(name)) {
            std::cerr << "DocumentStore: skipping invalid index name in manifest: " << name << "\n";
            continue;
        }
        IndexState state;
        try {
            state.schema = IndexSchema::fromJson(it.value());
        } catch (const std::exception& e) {
            std::cerr << "DocumentStore: bad schema for index " << name << ": " << e.what() << "\n";
            continue;
        }

        if (auto snap = readSnapshot(snapshotPath(name))) {
            const auto& docs = (*snap)["documents"];
            if (docs.is_object()) {
                for (auto d = docs.begin(); d != docs.end(); ++d) state.documents[d.key()] = d.value();
            }
        }

        state.log = std::make_unique<LogStore>(logPath(name));
        size_t replayed = 0;
        bool clean = state.log->load([&state, &replayed](const LogRecord& rec) {
            if (rec.op == LogRecord::Op::Put) {
                state.documents[rec.key] = rec.doc;
            } else {
                state.documents.erase(rec.key);
            }
            ++replayed;
        });
        if (!clean) {
            std::cerr << "DocumentStore: log for index " << name << " is damaged; kept " << replayed << " records\n";
            damaged = true;
        }
        std::cerr << "DocumentStore: loaded index " << name << " docs=" << state.documents.size()
                  << " replayed=" << replayed << "\n";
        indexes_.emplace(name, std::move(state));
    }

    // a damaged tail would swallow later appends; fold what survived into snapshots
    if (damaged && !checkpoint()) {
        std::cerr << "DocumentStore: checkpoint after damaged log failed\n";
    }
}

} // namespace docledger
