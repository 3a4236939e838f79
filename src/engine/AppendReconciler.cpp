//AppendReconciler.cpp
#include "docledger/AppendReconciler.hpp"

#include <iostream>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace docledger {

namespace {

std::string describeFailures(const std::map<std::string, std::string>& failures) {
    std::string msg = std::to_string(failures.size()) + " item(s) failed to index:";
    std::size_t shown = 0;
    for (const auto& kv : failures) {
        if (shown++ == 5) {
            msg += " ...";
            break;
        }
        msg += " [" + kv.first + "] " + kv.second + ";";
    }
    return msg;
}

} // namespace

json AppendOutcome::toJson() const {
    return json{
        {"inserted", insertedCount},
        {"total", totalCount},
        {"duplicates", duplicateCount},
        {"inserted_ids", insertedIds},
        {"failures", failures}
    };
}

BatchPartialFailure::BatchPartialFailure(AppendOutcome outcome)
    : Error(describeFailures(outcome.failures)), outcome_(std::move(outcome)) {}

const char* stateName(AppendReconciler::State state) {
    switch (state) {
    case AppendReconciler::State::Received: return "received";
    case AppendReconciler::State::Deduplicated: return "deduplicated";
    case AppendReconciler::State::Submitted: return "submitted";
    case AppendReconciler::State::Reconciling: return "reconciling";
    case AppendReconciler::State::Completed: return "completed";
    case AppendReconciler::State::CompletedWithFailures: return "completed_with_failures";
    }
    return "unknown";
}

AppendReconciler::AppendReconciler(BulkTransport& transport, OffsetIndex& offsets, std::string documentIndex)
    : transport_(transport), offsets_(offsets), documentIndex_(std::move(documentIndex)) {}

AppendOutcome AppendReconciler::run(const std::vector<BatchItem>& items, const TransportParams& params) {
    if (state_ != State::Received) {
        throw Error(std::string("append reconciler already used (state ") + stateName(state_) + ")");
    }
    params.validate();
    AppendOutcome outcome;

    // --- Deduplicate: already indexed ids and repeats within the batch are no-ops
    std::vector<const BatchItem*> novel;
    std::unordered_set<std::string> seen;
    novel.reserve(items.size());
    for (std::size_t pos = 0; pos < items.size(); ++pos) {
        const BatchItem& item = items[pos];
        if (item.id.empty()) {
            outcome.failures["<missing id #" + std::to_string(pos) + ">"] =
                "action_request_validation_exception: id is missing";
            continue;
        }
        if (offsets_.contains(item.id) || !seen.insert(item.id).second) {
            ++outcome.duplicateCount;
            continue;
        }
        novel.push_back(&item);
    }
    state_ = State::Deduplicated;

    // --- Submit the novel entries as one bulk request
    std::vector<BulkOperation> ops;
    ops.reserve(novel.size());
    for (const auto* item : novel) {
        ops.push_back(BulkOperation{BulkOperation::Type::Index, documentIndex_, item->id, item->payload});
    }
    std::vector<BulkItemResult> results;
    if (!ops.empty()) {
        results = transport_.submitBulk(ops, params);
    }
    state_ = State::Submitted;

    // --- Correlate results by id; reject the response before touching the ledger
    state_ = State::Reconciling;
    std::unordered_map<std::string, const BulkItemResult*> byId;
    byId.reserve(results.size());
    for (const auto& r : results) {
        if (r.index != documentIndex_ || seen.count(r.id) == 0) {
            throw TransportError("bulk response names unexpected item [" + r.index + "/" + r.id + "]");
        }
        if (!byId.emplace(r.id, &r).second) {
            throw TransportError("bulk response repeats item [" + r.id + "]");
        }
    }

    std::vector<std::string> accepted;
    accepted.reserve(novel.size());
    for (const auto* item : novel) {
        auto it = byId.find(item->id);
        if (it == byId.end()) {
            throw TransportError("bulk response is missing item [" + item->id + "]");
        }
        const BulkItemResult& r = *it->second;
        switch (r.status) {
        case BulkItemResult::Status::Success:
            accepted.push_back(item->id);
            break;
        case BulkItemResult::Status::Failure:
            outcome.failures[item->id] = r.error.empty() ? "rejected" : r.error;
            break;
        }
    }

    // --- Commit accepted ids in submission order
    const std::size_t before = offsets_.count();
    try {
        offsets_.appendAll(accepted);
    } catch (const StorageError& e) {
        std::vector<std::string> uncommitted(accepted.begin() + static_cast<std::ptrdiff_t>(offsets_.count() - before),
                                             accepted.end());
        std::cerr << "AppendReconciler: offset ledger write failed for " << documentIndex_ << ": " << e.what() << "\n";
        rollbackUncommitted(uncommitted, e.what(), outcome);
    } catch (const TransportError& e) {
        // appendAll commits nothing when its bulk call fails outright
        std::cerr << "AppendReconciler: offset ledger unreachable for " << documentIndex_ << ": " << e.what() << "\n";
        rollbackUncommitted(accepted, e.what(), outcome);
        throw;
    }

    const auto& ids = offsets_.ids();
    outcome.insertedIds.assign(ids.begin() + static_cast<std::ptrdiff_t>(before), ids.end());
    outcome.insertedCount = outcome.insertedIds.size();
    outcome.totalCount = offsets_.count();

    state_ = outcome.failures.empty() ? State::Completed : State::CompletedWithFailures;
    std::cerr << "AppendReconciler: index=" << documentIndex_ << " received=" << items.size()
              << " duplicates=" << outcome.duplicateCount << " inserted=" << outcome.insertedCount
              << " failed=" << outcome.failures.size() << " total=" << outcome.totalCount
              << " state=" << stateName(state_) << "\n";

    if (!outcome.failures.empty()) {
        throw BatchPartialFailure(outcome);
    }
    return outcome;
}

void AppendReconciler::rollbackUncommitted(const std::vector<std::string>& ids, const std::string& cause,
                                           AppendOutcome& outcome) {
    if (ids.empty()) return;
    // documents the ledger could not record must not stay in the document index
    std::vector<BulkOperation> deletes;
    deletes.reserve(ids.size());
    for (const auto& id : ids) {
        deletes.push_back(BulkOperation{BulkOperation::Type::Delete, documentIndex_, id, json()});
        outcome.failures[id] = "offset ledger not updated: " + cause;
    }
    try {
        for (const auto& r : transport_.submitBulk(deletes, TransportParams::defaults())) {
            if (r.status == BulkItemResult::Status::Failure) {
                std::cerr << "AppendReconciler: could not remove unrecorded document " << r.id << ": " << r.error << "\n";
            }
        }
    } catch (const TransportError& e) {
        std::cerr << "AppendReconciler: rollback of " << ids.size() << " documents failed: " << e.what() << "\n";
    }
}

} // namespace docledger
