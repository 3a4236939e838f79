#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "docledger/BulkTransport.hpp"
#include "docledger/Errors.hpp"
#include "docledger/OffsetIndex.hpp"

namespace docledger {

struct BatchItem {
    std::string id;
    nlohmann::json payload;
};

struct AppendOutcome {
    std::size_t insertedCount = 0;
    std::size_t totalCount = 0;
    std::size_t duplicateCount = 0;
    std::vector<std::string> insertedIds;            // in offset order
    std::map<std::string, std::string> failures;     // id -> error detail

    nlohmann::json toJson() const;
};

// Raised after commit when at least one item of a batch was rejected.
class BatchPartialFailure : public Error {
public:
    explicit BatchPartialFailure(AppendOutcome outcome);

    const AppendOutcome& outcome() const { return outcome_; }
    const std::map<std::string, std::string>& failures() const { return outcome_.failures; }

private:
    AppendOutcome outcome_;
};

// One append attempt against a document index and its offset index. Drops
// ids already indexed (and repeats within the batch), submits the rest as a
// single bulk request, and appends the accepted ids in submission order.
// Single use: construct a fresh reconciler per batch. The caller must hold
// the collection lock for the whole run().
class AppendReconciler {
public:
    enum class State { Received, Deduplicated, Submitted, Reconciling, Completed, CompletedWithFailures };

    AppendReconciler(BulkTransport& transport, OffsetIndex& offsets, std::string documentIndex);

    // Throws BatchPartialFailure (after commit) when items were rejected and
    // TransportError (before any mutation) when the bulk call itself failed.
    AppendOutcome run(const std::vector<BatchItem>& items, const TransportParams& params);

    State state() const { return state_; }

private:
    BulkTransport& transport_;
    OffsetIndex& offsets_;
    std::string documentIndex_;
    State state_ = State::Received;

    void rollbackUncommitted(const std::vector<std::string>& ids, const std::string& cause, AppendOutcome& outcome);
};

const char* stateName(AppendReconciler::State state);

} // namespace docledger
