#pragma once

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include "docledger/BulkTransport.hpp"
#include "docledger/Errors.hpp"

namespace testsupport {

inline void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

template <typename E, typename Fn>
void expectThrows(Fn&& fn, const std::string& msg) {
    try {
        fn();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        expect(false, msg + " (threw something else: " + e.what() + ")");
    }
    expect(false, msg + " (nothing thrown)");
}

inline std::string freshDir(const std::string& name) {
    const std::string dir = "testdata_" + name;
    std::filesystem::remove_all(dir);
    return dir;
}

// Wraps a transport and records what every bulk call carried. Can reorder
// results, drop one, or fail outright to exercise the reconciler.
class RecordingTransport : public docledger::BulkTransport {
public:
    struct Call {
        std::string index;   // index of the first operation
        std::size_t operations = 0;
        docledger::TransportParams params;
    };

    explicit RecordingTransport(docledger::BulkTransport& inner) : inner_(inner) {}

    bool reverseResults = false;
    bool dropLastResult = false;
    bool failSubmissions = false;
    // When set, operations for this index are rejected with "injected failure".
    std::string rejectIndex;
    // When set, only delete operations for this index are rejected.
    std::string rejectDeletesOn;
    // When set, any call carrying an operation for this index throws TransportError.
    std::string throwOnIndex;

    std::vector<Call> calls;

    std::vector<docledger::BulkItemResult> submitBulk(const std::vector<docledger::BulkOperation>& operations,
                                                      const docledger::TransportParams& params) override {
        calls.push_back(Call{operations.empty() ? std::string() : operations.front().index, operations.size(), params});
        if (failSubmissions) throw docledger::TransportError("connection refused");
        if (!throwOnIndex.empty()) {
            for (const auto& op : operations) {
                if (op.index == throwOnIndex) throw docledger::TransportError("connection reset by " + throwOnIndex);
            }
        }

        std::vector<docledger::BulkOperation> forwarded;
        std::vector<docledger::BulkItemResult> results;
        for (const auto& op : operations) {
            const bool rejectedDelete = !rejectDeletesOn.empty() && op.index == rejectDeletesOn &&
                                        op.type == docledger::BulkOperation::Type::Delete;
            if (rejectedDelete || (!rejectIndex.empty() && op.index == rejectIndex)) {
                results.push_back(docledger::BulkItemResult::failure(op.index, op.id, "injected failure"));
            } else {
                forwarded.push_back(op);
            }
        }
        if (!forwarded.empty()) {
            auto innerResults = inner_.submitBulk(forwarded, params);
            results.insert(results.end(), innerResults.begin(), innerResults.end());
        }
        if (reverseResults) std::reverse(results.begin(), results.end());
        if (dropLastResult && !results.empty()) results.pop_back();
        return results;
    }

    bool ensureIndex(const std::string& index, const docledger::IndexSchema& schema) override {
        return inner_.ensureIndex(index, schema);
    }
    std::vector<docledger::StoredDocument> scan(const std::string& index) override {
        return inner_.scan(index);
    }
    std::optional<nlohmann::json> fetch(const std::string& index, const std::string& id) override {
        return inner_.fetch(index, id);
    }

    std::vector<Call> callsFor(const std::string& index) const {
        std::vector<Call> out;
        for (const auto& c : calls) {
            if (c.index == index) out.push_back(c);
        }
        return out;
    }

private:
    docledger::BulkTransport& inner_;
};

} // namespace testsupport
