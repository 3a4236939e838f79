#pragma once

#include <atomic>
#include <cstdint>
#include <vector>
#include "docledger/BulkTransport.hpp"
#include "docledger/DocumentStore.hpp"

namespace docledger {

// BulkTransport over an in-process DocumentStore. A submission is split into
// chunks bounded by chunk_size operations and max_chunk_bytes, which are
// handed to thread_count workers through a queue of at most queue_size
// chunks. Results are returned in completion order.
class LocalBulkTransport : public BulkTransport {
public:
    struct Stats {
        uint64_t submissions = 0;
        uint64_t chunks = 0;
        uint64_t operations = 0;
    };

    explicit LocalBulkTransport(DocumentStore& store);

    std::vector<BulkItemResult> submitBulk(const std::vector<BulkOperation>& operations,
                                           const TransportParams& params) override;
    bool ensureIndex(const std::string& index, const IndexSchema& schema) override;
    std::vector<StoredDocument> scan(const std::string& index) override;
    std::optional<nlohmann::json> fetch(const std::string& index, const std::string& id) override;

    Stats stats() const;

    // Splits operations the way submitBulk does. Exposed for tests.
    static std::vector<std::vector<BulkOperation>> chunk(const std::vector<BulkOperation>& operations,
                                                         const TransportParams& params);

private:
    DocumentStore& store_;
    std::atomic<uint64_t> submissions_{0};
    std::atomic<uint64_t> chunks_{0};
    std::atomic<uint64_t> operations_{0};
};

} // namespace docledger
