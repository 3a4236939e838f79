#include "docledger/LocalBulkTransport.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include "docledger/Errors.hpp"

namespace docledger {

std::size_t BulkOperation::estimatedBytes() const {
    // action line + source line, as they would travel in an NDJSON bulk body
    std::size_t bytes = index.size() + id.size() + 48;
    if (type == Type::Index) bytes += source.dump().size() + 1;
    return bytes;
}

LocalBulkTransport::LocalBulkTransport(DocumentStore& store) : store_(store) {}

std::vector<std::vector<BulkOperation>> LocalBulkTransport::chunk(const std::vector<BulkOperation>& operations,
                                                                  const TransportParams& params) {
    std::vector<std::vector<BulkOperation>> chunks;
    std::vector<BulkOperation> current;
    std::size_t currentBytes = 0;
    for (const auto& op : operations) {
        std::size_t opBytes = op.estimatedBytes();
        bool full = current.size() >= params.chunkSize ||
                    (!current.empty() && currentBytes + opBytes > params.maxChunkBytes);
        if (full) {
            chunks.push_back(std::move(current));
            current.clear();
            currentBytes = 0;
        }
        current.push_back(op);
        currentBytes += opBytes;
    }
    if (!current.empty()) chunks.push_back(std::move(current));
    return chunks;
}

std::vector<BulkItemResult> LocalBulkTransport::submitBulk(const std::vector<BulkOperation>& operations,
                                                           const TransportParams& params) {
    params.validate();
    ++submissions_;
    if (operations.empty()) return {};

    auto chunks = chunk(operations, params);
    chunks_ += chunks.size();
    operations_ += operations.size();

    std::mutex mu;
    std::condition_variable notEmpty;
    std::condition_variable notFull;
    std::deque<std::vector<BulkOperation>*> queue;
    bool producerDone = false;
    std::vector<BulkItemResult> results;
    results.reserve(operations.size());
    std::exception_ptr failure;

    auto worker = [&]() {
        while (true) {
            std::vector<BulkOperation>* work = nullptr;
            {
                std::unique_lock<std::mutex> lk(mu);
                notEmpty.wait(lk, [&] { return !queue.empty() || producerDone; });
                if (queue.empty()) return;
                work = queue.front();
                queue.pop_front();
            }
            notFull.notify_one();
            try {
                auto chunkResults = store_.applyBulk(*work);
                std::lock_guard<std::mutex> lk(mu);
                for (auto& r : chunkResults) results.push_back(std::move(r));
            } catch (const std::exception& e) {
                std::cerr << "LocalBulkTransport: chunk of " << work->size() << " failed: " << e.what() << "\n";
                std::lock_guard<std::mutex> lk(mu);
                if (!failure) failure = std::current_exception();
            }
        }
    };

    const std::size_t workerCount = std::min(params.threadCount, chunks.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) workers.emplace_back(worker);

    for (auto& c : chunks) {
        std::unique_lock<std::mutex> lk(mu);
        notFull.wait(lk, [&] { return queue.size() < params.queueSize; });
        queue.push_back(&c);
        lk.unlock();
        notEmpty.notify_one();
    }
    {
        std::lock_guard<std::mutex> lk(mu);
        producerDone = true;
    }
    notEmpty.notify_all();
    for (auto& t : workers) t.join();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            throw TransportError(std::string("bulk submission failed: ") + e.what());
        }
    }
    if (results.size() != operations.size()) {
        throw TransportError("bulk response has " + std::to_string(results.size()) + " items for " +
                             std::to_string(operations.size()) + " operations");
    }
    return results;
}

bool LocalBulkTransport::ensureIndex(const std::string& index, const IndexSchema& schema) {
    if (store_.indexExists(index)) return false;
    if (!store_.createIndex(index, schema)) {
        // lost a race with another creator, or the name is unusable
        if (store_.indexExists(index)) return false;
        throw TransportError("cannot create index [" + index + "]");
    }
    return true;
}

std::vector<StoredDocument> LocalBulkTransport::scan(const std::string& index) {
    return store_.documents(index);
}

std::optional<nlohmann::json> LocalBulkTransport::fetch(const std::string& index, const std::string& id) {
    return store_.getDocument(index, id);
}

LocalBulkTransport::Stats LocalBulkTransport::stats() const {
    return Stats{submissions_.load(), chunks_.load(), operations_.load()};
}

} // namespace docledger
