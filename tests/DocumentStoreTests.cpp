#include "docledger/DocumentStore.hpp"
#include "docledger/LocalBulkTransport.hpp"
#include "docledger/Snapshot.hpp"
#include "TestSupport.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using docledger::BulkItemResult;
using docledger::BulkOperation;
using docledger::DocumentStore;
using docledger::IndexSchema;
using docledger::LocalBulkTransport;
using nlohmann::json;
using testsupport::expect;

static IndexSchema intSchema() {
    IndexSchema schema;
    schema.columns["price"] = docledger::ColumnType::Int;
    return schema;
}

static void testBulkApply() {
    DocumentStore store;
    expect(!store.persistenceEnabled(), "no data dir, no persistence");
    expect(store.createIndex("shop", intSchema()), "create index");
    expect(!store.createIndex("shop", intSchema()), "create twice refused");
    expect(!store.createIndex("bad/name", intSchema()), "path-like name refused");

    auto results = store.applyBulk({
        BulkOperation{BulkOperation::Type::Index, "shop", "a", {{"price", 1}}},
        BulkOperation{BulkOperation::Type::Index, "shop", "b", {{"price", 10000000000LL}}},
        BulkOperation{BulkOperation::Type::Index, "nowhere", "c", {{"price", 1}}},
        BulkOperation{BulkOperation::Type::Delete, "shop", "zzz", json()},
        BulkOperation{BulkOperation::Type::Index, "shop", "", {{"price", 1}}},
    });
    expect(results.size() == 5, "one result per op");
    expect(results[0].status == BulkItemResult::Status::Success && results[0].id == "a", "valid doc accepted");
    expect(results[1].status == BulkItemResult::Status::Failure && results[1].id == "b", "overflow rejected");
    expect(results[2].status == BulkItemResult::Status::Failure &&
           results[2].error.find("index_not_found") != std::string::npos, "unknown index rejected");
    expect(results[3].status == BulkItemResult::Status::Success, "deleting an absent doc is a no-op");
    expect(results[4].status == BulkItemResult::Status::Failure, "empty id rejected");
    expect(store.documentCount("shop") == 1, "only a stored");
}

static void testLogReplay() {
    const auto dir = testsupport::freshDir("store_replay");
    {
        DocumentStore store(dir);
        store.createIndex("shop", intSchema());
        store.applyBulk({
            BulkOperation{BulkOperation::Type::Index, "shop", "a", {{"price", 1}}},
            BulkOperation{BulkOperation::Type::Index, "shop", "b", {{"price", 2}}},
            BulkOperation{BulkOperation::Type::Index, "shop", "a", {{"price", 3}}},
            BulkOperation{BulkOperation::Type::Delete, "shop", "b", json()},
        });
    }
    DocumentStore store(dir);
    expect(store.indexExists("shop"), "index restored from manifest");
    expect(store.schema("shop")->columns.at("price") == docledger::ColumnType::Int, "schema restored");
    expect(store.documentCount("shop") == 1, "delete replayed");
    auto a = store.getDocument("shop", "a");
    expect(a && (*a)["price"] == 3, "last write wins on replay");
}

static void testConfigReportsLogBytes() {
    const auto dir = testsupport::freshDir("store_log_bytes");
    DocumentStore store(dir);
    store.createIndex("shop", intSchema());
    expect(store.config()["log_bytes"] == 0, "fresh log is empty");
    store.applyBulk({
        BulkOperation{BulkOperation::Type::Index, "shop", "a", {{"price", 1}}},
        BulkOperation{BulkOperation::Type::Index, "shop", "b", {{"price", 2}}},
    });
    const auto written = store.config()["log_bytes"].get<uint64_t>();
    expect(written > 0, "appends counted");
    store.applyBulk({BulkOperation{BulkOperation::Type::Delete, "shop", "a", json()}});
    expect(store.config()["log_bytes"].get<uint64_t>() > written, "deletes counted");
    expect(store.checkpoint(), "checkpoint");
    expect(store.config()["log_bytes"] == 0, "checkpoint truncates the logs");
}

static void testCheckpointRoundTrip() {
    const auto dir = testsupport::freshDir("store_checkpoint");
    {
        DocumentStore store(dir);
        store.createIndex("shop", intSchema());
        std::vector<BulkOperation> ops;
        for (int i = 0; i < 200; ++i) {
            ops.push_back(BulkOperation{BulkOperation::Type::Index, "shop", "d" + std::to_string(i), {{"price", i}}});
        }
        store.applyBulk(ops);
        expect(store.checkpoint(), "checkpoint succeeds");
        expect(std::filesystem::file_size(std::filesystem::path(dir) / "shop.log") == 0, "log truncated");
        store.applyBulk({BulkOperation{BulkOperation::Type::Delete, "shop", "d0", json()}});
    }
    DocumentStore store(dir);
    expect(store.documentCount("shop") == 199, "snapshot plus log tail");
    expect(!store.getDocument("shop", "d0"), "post-checkpoint delete replayed");
    expect(store.getDocument("shop", "d199").has_value(), "snapshot docs present");
}

static void testSnapshotCodec() {
    const auto dir = testsupport::freshDir("snapshot_codec");
    std::filesystem::create_directories(dir);
    const std::string path = (std::filesystem::path(dir) / "body.snap").string();
    json body;
    body["documents"]["x"]["v"] = std::string(4096, 'a');

    expect(docledger::writeSnapshot(path, body, true), "compressed write");
    auto compressedSize = std::filesystem::file_size(path);
    auto back = docledger::readSnapshot(path);
    expect(back && *back == body, "compressed snapshot decodes");

    expect(docledger::writeSnapshot(path, body, false), "raw write");
    expect(std::filesystem::file_size(path) > compressedSize, "zstd shrinks repetitive payloads");
    auto raw = docledger::readSnapshot(path);
    expect(raw && *raw == body, "raw snapshot decodes");

    {
        std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
        f.seekp(30);
        f.put('#');
    }
    expect(!docledger::readSnapshot(path), "corrupted snapshot rejected");
    expect(!docledger::readSnapshot(path + ".missing"), "missing snapshot is nullopt");
}

static void testDamagedLogTail() {
    const auto dir = testsupport::freshDir("store_damaged");
    {
        DocumentStore store(dir);
        store.createIndex("shop", intSchema());
        store.applyBulk({BulkOperation{BulkOperation::Type::Index, "shop", "a", {{"price", 1}}}});
    }
    {
        std::ofstream log(std::filesystem::path(dir) / "shop.log", std::ios::binary | std::ios::app);
        const char junk[] = {0x10, 0x00, 0x00, 0x00, 'n', 'o', 't', ' ', 'j', 's', 'o', 'n', '!', '!', '!', '!', '!', '!', '!', '!', 0, 0, 0, 0};
        log.write(junk, sizeof(junk));
    }
    {
        DocumentStore store(dir);
        expect(store.documentCount("shop") == 1, "records before the damage survive");
        store.applyBulk({BulkOperation{BulkOperation::Type::Index, "shop", "b", {{"price", 2}}}});
    }
    DocumentStore store(dir);
    expect(store.documentCount("shop") == 2, "writes after recovery are readable");
}

static void testParallelTransport() {
    DocumentStore store;
    LocalBulkTransport transport(store);
    expect(transport.ensureIndex("par", IndexSchema{}), "index created through transport");
    expect(!transport.ensureIndex("par", IndexSchema{}), "second ensure is a no-op");

    std::vector<BulkOperation> ops;
    for (int i = 0; i < 1000; ++i) {
        ops.push_back(BulkOperation{BulkOperation::Type::Index, "par", "k" + std::to_string(i), {{"i", i}}});
    }
    docledger::TransportParams params;
    params.threadCount = 8;
    params.chunkSize = 7;
    params.queueSize = 2;
    auto results = transport.submitBulk(ops, params);
    expect(results.size() == 1000, "every op answered");
    for (const auto& r : results) expect(r.status == BulkItemResult::Status::Success, "op " + r.id + " succeeded");
    expect(store.documentCount("par") == 1000, "all stored");
    auto stats = transport.stats();
    expect(stats.chunks == 143 && stats.operations == 1000 && stats.submissions == 1, "stats counted");
    expect(transport.scan("par").size() == 1000, "scan sees everything");
    expect(transport.fetch("par", "k5").has_value() && !transport.fetch("par", "nope"), "fetch");
}

int main() {
    testBulkApply();
    testLogReplay();
    testConfigReportsLogBytes();
    testCheckpointRoundTrip();
    testSnapshotCodec();
    testDamagedLogTail();
    testParallelTransport();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
