#include "docledger/DocumentStore.hpp"
#include "docledger/Errors.hpp"
#include "docledger/LocalBulkTransport.hpp"
#include "docledger/OffsetIndex.hpp"
#include "TestSupport.hpp"

#include <iostream>
#include <string>
#include <vector>

using docledger::BulkOperation;
using docledger::DocumentStore;
using docledger::LocalBulkTransport;
using docledger::OffsetIndex;
using testsupport::expect;
using testsupport::expectThrows;

static void testAppendAndLookup() {
    DocumentStore store;
    LocalBulkTransport transport(store);
    OffsetIndex offsets(transport, "books");
    expect(offsets.load() == 0, "fresh ledger is empty");
    expect(offsets.recordIndex() == "offset2id__books", "record index name");

    expect(offsets.append("a") == 0, "first append gets offset 0");
    expect(offsets.append("b") == 1, "second append gets offset 1");
    offsets.appendAll({"c", "d"});
    expect(offsets.count() == 4, "count after appends");
    expect(offsets.idAt(2) == "c", "idAt(2)");
    expect(offsets.offsetOf("d") == 3, "offsetOf(d)");
    expect(offsets.contains("a") && !offsets.contains("z"), "contains");

    expectThrows<docledger::DuplicateIdError>([&] { offsets.append("b"); }, "append of existing id");
    expectThrows<docledger::DuplicateIdError>([&] { offsets.appendAll({"x", "x"}); }, "appendAll with repeat");
    expect(offsets.count() == 4, "rejected appends leave count alone");
    expectThrows<docledger::OutOfRangeError>([&] { offsets.idAt(4); }, "idAt past end");
    expectThrows<docledger::OutOfRangeError>([&] { offsets.offsetOf("zz"); }, "offsetOf unknown id");

    // one record per offset in the store
    expect(store.documentCount("offset2id__books") == 4, "records persisted");
    auto rec = store.getDocument("offset2id__books", "3");
    expect(rec && (*rec)["blob"] == "d", "record 3 holds d");
}

static void testRemoveAtShiftsDown() {
    DocumentStore store;
    LocalBulkTransport transport(store);
    OffsetIndex offsets(transport, "shift");
    offsets.load();
    offsets.appendAll({"a", "b", "c", "d", "e"});

    offsets.removeAt(1);
    expect(offsets.count() == 4, "count after removeAt");
    std::vector<std::string> expected{"a", "c", "d", "e"};
    expect(offsets.ids() == expected, "ids shifted down");
    for (std::size_t i = 0; i < offsets.count(); ++i) {
        expect(offsets.offsetOf(offsets.idAt(i)) == i, "reverse map agrees at " + std::to_string(i));
    }
    expect(!offsets.contains("b"), "removed id gone");

    offsets.removeAt(3);
    expect(offsets.count() == 3 && offsets.idAt(2) == "d", "remove last");
    expectThrows<docledger::OutOfRangeError>([&] { offsets.removeAt(3); }, "removeAt == count");

    expect(store.documentCount("offset2id__shift") == 3, "persisted records shrink with the ledger");
    auto rec = store.getDocument("offset2id__shift", "1");
    expect(rec && (*rec)["blob"] == "c", "record 1 rewritten");
}

static void testReloadFromDisk() {
    const auto dir = testsupport::freshDir("offset_reload");
    {
        DocumentStore store(dir);
        LocalBulkTransport transport(store);
        OffsetIndex offsets(transport, "persisted");
        offsets.load();
        for (int i = 0; i < 12; ++i) offsets.append("doc" + std::to_string(i));
        offsets.removeAt(0);
    }
    {
        DocumentStore store(dir);
        LocalBulkTransport transport(store);
        OffsetIndex offsets(transport, "persisted");
        expect(offsets.load() == 11, "reloaded count");
        expect(offsets.idAt(0) == "doc1", "first id after reload");
        expect(offsets.idAt(10) == "doc11", "offset 10 sorts numerically, not lexically");
    }
}

static void testLoadTrimsStaleRecords() {
    DocumentStore store;
    LocalBulkTransport transport(store);
    {
        OffsetIndex offsets(transport, "stale");
        offsets.load();
        offsets.appendAll({"a", "b"});
    }
    // a gap at offset 2 and a repeated id at 4 leave records 3..5 unreachable
    store.applyBulk({
        BulkOperation{BulkOperation::Type::Index, "offset2id__stale", "3", {{"blob", "d"}}},
        BulkOperation{BulkOperation::Type::Index, "offset2id__stale", "4", {{"blob", "a"}}},
        BulkOperation{BulkOperation::Type::Index, "offset2id__stale", "x", {{"blob", "junk"}}},
    });
    OffsetIndex offsets(transport, "stale");
    expect(offsets.load() == 2, "contiguous prefix only");
    expect(store.documentCount("offset2id__stale") == 3, "stale offsets deleted, malformed key left alone");
    offsets.append("c");
    expect(offsets.idAt(2) == "c", "append continues the prefix");
}

static void testMaintenanceUsesDefaultParams() {
    DocumentStore store;
    LocalBulkTransport inner(store);
    testsupport::RecordingTransport transport(inner);
    OffsetIndex offsets(transport, "params");
    offsets.load();
    offsets.appendAll({"a", "b", "c"});
    offsets.removeAt(0);
    expect(!transport.calls.empty(), "maintenance writes happened");
    for (const auto& call : transport.calls) {
        expect(call.params == docledger::TransportParams::defaults(), "maintenance write used default params");
    }
}

static void testRejectedRecordLeavesLedgerUnchanged() {
    DocumentStore store;
    LocalBulkTransport inner(store);
    testsupport::RecordingTransport transport(inner);
    OffsetIndex offsets(transport, "reject");
    offsets.load();
    offsets.append("a");
    transport.rejectIndex = "offset2id__reject";
    expectThrows<docledger::StorageError>([&] { offsets.append("b"); }, "rejected record surfaces");
    expect(offsets.count() == 1 && !offsets.contains("b"), "ledger not advanced");
    expectThrows<docledger::StorageError>([&] { offsets.removeAt(0); }, "rejected rewrite surfaces");
    expect(offsets.count() == 1, "ledger unchanged after failed removal");
}

static void testUnacknowledgedRecordIsNotCommitted() {
    DocumentStore store;
    LocalBulkTransport inner(store);
    testsupport::RecordingTransport transport(inner);
    OffsetIndex offsets(transport, "unacked");
    offsets.load();
    offsets.append("a");
    transport.dropLastResult = true;
    expectThrows<docledger::StorageError>([&] { offsets.appendAll({"b", "c"}); }, "missing result surfaces");
    transport.dropLastResult = false;
    expect(offsets.count() < 3, "record without a result never committed");
    expect(offsets.idAt(0) == "a", "existing offsets untouched");
    expect(store.documentCount("offset2id__unacked") == offsets.count(), "uncommitted records deleted again");
}

static void testRefusedShiftRestoresRecords() {
    DocumentStore store;
    LocalBulkTransport inner(store);
    testsupport::RecordingTransport transport(inner);
    std::vector<std::string> expected{"a", "b", "c"};
    {
        OffsetIndex offsets(transport, "shift");
        offsets.load();
        offsets.appendAll(expected);
        transport.rejectDeletesOn = "offset2id__shift";
        expectThrows<docledger::StorageError>([&] { offsets.removeAt(0); }, "refused tail delete surfaces");
        transport.rejectDeletesOn.clear();
        expect(offsets.ids() == expected, "in-memory ledger unchanged");
    }
    OffsetIndex reloaded(transport, "shift");
    expect(reloaded.load() == 3, "all records still persisted");
    expect(reloaded.ids() == expected, "persisted order restored");
}

int main() {
    testAppendAndLookup();
    testRemoveAtShiftsDown();
    testReloadFromDisk();
    testLoadTrimsStaleRecords();
    testMaintenanceUsesDefaultParams();
    testRejectedRecordLeavesLedgerUnchanged();
    testUnacknowledgedRecordIsNotCommitted();
    testRefusedShiftRestoresRecords();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
