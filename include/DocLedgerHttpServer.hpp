#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "httplib.h"
#include "docledger/DocumentCollection.hpp"
#include "docledger/DocumentStore.hpp"
#include "docledger/LocalBulkTransport.hpp"
#include <nlohmann/json.hpp>

class DocLedgerHttpServer {
public:
    DocLedgerHttpServer(std::string host, int port, std::string dataDir = "");
    void run();

private:
    void setupRoutes();
    void openExistingCollections();
    docledger::DocumentCollection* findCollection(const std::string& name);

    std::string host_;
    int port_;
    httplib::Server server_;
    docledger::DocumentStore store_;
    docledger::LocalBulkTransport transport_;
    docledger::TransportParams defaultParams_;
    std::mutex collectionsMutex_;
    std::map<std::string, std::unique_ptr<docledger::DocumentCollection>> collections_;
};
