#include "DocLedgerHttpServer.hpp"

#include <iostream>

using json = nlohmann::json;
using docledger::AppendOutcome;
using docledger::BatchPartialFailure;
using docledger::CollectionConfig;
using docledger::DocumentCollection;
using docledger::OffsetIndex;

DocLedgerHttpServer::DocLedgerHttpServer(std::string host, int port, std::string dataDir)
    : host_(std::move(host)), port_(port), store_(dataDir), transport_(store_),
      defaultParams_(docledger::TransportParams::fromEnvironment()) {
    openExistingCollections();
    setupRoutes();
}

void DocLedgerHttpServer::run() {
    std::cout << "DocLedger HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("cannot listen on " + host_ + ":" + std::to_string(port_));
    }
}

void DocLedgerHttpServer::openExistingCollections() {
    const std::string prefix = OffsetIndex::kRecordIndexPrefix;
    for (const auto& name : store_.indexNames()) {
        if (name.rfind(prefix, 0) == 0) continue;
        if (!store_.indexExists(prefix + name)) continue;
        auto schema = store_.schema(name);
        if (!schema) continue;
        CollectionConfig config{name, *schema};
        collections_[name] = std::make_unique<DocumentCollection>(transport_, config);
    }
    std::cerr << "DocLedgerHttpServer: reopened " << collections_.size() << " collections\n";
}

DocumentCollection* DocLedgerHttpServer::findCollection(const std::string& name) {
    std::lock_guard<std::mutex> lk(collectionsMutex_);
    auto it = collections_.find(name);
    return it == collections_.end() ? nullptr : it->second.get();
}

void DocLedgerHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok](const httplib::Request&, httplib::Response& res) {
        std::size_t count = 0;
        {
            std::lock_guard<std::mutex> lk(collectionsMutex_);
            count = collections_.size();
        }
        json data = {{"collections", count}, {"store", store_.config()}, {"bulk_defaults", defaultParams_.toJson()}};
        res.set_content(ok(data).dump(), "application/json");
    });

    // --- OPEN / CREATE COLLECTION ---
    server_.Post("/v1/collections", [this, ok, err, isJsonContent](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            res.status = 415;
            res.set_content(err(415, "Content-Type must be application/json").dump(), "application/json");
            return;
        }
        try {
            auto config = CollectionConfig::fromJson(json::parse(req.body));
            std::lock_guard<std::mutex> lk(collectionsMutex_);
            auto it = collections_.find(config.indexName);
            bool created = false;
            if (it == collections_.end()) {
                auto name = config.indexName;
                it = collections_.emplace(name, std::make_unique<DocumentCollection>(transport_, std::move(config))).first;
                created = true;
            }
            res.status = created ? 201 : 200;
            res.set_content(ok(json{{"name", it->first}, {"size", it->second->size()}}).dump(), "application/json");
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(err(400, std::string("Invalid JSON: ") + e.what()).dump(), "application/json");
        } catch (const docledger::ConfigError& e) {
            res.status = 400;
            res.set_content(err(400, e.what()).dump(), "application/json");
        } catch (const docledger::Error& e) {
            res.status = 500;
            res.set_content(err(500, e.what()).dump(), "application/json");
        }
    });

    // --- BULK APPEND ---
    server_.Post(R"(/v1/collections/([A-Za-z0-9_.\-]+)/_bulk)", [this, ok, err, isJsonContent](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            res.status = 415;
            res.set_content(err(415, "Content-Type must be application/json").dump(), "application/json");
            return;
        }
        auto* collection = findCollection(req.matches[1]);
        if (!collection) {
            res.status = 404;
            res.set_content(err(404, "Collection not found").dump(), "application/json");
            return;
        }
        try {
            auto body = json::parse(req.body);
            auto items = docledger::batchFromJson(body.value("docs", json::array()));
            auto params = body.contains("params") ? docledger::TransportParams::fromJson(body["params"]) : defaultParams_;
            AppendOutcome outcome = collection->extend(items, params);
            res.set_content(ok(outcome.toJson()).dump(), "application/json");
        } catch (const BatchPartialFailure& e) {
            res.status = 207;
            json body = {{"status", "partial"}, {"data", e.outcome().toJson()}};
            res.set_content(body.dump(), "application/json");
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(err(400, std::string("Invalid JSON: ") + e.what()).dump(), "application/json");
        } catch (const docledger::ConfigError& e) {
            res.status = 400;
            res.set_content(err(400, e.what()).dump(), "application/json");
        } catch (const docledger::TransportError& e) {
            res.status = 502;
            res.set_content(err(502, e.what()).dump(), "application/json");
        } catch (const docledger::Error& e) {
            res.status = 500;
            res.set_content(err(500, e.what()).dump(), "application/json");
        }
    });

    // --- ORDERED IDS ---
    server_.Get(R"(/v1/collections/([A-Za-z0-9_.\-]+)/ids)", [this, ok, err](const httplib::Request& req, httplib::Response& res) {
        auto* collection = findCollection(req.matches[1]);
        if (!collection) {
            res.status = 404;
            res.set_content(err(404, "Collection not found").dump(), "application/json");
            return;
        }
        auto ids = collection->ids();
        res.set_content(ok(json{{"count", ids.size()}, {"ids", ids}}).dump(), "application/json");
    });

    // --- ID AT OFFSET ---
    server_.Get(R"(/v1/collections/([A-Za-z0-9_.\-]+)/offsets/(\d+))", [this, ok, err](const httplib::Request& req, httplib::Response& res) {
        auto* collection = findCollection(req.matches[1]);
        if (!collection) {
            res.status = 404;
            res.set_content(err(404, "Collection not found").dump(), "application/json");
            return;
        }
        try {
            auto offset = static_cast<std::size_t>(std::stoull(req.matches[2]));
            auto id = collection->idAt(offset);
            json data = {{"offset", offset}, {"id", id}, {"doc", collection->get(id).value_or(json())}};
            res.set_content(ok(data).dump(), "application/json");
        } catch (const std::out_of_range&) {
            res.status = 404;
            res.set_content(err(404, "Offset out of range").dump(), "application/json");
        } catch (const docledger::OutOfRangeError& e) {
            res.status = 404;
            res.set_content(err(404, e.what()).dump(), "application/json");
        }
    });

    // --- DELETE DOCUMENT ---
    server_.Delete(R"(/v1/collections/([A-Za-z0-9_.\-]+)/docs/([^/]+))", [this, ok, err](const httplib::Request& req, httplib::Response& res) {
        auto* collection = findCollection(req.matches[1]);
        if (!collection) {
            res.status = 404;
            res.set_content(err(404, "Collection not found").dump(), "application/json");
            return;
        }
        const std::string id = req.matches[2];
        try {
            if (collection->remove(id)) {
                json data = {{"id", id}, {"deleted", true}, {"size", collection->size()}};
                res.set_content(ok(data).dump(), "application/json");
            } else {
                res.status = 404;
                res.set_content(err(404, "Document not found").dump(), "application/json");
            }
        } catch (const docledger::Error& e) {
            res.status = 500;
            res.set_content(err(500, e.what()).dump(), "application/json");
        }
    });

    // --- CHECKPOINT ---
    server_.Post("/v1/checkpoint", [this, ok, err](const httplib::Request&, httplib::Response& res) {
        if (!store_.persistenceEnabled()) {
            res.status = 409;
            res.set_content(err(409, "Persistence disabled").dump(), "application/json");
            return;
        }
        if (store_.checkpoint()) {
            res.set_content(ok(store_.config()).dump(), "application/json");
        } else {
            res.status = 500;
            res.set_content(err(500, "Checkpoint failed").dump(), "application/json");
        }
    });
}
