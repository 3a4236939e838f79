#include "DocLedgerHttpServer.hpp"
#include <cstdlib>
#include <iostream>

int main() {
    try {
        std::string dataDir = "data";
        int port = 8080;
        if (const char* envDir = std::getenv("DOCLEDGER_DATA_DIR")) dataDir = envDir;
        if (const char* envPort = std::getenv("DOCLEDGER_PORT")) port = std::stoi(envPort);

        DocLedgerHttpServer app("0.0.0.0", port, dataDir);
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
