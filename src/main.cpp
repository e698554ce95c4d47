#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "engine/escrow_engine.hpp"
#include "gateway/credential_vault.hpp"
#include "gateway/dry_payment_gateway.hpp"
#include "gateway/http_payment_gateway.hpp"
#include "ledger/transaction_log.hpp"
#include "ledger/wallet_ledger.hpp"
#include "service/operation_dispatcher.hpp"
#include "store/json_file_ledger_store.hpp"
#include "store/memory_ledger_store.hpp"

static void printUsage() {
    std::cerr << "usage: escrowd [--config path] [--memory] <op> [json-args]\n"
              << "       escrowd [--config path] [--memory] --batch <file>\n"
              << "       escrowd --list\n";
}

static std::string readFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

// Durable store unless configured or forced to memory; falls back to memory
// when the ledger file cannot be opened.
static std::unique_ptr<ILedgerStore> openStore(const StoreSettings& settings, bool forceMemory) {
    std::chrono::milliseconds timeout(settings.lockTimeoutMs);
    if (forceMemory || settings.backend == "memory") {
        std::cout << "[MAIN] Using in-memory ledger store.\n";
        return std::unique_ptr<ILedgerStore>(new MemoryLedgerStore(timeout));
    }

    std::unique_ptr<JsonFileLedgerStore> fileStore(new JsonFileLedgerStore(settings.path, timeout));
    try {
        fileStore->open();
    } catch (const StoreError& e) {
        std::cerr << "[MAIN] Could not open ledger file " << settings.path << ": " << e.what()
                  << "\n[MAIN] Falling back to in-memory store, nothing will be persisted.\n";
        return std::unique_ptr<ILedgerStore>(new MemoryLedgerStore(timeout));
    }
    return std::unique_ptr<ILedgerStore>(fileStore.release());
}

// nullptr => card deposits are recorded without authorization
static std::unique_ptr<IPaymentGateway> openGateway(const GatewaySettings& settings) {
    if (settings.mode == "dry") {
        std::cout << "[MAIN] Using DRY payment gateway.\n";
        return std::unique_ptr<IPaymentGateway>(new DryPaymentGateway(settings.dryLatencyMs));
    }
    if (settings.mode == "http") {
        GatewayCredentials creds = CredentialVault::readGatewayCredentials(settings.keysFile,
                                                                           settings.passphraseFile);
        std::cout << "[MAIN] Using HTTP payment gateway at " << settings.baseUrl << "\n";
        return std::unique_ptr<IPaymentGateway>(new HttpPaymentGateway(creds.apiKey,
                                                                       creds.secretKey,
                                                                       settings.baseUrl,
                                                                       settings.timeoutSeconds));
    }
    if (settings.mode != "none") {
        std::cerr << "[MAIN] Unknown gateway.mode '" << settings.mode << "', running without gateway.\n";
    }
    return nullptr;
}

int main(int argc, char** argv) {
    // 0) CLI args
    std::string configPath = "config/escrow_config.json";
    std::string batchFile;
    bool forceMemory = false;
    bool listOps = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--batch" && i + 1 < argc) {
            batchFile = argv[++i];
        } else if (arg == "--memory") {
            forceMemory = true;
        } else if (arg == "--list") {
            listOps = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (!listOps && batchFile.empty() && positional.empty()) {
        printUsage();
        return 2;
    }

    // 1) Load config
    LedgerConfig cfg = loadLedgerConfig(configPath);

    // 2) Store + gateway
    std::unique_ptr<ILedgerStore> store;
    std::unique_ptr<IPaymentGateway> gateway;
    try {
        store   = openStore(cfg.store, forceMemory || listOps);
        gateway = openGateway(cfg.gateway);
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] Startup failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "[MAIN] store=" << store->describe()
              << " gateway=" << (gateway ? gateway->name() : "none") << "\n";

    // 3) Wire the ledger
    TransactionLog log(*store);
    WalletLedger wallets(*store, log, cfg.defaultCurrency, gateway.get());
    EscrowEngine escrows(*store, wallets, log, cfg.platformFeeBps);
    OperationDispatcher dispatcher(wallets, escrows);

    if (listOps) {
        for (const auto& name : dispatcher.operations()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    // 4) Run batch or single op
    nlohmann::json result;
    try {
        if (!batchFile.empty()) {
            nlohmann::json requests = nlohmann::json::parse(readFile(batchFile));
            result = dispatcher.runBatch(requests, cfg.batchWorkers);
        } else {
            nlohmann::json args = nlohmann::json::object();
            if (positional.size() > 1) {
                args = nlohmann::json::parse(positional[1]);
            }
            result = dispatcher.dispatch(positional[0], args);
        }
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[MAIN] Invalid JSON input: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] " << e.what() << "\n";
        return 1;
    }

    std::cout << result.dump(2) << std::endl;

    if (result.is_array()) {
        for (const auto& r : result) {
            if (!r.value("success", false)) return 1;
        }
        return 0;
    }
    return result.value("success", false) ? 0 : 1;
}
