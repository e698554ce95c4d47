#include "core/config.hpp"
#include <cmath>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

LedgerConfig loadLedgerConfig(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[CONFIG] Could not open " << path
                  << ", using defaults.\n";
        return LedgerConfig{};
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        std::cerr << "[CONFIG] Parse error in " << path << ": " << e.what()
                  << ", using defaults.\n";
        return LedgerConfig{};
    }
    try {
        return parseLedgerConfig(j);
    } catch (const json::exception& e) {
        std::cerr << "[CONFIG] Bad value in " << path << ": " << e.what()
                  << ", using defaults.\n";
        return LedgerConfig{};
    }
}

LedgerConfig parseLedgerConfig(const json& cfg) {
    LedgerConfig out;
    if (!cfg.is_object()) {
        std::cerr << "[CONFIG] Top-level config is not an object, using defaults.\n";
        return out;
    }

    double feeRate = cfg.value("platformFeeRate", 0.05);
    if (feeRate < 0.0 || feeRate > 1.0) {
        std::cerr << "[CONFIG] platformFeeRate=" << feeRate
                  << " outside [0,1], using 0.05\n";
        feeRate = 0.05;
    }
    out.platformFeeBps  = (int)std::lround(feeRate * 10000.0);
    out.defaultCurrency = cfg.value("defaultCurrency", out.defaultCurrency);

    int workers = cfg.value("batchWorkers", (int)out.batchWorkers);
    out.batchWorkers = (workers > 0) ? (size_t)workers : 1;

    if (cfg.contains("store") && cfg["store"].is_object()) {
        const json& s = cfg["store"];
        out.store.backend       = s.value("backend", out.store.backend);
        out.store.path          = s.value("path", out.store.path);
        out.store.lockTimeoutMs = s.value("lockTimeoutMs", out.store.lockTimeoutMs);
        if (out.store.lockTimeoutMs <= 0) {
            std::cerr << "[CONFIG] store.lockTimeoutMs must be positive, using 2000\n";
            out.store.lockTimeoutMs = 2000;
        }
    }

    if (cfg.contains("gateway") && cfg["gateway"].is_object()) {
        const json& g = cfg["gateway"];
        out.gateway.mode           = g.value("mode", out.gateway.mode);
        out.gateway.baseUrl        = g.value("baseUrl", out.gateway.baseUrl);
        out.gateway.keysFile       = g.value("keysFile", out.gateway.keysFile);
        out.gateway.passphraseFile = g.value("passphraseFile", out.gateway.passphraseFile);
        out.gateway.timeoutSeconds = g.value("timeoutSeconds", out.gateway.timeoutSeconds);
        out.gateway.dryLatencyMs   = g.value("dryLatencyMs", out.gateway.dryLatencyMs);
    }

    std::cout << "[CONFIG] feeBps=" << out.platformFeeBps
              << " currency=" << out.defaultCurrency
              << " store=" << out.store.backend << ":" << out.store.path
              << " gateway=" << out.gateway.mode
              << " batchWorkers=" << out.batchWorkers << "\n";
    return out;
}
