#ifndef LEDGER_CONFIG_HPP
#define LEDGER_CONFIG_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

struct StoreSettings {
    std::string backend{"file"};          // "file" or "memory"
    std::string path{"data/ledger.json"};
    int lockTimeoutMs{2000};
};

struct GatewaySettings {
    std::string mode{"none"};             // "none", "dry" or "http"
    std::string baseUrl{"https://sandbox.payments.example"};
    std::string keysFile{"config/gateway_keys.enc"};
    std::string passphraseFile{"config/passphrase.txt"};
    long timeoutSeconds{10};
    int dryLatencyMs{0};
};

struct LedgerConfig {
    int platformFeeBps{500};              // 5%
    std::string defaultCurrency{"TND"};
    StoreSettings store;
    GatewaySettings gateway;
    size_t batchWorkers{4};
};

/**
 * Reads config from a JSON file. A missing or unparsable file logs a
 * [CONFIG] warning and yields the defaults above.
 */
LedgerConfig loadLedgerConfig(const std::string& path);

// Missing keys keep their defaults; out-of-range values are replaced by the
// default with a warning.
LedgerConfig parseLedgerConfig(const nlohmann::json& cfg);

#endif // LEDGER_CONFIG_HPP
