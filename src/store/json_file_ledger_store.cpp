#include "store/json_file_ledger_store.hpp"
#include "core/errors.hpp"
#include "core/json_codec.hpp"
#include "core/ledger_utils.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const int kDocumentVersion = 1;

std::atomic<uint64_t> g_tempCounter{0};

fs::path makeTempPath(const fs::path& target) {
    uint64_t nonce = g_tempCounter.fetch_add(1);
    return target.parent_path() / (target.filename().string() + ".tmp." + std::to_string(nonce));
}

json toDocument(const LedgerState& state) {
    json doc;
    doc["version"] = kDocumentVersion;
    doc["wallets"] = json::array();
    for (const auto& kv : state.wallets) {
        doc["wallets"].push_back(kv.second);
    }
    doc["escrows"] = json::array();
    for (const auto& kv : state.escrows) {
        doc["escrows"].push_back(kv.second);
    }
    doc["transactions"] = state.transactions;
    return doc;
}

LedgerState fromDocument(const json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("ledger document is not an object");
    }
    int version = doc.value("version", 0);
    if (version != kDocumentVersion) {
        throw std::invalid_argument("unsupported ledger version " + std::to_string(version));
    }

    LedgerState state;
    for (const auto& jw : doc.value("wallets", json::array())) {
        Wallet w = jw.get<Wallet>();
        std::string broken = LedgerUtils::checkWalletInvariants(w);
        if (!broken.empty()) {
            throw std::invalid_argument("wallet " + w.userId + ": " + broken);
        }
        state.wallets[w.userId] = w;
    }
    for (const auto& je : doc.value("escrows", json::array())) {
        Escrow e = je.get<Escrow>();
        state.escrows[e.id] = e;
    }
    for (const auto& jt : doc.value("transactions", json::array())) {
        Transaction t = jt.get<Transaction>();
        if (state.transactionIndex.count(t.id)) {
            throw std::invalid_argument("duplicate transaction " + t.id);
        }
        state.transactionIndex[t.id] = state.transactions.size();
        state.transactions.push_back(t);
    }
    return state;
}

} // anonymous namespace

JsonFileLedgerStore::JsonFileLedgerStore(const std::string& path,
                                         std::chrono::milliseconds lockTimeout)
    : MemoryLedgerStore(lockTimeout)
    , path_(path)
{
}

void JsonFileLedgerStore::open() {
    auto lock = acquire("open");

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        std::cout << "[STORE] No ledger at " << path_ << ", starting empty.\n";
        state_ = LedgerState{};
        try {
            persistLocked(state_);
        } catch (const std::exception& e) {
            throw StoreError("cannot initialise ledger at " + path_ + ": " + e.what(), false);
        }
        return;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw StoreError("cannot open ledger " + path_, false);
    }
    try {
        json doc;
        in >> doc;
        state_ = fromDocument(doc);
    } catch (const std::exception& e) {
        throw StoreError("corrupt ledger " + path_ + ": " + e.what(), false);
    }

    std::cout << "[STORE] Loaded " << state_.wallets.size() << " wallets, "
              << state_.escrows.size() << " escrows, "
              << state_.transactions.size() << " transactions from " << path_ << "\n";
}

void JsonFileLedgerStore::persistLocked(const LedgerState& state) {
    fs::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("create_directories failed: " + ec.message());
        }
    }

    fs::path tmp = makeTempPath(target);
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        }
        out << toDocument(state).dump(2);
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("write to " + tmp.string() + " failed");
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
        throw std::runtime_error("rename to " + path_ + " failed: " + ec.message());
    }
}
