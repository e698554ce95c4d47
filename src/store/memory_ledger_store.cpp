#include "store/memory_ledger_store.hpp"
#include "core/errors.hpp"
#include "core/ledger_utils.hpp"
#include <algorithm>
#include <iostream>

namespace {

/**
 * Buffers a unit's writes on top of the committed state. Reads fall through
 * to the committed state for anything the unit has not written.
 */
class StagedUnitOfWork : public StoreTransaction {
public:
    explicit StagedUnitOfWork(const LedgerState& committed)
        : committed_(committed)
    {
    }

    std::optional<Wallet> findWallet(const std::string& userId) override {
        auto staged = wallets_.find(userId);
        if (staged != wallets_.end()) return staged->second;
        auto it = committed_.wallets.find(userId);
        if (it == committed_.wallets.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Escrow> findEscrow(const std::string& escrowId) override {
        auto staged = escrows_.find(escrowId);
        if (staged != escrows_.end()) return staged->second;
        auto it = committed_.escrows.find(escrowId);
        if (it == committed_.escrows.end()) return std::nullopt;
        return it->second;
    }

    void putWallet(const Wallet& wallet) override {
        if (wallet.userId.empty()) {
            throw StoreError("wallet without userId", false);
        }
        std::string broken = LedgerUtils::checkWalletInvariants(wallet);
        if (!broken.empty()) {
            throw StoreError("wallet " + wallet.userId + " rejected: " + broken, false);
        }
        wallets_[wallet.userId] = wallet;
    }

    void putEscrow(const Escrow& escrow) override {
        if (escrow.id.empty()) {
            throw StoreError("escrow without id", false);
        }
        escrows_[escrow.id] = escrow;
    }

    void appendTransaction(const Transaction& tx) override {
        if (tx.id.empty()) {
            throw StoreError("transaction without id", false);
        }
        bool seen = committed_.transactionIndex.count(tx.id) > 0
            || std::any_of(appended_.begin(), appended_.end(),
                           [&](const Transaction& t) { return t.id == tx.id; });
        if (seen) {
            throw StoreError("transaction " + tx.id + " already recorded", false);
        }
        appended_.push_back(tx);
    }

    std::vector<Transaction> transactionsFor(const std::string& userId) override {
        std::vector<Transaction> out;
        for (const auto& t : committed_.transactions) {
            if (t.userId == userId) out.push_back(t);
        }
        for (const auto& t : appended_) {
            if (t.userId == userId) out.push_back(t);
        }
        return out;
    }

    const std::map<std::string, Wallet>& stagedWallets() const { return wallets_; }
    const std::map<std::string, Escrow>& stagedEscrows() const { return escrows_; }
    const std::vector<Transaction>& appended() const { return appended_; }

private:
    const LedgerState& committed_;
    std::map<std::string, Wallet> wallets_;
    std::map<std::string, Escrow> escrows_;
    std::vector<Transaction> appended_;
};

bool matches(const EscrowFilter& f, const Escrow& e) {
    if (!f.userId.empty()) {
        if (f.role == "client") {
            if (e.clientId != f.userId) return false;
        } else if (f.role == "freelancer") {
            if (e.freelancerId != f.userId) return false;
        } else if (e.clientId != f.userId && e.freelancerId != f.userId) {
            return false;
        }
    }
    if (f.status && e.status != *f.status) return false;
    return true;
}

bool matches(const TransactionFilter& f, const Transaction& t) {
    if (!f.userId.empty() && t.userId != f.userId) return false;
    if (f.type && t.type != *f.type) return false;
    if (!f.reference.empty() && t.reference != f.reference) return false;
    return true;
}

template <typename T>
ListResult<T> window(std::vector<T>&& all, const ListRange& range) {
    ListResult<T> out;
    out.total = all.size();
    if (range.skip >= all.size()) return out;
    auto first = all.begin() + range.skip;
    auto last  = all.end();
    if (range.limit > 0 && (size_t)(last - first) > range.limit) {
        last = first + range.limit;
    }
    out.items.assign(std::make_move_iterator(first), std::make_move_iterator(last));
    return out;
}

} // anonymous namespace

MemoryLedgerStore::MemoryLedgerStore(std::chrono::milliseconds lockTimeout)
    : lockTimeout_(lockTimeout)
{
}

std::unique_lock<std::timed_mutex> MemoryLedgerStore::acquire(const char* what) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(lockTimeout_)) {
        throw StoreError(std::string("timed out waiting for ledger lock (") + what + ")");
    }
    return lock;
}

std::optional<Wallet> MemoryLedgerStore::findWallet(const std::string& userId) {
    auto lock = acquire("findWallet");
    auto it = state_.wallets.find(userId);
    if (it == state_.wallets.end()) return std::nullopt;
    return it->second;
}

std::optional<Escrow> MemoryLedgerStore::findEscrow(const std::string& escrowId) {
    auto lock = acquire("findEscrow");
    auto it = state_.escrows.find(escrowId);
    if (it == state_.escrows.end()) return std::nullopt;
    return it->second;
}

std::optional<Transaction> MemoryLedgerStore::findTransaction(const std::string& txId) {
    auto lock = acquire("findTransaction");
    auto it = state_.transactionIndex.find(txId);
    if (it == state_.transactionIndex.end()) return std::nullopt;
    return state_.transactions[it->second];
}

ListResult<Escrow> MemoryLedgerStore::listEscrows(const EscrowFilter& filter, const ListRange& range) {
    std::vector<Escrow> hits;
    {
        auto lock = acquire("listEscrows");
        for (const auto& kv : state_.escrows) {
            if (matches(filter, kv.second)) hits.push_back(kv.second);
        }
    }
    std::sort(hits.begin(), hits.end(), [](const Escrow& a, const Escrow& b) {
        if (a.createdAt != b.createdAt) return a.createdAt > b.createdAt;
        return a.id > b.id;
    });
    return window(std::move(hits), range);
}

ListResult<Transaction> MemoryLedgerStore::listTransactions(const TransactionFilter& filter,
                                                            const ListRange& range)
{
    std::vector<Transaction> hits;
    {
        auto lock = acquire("listTransactions");
        for (auto it = state_.transactions.rbegin(); it != state_.transactions.rend(); ++it) {
            if (matches(filter, *it)) hits.push_back(*it);
        }
    }
    return window(std::move(hits), range);
}

void MemoryLedgerStore::withTransaction(const std::function<void(StoreTransaction&)>& fn) {
    auto lock = acquire("unit of work");

    StagedUnitOfWork uow(state_);
    fn(uow); // a throw here drops everything staged

    // apply, remembering what was there before
    std::vector<std::pair<std::string, std::optional<Wallet>>> walletUndo;
    std::vector<std::pair<std::string, std::optional<Escrow>>> escrowUndo;
    size_t txCountBefore = state_.transactions.size();

    for (const auto& kv : uow.stagedWallets()) {
        auto it = state_.wallets.find(kv.first);
        walletUndo.emplace_back(kv.first, it == state_.wallets.end()
                                              ? std::nullopt
                                              : std::optional<Wallet>(it->second));
        state_.wallets[kv.first] = kv.second;
    }
    for (const auto& kv : uow.stagedEscrows()) {
        auto it = state_.escrows.find(kv.first);
        escrowUndo.emplace_back(kv.first, it == state_.escrows.end()
                                              ? std::nullopt
                                              : std::optional<Escrow>(it->second));
        state_.escrows[kv.first] = kv.second;
    }
    for (const auto& tx : uow.appended()) {
        state_.transactionIndex[tx.id] = state_.transactions.size();
        state_.transactions.push_back(tx);
    }

    try {
        persistLocked(state_);
    } catch (const std::exception& e) {
        for (auto& u : walletUndo) {
            if (u.second) state_.wallets[u.first] = *u.second;
            else state_.wallets.erase(u.first);
        }
        for (auto& u : escrowUndo) {
            if (u.second) state_.escrows[u.first] = *u.second;
            else state_.escrows.erase(u.first);
        }
        while (state_.transactions.size() > txCountBefore) {
            state_.transactionIndex.erase(state_.transactions.back().id);
            state_.transactions.pop_back();
        }
        std::cerr << "[STORE] Commit failed, unit of work rolled back: " << e.what() << "\n";
        throw StoreError(std::string("commit failed: ") + e.what(), false);
    }
}

void MemoryLedgerStore::persistLocked(const LedgerState&) {
    // nothing to persist
}
