#ifndef MEMORY_LEDGER_STORE_HPP
#define MEMORY_LEDGER_STORE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "store/i_ledger_store.hpp"

struct LedgerState {
    std::map<std::string, Wallet> wallets;  // by userId
    std::map<std::string, Escrow> escrows;  // by id
    std::vector<Transaction> transactions;  // append order
    std::unordered_map<std::string, size_t> transactionIndex;
};

/**
 * In-memory ledger store. Also the fallback used when the durable store
 * cannot be opened; nothing survives a restart.
 *
 * Units of work are serialized: a unit holds the commit lock from its
 * first read until it commits, so every read it makes is current.
 * Acquiring the lock gives up after lockTimeout with a retryable StoreError.
 */
class MemoryLedgerStore : public ILedgerStore {
public:
    explicit MemoryLedgerStore(std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(2000));
    ~MemoryLedgerStore() override = default;

    std::optional<Wallet> findWallet(const std::string& userId) override;
    std::optional<Escrow> findEscrow(const std::string& escrowId) override;
    std::optional<Transaction> findTransaction(const std::string& txId) override;

    ListResult<Escrow> listEscrows(const EscrowFilter& filter, const ListRange& range) override;
    ListResult<Transaction> listTransactions(const TransactionFilter& filter,
                                             const ListRange& range) override;

    void withTransaction(const std::function<void(StoreTransaction&)>& fn) override;

    std::string describe() const override { return "memory"; }

protected:
    /**
     * Called with the lock held once a unit's changes are applied to state_.
     * Throwing makes the unit roll back.
     */
    virtual void persistLocked(const LedgerState& state);

    std::unique_lock<std::timed_mutex> acquire(const char* what);

    LedgerState state_;

private:
    std::timed_mutex mutex_;
    std::chrono::milliseconds lockTimeout_;
};

#endif // MEMORY_LEDGER_STORE_HPP
