#ifndef I_LEDGER_STORE_HPP
#define I_LEDGER_STORE_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/ledger_types.hpp"

struct ListRange {
    size_t skip{0};
    size_t limit{0}; // 0 = no limit
};

struct EscrowFilter {
    std::string userId;
    std::string role;                   // "client", "freelancer", or empty for either
    std::optional<EscrowStatus> status;
};

struct TransactionFilter {
    std::string userId;                 // empty = every user
    std::optional<TransactionType> type;
    std::string reference;              // empty = any
};

/**
 * Scoped handle passed to the body of ILedgerStore::withTransaction.
 * Reads see the unit's own pending writes; nothing is visible to other
 * callers until the body returns and the unit commits.
 */
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    // wallet lookup by its unique userId
    virtual std::optional<Wallet> findWallet(const std::string& userId) = 0;
    virtual std::optional<Escrow> findEscrow(const std::string& escrowId) = 0;

    virtual void putWallet(const Wallet& wallet) = 0;
    virtual void putEscrow(const Escrow& escrow) = 0;

    // Transactions are insert-only; an existing id is rejected.
    virtual void appendTransaction(const Transaction& tx) = 0;

    // every entry recorded for userId, including this unit's own appends
    virtual std::vector<Transaction> transactionsFor(const std::string& userId) = 0;
};

/**
 * Keyed storage for wallets, escrows and ledger transactions.
 *
 * Lists are sorted newest first (escrows by createdAt, transactions by
 * append order) and report the total match count alongside the window.
 *
 * withTransaction runs fn as one atomic unit: if fn throws, or the commit
 * fails, no change is kept. Commit failures and lock timeouts surface as
 * StoreError.
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual std::optional<Wallet> findWallet(const std::string& userId) = 0;
    virtual std::optional<Escrow> findEscrow(const std::string& escrowId) = 0;
    virtual std::optional<Transaction> findTransaction(const std::string& txId) = 0;

    virtual ListResult<Escrow> listEscrows(const EscrowFilter& filter, const ListRange& range) = 0;
    virtual ListResult<Transaction> listTransactions(const TransactionFilter& filter,
                                                     const ListRange& range) = 0;

    virtual void withTransaction(const std::function<void(StoreTransaction&)>& fn) = 0;

    // e.g. "memory" or "file:/var/lib/escrow/ledger.json"
    virtual std::string describe() const = 0;
};

#endif // I_LEDGER_STORE_HPP
