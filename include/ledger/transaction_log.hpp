#ifndef TRANSACTION_LOG_HPP
#define TRANSACTION_LOG_HPP

#include <optional>
#include <string>
#include "core/ledger_types.hpp"
#include "store/i_ledger_store.hpp"

// What a caller wants recorded; post() fills in id, user, currency, time.
struct LedgerEntry {
    TransactionType type{TransactionType::Deposit};
    Amount amount{0}; // signed
    std::string paymentMethodId;
    std::string description;
    std::string reference;        // escrow id, optional
    std::string gatewayReference; // optional
};

struct ReconciliationReport {
    std::string userId;
    Amount ledgerSum{0};
    Amount balance{0};
    size_t entries{0};
    bool consistent{false};
};

const char* const kSystemTransfer = "system_transfer";

/**
 * Append-only record of every balance movement.
 *
 * post() is the only way balances change: it applies the entry's amount to
 * the wallet and appends the entry within the caller's unit of work, so a
 * wallet's balance always equals the sum of its entries.
 */
class TransactionLog {
public:
    explicit TransactionLog(ILedgerStore& store);

    /**
     * Applies entry.amount to wallet.balance, records the new id in
     * wallet.transactionIds and appends the Transaction to uow.
     * The caller still has to putWallet(wallet) in the same unit.
     * Throws InsufficientFundsError if a debit would take the balance below zero.
     */
    Transaction post(StoreTransaction& uow, Wallet& wallet, const LedgerEntry& entry) const;

    // newest first; page is 1-based
    Paged<Transaction> history(const std::string& userId,
                               std::optional<TransactionType> type,
                               size_t page,
                               size_t limit) const;

    ReconciliationReport reconcile(const std::string& userId) const;

private:
    ILedgerStore& store_;
};

#endif // TRANSACTION_LOG_HPP
