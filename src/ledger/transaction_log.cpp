#include "ledger/transaction_log.hpp"
#include "core/errors.hpp"
#include "core/ledger_utils.hpp"
#include <limits>

TransactionLog::TransactionLog(ILedgerStore& store)
    : store_(store)
{
}

Transaction TransactionLog::post(StoreTransaction& uow, Wallet& wallet, const LedgerEntry& entry) const {
    if (entry.amount == 0) {
        throw ValidationError("ledger entry amount must be non-zero");
    }
    if (entry.amount > 0 && wallet.balance > std::numeric_limits<Amount>::max() - entry.amount) {
        throw ValidationError("ledger entry would overflow the wallet balance");
    }
    Amount newBalance = wallet.balance + entry.amount;
    if (newBalance < 0) {
        throw InsufficientFundsError(wallet.balance, -entry.amount);
    }

    Transaction tx;
    tx.id               = LedgerUtils::makeId("tx");
    tx.userId           = wallet.userId;
    tx.amount           = entry.amount;
    tx.currency         = wallet.currency;
    tx.type             = entry.type;
    tx.status           = TransactionStatus::Completed;
    tx.paymentMethodId  = entry.paymentMethodId.empty() ? kSystemTransfer : entry.paymentMethodId;
    tx.description      = entry.description;
    tx.reference        = entry.reference;
    tx.referenceKind    = entry.reference.empty() ? "" : "Escrow";
    tx.gatewayReference = entry.gatewayReference;
    tx.timestamp        = LedgerUtils::nowMs();

    uow.appendTransaction(tx);

    wallet.balance = newBalance;
    wallet.transactionIds.push_back(tx.id);
    wallet.updatedAt = tx.timestamp;
    return tx;
}

Paged<Transaction> TransactionLog::history(const std::string& userId,
                                           std::optional<TransactionType> type,
                                           size_t page,
                                           size_t limit) const
{
    if (userId.empty()) {
        throw ValidationError("User ID is required");
    }
    if (page == 0) page = 1;
    if (limit == 0) limit = 10;

    TransactionFilter filter;
    filter.userId = userId;
    filter.type   = type;

    ListRange range;
    range.skip  = LedgerUtils::pageOffset(page, limit);
    range.limit = limit;

    auto slice = store_.listTransactions(filter, range);

    Paged<Transaction> out;
    out.items      = std::move(slice.items);
    out.pagination = LedgerUtils::makePageInfo(page, limit, slice.total);
    return out;
}

ReconciliationReport TransactionLog::reconcile(const std::string& userId) const {
    ReconciliationReport report;
    report.userId = userId;

    // wallet and entries are read in one unit so no movement lands in between
    store_.withTransaction([&](StoreTransaction& uow) {
        auto wallet = uow.findWallet(userId);
        if (!wallet) {
            throw NotFoundError("Wallet not found for user " + userId);
        }
        report.balance = wallet->balance;

        Amount sum = 0;
        auto entries = uow.transactionsFor(userId);
        for (const auto& tx : entries) {
            sum += tx.amount;
        }
        report.ledgerSum = sum;
        report.entries   = entries.size();
    });

    report.consistent = (report.ledgerSum == report.balance);
    return report;
}
