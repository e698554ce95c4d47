#ifndef WALLET_LEDGER_HPP
#define WALLET_LEDGER_HPP

#include <optional>
#include <string>
#include "core/ledger_types.hpp"
#include "gateway/i_payment_gateway.hpp"
#include "ledger/transaction_log.hpp"
#include "store/i_ledger_store.hpp"

struct PaymentMethodSpec {
    std::string type;          // credit_card | paypal | bank_transfer
    std::string cardNumber;    // only the last four digits are kept
    std::string expiryMonth;
    std::string expiryYear;
    std::string name;
    bool isDefault{false};
    std::string gatewayToken;
};

struct WalletView {
    Wallet wallet;
    Amount availableBalance{0};
};

struct BalanceChange {
    Amount newBalance{0};
    Amount availableBalance{0};
    Transaction transaction;
    std::string gatewayReference;
};

/**
 * Per-user wallet operations: deposits, withdrawals and payment methods.
 * Each public call is one unit of work against the store.
 */
class WalletLedger {
public:
    WalletLedger(ILedgerStore& store,
                 TransactionLog& log,
                 const std::string& defaultCurrency,
                 IPaymentGateway* gateway = nullptr);

    Wallet getOrCreate(const std::string& userId);

    // getOrCreate plus the derived balance - reserved
    WalletView walletView(const std::string& userId);

    BalanceChange deposit(const std::string& userId,
                          Amount amount,
                          const std::string& paymentMethodId,
                          const std::string& currency = "");

    BalanceChange withdraw(const std::string& userId,
                           Amount amount,
                           const std::string& paymentMethodId,
                           const std::string& currency = "");

    PaymentMethod addPaymentMethod(const std::string& userId, const PaymentMethodSpec& spec);
    Wallet removePaymentMethod(const std::string& userId, const std::string& methodId);
    Wallet setDefaultPaymentMethod(const std::string& userId, const std::string& methodId);

    Paged<Transaction> transactions(const std::string& userId,
                                    std::optional<TransactionType> type,
                                    size_t page,
                                    size_t limit);

    ReconciliationReport reconcile(const std::string& userId);

    /**
     * Loads the wallet for userId inside an open unit of work, creating a
     * fresh one (not yet stored) if absent. Shared with the escrow engine.
     */
    Wallet loadOrCreate(StoreTransaction& uow, const std::string& userId) const;

    const std::string& defaultCurrency() const { return defaultCurrency_; }

private:
    void checkCurrency(const Wallet& wallet, const std::string& currency) const;

    ILedgerStore& store_;
    TransactionLog& log_;
    std::string defaultCurrency_;
    IPaymentGateway* gateway_;
};

#endif // WALLET_LEDGER_HPP
