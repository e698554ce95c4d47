#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <chrono>
#include <string>
#include "engine/escrow_engine.hpp"
#include "gateway/i_payment_gateway.hpp"
#include "ledger/transaction_log.hpp"
#include "ledger/wallet_ledger.hpp"
#include "store/memory_ledger_store.hpp"

/**
 * A complete in-memory ledger: store, log, wallets and escrow engine wired
 * the way escrowd wires them.
 */
struct LedgerHarness {
    explicit LedgerHarness(IPaymentGateway* gateway = nullptr,
                           int feeBps = 500,
                           std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(2000))
        : store(lockTimeout)
        , log(store)
        , wallets(store, log, "TND", gateway)
        , engine(store, wallets, log, feeBps)
    {
    }

    // bank transfer method + deposit; returns the method id
    std::string fund(const std::string& userId, Amount amount) {
        PaymentMethodSpec spec;
        spec.type = "bank_transfer";
        PaymentMethod pm = wallets.addPaymentMethod(userId, spec);
        if (amount > 0) {
            wallets.deposit(userId, amount, pm.id);
        }
        return pm.id;
    }

    EscrowFunding openEscrow(const std::string& clientId,
                             const std::string& freelancerId,
                             Amount amount,
                             const std::string& paymentMethodId = "pm_any")
    {
        CreateEscrowRequest req;
        req.clientId        = clientId;
        req.freelancerId    = freelancerId;
        req.serviceName     = "Logo design";
        req.description     = "Three logo concepts";
        req.amount          = amount;
        req.paymentMethodId = paymentMethodId;
        return engine.create(req);
    }

    // funded => in_progress => delivered
    Escrow deliveredEscrow(const std::string& clientId,
                           const std::string& freelancerId,
                           Amount amount)
    {
        EscrowFunding f = openEscrow(clientId, freelancerId, amount);
        engine.start(f.escrow.id, freelancerId);
        return engine.deliver(f.escrow.id, freelancerId, "Final files attached");
    }

    Wallet wallet(const std::string& userId) {
        return wallets.getOrCreate(userId);
    }

    MemoryLedgerStore store;
    TransactionLog log;
    WalletLedger wallets;
    EscrowEngine engine;
};

#endif // TEST_HELPERS_HPP
