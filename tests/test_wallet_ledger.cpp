#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "test_helpers.hpp"

TEST(WalletLedger, GetOrCreateMakesEmptyWallet) {
    LedgerHarness h;
    Wallet w = h.wallets.getOrCreate("alice");
    EXPECT_EQ(w.userId, "alice");
    EXPECT_EQ(w.currency, "TND");
    EXPECT_EQ(w.balance, 0);
    EXPECT_EQ(w.reservedBalance, 0);
    EXPECT_TRUE(w.paymentMethods.empty());
    EXPECT_EQ(w.id.rfind("wal_", 0), 0u);

    // same wallet on the second call
    EXPECT_EQ(h.wallets.getOrCreate("alice").id, w.id);
    EXPECT_THROW(h.wallets.getOrCreate(""), ValidationError);
}

TEST(WalletLedger, DepositCreditsBalanceAndLogs) {
    LedgerHarness h;
    std::string pm = h.fund("alice", 0);

    BalanceChange c = h.wallets.deposit("alice", 250, pm);
    EXPECT_EQ(c.newBalance, 250);
    EXPECT_EQ(c.availableBalance, 250);
    EXPECT_EQ(c.transaction.type, TransactionType::Deposit);
    EXPECT_EQ(c.transaction.amount, 250);
    EXPECT_EQ(c.transaction.paymentMethodId, pm);
    EXPECT_EQ(c.transaction.status, TransactionStatus::Completed);

    Wallet w = h.wallet("alice");
    ASSERT_EQ(w.transactionIds.size(), 1u);
    EXPECT_EQ(w.transactionIds[0], c.transaction.id);
    EXPECT_TRUE(h.store.findTransaction(c.transaction.id).has_value());
}

TEST(WalletLedger, DepositRejectsBadInput) {
    LedgerHarness h;
    std::string pm = h.fund("alice", 0);

    EXPECT_THROW(h.wallets.deposit("alice", 0, pm), ValidationError);
    EXPECT_THROW(h.wallets.deposit("alice", -10, pm), ValidationError);
    EXPECT_THROW(h.wallets.deposit("alice", kMaxAmount + 1, pm), ValidationError);
    EXPECT_THROW(h.wallets.deposit("alice", 10, ""), ValidationError);
    EXPECT_THROW(h.wallets.deposit("alice", 10, "pm_unknown"), ValidationError);
    EXPECT_THROW(h.wallets.deposit("alice", 10, pm, "EUR"), ValidationError);
    EXPECT_NO_THROW(h.wallets.deposit("alice", 10, pm, "TND"));

    EXPECT_EQ(h.wallet("alice").balance, 10);
}

TEST(WalletLedger, WithdrawHonoursReservedFunds) {
    LedgerHarness h;
    std::string pm = h.fund("client", 1000);
    h.openEscrow("client", "freelancer", 100, pm); // balance 895, reserved 100

    try {
        h.wallets.withdraw("client", 800, pm);
        FAIL() << "only 795 is available";
    } catch (const InsufficientFundsError& e) {
        EXPECT_EQ(e.available(), 795);
        EXPECT_EQ(e.requested(), 800);
        EXPECT_EQ(e.kind(), ErrorKind::InsufficientFunds);
    }
    EXPECT_EQ(h.wallet("client").balance, 895);

    BalanceChange c = h.wallets.withdraw("client", 795, pm);
    EXPECT_EQ(c.newBalance, 100);
    EXPECT_EQ(c.availableBalance, 0);
    EXPECT_EQ(c.transaction.amount, -795);
    EXPECT_EQ(c.transaction.type, TransactionType::Withdrawal);
}

TEST(WalletLedger, WithdrawChecksFundsBeforeMethod) {
    LedgerHarness h;
    h.fund("alice", 50);
    EXPECT_THROW(h.wallets.withdraw("alice", 60, "pm_unknown"), InsufficientFundsError);
    EXPECT_THROW(h.wallets.withdraw("alice", 10, "pm_unknown"), ValidationError);
    EXPECT_THROW(h.wallets.withdraw("bob", 10, "pm_unknown"), InsufficientFundsError);
}

TEST(WalletLedger, CardMethodKeepsOnlyLastFour) {
    LedgerHarness h;
    PaymentMethodSpec spec;
    spec.type        = "credit_card";
    spec.cardNumber  = "4242 4242 4242 1234";
    spec.expiryMonth = "7";
    spec.expiryYear  = "2027";

    PaymentMethod pm = h.wallets.addPaymentMethod("alice", spec);
    EXPECT_EQ(pm.type, PaymentMethodType::CreditCard);
    EXPECT_EQ(pm.last4, "1234");
    EXPECT_EQ(pm.expiryDate, "07/27");
    EXPECT_EQ(pm.name, "credit_card");
    EXPECT_TRUE(pm.isDefault); // first method
    EXPECT_EQ(pm.id.rfind("pm_", 0), 0u);
}

TEST(WalletLedger, AddPaymentMethodValidatesType) {
    LedgerHarness h;
    PaymentMethodSpec spec;
    EXPECT_THROW(h.wallets.addPaymentMethod("alice", spec), ValidationError);
    spec.type = "bitcoin";
    EXPECT_THROW(h.wallets.addPaymentMethod("alice", spec), ValidationError);
    EXPECT_TRUE(h.wallet("alice").paymentMethods.empty());
}

TEST(WalletLedger, DefaultMovesToNewDefaultMethod) {
    LedgerHarness h;
    PaymentMethodSpec bank;
    bank.type = "bank_transfer";
    PaymentMethod first = h.wallets.addPaymentMethod("alice", bank);

    PaymentMethodSpec paypal;
    paypal.type = "paypal";
    PaymentMethod second = h.wallets.addPaymentMethod("alice", paypal);
    EXPECT_FALSE(second.isDefault);

    paypal.isDefault = true;
    PaymentMethod third = h.wallets.addPaymentMethod("alice", paypal);
    EXPECT_TRUE(third.isDefault);

    Wallet w = h.wallet("alice");
    int defaults = 0;
    for (const auto& m : w.paymentMethods) {
        if (m.isDefault) {
            defaults++;
            EXPECT_EQ(m.id, third.id);
        }
    }
    EXPECT_EQ(defaults, 1);

    Wallet after = h.wallets.setDefaultPaymentMethod("alice", first.id);
    EXPECT_TRUE(after.findPaymentMethod(first.id)->isDefault);
    EXPECT_FALSE(after.findPaymentMethod(third.id)->isDefault);
    EXPECT_THROW(h.wallets.setDefaultPaymentMethod("alice", "pm_unknown"), NotFoundError);
}

TEST(WalletLedger, RemovePaymentMethodRules) {
    LedgerHarness h;
    PaymentMethodSpec spec;
    spec.type = "bank_transfer";
    PaymentMethod only = h.wallets.addPaymentMethod("alice", spec);

    EXPECT_THROW(h.wallets.removePaymentMethod("alice", only.id), ValidationError);
    EXPECT_THROW(h.wallets.removePaymentMethod("alice", "pm_unknown"), NotFoundError);

    spec.type = "paypal";
    PaymentMethod second = h.wallets.addPaymentMethod("alice", spec);

    Wallet w = h.wallets.removePaymentMethod("alice", only.id);
    ASSERT_EQ(w.paymentMethods.size(), 1u);
    EXPECT_EQ(w.paymentMethods[0].id, second.id);
    EXPECT_TRUE(w.paymentMethods[0].isDefault);
}

TEST(WalletLedger, TransactionsNewestFirstWithPaging) {
    LedgerHarness h;
    std::string pm = h.fund("alice", 10);
    h.wallets.deposit("alice", 20, pm);
    h.wallets.deposit("alice", 30, pm);
    h.wallets.withdraw("alice", 5, pm);

    Paged<Transaction> first = h.wallets.transactions("alice", std::nullopt, 1, 2);
    ASSERT_EQ(first.items.size(), 2u);
    EXPECT_EQ(first.items[0].amount, -5);
    EXPECT_EQ(first.items[1].amount, 30);
    EXPECT_EQ(first.pagination.total, 4u);
    EXPECT_EQ(first.pagination.pages, 2u);

    Paged<Transaction> deposits = h.wallets.transactions("alice", TransactionType::Deposit, 1, 10);
    EXPECT_EQ(deposits.pagination.total, 3u);

    Paged<Transaction> beyond = h.wallets.transactions("alice", std::nullopt, 5, 2);
    EXPECT_TRUE(beyond.items.empty());
    EXPECT_EQ(beyond.pagination.total, 4u);
}

TEST(WalletLedger, WalletViewReportsAvailable) {
    LedgerHarness h;
    std::string pm = h.fund("client", 500);
    h.openEscrow("client", "freelancer", 200, pm);

    WalletView view = h.wallets.walletView("client");
    EXPECT_EQ(view.wallet.balance, 290);
    EXPECT_EQ(view.wallet.reservedBalance, 200);
    EXPECT_EQ(view.availableBalance, 90);
}

TEST(WalletLedger, ReconcileMatchesBalance) {
    LedgerHarness h;
    std::string pm = h.fund("alice", 100);
    h.wallets.withdraw("alice", 40, pm);

    ReconciliationReport r = h.wallets.reconcile("alice");
    EXPECT_TRUE(r.consistent);
    EXPECT_EQ(r.balance, 60);
    EXPECT_EQ(r.ledgerSum, 60);
    EXPECT_EQ(r.entries, 2u);

    EXPECT_THROW(h.wallets.reconcile("nobody"), NotFoundError);
}
