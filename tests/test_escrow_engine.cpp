#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "test_helpers.hpp"

class EscrowEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clientMethod_ = h_.fund("client", 1000);
    }

    LedgerHarness h_;
    std::string clientMethod_;
};

TEST_F(EscrowEngineTest, CreateDebitsTotalAndReservesAmount) {
    EscrowFunding f = h_.openEscrow("client", "freelancer", 100, clientMethod_);

    EXPECT_EQ(f.platformFee, 5);
    EXPECT_EQ(f.totalAmount, 105);
    EXPECT_EQ(f.escrow.status, EscrowStatus::Funded);
    EXPECT_GT(f.escrow.fundedAt, 0);
    EXPECT_EQ(f.escrow.transactionId, f.transaction.id);
    EXPECT_EQ(f.escrow.currency, "TND");
    EXPECT_EQ(f.escrow.id.rfind("esc_", 0), 0u);

    EXPECT_EQ(f.transaction.type, TransactionType::Escrow);
    EXPECT_EQ(f.transaction.amount, -105);
    EXPECT_EQ(f.transaction.reference, f.escrow.id);
    EXPECT_EQ(f.transaction.referenceKind, "Escrow");

    Wallet client = h_.wallet("client");
    EXPECT_EQ(client.balance, 895);
    EXPECT_EQ(client.reservedBalance, 100);
    EXPECT_EQ(client.availableBalance(), 795);
    ASSERT_EQ(client.escrowReserves.size(), 1u);
    EXPECT_EQ(client.escrowReserves[0].escrowId, f.escrow.id);
    EXPECT_EQ(client.escrowReserves[0].amount, 100);

    EXPECT_EQ(h_.engine.get(f.escrow.id).status, EscrowStatus::Funded);
}

TEST_F(EscrowEngineTest, ApprovePaysFreelancerAndKeepsFee) {
    Escrow delivered = h_.deliveredEscrow("client", "freelancer", 100);
    EXPECT_EQ(delivered.status, EscrowStatus::Delivered);
    EXPECT_EQ(delivered.deliveryMessage, "Final files attached");

    EscrowSettlement s = h_.engine.approve(delivered.id, "client", 5, "Great work");
    EXPECT_EQ(s.escrow.status, EscrowStatus::Approved);
    EXPECT_GT(s.escrow.approvedAt, 0);
    ASSERT_TRUE(s.escrow.approvalRating.has_value());
    EXPECT_EQ(*s.escrow.approvalRating, 5);
    EXPECT_EQ(s.escrow.approvalFeedback, "Great work");

    EXPECT_EQ(s.transaction.userId, "freelancer");
    EXPECT_EQ(s.transaction.type, TransactionType::Payment);
    EXPECT_EQ(s.transaction.amount, 100);
    EXPECT_EQ(s.transaction.paymentMethodId, kSystemTransfer);
    EXPECT_EQ(s.transaction.description, "Payment for completed work: Logo design");

    Wallet client = h_.wallet("client");
    Wallet freelancer = h_.wallet("freelancer");
    EXPECT_EQ(client.balance, 895);
    EXPECT_EQ(client.reservedBalance, 0);
    EXPECT_TRUE(client.escrowReserves.empty());
    EXPECT_EQ(freelancer.balance, 100);

    EXPECT_TRUE(h_.wallets.reconcile("client").consistent);
    EXPECT_TRUE(h_.wallets.reconcile("freelancer").consistent);
}

TEST_F(EscrowEngineTest, InsufficientFundsLeavesNothingBehind) {
    h_.fund("poor", 100);
    try {
        h_.openEscrow("poor", "freelancer", 100);
        FAIL() << "total 105 exceeds available 100";
    } catch (const InsufficientFundsError& e) {
        EXPECT_EQ(e.available(), 100);
        EXPECT_EQ(e.requested(), 105);
    }

    Wallet poor = h_.wallet("poor");
    EXPECT_EQ(poor.balance, 100);
    EXPECT_EQ(poor.reservedBalance, 0);
    EXPECT_EQ(h_.engine.listForUser("poor", "", std::nullopt, 1, 10).pagination.total, 0u);
    EXPECT_EQ(h_.wallets.transactions("poor", std::nullopt, 1, 10).pagination.total, 1u);
}

TEST_F(EscrowEngineTest, ReserveMustStillBeCoveredAfterDebit) {
    h_.fund("tight", 150);
    try {
        h_.openEscrow("tight", "freelancer", 100);
        FAIL() << "105 debit plus 100 reserve exceeds 150";
    } catch (const InsufficientFundsError& e) {
        EXPECT_EQ(e.available(), 150);
        EXPECT_EQ(e.requested(), 205);
    }
    EXPECT_EQ(h_.wallet("tight").balance, 150);
}

TEST_F(EscrowEngineTest, CreateValidatesInput) {
    EXPECT_THROW(h_.openEscrow("client", "client", 100), ValidationError);
    EXPECT_THROW(h_.openEscrow("client", "freelancer", 0), ValidationError);
    EXPECT_THROW(h_.openEscrow("client", "freelancer", -5), ValidationError);
    EXPECT_THROW(h_.openEscrow("client", "freelancer", kMaxAmount + 1), ValidationError);
    EXPECT_THROW(h_.openEscrow("", "freelancer", 100), ValidationError);

    CreateEscrowRequest req;
    req.clientId        = "client";
    req.freelancerId    = "freelancer";
    req.serviceName     = "Logo design";
    req.amount          = 100;
    req.paymentMethodId = clientMethod_;
    EXPECT_THROW(h_.engine.create(req), ValidationError); // no description

    req.description = "Three concepts";
    req.currency    = "EUR";
    EXPECT_THROW(h_.engine.create(req), ValidationError);

    EXPECT_EQ(h_.wallet("client").balance, 1000);
}

TEST_F(EscrowEngineTest, FeeRoundsHalfUp) {
    EXPECT_EQ(h_.openEscrow("client", "freelancer", 10).platformFee, 1);  // 0.5 => 1
    EXPECT_EQ(h_.openEscrow("client", "freelancer", 9).platformFee, 0);   // 0.45 => 0
    EXPECT_EQ(h_.openEscrow("client", "freelancer", 30).platformFee, 2);  // 1.5 => 2
}

TEST_F(EscrowEngineTest, TransitionsCheckLookupThenActorThenState) {
    EscrowFunding f = h_.openEscrow("client", "freelancer", 100);

    // unknown escrow wins over a wrong actor
    EXPECT_THROW(h_.engine.start("esc_missing", "someone"), NotFoundError);

    // wrong actor wins over a wrong state
    EXPECT_THROW(h_.engine.approve(f.escrow.id, "freelancer"), NotAuthorizedError);
    EXPECT_THROW(h_.engine.start(f.escrow.id, "client"), NotAuthorizedError);

    try {
        h_.engine.approve(f.escrow.id, "client");
        FAIL() << "approve requires delivered";
    } catch (const InvalidStateError& e) {
        EXPECT_EQ(e.current(), EscrowStatus::Funded);
        EXPECT_EQ(e.required(), EscrowStatus::Delivered);
    }

    Wallet client = h_.wallet("client");
    EXPECT_EQ(client.balance, 895);
    EXPECT_EQ(client.reservedBalance, 100);
    EXPECT_EQ(h_.engine.get(f.escrow.id).status, EscrowStatus::Funded);
}

TEST_F(EscrowEngineTest, InputValidationPrecedesLookup) {
    EXPECT_THROW(h_.engine.deliver("esc_missing", "freelancer", ""), ValidationError);
    EXPECT_THROW(h_.engine.reject("esc_missing", "client", ""), ValidationError);
    EXPECT_THROW(h_.engine.approve("esc_missing", "client", 6), ValidationError);
    EXPECT_THROW(h_.engine.approve("esc_missing", "client", 0), ValidationError);
    EXPECT_THROW(h_.engine.get(""), ValidationError);
    EXPECT_THROW(h_.engine.get("esc_missing"), NotFoundError);
}

TEST_F(EscrowEngineTest, DeliverKeepsFiles) {
    EscrowFunding f = h_.openEscrow("client", "freelancer", 100);
    h_.engine.start(f.escrow.id, "freelancer");
    Escrow e = h_.engine.deliver(f.escrow.id, "freelancer", "Done", {"logo.svg", "logo.png"});
    ASSERT_EQ(e.deliveryFiles.size(), 2u);
    EXPECT_EQ(e.deliveryFiles[1], "logo.png");
    EXPECT_GT(e.deliveredAt, 0);
    EXPECT_GT(e.startedAt, 0);
}

TEST_F(EscrowEngineTest, RejectDisputesWithoutMovingMoney) {
    Escrow delivered = h_.deliveredEscrow("client", "freelancer", 100);
    Escrow disputed = h_.engine.reject(delivered.id, "client", "Not what was agreed");

    EXPECT_EQ(disputed.status, EscrowStatus::Disputed);
    EXPECT_EQ(disputed.disputeReason, "Not what was agreed");
    EXPECT_GT(disputed.disputedAt, 0);

    Wallet client = h_.wallet("client");
    EXPECT_EQ(client.balance, 895);
    EXPECT_EQ(client.reservedBalance, 100);
    EXPECT_EQ(h_.wallet("freelancer").balance, 0);
}

TEST_F(EscrowEngineTest, ResolverReleasesDisputeToFreelancer) {
    Escrow delivered = h_.deliveredEscrow("client", "freelancer", 100);
    h_.engine.reject(delivered.id, "client", "Late");

    EXPECT_THROW(h_.engine.release(delivered.id, "client", "self-serving"), NotAuthorizedError);
    EXPECT_THROW(h_.engine.release(delivered.id, "freelancer"), NotAuthorizedError);

    EscrowSettlement s = h_.engine.release(delivered.id, "support", "Work matches terms");
    EXPECT_EQ(s.escrow.status, EscrowStatus::Released);
    EXPECT_EQ(s.escrow.disputeResolvedBy, "support");
    EXPECT_EQ(s.escrow.disputeResolution, "Work matches terms");
    EXPECT_GT(s.escrow.resolvedAt, 0);

    EXPECT_EQ(h_.wallet("freelancer").balance, 100);
    EXPECT_EQ(h_.wallet("client").reservedBalance, 0);
}

TEST_F(EscrowEngineTest, ResolverRefundsDisputeToClient) {
    Escrow delivered = h_.deliveredEscrow("client", "freelancer", 100);
    h_.engine.reject(delivered.id, "client", "Incomplete");

    EscrowSettlement s = h_.engine.refund(delivered.id, "support", "Refund agreed");
    EXPECT_EQ(s.escrow.status, EscrowStatus::Refunded);
    EXPECT_EQ(s.transaction.type, TransactionType::Refund);
    EXPECT_EQ(s.transaction.userId, "client");
    EXPECT_EQ(s.transaction.amount, 100);

    Wallet client = h_.wallet("client");
    EXPECT_EQ(client.balance, 995); // fee retained
    EXPECT_EQ(client.reservedBalance, 0);
    EXPECT_EQ(h_.wallet("freelancer").balance, 0);
    EXPECT_TRUE(h_.wallets.reconcile("client").consistent);

    // terminal
    EXPECT_THROW(h_.engine.release(delivered.id, "support"), InvalidStateError);
}

TEST_F(EscrowEngineTest, CancelOnlyBeforeWorkStarts) {
    EscrowFunding f = h_.openEscrow("client", "freelancer", 100);
    EscrowSettlement s = h_.engine.cancel(f.escrow.id, "client");
    EXPECT_EQ(s.escrow.status, EscrowStatus::Cancelled);
    EXPECT_GT(s.escrow.cancelledAt, 0);
    EXPECT_EQ(h_.wallet("client").balance, 995);
    EXPECT_EQ(h_.wallet("client").reservedBalance, 0);

    EscrowFunding g = h_.openEscrow("client", "freelancer", 100);
    h_.engine.start(g.escrow.id, "freelancer");
    try {
        h_.engine.cancel(g.escrow.id, "client");
        FAIL() << "started escrow cannot be cancelled";
    } catch (const InvalidStateError& e) {
        EXPECT_EQ(e.current(), EscrowStatus::InProgress);
        EXPECT_EQ(e.required(), EscrowStatus::Funded);
    }
    EXPECT_THROW(h_.engine.cancel(g.escrow.id, "freelancer"), NotAuthorizedError);
}

TEST_F(EscrowEngineTest, SecondApproveIsInvalidState) {
    Escrow delivered = h_.deliveredEscrow("client", "freelancer", 100);
    h_.engine.approve(delivered.id, "client");
    try {
        h_.engine.approve(delivered.id, "client");
        FAIL() << "already approved";
    } catch (const InvalidStateError& e) {
        EXPECT_EQ(e.current(), EscrowStatus::Approved);
        EXPECT_EQ(e.required(), EscrowStatus::Delivered);
    }
    EXPECT_EQ(h_.wallet("freelancer").balance, 100);
}

TEST_F(EscrowEngineTest, ListForUserFiltersByRoleAndStatus) {
    h_.fund("other", 1000);
    EscrowFunding a = h_.openEscrow("client", "freelancer", 100);
    EscrowFunding b = h_.openEscrow("client", "designer", 50);
    h_.openEscrow("other", "client", 20);
    h_.engine.start(a.escrow.id, "freelancer");

    EXPECT_EQ(h_.engine.listForUser("client", "", std::nullopt, 1, 10).pagination.total, 3u);
    EXPECT_EQ(h_.engine.listForUser("client", "client", std::nullopt, 1, 10).pagination.total, 2u);
    EXPECT_EQ(h_.engine.listForUser("client", "freelancer", std::nullopt, 1, 10).pagination.total, 1u);

    Paged<Escrow> funded = h_.engine.listForUser("client", "client", EscrowStatus::Funded, 1, 10);
    ASSERT_EQ(funded.items.size(), 1u);
    EXPECT_EQ(funded.items[0].id, b.escrow.id);

    Paged<Escrow> page2 = h_.engine.listForUser("client", "", std::nullopt, 2, 2);
    EXPECT_EQ(page2.items.size(), 1u);
    EXPECT_EQ(page2.pagination.pages, 2u);
    EXPECT_EQ(page2.pagination.page, 2u);

    EXPECT_THROW(h_.engine.listForUser("client", "admin", std::nullopt, 1, 10), ValidationError);
    EXPECT_THROW(h_.engine.listForUser("", "", std::nullopt, 1, 10), ValidationError);
}

TEST(EscrowEngineFee, ConfiguredRateApplies) {
    LedgerHarness h(nullptr, 1000); // 10%
    h.fund("client", 1000);
    EscrowFunding f = h.openEscrow("client", "freelancer", 200);
    EXPECT_EQ(f.platformFee, 20);
    EXPECT_EQ(h.wallet("client").balance, 780);
}
