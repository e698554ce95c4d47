#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "engine/escrow_rules.hpp"

namespace {

Escrow escrowIn(EscrowStatus status) {
    Escrow e;
    e.id           = "esc_rules";
    e.clientId     = "client";
    e.freelancerId = "freelancer";
    e.amount       = 100;
    e.status       = status;
    return e;
}

} // namespace

TEST(EscrowRules, TransitionTableMatchesLifecycle) {
    EXPECT_EQ(EscrowRules::requiredStatus(EscrowAction::Start), EscrowStatus::Funded);
    EXPECT_EQ(EscrowRules::targetStatus(EscrowAction::Start), EscrowStatus::InProgress);
    EXPECT_EQ(EscrowRules::requiredStatus(EscrowAction::Deliver), EscrowStatus::InProgress);
    EXPECT_EQ(EscrowRules::targetStatus(EscrowAction::Deliver), EscrowStatus::Delivered);
    EXPECT_EQ(EscrowRules::requiredStatus(EscrowAction::Approve), EscrowStatus::Delivered);
    EXPECT_EQ(EscrowRules::targetStatus(EscrowAction::Approve), EscrowStatus::Approved);
    EXPECT_EQ(EscrowRules::requiredStatus(EscrowAction::Reject), EscrowStatus::Delivered);
    EXPECT_EQ(EscrowRules::targetStatus(EscrowAction::Reject), EscrowStatus::Disputed);
    EXPECT_EQ(EscrowRules::targetStatus(EscrowAction::Release), EscrowStatus::Released);
    EXPECT_EQ(EscrowRules::targetStatus(EscrowAction::Refund), EscrowStatus::Refunded);
    EXPECT_EQ(EscrowRules::requiredStatus(EscrowAction::Cancel), EscrowStatus::Funded);
    EXPECT_EQ(EscrowRules::targetStatus(EscrowAction::Cancel), EscrowStatus::Cancelled);
}

TEST(EscrowRules, ReserveHeldOnlyWhileOpen) {
    EXPECT_TRUE(EscrowRules::holdsReserve(EscrowStatus::Funded));
    EXPECT_TRUE(EscrowRules::holdsReserve(EscrowStatus::InProgress));
    EXPECT_TRUE(EscrowRules::holdsReserve(EscrowStatus::Delivered));
    EXPECT_TRUE(EscrowRules::holdsReserve(EscrowStatus::Disputed));
    EXPECT_FALSE(EscrowRules::holdsReserve(EscrowStatus::Approved));
    EXPECT_FALSE(EscrowRules::holdsReserve(EscrowStatus::Refunded));
    EXPECT_FALSE(EscrowRules::holdsReserve(EscrowStatus::Released));
    EXPECT_FALSE(EscrowRules::holdsReserve(EscrowStatus::Cancelled));

    for (auto s : {EscrowStatus::Approved, EscrowStatus::Refunded,
                   EscrowStatus::Released, EscrowStatus::Cancelled}) {
        EXPECT_TRUE(EscrowRules::isTerminal(s)) << toString(s);
    }
    EXPECT_FALSE(EscrowRules::isTerminal(EscrowStatus::Disputed));
}

TEST(EscrowRules, PayeeFollowsOutcome) {
    EXPECT_EQ(EscrowRules::payeeFor(EscrowAction::Approve), EscrowPayee::Freelancer);
    EXPECT_EQ(EscrowRules::payeeFor(EscrowAction::Release), EscrowPayee::Freelancer);
    EXPECT_EQ(EscrowRules::payeeFor(EscrowAction::Refund), EscrowPayee::Client);
    EXPECT_EQ(EscrowRules::payeeFor(EscrowAction::Cancel), EscrowPayee::Client);
    EXPECT_EQ(EscrowRules::payeeFor(EscrowAction::Reject), EscrowPayee::None);

    // every payout ends the escrow
    for (auto a : {EscrowAction::Approve, EscrowAction::Release,
                   EscrowAction::Refund, EscrowAction::Cancel}) {
        EXPECT_TRUE(EscrowRules::isTerminal(EscrowRules::targetStatus(a))) << EscrowRules::actionName(a);
    }
}

TEST(EscrowRules, ActorChecks) {
    Escrow e = escrowIn(EscrowStatus::Delivered);

    EXPECT_NO_THROW(EscrowRules::checkActor(EscrowAction::Approve, e, "client"));
    EXPECT_THROW(EscrowRules::checkActor(EscrowAction::Approve, e, "freelancer"), NotAuthorizedError);
    EXPECT_NO_THROW(EscrowRules::checkActor(EscrowAction::Deliver, e, "freelancer"));
    EXPECT_THROW(EscrowRules::checkActor(EscrowAction::Start, e, "client"), NotAuthorizedError);

    EXPECT_NO_THROW(EscrowRules::checkActor(EscrowAction::Release, e, "support-7"));
    EXPECT_THROW(EscrowRules::checkActor(EscrowAction::Release, e, "client"), NotAuthorizedError);
    EXPECT_THROW(EscrowRules::checkActor(EscrowAction::Refund, e, "freelancer"), NotAuthorizedError);
    EXPECT_THROW(EscrowRules::checkActor(EscrowAction::Refund, e, ""), NotAuthorizedError);
}

TEST(EscrowRules, StatusCheckReportsCurrentAndRequired) {
    Escrow e = escrowIn(EscrowStatus::Funded);
    try {
        EscrowRules::checkStatus(EscrowAction::Approve, e);
        FAIL() << "approve on a funded escrow must be rejected";
    } catch (const InvalidStateError& err) {
        EXPECT_EQ(err.current(), EscrowStatus::Funded);
        EXPECT_EQ(err.required(), EscrowStatus::Delivered);
        EXPECT_EQ(err.kind(), ErrorKind::InvalidState);
        EXPECT_FALSE(err.retryable());
    }
}

TEST(EscrowRules, ApplyTransitionStampsMatchingField) {
    Escrow e = escrowIn(EscrowStatus::Funded);
    EscrowRules::applyTransition(EscrowAction::Start, e, 1000);
    EXPECT_EQ(e.status, EscrowStatus::InProgress);
    EXPECT_EQ(e.startedAt, 1000);

    Escrow d = escrowIn(EscrowStatus::Disputed);
    EscrowRules::applyTransition(EscrowAction::Refund, d, 2000);
    EXPECT_EQ(d.status, EscrowStatus::Refunded);
    EXPECT_EQ(d.resolvedAt, 2000);

    Escrow c = escrowIn(EscrowStatus::Funded);
    EscrowRules::applyTransition(EscrowAction::Cancel, c, 3000);
    EXPECT_EQ(c.cancelledAt, 3000);
    EXPECT_EQ(c.approvedAt, 0);
}
