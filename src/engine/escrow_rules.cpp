#include "engine/escrow_rules.hpp"
#include "core/errors.hpp"

std::string EscrowRules::actionName(EscrowAction action) {
    switch (action) {
        case EscrowAction::Start:   return "start";
        case EscrowAction::Deliver: return "deliver";
        case EscrowAction::Approve: return "approve";
        case EscrowAction::Reject:  return "reject";
        case EscrowAction::Release: return "release";
        case EscrowAction::Refund:  return "refund";
        case EscrowAction::Cancel:  return "cancel";
    }
    return "unknown";
}

EscrowStatus EscrowRules::requiredStatus(EscrowAction action) {
    switch (action) {
        case EscrowAction::Start:   return EscrowStatus::Funded;
        case EscrowAction::Deliver: return EscrowStatus::InProgress;
        case EscrowAction::Approve: return EscrowStatus::Delivered;
        case EscrowAction::Reject:  return EscrowStatus::Delivered;
        case EscrowAction::Release: return EscrowStatus::Disputed;
        case EscrowAction::Refund:  return EscrowStatus::Disputed;
        case EscrowAction::Cancel:  return EscrowStatus::Funded;
    }
    throw std::logic_error("unhandled escrow action");
}

EscrowStatus EscrowRules::targetStatus(EscrowAction action) {
    switch (action) {
        case EscrowAction::Start:   return EscrowStatus::InProgress;
        case EscrowAction::Deliver: return EscrowStatus::Delivered;
        case EscrowAction::Approve: return EscrowStatus::Approved;
        case EscrowAction::Reject:  return EscrowStatus::Disputed;
        case EscrowAction::Release: return EscrowStatus::Released;
        case EscrowAction::Refund:  return EscrowStatus::Refunded;
        case EscrowAction::Cancel:  return EscrowStatus::Cancelled;
    }
    throw std::logic_error("unhandled escrow action");
}

EscrowActor EscrowRules::actorFor(EscrowAction action) {
    switch (action) {
        case EscrowAction::Start:
        case EscrowAction::Deliver:
            return EscrowActor::Freelancer;
        case EscrowAction::Approve:
        case EscrowAction::Reject:
        case EscrowAction::Cancel:
            return EscrowActor::Client;
        case EscrowAction::Release:
        case EscrowAction::Refund:
            return EscrowActor::Resolver;
    }
    throw std::logic_error("unhandled escrow action");
}

EscrowPayee EscrowRules::payeeFor(EscrowAction action) {
    switch (action) {
        case EscrowAction::Start:
        case EscrowAction::Deliver:
        case EscrowAction::Reject:
            return EscrowPayee::None;
        case EscrowAction::Approve:
        case EscrowAction::Release:
            return EscrowPayee::Freelancer;
        case EscrowAction::Refund:
        case EscrowAction::Cancel:
            return EscrowPayee::Client;
    }
    throw std::logic_error("unhandled escrow action");
}

bool EscrowRules::holdsReserve(EscrowStatus status) {
    switch (status) {
        case EscrowStatus::Funded:
        case EscrowStatus::InProgress:
        case EscrowStatus::Delivered:
        case EscrowStatus::Disputed:
            return true;
        case EscrowStatus::Created:
        case EscrowStatus::Approved:
        case EscrowStatus::Refunded:
        case EscrowStatus::Released:
        case EscrowStatus::Cancelled:
            return false;
    }
    throw std::logic_error("unhandled escrow status");
}

bool EscrowRules::isTerminal(EscrowStatus status) {
    switch (status) {
        case EscrowStatus::Approved:
        case EscrowStatus::Refunded:
        case EscrowStatus::Released:
        case EscrowStatus::Cancelled:
            return true;
        case EscrowStatus::Created:
        case EscrowStatus::Funded:
        case EscrowStatus::InProgress:
        case EscrowStatus::Delivered:
        case EscrowStatus::Disputed:
            return false;
    }
    throw std::logic_error("unhandled escrow status");
}

void EscrowRules::checkActor(EscrowAction action, const Escrow& escrow, const std::string& actorId) {
    const std::string verb = actionName(action);
    switch (actorFor(action)) {
        case EscrowActor::Client:
            if (escrow.clientId != actorId) {
                throw NotAuthorizedError("Not authorized to " + verb + " this escrow");
            }
            return;
        case EscrowActor::Freelancer:
            if (escrow.freelancerId != actorId) {
                throw NotAuthorizedError("Not authorized to " + verb + " this escrow");
            }
            return;
        case EscrowActor::Resolver:
            if (actorId.empty() || actorId == escrow.clientId || actorId == escrow.freelancerId) {
                throw NotAuthorizedError("A party to the escrow cannot " + verb + " its dispute");
            }
            return;
    }
}

void EscrowRules::checkStatus(EscrowAction action, const Escrow& escrow) {
    EscrowStatus required = requiredStatus(action);
    if (escrow.status != required) {
        throw InvalidStateError(escrow.status, required);
    }
}

void EscrowRules::applyTransition(EscrowAction action, Escrow& escrow, TimestampMs now) {
    escrow.status = targetStatus(action);
    switch (action) {
        case EscrowAction::Start:   escrow.startedAt   = now; break;
        case EscrowAction::Deliver: escrow.deliveredAt = now; break;
        case EscrowAction::Approve: escrow.approvedAt  = now; break;
        case EscrowAction::Reject:  escrow.disputedAt  = now; break;
        case EscrowAction::Release: escrow.resolvedAt  = now; break;
        case EscrowAction::Refund:  escrow.resolvedAt  = now; break;
        case EscrowAction::Cancel:  escrow.cancelledAt = now; break;
    }
}
