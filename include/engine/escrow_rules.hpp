#ifndef ESCROW_RULES_HPP
#define ESCROW_RULES_HPP

#include <string>
#include "core/ledger_types.hpp"

enum class EscrowAction { Start, Deliver, Approve, Reject, Release, Refund, Cancel };

// who may perform an action
enum class EscrowActor { Client, Freelancer, Resolver };

// whose wallet is credited when an action settles the escrow
enum class EscrowPayee { None, Client, Freelancer };

/**
 * The escrow state machine as pure functions. Every decision here is an
 * exhaustive switch, so a new status or action will not compile silently
 * into a default branch.
 */
namespace EscrowRules {
    std::string actionName(EscrowAction action);

    EscrowStatus requiredStatus(EscrowAction action);
    EscrowStatus targetStatus(EscrowAction action);
    EscrowActor actorFor(EscrowAction action);
    EscrowPayee payeeFor(EscrowAction action);

    // true while the client wallet must hold a reserve entry for the escrow
    bool holdsReserve(EscrowStatus status);

    bool isTerminal(EscrowStatus status);

    /**
     * Throws NotAuthorizedError if actorId may not perform action on escrow.
     * Resolvers must be non-empty and neither party.
     */
    void checkActor(EscrowAction action, const Escrow& escrow, const std::string& actorId);

    // Throws InvalidStateError{current, required} unless escrow is in the required state.
    void checkStatus(EscrowAction action, const Escrow& escrow);

    // Sets status and the matching timestamp field.
    void applyTransition(EscrowAction action, Escrow& escrow, TimestampMs now);
}

#endif // ESCROW_RULES_HPP
