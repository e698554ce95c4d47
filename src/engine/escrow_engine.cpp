#include "engine/escrow_engine.hpp"
#include "core/errors.hpp"
#include "core/ledger_utils.hpp"
#include <iostream>

namespace {

void requireField(const std::string& value, const std::string& what) {
    if (value.empty()) {
        throw ValidationError(what + " is required");
    }
}

} // anonymous namespace

EscrowEngine::EscrowEngine(ILedgerStore& store,
                           WalletLedger& wallets,
                           TransactionLog& log,
                           int platformFeeBps)
    : store_(store)
    , wallets_(wallets)
    , log_(log)
    , platformFeeBps_(platformFeeBps)
{
    if (platformFeeBps_ < 0 || platformFeeBps_ > 10000) {
        throw ValidationError("platform fee must be between 0 and 10000 basis points");
    }
}

/**
 * create => validate, then in one unit of work: check the client can cover
 * amount + fee, debit it through the log, reserve amount, store the escrow
 * as funded. The intermediate "created" status never reaches the store.
 */
EscrowFunding EscrowEngine::create(const CreateEscrowRequest& request)
{
    if (request.clientId.empty() || request.freelancerId.empty()
        || request.serviceName.empty() || request.description.empty()
        || request.paymentMethodId.empty()) {
        throw ValidationError("Missing required fields");
    }
    LedgerUtils::requirePositiveAmount(request.amount, "amount");
    if (request.clientId == request.freelancerId) {
        throw ValidationError("Client and freelancer must be different users");
    }

    EscrowFunding out;
    out.platformFee = LedgerUtils::computePlatformFee(request.amount, platformFeeBps_);
    out.totalAmount = request.amount + out.platformFee;

    store_.withTransaction([&](StoreTransaction& uow) {
        Wallet client = wallets_.loadOrCreate(uow, request.clientId);
        std::string currency = request.currency.empty() ? client.currency : request.currency;
        if (currency != client.currency) {
            throw ValidationError("Currency " + currency + " does not match client wallet currency "
                                  + client.currency);
        }
        auto freelancer = uow.findWallet(request.freelancerId);
        if (freelancer && freelancer->currency != currency) {
            throw ValidationError("Freelancer wallet currency " + freelancer->currency
                                  + " does not match escrow currency " + currency);
        }

        Amount available = client.availableBalance();
        if (out.totalAmount > available) {
            throw InsufficientFundsError(available, out.totalAmount);
        }
        // the reserve is held on top of the debit, so both must fit
        if (out.totalAmount + request.amount > available) {
            throw InsufficientFundsError(available, out.totalAmount + request.amount);
        }

        TimestampMs now = LedgerUtils::nowMs();

        Escrow escrow;
        escrow.id              = LedgerUtils::makeId("esc");
        escrow.clientId        = request.clientId;
        escrow.freelancerId    = request.freelancerId;
        escrow.serviceId       = request.serviceId;
        escrow.serviceName     = request.serviceName;
        escrow.description     = request.description;
        escrow.amount          = request.amount;
        escrow.platformFee     = out.platformFee;
        escrow.currency        = currency;
        escrow.paymentMethodId = request.paymentMethodId;
        escrow.terms           = request.terms;
        escrow.status          = EscrowStatus::Created;
        escrow.createdAt       = now;

        LedgerEntry entry;
        entry.type            = TransactionType::Escrow;
        entry.amount          = -out.totalAmount;
        entry.paymentMethodId = request.paymentMethodId;
        entry.description     = "Escrow payment for " + request.serviceName;
        entry.reference       = escrow.id;
        out.transaction = log_.post(uow, client, entry);

        EscrowReserve reserve;
        reserve.escrowId = escrow.id;
        reserve.amount   = request.amount;
        client.escrowReserves.push_back(reserve);
        client.recalculateReservedBalance();
        uow.putWallet(client);

        escrow.transactionId = out.transaction.id;
        escrow.status        = EscrowStatus::Funded;
        escrow.fundedAt      = now;
        uow.putEscrow(escrow);

        out.escrow = escrow;
    });

    std::cout << "[ESCROW] Funded escrow=" << out.escrow.id
              << " client=" << request.clientId
              << " freelancer=" << request.freelancerId
              << " amount=" << request.amount
              << " fee=" << out.platformFee << "\n";
    return out;
}

Escrow EscrowEngine::transition(const std::string& escrowId,
                                EscrowAction action,
                                const std::string& actorId,
                                const TransitionBody& body)
{
    requireField(escrowId, "Escrow ID");

    Escrow result;
    store_.withTransaction([&](StoreTransaction& uow) {
        auto found = uow.findEscrow(escrowId);
        if (!found) {
            throw NotFoundError("Escrow not found: " + escrowId);
        }
        Escrow escrow = *found;

        EscrowRules::checkActor(action, escrow, actorId);
        EscrowRules::checkStatus(action, escrow);

        if (body) {
            body(uow, escrow);
        }
        EscrowRules::applyTransition(action, escrow, LedgerUtils::nowMs());
        uow.putEscrow(escrow);
        result = escrow;
    });

    std::cout << "[ESCROW] " << EscrowRules::actionName(action)
              << " escrow=" << escrowId
              << " by=" << actorId
              << " => " << toString(result.status) << "\n";
    return result;
}

EscrowSettlement EscrowEngine::settle(const std::string& escrowId,
                                      EscrowAction action,
                                      const std::string& actorId,
                                      const TransitionBody& extra)
{
    EscrowSettlement out;
    out.escrow = transition(escrowId, action, actorId, [&](StoreTransaction& uow, Escrow& escrow) {
        if (extra) {
            extra(uow, escrow);
        }
        out.transaction = moveFunds(uow, escrow, action);
    });
    return out;
}

Transaction EscrowEngine::moveFunds(StoreTransaction& uow, const Escrow& escrow, EscrowAction action)
{
    EscrowStatus target = EscrowRules::targetStatus(action);
    if (!EscrowRules::holdsReserve(escrow.status) || !EscrowRules::isTerminal(target)) {
        throw StoreError("escrow " + escrow.id + ": " + EscrowRules::actionName(action)
                         + " does not settle a held reserve", false);
    }

    auto found = uow.findWallet(escrow.clientId);
    if (!found) {
        throw StoreError("client wallet missing for escrow " + escrow.id, false);
    }
    Wallet client = *found;
    const EscrowReserve* reserve = client.findReserve(escrow.id);
    if (!reserve || reserve->amount != escrow.amount) {
        throw StoreError("reserve for escrow " + escrow.id + " does not match its amount", false);
    }
    client.removeReserve(escrow.id);
    client.recalculateReservedBalance();
    client.updatedAt = LedgerUtils::nowMs();

    LedgerEntry entry;
    entry.amount          = escrow.amount;
    entry.paymentMethodId = kSystemTransfer;
    entry.reference       = escrow.id;

    Transaction tx;
    switch (EscrowRules::payeeFor(action)) {
        case EscrowPayee::Freelancer: {
            uow.putWallet(client);
            Wallet payee = wallets_.loadOrCreate(uow, escrow.freelancerId);
            entry.type        = TransactionType::Payment;
            entry.description = "Payment for completed work: " + escrow.serviceName;
            tx = log_.post(uow, payee, entry);
            uow.putWallet(payee);
            break;
        }
        case EscrowPayee::Client:
            entry.type        = TransactionType::Refund;
            entry.description = "Refund for escrow: " + escrow.serviceName;
            tx = log_.post(uow, client, entry);
            uow.putWallet(client);
            break;
        case EscrowPayee::None:
            throw StoreError("escrow action " + EscrowRules::actionName(action)
                             + " has no payee", false);
    }
    return tx;
}

Escrow EscrowEngine::start(const std::string& escrowId, const std::string& freelancerId)
{
    requireField(freelancerId, "Freelancer ID");
    return transition(escrowId, EscrowAction::Start, freelancerId, nullptr);
}

Escrow EscrowEngine::deliver(const std::string& escrowId,
                             const std::string& freelancerId,
                             const std::string& message,
                             const std::vector<std::string>& files)
{
    if (freelancerId.empty() || message.empty()) {
        throw ValidationError("Freelancer ID and delivery message are required");
    }
    return transition(escrowId, EscrowAction::Deliver, freelancerId,
                      [&](StoreTransaction&, Escrow& escrow) {
                          escrow.deliveryMessage = message;
                          if (!files.empty()) escrow.deliveryFiles = files;
                      });
}

EscrowSettlement EscrowEngine::approve(const std::string& escrowId,
                                       const std::string& clientId,
                                       std::optional<int> rating,
                                       const std::string& feedback)
{
    requireField(clientId, "Client ID");
    if (rating && (*rating < 1 || *rating > 5)) {
        throw ValidationError("Rating must be between 1 and 5");
    }
    return settle(escrowId, EscrowAction::Approve, clientId,
                  [&](StoreTransaction&, Escrow& escrow) {
                      if (rating) escrow.approvalRating = rating;
                      if (!feedback.empty()) escrow.approvalFeedback = feedback;
                  });
}

Escrow EscrowEngine::reject(const std::string& escrowId,
                            const std::string& clientId,
                            const std::string& reason)
{
    if (clientId.empty() || reason.empty()) {
        throw ValidationError("Client ID and rejection reason are required");
    }
    // funds stay reserved until the dispute is resolved
    return transition(escrowId, EscrowAction::Reject, clientId,
                      [&](StoreTransaction&, Escrow& escrow) {
                          escrow.disputeReason = reason;
                      });
}

EscrowSettlement EscrowEngine::release(const std::string& escrowId,
                                       const std::string& resolverId,
                                       const std::string& resolution)
{
    requireField(resolverId, "Resolver ID");
    return settle(escrowId, EscrowAction::Release, resolverId,
                  [&](StoreTransaction&, Escrow& escrow) {
                      escrow.disputeResolution = resolution;
                      escrow.disputeResolvedBy = resolverId;
                  });
}

EscrowSettlement EscrowEngine::refund(const std::string& escrowId,
                                      const std::string& resolverId,
                                      const std::string& resolution)
{
    requireField(resolverId, "Resolver ID");
    return settle(escrowId, EscrowAction::Refund, resolverId,
                  [&](StoreTransaction&, Escrow& escrow) {
                      escrow.disputeResolution = resolution;
                      escrow.disputeResolvedBy = resolverId;
                  });
}

EscrowSettlement EscrowEngine::cancel(const std::string& escrowId, const std::string& clientId)
{
    requireField(clientId, "Client ID");
    return settle(escrowId, EscrowAction::Cancel, clientId, nullptr);
}

Escrow EscrowEngine::get(const std::string& escrowId)
{
    requireField(escrowId, "Escrow ID");
    auto found = store_.findEscrow(escrowId);
    if (!found) {
        throw NotFoundError("Escrow not found: " + escrowId);
    }
    return *found;
}

Paged<Escrow> EscrowEngine::listForUser(const std::string& userId,
                                        const std::string& role,
                                        std::optional<EscrowStatus> status,
                                        size_t page,
                                        size_t limit)
{
    requireField(userId, "User ID");
    if (!role.empty() && role != "client" && role != "freelancer") {
        throw ValidationError("Role must be client or freelancer");
    }
    if (page == 0) page = 1;
    if (limit == 0) limit = 10;

    EscrowFilter filter;
    filter.userId = userId;
    filter.role   = role;
    filter.status = status;

    ListRange range;
    range.skip  = LedgerUtils::pageOffset(page, limit);
    range.limit = limit;

    auto slice = store_.listEscrows(filter, range);

    Paged<Escrow> out;
    out.items      = std::move(slice.items);
    out.pagination = LedgerUtils::makePageInfo(page, limit, slice.total);
    return out;
}
