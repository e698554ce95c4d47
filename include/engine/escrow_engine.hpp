#ifndef ESCROW_ENGINE_HPP
#define ESCROW_ENGINE_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/ledger_types.hpp"
#include "engine/escrow_rules.hpp"
#include "ledger/transaction_log.hpp"
#include "ledger/wallet_ledger.hpp"
#include "store/i_ledger_store.hpp"

struct CreateEscrowRequest {
    std::string clientId;
    std::string freelancerId;
    std::string serviceId;       // optional
    std::string serviceName;
    std::string description;
    Amount amount{0};
    std::string currency;        // empty = client wallet currency
    std::string paymentMethodId;
    std::string terms;           // optional
};

struct EscrowFunding {
    Escrow escrow;
    Transaction transaction;
    Amount platformFee{0};
    Amount totalAmount{0};
};

// Result of a transition that moves money (approve, release, refund, cancel).
struct EscrowSettlement {
    Escrow escrow;
    Transaction transaction;
};

/**
 * Escrow lifecycle engine.
 *
 * Funding takes amount + fee from the client's balance and additionally
 * reserves amount against the escrow. Settling (approve/release to the
 * freelancer, refund/cancel to the client) drops the reserve and credits the
 * payee with amount. The fee is kept by the platform in every outcome.
 *
 * Each operation is a single unit of work: validation, then escrow lookup,
 * then actor check, then state check, then the mutation. Any failure leaves
 * wallets, escrow and log untouched.
 */
class EscrowEngine {
public:
    EscrowEngine(ILedgerStore& store,
                 WalletLedger& wallets,
                 TransactionLog& log,
                 int platformFeeBps = 500);

    EscrowFunding create(const CreateEscrowRequest& request);

    Escrow start(const std::string& escrowId, const std::string& freelancerId);

    Escrow deliver(const std::string& escrowId,
                   const std::string& freelancerId,
                   const std::string& message,
                   const std::vector<std::string>& files = {});

    EscrowSettlement approve(const std::string& escrowId,
                             const std::string& clientId,
                             std::optional<int> rating = std::nullopt,
                             const std::string& feedback = "");

    Escrow reject(const std::string& escrowId,
                  const std::string& clientId,
                  const std::string& reason);

    // dispute resolution, disputed => released (freelancer paid)
    EscrowSettlement release(const std::string& escrowId,
                             const std::string& resolverId,
                             const std::string& resolution = "");

    // dispute resolution, disputed => refunded (client repaid amount)
    EscrowSettlement refund(const std::string& escrowId,
                            const std::string& resolverId,
                            const std::string& resolution = "");

    // client withdraws a funded escrow before work starts
    EscrowSettlement cancel(const std::string& escrowId, const std::string& clientId);

    Escrow get(const std::string& escrowId);

    Paged<Escrow> listForUser(const std::string& userId,
                              const std::string& role,
                              std::optional<EscrowStatus> status,
                              size_t page,
                              size_t limit);

    int platformFeeBps() const { return platformFeeBps_; }

private:
    typedef std::function<void(StoreTransaction&, Escrow&)> TransitionBody;

    // lookup -> actor -> state -> body -> status/timestamp -> putEscrow
    Escrow transition(const std::string& escrowId,
                      EscrowAction action,
                      const std::string& actorId,
                      const TransitionBody& body);

    EscrowSettlement settle(const std::string& escrowId,
                            EscrowAction action,
                            const std::string& actorId,
                            const TransitionBody& extra);

    // drops the client's reserve and credits the payee; called inside a unit
    Transaction moveFunds(StoreTransaction& uow, const Escrow& escrow, EscrowAction action);

    ILedgerStore& store_;
    WalletLedger& wallets_;
    TransactionLog& log_;
    int platformFeeBps_;
};

#endif // ESCROW_ENGINE_HPP
