#ifndef LEDGER_TYPES_HPP
#define LEDGER_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * Money is counted in minor currency units (e.g. millimes for TND).
 * Signed so that ledger entries can carry debits.
 */
typedef int64_t Amount;

// milliseconds since the Unix epoch, 0 = not set
typedef int64_t TimestampMs;

// upper bound accepted for any single caller-supplied amount
const Amount kMaxAmount = 100000000000000LL;

enum class EscrowStatus {
    Created,
    Funded,
    InProgress,
    Delivered,
    Approved,
    Disputed,
    Refunded,
    Released,
    Cancelled
};

enum class TransactionType { Deposit, Withdrawal, Payment, Refund, Escrow };

enum class TransactionStatus { Pending, Completed, Failed, Refunded };

enum class PaymentMethodType { CreditCard, PayPal, BankTransfer };

std::string toString(EscrowStatus status);
std::string toString(TransactionType type);
std::string toString(TransactionStatus status);
std::string toString(PaymentMethodType type);

std::optional<EscrowStatus> parseEscrowStatus(const std::string& s);
std::optional<TransactionType> parseTransactionType(const std::string& s);
std::optional<TransactionStatus> parseTransactionStatus(const std::string& s);
std::optional<PaymentMethodType> parsePaymentMethodType(const std::string& s);

struct EscrowReserve {
    std::string escrowId;
    Amount amount{0};
};

struct PaymentMethod {
    std::string id;
    PaymentMethodType type{PaymentMethodType::BankTransfer};
    std::string last4;       // credit cards only
    std::string expiryDate;  // "MM/YY", credit cards only
    std::string name;
    bool isDefault{false};
    std::string gatewayToken; // token handed to the payment gateway
    TimestampMs createdAt{0};
};

struct Wallet {
    std::string id;
    std::string userId;
    Amount balance{0};
    Amount reservedBalance{0};
    std::string currency;
    std::vector<EscrowReserve> escrowReserves;
    std::vector<PaymentMethod> paymentMethods;
    std::vector<std::string> transactionIds;
    TimestampMs createdAt{0};
    TimestampMs updatedAt{0};

    // free = total - reserved
    Amount availableBalance() const { return balance - reservedBalance; }

    // reservedBalance := sum(escrowReserves[].amount)
    Amount recalculateReservedBalance();

    PaymentMethod* findPaymentMethod(const std::string& methodId);
    const PaymentMethod* findPaymentMethod(const std::string& methodId) const;

    const EscrowReserve* findReserve(const std::string& escrowId) const;

    // Drops the reserve entry for escrowId. Returns false if there was none.
    bool removeReserve(const std::string& escrowId);
};

struct Escrow {
    std::string id;
    std::string clientId;
    std::string freelancerId;

    std::string serviceId;
    std::string serviceName;
    std::string description;

    Amount amount{0};
    Amount platformFee{0};
    std::string currency;

    std::string paymentMethodId;
    std::string transactionId;

    EscrowStatus status{EscrowStatus::Created};

    TimestampMs createdAt{0};
    TimestampMs fundedAt{0};
    TimestampMs startedAt{0};
    TimestampMs deliveredAt{0};
    TimestampMs approvedAt{0};
    TimestampMs disputedAt{0};
    TimestampMs resolvedAt{0};
    TimestampMs cancelledAt{0};

    std::string deliveryMessage;
    std::vector<std::string> deliveryFiles;
    std::optional<int> approvalRating;
    std::string approvalFeedback;

    std::string disputeReason;
    std::string disputeResolution;
    std::string disputeResolvedBy;

    std::string terms;
};

struct Transaction {
    std::string id;
    std::string userId;
    Amount amount{0}; // > 0 credit, < 0 debit
    std::string currency;
    TransactionType type{TransactionType::Deposit};
    TransactionStatus status{TransactionStatus::Completed};
    std::string paymentMethodId;
    std::string description;
    std::string reference;      // escrow id, empty if none
    std::string referenceKind;  // "Escrow" when reference is set
    std::string gatewayReference;
    TimestampMs timestamp{0};
};

/**
 * Raw slice returned by the store: the requested window plus the total
 * number of matching records.
 */
template <typename T>
struct ListResult {
    std::vector<T> items;
    size_t total{0};
};

struct PageInfo {
    size_t page{1};
    size_t limit{10};
    size_t total{0};
    size_t pages{0};
};

template <typename T>
struct Paged {
    std::vector<T> items;
    PageInfo pagination;
};

#endif // LEDGER_TYPES_HPP
