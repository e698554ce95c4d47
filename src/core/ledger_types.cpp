#include "core/ledger_types.hpp"
#include <algorithm>

std::string toString(EscrowStatus status) {
    switch (status) {
        case EscrowStatus::Created:    return "created";
        case EscrowStatus::Funded:     return "funded";
        case EscrowStatus::InProgress: return "in_progress";
        case EscrowStatus::Delivered:  return "delivered";
        case EscrowStatus::Approved:   return "approved";
        case EscrowStatus::Disputed:   return "disputed";
        case EscrowStatus::Refunded:   return "refunded";
        case EscrowStatus::Released:   return "released";
        case EscrowStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::Deposit:    return "deposit";
        case TransactionType::Withdrawal: return "withdrawal";
        case TransactionType::Payment:    return "payment";
        case TransactionType::Refund:     return "refund";
        case TransactionType::Escrow:     return "escrow";
    }
    return "unknown";
}

std::string toString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::Pending:   return "pending";
        case TransactionStatus::Completed: return "completed";
        case TransactionStatus::Failed:    return "failed";
        case TransactionStatus::Refunded:  return "refunded";
    }
    return "unknown";
}

std::string toString(PaymentMethodType type) {
    switch (type) {
        case PaymentMethodType::CreditCard:   return "credit_card";
        case PaymentMethodType::PayPal:       return "paypal";
        case PaymentMethodType::BankTransfer: return "bank_transfer";
    }
    return "unknown";
}

std::optional<EscrowStatus> parseEscrowStatus(const std::string& s) {
    static const EscrowStatus all[] = {
        EscrowStatus::Created, EscrowStatus::Funded, EscrowStatus::InProgress,
        EscrowStatus::Delivered, EscrowStatus::Approved, EscrowStatus::Disputed,
        EscrowStatus::Refunded, EscrowStatus::Released, EscrowStatus::Cancelled
    };
    for (auto st : all) {
        if (toString(st) == s) return st;
    }
    return std::nullopt;
}

std::optional<TransactionType> parseTransactionType(const std::string& s) {
    static const TransactionType all[] = {
        TransactionType::Deposit, TransactionType::Withdrawal, TransactionType::Payment,
        TransactionType::Refund, TransactionType::Escrow
    };
    for (auto t : all) {
        if (toString(t) == s) return t;
    }
    return std::nullopt;
}

std::optional<TransactionStatus> parseTransactionStatus(const std::string& s) {
    static const TransactionStatus all[] = {
        TransactionStatus::Pending, TransactionStatus::Completed,
        TransactionStatus::Failed, TransactionStatus::Refunded
    };
    for (auto st : all) {
        if (toString(st) == s) return st;
    }
    return std::nullopt;
}

std::optional<PaymentMethodType> parsePaymentMethodType(const std::string& s) {
    static const PaymentMethodType all[] = {
        PaymentMethodType::CreditCard, PaymentMethodType::PayPal, PaymentMethodType::BankTransfer
    };
    for (auto t : all) {
        if (toString(t) == s) return t;
    }
    return std::nullopt;
}

Amount Wallet::recalculateReservedBalance() {
    Amount total = 0;
    for (const auto& r : escrowReserves) {
        total += r.amount;
    }
    reservedBalance = total;
    return reservedBalance;
}

PaymentMethod* Wallet::findPaymentMethod(const std::string& methodId) {
    for (auto& m : paymentMethods) {
        if (m.id == methodId) return &m;
    }
    return nullptr;
}

const PaymentMethod* Wallet::findPaymentMethod(const std::string& methodId) const {
    for (const auto& m : paymentMethods) {
        if (m.id == methodId) return &m;
    }
    return nullptr;
}

const EscrowReserve* Wallet::findReserve(const std::string& escrowId) const {
    for (const auto& r : escrowReserves) {
        if (r.escrowId == escrowId) return &r;
    }
    return nullptr;
}

bool Wallet::removeReserve(const std::string& escrowId) {
    auto it = std::find_if(escrowReserves.begin(), escrowReserves.end(),
                           [&](const EscrowReserve& r) { return r.escrowId == escrowId; });
    if (it == escrowReserves.end()) {
        return false;
    }
    escrowReserves.erase(it);
    return true;
}
