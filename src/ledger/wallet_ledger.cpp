#include "ledger/wallet_ledger.hpp"
#include "core/errors.hpp"
#include "core/ledger_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace {

void requireUser(const std::string& userId) {
    if (userId.empty()) {
        throw ValidationError("User ID is required");
    }
}

std::string lastFourDigits(const std::string& cardNumber) {
    std::string digits;
    for (char c : cardNumber) {
        if (std::isdigit((unsigned char)c)) digits.push_back(c);
    }
    if (digits.size() < 4) {
        return digits.empty() ? "" : std::string(4 - digits.size(), '0') + digits;
    }
    return digits.substr(digits.size() - 4);
}

// "7", "2027" => "07/27"
std::string formatExpiry(const std::string& month, const std::string& year) {
    if (month.empty() || year.empty()) return "";
    std::string mm = (month.size() == 1) ? "0" + month : month;
    std::string yy = (year.size() > 2) ? year.substr(year.size() - 2) : year;
    return mm + "/" + yy;
}

} // anonymous namespace

WalletLedger::WalletLedger(ILedgerStore& store,
                           TransactionLog& log,
                           const std::string& defaultCurrency,
                           IPaymentGateway* gateway)
    : store_(store)
    , log_(log)
    , defaultCurrency_(defaultCurrency)
    , gateway_(gateway)
{
}

Wallet WalletLedger::loadOrCreate(StoreTransaction& uow, const std::string& userId) const {
    auto found = uow.findWallet(userId);
    if (found) {
        return *found;
    }
    Wallet w;
    w.id        = LedgerUtils::makeId("wal");
    w.userId    = userId;
    w.currency  = defaultCurrency_;
    w.createdAt = LedgerUtils::nowMs();
    w.updatedAt = w.createdAt;
    return w;
}

Wallet WalletLedger::getOrCreate(const std::string& userId) {
    requireUser(userId);

    auto existing = store_.findWallet(userId);
    if (existing) {
        return *existing;
    }

    Wallet result;
    bool created = false;
    store_.withTransaction([&](StoreTransaction& uow) {
        auto found = uow.findWallet(userId);
        if (found) {
            result = *found;
            return;
        }
        result = loadOrCreate(uow, userId);
        uow.putWallet(result);
        created = true;
    });
    if (created) {
        std::cout << "[WALLET] Created wallet for user=" << userId
                  << " currency=" << result.currency << "\n";
    }
    return result;
}

WalletView WalletLedger::walletView(const std::string& userId) {
    WalletView view;
    view.wallet           = getOrCreate(userId);
    view.availableBalance = view.wallet.availableBalance();
    return view;
}

void WalletLedger::checkCurrency(const Wallet& wallet, const std::string& currency) const {
    if (!currency.empty() && currency != wallet.currency) {
        throw ValidationError("Currency " + currency + " does not match wallet currency "
                              + wallet.currency);
    }
}

BalanceChange WalletLedger::deposit(const std::string& userId,
                                    Amount amount,
                                    const std::string& paymentMethodId,
                                    const std::string& currency)
{
    requireUser(userId);
    LedgerUtils::requirePositiveAmount(amount, "amount");
    if (paymentMethodId.empty()) {
        throw ValidationError("Payment method ID is required");
    }

    // (1) resolve the method and authorize card charges before taking the ledger lock
    Wallet snapshot = getOrCreate(userId);
    checkCurrency(snapshot, currency);
    const PaymentMethod* method = snapshot.findPaymentMethod(paymentMethodId);
    if (!method) {
        throw ValidationError("Payment method not found: " + paymentMethodId);
    }

    std::string gatewayRef;
    if (method->type == PaymentMethodType::CreditCard && !method->gatewayToken.empty()) {
        if (gateway_) {
            GatewayAuthorization auth = gateway_->authorize(method->gatewayToken, amount, snapshot.currency);
            gatewayRef = auth.reference;
            std::cout << "[WALLET] " << gateway_->name() << " authorized deposit ref=" << gatewayRef << "\n";
        } else {
            std::cout << "[WALLET] No payment gateway configured, recording card deposit unauthorized.\n";
        }
    }

    // (2) re-resolve inside the unit of work and post
    BalanceChange out;
    try {
        store_.withTransaction([&](StoreTransaction& uow) {
            Wallet w = loadOrCreate(uow, userId);
            if (!w.findPaymentMethod(paymentMethodId)) {
                throw ValidationError("Payment method not found: " + paymentMethodId);
            }

            LedgerEntry entry;
            entry.type             = TransactionType::Deposit;
            entry.amount           = amount;
            entry.paymentMethodId  = paymentMethodId;
            entry.description      = "Wallet deposit";
            entry.gatewayReference = gatewayRef;

            out.transaction = log_.post(uow, w, entry);
            uow.putWallet(w);

            out.newBalance       = w.balance;
            out.availableBalance = w.availableBalance();
        });
    } catch (const std::exception& e) {
        if (!gatewayRef.empty()) {
            // authorized at the processor but never booked; needs a manual void
            std::cerr << "[WALLET] Unbooked authorization ref=" << gatewayRef
                      << " user=" << userId << " amount=" << amount
                      << ": " << e.what() << "\n";
        }
        throw;
    }
    out.gatewayReference = gatewayRef;

    std::cout << "[WALLET] deposit user=" << userId << " amount=" << amount
              << " newBalance=" << out.newBalance << "\n";
    return out;
}

BalanceChange WalletLedger::withdraw(const std::string& userId,
                                     Amount amount,
                                     const std::string& paymentMethodId,
                                     const std::string& currency)
{
    requireUser(userId);
    LedgerUtils::requirePositiveAmount(amount, "amount");
    if (paymentMethodId.empty()) {
        throw ValidationError("Payment method ID is required");
    }

    BalanceChange out;
    store_.withTransaction([&](StoreTransaction& uow) {
        Wallet w = loadOrCreate(uow, userId);
        checkCurrency(w, currency);

        Amount available = w.availableBalance();
        if (amount > available) {
            throw InsufficientFundsError(available, amount);
        }
        if (!w.findPaymentMethod(paymentMethodId)) {
            throw ValidationError("Payment method not found: " + paymentMethodId);
        }

        LedgerEntry entry;
        entry.type            = TransactionType::Withdrawal;
        entry.amount          = -amount;
        entry.paymentMethodId = paymentMethodId;
        entry.description     = "Wallet withdrawal";

        out.transaction = log_.post(uow, w, entry);
        uow.putWallet(w);

        out.newBalance       = w.balance;
        out.availableBalance = w.availableBalance();
    });

    std::cout << "[WALLET] withdraw user=" << userId << " amount=" << amount
              << " newBalance=" << out.newBalance << "\n";
    return out;
}

PaymentMethod WalletLedger::addPaymentMethod(const std::string& userId, const PaymentMethodSpec& spec) {
    requireUser(userId);
    if (spec.type.empty()) {
        throw ValidationError("Payment method type is required");
    }
    auto type = parsePaymentMethodType(spec.type);
    if (!type) {
        throw ValidationError("Unknown payment method type: " + spec.type);
    }

    PaymentMethod method;
    method.id           = LedgerUtils::makeId("pm");
    method.type         = *type;
    method.name         = spec.name.empty() ? spec.type : spec.name;
    method.gatewayToken = spec.gatewayToken;
    method.createdAt    = LedgerUtils::nowMs();
    if (*type == PaymentMethodType::CreditCard) {
        method.last4      = lastFourDigits(spec.cardNumber);
        method.expiryDate = formatExpiry(spec.expiryMonth, spec.expiryYear);
    }

    store_.withTransaction([&](StoreTransaction& uow) {
        Wallet w = loadOrCreate(uow, userId);
        method.isDefault = spec.isDefault || w.paymentMethods.empty();
        if (method.isDefault) {
            for (auto& m : w.paymentMethods) {
                m.isDefault = false;
            }
        }
        w.paymentMethods.push_back(method);
        w.updatedAt = method.createdAt;
        uow.putWallet(w);
    });

    std::cout << "[WALLET] Added " << spec.type << " method " << method.id
              << " for user=" << userId << (method.isDefault ? " (default)" : "") << "\n";
    return method;
}

Wallet WalletLedger::removePaymentMethod(const std::string& userId, const std::string& methodId) {
    requireUser(userId);

    Wallet result;
    store_.withTransaction([&](StoreTransaction& uow) {
        Wallet w = loadOrCreate(uow, userId);
        auto it = std::find_if(w.paymentMethods.begin(), w.paymentMethods.end(),
                               [&](const PaymentMethod& m) { return m.id == methodId; });
        if (it == w.paymentMethods.end()) {
            throw NotFoundError("Payment method not found: " + methodId);
        }
        if (w.paymentMethods.size() == 1) {
            throw ValidationError("Cannot remove the only payment method");
        }

        bool wasDefault = it->isDefault;
        w.paymentMethods.erase(it);
        if (wasDefault) {
            w.paymentMethods.front().isDefault = true;
        }
        w.updatedAt = LedgerUtils::nowMs();
        uow.putWallet(w);
        result = w;
    });

    std::cout << "[WALLET] Removed method " << methodId << " for user=" << userId << "\n";
    return result;
}

Wallet WalletLedger::setDefaultPaymentMethod(const std::string& userId, const std::string& methodId) {
    requireUser(userId);

    Wallet result;
    store_.withTransaction([&](StoreTransaction& uow) {
        Wallet w = loadOrCreate(uow, userId);
        if (!w.findPaymentMethod(methodId)) {
            throw NotFoundError("Payment method not found: " + methodId);
        }
        for (auto& m : w.paymentMethods) {
            m.isDefault = (m.id == methodId);
        }
        w.updatedAt = LedgerUtils::nowMs();
        uow.putWallet(w);
        result = w;
    });
    return result;
}

Paged<Transaction> WalletLedger::transactions(const std::string& userId,
                                              std::optional<TransactionType> type,
                                              size_t page,
                                              size_t limit)
{
    return log_.history(userId, type, page, limit);
}

ReconciliationReport WalletLedger::reconcile(const std::string& userId) {
    requireUser(userId);
    ReconciliationReport report = log_.reconcile(userId);
    if (!report.consistent) {
        std::cerr << "[WALLET] Reconciliation mismatch user=" << userId
                  << " balance=" << report.balance
                  << " ledgerSum=" << report.ledgerSum << "\n";
    }
    return report;
}
