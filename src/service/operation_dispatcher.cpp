#include "service/operation_dispatcher.hpp"
#include "core/json_codec.hpp"
#include "core/thread_pool.hpp"
#include <climits>
#include <future>
#include <iostream>

using json = nlohmann::json;

namespace {

// absent or null => ""
std::string optString(const json& args, const std::string& key) {
    if (!args.contains(key) || args[key].is_null()) return "";
    if (!args[key].is_string()) {
        throw ValidationError(key + " must be a string");
    }
    return args[key].get<std::string>();
}

Amount requireAmount(const json& args, const std::string& key) {
    if (!args.contains(key) || args[key].is_null()) {
        throw ValidationError(key + " is required");
    }
    if (!args[key].is_number_integer()) {
        throw ValidationError(key + " must be an integer count of minor units");
    }
    return args[key].get<Amount>();
}

size_t optCount(const json& args, const std::string& key, size_t fallback) {
    if (!args.contains(key) || args[key].is_null()) return fallback;
    const json& v = args[key];
    if (!v.is_number_integer()
        || (v.is_number_unsigned() ? v.get<unsigned long long>() < 1 : v.get<long long>() < 1)) {
        throw ValidationError(key + " must be a positive integer");
    }
    return v.get<size_t>();
}

std::optional<int> optInt(const json& args, const std::string& key) {
    if (!args.contains(key) || args[key].is_null()) return std::nullopt;
    if (!args[key].is_number_integer()) {
        throw ValidationError(key + " must be an integer");
    }
    if (args[key].is_number_unsigned() && args[key].get<unsigned long long>() > (unsigned long long)INT_MAX) {
        throw ValidationError(key + " is out of range");
    }
    long long v = args[key].get<long long>();
    if (v < INT_MIN || v > INT_MAX) {
        throw ValidationError(key + " is out of range");
    }
    return (int)v;
}

bool optBool(const json& args, const std::string& key) {
    if (!args.contains(key) || args[key].is_null()) return false;
    if (!args[key].is_boolean()) {
        throw ValidationError(key + " must be true or false");
    }
    return args[key].get<bool>();
}

std::vector<std::string> optStrings(const json& args, const std::string& key) {
    std::vector<std::string> out;
    if (!args.contains(key) || args[key].is_null()) return out;
    if (!args[key].is_array()) {
        throw ValidationError(key + " must be an array of strings");
    }
    for (const auto& v : args[key]) {
        if (!v.is_string()) {
            throw ValidationError(key + " must be an array of strings");
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

json balanceChangeJson(const BalanceChange& change) {
    json j;
    j["newBalance"]       = change.newBalance;
    j["availableBalance"] = change.availableBalance;
    j["transaction"]      = change.transaction;
    if (!change.gatewayReference.empty()) {
        j["gatewayReference"] = change.gatewayReference;
    }
    return j;
}

json settlementJson(const EscrowSettlement& s) {
    json j;
    j["escrow"]      = s.escrow;
    j["transaction"] = s.transaction;
    return j;
}

json escrowJson(const Escrow& e) {
    json j;
    j["escrow"] = e;
    return j;
}

json failure(const json& error) {
    json j;
    j["success"] = false;
    j["error"]   = error;
    return j;
}

} // anonymous namespace

OperationDispatcher::OperationDispatcher(WalletLedger& wallets, EscrowEngine& escrows)
    : wallets_(wallets)
    , escrows_(escrows)
{
    registerWalletOps();
    registerEscrowOps();
}

void OperationDispatcher::registerWalletOps() {
    handlers_["wallet.get"] = [this](const json& a) {
        WalletView view = wallets_.walletView(optString(a, "userId"));
        json j;
        j["wallet"]           = view.wallet;
        j["availableBalance"] = view.availableBalance;
        return j;
    };

    handlers_["wallet.deposit"] = [this](const json& a) {
        return balanceChangeJson(wallets_.deposit(optString(a, "userId"),
                                                  requireAmount(a, "amount"),
                                                  optString(a, "paymentMethodId"),
                                                  optString(a, "currency")));
    };

    handlers_["wallet.withdraw"] = [this](const json& a) {
        return balanceChangeJson(wallets_.withdraw(optString(a, "userId"),
                                                   requireAmount(a, "amount"),
                                                   optString(a, "paymentMethodId"),
                                                   optString(a, "currency")));
    };

    handlers_["wallet.addPaymentMethod"] = [this](const json& a) {
        PaymentMethodSpec spec;
        spec.type         = optString(a, "type");
        spec.cardNumber   = optString(a, "cardNumber");
        spec.expiryMonth  = optString(a, "expiryMonth");
        spec.expiryYear   = optString(a, "expiryYear");
        spec.name         = optString(a, "name");
        spec.isDefault    = optBool(a, "isDefault");
        spec.gatewayToken = optString(a, "gatewayToken");
        json j;
        j["paymentMethod"] = wallets_.addPaymentMethod(optString(a, "userId"), spec);
        return j;
    };

    handlers_["wallet.removePaymentMethod"] = [this](const json& a) {
        json j;
        j["wallet"] = wallets_.removePaymentMethod(optString(a, "userId"), optString(a, "methodId"));
        return j;
    };

    handlers_["wallet.setDefaultPaymentMethod"] = [this](const json& a) {
        json j;
        j["wallet"] = wallets_.setDefaultPaymentMethod(optString(a, "userId"), optString(a, "methodId"));
        return j;
    };

    handlers_["wallet.transactions"] = [this](const json& a) {
        std::optional<TransactionType> type;
        std::string typeName = optString(a, "type");
        if (!typeName.empty()) {
            type = parseTransactionType(typeName);
            if (!type) {
                throw ValidationError("Unknown transaction type: " + typeName);
            }
        }
        Paged<Transaction> page = wallets_.transactions(optString(a, "userId"), type,
                                                        optCount(a, "page", 1),
                                                        optCount(a, "limit", 10));
        json j;
        j["transactions"] = page.items;
        j["pagination"]   = page.pagination;
        return j;
    };

    handlers_["wallet.reconcile"] = [this](const json& a) {
        ReconciliationReport r = wallets_.reconcile(optString(a, "userId"));
        json j;
        j["userId"]     = r.userId;
        j["ledgerSum"]  = r.ledgerSum;
        j["balance"]    = r.balance;
        j["entries"]    = r.entries;
        j["consistent"] = r.consistent;
        return j;
    };
}

void OperationDispatcher::registerEscrowOps() {
    handlers_["escrow.create"] = [this](const json& a) {
        CreateEscrowRequest req;
        req.clientId        = optString(a, "clientId");
        req.freelancerId    = optString(a, "freelancerId");
        req.serviceId       = optString(a, "serviceId");
        req.serviceName     = optString(a, "serviceName");
        req.description     = optString(a, "description");
        req.amount          = requireAmount(a, "amount");
        req.currency        = optString(a, "currency");
        req.paymentMethodId = optString(a, "paymentMethodId");
        req.terms           = optString(a, "terms");

        EscrowFunding funding = escrows_.create(req);
        json j;
        j["escrow"]      = funding.escrow;
        j["transaction"] = funding.transaction;
        j["platformFee"] = funding.platformFee;
        j["totalAmount"] = funding.totalAmount;
        return j;
    };

    handlers_["escrow.get"] = [this](const json& a) {
        return escrowJson(escrows_.get(optString(a, "escrowId")));
    };

    handlers_["escrow.list"] = [this](const json& a) {
        std::optional<EscrowStatus> status;
        std::string statusName = optString(a, "status");
        if (!statusName.empty()) {
            status = parseEscrowStatus(statusName);
            if (!status) {
                throw ValidationError("Unknown escrow status: " + statusName);
            }
        }
        Paged<Escrow> page = escrows_.listForUser(optString(a, "userId"),
                                                  optString(a, "role"),
                                                  status,
                                                  optCount(a, "page", 1),
                                                  optCount(a, "limit", 10));
        json j;
        j["escrows"]    = page.items;
        j["pagination"] = page.pagination;
        return j;
    };

    handlers_["escrow.start"] = [this](const json& a) {
        return escrowJson(escrows_.start(optString(a, "escrowId"), optString(a, "freelancerId")));
    };

    handlers_["escrow.deliver"] = [this](const json& a) {
        return escrowJson(escrows_.deliver(optString(a, "escrowId"),
                                           optString(a, "freelancerId"),
                                           optString(a, "deliveryMessage"),
                                           optStrings(a, "deliveryFiles")));
    };

    handlers_["escrow.approve"] = [this](const json& a) {
        return settlementJson(escrows_.approve(optString(a, "escrowId"),
                                               optString(a, "clientId"),
                                               optInt(a, "rating"),
                                               optString(a, "feedback")));
    };

    handlers_["escrow.reject"] = [this](const json& a) {
        return escrowJson(escrows_.reject(optString(a, "escrowId"),
                                          optString(a, "clientId"),
                                          optString(a, "reason")));
    };

    handlers_["escrow.release"] = [this](const json& a) {
        return settlementJson(escrows_.release(optString(a, "escrowId"),
                                               optString(a, "resolverId"),
                                               optString(a, "resolution")));
    };

    handlers_["escrow.refund"] = [this](const json& a) {
        return settlementJson(escrows_.refund(optString(a, "escrowId"),
                                              optString(a, "resolverId"),
                                              optString(a, "resolution")));
    };

    handlers_["escrow.cancel"] = [this](const json& a) {
        return settlementJson(escrows_.cancel(optString(a, "escrowId"), optString(a, "clientId")));
    };
}

json OperationDispatcher::errorToJson(const LedgerError& err) {
    json j;
    j["kind"]      = errorKindName(err.kind());
    j["message"]   = err.what();
    j["retryable"] = err.retryable();

    if (auto funds = dynamic_cast<const InsufficientFundsError*>(&err)) {
        j["available"] = funds->available();
        j["requested"] = funds->requested();
    } else if (auto state = dynamic_cast<const InvalidStateError*>(&err)) {
        j["current"]  = toString(state->current());
        j["required"] = toString(state->required());
    }
    return j;
}

json OperationDispatcher::dispatch(const std::string& op, const json& args) {
    try {
        auto it = handlers_.find(op);
        if (it == handlers_.end()) {
            throw ValidationError("Unknown operation: " + op);
        }
        if (!args.is_null() && !args.is_object()) {
            throw ValidationError("Arguments must be a JSON object");
        }
        json out = it->second(args.is_null() ? json::object() : args);
        out["success"] = true;
        return out;
    } catch (const LedgerError& e) {
        std::cerr << "[DISPATCH] " << op << " => " << errorKindName(e.kind())
                  << ": " << e.what() << "\n";
        return failure(errorToJson(e));
    } catch (const json::exception& e) {
        std::cerr << "[DISPATCH] " << op << " => bad arguments: " << e.what() << "\n";
        return failure(errorToJson(ValidationError(e.what())));
    } catch (const std::exception& e) {
        std::cerr << "[DISPATCH] " << op << " => internal error: " << e.what() << "\n";
        json err;
        err["kind"]      = "InternalError";
        err["message"]   = e.what();
        err["retryable"] = false;
        return failure(err);
    }
}

json OperationDispatcher::runBatch(const json& requests, size_t workers) {
    if (!requests.is_array()) {
        throw ValidationError("Batch must be a JSON array of {op, args}");
    }

    std::vector<std::future<json>> pending;
    {
        ThreadPool pool(workers);
        for (const auto& req : requests) {
            pending.push_back(pool.submit([this, req]() -> json {
                if (!req.is_object() || !req.contains("op") || !req["op"].is_string()) {
                    return failure(errorToJson(ValidationError("Batch entry needs a string \"op\"")));
                }
                json args = req.contains("args") ? req.at("args") : json::object();
                return dispatch(req["op"].get<std::string>(), args);
            }));
        }
        std::cout << "[DISPATCH] batch of " << pending.size()
                  << " on " << pool.size() << " workers\n";
    }

    json results = json::array();
    for (auto& f : pending) {
        results.push_back(f.get());
    }
    return results;
}

std::vector<std::string> OperationDispatcher::operations() const {
    std::vector<std::string> names;
    for (const auto& kv : handlers_) {
        names.push_back(kv.first);
    }
    return names;
}
