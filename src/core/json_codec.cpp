#include "core/json_codec.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

void putIfSet(json& j, const char* key, const std::string& v) {
    if (!v.empty()) j[key] = v;
}

void putIfSet(json& j, const char* key, TimestampMs v) {
    if (v != 0) j[key] = v;
}

template <typename E>
E parseEnumField(const json& j, const char* key, E fallback,
                 std::optional<E> (*parse)(const std::string&))
{
    if (!j.contains(key)) return fallback;
    auto parsed = parse(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("unknown value for ") + key + ": "
                                    + j.at(key).get<std::string>());
    }
    return *parsed;
}

} // anonymous namespace

void to_json(json& j, const EscrowReserve& r) {
    j = json{{"escrowId", r.escrowId}, {"amount", r.amount}};
}

void from_json(const json& j, EscrowReserve& r) {
    r.escrowId = j.at("escrowId").get<std::string>();
    r.amount   = j.at("amount").get<Amount>();
}

void to_json(json& j, const PaymentMethod& m) {
    j = json{
        {"id", m.id},
        {"type", toString(m.type)},
        {"name", m.name},
        {"isDefault", m.isDefault}
    };
    putIfSet(j, "last4", m.last4);
    putIfSet(j, "expiryDate", m.expiryDate);
    putIfSet(j, "gatewayToken", m.gatewayToken);
    putIfSet(j, "createdAt", m.createdAt);
}

void from_json(const json& j, PaymentMethod& m) {
    m.id           = j.at("id").get<std::string>();
    m.type         = parseEnumField(j, "type", PaymentMethodType::BankTransfer, &parsePaymentMethodType);
    m.name         = j.value("name", "");
    m.isDefault    = j.value("isDefault", false);
    m.last4        = j.value("last4", "");
    m.expiryDate   = j.value("expiryDate", "");
    m.gatewayToken = j.value("gatewayToken", "");
    m.createdAt    = j.value("createdAt", (TimestampMs)0);
}

void to_json(json& j, const Wallet& w) {
    j = json{
        {"id", w.id},
        {"userId", w.userId},
        {"balance", w.balance},
        {"reservedBalance", w.reservedBalance},
        {"currency", w.currency},
        {"escrowReserves", w.escrowReserves},
        {"paymentMethods", w.paymentMethods},
        {"transactionIds", w.transactionIds}
    };
    putIfSet(j, "createdAt", w.createdAt);
    putIfSet(j, "updatedAt", w.updatedAt);
}

void from_json(const json& j, Wallet& w) {
    w.id              = j.value("id", "");
    w.userId          = j.at("userId").get<std::string>();
    w.balance         = j.value("balance", (Amount)0);
    w.reservedBalance = j.value("reservedBalance", (Amount)0);
    w.currency        = j.value("currency", "");
    w.escrowReserves  = j.value("escrowReserves", std::vector<EscrowReserve>{});
    w.paymentMethods  = j.value("paymentMethods", std::vector<PaymentMethod>{});
    w.transactionIds  = j.value("transactionIds", std::vector<std::string>{});
    w.createdAt       = j.value("createdAt", (TimestampMs)0);
    w.updatedAt       = j.value("updatedAt", (TimestampMs)0);
}

void to_json(json& j, const Escrow& e) {
    j = json{
        {"id", e.id},
        {"clientId", e.clientId},
        {"freelancerId", e.freelancerId},
        {"serviceName", e.serviceName},
        {"description", e.description},
        {"amount", e.amount},
        {"platformFee", e.platformFee},
        {"currency", e.currency},
        {"paymentMethodId", e.paymentMethodId},
        {"status", toString(e.status)}
    };
    putIfSet(j, "serviceId", e.serviceId);
    putIfSet(j, "transactionId", e.transactionId);
    putIfSet(j, "terms", e.terms);

    putIfSet(j, "createdAt", e.createdAt);
    putIfSet(j, "fundedAt", e.fundedAt);
    putIfSet(j, "startedAt", e.startedAt);
    putIfSet(j, "deliveredAt", e.deliveredAt);
    putIfSet(j, "approvedAt", e.approvedAt);
    putIfSet(j, "disputedAt", e.disputedAt);
    putIfSet(j, "resolvedAt", e.resolvedAt);
    putIfSet(j, "cancelledAt", e.cancelledAt);

    putIfSet(j, "deliveryMessage", e.deliveryMessage);
    if (!e.deliveryFiles.empty()) j["deliveryFiles"] = e.deliveryFiles;
    if (e.approvalRating) j["approvalRating"] = *e.approvalRating;
    putIfSet(j, "approvalFeedback", e.approvalFeedback);

    putIfSet(j, "disputeReason", e.disputeReason);
    putIfSet(j, "disputeResolution", e.disputeResolution);
    putIfSet(j, "disputeResolvedBy", e.disputeResolvedBy);
}

void from_json(const json& j, Escrow& e) {
    e.id              = j.at("id").get<std::string>();
    e.clientId        = j.at("clientId").get<std::string>();
    e.freelancerId    = j.at("freelancerId").get<std::string>();
    e.serviceId       = j.value("serviceId", "");
    e.serviceName     = j.value("serviceName", "");
    e.description     = j.value("description", "");
    e.amount          = j.at("amount").get<Amount>();
    e.platformFee     = j.value("platformFee", (Amount)0);
    e.currency        = j.value("currency", "");
    e.paymentMethodId = j.value("paymentMethodId", "");
    e.transactionId   = j.value("transactionId", "");
    e.status          = parseEnumField(j, "status", EscrowStatus::Created, &parseEscrowStatus);
    e.terms           = j.value("terms", "");

    e.createdAt   = j.value("createdAt", (TimestampMs)0);
    e.fundedAt    = j.value("fundedAt", (TimestampMs)0);
    e.startedAt   = j.value("startedAt", (TimestampMs)0);
    e.deliveredAt = j.value("deliveredAt", (TimestampMs)0);
    e.approvedAt  = j.value("approvedAt", (TimestampMs)0);
    e.disputedAt  = j.value("disputedAt", (TimestampMs)0);
    e.resolvedAt  = j.value("resolvedAt", (TimestampMs)0);
    e.cancelledAt = j.value("cancelledAt", (TimestampMs)0);

    e.deliveryMessage = j.value("deliveryMessage", "");
    e.deliveryFiles   = j.value("deliveryFiles", std::vector<std::string>{});
    if (j.contains("approvalRating") && j["approvalRating"].is_number_integer()) {
        e.approvalRating = j["approvalRating"].get<int>();
    } else {
        e.approvalRating.reset();
    }
    e.approvalFeedback = j.value("approvalFeedback", "");

    e.disputeReason     = j.value("disputeReason", "");
    e.disputeResolution = j.value("disputeResolution", "");
    e.disputeResolvedBy = j.value("disputeResolvedBy", "");
}

void to_json(json& j, const Transaction& t) {
    j = json{
        {"id", t.id},
        {"userId", t.userId},
        {"amount", t.amount},
        {"currency", t.currency},
        {"type", toString(t.type)},
        {"status", toString(t.status)},
        {"paymentMethodId", t.paymentMethodId},
        {"timestamp", t.timestamp}
    };
    putIfSet(j, "description", t.description);
    putIfSet(j, "reference", t.reference);
    putIfSet(j, "referenceModel", t.referenceKind);
    putIfSet(j, "gatewayReference", t.gatewayReference);
}

void from_json(const json& j, Transaction& t) {
    t.id               = j.at("id").get<std::string>();
    t.userId           = j.at("userId").get<std::string>();
    t.amount           = j.at("amount").get<Amount>();
    t.currency         = j.value("currency", "");
    t.type             = parseEnumField(j, "type", TransactionType::Deposit, &parseTransactionType);
    t.status           = parseEnumField(j, "status", TransactionStatus::Completed, &parseTransactionStatus);
    t.paymentMethodId  = j.value("paymentMethodId", "");
    t.description      = j.value("description", "");
    t.reference        = j.value("reference", "");
    t.referenceKind    = j.value("referenceModel", "");
    t.gatewayReference = j.value("gatewayReference", "");
    t.timestamp        = j.value("timestamp", (TimestampMs)0);
}

void to_json(json& j, const PageInfo& p) {
    j = json{{"page", p.page}, {"limit", p.limit}, {"total", p.total}, {"pages", p.pages}};
}
