#include "gateway/dry_payment_gateway.hpp"
#include "core/errors.hpp"
#include "core/ledger_utils.hpp"
#include <chrono>
#include <iostream>
#include <thread>

DryPaymentGateway::DryPaymentGateway(int latencyMs)
    : latencyMs_(latencyMs)
{
}

GatewayAuthorization DryPaymentGateway::authorize(const std::string& cardToken,
                                                  Amount amount,
                                                  const std::string& currency)
{
    // Simulate processor round trip
    if (latencyMs_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(latencyMs_.load()));
    }

    {
        std::lock_guard<std::mutex> lg(declineMutex_);
        if (declined_.count(cardToken)) {
            std::cout << "[DRY] Declining token=" << cardToken << " amount=" << amount << "\n";
            throw GatewayError("Card declined by dry gateway");
        }
    }

    GatewayAuthorization auth;
    auth.reference = LedgerUtils::makeId("dry");
    auth.message   = "approved";
    authorizations_++;

    std::cout << "[DRY] authorize token=" << cardToken
              << " amount=" << amount
              << " currency=" << currency
              << " ref=" << auth.reference << std::endl;
    return auth;
}

void DryPaymentGateway::setDecline(const std::string& cardToken, bool decline) {
    std::lock_guard<std::mutex> lg(declineMutex_);
    if (decline) {
        declined_.insert(cardToken);
    } else {
        declined_.erase(cardToken);
    }
}
