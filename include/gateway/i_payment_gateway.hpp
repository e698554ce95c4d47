#ifndef I_PAYMENT_GATEWAY_HPP
#define I_PAYMENT_GATEWAY_HPP

#include <string>
#include "core/ledger_types.hpp"

struct GatewayAuthorization {
    std::string reference; // processor-side id of the authorization
    std::string message;
};

class IPaymentGateway {
public:
    virtual ~IPaymentGateway() = default;

    // Authorize a card charge. Throws GatewayError on decline or transport failure.
    virtual GatewayAuthorization authorize(const std::string& cardToken,
                                           Amount amount,
                                           const std::string& currency) = 0;

    virtual std::string name() const = 0;
};

#endif // I_PAYMENT_GATEWAY_HPP
