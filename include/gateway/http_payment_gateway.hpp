#ifndef HTTP_PAYMENT_GATEWAY_HPP
#define HTTP_PAYMENT_GATEWAY_HPP

#include "gateway/i_payment_gateway.hpp"
#include <string>

/**
 * Card processor reached over HTTPS with libcurl. Each authorization is a
 * signed form POST to {baseUrl}/v1/authorizations; the API key travels in the
 * X-GATEWAY-KEY header and the body carries an HMAC-SHA256 signature made
 * with the secret key.
 */
class HttpPaymentGateway : public IPaymentGateway {
public:
    HttpPaymentGateway(const std::string& apiKey,
                       const std::string& secretKey,
                       const std::string& baseUrl,
                       long timeoutSeconds = 10);

    GatewayAuthorization authorize(const std::string& cardToken,
                                   Amount amount,
                                   const std::string& currency) override;

    std::string name() const override { return "http"; }

    // body of an authorization request before the signature is appended
    static std::string buildPayload(const std::string& cardToken,
                                    Amount amount,
                                    const std::string& currency,
                                    TimestampMs timestamp);

    // reads {"reference": ...} or throws GatewayError for {"code", "msg"}
    static GatewayAuthorization parseResponse(const std::string& body);

private:
    std::string post(const std::string& endpoint, const std::string& body);

    std::string apiKey_;
    std::string secretKey_;
    std::string baseUrl_;
    long timeoutSeconds_;
};

#endif // HTTP_PAYMENT_GATEWAY_HPP
