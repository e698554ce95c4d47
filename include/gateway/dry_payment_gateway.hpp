#ifndef DRY_PAYMENT_GATEWAY_HPP
#define DRY_PAYMENT_GATEWAY_HPP

#include "gateway/i_payment_gateway.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>

/**
 * Offline gateway for local runs and tests. Approves every card token except
 * those marked with setDecline(), after an optional simulated latency.
 */
class DryPaymentGateway : public IPaymentGateway {
public:
    explicit DryPaymentGateway(int latencyMs = 0);

    GatewayAuthorization authorize(const std::string& cardToken,
                                   Amount amount,
                                   const std::string& currency) override;

    std::string name() const override { return "dry"; }

    void setDecline(const std::string& cardToken, bool decline = true);
    void setLatencyMs(int ms) { latencyMs_ = ms; }

    int authorizationCount() const { return authorizations_.load(); }

private:
    std::atomic<int> latencyMs_;
    std::atomic<int> authorizations_{0};

    std::mutex declineMutex_;
    std::set<std::string> declined_;
};

#endif // DRY_PAYMENT_GATEWAY_HPP
