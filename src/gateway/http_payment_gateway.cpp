#include "gateway/http_payment_gateway.hpp"
#include "gateway/request_signing.hpp"
#include "core/errors.hpp"
#include "core/ledger_utils.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

HttpPaymentGateway::HttpPaymentGateway(const std::string& apiKey,
                                       const std::string& secretKey,
                                       const std::string& baseUrl,
                                       long timeoutSeconds)
    : apiKey_(apiKey)
    , secretKey_(secretKey)
    , baseUrl_(baseUrl)
    , timeoutSeconds_(timeoutSeconds)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

std::string HttpPaymentGateway::buildPayload(const std::string& cardToken,
                                             Amount amount,
                                             const std::string& currency,
                                             TimestampMs timestamp)
{
    std::ostringstream qs;
    qs << "token=" << RequestSigning::urlEncode(cardToken)
       << "&amount=" << amount
       << "&currency=" << RequestSigning::urlEncode(currency)
       << "&timestamp=" << timestamp;
    return qs.str();
}

GatewayAuthorization HttpPaymentGateway::parseResponse(const std::string& body) {
    if (body.empty()) {
        throw GatewayError("Empty response from payment gateway");
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error&) {
        throw GatewayError("Unparsable gateway response: " + body);
    }

    if (j.contains("code") && j["code"].is_number()) {
        throw GatewayError("Gateway error code=" + std::to_string(j["code"].get<int>())
                           + " msg=" + j.value("msg", "unknown"));
    }
    if (!j.contains("reference") || !j["reference"].is_string()) {
        throw GatewayError("Gateway response has no reference");
    }

    GatewayAuthorization auth;
    auth.reference = j["reference"].get<std::string>();
    auth.message   = j.value("message", "approved");
    return auth;
}

/**
 * authorize => sign the form body, POST it, map the reply
 */
GatewayAuthorization HttpPaymentGateway::authorize(const std::string& cardToken,
                                                   Amount amount,
                                                   const std::string& currency)
{
    std::string body = buildPayload(cardToken, amount, currency, LedgerUtils::nowMs());
    body += "&signature=" + RequestSigning::hmacSha256Hex(secretKey_, body);

    std::string response = post("/v1/authorizations", body);
    GatewayAuthorization auth = parseResponse(response);

    std::cout << "[GATEWAY] authorized amount=" << amount << " " << currency
              << " ref=" << auth.reference << "\n";
    return auth;
}

std::string HttpPaymentGateway::post(const std::string& endpoint, const std::string& body) {
    std::string url = baseUrl_ + endpoint;

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw GatewayError("curl_easy_init failed");
    }

    std::string readBuffer;
    struct curl_slist* chunk = nullptr;
    chunk = curl_slist_append(chunk, ("X-GATEWAY-KEY: " + apiKey_).c_str());
    chunk = curl_slist_append(chunk, "Content-Type: application/x-www-form-urlencoded");

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, chunk);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());

    CURLcode ret = curl_easy_perform(curl);
    curl_slist_free_all(chunk);
    curl_easy_cleanup(curl);

    if (ret != CURLE_OK) {
        std::cerr << "[GATEWAY] POST " << url << " failed: " << curl_easy_strerror(ret) << "\n";
        throw GatewayError(std::string("Gateway request failed: ") + curl_easy_strerror(ret));
    }
    return readBuffer;
}
