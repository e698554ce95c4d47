#include "gateway/request_signing.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string RequestSigning::hmacSha256Hex(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    unsigned char* ok = HMAC(EVP_sha256(),
                             key.data(), (int)key.size(),
                             (const unsigned char*)data.data(), data.size(),
                             digest, &digestLen);
    if (!ok) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digestLen; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
    }
    return hex.str();
}

std::string RequestSigning::urlEncode(const std::string& value) {
    std::ostringstream out;
    out << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << (char)c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << (int)c;
        }
    }
    return out.str();
}
