#ifndef REQUEST_SIGNING_HPP
#define REQUEST_SIGNING_HPP

#include <string>

namespace RequestSigning {
    // lowercase hex HMAC-SHA256 of data under key
    std::string hmacSha256Hex(const std::string& key, const std::string& data);

    // percent-encodes everything except unreserved characters (RFC 3986)
    std::string urlEncode(const std::string& value);
}

#endif // REQUEST_SIGNING_HPP
