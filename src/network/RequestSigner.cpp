#include "network/RequestSigner.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace zenith {
namespace network {

std::string RequestSigner::hmacSha256Hex(const std::string& secret, const std::string& message) {
    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    const unsigned char* result = HMAC(
        EVP_sha256(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        signature, &signature_len);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 signing failed");
    }

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < signature_len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(signature[i]);
    }
    return hex_stream.str();
}

std::string RequestSigner::buildQueryString(const QueryParams& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string RequestSigner::signQuery(const std::string& query, const std::string& secret) {
    const std::string signature = hmacSha256Hex(secret, query);
    if (query.empty()) {
        return "signature=" + signature;
    }
    return query + "&signature=" + signature;
}

} // namespace network
} // namespace zenith
