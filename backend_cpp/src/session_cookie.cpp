#include "session_cookie.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace concierge {

SessionCookie::SessionCookie(std::string secret_key) : secret_key_(std::move(secret_key)) {
    if (secret_key_.empty()) throw std::invalid_argument("cookie signing key must not be empty");
}

std::string SessionCookie::mac_hex(const std::string& data) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!HMAC(EVP_sha256(), secret_key_.data(), static_cast<int>(secret_key_.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &digest_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < digest_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string SessionCookie::sign(const std::string& session_id) const {
    return session_id + "." + mac_hex(session_id);
}

std::optional<std::string> SessionCookie::verify(const std::string& cookie_value) const {
    auto dot = cookie_value.rfind('.');
    if (dot == std::string::npos || dot == 0) return std::nullopt;

    std::string session_id = cookie_value.substr(0, dot);
    std::string given = cookie_value.substr(dot + 1);
    std::string expected = mac_hex(session_id);
    if (given.size() != expected.size()) return std::nullopt;
    if (CRYPTO_memcmp(given.data(), expected.data(), expected.size()) != 0) return std::nullopt;
    return session_id;
}

std::optional<std::string> SessionCookie::extract(const std::string& cookie_header) {
    const std::string prefix = std::string(kName) + "=";
    size_t pos = 0;
    while (pos < cookie_header.size()) {
        size_t end = cookie_header.find(';', pos);
        if (end == std::string::npos) end = cookie_header.size();
        std::string part = cookie_header.substr(pos, end - pos);
        auto first = part.find_first_not_of(' ');
        if (first != std::string::npos) part = part.substr(first);
        if (part.compare(0, prefix.size(), prefix) == 0) {
            std::string value = part.substr(prefix.size());
            if (!value.empty()) return value;
        }
        pos = end + 1;
    }
    return std::nullopt;
}

} // namespace concierge
