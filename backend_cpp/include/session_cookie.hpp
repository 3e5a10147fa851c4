#pragma once
#include <optional>
#include <string>

namespace concierge {

// Session cookie value: "<session id>.<hex HMAC-SHA256(session id, key)>".
class SessionCookie {
public:
    explicit SessionCookie(std::string secret_key);

    std::string sign(const std::string& session_id) const;

    // The session id when the signature checks out, nullopt otherwise.
    std::optional<std::string> verify(const std::string& cookie_value) const;

    // Pulls "session=..." out of a Cookie header.
    static std::optional<std::string> extract(const std::string& cookie_header);

    static constexpr const char* kName = "session";

private:
    std::string secret_key_;

    std::string mac_hex(const std::string& data) const;
};

} // namespace concierge
