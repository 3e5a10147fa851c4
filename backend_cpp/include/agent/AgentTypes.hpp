#pragma once
#include <memory>
#include <optional>
#include <string>

namespace concierge {

// Verified identity-provider token; std::nullopt means an anonymous session.
using IdentityToken = std::optional<std::string>;

// Natural-language in, natural-language out. One call is one turn; the
// conversation history lives on the Session, not here.
class IAgent {
public:
    virtual ~IAgent() = default;

    // Throws on any model or tool failure.
    virtual std::string invoke(const std::string& input) = 0;

    // Releases the network client the agent holds. Idempotent.
    virtual void close() = 0;
};

using AgentPtr = std::shared_ptr<IAgent>;

} // namespace concierge
