#pragma once
#include <string>
#include "service_error.hpp"
#include "session/SessionRegistry.hpp"

namespace concierge {

// Text returned to the browser for an agent reply.
std::string format_reply(const std::string& raw);

// One chat turn: validate, invoke the session's agent once, record the
// exchange on the session. Sessions are never created here.
class ChatPipeline {
public:
    explicit ChatPipeline(SessionRegistry& registry) : registry_(registry) {}

    // InvalidInput for an empty prompt, SessionNotFound for an unknown id,
    // AgentInvocationError when the agent throws. On that last error the
    // user turn stays recorded and no assistant turn is added.
    Result<std::string> chat(const std::string& session_id, const std::string& prompt);

private:
    SessionRegistry& registry_;
};

} // namespace concierge
