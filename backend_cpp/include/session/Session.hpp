#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agent/AgentTypes.hpp"

namespace concierge {

enum class Role {
    Assistant,
    User,
};

const char* role_to_string(Role role);

struct ChatTurn {
    Role role;
    std::string content;
};

// Every session's history opens with this assistant turn.
extern const char* const kGreeting;

// One browser client's conversation: the agent built for it and the turns
// exchanged so far. Turns are only ever appended.
class Session {
public:
    Session(std::string id, IdentityToken identity, AgentPtr agent);

    const std::string& id() const { return id_; }
    const IdentityToken& identity() const { return identity_; }
    bool is_authenticated() const { return identity_.has_value(); }
    const AgentPtr& agent() const { return agent_; }

    std::vector<ChatTurn> turns() const;
    size_t turn_count() const;
    void append_turn(Role role, std::string content);

    nlohmann::json history_json() const;

    // Held for a whole chat turn so concurrent requests on one session run
    // one after another. Reading turns() does not wait on it.
    std::unique_lock<std::mutex> acquire_turn_lock() { return std::unique_lock<std::mutex>(turn_mutex_); }

private:
    const std::string id_;
    const IdentityToken identity_;
    const AgentPtr agent_;

    mutable std::mutex history_mutex_;
    std::vector<ChatTurn> turns_;

    std::mutex turn_mutex_;
};

using SessionPtr = std::shared_ptr<Session>;

} // namespace concierge
