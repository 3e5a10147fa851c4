#include "session/Session.hpp"

namespace concierge {

const char* const kGreeting = "How can I help you?";

const char* role_to_string(Role role) {
    switch (role) {
        case Role::Assistant: return "assistant";
        case Role::User: return "user";
    }
    return "assistant";
}

Session::Session(std::string id, IdentityToken identity, AgentPtr agent)
    : id_(std::move(id)), identity_(std::move(identity)), agent_(std::move(agent)) {
    turns_.push_back({Role::Assistant, kGreeting});
}

std::vector<ChatTurn> Session::turns() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return turns_;
}

size_t Session::turn_count() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return turns_.size();
}

void Session::append_turn(Role role, std::string content) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    turns_.push_back({role, std::move(content)});
}

nlohmann::json Session::history_json() const {
    auto messages = nlohmann::json::array();
    for (const auto& turn : turns()) {
        messages.push_back({{"role", role_to_string(turn.role)}, {"content", turn.content}});
    }
    return messages;
}

} // namespace concierge
