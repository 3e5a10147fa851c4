#include "chat_pipeline.hpp"
#include "LogManager.hpp"
#include <chrono>
#include <ctime>
#include <optional>
#include <spdlog/spdlog.h>

namespace concierge {

std::string format_reply(const std::string& raw) {
    const auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = raw.find_last_not_of(" \t\r\n");
    return raw.substr(first, last - first + 1);
}

Result<std::string> ChatPipeline::chat(const std::string& session_id, const std::string& prompt) {
    if (prompt.empty()) {
        return make_error(ErrorKind::InvalidInput, "No user query");
    }

    SessionPtr session = session_id.empty() ? nullptr : registry_.find(session_id);
    if (!session) {
        return make_error(ErrorKind::SessionNotFound, "Invoke index handler before start chatting");
    }

    auto turn_lock = session->acquire_turn_lock();
    auto start_time = std::chrono::steady_clock::now();

    session->append_turn(Role::User, prompt);

    std::string raw;
    std::optional<std::string> failure;
    try {
        raw = session->agent()->invoke(prompt);
    } catch (const std::exception& e) {
        failure = e.what();
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();

    if (failure) {
        spdlog::error("❌ Agent invocation failed for session {}: {}", session_id, *failure);
        auto error = make_error(ErrorKind::AgentInvocationError, "Error invoking agent", *failure);
        LogManager::instance().add_log({std::time(nullptr), session_id, prompt, error.describe(),
                                        error_kind_name(error.kind), duration});
        return error;
    }

    session->append_turn(Role::Assistant, raw);
    LogManager::instance().add_log({std::time(nullptr), session_id, prompt, raw, "ok", duration});
    spdlog::info("💬 Session {} turn answered in {:.0f} ms", session_id, duration);

    return format_reply(raw);
}

} // namespace concierge
