#pragma once
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "ThreadPool.hpp"
#include "agent/AgentFactory.hpp"
#include "service_error.hpp"
#include "session/Session.hpp"

namespace concierge {

// Random RFC 4122 version 4 identifier.
std::string new_session_id();

// Process-wide map of session id -> Session, shared by every request
// handler through an explicitly passed reference.
//
// Concurrency contract:
//  - all operations are thread-safe; the map lock is never held while an
//    agent is constructed, invoked or closed.
//  - concurrent resolve_or_create() calls for one id build exactly one agent;
//    late callers wait for the in-flight construction and share its outcome.
//  - a failed construction leaves no entry behind.
//  - agents are closed on an internal worker pool that grows so every close
//    starts at once; dispose() never waits.
//  - a session disposed while still being built is closed by its builder as
//    soon as construction finishes.
class SessionRegistry {
public:
    explicit SessionRegistry(std::shared_ptr<IAgentFactory> factory, size_t close_workers = 2);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    Result<SessionPtr> resolve_or_create(const std::string& session_id, const IdentityToken& identity);

    // Builds `session_id`, then disposes `previous` (the session it takes
    // over, e.g. the anonymous one a browser held before logging in). A
    // failed build leaves `previous` untouched.
    Result<SessionPtr> replace(const std::optional<std::string>& previous,
                               const std::string& session_id, const IdentityToken& identity);

    // nullptr when the id is unknown or its construction failed. Waits if the
    // session is still being built.
    SessionPtr find(const std::string& session_id) const;

    // SessionNotFound for an unknown id.
    Result<void> dispose(const std::string& session_id);

    // Shutdown path: starts closing every agent at once and waits at most
    // `grace` for them. Agents still closing afterwards are abandoned, so a
    // forced exit can leak their remote resources.
    void dispose_all(std::chrono::milliseconds grace);

    size_t size() const;

private:
    using PendingSession = std::shared_future<Result<SessionPtr>>;

    struct Slot {
        uint64_t generation;
        PendingSession session;
        bool built = false; // construction finished successfully
    };

    std::shared_ptr<IAgentFactory> factory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> sessions_;
    uint64_t next_generation_ = 0;
    ThreadPool close_pool_;

    Result<SessionPtr> build_session(const std::string& session_id, const IdentityToken& identity);
    std::future<void> release_async(SessionPtr session);
};

} // namespace concierge
