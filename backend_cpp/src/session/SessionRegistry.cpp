#include "session/SessionRegistry.hpp"
#include <cstdio>
#include <random>
#include <vector>
#include <spdlog/spdlog.h>

namespace concierge {

namespace {

uint64_t rand64() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    return rng();
}

void release_agent(const SessionPtr& session) {
    session->agent()->close();
    spdlog::info("🧹 Released agent for session {}", session->id());
}

} // namespace

std::string new_session_id() {
    uint64_t hi = rand64();
    uint64_t lo = rand64();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

SessionRegistry::SessionRegistry(std::shared_ptr<IAgentFactory> factory, size_t close_workers)
    : factory_(std::move(factory)), close_pool_(close_workers) {
    if (!factory_) throw std::invalid_argument("SessionRegistry requires an agent factory");
}

SessionRegistry::~SessionRegistry() {
    dispose_all(std::chrono::milliseconds(0));
    // Queued closes are dropped; each agent's destructor still releases its client.
    close_pool_.shutdown(false);
}

Result<SessionPtr> SessionRegistry::build_session(const std::string& session_id, const IdentityToken& identity) {
    try {
        auto agent = factory_->create(identity);
        if (!agent) return agent.error();
        return std::make_shared<Session>(session_id, identity, agent.value());
    } catch (const std::exception& e) {
        return make_error(ErrorKind::ConfigurationError, "agent construction failed", e.what());
    }
}

Result<SessionPtr> SessionRegistry::resolve_or_create(const std::string& session_id, const IdentityToken& identity) {
    if (session_id.empty()) {
        return make_error(ErrorKind::InvalidInput, "session id must not be empty");
    }

    std::promise<Result<SessionPtr>> promise;
    uint64_t generation = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            PendingSession existing = it->second.session;
            lock.unlock();
            return existing.get();
        }
        generation = ++next_generation_;
        sessions_.emplace(session_id, Slot{generation, promise.get_future().share()});
    }

    auto forget_slot = [&]() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second.generation == generation) sessions_.erase(it);
    };

    Result<SessionPtr> outcome = make_error(ErrorKind::ConfigurationError, "agent construction did not run");
    try {
        outcome = build_session(session_id, identity);
    } catch (...) {
        // Waiters must not block forever on a construction that died.
        forget_slot();
        promise.set_exception(std::current_exception());
        throw;
    }

    if (!outcome) {
        forget_slot();
        spdlog::warn("⚠️ Session {} not created: {}", session_id, outcome.error().describe());
        promise.set_value(outcome);
        return outcome;
    }

    // Publish first, then mark the slot built. A dispose that lands in
    // between finds built == false and leaves the release to us.
    promise.set_value(outcome);
    bool orphaned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second.generation == generation) {
            it->second.built = true;
        } else {
            orphaned = true;
        }
    }

    if (orphaned) {
        spdlog::info("🗑️ Session {} was disposed during construction; releasing its agent", session_id);
        release_async(outcome.value());
    } else {
        spdlog::info("🆕 Session {} created ({})", session_id,
                     identity ? "authenticated" : "anonymous");
    }
    return outcome;
}

Result<SessionPtr> SessionRegistry::replace(const std::optional<std::string>& previous,
                                            const std::string& session_id, const IdentityToken& identity) {
    auto session = resolve_or_create(session_id, identity);
    if (!session || !previous || *previous == session_id) return session;

    auto disposed = dispose(*previous);
    if (!disposed) {
        spdlog::debug("Replaced session {} was already gone: {}", *previous, disposed.error().describe());
    }
    return session;
}

SessionPtr SessionRegistry::find(const std::string& session_id) const {
    PendingSession pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return nullptr;
        pending = it->second.session;
    }
    const auto& outcome = pending.get();
    return outcome ? outcome.value() : nullptr;
}

std::future<void> SessionRegistry::release_async(SessionPtr session) {
    auto task = [session]() {
        try {
            release_agent(session);
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Could not release agent for session {}: {}", session->id(), e.what());
        }
    };

    try {
        return close_pool_.enqueue(task);
    } catch (const std::exception& e) {
        // Pool already stopped: release on the caller's thread instead.
        spdlog::debug("Close pool unavailable ({}), releasing inline", e.what());
        task();
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
}

Result<void> SessionRegistry::dispose(const std::string& session_id) {
    Slot slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return make_error(ErrorKind::SessionNotFound, "no session with id " + session_id);
        }
        slot = it->second;
        sessions_.erase(it);
    }

    // Not awaited: reset returns while the client is still being released.
    // An unfinished build is released by its builder instead.
    if (slot.built) release_async(slot.session.get().value());
    spdlog::info("🗑️ Session {} disposed", session_id);
    return {};
}

void SessionRegistry::dispose_all(std::chrono::milliseconds grace) {
    std::unordered_map<std::string, Slot> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(sessions_);
    }
    if (drained.empty()) return;

    std::vector<std::future<void>> closing;
    closing.reserve(drained.size());
    size_t building = 0;
    for (auto& entry : drained) {
        if (entry.second.built) {
            closing.push_back(release_async(entry.second.session.get().value()));
        } else {
            ++building;
        }
    }
    spdlog::info("🧹 Releasing {} agent(s) on shutdown, {} still under construction",
                 closing.size(), building);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    size_t stragglers = 0;
    for (auto& f : closing) {
        if (f.wait_until(deadline) != std::future_status::ready) ++stragglers;
    }
    if (stragglers > 0) {
        spdlog::warn("⚠️ {} agent(s) still closing after {} ms; not waiting any longer",
                     stragglers, grace.count());
    }
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace concierge
