#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace concierge {

struct InteractionLog {
    long long timestamp;     // unix seconds
    std::string session_id;
    std::string user_query;
    std::string ai_response; // reply text, or the error description on failure
    std::string outcome;     // "ok" or the ErrorKind name
    double duration_ms;
};

// Recent chat turns for /api/admin/logs. Only the newest kCapacity
// interactions are kept; the counters cover the whole process lifetime.
class LogManager {
public:
    static constexpr size_t kCapacity = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    void add_log(InteractionLog log) {
        std::lock_guard<std::mutex> lock(mtx_);
        ++total_;
        if (log.outcome != "ok") ++failed_;
        window_.push_back(std::move(log));
        while (window_.size() > kCapacity) window_.pop_front();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return window_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        window_.clear();
        total_ = 0;
        failed_ = 0;
    }

    // Newest first.
    nlohmann::json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto entries = nlohmann::json::array();
        for (auto it = window_.rbegin(); it != window_.rend(); ++it) {
            entries.push_back({
                {"timestamp", it->timestamp},
                {"session_id", it->session_id},
                {"user_query", it->user_query},
                {"ai_response", it->ai_response},
                {"outcome", it->outcome},
                {"duration_ms", it->duration_ms}
            });
        }
        return entries;
    }

    nlohmann::json summary_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return {{"total_turns", total_}, {"failed_turns", failed_}, {"retained", window_.size()}};
    }

private:
    LogManager() = default;

    std::deque<InteractionLog> window_;
    size_t total_ = 0;
    size_t failed_ = 0;
    mutable std::mutex mtx_;
};

} // namespace concierge
