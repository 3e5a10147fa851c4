#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace concierge {

// Pool of Gemini API keys plus the model names, read from keys.json:
//   {"keys": ["..."], "primary": "gemini-1.5-flash", "embedding": "text-embedding-004"}
// A key that keeps getting rate limited is taken out of rotation.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string primary_model = "gemini-1.5-flash";
    std::string embedding_model = "text-embedding-004";

public:
    KeyManager() {
        refresh_key_pool();
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);

        std::vector<std::string> search_paths = {
            "keys.json",                // 1. Current Working Directory
            "../keys.json",             // 2. Parent Directory (common in build/Release)
            "build/keys.json",          // 3. Build Directory
            "Release/keys.json",        // 4. Release Directory
            "../../keys.json"           // 5. Project Root (from build/Release)
        };

        std::ifstream f;
        std::string found_path;

        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            spdlog::error("🚨 Key pool (keys.json) not found in any standard path!");
            return;
        }

        try {
            auto j = nlohmann::json::parse(f);

            key_pool.clear();
            for (auto& k : j.at("keys")) {
                key_pool.push_back({k.get<std::string>(), true, 0});
            }

            primary_model = j.value("primary", primary_model);
            embedding_model = j.value("embedding", embedding_model);

            spdlog::info("🔑 Key pool loaded from {}: {} keys, model {}, embeddings {}",
                         found_path, key_pool.size(), primary_model, embedding_model);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}", found_path, e.what());
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    // Empty when no key is configured or every key has been decommissioned.
    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        for (size_t i = 0; i < key_pool.size(); ++i) {
            const auto& candidate = key_pool[(current_index + i) % key_pool.size()];
            if (candidate.is_active) return candidate.key;
        }
        return "";
    }

    std::string get_current_model() const {
        std::shared_lock lock(pool_mutex);
        return primary_model;
    }

    std::string get_embedding_model() const {
        std::shared_lock lock(pool_mutex);
        return embedding_model;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} decommissioned after {} rate limits", current_index, current.fail_count);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace concierge
