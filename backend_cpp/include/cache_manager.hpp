#pragma once

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace concierge {

// Bounded map with per-entry expiry. Reads refresh recency, not expiry.
template<typename Key, typename Value>
class LRUCache {
public:
    LRUCache(size_t capacity, std::chrono::seconds ttl)
        : capacity_(capacity == 0 ? 1 : capacity), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = index_.find(key);
        if (found == index_.end()) {
            ++misses_;
            return std::nullopt;
        }

        auto node = found->second;
        if (std::chrono::steady_clock::now() >= node->expires_at) {
            entries_.erase(node);
            index_.erase(found);
            ++misses_;
            return std::nullopt;
        }

        entries_.splice(entries_.begin(), entries_, node);
        ++hits_;
        return node->value;
    }

    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto expires_at = std::chrono::steady_clock::now() + ttl_;

        auto found = index_.find(key);
        if (found != index_.end()) {
            found->second->value = std::move(value);
            found->second->expires_at = expires_at;
            entries_.splice(entries_.begin(), entries_, found->second);
            return;
        }

        while (index_.size() >= capacity_) {
            index_.erase(entries_.back().key);
            entries_.pop_back();
        }
        entries_.push_front(Entry{key, std::move(value), expires_at});
        index_.emplace(key, entries_.begin());
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    // (hits, misses) since construction.
    std::pair<size_t, size_t> stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {hits_, misses_};
    }

private:
    struct Entry {
        Key key;
        Value value;
        std::chrono::steady_clock::time_point expires_at;
    };

    size_t capacity_;
    std::chrono::seconds ttl_;
    std::list<Entry> entries_; // most recently used first
    std::unordered_map<Key, typename std::list<Entry>::iterator> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

// Query embeddings, keyed by model and text so a model switch in keys.json
// never serves vectors from the old embedding space.
class CacheManager {
public:
    explicit CacheManager(size_t max_embeddings = 1000,
                          std::chrono::seconds ttl = std::chrono::seconds(3600))
        : embeddings_(max_embeddings, ttl) {}

    std::optional<std::vector<float>> get_embedding(const std::string& model, const std::string& text) {
        return embeddings_.get(cache_key(model, text));
    }

    void set_embedding(const std::string& model, const std::string& text, std::vector<float> embedding) {
        embeddings_.put(cache_key(model, text), std::move(embedding));
    }

    size_t embedding_count() const { return embeddings_.size(); }
    std::pair<size_t, size_t> embedding_stats() const { return embeddings_.stats(); }

private:
    LRUCache<std::string, std::vector<float>> embeddings_;

    static std::string cache_key(const std::string& model, const std::string& text) {
        return model + '\n' + text;
    }
};

} // namespace concierge
