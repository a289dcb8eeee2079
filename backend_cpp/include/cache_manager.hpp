#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "text_utils.hpp"

namespace code_intelligence {

// Bounded LRU map with a per-entry time to live.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t capacity, std::chrono::seconds ttl = std::chrono::seconds(300))
        : capacity_(capacity > 0 ? capacity : 1), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;

        if (std::chrono::steady_clock::now() > it->second->expires) {
            order_.erase(it->second);
            index_.erase(it);
            return std::nullopt;
        }
        order_.splice(order_.begin(), order_, it->second);
        return it->second->value;
    }

    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto expires = std::chrono::steady_clock::now() + ttl_;

        if (auto it = index_.find(key); it != index_.end()) {
            it->second->value = std::move(value);
            it->second->expires = expires;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        if (index_.size() >= capacity_) {
            index_.erase(order_.back().key);
            order_.pop_back();
        }
        order_.push_front(Entry{key, std::move(value), expires});
        index_[key] = order_.begin();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

private:
    struct Entry {
        Key key;
        Value value;
        std::chrono::steady_clock::time_point expires;
    };

    size_t capacity_;
    std::chrono::seconds ttl_;
    std::list<Entry> order_; // most recent first
    std::unordered_map<Key, typename std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
};

// Model vectors keyed by (model, FNV-1a of the preprocessed text).
class CacheManager {
public:
    explicit CacheManager(size_t max_entries = 1000, std::chrono::seconds ttl = std::chrono::seconds(3600))
        : embeddings_(max_entries, ttl) {}

    std::optional<std::vector<float>> get_embedding(const std::string& model, const std::string& text) {
        auto hit = embeddings_.get(key_for(model, text));
        (hit ? hits_ : misses_).fetch_add(1);
        return hit;
    }

    void set_embedding(const std::string& model, const std::string& text, std::vector<float> embedding) {
        embeddings_.set(key_for(model, text), std::move(embedding));
    }

    size_t size() const { return embeddings_.size(); }
    long long hits() const { return hits_.load(); }
    long long misses() const { return misses_.load(); }

    void clear_all() {
        embeddings_.clear();
    }

private:
    LRUCache<std::string, std::vector<float>> embeddings_;
    std::atomic<long long> hits_{0};
    std::atomic<long long> misses_{0};

    static std::string key_for(const std::string& model, const std::string& text) {
        return model + ':' + std::to_string(text.size()) + ':' + std::to_string(fnv1a_64(text));
    }
};

} // namespace code_intelligence
