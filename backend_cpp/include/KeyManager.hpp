#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_intelligence {

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
    std::string secondary_model;
    std::string keys_path;

public:
    // Empty path = standard search paths.
    explicit KeyManager(std::string explicit_path = "") : keys_path(std::move(explicit_path)) {
        refresh_key_pool();
    }

    void refresh_key_pool() {
        std::unique_lock lock(pool_mutex);

        std::vector<std::string> search_paths = {
            "keys.json",                // 1. Current Working Directory
            "../keys.json",             // 2. Parent Directory (common in build/Release)
            "build/keys.json",          // 3. Build Directory
            "../../keys.json"           // 4. Project Root (from build/Release)
        };
        if (!keys_path.empty()) search_paths.insert(search_paths.begin(), keys_path);

        std::ifstream f;
        std::string found_path = "";

        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            spdlog::warn("🔑 No keys.json found; remote model backends stay offline.");
            return;
        }

        try {
            auto j = nlohmann::json::parse(f);

            key_pool.clear();
            for (auto& k : j.value("keys", nlohmann::json::array())) {
                key_pool.push_back({k.get<std::string>(), true, 0});
            }
            current_index = 0;

            primary_model = j.value("primary", "gemini-1.5-flash");
            secondary_model = j.value("secondary", "");

            spdlog::info("🛰️ Key pool synchronized from {}: {} keys, model {}",
                         found_path, key_pool.size(), primary_model);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse key pool {}: {}", found_path, e.what());
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

    bool has_keys() const { return get_active_key_count() > 0; }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        // Skip decommissioned keys.
        for (size_t step = 0; step < key_pool.size(); ++step) {
            const auto& k = key_pool[(current_index + step) % key_pool.size()];
            if (k.is_active) return k.key;
        }
        return "";
    }

    // Falls back to the secondary model once half the pool is decommissioned.
    std::string get_current_model() const {
        std::shared_lock lock(pool_mutex);
        size_t active = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) active++;
        }
        if (!secondary_model.empty() && active * 2 < key_pool.size()) return secondary_model;
        return primary_model;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} Decommissioned", current_index);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace code_intelligence
