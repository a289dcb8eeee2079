#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace code_intelligence {

struct InteractionLog {
    long long timestamp = 0;
    std::string project_id;
    std::string intent;
    std::string file_path;
    std::string user_query;
    std::string full_prompt; // The raw prompt sent to the strategy
    std::string ai_response;
    std::string strategy;
    std::string status;
    int token_count_est = 0; // Rough estimate
    double duration_ms = 0.0;
};

class LogManager {
public:
    static constexpr size_t kMaxEntries = 50;

    // Singleton access
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) { // Keep last 50 only
            logs_.pop_front();
        }
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

    nlohmann::json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        // Return in reverse order (newest first)
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"project_id", it->project_id},
                {"intent", it->intent},
                {"file_path", it->file_path},
                {"user_query", it->user_query},
                {"full_prompt", it->full_prompt},
                {"ai_response", it->ai_response},
                {"strategy", it->strategy},
                {"status", it->status},
                {"token_count_est", it->token_count_est},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    LogManager() {} // Private constructor
    std::deque<InteractionLog> logs_;
    std::mutex mtx_;
};

}
