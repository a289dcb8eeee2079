#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "diagnostics.hpp"

namespace code_intelligence {

enum class Intent { Suggest, Explain, Refactor, Debug, Optimize };

const char* to_string(Intent intent);
std::optional<Intent> intent_from_string(const std::string& name);

// Preference order: Full -> Reduced -> Mock -> Fallback
enum class StrategyKind { Full, Reduced, Mock, Fallback };

const char* to_string(StrategyKind kind);

enum class StrategyState { Uninitialized, Initializing, Ready, Degraded };

const char* to_string(StrategyState state);

struct CompletionContext {
    std::string file_path;
    std::string language;
    std::string query;
    std::string surrounding_code;
    int cursor_line = 0;
    std::vector<std::string> symbol_excerpts;
    std::vector<std::string> graph_excerpts;
    std::vector<std::string> vector_excerpts;
    std::map<std::string, std::string> extensions; // backend hints

    size_t context_items() const {
        return symbol_excerpts.size() + graph_excerpts.size() + vector_excerpts.size();
    }
    bool has_project_context() const { return context_items() > 0; }

    nlohmann::json to_json() const;
    static CompletionContext from_json(const nlohmann::json& j);
};

struct CompletionResult {
    std::string status = "error"; // "success" | "error"
    std::string response;
    double confidence = 0.0;
    std::string strategy_used;
    bool context_used = false;
    size_t context_items = 0;
    std::vector<std::string> suggestions;
    bool requires_human_review = false;
    double duration_ms = 0.0;
    std::string error;
    std::optional<ErrorKind> error_kind;

    bool ok() const { return status == "success"; }

    static CompletionResult failure(std::string message, std::optional<ErrorKind> kind = std::nullopt);

    nlohmann::json to_json() const;
};

} // namespace code_intelligence
