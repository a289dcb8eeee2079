#include "inference/inference_types.hpp"
#include <algorithm>
#include <cctype>

namespace code_intelligence {

using json = nlohmann::json;

const char* to_string(Intent intent) {
    switch (intent) {
        case Intent::Suggest: return "suggest";
        case Intent::Explain: return "explain";
        case Intent::Refactor: return "refactor";
        case Intent::Debug: return "debug";
        case Intent::Optimize: return "optimize";
    }
    return "suggest";
}

std::optional<Intent> intent_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "suggest") return Intent::Suggest;
    if (lower == "explain") return Intent::Explain;
    if (lower == "refactor") return Intent::Refactor;
    if (lower == "debug") return Intent::Debug;
    if (lower == "optimize") return Intent::Optimize;
    return std::nullopt;
}

const char* to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Full: return "full";
        case StrategyKind::Reduced: return "reduced";
        case StrategyKind::Mock: return "mock";
        case StrategyKind::Fallback: return "fallback";
    }
    return "fallback";
}

const char* to_string(StrategyState state) {
    switch (state) {
        case StrategyState::Uninitialized: return "uninitialized";
        case StrategyState::Initializing: return "initializing";
        case StrategyState::Ready: return "ready";
        case StrategyState::Degraded: return "degraded";
    }
    return "uninitialized";
}

json CompletionContext::to_json() const {
    return {
        {"file_path", file_path},
        {"language", language},
        {"query", query},
        {"surrounding_code", surrounding_code},
        {"cursor_line", cursor_line},
        {"symbol_excerpts", symbol_excerpts},
        {"graph_excerpts", graph_excerpts},
        {"vector_excerpts", vector_excerpts},
        {"extensions", extensions}
    };
}

CompletionContext CompletionContext::from_json(const json& j) {
    CompletionContext c;
    c.file_path = j.value("file_path", "");
    c.language = j.value("language", "");
    c.query = j.value("query", "");
    c.surrounding_code = j.value("surrounding_code", "");
    c.cursor_line = j.value("cursor_line", 0);
    c.symbol_excerpts = j.value("symbol_excerpts", std::vector<std::string>{});
    c.graph_excerpts = j.value("graph_excerpts", std::vector<std::string>{});
    c.vector_excerpts = j.value("vector_excerpts", std::vector<std::string>{});
    if (j.contains("extensions") && j["extensions"].is_object()) {
        for (auto& [key, value] : j["extensions"].items()) {
            c.extensions[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return c;
}

CompletionResult CompletionResult::failure(std::string message, std::optional<ErrorKind> kind) {
    CompletionResult r;
    r.status = "error";
    r.error = std::move(message);
    r.error_kind = kind;
    return r;
}

json CompletionResult::to_json() const {
    json j = {
        {"status", status},
        {"response", response},
        {"confidence", confidence},
        {"strategy_used", strategy_used},
        {"context_used", context_used},
        {"context_items", context_items},
        {"suggestions", suggestions},
        {"requires_human_review", requires_human_review},
        {"duration_ms", duration_ms}
    };
    if (!error.empty()) j["error"] = error;
    if (error_kind) j["error_kind"] = to_string(*error_kind);
    return j;
}

} // namespace code_intelligence
