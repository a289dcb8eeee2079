#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_intelligence {

enum class ErrorKind {
    ParseDegraded,
    FileUnreadable,
    BackendUnavailable,
    StrategyExhausted,
    GraphIntegrityViolation
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseDegraded: return "ParseDegraded";
        case ErrorKind::FileUnreadable: return "FileUnreadable";
        case ErrorKind::BackendUnavailable: return "BackendUnavailable";
        case ErrorKind::StrategyExhausted: return "StrategyExhausted";
        case ErrorKind::GraphIntegrityViolation: return "GraphIntegrityViolation";
    }
    return "Unknown";
}

// A component-local failure that was absorbed. Returned next to partial results.
struct Diagnostic {
    ErrorKind kind;
    std::string message;
    std::string subject; // file path, node id or strategy name

    nlohmann::json to_json() const {
        return {{"kind", to_string(kind)}, {"message", message}, {"subject", subject}};
    }
};

inline nlohmann::json diagnostics_to_json(const std::vector<Diagnostic>& list) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : list) arr.push_back(d.to_json());
    return arr;
}

} // namespace code_intelligence
