#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "diagnostics.hpp"

namespace code_intelligence {

// Labels: Project, File, Function, Method, Class, Struct, Constant, Variable, Import
struct GraphNode {
    std::string id;
    std::string label;
    std::string name;
    std::string project_id;
    std::string file_path;
    nlohmann::json properties = nlohmann::json::object();

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

// Types: CONTAINS, IMPORTS, DEPENDS_ON, INHERITS_FROM, CALLS
struct GraphRelationship {
    std::string from_id;
    std::string to_id;
    std::string type;
    double weight = 1.0;
    nlohmann::json properties = nlohmann::json::object();

    // (from, type, to) is the upsert key
    std::string key() const { return from_id + "|" + type + "|" + to_id; }

    nlohmann::json to_json() const;
    static GraphRelationship from_json(const nlohmann::json& j);
};

enum class WriteOutcome { Ok, MissingEndpoint, Failed };

struct GraphWriteResult {
    bool ok = false;
    std::optional<Diagnostic> diagnostic;

    explicit operator bool() const { return ok; }
};

struct ClearResult {
    size_t relationships_removed = 0;
    size_t nodes_removed = 0;

    nlohmann::json to_json() const {
        return {{"relationships_removed", relationships_removed}, {"nodes_removed", nodes_removed}};
    }
};

struct GraphHealth {
    bool connected = false;
    size_t node_count = 0;
    size_t relationship_count = 0;
    double query_time_ms = 0.0;
    std::string backend;
    std::string error;

    nlohmann::json to_json() const;
};

struct IngestReport {
    size_t nodes_written = 0;
    size_t relationships_written = 0;
    size_t nodes_removed = 0;
    std::vector<Diagnostic> diagnostics;

    nlohmann::json to_json() const;
};

} // namespace code_intelligence
