#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_intelligence {

struct IndexerConfig {
    std::vector<std::string> allowed_extensions = {
        ".py", ".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx", ".c", ".cc", ".cpp", ".cxx",
        ".h", ".hh", ".hpp", ".go", ".rs", ".swift"};
    // fnmatch patterns tested against every path segment
    std::vector<std::string> exclude_patterns = {
        ".git", ".svn", ".hg", "node_modules", "__pycache__", ".venv", "venv", "env",
        ".build", "build", "dist", "target", ".codeintel", "*.pyc", "*.min.js",
        "*.bundle.js", "*.map"};
    std::vector<std::string> test_patterns = {
        "test_*.py", "*_test.*", "*.test.*", "*.spec.*", "tests", "__tests__"};
    bool exclude_tests = true;
    // Project-relative rules; included paths override ignored ones.
    std::vector<std::string> ignored_paths;
    std::vector<std::string> included_paths;
    size_t max_file_bytes = 2 * 1024 * 1024;
    size_t batch_size = 32;

    void merge_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct GraphConfig {
    std::string backend = "memory"; // "memory" | "neo4j"
    std::string uri = "bolt://localhost:7687";
    std::string user = "neo4j";
    std::string password;
    std::string database = "neo4j";
    int timeout_ms = 5000;
    int connect_backoff_ms = 500;

    void merge_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct VectorConfig {
    std::string backend = "faiss"; // "faiss" | "chroma"
    std::string host = "localhost";
    int port = 8000;
    std::string collection = "code_embeddings";
    int timeout_ms = 5000;
    std::string storage_path; // persisted FAISS index directory, empty = memory only

    void merge_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct EmbeddingConfig {
    bool use_model = true;
    std::string model = "text-embedding-004";
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    int dimension = 768;
    size_t max_input_chars = 8000;
    size_t file_embedding_chars = 1000;
    int timeout_ms = 10000;

    void merge_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct InferenceConfig {
    std::vector<std::string> preference = {"remote", "local", "mock", "fallback"};
    std::string remote_base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    std::string local_url; // llama.cpp-style server, e.g. http://127.0.0.1:8080
    int timeout_ms = 30000;
    int max_output_tokens = 512;
    double temperature = 0.2;
    size_t context_char_budget = 6000;
    bool enable_remote = true;
    bool enable_local = true;
    bool enable_mock = true;

    void merge_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct AnalyticsConfig {
    size_t high_severity_min_length = 3;
    double hotspot_percentile = 0.8;
    double coupling_factor = 1.5;
    size_t top_n = 10;
    size_t max_cycle_length = 10;
    size_t max_cycles = 50;
    int default_depth = 3;
    size_t max_traversal_results = 50;
    std::vector<std::string> traversal_types = {"DEPENDS_ON", "IMPORTS", "CALLS"};

    void merge_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct EngineConfig {
    IndexerConfig indexer;
    GraphConfig graph;
    VectorConfig vector;
    EmbeddingConfig embedding;
    InferenceConfig inference;
    AnalyticsConfig analytics;
    std::string log_level = "info";
    std::string keys_path; // empty = KeyManager search paths

    static EngineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // explicit path, then codeintel.json search paths; env overrides last
    static EngineConfig load(const std::string& explicit_path = "");
    void apply_environment();
};

// <root>/.codeintel/config.json, falling back to defaults
IndexerConfig load_project_indexer_config(const std::string& root_path, const IndexerConfig& base);

} // namespace code_intelligence
