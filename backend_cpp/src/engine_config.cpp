#include "engine_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_intelligence {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_into(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) target = j[key].get<T>();
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

} // namespace

void IndexerConfig::merge_json(const json& j) {
    read_into(j, "allowed_extensions", allowed_extensions);
    read_into(j, "exclude_patterns", exclude_patterns);
    read_into(j, "test_patterns", test_patterns);
    read_into(j, "exclude_tests", exclude_tests);
    read_into(j, "ignored_paths", ignored_paths);
    read_into(j, "included_paths", included_paths);
    read_into(j, "max_file_bytes", max_file_bytes);
    read_into(j, "batch_size", batch_size);
    if (batch_size == 0) batch_size = 1;
}

json IndexerConfig::to_json() const {
    return {
        {"allowed_extensions", allowed_extensions},
        {"exclude_patterns", exclude_patterns},
        {"test_patterns", test_patterns},
        {"exclude_tests", exclude_tests},
        {"ignored_paths", ignored_paths},
        {"included_paths", included_paths},
        {"max_file_bytes", max_file_bytes},
        {"batch_size", batch_size}
    };
}

void GraphConfig::merge_json(const json& j) {
    read_into(j, "backend", backend);
    read_into(j, "uri", uri);
    read_into(j, "user", user);
    read_into(j, "password", password);
    read_into(j, "database", database);
    read_into(j, "timeout_ms", timeout_ms);
    read_into(j, "connect_backoff_ms", connect_backoff_ms);
}

json GraphConfig::to_json() const {
    // password is never serialized
    return {
        {"backend", backend},
        {"uri", uri},
        {"user", user},
        {"database", database},
        {"timeout_ms", timeout_ms},
        {"connect_backoff_ms", connect_backoff_ms}
    };
}

void VectorConfig::merge_json(const json& j) {
    read_into(j, "backend", backend);
    read_into(j, "host", host);
    read_into(j, "port", port);
    read_into(j, "collection", collection);
    read_into(j, "timeout_ms", timeout_ms);
    read_into(j, "storage_path", storage_path);
}

json VectorConfig::to_json() const {
    return {
        {"backend", backend},
        {"host", host},
        {"port", port},
        {"collection", collection},
        {"timeout_ms", timeout_ms},
        {"storage_path", storage_path}
    };
}

void EmbeddingConfig::merge_json(const json& j) {
    read_into(j, "use_model", use_model);
    read_into(j, "model", model);
    read_into(j, "base_url", base_url);
    read_into(j, "dimension", dimension);
    read_into(j, "max_input_chars", max_input_chars);
    read_into(j, "file_embedding_chars", file_embedding_chars);
    read_into(j, "timeout_ms", timeout_ms);
}

json EmbeddingConfig::to_json() const {
    return {
        {"use_model", use_model},
        {"model", model},
        {"base_url", base_url},
        {"dimension", dimension},
        {"max_input_chars", max_input_chars},
        {"file_embedding_chars", file_embedding_chars},
        {"timeout_ms", timeout_ms}
    };
}

void InferenceConfig::merge_json(const json& j) {
    read_into(j, "preference", preference);
    read_into(j, "remote_base_url", remote_base_url);
    read_into(j, "local_url", local_url);
    read_into(j, "timeout_ms", timeout_ms);
    read_into(j, "max_output_tokens", max_output_tokens);
    read_into(j, "temperature", temperature);
    read_into(j, "context_char_budget", context_char_budget);
    read_into(j, "enable_remote", enable_remote);
    read_into(j, "enable_local", enable_local);
    read_into(j, "enable_mock", enable_mock);
}

json InferenceConfig::to_json() const {
    return {
        {"preference", preference},
        {"remote_base_url", remote_base_url},
        {"local_url", local_url},
        {"timeout_ms", timeout_ms},
        {"max_output_tokens", max_output_tokens},
        {"temperature", temperature},
        {"context_char_budget", context_char_budget},
        {"enable_remote", enable_remote},
        {"enable_local", enable_local},
        {"enable_mock", enable_mock}
    };
}

void AnalyticsConfig::merge_json(const json& j) {
    read_into(j, "high_severity_min_length", high_severity_min_length);
    read_into(j, "hotspot_percentile", hotspot_percentile);
    read_into(j, "coupling_factor", coupling_factor);
    read_into(j, "top_n", top_n);
    read_into(j, "max_cycle_length", max_cycle_length);
    read_into(j, "max_cycles", max_cycles);
    read_into(j, "default_depth", default_depth);
    read_into(j, "max_traversal_results", max_traversal_results);
    read_into(j, "traversal_types", traversal_types);
}

json AnalyticsConfig::to_json() const {
    return {
        {"high_severity_min_length", high_severity_min_length},
        {"hotspot_percentile", hotspot_percentile},
        {"coupling_factor", coupling_factor},
        {"top_n", top_n},
        {"max_cycle_length", max_cycle_length},
        {"max_cycles", max_cycles},
        {"default_depth", default_depth},
        {"max_traversal_results", max_traversal_results},
        {"traversal_types", traversal_types}
    };
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;
    if (j.contains("indexer")) cfg.indexer.merge_json(j["indexer"]);
    if (j.contains("graph")) cfg.graph.merge_json(j["graph"]);
    if (j.contains("vector")) cfg.vector.merge_json(j["vector"]);
    if (j.contains("embedding")) cfg.embedding.merge_json(j["embedding"]);
    if (j.contains("inference")) cfg.inference.merge_json(j["inference"]);
    if (j.contains("analytics")) cfg.analytics.merge_json(j["analytics"]);
    cfg.log_level = j.value("log_level", cfg.log_level);
    cfg.keys_path = j.value("keys_path", cfg.keys_path);
    return cfg;
}

json EngineConfig::to_json() const {
    return {
        {"indexer", indexer.to_json()},
        {"graph", graph.to_json()},
        {"vector", vector.to_json()},
        {"embedding", embedding.to_json()},
        {"inference", inference.to_json()},
        {"analytics", analytics.to_json()},
        {"log_level", log_level},
        {"keys_path", keys_path}
    };
}

EngineConfig EngineConfig::load(const std::string& explicit_path) {
    std::vector<std::string> search_paths = {
        "codeintel.json",
        "../codeintel.json",
        "config/codeintel.json"
    };
    if (!explicit_path.empty()) search_paths.insert(search_paths.begin(), explicit_path);

    EngineConfig cfg;
    for (const auto& path : search_paths) {
        std::ifstream f(path);
        if (!f.is_open()) continue;
        try {
            cfg = from_json(json::parse(f));
            spdlog::info("⚙️  Engine config loaded from {}", path);
        } catch (const json::exception& e) {
            spdlog::error("❌ Config corrupted at {}: {}", path, e.what());
        }
        break;
    }
    cfg.apply_environment();
    return cfg;
}

void EngineConfig::apply_environment() {
    if (const char* uri = std::getenv("NEO4J_URI"); uri && *uri) {
        graph.uri = uri;
        graph.backend = "neo4j";
    }
    graph.user = env_or("NEO4J_USER", graph.user);
    graph.password = env_or("NEO4J_PASSWORD", graph.password);

    if (const char* host = std::getenv("CHROMA_HOST"); host && *host) {
        vector.host = host;
        vector.backend = "chroma";
    }
    std::string port = env_or("CHROMA_PORT", "");
    if (!port.empty()) {
        try {
            vector.port = std::stoi(port);
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring non-numeric CHROMA_PORT '{}'", port);
        }
    }

    inference.local_url = env_or("CODEINTEL_LOCAL_MODEL_URL", inference.local_url);
    log_level = env_or("CODEINTEL_LOG_LEVEL", log_level);
}

IndexerConfig load_project_indexer_config(const std::string& root_path, const IndexerConfig& base) {
    IndexerConfig cfg = base;
    fs::path config_path = fs::path(root_path) / ".codeintel" / "config.json";
    std::error_code ec;
    if (!fs::exists(config_path, ec)) return cfg;

    try {
        std::ifstream f(config_path);
        auto j = json::parse(f);
        cfg.merge_json(j);
        spdlog::info("⚙️  Project rules synced: {} ignores, {} exceptions.",
                     cfg.ignored_paths.size(), cfg.included_paths.size());
    } catch (const json::exception& e) {
        spdlog::error("❌ Project config corrupted at {}: {}", config_path.string(), e.what());
    }
    return cfg;
}

} // namespace code_intelligence
