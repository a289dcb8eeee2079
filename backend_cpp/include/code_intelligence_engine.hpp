#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine_config.hpp"
#include "embedding_service.hpp"
#include "graph/graph_analytics.hpp"
#include "graph/graph_store.hpp"
#include "inference/inference_router.hpp"
#include "KeyManager.hpp"
#include "language_analyzer.hpp"
#include "project_indexer.hpp"
#include "retrieval_engine.hpp"
#include "vector/vector_store.hpp"

namespace code_intelligence {

// Injected components. Anything left empty is built from EngineConfig.
struct EngineDependencies {
    std::shared_ptr<const LanguageAnalyzer> analyzer;
    std::shared_ptr<GraphBackend> graph_backend;
    std::shared_ptr<VectorBackend> vector_backend;
    std::shared_ptr<Embedder> embedder;
    std::shared_ptr<KeyManager> key_manager;
    std::vector<std::shared_ptr<InferenceStrategy>> strategies;
};

struct IndexReport {
    std::string project_id;
    std::string root_path;
    size_t files_indexed = 0;
    size_t symbols = 0;
    size_t dependency_edges = 0;
    size_t stale_files_removed = 0;
    size_t embeddings_stored = 0;
    bool workspace_changed = false;
    bool cancelled = false;
    IngestReport graph;
    std::vector<Diagnostic> diagnostics;
    double duration_ms = 0.0;

    nlohmann::json to_json() const;
};

struct ReindexReport {
    std::string file_path;
    bool removed = false;
    size_t symbols = 0;
    size_t embeddings_stored = 0;
    IngestReport graph;
    std::vector<Diagnostic> diagnostics;

    nlohmann::json to_json() const;
};

struct FileContext {
    bool found = false;
    std::string file_path;
    std::optional<FileAnalysis> analysis;
    std::optional<Symbol> symbol_at_cursor;
    int cursor_line = 0;
    std::string surrounding_code;
    std::vector<TraversalHit> dependencies;
    std::vector<TraversalHit> dependents;
    std::vector<SearchResult> related;

    nlohmann::json to_json() const;
};

class CodeIntelligenceEngine {
public:
    explicit CodeIntelligenceEngine(EngineConfig config = {}, EngineDependencies deps = {});

    // Idempotent. Connects the graph, opens the vector store and picks a strategy.
    bool initialize();
    bool is_initialized() const { return initialized_.load(); }

    IndexReport index_project(const std::string& path, const CancellationToken* cancel = nullptr);
    ReindexReport reindex_file(const std::string& path);

    FileContext get_file_context(const std::string& path, int cursor_line = 0);
    std::vector<SearchResult> search_code(const std::string& query, const SearchFilters& filters = {}, size_t k = 10);

    // Empty project_id selects the indexed project.
    nlohmann::json get_architecture_overview(const std::string& project_id = "");
    std::vector<DependencyCycle> find_circular_dependencies(const std::string& project_id = "");

    CompletionResult generate_completion(CompletionContext context, Intent intent);
    CompletionResult generate_completion(CompletionContext context, const std::string& intent);

    nlohmann::json health();

    // --- components ---
    std::shared_ptr<ProjectIndexer> indexer() const { return indexer_; }
    std::shared_ptr<RelationshipGraphStore> graph_store() const { return graph_store_; }
    std::shared_ptr<GraphAnalytics> analytics() const { return analytics_; }
    std::shared_ptr<VectorSemanticStore> vector_store() const { return vector_store_; }
    std::shared_ptr<InferenceRouter> router() const { return router_; }
    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<const LanguageAnalyzer> analyzer_;
    std::shared_ptr<ProjectIndexer> indexer_;
    std::shared_ptr<RelationshipGraphStore> graph_store_;
    std::shared_ptr<GraphAnalytics> analytics_;
    std::shared_ptr<EmbeddingService> embeddings_;
    std::shared_ptr<VectorSemanticStore> vector_store_;
    std::shared_ptr<InferenceRouter> router_;
    std::shared_ptr<RetrievalEngine> retrieval_;

    std::mutex init_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<size_t> embeddings_stored_{0};

    std::string resolve_project_id(const std::string& project_id) const;
    bool ensure_graph(std::vector<Diagnostic>& diagnostics);
    std::string read_lines(const std::string& rel_path, int first, int last) const;
};

} // namespace code_intelligence
