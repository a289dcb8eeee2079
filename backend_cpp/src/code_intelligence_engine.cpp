#include "code_intelligence_engine.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <spdlog/spdlog.h>
#include "graph/memory_graph_backend.hpp"
#include "graph/neo4j_graph_backend.hpp"
#include "SystemMonitor.hpp"
#include "text_utils.hpp"
#include "vector/chroma_vector_backend.hpp"

namespace code_intelligence {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
constexpr int kContextRadius = 10;      // lines on each side of the cursor
constexpr int kHeadLines = 40;          // shown when no cursor is given
constexpr size_t kRelatedResults = 5;
constexpr size_t kSymbolExcerpts = 8;
constexpr size_t kRetrievalNodes = 8;

json hits_to_json(const std::vector<TraversalHit>& hits) {
    json arr = json::array();
    for (const auto& h : hits) arr.push_back(h.to_json());
    return arr;
}

// Innermost non-import symbol spanning `line`.
std::optional<Symbol> symbol_at(const FileAnalysis& analysis, int line) {
    const Symbol* best = nullptr;
    for (const auto& sym : analysis.symbols) {
        if (sym.kind == SymbolKind::Import) continue;
        int end = std::max(sym.line_start, sym.line_end);
        if (line < sym.line_start || line > end) continue;
        if (!best || (end - sym.line_start) < (std::max(best->line_start, best->line_end) - best->line_start)) {
            best = &sym;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

} // namespace

// --- REPORTS ---

json IndexReport::to_json() const {
    return {
        {"project_id", project_id},
        {"root_path", root_path},
        {"files_indexed", files_indexed},
        {"symbols", symbols},
        {"dependency_edges", dependency_edges},
        {"stale_files_removed", stale_files_removed},
        {"embeddings_stored", embeddings_stored},
        {"workspace_changed", workspace_changed},
        {"cancelled", cancelled},
        {"graph", graph.to_json()},
        {"diagnostics", diagnostics_to_json(diagnostics)},
        {"duration_ms", duration_ms}
    };
}

json ReindexReport::to_json() const {
    return {
        {"file_path", file_path},
        {"removed", removed},
        {"symbols", symbols},
        {"embeddings_stored", embeddings_stored},
        {"graph", graph.to_json()},
        {"diagnostics", diagnostics_to_json(diagnostics)}
    };
}

json FileContext::to_json() const {
    json related_json = json::array();
    for (const auto& r : related) related_json.push_back(r.to_json());
    return {
        {"found", found},
        {"file_path", file_path},
        {"analysis", analysis ? analysis->to_json() : json(nullptr)},
        {"symbol_at_cursor", symbol_at_cursor ? symbol_at_cursor->to_json() : json(nullptr)},
        {"cursor_line", cursor_line},
        {"surrounding_code", surrounding_code},
        {"dependencies", hits_to_json(dependencies)},
        {"dependents", hits_to_json(dependents)},
        {"related", related_json}
    };
}

// --- WIRING ---

CodeIntelligenceEngine::CodeIntelligenceEngine(EngineConfig config, EngineDependencies deps)
    : config_(std::move(config)) {
    analyzer_ = deps.analyzer ? deps.analyzer : std::make_shared<LanguageAnalyzer>();
    indexer_ = std::make_shared<ProjectIndexer>(analyzer_, config_.indexer);

    auto graph_backend = deps.graph_backend;
    if (!graph_backend) {
        if (config_.graph.backend == "neo4j") {
            graph_backend = std::make_shared<Neo4jGraphBackend>(config_.graph);
        } else {
            graph_backend = std::make_shared<MemoryGraphBackend>();
        }
    }
    graph_store_ = std::make_shared<RelationshipGraphStore>(graph_backend, config_.graph);
    analytics_ = std::make_shared<GraphAnalytics>(graph_store_, config_.analytics);

    auto key_manager = deps.key_manager;
    auto embedder = deps.embedder;
    if (!embedder && config_.embedding.use_model) {
        if (!key_manager) key_manager = std::make_shared<KeyManager>(config_.keys_path);
        embedder = std::make_shared<GeminiEmbedder>(key_manager, config_.embedding);
    }
    embeddings_ = std::make_shared<EmbeddingService>(config_.embedding, embedder);

    auto vector_backend = deps.vector_backend;
    if (!vector_backend && config_.vector.backend == "chroma") {
        vector_backend = std::make_shared<ChromaVectorBackend>(config_.vector);
    }
    vector_store_ = std::make_shared<VectorSemanticStore>(embeddings_, vector_backend, config_.vector);

    auto strategies = deps.strategies;
    if (strategies.empty()) {
        if (!key_manager) key_manager = std::make_shared<KeyManager>(config_.keys_path);
        strategies = InferenceRouter::default_strategies(key_manager, config_.inference);
    }
    router_ = std::make_shared<InferenceRouter>(std::move(strategies), config_.inference);
    retrieval_ = std::make_shared<RetrievalEngine>(vector_store_, graph_store_, analytics_);

    // Every merged file is embedded as it lands in the index.
    std::weak_ptr<VectorSemanticStore> weak_store = vector_store_;
    indexer_->set_observer([this, weak_store](const FileAnalysis& analysis, const std::string& content) {
        auto store = weak_store.lock();
        if (!store || !store->is_initialized()) return;
        embeddings_stored_.fetch_add(store->embed_file(analysis, content));
    });
}

bool CodeIntelligenceEngine::initialize() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_.load()) return true;

    if (!graph_store_->connect()) {
        spdlog::warn("⚠️ Graph backend '{}' unreachable; graph features stay empty until it returns",
                     graph_store_->backend_name());
    }
    vector_store_->initialize();
    bool router_ready = router_->initialize();

    initialized_.store(true);
    spdlog::info("🚀 Code intelligence engine online (graph={}, vector={}, strategy={})",
                 graph_store_->backend_name(), vector_store_->backend_name(),
                 router_ready ? router_->current_strategy() : "none");
    return router_ready;
}

bool CodeIntelligenceEngine::ensure_graph(std::vector<Diagnostic>& diagnostics) {
    if (graph_store_->is_connected() || graph_store_->connect()) return true;
    diagnostics.push_back({ErrorKind::BackendUnavailable, "graph backend unreachable", graph_store_->backend_name()});
    return false;
}

std::string CodeIntelligenceEngine::resolve_project_id(const std::string& project_id) const {
    return project_id.empty() ? indexer_->project_id() : project_id;
}

// --- INDEXING ---

IndexReport CodeIntelligenceEngine::index_project(const std::string& path, const CancellationToken* cancel) {
    auto start = std::chrono::steady_clock::now();
    IndexReport report;
    initialize();

    std::error_code ec;
    std::string requested = fs::weakly_canonical(fs::absolute(path, ec), ec).lexically_normal().generic_string();
    if (ec) requested = fs::path(path).lexically_normal().generic_string();

    std::set<std::string> previous_files;
    if (indexer_->has_index()) {
        auto previous = indexer_->snapshot();
        if (previous.root_path != requested) {
            // New workspace: nothing from the old project may survive.
            report.workspace_changed = true;
            spdlog::info("🔁 Workspace changed from {} to {}; dropping previous project data",
                         previous.root_path, requested);
            if (ensure_graph(report.diagnostics)) graph_store_->clear_project(previous.project_id);
            vector_store_->clear();
        } else {
            for (const auto& [file, fa] : previous.files) previous_files.insert(file);
        }
    }

    embeddings_stored_.store(0);
    ProjectIndex index = indexer_->index_project(path, cancel);

    report.project_id = index.project_id;
    report.root_path = index.root_path;
    report.files_indexed = index.file_count();
    report.symbols = index.symbol_count();
    report.dependency_edges = index.dependency_edges.size();
    report.cancelled = index.cancelled;
    report.diagnostics.insert(report.diagnostics.end(), index.diagnostics.begin(), index.diagnostics.end());

    for (const auto& file : previous_files) {
        if (index.files.count(file)) continue;
        vector_store_->remove_file(file);
        report.stale_files_removed++;
    }

    if (ensure_graph(report.diagnostics)) {
        report.graph = graph_store_->ingest_project(index);
        report.diagnostics.insert(report.diagnostics.end(),
                                  report.graph.diagnostics.begin(), report.graph.diagnostics.end());
    }
    report.embeddings_stored = embeddings_stored_.load();
    vector_store_->persist();

    report.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("📦 Indexed {}: {} files, {} symbols, {} edges, {} embeddings in {:.1f} ms",
                 report.project_id, report.files_indexed, report.symbols, report.dependency_edges,
                 report.embeddings_stored, report.duration_ms);
    return report;
}

ReindexReport CodeIntelligenceEngine::reindex_file(const std::string& path) {
    ReindexReport report;
    if (!indexer_->has_index()) {
        report.diagnostics.push_back({ErrorKind::FileUnreadable, "no project indexed", path});
        return report;
    }
    const std::string rel = indexer_->relative_path(path);
    report.file_path = rel;

    embeddings_stored_.store(0);
    FileAnalysis analysis = indexer_->reindex_file(path);
    ProjectIndex index = indexer_->snapshot();
    report.removed = index.files.count(rel) == 0;
    report.symbols = analysis.symbols.size();

    if (report.removed) {
        vector_store_->remove_file(rel);
        if (ensure_graph(report.diagnostics)) graph_store_->remove_file(index.project_id, rel);
        spdlog::info("🗑️ {} left the index", rel);
        return report;
    }

    for (const auto& d : index.diagnostics) {
        if (d.subject == rel) report.diagnostics.push_back(d);
    }
    if (ensure_graph(report.diagnostics)) {
        report.graph = graph_store_->replace_file(index, rel);
        report.diagnostics.insert(report.diagnostics.end(),
                                  report.graph.diagnostics.begin(), report.graph.diagnostics.end());
    }
    report.embeddings_stored = embeddings_stored_.load();
    return report;
}

// --- QUERIES ---

std::string CodeIntelligenceEngine::read_lines(const std::string& rel_path, int first, int last) const {
    std::ifstream in(fs::path(indexer_->root_path()) / rel_path, std::ios::binary);
    if (!in.is_open()) return "";
    std::string out;
    std::string line;
    int n = 0;
    while (std::getline(in, line)) {
        ++n;
        if (n < first) continue;
        if (n > last) break;
        out += line;
        out += '\n';
    }
    return sanitize_utf8(out);
}

FileContext CodeIntelligenceEngine::get_file_context(const std::string& path, int cursor_line) {
    FileContext ctx;
    ctx.cursor_line = cursor_line;
    if (!indexer_->has_index()) return ctx;

    ctx.file_path = indexer_->relative_path(path);
    ctx.analysis = indexer_->file_analysis(ctx.file_path);
    if (!ctx.analysis) return ctx;
    ctx.found = true;

    if (cursor_line > 0) {
        ctx.symbol_at_cursor = symbol_at(*ctx.analysis, cursor_line);
        ctx.surrounding_code = read_lines(ctx.file_path, cursor_line - kContextRadius, cursor_line + kContextRadius);
    } else {
        ctx.surrounding_code = read_lines(ctx.file_path, 1, kHeadLines);
    }

    const std::string file_id = make_file_id(ctx.file_path);
    ctx.dependencies = analytics_->dependencies(file_id, 1);
    ctx.dependents = analytics_->dependents(file_id, 1);

    std::string seed_text = ctx.symbol_at_cursor ? ctx.symbol_at_cursor->signature : ctx.surrounding_code;
    if (!seed_text.empty()) {
        for (auto& hit : search_code(seed_text, {}, kRelatedResults + 4)) {
            if (hit.file_path == ctx.file_path) continue;
            ctx.related.push_back(std::move(hit));
            if (ctx.related.size() >= kRelatedResults) break;
        }
    }
    return ctx;
}

std::vector<SearchResult> CodeIntelligenceEngine::search_code(const std::string& query,
                                                              const SearchFilters& filters, size_t k) {
    if (query.empty()) return {};
    if (!vector_store_->is_initialized()) vector_store_->initialize();
    return vector_store_->search(query, k, filters);
}

json CodeIntelligenceEngine::get_architecture_overview(const std::string& project_id) {
    std::vector<Diagnostic> diagnostics;
    ensure_graph(diagnostics);
    json overview = analytics_->get_architecture_overview(resolve_project_id(project_id));
    if (!diagnostics.empty()) overview["diagnostics"] = diagnostics_to_json(diagnostics);
    return overview;
}

std::vector<DependencyCycle> CodeIntelligenceEngine::find_circular_dependencies(const std::string& project_id) {
    std::vector<Diagnostic> diagnostics;
    if (!ensure_graph(diagnostics)) return {};
    return analytics_->find_circular_dependencies(resolve_project_id(project_id));
}

// --- COMPLETION ---

CompletionResult CodeIntelligenceEngine::generate_completion(CompletionContext context, const std::string& intent) {
    auto parsed = intent_from_string(intent);
    if (!parsed) return CompletionResult::failure("unknown intent '" + intent + "'");
    return generate_completion(std::move(context), *parsed);
}

CompletionResult CodeIntelligenceEngine::generate_completion(CompletionContext context, Intent intent) {
    if (context.language.empty() && !context.file_path.empty()) {
        context.language = to_string(detect_language(context.file_path));
    }

    if (indexer_->has_index() && !context.file_path.empty()) {
        context.file_path = indexer_->relative_path(context.file_path);
        if (auto analysis = indexer_->file_analysis(context.file_path)) {
            if (context.surrounding_code.empty()) {
                int line = context.cursor_line;
                context.surrounding_code = line > 0 ? read_lines(context.file_path, line - kContextRadius, line + kContextRadius)
                                                    : read_lines(context.file_path, 1, kHeadLines);
            }
            auto focus = context.cursor_line > 0 ? symbol_at(*analysis, context.cursor_line) : std::nullopt;
            if (focus) context.symbol_excerpts.push_back(to_string(focus->kind) + std::string(" ") + focus->signature);
            for (const auto& sym : analysis->symbols) {
                if (context.symbol_excerpts.size() >= kSymbolExcerpts) break;
                if (sym.kind == SymbolKind::Import || (focus && sym.id == focus->id)) continue;
                context.symbol_excerpts.push_back(std::string(to_string(sym.kind)) + " " +
                                                  (sym.signature.empty() ? sym.qualified_name : sym.signature));
            }
        }
        context.extensions.emplace("project_id", indexer_->project_id());
    }

    retrieval_->enrich(context, kRetrievalNodes, config_.inference.context_char_budget / 2);
    return router_->generate_completion(context, intent);
}

// --- HEALTH ---

json CodeIntelligenceEngine::health() {
    json index = indexer_->has_index() ? indexer_->snapshot().summary_json() : json(nullptr);
    return {
        {"initialized", initialized_.load()},
        {"graph", graph_store_->health().to_json()},
        {"vector", vector_store_->stats().to_json()},
        {"inference", router_->health()},
        {"index", index},
        {"telemetry", SystemMonitor::snapshot().to_json()}
    };
}

} // namespace code_intelligence
