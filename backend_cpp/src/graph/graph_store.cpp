#include "graph/graph_store.hpp"
#include "SystemMonitor.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>
#include <set>
#include <thread>
#include <spdlog/spdlog.h>

namespace code_intelligence {

using json = nlohmann::json;

namespace {

const std::set<SymbolKind> kCallable = {SymbolKind::Function, SymbolKind::Method};
const std::set<SymbolKind> kTypes = {SymbolKind::Class, SymbolKind::Struct};

bool imports_file(const ProjectIndex& index, const std::string& from_file, const std::string& target_file) {
    const FileAnalysis* fa = index.find_file(from_file);
    if (!fa) return false;
    return std::any_of(fa->dependencies.begin(), fa->dependencies.end(), [&](const Dependency& d) {
        return d.resolved_file && *d.resolved_file == target_file;
    });
}

// Same file, then imported files, then a unique project-wide match.
std::optional<std::string> resolve_reference(const ProjectIndex& index, const std::string& raw,
                                             const Symbol& from, const std::set<SymbolKind>& kinds) {
    std::string name = referenced_name(raw);
    if (name.empty()) return std::nullopt;

    std::vector<const Symbol*> candidates;
    for (const Symbol* s : index.find_symbols(name)) {
        if (s->id != from.id && s->name == name && kinds.count(s->kind)) candidates.push_back(s);
    }
    if (candidates.empty()) return std::nullopt;
    std::sort(candidates.begin(), candidates.end(),
              [](const Symbol* a, const Symbol* b) { return a->id < b->id; });

    for (const Symbol* s : candidates) {
        if (s->file_path == from.file_path) return s->id;
    }
    for (const Symbol* s : candidates) {
        if (imports_file(index, from.file_path, s->file_path)) return s->id;
    }
    if (candidates.size() == 1) return candidates.front()->id;
    return std::nullopt;
}

GraphNode project_node(const ProjectIndex& index) {
    GraphNode project;
    project.id = project_node_id(index.project_id);
    project.label = "Project";
    project.name = index.project_id;
    project.project_id = index.project_id;
    project.properties = {{"root_path", index.root_path}, {"generation", index.generation},
                          {"file_count", index.files.size()}};
    return project;
}

GraphNode file_node(const ProjectIndex& index, const FileAnalysis& fa) {
    GraphNode node;
    node.id = fa.id();
    node.label = "File";
    node.name = std::filesystem::path(fa.file_path).filename().string();
    node.project_id = index.project_id;
    node.file_path = fa.file_path;
    node.properties = {
        {"language", to_string(fa.language)},
        {"module", module_name_for(fa.file_path)},
        {"analysis_mode", to_string(fa.analysis_mode)},
        {"content_hash", fa.content_hash},
        {"lines_of_code", fa.complexity_metrics.lines_of_code},
        {"cyclomatic_complexity", fa.complexity_metrics.cyclomatic_complexity},
        {"maintainability_index", fa.complexity_metrics.maintainability_index},
        {"symbol_count", fa.symbols.size()}
    };
    return node;
}

GraphNode symbol_node(const ProjectIndex& index, const Symbol& sym) {
    GraphNode node;
    node.id = sym.id;
    node.label = graph_label(sym.kind);
    node.name = sym.name;
    node.project_id = index.project_id;
    node.file_path = sym.file_path;
    node.properties = {
        {"qualified_name", sym.qualified_name},
        {"kind", to_string(sym.kind)},
        {"line_start", sym.line_start},
        {"line_end", sym.line_end},
        {"complexity", sym.complexity},
        {"scope", sym.scope},
        {"signature", sym.signature},
        {"is_async", sym.is_async},
        {"parameters", sym.parameters}
    };
    if (sym.docstring) node.properties["docstring"] = *sym.docstring;
    return node;
}

GraphRelationship edge(const std::string& from, const std::string& to, const std::string& type, double weight = 1.0) {
    GraphRelationship rel;
    rel.from_id = from;
    rel.to_id = to;
    rel.type = type;
    rel.weight = weight;
    return rel;
}

// INHERITS_FROM and CALLS leaving `sym`. `accept` filters on the resolved target id.
template<typename Accept>
void append_references(GraphProjection& out, const ProjectIndex& index, const Symbol& sym, Accept accept) {
    if (kTypes.count(sym.kind)) {
        for (const auto& base : sym.bases) {
            auto target = resolve_reference(index, base, sym, kTypes);
            if (target && accept(*target)) out.relationships.push_back(edge(sym.id, *target, "INHERITS_FROM"));
        }
    }
    if (kCallable.count(sym.kind)) {
        for (const auto& call : sym.calls) {
            auto target = resolve_reference(index, call, sym, kCallable);
            if (target && accept(*target)) out.relationships.push_back(edge(sym.id, *target, "CALLS"));
        }
    }
}

// File node, its symbols, their CONTAINS edges and every reference leaving them.
void append_file(GraphProjection& out, const ProjectIndex& index, const FileAnalysis& fa) {
    out.nodes.push_back(file_node(index, fa));
    out.relationships.push_back(edge(project_node_id(index.project_id), fa.id(), "CONTAINS"));

    for (const auto& sym : fa.symbols) {
        out.nodes.push_back(symbol_node(index, sym));
        bool has_parent = sym.parent_id && index.symbols.count(*sym.parent_id);
        out.relationships.push_back(edge(has_parent ? *sym.parent_id : fa.id(), sym.id, "CONTAINS"));
        append_references(out, index, sym, [](const std::string&) { return true; });
    }
}

// One IMPORTS edge per resolved import, one aggregated DEPENDS_ON per file pair.
template<typename Keep>
void append_imports(GraphProjection& out, const ProjectIndex& index, Keep keep) {
    std::map<std::pair<std::string, std::string>, int> import_counts;
    for (const auto& dep : index.dependency_edges) {
        if (!keep(dep)) continue;
        auto from = make_file_id(dep.source_file);
        auto to = make_file_id(dep.target_file);
        if (import_counts[{from, to}]++ == 0) {
            GraphRelationship rel = edge(from, to, "IMPORTS");
            rel.properties = {{"line", dep.line}, {"module", dep.target_module}};
            out.relationships.push_back(rel);
        }
    }
    for (const auto& [pair, count] : import_counts) {
        out.relationships.push_back(edge(pair.first, pair.second, "DEPENDS_ON", static_cast<double>(count)));
    }
}

// Upsert semantics: (from, type, to) appears once.
void dedupe(GraphProjection& out) {
    std::set<std::string> seen;
    out.relationships.erase(std::remove_if(out.relationships.begin(), out.relationships.end(),
                                           [&](const GraphRelationship& r) { return !seen.insert(r.key()).second; }),
                            out.relationships.end());
}

} // namespace

std::string project_node_id(const std::string& project_id) {
    return "project:" + project_id;
}

GraphProjection project_index(const ProjectIndex& index) {
    GraphProjection out;
    out.nodes.push_back(project_node(index));
    for (const auto& [path, fa] : index.files) append_file(out, index, fa);
    append_imports(out, index, [](const DependencyEdge&) { return true; });
    dedupe(out);
    return out;
}

GraphProjection project_file(const ProjectIndex& index, const std::string& file_path) {
    GraphProjection out;
    const FileAnalysis* fa = index.find_file(file_path);
    if (!fa) return out;

    out.nodes.push_back(project_node(index));
    append_file(out, index, *fa);

    // References from other files that now land on this file's symbols.
    std::set<std::string> referrers;
    for (const auto& sym : fa->symbols) {
        for (const Symbol* r : index.find_referrers(sym.name)) {
            if (r->file_path != file_path) referrers.insert(r->id);
        }
    }
    auto lands_here = [&](const std::string& target) {
        auto it = index.symbols.find(target);
        return it != index.symbols.end() && it->second.file_path == file_path;
    };
    for (const auto& id : referrers) append_references(out, index, index.symbols.at(id), lands_here);

    append_imports(out, index, [&](const DependencyEdge& dep) {
        return dep.source_file == file_path || dep.target_file == file_path;
    });
    dedupe(out);
    return out;
}

RelationshipGraphStore::RelationshipGraphStore(std::shared_ptr<GraphBackend> backend, GraphConfig config)
    : backend_(std::move(backend)), config_(std::move(config)) {}

bool RelationshipGraphStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (backend_->is_connected()) return true;
    if (backend_->connect()) return true;

    spdlog::warn("⚠️ Graph backend '{}' refused connection. Retrying in {} ms...",
                 backend_->name(), config_.connect_backoff_ms);
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.connect_backoff_ms));
    if (backend_->connect()) return true;

    spdlog::error("❌ Graph backend '{}' unavailable", backend_->name());
    return false;
}

void RelationshipGraphStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_->disconnect();
}

bool RelationshipGraphStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->is_connected();
}

std::string RelationshipGraphStore::backend_name() const {
    return backend_->name();
}

bool RelationshipGraphStore::upsert_node(const GraphNode& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->upsert_node(node);
}

GraphWriteResult RelationshipGraphStore::upsert_relationship(const GraphRelationship& rel) {
    std::lock_guard<std::mutex> lock(mutex_);
    return upsert_relationship_locked(rel);
}

GraphWriteResult RelationshipGraphStore::upsert_relationship_locked(const GraphRelationship& rel) {
    GraphWriteResult result;
    switch (backend_->upsert_relationship(rel)) {
        case WriteOutcome::Ok:
            result.ok = true;
            break;
        case WriteOutcome::MissingEndpoint:
            spdlog::warn("⚠️ Rejected {} edge {} -> {}: endpoint missing", rel.type, rel.from_id, rel.to_id);
            result.diagnostic = Diagnostic{ErrorKind::GraphIntegrityViolation,
                                           "relationship endpoint does not exist", rel.key()};
            break;
        case WriteOutcome::Failed:
            result.diagnostic = Diagnostic{ErrorKind::BackendUnavailable,
                                           "graph backend rejected write", rel.key()};
            break;
    }
    return result;
}

ClearResult RelationshipGraphStore::clear_project(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClearResult result = backend_->delete_project(project_id);
    spdlog::info("🧹 Cleared project '{}': {} relationships, {} nodes",
                 project_id, result.relationships_removed, result.nodes_removed);
    return result;
}

GraphHealth RelationshipGraphStore::health() {
    std::lock_guard<std::mutex> lock(mutex_);
    GraphHealth h;
    h.backend = backend_->name();
    h.connected = backend_->is_connected();
    if (!h.connected) {
        h.error = "not connected";
        return h;
    }
    auto start = std::chrono::steady_clock::now();
    h.node_count = backend_->node_count();
    h.relationship_count = backend_->relationship_count();
    h.query_time_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return h;
}

void RelationshipGraphStore::write_projection_locked(const GraphProjection& projection, IngestReport& report) {
    for (const auto& node : projection.nodes) {
        if (backend_->upsert_node(node)) {
            ++report.nodes_written;
        } else {
            report.diagnostics.push_back({ErrorKind::BackendUnavailable, "node upsert failed", node.id});
        }
    }
    for (const auto& rel : projection.relationships) {
        auto result = upsert_relationship_locked(rel);
        if (result) {
            ++report.relationships_written;
        } else if (result.diagnostic) {
            report.diagnostics.push_back(*result.diagnostic);
        }
    }
}

IngestReport RelationshipGraphStore::ingest_project(const ProjectIndex& index) {
    IngestReport report;
    SystemMonitor::ScopedLatency timer(SystemMonitor::global_graph_latency_ms);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backend_->is_connected()) {
        report.diagnostics.push_back({ErrorKind::BackendUnavailable, "graph not connected", index.project_id});
        return report;
    }

    // Drop every file subgraph first so stale symbol ids cannot survive.
    std::set<std::string> stored_files;
    for (const auto& node : backend_->project_nodes(index.project_id)) {
        if (node.label == "File") stored_files.insert(node.file_path);
    }
    for (const auto& path : stored_files) {
        report.nodes_removed += backend_->delete_file_nodes(index.project_id, path).nodes_removed;
    }

    write_projection_locked(project_index(index), report);
    spdlog::info("🕸️ Graph ingest '{}': {} nodes, {} relationships, {} rejected",
                 index.project_id, report.nodes_written, report.relationships_written, report.diagnostics.size());
    return report;
}

IngestReport RelationshipGraphStore::replace_file(const ProjectIndex& index, const std::string& file_path) {
    IngestReport report;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backend_->is_connected()) {
        report.diagnostics.push_back({ErrorKind::BackendUnavailable, "graph not connected", file_path});
        return report;
    }
    report.nodes_removed = backend_->delete_file_nodes(index.project_id, file_path).nodes_removed;
    if (index.files.count(file_path)) write_projection_locked(project_file(index, file_path), report);
    spdlog::debug("🔁 Graph subgraph for {} rebuilt ({} nodes)", file_path, report.nodes_written);
    return report;
}

size_t RelationshipGraphStore::remove_file(const std::string& project_id, const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->delete_file_nodes(project_id, file_path).nodes_removed;
}

std::optional<GraphNode> RelationshipGraphStore::get_node(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->get_node(id);
}

std::vector<GraphRelationship> RelationshipGraphStore::outgoing(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->outgoing(id);
}

std::vector<GraphRelationship> RelationshipGraphStore::incoming(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->incoming(id);
}

std::vector<GraphNode> RelationshipGraphStore::project_nodes(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->project_nodes(project_id);
}

std::vector<GraphRelationship> RelationshipGraphStore::project_relationships(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->project_relationships(project_id);
}

} // namespace code_intelligence
