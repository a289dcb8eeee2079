#include "project_indexer.hpp"
#include "SystemMonitor.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <mutex>
#include <tuple>
#include <omp.h>
#include <spdlog/spdlog.h>

namespace code_intelligence {

using json = nlohmann::json;

namespace {

std::string generic(const fs::path& p) {
    return p.lexically_normal().generic_string();
}

// Drops "." and resolves ".." without touching the filesystem.
std::string normalize_rel(const fs::path& p) {
    std::string s = generic(p);
    while (starts_with(s, "./")) s = s.substr(2);
    return s;
}

const std::vector<std::string>& script_extensions() {
    static const std::vector<std::string> ext = {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs"};
    return ext;
}

} // namespace

json SymbolReference::to_json() const {
    return {
        {"file_path", file_path},
        {"line", line},
        {"kind", kind},
        {"from_symbol_id", from_symbol_id},
        {"context", sanitize_utf8(context)}
    };
}

json RefreshReport::to_json() const {
    return {{"added", added}, {"updated", updated}, {"removed", removed}, {"cancelled", cancelled}};
}

ProjectIndexer::ProjectIndexer(std::shared_ptr<const LanguageAnalyzer> analyzer, IndexerConfig config)
    : analyzer_(std::move(analyzer)), base_config_(config), config_(std::move(config)) {}

// --- DISCOVERY ---

void ProjectIndexer::load_rules(const std::string& root) {
    config_ = load_project_indexer_config(root, base_config_);
    path_rules_.clear();
    for (const auto& p : config_.ignored_paths) path_rules_.insert(p, PathFlag::IGNORE);
    for (const auto& p : config_.included_paths) path_rules_.insert(p, PathFlag::INCLUDE);
}

bool ProjectIndexer::matches_any(const std::string& segment, const std::vector<std::string>& patterns) const {
    for (const auto& pattern : patterns) {
        if (glob_match(pattern, segment)) return true;
    }
    return false;
}

bool ProjectIndexer::should_index(const fs::path& rel_path, bool is_directory) const {
    uint8_t flags = path_rules_.check(rel_path);
    if (flags & PathFlag::INCLUDE) {
        if (is_directory) return true;
    } else {
        if (flags & PathFlag::IGNORE) return false;
        for (const auto& part : rel_path) {
            std::string segment = part.string();
            if (matches_any(segment, config_.exclude_patterns)) return false;
            if (config_.exclude_tests && matches_any(segment, config_.test_patterns)) return false;
        }
    }
    if (is_directory) return true;

    std::string ext = rel_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return std::find(config_.allowed_extensions.begin(), config_.allowed_extensions.end(), ext) !=
           config_.allowed_extensions.end();
}

void ProjectIndexer::recursive_scan(const fs::path& current_dir, const fs::path& root_dir,
                                    bool ignored_context, std::vector<fs::path>& results) const {
    std::error_code ec;
    fs::directory_iterator it(current_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("⚠️ Cannot list {}: {}", current_dir.string(), ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        fs::path rel = entry.path().lexically_relative(root_dir);

        std::error_code type_ec;
        if (entry.is_symlink(type_ec)) continue;

        if (entry.is_directory(type_ec)) {
            bool included = path_rules_.check(rel) & PathFlag::INCLUDE;
            bool allowed = !ignored_context ? should_index(rel, true) : included;
            if (allowed) {
                recursive_scan(entry.path(), root_dir, false, results);
            } else if (path_rules_.has_include_below(rel)) {
                // Bridge through an ignored directory towards an included child.
                recursive_scan(entry.path(), root_dir, true, results);
            }
            continue;
        }

        if (!entry.is_regular_file(type_ec)) continue;
        if (ignored_context && !(path_rules_.check(rel) & PathFlag::INCLUDE)) continue;
        if (!should_index(rel, false)) continue;

        auto size = entry.file_size(type_ec);
        if (!type_ec && size > config_.max_file_bytes) {
            spdlog::debug("⏭️ Skipping oversized file {} ({} bytes)", rel.generic_string(), size);
            continue;
        }
        results.push_back(entry.path());
    }
}

std::string ProjectIndexer::calculate_file_hash(const fs::path& file_path) {
    std::error_code ec;
    auto size = fs::file_size(file_path, ec);
    if (ec) return "";
    auto ftime = fs::last_write_time(file_path, ec);
    if (ec) return "";
    return std::to_string(size) + "-" + std::to_string(ftime.time_since_epoch().count());
}

// --- ANALYSIS ---

ProjectIndexer::AnalysisSlot ProjectIndexer::analyze_one(const fs::path& root, const fs::path& file) const {
    AnalysisSlot slot;
    slot.started = true;
    slot.rel_path = normalize_rel(file.lexically_relative(root));
    slot.stamp = calculate_file_hash(file);

    auto unreadable = [&](const std::string& reason) {
        slot.analysis = FileAnalysis{};
        slot.analysis.file_path = slot.rel_path;
        slot.analysis.language = detect_language(slot.rel_path);
        slot.analysis.parsing_errors.push_back(reason);
        slot.content.clear();
        slot.diagnostic = Diagnostic{ErrorKind::FileUnreadable, reason, slot.rel_path};
    };

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        unreadable("cannot read file: permission denied or missing");
        return slot;
    }
    slot.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        unreadable("cannot read file: I/O error");
        return slot;
    }
    if (slot.content.find('\0') != std::string::npos) {
        unreadable("cannot decode file: binary content");
        return slot;
    }

    try {
        slot.analysis = analyzer_->analyze(slot.rel_path, slot.content);
        if (slot.analysis.degraded()) {
            slot.diagnostic = Diagnostic{ErrorKind::ParseDegraded, "heuristic analysis used", slot.rel_path};
        }
    } catch (const std::exception& e) {
        // Exceptions must not leave the OpenMP region.
        unreadable(std::string("analysis failed: ") + e.what());
    }
    return slot;
}

ProjectIndex ProjectIndexer::index_project(const std::string& root_path, const CancellationToken* cancel) {
    auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::absolute(root_path, ec), ec);
    if (ec) root = fs::path(root_path).lexically_normal();

    ProjectIndex fresh;
    fresh.root_path = generic(root);
    fresh.project_id = root.filename().string().empty() ? "project" : root.filename().string();

    {
        std::unique_lock lock(mutex_);
        fresh.generation = index_.generation + 1;
        index_ = fresh;
        manifest_.clear();
        has_index_ = true;
    }

    if (!fs::is_directory(root, ec)) {
        spdlog::info("📭 Nothing to index at {}", root_path);
        return snapshot();
    }

    load_rules(root.string());

    std::vector<fs::path> files;
    recursive_scan(root, root, false, files);
    std::sort(files.begin(), files.end());
    spdlog::info("🛰️ Indexing {} candidate files under {}", files.size(), root.string());

    const size_t batch_size = config_.batch_size;
    bool cancelled = false;

    for (size_t offset = 0; offset < files.size() && !cancelled; offset += batch_size) {
        if (cancel && cancel->is_cancelled()) {
            cancelled = true;
            break;
        }
        size_t count = std::min(batch_size, files.size() - offset);
        std::vector<AnalysisSlot> slots(count);

        // Parallel analysis; each task writes only its own slot.
        #pragma omp parallel for schedule(dynamic)
        for (long long i = 0; i < static_cast<long long>(count); ++i) {
            if (cancel && cancel->is_cancelled()) continue;
            slots[static_cast<size_t>(i)] = analyze_one(root, files[offset + static_cast<size_t>(i)]);
        }

        // Serial merge.
        std::vector<AnalysisSlot*> merged;
        {
            std::unique_lock lock(mutex_);
            for (auto& slot : slots) {
                if (!slot.started) {
                    cancelled = true;
                    continue;
                }
                if (slot.diagnostic) index_.diagnostics.push_back(*slot.diagnostic);
                manifest_[slot.rel_path] = slot.stamp;
                merge_file_locked(slot.analysis);
                merged.push_back(&slot);
            }
        }
        SystemMonitor::global_files_indexed.fetch_add(static_cast<long long>(merged.size()));

        if (observer_) {
            for (auto* slot : merged) observer_(slot->analysis, slot->content);
        }
    }

    {
        std::unique_lock lock(mutex_);
        // Second pass: imports between files of the same batch order.
        for (auto& [path, analysis] : index_.files) resolve_file_locked(analysis);
        index_.dependency_edges.clear();
        for (const auto& [path, analysis] : index_.files) {
            for (const auto& dep : analysis.dependencies) {
                if (!dep.resolved_file || *dep.resolved_file == path) continue;
                index_.dependency_edges.push_back(
                    {path, *dep.resolved_file, dep.target_module, dep.import_statement, dep.line});
            }
        }
        sort_edges_locked();
        index_.cancelled = cancelled;
    }

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    ProjectIndex result = snapshot();
    spdlog::info("✅ Indexed {} files, {} symbols, {} internal edges in {:.1f} ms{}",
                 result.files.size(), result.symbols.size(), result.dependency_edges.size(), ms,
                 cancelled ? " (cancelled)" : "");
    return result;
}

// --- INCREMENTAL ---

FileAnalysis ProjectIndexer::reindex_file(const std::string& path) {
    std::string rel = relative_path(path);
    fs::path root;
    {
        std::shared_lock lock(mutex_);
        root = fs::path(index_.root_path);
    }
    fs::path abs = root / rel;

    std::error_code ec;
    if (!fs::is_regular_file(abs, ec) || !should_index(fs::path(rel), false)) {
        remove_file(rel);
        FileAnalysis gone;
        gone.file_path = rel;
        gone.language = detect_language(rel);
        return gone;
    }

    AnalysisSlot slot = analyze_one(root, abs);
    {
        std::unique_lock lock(mutex_);
        bool is_new = index_.files.find(rel) == index_.files.end();
        erase_file_locked(rel);

        auto& diags = index_.diagnostics;
        diags.erase(std::remove_if(diags.begin(), diags.end(),
                                   [&](const Diagnostic& d) { return d.subject == rel; }),
                    diags.end());
        if (slot.diagnostic) diags.push_back(*slot.diagnostic);

        merge_file_locked(slot.analysis);
        FileAnalysis& stored = index_.files[rel];
        resolve_file_locked(stored);
        for (const auto& dep : stored.dependencies) {
            if (!dep.resolved_file || *dep.resolved_file == rel) continue;
            index_.dependency_edges.push_back({rel, *dep.resolved_file, dep.target_module, dep.import_statement, dep.line});
        }
        if (is_new) relink_dependents_locked(rel);
        sort_edges_locked();
        manifest_[rel] = slot.stamp;
        slot.analysis = stored;
    }

    spdlog::info("🔄 Re-indexed {}: {} symbols", rel, slot.analysis.symbols.size());
    if (observer_) observer_(slot.analysis, slot.content);
    return slot.analysis;
}

bool ProjectIndexer::remove_file(const std::string& path) {
    std::string rel = relative_path(path);
    std::unique_lock lock(mutex_);
    if (index_.files.find(rel) == index_.files.end()) return false;

    erase_file_locked(rel);
    manifest_.erase(rel);

    // Imports that pointed at the removed file become unresolved.
    for (auto& [other_path, analysis] : index_.files) {
        for (auto& dep : analysis.dependencies) {
            if (dep.resolved_file && *dep.resolved_file == rel) {
                dep.resolved_file.reset();
                dep.is_external = true;
            }
        }
    }
    auto& edges = index_.dependency_edges;
    edges.erase(std::remove_if(edges.begin(), edges.end(),
                               [&](const DependencyEdge& e) { return e.target_file == rel; }),
                edges.end());
    spdlog::info("🗑️ Removed {} from index", rel);
    return true;
}

RefreshReport ProjectIndexer::refresh(const CancellationToken* cancel) {
    RefreshReport report;
    fs::path root;
    std::unordered_map<std::string, std::string> manifest;
    {
        std::shared_lock lock(mutex_);
        if (!has_index_) return report;
        root = fs::path(index_.root_path);
        manifest = manifest_;
    }

    std::error_code ec;
    std::vector<fs::path> files;
    if (fs::is_directory(root, ec)) recursive_scan(root, root, false, files);
    std::sort(files.begin(), files.end());

    std::set<std::string> seen;
    for (const auto& file : files) {
        if (cancel && cancel->is_cancelled()) {
            report.cancelled = true;
            return report;
        }
        std::string rel = normalize_rel(file.lexically_relative(root));
        seen.insert(rel);
        auto it = manifest.find(rel);
        if (it == manifest.end()) {
            reindex_file(rel);
            report.added.push_back(rel);
        } else if (it->second != calculate_file_hash(file)) {
            reindex_file(rel);
            report.updated.push_back(rel);
        }
    }
    for (const auto& [rel, stamp] : manifest) {
        if (!seen.count(rel) && remove_file(rel)) report.removed.push_back(rel);
    }
    return report;
}

// --- MERGE HELPERS (unique lock held) ---

void ProjectIndexer::merge_file_locked(FileAnalysis analysis) {
    for (const auto& sym : analysis.symbols) index_.add_symbol(sym);
    index_.files[analysis.file_path] = std::move(analysis);
}

void ProjectIndexer::erase_file_locked(const std::string& rel_path) {
    auto it = index_.files.find(rel_path);
    if (it == index_.files.end()) return;

    for (const auto& sym : it->second.symbols) index_.erase_symbol(sym);
    index_.files.erase(it);

    auto& edges = index_.dependency_edges;
    edges.erase(std::remove_if(edges.begin(), edges.end(),
                               [&](const DependencyEdge& e) { return e.source_file == rel_path; }),
                edges.end());
}

void ProjectIndexer::resolve_file_locked(FileAnalysis& analysis) {
    for (auto& dep : analysis.dependencies) {
        auto target = resolve_module_locked(analysis.file_path, dep, analysis.language);
        dep.resolved_file = target;
        dep.is_external = !target.has_value();
    }
}

void ProjectIndexer::relink_dependents_locked(const std::string& new_rel_path) {
    for (auto& [path, analysis] : index_.files) {
        if (path == new_rel_path) continue;
        for (auto& dep : analysis.dependencies) {
            if (dep.resolved_file) continue;
            auto target = resolve_module_locked(path, dep, analysis.language);
            if (!target || *target != new_rel_path) continue;
            dep.resolved_file = target;
            dep.is_external = false;
            index_.dependency_edges.push_back({path, *target, dep.target_module, dep.import_statement, dep.line});
        }
    }
}

void ProjectIndexer::sort_edges_locked() {
    auto& edges = index_.dependency_edges;
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
}

std::optional<std::string> ProjectIndexer::resolve_module_locked(const std::string& source_file,
                                                                 const Dependency& dep,
                                                                 Language language) const {
    const auto& files = index_.files;
    auto exists = [&](const fs::path& candidate) -> std::optional<std::string> {
        std::string rel = normalize_rel(candidate);
        if (rel.empty() || starts_with(rel, "..")) return std::nullopt;
        if (files.count(rel)) return rel;
        return std::nullopt;
    };
    const std::string& module = dep.target_module;
    fs::path source_dir = fs::path(source_file).parent_path();

    if (language == Language::Python) {
        if (starts_with(module, ".")) {
            size_t dots = module.find_first_not_of('.');
            std::string rest = dots == std::string::npos ? "" : module.substr(dots);
            size_t level = dots == std::string::npos ? module.size() : dots;
            fs::path base = source_dir;
            for (size_t i = 1; i < level; ++i) base = base.parent_path();

            if (rest.empty()) {
                for (const auto& name : dep.imported_names) {
                    if (auto hit = exists(base / (name + ".py"))) return hit;
                }
                return exists(base / "__init__.py");
            }
            std::string rel = rest;
            std::replace(rel.begin(), rel.end(), '.', '/');
            if (auto hit = exists(base / (rel + ".py"))) return hit;
            return exists(base / rel / "__init__.py");
        }

        std::vector<std::string> parts = split(module, '.');
        for (size_t len = parts.size(); len > 0; --len) {
            fs::path rel;
            for (size_t i = 0; i < len; ++i) rel /= parts[i];
            for (const fs::path& base : {fs::path(), source_dir}) {
                if (auto hit = exists(base / (rel.string() + ".py"))) return hit;
                if (auto hit = exists(base / rel / "__init__.py")) return hit;
            }
        }
        return std::nullopt;
    }

    if (language == Language::JavaScript || language == Language::TypeScript) {
        fs::path base = starts_with(module, ".") ? source_dir / module : fs::path(module);
        if (auto hit = exists(base)) return hit;
        for (const auto& ext : script_extensions()) {
            if (auto hit = exists(fs::path(base.string() + ext))) return hit;
        }
        for (const auto& ext : script_extensions()) {
            if (auto hit = exists(base / ("index" + ext))) return hit;
        }
        return std::nullopt;
    }

    if (language == Language::Cpp) {
        for (const fs::path& base : {source_dir, fs::path(), fs::path("include"), fs::path("src")}) {
            if (auto hit = exists(base / module)) return hit;
        }
        // Unique suffix match for include paths set by the build system.
        std::optional<std::string> found;
        std::string suffix = "/" + module;
        for (const auto& [path, analysis] : files) {
            if (ends_with(path, suffix) || path == module) {
                if (found) return std::nullopt;
                found = path;
            }
        }
        return found;
    }

    if (language == Language::Rust) {
        std::string mod = module;
        for (const char* prefix : {"crate::", "self::", "super::"}) {
            if (starts_with(mod, prefix)) mod = mod.substr(std::string(prefix).size());
        }
        std::vector<std::string> parts;
        for (auto& p : split(mod, ':')) {
            if (!p.empty()) parts.push_back(p);
        }
        for (size_t len = parts.size(); len > 0; --len) {
            fs::path rel;
            for (size_t i = 0; i < len; ++i) rel /= parts[i];
            for (const fs::path& base : {fs::path("src"), source_dir}) {
                if (auto hit = exists(base / (rel.string() + ".rs"))) return hit;
                if (auto hit = exists(base / rel / "mod.rs")) return hit;
            }
        }
    }
    return std::nullopt;
}

// --- QUERIES ---

std::vector<SymbolReference> ProjectIndexer::find_references(const std::string& symbol_name) const {
    std::vector<SymbolReference> refs;
    std::shared_lock lock(mutex_);

    for (const auto& [path, analysis] : index_.files) {
        for (const auto& sym : analysis.symbols) {
            if (std::find(sym.calls.begin(), sym.calls.end(), symbol_name) != sym.calls.end()) {
                refs.push_back({path, sym.line_start, "call", sym.id, sym.signature});
            }
            if (std::find(sym.bases.begin(), sym.bases.end(), symbol_name) != sym.bases.end()) {
                refs.push_back({path, sym.line_start, "inherit", sym.id, sym.signature});
            }
        }
        for (const auto& dep : analysis.dependencies) {
            bool named = std::find(dep.imported_names.begin(), dep.imported_names.end(), symbol_name) !=
                         dep.imported_names.end();
            std::string last = dep.target_module.substr(dep.target_module.find_last_of("./:") + 1);
            if (named || last == symbol_name) {
                refs.push_back({path, dep.line, "import", "", dep.import_statement});
            }
        }
    }
    std::sort(refs.begin(), refs.end(), [](const SymbolReference& a, const SymbolReference& b) {
        return std::tie(a.file_path, a.line, a.kind) < std::tie(b.file_path, b.line, b.kind);
    });
    return refs;
}

ProjectIndex ProjectIndexer::snapshot() const {
    std::shared_lock lock(mutex_);
    return index_;
}

std::optional<FileAnalysis> ProjectIndexer::file_analysis(const std::string& path) const {
    std::string rel = relative_path(path);
    std::shared_lock lock(mutex_);
    auto it = index_.files.find(rel);
    if (it == index_.files.end()) return std::nullopt;
    return it->second;
}

std::string ProjectIndexer::root_path() const {
    std::shared_lock lock(mutex_);
    return index_.root_path;
}

std::string ProjectIndexer::project_id() const {
    std::shared_lock lock(mutex_);
    return index_.project_id;
}

bool ProjectIndexer::has_index() const {
    std::shared_lock lock(mutex_);
    return has_index_;
}

std::string ProjectIndexer::relative_path(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute()) {
        std::string root;
        {
            std::shared_lock lock(mutex_);
            root = index_.root_path;
        }
        std::error_code ec;
        fs::path canon = fs::weakly_canonical(p, ec);
        if (ec) canon = p.lexically_normal();
        if (!root.empty()) {
            fs::path rel = canon.lexically_relative(fs::path(root));
            if (!rel.empty() && !starts_with(rel.generic_string(), "..")) return normalize_rel(rel);
        }
        return generic(canon);
    }
    return normalize_rel(p);
}

} // namespace code_intelligence
