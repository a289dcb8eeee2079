#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "code_model.hpp"
#include "engine_config.hpp"
#include "language_analyzer.hpp"
#include "PrefixTrie.hpp"

namespace code_intelligence {

namespace fs = std::filesystem;

// Cooperative cancellation, checked between files.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct SymbolReference {
    std::string file_path;
    int line = 0;
    std::string kind; // "call" | "import" | "inherit"
    std::string from_symbol_id;
    std::string context;

    nlohmann::json to_json() const;
};

struct RefreshReport {
    std::vector<std::string> added;
    std::vector<std::string> updated;
    std::vector<std::string> removed;
    bool cancelled = false;

    bool empty() const { return added.empty() && updated.empty() && removed.empty(); }
    nlohmann::json to_json() const;
};

// Called once per merged file, outside the index lock, in merge order.
using FileObserver = std::function<void(const FileAnalysis&, const std::string& content)>;

class ProjectIndexer {
public:
    explicit ProjectIndexer(std::shared_ptr<const LanguageAnalyzer> analyzer, IndexerConfig config = {});

    ProjectIndex index_project(const std::string& root_path, const CancellationToken* cancel = nullptr);

    // Path may be absolute or relative to the indexed root.
    FileAnalysis reindex_file(const std::string& path);
    bool remove_file(const std::string& path);

    // Reindexes files whose size-mtime stamp changed since the last pass.
    RefreshReport refresh(const CancellationToken* cancel = nullptr);

    std::vector<SymbolReference> find_references(const std::string& symbol_name) const;

    ProjectIndex snapshot() const;
    std::optional<FileAnalysis> file_analysis(const std::string& path) const;
    std::string root_path() const;
    std::string project_id() const;
    bool has_index() const;

    // Project-relative, '/'-separated form of `path`.
    std::string relative_path(const std::string& path) const;
    bool should_index(const fs::path& rel_path, bool is_directory = false) const;

    void set_observer(FileObserver observer) { observer_ = std::move(observer); }
    const IndexerConfig& config() const { return config_; }

private:
    struct AnalysisSlot {
        bool started = false;
        std::string rel_path;
        std::string content;
        std::string stamp;
        FileAnalysis analysis;
        std::optional<Diagnostic> diagnostic;
    };

    std::shared_ptr<const LanguageAnalyzer> analyzer_;
    IndexerConfig base_config_;
    IndexerConfig config_;
    PrefixTrie path_rules_;
    FileObserver observer_;

    mutable std::shared_mutex mutex_;
    ProjectIndex index_;
    bool has_index_ = false;
    std::unordered_map<std::string, std::string> manifest_;

    void load_rules(const std::string& root);
    void recursive_scan(const fs::path& current_dir, const fs::path& root_dir,
                        bool ignored_context, std::vector<fs::path>& results) const;
    bool matches_any(const std::string& segment, const std::vector<std::string>& patterns) const;

    AnalysisSlot analyze_one(const fs::path& root, const fs::path& file) const;
    static std::string calculate_file_hash(const fs::path& file_path);

    // --- single-writer helpers; caller holds the unique lock ---
    void merge_file_locked(FileAnalysis analysis);
    void erase_file_locked(const std::string& rel_path);
    void resolve_file_locked(FileAnalysis& analysis);
    void relink_dependents_locked(const std::string& new_rel_path);
    std::optional<std::string> resolve_module_locked(const std::string& source_file,
                                                     const Dependency& dep,
                                                     Language language) const;
    void sort_edges_locked();
};

} // namespace code_intelligence
