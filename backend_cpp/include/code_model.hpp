#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "diagnostics.hpp"

namespace code_intelligence {

enum class Language { Python, JavaScript, TypeScript, Cpp, Go, Rust, Swift, Unknown };

enum class SymbolKind { Function, Method, Class, Struct, Constant, Variable, Import };

enum class AnalysisMode { Grammar, Heuristic, None };

const char* to_string(Language lang);
const char* to_string(SymbolKind kind);
const char* to_string(AnalysisMode mode);
Language language_from_string(const std::string& name);
std::optional<SymbolKind> symbol_kind_from_string(const std::string& name);

// Graph label for a symbol kind ("Function", "Class", ...).
const char* graph_label(SymbolKind kind);

Language detect_language(const std::string& file_path);

std::string make_symbol_id(SymbolKind kind, const std::string& file_path,
                           const std::string& name, int line_start);
std::string make_file_id(const std::string& file_path);

// "pkg/mod.py" -> "pkg.mod"
std::string module_name_for(const std::string& file_path);

// Name a call or base list entry refers to: "self.helper" -> "helper", "ns::Base<T>" -> "Base".
std::string referenced_name(const std::string& raw);

struct Symbol {
    std::string id;
    std::string name;
    std::string qualified_name;
    SymbolKind kind = SymbolKind::Function;
    std::string file_path;
    int line_start = 0;   // 1-based
    int line_end = 0;
    int column_start = 0;
    int column_end = 0;
    std::string scope = "global";
    std::optional<std::string> parent_id;
    std::vector<std::string> parameters;
    bool is_async = false;
    std::optional<std::string> docstring;
    int complexity = 1;
    std::string signature;
    std::vector<std::string> bases;
    std::vector<std::string> calls;

    nlohmann::json to_json() const;
    static Symbol from_json(const nlohmann::json& j);
};

struct Dependency {
    std::string source_module;
    std::string target_module;
    bool is_external = true;
    std::string import_statement;
    int line = 0;
    std::vector<std::string> imported_names;
    std::optional<std::string> resolved_file;

    nlohmann::json to_json() const;
    static Dependency from_json(const nlohmann::json& j);
};

struct ComplexityMetrics {
    double cyclomatic_complexity = 1.0;
    int max_complexity = 1;
    int lines_of_code = 0;
    int number_of_functions = 0;
    int number_of_classes = 0;
    double maintainability_index = 0.0;

    nlohmann::json to_json() const;
    static ComplexityMetrics from_json(const nlohmann::json& j);
};

// Recomputes averages and the maintainability index from the symbol list.
ComplexityMetrics compute_metrics(const std::vector<Symbol>& symbols, int lines_of_code);

struct FileAnalysis {
    std::string file_path;
    Language language = Language::Unknown;
    std::vector<Symbol> symbols;
    std::vector<Dependency> dependencies;
    ComplexityMetrics complexity_metrics;
    std::vector<std::string> parsing_errors;
    AnalysisMode analysis_mode = AnalysisMode::None;
    std::string content_hash;

    std::string id() const { return make_file_id(file_path); }
    bool degraded() const { return analysis_mode == AnalysisMode::Heuristic; }

    nlohmann::json to_json() const;
    static FileAnalysis from_json(const nlohmann::json& j);
};

// Resolved intra-project edge between two indexed files.
struct DependencyEdge {
    std::string source_file;
    std::string target_file;
    std::string target_module;
    std::string import_statement;
    int line = 0;

    bool operator<(const DependencyEdge& other) const;
    bool operator==(const DependencyEdge& other) const;
    nlohmann::json to_json() const;
};

struct ProjectIndex {
    std::string root_path;
    std::string project_id;
    uint64_t generation = 0;
    bool cancelled = false;

    std::map<std::string, FileAnalysis> files;
    std::map<std::string, Symbol> symbols;
    std::map<std::string, std::vector<std::string>> symbol_table;   // qualified name -> ids
    std::map<std::string, std::vector<std::string>> name_table;     // simple name -> ids
    std::map<std::string, std::vector<std::string>> reference_table; // called/inherited name -> referring ids
    std::vector<DependencyEdge> dependency_edges;
    std::vector<Diagnostic> diagnostics;

    size_t symbol_count() const { return symbols.size(); }
    size_t file_count() const { return files.size(); }

    // All symbols whose simple or qualified name matches.
    std::vector<const Symbol*> find_symbols(const std::string& name) const;
    // Symbols whose calls or bases mention `name`.
    std::vector<const Symbol*> find_referrers(const std::string& name) const;

    // Keeps symbols and the three lookup tables in step.
    void add_symbol(const Symbol& sym);
    void erase_symbol(const Symbol& sym);
    const FileAnalysis* find_file(const std::string& file_path) const;

    nlohmann::json summary_json() const;
};

} // namespace code_intelligence
