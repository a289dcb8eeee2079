#include "code_model.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <set>
#include <tuple>

namespace code_intelligence {

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* to_string(Language lang) {
    switch (lang) {
        case Language::Python: return "python";
        case Language::JavaScript: return "javascript";
        case Language::TypeScript: return "typescript";
        case Language::Cpp: return "cpp";
        case Language::Go: return "go";
        case Language::Rust: return "rust";
        case Language::Swift: return "swift";
        case Language::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return "function";
        case SymbolKind::Method: return "method";
        case SymbolKind::Class: return "class";
        case SymbolKind::Struct: return "struct";
        case SymbolKind::Constant: return "constant";
        case SymbolKind::Variable: return "variable";
        case SymbolKind::Import: return "import";
    }
    return "function";
}

const char* to_string(AnalysisMode mode) {
    switch (mode) {
        case AnalysisMode::Grammar: return "grammar";
        case AnalysisMode::Heuristic: return "heuristic";
        case AnalysisMode::None: return "none";
    }
    return "none";
}

Language language_from_string(const std::string& name) {
    static const std::map<std::string, Language> table = {
        {"python", Language::Python},         {"javascript", Language::JavaScript},
        {"typescript", Language::TypeScript}, {"cpp", Language::Cpp},
        {"go", Language::Go},                 {"rust", Language::Rust},
        {"swift", Language::Swift}};
    auto it = table.find(name);
    return it == table.end() ? Language::Unknown : it->second;
}

std::optional<SymbolKind> symbol_kind_from_string(const std::string& name) {
    static const std::map<std::string, SymbolKind> table = {
        {"function", SymbolKind::Function}, {"method", SymbolKind::Method},
        {"class", SymbolKind::Class},       {"struct", SymbolKind::Struct},
        {"constant", SymbolKind::Constant}, {"variable", SymbolKind::Variable},
        {"import", SymbolKind::Import}};
    auto it = table.find(name);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

const char* graph_label(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return "Function";
        case SymbolKind::Method: return "Method";
        case SymbolKind::Class: return "Class";
        case SymbolKind::Struct: return "Struct";
        case SymbolKind::Constant: return "Constant";
        case SymbolKind::Variable: return "Variable";
        case SymbolKind::Import: return "Import";
    }
    return "Symbol";
}

Language detect_language(const std::string& file_path) {
    std::string ext = fs::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    if (ext == ".py") return Language::Python;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs") return Language::JavaScript;
    if (ext == ".ts" || ext == ".tsx") return Language::TypeScript;
    if (ext == ".c" || ext == ".cc" || ext == ".cpp" || ext == ".cxx" ||
        ext == ".h" || ext == ".hpp" || ext == ".hh") return Language::Cpp;
    if (ext == ".go") return Language::Go;
    if (ext == ".rs") return Language::Rust;
    if (ext == ".swift") return Language::Swift;
    return Language::Unknown;
}

std::string make_symbol_id(SymbolKind kind, const std::string& file_path,
                           const std::string& name, int line_start) {
    return std::string(to_string(kind)) + ":" + file_path + ":" + name + ":" +
           std::to_string(line_start);
}

std::string make_file_id(const std::string& file_path) {
    return "file:" + file_path;
}

std::string module_name_for(const std::string& file_path) {
    fs::path p(file_path);
    p.replace_extension();
    std::string module;
    for (const auto& part : p) {
        std::string seg = part.string();
        if (seg.empty() || seg == "." || seg == "/") continue;
        if (!module.empty()) module += ".";
        module += seg;
    }
    if (ends_with(module, ".__init__")) module.resize(module.size() - 9);
    return module;
}

std::string referenced_name(const std::string& raw) {
    std::string name = raw.substr(0, raw.find_first_of("<(["));
    size_t cut = name.find_last_of(".:");
    if (cut != std::string::npos) name = name.substr(cut + 1);
    return name;
}

// --- Symbol ---

json Symbol::to_json() const {
    json j = {
        {"id", sanitize_utf8(id)},
        {"name", sanitize_utf8(name)},
        {"qualified_name", sanitize_utf8(qualified_name)},
        {"kind", to_string(kind)},
        {"file_path", sanitize_utf8(file_path)},
        {"line_start", line_start},
        {"line_end", line_end},
        {"column_start", column_start},
        {"column_end", column_end},
        {"scope", scope},
        {"parameters", parameters},
        {"is_async", is_async},
        {"complexity", complexity},
        {"signature", sanitize_utf8(signature)},
        {"bases", bases},
        {"calls", calls}
    };
    j["parent_id"] = parent_id ? json(*parent_id) : json(nullptr);
    j["docstring"] = docstring ? json(sanitize_utf8(*docstring)) : json(nullptr);
    return j;
}

Symbol Symbol::from_json(const json& j) {
    Symbol s;
    s.id = j.value("id", "");
    s.name = j.value("name", "");
    s.qualified_name = j.value("qualified_name", s.name);
    s.kind = symbol_kind_from_string(j.value("kind", "function")).value_or(SymbolKind::Function);
    s.file_path = j.value("file_path", "");
    s.line_start = j.value("line_start", 0);
    s.line_end = j.value("line_end", 0);
    s.column_start = j.value("column_start", 0);
    s.column_end = j.value("column_end", 0);
    s.scope = j.value("scope", "global");
    if (j.contains("parent_id") && j["parent_id"].is_string()) s.parent_id = j["parent_id"].get<std::string>();
    if (j.contains("parameters")) s.parameters = j["parameters"].get<std::vector<std::string>>();
    s.is_async = j.value("is_async", false);
    if (j.contains("docstring") && j["docstring"].is_string()) s.docstring = j["docstring"].get<std::string>();
    s.complexity = j.value("complexity", 1);
    s.signature = j.value("signature", "");
    if (j.contains("bases")) s.bases = j["bases"].get<std::vector<std::string>>();
    if (j.contains("calls")) s.calls = j["calls"].get<std::vector<std::string>>();
    return s;
}

// --- Dependency ---

json Dependency::to_json() const {
    json j = {
        {"source_module", source_module},
        {"target_module", target_module},
        {"is_external", is_external},
        {"import_statement", sanitize_utf8(import_statement)},
        {"line", line},
        {"imported_names", imported_names}
    };
    j["resolved_file"] = resolved_file ? json(*resolved_file) : json(nullptr);
    return j;
}

Dependency Dependency::from_json(const json& j) {
    Dependency d;
    d.source_module = j.value("source_module", "");
    d.target_module = j.value("target_module", "");
    d.is_external = j.value("is_external", true);
    d.import_statement = j.value("import_statement", "");
    d.line = j.value("line", 0);
    if (j.contains("imported_names")) d.imported_names = j["imported_names"].get<std::vector<std::string>>();
    if (j.contains("resolved_file") && j["resolved_file"].is_string()) {
        d.resolved_file = j["resolved_file"].get<std::string>();
    }
    return d;
}

// --- ComplexityMetrics ---

json ComplexityMetrics::to_json() const {
    return {
        {"cyclomatic_complexity", cyclomatic_complexity},
        {"max_complexity", max_complexity},
        {"lines_of_code", lines_of_code},
        {"number_of_functions", number_of_functions},
        {"number_of_classes", number_of_classes},
        {"maintainability_index", maintainability_index}
    };
}

ComplexityMetrics ComplexityMetrics::from_json(const json& j) {
    ComplexityMetrics m;
    m.cyclomatic_complexity = j.value("cyclomatic_complexity", 1.0);
    m.max_complexity = j.value("max_complexity", 1);
    m.lines_of_code = j.value("lines_of_code", 0);
    m.number_of_functions = j.value("number_of_functions", 0);
    m.number_of_classes = j.value("number_of_classes", 0);
    m.maintainability_index = j.value("maintainability_index", 0.0);
    return m;
}

ComplexityMetrics compute_metrics(const std::vector<Symbol>& symbols, int lines_of_code) {
    ComplexityMetrics m;
    m.lines_of_code = lines_of_code;

    int total = 0;
    for (const auto& s : symbols) {
        if (s.kind == SymbolKind::Function || s.kind == SymbolKind::Method) {
            m.number_of_functions++;
            total += s.complexity;
            m.max_complexity = std::max(m.max_complexity, s.complexity);
        } else if (s.kind == SymbolKind::Class || s.kind == SymbolKind::Struct) {
            m.number_of_classes++;
        }
    }

    m.cyclomatic_complexity = m.number_of_functions > 0
        ? static_cast<double>(total) / m.number_of_functions
        : 1.0;
    m.maintainability_index = std::max(
        0.0, 171.0 - 5.2 * m.cyclomatic_complexity - 0.23 * lines_of_code / 100.0);
    return m;
}

// --- FileAnalysis ---

json FileAnalysis::to_json() const {
    json syms = json::array();
    for (const auto& s : symbols) syms.push_back(s.to_json());
    json deps = json::array();
    for (const auto& d : dependencies) deps.push_back(d.to_json());

    return {
        {"file_path", sanitize_utf8(file_path)},
        {"language", to_string(language)},
        {"symbols", syms},
        {"dependencies", deps},
        {"complexity_metrics", complexity_metrics.to_json()},
        {"parsing_errors", parsing_errors},
        {"analysis_mode", to_string(analysis_mode)},
        {"degraded", degraded()},
        {"content_hash", content_hash}
    };
}

FileAnalysis FileAnalysis::from_json(const json& j) {
    FileAnalysis fa;
    fa.file_path = j.value("file_path", "");
    fa.language = language_from_string(j.value("language", "unknown"));
    if (j.contains("symbols")) {
        for (const auto& s : j["symbols"]) fa.symbols.push_back(Symbol::from_json(s));
    }
    if (j.contains("dependencies")) {
        for (const auto& d : j["dependencies"]) fa.dependencies.push_back(Dependency::from_json(d));
    }
    if (j.contains("complexity_metrics")) {
        fa.complexity_metrics = ComplexityMetrics::from_json(j["complexity_metrics"]);
    }
    if (j.contains("parsing_errors")) fa.parsing_errors = j["parsing_errors"].get<std::vector<std::string>>();
    std::string mode = j.value("analysis_mode", "none");
    fa.analysis_mode = mode == "grammar" ? AnalysisMode::Grammar
                     : mode == "heuristic" ? AnalysisMode::Heuristic
                     : AnalysisMode::None;
    fa.content_hash = j.value("content_hash", "");
    return fa;
}

// --- DependencyEdge ---

bool DependencyEdge::operator<(const DependencyEdge& other) const {
    return std::tie(source_file, target_file, line, target_module) <
           std::tie(other.source_file, other.target_file, other.line, other.target_module);
}

bool DependencyEdge::operator==(const DependencyEdge& other) const {
    return source_file == other.source_file && target_file == other.target_file &&
           line == other.line && target_module == other.target_module;
}

json DependencyEdge::to_json() const {
    return {
        {"source_file", source_file},
        {"target_file", target_file},
        {"target_module", target_module},
        {"import_statement", sanitize_utf8(import_statement)},
        {"line", line}
    };
}

// --- ProjectIndex ---

namespace {

std::vector<const Symbol*> lookup(const std::map<std::string, std::vector<std::string>>& table,
                                  const std::map<std::string, Symbol>& symbols, const std::string& key) {
    std::vector<const Symbol*> found;
    auto it = table.find(key);
    if (it == table.end()) return found;
    for (const auto& id : it->second) {
        auto sit = symbols.find(id);
        if (sit != symbols.end()) found.push_back(&sit->second);
    }
    return found;
}

void add_id(std::map<std::string, std::vector<std::string>>& table, const std::string& key, const std::string& id) {
    auto& ids = table[key];
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
}

void erase_id(std::map<std::string, std::vector<std::string>>& table, const std::string& key, const std::string& id) {
    auto it = table.find(key);
    if (it == table.end()) return;
    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    if (ids.empty()) table.erase(it);
}

std::set<std::string> references_of(const Symbol& sym) {
    std::set<std::string> names;
    for (const auto& call : sym.calls) names.insert(referenced_name(call));
    for (const auto& base : sym.bases) names.insert(referenced_name(base));
    names.erase("");
    return names;
}

} // namespace

std::vector<const Symbol*> ProjectIndex::find_symbols(const std::string& name) const {
    auto found = lookup(symbol_table, symbols, name);
    if (!found.empty()) return found;
    return lookup(name_table, symbols, name);
}

std::vector<const Symbol*> ProjectIndex::find_referrers(const std::string& name) const {
    return lookup(reference_table, symbols, name);
}

void ProjectIndex::add_symbol(const Symbol& sym) {
    symbols[sym.id] = sym;
    add_id(symbol_table, sym.qualified_name, sym.id);
    add_id(name_table, sym.name, sym.id);
    for (const auto& name : references_of(sym)) add_id(reference_table, name, sym.id);
}

void ProjectIndex::erase_symbol(const Symbol& sym) {
    symbols.erase(sym.id);
    erase_id(symbol_table, sym.qualified_name, sym.id);
    erase_id(name_table, sym.name, sym.id);
    for (const auto& name : references_of(sym)) erase_id(reference_table, name, sym.id);
}

const FileAnalysis* ProjectIndex::find_file(const std::string& file_path) const {
    auto it = files.find(file_path);
    return it == files.end() ? nullptr : &it->second;
}

json ProjectIndex::summary_json() const {
    size_t degraded = 0, with_errors = 0;
    std::map<std::string, int> by_language;
    for (const auto& [path, fa] : files) {
        if (fa.degraded()) degraded++;
        if (!fa.parsing_errors.empty()) with_errors++;
        by_language[to_string(fa.language)]++;
    }
    return {
        {"root_path", root_path},
        {"project_id", project_id},
        {"generation", generation},
        {"cancelled", cancelled},
        {"files", files.size()},
        {"symbols", symbols.size()},
        {"dependency_edges", dependency_edges.size()},
        {"degraded_files", degraded},
        {"files_with_errors", with_errors},
        {"languages", by_language},
        {"diagnostics", diagnostics_to_json(diagnostics)}
    };
}

} // namespace code_intelligence
