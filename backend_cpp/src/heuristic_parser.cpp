#include "heuristic_parser.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <regex>
#include <set>
#include <spdlog/spdlog.h>

namespace code_intelligence {

namespace {

// Lines longer than this are generated or minified; regexes skip them.
constexpr size_t kMaxScanLine = 400;

const std::set<std::string>& control_keywords() {
    static const std::set<std::string> kw = {
        "if", "elif", "else", "for", "while", "do", "switch", "case", "return", "catch",
        "try", "except", "with", "new", "delete", "throw", "sizeof", "typeof", "await",
        "yield", "function", "def", "class", "struct", "print", "not", "and", "or", "in",
        "lambda", "assert", "super", "import", "from", "require", "defer", "go", "match",
        "loop", "fn", "func", "decltype", "static_assert", "alignof", "raise", "del"};
    return kw;
}

int indent_of(const std::string& line) {
    int n = 0;
    for (char c : line) {
        if (c == ' ') n++;
        else if (c == '\t') n += 4;
        else break;
    }
    return n;
}

bool is_blank_or_comment(const std::string& line, const char* comment_prefix) {
    std::string t = trim(line);
    return t.empty() || starts_with(t, comment_prefix);
}

// Drops string literal bodies and trailing line comments so that braces and
// keywords inside them are not counted.
std::string strip_code_noise(const std::string& line, bool hash_comments) {
    std::string out;
    out.reserve(line.size());
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == '\\') { ++i; continue; }
            if (c == quote) { quote = 0; out += c; }
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') { quote = c; out += c; continue; }
        if (hash_comments && c == '#') break;
        if (!hash_comments && c == '/' && i + 1 < line.size() && line[i + 1] == '/') break;
        out += c;
    }
    return out;
}

std::vector<std::string> split_params(const std::string& raw, bool drop_self) {
    std::vector<std::string> params;
    std::string current;
    int depth = 0;
    auto flush = [&]() {
        std::string p = trim(current);
        current.clear();
        if (p.empty()) return;
        // name is the part before ':' or '=' (python / ts) ...
        size_t cut = p.find_first_of(":=");
        std::string name = trim(p.substr(0, cut));
        // ... or the last word of a C-style declaration
        size_t space = name.find_last_of(" \t*&");
        if (space != std::string::npos && cut == std::string::npos) name = name.substr(space + 1);
        while (!name.empty() && (name.front() == '*' || name.front() == '&' || name.front() == '.')) {
            name.erase(name.begin());
        }
        if (name.empty() || name == "void") return;
        if (drop_self && (name == "self" || name == "cls")) return;
        params.push_back(name);
    };
    for (char c : raw) {
        if (c == '(' || c == '[' || c == '{' || c == '<') depth++;
        else if (c == ')' || c == ']' || c == '}' || c == '>') depth--;
        if (c == ',' && depth == 0) { flush(); continue; }
        current += c;
    }
    flush();
    return params;
}

// Text between the first '(' at or after `line_idx`/`col` and its match.
std::string collect_parenthesized(const std::vector<std::string>& lines, size_t line_idx) {
    std::string out;
    int depth = 0;
    bool started = false;
    for (size_t i = line_idx; i < lines.size() && i < line_idx + 20; ++i) {
        for (char c : lines[i]) {
            if (c == '(') {
                if (started) out += c;
                depth++;
                started = true;
                continue;
            }
            if (c == ')' && started) {
                depth--;
                if (depth == 0) return out;
            }
            if (started) out += c;
        }
        if (started) out += ' ';
    }
    return out;
}

std::vector<std::string> extract_calls(const std::vector<std::string>& lines, int from, int to,
                                       const std::string& self_name, bool hash_comments) {
    static const std::regex call_re(R"(([A-Za-z_$][\w$]*)\s*\()");
    std::vector<std::string> calls;
    std::set<std::string> seen;
    for (int i = from; i <= to && i < static_cast<int>(lines.size()); ++i) {
        if (lines[i].size() > kMaxScanLine) continue;
        std::string code = strip_code_noise(lines[i], hash_comments);
        for (auto it = std::sregex_iterator(code.begin(), code.end(), call_re);
             it != std::sregex_iterator(); ++it) {
            std::string name = (*it)[1].str();
            if (i == from && name == self_name) continue;
            if (control_keywords().count(name)) continue;
            if (seen.insert(name).second) calls.push_back(name);
        }
    }
    return calls;
}

int count_branches(const std::vector<std::string>& lines, int from, int to, bool python) {
    static const std::regex py_re(R"(\b(if|elif|for|while|except|and|or|case)\b)");
    static const std::regex c_re(R"(\b(if|for|while|case|catch)\b|&&|\|\||\s\?\s)");
    const std::regex& re = python ? py_re : c_re;
    int count = 0;
    for (int i = from; i <= to && i < static_cast<int>(lines.size()); ++i) {
        if (lines[i].size() > kMaxScanLine) continue;
        std::string code = strip_code_noise(lines[i], python);
        count += static_cast<int>(std::distance(
            std::sregex_iterator(code.begin(), code.end(), re), std::sregex_iterator()));
    }
    return count;
}

// Index of the line holding the closing brace of the block opened at or after `start`.
int find_brace_block_end(const std::vector<std::string>& lines, int start, bool* found_open) {
    int depth = 0;
    bool opened = false;
    for (int i = start; i < static_cast<int>(lines.size()); ++i) {
        std::string code = strip_code_noise(lines[i], false);
        for (char c : code) {
            if (c == '{') { depth++; opened = true; }
            else if (c == '}') depth--;
        }
        if (opened && depth <= 0) {
            if (found_open) *found_open = true;
            return i;
        }
        // A declaration with no body ends on its own line.
        if (!opened && i > start + 2) break;
        if (!opened && !code.empty() && code.find(';') != std::string::npos) break;
    }
    if (found_open) *found_open = opened;
    return opened ? static_cast<int>(lines.size()) - 1 : start;
}

std::optional<std::string> preceding_comment(const std::vector<std::string>& lines, int idx) {
    if (idx <= 0) return std::nullopt;
    int i = idx - 1;
    std::string prev = trim(lines[i]);
    if (ends_with(prev, "*/")) {
        std::vector<std::string> block;
        while (i >= 0) {
            std::string t = trim(lines[i]);
            block.push_back(t);
            if (starts_with(t, "/*")) break;
            --i;
        }
        std::reverse(block.begin(), block.end());
        std::string text;
        for (auto& l : block) {
            std::string cleaned = l;
            for (const char* tok : {"/**", "/*", "*/"}) {
                size_t pos;
                while ((pos = cleaned.find(tok)) != std::string::npos) cleaned.erase(pos, std::string(tok).size());
            }
            cleaned = trim(cleaned);
            if (starts_with(cleaned, "*")) cleaned = trim(cleaned.substr(1));
            if (cleaned.empty()) continue;
            if (!text.empty()) text += "\n";
            text += cleaned;
        }
        if (!text.empty()) return text;
        return std::nullopt;
    }
    if (starts_with(prev, "//")) {
        std::vector<std::string> block;
        while (i >= 0 && starts_with(trim(lines[i]), "//")) {
            std::string t = trim(lines[i]);
            size_t cut = t.find_first_not_of('/');
            block.push_back(cut == std::string::npos ? "" : trim(t.substr(cut)));
            --i;
        }
        std::reverse(block.begin(), block.end());
        std::string text;
        for (auto& l : block) {
            if (!text.empty()) text += "\n";
            text += l;
        }
        return text;
    }
    return std::nullopt;
}

bool is_all_caps(const std::string& name) {
    bool has_alpha = false;
    for (char c : name) {
        if (std::islower(static_cast<unsigned char>(c))) return false;
        if (std::isalpha(static_cast<unsigned char>(c))) has_alpha = true;
    }
    return has_alpha;
}

Symbol make_symbol(const FileAnalysis& fa, SymbolKind kind, const std::string& name,
                   int line_idx, int end_idx, const std::vector<std::string>& lines) {
    Symbol s;
    s.kind = kind;
    s.name = name;
    s.qualified_name = name;
    s.file_path = fa.file_path;
    s.line_start = line_idx + 1;
    s.line_end = end_idx + 1;
    s.column_start = indent_of(lines[line_idx]);
    s.column_end = static_cast<int>(lines[end_idx].size());
    s.id = make_symbol_id(kind, fa.file_path, name, s.line_start);
    s.signature = utf8_safe_substr(trim(lines[line_idx]), 200);
    return s;
}

void add_import(FileAnalysis& fa, const std::string& module, const std::string& statement,
                int line_idx, std::vector<std::string> names, const std::vector<std::string>& lines) {
    if (module.empty()) return;
    Dependency d;
    d.source_module = module_name_for(fa.file_path);
    d.target_module = module;
    d.import_statement = utf8_safe_substr(trim(statement), 200);
    d.line = line_idx + 1;
    d.imported_names = std::move(names);
    d.is_external = !(starts_with(module, ".") || starts_with(module, "/"));
    fa.dependencies.push_back(d);

    Symbol s = make_symbol(fa, SymbolKind::Import, module, line_idx, line_idx, lines);
    fa.symbols.push_back(s);
}

std::vector<std::string> split_import_names(const std::string& raw) {
    std::vector<std::string> names;
    std::string cleaned;
    for (char c : raw) {
        if (c == '(' || c == ')' || c == '{' || c == '}') continue;
        cleaned += c;
    }
    for (auto& part : split(cleaned, ',')) {
        std::string p = trim(part);
        if (p.empty()) continue;
        size_t as = p.find(" as ");
        if (as != std::string::npos) p = trim(p.substr(0, as));
        if (starts_with(p, "* ")) continue;
        if (starts_with(p, "type ")) p = trim(p.substr(5));
        names.push_back(p);
    }
    return names;
}

} // namespace

FileAnalysis HeuristicParser::parse(const std::string& file_path,
                                    const std::string& content,
                                    Language language) {
    FileAnalysis fa;
    fa.file_path = file_path;
    fa.language = language;
    fa.analysis_mode = AnalysisMode::Heuristic;

    std::vector<std::string> lines = split_lines(content);
    if (language == Language::Python) {
        parse_python(fa, lines);
    } else {
        parse_brace_language(fa, lines);
    }

    std::stable_sort(fa.symbols.begin(), fa.symbols.end(), [](const Symbol& a, const Symbol& b) {
        return a.line_start < b.line_start;
    });
    fa.complexity_metrics = compute_metrics(fa.symbols, static_cast<int>(lines.size()));
    spdlog::debug("🧩 Heuristic scan of {}: {} symbols, {} imports",
                  file_path, fa.symbols.size(), fa.dependencies.size());
    return fa;
}

void HeuristicParser::parse_python(FileAnalysis& fa, const std::vector<std::string>& lines) {
    static const std::regex def_re(R"(^(\s*)(async\s+)?def\s+([A-Za-z_]\w*)\s*\()");
    static const std::regex class_re(R"(^(\s*)class\s+([A-Za-z_]\w*)\s*(?:\(([^)]*)\))?\s*:)");
    static const std::regex import_re(R"(^\s*import\s+(.+)$)");
    static const std::regex from_re(R"(^\s*from\s+(\.*[\w.]*)\s+import\s+(.+)$)");
    static const std::regex assign_re(R"(^([A-Za-z_]\w*)\s*(?::[^=]*)?=[^=])");

    struct Open { int indent; size_t index; };
    std::vector<Open> stack;

    auto block_end = [&](size_t i, int indent) {
        size_t end = i;
        for (size_t k = i + 1; k < lines.size(); ++k) {
            if (is_blank_or_comment(lines[k], "#")) continue;
            if (indent_of(lines[k]) <= indent) break;
            end = k;
        }
        return end;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.size() > kMaxScanLine || is_blank_or_comment(line, "#")) continue;

        int indent = indent_of(line);
        while (!stack.empty() && stack.back().indent >= indent) stack.pop_back();

        std::smatch m;
        if (std::regex_search(line, m, def_re)) {
            std::string name = m[3].str();
            size_t end = block_end(i, indent);
            const Symbol* parent = stack.empty() ? nullptr : &fa.symbols[stack.back().index];
            SymbolKind kind = (parent && parent->kind == SymbolKind::Class)
                                  ? SymbolKind::Method : SymbolKind::Function;

            Symbol s = make_symbol(fa, kind, name, static_cast<int>(i), static_cast<int>(end), lines);
            s.is_async = m[2].matched;
            s.parameters = split_params(collect_parenthesized(lines, i), true);
            if (parent) {
                s.parent_id = parent->id;
                s.qualified_name = parent->qualified_name + "." + name;
                s.scope = parent->kind == SymbolKind::Class ? "class" : "function";
            }

            // Docstring: first statement of the body when it is a string literal.
            size_t header_end = i;
            while (header_end < end && !ends_with(trim(strip_code_noise(lines[header_end], true)), ":")) {
                ++header_end;
            }
            for (size_t k = header_end + 1; k <= end && k < lines.size(); ++k) {
                std::string t = trim(lines[k]);
                if (t.empty()) continue;
                if (starts_with(t, "\"\"\"") || starts_with(t, "'''")) {
                    std::string quote = t.substr(0, 3);
                    std::string body = t.substr(3);
                    size_t close = body.find(quote);
                    size_t k2 = k;
                    while (close == std::string::npos && k2 + 1 <= end && k2 + 1 < lines.size()) {
                        ++k2;
                        body += "\n" + trim(lines[k2]);
                        close = body.find(quote);
                    }
                    s.docstring = trim(body.substr(0, close));
                }
                break;
            }

            s.complexity = 1 + count_branches(lines, static_cast<int>(i) + 1, static_cast<int>(end), true);
            s.calls = extract_calls(lines, static_cast<int>(i), static_cast<int>(end), name, true);
            fa.symbols.push_back(s);
            stack.push_back({indent, fa.symbols.size() - 1});
            continue;
        }

        if (std::regex_search(line, m, class_re)) {
            std::string name = m[2].str();
            size_t end = block_end(i, indent);
            Symbol s = make_symbol(fa, SymbolKind::Class, name, static_cast<int>(i), static_cast<int>(end), lines);
            if (m[3].matched) {
                for (auto& b : split(m[3].str(), ',')) {
                    std::string base = trim(b);
                    if (!base.empty() && base.find('=') == std::string::npos) s.bases.push_back(base);
                }
            }
            if (!stack.empty()) {
                const Symbol& parent = fa.symbols[stack.back().index];
                s.parent_id = parent.id;
                s.qualified_name = parent.qualified_name + "." + name;
                s.scope = parent.kind == SymbolKind::Class ? "class" : "function";
            }
            fa.symbols.push_back(s);
            stack.push_back({indent, fa.symbols.size() - 1});
            continue;
        }

        // Trailing "# ..." is not part of an import.
        const std::string code = line.substr(0, line.find('#'));
        if (std::regex_search(code, m, from_re)) {
            add_import(fa, m[1].str(), line, static_cast<int>(i), split_import_names(m[2].str()), lines);
            continue;
        }

        if (std::regex_search(code, m, import_re)) {
            for (auto& name : split_import_names(m[1].str())) {
                add_import(fa, name, line, static_cast<int>(i), {}, lines);
            }
            continue;
        }

        if (indent == 0 && std::regex_search(line, m, assign_re)) {
            std::string name = m[1].str();
            if (starts_with(name, "_")) continue;
            SymbolKind kind = is_all_caps(name) ? SymbolKind::Constant : SymbolKind::Variable;
            fa.symbols.push_back(make_symbol(fa, kind, name, static_cast<int>(i), static_cast<int>(i), lines));
        }
    }
}

void HeuristicParser::parse_brace_language(FileAnalysis& fa, const std::vector<std::string>& lines) {
    const Language lang = fa.language;
    const bool js_like = lang == Language::JavaScript || lang == Language::TypeScript;

    // JavaScript / TypeScript
    static const std::regex js_import_from(R"(^\s*import\s+(?:type\s+)?(.+?)\s+from\s+['"]([^'"]+)['"])");
    static const std::regex js_import_bare(R"(^\s*import\s+['"]([^'"]+)['"])");
    static const std::regex js_export_from(R"(^\s*export\s+(?:\*|\{[^}]*\})\s+from\s+['"]([^'"]+)['"])");
    static const std::regex js_require(R"(require\(\s*['"]([^'"]+)['"]\s*\))");
    static const std::regex js_function(R"(^\s*(?:export\s+)?(?:default\s+)?(async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*))");
    static const std::regex js_arrow(R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=]+)?=\s*(async\s+)?(?:function\b|\([^)]*\)\s*(?::[^=]+)?=>|[A-Za-z_$][\w$]*\s*=>))");
    static const std::regex js_class(R"(^\s*(?:export\s+)?(?:default\s+)?(?:abstract\s+)?class\s+([A-Za-z_$][\w$]*)(?:\s*<[^>]*>)?(?:\s+extends\s+([A-Za-z_$][\w$.]*))?)");
    static const std::regex js_method(R"(^\s*(?:(?:public|private|protected|static|readonly|override|abstract|get|set)\s+)*(async\s+)?\*?([A-Za-z_$][\w$]*)\s*(?:<[^>]*>)?\s*\([^)]*\)\s*(?::[^{]+)?\{)");
    static const std::regex js_var(R"(^(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*))");

    // C / C++
    static const std::regex cpp_include(R"(^\s*#\s*include\s*[<"]([^>"]+)[>"])");
    static const std::regex cpp_class(R"(^\s*(?:template\s*<[^>]*>\s*)?(class|struct)\s+(?:[A-Z_]+\s+)?([A-Za-z_]\w*)\s*(?:final\s*)?(?::\s*([^{]*))?\{?\s*$)");

    // Go / Rust / Swift
    static const std::regex go_func(R"(^func\s+(?:\(\s*\w*\s*\*?(\w+)\s*\)\s*)?([A-Za-z_]\w*)\s*\()");
    static const std::regex go_type(R"(^type\s+(\w+)\s+(struct|interface)\b)");
    static const std::regex go_import(R"re(^\s*(?:import\s+)?(?:[\w.]+\s+)?"([^"]+)"\s*$)re");
    static const std::regex rust_fn(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:const\s+)?(async\s+)?(?:unsafe\s+)?(?:extern\s+"[^"]*"\s+)?fn\s+([A-Za-z_]\w*))");
    static const std::regex rust_type(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(struct|enum|trait)\s+([A-Za-z_]\w*))");
    static const std::regex rust_impl(R"(^\s*impl(?:<[^>]*>)?\s+(?:[\w:]+(?:<[^>]*>)?\s+for\s+)?([A-Za-z_]\w*))");
    static const std::regex rust_use(R"(^\s*(?:pub\s+)?use\s+([\w:]+))");
    static const std::regex swift_func(R"(^\s*(?:(?:public|private|internal|fileprivate|open|static|final|override|mutating|@\w+)\s+)*func\s+([A-Za-z_]\w*))");
    static const std::regex swift_type(R"(^\s*(?:(?:public|private|internal|fileprivate|open|final)\s+)*(class|struct|enum|protocol|extension)\s+([A-Za-z_]\w*)(?:\s*:\s*([^{]+))?)");
    static const std::regex swift_import(R"(^\s*import\s+([\w.]+))");

    std::vector<int> depth_before(lines.size(), 0);
    {
        int depth = 0;
        for (size_t i = 0; i < lines.size(); ++i) {
            depth_before[i] = depth;
            for (char c : strip_code_noise(lines[i], false)) {
                if (c == '{') depth++;
                else if (c == '}') depth = std::max(0, depth - 1);
            }
        }
    }

    // Pass 1: containers and imports.
    struct Container { size_t index; int start; int end; };
    std::vector<Container> containers;
    std::set<size_t> consumed;
    bool in_go_import_block = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.size() > kMaxScanLine) continue;
        std::smatch m;
        int ii = static_cast<int>(i);

        if (js_like) {
            if (std::regex_search(line, m, js_import_from)) {
                add_import(fa, m[2].str(), line, ii, split_import_names(m[1].str()), lines);
                continue;
            }
            if (std::regex_search(line, m, js_import_bare) || std::regex_search(line, m, js_export_from)) {
                add_import(fa, m[1].str(), line, ii, {}, lines);
                continue;
            }
            if (line.find("require(") != std::string::npos && std::regex_search(line, m, js_require)) {
                add_import(fa, m[1].str(), line, ii, {}, lines);
            }
            if (std::regex_search(line, m, js_class)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                Symbol s = make_symbol(fa, SymbolKind::Class, m[1].str(), ii, end, lines);
                if (m[2].matched) s.bases.push_back(m[2].str());
                s.docstring = preceding_comment(lines, ii);
                fa.symbols.push_back(s);
                containers.push_back({fa.symbols.size() - 1, ii, end});
                consumed.insert(i);
            }
        } else if (lang == Language::Cpp) {
            if (std::regex_search(line, m, cpp_include)) {
                add_import(fa, m[1].str(), line, ii, {}, lines);
                if (line.find('"') != std::string::npos) fa.dependencies.back().is_external = false;
                continue;
            }
            if (std::regex_search(line, m, cpp_class)) {
                bool opened = false;
                int end = find_brace_block_end(lines, ii, &opened);
                if (!opened) continue; // forward declaration
                SymbolKind kind = m[1].str() == "class" ? SymbolKind::Class : SymbolKind::Struct;
                Symbol s = make_symbol(fa, kind, m[2].str(), ii, end, lines);
                if (m[3].matched) {
                    for (auto& b : split(m[3].str(), ',')) {
                        std::string base = trim(b);
                        for (const char* access : {"public ", "protected ", "private ", "virtual "}) {
                            if (starts_with(base, access)) base = trim(base.substr(std::string(access).size()));
                        }
                        if (!base.empty()) s.bases.push_back(base);
                    }
                }
                s.docstring = preceding_comment(lines, ii);
                fa.symbols.push_back(s);
                containers.push_back({fa.symbols.size() - 1, ii, end});
                consumed.insert(i);
            }
        } else if (lang == Language::Go) {
            std::string t = trim(line);
            if (starts_with(t, "import (")) { in_go_import_block = true; continue; }
            if (in_go_import_block && t == ")") { in_go_import_block = false; continue; }
            if ((in_go_import_block || starts_with(t, "import ")) && std::regex_search(line, m, go_import)) {
                add_import(fa, m[1].str(), line, ii, {}, lines);
                continue;
            }
            if (std::regex_search(line, m, go_type)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                SymbolKind kind = m[2].str() == "struct" ? SymbolKind::Struct : SymbolKind::Class;
                Symbol s = make_symbol(fa, kind, m[1].str(), ii, end, lines);
                s.docstring = preceding_comment(lines, ii);
                fa.symbols.push_back(s);
                consumed.insert(i);
            }
        } else if (lang == Language::Rust) {
            if (std::regex_search(line, m, rust_use)) {
                add_import(fa, m[1].str(), line, ii, {}, lines);
                continue;
            }
            if (std::regex_search(line, m, rust_type)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                SymbolKind kind = m[1].str() == "struct" ? SymbolKind::Struct : SymbolKind::Class;
                Symbol s = make_symbol(fa, kind, m[2].str(), ii, end, lines);
                s.docstring = preceding_comment(lines, ii);
                fa.symbols.push_back(s);
                if (kind == SymbolKind::Class) containers.push_back({fa.symbols.size() - 1, ii, end});
                consumed.insert(i);
            }
        } else if (lang == Language::Swift) {
            if (std::regex_search(line, m, swift_import)) {
                add_import(fa, m[1].str(), line, ii, {}, lines);
                continue;
            }
            if (std::regex_search(line, m, swift_type) && m[1].str() != "extension") {
                int end = find_brace_block_end(lines, ii, nullptr);
                SymbolKind kind = m[1].str() == "struct" ? SymbolKind::Struct : SymbolKind::Class;
                Symbol s = make_symbol(fa, kind, m[2].str(), ii, end, lines);
                if (m[3].matched) {
                    for (auto& b : split(m[3].str(), ',')) {
                        if (!trim(b).empty()) s.bases.push_back(trim(b));
                    }
                }
                s.docstring = preceding_comment(lines, ii);
                fa.symbols.push_back(s);
                containers.push_back({fa.symbols.size() - 1, ii, end});
                consumed.insert(i);
            }
        }
    }

    // Rust impl blocks own methods without being symbols themselves.
    std::vector<std::pair<std::string, std::pair<int, int>>> impl_blocks;
    if (lang == Language::Rust) {
        for (size_t i = 0; i < lines.size(); ++i) {
            std::smatch m;
            if (lines[i].size() <= kMaxScanLine && std::regex_search(lines[i], m, rust_impl)) {
                int end = find_brace_block_end(lines, static_cast<int>(i), nullptr);
                impl_blocks.push_back({m[1].str(), {static_cast<int>(i), end}});
            }
        }
    }

    auto enclosing_container = [&](int line_idx) -> const Symbol* {
        const Container* best = nullptr;
        for (const auto& c : containers) {
            if (line_idx > c.start && line_idx <= c.end) {
                if (!best || c.start > best->start) best = &c;
            }
        }
        return best ? &fa.symbols[best->index] : nullptr;
    };

    auto attach_parent = [&](Symbol& s, int line_idx) {
        if (const Symbol* parent = enclosing_container(line_idx)) {
            s.kind = SymbolKind::Method;
            s.parent_id = parent->id;
            s.qualified_name = parent->qualified_name + "." + s.name;
            s.scope = "class";
            s.id = make_symbol_id(s.kind, s.file_path, s.name, s.line_start);
            return;
        }
        for (const auto& [type_name, range] : impl_blocks) {
            if (line_idx > range.first && line_idx <= range.second) {
                s.kind = SymbolKind::Method;
                s.qualified_name = type_name + "." + s.name;
                s.scope = "class";
                s.id = make_symbol_id(s.kind, s.file_path, s.name, s.line_start);
                for (const auto& other : fa.symbols) {
                    if (other.name == type_name &&
                        (other.kind == SymbolKind::Struct || other.kind == SymbolKind::Class)) {
                        s.parent_id = other.id;
                        break;
                    }
                }
                return;
            }
        }
    };

    auto finish_function = [&](Symbol s, int line_idx, int end, bool is_async) {
        s.is_async = is_async;
        s.parameters = split_params(collect_parenthesized(lines, static_cast<size_t>(line_idx)), false);
        s.docstring = preceding_comment(lines, line_idx);
        s.complexity = 1 + count_branches(lines, line_idx, end, false);
        s.calls = extract_calls(lines, line_idx, end, s.name, false);
        attach_parent(s, line_idx);
        fa.symbols.push_back(s);
    };

    // Pass 2: functions, methods and top-level values.
    for (size_t i = 0; i < lines.size(); ++i) {
        if (consumed.count(i)) continue;
        const std::string& line = lines[i];
        if (line.size() > kMaxScanLine) continue;
        int ii = static_cast<int>(i);
        std::smatch m;

        if (js_like) {
            if (std::regex_search(line, m, js_function)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                finish_function(make_symbol(fa, SymbolKind::Function, m[2].str(), ii, end, lines), ii, end, m[1].matched);
                continue;
            }
            if (std::regex_search(line, m, js_arrow)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                finish_function(make_symbol(fa, SymbolKind::Function, m[1].str(), ii, end, lines), ii, end, m[2].matched);
                continue;
            }
            if (enclosing_container(ii) && std::regex_search(line, m, js_method) &&
                !control_keywords().count(m[2].str())) {
                int end = find_brace_block_end(lines, ii, nullptr);
                finish_function(make_symbol(fa, SymbolKind::Method, m[2].str(), ii, end, lines), ii, end, m[1].matched);
                continue;
            }
            if (depth_before[i] == 0 && std::regex_search(line, m, js_var)) {
                std::string name = m[1].str();
                if (starts_with(name, "_")) continue;
                SymbolKind kind = is_all_caps(name) ? SymbolKind::Constant : SymbolKind::Variable;
                fa.symbols.push_back(make_symbol(fa, kind, name, ii, ii, lines));
            }
        } else if (lang == Language::Cpp) {
            std::string code = trim(strip_code_noise(line, false));
            if (code.empty() || code[0] == '#' || ends_with(code, ";")) continue;
            size_t paren = code.find('(');
            if (paren == std::string::npos || paren == 0) continue;

            size_t name_end = paren;
            while (name_end > 0 && code[name_end - 1] == ' ') --name_end;
            size_t name_start = name_end;
            while (name_start > 0) {
                char c = code[name_start - 1];
                if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '~') --name_start;
                else break;
            }
            std::string full_name = code.substr(name_start, name_end - name_start);
            std::string prefix = trim(code.substr(0, name_start));
            if (full_name.empty() || prefix.find('=') != std::string::npos) continue;
            if (prefix.empty() && full_name.find("::") == std::string::npos) continue;

            std::string first_word = prefix.substr(0, prefix.find_first_of(" \t(<"));
            if (control_keywords().count(first_word) || control_keywords().count(full_name)) continue;
            if (!prefix.empty() && (prefix.back() == '.' || ends_with(prefix, "->"))) continue;

            // Must open a body on this line or the next non-blank one.
            bool opens_body = code.find('{') != std::string::npos;
            if (!opens_body) {
                for (size_t k = i + 1; k < lines.size() && k <= i + 3; ++k) {
                    std::string t = trim(lines[k]);
                    if (t.empty()) continue;
                    opens_body = starts_with(t, "{") || (t.find('{') != std::string::npos && t.find(';') == std::string::npos &&
                                                         (starts_with(t, ":") || starts_with(t, "const") || starts_with(t, ")")));
                    if (t.find(';') != std::string::npos && !opens_body) break;
                    if (opens_body) break;
                }
            }
            if (!opens_body) continue;

            std::string name = full_name;
            std::string owner;
            size_t scope_sep = full_name.rfind("::");
            if (scope_sep != std::string::npos) {
                name = full_name.substr(scope_sep + 2);
                owner = full_name.substr(0, scope_sep);
            }
            if (name.empty()) continue;

            int end = find_brace_block_end(lines, ii, nullptr);
            Symbol s = make_symbol(fa, SymbolKind::Function, name, ii, end, lines);
            finish_function(s, ii, end, false);
            Symbol& added = fa.symbols.back();
            if (!owner.empty() && !added.parent_id) {
                added.kind = SymbolKind::Method;
                added.scope = "class";
                added.qualified_name = owner + "." + name;
                added.id = make_symbol_id(added.kind, added.file_path, added.name, added.line_start);
            }
            // Statements inside the body are not declarations.
            if (end > ii) i = static_cast<size_t>(end);
        } else if (lang == Language::Go) {
            if (std::regex_search(line, m, go_func)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                Symbol s = make_symbol(fa, SymbolKind::Function, m[2].str(), ii, end, lines);
                finish_function(s, ii, end, false);
                if (m[1].matched) {
                    Symbol& added = fa.symbols.back();
                    added.kind = SymbolKind::Method;
                    added.scope = "class";
                    added.qualified_name = m[1].str() + "." + added.name;
                    added.id = make_symbol_id(added.kind, added.file_path, added.name, added.line_start);
                    for (const auto& other : fa.symbols) {
                        if (other.name == m[1].str() && other.kind == SymbolKind::Struct) {
                            added.parent_id = other.id;
                            break;
                        }
                    }
                }
            }
        } else if (lang == Language::Rust) {
            if (std::regex_search(line, m, rust_fn)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                finish_function(make_symbol(fa, SymbolKind::Function, m[2].str(), ii, end, lines), ii, end, m[1].matched);
            }
        } else if (lang == Language::Swift) {
            if (std::regex_search(line, m, swift_func)) {
                int end = find_brace_block_end(lines, ii, nullptr);
                bool is_async = line.find(" async") != std::string::npos;
                finish_function(make_symbol(fa, SymbolKind::Function, m[1].str(), ii, end, lines), ii, end, is_async);
            }
        }
    }
}

} // namespace code_intelligence
