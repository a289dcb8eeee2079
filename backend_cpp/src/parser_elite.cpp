#include "parser_elite.hpp"
#include "text_utils.hpp"
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <set>
#include <stack>

namespace code_intelligence::elite {

namespace {

struct ParserDeleter {
    void operator()(TSParser* p) const { ts_parser_delete(p); }
};

struct TreeDeleter {
    void operator()(TSTree* t) const { ts_tree_delete(t); }
};

std::string type_of(TSNode node) {
    return ts_node_type(node);
}

std::string text_of(TSNode node, const std::string& src) {
    if (ts_node_is_null(node)) return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= src.size() || end <= start) return "";
    return src.substr(start, std::min<size_t>(end, src.size()) - start);
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

bool has_token_child(TSNode node, const char* token) {
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (type_of(ts_node_child(node, i)) == token) return true;
    }
    return false;
}

// First descendant of the given type in document order.
TSNode first_descendant(TSNode node, const std::set<std::string>& types) {
    std::stack<TSNode> stack;
    stack.push(node);
    while (!stack.empty()) {
        TSNode n = stack.top();
        stack.pop();
        if (types.count(type_of(n))) return n;
        uint32_t count = ts_node_named_child_count(n);
        for (uint32_t i = count; i > 0; --i) stack.push(ts_node_named_child(n, i - 1));
    }
    return TSNode{};
}

std::string strip_quotes(std::string s) {
    while (!s.empty() && std::strchr("rbuRBUf", s.front()) && s.size() > 1 &&
           (s[1] == '"' || s[1] == '\'' || std::strchr("rbuRBUf", s[1]))) {
        s.erase(s.begin());
    }
    for (const char* q : {"\"\"\"", "'''"}) {
        if (starts_with(s, q) && ends_with(s, q) && s.size() >= 6) return trim(s.substr(3, s.size() - 6));
    }
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'' || s.front() == '`' || s.front() == '<')) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string clean_comment(const std::string& raw) {
    std::string text;
    for (auto& line : split_lines(raw)) {
        std::string t = trim(line);
        for (const char* tok : {"/**", "/*", "*/", "///", "//"}) {
            if (starts_with(t, tok)) t = t.substr(std::strlen(tok));
            if (ends_with(t, "*/")) t = t.substr(0, t.size() - 2);
        }
        t = trim(t);
        if (starts_with(t, "*")) t = trim(t.substr(1));
        if (t.empty()) continue;
        if (!text.empty()) text += "\n";
        text += t;
    }
    return text;
}

bool is_all_caps(const std::string& name) {
    bool has_alpha = false;
    for (char c : name) {
        if (std::islower(static_cast<unsigned char>(c))) return false;
        if (std::isalpha(static_cast<unsigned char>(c))) has_alpha = true;
    }
    return has_alpha;
}

enum class Dialect { Python, Script, Cpp };

struct DialectTables {
    std::set<std::string> functions;
    std::set<std::string> branches;
    std::set<std::string> logical;     // binary nodes counted when their operator is boolean
    std::set<std::string> calls;
};

const DialectTables& tables_for(Dialect d) {
    static const DialectTables python{
        {"function_definition", "lambda"},
        {"if_statement", "elif_clause", "for_statement", "while_statement", "except_clause",
         "conditional_expression", "case_clause", "for_in_clause", "if_clause"},
        {"boolean_operator"},
        {"call"}};
    static const DialectTables script{
        {"function_declaration", "generator_function_declaration", "function_expression", "function",
         "arrow_function", "method_definition", "generator_function"},
        {"if_statement", "for_statement", "for_in_statement", "while_statement", "do_statement",
         "switch_case", "catch_clause", "ternary_expression"},
        {"binary_expression"},
        {"call_expression"}};
    static const DialectTables cpp{
        {"function_definition", "lambda_expression"},
        {"if_statement", "for_statement", "for_range_loop", "while_statement", "do_statement",
         "case_statement", "catch_clause", "conditional_expression"},
        {"binary_expression"},
        {"call_expression"}};
    switch (d) {
        case Dialect::Python: return python;
        case Dialect::Script: return script;
        case Dialect::Cpp: return cpp;
    }
    return python;
}

// Walks one syntax tree and fills a FileAnalysis.
class SymbolWalker {
public:
    SymbolWalker(FileAnalysis& out, const std::string& src, Dialect dialect)
        : out_(out), src_(src), dialect_(dialect), tables_(tables_for(dialect)) {}

    void walk(TSNode root) {
        struct Frame { TSNode node; int parent; bool top_level; };
        std::stack<Frame> stack;
        push_children(stack, root, -1, true);

        while (!stack.empty()) {
            Frame f = stack.top();
            stack.pop();
            TSNode node = f.node;
            std::string type = type_of(node);

            // Partial-tree policy: nothing inside an ERROR region is trusted.
            if (type == "ERROR") continue;

            int produced = -1;
            bool descend = true;
            switch (dialect_) {
                case Dialect::Python: produced = visit_python(node, type, f.parent, f.top_level, descend); break;
                case Dialect::Script: produced = visit_script(node, type, f.parent, f.top_level, descend); break;
                case Dialect::Cpp: produced = visit_cpp(node, type, f.parent, f.top_level, descend); break;
            }

            if (dialect_ != Dialect::Python && type == "call_expression") visit_require(node);
            if (!descend) continue;

            if (produced >= 0) {
                TSNode body = field(node, "body");
                if (ts_node_is_null(body)) {
                    TSNode value = field(node, "value");
                    if (!ts_node_is_null(value)) body = field(value, "body");
                }
                if (!ts_node_is_null(body)) push_children(stack, body, produced, false);
            } else {
                bool still_top = f.top_level && is_transparent(type);
                push_children(stack, node, f.parent, still_top);
            }
        }
    }

private:
    FileAnalysis& out_;
    const std::string& src_;
    Dialect dialect_;
    const DialectTables& tables_;

    template <typename Stack>
    void push_children(Stack& stack, TSNode node, int parent, bool top_level) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push({ts_node_named_child(node, i - 1), parent, top_level});
        }
    }

    // Wrappers that do not open a new scope.
    bool is_transparent(const std::string& type) const {
        static const std::set<std::string> t = {
            "module", "program", "translation_unit", "decorated_definition", "export_statement",
            "namespace_definition", "declaration_list", "template_declaration", "linkage_specification",
            "expression_statement", "lexical_declaration", "variable_declaration"};
        return t.count(type) > 0;
    }

    const Symbol* parent_symbol(int parent) const {
        return parent >= 0 ? &out_.symbols[static_cast<size_t>(parent)] : nullptr;
    }

    int add_symbol(TSNode node, SymbolKind kind, const std::string& name, int parent) {
        Symbol s;
        s.kind = kind;
        s.name = name;
        s.qualified_name = name;
        s.file_path = out_.file_path;
        TSPoint start = ts_node_start_point(node);
        TSPoint end = ts_node_end_point(node);
        s.line_start = static_cast<int>(start.row) + 1;
        s.line_end = static_cast<int>(end.row) + 1;
        s.column_start = static_cast<int>(start.column);
        s.column_end = static_cast<int>(end.column);

        if (const Symbol* p = parent_symbol(parent)) {
            s.parent_id = p->id;
            s.qualified_name = p->qualified_name + "." + name;
            bool in_type = p->kind == SymbolKind::Class || p->kind == SymbolKind::Struct;
            s.scope = in_type ? "class" : "function";
            if (in_type && kind == SymbolKind::Function) s.kind = SymbolKind::Method;
        }
        s.id = make_symbol_id(s.kind, s.file_path, s.name, s.line_start);

        TSNode body = field(node, "body");
        uint32_t sig_end = ts_node_is_null(body) ? ts_node_end_byte(node) : ts_node_start_byte(body);
        std::string sig = src_.substr(ts_node_start_byte(node), sig_end - ts_node_start_byte(node));
        s.signature = utf8_safe_substr(collapse_whitespace(sig), 200);

        out_.symbols.push_back(std::move(s));
        return static_cast<int>(out_.symbols.size()) - 1;
    }

    void add_dependency(TSNode node, const std::string& module, std::vector<std::string> names, bool internal_hint) {
        if (module.empty()) return;
        Dependency d;
        d.source_module = module_name_for(out_.file_path);
        d.target_module = module;
        d.import_statement = utf8_safe_substr(collapse_whitespace(text_of(node, src_)), 200);
        d.line = static_cast<int>(ts_node_start_point(node).row) + 1;
        d.imported_names = std::move(names);
        d.is_external = !internal_hint;
        out_.dependencies.push_back(d);
        add_symbol(node, SymbolKind::Import, module, -1);
    }

    std::vector<std::string> parameter_names(TSNode params, bool drop_self) const {
        std::vector<std::string> names;
        if (ts_node_is_null(params)) return names;
        static const std::set<std::string> ident = {"identifier"};
        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode p = ts_node_named_child(params, i);
            if (type_of(p) == "comment") continue;
            TSNode id = type_of(p) == "identifier" ? p : first_descendant(p, ident);
            std::string name = text_of(id, src_);
            if (name.empty()) continue;
            if (drop_self && (name == "self" || name == "cls")) continue;
            names.push_back(name);
        }
        return names;
    }

    // Cyclomatic complexity and callee names of one function body. Nested
    // functions are measured on their own.
    void measure(TSNode fn, Symbol& s) const {
        int complexity = 1;
        std::set<std::string> seen;
        std::stack<TSNode> stack;
        uint32_t count = ts_node_named_child_count(fn);
        for (uint32_t i = 0; i < count; ++i) stack.push(ts_node_named_child(fn, i));

        while (!stack.empty()) {
            TSNode n = stack.top();
            stack.pop();
            std::string type = type_of(n);
            if (tables_.functions.count(type)) continue;

            if (tables_.branches.count(type)) {
                complexity++;
            } else if (tables_.logical.count(type)) {
                std::string op = type_of(field(n, "operator"));
                if (dialect_ == Dialect::Python || op == "&&" || op == "||" || op == "??" ||
                    op == "and" || op == "or") {
                    complexity++;
                }
            } else if (tables_.calls.count(type)) {
                std::string callee = callee_name(field(n, "function"));
                if (!callee.empty() && seen.insert(callee).second) s.calls.push_back(callee);
            }

            uint32_t c = ts_node_named_child_count(n);
            for (uint32_t i = 0; i < c; ++i) stack.push(ts_node_named_child(n, i));
        }
        s.complexity = complexity;
    }

    std::string callee_name(TSNode fn) const {
        if (ts_node_is_null(fn)) return "";
        std::string type = type_of(fn);
        if (type == "identifier") return text_of(fn, src_);
        if (type == "attribute") return text_of(field(fn, "attribute"), src_);
        if (type == "member_expression") return text_of(field(fn, "property"), src_);
        if (type == "field_expression") return text_of(field(fn, "field"), src_);
        if (type == "qualified_identifier") return callee_name(field(fn, "name"));
        if (type == "template_function") return callee_name(field(fn, "name"));
        return "";
    }

    std::optional<std::string> leading_comment(TSNode node) const {
        TSNode anchor = node;
        TSNode parent = ts_node_parent(node);
        if (!ts_node_is_null(parent) &&
            (type_of(parent) == "export_statement" || type_of(parent) == "template_declaration")) {
            anchor = parent;
        }
        TSNode prev = ts_node_prev_named_sibling(anchor);
        if (ts_node_is_null(prev) || type_of(prev) != "comment") return std::nullopt;
        // Only comments that end on the line right above the declaration.
        if (ts_node_end_point(prev).row + 1 < ts_node_start_point(anchor).row) return std::nullopt;
        std::string text = clean_comment(text_of(prev, src_));
        if (text.empty()) return std::nullopt;
        return text;
    }

    void collect_bases(TSNode heritage, Symbol& s) const {
        if (ts_node_is_null(heritage)) return;
        static const std::set<std::string> names = {
            "identifier", "type_identifier", "qualified_identifier", "attribute",
            "member_expression", "template_type"};
        uint32_t count = ts_node_named_child_count(heritage);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(heritage, i);
            std::string type = type_of(child);
            if (type == "keyword_argument" || type == "access_specifier" || type == "comment") continue;
            if (names.count(type)) {
                s.bases.push_back(text_of(child, src_));
            } else {
                collect_bases(child, s);
            }
        }
    }

    // --- Python ---

    int visit_python(TSNode node, const std::string& type, int parent, bool top_level, bool& descend) {
        if (type == "function_definition") {
            std::string name = text_of(field(node, "name"), src_);
            if (name.empty()) return -1;
            int idx = add_symbol(node, SymbolKind::Function, name, parent);
            Symbol& s = out_.symbols[static_cast<size_t>(idx)];
            s.is_async = has_token_child(node, "async");
            s.parameters = parameter_names(field(node, "parameters"), true);
            s.docstring = python_docstring(field(node, "body"));
            measure(node, s);
            return idx;
        }
        if (type == "class_definition") {
            std::string name = text_of(field(node, "name"), src_);
            if (name.empty()) return -1;
            int idx = add_symbol(node, SymbolKind::Class, name, parent);
            Symbol& s = out_.symbols[static_cast<size_t>(idx)];
            collect_bases(field(node, "superclasses"), s);
            s.docstring = python_docstring(field(node, "body"));
            return idx;
        }
        if (type == "import_statement") {
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                TSNode name = type_of(child) == "aliased_import" ? field(child, "name") : child;
                add_dependency(node, text_of(name, src_), {}, false);
            }
            descend = false;
            return -1;
        }
        if (type == "import_from_statement") {
            TSNode module = field(node, "module_name");
            std::string module_text = text_of(module, src_);
            std::vector<std::string> names;
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (ts_node_start_byte(child) == ts_node_start_byte(module)) continue;
                std::string ctype = type_of(child);
                if (ctype == "aliased_import") names.push_back(text_of(field(child, "name"), src_));
                else if (ctype == "dotted_name") names.push_back(text_of(child, src_));
                else if (ctype == "wildcard_import") names.push_back("*");
            }
            add_dependency(node, module_text, names, starts_with(module_text, "."));
            descend = false;
            return -1;
        }
        if (type == "assignment" && top_level) {
            TSNode left = field(node, "left");
            if (type_of(left) == "identifier") {
                std::string name = text_of(left, src_);
                if (!name.empty() && name[0] != '_') {
                    add_symbol(node, is_all_caps(name) ? SymbolKind::Constant : SymbolKind::Variable, name, -1);
                }
            }
            descend = false;
            return -1;
        }
        return -1;
    }

    std::optional<std::string> python_docstring(TSNode body) const {
        if (ts_node_is_null(body) || ts_node_named_child_count(body) == 0) return std::nullopt;
        TSNode first = ts_node_named_child(body, 0);
        if (type_of(first) != "expression_statement" || ts_node_named_child_count(first) == 0) return std::nullopt;
        TSNode str = ts_node_named_child(first, 0);
        if (type_of(str) != "string") return std::nullopt;
        return strip_quotes(trim(text_of(str, src_)));
    }

    // --- JavaScript / TypeScript ---

    int visit_script(TSNode node, const std::string& type, int parent, bool top_level, bool& descend) {
        if (type == "function_declaration" || type == "generator_function_declaration" ||
            type == "method_definition") {
            std::string name = text_of(field(node, "name"), src_);
            if (name.empty()) return -1;
            SymbolKind kind = type == "method_definition" ? SymbolKind::Method : SymbolKind::Function;
            int idx = add_symbol(node, kind, name, parent);
            Symbol& s = out_.symbols[static_cast<size_t>(idx)];
            s.is_async = has_token_child(node, "async");
            s.parameters = parameter_names(field(node, "parameters"), false);
            s.docstring = leading_comment(node);
            measure(node, s);
            return idx;
        }
        if (type == "class_declaration" || type == "abstract_class_declaration") {
            std::string name = text_of(field(node, "name"), src_);
            if (name.empty()) return -1;
            int idx = add_symbol(node, SymbolKind::Class, name, parent);
            Symbol& s = out_.symbols[static_cast<size_t>(idx)];
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (type_of(child) == "class_heritage") collect_bases(child, s);
            }
            s.docstring = leading_comment(node);
            return idx;
        }
        if (type == "variable_declarator") {
            std::string name = text_of(field(node, "name"), src_);
            TSNode value = field(node, "value");
            std::string vtype = type_of(value);
            if (!ts_node_is_null(value) &&
                (vtype == "arrow_function" || vtype == "function_expression" || vtype == "function" ||
                 vtype == "generator_function")) {
                if (name.empty()) return -1;
                int idx = add_symbol(node, SymbolKind::Function, name, parent);
                Symbol& s = out_.symbols[static_cast<size_t>(idx)];
                s.is_async = has_token_child(value, "async");
                TSNode params = field(value, "parameters");
                if (ts_node_is_null(params)) {
                    TSNode single = field(value, "parameter");
                    if (!ts_node_is_null(single)) s.parameters.push_back(text_of(single, src_));
                } else {
                    s.parameters = parameter_names(params, false);
                }
                TSNode decl = ts_node_parent(node);
                s.docstring = leading_comment(ts_node_is_null(decl) ? node : decl);
                measure(value, s);
                return idx;
            }
            if (top_level && type_of(field(node, "name")) == "identifier" && !name.empty() && name[0] != '_') {
                add_symbol(node, is_all_caps(name) ? SymbolKind::Constant : SymbolKind::Variable, name, -1);
            }
            return -1;
        }
        if (type == "import_statement") {
            std::string module = strip_quotes(text_of(field(node, "source"), src_));
            std::vector<std::string> names;
            static const std::set<std::string> ident = {"identifier"};
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (type_of(child) != "import_clause") continue;
                std::stack<TSNode> stack;
                stack.push(child);
                while (!stack.empty()) {
                    TSNode n = stack.top();
                    stack.pop();
                    if (type_of(n) == "identifier") names.push_back(text_of(n, src_));
                    uint32_t c = ts_node_named_child_count(n);
                    for (uint32_t k = c; k > 0; --k) stack.push(ts_node_named_child(n, k - 1));
                }
            }
            add_dependency(node, module, names, starts_with(module, "."));
            descend = false;
            return -1;
        }
        if (type == "export_statement") {
            TSNode source = field(node, "source");
            if (!ts_node_is_null(source)) {
                std::string module = strip_quotes(text_of(source, src_));
                add_dependency(node, module, {}, starts_with(module, "."));
            }
        }
        return -1;
    }

    // require('x') anywhere in the file.
    void visit_require(TSNode node) {
        if (dialect_ != Dialect::Script) return;
        TSNode fn = field(node, "function");
        if (type_of(fn) != "identifier" || text_of(fn, src_) != "require") return;
        TSNode args = field(node, "arguments");
        if (ts_node_is_null(args) || ts_node_named_child_count(args) == 0) return;
        TSNode first = ts_node_named_child(args, 0);
        if (type_of(first) != "string") return;
        std::string module = strip_quotes(text_of(first, src_));
        add_dependency(node, module, {}, starts_with(module, "."));
    }

    // --- C++ ---

    int visit_cpp(TSNode node, const std::string& type, int parent, bool top_level, bool& descend) {
        if (type == "function_definition") {
            static const std::set<std::string> fn_decl = {"function_declarator"};
            TSNode declarator = first_descendant(field(node, "declarator"), fn_decl);
            if (ts_node_is_null(declarator)) return -1;
            TSNode name_node = field(declarator, "declarator");
            std::string full = text_of(name_node, src_);
            std::string name = full;
            std::string owner;
            size_t sep = full.rfind("::");
            if (sep != std::string::npos) {
                name = full.substr(sep + 2);
                owner = full.substr(0, sep);
            }
            if (name.empty()) return -1;

            int idx = add_symbol(node, SymbolKind::Function, name, parent);
            Symbol& s = out_.symbols[static_cast<size_t>(idx)];
            if (!owner.empty() && !s.parent_id) {
                s.kind = SymbolKind::Method;
                s.scope = "class";
                s.qualified_name = owner + "." + name;
                s.id = make_symbol_id(s.kind, s.file_path, s.name, s.line_start);
            }
            s.parameters = parameter_names(field(declarator, "parameters"), false);
            s.docstring = leading_comment(node);
            measure(node, s);
            descend = false;
            return idx;
        }
        if (type == "class_specifier" || type == "struct_specifier") {
            TSNode body = field(node, "body");
            std::string name = text_of(field(node, "name"), src_);
            if (ts_node_is_null(body) || name.empty()) return -1;
            SymbolKind kind = type == "class_specifier" ? SymbolKind::Class : SymbolKind::Struct;
            int idx = add_symbol(node, kind, name, parent);
            Symbol& s = out_.symbols[static_cast<size_t>(idx)];
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (type_of(child) == "base_class_clause") collect_bases(child, s);
            }
            TSNode decl = ts_node_parent(node);
            s.docstring = leading_comment(!ts_node_is_null(decl) && type_of(decl) == "declaration" ? decl : node);
            return idx;
        }
        if (type == "preproc_include") {
            TSNode path = field(node, "path");
            add_dependency(node, strip_quotes(text_of(path, src_)), {}, type_of(path) == "string_literal");
            descend = false;
            return -1;
        }
        if (type == "declaration" && top_level) {
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (type_of(child) != "init_declarator") continue;
                TSNode target = field(child, "declarator");
                if (type_of(target) != "identifier") continue;
                std::string name = text_of(target, src_);
                if (name.empty() || name[0] == '_') continue;
                add_symbol(node, is_all_caps(name) || text_of(node, src_).find("constexpr") != std::string::npos
                                     ? SymbolKind::Constant : SymbolKind::Variable,
                           name, -1);
            }
            return -1;
        }
        return -1;
    }
};

std::optional<int> first_error_line(TSNode root) {
    std::stack<TSNode> stack;
    stack.push(root);
    std::optional<int> best;
    while (!stack.empty()) {
        TSNode n = stack.top();
        stack.pop();
        if (!ts_node_has_error(n) && !ts_node_is_missing(n)) continue;
        if (type_of(n) == "ERROR" || ts_node_is_missing(n)) {
            int line = static_cast<int>(ts_node_start_point(n).row) + 1;
            if (!best || line < *best) best = line;
            continue;
        }
        uint32_t count = ts_node_child_count(n);
        for (uint32_t i = 0; i < count; ++i) stack.push(ts_node_child(n, i));
    }
    return best;
}

} // namespace

// --- GrammarRegistry ---

std::shared_ptr<GrammarRegistry> GrammarRegistry::with_builtin_grammars() {
    auto registry = std::make_shared<GrammarRegistry>();
    registry->register_grammar("python", tree_sitter_python());
    registry->register_grammar("javascript", tree_sitter_javascript());
    registry->register_grammar("typescript", tree_sitter_typescript());
    registry->register_grammar("tsx", tree_sitter_tsx());
    registry->register_grammar("cpp", tree_sitter_cpp());
    return registry;
}

void GrammarRegistry::register_grammar(const std::string& name, const TSLanguage* language) {
    if (!language) return;
    grammars_[name] = language;
}

void GrammarRegistry::unregister_grammar(const std::string& name) {
    grammars_.erase(name);
}

const TSLanguage* GrammarRegistry::find(const std::string& name) const {
    auto it = grammars_.find(name);
    return it == grammars_.end() ? nullptr : it->second;
}

std::vector<std::string> GrammarRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& [name, lang] : grammars_) out.push_back(name);
    return out;
}

std::string GrammarRegistry::grammar_for(Language language, const std::string& file_path) {
    switch (language) {
        case Language::Python: return "python";
        case Language::JavaScript: return "javascript";
        case Language::TypeScript:
            return ends_with(file_path, ".tsx") ? "tsx" : "typescript";
        case Language::Cpp: return "cpp";
        default: return "";
    }
}

// --- ASTBooster ---

ASTBooster::ASTBooster(std::shared_ptr<const GrammarRegistry> registry)
    : registry_(std::move(registry)) {}

std::optional<FileAnalysis> ASTBooster::extract(const std::string& path,
                                                const std::string& content,
                                                Language language) const {
    std::string grammar = GrammarRegistry::grammar_for(language, path);
    const TSLanguage* lang = registry_ ? registry_->find(grammar) : nullptr;
    if (!lang) return std::nullopt;

    // One parser per call: analyses of different files run concurrently.
    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!ts_parser_set_language(parser.get(), lang)) {
        spdlog::warn("⚠️ Grammar '{}' rejected by the tree-sitter runtime (ABI mismatch)", grammar);
        return std::nullopt;
    }

    std::unique_ptr<TSTree, TreeDeleter> tree(
        ts_parser_parse_string(parser.get(), nullptr, content.c_str(), static_cast<uint32_t>(content.length())));
    if (!tree) return std::nullopt;

    FileAnalysis fa;
    fa.file_path = path;
    fa.language = language;
    fa.analysis_mode = AnalysisMode::Grammar;

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        int line = first_error_line(root).value_or(static_cast<int>(ts_node_start_point(root).row) + 1);
        fa.parsing_errors.push_back("syntax error at line " + std::to_string(line));
    }

    Dialect dialect = language == Language::Python ? Dialect::Python
                    : language == Language::Cpp ? Dialect::Cpp
                    : Dialect::Script;
    SymbolWalker walker(fa, content, dialect);
    walker.walk(root);

    std::stable_sort(fa.symbols.begin(), fa.symbols.end(), [](const Symbol& a, const Symbol& b) {
        return a.line_start != b.line_start ? a.line_start < b.line_start : a.column_start < b.column_start;
    });
    std::stable_sort(fa.dependencies.begin(), fa.dependencies.end(), [](const Dependency& a, const Dependency& b) {
        return a.line < b.line;
    });

    int loc = static_cast<int>(ts_node_end_point(root).row) + 1;
    fa.complexity_metrics = compute_metrics(fa.symbols, loc);

    spdlog::debug("🛰️  AST X-Ray Complete: {} symbols in {}", fa.symbols.size(), path);
    return fa;
}

} // namespace code_intelligence::elite
