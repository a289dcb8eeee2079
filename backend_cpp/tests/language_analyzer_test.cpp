#include <gtest/gtest.h>
#include <algorithm>
#include "heuristic_parser.hpp"
#include "language_analyzer.hpp"

using namespace code_intelligence;

namespace {

const Symbol* by_name(const FileAnalysis& fa, const std::string& name) {
    for (const auto& s : fa.symbols) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

const char* kPythonSource =
    "import os\n"
    "from .helpers import load\n"
    "\n"
    "class Repo(Base):\n"
    "    def fetch(self, key, default=None):\n"
    "        \"\"\"Returns the stored value.\"\"\"\n"
    "        if key in self.items and default:\n"
    "            return load(key)\n"
    "        for item in self.items:\n"
    "            pass\n"
    "        return default\n"
    "\n"
    "async def run(repo):\n"
    "    return await repo.fetch(\"a\")\n";

} // namespace

TEST(LanguageDetection, MapsExtensions) {
    EXPECT_EQ(detect_language("a/b.py"), Language::Python);
    EXPECT_EQ(detect_language("x.tsx"), Language::TypeScript);
    EXPECT_EQ(detect_language("x.mjs"), Language::JavaScript);
    EXPECT_EQ(detect_language("src/a.hpp"), Language::Cpp);
    EXPECT_EQ(detect_language("main.rs"), Language::Rust);
    EXPECT_EQ(detect_language("README.md"), Language::Unknown);
}

TEST(SymbolIds, AreDeterministic) {
    EXPECT_EQ(make_symbol_id(SymbolKind::Function, "pkg/a.py", "run", 3), "function:pkg/a.py:run:3");
    EXPECT_EQ(make_file_id("pkg/a.py"), "file:pkg/a.py");
    EXPECT_EQ(module_name_for("pkg/mod.py"), "pkg.mod");
}

TEST(LanguageAnalyzer, ExtractsPythonStructure) {
    LanguageAnalyzer analyzer;
    FileAnalysis fa = analyzer.analyze("pkg/repo.py", kPythonSource);

    EXPECT_EQ(fa.language, Language::Python);
    EXPECT_NE(fa.analysis_mode, AnalysisMode::None);

    const Symbol* repo = by_name(fa, "Repo");
    ASSERT_NE(repo, nullptr);
    EXPECT_EQ(repo->kind, SymbolKind::Class);
    EXPECT_EQ(repo->line_start, 4);

    const Symbol* fetch = by_name(fa, "fetch");
    ASSERT_NE(fetch, nullptr);
    EXPECT_EQ(fetch->kind, SymbolKind::Method);
    EXPECT_EQ(fetch->qualified_name, "Repo.fetch");
    ASSERT_TRUE(fetch->parent_id.has_value());
    EXPECT_EQ(*fetch->parent_id, repo->id);
    EXPECT_EQ(fetch->parameters, (std::vector<std::string>{"key", "default"}));
    ASSERT_TRUE(fetch->docstring.has_value());
    EXPECT_EQ(*fetch->docstring, "Returns the stored value.");
    EXPECT_GE(fetch->complexity, 3);

    const Symbol* run = by_name(fa, "run");
    ASSERT_NE(run, nullptr);
    EXPECT_TRUE(run->is_async);
    EXPECT_EQ(run->scope, "global");

    ASSERT_EQ(fa.dependencies.size(), 2u);
    auto os_dep = std::find_if(fa.dependencies.begin(), fa.dependencies.end(),
                               [](const Dependency& d) { return d.target_module == "os"; });
    ASSERT_NE(os_dep, fa.dependencies.end());
    EXPECT_TRUE(os_dep->is_external);
    auto rel_dep = std::find_if(fa.dependencies.begin(), fa.dependencies.end(),
                                [](const Dependency& d) { return d.target_module == ".helpers"; });
    ASSERT_NE(rel_dep, fa.dependencies.end());
    EXPECT_FALSE(rel_dep->is_external);
    EXPECT_EQ(rel_dep->imported_names, std::vector<std::string>{"load"});

    EXPECT_EQ(fa.complexity_metrics.number_of_classes, 1);
    EXPECT_GE(fa.complexity_metrics.number_of_functions, 2);
    EXPECT_GT(fa.complexity_metrics.maintainability_index, 0.0);
}

TEST(LanguageAnalyzer, IsPureOverInput) {
    LanguageAnalyzer analyzer;
    FileAnalysis a = analyzer.analyze("pkg/repo.py", kPythonSource);
    FileAnalysis b = analyzer.analyze("pkg/repo.py", kPythonSource);
    ASSERT_EQ(a.symbols.size(), b.symbols.size());
    for (size_t i = 0; i < a.symbols.size(); ++i) EXPECT_EQ(a.symbols[i].id, b.symbols[i].id);
    EXPECT_EQ(a.content_hash, b.content_hash);
}

TEST(LanguageAnalyzer, FallsBackToHeuristicsWithoutGrammar) {
    LanguageAnalyzer analyzer(std::make_shared<elite::GrammarRegistry>());
    EXPECT_FALSE(analyzer.has_grammar(Language::Python, "a.py"));

    FileAnalysis fa = analyzer.analyze("pkg/repo.py", kPythonSource);
    EXPECT_EQ(fa.analysis_mode, AnalysisMode::Heuristic);
    EXPECT_TRUE(fa.degraded());
    ASSERT_NE(by_name(fa, "Repo"), nullptr);
    ASSERT_NE(by_name(fa, "fetch"), nullptr);
    EXPECT_EQ(by_name(fa, "fetch")->kind, SymbolKind::Method);
    ASSERT_NE(by_name(fa, "run"), nullptr);
    EXPECT_EQ(fa.dependencies.size(), 2u);
}

TEST(LanguageAnalyzer, UnknownLanguageYieldsEmptyAnalysis) {
    LanguageAnalyzer analyzer;
    FileAnalysis fa = analyzer.analyze("notes.txt", "def not_code():\n    pass\n");
    EXPECT_EQ(fa.language, Language::Unknown);
    EXPECT_EQ(fa.analysis_mode, AnalysisMode::None);
    EXPECT_TRUE(fa.symbols.empty());
    EXPECT_EQ(fa.complexity_metrics.lines_of_code, 2);
}

TEST(LanguageAnalyzer, BrokenSourceStillProducesSymbols) {
    LanguageAnalyzer analyzer;
    FileAnalysis fa = analyzer.analyze("broken.py",
                                       "def ok():\n"
                                       "    return 1\n"
                                       "\n"
                                       "def broken(:\n"
                                       "    return (\n");
    EXPECT_NE(by_name(fa, "ok"), nullptr);
}

TEST(HeuristicParser, ExtractsJavaScriptImportsAndFunctions) {
    FileAnalysis fa = HeuristicParser::parse("web/app.js",
                                             "import { api } from './api';\n"
                                             "const fs = require('fs');\n"
                                             "\n"
                                             "export function render(node) {\n"
                                             "  if (node) {\n"
                                             "    return api(node);\n"
                                             "  }\n"
                                             "}\n"
                                             "\n"
                                             "class View extends Base {\n"
                                             "}\n",
                                             Language::JavaScript);
    EXPECT_EQ(fa.analysis_mode, AnalysisMode::Heuristic);
    ASSERT_NE(by_name(fa, "render"), nullptr);
    EXPECT_EQ(by_name(fa, "render")->kind, SymbolKind::Function);
    ASSERT_NE(by_name(fa, "View"), nullptr);
    EXPECT_EQ(by_name(fa, "View")->kind, SymbolKind::Class);

    auto api = std::find_if(fa.dependencies.begin(), fa.dependencies.end(),
                            [](const Dependency& d) { return d.target_module == "./api"; });
    ASSERT_NE(api, fa.dependencies.end());
    EXPECT_FALSE(api->is_external);
    auto fs_dep = std::find_if(fa.dependencies.begin(), fa.dependencies.end(),
                               [](const Dependency& d) { return d.target_module == "fs"; });
    ASSERT_NE(fs_dep, fa.dependencies.end());
    EXPECT_TRUE(fs_dep->is_external);
}

TEST(HeuristicParser, ExtractsCppIncludes) {
    FileAnalysis fa = HeuristicParser::parse("src/a.cpp",
                                             "#include \"a.hpp\"\n"
                                             "#include <vector>\n"
                                             "\n"
                                             "int add(int x, int y) {\n"
                                             "    return x + y;\n"
                                             "}\n",
                                             Language::Cpp);
    ASSERT_NE(by_name(fa, "add"), nullptr);
    auto local = std::find_if(fa.dependencies.begin(), fa.dependencies.end(),
                              [](const Dependency& d) { return d.target_module == "a.hpp"; });
    ASSERT_NE(local, fa.dependencies.end());
    EXPECT_FALSE(local->is_external);
}

TEST(HeuristicParser, PythonImportsIgnoreTrailingComments) {
    FileAnalysis fa = HeuristicParser::parse("tool.py",
                                             "import os  # filesystem\n"
                                             "import sys, json # stdlib\n"
                                             "from .helpers import load  # local\n"
                                             "\n"
                                             "def run():\n"
                                             "    return load(os.getcwd())\n",
                                             Language::Python);
    std::vector<std::string> modules;
    for (const auto& d : fa.dependencies) modules.push_back(d.target_module);
    EXPECT_EQ(modules, (std::vector<std::string>{"os", "sys", "json", ".helpers"}));

    auto helpers = std::find_if(fa.dependencies.begin(), fa.dependencies.end(),
                                [](const Dependency& d) { return d.target_module == ".helpers"; });
    ASSERT_NE(helpers, fa.dependencies.end());
    EXPECT_EQ(helpers->imported_names, (std::vector<std::string>{"load"}));
}
