#include <gtest/gtest.h>
#include <algorithm>
#include "project_indexer.hpp"
#include "test_support.hpp"

using namespace code_intelligence;
using code_intelligence::testing::TempProject;
using code_intelligence::testing::find_symbol;
using code_intelligence::testing::write_sample_python_project;

namespace {

bool has_edge(const ProjectIndex& index, const std::string& from, const std::string& to) {
    return std::any_of(index.dependency_edges.begin(), index.dependency_edges.end(),
                       [&](const DependencyEdge& e) { return e.source_file == from && e.target_file == to; });
}

} // namespace

class ProjectIndexerTest : public ::testing::Test {
protected:
    void SetUp() override {
        analyzer_ = std::make_shared<LanguageAnalyzer>();
        indexer_ = std::make_unique<ProjectIndexer>(analyzer_);
    }

    std::shared_ptr<LanguageAnalyzer> analyzer_;
    std::unique_ptr<ProjectIndexer> indexer_;
    TempProject project_{"sample"};
};

TEST_F(ProjectIndexerTest, IndexesThreeFileProjectWithInternalEdges) {
    write_sample_python_project(project_);
    ProjectIndex index = indexer_->index_project(project_.path());

    EXPECT_EQ(index.project_id, "sample");
    EXPECT_EQ(index.file_count(), 3u);
    EXPECT_GE(index.symbol_count(), 3u);
    EXPECT_NE(find_symbol(index, "main", SymbolKind::Function), nullptr);
    EXPECT_NE(find_symbol(index, "helper", SymbolKind::Function), nullptr);
    EXPECT_NE(find_symbol(index, "User", SymbolKind::Class), nullptr);

    EXPECT_TRUE(has_edge(index, "main.py", "utils.py"));
    EXPECT_TRUE(has_edge(index, "main.py", "models.py"));

    const FileAnalysis* main_fa = index.find_file("main.py");
    ASSERT_NE(main_fa, nullptr);
    for (const auto& dep : main_fa->dependencies) {
        EXPECT_FALSE(dep.is_external) << dep.target_module;
        ASSERT_TRUE(dep.resolved_file.has_value());
    }
}

TEST_F(ProjectIndexerTest, ReindexingUnchangedProjectIsIdempotent) {
    write_sample_python_project(project_);
    ProjectIndex first = indexer_->index_project(project_.path());
    ProjectIndex second = indexer_->index_project(project_.path());

    EXPECT_EQ(first.symbol_count(), second.symbol_count());
    EXPECT_EQ(first.file_count(), second.file_count());
    EXPECT_EQ(first.dependency_edges, second.dependency_edges);
    for (const auto& [id, sym] : first.symbols) {
        EXPECT_EQ(second.symbols.count(id), 1u) << id;
    }
    EXPECT_GT(second.generation, first.generation);
}

TEST_F(ProjectIndexerTest, ReindexFileOnlyTouchesThatFile) {
    write_sample_python_project(project_);
    ProjectIndex before = indexer_->index_project(project_.path());

    project_.write("utils.py",
                   "def helper(value):\n"
                   "    return str(value)\n"
                   "\n"
                   "def shout(value):\n"
                   "    return helper(value).upper()\n");
    FileAnalysis updated = indexer_->reindex_file("utils.py");
    ProjectIndex after = indexer_->snapshot();

    auto names_in = [](const FileAnalysis& fa) {
        std::vector<std::string> names;
        for (const auto& s : fa.symbols) names.push_back(s.name);
        return names;
    };
    auto names = names_in(updated);
    EXPECT_NE(std::find(names.begin(), names.end(), "shout"), names.end());

    for (const auto& [id, sym] : before.symbols) {
        if (sym.file_path == "utils.py") continue;
        ASSERT_EQ(after.symbols.count(id), 1u) << id;
        EXPECT_EQ(after.symbols.at(id).signature, sym.signature);
    }
    for (const auto& [id, sym] : after.symbols) {
        if (sym.file_path != "utils.py") continue;
        EXPECT_NE(std::find_if(updated.symbols.begin(), updated.symbols.end(),
                               [&](const Symbol& s) { return s.id == id; }),
                  updated.symbols.end());
    }
    EXPECT_TRUE(has_edge(after, "main.py", "utils.py"));
}

TEST_F(ProjectIndexerTest, DeletedFileIsRemovedAndEdgesUnresolved) {
    write_sample_python_project(project_);
    indexer_->index_project(project_.path());

    project_.remove("models.py");
    indexer_->reindex_file("models.py");
    ProjectIndex after = indexer_->snapshot();

    EXPECT_EQ(after.files.count("models.py"), 0u);
    EXPECT_EQ(find_symbol(after, "User", SymbolKind::Class), nullptr);
    EXPECT_FALSE(has_edge(after, "main.py", "models.py"));
    for (const auto& [id, sym] : after.symbols) EXPECT_NE(sym.file_path, "models.py");
}

TEST_F(ProjectIndexerTest, MissingRootYieldsEmptyIndex) {
    ProjectIndex index = indexer_->index_project(project_.path() + "/does-not-exist");
    EXPECT_EQ(index.file_count(), 0u);
    EXPECT_EQ(index.symbol_count(), 0u);
}

TEST_F(ProjectIndexerTest, SkipsExcludedDirectoriesAndTests) {
    write_sample_python_project(project_);
    project_.write("node_modules/lib/index.js", "function vendored() {}\n");
    project_.write("tests/test_utils.py", "def test_helper():\n    pass\n");
    project_.write("build/gen.py", "def generated():\n    pass\n");
    project_.write("README.md", "# docs\n");

    ProjectIndex index = indexer_->index_project(project_.path());
    EXPECT_EQ(index.file_count(), 3u);
    EXPECT_EQ(find_symbol(index, "vendored", SymbolKind::Function), nullptr);
    EXPECT_EQ(find_symbol(index, "test_helper", SymbolKind::Function), nullptr);
}

TEST_F(ProjectIndexerTest, ProjectRulesIncludeIgnoredPaths) {
    write_sample_python_project(project_);
    project_.write("vendor/keep/kept.py", "def kept():\n    pass\n");
    project_.write("vendor/drop/dropped.py", "def dropped():\n    pass\n");
    project_.write(".codeintel/config.json",
                   R"({"ignored_paths": ["vendor"], "included_paths": ["vendor/keep"]})");

    ProjectIndex index = indexer_->index_project(project_.path());
    EXPECT_NE(find_symbol(index, "kept", SymbolKind::Function), nullptr);
    EXPECT_EQ(find_symbol(index, "dropped", SymbolKind::Function), nullptr);
}

TEST_F(ProjectIndexerTest, BinaryFileIsReportedUnreadable) {
    write_sample_python_project(project_);
    project_.write("blob.py", std::string("abc\0def", 7));

    ProjectIndex index = indexer_->index_project(project_.path());
    auto diag = std::find_if(index.diagnostics.begin(), index.diagnostics.end(),
                             [](const Diagnostic& d) { return d.subject == "blob.py"; });
    ASSERT_NE(diag, index.diagnostics.end());
    EXPECT_EQ(diag->kind, ErrorKind::FileUnreadable);
    EXPECT_NE(find_symbol(index, "main", SymbolKind::Function), nullptr);
}

TEST_F(ProjectIndexerTest, CancelledBeforeStartIndexesNothing) {
    write_sample_python_project(project_);
    CancellationToken token;
    token.cancel();

    ProjectIndex index = indexer_->index_project(project_.path(), &token);
    EXPECT_TRUE(index.cancelled);
    EXPECT_EQ(index.file_count(), 0u);
}

TEST_F(ProjectIndexerTest, HeuristicFilesCarryParseDegraded) {
    auto bare = std::make_shared<LanguageAnalyzer>(std::make_shared<elite::GrammarRegistry>());
    ProjectIndexer indexer(bare);
    write_sample_python_project(project_);

    ProjectIndex index = indexer.index_project(project_.path());
    EXPECT_EQ(index.file_count(), 3u);
    size_t degraded = std::count_if(index.diagnostics.begin(), index.diagnostics.end(),
                                    [](const Diagnostic& d) { return d.kind == ErrorKind::ParseDegraded; });
    EXPECT_EQ(degraded, 3u);
    EXPECT_TRUE(has_edge(index, "main.py", "utils.py"));
}

TEST_F(ProjectIndexerTest, RefreshPicksUpAddedAndRemovedFiles) {
    write_sample_python_project(project_);
    indexer_->index_project(project_.path());

    project_.write("extra.py", "def extra():\n    pass\n");
    project_.remove("models.py");
    RefreshReport report = indexer_->refresh();

    EXPECT_EQ(report.added, std::vector<std::string>{"extra.py"});
    EXPECT_EQ(report.removed, std::vector<std::string>{"models.py"});
    EXPECT_NE(find_symbol(indexer_->snapshot(), "extra", SymbolKind::Function), nullptr);
}

TEST_F(ProjectIndexerTest, FindsReferencesToSymbol) {
    write_sample_python_project(project_);
    indexer_->index_project(project_.path());

    auto refs = indexer_->find_references("helper");
    auto call = std::find_if(refs.begin(), refs.end(),
                             [](const SymbolReference& r) { return r.kind == "call" && r.file_path == "main.py"; });
    EXPECT_NE(call, refs.end());
}
