#include <gtest/gtest.h>
#include <algorithm>
#include "code_intelligence_engine.hpp"
#include "graph/memory_graph_backend.hpp"
#include "inference/model_strategies.hpp"
#include "test_support.hpp"

using namespace code_intelligence;
using code_intelligence::testing::TempProject;
using code_intelligence::testing::write_sample_python_project;

namespace {

EngineConfig offline_config() {
    EngineConfig config;
    config.embedding.use_model = false;
    config.embedding.dimension = 256;
    config.graph.connect_backoff_ms = 1;
    config.inference.preference = {"mock", "fallback"};
    config.inference.timeout_ms = 2000;
    return config;
}

bool contains_id(const std::vector<TraversalHit>& hits, const std::string& id) {
    return std::any_of(hits.begin(), hits.end(), [&](const TraversalHit& h) { return h.id == id; });
}

bool has_kind(const std::vector<Diagnostic>& diags, ErrorKind kind) {
    return std::any_of(diags.begin(), diags.end(), [&](const Diagnostic& d) { return d.kind == kind; });
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_backend_ = std::make_shared<MemoryGraphBackend>();
        EngineDependencies deps;
        deps.graph_backend = graph_backend_;
        deps.strategies = {std::make_shared<MockStrategy>()};
        engine_ = std::make_unique<CodeIntelligenceEngine>(offline_config(), deps);
        ASSERT_TRUE(engine_->initialize());
        write_sample_python_project(project_);
    }

    std::shared_ptr<MemoryGraphBackend> graph_backend_;
    std::unique_ptr<CodeIntelligenceEngine> engine_;
    TempProject project_{"sample"};
};

TEST_F(EngineTest, IndexesProjectIntoGraphAndVectors) {
    IndexReport report = engine_->index_project(project_.path());

    EXPECT_EQ(report.project_id, "sample");
    EXPECT_EQ(report.files_indexed, 3u);
    EXPECT_EQ(report.dependency_edges, 2u);
    EXPECT_FALSE(report.workspace_changed);
    EXPECT_GT(report.graph.nodes_written, 3u);
    EXPECT_GE(report.embeddings_stored, report.files_indexed + 3);
    EXPECT_FALSE(has_kind(report.diagnostics, ErrorKind::GraphIntegrityViolation));
    EXPECT_EQ(engine_->vector_store()->stats().total_embeddings, report.embeddings_stored);
}

TEST_F(EngineTest, SearchFindsAndFiltersCode) {
    engine_->index_project(project_.path());

    auto hits = engine_->search_code("helper value formats");
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits.front().file_path, "utils.py");

    SearchFilters filters;
    filters.file_filter = "models.py";
    for (const auto& hit : engine_->search_code("helper value", filters)) EXPECT_EQ(hit.file_path, "models.py");

    EXPECT_TRUE(engine_->search_code("").empty());
}

TEST_F(EngineTest, FileContextJoinsIndexGraphAndVectors) {
    engine_->index_project(project_.path());

    FileContext ctx = engine_->get_file_context("main.py", 5);
    ASSERT_TRUE(ctx.found);
    ASSERT_TRUE(ctx.symbol_at_cursor.has_value());
    EXPECT_EQ(ctx.symbol_at_cursor->name, "main");
    EXPECT_NE(ctx.surrounding_code.find("def main"), std::string::npos);
    EXPECT_TRUE(contains_id(ctx.dependencies, "file:utils.py"));
    EXPECT_TRUE(contains_id(ctx.dependencies, "file:models.py"));
    for (const auto& r : ctx.related) EXPECT_NE(r.file_path, "main.py");

    FileContext utils = engine_->get_file_context(project_.path() + "/utils.py");
    ASSERT_TRUE(utils.found);
    EXPECT_EQ(utils.file_path, "utils.py");
    EXPECT_TRUE(contains_id(utils.dependents, "file:main.py"));

    EXPECT_FALSE(engine_->get_file_context("missing.py").found);
}

TEST_F(EngineTest, OverviewAndCycles) {
    engine_->index_project(project_.path());
    auto overview = engine_->get_architecture_overview();
    EXPECT_EQ(overview["project_id"], "sample");
    EXPECT_EQ(overview["node_counts"]["File"], 3);
    EXPECT_EQ(overview["circular_dependency_count"], 0);
    EXPECT_TRUE(engine_->find_circular_dependencies().empty());

    project_.write("models.py",
                   "from main import main\n"
                   "\n"
                   "class User:\n"
                   "    def __init__(self, name):\n"
                   "        self.name = name\n");
    engine_->index_project(project_.path());

    auto cycles = engine_->find_circular_dependencies();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].length, 2u);
    EXPECT_EQ(cycles[0].severity, "medium");
    EXPECT_EQ(cycles[0].nodes, (std::vector<std::string>{"file:main.py", "file:models.py"}));
}

TEST_F(EngineTest, CompletionUsesProjectContext) {
    engine_->index_project(project_.path());

    CompletionContext ctx;
    ctx.file_path = "main.py";
    ctx.cursor_line = 5;
    ctx.query = "what does main do?";
    CompletionResult result = engine_->generate_completion(ctx, "explain");

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.strategy_used, "mock");
    EXPECT_TRUE(result.context_used);
    EXPECT_GT(result.context_items, 0u);
    EXPECT_GE(result.confidence, 0.0);
    EXPECT_LE(result.confidence, 1.0);

    EXPECT_EQ(engine_->generate_completion(ctx, "teleport").status, "error");
}

TEST_F(EngineTest, ReindexFileUpdatesGraphAndVectors) {
    engine_->index_project(project_.path());

    project_.write("utils.py",
                   "def helper(value):\n"
                   "    return str(value)\n"
                   "\n"
                   "def shout_loudly(value):\n"
                   "    return helper(value).upper()\n");
    ReindexReport updated = engine_->reindex_file("utils.py");
    EXPECT_FALSE(updated.removed);
    EXPECT_EQ(updated.symbols, 2u);
    EXPECT_GE(updated.embeddings_stored, 3u);

    SearchFilters functions;
    functions.symbol_type_filter = "function";
    auto hits = engine_->search_code("shout_loudly", functions, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].symbol_name, "shout_loudly");

    project_.remove("models.py");
    ReindexReport removed = engine_->reindex_file("models.py");
    EXPECT_TRUE(removed.removed);
    EXPECT_FALSE(engine_->graph_store()->get_node("file:models.py").has_value());
    SearchFilters models;
    models.file_filter = "models.py";
    EXPECT_TRUE(engine_->search_code("User", models).empty());
}

TEST_F(EngineTest, SwitchingWorkspaceDropsPreviousProject) {
    engine_->index_project(project_.path());

    TempProject other("other");
    other.write("app.py", "def start():\n    return 1\n");
    IndexReport report = engine_->index_project(other.path());

    EXPECT_TRUE(report.workspace_changed);
    EXPECT_EQ(report.project_id, "other");
    EXPECT_TRUE(engine_->graph_store()->project_nodes("sample").empty());
    SearchFilters old_files;
    old_files.file_filter = "utils.py";
    EXPECT_TRUE(engine_->search_code("helper", old_files).empty());
}

TEST_F(EngineTest, UnreachableGraphDegradesGracefully) {
    graph_backend_->set_reachable(false);
    engine_->graph_store()->disconnect();

    IndexReport report = engine_->index_project(project_.path());
    EXPECT_EQ(report.files_indexed, 3u);
    EXPECT_TRUE(has_kind(report.diagnostics, ErrorKind::BackendUnavailable));
    EXPECT_TRUE(engine_->find_circular_dependencies().empty());

    FileContext ctx = engine_->get_file_context("main.py", 5);
    EXPECT_TRUE(ctx.found);
    EXPECT_TRUE(ctx.dependencies.empty());
    EXPECT_FALSE(engine_->search_code("helper").empty());

    CompletionContext completion;
    completion.file_path = "main.py";
    completion.query = "explain";
    EXPECT_TRUE(engine_->generate_completion(completion, Intent::Explain).ok());

    auto health = engine_->health();
    EXPECT_FALSE(health["graph"]["connected"].get<bool>());
    EXPECT_EQ(health["inference"]["current_strategy"], "mock");
}
