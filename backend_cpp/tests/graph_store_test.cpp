#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include "graph/graph_store.hpp"
#include "graph/memory_graph_backend.hpp"
#include "project_indexer.hpp"
#include "test_support.hpp"

using namespace code_intelligence;
using code_intelligence::testing::TempProject;
using code_intelligence::testing::find_symbol;
using code_intelligence::testing::write_sample_python_project;

namespace {

bool has_relationship(const std::vector<GraphRelationship>& rels, const std::string& from,
                      const std::string& type, const std::string& to) {
    return std::any_of(rels.begin(), rels.end(), [&](const GraphRelationship& r) {
        return r.from_id == from && r.type == type && r.to_id == to;
    });
}

GraphNode make_node(const std::string& id, const std::string& label, const std::string& file = "") {
    GraphNode n;
    n.id = id;
    n.label = label;
    n.name = id;
    n.project_id = "p";
    n.file_path = file;
    return n;
}

// Records which ids reach the backend.
class RecordingGraphBackend : public MemoryGraphBackend {
public:
    bool upsert_node(const GraphNode& node) override {
        written_nodes.push_back(node);
        return MemoryGraphBackend::upsert_node(node);
    }
    WriteOutcome upsert_relationship(const GraphRelationship& rel) override {
        written_relationships.push_back(rel);
        return MemoryGraphBackend::upsert_relationship(rel);
    }
    void reset() {
        written_nodes.clear();
        written_relationships.clear();
    }

    std::vector<GraphNode> written_nodes;
    std::vector<GraphRelationship> written_relationships;
};

std::set<std::string> relationship_keys(const std::vector<GraphRelationship>& rels) {
    std::set<std::string> keys;
    for (const auto& r : rels) keys.insert(r.key());
    return keys;
}

} // namespace

class GraphStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<MemoryGraphBackend>();
        GraphConfig config;
        config.connect_backoff_ms = 1;
        store_ = std::make_shared<RelationshipGraphStore>(backend_, config);
        ASSERT_TRUE(store_->connect());

        write_sample_python_project(project_);
        indexer_ = std::make_unique<ProjectIndexer>(std::make_shared<LanguageAnalyzer>());
        index_ = indexer_->index_project(project_.path());
    }

    std::shared_ptr<MemoryGraphBackend> backend_;
    std::shared_ptr<RelationshipGraphStore> store_;
    TempProject project_{"sample"};
    std::unique_ptr<ProjectIndexer> indexer_;
    ProjectIndex index_;
};

TEST_F(GraphStoreTest, ProjectionCoversFilesSymbolsAndDependencies) {
    GraphProjection projection = project_index(index_);

    ASSERT_FALSE(projection.nodes.empty());
    EXPECT_EQ(projection.nodes.front().id, "project:sample");
    EXPECT_EQ(projection.nodes.front().label, "Project");

    const Symbol* main_fn = find_symbol(index_, "main", SymbolKind::Function);
    const Symbol* helper = find_symbol(index_, "helper", SymbolKind::Function);
    ASSERT_NE(main_fn, nullptr);
    ASSERT_NE(helper, nullptr);

    const auto& rels = projection.relationships;
    EXPECT_TRUE(has_relationship(rels, "project:sample", "CONTAINS", "file:main.py"));
    EXPECT_TRUE(has_relationship(rels, "file:main.py", "CONTAINS", main_fn->id));
    EXPECT_TRUE(has_relationship(rels, "file:main.py", "IMPORTS", "file:utils.py"));
    EXPECT_TRUE(has_relationship(rels, "file:main.py", "DEPENDS_ON", "file:models.py"));
    EXPECT_TRUE(has_relationship(rels, main_fn->id, "CALLS", helper->id));

    std::set<std::string> keys;
    for (const auto& r : rels) EXPECT_TRUE(keys.insert(r.key()).second) << r.key();
}

TEST_F(GraphStoreTest, IngestIsIdempotent) {
    IngestReport first = store_->ingest_project(index_);
    EXPECT_TRUE(first.diagnostics.empty());
    size_t nodes = backend_->node_count();
    size_t rels = backend_->relationship_count();
    EXPECT_EQ(nodes, first.nodes_written);

    IngestReport second = store_->ingest_project(index_);
    EXPECT_TRUE(second.diagnostics.empty());
    EXPECT_EQ(backend_->node_count(), nodes);
    EXPECT_EQ(backend_->relationship_count(), rels);
    EXPECT_EQ(second.relationships_written, first.relationships_written);
}

TEST_F(GraphStoreTest, ReplaceFileSwapsOnlyThatSubgraph) {
    store_->ingest_project(index_);
    const Symbol* user = find_symbol(index_, "User", SymbolKind::Class);
    ASSERT_NE(user, nullptr);
    std::string user_id = user->id;

    project_.write("utils.py",
                   "def helper(value):\n"
                   "    return str(value)\n"
                   "\n"
                   "def shout(value):\n"
                   "    return helper(value).upper()\n");
    indexer_->reindex_file("utils.py");
    ProjectIndex updated = indexer_->snapshot();

    IngestReport report = store_->replace_file(updated, "utils.py");
    EXPECT_TRUE(report.diagnostics.empty());
    EXPECT_GT(report.nodes_removed, 0u);

    const Symbol* shout = find_symbol(updated, "shout", SymbolKind::Function);
    ASSERT_NE(shout, nullptr);
    EXPECT_TRUE(store_->get_node(shout->id).has_value());
    EXPECT_TRUE(store_->get_node(user_id).has_value());
    EXPECT_TRUE(has_relationship(store_->incoming("file:utils.py"), "file:main.py", "DEPENDS_ON", "file:utils.py"));
}

TEST_F(GraphStoreTest, RemoveFileDropsNodesAndEdges) {
    store_->ingest_project(index_);
    EXPECT_GT(store_->remove_file("sample", "models.py"), 0u);
    EXPECT_FALSE(store_->get_node("file:models.py").has_value());
    EXPECT_FALSE(has_relationship(store_->outgoing("file:main.py"), "file:main.py", "DEPENDS_ON", "file:models.py"));
    EXPECT_TRUE(store_->get_node("file:main.py").has_value());
}

TEST_F(GraphStoreTest, RelationshipToMissingNodeIsRejected) {
    ASSERT_TRUE(store_->upsert_node(make_node("file:a.py", "File", "a.py")));
    GraphRelationship rel;
    rel.from_id = "file:a.py";
    rel.to_id = "file:ghost.py";
    rel.type = "DEPENDS_ON";

    GraphWriteResult result = store_->upsert_relationship(rel);
    EXPECT_FALSE(result);
    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_EQ(result.diagnostic->kind, ErrorKind::GraphIntegrityViolation);
    EXPECT_EQ(backend_->relationship_count(), 0u);
}

TEST_F(GraphStoreTest, RelationshipUpsertKeepsOneEdgePerKey) {
    store_->upsert_node(make_node("file:a.py", "File", "a.py"));
    store_->upsert_node(make_node("file:b.py", "File", "b.py"));
    GraphRelationship rel;
    rel.from_id = "file:a.py";
    rel.to_id = "file:b.py";
    rel.type = "DEPENDS_ON";
    EXPECT_TRUE(store_->upsert_relationship(rel));
    rel.weight = 3.0;
    EXPECT_TRUE(store_->upsert_relationship(rel));

    auto out = store_->outgoing("file:a.py");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out.front().weight, 3.0);
}

TEST_F(GraphStoreTest, ClearProjectRemovesEverything) {
    store_->ingest_project(index_);
    ClearResult cleared = store_->clear_project("sample");
    EXPECT_GT(cleared.nodes_removed, 0u);
    EXPECT_GT(cleared.relationships_removed, 0u);
    EXPECT_TRUE(store_->project_nodes("sample").empty());
    EXPECT_EQ(backend_->relationship_count(), 0u);
}

TEST_F(GraphStoreTest, DisconnectedBackendDegradesToEmptyResults) {
    store_->ingest_project(index_);
    backend_->set_reachable(false);
    store_->disconnect();

    EXPECT_FALSE(store_->connect());
    EXPECT_FALSE(store_->is_connected());
    EXPECT_TRUE(store_->project_nodes("sample").empty());
    EXPECT_TRUE(store_->outgoing("file:main.py").empty());

    IngestReport report = store_->ingest_project(index_);
    ASSERT_FALSE(report.diagnostics.empty());
    EXPECT_EQ(report.diagnostics.front().kind, ErrorKind::BackendUnavailable);

    GraphHealth health = store_->health();
    EXPECT_FALSE(health.connected);
    EXPECT_EQ(health.backend, "memory");

    backend_->set_reachable(true);
    EXPECT_TRUE(store_->connect());
    EXPECT_FALSE(store_->project_nodes("sample").empty());
}

TEST_F(GraphStoreTest, ReplaceFileRestoresIncomingCalls) {
    store_->ingest_project(index_);
    const Symbol* main_fn = find_symbol(index_, "main", SymbolKind::Function);
    ASSERT_NE(main_fn, nullptr);

    indexer_->reindex_file("utils.py");
    ProjectIndex updated = indexer_->snapshot();
    const Symbol* helper = find_symbol(updated, "helper", SymbolKind::Function);
    ASSERT_NE(helper, nullptr);

    store_->replace_file(updated, "utils.py");
    EXPECT_TRUE(has_relationship(store_->incoming(helper->id), main_fn->id, "CALLS", helper->id));
    EXPECT_EQ(relationship_keys(store_->project_relationships("sample")),
              relationship_keys(project_index(updated).relationships));
}

TEST_F(GraphStoreTest, UpsertReplacesNodeProperties) {
    GraphNode node = make_node("file:a.py", "File", "a.py");
    node.properties = {{"language", "python"}, {"docstring", "old"}};
    ASSERT_TRUE(store_->upsert_node(node));

    node.properties = {{"language", "python"}};
    ASSERT_TRUE(store_->upsert_node(node));

    auto stored = store_->get_node("file:a.py");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->properties.value("language", ""), "python");
    EXPECT_FALSE(stored->properties.contains("docstring"));
}

class WideProjectGraphTest : public ::testing::Test {
protected:
    static constexpr int kModules = 24;

    void SetUp() override {
        project_.write("core.py",
                       "def base_fn():\n"
                       "    return 1\n");
        for (int i = 0; i < kModules; ++i) project_.write(module(i), module_source(i, "base_fn()"));

        backend_ = std::make_shared<RecordingGraphBackend>();
        GraphConfig config;
        config.connect_backoff_ms = 1;
        store_ = std::make_shared<RelationshipGraphStore>(backend_, config);
        ASSERT_TRUE(store_->connect());

        indexer_ = std::make_unique<ProjectIndexer>(std::make_shared<LanguageAnalyzer>());
        ASSERT_TRUE(store_->ingest_project(indexer_->index_project(project_.path())).diagnostics.empty());
        backend_->reset();
    }

    static std::string module(int i) { return "mod" + std::to_string(i) + ".py"; }

    static std::string module_source(int i, const std::string& body) {
        return "from core import base_fn\n"
               "\n"
               "def task_" + std::to_string(i) + "():\n"
               "    return " + body + "\n";
    }

    TempProject project_{"wide"};
    std::shared_ptr<RecordingGraphBackend> backend_;
    std::shared_ptr<RelationshipGraphStore> store_;
    std::unique_ptr<ProjectIndexer> indexer_;
};

TEST_F(WideProjectGraphTest, ReindexWritesOnlyTheChangedFile) {
    project_.write(module(7), module_source(7, "base_fn() + 1"));
    indexer_->reindex_file(module(7));
    ProjectIndex updated = indexer_->snapshot();

    IngestReport report = store_->replace_file(updated, module(7));
    EXPECT_TRUE(report.diagnostics.empty());

    std::set<std::string> members;
    for (const auto& node : backend_->written_nodes) {
        if (node.label == "Project") continue;
        EXPECT_EQ(node.file_path, module(7)) << node.id;
        members.insert(node.id);
    }
    EXPECT_EQ(members.size(), 1 + updated.files.at(module(7)).symbols.size());
    for (const auto& rel : backend_->written_relationships) {
        EXPECT_TRUE(members.count(rel.from_id) || members.count(rel.to_id)) << rel.key();
    }
    EXPECT_TRUE(has_relationship(store_->outgoing("file:mod7.py"), "file:mod7.py", "DEPENDS_ON", "file:core.py"));
}

TEST_F(WideProjectGraphTest, ReplacingSharedFileRelinksEveryCaller) {
    project_.write("core.py",
                   "def base_fn():\n"
                   "    return 2\n");
    indexer_->reindex_file("core.py");
    ProjectIndex updated = indexer_->snapshot();

    store_->replace_file(updated, "core.py");
    const Symbol* base = find_symbol(updated, "base_fn", SymbolKind::Function);
    ASSERT_NE(base, nullptr);

    size_t calls = 0;
    for (const auto& rel : store_->incoming(base->id)) calls += rel.type == "CALLS";
    EXPECT_EQ(calls, static_cast<size_t>(kModules));
    EXPECT_EQ(relationship_keys(store_->project_relationships("wide")),
              relationship_keys(project_index(updated).relationships));
}

TEST_F(WideProjectGraphTest, FileProjectionMatchesFullProjection) {
    ProjectIndex index = indexer_->snapshot();
    GraphProjection full = project_index(index);

    for (const auto& [path, fa] : index.files) {
        std::set<std::string> members;
        for (const auto& node : full.nodes) {
            if (node.file_path == path) members.insert(node.id);
        }
        std::set<std::string> expected;
        for (const auto& rel : full.relationships) {
            if (members.count(rel.from_id) || members.count(rel.to_id)) expected.insert(rel.key());
        }
        EXPECT_EQ(relationship_keys(project_file(index, path).relationships), expected) << path;
    }
}
