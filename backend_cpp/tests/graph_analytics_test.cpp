#include <gtest/gtest.h>
#include <algorithm>
#include "graph/graph_analytics.hpp"
#include "graph/memory_graph_backend.hpp"

using namespace code_intelligence;

class GraphAnalyticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<MemoryGraphBackend>();
        store_ = std::make_shared<RelationshipGraphStore>(backend_);
        ASSERT_TRUE(store_->connect());
        analytics_ = std::make_unique<GraphAnalytics>(store_);

        GraphNode project;
        project.id = "project:p";
        project.label = "Project";
        project.name = "p";
        project.project_id = "p";
        store_->upsert_node(project);
    }

    void add_file(const std::string& path) {
        GraphNode n;
        n.id = "file:" + path;
        n.label = "File";
        n.name = path;
        n.project_id = "p";
        n.file_path = path;
        ASSERT_TRUE(store_->upsert_node(n));
        link("project:p", n.id, "CONTAINS");
    }

    void add_function(const std::string& file, const std::string& name, int complexity) {
        GraphNode n;
        n.id = "function:" + file + ":" + name + ":1";
        n.label = "Function";
        n.name = name;
        n.project_id = "p";
        n.file_path = file;
        n.properties = {{"complexity", complexity}};
        ASSERT_TRUE(store_->upsert_node(n));
        link("file:" + file, n.id, "CONTAINS");
    }

    void link(const std::string& from, const std::string& to, const std::string& type) {
        GraphRelationship rel;
        rel.from_id = from;
        rel.to_id = to;
        rel.type = type;
        ASSERT_TRUE(store_->upsert_relationship(rel));
    }

    void depends(const std::string& from, const std::string& to) {
        link("file:" + from, "file:" + to, "DEPENDS_ON");
    }

    std::shared_ptr<MemoryGraphBackend> backend_;
    std::shared_ptr<RelationshipGraphStore> store_;
    std::unique_ptr<GraphAnalytics> analytics_;
};

TEST_F(GraphAnalyticsTest, DetectsSingleThreeNodeCycle) {
    add_file("a.py");
    add_file("b.py");
    add_file("c.py");
    depends("a.py", "b.py");
    depends("b.py", "c.py");
    depends("c.py", "a.py");

    auto cycles = analytics_->find_circular_dependencies("p");
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].length, 3u);
    EXPECT_EQ(cycles[0].severity, "high");
    EXPECT_EQ(cycles[0].nodes, (std::vector<std::string>{"file:a.py", "file:b.py", "file:c.py"}));
}

TEST_F(GraphAnalyticsTest, TwoNodeCycleIsMediumSeverity) {
    add_file("a.py");
    add_file("b.py");
    depends("a.py", "b.py");
    depends("b.py", "a.py");

    auto cycles = analytics_->find_circular_dependencies("p");
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].length, 2u);
    EXPECT_EQ(cycles[0].severity, "medium");
}

TEST_F(GraphAnalyticsTest, AcyclicGraphHasNoCycles) {
    add_file("a.py");
    add_file("b.py");
    add_file("c.py");
    depends("a.py", "b.py");
    depends("b.py", "c.py");
    depends("a.py", "c.py");

    EXPECT_TRUE(analytics_->find_circular_dependencies("p").empty());
}

TEST_F(GraphAnalyticsTest, TraversesDependenciesAndDependents) {
    add_file("a.py");
    add_file("b.py");
    add_file("c.py");
    depends("a.py", "b.py");
    depends("b.py", "c.py");

    auto direct = analytics_->dependencies("file:a.py", 1);
    ASSERT_EQ(direct.size(), 1u);
    EXPECT_EQ(direct[0].id, "file:b.py");
    EXPECT_EQ(direct[0].distance, 1);
    EXPECT_EQ(direct[0].label, "File");

    auto transitive = analytics_->dependencies("file:a.py", 3);
    ASSERT_EQ(transitive.size(), 2u);
    EXPECT_EQ(transitive[1].id, "file:c.py");
    EXPECT_EQ(transitive[1].distance, 2);
    EXPECT_EQ(transitive[1].relationship_path, (std::vector<std::string>{"DEPENDS_ON", "DEPENDS_ON"}));

    auto users = analytics_->dependents("file:c.py", 3);
    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users[0].id, "file:b.py");
    EXPECT_EQ(users[1].id, "file:a.py");

    EXPECT_TRUE(analytics_->dependencies("file:a.py", 0).empty());
}

TEST_F(GraphAnalyticsTest, TraversalIgnoresContainment) {
    add_file("a.py");
    add_function("a.py", "run", 1);
    EXPECT_TRUE(analytics_->dependencies("file:a.py", 2).empty());
    EXPECT_TRUE(analytics_->dependencies("project:p", 2).empty());
}

TEST_F(GraphAnalyticsTest, CouplingFlagsHighlyConnectedFiles) {
    for (const char* f : {"hub.py", "a.py", "b.py", "c.py", "d.py"}) add_file(f);
    depends("a.py", "hub.py");
    depends("b.py", "hub.py");
    depends("c.py", "hub.py");
    depends("hub.py", "d.py");

    CouplingReport report = analytics_->analyze_coupling("p");
    ASSERT_EQ(report.files.size(), 5u);
    EXPECT_EQ(report.files.front().id, "file:hub.py");
    EXPECT_EQ(report.files.front().afferent, 3);
    EXPECT_EQ(report.files.front().efferent, 1);
    EXPECT_DOUBLE_EQ(report.average_coupling, 8.0 / 5.0);
    EXPECT_EQ(report.highly_coupled, std::vector<std::string>{"file:hub.py"});
}

TEST_F(GraphAnalyticsTest, HotspotsAreAboveThePercentile) {
    for (const char* f : {"hub.py", "a.py", "b.py", "c.py", "d.py"}) add_file(f);
    depends("a.py", "hub.py");
    depends("b.py", "hub.py");
    depends("c.py", "hub.py");
    depends("d.py", "hub.py");

    auto hotspots = analytics_->find_hotspots("p");
    ASSERT_EQ(hotspots.size(), 1u);
    EXPECT_EQ(hotspots[0].id, "file:hub.py");
    EXPECT_EQ(hotspots[0].in_degree, 4);
    EXPECT_EQ(hotspots[0].risk, "low");
}

TEST_F(GraphAnalyticsTest, OverviewSummarisesTheProject) {
    add_file("core/a.py");
    add_file("core/b.py");
    add_file("main.py");
    add_function("core/a.py", "run", 12);
    add_function("main.py", "start", 2);
    depends("main.py", "core/a.py");
    depends("core/a.py", "core/b.py");

    auto overview = analytics_->get_architecture_overview("p");
    EXPECT_EQ(overview["project_id"], "p");
    EXPECT_EQ(overview["node_counts"]["File"], 3);
    EXPECT_EQ(overview["node_counts"]["Function"], 2);
    EXPECT_EQ(overview["relationship_counts"]["DEPENDS_ON"], 2);
    EXPECT_EQ(overview["metrics"]["total_nodes"], 6);
    EXPECT_EQ(overview["circular_dependency_count"], 0);
    EXPECT_EQ(overview["components"]["core"]["files"], 2);
    EXPECT_EQ(overview["components"]["core"]["symbols"], 1);
    EXPECT_FALSE(overview["most_connected"].empty());

    auto complex = analytics_->find_complex_functions("p", 10);
    ASSERT_EQ(complex.size(), 1u);
    EXPECT_EQ(complex[0].name, "run");
}

TEST_F(GraphAnalyticsTest, EmptyOrDisconnectedGraphYieldsEmptyResults) {
    EXPECT_TRUE(analytics_->find_circular_dependencies("missing").empty());
    EXPECT_TRUE(analytics_->find_hotspots("missing").empty());
    EXPECT_EQ(analytics_->get_architecture_overview("missing")["metrics"]["total_nodes"], 0);

    add_file("a.py");
    add_file("b.py");
    depends("a.py", "b.py");
    depends("b.py", "a.py");
    backend_->set_reachable(false);
    store_->disconnect();

    EXPECT_TRUE(analytics_->find_circular_dependencies("p").empty());
    EXPECT_TRUE(analytics_->dependencies("file:a.py").empty());
    EXPECT_TRUE(analytics_->analyze_coupling("p").files.empty());
}
