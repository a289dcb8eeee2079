#pragma once

#include <nlohmann/json.hpp>
#include "engine_config.hpp"
#include "graph/graph_backend.hpp"

namespace code_intelligence {

// Neo4j over the transactional HTTP Cypher endpoint.
// Every node carries the :CodeNode label plus its specific label.
class Neo4jGraphBackend : public GraphBackend {
public:
    explicit Neo4jGraphBackend(GraphConfig config);

    std::string name() const override { return "neo4j"; }
    bool connect() override;
    void disconnect() override;
    bool is_connected() const override { return connected_; }

    bool upsert_node(const GraphNode& node) override;
    WriteOutcome upsert_relationship(const GraphRelationship& rel) override;

    ClearResult delete_project(const std::string& project_id) override;
    ClearResult delete_file_nodes(const std::string& project_id, const std::string& file_path) override;

    size_t node_count() override;
    size_t relationship_count() override;

    std::optional<GraphNode> get_node(const std::string& id) override;
    std::vector<GraphRelationship> outgoing(const std::string& id) override;
    std::vector<GraphRelationship> incoming(const std::string& id) override;
    std::vector<GraphNode> project_nodes(const std::string& project_id) override;
    std::vector<GraphRelationship> project_relationships(const std::string& project_id) override;

    // bolt://host:7687 -> http://host:7474/db/<database>/tx/commit
    static std::string commit_endpoint(const std::string& uri, const std::string& database);
    static bool is_known_label(const std::string& label);
    static bool is_known_relationship(const std::string& type);

private:
    GraphConfig config_;
    std::string endpoint_;
    bool connected_ = false;

    // One transaction; returns the "results" array or nullopt on any error.
    std::optional<nlohmann::json> run(const nlohmann::json& statements);
    std::optional<nlohmann::json> run_one(const std::string& cypher, const nlohmann::json& params);

    static nlohmann::json flatten_properties(const nlohmann::json& props);
    static GraphNode node_from_row(const nlohmann::json& row);
    static GraphRelationship relationship_from_row(const nlohmann::json& row);
    std::vector<GraphRelationship> relationships_query(const std::string& cypher, const nlohmann::json& params);
    size_t count_query(const std::string& cypher, const nlohmann::json& params);
};

} // namespace code_intelligence
