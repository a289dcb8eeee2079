#pragma once

#include <map>
#include <set>
#include <unordered_map>
#include "graph/graph_backend.hpp"

namespace code_intelligence {

// In-process property graph. Ordered maps keep reads deterministic.
class MemoryGraphBackend : public GraphBackend {
public:
    std::string name() const override { return "memory"; }
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

    // Test hook: a disconnected backend rejects every call.
    void set_reachable(bool reachable) { reachable_ = reachable; }

private:
    bool connected_ = false;
    bool reachable_ = true;

    std::map<std::string, GraphNode> nodes_;
    std::map<std::string, GraphRelationship> relationships_; // key() -> rel
    std::unordered_map<std::string, std::set<std::string>> out_index_;
    std::unordered_map<std::string, std::set<std::string>> in_index_;

    size_t erase_nodes(const std::vector<std::string>& ids, size_t& rels_removed);
};

} // namespace code_intelligence
