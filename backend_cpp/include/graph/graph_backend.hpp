#pragma once

#include <optional>
#include <string>
#include <vector>
#include "graph/graph_types.hpp"

namespace code_intelligence {

// Storage seam of the relationship graph. Implementations are not
// required to be thread-safe; RelationshipGraphStore serializes access.
class GraphBackend {
public:
    virtual ~GraphBackend() = default;

    virtual std::string name() const = 0;
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual bool upsert_node(const GraphNode& node) = 0;
    virtual WriteOutcome upsert_relationship(const GraphRelationship& rel) = 0;

    // Relationships touching the removed nodes go first.
    virtual ClearResult delete_project(const std::string& project_id) = 0;
    virtual ClearResult delete_file_nodes(const std::string& project_id, const std::string& file_path) = 0;

    virtual size_t node_count() = 0;
    virtual size_t relationship_count() = 0;

    virtual std::optional<GraphNode> get_node(const std::string& id) = 0;
    virtual std::vector<GraphRelationship> outgoing(const std::string& id) = 0;
    virtual std::vector<GraphRelationship> incoming(const std::string& id) = 0;
    virtual std::vector<GraphNode> project_nodes(const std::string& project_id) = 0;
    virtual std::vector<GraphRelationship> project_relationships(const std::string& project_id) = 0;
};

} // namespace code_intelligence
