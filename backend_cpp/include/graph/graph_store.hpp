#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "code_model.hpp"
#include "engine_config.hpp"
#include "graph/graph_backend.hpp"

namespace code_intelligence {

// Nodes and edges derived from a ProjectIndex.
struct GraphProjection {
    std::vector<GraphNode> nodes;
    std::vector<GraphRelationship> relationships;
};

std::string project_node_id(const std::string& project_id);

// Full projection of the index (deterministic order).
GraphProjection project_index(const ProjectIndex& index);

// Nodes of one file plus every relationship with an endpoint in that file.
GraphProjection project_file(const ProjectIndex& index, const std::string& file_path);

class RelationshipGraphStore {
public:
    explicit RelationshipGraphStore(std::shared_ptr<GraphBackend> backend, GraphConfig config = {});

    // Idempotent; one retry after config.connect_backoff_ms.
    bool connect();
    void disconnect();
    bool is_connected() const;
    std::string backend_name() const;

    bool upsert_node(const GraphNode& node);
    GraphWriteResult upsert_relationship(const GraphRelationship& rel);
    ClearResult clear_project(const std::string& project_id);
    GraphHealth health();

    IngestReport ingest_project(const ProjectIndex& index);
    IngestReport replace_file(const ProjectIndex& index, const std::string& file_path);
    size_t remove_file(const std::string& project_id, const std::string& file_path);

    std::optional<GraphNode> get_node(const std::string& id);
    std::vector<GraphRelationship> outgoing(const std::string& id);
    std::vector<GraphRelationship> incoming(const std::string& id);
    std::vector<GraphNode> project_nodes(const std::string& project_id);
    std::vector<GraphRelationship> project_relationships(const std::string& project_id);

private:
    std::shared_ptr<GraphBackend> backend_;
    GraphConfig config_;
    mutable std::mutex mutex_;

    GraphWriteResult upsert_relationship_locked(const GraphRelationship& rel);
    void write_projection_locked(const GraphProjection& projection, IngestReport& report);
};

} // namespace code_intelligence
