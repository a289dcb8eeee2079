#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine_config.hpp"
#include "graph/graph_store.hpp"

namespace code_intelligence {

struct TraversalHit {
    std::string id;
    std::string name;
    std::string label;
    int distance = 0;
    std::vector<std::string> relationship_path;

    nlohmann::json to_json() const;
};

struct DependencyCycle {
    std::vector<std::string> nodes; // canonical rotation, smallest id first
    size_t length = 0;
    std::string severity;           // "high" | "medium"

    nlohmann::json to_json() const;
};

struct CouplingEntry {
    std::string id;
    std::string file_path;
    int afferent = 0;
    int efferent = 0;
    int total = 0;
    bool highly_coupled = false;

    nlohmann::json to_json() const;
};

struct CouplingReport {
    std::vector<CouplingEntry> files;
    double average_coupling = 0.0;
    std::vector<std::string> highly_coupled;

    nlohmann::json to_json() const;
};

struct Hotspot {
    std::string id;
    std::string name;
    std::string label;
    std::string file_path;
    int in_degree = 0;
    int out_degree = 0;
    int total_degree = 0;
    std::string risk; // "low" | "medium" | "high"

    nlohmann::json to_json() const;
};

// Read-only queries over a RelationshipGraphStore. Never throws; an empty
// or disconnected graph yields empty results.
class GraphAnalytics {
public:
    explicit GraphAnalytics(std::shared_ptr<RelationshipGraphStore> store, AnalyticsConfig config = {});

    std::vector<TraversalHit> dependencies(const std::string& node_id, int depth = -1);
    std::vector<TraversalHit> dependents(const std::string& node_id, int depth = -1);

    std::vector<DependencyCycle> find_circular_dependencies(const std::string& project_id);
    CouplingReport analyze_coupling(const std::string& project_id);
    std::vector<Hotspot> find_hotspots(const std::string& project_id);
    nlohmann::json get_architecture_overview(const std::string& project_id);
    std::vector<GraphNode> find_complex_functions(const std::string& project_id, int threshold);

    const AnalyticsConfig& config() const { return config_; }

private:
    std::shared_ptr<RelationshipGraphStore> store_;
    AnalyticsConfig config_;

    std::vector<TraversalHit> traverse(const std::string& node_id, int depth, bool forward);
    bool traversable(const std::string& type) const;

    std::vector<DependencyCycle> cycles_from(const std::vector<GraphNode>& nodes,
                                             const std::vector<GraphRelationship>& rels) const;
    std::vector<Hotspot> hotspots_from(const std::vector<GraphNode>& nodes,
                                       const std::vector<GraphRelationship>& rels) const;
};

} // namespace code_intelligence
