#include "graph/graph_types.hpp"
#include "text_utils.hpp"

namespace code_intelligence {

using json = nlohmann::json;

json GraphNode::to_json() const {
    return {
        {"id", sanitize_utf8(id)},
        {"label", label},
        {"name", sanitize_utf8(name)},
        {"project_id", project_id},
        {"file_path", sanitize_utf8(file_path)},
        {"properties", properties}
    };
}

GraphNode GraphNode::from_json(const json& j) {
    GraphNode node;
    node.id = j.value("id", "");
    node.label = j.value("label", "");
    node.name = j.value("name", "");
    node.project_id = j.value("project_id", "");
    node.file_path = j.value("file_path", "");
    if (j.contains("properties") && j["properties"].is_object()) node.properties = j["properties"];
    return node;
}

json GraphRelationship::to_json() const {
    return {
        {"from_id", from_id},
        {"to_id", to_id},
        {"type", type},
        {"weight", weight},
        {"properties", properties}
    };
}

GraphRelationship GraphRelationship::from_json(const json& j) {
    GraphRelationship rel;
    rel.from_id = j.value("from_id", "");
    rel.to_id = j.value("to_id", "");
    rel.type = j.value("type", "");
    rel.weight = j.value("weight", 1.0);
    if (j.contains("properties") && j["properties"].is_object()) rel.properties = j["properties"];
    return rel;
}

json GraphHealth::to_json() const {
    json j = {
        {"connected", connected},
        {"node_count", node_count},
        {"relationship_count", relationship_count},
        {"query_time_ms", query_time_ms},
        {"backend", backend}
    };
    if (!error.empty()) j["error"] = error;
    return j;
}

json IngestReport::to_json() const {
    return {
        {"nodes_written", nodes_written},
        {"relationships_written", relationships_written},
        {"nodes_removed", nodes_removed},
        {"diagnostics", diagnostics_to_json(diagnostics)}
    };
}

} // namespace code_intelligence
