#include "graph/memory_graph_backend.hpp"

namespace code_intelligence {

bool MemoryGraphBackend::connect() {
    connected_ = reachable_;
    return connected_;
}

void MemoryGraphBackend::disconnect() {
    connected_ = false;
}

bool MemoryGraphBackend::upsert_node(const GraphNode& node) {
    if (!connected_ || node.id.empty()) return false;
    auto it = nodes_.find(node.id);
    if (it == nodes_.end()) {
        nodes_.emplace(node.id, node);
        return true;
    }
    GraphNode& existing = it->second;
    existing.label = node.label;
    existing.name = node.name;
    existing.project_id = node.project_id;
    existing.file_path = node.file_path;
    existing.properties = node.properties;
    return true;
}

WriteOutcome MemoryGraphBackend::upsert_relationship(const GraphRelationship& rel) {
    if (!connected_) return WriteOutcome::Failed;
    if (!nodes_.count(rel.from_id) || !nodes_.count(rel.to_id)) return WriteOutcome::MissingEndpoint;

    std::string key = rel.key();
    auto it = relationships_.find(key);
    if (it == relationships_.end()) {
        relationships_.emplace(key, rel);
        out_index_[rel.from_id].insert(key);
        in_index_[rel.to_id].insert(key);
    } else {
        it->second.weight = rel.weight;
        it->second.properties.update(rel.properties);
    }
    return WriteOutcome::Ok;
}

size_t MemoryGraphBackend::erase_nodes(const std::vector<std::string>& ids, size_t& rels_removed) {
    // Relationships first, then nodes.
    for (const auto& id : ids) {
        std::set<std::string> keys;
        if (auto it = out_index_.find(id); it != out_index_.end()) keys.insert(it->second.begin(), it->second.end());
        if (auto it = in_index_.find(id); it != in_index_.end()) keys.insert(it->second.begin(), it->second.end());

        for (const auto& key : keys) {
            auto rit = relationships_.find(key);
            if (rit == relationships_.end()) continue;
            out_index_[rit->second.from_id].erase(key);
            in_index_[rit->second.to_id].erase(key);
            relationships_.erase(rit);
            ++rels_removed;
        }
        out_index_.erase(id);
        in_index_.erase(id);
    }

    size_t removed = 0;
    for (const auto& id : ids) removed += nodes_.erase(id);
    return removed;
}

ClearResult MemoryGraphBackend::delete_project(const std::string& project_id) {
    ClearResult result;
    if (!connected_) return result;

    std::vector<std::string> ids;
    for (const auto& [id, node] : nodes_) {
        if (node.project_id == project_id) ids.push_back(id);
    }
    result.nodes_removed = erase_nodes(ids, result.relationships_removed);
    return result;
}

ClearResult MemoryGraphBackend::delete_file_nodes(const std::string& project_id, const std::string& file_path) {
    ClearResult result;
    if (!connected_) return result;

    std::vector<std::string> ids;
    for (const auto& [id, node] : nodes_) {
        if (node.project_id == project_id && node.file_path == file_path && node.label != "Project") {
            ids.push_back(id);
        }
    }
    result.nodes_removed = erase_nodes(ids, result.relationships_removed);
    return result;
}

size_t MemoryGraphBackend::node_count() {
    return connected_ ? nodes_.size() : 0;
}

size_t MemoryGraphBackend::relationship_count() {
    return connected_ ? relationships_.size() : 0;
}

std::optional<GraphNode> MemoryGraphBackend::get_node(const std::string& id) {
    if (!connected_) return std::nullopt;
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<GraphRelationship> MemoryGraphBackend::outgoing(const std::string& id) {
    std::vector<GraphRelationship> out;
    if (!connected_) return out;
    auto it = out_index_.find(id);
    if (it == out_index_.end()) return out;
    for (const auto& key : it->second) out.push_back(relationships_.at(key));
    return out;
}

std::vector<GraphRelationship> MemoryGraphBackend::incoming(const std::string& id) {
    std::vector<GraphRelationship> in;
    if (!connected_) return in;
    auto it = in_index_.find(id);
    if (it == in_index_.end()) return in;
    for (const auto& key : it->second) in.push_back(relationships_.at(key));
    return in;
}

std::vector<GraphNode> MemoryGraphBackend::project_nodes(const std::string& project_id) {
    std::vector<GraphNode> out;
    if (!connected_) return out;
    for (const auto& [id, node] : nodes_) {
        if (node.project_id == project_id) out.push_back(node);
    }
    return out;
}

std::vector<GraphRelationship> MemoryGraphBackend::project_relationships(const std::string& project_id) {
    std::vector<GraphRelationship> out;
    if (!connected_) return out;
    for (const auto& [key, rel] : relationships_) {
        auto it = nodes_.find(rel.from_id);
        if (it != nodes_.end() && it->second.project_id == project_id) out.push_back(rel);
    }
    return out;
}

} // namespace code_intelligence
