#include "graph/graph_analytics.hpp"
#include "SystemMonitor.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <functional>
#include <map>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace code_intelligence {

using json = nlohmann::json;

namespace {

std::string risk_for(int degree) {
    if (degree < 5) return "low";
    if (degree < 10) return "medium";
    return "high";
}

std::string top_level_component(const std::string& file_path) {
    size_t slash = file_path.find('/');
    return slash == std::string::npos ? "." : file_path.substr(0, slash);
}

} // namespace

json TraversalHit::to_json() const {
    return {{"id", id}, {"name", name}, {"label", label}, {"distance", distance},
            {"relationship_path", relationship_path}};
}

json DependencyCycle::to_json() const {
    return {{"nodes", nodes}, {"length", length}, {"severity", severity}};
}

json CouplingEntry::to_json() const {
    return {{"id", id}, {"file_path", file_path}, {"afferent", afferent}, {"efferent", efferent},
            {"total", total}, {"highly_coupled", highly_coupled}};
}

json CouplingReport::to_json() const {
    json arr = json::array();
    for (const auto& f : files) arr.push_back(f.to_json());
    return {{"files", arr}, {"average_coupling", average_coupling}, {"highly_coupled", highly_coupled}};
}

json Hotspot::to_json() const {
    return {{"id", id}, {"name", name}, {"label", label}, {"file_path", file_path},
            {"in_degree", in_degree}, {"out_degree", out_degree}, {"total_degree", total_degree},
            {"risk", risk}};
}

GraphAnalytics::GraphAnalytics(std::shared_ptr<RelationshipGraphStore> store, AnalyticsConfig config)
    : store_(std::move(store)), config_(std::move(config)) {}

bool GraphAnalytics::traversable(const std::string& type) const {
    return std::find(config_.traversal_types.begin(), config_.traversal_types.end(), type) !=
           config_.traversal_types.end();
}

// --- TRAVERSAL ---

std::vector<TraversalHit> GraphAnalytics::traverse(const std::string& node_id, int depth, bool forward) {
    std::vector<TraversalHit> hits;
    if (depth < 0) depth = config_.default_depth;
    if (depth == 0 || !store_->is_connected()) return hits;

    try {
        std::unordered_set<std::string> visited{node_id};
        std::deque<std::tuple<std::string, int, std::vector<std::string>>> queue;
        queue.emplace_back(node_id, 0, std::vector<std::string>{});

        while (!queue.empty()) {
            auto [current, dist, path] = queue.front();
            queue.pop_front();
            if (dist >= depth) continue;

            auto edges = forward ? store_->outgoing(current) : store_->incoming(current);
            std::sort(edges.begin(), edges.end(), [&](const GraphRelationship& a, const GraphRelationship& b) {
                const auto& na = forward ? a.to_id : a.from_id;
                const auto& nb = forward ? b.to_id : b.from_id;
                return std::tie(na, a.type) < std::tie(nb, b.type);
            });

            for (const auto& rel : edges) {
                if (!traversable(rel.type)) continue;
                const std::string& next = forward ? rel.to_id : rel.from_id;
                if (!visited.insert(next).second) continue;

                TraversalHit hit;
                hit.id = next;
                hit.distance = dist + 1;
                hit.relationship_path = path;
                hit.relationship_path.push_back(rel.type);
                if (auto node = store_->get_node(next)) {
                    hit.name = node->name;
                    hit.label = node->label;
                }
                queue.emplace_back(next, hit.distance, hit.relationship_path);
                hits.push_back(std::move(hit));
            }
        }
        SystemMonitor::global_graph_nodes_scanned.store(static_cast<int>(visited.size()));
    } catch (const std::exception& e) {
        spdlog::error("❌ Traversal from {} failed: {}", node_id, e.what());
        return {};
    }

    std::sort(hits.begin(), hits.end(), [](const TraversalHit& a, const TraversalHit& b) {
        return std::tie(a.distance, a.id) < std::tie(b.distance, b.id);
    });
    if (hits.size() > config_.max_traversal_results) hits.resize(config_.max_traversal_results);
    return hits;
}

std::vector<TraversalHit> GraphAnalytics::dependencies(const std::string& node_id, int depth) {
    return traverse(node_id, depth, true);
}

std::vector<TraversalHit> GraphAnalytics::dependents(const std::string& node_id, int depth) {
    return traverse(node_id, depth, false);
}

// --- CYCLES ---

std::vector<DependencyCycle> GraphAnalytics::cycles_from(const std::vector<GraphNode>& nodes,
                                                         const std::vector<GraphRelationship>& rels) const {
    std::set<std::string> modules;
    for (const auto& n : nodes) {
        if (n.label == "File" || n.label == "Module") modules.insert(n.id);
    }
    std::map<std::string, std::set<std::string>> adjacency;
    for (const auto& r : rels) {
        if (r.type != "DEPENDS_ON" || r.from_id == r.to_id) continue;
        if (modules.count(r.from_id) && modules.count(r.to_id)) adjacency[r.from_id].insert(r.to_id);
    }

    std::vector<DependencyCycle> cycles;
    std::vector<std::string> path;
    std::set<std::string> on_path;

    // Elementary cycles rooted at their smallest id: only larger ids are visited.
    std::function<void(const std::string&, const std::string&)> dfs =
        [&](const std::string& start, const std::string& current) {
            if (cycles.size() >= config_.max_cycles) return;
            auto it = adjacency.find(current);
            if (it == adjacency.end()) return;
            for (const auto& next : it->second) {
                if (cycles.size() >= config_.max_cycles) return;
                if (next == start) {
                    DependencyCycle c;
                    c.nodes = path;
                    c.length = path.size();
                    c.severity = c.length >= config_.high_severity_min_length ? "high" : "medium";
                    cycles.push_back(std::move(c));
                    continue;
                }
                if (next < start || on_path.count(next) || path.size() >= config_.max_cycle_length) continue;
                path.push_back(next);
                on_path.insert(next);
                dfs(start, next);
                on_path.erase(next);
                path.pop_back();
            }
        };

    for (const auto& [start, targets] : adjacency) {
        if (cycles.size() >= config_.max_cycles) break;
        path = {start};
        on_path = {start};
        dfs(start, start);
    }
    return cycles;
}

std::vector<DependencyCycle> GraphAnalytics::find_circular_dependencies(const std::string& project_id) {
    try {
        if (!store_->is_connected()) return {};
        auto cycles = cycles_from(store_->project_nodes(project_id), store_->project_relationships(project_id));
        if (!cycles.empty()) spdlog::info("🔁 {} circular dependencies in '{}'", cycles.size(), project_id);
        return cycles;
    } catch (const std::exception& e) {
        spdlog::error("❌ Cycle detection failed for {}: {}", project_id, e.what());
        return {};
    }
}

// --- COUPLING ---

CouplingReport GraphAnalytics::analyze_coupling(const std::string& project_id) {
    CouplingReport report;
    try {
        if (!store_->is_connected()) return report;
        auto nodes = store_->project_nodes(project_id);
        auto rels = store_->project_relationships(project_id);

        std::map<std::string, CouplingEntry> entries;
        for (const auto& n : nodes) {
            if (n.label != "File") continue;
            entries[n.id].id = n.id;
            entries[n.id].file_path = n.file_path;
        }
        for (const auto& r : rels) {
            if (r.type != "DEPENDS_ON") continue;
            if (auto it = entries.find(r.from_id); it != entries.end()) ++it->second.efferent;
            if (auto it = entries.find(r.to_id); it != entries.end()) ++it->second.afferent;
        }
        if (entries.empty()) return report;

        double sum = 0.0;
        for (auto& [id, e] : entries) {
            e.total = e.afferent + e.efferent;
            sum += e.total;
        }
        report.average_coupling = sum / static_cast<double>(entries.size());
        double limit = config_.coupling_factor * report.average_coupling;

        for (auto& [id, e] : entries) {
            e.highly_coupled = report.average_coupling > 0.0 && e.total > limit;
            report.files.push_back(e);
        }
        std::sort(report.files.begin(), report.files.end(), [](const CouplingEntry& a, const CouplingEntry& b) {
            if (a.total != b.total) return a.total > b.total;
            return a.id < b.id;
        });
        for (const auto& e : report.files) {
            if (e.highly_coupled) report.highly_coupled.push_back(e.id);
        }
    } catch (const std::exception& e) {
        spdlog::error("❌ Coupling analysis failed for {}: {}", project_id, e.what());
        return CouplingReport{};
    }
    return report;
}

// --- HOTSPOTS ---

std::vector<Hotspot> GraphAnalytics::hotspots_from(const std::vector<GraphNode>& nodes,
                                                   const std::vector<GraphRelationship>& rels) const {
    std::map<std::string, Hotspot> by_id;
    for (const auto& n : nodes) {
        Hotspot h;
        h.id = n.id;
        h.name = n.name;
        h.label = n.label;
        h.file_path = n.file_path;
        by_id.emplace(n.id, std::move(h));
    }
    for (const auto& r : rels) {
        if (r.type == "CONTAINS") continue;
        if (auto it = by_id.find(r.from_id); it != by_id.end()) ++it->second.out_degree;
        if (auto it = by_id.find(r.to_id); it != by_id.end()) ++it->second.in_degree;
    }

    std::vector<int> degrees;
    for (auto& [id, h] : by_id) {
        h.total_degree = h.in_degree + h.out_degree;
        if (h.total_degree > 0) degrees.push_back(h.total_degree);
    }
    if (degrees.empty()) return {};

    // Nearest-rank percentile.
    std::sort(degrees.begin(), degrees.end());
    size_t rank = static_cast<size_t>(std::ceil(config_.hotspot_percentile * static_cast<double>(degrees.size())));
    rank = std::clamp<size_t>(rank, 1, degrees.size());
    int threshold = degrees[rank - 1];

    std::vector<Hotspot> out;
    for (auto& [id, h] : by_id) {
        if (h.total_degree <= threshold) continue;
        h.risk = risk_for(h.total_degree);
        out.push_back(h);
    }
    std::sort(out.begin(), out.end(), [](const Hotspot& a, const Hotspot& b) {
        if (a.total_degree != b.total_degree) return a.total_degree > b.total_degree;
        return a.id < b.id;
    });
    return out;
}

std::vector<Hotspot> GraphAnalytics::find_hotspots(const std::string& project_id) {
    try {
        if (!store_->is_connected()) return {};
        return hotspots_from(store_->project_nodes(project_id), store_->project_relationships(project_id));
    } catch (const std::exception& e) {
        spdlog::error("❌ Hotspot analysis failed for {}: {}", project_id, e.what());
        return {};
    }
}

// --- OVERVIEW ---

json GraphAnalytics::get_architecture_overview(const std::string& project_id) {
    json overview = {
        {"project_id", project_id},
        {"node_counts", json::object()},
        {"relationship_counts", json::object()},
        {"most_connected", json::array()},
        {"hotspots", json::array()},
        {"metrics", {{"total_nodes", 0}, {"total_relationships", 0}, {"density", 0.0}, {"average_degree", 0.0}}},
        {"circular_dependency_count", 0},
        {"components", json::object()}
    };

    try {
        if (!store_->is_connected()) return overview;
        auto nodes = store_->project_nodes(project_id);
        auto rels = store_->project_relationships(project_id);
        if (nodes.empty()) return overview;

        std::map<std::string, int> label_counts;
        std::map<std::string, int> type_counts;
        std::map<std::string, int> degree;
        std::map<std::string, std::pair<int, int>> components; // files, symbols

        for (const auto& n : nodes) {
            ++label_counts[n.label];
            degree[n.id] = 0;
            if (n.label == "Project") continue;
            auto& comp = components[top_level_component(n.file_path)];
            if (n.label == "File") ++comp.first;
            else ++comp.second;
        }
        for (const auto& r : rels) {
            ++type_counts[r.type];
            if (auto it = degree.find(r.from_id); it != degree.end()) ++it->second;
            if (auto it = degree.find(r.to_id); it != degree.end()) ++it->second;
        }

        for (const auto& [label, count] : label_counts) overview["node_counts"][label] = count;
        for (const auto& [type, count] : type_counts) overview["relationship_counts"][type] = count;

        std::vector<std::pair<std::string, int>> ranked(degree.begin(), degree.end());
        std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });
        std::unordered_map<std::string, const GraphNode*> lookup;
        for (const auto& n : nodes) lookup[n.id] = &n;
        for (size_t i = 0; i < ranked.size() && i < config_.top_n; ++i) {
            const GraphNode* n = lookup[ranked[i].first];
            overview["most_connected"].push_back(
                {{"id", n->id}, {"name", n->name}, {"label", n->label}, {"degree", ranked[i].second}});
        }

        auto hotspots = hotspots_from(nodes, rels);
        for (size_t i = 0; i < hotspots.size() && i < config_.top_n; ++i) {
            overview["hotspots"].push_back(hotspots[i].to_json());
        }

        double n = static_cast<double>(nodes.size());
        double m = static_cast<double>(rels.size());
        overview["metrics"] = {
            {"total_nodes", nodes.size()},
            {"total_relationships", rels.size()},
            {"density", n > 1 ? m / (n * (n - 1)) : 0.0},
            {"average_degree", 2.0 * m / n}
        };
        overview["circular_dependency_count"] = cycles_from(nodes, rels).size();

        for (const auto& [name, counts] : components) {
            overview["components"][name] = {{"files", counts.first}, {"symbols", counts.second}};
        }
    } catch (const std::exception& e) {
        spdlog::error("❌ Architecture overview failed for {}: {}", project_id, e.what());
    }
    return overview;
}

std::vector<GraphNode> GraphAnalytics::find_complex_functions(const std::string& project_id, int threshold) {
    std::vector<GraphNode> out;
    try {
        if (!store_->is_connected()) return out;
        for (auto& n : store_->project_nodes(project_id)) {
            if (n.label != "Function" && n.label != "Method") continue;
            if (n.properties.value("complexity", 0) > threshold) out.push_back(std::move(n));
        }
    } catch (const std::exception& e) {
        spdlog::error("❌ Complexity query failed for {}: {}", project_id, e.what());
        return {};
    }
    std::sort(out.begin(), out.end(), [](const GraphNode& a, const GraphNode& b) {
        int ca = a.properties.value("complexity", 0);
        int cb = b.properties.value("complexity", 0);
        if (ca != cb) return ca > cb;
        return a.id < b.id;
    });
    return out;
}

} // namespace code_intelligence
