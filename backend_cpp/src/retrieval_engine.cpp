#include "retrieval_engine.hpp"
#include <deque>
#include <cmath>
#include <algorithm>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include <chrono>
#include "SystemMonitor.hpp"
#include "text_utils.hpp"

namespace code_intelligence {

namespace {
// Neighbour weights above this count as fully structural.
constexpr double kWeightSaturation = 5.0;
}

nlohmann::json RetrievalResult::to_json() const {
    return {
        {"id", id}, {"name", name}, {"type", type}, {"file_path", file_path},
        {"graph_score", graph_score}, {"final_score", final_score}, {"distance", distance}
    };
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<VectorSemanticStore> vector_store,
                                 std::shared_ptr<RelationshipGraphStore> graph_store,
                                 std::shared_ptr<GraphAnalytics> analytics)
    : vector_store_(std::move(vector_store)),
      graph_store_(std::move(graph_store)),
      analytics_(std::move(analytics)) {}

std::vector<RetrievalResult> RetrievalEngine::retrieve(
    const std::string& query,
    size_t max_nodes,
    const SearchFilters& filters,
    int max_hops)
{
    if (!vector_store_ || max_nodes == 0) return {};
    auto start = std::chrono::high_resolution_clock::now();

    // 1. Search (Get seeds)
    auto seeds = vector_store_->search(query, max_nodes, filters);

    // 2. Expand
    auto expanded = exponential_graph_expansion(seeds, max_nodes * 2, max_hops, 0.5);

    // 3. Score
    multi_dimensional_scoring(expanded);

    // 4. Sort and filter
    std::sort(expanded.begin(), expanded.end(), [](const auto& a, const auto& b) {
        if (a.final_score != b.final_score) return a.final_score > b.final_score;
        return a.id < b.id;
    });
    if (expanded.size() > max_nodes) expanded.resize(max_nodes);

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::debug("⏱️ Retrieval Pipeline Time: {:.2f} ms ({} seeds, {} kept)", duration, seeds.size(), expanded.size());

    return expanded;
}

std::string RetrievalEngine::build_hierarchical_context(
    const std::vector<RetrievalResult>& candidates,
    size_t max_chars)
{
    std::string context;
    std::unordered_set<std::string> included_files;

    for (const auto& cand : candidates) {
        // A whole-file fragment already covers its symbols.
        if (included_files.count(cand.file_path)) continue;
        if (cand.type == "file") included_files.insert(cand.file_path);
        if (cand.content.empty()) continue;

        std::string entry = "\n# FILE: " + cand.file_path +
                            " | NODE: " + cand.name +
                            " (Type: " + cand.type + ")\n" +
                            std::string(50, '-') + "\n" +
                            cand.content + "\n" +
                            std::string(50, '-') + "\n";

        if (context.length() + entry.length() > max_chars) break;
        context += entry;
    }
    return context;
}

std::vector<RetrievalResult> RetrievalEngine::exponential_graph_expansion(
    const std::vector<SearchResult>& seed_nodes,
    size_t max_nodes,
    int max_hops,
    double alpha)
{
    std::unordered_map<std::string, RetrievalResult> visited;
    std::deque<std::tuple<std::string, int, double>> queue;

    for (const auto& seed : seed_nodes) {
        if (visited.count(seed.id)) continue;
        RetrievalResult r;
        r.id = seed.id;
        r.name = seed.symbol_name;
        r.type = seed.symbol_type;
        r.file_path = seed.file_path;
        r.content = seed.content;
        r.graph_score = seed.similarity_score;
        visited.emplace(seed.id, std::move(r));
        queue.emplace_back(seed.id, 0, seed.similarity_score);
    }

    if (!graph_store_ || !graph_store_->is_connected()) {
        std::vector<RetrievalResult> results;
        for (auto& [id, val] : visited) results.push_back(std::move(val));
        return results;
    }

    int scanned_count = static_cast<int>(visited.size());

    while (!queue.empty() && visited.size() < max_nodes) {
        auto [curr, dist, base_score] = queue.front();
        queue.pop_front();

        if (dist >= max_hops) continue;

        for (const auto& rel : graph_store_->outgoing(curr)) {
            if (rel.type == "CONTAINS") continue;
            scanned_count++;
            if (visited.count(rel.to_id)) continue;

            auto node = graph_store_->get_node(rel.to_id);
            if (!node) continue;

            int new_dist = dist + 1;
            double new_score = base_score * std::exp(-alpha * new_dist);

            RetrievalResult r;
            r.id = node->id;
            r.name = node->name;
            r.type = node->label;
            r.file_path = node->file_path;
            r.content = node->properties.value("signature", "");
            if (node->properties.contains("docstring") && node->properties["docstring"].is_string()) {
                r.content += "\n" + node->properties["docstring"].get<std::string>();
            }
            r.graph_score = new_score;
            r.structural_weight = std::min(1.0, rel.weight / kWeightSaturation);
            r.distance = new_dist;
            visited.emplace(r.id, std::move(r));
            queue.emplace_back(node->id, new_dist, new_score);
            if (visited.size() >= max_nodes) break;
        }
    }

    SystemMonitor::global_graph_nodes_scanned.store(scanned_count);

    std::vector<RetrievalResult> results;
    for (auto& [key, val] : visited) results.push_back(std::move(val));
    spdlog::debug("Graph expansion complete. {} nodes selected.", results.size());
    return results;
}

void RetrievalEngine::multi_dimensional_scoring(std::vector<RetrievalResult>& candidates) {
    for (auto& c : candidates) {
        c.final_score = c.graph_score * (0.8 + (c.structural_weight * 0.2));
    }
}

std::vector<std::string> RetrievalEngine::graph_neighbourhood(const std::string& file_path, int depth) {
    std::vector<std::string> lines;
    if (!analytics_) return lines;
    const std::string file_id = make_file_id(file_path);

    for (const auto& hit : analytics_->dependencies(file_id, depth)) {
        if (hit.label != "File") continue;
        lines.push_back("depends on: " + hit.name + " (distance " + std::to_string(hit.distance) + ")");
    }
    for (const auto& hit : analytics_->dependents(file_id, depth)) {
        if (hit.label != "File") continue;
        lines.push_back("used by: " + hit.name + " (distance " + std::to_string(hit.distance) + ")");
    }
    return lines;
}

void RetrievalEngine::enrich(CompletionContext& context, size_t max_nodes, size_t max_chars) {
    size_t used = 0;
    for (auto& line : graph_neighbourhood(context.file_path)) {
        if (used + line.size() > max_chars / 4) break;
        used += line.size();
        context.graph_excerpts.push_back(std::move(line));
    }

    std::string query = !context.query.empty() ? context.query
                      : !context.surrounding_code.empty() ? context.surrounding_code
                      : context.file_path;
    if (query.empty()) return;

    std::unordered_set<std::string> seen_files;
    for (const auto& cand : retrieve(query, max_nodes)) {
        // The focal file is already in surrounding_code.
        if (cand.file_path == context.file_path || cand.content.empty()) continue;
        if (seen_files.count(cand.file_path)) continue;
        if (cand.type == "file") seen_files.insert(cand.file_path);

        std::string entry = "# " + cand.file_path + " | " + cand.name + " (" + cand.type + ")\n" + cand.content;
        if (used + entry.size() > max_chars) break;
        used += entry.size();
        context.vector_excerpts.push_back(std::move(entry));
    }
}

} // namespace code_intelligence
