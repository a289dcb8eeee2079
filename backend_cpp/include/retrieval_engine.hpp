#pragma once
#include <memory>
#include <string>
#include <vector>
#include "graph/graph_analytics.hpp"
#include "graph/graph_store.hpp"
#include "inference/inference_types.hpp"
#include "vector/vector_store.hpp"

namespace code_intelligence {

struct RetrievalResult {
    std::string id;
    std::string name;
    std::string type;       // symbol_type for vector hits, graph label for neighbours
    std::string file_path;
    std::string content;
    double graph_score = 0.0;
    double structural_weight = 0.5;
    double final_score = 0.0;
    int distance = 0;       // hops from the nearest vector seed

    nlohmann::json to_json() const;
};

class RetrievalEngine {
public:
    // Any component may be null; its contribution is then skipped.
    RetrievalEngine(std::shared_ptr<VectorSemanticStore> vector_store,
                    std::shared_ptr<RelationshipGraphStore> graph_store,
                    std::shared_ptr<GraphAnalytics> analytics);

    std::vector<RetrievalResult> retrieve(
        const std::string& query,
        size_t max_nodes = 20,
        const SearchFilters& filters = {},
        int max_hops = 1
    );

    std::string build_hierarchical_context(
        const std::vector<RetrievalResult>& candidates,
        size_t max_chars = 6000
    );

    // "depends on" / "used by" lines for a file node.
    std::vector<std::string> graph_neighbourhood(const std::string& file_path, int depth = 1);

    // Fills graph_excerpts and vector_excerpts, together capped at max_chars.
    void enrich(CompletionContext& context, size_t max_nodes, size_t max_chars);

private:
    std::shared_ptr<VectorSemanticStore> vector_store_;
    std::shared_ptr<RelationshipGraphStore> graph_store_;
    std::shared_ptr<GraphAnalytics> analytics_;

    std::vector<RetrievalResult> exponential_graph_expansion(
        const std::vector<SearchResult>& seed_nodes,
        size_t max_nodes,
        int max_hops,
        double alpha
    );

    void multi_dimensional_scoring(std::vector<RetrievalResult>& candidates);
};

} // namespace code_intelligence
