#include "vector/vector_backend.hpp"
#include <algorithm>
#include "text_utils.hpp"

namespace code_intelligence {

using json = nlohmann::json;

json CodeEmbedding::metadata_json() const {
    return {
        {"id", id},
        {"content", sanitize_utf8(content)},
        {"file_path", file_path},
        {"language", language},
        {"symbol_type", symbol_type},
        {"symbol_name", symbol_name},
        {"start_line", start_line},
        {"end_line", end_line}
    };
}

CodeEmbedding CodeEmbedding::from_metadata(const json& j) {
    CodeEmbedding e;
    e.id = j.value("id", "");
    e.content = j.value("content", "");
    e.file_path = j.value("file_path", "");
    e.language = j.value("language", "");
    e.symbol_type = j.value("symbol_type", "");
    e.symbol_name = j.value("symbol_name", "");
    e.start_line = j.value("start_line", 0);
    e.end_line = j.value("end_line", 0);
    return e;
}

json SearchResult::to_json() const {
    return {
        {"id", id},
        {"similarity_score", similarity_score},
        {"content", sanitize_utf8(content)},
        {"file_path", file_path},
        {"language", language},
        {"symbol_type", symbol_type},
        {"symbol_name", symbol_name},
        {"start_line", start_line},
        {"end_line", end_line}
    };
}

void rank_results(std::vector<SearchResult>& results, size_t k) {
    std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
        if (a.similarity_score != b.similarity_score) return a.similarity_score > b.similarity_score;
        return a.id < b.id;
    });
    if (results.size() > k) results.resize(k);
}

json VectorStats::to_json() const {
    return {
        {"backend", backend},
        {"total_embeddings", total_embeddings},
        {"dimension", dimension},
        {"embedding_method", embedding_method},
        {"fallback_embeddings", fallback_embeddings},
        {"cache_hits", cache_hits},
        {"diagnostics", diagnostics_to_json(diagnostics)}
    };
}

} // namespace code_intelligence
