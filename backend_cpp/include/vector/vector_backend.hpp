#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "diagnostics.hpp"

namespace code_intelligence {

// One indexed fragment, file- or symbol-granularity.
struct CodeEmbedding {
    std::string id;
    std::string content;
    std::string file_path;
    std::string language;
    std::string symbol_type; // "file", "function", "class", ...
    std::string symbol_name;
    int start_line = 0;
    int end_line = 0;
    std::vector<float> vector;

    nlohmann::json metadata_json() const;
    static CodeEmbedding from_metadata(const nlohmann::json& j);
};

struct SearchFilters {
    std::optional<std::string> file_filter;        // substring of file_path
    std::optional<std::string> symbol_type_filter; // exact symbol_type

    bool empty() const { return !file_filter && !symbol_type_filter; }
    bool accepts(const CodeEmbedding& e) const {
        if (file_filter && e.file_path.find(*file_filter) == std::string::npos) return false;
        if (symbol_type_filter && e.symbol_type != *symbol_type_filter) return false;
        return true;
    }
};

struct SearchResult {
    std::string id;
    double similarity_score = 0.0; // cosine clamped to [0, 1]
    std::string content;
    std::string file_path;
    std::string language;
    std::string symbol_type;
    std::string symbol_name;
    int start_line = 0;
    int end_line = 0;

    nlohmann::json to_json() const;
};

// Descending score, then id ascending; truncated to k.
void rank_results(std::vector<SearchResult>& results, size_t k);

struct VectorStats {
    std::string backend;
    size_t total_embeddings = 0;
    int dimension = 0;
    std::string embedding_method;
    long long fallback_embeddings = 0;
    long long cache_hits = 0;
    std::vector<Diagnostic> diagnostics;

    nlohmann::json to_json() const;
};

// Storage seam of the vector store. Vectors arrive L2-normalised.
// VectorSemanticStore serializes writes; query() and count() run concurrently
// under its shared lock and must not mutate backend state.
class VectorBackend {
public:
    virtual ~VectorBackend() = default;

    virtual std::string name() const = 0;
    virtual bool initialize(int dimension) = 0;

    virtual bool upsert(const CodeEmbedding& embedding) = 0;
    virtual std::vector<SearchResult> query(const std::vector<float>& query_vector, size_t k,
                                            const SearchFilters& filters) = 0;
    virtual bool remove(const std::string& id) = 0;
    virtual size_t remove_file(const std::string& file_path) = 0;
    virtual size_t clear() = 0;
    virtual size_t count() = 0;

    // Only meaningful for backends with local persistence.
    virtual bool save(const std::string& /*path*/) { return true; }
};

} // namespace code_intelligence
