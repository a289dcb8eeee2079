#pragma once

#include <nlohmann/json.hpp>
#include "engine_config.hpp"
#include "vector/vector_backend.hpp"

namespace code_intelligence {

// Chroma REST v1 collection API (cosine space).
class ChromaVectorBackend : public VectorBackend {
public:
    explicit ChromaVectorBackend(VectorConfig config);

    std::string name() const override { return "chroma"; }
    bool initialize(int dimension) override;

    bool upsert(const CodeEmbedding& embedding) override;
    std::vector<SearchResult> query(const std::vector<float>& query_vector, size_t k,
                                    const SearchFilters& filters) override;
    bool remove(const std::string& id) override;
    size_t remove_file(const std::string& file_path) override;
    size_t clear() override;
    size_t count() override;

    // Metadata filter in Chroma "where" syntax; file substrings are expanded
    // to the matching file paths first.
    static nlohmann::json build_where(const std::vector<std::string>& file_paths,
                                      const std::optional<std::string>& symbol_type);

private:
    VectorConfig config_;
    std::string base_url_;
    std::string collection_id_;

    std::optional<nlohmann::json> post(const std::string& path, const nlohmann::json& body);
    std::optional<nlohmann::json> get(const std::string& path);
    std::string collection_url(const std::string& action) const;
    std::optional<std::vector<std::string>> matching_file_paths(const std::string& substring,
                                                                const std::optional<std::string>& symbol_type);
};

} // namespace code_intelligence
