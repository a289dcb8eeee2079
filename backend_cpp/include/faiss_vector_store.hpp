#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "vector/vector_backend.hpp"

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace code_intelligence {

// Exact inner-product index; rows mirror FAISS storage order.
class FaissVectorStore : public VectorBackend {
public:
    FaissVectorStore();
    ~FaissVectorStore() override; // Destructor must be defined in .cpp

    std::string name() const override { return "faiss"; }
    bool initialize(int dimension) override;

    bool upsert(const CodeEmbedding& embedding) override;
    std::vector<SearchResult> query(const std::vector<float>& query_vector, size_t k,
                                    const SearchFilters& filters) override;
    bool remove(const std::string& id) override;
    size_t remove_file(const std::string& file_path) override;
    size_t clear() override;
    size_t count() override;

    // <dir>/faiss.index + <dir>/metadata.json
    bool save(const std::string& path) override;
    bool load(const std::string& path);

    int dimension() const { return dimension_; }

private:
    int dimension_ = 0;
    std::unique_ptr<faiss::Index> index_;
    std::vector<CodeEmbedding> rows_; // metadata only, vector cleared
    std::unordered_map<std::string, long> id_to_row_;

    void remove_rows(std::vector<long> rows);
    void rebuild_row_map();
};

} // namespace code_intelligence
