#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "code_model.hpp"
#include "embedding_service.hpp"
#include "engine_config.hpp"
#include "vector/vector_backend.hpp"

namespace code_intelligence {

class VectorSemanticStore {
public:
    // `primary` null selects the in-process FAISS backend.
    VectorSemanticStore(std::shared_ptr<EmbeddingService> embeddings,
                        std::shared_ptr<VectorBackend> primary,
                        VectorConfig config = {});

    // Falls back to FAISS when the primary backend cannot be reached.
    bool initialize();
    bool is_initialized() const;

    bool embed_and_store(CodeEmbedding embedding);
    std::vector<SearchResult> search(const std::string& query_text, size_t k,
                                     const SearchFilters& filters = {});
    bool remove(const std::string& id);
    VectorStats stats();

    // One file-level fragment plus one per symbol; replaces the file's old fragments.
    size_t embed_file(const FileAnalysis& analysis, const std::string& content);
    size_t remove_file(const std::string& file_path);
    size_t clear();

    // Writes the FAISS index when storage_path is configured.
    bool persist();

    std::string backend_name() const;
    std::vector<Diagnostic> diagnostics() const;

private:
    std::shared_ptr<EmbeddingService> embeddings_;
    std::shared_ptr<VectorBackend> backend_;
    VectorConfig config_;
    bool initialized_ = false;
    std::vector<Diagnostic> diagnostics_;
    mutable std::shared_mutex mutex_;

    bool store_locked(CodeEmbedding& embedding);
};

} // namespace code_intelligence
