#include "vector/vector_store.hpp"
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <spdlog/spdlog.h>
#include "faiss_vector_store.hpp"
#include "text_utils.hpp"

namespace code_intelligence {

VectorSemanticStore::VectorSemanticStore(std::shared_ptr<EmbeddingService> embeddings,
                                         std::shared_ptr<VectorBackend> primary,
                                         VectorConfig config)
    : embeddings_(std::move(embeddings)), backend_(std::move(primary)), config_(std::move(config)) {}

bool VectorSemanticStore::initialize() {
    std::unique_lock lock(mutex_);
    if (initialized_) return true;

    const int dimension = embeddings_->dimension();
    if (!backend_) backend_ = std::make_shared<FaissVectorStore>();

    if (!backend_->initialize(dimension)) {
        spdlog::warn("⚠️ Vector backend '{}' unavailable; switching to in-process FAISS", backend_->name());
        diagnostics_.push_back({ErrorKind::BackendUnavailable,
                                "vector backend unreachable, using in-process index", backend_->name()});
        backend_ = std::make_shared<FaissVectorStore>();
        backend_->initialize(dimension);
    }

    if (auto* faiss_store = dynamic_cast<FaissVectorStore*>(backend_.get());
        faiss_store && !config_.storage_path.empty()) {
        faiss_store->load(config_.storage_path);
    }

    initialized_ = true;
    spdlog::info("🧭 Vector store ready: backend={}, dimension={}, embedder={}",
                 backend_->name(), dimension, embeddings_->preferred_method());
    return true;
}

bool VectorSemanticStore::is_initialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

bool VectorSemanticStore::store_locked(CodeEmbedding& embedding) {
    return backend_->upsert(embedding);
}

bool VectorSemanticStore::embed_and_store(CodeEmbedding embedding) {
    if (embedding.id.empty() || !is_initialized()) return false;
    if (embedding.vector.empty()) embedding.vector = embeddings_->embed(embedding.content).vector;

    std::unique_lock lock(mutex_);
    return store_locked(embedding);
}

std::vector<SearchResult> VectorSemanticStore::search(const std::string& query_text, size_t k,
                                                      const SearchFilters& filters) {
    if (k == 0 || !is_initialized()) return {};
    auto query = embeddings_->embed(query_text);

    std::shared_lock lock(mutex_);
    return backend_->query(query.vector, k, filters);
}

bool VectorSemanticStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (!initialized_) return false;
    return backend_->remove(id);
}

size_t VectorSemanticStore::remove_file(const std::string& file_path) {
    std::unique_lock lock(mutex_);
    if (!initialized_) return 0;
    return backend_->remove_file(file_path);
}

size_t VectorSemanticStore::clear() {
    std::unique_lock lock(mutex_);
    if (!initialized_) return 0;
    size_t removed = backend_->clear();
    spdlog::info("🧹 Vector store cleared ({} embeddings)", removed);
    return removed;
}

size_t VectorSemanticStore::embed_file(const FileAnalysis& analysis, const std::string& content) {
    if (!is_initialized()) return 0;
    const auto& cfg = embeddings_->config();
    auto lines = split_lines(content);

    std::vector<CodeEmbedding> fragments;

    CodeEmbedding file_fragment;
    file_fragment.id = analysis.id();
    file_fragment.content = utf8_safe_substr(content, cfg.file_embedding_chars);
    file_fragment.file_path = analysis.file_path;
    file_fragment.language = to_string(analysis.language);
    file_fragment.symbol_type = "file";
    file_fragment.symbol_name = std::filesystem::path(analysis.file_path).filename().string();
    file_fragment.start_line = 1;
    file_fragment.end_line = static_cast<int>(lines.size());
    fragments.push_back(std::move(file_fragment));

    for (const auto& sym : analysis.symbols) {
        CodeEmbedding e;
        e.id = sym.id;
        e.file_path = analysis.file_path;
        e.language = to_string(analysis.language);
        e.symbol_type = to_string(sym.kind);
        e.symbol_name = sym.qualified_name;
        e.start_line = sym.line_start;
        e.end_line = std::max(sym.line_start, sym.line_end);

        std::string body;
        for (int i = e.start_line; i <= e.end_line && i <= static_cast<int>(lines.size()); ++i) {
            if (i < 1) continue;
            body += lines[static_cast<size_t>(i - 1)];
            body += '\n';
            if (body.size() > cfg.max_input_chars) break;
        }
        if (sym.docstring) body = *sym.docstring + "\n" + body;
        e.content = utf8_safe_substr(body.empty() ? sym.signature : body, cfg.max_input_chars);
        fragments.push_back(std::move(e));
    }

    // Vectors are computed without holding the lock.
    for (auto& f : fragments) f.vector = embeddings_->embed(f.content).vector;

    std::unique_lock lock(mutex_);
    backend_->remove_file(analysis.file_path);
    size_t stored = 0;
    for (auto& f : fragments) {
        if (store_locked(f)) ++stored;
    }
    return stored;
}

bool VectorSemanticStore::persist() {
    std::unique_lock lock(mutex_);
    if (!initialized_ || config_.storage_path.empty()) return false;
    return backend_->save(config_.storage_path);
}

VectorStats VectorSemanticStore::stats() {
    VectorStats s;
    s.dimension = embeddings_->dimension();
    s.embedding_method = embeddings_->preferred_method();
    s.fallback_embeddings = embeddings_->fallback_count();
    s.cache_hits = embeddings_->cache_hits();

    std::shared_lock lock(mutex_);
    s.backend = backend_ ? backend_->name() : "none";
    s.total_embeddings = initialized_ ? backend_->count() : 0;
    s.diagnostics = diagnostics_;
    return s;
}

std::string VectorSemanticStore::backend_name() const {
    std::shared_lock lock(mutex_);
    return backend_ ? backend_->name() : "none";
}

std::vector<Diagnostic> VectorSemanticStore::diagnostics() const {
    std::shared_lock lock(mutex_);
    return diagnostics_;
}

} // namespace code_intelligence
