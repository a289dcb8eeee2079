#include "faiss_vector_store.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace code_intelligence {

FaissVectorStore::FaissVectorStore() = default;

FaissVectorStore::~FaissVectorStore() {
}

bool FaissVectorStore::initialize(int dimension) {
    if (index_ && dimension_ == dimension) return true;
    dimension_ = dimension;
    index_ = std::make_unique<faiss::IndexFlatIP>(dimension);
    rows_.clear();
    id_to_row_.clear();
    return true;
}

bool FaissVectorStore::upsert(const CodeEmbedding& embedding) {
    if (!index_ || static_cast<int>(embedding.vector.size()) != dimension_) {
        spdlog::warn("⚠️ Rejected embedding {}: dimension {} != {}", embedding.id, embedding.vector.size(), dimension_);
        return false;
    }
    try {
        if (auto it = id_to_row_.find(embedding.id); it != id_to_row_.end()) remove_rows({it->second});

        std::vector<float> vec = embedding.vector;
        faiss::fvec_renorm_L2(dimension_, 1, vec.data());
        index_->add(1, vec.data());

        CodeEmbedding meta = embedding;
        meta.vector.clear();
        id_to_row_[meta.id] = static_cast<long>(rows_.size());
        rows_.push_back(std::move(meta));
        return true;
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS add failed for {}: {}", embedding.id, e.what());
        return false;
    }
}

std::vector<SearchResult> FaissVectorStore::query(const std::vector<float>& query_vector, size_t k,
                                                  const SearchFilters& filters) {
    std::vector<SearchResult> results;
    if (!index_ || index_->ntotal == 0 || k == 0) return results;
    if (static_cast<int>(query_vector.size()) != dimension_) return results;

    SystemMonitor::ScopedLatency timer(SystemMonitor::global_vector_latency_ms);

    // Filters select rows before ranking.
    std::vector<faiss::idx_t> allowed;
    for (size_t row = 0; row < rows_.size(); ++row) {
        if (filters.accepts(rows_[row])) allowed.push_back(static_cast<faiss::idx_t>(row));
    }
    if (allowed.empty()) return results;

    std::vector<float> query_copy = query_vector;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    // Exhaustive over the allowed rows so equal scores can be ordered by id.
    faiss::idx_t n = static_cast<faiss::idx_t>(allowed.size());
    std::vector<float> scores(n);
    std::vector<faiss::idx_t> indices(n);

    try {
        faiss::IDSelectorBatch selector(allowed.size(), allowed.data());
        faiss::SearchParameters params;
        params.sel = filters.empty() ? nullptr : &selector;
        index_->search(1, query_copy.data(), n, scores.data(), indices.data(), &params);
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS search failed: {}", e.what());
        return results;
    }

    for (faiss::idx_t i = 0; i < n; ++i) {
        if (indices[i] < 0 || static_cast<size_t>(indices[i]) >= rows_.size()) continue;
        const CodeEmbedding& e = rows_[static_cast<size_t>(indices[i])];
        SearchResult r;
        r.id = e.id;
        r.similarity_score = std::clamp(static_cast<double>(scores[i]), 0.0, 1.0);
        r.content = e.content;
        r.file_path = e.file_path;
        r.language = e.language;
        r.symbol_type = e.symbol_type;
        r.symbol_name = e.symbol_name;
        r.start_line = e.start_line;
        r.end_line = e.end_line;
        results.push_back(std::move(r));
    }
    rank_results(results, k);
    return results;
}

void FaissVectorStore::remove_rows(std::vector<long> rows) {
    if (rows.empty()) return;
    std::sort(rows.begin(), rows.end());
    // IndexFlat compacts storage in order; drop from the back so earlier rows keep their numbers.
    for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
        faiss::IDSelectorRange range(*it, *it + 1);
        index_->remove_ids(range);
        rows_.erase(rows_.begin() + *it);
    }
    rebuild_row_map();
}

void FaissVectorStore::rebuild_row_map() {
    id_to_row_.clear();
    for (size_t row = 0; row < rows_.size(); ++row) id_to_row_[rows_[row].id] = static_cast<long>(row);
}

bool FaissVectorStore::remove(const std::string& id) {
    auto it = id_to_row_.find(id);
    if (it == id_to_row_.end() || !index_) return false;
    try {
        remove_rows({it->second});
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS remove failed for {}: {}", id, e.what());
        return false;
    }
    return true;
}

size_t FaissVectorStore::remove_file(const std::string& file_path) {
    if (!index_) return 0;
    std::vector<long> rows;
    for (size_t row = 0; row < rows_.size(); ++row) {
        if (rows_[row].file_path == file_path) rows.push_back(static_cast<long>(row));
    }
    try {
        remove_rows(rows);
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS remove failed for {}: {}", file_path, e.what());
        return 0;
    }
    return rows.size();
}

size_t FaissVectorStore::clear() {
    size_t removed = rows_.size();
    if (index_) index_->reset();
    rows_.clear();
    id_to_row_.clear();
    return removed;
}

size_t FaissVectorStore::count() {
    return rows_.size();
}

bool FaissVectorStore::save(const std::string& path) {
    if (!index_ || path.empty()) return false;
    try {
        fs::path dir(path);
        fs::create_directories(dir);

        // Use .get() to pass raw pointer to FAISS function
        faiss::write_index(index_.get(), (dir / "faiss.index").string().c_str());

        json metadata = {{"dimension", dimension_}, {"rows", json::array()}};
        for (const auto& row : rows_) metadata["rows"].push_back(row.metadata_json());

        std::ofstream meta_file(dir / "metadata.json");
        meta_file << metadata.dump(2);
        spdlog::info("💾 Saved FAISS index ({} vectors) to {}", rows_.size(), path);
        return static_cast<bool>(meta_file);
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS save failed: {}", e.what());
    } catch (const fs::filesystem_error& e) {
        spdlog::error("❌ Cannot write vector store to {}: {}", path, e.what());
    }
    return false;
}

bool FaissVectorStore::load(const std::string& path) {
    fs::path dir(path);
    std::error_code ec;
    if (!fs::exists(dir / "faiss.index", ec) || !fs::exists(dir / "metadata.json", ec)) return false;

    try {
        std::ifstream meta_file(dir / "metadata.json");
        json metadata = json::parse(meta_file);
        int dimension = metadata.value("dimension", 0);
        if (dimension_ != 0 && dimension != dimension_) {
            spdlog::warn("⚠️ Stored vectors have dimension {}, expected {}; ignoring {}", dimension, dimension_, path);
            return false;
        }

        std::unique_ptr<faiss::Index> loaded(faiss::read_index((dir / "faiss.index").string().c_str()));
        std::vector<CodeEmbedding> rows;
        for (const auto& j_row : metadata.value("rows", json::array())) rows.push_back(CodeEmbedding::from_metadata(j_row));
        if (static_cast<size_t>(loaded->ntotal) != rows.size()) {
            spdlog::warn("⚠️ FAISS index and metadata disagree in {}; ignoring", path);
            return false;
        }

        index_ = std::move(loaded);
        dimension_ = dimension;
        rows_ = std::move(rows);
        rebuild_row_map();
        spdlog::info("✅ Loaded FAISS index with {} vectors from {}", index_->ntotal, path);
        return true;
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS load failed: {}", e.what());
    } catch (const json::exception& e) {
        spdlog::error("❌ Vector metadata corrupted at {}: {}", path, e.what());
    }
    return false;
}

} // namespace code_intelligence
