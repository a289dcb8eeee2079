#include "vector/chroma_vector_backend.hpp"
#include "SystemMonitor.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <set>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace code_intelligence {

using json = nlohmann::json;

namespace {
// Extra candidates fetched so equal scores can be ordered by id.
constexpr size_t kTieWindow = 16;
}

ChromaVectorBackend::ChromaVectorBackend(VectorConfig config)
    : config_(std::move(config)),
      base_url_("http://" + config_.host + ":" + std::to_string(config_.port) + "/api/v1") {}

std::string ChromaVectorBackend::collection_url(const std::string& action) const {
    return "/collections/" + collection_id_ + "/" + action;
}

std::optional<json> ChromaVectorBackend::post(const std::string& path, const json& body) {
    cpr::Response r = cpr::Post(cpr::Url{base_url_ + path},
                                cpr::Body{body.dump(-1, ' ', false, json::error_handler_t::replace)},
                                cpr::Header{{"Content-Type", "application/json"}},
                                cpr::Timeout{config_.timeout_ms});
    if (r.error.code != cpr::ErrorCode::OK) {
        spdlog::warn("⚠️ Chroma unreachable ({}): {}", path, r.error.message);
        return std::nullopt;
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        spdlog::warn("⚠️ Chroma HTTP {} on {}: {}", r.status_code, path, utf8_safe_substr(r.text, 300));
        return std::nullopt;
    }
    try {
        return r.text.empty() ? json::object() : json::parse(r.text);
    } catch (const json::exception& e) {
        spdlog::error("❌ Chroma returned malformed JSON on {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<json> ChromaVectorBackend::get(const std::string& path) {
    cpr::Response r = cpr::Get(cpr::Url{base_url_ + path}, cpr::Timeout{config_.timeout_ms});
    if (r.error.code != cpr::ErrorCode::OK || r.status_code != 200) return std::nullopt;
    try {
        return json::parse(r.text);
    } catch (const json::exception& e) {
        spdlog::error("❌ Chroma returned malformed JSON on {}: {}", path, e.what());
        return std::nullopt;
    }
}

bool ChromaVectorBackend::initialize(int /*dimension*/) {
    if (!collection_id_.empty()) return true;
    if (!get("/heartbeat")) return false;

    auto created = post("/collections", {
        {"name", config_.collection},
        {"get_or_create", true},
        {"metadata", {{"hnsw:space", "cosine"}}}
    });
    if (!created || !created->contains("id")) return false;
    collection_id_ = (*created)["id"].get<std::string>();
    spdlog::info("🗄️ Chroma collection '{}' ready at {}", config_.collection, base_url_);
    return true;
}

bool ChromaVectorBackend::upsert(const CodeEmbedding& embedding) {
    if (collection_id_.empty()) return false;
    json meta = embedding.metadata_json();
    meta.erase("id");
    meta.erase("content");
    json body = {
        {"ids", json::array({embedding.id})},
        {"embeddings", json::array({embedding.vector})},
        {"documents", json::array({sanitize_utf8(embedding.content)})},
        {"metadatas", json::array({meta})}
    };
    return post(collection_url("upsert"), body).has_value();
}

json ChromaVectorBackend::build_where(const std::vector<std::string>& file_paths,
                                      const std::optional<std::string>& symbol_type) {
    json clauses = json::array();
    if (!file_paths.empty()) clauses.push_back({{"file_path", {{"$in", file_paths}}}});
    if (symbol_type) clauses.push_back({{"symbol_type", {{"$eq", *symbol_type}}}});
    if (clauses.empty()) return json::object();
    if (clauses.size() == 1) return clauses[0];
    return {{"$and", clauses}};
}

std::optional<std::vector<std::string>> ChromaVectorBackend::matching_file_paths(
    const std::string& substring, const std::optional<std::string>& symbol_type) {
    json body = {{"include", json::array({"metadatas"})}};
    json where = build_where({}, symbol_type);
    if (!where.empty()) body["where"] = where;

    auto listed = post(collection_url("get"), body);
    if (!listed) return std::nullopt;

    std::set<std::string> paths;
    for (const auto& meta : listed->value("metadatas", json::array())) {
        if (!meta.is_object()) continue;
        std::string path = meta.value("file_path", "");
        if (path.find(substring) != std::string::npos) paths.insert(path);
    }
    return std::vector<std::string>(paths.begin(), paths.end());
}

std::vector<SearchResult> ChromaVectorBackend::query(const std::vector<float>& query_vector, size_t k,
                                                     const SearchFilters& filters) {
    std::vector<SearchResult> results;
    if (collection_id_.empty() || k == 0) return results;

    SystemMonitor::ScopedLatency timer(SystemMonitor::global_vector_latency_ms);

    std::vector<std::string> file_paths;
    if (filters.file_filter) {
        auto matched = matching_file_paths(*filters.file_filter, filters.symbol_type_filter);
        if (!matched || matched->empty()) return results;
        file_paths = std::move(*matched);
    }

    json body = {
        {"query_embeddings", json::array({query_vector})},
        {"n_results", k + kTieWindow},
        {"include", json::array({"documents", "metadatas", "distances"})}
    };
    json where = build_where(file_paths, filters.symbol_type_filter);
    if (!where.empty()) body["where"] = where;

    auto response = post(collection_url("query"), body);
    if (!response) return results;

    try {
        const auto& ids = response->at("ids").at(0);
        const auto& distances = response->at("distances").at(0);
        const auto& documents = response->at("documents").at(0);
        const auto& metadatas = response->at("metadatas").at(0);

        for (size_t i = 0; i < ids.size(); ++i) {
            CodeEmbedding e = CodeEmbedding::from_metadata(metadatas.at(i).is_object() ? metadatas.at(i) : json::object());
            if (!filters.accepts(e)) continue;

            SearchResult r;
            r.id = ids.at(i).get<std::string>();
            // cosine distance = 1 - cosine similarity
            r.similarity_score = std::clamp(1.0 - distances.at(i).get<double>(), 0.0, 1.0);
            r.content = documents.at(i).is_string() ? documents.at(i).get<std::string>() : "";
            r.file_path = e.file_path;
            r.language = e.language;
            r.symbol_type = e.symbol_type;
            r.symbol_name = e.symbol_name;
            r.start_line = e.start_line;
            r.end_line = e.end_line;
            results.push_back(std::move(r));
        }
    } catch (const json::exception& e) {
        spdlog::error("❌ Unexpected Chroma query response: {}", e.what());
        return {};
    }
    rank_results(results, k);
    return results;
}

bool ChromaVectorBackend::remove(const std::string& id) {
    if (collection_id_.empty()) return false;
    auto found = post(collection_url("get"), {{"ids", json::array({id})}, {"include", json::array()}});
    if (!found || found->value("ids", json::array()).empty()) return false;
    return post(collection_url("delete"), {{"ids", json::array({id})}}).has_value();
}

size_t ChromaVectorBackend::remove_file(const std::string& file_path) {
    if (collection_id_.empty()) return 0;
    json where = {{"file_path", {{"$eq", file_path}}}};
    auto found = post(collection_url("get"), {{"where", where}, {"include", json::array()}});
    if (!found) return 0;
    size_t n = found->value("ids", json::array()).size();
    if (n == 0) return 0;
    return post(collection_url("delete"), {{"where", where}}) ? n : 0;
}

size_t ChromaVectorBackend::clear() {
    if (collection_id_.empty()) return 0;
    auto listed = post(collection_url("get"), {{"include", json::array()}});
    if (!listed) return 0;
    json ids = listed->value("ids", json::array());
    if (ids.empty()) return 0;
    return post(collection_url("delete"), {{"ids", ids}}) ? ids.size() : 0;
}

size_t ChromaVectorBackend::count() {
    if (collection_id_.empty()) return 0;
    auto counted = get(collection_url("count"));
    if (!counted || !counted->is_number_integer()) return 0;
    return counted->get<size_t>();
}

} // namespace code_intelligence
