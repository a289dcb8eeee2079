#include "embedding_service.hpp"
#include <cmath>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include "SystemMonitor.hpp"
#include "http_retry.hpp"
#include "text_utils.hpp"

namespace code_intelligence {

using json = nlohmann::json;

// --- HASH EMBEDDER ---

std::vector<float> HashEmbedder::embed(const std::string& text) {
    std::vector<float> vec(static_cast<size_t>(dimension_), 0.0f);
    for (const auto& token : identifier_tokens(text)) {
        uint64_t h = fnv1a_64(token);
        vec[h % static_cast<uint64_t>(dimension_)] += 1.0f;
    }
    double norm = 0.0;
    for (float v : vec) norm += static_cast<double>(v) * v;
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) v *= inv;
    }
    return vec;
}

// --- GEMINI EMBEDDER ---

GeminiEmbedder::GeminiEmbedder(std::shared_ptr<KeyManager> key_manager, EmbeddingConfig config)
    : key_manager_(std::move(key_manager)), config_(std::move(config)) {}

bool GeminiEmbedder::is_available() const {
    return config_.use_model && key_manager_ && key_manager_->has_keys();
}

std::string GeminiEmbedder::get_endpoint_url() const {
    return config_.base_url + config_.model + ":embedContent?key=" + key_manager_->get_current_key();
}

std::vector<float> GeminiEmbedder::embed(const std::string& text) {
    if (!is_available()) throw std::runtime_error("embedding model not configured");

    std::string payload = json{
        {"model", "models/" + config_.model},
        {"content", {{"parts", {{{"text", text}}}}}}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        // Fresh URL per attempt so a rotated key is used.
        return cpr::Post(cpr::Url{get_endpoint_url()},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{config_.timeout_ms});
    }, key_manager_);

    if (r.status_code != 200) {
        spdlog::warn("⚠️ Embedding API error [{}]: {}", r.status_code,
                     r.error.message.empty() ? utf8_safe_substr(r.text, 200) : r.error.message);
        throw std::runtime_error("Failed to generate embedding after retries");
    }

    std::vector<float> embedding;
    try {
        auto response_json = json::parse(r.text);
        embedding = response_json.at("embedding").at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed embedding response: ") + e.what());
    }
    if (static_cast<int>(embedding.size()) != config_.dimension) {
        throw std::runtime_error("embedding dimension mismatch: got " + std::to_string(embedding.size()));
    }
    return embedding;
}

// --- SERVICE ---

EmbeddingService::EmbeddingService(EmbeddingConfig config, std::shared_ptr<Embedder> model)
    : config_(std::move(config)), model_(std::move(model)), hash_(config_.dimension) {}

std::string EmbeddingService::preprocess(const std::string& text) const {
    return utf8_safe_substr(collapse_whitespace(sanitize_utf8(text)), config_.max_input_chars);
}

std::string EmbeddingService::preferred_method() const {
    return (model_ && model_->is_available()) ? model_->name() : hash_.name();
}

EmbeddingResult EmbeddingService::embed(const std::string& text) {
    EmbeddingResult result;
    std::string clean = preprocess(text);

    if (model_ && model_->is_available()) {
        if (auto cached = cache_manager_.get_embedding(model_->name(), clean)) {
            result.vector = std::move(*cached);
            result.method = model_->name();
            result.from_cache = true;
            return result;
        }

        SystemMonitor::ScopedLatency timer(SystemMonitor::global_embedding_latency_ms);
        try {
            result.vector = model_->embed(clean);
            result.method = model_->name();
            cache_manager_.set_embedding(result.method, clean, result.vector);
            return result;
        } catch (const std::runtime_error& e) {
            spdlog::warn("⚠️ Model embedding failed ({}); using hash embedding", e.what());
            fallbacks_.fetch_add(1);
            SystemMonitor::global_embedding_fallbacks.fetch_add(1);
        }
    }

    result.vector = hash_.embed(clean);
    result.method = hash_.name();
    return result;
}

} // namespace code_intelligence
