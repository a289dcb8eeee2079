#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "cache_manager.hpp"
#include "engine_config.hpp"
#include "KeyManager.hpp"

namespace code_intelligence {

class Embedder {
public:
    virtual ~Embedder() = default;
    virtual std::string name() const = 0;
    virtual bool is_available() const = 0;
    virtual int dimension() const = 0;
    // Throws std::runtime_error when no vector can be produced.
    virtual std::vector<float> embed(const std::string& text) = 0;
};

// Deterministic fallback: identifier tokens hashed into buckets, L2-normalised.
class HashEmbedder : public Embedder {
public:
    explicit HashEmbedder(int dimension) : dimension_(dimension > 0 ? dimension : 768) {}

    std::string name() const override { return "hash"; }
    bool is_available() const override { return true; }
    int dimension() const override { return dimension_; }
    std::vector<float> embed(const std::string& text) override;

private:
    int dimension_;
};

// Gemini embedContent over cpr with key rotation.
class GeminiEmbedder : public Embedder {
public:
    GeminiEmbedder(std::shared_ptr<KeyManager> key_manager, EmbeddingConfig config);

    std::string name() const override { return config_.model; }
    bool is_available() const override;
    int dimension() const override { return config_.dimension; }
    std::vector<float> embed(const std::string& text) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    EmbeddingConfig config_;

    std::string get_endpoint_url() const;
};

struct EmbeddingResult {
    std::vector<float> vector;
    std::string method; // embedder name that produced the vector
    bool from_cache = false;
};

class EmbeddingService {
public:
    // `model` may be null: every call then uses the hash embedder.
    EmbeddingService(EmbeddingConfig config, std::shared_ptr<Embedder> model = nullptr);

    EmbeddingResult embed(const std::string& text);

    // Whitespace collapsed, identifiers untouched, UTF-8 safe cut at max_input_chars.
    std::string preprocess(const std::string& text) const;

    int dimension() const { return config_.dimension; }
    std::string preferred_method() const;
    long long fallback_count() const { return fallbacks_.load(); }
    long long cache_hits() const { return cache_manager_.hits(); }
    const EmbeddingConfig& config() const { return config_; }

private:
    EmbeddingConfig config_;
    std::shared_ptr<Embedder> model_;
    HashEmbedder hash_;
    CacheManager cache_manager_;
    std::atomic<long long> fallbacks_{0};
};

} // namespace code_intelligence
