#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "engine_config.hpp"
#include "inference/inference_strategy.hpp"
#include "inference/prompt_builder.hpp"
#include "KeyManager.hpp"

namespace code_intelligence {

// Full capability: Gemini generateContent with the rotating key pool.
class RemoteModelStrategy : public InferenceStrategy {
public:
    RemoteModelStrategy(std::shared_ptr<KeyManager> key_manager, InferenceConfig config);

    StrategyKind kind() const override { return StrategyKind::Full; }
    std::string name() const override { return "remote"; }
    bool is_available() override;
    bool initialize() override;
    bool is_initialized() const override { return initialized_.load(); }
    CompletionResult generate_code_completion(const CompletionContext& context, Intent intent) override;
    nlohmann::json health() const override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    InferenceConfig config_;
    PromptBuilder prompt_builder_;
    std::atomic<bool> initialized_{false};

    std::string get_endpoint_url() const;
};

// Reduced capability: a llama.cpp-style server exposing /health and /completion.
class LocalModelStrategy : public InferenceStrategy {
public:
    explicit LocalModelStrategy(InferenceConfig config);

    StrategyKind kind() const override { return StrategyKind::Reduced; }
    std::string name() const override { return "local"; }
    bool is_available() override;
    bool initialize() override;
    bool is_initialized() const override { return initialized_.load(); }
    CompletionResult generate_code_completion(const CompletionContext& context, Intent intent) override;
    nlohmann::json health() const override;

private:
    InferenceConfig config_;
    PromptBuilder prompt_builder_;
    std::atomic<bool> initialized_{false};

    bool probe_health() const;
};

// Deterministic templated answers built from the request context.
class MockStrategy : public InferenceStrategy {
public:
    explicit MockStrategy(bool enabled = true) : enabled_(enabled) {}

    StrategyKind kind() const override { return StrategyKind::Mock; }
    std::string name() const override { return "mock"; }
    bool is_available() override { return enabled_; }
    bool initialize() override;
    bool is_initialized() const override { return initialized_.load(); }
    CompletionResult generate_code_completion(const CompletionContext& context, Intent intent) override;

    // 0.3 base, raised by context richness, scaled per intent, clamped to [0.3, 0.95].
    static double estimate_confidence(const CompletionContext& context, Intent intent);

private:
    bool enabled_;
    std::atomic<bool> initialized_{false};
};

// Always available; canned per-intent guidance that needs human review.
class FallbackStrategy : public InferenceStrategy {
public:
    StrategyKind kind() const override { return StrategyKind::Fallback; }
    std::string name() const override { return "fallback"; }
    bool is_available() override { return true; }
    bool initialize() override { initialized_.store(true); return true; }
    bool is_initialized() const override { return initialized_.load(); }
    CompletionResult generate_code_completion(const CompletionContext& context, Intent intent) override;

private:
    std::atomic<bool> initialized_{false};
};

// Follow-up actions offered with a completion.
std::vector<std::string> follow_up_suggestions(Intent intent);

} // namespace code_intelligence
