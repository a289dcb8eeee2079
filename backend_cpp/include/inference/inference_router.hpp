#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine_config.hpp"
#include "inference/inference_strategy.hpp"
#include "inference/prompt_builder.hpp"
#include "KeyManager.hpp"

namespace code_intelligence {

// Picks one strategy out of an ordered preference list and falls over to
// the next one, at most one hop per request, when it fails mid-flight.
class InferenceRouter {
public:
    // Strategies are ordered by config.preference; a FallbackStrategy is
    // appended when none is supplied.
    InferenceRouter(std::vector<std::shared_ptr<InferenceStrategy>> strategies, InferenceConfig config = {});

    // remote, local, mock and fallback built from config.
    static std::vector<std::shared_ptr<InferenceStrategy>> default_strategies(
        std::shared_ptr<KeyManager> key_manager, const InferenceConfig& config);

    // Idempotent. True once a strategy is Ready.
    bool initialize();

    CompletionResult generate_completion(const CompletionContext& context, Intent intent);
    CompletionResult generate_completion(const CompletionContext& context, const std::string& intent);

    // Re-runs the named strategy's initialize() and makes it current on success.
    bool switch_strategy(const std::string& name);

    std::vector<std::string> get_available_strategies();
    std::vector<std::string> strategy_names() const;

    StrategyState state() const;
    std::string current_strategy() const;
    nlohmann::json health() const;

private:
    std::vector<std::shared_ptr<InferenceStrategy>> strategies_;
    InferenceConfig config_;
    PromptBuilder prompt_builder_;

    std::mutex init_mutex_;
    mutable std::mutex mutex_;
    StrategyState state_ = StrategyState::Uninitialized;
    std::shared_ptr<InferenceStrategy> current_;
    std::map<std::string, StrategyState> strategy_states_;

    void set_strategy_state(const std::string& name, StrategyState state);
    std::optional<size_t> index_of(const std::shared_ptr<InferenceStrategy>& strategy) const;
    // First strategy after `start` whose is_available() and initialize() succeed.
    std::shared_ptr<InferenceStrategy> next_initializable(size_t start);
    // Time-boxed call; nullopt with `error` set on throw, error status or timeout.
    std::optional<CompletionResult> attempt(const std::shared_ptr<InferenceStrategy>& strategy,
                                            const CompletionContext& context, Intent intent,
                                            std::string& error);
    void record(const CompletionContext& context, Intent intent, const CompletionResult& result) const;
};

} // namespace code_intelligence
