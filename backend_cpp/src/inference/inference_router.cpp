#include "inference/inference_router.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include "async_task.hpp"
#include "inference/model_strategies.hpp"
#include "LogManager.hpp"

namespace code_intelligence {

using json = nlohmann::json;

InferenceRouter::InferenceRouter(std::vector<std::shared_ptr<InferenceStrategy>> strategies, InferenceConfig config)
    : strategies_(std::move(strategies)), config_(std::move(config)), prompt_builder_(config_.context_char_budget) {
    strategies_.erase(std::remove(strategies_.begin(), strategies_.end(), nullptr), strategies_.end());

    bool has_fallback = std::any_of(strategies_.begin(), strategies_.end(),
                                    [](const auto& s) { return s->kind() == StrategyKind::Fallback; });
    if (!has_fallback) strategies_.push_back(std::make_shared<FallbackStrategy>());

    // Listed names first in config order, then the rest by kind.
    auto rank = [this](const std::shared_ptr<InferenceStrategy>& s) {
        auto it = std::find(config_.preference.begin(), config_.preference.end(), s->name());
        if (it != config_.preference.end()) return static_cast<size_t>(it - config_.preference.begin());
        return config_.preference.size() + static_cast<size_t>(s->kind());
    };
    std::stable_sort(strategies_.begin(), strategies_.end(),
                     [&rank](const auto& a, const auto& b) { return rank(a) < rank(b); });

    for (const auto& s : strategies_) strategy_states_[s->name()] = StrategyState::Uninitialized;
}

std::vector<std::shared_ptr<InferenceStrategy>> InferenceRouter::default_strategies(
    std::shared_ptr<KeyManager> key_manager, const InferenceConfig& config) {
    return {
        std::make_shared<RemoteModelStrategy>(std::move(key_manager), config),
        std::make_shared<LocalModelStrategy>(config),
        std::make_shared<MockStrategy>(config.enable_mock),
        std::make_shared<FallbackStrategy>()
    };
}

void InferenceRouter::set_strategy_state(const std::string& name, StrategyState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    strategy_states_[name] = state;
}

std::optional<size_t> InferenceRouter::index_of(const std::shared_ptr<InferenceStrategy>& strategy) const {
    for (size_t i = 0; i < strategies_.size(); ++i) {
        if (strategies_[i] == strategy) return i;
    }
    return std::nullopt;
}

std::shared_ptr<InferenceStrategy> InferenceRouter::next_initializable(size_t start) {
    for (size_t i = start; i < strategies_.size(); ++i) {
        const auto& s = strategies_[i];
        set_strategy_state(s->name(), StrategyState::Initializing);
        bool ok = false;
        try {
            ok = s->is_available() && s->initialize();
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Strategy '{}' failed to initialize: {}", s->name(), e.what());
        }
        if (ok) return s;
        set_strategy_state(s->name(), StrategyState::Uninitialized);
        spdlog::debug("Strategy '{}' unavailable, trying next", s->name());
    }
    return nullptr;
}

bool InferenceRouter::initialize() {
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && state_ != StrategyState::Uninitialized) return true;
        state_ = StrategyState::Initializing;
    }

    auto chosen = next_initializable(0);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!chosen) {
        state_ = StrategyState::Uninitialized;
        spdlog::error("❌ No inference strategy could be initialized");
        return false;
    }
    current_ = chosen;
    state_ = StrategyState::Ready;
    strategy_states_[chosen->name()] = StrategyState::Ready;
    spdlog::info("🧠 Inference router ready with strategy '{}'", chosen->name());
    return true;
}

std::optional<CompletionResult> InferenceRouter::attempt(const std::shared_ptr<InferenceStrategy>& strategy,
                                                         const CompletionContext& context, Intent intent,
                                                         std::string& error) {
    // The worker owns copies; a timed-out call keeps running detached.
    auto outcome = run_with_timeout<CompletionResult>(
        [strategy, context, intent]() { return strategy->generate_code_completion(context, intent); },
        std::chrono::milliseconds(config_.timeout_ms));

    if (outcome.timed_out) {
        error = "strategy '" + strategy->name() + "' timed out after " + std::to_string(config_.timeout_ms) + " ms";
        return std::nullopt;
    }
    if (!outcome.value) {
        error = "strategy '" + strategy->name() + "' failed: " + outcome.error;
        return std::nullopt;
    }
    if (!outcome.value->ok()) {
        error = "strategy '" + strategy->name() + "' returned error: " + outcome.value->error;
        return std::nullopt;
    }
    return outcome.value;
}

CompletionResult InferenceRouter::generate_completion(const CompletionContext& context, const std::string& intent) {
    auto parsed = intent_from_string(intent);
    if (!parsed) return CompletionResult::failure("unknown intent '" + intent + "'");
    return generate_completion(context, *parsed);
}

CompletionResult InferenceRouter::generate_completion(const CompletionContext& context, Intent intent) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    std::shared_ptr<InferenceStrategy> strategy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == StrategyState::Uninitialized || !current_) {
            return CompletionResult::failure("inference router not initialized");
        }
        strategy = current_;
    }

    std::string error;
    auto result = attempt(strategy, context, intent, error);

    if (!result) {
        spdlog::warn("⚠️ {}", error);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            strategy_states_[strategy->name()] = StrategyState::Degraded;
            if (current_ == strategy) state_ = StrategyState::Degraded;
        }

        // One hop only.
        auto idx = index_of(strategy);
        auto next = next_initializable(idx ? *idx + 1 : strategies_.size());
        if (next) {
            std::string next_error;
            result = attempt(next, context, intent, next_error);
            if (result) {
                std::lock_guard<std::mutex> lock(mutex_);
                current_ = next;
                state_ = StrategyState::Ready;
                strategy_states_[next->name()] = StrategyState::Ready;
                spdlog::info("🔀 Inference switched from '{}' to '{}'", strategy->name(), next->name());
            } else {
                spdlog::warn("⚠️ {}", next_error);
                set_strategy_state(next->name(), StrategyState::Degraded);
                error += "; " + next_error;
            }
        }
    }

    CompletionResult final_result;
    if (result) {
        final_result = std::move(*result);
    } else {
        spdlog::error("❌ Inference strategies exhausted: {}", error);
        final_result = CompletionResult::failure(error, ErrorKind::StrategyExhausted);
        final_result.strategy_used = strategy->name();
    }
    final_result.confidence = std::clamp(final_result.confidence, 0.0, 1.0);
    final_result.duration_ms = elapsed();

    record(context, intent, final_result);
    return final_result;
}

void InferenceRouter::record(const CompletionContext& context, Intent intent, const CompletionResult& result) const {
    InteractionLog log;
    log.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto it = context.extensions.find("project_id");
    if (it != context.extensions.end()) log.project_id = it->second;
    log.intent = to_string(intent);
    log.file_path = context.file_path;
    log.user_query = context.query;
    log.full_prompt = prompt_builder_.build(context, intent);
    log.ai_response = result.ok() ? result.response : result.error;
    log.strategy = result.strategy_used;
    log.status = result.status;
    log.token_count_est = static_cast<int>(log.ai_response.size() / 4);
    log.duration_ms = result.duration_ms;
    LogManager::instance().add_log(log);
}

bool InferenceRouter::switch_strategy(const std::string& name) {
    std::lock_guard<std::mutex> init_lock(init_mutex_);
    auto it = std::find_if(strategies_.begin(), strategies_.end(),
                           [&name](const auto& s) { return s->name() == name; });
    if (it == strategies_.end()) {
        spdlog::warn("⚠️ Unknown inference strategy '{}'", name);
        return false;
    }
    auto target = *it;
    set_strategy_state(target->name(), StrategyState::Initializing);

    bool ok = false;
    try {
        ok = target->initialize();
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Strategy '{}' failed to initialize: {}", name, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ok) {
        strategy_states_[name] = StrategyState::Uninitialized;
        return false;
    }
    current_ = target;
    state_ = StrategyState::Ready;
    strategy_states_[name] = StrategyState::Ready;
    spdlog::info("🔀 Inference strategy switched to '{}'", name);
    return true;
}

std::vector<std::string> InferenceRouter::get_available_strategies() {
    std::vector<std::string> names;
    for (const auto& s : strategies_) {
        bool available = s->kind() == StrategyKind::Fallback;
        if (!available) {
            try {
                available = s->is_available();
            } catch (const std::exception& e) {
                spdlog::debug("Availability probe of '{}' threw: {}", s->name(), e.what());
            }
        }
        if (available) names.push_back(s->name());
    }
    return names;
}

std::vector<std::string> InferenceRouter::strategy_names() const {
    std::vector<std::string> names;
    for (const auto& s : strategies_) names.push_back(s->name());
    return names;
}

StrategyState InferenceRouter::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string InferenceRouter::current_strategy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ ? current_->name() : "";
}

json InferenceRouter::health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json strategies = json::array();
    for (const auto& s : strategies_) {
        json h = s->health();
        auto st = strategy_states_.find(s->name());
        h["state"] = to_string(st != strategy_states_.end() ? st->second : StrategyState::Uninitialized);
        strategies.push_back(h);
    }
    return {
        {"status", to_string(state_)},
        {"current_strategy", current_ ? current_->name() : ""},
        {"preference", strategy_names()},
        {"strategies", strategies}
    };
}

} // namespace code_intelligence
