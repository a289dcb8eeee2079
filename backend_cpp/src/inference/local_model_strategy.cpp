#include "inference/model_strategies.hpp"
#include <algorithm>
#include <stdexcept>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"
#include "text_utils.hpp"

namespace code_intelligence {

using json = nlohmann::json;

namespace {
constexpr int kHealthTimeoutMs = 2000;
}

LocalModelStrategy::LocalModelStrategy(InferenceConfig config)
    : config_(std::move(config)), prompt_builder_(config_.context_char_budget) {}

bool LocalModelStrategy::probe_health() const {
    cpr::Response r = cpr::Get(cpr::Url{config_.local_url + "/health"},
                               cpr::Timeout{std::min(config_.timeout_ms, kHealthTimeoutMs)});
    if (r.error.code != cpr::ErrorCode::OK) {
        spdlog::debug("Local model server unreachable: {}", r.error.message);
        return false;
    }
    return r.status_code == 200;
}

bool LocalModelStrategy::is_available() {
    return config_.enable_local && !config_.local_url.empty() && probe_health();
}

bool LocalModelStrategy::initialize() {
    bool ok = is_available();
    initialized_.store(ok);
    if (ok) spdlog::info("🖥️ Local model server ready at {}", config_.local_url);
    return ok;
}

CompletionResult LocalModelStrategy::generate_code_completion(const CompletionContext& context, Intent intent) {
    if (!initialized_.load()) throw std::runtime_error("local strategy not initialized");

    json payload = {
        {"prompt", prompt_builder_.build(context, intent)},
        {"n_predict", config_.max_output_tokens},
        {"temperature", config_.temperature},
        {"stream", false}
    };

    SystemMonitor::ScopedLatency timer(SystemMonitor::global_llm_generation_ms);
    cpr::Response r = cpr::Post(cpr::Url{config_.local_url + "/completion"},
                                cpr::Body{payload.dump(-1, ' ', false, json::error_handler_t::replace)},
                                cpr::Header{{"Content-Type", "application/json"}},
                                cpr::Timeout{config_.timeout_ms});
    if (r.error.code != cpr::ErrorCode::OK) {
        throw std::runtime_error("local model request failed: " + r.error.message);
    }
    if (r.status_code != 200) {
        throw std::runtime_error("local model HTTP " + std::to_string(r.status_code) + ": " +
                                 utf8_safe_substr(r.text, 200));
    }

    CompletionResult result;
    try {
        auto j = json::parse(r.text);
        result.response = j.at("content").get<std::string>();
        SystemMonitor::global_output_tokens.store(j.value("tokens_predicted", 0));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed local completion: ") + e.what());
    }

    result.status = "success";
    result.confidence = 0.8;
    result.strategy_used = name();
    result.context_used = context.has_project_context();
    result.context_items = context.context_items();
    result.suggestions = follow_up_suggestions(intent);
    return result;
}

json LocalModelStrategy::health() const {
    json h = InferenceStrategy::health();
    h["url"] = config_.local_url;
    return h;
}

} // namespace code_intelligence
