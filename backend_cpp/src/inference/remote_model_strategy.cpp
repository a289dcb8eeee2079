#include "inference/model_strategies.hpp"
#include <stdexcept>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "http_retry.hpp"
#include "SystemMonitor.hpp"
#include "text_utils.hpp"

namespace code_intelligence {

using json = nlohmann::json;

RemoteModelStrategy::RemoteModelStrategy(std::shared_ptr<KeyManager> key_manager, InferenceConfig config)
    : key_manager_(std::move(key_manager)),
      config_(std::move(config)),
      prompt_builder_(config_.context_char_budget) {}

bool RemoteModelStrategy::is_available() {
    return config_.enable_remote && key_manager_ && key_manager_->has_keys();
}

bool RemoteModelStrategy::initialize() {
    if (!is_available()) {
        initialized_.store(false);
        return false;
    }
    initialized_.store(true);
    spdlog::info("🛰️ Remote strategy ready (model {}, {} active keys)",
                 key_manager_->get_current_model(), key_manager_->get_active_key_count());
    return true;
}

std::string RemoteModelStrategy::get_endpoint_url() const {
    return config_.remote_base_url + key_manager_->get_current_model() +
           ":generateContent?key=" + key_manager_->get_current_key();
}

CompletionResult RemoteModelStrategy::generate_code_completion(const CompletionContext& context, Intent intent) {
    if (!initialized_.load()) throw std::runtime_error("remote strategy not initialized");

    const std::string prompt = prompt_builder_.build(context, intent);
    std::string payload = json{
        {"contents", json::array({{{"parts", json::array({{{"text", prompt}}})}}})},
        {"generationConfig", {
            {"maxOutputTokens", config_.max_output_tokens},
            {"temperature", config_.temperature}
        }}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    SystemMonitor::ScopedLatency timer(SystemMonitor::global_llm_generation_ms);
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url()},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{config_.timeout_ms});
    }, key_manager_);

    if (r.status_code != 200) {
        spdlog::error("❌ Generation API error [{}]: {}", r.status_code,
                      r.error.message.empty() ? utf8_safe_substr(r.text, 300) : r.error.message);
        throw std::runtime_error("generateContent failed with status " + std::to_string(r.status_code));
    }

    CompletionResult result;
    try {
        auto response_json = json::parse(r.text);
        result.response = response_json.at("candidates").at(0).at("content").at("parts").at(0).at("text").get<std::string>();
        if (response_json.contains("usageMetadata")) {
            SystemMonitor::global_output_tokens.store(
                response_json["usageMetadata"].value("candidatesTokenCount", 0));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed generation response: ") + e.what());
    }

    result.status = "success";
    result.confidence = 0.9;
    result.strategy_used = name();
    result.context_used = context.has_project_context();
    result.context_items = context.context_items();
    result.suggestions = follow_up_suggestions(intent);
    return result;
}

json RemoteModelStrategy::health() const {
    json h = InferenceStrategy::health();
    h["model"] = key_manager_ ? key_manager_->get_current_model() : "";
    h["active_keys"] = key_manager_ ? key_manager_->get_active_key_count() : 0;
    return h;
}

} // namespace code_intelligence
