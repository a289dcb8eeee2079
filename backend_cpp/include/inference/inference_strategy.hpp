#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "inference/inference_types.hpp"

namespace code_intelligence {

// One concrete backend able to answer a completion request.
// generate_code_completion may throw; the router treats a throw like an error result.
class InferenceStrategy {
public:
    virtual ~InferenceStrategy() = default;

    virtual StrategyKind kind() const = 0;
    virtual std::string name() const = 0;
    virtual bool is_available() = 0;
    virtual bool initialize() = 0;
    virtual bool is_initialized() const = 0;
    virtual CompletionResult generate_code_completion(const CompletionContext& context, Intent intent) = 0;

    virtual nlohmann::json health() const {
        return {{"strategy", name()}, {"kind", to_string(kind())}, {"initialized", is_initialized()}};
    }
};

} // namespace code_intelligence
