#pragma once

#include <string>
#include "inference/inference_types.hpp"

namespace code_intelligence {

// Assembles the model prompt. Sections are added in rank order and the
// lowest ranked ones are dropped or cut once `char_budget` is reached.
class PromptBuilder {
public:
    explicit PromptBuilder(size_t char_budget = 6000) : char_budget_(char_budget) {}

    std::string build(const CompletionContext& context, Intent intent) const;

    // The task line for an intent, without project context.
    static std::string instruction(const CompletionContext& context, Intent intent);

    size_t char_budget() const { return char_budget_; }

private:
    size_t char_budget_;
};

} // namespace code_intelligence
