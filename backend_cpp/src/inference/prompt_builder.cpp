#include "inference/prompt_builder.hpp"
#include <vector>
#include "text_utils.hpp"

namespace code_intelligence {

namespace {

std::string join_excerpts(const std::vector<std::string>& excerpts) {
    std::string out;
    for (const auto& e : excerpts) {
        out += e;
        if (!ends_with(e, "\n")) out += '\n';
    }
    return out;
}

} // namespace

std::string PromptBuilder::instruction(const CompletionContext& ctx, Intent intent) {
    const std::string where = ctx.file_path.empty() ? std::string("the current file") : ctx.file_path;
    const std::string lang = ctx.language.empty() ? std::string("source") : ctx.language;
    switch (intent) {
        case Intent::Suggest:
            return "Suggest code improvements for " + where + " at line " +
                   std::to_string(ctx.cursor_line) + ". Answer with " + lang + " code.";
        case Intent::Explain:
            return "Explain this " + lang + " code from " + where + ".";
        case Intent::Refactor:
            return "Suggest refactoring for this " + lang + " code from " + where + ".";
        case Intent::Debug:
            return "Help debug this " + lang + " code from " + where + ".";
        case Intent::Optimize:
            return "Suggest optimizations for this " + lang + " code from " + where + ".";
    }
    return "Analyze this code from " + where + ".";
}

std::string PromptBuilder::build(const CompletionContext& ctx, Intent intent) const {
    std::string payload = instruction(ctx, intent) + "\n";
    if (!ctx.query.empty()) payload += "### REQUEST\n" + ctx.query + "\n";

    // Rank order: focal code, symbols, topology, related code.
    const std::vector<std::pair<std::string, std::string>> sections = {
        {"### FOCAL POINT\n", ctx.surrounding_code.empty() ? "" : ctx.surrounding_code + "\n"},
        {"### SYMBOLS\n", join_excerpts(ctx.symbol_excerpts)},
        {"### PROJECT TOPOLOGY\n", join_excerpts(ctx.graph_excerpts)},
        {"### RELATED CODE\n", join_excerpts(ctx.vector_excerpts)},
    };

    for (const auto& [header, body] : sections) {
        if (body.empty()) continue;
        if (payload.size() + header.size() >= char_budget_) break;
        size_t room = char_budget_ - payload.size() - header.size();
        payload += header;
        if (body.size() <= room) {
            payload += body;
        } else {
            payload += utf8_safe_substr(body, room);
            break;
        }
    }
    return payload;
}

} // namespace code_intelligence
