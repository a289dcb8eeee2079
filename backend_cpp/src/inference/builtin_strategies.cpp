#include "inference/model_strategies.hpp"
#include <algorithm>
#include <filesystem>
#include "text_utils.hpp"

namespace code_intelligence {

std::vector<std::string> follow_up_suggestions(Intent intent) {
    switch (intent) {
        case Intent::Suggest:
            return {"Ask for explanation of suggested patterns",
                    "Request refactoring recommendations",
                    "Get debugging tips for this code section"};
        case Intent::Explain:
            return {"Request code improvement suggestions",
                    "Ask about performance optimization",
                    "Get examples of similar patterns"};
        case Intent::Refactor:
            return {"Test the refactored code",
                    "Get performance impact analysis",
                    "Request additional refactoring opportunities"};
        case Intent::Debug:
            return {"Set up debugging environment",
                    "Write unit tests to isolate issues",
                    "Profile code for performance bottlenecks"};
        case Intent::Optimize:
            return {"Benchmark current performance",
                    "Profile memory usage",
                    "Consider alternative algorithms"};
    }
    return {};
}

// --- MOCK ---

namespace {

std::string display_language(const CompletionContext& ctx) {
    return ctx.language.empty() ? std::string("unknown") : ctx.language;
}

std::string first_line(const std::string& text) {
    auto lines = split_lines(text);
    for (const auto& l : lines) {
        std::string t = trim(l);
        if (!t.empty()) return t;
    }
    return "";
}

std::string comment_prefix(const std::string& language) {
    if (language == "python") return "# ";
    return "// ";
}

} // namespace

bool MockStrategy::initialize() {
    initialized_.store(enabled_);
    return enabled_;
}

double MockStrategy::estimate_confidence(const CompletionContext& ctx, Intent intent) {
    double base = 0.3;
    if (!ctx.symbol_excerpts.empty()) base += 0.15;
    if (!ctx.surrounding_code.empty()) base += 0.15;
    if (!ctx.graph_excerpts.empty() || !ctx.vector_excerpts.empty()) base += 0.1;

    const std::string lang = display_language(ctx);
    if (lang == "python" || lang == "javascript" || lang == "typescript" || lang == "swift") {
        base += 0.2;
    } else if (lang != "unknown") {
        base += 0.1;
    }

    double multiplier = 1.0;
    switch (intent) {
        case Intent::Suggest: multiplier = 1.0; break;
        case Intent::Explain: multiplier = 1.1; break;
        case Intent::Refactor: multiplier = 0.9; break;
        case Intent::Debug: multiplier = 0.8; break;
        case Intent::Optimize: multiplier = 0.8; break;
    }
    return std::clamp(base * multiplier, 0.3, 0.95);
}

CompletionResult MockStrategy::generate_code_completion(const CompletionContext& ctx, Intent intent) {
    const std::string lang = display_language(ctx);
    const std::string file = std::filesystem::path(ctx.file_path).filename().string();
    const std::string focus = first_line(ctx.surrounding_code);
    const std::string symbol = ctx.symbol_excerpts.empty() ? std::string() : first_line(ctx.symbol_excerpts.front());
    const std::string cp = comment_prefix(lang);

    std::string response;
    switch (intent) {
        case Intent::Suggest:
            response = cp + "Suggested continuation for " + file + " line " + std::to_string(ctx.cursor_line) + "\n";
            if (!focus.empty()) response += cp + "Following: " + focus + "\n";
            response += cp + "Validate inputs and handle the error path before returning.";
            break;
        case Intent::Explain:
            response = "Code explanation for " + (symbol.empty() ? file : symbol) + " (" + lang + ").\n";
            if (!focus.empty()) response += "Entry point: " + focus + "\n";
            response += "It is referenced by " + std::to_string(ctx.graph_excerpts.size()) +
                        " related graph entries and resembles " + std::to_string(ctx.vector_excerpts.size()) +
                        " indexed fragments.";
            break;
        case Intent::Refactor:
            response = "Refactoring plan for " + (symbol.empty() ? file : symbol) + ":\n"
                       "- Extract long branches into named helpers\n"
                       "- Replace repeated literals with constants\n"
                       "- Keep each function on one level of abstraction";
            break;
        case Intent::Debug:
            response = "Debugging checklist for " + file + ":\n"
                       "- Check the values reaching line " + std::to_string(ctx.cursor_line) + "\n"
                       "- Verify imports and names resolve\n"
                       "- Add a failing test that reproduces the issue";
            break;
        case Intent::Optimize:
            response = "Optimization notes for " + file + ":\n"
                       "- Hoist invariant work out of loops\n"
                       "- Cache repeated lookups\n"
                       "- Prefer data structures with the right lookup cost";
            break;
    }

    CompletionResult result;
    result.status = "success";
    result.response = std::move(response);
    result.confidence = estimate_confidence(ctx, intent);
    result.strategy_used = name();
    result.context_used = ctx.has_project_context();
    result.context_items = ctx.context_items();
    result.suggestions = follow_up_suggestions(intent);
    return result;
}

// --- FALLBACK ---

CompletionResult FallbackStrategy::generate_code_completion(const CompletionContext& ctx, Intent intent) {
    std::string response;
    switch (intent) {
        case Intent::Suggest:
            response = "# Consider implementing the functionality here\n# Add your code logic";
            break;
        case Intent::Explain:
            response = "This code requires analysis. Please refer to documentation or comments.";
            break;
        case Intent::Refactor:
            response = "Consider breaking this into smaller functions for better maintainability.";
            break;
        case Intent::Debug:
            response = "Check for common issues: variable names, syntax, imports, and logic flow.";
            break;
        case Intent::Optimize:
            response = "Look for opportunities to improve performance: caching, algorithms, data structures.";
            break;
    }

    CompletionResult result;
    result.status = "success";
    result.response = std::move(response);
    result.confidence = 0.5;
    result.strategy_used = name();
    result.context_used = false;
    result.context_items = ctx.context_items();
    result.requires_human_review = true;
    result.suggestions = {"Configure a model backend for context-aware answers"};
    return result;
}

} // namespace code_intelligence
