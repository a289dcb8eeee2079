#include "language_analyzer.hpp"
#include "heuristic_parser.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>

namespace code_intelligence {

LanguageAnalyzer::LanguageAnalyzer()
    : LanguageAnalyzer(elite::GrammarRegistry::with_builtin_grammars()) {}

LanguageAnalyzer::LanguageAnalyzer(std::shared_ptr<const elite::GrammarRegistry> registry)
    : registry_(std::move(registry)), booster_(registry_) {}

bool LanguageAnalyzer::has_grammar(Language language, const std::string& file_path) const {
    std::string grammar = elite::GrammarRegistry::grammar_for(language, file_path);
    return registry_ && !grammar.empty() && registry_->find(grammar) != nullptr;
}

FileAnalysis LanguageAnalyzer::analyze(const std::string& file_path, const std::string& content) const {
    Language language = detect_language(file_path);
    std::string hash = std::to_string(fnv1a_64(content));

    if (language == Language::Unknown) {
        FileAnalysis empty;
        empty.file_path = file_path;
        empty.content_hash = hash;
        empty.complexity_metrics = compute_metrics({}, static_cast<int>(split_lines(content).size()));
        return empty;
    }

    if (auto parsed = booster_.extract(file_path, content, language)) {
        parsed->content_hash = hash;
        if (!parsed->parsing_errors.empty()) {
            spdlog::debug("⚠️ {} parsed with errors: {}", file_path, parsed->parsing_errors.front());
        }
        return *parsed;
    }

    FileAnalysis fallback = HeuristicParser::parse(file_path, content, language);
    fallback.content_hash = hash;
    return fallback;
}

} // namespace code_intelligence
