#pragma once

#include <memory>
#include <string>
#include "code_model.hpp"
#include "parser_elite.hpp"

namespace code_intelligence {

// Single-file analysis entry point. Pure over (file_path, content); safe to
// call from several threads at once.
class LanguageAnalyzer {
public:
    LanguageAnalyzer();
    explicit LanguageAnalyzer(std::shared_ptr<const elite::GrammarRegistry> registry);

    FileAnalysis analyze(const std::string& file_path, const std::string& content) const;

    bool has_grammar(Language language, const std::string& file_path = "") const;

private:
    std::shared_ptr<const elite::GrammarRegistry> registry_;
    elite::ASTBooster booster_;
};

} // namespace code_intelligence
