#pragma once
#include <tree_sitter/api.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "code_model.hpp"

// Grammars linked from the tree-sitter grammar libraries
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
}

namespace code_intelligence {
    namespace elite {

// Grammar name -> TSLanguage. Names: "python", "javascript", "typescript", "tsx", "cpp".
class GrammarRegistry {
public:
    // Registry holding every grammar this build links against.
    static std::shared_ptr<GrammarRegistry> with_builtin_grammars();

    void register_grammar(const std::string& name, const TSLanguage* language);
    void unregister_grammar(const std::string& name);
    const TSLanguage* find(const std::string& name) const;
    std::vector<std::string> names() const;

    // Grammar name used for a file, or "" when the language has none.
    static std::string grammar_for(Language language, const std::string& file_path);

private:
    std::map<std::string, const TSLanguage*> grammars_;
};

class ASTBooster {
public:
    explicit ASTBooster(std::shared_ptr<const GrammarRegistry> registry);

    // 🛰️ Grammar-driven extraction. std::nullopt when the grammar is missing or
    // the parser produced no tree; syntax errors still yield a partial analysis.
    std::optional<FileAnalysis> extract(const std::string& path,
                                        const std::string& content,
                                        Language language) const;

private:
    std::shared_ptr<const GrammarRegistry> registry_;
};

    }
}
