#pragma once

#include <string>
#include "code_model.hpp"

namespace code_intelligence {

// Line-pattern extractor used when no grammar is registered for a language or
// the grammar parser cannot produce a tree. Never throws; parsing_errors stays
// empty and analysis_mode is Heuristic.
class HeuristicParser {
public:
    static FileAnalysis parse(const std::string& file_path,
                              const std::string& content,
                              Language language);

private:
    static void parse_python(FileAnalysis& out, const std::vector<std::string>& lines);
    static void parse_brace_language(FileAnalysis& out, const std::vector<std::string>& lines);
};

} // namespace code_intelligence
