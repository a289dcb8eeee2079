#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "code_intelligence_engine.hpp"
#include "engine_config.hpp"

using json = nlohmann::json;
using namespace code_intelligence;

namespace {

struct CliOptions {
    std::string project_path;
    std::string config_path;
    std::string search;
    std::string file;
    int line = 0;
    std::string intent;
    std::string query;
    bool overview = false;
    bool cycles = false;
    bool health = false;
};

void print_usage() {
    std::cerr <<
        "usage: codeintel <project_path> [options]\n"
        "  --config <file>      engine config (default: codeintel.json search paths)\n"
        "  --search <text>      semantic code search\n"
        "  --file <path>        file context for <path>\n"
        "  --line <n>           cursor line for --file / --intent\n"
        "  --intent <name>      suggest|explain|refactor|debug|optimize on --file\n"
        "  --query <text>       free-form request passed with --intent\n"
        "  --overview           architecture overview\n"
        "  --cycles             circular dependencies\n"
        "  --health             component health\n";
}

bool parse_args(int argc, char* argv[], CliOptions& opts) {
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };
        if (a == "--config") { if (!next(opts.config_path)) return false; }
        else if (a == "--search") { if (!next(opts.search)) return false; }
        else if (a == "--file") { if (!next(opts.file)) return false; }
        else if (a == "--intent") { if (!next(opts.intent)) return false; }
        else if (a == "--query") { if (!next(opts.query)) return false; }
        else if (a == "--line") {
            std::string v;
            if (!next(v)) return false;
            try {
                opts.line = std::stoi(v);
            } catch (const std::exception&) {
                spdlog::error("❌ --line expects a number, got '{}'", v);
                return false;
            }
        }
        else if (a == "--overview") opts.overview = true;
        else if (a == "--cycles") opts.cycles = true;
        else if (a == "--health") opts.health = true;
        else if (a == "-h" || a == "--help") return false;
        else if (!a.empty() && a[0] == '-') {
            spdlog::error("❌ Unknown option {}", a);
            return false;
        }
        else if (opts.project_path.empty()) opts.project_path = a;
        else return false;
    }
    return !opts.project_path.empty();
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    EngineConfig config = EngineConfig::load(opts.config_path);
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    CodeIntelligenceEngine engine(config);
    engine.initialize();

    json out;
    out["index"] = engine.index_project(opts.project_path).to_json();

    if (!opts.search.empty()) {
        json hits = json::array();
        for (const auto& r : engine.search_code(opts.search)) hits.push_back(r.to_json());
        out["search"] = hits;
    }

    if (!opts.file.empty() && opts.intent.empty()) {
        out["file_context"] = engine.get_file_context(opts.file, opts.line).to_json();
    }

    if (!opts.intent.empty()) {
        CompletionContext ctx;
        ctx.file_path = opts.file;
        ctx.cursor_line = opts.line;
        ctx.query = opts.query;
        out["completion"] = engine.generate_completion(ctx, opts.intent).to_json();
    }

    if (opts.overview) out["overview"] = engine.get_architecture_overview();

    if (opts.cycles) {
        json cycles = json::array();
        for (const auto& c : engine.find_circular_dependencies()) cycles.push_back(c.to_json());
        out["cycles"] = cycles;
    }

    if (opts.health) out["health"] = engine.health();

    std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return 0;
}
