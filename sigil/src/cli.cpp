// sigil: condition/effect engine over a campaign snapshot
//
// Modes:
//   Server mode: sigil --source FILE           - JSON-RPC 2.0 over stdio
//   CLI mode:    sigil --source FILE <tool> [--key value ...]
//
// CLI Examples:
//   sigil --source world.json evaluate_condition --conditionId c1 --context '{"x":1}'
//   sigil --source world.db resolve_encounter --encounterId enc-7
//   sigil --source world.json graph_downstream --nodeId VARIABLE:gold --maxDepth 2
//
// Engine options (also SIGIL_* environment variables):
//   --source PATH             Snapshot file (.json, or .db/.sqlite for SQLite)
//   --source-kind KIND        json | sqlite (default: from extension)
//   --campaign ID             Default campaign for graph tools
//   --branch ID               Default branch (default: main)
//   --max-depth N             Expression validation depth limit
//   --refuse-cyclic-writes    Skip effects that sit on a write cycle
//   --no-write-chains         Omit EFFECT -> EFFECT graph edges
//   --log-level LEVEL         debug | info | warn | error | off
//   -v, --verbose             Same as --log-level debug

#include <sigil/sigil.hpp>
#include <sigil/rpc/handler.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <cstring>
#include <csignal>
#include <cstdlib>

using namespace sigil;
using json = nlohmann::json;

void signal_handler(int sig) {
    (void)sig;
    std::cerr << "[sigil] Signal received, exiting\n";
    std::_Exit(0);
}

static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog, const rpc::Handler* handler) {
    const char* name = prog_name(prog);
    std::cerr << "sigil " << SIGIL_VERSION << " - Condition and effect engine\n\n"
              << "Usage: " << name << " --source PATH [options]            Serve JSON-RPC on stdio\n"
              << "       " << name << " --source PATH <tool> [--key value]  Run one tool\n\n"
              << "Options:\n"
              << "  --source PATH             Snapshot file (.json, .db, .sqlite)\n"
              << "  --source-kind KIND        json | sqlite\n"
              << "  --campaign ID             Default campaign\n"
              << "  --branch ID               Default branch (default: main)\n"
              << "  --max-depth N             Expression depth limit (default: 10)\n"
              << "  --refuse-cyclic-writes    Skip effects on write cycles\n"
              << "  --no-write-chains         Omit effect-to-effect graph edges\n"
              << "  --log-level LEVEL         debug | info | warn | error | off\n"
              << "  --json                    CLI mode: print the raw structured result\n"
              << "  -v, --verbose             Debug logging\n"
              << "  --version                 Show version\n"
              << "  -h, --help                Show this help\n";
    if (handler) {
        std::cerr << "\nTools:\n";
        for (const auto& tool : handler->tools()) {
            std::cerr << "  " << tool.name << "\n";
        }
    }
}

// "--key value" pairs; values that parse as JSON keep their type
json parse_tool_args(int argc, char* argv[], int arg_start) {
    json args = json::object();
    for (int i = arg_start; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") continue;
        if (arg.rfind("--", 0) != 0) {
            std::cerr << "[sigil] Ignoring positional argument: " << arg << "\n";
            continue;
        }
        std::string key = arg.substr(2);
        if (i + 1 < argc && std::strncmp(argv[i + 1], "--", 2) != 0) {
            std::string value = argv[++i];
            args[key] = json::accept(value) ? json::parse(value) : json(value);
        } else {
            args[key] = true;  // Flag without value
        }
    }
    return args;
}

std::unique_ptr<RecordSource> open_source(const EngineConfig& config) {
    std::unique_ptr<JsonRecordSource> source;
    if (config.source_kind == SourceKind::Sqlite) {
        source = std::make_unique<SqliteRecordSource>(config.source_path);
    } else {
        source = std::make_unique<JsonRecordSource>(JsonRecordSource::from_file(config.source_path));
    }
    for (const auto& w : source->warnings()) {
        log::warn("source", "%s", w.c_str());
    }
    log::info("source", "Opened %s", source->describe().c_str());
    return source;
}

int run_cli(rpc::Handler& handler, const std::string& tool, int argc, char* argv[],
            int arg_start, bool json_output) {
    json args = parse_tool_args(argc, argv, arg_start);
    log::debug("cli", "%s %s", tool.c_str(), args.dump().c_str());

    rpc::ToolResult result = handler.call_tool(tool, args);
    if (json_output) {
        json out = result.structured.is_null() ? json({{"error", result.content}}) : result.structured;
        std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    } else if (result.is_error) {
        std::cerr << result.content << "\n";
    } else {
        std::cout << result.content << "\n";
    }
    return result.is_error ? 1 : 0;
}

int serve(rpc::Handler& handler) {
    std::cerr << "[sigil] Listening on stdin...\n";
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::cout << handler.handle(line) << "\n";
        std::cout.flush();
        if (handler.shutdown_requested()) break;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    EngineConfig config = EngineConfig::from_environment();
    argc = config.apply_args(argc, argv);
    log::set_level(config.log_level);

    bool json_output = false;
    bool show_help = false;
    int tool_index = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "sigil " << SIGIL_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            show_help = true;
        } else if (tool_index == 0 && argv[i][0] != '-') {
            tool_index = i;
        }
    }

    if (config.source_path.empty()) {
        print_usage(argv[0], nullptr);
        if (show_help) return 0;
        std::cerr << "\nError: no record source (--source or SIGIL_SOURCE)\n";
        return 1;
    }

    std::unique_ptr<RecordSource> source;
    try {
        source = open_source(config);
    } catch (const Error& e) {
        std::cerr << "[sigil] " << e.what() << "\n";
        return 1;
    }

    Engine engine(*source, config);
    rpc::Handler handler(engine);

    if (show_help) {
        print_usage(argv[0], &handler);
        return 0;
    }

    if (tool_index > 0) {
        std::string tool = argv[tool_index];
        if (!handler.has_tool(tool)) {
            std::cerr << "Unknown tool: " << tool << "\n";
            print_usage(argv[0], &handler);
            return 1;
        }
        return run_cli(handler, tool, argc, argv, tool_index + 1, json_output);
    }

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    return serve(handler);
}
