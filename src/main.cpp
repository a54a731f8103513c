#include "config.hpp"
#include "executor.hpp"
#include "http.hpp"
#include "cache/response_cache.hpp"
#include "recovery/json_recovery.hpp"
#include "recovery/reflection.hpp"
#include "sandbox/process_runner.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: toolcage [options] <command> [args]\n"
              << "\n"
              << "Options:\n"
              << "  -w, --workspace DIR  Workspace root (default: config or current directory)\n"
              << "  -c, --config FILE    Read configuration from FILE instead of\n"
              << "                       ~/.toolcage/config.json\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  run TOOL [ARGS_JSON] Execute one tool call and print the JSON result\n"
              << "  tools                Print the function-calling schemas of all tools\n"
              << "  cache stats          Show response cache statistics\n"
              << "  cache prune          Remove expired cache entries\n"
              << "  cache clear          Remove all cache entries\n"
              << "  recover              Read text on stdin and print the first JSON object\n"
              << "  reflect [OUTPUT_JSON]\n"
              << "                       Read an auditor reply on stdin and print the\n"
              << "                       normalised verdict for the given tool output\n"
              << "\n"
              << "Exit status: 0 on success, 1 on an error result, 2 on usage errors.\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLCAGE_WORK_DIR    Workspace root (WORK_DIR is also accepted)\n"
              << "  TOOLCAGE_MODEL       Model name used in cache keys\n"
              << "  TOOLCAGE_CACHE_ENABLED, TOOLCAGE_CACHE_DIR, TOOLCAGE_CACHE_TTL\n"
              << "  TOOLCAGE_SHELL_TIMEOUT, TOOLCAGE_DOCKER_TIMEOUT\n";
}

static int usage_error(const std::string& message) {
    std::cerr << "Error: " << message << "\n\n";
    print_usage();
    return 2;
}

static std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
}

static int run_tool(const toolcage::Config& config,
                    const std::string& tool_name,
                    const std::string& args_text) {
    nlohmann::json args = nlohmann::json::object();
    if (!args_text.empty()) {
        args = nlohmann::json::parse(args_text, nullptr, false);
        if (args.is_discarded()) return usage_error("ARGS_JSON is not valid JSON");
    }

    toolcage::http_init();
    toolcage::PosixProcessRunner runner(config.security.max_output_bytes);
    toolcage::PlatformHttpClient http_client;
    toolcage::ToolExecutor executor(config, runner, http_client);

    toolcage::ToolResult result = executor.execute(tool_name, args);
    std::cout << result.to_json().dump(2) << '\n';

    toolcage::http_cleanup();
    return result.is_error() ? 1 : 0;
}

static int run_cache(const toolcage::Config& config, const std::string& action) {
    if (action != "stats" && action != "prune" && action != "clear") {
        return usage_error("unknown cache action: " + action);
    }
    if (!config.cache.enabled) {
        std::cerr << "Response cache is disabled\n";
        return 1;
    }

    toolcage::ResponseCache cache(config.cache_dir(), config.cache.ttl);
    if (action == "stats") {
        std::cout << cache.stats().to_json().dump(2) << '\n';
    } else if (action == "prune") {
        std::cout << nlohmann::json{{"removed", cache.prune_expired()}}.dump() << '\n';
    } else {
        std::cout << nlohmann::json{{"removed", cache.clear()}}.dump() << '\n';
    }
    return 0;
}

static int run_recover() {
    auto obj = toolcage::extract_json_object(read_stdin());
    if (!obj) {
        std::cerr << "No JSON object found\n";
        return 1;
    }
    std::cout << obj->dump(2) << '\n';
    return 0;
}

static int run_reflect(const std::string& output_text) {
    nlohmann::json tool_output = nullptr;
    if (!output_text.empty()) {
        tool_output = nlohmann::json::parse(output_text, nullptr, false);
        if (tool_output.is_discarded()) tool_output = output_text;
    }
    auto verdict = toolcage::audit_response(read_stdin(), tool_output);
    std::cout << verdict.to_json().dump(2) << '\n';
    return verdict.success ? 0 : 1;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string workspace;
    std::string config_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-w") == 0 || std::strcmp(argv[i], "--workspace") == 0) && i + 1 < argc) {
            workspace = argv[++i];
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (argv[i][0] == '-' && positional.empty()) {
            return usage_error(std::string("unknown option: ") + argv[i]);
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) return usage_error("missing command");
    const std::string& command = positional[0];

    // Commands that need no configuration
    if (command == "recover") {
        if (positional.size() != 1) return usage_error("recover takes no arguments");
        return run_recover();
    }
    if (command == "reflect") {
        if (positional.size() > 2) return usage_error("reflect takes at most one argument");
        return run_reflect(positional.size() == 2 ? positional[1] : std::string());
    }
    if (command == "tools") {
        if (positional.size() != 1) return usage_error("tools takes no arguments");
        std::cout << toolcage::ToolExecutor::tool_specs().dump(2) << '\n';
        return 0;
    }

    auto config = config_path.empty() ? toolcage::Config::load()
                                      : toolcage::Config::load_from(config_path);
    if (!workspace.empty()) config.workspace = workspace;

    if (command == "run") {
        if (positional.size() < 2 || positional.size() > 3) {
            return usage_error("usage: run TOOL [ARGS_JSON]");
        }
        return run_tool(config, positional[1], positional.size() == 3 ? positional[2] : "");
    }
    if (command == "cache") {
        if (positional.size() != 2) return usage_error("usage: cache stats|prune|clear");
        return run_cache(config, positional[1]);
    }
    return usage_error("unknown command: " + command);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
