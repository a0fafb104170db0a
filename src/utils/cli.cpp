#include "utils/cli.h"

#include <cstdlib>
#include <vector>
#include "utils/version.h"

namespace cqr {

namespace {

const char* const kServeHelp = R"(cluster-query-router serve - Start the HTTP service

USAGE:
    cluster-query-router serve [--port <PORT>] [--host <HOST>]

OPTIONS:
    --port <PORT>    Listen port (default: 8080, or CQR_PORT)
    --host <HOST>    Bind address (default: 0.0.0.0, or CQR_BIND_ADDRESS)
    -h, --help       Print help

ENVIRONMENT:
    CQR_CONFIG                Config file (default: ~/.cqr/config.json)
    CQR_LOKI_MCP_URL          Loki MCP server URL (or LOKI_MCP_URL)
    CQR_PROMETHEUS_MCP_URL    Prometheus MCP server URL (or PROMETHEUS_MCP_URL)
    CQR_OLLAMA_URL            Ollama base URL (or OLLAMA_URL)
    CQR_OLLAMA_MODEL          Summarization model (or OLLAMA_MODEL)
    CQR_TOOL_TIMEOUT_MS       MCP tool call timeout (default: 30000)
    CQR_MODEL_TIMEOUT_MS      Model call timeout (default: 60000)
    CQR_LOG_LEVEL             trace|debug|info|warn|error|off
    CQR_LOG_DIR               Log directory (default: ~/.cqr/logs)
    CQR_LOG_RETENTION_DAYS    Days of JSON logs to keep (default: 7)
)";

const char* const kAskHelp = R"(cluster-query-router ask - Send a question to a running router

USAGE:
    cluster-query-router ask <QUESTION> [--server <URL>]

ARGUMENTS:
    <QUESTION>       Question text, quoted

OPTIONS:
    --server <URL>   Router URL (default: CQR_SERVER or http://127.0.0.1:8080)
    -h, --help       Print help
)";

const char* const kRoutesHelp = R"(cluster-query-router routes - Print the route table

USAGE:
    cluster-query-router routes

Routes are tried top to bottom and the first match wins.
)";

CliResult exitWith(Subcommand subcommand, int code, std::string output) {
    CliResult result;
    result.subcommand = subcommand;
    result.should_exit = true;
    result.exit_code = code;
    result.output = std::move(output);
    return result;
}

CliResult usageError(Subcommand subcommand, const std::string& message, const char* help) {
    return exitWith(subcommand, 1, "Error: " + message + "\n\n" + help);
}

bool isHelp(const std::string& arg) { return arg == "-h" || arg == "--help"; }

bool wantsHelp(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (isHelp(arg)) return true;
    }
    return false;
}

bool parsePort(const std::string& text, uint16_t& port) {
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

CliResult parseServe(const std::vector<std::string>& args) {
    if (wantsHelp(args)) return exitWith(Subcommand::Serve, 0, kServeHelp);

    CliResult result;
    result.subcommand = Subcommand::Serve;
    for (size_t i = 0; i < args.size(); ++i) {
        const bool has_value = i + 1 < args.size();
        if (args[i] == "--port" && has_value) {
            if (!parsePort(args[++i], result.serve_options.port)) {
                return usageError(Subcommand::Serve, "invalid port: " + args[i], kServeHelp);
            }
        } else if (args[i] == "--host" && has_value) {
            result.serve_options.host = args[++i];
        } else {
            return usageError(Subcommand::Serve, "unexpected argument: " + args[i], kServeHelp);
        }
    }
    return result;
}

CliResult parseAsk(const std::vector<std::string>& args) {
    if (wantsHelp(args)) return exitWith(Subcommand::Ask, 0, kAskHelp);

    CliResult result;
    result.subcommand = Subcommand::Ask;
    bool have_question = false;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--server" && i + 1 < args.size()) {
            result.ask_options.server = args[++i];
        } else if (!have_question && !args[i].empty() && args[i][0] != '-') {
            result.ask_options.question = args[i];
            have_question = true;
        } else {
            return usageError(Subcommand::Ask, "unexpected argument: " + args[i], kAskHelp);
        }
    }
    if (!have_question) {
        return usageError(Subcommand::Ask, "question required", kAskHelp);
    }
    return result;
}

CliResult parseRoutes(const std::vector<std::string>& args) {
    if (wantsHelp(args)) return exitWith(Subcommand::Routes, 0, kRoutesHelp);
    if (!args.empty()) {
        return usageError(Subcommand::Routes, "unexpected argument: " + args.front(), kRoutesHelp);
    }
    CliResult result;
    result.subcommand = Subcommand::Routes;
    return result;
}

}  // namespace

std::string getHelpMessage() {
    return std::string("cluster-query-router ") + CQR_VERSION + R"( - deterministic cluster-ops question router

USAGE:
    cluster-query-router [COMMAND]

COMMANDS:
    serve      Start the HTTP service (default)
    ask        Send a question to a running router
    routes     Print the route table

OPTIONS:
    -h, --help       Print help information
    -V, --version    Print version information

Run 'cluster-query-router <COMMAND> --help' for details.
)";
}

std::string getVersionMessage() {
    return std::string("cluster-query-router ") + CQR_VERSION + "\n";
}

CliResult parseCliArgs(int argc, char* argv[]) {
    if (argc < 2) return CliResult{};

    const std::string command = argv[1];
    const std::vector<std::string> rest(argv + 2, argv + argc);

    if (isHelp(command)) return exitWith(Subcommand::None, 0, getHelpMessage());
    if (command == "-V" || command == "--version") return exitWith(Subcommand::None, 0, getVersionMessage());
    if (command == "serve") return parseServe(rest);
    if (command == "ask") return parseAsk(rest);
    if (command == "routes") return parseRoutes(rest);

    return exitWith(Subcommand::None, 1, "Unknown command: " + command + "\n\n" + getHelpMessage());
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Serve: return "serve";
        case Subcommand::Ask: return "ask";
        case Subcommand::Routes: return "routes";
    }
    return "unknown";
}

}  // namespace cqr
