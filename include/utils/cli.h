#pragma once

#include <cstdint>
#include <string>

namespace cqr {

enum class Subcommand {
    None,    // bare invocation runs the server with the loaded config
    Serve,
    Ask,
    Routes,
};

/// `serve` overrides; port 0 and an empty host keep the configured values.
struct ServeOptions {
    uint16_t port{0};
    std::string host;
};

struct AskOptions {
    std::string question;
    std::string server;  // empty: CQR_SERVER or http://127.0.0.1:8080
};

/// Outcome of argument parsing. When should_exit is set, main prints output
/// (stdout for exit_code 0, stderr otherwise) and returns exit_code without
/// running a subcommand.
struct CliResult {
    bool should_exit{false};
    int exit_code{0};
    std::string output;
    Subcommand subcommand{Subcommand::None};
    ServeOptions serve_options;
    AskOptions ask_options;
};

CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getVersionMessage();
std::string subcommandToString(Subcommand cmd);

}  // namespace cqr
