#include <iostream>
#include <signal.h>
#include <thread>
#include <chrono>
#include <string>
#include <spdlog/spdlog.h>

#include "api/ask_endpoints.h"
#include "api/http_server.h"
#include "api/node_endpoints.h"
#include "backends/backend_client.h"
#include "cli/commands.h"
#include "core/orchestrator.h"
#include "routing/route_table.h"
#include "runtime/state.h"
#include "summarizer/summarizer.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

int run_router(const cqr::RouterConfig& cfg, const std::string& config_log) {
    cqr::g_running_flag.store(true);

    try {
        cqr::logger::init_from_env();
        cqr::set_ready(false);

        spdlog::info("cluster-query-router {} starting", CQR_VERSION);
        spdlog::info("Config: {}", config_log);
        spdlog::info("Loki MCP: {}", cfg.loki_mcp_url);
        spdlog::info("Prometheus MCP: {}", cfg.prometheus_mcp_url);
        spdlog::info("Ollama: {} (model {})", cfg.ollama_url, cfg.ollama_model);

        cqr::McpBackendClient backend(cfg);
        cqr::OllamaSummarizer summarizer(cfg);
        cqr::Orchestrator orchestrator(cqr::RouteTable::defaults(), backend, summarizer);

        cqr::NodeEndpoints node_endpoints;
        cqr::AskEndpoints ask_endpoints(orchestrator, node_endpoints.exporter());

        cqr::HttpServer server(cfg.port, ask_endpoints, node_endpoints, cfg.bind_address);
        server.enableCors(cfg.cors_enabled);
        server.setCorsOrigin(cfg.cors_allow_origin);
        server.enableCompression(cfg.gzip_enabled);
        server.setLogger([](const httplib::Request& req, const httplib::Response& res, double elapsed) {
            spdlog::info("{} {} {} {:.1f}ms", req.method, req.path, res.status, elapsed * 1000.0);
        });

        for (const auto& route : cqr::RouteTable::defaults().routes()) {
            spdlog::debug("Route {} -> {}", route.id, cqr::to_string(route.backend));
        }

        std::cout << "Starting HTTP server on " << cfg.bind_address << ":" << cfg.port << "..." << std::endl;
        server.start();

        cqr::set_ready(true);
        spdlog::info("Router ready, {} routes loaded", cqr::RouteTable::defaults().routes().size());

        while (cqr::is_running()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        std::cout << "Shutting down..." << std::endl;
        cqr::set_ready(false);
        server.stop();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Router shutdown complete" << std::endl;
    return 0;
}

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    cqr::request_shutdown();
}

int serve(const cqr::ServeOptions& options) {
    auto [cfg, config_log] = cqr::loadRouterConfigWithLog();
    // CLI options override the loaded config
    if (options.port != 0) {
        cfg.port = options.port;
    }
    if (!options.host.empty()) {
        cfg.bind_address = options.host;
    }
    return run_router(cfg, config_log);
}

int main(int argc, char* argv[]) {
    auto cli_result = cqr::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    switch (cli_result.subcommand) {
        case cqr::Subcommand::Ask:
            return cqr::cli::commands::ask(cli_result.ask_options);

        case cqr::Subcommand::Routes:
            return cqr::cli::commands::routes();

        case cqr::Subcommand::Serve:
        case cqr::Subcommand::None:
            break;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    return serve(cli_result.serve_options);
}
