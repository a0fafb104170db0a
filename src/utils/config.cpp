#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cqr {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Get environment variable, falling back to the unprefixed name used by
/// earlier deployments.
std::optional<std::string> getEnvWithFallback(const char* new_name, const char* legacy_name) {
    if (auto v = getEnvValue(new_name)) {
        return v;
    }
    if (auto v = getEnvValue(legacy_name)) {
        spdlog::info("Using legacy environment variable '{}' (preferred: '{}')", legacy_name, new_name);
        return v;
    }
    return std::nullopt;
}

std::optional<long long> parsePositive(const std::string& text) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != text.size() || v <= 0) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::filesystem::path defaultConfigPath() {
    auto home = getEnvValue("HOME");
    if (!home || home->empty()) return std::filesystem::path();
    return std::filesystem::path(*home) / ".cqr" / "config.json";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        spdlog::warn("Ignoring malformed config file {}", path.string());
        return false;
    }
    return true;
}

void applyJson(const nlohmann::json& j, RouterConfig& cfg) {
    auto str = [&](const char* key, std::string& field) {
        if (j.contains(key) && j[key].is_string()) field = j[key].get<std::string>();
    };
    str("loki_mcp_url", cfg.loki_mcp_url);
    str("prometheus_mcp_url", cfg.prometheus_mcp_url);
    str("ollama_url", cfg.ollama_url);
    str("ollama_model", cfg.ollama_model);
    str("bind_address", cfg.bind_address);
    str("cors_allow_origin", cfg.cors_allow_origin);

    if (j.contains("port") && j["port"].is_number_integer()) {
        cfg.port = j["port"].get<int>();
    }
    if (j.contains("tool_timeout_ms") && j["tool_timeout_ms"].is_number_integer() &&
        j["tool_timeout_ms"].get<long long>() > 0) {
        cfg.tool_timeout = std::chrono::milliseconds(j["tool_timeout_ms"].get<long long>());
    }
    if (j.contains("model_timeout_ms") && j["model_timeout_ms"].is_number_integer() &&
        j["model_timeout_ms"].get<long long>() > 0) {
        cfg.model_timeout = std::chrono::milliseconds(j["model_timeout_ms"].get<long long>());
    }
    if (j.contains("cors_enabled") && j["cors_enabled"].is_boolean()) {
        cfg.cors_enabled = j["cors_enabled"].get<bool>();
    }
    if (j.contains("gzip_enabled") && j["gzip_enabled"].is_boolean()) {
        cfg.gzip_enabled = j["gzip_enabled"].get<bool>();
    }
}

}  // namespace

std::pair<RouterConfig, std::string> loadRouterConfigWithLog() {
    RouterConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("CQR_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }
    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            applyJson(j, cfg);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        }
    }

    // env overrides
    if (auto v = getEnvWithFallback("CQR_LOKI_MCP_URL", "LOKI_MCP_URL")) {
        cfg.loki_mcp_url = *v;
        log << "env:LOKI_MCP_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvWithFallback("CQR_PROMETHEUS_MCP_URL", "PROMETHEUS_MCP_URL")) {
        cfg.prometheus_mcp_url = *v;
        log << "env:PROMETHEUS_MCP_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvWithFallback("CQR_OLLAMA_URL", "OLLAMA_URL")) {
        cfg.ollama_url = *v;
        log << "env:OLLAMA_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvWithFallback("CQR_OLLAMA_MODEL", "OLLAMA_MODEL")) {
        cfg.ollama_model = *v;
        log << "env:OLLAMA_MODEL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvWithFallback("CQR_PORT", "PORT")) {
        if (auto port = parsePositive(*v); port && *port <= 65535) {
            cfg.port = static_cast<int>(*port);
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvWithFallback("CQR_BIND_ADDRESS", "HOST")) {
        cfg.bind_address = *v;
        log << "env:BIND_ADDRESS=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("CQR_TOOL_TIMEOUT_MS")) {
        if (auto ms = parsePositive(*v)) {
            cfg.tool_timeout = std::chrono::milliseconds(*ms);
            log << "env:TOOL_TIMEOUT_MS=" << *ms << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CQR_MODEL_TIMEOUT_MS")) {
        if (auto ms = parsePositive(*v)) {
            cfg.model_timeout = std::chrono::milliseconds(*ms);
            log << "env:MODEL_TIMEOUT_MS=" << *ms << " ";
            used_env = true;
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

RouterConfig loadRouterConfig() {
    auto info = loadRouterConfigWithLog();
    return info.first;
}

}  // namespace cqr
