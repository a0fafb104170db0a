#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace cqr::logger {

/// Where and how much the router logs.
struct LogOptions {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string dir;  // empty: stdout only
    int retention_days{7};
};

/// Case-insensitive level name to spdlog level; unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& level_text);

/// Reads CQR_LOG_LEVEL, CQR_LOG_DIR (default ~/.cqr/logs) and
/// CQR_LOG_RETENTION_DAYS (1..364, default 7).
LogOptions options_from_env();

/// Today's JSON-lines file in dir: cqr.jsonl.YYYY-MM-DD
std::string log_file_path(const std::string& dir);

/// Deletes cqr.jsonl.* files in dir dated before the retention window.
/// Returns the number of files removed.
size_t cleanup_old_logs(const std::string& dir, int retention_days);

/// Installs a default logger over the given sinks (stdout when empty).
void init(const std::string& level = "info", std::vector<spdlog::sink_ptr> sinks = {});

/// Installs stdout plus the daily JSON-lines file. Returns the file path,
/// or an empty string when the file sink could not be opened.
std::string install(const LogOptions& options);

void init_from_env();

}  // namespace cqr::logger
