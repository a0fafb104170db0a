#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace cqr::logger {

namespace {

constexpr const char* kFilePrefix = "cqr.jsonl.";
constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%l] %v";
// %* is the message as a quoted JSON string.
constexpr const char* kJsonPattern = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":%*})";

class JsonMessageFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        // Invalid UTF-8 in questions or tool output becomes U+FFFD instead of throwing.
        const std::string quoted = nlohmann::json(std::string(msg.payload.data(), msg.payload.size()))
                                       .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        dest.append(quoted.data(), quoted.data() + quoted.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};

std::unique_ptr<spdlog::formatter> jsonLineFormatter() {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<JsonMessageFlag>('*').set_pattern(kJsonPattern);
    return formatter;
}

std::string isoDate(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string name(level_text);
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "fatal") return spdlog::level::critical;

    // spdlog maps unknown names to off; the router wants info.
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return spdlog::level::info;
    return level;
}

LogOptions options_from_env() {
    LogOptions options;
    options.level = parse_level(envOr("CQR_LOG_LEVEL", "info"));

    const std::string home = envOr("HOME", "/tmp");
    options.dir = envOr("CQR_LOG_DIR", (fs::path(home) / ".cqr" / "logs").string());

    const std::string days = envOr("CQR_LOG_RETENTION_DAYS", "");
    char* end = nullptr;
    const long parsed = days.empty() ? 0 : std::strtol(days.c_str(), &end, 10);
    if (!days.empty() && end && *end == '\0' && parsed > 0 && parsed < 365) {
        options.retention_days = static_cast<int>(parsed);
    }
    return options;
}

std::string log_file_path(const std::string& dir) {
    return (fs::path(dir) / (kFilePrefix + isoDate(std::chrono::system_clock::now()))).string();
}

size_t cleanup_old_logs(const std::string& dir, int retention_days) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return 0;

    const std::string prefix(kFilePrefix);
    const std::string cutoff =
        isoDate(std::chrono::system_clock::now() - std::chrono::hours(24) * retention_days);

    size_t removed = 0;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || name.compare(0, prefix.size(), prefix) != 0) continue;
        // YYYY-MM-DD suffixes order lexicographically
        if (name.substr(prefix.size()) < cutoff && fs::remove(entry.path(), ec)) {
            ++removed;
        }
    }
    return removed;
}

void init(const std::string& level, std::vector<spdlog::sink_ptr> sinks) {
    if (sinks.empty()) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(std::move(console));
    }
    auto logger = std::make_shared<spdlog::logger>("cqr", sinks.begin(), sinks.end());
    logger->set_level(parse_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(std::move(logger));
}

std::string install(const LogOptions& options) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    std::vector<spdlog::sink_ptr> sinks{console};

    std::string path;
    std::string failure;
    if (!options.dir.empty()) {
        std::error_code ec;
        fs::create_directories(options.dir, ec);
        if (ec) {
            failure = ec.message();
        } else {
            cleanup_old_logs(options.dir, options.retention_days);
            try {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path(options.dir));
                file->set_formatter(jsonLineFormatter());
                sinks.push_back(std::move(file));
                path = log_file_path(options.dir);
            } catch (const spdlog::spdlog_ex& e) {
                failure = e.what();
            }
        }
    }

    init(std::string(spdlog::level::to_string_view(options.level).data()), std::move(sinks));
    if (!failure.empty()) {
        spdlog::warn("Logging to stdout only, cannot open {}: {}", options.dir, failure);
    }
    return path;
}

void init_from_env() {
    const std::string path = install(options_from_env());
    if (!path.empty()) {
        spdlog::info("Router logs initialized: {}", path);
    }
}

}  // namespace cqr::logger
