#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include "utils/logger.h"

namespace fs = std::filesystem;

namespace {
class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("cqr-log-XXXXXX");
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path();
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path path;
};

class ScopedEnv {
public:
    ScopedEnv(const char* key, const std::string& value) : key_(key) {
        if (const char* old = std::getenv(key)) {
            had_ = true;
            old_ = old;
        }
        setenv(key, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (had_) {
            setenv(key_, old_.c_str(), 1);
        } else {
            unsetenv(key_);
        }
    }

private:
    const char* key_;
    bool had_{false};
    std::string old_;
};

std::string format_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

void touch_file(const fs::path& path) {
    std::ofstream ofs(path);
    ofs << "log";
}
}  // namespace

TEST(LoggerRotationTest, RemovesLogsOlderThanRetention) {
    TempDir temp;

    auto now = std::chrono::system_clock::now();
    auto old_date = now - std::chrono::hours(24 * 10);
    auto recent_date = now - std::chrono::hours(24);

    fs::path old_file = temp.path / ("cqr.jsonl." + format_date(old_date));
    fs::path recent_file = temp.path / ("cqr.jsonl." + format_date(recent_date));
    fs::path unrelated = temp.path / ("other.jsonl." + format_date(old_date));
    touch_file(old_file);
    touch_file(recent_file);
    touch_file(unrelated);

    EXPECT_EQ(cqr::logger::cleanup_old_logs(temp.path.string(), 3), 1u);

    EXPECT_FALSE(fs::exists(old_file));
    EXPECT_TRUE(fs::exists(recent_file));
    EXPECT_TRUE(fs::exists(unrelated));
}

TEST(LoggerRotationTest, MissingDirectoryIsIgnored) {
    EXPECT_EQ(cqr::logger::cleanup_old_logs("/nonexistent/cqr-logs", 3), 0u);
}

TEST(LoggerConfigTest, ParsesLevelsCaseInsensitively) {
    EXPECT_EQ(cqr::logger::parse_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(cqr::logger::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(cqr::logger::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(cqr::logger::parse_level("off"), spdlog::level::off);
    EXPECT_EQ(cqr::logger::parse_level("verbose"), spdlog::level::info);
    EXPECT_EQ(cqr::logger::parse_level("fatal"), spdlog::level::critical);
}

TEST(LoggerConfigTest, LogDirAndRetentionFromEnv) {
    TempDir temp;
    ScopedEnv dir("CQR_LOG_DIR", temp.path.string());
    ScopedEnv days("CQR_LOG_RETENTION_DAYS", "14");

    ScopedEnv level("CQR_LOG_LEVEL", "Debug");

    const auto options = cqr::logger::options_from_env();
    EXPECT_EQ(options.dir, temp.path.string());
    EXPECT_EQ(options.retention_days, 14);
    EXPECT_EQ(options.level, spdlog::level::debug);

    const std::string expected =
        (temp.path / ("cqr.jsonl." + format_date(std::chrono::system_clock::now()))).string();
    EXPECT_EQ(cqr::logger::log_file_path(options.dir), expected);
}

TEST(LoggerConfigTest, InvalidRetentionFallsBackToDefault) {
    ScopedEnv days("CQR_LOG_RETENTION_DAYS", "forever");
    EXPECT_EQ(cqr::logger::options_from_env().retention_days, 7);

    ScopedEnv too_long("CQR_LOG_RETENTION_DAYS", "400");
    EXPECT_EQ(cqr::logger::options_from_env().retention_days, 7);
}

TEST(LoggerConfigTest, InjectedSinkReceivesMessagesAtLevel) {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    sink->set_pattern("%l %v");
    cqr::logger::init("warn", {sink});

    spdlog::info("hidden");
    spdlog::warn("shown {}", 1);
    spdlog::default_logger()->flush();

    const std::string out = oss.str();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("warning shown 1"), std::string::npos);

    // Back to stdout before oss goes out of scope.
    cqr::logger::init("info");
}

TEST(LoggerConfigTest, InitFromEnvWritesJsonLines) {
    TempDir temp;
    ScopedEnv dir("CQR_LOG_DIR", temp.path.string());
    ScopedEnv level("CQR_LOG_LEVEL", "info");

    cqr::logger::init_from_env();
    spdlog::info("router test line");
    spdlog::default_logger()->flush();

    std::ifstream ifs(cqr::logger::log_file_path(temp.path.string()));
    ASSERT_TRUE(ifs.is_open());
    std::string line;
    bool found = false;
    while (std::getline(ifs, line)) {
        if (line.find("router test line") != std::string::npos) {
            EXPECT_EQ(line.front(), '{');
            EXPECT_NE(line.find("\"level\":\"info\""), std::string::npos);
            found = true;
        }
    }
    EXPECT_TRUE(found);

    // Release the file sink before the directory is removed.
    cqr::logger::init("info");
}

TEST(LoggerConfigTest, JsonLinesEscapeQuotesAndNewlines) {
    TempDir temp;
    cqr::logger::LogOptions options;
    options.dir = temp.path.string();
    const std::string path = cqr::logger::install(options);
    ASSERT_FALSE(path.empty());

    const std::string question = "Search for \"connection refused\"\nnow \\ tab\there";
    spdlog::info("No route matched question: {}", question);
    spdlog::warn("Tool call failed: {}", std::string("bad byte \xff end"));
    spdlog::default_logger()->flush();

    std::ifstream ifs(path);
    ASSERT_TRUE(ifs.is_open());
    std::vector<nlohmann::json> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        auto parsed = nlohmann::json::parse(line, nullptr, false);
        ASSERT_FALSE(parsed.is_discarded()) << line;
        lines.push_back(parsed);
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["level"], "info");
    EXPECT_EQ(lines[0]["msg"], "No route matched question: " + question);
    EXPECT_EQ(lines[1]["level"], "warning");
    EXPECT_NE(lines[1]["msg"].get<std::string>().find("end"), std::string::npos);

    cqr::logger::init("info");
}
