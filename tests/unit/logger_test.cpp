#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>
#include <string>
#include <vector>

#include "utils/logger.h"

namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir() {
    std::string tmpl = (fs::temp_directory_path() / "paca-logger-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* created = mkdtemp(buf.data());
    return created ? fs::path(created) : fs::temp_directory_path();
}

std::string day_stamp(int days_ago) {
    auto tp = std::chrono::system_clock::now() - std::chrono::hours(24 * days_ago);
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_temp_dir();
        original_logger_ = spdlog::default_logger();
        original_level_ = spdlog::get_level();
        for (const char* key : {"PACA_LOG_DIR", "PACA_LOG_LEVEL", "PACA_LOG_RETENTION_DAYS"}) {
            if (const char* v = std::getenv(key)) saved_.emplace_back(key, v);
            unsetenv(key);
        }
    }

    void TearDown() override {
        // Drop sinks that point at test-owned streams and files.
        spdlog::set_default_logger(original_logger_);
        spdlog::set_level(original_level_);
        unsetenv("PACA_LOG_DIR");
        unsetenv("PACA_LOG_LEVEL");
        unsetenv("PACA_LOG_RETENTION_DAYS");
        for (const auto& kv : saved_) setenv(kv.first.c_str(), kv.second.c_str(), 1);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& name) { std::ofstream(dir_ / name) << "{}\n"; }

    fs::path dir_;
    std::shared_ptr<spdlog::logger> original_logger_;
    spdlog::level::level_enum original_level_{spdlog::level::info};
    std::vector<std::pair<std::string, std::string>> saved_;
};

}  // namespace

TEST_F(LoggerTest, ParseLevelAcceptsAliasesAndDefaultsToInfo) {
    EXPECT_EQ(paca::logger::parse_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(paca::logger::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(paca::logger::parse_level("fatal"), spdlog::level::critical);
    EXPECT_EQ(paca::logger::parse_level("off"), spdlog::level::off);
    EXPECT_EQ(paca::logger::parse_level("verbose"), spdlog::level::info);
}

TEST_F(LoggerTest, LogFileLivesUnderConfiguredDirectory) {
    setenv("PACA_LOG_DIR", dir_.c_str(), 1);
    EXPECT_EQ(paca::logger::get_log_dir(), dir_.string());
    EXPECT_EQ(paca::logger::get_log_file_path(), (dir_ / ("paca.jsonl." + day_stamp(0))).string());
}

TEST_F(LoggerTest, RetentionRejectsOutOfRangeValues) {
    EXPECT_EQ(paca::logger::get_retention_days(), 7);
    setenv("PACA_LOG_RETENTION_DAYS", "30", 1);
    EXPECT_EQ(paca::logger::get_retention_days(), 30);
    setenv("PACA_LOG_RETENTION_DAYS", "0", 1);
    EXPECT_EQ(paca::logger::get_retention_days(), 7);
    setenv("PACA_LOG_RETENTION_DAYS", "weekly", 1);
    EXPECT_EQ(paca::logger::get_retention_days(), 7);
}

TEST_F(LoggerTest, CleanupDropsOnlyExpiredPacaLogs) {
    const std::string expired = "paca.jsonl." + day_stamp(12);
    const std::string fresh = "paca.jsonl." + day_stamp(1);
    const std::string foreign = "downloads.log." + day_stamp(12);
    write(expired);
    write(fresh);
    write(foreign);

    paca::logger::cleanup_old_logs(dir_.string(), 3);

    EXPECT_FALSE(fs::exists(dir_ / expired));
    EXPECT_TRUE(fs::exists(dir_ / fresh));
    EXPECT_TRUE(fs::exists(dir_ / foreign));
}

TEST_F(LoggerTest, CleanupOfMissingDirectoryIsNoop) {
    paca::logger::cleanup_old_logs((dir_ / "nowhere").string(), 3);
    EXPECT_FALSE(fs::exists(dir_ / "nowhere"));
}

TEST_F(LoggerTest, InitRoutesToProvidedSinkAtRequestedLevel) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    paca::logger::init("warn", "%l|%v", "", {sink});

    spdlog::info("Scheduler: hidden");
    spdlog::warn("Scheduler: retrying path='{}'", "a.gguf");
    spdlog::default_logger()->flush();

    const std::string text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("warning|Scheduler: retrying path='a.gguf'"), std::string::npos);
}

TEST_F(LoggerTest, InitFromEnvWritesJsonLinesFile) {
    setenv("PACA_LOG_DIR", dir_.c_str(), 1);
    setenv("PACA_LOG_LEVEL", "info", 1);

    paca::logger::init_from_env();
    spdlog::info("hello");
    spdlog::default_logger()->flush();

    std::ifstream in(paca::logger::get_log_file_path());
    ASSERT_TRUE(in.is_open());
    std::string line;
    bool found = false;
    while (std::getline(in, line)) {
        if (line.find("\"msg\":\"hello\"") == std::string::npos) continue;
        found = true;
        EXPECT_EQ(line.front(), '{');
        EXPECT_NE(line.find("\"level\":\"info\""), std::string::npos);
    }
    EXPECT_TRUE(found);
}
