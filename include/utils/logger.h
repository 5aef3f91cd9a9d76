// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace paca::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory ($PACA_LOG_DIR, default ~/.paca/logs).
std::string get_log_dir();

// Today's log file path (paca.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// Retention days from PACA_LOG_RETENTION_DAYS (default: 7).
int get_retention_days();

// Remove paca.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize the default logger. additional_sinks is mainly for tests.
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize from PACA_LOG_DIR / PACA_LOG_LEVEL / PACA_LOG_RETENTION_DAYS.
// Console output goes to stderr so stdout stays clean for printed paths.
void init_from_env();

}  // namespace paca::logger
