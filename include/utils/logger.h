// logger.h - spdlog setup for the wcache tool and library
#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <vector>

namespace wcache::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory (WCACHE_LOG_DIR, default ~/.wcache/logs).
std::string get_log_dir();

// Today's log file path (wcache.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// Retention days from WCACHE_LOG_RETENTION_DAYS (default: 7).
int get_retention_days();

// Remove wcache.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize the default logger. additional_sinks is mainly for tests
// (e.g. an ostream sink).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize from environment:
// WCACHE_LOG_DIR, WCACHE_LOG_LEVEL (trace|debug|info|warn|error|critical|off),
// WCACHE_LOG_RETENTION_DAYS.
// console=false drops the stderr sink (used by commands that print tables).
void init_from_env(bool console = true);

// Logger handed to components that were not given one explicitly.
std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> log);

}  // namespace wcache::logger
