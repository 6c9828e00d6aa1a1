#include "utils/logger.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace wcache::logger {

namespace {
    inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
        if (localtime_s(result, time) == 0) {
            return result;
        }
        return nullptr;
#else
        return localtime_r(time, result);
#endif
    }

    constexpr const char* LOG_FILE_BASE = "wcache.jsonl";
    constexpr const char* DEFAULT_DATA_DIR = ".wcache";
    constexpr const char* LOG_SUBDIR = "logs";
    constexpr int DEFAULT_RETENTION_DAYS = 7;

    constexpr const char* LOG_DIR_ENV = "WCACHE_LOG_DIR";
    constexpr const char* LOG_LEVEL_ENV = "WCACHE_LOG_LEVEL";
    constexpr const char* LOG_RETENTION_DAYS_ENV = "WCACHE_LOG_RETENTION_DAYS";

    std::string format_date(std::chrono::system_clock::time_point tp) {
        auto time_t_value = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_value{};
        safe_localtime(&time_t_value, &tm_value);
        std::ostringstream oss;
        oss << std::put_time(&tm_value, "%Y-%m-%d");
        return oss.str();
    }

    std::string get_home_dir() {
        if (const char* home = std::getenv("HOME")) {
            return home;
        }
        if (const char* userprofile = std::getenv("USERPROFILE")) {
            return userprofile;
        }
        return "/tmp";
    }
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(LOG_DIR_ENV)) {
        return env;
    }
    return (fs::path(get_home_dir()) / DEFAULT_DATA_DIR / LOG_SUBDIR).string();
}

std::string get_log_file_path() {
    std::string filename = std::string(LOG_FILE_BASE) + "." + format_date(std::chrono::system_clock::now());
    return (fs::path(get_log_dir()) / filename).string();
}

int get_retention_days() {
    if (const char* env = std::getenv(LOG_RETENTION_DAYS_ENV)) {
        try {
            int days = std::stoi(env);
            if (days > 0 && days < 365) {
                return days;
            }
        } catch (const std::logic_error&) {
            // not a number, keep the default
        }
    }
    return DEFAULT_RETENTION_DAYS;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::exists(log_dir, ec)) {
        return;
    }

    const std::string cutoff_str =
        format_date(std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days));
    const std::string prefix = std::string(LOG_FILE_BASE) + ".";

    for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
        if (!entry.is_regular_file()) continue;

        std::string filename = entry.path().filename().string();
        if (filename.rfind(prefix, 0) != 0) continue;

        std::string date_part = filename.substr(prefix.length());
        if (date_part < cutoff_str) {
            std::error_code rm_ec;
            fs::remove(entry.path(), rm_ec);
        }
    }
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (!file_path.empty() && sinks.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("wcache", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env(bool console) {
    std::string level = "info";
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        level = env;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (console) {
        // stderr keeps stdout free for command output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
        sinks.push_back(console_sink);
    }

    std::string log_path;
    std::string file_error;
    const std::string log_dir = get_log_dir();
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (!ec) {
        cleanup_old_logs(log_dir, get_retention_days());
        log_path = get_log_file_path();
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
            file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            log_path.clear();
            file_error = e.what();
        }
    }

    if (sinks.empty()) {
        // Nowhere writable; keep a console sink so warnings are not lost.
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    // Per-sink patterns stay as set above.
    init(level, "", "", sinks);

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled: {}", file_error);
    }
    if (!log_path.empty()) {
        spdlog::debug("Logs initialized: {}", log_path);
    }
}

std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> log) {
    if (log) return log;
    return spdlog::default_logger();
}

}  // namespace wcache::logger
