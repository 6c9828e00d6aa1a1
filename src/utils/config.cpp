#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#ifdef _WIN32
#include <windows.h>
#endif
#include "utils/file_lock.h"

namespace wcache {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
#ifdef _WIN32
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    DWORD size = GetEnvironmentVariableA(name, nullptr, 0);
    if (size == 0) {
        return std::nullopt;
    }
    std::string value(size, '\0');
    DWORD copied = GetEnvironmentVariableA(name, value.data(), size);
    value.resize(copied);
    return value;
#else
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
#endif
}

namespace {

std::filesystem::path homeDir() {
    if (auto home = getEnvValue("HOME")) {
        if (!home->empty()) return *home;
    }
    if (auto profile = getEnvValue("USERPROFILE")) {
        if (!profile->empty()) return *profile;
    }
    return {};
}

bool validRatio(double v) {
    return v > 0.0 && v <= 1.0;
}

}  // namespace

std::string defaultModelsDir() {
#ifdef _WIN32
    if (auto local = getEnvValue("LOCALAPPDATA")) {
        if (!local->empty()) return (std::filesystem::path(*local) / "wcache" / "models").string();
    }
#else
    if (auto xdg = getEnvValue("XDG_DATA_HOME")) {
        if (!xdg->empty()) return (std::filesystem::path(*xdg) / "wcache" / "models").string();
    }
#endif
    const auto home = homeDir();
    if (!home.empty()) {
        return (home / ".local" / "share" / "wcache" / "models").string();
    }
    // No home directory (e.g. a stripped service environment).
    return (std::filesystem::current_path() / "models").string();
}

std::filesystem::path defaultConfigPath() {
    if (auto env = getEnvValue("WCACHE_CONFIG")) {
        return *env;
    }
    const auto home = homeDir();
    if (home.empty()) return {};
    return home / ".wcache" / "config.json";
}

CacheConfig loadCacheConfig() {
    return loadCacheConfigWithLog().first;
}

std::pair<CacheConfig, std::string> loadCacheConfigWithLog() {
    CacheConfig cfg;
    cfg.models_dir = defaultModelsDir();
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    auto load_from_file = [&](const std::filesystem::path& path) {
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec)) return false;
#ifndef _WIN32
        FileLock lock(path);
#endif
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;

        nlohmann::json j;
        try {
            ifs >> j;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Ignoring config file {}: {}", path.string(), e.what());
            return false;
        }
        if (!j.is_object()) {
            spdlog::warn("Ignoring config file {}: top level is not an object", path.string());
            return false;
        }

        try {
            if (j.contains("models_dir")) cfg.models_dir = j.value("models_dir", cfg.models_dir);
            if (j.contains("max_retries")) {
                const int v = j.value("max_retries", cfg.max_retries);
                if (v >= 0) cfg.max_retries = v;
            }
            if (j.contains("backoff_ms")) {
                const long long v = j.value("backoff_ms", static_cast<long long>(cfg.backoff.count()));
                if (v >= 0) cfg.backoff = std::chrono::milliseconds(v);
            }
            if (j.contains("timeout_ms")) {
                const long long v = j.value("timeout_ms", static_cast<long long>(cfg.timeout.count()));
                if (v > 0) cfg.timeout = std::chrono::milliseconds(v);
            }
            if (j.contains("memory_budget_ratio")) {
                const double v = j.value("memory_budget_ratio", cfg.memory_budget_ratio);
                if (validRatio(v)) {
                    cfg.memory_budget_ratio = v;
                } else {
                    spdlog::warn("Config memory_budget_ratio={} out of range (0,1], keeping {}", v,
                                 cfg.memory_budget_ratio);
                }
            }
            if (j.contains("default_model")) cfg.default_model = j.value("default_model", cfg.default_model);
            if (j.contains("catalog_file")) cfg.catalog_file = j.value("catalog_file", cfg.catalog_file);
            if (j.contains("base_url")) cfg.base_url = j.value("base_url", cfg.base_url);
        } catch (const nlohmann::json::type_error& e) {
            spdlog::warn("Config file {} has a field of the wrong type: {}", path.string(), e.what());
        }
        log << "file=" << path.string() << " ";
        return true;
    };

    used_file = load_from_file(defaultConfigPath());

    if (auto env = getEnvValue("WCACHE_MODELS_DIR")) {
        if (!env->empty()) {
            cfg.models_dir = *env;
            log << "env:MODELS_DIR=" << *env << " ";
            used_env = true;
        }
    }

    if (auto env = getEnvValue("WCACHE_DL_MAX_RETRIES")) {
        try {
            int v = std::stoi(*env);
            if (v >= 0) cfg.max_retries = v;
            log << "env:MAX_RETRIES=" << v << " ";
            used_env = true;
        } catch (const std::logic_error&) {
            spdlog::warn("Ignoring WCACHE_DL_MAX_RETRIES='{}': not a number", *env);
        }
    }

    if (auto env = getEnvValue("WCACHE_DL_BACKOFF_MS")) {
        try {
            long long ms = std::stoll(*env);
            if (ms >= 0) cfg.backoff = std::chrono::milliseconds(ms);
            log << "env:BACKOFF_MS=" << ms << " ";
            used_env = true;
        } catch (const std::logic_error&) {
            spdlog::warn("Ignoring WCACHE_DL_BACKOFF_MS='{}': not a number", *env);
        }
    }

    if (auto env = getEnvValue("WCACHE_DL_TIMEOUT_MS")) {
        try {
            long long ms = std::stoll(*env);
            if (ms > 0) cfg.timeout = std::chrono::milliseconds(ms);
            log << "env:TIMEOUT_MS=" << ms << " ";
            used_env = true;
        } catch (const std::logic_error&) {
            spdlog::warn("Ignoring WCACHE_DL_TIMEOUT_MS='{}': not a number", *env);
        }
    }

    if (auto env = getEnvValue("WCACHE_MEMORY_BUDGET_RATIO")) {
        try {
            double v = std::stod(*env);
            if (validRatio(v)) {
                cfg.memory_budget_ratio = v;
                log << "env:MEMORY_BUDGET_RATIO=" << v << " ";
                used_env = true;
            } else {
                spdlog::warn("Ignoring WCACHE_MEMORY_BUDGET_RATIO={}: out of range (0,1]", v);
            }
        } catch (const std::logic_error&) {
            spdlog::warn("Ignoring WCACHE_MEMORY_BUDGET_RATIO='{}': not a number", *env);
        }
    }

    if (auto env = getEnvValue("WCACHE_MODEL")) {
        if (!env->empty()) {
            cfg.default_model = *env;
            log << "env:MODEL=" << *env << " ";
            used_env = true;
        }
    }

    if (auto env = getEnvValue("WCACHE_CATALOG_FILE")) {
        cfg.catalog_file = *env;
        log << "env:CATALOG_FILE=" << *env << " ";
        used_env = true;
    }

    if (auto env = getEnvValue("HF_BASE_URL")) {
        if (!env->empty()) {
            std::string base = *env;
            while (!base.empty() && base.back() == '/') base.pop_back();
            cfg.base_url = base;
            log << "env:HF_BASE_URL=" << base << " ";
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

}  // namespace wcache
