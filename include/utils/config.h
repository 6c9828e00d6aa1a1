#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace wcache {

struct CacheConfig {
    std::string models_dir;
    int max_retries{2};
    std::chrono::milliseconds backoff{500};
    std::chrono::milliseconds timeout{30000};
    double memory_budget_ratio{0.75};
    std::string default_model{"small"};
    std::string catalog_file;
    std::string base_url{"https://huggingface.co"};
};

// Platform data directory for cached models:
// $XDG_DATA_HOME/wcache/models, else ~/.local/share/wcache/models
// (%LOCALAPPDATA%\wcache\models on Windows).
std::string defaultModelsDir();

// Config file path: WCACHE_CONFIG, else ~/.wcache/config.json.
std::filesystem::path defaultConfigPath();

// Environment > JSON config file > defaults.
CacheConfig loadCacheConfig();

// Same as loadCacheConfig(); the second element describes which sources
// contributed (e.g. "file=... env:MAX_RETRIES=3 |sources=env,file").
std::pair<CacheConfig, std::string> loadCacheConfigWithLog();

std::optional<std::string> getEnvValue(const char* name);

}  // namespace wcache
