#pragma once

#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

#include "models/http_transport.h"
#include "models/model_cache.h"
#include "models/model_catalog.h"
#include "utils/config.h"

namespace wcache {
namespace cli {

/// Everything a command needs, built once from the configuration.
struct CommandContext {
    CacheConfig config;
    std::optional<ModelCatalog> catalog;
    std::shared_ptr<HttpTransport> transport;
    std::unique_ptr<ModelCacheManager> cache;
    std::shared_ptr<spdlog::logger> log;
};

/// Built-in catalog, or the catalog file when one is configured. A base_url
/// other than the default re-targets every download URL.
std::optional<ModelCatalog> loadCatalog(const CacheConfig& config, std::string* error = nullptr);

/// Assembles the context. transport defaults to HttplibTransport with the
/// configured timeout. Returns nullopt (and sets error) if the catalog file
/// cannot be used.
std::optional<CommandContext> makeCommandContext(CacheConfig config,
                                                 std::shared_ptr<HttpTransport> transport = nullptr,
                                                 std::shared_ptr<spdlog::logger> log = nullptr,
                                                 std::string* error = nullptr);

/// Resolves a model name or prints an error naming the valid choices.
std::optional<ModelId> resolveModel(const CommandContext& ctx, const std::string& name);

}  // namespace cli
}  // namespace wcache
