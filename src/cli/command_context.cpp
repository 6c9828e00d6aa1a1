#include "cli/command_context.h"

#include <iostream>
#include <nlohmann/json.hpp>

#include "utils/logger.h"

namespace wcache {
namespace cli {

std::optional<ModelCatalog> loadCatalog(const CacheConfig& config, std::string* error) {
    const bool custom_base = config.base_url != ModelCatalog::defaultSource().base_url;

    if (config.catalog_file.empty()) {
        if (!custom_base) return ModelCatalog::builtin();
        return ModelCatalog::fromJson(nlohmann::json{{"base_url", config.base_url}}, error);
    }

    std::optional<std::string> base_override;
    if (custom_base) base_override = config.base_url;
    return ModelCatalog::fromFile(config.catalog_file, error, base_override);
}

std::optional<CommandContext> makeCommandContext(CacheConfig config,
                                                 std::shared_ptr<HttpTransport> transport,
                                                 std::shared_ptr<spdlog::logger> log,
                                                 std::string* error) {
    auto catalog = loadCatalog(config, error);
    if (!catalog) return std::nullopt;

    CommandContext ctx;
    ctx.log = logger::or_default(std::move(log));
    ctx.transport = transport ? std::move(transport) : std::make_shared<HttplibTransport>(config.timeout);
    ctx.cache = std::make_unique<ModelCacheManager>(config.models_dir, ctx.transport, ctx.log);
    ctx.cache->setBackoff(config.backoff);
    ctx.catalog = std::move(catalog);
    ctx.config = std::move(config);
    return ctx;
}

std::optional<ModelId> resolveModel(const CommandContext& ctx, const std::string& name) {
    if (auto id = ctx.catalog->idFromName(name)) {
        return id;
    }
    std::cerr << "Error: unknown model '" << name << "'" << std::endl;
    std::cerr << "Known models:";
    for (const auto& entry : ctx.catalog->all()) {
        std::cerr << " " << entry.filename;
    }
    std::cerr << std::endl;
    return std::nullopt;
}

}  // namespace cli
}  // namespace wcache
