// ensure: memory-aware selection + validation of the active model

#include "cli/commands.h"
#include "core/engine_bootstrap.h"
#include <iostream>

namespace wcache {
namespace cli {
namespace commands {

int ensure(const EnsureOptions& options, CommandContext& ctx) {
    const std::string name = options.model.empty() ? ctx.config.default_model : options.model;
    const auto id = resolveModel(ctx, name);
    if (!id) return 2;

    EngineBootstrap bootstrap(*ctx.cache, *ctx.catalog, sampleSystemMemory, ctx.config.memory_budget_ratio,
                              2, ctx.log);
    auto result = bootstrap.ensureReady(*id, options.check_memory);
    if (!result.ok()) {
        std::cerr << "Error: " << userMessage(result.error) << std::endl;
        return 1;
    }

    const auto& active = *result.data;
    if (active.downgraded) {
        std::cerr << "note: " << toString(active.requested) << " does not fit in memory, using "
                  << active.entry.filename << std::endl;
    }
    std::cout << active.entry.filename << " ready: " << active.path.string() << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace wcache
