// rm / clean: cache housekeeping

#include "cli/commands.h"
#include <iostream>

namespace wcache {
namespace cli {
namespace commands {

int rm(const ModelOptions& options, CommandContext& ctx) {
    const auto id = resolveModel(ctx, options.model);
    if (!id) return 2;

    auto result = ctx.cache->removeModel(ctx.catalog->entryFor(*id));
    if (!result.ok()) {
        std::cerr << "Error: " << userMessage(result.error) << std::endl;
        return 1;
    }
    if (!*result.data) {
        std::cerr << "Error: '" << options.model << "' is not cached" << std::endl;
        return 1;
    }
    std::cout << "deleted '" << options.model << "'" << std::endl;
    return 0;
}

int clean(CommandContext& ctx) {
    const size_t removed = ctx.cache->cleanupTempFiles();
    std::cout << "removed " << removed << " orphaned temp file" << (removed == 1 ? "" : "s") << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace wcache
