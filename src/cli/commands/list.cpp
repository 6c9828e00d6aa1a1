// list: catalog entries with a cached marker

#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include <iomanip>
#include <iostream>

namespace wcache {
namespace cli {
namespace commands {

int list(CommandContext& ctx) {
    const auto cached = ctx.cache->availableModels(*ctx.catalog);

    std::cout << std::left
              << std::setw(24) << "NAME"
              << std::setw(12) << "SIZE"
              << std::setw(12) << "MEMORY"
              << std::setw(8) << "CACHED"
              << std::endl;

    for (const auto& entry : ctx.catalog->all()) {
        std::cout << std::left
                  << std::setw(24) << entry.filename
                  << std::setw(12) << ProgressRenderer::formatBytes(entry.expected_size_bytes)
                  << std::setw(12) << (std::to_string(ctx.catalog->memoryUsageMb(entry)) + " MB")
                  << std::setw(8) << (cached.count(entry.id) ? "yes" : "-")
                  << std::endl;
    }

    std::cout << std::endl << "cache: " << ctx.cache->cacheDir().string() << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace wcache
