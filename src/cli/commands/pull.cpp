// pull: explicit download with retry and a progress line

#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include <iostream>

namespace wcache {
namespace cli {
namespace commands {

int pull(const PullOptions& options, CommandContext& ctx) {
    const auto id = resolveModel(ctx, options.model);
    if (!id) return 2;

    const auto& entry = ctx.catalog->entryFor(*id);
    const int retries = options.retries ? *options.retries : ctx.config.max_retries;

    ProgressRenderer progress(entry.expected_size_bytes);
    progress.setPhase("pulling " + entry.filename);

    auto result = ctx.cache->downloadModelWithRetry(
        entry, static_cast<uint32_t>(retries),
        [&progress](uint64_t downloaded, uint64_t /* total */) { progress.update(downloaded); });

    if (!result.ok()) {
        progress.fail(to_string(result.error.kind));
        std::cerr << "Error: " << userMessage(result.error) << std::endl;
        return 1;
    }

    progress.complete();
    std::cout << result.data->string() << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace wcache
