#include "cli/commands.h"
#include <iostream>

namespace wcache {
namespace cli {
namespace commands {

int url(const ModelOptions& options, CommandContext& ctx) {
    const auto id = resolveModel(ctx, options.model);
    if (!id) return 2;
    std::cout << ctx.catalog->entryFor(*id).remote_url << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace wcache
