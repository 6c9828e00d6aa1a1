// status / verify: two-tier validity check of one cached model

#include "cli/commands.h"
#include <filesystem>
#include <iostream>

namespace wcache {
namespace cli {
namespace commands {

namespace {

int checkModel(CommandContext& ctx, ModelId id, bool verify_hash) {
    const auto& entry = ctx.catalog->entryFor(id);
    const auto path = ctx.cache->modelPath(entry);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        CacheError err;
        err.kind = CacheErrorKind::ModelNotFound;
        err.model = id;
        std::cout << entry.filename << ": missing (" << path.string() << ")" << std::endl;
        std::cerr << userMessage(err) << std::endl;
        return 1;
    }

    if (ctx.cache->isAvailable(entry, verify_hash)) {
        std::cout << entry.filename << ": " << (verify_hash ? "valid" : "present, size ok")
                  << " (" << path.string() << ")" << std::endl;
        return 0;
    }

    CacheError err;
    err.kind = CacheErrorKind::Corruption;
    err.model = id;
    std::cout << entry.filename << ": invalid (" << path.string() << ")" << std::endl;
    std::cerr << userMessage(err) << std::endl;
    return 1;
}

}  // namespace

int status(const StatusOptions& options, CommandContext& ctx) {
    const auto id = resolveModel(ctx, options.model);
    if (!id) return 2;
    return checkModel(ctx, *id, options.verify);
}

int verify(const ModelOptions& options, CommandContext& ctx) {
    const auto id = resolveModel(ctx, options.model);
    if (!id) return 2;
    return checkModel(ctx, *id, true);
}

}  // namespace commands
}  // namespace cli
}  // namespace wcache
