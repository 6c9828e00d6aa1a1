// catalog refresh: regenerate digests and sizes from the model host

#include "cli/commands.h"
#include "models/catalog_updater.h"
#include <fstream>
#include <iostream>

namespace wcache {
namespace cli {
namespace commands {

int catalog(const CatalogOptions& options, CommandContext& ctx) {
    RemoteSource source = ctx.catalog->source();
    if (!options.git_ref.empty()) {
        source.git_ref = options.git_ref;
    }

    CatalogUpdater updater(ctx.transport, ctx.log);
    auto result = updater.refresh(source, *ctx.catalog);
    if (!result.ok()) {
        std::cerr << "Error: catalog refresh failed: " << result.error.message << std::endl;
        return 1;
    }

    const std::string text = result.data->dump(2) + "\n";
    if (options.output.empty()) {
        std::cout << text;
        return 0;
    }

    std::ofstream ofs(options.output, std::ios::binary | std::ios::trunc);
    ofs << text;
    ofs.close();
    if (!ofs) {
        std::cerr << "Error: cannot write " << options.output << std::endl;
        return 1;
    }
    std::cerr << "wrote " << (*result.data)["models"].size() << " models to " << options.output << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace wcache
