#include <iostream>
#include <string>

#include "cli/command_context.h"
#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"

int main(int argc, char* argv[]) {
    auto cli_result = wcache::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    // Console logging only on request; command output owns the terminal.
    wcache::logger::init_from_env(wcache::getEnvValue("WCACHE_LOG_LEVEL").has_value());

    auto [config, config_log] = wcache::loadCacheConfigWithLog();
    spdlog::info("wcache {} config: {}", wcache::subcommandToString(cli_result.subcommand), config_log);

    std::string error;
    auto ctx = wcache::cli::makeCommandContext(std::move(config), nullptr, nullptr, &error);
    if (!ctx) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    namespace commands = wcache::cli::commands;
    switch (cli_result.subcommand) {
        case wcache::Subcommand::List:
            return commands::list(*ctx);
        case wcache::Subcommand::Status:
            return commands::status(cli_result.status_options, *ctx);
        case wcache::Subcommand::Pull:
            return commands::pull(cli_result.pull_options, *ctx);
        case wcache::Subcommand::Verify:
            return commands::verify(cli_result.model_options, *ctx);
        case wcache::Subcommand::Ensure:
            return commands::ensure(cli_result.ensure_options, *ctx);
        case wcache::Subcommand::Rm:
            return commands::rm(cli_result.model_options, *ctx);
        case wcache::Subcommand::Clean:
            return commands::clean(*ctx);
        case wcache::Subcommand::Url:
            return commands::url(cli_result.model_options, *ctx);
        case wcache::Subcommand::Catalog:
            return commands::catalog(cli_result.catalog_options, *ctx);
        case wcache::Subcommand::None:
        default:
            std::cerr << wcache::getHelpMessage();
            return 2;
    }
}
