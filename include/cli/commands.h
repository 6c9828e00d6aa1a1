#pragma once

#include "cli/command_context.h"
#include "utils/cli.h"

namespace wcache {
namespace cli {
namespace commands {

/// Execute the 'list' command
/// @return Exit code (0=success)
int list(CommandContext& ctx);

/// Execute the 'status' command
/// @return Exit code (0=available, 1=missing or invalid, 2=usage error)
int status(const StatusOptions& options, CommandContext& ctx);

/// Execute the 'pull' command
/// @return Exit code (0=success, 1=download failed, 2=usage error)
int pull(const PullOptions& options, CommandContext& ctx);

/// Execute the 'verify' command
/// @return Exit code (0=valid, 1=missing or corrupted, 2=usage error)
int verify(const ModelOptions& options, CommandContext& ctx);

/// Execute the 'ensure' command
/// @return Exit code (0=ready, 1=failed, 2=usage error)
int ensure(const EnsureOptions& options, CommandContext& ctx);

/// Execute the 'rm' command
/// @return Exit code (0=removed, 1=not cached or error, 2=usage error)
int rm(const ModelOptions& options, CommandContext& ctx);

/// Execute the 'clean' command
int clean(CommandContext& ctx);

/// Execute the 'url' command
int url(const ModelOptions& options, CommandContext& ctx);

/// Execute the 'catalog refresh' command
int catalog(const CatalogOptions& options, CommandContext& ctx);

}  // namespace commands
}  // namespace cli
}  // namespace wcache
