#pragma once

#include <optional>
#include <string>

namespace wcache {

/// Subcommand types for the wcache CLI
enum class Subcommand {
    None,
    List,     // list
    Status,   // status <model> [--verify]
    Pull,     // pull <model> [--retries N]
    Verify,   // verify <model>
    Ensure,   // ensure [model] [--no-memory-check]
    Rm,       // rm <model>
    Clean,    // clean
    Url,      // url <model>
    Catalog,  // catalog refresh [--ref REF] [--output FILE]
};

/// Options for commands that take a single model name (verify, rm, url)
struct ModelOptions {
    std::string model;
};

struct StatusOptions {
    std::string model;
    bool verify{false};
};

struct PullOptions {
    std::string model;
    std::optional<int> retries;  // falls back to the configured max_retries
};

struct EnsureOptions {
    std::string model;  // empty: the configured default model
    bool check_memory{true};
};

struct CatalogOptions {
    std::string action;   // only "refresh" for now
    std::string git_ref;  // empty: keep the catalog's ref
    std::string output;   // empty: print to stdout
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (help, version, usage error)
    bool should_exit{false};

    /// 0 after --help/--version, 2 for usage errors
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    ModelOptions model_options;
    StatusOptions status_options;
    PullOptions pull_options;
    EnsureOptions ensure_options;
    CatalogOptions catalog_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace wcache
