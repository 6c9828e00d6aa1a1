#include "utils/cli.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace wcache {

std::string getListHelpMessage();
std::string getStatusHelpMessage();
std::string getPullHelpMessage();
std::string getVerifyHelpMessage();
std::string getEnsureHelpMessage();
std::string getRmHelpMessage();
std::string getCleanHelpMessage();
std::string getUrlHelpMessage();
std::string getCatalogHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "wcache " << WCACHE_VERSION << " - Whisper model cache manager\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    list       List catalog models and what is cached\n";
    oss << "    status     Check whether a model is cached and valid\n";
    oss << "    pull       Download a model into the cache\n";
    oss << "    verify     Verify the SHA-256 of a cached model\n";
    oss << "    ensure     Select a model for this machine and make it ready\n";
    oss << "    rm         Delete a cached model\n";
    oss << "    clean      Remove orphaned partial downloads\n";
    oss << "    url        Print the download URL of a model\n";
    oss << "    catalog    Maintain the model catalog (refresh)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    WCACHE_MODELS_DIR           Cache directory (default: ~/.local/share/wcache/models)\n";
    oss << "    WCACHE_CONFIG               Config file path (default: ~/.wcache/config.json)\n";
    oss << "    WCACHE_CATALOG_FILE         Catalog document overriding the built-in table\n";
    oss << "    WCACHE_DL_MAX_RETRIES       Download retries (default: 2)\n";
    oss << "    WCACHE_DL_BACKOFF_MS        Retry backoff unit in ms (default: 500)\n";
    oss << "    WCACHE_DL_TIMEOUT_MS        HTTP timeout in ms (default: 30000)\n";
    oss << "    WCACHE_MEMORY_BUDGET_RATIO  Share of RAM+swap a model may use (default: 0.75)\n";
    oss << "    WCACHE_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    WCACHE_LOG_DIR              Log directory (default: ~/.wcache/logs)\n";
    oss << "    HF_BASE_URL                 Model host (default: https://huggingface.co)\n";
    oss << "\n";
    oss << "Run 'wcache <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getListHelpMessage() {
    std::ostringstream oss;
    oss << "wcache list - List catalog models\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache list\n";
    oss << "\n";
    oss << "Shows every catalog entry with its size, memory estimate and whether\n";
    oss << "its file is present in the cache (existence only, no hashing).\n";
    return oss.str();
}

std::string getStatusHelpMessage() {
    std::ostringstream oss;
    oss << "wcache status - Check a cached model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache status <MODEL> [--verify]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --verify         Also compare the SHA-256 digest (reads the whole file)\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getPullHelpMessage() {
    std::ostringstream oss;
    oss << "wcache pull - Download a model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache pull <MODEL> [--retries <N>]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <MODEL>          Catalog name (e.g., small, tiny.en, large-v3-turbo-q5_0)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --retries <N>    Extra attempts after a failure (default: WCACHE_DL_MAX_RETRIES)\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getVerifyHelpMessage() {
    std::ostringstream oss;
    oss << "wcache verify - Verify a cached model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache verify <MODEL>\n";
    oss << "\n";
    oss << "Exits with 1 when the file is missing or its size or digest differ.\n";
    return oss.str();
}

std::string getEnsureHelpMessage() {
    std::ostringstream oss;
    oss << "wcache ensure - Make a model ready for use\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache ensure [MODEL] [--no-memory-check]\n";
    oss << "\n";
    oss << "Picks the largest tier up to MODEL (default: WCACHE_MODEL or small) that\n";
    oss << "fits the memory budget, then validates its file. A corrupted file is\n";
    oss << "downloaded again; a missing one is reported (use 'wcache pull').\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --no-memory-check  Use MODEL as given\n";
    oss << "    -h, --help         Print help\n";
    return oss.str();
}

std::string getRmHelpMessage() {
    std::ostringstream oss;
    oss << "wcache rm - Delete a cached model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache rm <MODEL>\n";
    return oss.str();
}

std::string getCleanHelpMessage() {
    std::ostringstream oss;
    oss << "wcache clean - Remove orphaned partial downloads\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache clean\n";
    return oss.str();
}

std::string getUrlHelpMessage() {
    std::ostringstream oss;
    oss << "wcache url - Print the download URL of a model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache url <MODEL>\n";
    return oss.str();
}

std::string getCatalogHelpMessage() {
    std::ostringstream oss;
    oss << "wcache catalog - Maintain the model catalog\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    wcache catalog refresh [--ref <REF>] [--output <FILE>]\n";
    oss << "\n";
    oss << "Reads digests and sizes from the model host's tree listing and writes a\n";
    oss << "catalog document usable as WCACHE_CATALOG_FILE.\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --ref <REF>      Git ref to pin (default: the current catalog's ref)\n";
    oss << "    --output <FILE>  Write to FILE instead of stdout\n";
    oss << "    -h, --help       Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "wcache " << WCACHE_VERSION << "\n";
    return oss.str();
}

namespace {

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

CliResult usageError(CliResult result, const std::string& message, const std::string& usage) {
    result.should_exit = true;
    result.exit_code = 2;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
    return result;
}

CliResult helpResult(CliResult result, const std::string& text) {
    result.should_exit = true;
    result.exit_code = 0;
    result.output = text;
    return result;
}

// First positional argument after the command, rejecting unknown flags.
bool parseSingleModel(int argc, char* argv[], std::string& model, std::string& bad_flag) {
    for (int i = 2; i < argc; ++i) {
        if (argv[i][0] == '-') {
            bad_flag = argv[i];
            return false;
        }
        if (model.empty()) model = argv[i];
    }
    return true;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 2;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        return helpResult(result, getHelpMessage());
    }
    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        return helpResult(result, getVersionMessage());
    }

    if (std::strcmp(command, "list") == 0) {
        result.subcommand = Subcommand::List;
        if (hasHelpFlag(argc, argv, 2)) return helpResult(result, getListHelpMessage());
        if (argc > 2) return usageError(result, std::string("unexpected argument '") + argv[2] + "'", "wcache list");
        return result;
    }

    if (std::strcmp(command, "status") == 0) {
        result.subcommand = Subcommand::Status;
        if (hasHelpFlag(argc, argv, 2)) return helpResult(result, getStatusHelpMessage());
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--verify") == 0) {
                result.status_options.verify = true;
            } else if (argv[i][0] == '-') {
                return usageError(result, std::string("unknown option '") + argv[i] + "'",
                                  "wcache status <MODEL> [--verify]");
            } else if (result.status_options.model.empty()) {
                result.status_options.model = argv[i];
            }
        }
        if (result.status_options.model.empty()) {
            return usageError(result, "model name required", "wcache status <MODEL> [--verify]");
        }
        return result;
    }

    if (std::strcmp(command, "pull") == 0) {
        result.subcommand = Subcommand::Pull;
        if (hasHelpFlag(argc, argv, 2)) return helpResult(result, getPullHelpMessage());
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--retries") == 0) {
                if (i + 1 >= argc) {
                    return usageError(result, "--retries needs a value", "wcache pull <MODEL> [--retries <N>]");
                }
                const std::string value = argv[++i];
                int retries = -1;
                try {
                    size_t pos = 0;
                    retries = std::stoi(value, &pos);
                    if (pos != value.size()) retries = -1;
                } catch (const std::logic_error&) {
                    retries = -1;
                }
                if (retries < 0) {
                    return usageError(result, "invalid --retries value '" + value + "'",
                                      "wcache pull <MODEL> [--retries <N>]");
                }
                result.pull_options.retries = retries;
            } else if (argv[i][0] == '-') {
                return usageError(result, std::string("unknown option '") + argv[i] + "'",
                                  "wcache pull <MODEL> [--retries <N>]");
            } else if (result.pull_options.model.empty()) {
                result.pull_options.model = argv[i];
            }
        }
        if (result.pull_options.model.empty()) {
            return usageError(result, "model name required", "wcache pull <MODEL> [--retries <N>]");
        }
        return result;
    }

    if (std::strcmp(command, "ensure") == 0) {
        result.subcommand = Subcommand::Ensure;
        if (hasHelpFlag(argc, argv, 2)) return helpResult(result, getEnsureHelpMessage());
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--no-memory-check") == 0) {
                result.ensure_options.check_memory = false;
            } else if (argv[i][0] == '-') {
                return usageError(result, std::string("unknown option '") + argv[i] + "'",
                                  "wcache ensure [MODEL] [--no-memory-check]");
            } else if (result.ensure_options.model.empty()) {
                result.ensure_options.model = argv[i];
            }
        }
        return result;
    }

    struct SingleModelCommand {
        const char* name;
        Subcommand subcommand;
        std::string (*help)();
    };
    static const SingleModelCommand kSingleModel[] = {
        {"verify", Subcommand::Verify, getVerifyHelpMessage},
        {"rm", Subcommand::Rm, getRmHelpMessage},
        {"url", Subcommand::Url, getUrlHelpMessage},
    };
    for (const auto& cmd : kSingleModel) {
        if (std::strcmp(command, cmd.name) != 0) continue;
        result.subcommand = cmd.subcommand;
        const std::string usage = std::string("wcache ") + cmd.name + " <MODEL>";
        if (hasHelpFlag(argc, argv, 2)) return helpResult(result, cmd.help());
        std::string bad_flag;
        if (!parseSingleModel(argc, argv, result.model_options.model, bad_flag)) {
            return usageError(result, "unknown option '" + bad_flag + "'", usage);
        }
        if (result.model_options.model.empty()) {
            return usageError(result, "model name required", usage);
        }
        return result;
    }

    if (std::strcmp(command, "clean") == 0) {
        result.subcommand = Subcommand::Clean;
        if (hasHelpFlag(argc, argv, 2)) return helpResult(result, getCleanHelpMessage());
        if (argc > 2) return usageError(result, std::string("unexpected argument '") + argv[2] + "'", "wcache clean");
        return result;
    }

    if (std::strcmp(command, "catalog") == 0) {
        result.subcommand = Subcommand::Catalog;
        const std::string usage = "wcache catalog refresh [--ref <REF>] [--output <FILE>]";
        if (hasHelpFlag(argc, argv, 2)) return helpResult(result, getCatalogHelpMessage());
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--ref") == 0 || std::strcmp(argv[i], "--output") == 0) {
                if (i + 1 >= argc) {
                    return usageError(result, std::string(argv[i]) + " needs a value", usage);
                }
                auto& slot = std::strcmp(argv[i], "--ref") == 0 ? result.catalog_options.git_ref
                                                                 : result.catalog_options.output;
                slot = argv[++i];
            } else if (argv[i][0] == '-') {
                return usageError(result, std::string("unknown option '") + argv[i] + "'", usage);
            } else if (result.catalog_options.action.empty()) {
                result.catalog_options.action = argv[i];
            }
        }
        if (result.catalog_options.action != "refresh") {
            return usageError(result,
                              result.catalog_options.action.empty()
                                  ? std::string("catalog action required")
                                  : "unknown catalog action '" + result.catalog_options.action + "'",
                              usage);
        }
        return result;
    }

    result.should_exit = true;
    result.exit_code = 2;
    std::ostringstream oss;
    oss << (command[0] == '-' ? "Unknown option: " : "Unknown command: ") << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::List: return "list";
        case Subcommand::Status: return "status";
        case Subcommand::Pull: return "pull";
        case Subcommand::Verify: return "verify";
        case Subcommand::Ensure: return "ensure";
        case Subcommand::Rm: return "rm";
        case Subcommand::Clean: return "clean";
        case Subcommand::Url: return "url";
        case Subcommand::Catalog: return "catalog";
        default: return "unknown";
    }
}

}  // namespace wcache
