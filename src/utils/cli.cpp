#include "utils/cli.h"
#include "utils/string_utils.h"
#include "utils/version.h"
#include <sstream>
#include <cstring>
#include <optional>
#include <stdexcept>

namespace paca {

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "paca " << PACA_VERSION << " - resumable model downloader\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    paca <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    download   Download a model from a HuggingFace-compatible hub\n";
    oss << "    version    Print version information\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'paca <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getDownloadHelpMessage() {
    std::ostringstream oss;
    oss << "paca download - Download a model\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    paca download <OWNER/NAME[:QUANT]> [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <OWNER/NAME[:QUANT]>  Model reference (e.g., unsloth/GLM-4.7-Flash-GGUF:Q4_K_M)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --dir <DIR>             Destination directory (default: <models dir>/<owner>/<name>)\n";
    oss << "    --concurrency <N>       Concurrent chunk downloads (default: 8)\n";
    oss << "    --per-file <N>          Concurrent chunks per file (default: 4)\n";
    oss << "    --chunk-size <BYTES>    Chunk size in bytes (default: 33554432)\n";
    oss << "    -h, --help              Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    MODEL_ENDPOINT / HF_ENDPOINT  Registry endpoint (default: https://huggingface.co)\n";
    oss << "    HF_TOKEN                      Access token for gated models\n";
    oss << "    PACA_MODELS_DIR               Models directory (default: ~/.cache/paca)\n";
    oss << "    PACA_CONFIG                   Config file path (default: ~/.paca/config.json)\n";
    oss << "    PACA_DL_CONCURRENCY           Concurrent chunk downloads\n";
    oss << "    PACA_DL_PER_FILE_CONCURRENCY  Concurrent chunks per file\n";
    oss << "    PACA_DL_CHUNK                 Chunk size in bytes\n";
    oss << "    PACA_DL_MAX_RETRIES           Retries per chunk\n";
    oss << "    PACA_DL_BACKOFF_MS            Base retry backoff\n";
    oss << "    PACA_DL_TIMEOUT_MS            Per-request timeout\n";
    oss << "    PACA_DL_MAX_BPS               Bandwidth budget per host (0 = unlimited)\n";
    oss << "    PACA_LOG_LEVEL                Log level (trace|debug|info|warn|error)\n";
    oss << "    PACA_LOG_DIR                  Log directory (default: ~/.paca/logs)\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "paca " << PACA_VERSION << "\n";
    return oss.str();
}

namespace {

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

void usageError(CliResult& result, const std::string& message) {
    result.should_exit = true;
    result.exit_code = kExitUsage;
    result.output = "Error: " + message + "\n\nUsage: paca download <OWNER/NAME[:QUANT]> [OPTIONS]\n";
}

std::optional<uint64_t> parsePositive(const char* text) {
    const std::string value(text);
    if (!isAllDigits(value)) return std::nullopt;
    try {
        uint64_t n = std::stoull(value);
        if (n == 0) return std::nullopt;
        return n;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - show help
    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = kExitUsage;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0 ||
        std::strcmp(command, "version") == 0) {
        result.subcommand = Subcommand::Version;
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "download") == 0) {
        result.subcommand = Subcommand::Download;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getDownloadHelpMessage();
            return result;
        }

        auto& opts = result.download_options;
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "--dir") {
                if (!has_value) {
                    usageError(result, "--dir requires a value");
                    return result;
                }
                opts.dir = argv[++i];
            } else if (arg == "--concurrency" || arg == "--per-file" || arg == "--chunk-size") {
                if (!has_value) {
                    usageError(result, arg + " requires a value");
                    return result;
                }
                auto n = parsePositive(argv[++i]);
                if (!n) {
                    usageError(result, arg + " expects a positive integer, got '" + argv[i] + "'");
                    return result;
                }
                if (arg == "--concurrency") {
                    opts.concurrency = static_cast<size_t>(*n);
                } else if (arg == "--per-file") {
                    opts.per_file = static_cast<size_t>(*n);
                } else {
                    opts.chunk_size = *n;
                }
            } else if (!arg.empty() && arg[0] == '-') {
                usageError(result, "unknown option '" + arg + "'");
                return result;
            } else if (opts.model.empty()) {
                opts.model = arg;
            } else {
                usageError(result, "unexpected argument '" + arg + "'");
                return result;
            }
        }

        if (opts.model.empty()) {
            usageError(result, "model reference required");
        }
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = kExitUsage;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::None: return "none";
        case Subcommand::Download: return "download";
        case Subcommand::Version: return "version";
        default: return "unknown";
    }
}

}  // namespace paca
