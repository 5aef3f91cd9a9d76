#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace paca {

/// Subcommand types for paca CLI
enum class Subcommand {
    None,      // No subcommand (prints help)
    Download,  // download <model>
    Version,   // version
};

/// Options for download command
struct DownloadOptions {
    std::string model;
    std::string dir;                         // --dir (default: <models_dir>/<owner>/<name>)
    std::optional<size_t> concurrency;       // --concurrency
    std::optional<size_t> per_file;          // --per-file
    std::optional<uint64_t> chunk_size;      // --chunk-size (bytes)
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or a usage error)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed subcommand
    Subcommand subcommand{Subcommand::None};

    /// Options for download command
    DownloadOptions download_options;
};

/// Exit code for usage errors
constexpr int kExitUsage = 2;
/// Exit code after SIGINT cancellation
constexpr int kExitCancelled = 130;

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the help message for the download command
std::string getDownloadHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace paca
