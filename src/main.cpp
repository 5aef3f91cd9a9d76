#include <iostream>
#include <signal.h>

#include "cli/commands.h"
#include "download/range_fetcher.h"
#include "utils/cli.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

paca::CancellationToken g_cancel;

void signalHandler(int) {
    g_cancel.cancel();
    // A second Ctrl-C terminates immediately.
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = paca::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    paca::logger::init_from_env();

    // Set up signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    switch (cli_result.subcommand) {
        case paca::Subcommand::Download:
            return paca::cli::commands::download(cli_result.download_options, g_cancel);

        case paca::Subcommand::Version:
            std::cout << paca::getVersionMessage();
            return 0;

        case paca::Subcommand::None:
        default:
            std::cerr << paca::getHelpMessage();
            return paca::kExitUsage;
    }
}
