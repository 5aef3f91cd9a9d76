// paca download command
// Resolves a reference and downloads its files with progress output

#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include "download/model_downloader.h"
#include <iostream>
#include <algorithm>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace paca {
namespace cli {
namespace commands {

void applyDownloadOverrides(DownloadConfig& cfg, const DownloadOptions& options) {
    if (options.concurrency) cfg.max_concurrency = *options.concurrency;
    if (options.per_file) cfg.max_per_file_concurrency = *options.per_file;
    if (options.chunk_size) cfg.chunk_size = *options.chunk_size;
    cfg.max_per_file_concurrency = std::min(cfg.max_per_file_concurrency, cfg.max_concurrency);
}

int download(const DownloadOptions& options, const CancellationToken& cancel) {
    auto [cfg, log] = loadDownloadConfigWithLog();
    applyDownloadOverrides(cfg, options);
    spdlog::info("config: {}", log);

    MultiProgressRenderer renderer(std::cerr, ::isatty(STDERR_FILENO) == 1);
    ModelDownloader downloader(cfg);
    auto outcome = downloader.download(options.model, options.dir, cancel,
                                       [&renderer](const ProgressEvent& ev) { renderer.onEvent(ev); });

    if (outcome.error.code == DownloadErrorCode::kCancelled || outcome.result.cancelled()) {
        renderer.onDone("cancelled");
        std::cerr << "Download cancelled; run the same command again to resume." << std::endl;
        return kExitCancelled;
    }
    if (!outcome.ok()) {
        renderer.onDone("failed");
        std::cerr << "Error: " << outcome.error.describe() << std::endl;
        if (outcome.error.code == DownloadErrorCode::kUnauthorized && cfg.token.empty()) {
            std::cerr << "This model requires authentication. Set HF_TOKEN environment variable." << std::endl;
        }
        return 1;
    }
    renderer.onDone("ok");
    for (const auto& path : outcome.finalPaths()) {
        std::cout << path.string() << std::endl;
    }
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace paca
