#pragma once

#include "download/range_fetcher.h"
#include "utils/cli.h"
#include "utils/config.h"

namespace paca {
namespace cli {
namespace commands {

/// Apply --concurrency / --per-file / --chunk-size on top of the loaded config.
/// The per-file cap never exceeds the global cap.
void applyDownloadOverrides(DownloadConfig& cfg, const DownloadOptions& options);

/// Execute the 'download' command
/// @param options Download options (model, dir, overrides)
/// @param cancel Set from the SIGINT handler
/// @return Exit code (0=success, 1=error, 130=cancelled)
int download(const DownloadOptions& options, const CancellationToken& cancel);

}  // namespace commands
}  // namespace cli
}  // namespace paca
