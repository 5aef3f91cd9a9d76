#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <ostream>
#include <unordered_map>
#include <vector>

#include "download/progress_aggregator.h"

namespace paca {
namespace cli {

/// Multi-line progress display for one download run (one line per file plus a
/// header). Fed from the progress aggregator thread only.
class MultiProgressRenderer {
public:
    /// @param out Stream to render to (stderr in the CLI)
    /// @param interactive Redraw in place with ANSI cursor movement; otherwise
    ///        only file-level events are printed, one line each
    explicit MultiProgressRenderer(std::ostream& out, bool interactive = true);

    void onEvent(const ProgressEvent& event);
    void onDone(const std::string& status);

    /// Format bytes as human-readable string (e.g., "6.4 GB", "128 MB")
    static std::string formatBytes(uint64_t bytes);

    /// Progress bar without percent label (e.g., "[======>   ]")
    static std::string formatProgressBarBare(uint64_t downloaded_bytes, uint64_t total_bytes, int width = 20);

    /// Format duration as human-readable string (e.g., "2m 30s", "45s")
    static std::string formatDuration(double seconds);

private:
    struct FileState {
        uint64_t completed{0};
        uint64_t total{0};
        std::chrono::steady_clock::time_point started;
        std::string status{"Waiting"};
        bool done{false};
    };

    std::ostream& out_;
    bool interactive_;
    uint64_t aggregate_written_{0};
    uint64_t aggregate_total_{0};
    size_t lines_rendered_{0};
    size_t spinner_index_{0};
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_render_;
    std::unordered_map<std::string, FileState> files_;
    std::vector<std::string> order_;
    std::vector<std::string> notices_;
    std::string final_status_;

    FileState& fileState(const std::string& file);
    void render(bool force);
    std::string shortenFileLabel(const std::string& file) const;
    void renderLines(const std::vector<std::string>& lines);
    std::string spinnerFrame() const;
};

}  // namespace cli
}  // namespace paca
