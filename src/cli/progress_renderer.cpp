#include "cli/progress_renderer.h"
#include <iomanip>
#include <sstream>
#include <cmath>
#include <algorithm>

namespace paca {
namespace cli {

namespace {
constexpr auto kRenderInterval = std::chrono::milliseconds(100);
}

MultiProgressRenderer::MultiProgressRenderer(std::ostream& out, bool interactive)
    : out_(out), interactive_(interactive), start_time_(std::chrono::steady_clock::now()) {}

MultiProgressRenderer::FileState& MultiProgressRenderer::fileState(const std::string& file) {
    auto it = files_.find(file);
    if (it != files_.end()) return it->second;
    FileState state;
    state.started = std::chrono::steady_clock::now();
    order_.push_back(file);
    return files_.emplace(file, state).first->second;
}

void MultiProgressRenderer::onEvent(const ProgressEvent& event) {
    aggregate_written_ = event.aggregate_written;
    aggregate_total_ = event.aggregate_total;

    if (event.file.empty()) {
        if (!event.message.empty()) {
            notices_.push_back(event.message);
            if (!interactive_) out_ << "note: " << event.message << "\n";
        }
        render(true);
        return;
    }

    auto& state = fileState(event.file);
    state.completed = event.bytes_written;
    state.total = event.total_bytes;
    bool force = false;
    switch (event.kind) {
        case ProgressKind::kFileStarted:
        case ProgressKind::kProgress:
            if (!state.done) state.status = "Downloading";
            break;
        case ProgressKind::kFileVerifying:
            state.status = "Verifying";
            force = true;
            break;
        case ProgressKind::kFileCompleted:
            state.status = "Complete";
            state.done = true;
            force = true;
            if (!interactive_) out_ << event.file << ": complete\n";
            break;
        case ProgressKind::kFileFailed:
            state.status = "Failed";
            state.done = true;
            force = true;
            notices_.push_back(event.file + ": " + event.message);
            if (!interactive_) out_ << event.file << ": failed: " << event.message << "\n";
            break;
        case ProgressKind::kNotice:
            if (!event.message.empty()) {
                notices_.push_back(event.file + ": " + event.message);
                if (!interactive_) out_ << "note: " << event.file << ": " << event.message << "\n";
            }
            force = true;
            break;
    }
    render(force);
}

void MultiProgressRenderer::onDone(const std::string& status) {
    final_status_ = status;
    render(true);
    if (interactive_) out_ << std::endl;
}

void MultiProgressRenderer::render(bool force) {
    if (!interactive_) return;
    auto now = std::chrono::steady_clock::now();
    if (!force && now - last_render_ < kRenderInterval) return;
    last_render_ = now;

    std::vector<std::string> lines;
    size_t done = 0;
    for (const auto& entry : files_) {
        if (entry.second.done) ++done;
    }
    const size_t total = files_.size();
    {
        std::ostringstream oss;
        oss << "[+] Downloading " << done << "/" << total << "  " << formatBytes(aggregate_written_) << "/"
            << formatBytes(aggregate_total_);
        lines.push_back(oss.str());
    }

    for (const auto& file : order_) {
        const auto& state = files_.at(file);
        std::ostringstream oss;
        const std::string icon = state.done ? (state.status == "Failed" ? "✘" : "✔") : spinnerFrame();
        oss << " " << icon << " " << shortenFileLabel(file) << " ";
        oss << std::left << std::setw(12) << state.status;
        if (!state.done && state.total > 0) {
            oss << " " << formatProgressBarBare(state.completed, state.total, 40);
            oss << "  " << formatBytes(state.completed) << "/" << formatBytes(state.total);
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - state.started).count();
        oss << " " << formatDuration(elapsed);
        lines.push_back(oss.str());
    }

    // Only the latest notices stay on screen.
    const size_t shown = std::min<size_t>(notices_.size(), 3);
    for (size_t i = notices_.size() - shown; i < notices_.size(); ++i) {
        lines.push_back("    " + notices_[i]);
    }

    if (!final_status_.empty() && final_status_ != "ok") {
        lines.push_back("Status: " + final_status_);
    }

    renderLines(lines);
    spinner_index_++;
}

std::string MultiProgressRenderer::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << static_cast<uint64_t>(size) << " " << units[unit_index];
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }
    return oss.str();
}

std::string MultiProgressRenderer::formatProgressBarBare(uint64_t downloaded_bytes, uint64_t total_bytes, int width) {
    if (total_bytes == 0) {
        return "";
    }

    double progress = static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes);
    int filled = static_cast<int>(progress * width);

    std::ostringstream oss;
    oss << "[";
    for (int i = 0; i < width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }
    oss << "]";
    return oss.str();
}

std::string MultiProgressRenderer::formatDuration(double seconds) {
    std::ostringstream oss;

    if (seconds < 60) {
        oss << static_cast<int>(std::ceil(seconds)) << "s";
    } else if (seconds < 3600) {
        int minutes = static_cast<int>(seconds / 60);
        int secs = static_cast<int>(seconds) % 60;
        oss << minutes << "m " << secs << "s";
    } else {
        int hours = static_cast<int>(seconds / 3600);
        int minutes = (static_cast<int>(seconds) % 3600) / 60;
        oss << hours << "h " << minutes << "m";
    }

    return oss.str();
}

std::string MultiProgressRenderer::shortenFileLabel(const std::string& file) const {
    auto pos = file.find_last_of('/');
    std::string label = pos == std::string::npos ? file : file.substr(pos + 1);
    if (label.size() <= 32) {
        return label;
    }
    return label.substr(0, 14) + "…" + label.substr(label.size() - 14);
}

void MultiProgressRenderer::renderLines(const std::vector<std::string>& lines) {
    // Back to the first line of the previous frame.
    if (lines_rendered_ > 1) {
        out_ << "\033[" << lines_rendered_ - 1 << "A";
    }
    out_ << "\r";
    for (size_t i = 0; i < lines.size(); ++i) {
        out_ << "\033[2K" << lines[i];
        if (i + 1 < lines.size()) {
            out_ << "\n";
        }
    }
    // Clear whatever a longer previous frame left below.
    out_ << "\033[J" << std::flush;
    lines_rendered_ = lines.size();
}

std::string MultiProgressRenderer::spinnerFrame() const {
    static const char* frames[] = {"⠦", "⠧", "⠇", "⠏", "⠋", "⠙", "⠹", "⠸", "⠼", "⠴"};
    return frames[spinner_index_ % (sizeof(frames) / sizeof(frames[0]))];
}

}  // namespace cli
}  // namespace paca
