#include "download/transfer_planner.h"

#include <spdlog/spdlog.h>

#include "utils/fs_utils.h"
#include "utils/string_utils.h"

namespace fs = std::filesystem;

namespace paca {

namespace {

std::optional<fs::path> finalPathFor(const fs::path& dest_dir, const std::string& rel) {
    if (rel.empty()) return std::nullopt;
    fs::path rel_path(rel);
    if (rel_path.is_absolute() || rel_path.has_root_name()) return std::nullopt;
    fs::path candidate = (dest_dir / rel_path).lexically_normal();
    if (!isWithinDirectory(dest_dir, candidate)) return std::nullopt;
    return candidate;
}

std::string staleReason(const ResumeState& state, const RemoteFile& file) {
    if (state.path != file.path) return "path changed";
    if (state.size != file.size_bytes) {
        return "size changed " + std::to_string(state.size) + " -> " + std::to_string(file.size_bytes);
    }
    if (toLowerAscii(state.content_hash) != toLowerAscii(file.content_hash)) return "content hash changed";
    if (!state.ranges_supported) return "server did not support range requests";
    return {};
}

ResumeState freshState(const RemoteFile& file) {
    ResumeState state;
    state.path = file.path;
    state.size = file.size_bytes;
    state.content_hash = file.content_hash;
    return state;
}

}  // namespace

uint64_t FilePlan::missingBytes() const {
    uint64_t total = 0;
    for (const auto& r : missing) total += r.length();
    return total;
}

uint64_t TransferPlan::totalBytes() const {
    uint64_t total = 0;
    for (const auto& f : files) total += f.file.size_bytes;
    return total;
}

uint64_t TransferPlan::missingBytes() const {
    uint64_t total = 0;
    for (const auto& f : files) total += f.missingBytes();
    return total;
}

fs::path tempPathFor(const fs::path& final_path) {
    return fs::path(final_path.string() + ".part");
}

fs::path sidecarPathFor(const fs::path& final_path) {
    return fs::path(final_path.string() + ".part.json");
}

std::optional<TransferPlan> planTransfer(const RemoteManifest& manifest,
                                         const fs::path& dest_dir,
                                         const ResumeStates& resume_states,
                                         DownloadError& error,
                                         const PresentFiles& present) {
    error = {};
    TransferPlan plan;
    plan.dest_dir = dest_dir.lexically_normal();

    for (const auto& file : manifest.files) {
        auto final_path = finalPathFor(plan.dest_dir, file.path);
        if (!final_path) {
            error = make_error(DownloadErrorCode::kInvalidPath,
                               "manifest path escapes destination directory: '" + file.path + "'");
            return std::nullopt;
        }

        FilePlan fp;
        fp.file = file;
        fp.final_path = *final_path;
        fp.temp_path = tempPathFor(*final_path);
        fp.sidecar_path = sidecarPathFor(*final_path);
        fp.resume = freshState(file);

        auto present_it = present.find(file.path);
        auto state_it = resume_states.find(file.path);

        if (state_it == resume_states.end() && present_it != present.end() &&
            present_it->second == file.size_bytes) {
            fp.state = FilePlanState::kAlreadyPresent;
            fp.resume.ranges.add({0, file.size_bytes});
            plan.notices.push_back(file.path + ": already present, verifying only");
            plan.files.push_back(std::move(fp));
            continue;
        }
        if (present_it != present.end() && present_it->second != file.size_bytes) {
            plan.notices.push_back(file.path + ": existing file has size " + std::to_string(present_it->second) +
                                   ", expected " + std::to_string(file.size_bytes) + "; downloading again");
        }

        if (state_it != resume_states.end()) {
            const std::string reason = staleReason(state_it->second, file);
            if (reason.empty()) {
                fp.resume.ranges = state_it->second.ranges;
                fp.resume.etag = state_it->second.etag;
            } else {
                plan.notices.push_back(file.path + ": discarding resume state (" + reason + ")");
            }
        }
        fp.missing = fp.resume.ranges.complement(file.size_bytes);
        plan.files.push_back(std::move(fp));
    }
    return plan;
}

ResumeStates loadResumeStates(const RemoteManifest& manifest, const fs::path& dest_dir) {
    ResumeStates out;
    for (const auto& file : manifest.files) {
        auto final_path = finalPathFor(dest_dir.lexically_normal(), file.path);
        if (!final_path) continue;
        auto state = ResumeState::load(sidecarPathFor(*final_path));
        if (!state) continue;

        std::error_code ec;
        const fs::path temp = tempPathFor(*final_path);
        auto temp_size = fs::file_size(temp, ec);
        if (ec || temp_size != state->size) {
            spdlog::warn("TransferPlanner: ignoring sidecar without matching temp file path='{}'", temp.string());
            continue;
        }
        out.emplace(file.path, std::move(*state));
    }
    return out;
}

PresentFiles scanPresentFiles(const RemoteManifest& manifest, const fs::path& dest_dir) {
    PresentFiles out;
    for (const auto& file : manifest.files) {
        auto final_path = finalPathFor(dest_dir.lexically_normal(), file.path);
        if (!final_path) continue;
        std::error_code ec;
        if (!fs::is_regular_file(*final_path, ec)) continue;
        if (fs::exists(sidecarPathFor(*final_path), ec)) continue;
        auto size = fs::file_size(*final_path, ec);
        if (!ec) out.emplace(file.path, size);
    }
    return out;
}

uint64_t requiredDiskBytes(const TransferPlan& plan) {
    uint64_t required = 0;
    for (const auto& f : plan.files) {
        if (f.state == FilePlanState::kAlreadyPresent) continue;
        std::error_code ec;
        uint64_t held = 0;
        if (fs::is_regular_file(f.temp_path, ec)) {
            held = fs::file_size(f.temp_path, ec);
            if (ec) held = 0;
        }
        if (f.file.size_bytes > held) required += f.file.size_bytes - held;
    }
    return required;
}

bool checkDiskSpace(const TransferPlan& plan, DownloadError& error) {
    const uint64_t required = requiredDiskBytes(plan);
    if (required == 0) return true;

    // space() needs an existing path; walk up until one exists.
    fs::path existing = plan.dest_dir.empty() ? fs::path(".") : plan.dest_dir;
    std::error_code ec;
    while (!fs::exists(existing, ec) && existing.has_parent_path() && existing != existing.parent_path()) {
        existing = existing.parent_path();
    }
    auto info = fs::space(existing, ec);
    if (ec) {
        spdlog::warn("TransferPlanner: cannot query free space path='{}' error='{}'", existing.string(), ec.message());
        return true;
    }
    if (info.available < required) {
        error = make_error(DownloadErrorCode::kInsufficientDiskSpace,
                           "need " + std::to_string(required) + " bytes in " + plan.dest_dir.string() + ", " +
                               std::to_string(info.available) + " available");
        return false;
    }
    return true;
}

}  // namespace paca
