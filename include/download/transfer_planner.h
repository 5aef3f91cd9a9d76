#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "download/download_error.h"
#include "download/range_set.h"
#include "download/remote_manifest.h"
#include "download/resume_state.h"

namespace paca {

enum class FilePlanState {
    kFetch,           // at least the missing ranges must be transferred
    kAlreadyPresent,  // final file exists with the expected size; verify only
};

struct FilePlan {
    RemoteFile file;
    std::filesystem::path final_path;
    std::filesystem::path temp_path;     // <final>.part
    std::filesystem::path sidecar_path;  // <final>.part.json
    std::vector<ByteRange> missing;      // ordered, disjoint; complement of resume.ranges
    ResumeState resume;                  // seed for the destination writer
    FilePlanState state{FilePlanState::kFetch};

    uint64_t missingBytes() const;
};

struct TransferPlan {
    std::filesystem::path dest_dir;
    std::vector<FilePlan> files;       // same order as the manifest
    std::vector<std::string> notices;  // non-fatal events (stale resume state, file already present)

    uint64_t totalBytes() const;
    uint64_t missingBytes() const;
};

using ResumeStates = std::map<std::string, ResumeState>;
// RemoteFile::path -> size of the final file found on disk.
using PresentFiles = std::map<std::string, uint64_t>;

std::filesystem::path tempPathFor(const std::filesystem::path& final_path);
std::filesystem::path sidecarPathFor(const std::filesystem::path& final_path);

// Pure planning step. Fails with kInvalidPath when a manifest path is absolute
// or escapes dest_dir.
std::optional<TransferPlan> planTransfer(const RemoteManifest& manifest,
                                         const std::filesystem::path& dest_dir,
                                         const ResumeStates& resume_states,
                                         DownloadError& error,
                                         const PresentFiles& present = {});

// Reads the sidecars of the manifest's files. A sidecar whose temporary file
// is missing or has the wrong size is ignored.
ResumeStates loadResumeStates(const RemoteManifest& manifest, const std::filesystem::path& dest_dir);

// Final files that exist without a sidecar, keyed by RemoteFile::path.
PresentFiles scanPresentFiles(const RemoteManifest& manifest, const std::filesystem::path& dest_dir);

// Bytes the run still has to allocate: planned sizes minus the space already
// held by existing temporary files.
uint64_t requiredDiskBytes(const TransferPlan& plan);

// Compares requiredDiskBytes() with the free space of the destination volume.
bool checkDiskSpace(const TransferPlan& plan, DownloadError& error);

}  // namespace paca
