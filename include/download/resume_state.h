#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "download/range_set.h"

namespace paca {

// Durable record of the byte ranges of one destination file that have been
// written and flushed. Stored as a JSON sidecar next to the temporary file.
struct ResumeState {
    static constexpr int kVersion = 1;

    std::string path;          // RemoteFile::path this state belongs to
    uint64_t size{0};          // expected total size at the time of the first write
    std::string content_hash;  // expected content hash at the time of the first write
    std::string etag;          // entity tag the written bytes came from, empty until known
    bool ranges_supported{true};
    RangeSet ranges;

    bool complete() const { return ranges.containsAll(size); }

    std::string toJson() const;
    static std::optional<ResumeState> fromJson(const std::string& text);

    // Returns std::nullopt when the sidecar is missing or unreadable.
    static std::optional<ResumeState> load(const std::filesystem::path& sidecar);

    // Durable save (write temp, fsync, rename, fsync dir).
    bool save(const std::filesystem::path& sidecar, std::string& error) const;
};

}  // namespace paca
