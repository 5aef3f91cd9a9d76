#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace paca {

// Write content to path.tmp, fsync it, rename over path and fsync the parent
// directory. On failure returns false and fills error.
bool writeFileDurably(const std::filesystem::path& path, const std::string& content, std::string& error);

// fsync a directory so renames and unlinks inside it survive a crash.
bool fsyncDirectory(const std::filesystem::path& dir, std::string& error);

// "<what>: <strerror(errno)>"
std::string errnoMessage(const std::string& what);

// True when `candidate` stays inside `base` after lexical normalisation.
bool isWithinDirectory(const std::filesystem::path& base, const std::filesystem::path& candidate);

}  // namespace paca
