#include "utils/fs_utils.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace paca {

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

bool fsyncDirectory(const fs::path& dir, std::string& error) {
    const fs::path target = dir.empty() ? fs::path(".") : dir;
    int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        error = errnoMessage("open directory " + target.string());
        return false;
    }
    const bool ok = ::fsync(fd) == 0;
    if (!ok) error = errnoMessage("fsync directory " + target.string());
    ::close(fd);
    return ok;
}

bool writeFileDurably(const fs::path& path, const std::string& content, std::string& error) {
    const fs::path tmp = path.string() + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = errnoMessage("open " + tmp.string());
        return false;
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = errnoMessage("write " + tmp.string());
            ::close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        error = errnoMessage("fsync " + tmp.string());
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        error = errnoMessage("close " + tmp.string());
        return false;
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        error = "rename " + tmp.string() + " -> " + path.string() + ": " + ec.message();
        return false;
    }
    return fsyncDirectory(path.parent_path(), error);
}

bool isWithinDirectory(const fs::path& base, const fs::path& candidate) {
    fs::path norm_base = base.lexically_normal();
    if (norm_base.has_relative_path() && !norm_base.has_filename()) {
        norm_base = norm_base.parent_path();
    }
    const fs::path norm = candidate.lexically_normal();
    auto rel = norm.lexically_relative(norm_base);
    if (rel.empty()) return false;
    const auto first = *rel.begin();
    return first != ".." && first != ".";
}

}  // namespace paca
