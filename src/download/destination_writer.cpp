#include "download/destination_writer.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

#include "utils/fs_utils.h"

namespace fs = std::filesystem;

namespace paca {

namespace {

DownloadError ioError(const std::string& message) {
    return make_error(DownloadErrorCode::kDiskIOError, message);
}

// posix_fallocate reserves the blocks; filesystems without support get a sparse ftruncate.
bool preallocate(int fd, uint64_t size, std::string& error) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        error = errnoMessage("fstat");
        return false;
    }
    if (size > 0) {
        int rc = ::posix_fallocate(fd, 0, static_cast<off_t>(size));
        if (rc == 0) return true;
        if (rc == ENOSPC || rc == EFBIG) {
            error = std::string("posix_fallocate: ") + std::strerror(rc);
            return false;
        }
    }
    if (static_cast<uint64_t>(st.st_size) != size && ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        error = errnoMessage("ftruncate");
        return false;
    }
    return true;
}

bool pwriteAll(int fd, const char* data, size_t len, uint64_t offset, std::string& error) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd, data + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            error = errnoMessage("pwrite");
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace

DestinationWriter::~DestinationWriter() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : entries_) {
        if (kv.second->fd >= 0) ::close(kv.second->fd);
    }
}

DestinationWriter::Entry* DestinationWriter::find(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : it->second.get();
}

DownloadError DestinationWriter::open(const FilePlan& plan) {
    std::error_code ec;
    fs::create_directories(plan.temp_path.parent_path(), ec);
    if (ec) {
        return ioError("create directory " + plan.temp_path.parent_path().string() + ": " + ec.message());
    }

    const bool resuming = !plan.resume.ranges.empty();
    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (!resuming) flags |= O_TRUNC;
    int fd = ::open(plan.temp_path.c_str(), flags, 0644);
    if (fd < 0) {
        return ioError(errnoMessage("open " + plan.temp_path.string()));
    }
    std::string err;
    if (!preallocate(fd, plan.file.size_bytes, err)) {
        ::close(fd);
        return ioError(plan.temp_path.string() + ": " + err);
    }

    auto entry = std::make_unique<Entry>();
    entry->fd = fd;
    entry->final_path = plan.final_path;
    entry->temp_path = plan.temp_path;
    entry->sidecar_path = plan.sidecar_path;
    entry->state = plan.resume;

    if (!resuming) {
        // A stale sidecar must not outlive the truncation above.
        fs::remove(plan.sidecar_path, ec);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(plan.file.path);
    if (it != entries_.end() && it->second->fd >= 0) {
        ::close(it->second->fd);
    }
    entries_[plan.file.path] = std::move(entry);
    spdlog::debug("DestinationWriter: opened path='{}' size={} resumed_bytes={}", plan.temp_path.string(),
                  plan.file.size_bytes, plan.resume.ranges.covered());
    return {};
}

DownloadError DestinationWriter::write(const std::string& path, ByteRange range, const char* data, size_t len) {
    Entry* entry = find(path);
    if (!entry) return ioError("file not open: " + path);
    if (range.length() != len || range.end > entry->state.size) {
        return ioError("write of " + std::to_string(len) + " bytes does not fit range [" +
                       std::to_string(range.start) + ", " + std::to_string(range.end) + ") of " + path);
    }

    std::string err;
    if (!pwriteAll(entry->fd, data, len, range.start, err)) {
        return ioError(entry->temp_path.string() + ": " + err);
    }
    if (::fdatasync(entry->fd) != 0) {
        return ioError(errnoMessage("fdatasync " + entry->temp_path.string()));
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->state.ranges.add(range);
    if (!entry->state.save(entry->sidecar_path, err)) {
        return ioError(err);
    }
    return {};
}

DownloadError DestinationWriter::reset(const std::string& path, bool ranges_supported) {
    Entry* entry = find(path);
    if (!entry) return ioError("file not open: " + path);
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->state.ranges.clear();
    entry->state.etag.clear();
    entry->state.ranges_supported = ranges_supported;
    std::string err;
    if (!entry->state.save(entry->sidecar_path, err)) {
        return ioError(err);
    }
    return {};
}

void DestinationWriter::setEtag(const std::string& path, const std::string& etag) {
    Entry* entry = find(path);
    if (!entry) return;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->state.etag = etag;
}

DownloadError DestinationWriter::finalize(const std::string& path) {
    std::unique_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(path);
        if (it == entries_.end()) return ioError("file not open: " + path);
        entry = std::move(it->second);
        entries_.erase(it);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->state.complete()) {
        ::close(entry->fd);
        return ioError("refusing to finalize incomplete file " + path);
    }
    if (::fsync(entry->fd) != 0) {
        auto e = ioError(errnoMessage("fsync " + entry->temp_path.string()));
        ::close(entry->fd);
        return e;
    }
    if (::close(entry->fd) != 0) {
        return ioError(errnoMessage("close " + entry->temp_path.string()));
    }
    entry->fd = -1;

    std::error_code ec;
    fs::rename(entry->temp_path, entry->final_path, ec);
    if (ec) {
        return ioError("rename " + entry->temp_path.string() + " -> " + entry->final_path.string() + ": " +
                       ec.message());
    }
    fs::remove(entry->sidecar_path, ec);
    if (ec) {
        spdlog::warn("DestinationWriter: failed to remove sidecar path='{}' error='{}'", entry->sidecar_path.string(),
                     ec.message());
    }
    std::string err;
    if (!fsyncDirectory(entry->final_path.parent_path(), err)) {
        return ioError(err);
    }
    spdlog::info("DestinationWriter: finalized path='{}'", entry->final_path.string());
    return {};
}

void DestinationWriter::close(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) return;
    if (it->second->fd >= 0) ::close(it->second->fd);
    entries_.erase(it);
}

bool DestinationWriter::isComplete(const std::string& path) const {
    Entry* entry = find(path);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->state.complete();
}

std::optional<ResumeState> DestinationWriter::state(const std::string& path) const {
    Entry* entry = find(path);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->state;
}

fs::path DestinationWriter::tempPath(const std::string& path) const {
    Entry* entry = find(path);
    return entry ? entry->temp_path : fs::path();
}

}  // namespace paca
