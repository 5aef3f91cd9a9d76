#pragma once

#include <filesystem>
#include <system_error>
#ifdef __unix__
#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace paca {

// Advisory exclusive lock on a lock file (best-effort, non-blocking).
// Unix: flock; fallback: lock directory creation.
// If acquisition fails, locked() returns false.
// With remove_on_release the lock file is deleted when the lock is dropped.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& target, bool remove_on_release = false)
        : target_(target), remove_on_release_(remove_on_release) {
        acquire();
    }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }
    const std::filesystem::path& path() const { return target_; }

private:
    void acquire();
    void release();

    std::filesystem::path target_;
    bool remove_on_release_{false};
    bool locked_{false};
#ifdef __unix__
    int fd_{-1};
#endif
    bool used_dir_lock_{false};
    std::filesystem::path dir_lock_path_;
};

// ---- Implementation ----

inline void FileLock::acquire() {
#ifdef __unix__
    fd_ = ::open(target_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ >= 0) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            locked_ = true;
            return;
        }
        // Held by another process: do not fall back to the directory lock.
        ::close(fd_);
        fd_ = -1;
        return;
    }
#endif
    dir_lock_path_ = target_.string() + ".d";
    std::error_code ec;
    if (std::filesystem::create_directory(dir_lock_path_, ec)) {
        locked_ = true;
        used_dir_lock_ = true;
    }
}

inline void FileLock::release() {
    if (!locked_) return;
    std::error_code ec;
#ifdef __unix__
    if (fd_ >= 0) {
        if (remove_on_release_) std::filesystem::remove(target_, ec);
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
#endif
    if (used_dir_lock_) {
        std::filesystem::remove(dir_lock_path_, ec);
    }
    locked_ = false;
}

}  // namespace paca
