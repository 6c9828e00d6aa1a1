#pragma once

#include <chrono>
#include <filesystem>
#include <thread>
#ifdef __unix__
#include <sys/file.h>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#endif
#ifdef _WIN32
#include <windows.h>
#endif

namespace wcache {

// Advisory file lock shared between processes.
// Unix: flock, Windows: LockFileEx, fallback: lock directory creation.
// Non-blocking mode tries once; blocking mode waits until the holder releases.
// locked() reports whether the lock is held.
class FileLock {
public:
    enum class Mode { NonBlocking, Blocking };

    explicit FileLock(const std::filesystem::path& target, Mode mode = Mode::NonBlocking)
        : target_(target), mode_(mode) {
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
    bool tryDirLock();

    std::filesystem::path target_;
    Mode mode_;
    bool locked_{false};

#ifdef __unix__
    int fd_{-1};
#elif defined(_WIN32)
    void* handle_{nullptr};
#endif
    bool used_dir_lock_{false};
    std::filesystem::path dir_lock_path_;
};

// ---- Implementation ----

inline bool FileLock::tryDirLock() {
    dir_lock_path_ = target_.string() + ".d";
    std::error_code ec;
    if (std::filesystem::create_directory(dir_lock_path_, ec)) {
        locked_ = true;
        used_dir_lock_ = true;
        return true;
    }
    return false;
}

inline void FileLock::acquire() {
#ifdef __unix__
    fd_ = ::open(target_.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ >= 0) {
        const int op = mode_ == Mode::Blocking ? LOCK_EX : (LOCK_EX | LOCK_NB);
        int rc = ::flock(fd_, op);
        while (rc != 0 && errno == EINTR) rc = ::flock(fd_, op);
        if (rc == 0) {
            locked_ = true;
            return;
        }
        const bool held_elsewhere = errno == EWOULDBLOCK;
        ::close(fd_);
        fd_ = -1;
        // Another holder owns the flock; the directory fallback would not see it.
        if (held_elsewhere) return;
    }
#elif defined(_WIN32)
    handle_ = CreateFileA(target_.string().c_str(), GENERIC_READ | GENERIC_WRITE,
                          FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle_ != INVALID_HANDLE_VALUE && handle_ != nullptr) {
        DWORD flags = LOCKFILE_EXCLUSIVE_LOCK;
        if (mode_ == Mode::NonBlocking) flags |= LOCKFILE_FAIL_IMMEDIATELY;
        OVERLAPPED ov = {};
        if (LockFileEx(handle_, flags, 0, MAXDWORD, MAXDWORD, &ov)) {
            locked_ = true;
            return;
        }
        const bool held_elsewhere = GetLastError() == ERROR_LOCK_VIOLATION;
        CloseHandle(handle_);
        handle_ = nullptr;
        if (held_elsewhere) return;
    }
#endif
    // Fallback: lock directory. Blocking mode polls until it can be created.
    if (tryDirLock() || mode_ == Mode::NonBlocking) return;
    for (int i = 0; i < 6000 && !locked_; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        tryDirLock();
    }
}

inline void FileLock::release() {
    if (!locked_) return;
#ifdef __unix__
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
#elif defined(_WIN32)
    if (handle_ != nullptr) {
        OVERLAPPED ov = {};
        UnlockFileEx(handle_, 0, MAXDWORD, MAXDWORD, &ov);
        CloseHandle(handle_);
        handle_ = nullptr;
    }
#endif
    if (used_dir_lock_) {
        std::error_code ec;
        std::filesystem::remove(dir_lock_path_, ec);
    }
    locked_ = false;
}

}  // namespace wcache
