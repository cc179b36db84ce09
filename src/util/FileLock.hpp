#pragma once

#include <filesystem>

namespace gitcask {

/**
 * @brief Exclusive advisory lock on a sentinel file (flock(LOCK_EX))
 *
 * The lock belongs to the open file description, so two FileLock objects
 * on the same path exclude each other even inside one process. Move-only;
 * the destructor unlocks and closes but leaves the file on disk.
 *
 * Holders may unlink the file after releasing it. Acquisition only succeeds
 * once the locked descriptor is still the file named by the path.
 */
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /// Create/open the file and block until the lock is held; throws StoreError(LockError)
    static FileLock acquire(const std::filesystem::path& path);

    /// Non-blocking variant: empty (unlocked) FileLock when another holder exists
    static FileLock tryAcquire(const std::filesystem::path& path);

    bool locked() const { return fd >= 0; }
    const std::filesystem::path& path() const { return lockPath; }

    /// Unlock and close; safe to call twice
    void release() noexcept;

private:
    FileLock(int fd, std::filesystem::path path) : fd(fd), lockPath(std::move(path)) {}
    static int openLockFile(const std::filesystem::path& path);
    static bool stillLinked(int fd, const std::filesystem::path& path);
    void closeFd() noexcept;

    int fd{-1};
    std::filesystem::path lockPath;
};

}
