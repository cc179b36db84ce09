#include "util/FileLock.hpp"

#include "util/Expected.hpp"
#include "util/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitcask {

int FileLock::openLockFile(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StoreError(ErrorCode::LockError, "Failed to create lock directory: " + ec.message());
    }
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StoreError(ErrorCode::LockError,
                         "Failed to open lock file " + path.string() + ": " + std::strerror(errno));
    }
    return fd;
}

bool FileLock::stillLinked(int fd, const fs::path& path) {
    struct stat held;
    struct stat current;
    int rc = ::fstat(fd, &held);
    if (rc == 0) rc = ::stat(path.c_str(), &current);
    if (rc != 0) {
        int err = errno;
        if (err == ENOENT) return false;
        throw StoreError(ErrorCode::LockError,
                         "Failed to stat lock file " + path.string() + ": " + std::strerror(err));
    }
    return held.st_dev == current.st_dev && held.st_ino == current.st_ino;
}

FileLock FileLock::acquire(const fs::path& path) {
    // Holders unlink the file before unlocking; a lock won on the unlinked
    // inode excludes nobody, so reopen until the path matches.
    for (;;) {
        FileLock lock(openLockFile(path), path);
        int rc;
        do {
            rc = ::flock(lock.fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            throw StoreError(ErrorCode::LockError,
                             "Failed to lock " + path.string() + ": " + std::strerror(err));
        }
        if (stillLinked(lock.fd, path)) return lock;
        Logger::instance().debug("Lock file " + path.string() + " was replaced, retrying");
    }
}

FileLock FileLock::tryAcquire(const fs::path& path) {
    for (;;) {
        FileLock lock(openLockFile(path), path);
        if (::flock(lock.fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            lock.closeFd();
            if (err == EWOULDBLOCK) return FileLock();
            throw StoreError(ErrorCode::LockError,
                             "Failed to lock " + path.string() + ": " + std::strerror(err));
        }
        if (stillLinked(lock.fd, path)) return lock;
    }
}

FileLock::~FileLock() { release(); }

FileLock::FileLock(FileLock&& other) noexcept : fd(other.fd), lockPath(std::move(other.lockPath)) {
    other.fd = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd = other.fd;
        lockPath = std::move(other.lockPath);
        other.fd = -1;
    }
    return *this;
}

void FileLock::release() noexcept {
    if (fd < 0) return;
    ::flock(fd, LOCK_UN);
    closeFd();
}

void FileLock::closeFd() noexcept {
    if (fd < 0) return;
    ::close(fd);
    fd = -1;
}

}
