/**
 * @file FileLock.cpp
 * @brief flock(2)-based advisory locking
 */

#include "confstore/FileLock.hpp"
#include "confstore/Errors.hpp"

#include <glog/logging.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace confstore {

namespace {

constexpr std::chrono::milliseconds kPollInterval{10};

const char* mode_name(FileLock::Mode mode) {
    return mode == FileLock::Mode::Shared ? "shared" : "exclusive";
}

} // anonymous namespace

std::string FileLock::lock_path_for(const std::string& target) {
    return target + ".lock";
}

FileLock::FileLock(const std::string& target, Mode mode,
                   std::optional<std::chrono::milliseconds> timeout)
    : lock_path_(lock_path_for(target))
    , mode_(mode)
{
    int fd;
    do {
        fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw LockError(lock_path_, std::strerror(errno));
    }

    const int op = mode == Mode::Shared ? LOCK_SH : LOCK_EX;
    VLOG(1) << "Acquiring " << mode_name(mode) << " lock on " << lock_path_;

    if (!timeout) {
        // L3
        while (::flock(fd, op) != 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            throw LockError(lock_path_, std::strerror(err));
        }
    } else {
        // L4
        const auto deadline = std::chrono::steady_clock::now() + *timeout;
        while (::flock(fd, op | LOCK_NB) != 0) {
            const int err = errno;
            if (err == EINTR) continue;
            if (err != EWOULDBLOCK) {
                ::close(fd);
                throw LockError(lock_path_, std::strerror(err));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                ::close(fd);
                throw LockError(lock_path_, "timed out after " +
                                std::to_string(timeout->count()) + " ms");
            }
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    fd_ = fd;
    VLOG(1) << "Acquired " << mode_name(mode) << " lock on " << lock_path_;
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : lock_path_(std::move(other.lock_path_))
    , mode_(other.mode_)
    , fd_(other.fd_)
{
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        lock_path_ = std::move(other.lock_path_);
        mode_ = other.mode_;
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // L5: closing the descriptor drops the flock
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    VLOG(1) << "Released lock on " << lock_path_;
}

} // namespace confstore
