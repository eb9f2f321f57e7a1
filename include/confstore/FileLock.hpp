/**
 * @file FileLock.hpp
 * @brief Advisory cross-process lock on a "<file>.lock" sidecar
 *
 * Locking rules:
 * - L1: The lock lives on "<target>.lock", created on first use and never
 *       deleted; the target itself is never locked
 * - L2: Shared locks coexist; an exclusive lock excludes every other lock
 * - L3: Without a timeout, acquisition blocks until the lock is granted
 * - L4: With a timeout, acquisition gives up with LockError once it expires
 * - L5: The lock is released when the FileLock is destroyed or release()
 *       is called, whichever comes first
 *
 * Locks are advisory: they only exclude processes that use FileLock (or
 * flock) on the same sidecar.
 */

#ifndef CONFSTORE_FILE_LOCK_HPP
#define CONFSTORE_FILE_LOCK_HPP

#include <chrono>
#include <optional>
#include <string>

namespace confstore {

class FileLock {
public:
    enum class Mode { Shared, Exclusive };

    /**
     * @brief Acquire a lock for @p target
     *
     * @param target File being protected (the sidecar is target + ".lock")
     * @param mode Shared for readers, Exclusive for writers
     * @param timeout Give up after this long; std::nullopt waits forever
     * @throws LockError if the sidecar cannot be opened, flock fails, or
     *         the timeout expires
     */
    FileLock(const std::string& target, Mode mode,
             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /// Release the lock early; safe to call more than once
    void release() noexcept;

    bool held() const noexcept { return fd_ >= 0; }
    Mode mode() const noexcept { return mode_; }
    const std::string& lock_path() const noexcept { return lock_path_; }

    /// Sidecar path used for @p target
    static std::string lock_path_for(const std::string& target);

private:
    std::string lock_path_;
    Mode mode_;
    int fd_ = -1;
};

} // namespace confstore

#endif // CONFSTORE_FILE_LOCK_HPP
