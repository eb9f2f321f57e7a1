/**
 * @file AtomicWriter.cpp
 * @brief Temp file + fsync + rename implementation
 */

#include "confstore/AtomicWriter.hpp"
#include "confstore/Errors.hpp"

#include <glog/logging.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace confstore {

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

/**
 * @brief Owns a temporary file until it is committed
 *
 * Closes the descriptor and unlinks the file unless commit() was called.
 */
class TempFileGuard {
public:
    TempFileGuard(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    ~TempFileGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        if (!committed_) {
            ::unlink(path_.c_str());
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    int fd() const noexcept { return fd_; }
    const std::string& path() const noexcept { return path_; }

    void close() {
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            throw IoError(path_, "close", errno_text(errno));
        }
    }

    void commit() noexcept { committed_ = true; }

private:
    int fd_;
    std::string path_;
    bool committed_ = false;
};

void write_all(int fd, const std::string& content, const std::string& temp_path) {
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError(temp_path, "write", errno_text(errno));
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
}

/**
 * @brief Flush the directory entry created by rename()
 *
 * Runs after the rename has succeeded, so failures are only logged.
 */
void sync_directory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        LOG(WARNING) << "Cannot open " << dir << " to sync: " << errno_text(errno);
        return;
    }
    if (::fsync(fd) != 0) {
        LOG(WARNING) << "fsync of " << dir << " failed: " << errno_text(errno);
    }
    ::close(fd);
}

mode_t target_mode(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) == 0) {
        return st.st_mode & 07777;
    }
    return 0644;
}

} // anonymous namespace

void write_file_atomic(const std::string& path, const std::string& content,
                       const AtomicWriteOptions& options) {
    const fs::path target(path);
    const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");

    // mkstemps needs a writable buffer ending in XXXXXX plus the suffix
    const std::string suffix = ".tmp";
    const std::string pattern =
        (dir / ("." + target.filename().string() + "-XXXXXX" + suffix)).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = ::mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw IoError(path, "create temporary file for", errno_text(errno));
    }
    TempFileGuard temp(fd, buffer.data());
    VLOG(1) << "Writing " << content.size() << " bytes to " << temp.path();

    write_all(temp.fd(), content, temp.path());

    if (::fchmod(temp.fd(), target_mode(path)) != 0) {
        throw IoError(temp.path(), "chmod", errno_text(errno));
    }
    if (options.sync && ::fsync(temp.fd()) != 0) {
        throw IoError(temp.path(), "fsync", errno_text(errno));
    }
    temp.close();

    if (options.before_commit) {
        options.before_commit(temp.path());
    }

    if (::rename(temp.path().c_str(), path.c_str()) != 0) {
        throw IoError(path, "rename", errno_text(errno));
    }
    temp.commit();
    if (options.sync) {
        sync_directory(dir);
    }
    VLOG(1) << "Committed " << path;
}

} // namespace confstore
