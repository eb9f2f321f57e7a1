/**
 * @file AtomicWriter.hpp
 * @brief Crash-safe file replacement
 *
 * Content is written to a temporary file in the target's directory, flushed
 * to stable storage, then renamed over the target. Readers see either the
 * old file or the new one, never a partial write.
 */

#ifndef CONFSTORE_ATOMIC_WRITER_HPP
#define CONFSTORE_ATOMIC_WRITER_HPP

#include <functional>
#include <string>

namespace confstore {

/**
 * @brief Options for write_file_atomic()
 */
struct AtomicWriteOptions {
    /// fsync the temporary file before the rename and the directory after it
    bool sync = true;

    /**
     * Called with the temporary file path after it is fully written and
     * closed, immediately before the rename. An exception thrown here
     * aborts the write: the temporary file is removed and the target is
     * left untouched.
     */
    std::function<void(const std::string&)> before_commit;
};

/**
 * @brief Atomically replace @p path with @p content
 *
 * The new file keeps the permission bits of the file it replaces; a new
 * file gets 0644. Parent directories must exist.
 *
 * @throws IoError if any step before the rename fails (the target is
 *         unchanged and no temporary file is left behind)
 */
void write_file_atomic(const std::string& path, const std::string& content,
                       const AtomicWriteOptions& options = {});

} // namespace confstore

#endif // CONFSTORE_ATOMIC_WRITER_HPP
