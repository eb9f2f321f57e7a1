/**
 * @file Errors.hpp
 * @brief Exception types for confstore operations
 *
 * Error taxonomy:
 * - StoreError: Base class
 * - ParseError: Malformed source document
 * - PathError: Bad index, out-of-bounds index, non-sequence push/pop target
 * - LockError: Lock acquisition failed or timed out
 * - IoError: Read/write/rename failure
 * - FileNotFoundError: Backing file missing (IoError subclass)
 * - NotFoundError: Path does not resolve (distinct from a null value)
 * - BatchError: First failing pair of a multiset
 * - MissingKeysError: Required keys absent during validation
 */

#ifndef CONFSTORE_ERRORS_HPP
#define CONFSTORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace confstore {

/**
 * @brief Base class for all confstore exceptions
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Source document could not be decoded
 *
 * Line and column are 1-based; 0 means the codec did not report a
 * position.
 */
class ParseError : public StoreError {
public:
    ParseError(std::string file, std::string details, int line = 0, int column = 0)
        : StoreError(format_message(file, details, line, column))
        , file_(std::move(file))
        , details_(std::move(details))
        , line_(line)
        , column_(column)
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& details() const noexcept { return details_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }

private:
    std::string file_;
    std::string details_;
    int line_;
    int column_;

    static std::string format_message(const std::string& file,
                                      const std::string& details,
                                      int line, int column) {
        std::ostringstream oss;
        oss << "Parse error in '" << (file.empty() ? "<memory>" : file) << "'";
        if (line > 0) {
            oss << " at line " << line << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Path expression cannot be applied to the document
 *
 * Raised for out-of-bounds or invalid indices, indexing into a
 * non-sequence, and push/pop on a non-sequence or empty sequence.
 */
class PathError : public StoreError {
public:
    /**
     * @param path Path expression being applied (e.g., "items[5]")
     * @param reason What went wrong (e.g., "index 5 out of bounds (length 3)")
     */
    PathError(std::string path, std::string reason)
        : StoreError("Invalid path '" + path + "': " + reason)
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

/**
 * @brief Advisory lock could not be acquired
 */
class LockError : public StoreError {
public:
    LockError(std::string lock_file, std::string details)
        : StoreError("Failed to acquire lock '" + lock_file + "': " + details)
        , lock_file_(std::move(lock_file))
        , details_(std::move(details))
    {}

    const std::string& lock_file() const noexcept { return lock_file_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string lock_file_;
    std::string details_;
};

/**
 * @brief Filesystem operation failed
 */
class IoError : public StoreError {
public:
    /**
     * @param file Path the operation was applied to
     * @param operation Short verb ("read", "write", "rename", ...)
     * @param details System error text
     */
    IoError(std::string file, std::string operation, std::string details)
        : StoreError("Failed to " + operation + " '" + file + "': " + details)
        , file_(std::move(file))
        , operation_(std::move(operation))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& operation() const noexcept { return operation_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string operation_;
    std::string details_;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public IoError {
public:
    explicit FileNotFoundError(std::string path)
        : IoError(path, "open",
                  "configuration file not found (use create_missing or "
                  "ConfigStore::init to create it)")
    {}
};

/**
 * @brief Path did not resolve to a value
 */
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(std::string path)
        : StoreError("Key not found: '" + path + "'")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief A multiset failed; nothing was written
 *
 * Wraps the first failing pair and the message of the error it raised.
 */
class BatchError : public StoreError {
public:
    BatchError(std::size_t index, std::string key, std::string cause)
        : StoreError("Failed to set '" + key + "' (pair " +
                     std::to_string(index) + "): " + cause)
        , index_(index)
        , key_(std::move(key))
        , cause_(std::move(cause))
    {}

    /// Zero-based position of the failing pair
    std::size_t index() const noexcept { return index_; }
    const std::string& key() const noexcept { return key_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::size_t index_;
    std::string key_;
    std::string cause_;
};

/**
 * @brief Required keys are absent from the document
 *
 * Contains the list of all missing keys.
 */
class MissingKeysError : public StoreError {
public:
    explicit MissingKeysError(std::vector<std::string> keys)
        : StoreError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing required keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace confstore

#endif // CONFSTORE_ERRORS_HPP
