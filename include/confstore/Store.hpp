/**
 * @file Store.hpp
 * @brief File-backed configuration store with path-addressed access
 *
 * Every call is a self-contained sequence on the backing file:
 *   lock → read → decode → resolve path → operate → (write) → unlock
 * Nothing is cached between calls.
 *
 * Store rules:
 * - S1: Reads take a shared lock; mutations take an exclusive lock held
 *       across the whole read-modify-write sequence
 * - S2: set() on an existing node of a YAML file patches only that node's
 *       text, keeping comments; everything else re-serializes
 * - S3: Writes go through write_file_atomic(); a failed call leaves the
 *       file byte-identical
 * - S4: multiset() applies every pair to one in-memory copy first and
 *       writes once, or not at all
 * - S5: Dry-run never locks, writes or creates anything
 * - S6: A missing file is an error unless create_missing is set
 */

#ifndef CONFSTORE_STORE_HPP
#define CONFSTORE_STORE_HPP

#include "confstore/AtomicWriter.hpp"
#include "confstore/Codec.hpp"
#include "confstore/Value.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace confstore {

/**
 * @brief Per-store settings
 */
struct StoreOptions {
    /// Document format; Auto picks by file extension
    Format format = Format::Auto;

    /// Lock acquisition limit; std::nullopt blocks indefinitely
    std::optional<std::chrono::milliseconds> lock_timeout;

    /// Passed through to write_file_atomic()
    AtomicWriteOptions write;
};

/**
 * @brief Per-call settings for set() and multiset()
 */
struct MutationOptions {
    /// Treat a missing file as an empty mapping (created on write)
    bool create_missing = false;

    /// Report changes without touching the filesystem (S5)
    bool dry_run = false;
};

/**
 * @brief One key's before/after values
 */
struct Change {
    std::string key;
    std::optional<Value> old_value;  ///< nullopt if the key did not exist
    Value new_value;
};

/**
 * @brief Result of ConfigStore::validate()
 */
struct ValidationReport {
    std::size_t key_count = 0;
    std::vector<std::string> sections;  ///< Top-level keys, sorted
};

enum class InitStatus { Created, Exists };

struct InitResult {
    InitStatus status;
    std::size_t key_count;
};

class ConfigStore {
public:
    explicit ConfigStore(std::string file, StoreOptions options = {});

    const std::string& file() const noexcept { return file_; }
    Format format() const noexcept { return format_; }

    // ---- Reads (shared lock) ------------------------------------------------

    /**
     * @brief Value at a path, or std::nullopt if it does not resolve
     *
     * An empty key returns the whole document.
     *
     * @throws FileNotFoundError, ParseError, LockError
     */
    std::optional<Value> get(const std::string& key) const;

    /// Value at a path, or @p fallback if it does not resolve
    Value get_or(const std::string& key, const Value& fallback) const;

    /**
     * @brief Read several keys under one lock
     *
     * Repeated keys are reported once, in first-seen order.
     *
     * @throws NotFoundError for a missing key with no entry in @p defaults
     */
    std::vector<std::pair<std::string, Value>> multiget(
        const std::vector<std::string>& keys,
        const std::map<std::string, Value>& defaults = {}) const;

    /**
     * @brief Flattened leaves below a prefix, sorted by key
     *
     * A prefix naming a non-mapping yields that single entry.
     *
     * @throws NotFoundError if @p prefix does not resolve
     */
    std::vector<std::pair<std::string, Value>> list(const std::string& prefix = "") const;

    /**
     * @brief Check that the file decodes and holds the required keys
     *
     * @throws ParseError on invalid syntax
     * @throws MissingKeysError listing every absent key
     */
    ValidationReport validate(const std::vector<std::string>& required = {}) const;

    // ---- Mutations (exclusive lock) -----------------------------------------

    /**
     * @brief Set one value (S2)
     *
     * @return The single change made (or that would be made, for dry-run)
     * @throws PathError if the path cannot be set
     */
    std::vector<Change> set(const std::string& key, const Value& value,
                            const MutationOptions& options = {});

    /**
     * @brief Set several raw values atomically (S4)
     *
     * Values are typed with coerce_value(): "42" is stored as an integer,
     * "007" stays a string. Each Change carries the value the file held
     * before the call, even when an earlier pair set the same key.
     *
     * @throws BatchError for the first pair that fails; nothing is written
     */
    std::vector<Change> multiset(const std::vector<std::pair<std::string, std::string>>& pairs,
                                 const MutationOptions& options = {});

    /**
     * @brief Remove a key
     *
     * @return false if the key was missing; the file is not rewritten
     */
    bool erase(const std::string& key);

    /// Append to the sequence at @p key, creating it if absent
    void push(const std::string& key, const Value& value, bool create_missing = false);

    /// Remove and return the last element of the sequence at @p key
    Value pop(const std::string& key);

    // ---- Creation -----------------------------------------------------------

    /**
     * @brief Create a configuration file from a template
     *
     * @param template_name "planning" (also the default for ""),
     *        "minimal", or the path of a template file
     * @param force Overwrite an existing file
     * @throws ParseError if the template does not decode in @p file's format
     */
    static InitResult init(const std::string& file,
                           const std::string& template_name = "planning",
                           bool force = false,
                           StoreOptions options = {});

    /// Text of a built-in template, or std::nullopt for unknown names
    static std::optional<std::string> builtin_template(const std::string& name);

private:
    std::string file_;
    StoreOptions options_;
    Format format_;

    /// Raw file content; "" for a missing file when @p create_missing
    std::string read_source(bool create_missing) const;
    Value decode(const std::string& text) const;
    void persist(const std::string& content) const;

    /// Decoded document read without a lock (dry-run only)
    Value peek(bool create_missing) const;
};

} // namespace confstore

#endif // CONFSTORE_STORE_HPP
