/**
 * @file DotPath.hpp
 * @brief Dot/bracket path expressions for nested document access
 *
 * Path syntax:
 * - "database.host"       nested keys
 * - "a\.b"                literal dot inside a key
 * - "items[3]"            sequence element
 * - "items[-1]"           last element (negative indices count from the end)
 * - "items[0].name"       mixed
 *
 * Parsing never fails. Malformed brackets (no closing "]") are kept as
 * literal characters, and non-numeric bracket content yields an index
 * segment flagged invalid that only errors when applied to a sequence.
 */

#ifndef CONFSTORE_DOTPATH_HPP
#define CONFSTORE_DOTPATH_HPP

#include "confstore/Value.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace confstore {

/**
 * @brief One step of a path: a mapping key or a sequence index
 */
struct Segment {
    enum class Kind { Key, Index };

    Kind kind = Kind::Key;

    /// Key text for Kind::Key, raw bracket content for Kind::Index
    std::string text;

    /// Parsed index (Kind::Index with valid == true only)
    std::int64_t index = 0;

    /// False when the bracket content is not a signed integer
    bool valid = true;

    static Segment key(std::string name);
    static Segment at(std::int64_t idx);

    bool is_key() const noexcept { return kind == Kind::Key; }
    bool is_index() const noexcept { return kind == Kind::Index; }

    bool operator==(const Segment& other) const;
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

/// Ordered list of segments; empty denotes the document root
using Path = std::vector<Segment>;

/**
 * @brief Parse a path expression into segments
 *
 * Examples:
 * - "database.host"   → [Key(database), Key(host)]
 * - "items[-1].name"  → [Key(items), Index(-1), Key(name)]
 * - "a\.b.c"          → [Key(a.b), Key(c)]
 * - "a..b"            → [Key(a), Key(b)]
 * - "broken[0"        → [Key(broken[0)]
 * - ""                → []
 */
Path parse_dot_path(const std::string& expr);

/**
 * @brief Render segments back to canonical path syntax
 *
 * Dots inside keys are escaped, indices use brackets:
 * [Key(a.b), Index(2), Key(c)] → "a\.b[2].c"
 */
std::string format_dot_path(const Path& path);

/**
 * @brief Resolve a sequence index against a length
 *
 * @return len + idx for negative idx, idx otherwise; -1 if the result
 *         falls outside [0, len)
 */
std::int64_t normalize_index(std::int64_t idx, std::size_t len) noexcept;

/**
 * @brief Rewrite negative indices to their non-negative equivalents
 *
 * Walks @p doc alongside @p path using the same traversal rules as
 * get(). Every negative Index segment that lands on a live sequence is
 * replaced by len + idx.
 *
 * Must run against the document just read under the same lock as the
 * mutation that consumes its result.
 *
 * @throws PathError if a negative index targets a non-sequence (or a
 *         location that does not exist) or resolves out of bounds
 */
Path resolve_negative_indices(const Value& doc, const Path& path);

} // namespace confstore

#endif // CONFSTORE_DOTPATH_HPP
