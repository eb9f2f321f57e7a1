/**
 * @file Patch.hpp
 * @brief Comment-preserving in-place updates of YAML text
 *
 * An existing node is updated by replacing only the bytes of that node
 * with a minimal flow-style rendering of the new value. Every other byte
 * of the source (comments, blank lines, quoting, key order) is kept.
 *
 * The patch engine knows only canonical paths: negative indices must be
 * resolved (resolve_negative_indices) against the same content first.
 */

#ifndef CONFSTORE_PATCH_HPP
#define CONFSTORE_PATCH_HPP

#include "confstore/DotPath.hpp"
#include "confstore/Value.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace confstore {

/**
 * @brief Byte range [begin, end) of a node in the source text
 */
struct TextSpan {
    std::size_t begin = 0;
    std::size_t end = 0;
    /// True if the node sits inside a flow collection ("[...]", "{...}")
    bool in_flow = false;
};

/**
 * @brief Find the source bytes of the node at a canonical path
 *
 * @return std::nullopt if the path does not resolve, or the node has no
 *         text of its own (an implicit null such as "key:" with nothing
 *         after it)
 * @throws ParseError if @p source is not valid YAML
 */
std::optional<TextSpan> locate_node_span(const std::string& source, const Path& path);

/**
 * @brief Render a value as a single-line YAML fragment
 *
 * Collections use flow style ("{a: 1, b: [x, y]}"). Scalars are quoted
 * when they would otherwise change type or, with @p in_flow, collide
 * with flow indicators.
 */
std::string render_fragment(const Value& value, bool in_flow = false);

/**
 * @brief Replace the node at a canonical path, keeping all other text
 *
 * The patched text is decoded again and must equal the original document
 * with set_value() applied; anything else counts as "cannot patch".
 *
 * @param source Original YAML text
 * @param path Canonical path (no negative indices)
 * @param value New value for the node
 * @return Patched text, or std::nullopt if the node does not exist or
 *         cannot be replaced in place (caller re-serializes instead)
 * @throws ParseError if @p source is not valid YAML
 * @throws PathError if @p path still contains a negative index
 */
std::optional<std::string> patch_document(const std::string& source,
                                          const Path& path,
                                          const Value& value);

} // namespace confstore

#endif // CONFSTORE_PATCH_HPP
