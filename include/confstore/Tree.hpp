/**
 * @file Tree.hpp
 * @brief Path-addressed operations on a decoded document
 *
 * All functions act on an in-memory Value; persisting the result is the
 * caller's job.
 *
 * Traversal rules shared by every operation:
 * - Key segments apply to mappings only
 * - Index segments apply to sequences only; negative indices count from
 *   the end (-1 is the last element)
 * - Anything applied to a scalar does not resolve
 */

#ifndef CONFSTORE_TREE_HPP
#define CONFSTORE_TREE_HPP

#include "confstore/DotPath.hpp"
#include "confstore/Value.hpp"
#include <optional>

namespace confstore {

/**
 * @brief Locate the node at a path
 *
 * @return Pointer into @p doc, or nullptr if the path does not resolve.
 *         An empty path returns &doc.
 */
const Value* find_node(const Value& doc, const Path& path);

/**
 * @brief Read the value at a path
 *
 * @return A copy of the value, or std::nullopt if the path does not
 *         resolve. A stored null is returned as a null Value, not nullopt.
 *
 * Examples:
 * ```cpp
 * Value doc = {{"items", {10, 20, 30}}};
 * get_value(doc, parse_dot_path("items[-1]"));  // 30
 * get_value(doc, parse_dot_path("items[-4]"));  // nullopt
 * ```
 */
std::optional<Value> get_value(const Value& doc, const Path& path);

/**
 * @brief Write a value at a path, creating intermediate mappings
 *
 * - Missing keys along the way are created as empty mappings.
 * - A node that is not a mapping when a key must be applied to it is
 *   replaced by an empty mapping; its previous content is discarded.
 * - Index segments never extend a sequence: the element must exist.
 *
 * @throws PathError for an empty path, an index applied to a
 *         non-sequence, an invalid index, or an index out of bounds
 */
void set_value(Value& doc, const Path& path, Value value);

/**
 * @brief Remove the key at the end of a path
 *
 * @return true if a key was removed, false if any part of the path was
 *         missing (not an error)
 * @throws PathError for an empty path, a path ending in an index
 *         (element removal is unsupported), or an intermediate scalar
 */
bool erase_value(Value& doc, const Path& path);

/**
 * @brief Append to the sequence at a path
 *
 * Creates a one-element sequence if the path does not resolve.
 *
 * @throws PathError if the node exists and is not a sequence, or if the
 *         path cannot be created (see set_value)
 */
void push_value(Value& doc, const Path& path, Value value);

/**
 * @brief Remove and return the last element of the sequence at a path
 *
 * @throws NotFoundError if the path does not resolve
 * @throws PathError if the node is not a sequence or is empty
 */
Value pop_value(Value& doc, const Path& path);

} // namespace confstore

#endif // CONFSTORE_TREE_HPP
