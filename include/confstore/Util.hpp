/**
 * @file Util.hpp
 * @brief Helpers shared by the store and its callers
 */

#ifndef CONFSTORE_UTIL_HPP
#define CONFSTORE_UTIL_HPP

#include "confstore/Value.hpp"
#include <string>
#include <utility>
#include <vector>

namespace confstore {

/**
 * @brief Read a whole file into memory
 *
 * @throws FileNotFoundError if @p path does not exist
 * @throws IoError if it exists but cannot be read
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Flatten nested mappings to dot-path/value pairs
 *
 * Mappings are descended into; sequences and scalars are leaves. Keys
 * containing dots are escaped ("a\.b"). Result is sorted by key. An empty
 * nested mapping yields no entries.
 *
 * @param data Value to flatten
 * @param prefix Prefix prepended to every key (no trailing dot)
 *
 * Example:
 * ```cpp
 * Value data = {{"db", {{"host", "x"}, {"ports", {1, 2}}}}};
 * flatten_to_dotpaths(data);
 * // → [("db.host", "x"), ("db.ports", [1, 2])]
 * ```
 */
std::vector<std::pair<std::string, Value>> flatten_to_dotpaths(
    const Value& data, const std::string& prefix = "");

/**
 * @brief Number of leaves in a document (see flatten_to_dotpaths)
 */
std::size_t count_keys(const Value& data);

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(const std::string& s);

/**
 * @brief Read a list of keys, one per line
 *
 * Blank lines and lines starting with '#' are skipped; surrounding
 * whitespace is trimmed.
 *
 * @throws FileNotFoundError if @p path does not exist
 * @throws IoError if @p path is a symlink or not a regular file
 */
std::vector<std::string> read_keys_file(const std::string& path);

/**
 * @brief Drop repeated keys, keeping the first occurrence of each
 */
std::vector<std::string> unique_keys(const std::vector<std::string>& keys);

} // namespace confstore

#endif // CONFSTORE_UTIL_HPP
