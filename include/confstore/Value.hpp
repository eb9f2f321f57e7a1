/**
 * @file Value.hpp
 * @brief Value type for configuration documents
 *
 * Uses nlohmann::ordered_json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...}, insertion ordered)
 */

#ifndef CONFSTORE_VALUE_HPP
#define CONFSTORE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace confstore {

/**
 * @brief JSON-like value type for configuration documents
 *
 * Alias for nlohmann::ordered_json so that mappings keep the key order
 * found in the source document (human-edited files should not be
 * reshuffled on every write).
 *
 * Supports:
 * - Type queries: is_null(), is_boolean(), is_number_integer(),
 *   is_number_float(), is_string(), is_array(), is_object()
 * - Container operations: size(), empty(), operator[], find(), erase()
 * - Comparison: ==, !=
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "sequence";
    if (val.is_object()) return "mapping";
    return "unknown";
}

/**
 * @brief Check if value is a container (sequence or mapping)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace confstore

#endif // CONFSTORE_VALUE_HPP
