/**
 * @file Parse.hpp
 * @brief String-to-Value typing rules
 *
 * Two rule sets live here:
 *
 * coerce_value() types raw values supplied by callers (multiset pairs,
 * command-line style input). Only numbers are recognised:
 * - N1: Integer (matches ^-?(0|[1-9][0-9]*)$); a value that does not fit
 *       int64 becomes a float
 * - N2: Float (decimal with an optional sign and either side of the point
 *       optional, e.g. "+5", ".5", "5.", "1e3", "-2.5E-1")
 * - N3: Anything else stays a string ("true", "007", "1.2.3", ".", "")
 *
 * resolve_plain_scalar() types unquoted YAML scalars following the
 * YAML 1.2 core schema:
 * - null:  "", "~", "null", "Null", "NULL"
 * - bool:  true/True/TRUE, false/False/FALSE
 * - int:   [-+]?[0-9]+, 0o[0-7]+, 0x[0-9a-fA-F]+
 * - float: [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?,
 *          [-+]?.inf (any casing listed by the schema), .nan
 * - string otherwise
 */

#ifndef CONFSTORE_PARSE_HPP
#define CONFSTORE_PARSE_HPP

#include "confstore/Value.hpp"
#include <string>

namespace confstore {

/**
 * @brief Convert numeric-looking strings to numbers
 *
 * Examples:
 * ```cpp
 * coerce_value("42")      // → 42 (integer)
 * coerce_value("-17")     // → -17 (integer)
 * coerce_value("3.14")    // → 3.14 (float)
 * coerce_value("1e3")     // → 1000.0 (float)
 * coerce_value(".5")      // → 0.5 (float)
 * coerce_value("007")     // → "007" (string)
 * coerce_value("true")    // → "true" (string)
 * coerce_value("hello")   // → "hello" (string)
 * ```
 */
Value coerce_value(const std::string& raw);

/**
 * @brief Type an unquoted YAML scalar
 *
 * Examples:
 * ```cpp
 * resolve_plain_scalar("~")      // → null
 * resolve_plain_scalar("True")   // → true
 * resolve_plain_scalar("0x1F")   // → 31
 * resolve_plain_scalar("-.inf")  // → -infinity
 * resolve_plain_scalar("yes")    // → "yes" (YAML 1.1 booleans are strings)
 * ```
 */
Value resolve_plain_scalar(const std::string& text);

/**
 * @brief Check whether a string would be read back as a non-string
 *
 * True when the text written unquoted would resolve to null, a bool or a
 * number, so encoders must quote it to keep it a string.
 */
bool resolves_as_non_string(const std::string& text);

} // namespace confstore

#endif // CONFSTORE_PARSE_HPP
