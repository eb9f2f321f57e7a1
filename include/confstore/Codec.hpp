/**
 * @file Codec.hpp
 * @brief Decoding and encoding of configuration documents
 *
 * Supported formats:
 * - YAML (using yaml-cpp), the default and the only format that supports
 *   comment-preserving updates
 * - JSON (using nlohmann::json)
 * - TOML (using toml++)
 *
 * Format rules:
 * - C1: Auto detection by extension: ".json" → JSON, ".toml" → TOML,
 *       anything else (".yaml", ".yml", none) → YAML
 * - C2: Empty or whitespace-only source decodes to an empty mapping
 * - C3: A root that is not a mapping is a ParseError
 * - C4: Strings that would read back as another type are quoted on encode
 * - C5: TOML has no null; null encodes as an empty string
 */

#ifndef CONFSTORE_CODEC_HPP
#define CONFSTORE_CODEC_HPP

#include "confstore/Value.hpp"
#include <string>

namespace YAML {
class Emitter;
class Node;
}

namespace confstore {

/**
 * @brief On-disk document format
 */
enum class Format {
    Auto,
    Yaml,
    Json,
    Toml
};

/**
 * @brief Get file extension (lowercase, including the dot)
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Resolve Format::Auto from a file name (RULE C1)
 *
 * Non-Auto formats are returned unchanged.
 */
Format detect_format(const std::string& path, Format requested = Format::Auto);

/**
 * @brief Decode document text into a mapping
 *
 * @param text Raw file content
 * @param format Concrete format (not Auto)
 * @param source File name used in error messages
 * @return Root mapping (empty for empty text)
 * @throws ParseError on syntax errors or a non-mapping root
 */
Value decode_document(const std::string& text, Format format,
                      const std::string& source = "");

/**
 * @brief Encode a document in the given format
 *
 * Output always ends with a newline.
 *
 * @throws StoreError if the encoder rejects the value
 */
std::string encode_document(const Value& doc, Format format);

/**
 * @brief Convert a yaml-cpp node to a Value
 *
 * Quoted and block scalars are strings; plain scalars follow
 * resolve_plain_scalar(). Mapping keys keep their source text.
 */
Value yaml_node_to_value(const YAML::Node& node);

/**
 * @brief Write a Value to a yaml-cpp emitter (RULE C4)
 */
void emit_yaml(YAML::Emitter& out, const Value& value);

} // namespace confstore

#endif // CONFSTORE_CODEC_HPP
