/**
 * @file Codec.cpp
 * @brief Document decoding/encoding implementation
 *
 * RULE C1-C5: Format behavior documented in Codec.hpp.
 */

#include "confstore/Codec.hpp"
#include "confstore/Errors.hpp"
#include "confstore/Parse.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace confstore {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

/**
 * @brief Convert a byte offset to 1-based line and column
 */
void offset_to_position(const std::string& text, size_t offset, int& line, int& column) {
    line = 1;
    column = 1;
    const size_t end = std::min(offset, text.size());
    for (size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
}

/**
 * @brief Shortest text that reads back as the same double
 */
std::string format_float(double d) {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d < 0 ? "-.inf" : ".inf";
    return Value(d).dump();
}

Value require_mapping(Value doc, const std::string& source) {
    if (doc.is_null()) {
        return Value::object();
    }
    if (!doc.is_object()) {
        // RULE C3
        throw ParseError(source, "document root must be a mapping, got " + type_name(doc));
    }
    return doc;
}

// ============================================================================
// YAML
// ============================================================================

const std::string kYamlTagPrefix = "tag:yaml.org,2002:";

Value yaml_scalar_to_value(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();

    // "!" marks quoted and block scalars
    if (tag == "!" || tag == kYamlTagPrefix + "str") {
        return text;
    }
    if (tag.empty() || tag == "?" || tag.rfind(kYamlTagPrefix, 0) == 0) {
        return resolve_plain_scalar(text);
    }
    // Application-specific tags keep their text
    return text;
}

Value decode_yaml(const std::string& text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ParseError(source, e.msg, e.mark.line + 1, e.mark.column + 1);
    }
    return require_mapping(yaml_node_to_value(root), source);
}

std::string encode_yaml(const Value& doc) {
    YAML::Emitter out;
    out.SetIndent(2);
    emit_yaml(out, doc);
    if (!out.good()) {
        throw StoreError("Failed to encode YAML: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

// ============================================================================
// JSON
// ============================================================================

Value decode_json(const std::string& text, const std::string& source) {
    try {
        return require_mapping(Value::parse(text), source);
    } catch (const nlohmann::json::parse_error& e) {
        int line = 0;
        int column = 0;
        offset_to_position(text, e.byte > 0 ? e.byte - 1 : 0, line, column);
        throw ParseError(source, e.what(), line, column);
    }
}

// ============================================================================
// TOML
// ============================================================================

Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

Value decode_toml(const std::string& text, const std::string& source) {
    try {
        toml::table table = toml::parse(text, source);
        return require_mapping(toml_node_to_value(table), source);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            source,
            std::string(e.description()),
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column)
        );
    }
}

toml::array make_toml_array(const Value& a);
toml::table make_toml_table(const Value& o);

template <typename Insert>
void insert_toml_scalar(const Value& v, Insert&& insert) {
    if (v.is_string()) {
        insert(v.get<std::string>());
    } else if (v.is_boolean()) {
        insert(v.get<bool>());
    } else if (v.is_number_integer() && !v.is_number_unsigned()) {
        insert(v.get<std::int64_t>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            insert(static_cast<std::int64_t>(u));
        } else {
            // Oversize for TOML int; fall back to double
            insert(static_cast<double>(u));
        }
    } else if (v.is_number_float()) {
        insert(v.get<double>());
    } else {
        // RULE C5: no TOML null
        insert(std::string{});
    }
}

toml::array make_toml_array(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_toml_table(elem));
        } else if (elem.is_array()) {
            out.push_back(make_toml_array(elem));
        } else {
            insert_toml_scalar(elem, [&](auto&& x) {
                out.push_back(std::forward<decltype(x)>(x));
            });
        }
    }
    return out;
}

toml::table make_toml_table(const Value& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const std::string& k = it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            tbl.insert(k, make_toml_table(v));
        } else if (v.is_array()) {
            tbl.insert(k, make_toml_array(v));
        } else {
            insert_toml_scalar(v, [&](auto&& x) {
                tbl.insert(k, std::forward<decltype(x)>(x));
            });
        }
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Format detect_format(const std::string& path, Format requested) {
    if (requested != Format::Auto) {
        return requested;
    }
    const std::string ext = get_file_extension(path);
    if (ext == ".json") return Format::Json;
    if (ext == ".toml") return Format::Toml;
    return Format::Yaml;
}

Value decode_document(const std::string& text, Format format, const std::string& source) {
    // RULE C2
    if (is_blank(text)) {
        return Value::object();
    }

    switch (format) {
        case Format::Json:
            return decode_json(text, source);
        case Format::Toml:
            return decode_toml(text, source);
        case Format::Yaml:
        case Format::Auto:
            break;
    }
    return decode_yaml(text, source);
}

std::string encode_document(const Value& doc, Format format) {
    switch (format) {
        case Format::Json:
            try {
                return doc.dump(2) + "\n";
            } catch (const nlohmann::json::type_error& e) {
                // 316: string is not valid UTF-8
                throw StoreError(std::string("Failed to encode JSON: ") + e.what());
            }
        case Format::Toml: {
            std::ostringstream oss;
            oss << make_toml_table(doc) << "\n";
            return oss.str();
        }
        case Format::Yaml:
        case Format::Auto:
            break;
    }
    return encode_yaml(doc);
}

Value yaml_node_to_value(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return yaml_scalar_to_value(node);

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_node_to_value(item));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                const std::string key = kv.first.IsScalar()
                    ? kv.first.Scalar()
                    : YAML::Dump(kv.first);
                obj[key] = yaml_node_to_value(kv.second);
            }
            return obj;
        }

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return Value(nullptr);
}

void emit_yaml(YAML::Emitter& out, const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
            out << YAML::Null;
            break;

        case Value::value_t::boolean:
            out << value.get<bool>();
            break;

        case Value::value_t::number_integer:
            out << static_cast<long long>(value.get<std::int64_t>());
            break;

        case Value::value_t::number_unsigned:
            out << static_cast<unsigned long long>(value.get<std::uint64_t>());
            break;

        case Value::value_t::number_float:
            out << format_float(value.get<double>());
            break;

        case Value::value_t::string: {
            const auto& s = value.get_ref<const std::string&>();
            if (s.empty() || resolves_as_non_string(s)) {
                out << YAML::DoubleQuoted;
            }
            out << s;
            break;
        }

        case Value::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& elem : value) {
                emit_yaml(out, elem);
            }
            out << YAML::EndSeq;
            break;

        case Value::value_t::object:
            out << YAML::BeginMap;
            for (auto it = value.begin(); it != value.end(); ++it) {
                out << YAML::Key;
                if (it.key().empty()) {
                    out << YAML::DoubleQuoted;
                }
                out << it.key();
                out << YAML::Value;
                emit_yaml(out, it.value());
            }
            out << YAML::EndMap;
            break;

        case Value::value_t::binary:
        case Value::value_t::discarded:
            out << YAML::Null;
            break;
    }
}

} // namespace confstore
