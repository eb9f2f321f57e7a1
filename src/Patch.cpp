/**
 * @file Patch.cpp
 * @brief Comment-preserving YAML updates
 *
 * yaml-cpp reports where each node starts (Node::Mark) but not where it
 * ends, so the end of a node is found by scanning the source text from
 * that start. Every patch is checked by decoding the result; a mismatch
 * makes the caller re-serialize the whole document instead.
 */

#include "confstore/Patch.hpp"
#include "confstore/Codec.hpp"
#include "confstore/Errors.hpp"
#include "confstore/Tree.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace confstore {

namespace {

constexpr std::size_t npos = std::string::npos;

bool is_blank_char(char c) {
    return c == ' ' || c == '\t';
}

bool is_line_break(char c) {
    return c == '\n' || c == '\r';
}

std::size_t line_start(const std::string& src, std::size_t pos) {
    while (pos > 0 && src[pos - 1] != '\n') {
        --pos;
    }
    return pos;
}

std::size_t line_end(const std::string& src, std::size_t pos) {
    while (pos < src.size() && !is_line_break(src[pos])) {
        ++pos;
    }
    return pos;
}

std::size_t next_line(const std::string& src, std::size_t pos) {
    pos = line_end(src, pos);
    if (pos < src.size() && src[pos] == '\r') ++pos;
    if (pos < src.size() && src[pos] == '\n') ++pos;
    return pos;
}

std::size_t indent_at(const std::string& src, std::size_t begin) {
    std::size_t i = begin;
    while (i < src.size() && src[i] == ' ') {
        ++i;
    }
    return i - begin;
}

std::size_t trim_back(const std::string& src, std::size_t begin, std::size_t end) {
    while (end > begin && is_blank_char(src[end - 1])) {
        --end;
    }
    return end;
}

/**
 * @brief End of the content on a line, before any trailing comment
 *
 * Quotes are tracked within the line only.
 */
std::size_t content_end(const std::string& src, std::size_t from) {
    const std::size_t stop = line_end(src, from);
    char quote = 0;
    for (std::size_t i = from; i < stop; ++i) {
        const char c = src[i];
        if (quote == '"') {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                quote = 0;
            }
        } else if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == from || is_blank_char(src[i - 1]))) {
            return trim_back(src, from, i);
        }
    }
    return trim_back(src, from, stop);
}

/**
 * @brief Skip tag and anchor tokens ("!!str ", "&ref ")
 */
std::size_t skip_properties(const std::string& src, std::size_t pos) {
    while (pos < src.size() && (src[pos] == '!' || src[pos] == '&')) {
        while (pos < src.size() && !is_blank_char(src[pos]) && !is_line_break(src[pos])) {
            ++pos;
        }
        while (pos < src.size() && (is_blank_char(src[pos]) || is_line_break(src[pos]))) {
            ++pos;
        }
    }
    return pos;
}

std::size_t double_quoted_end(const std::string& src, std::size_t pos) {
    for (std::size_t i = pos + 1; i < src.size(); ++i) {
        if (src[i] == '\\') {
            ++i;
        } else if (src[i] == '"') {
            return i + 1;
        }
    }
    return npos;
}

std::size_t single_quoted_end(const std::string& src, std::size_t pos) {
    for (std::size_t i = pos + 1; i < src.size(); ++i) {
        if (src[i] == '\'') {
            if (i + 1 < src.size() && src[i + 1] == '\'') {
                ++i;
            } else {
                return i + 1;
            }
        }
    }
    return npos;
}

/**
 * @brief End of a literal ("|") or folded (">") block scalar
 *
 * Content lines are those indented deeper than the header line; blank
 * lines in between belong to the scalar.
 */
std::size_t block_scalar_end(const std::string& src, std::size_t pos) {
    std::size_t end = pos + 1;
    while (end < src.size() && (src[end] == '+' || src[end] == '-' ||
                                (src[end] >= '0' && src[end] <= '9'))) {
        ++end;
    }

    const std::size_t header_indent = indent_at(src, line_start(src, pos));
    std::size_t content_indent = 0;
    for (std::size_t ls = next_line(src, pos); ls < src.size(); ls = next_line(src, ls)) {
        const std::size_t le = line_end(src, ls);
        const std::size_t indent = indent_at(src, ls);
        if (ls + indent >= le) {
            continue;
        }
        if (content_indent == 0) {
            if (indent <= header_indent) break;
            content_indent = indent;
        } else if (indent < content_indent) {
            break;
        }
        end = le;
    }
    return end;
}

std::size_t plain_scalar_end(const std::string& src, std::size_t pos, bool in_flow) {
    std::size_t i = pos;
    for (; i < src.size(); ++i) {
        const char c = src[i];
        if (is_line_break(c)) break;
        if (c == '#' && i > pos && is_blank_char(src[i - 1])) break;
        if (in_flow && (c == ',' || c == '[' || c == ']' || c == '{' || c == '}')) break;
    }
    return trim_back(src, pos, i);
}

std::size_t flow_collection_end(const std::string& src, std::size_t pos) {
    int depth = 0;
    for (std::size_t i = pos; i < src.size(); ++i) {
        const char c = src[i];
        if (c == '"') {
            i = double_quoted_end(src, i);
            if (i == npos) return npos;
            --i;
        } else if (c == '\'') {
            i = single_quoted_end(src, i);
            if (i == npos) return npos;
            --i;
        } else if (c == '#' && i > 0 && (is_blank_char(src[i - 1]) || is_line_break(src[i - 1]))) {
            i = line_end(src, i) - 1;
        } else if (c == '[' || c == '{') {
            ++depth;
        } else if (c == ']' || c == '}') {
            if (--depth == 0) return i + 1;
        }
    }
    return npos;
}

bool is_document_marker(const std::string& src, std::size_t ls) {
    if (src.compare(ls, 3, "---") != 0 && src.compare(ls, 3, "...") != 0) {
        return false;
    }
    return ls + 3 >= src.size() || is_blank_char(src[ls + 3]) || is_line_break(src[ls + 3]);
}

/**
 * @brief End of a block mapping or block sequence starting at @p pos
 *
 * The collection owns every following line indented deeper than its
 * first line, plus same-column lines that continue it (sibling keys, or
 * "- " items for a sequence).
 */
std::size_t block_collection_end(const std::string& src, std::size_t pos, bool is_sequence) {
    const std::size_t column = pos - line_start(src, pos);
    std::size_t end = content_end(src, pos);

    for (std::size_t ls = next_line(src, pos); ls < src.size(); ls = next_line(src, ls)) {
        const std::size_t le = line_end(src, ls);
        const std::size_t indent = indent_at(src, ls);
        const std::size_t first = ls + indent;
        if (first >= le || src[first] == '#' || src[first] == '\t') {
            continue;
        }
        if (indent == 0 && is_document_marker(src, ls)) {
            break;
        }
        const bool dash_item = src[first] == '-' &&
            (first + 1 >= le || is_blank_char(src[first + 1]));
        if (indent < column) {
            break;
        }
        if (indent == column && dash_item != is_sequence) {
            break;
        }
        end = content_end(src, first);
    }
    return end;
}

bool is_null_text(const std::string& text) {
    return text == "~" || text == "null" || text == "Null" || text == "NULL";
}

struct FoundNode {
    YAML::Node node;
    bool in_flow;
};

std::optional<FoundNode> find_yaml_node(const YAML::Node& node, const Path& path,
                                        std::size_t depth, bool in_flow) {
    if (depth == path.size()) {
        return FoundNode{node, in_flow};
    }
    const Segment& seg = path[depth];
    const bool flow = in_flow || node.Style() == YAML::EmitterStyle::Flow;

    if (seg.is_key() && node.IsMap()) {
        // Duplicate keys decode last-wins, so the last match is the live one
        std::optional<YAML::Node> match;
        for (const auto& kv : node) {
            if (kv.first.IsScalar() && kv.first.Scalar() == seg.text) {
                match.emplace(kv.second);
            }
        }
        if (!match) return std::nullopt;
        return find_yaml_node(*match, path, depth + 1, flow);
    }

    if (seg.is_index() && node.IsSequence()) {
        if (seg.index < 0 || static_cast<std::size_t>(seg.index) >= node.size()) {
            return std::nullopt;
        }
        const YAML::Node child = node[static_cast<std::size_t>(seg.index)];
        return find_yaml_node(child, path, depth + 1, flow);
    }

    return std::nullopt;
}

/**
 * @brief Span of a node given its start offset
 */
std::optional<TextSpan> node_span(const std::string& src, const YAML::Node& node,
                                  std::size_t start, bool in_flow) {
    const std::size_t pos = skip_properties(src, start);
    if (pos >= src.size()) {
        return std::nullopt;
    }
    const char c = src[pos];
    std::size_t end = npos;

    if (node.IsScalar() || node.IsNull()) {
        if (c == '"') {
            end = double_quoted_end(src, pos);
        } else if (c == '\'') {
            end = single_quoted_end(src, pos);
        } else if (!in_flow && (c == '|' || c == '>')) {
            end = block_scalar_end(src, pos);
        } else {
            end = plain_scalar_end(src, pos, in_flow);
            const std::string text = src.substr(pos, end - pos);
            if (node.IsNull() ? !is_null_text(text) : text != node.Scalar()) {
                // Multi-line plain scalar or implicit null
                return std::nullopt;
            }
        }
    } else if (c == '[' || c == '{') {
        end = flow_collection_end(src, pos);
    } else if (!in_flow) {
        end = block_collection_end(src, pos, node.IsSequence());
    }

    if (end == npos || end <= pos) {
        return std::nullopt;
    }
    // Tags and anchors are replaced along with the value
    return TextSpan{start, end, in_flow};
}

std::string strip_outer_brackets(const std::string& text) {
    const std::size_t open = text.find('[');
    const std::size_t close = text.rfind(']');
    if (open == npos || close == npos || close <= open) {
        return text;
    }
    std::string inner = text.substr(open + 1, close - open - 1);
    const std::size_t first = inner.find_first_not_of(' ');
    const std::size_t last = inner.find_last_not_of(' ');
    return first == npos ? std::string{} : inner.substr(first, last - first + 1);
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

std::optional<TextSpan> locate_node_span(const std::string& source, const Path& path) {
    YAML::Node root;
    try {
        root = YAML::Load(source);
    } catch (const YAML::Exception& e) {
        throw ParseError("", e.msg, e.mark.line + 1, e.mark.column + 1);
    }

    const auto found = find_yaml_node(root, path, 0, false);
    if (!found) {
        return std::nullopt;
    }
    const YAML::Mark mark = found->node.Mark();
    if (mark.is_null() || mark.pos < 0 || static_cast<std::size_t>(mark.pos) >= source.size()) {
        return std::nullopt;
    }
    return node_span(source, found->node, static_cast<std::size_t>(mark.pos), found->in_flow);
}

std::string render_fragment(const Value& value, bool in_flow) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);

    if (in_flow && !is_container(value)) {
        // Wrapped so the emitter applies flow-context quoting
        out << YAML::BeginSeq;
        emit_yaml(out, value);
        out << YAML::EndSeq;
    } else {
        emit_yaml(out, value);
    }
    if (!out.good()) {
        throw StoreError("Failed to render YAML fragment: " + out.GetLastError());
    }

    std::string text = out.c_str();
    if (in_flow && !is_container(value)) {
        text = strip_outer_brackets(text);
    }
    return text;
}

std::optional<std::string> patch_document(const std::string& source,
                                          const Path& path,
                                          const Value& value) {
    for (const auto& seg : path) {
        if (seg.is_index() && seg.index < 0) {
            throw PathError(format_dot_path(path), "unresolved negative index");
        }
    }

    auto span = locate_node_span(source, path);
    if (!span) {
        return std::nullopt;
    }

    std::string fragment = render_fragment(value, span->in_flow);
    std::size_t begin = span->begin;

    // A block collection under "key:" or "-" moves up onto the indicator line
    if (!span->in_flow && begin < source.size() &&
        source[begin] != '[' && source[begin] != '{') {
        std::size_t back = begin;
        while (back > 0 && (is_blank_char(source[back - 1]) || is_line_break(source[back - 1]))) {
            --back;
        }
        const bool crossed_line = source.find('\n', back) < begin;
        if (crossed_line && back > 0 && (source[back - 1] == ':' || source[back - 1] == '-')) {
            begin = back;
            fragment = " " + fragment;
        }
    }

    std::string patched = source.substr(0, begin) + fragment + source.substr(span->end);

    Value expected = decode_document(source, Format::Yaml);
    set_value(expected, path, value);

    Value actual;
    try {
        actual = decode_document(patched, Format::Yaml);
    } catch (const ParseError& e) {
        LOG(WARNING) << "In-place patch of '" << format_dot_path(path)
                     << "' produced invalid YAML (" << e.what() << "); rewriting document";
        return std::nullopt;
    }
    if (actual != expected) {
        LOG(WARNING) << "In-place patch of '" << format_dot_path(path)
                     << "' changed other content; rewriting document";
        return std::nullopt;
    }

    VLOG(1) << "Patched '" << format_dot_path(path) << "' at bytes ["
            << begin << ", " << span->end << ")";
    return patched;
}

} // namespace confstore
