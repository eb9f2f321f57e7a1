/**
 * @file DotPath.cpp
 * @brief Implementation of path expression parsing and index resolution
 */

#include "confstore/DotPath.hpp"
#include "confstore/Errors.hpp"
#include <regex>
#include <sstream>

namespace confstore {

namespace {
    /**
     * @brief Parse bracket content as a signed 64-bit integer
     * @param text Content between "[" and "]"
     * @param out Receives the parsed value
     * @return false if text is not a (representable) integer
     */
    bool parse_index(const std::string& text, std::int64_t& out) {
        static const std::regex int_re("^[+-]?[0-9]+$");
        if (!std::regex_match(text, int_re)) {
            return false;
        }
        try {
            out = static_cast<std::int64_t>(std::stoll(text));
            return true;
        } catch (const std::out_of_range&) {
            return false;
        }
    }

    Segment index_segment(const std::string& text) {
        Segment seg;
        seg.kind = Segment::Kind::Index;
        seg.text = text;
        seg.valid = parse_index(text, seg.index);
        return seg;
    }
}

Segment Segment::key(std::string name) {
    Segment seg;
    seg.kind = Kind::Key;
    seg.text = std::move(name);
    return seg;
}

Segment Segment::at(std::int64_t idx) {
    Segment seg;
    seg.kind = Kind::Index;
    seg.index = idx;
    seg.text = std::to_string(idx);
    return seg;
}

bool Segment::operator==(const Segment& other) const {
    if (kind != other.kind) return false;
    if (kind == Kind::Key) return text == other.text;
    if (valid != other.valid) return false;
    return valid ? index == other.index : text == other.text;
}

Path parse_dot_path(const std::string& expr) {
    Path segments;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            segments.push_back(Segment::key(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < expr.size(); ++i) {
        const char c = expr[i];

        if (c == '\\' && i + 1 < expr.size() && expr[i + 1] == '.') {
            current += '.';
            ++i;
        } else if (c == '.') {
            flush();
        } else if (c == '[') {
            const auto close = expr.find(']', i + 1);
            if (close == std::string::npos) {
                // No closing bracket: keep "[" as part of the key
                current += c;
                continue;
            }
            flush();
            segments.push_back(index_segment(expr.substr(i + 1, close - i - 1)));
            i = close;
        } else {
            current += c;
        }
    }

    flush();
    return segments;
}

std::string format_dot_path(const Path& path) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : path) {
        if (seg.is_index()) {
            oss << '[' << (seg.valid ? std::to_string(seg.index) : seg.text) << ']';
        } else {
            if (!first) oss << '.';
            for (char c : seg.text) {
                if (c == '.') oss << '\\';
                oss << c;
            }
        }
        first = false;
    }
    return oss.str();
}

std::int64_t normalize_index(std::int64_t idx, std::size_t len) noexcept {
    const auto size = static_cast<std::int64_t>(len);
    const std::int64_t resolved = idx < 0 ? size + idx : idx;
    if (resolved < 0 || resolved >= size) {
        return -1;
    }
    return resolved;
}

Path resolve_negative_indices(const Value& doc, const Path& path) {
    Path resolved;
    resolved.reserve(path.size());

    // nullptr once the walk has left the existing document
    const Value* current = &doc;

    for (const auto& seg : path) {
        if (seg.is_index() && seg.valid && seg.index < 0) {
            if (current == nullptr || !current->is_array()) {
                throw PathError(format_dot_path(path),
                                "negative index " + std::to_string(seg.index) +
                                " used on non-sequence at '" +
                                format_dot_path(resolved) + "'");
            }
            const auto idx = normalize_index(seg.index, current->size());
            if (idx < 0) {
                throw PathError(format_dot_path(path),
                                "index " + std::to_string(seg.index) +
                                " out of bounds (length " +
                                std::to_string(current->size()) + ")");
            }
            resolved.push_back(Segment::at(idx));
            current = &(*current)[static_cast<size_t>(idx)];
            continue;
        }

        resolved.push_back(seg);
        if (current == nullptr) {
            continue;
        }

        if (seg.is_key()) {
            if (current->is_object()) {
                auto it = current->find(seg.text);
                current = it != current->end() ? &*it : nullptr;
            } else {
                current = nullptr;
            }
        } else if (current->is_array() && seg.valid &&
                   normalize_index(seg.index, current->size()) >= 0) {
            current = &(*current)[static_cast<size_t>(seg.index)];
        } else {
            current = nullptr;
        }
    }

    return resolved;
}

} // namespace confstore
