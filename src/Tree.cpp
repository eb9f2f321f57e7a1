/**
 * @file Tree.cpp
 * @brief Implementation of path-addressed document operations
 */

#include "confstore/Tree.hpp"
#include "confstore/Errors.hpp"

namespace confstore {

namespace {
    std::string prefix_of(const Path& path, size_t count) {
        return format_dot_path(Path(path.begin(), path.begin() + count));
    }

    /**
     * @brief Resolve an index segment against a sequence for writing
     * @throws PathError if @p node is not a sequence or the index is
     *         invalid or out of bounds
     */
    size_t checked_index(const Value* node, const Path& path, size_t pos) {
        const auto& seg = path[pos];
        if (node == nullptr || !node->is_array()) {
            throw PathError(format_dot_path(path),
                            "index applied to " +
                            (node ? type_name(*node) : std::string("missing node")) +
                            " at '" + prefix_of(path, pos) + "' (not an array)");
        }
        if (!seg.valid) {
            throw PathError(format_dot_path(path),
                            "invalid array index '" + seg.text + "'");
        }
        const auto idx = normalize_index(seg.index, node->size());
        if (idx < 0) {
            throw PathError(format_dot_path(path),
                            "index " + std::to_string(seg.index) +
                            " out of bounds (length " +
                            std::to_string(node->size()) + ")");
        }
        return static_cast<size_t>(idx);
    }

    /**
     * @brief Run set_value's traversal without touching the document
     *
     * Nodes that set_value would create or replace are tracked as
     * nullptr, so any index applied to them fails here first and
     * set_value itself never throws halfway through a mutation.
     */
    void check_settable(const Value& doc, const Path& path) {
        const Value* current = &doc;
        for (size_t i = 0; i < path.size(); ++i) {
            const auto& seg = path[i];
            if (seg.is_key()) {
                if (current != nullptr && current->is_object()) {
                    auto it = current->find(seg.text);
                    current = it != current->end() ? &*it : nullptr;
                } else {
                    current = nullptr;
                }
            } else {
                current = &(*current)[checked_index(current, path, i)];
            }
        }
    }

    Value* find_mutable(Value& doc, const Path& path) {
        return const_cast<Value*>(find_node(doc, path));
    }
}

const Value* find_node(const Value& doc, const Path& path) {
    const Value* current = &doc;

    for (const auto& seg : path) {
        if (seg.is_key()) {
            if (!current->is_object()) {
                return nullptr;
            }
            auto it = current->find(seg.text);
            if (it == current->end()) {
                return nullptr;
            }
            current = &*it;
        } else {
            if (!current->is_array() || !seg.valid) {
                return nullptr;
            }
            const auto idx = normalize_index(seg.index, current->size());
            if (idx < 0) {
                return nullptr;
            }
            current = &(*current)[static_cast<size_t>(idx)];
        }
    }

    return current;
}

std::optional<Value> get_value(const Value& doc, const Path& path) {
    const Value* node = find_node(doc, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    return *node;
}

void set_value(Value& doc, const Path& path, Value value) {
    if (path.empty()) {
        throw PathError("", "empty path");
    }
    check_settable(doc, path);

    Value* current = &doc;
    for (size_t i = 0; i < path.size(); ++i) {
        const auto& seg = path[i];
        const bool last = i + 1 == path.size();

        if (seg.is_key()) {
            if (!current->is_object()) {
                // Scalar or sequence where a mapping is needed: replaced
                *current = Value::object();
            }
            if (last) {
                (*current)[seg.text] = std::move(value);
                return;
            }
            current = &(*current)[seg.text];
        } else {
            Value& elem = (*current)[checked_index(current, path, i)];
            if (last) {
                elem = std::move(value);
                return;
            }
            current = &elem;
        }
    }
}

bool erase_value(Value& doc, const Path& path) {
    if (path.empty()) {
        throw PathError("", "empty path");
    }
    if (path.back().is_index()) {
        throw PathError(format_dot_path(path),
                        "removing sequence elements is not supported");
    }

    Value* current = &doc;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const auto& seg = path[i];

        if (seg.is_key() ? !current->is_object() : !current->is_array()) {
            throw PathError(format_dot_path(path),
                            "'" + prefix_of(path, i) + "' is not traversable (" +
                            type_name(*current) + ")");
        }

        if (seg.is_key()) {
            auto it = current->find(seg.text);
            if (it == current->end()) {
                return false;
            }
            current = &*it;
        } else {
            const auto idx = seg.valid ? normalize_index(seg.index, current->size()) : -1;
            if (idx < 0) {
                return false;
            }
            current = &(*current)[static_cast<size_t>(idx)];
        }
    }

    if (!current->is_object()) {
        throw PathError(format_dot_path(path),
                        "'" + prefix_of(path, path.size() - 1) +
                        "' is not traversable (" + type_name(*current) + ")");
    }
    return current->erase(path.back().text) > 0;
}

void push_value(Value& doc, const Path& path, Value value) {
    Value* node = find_mutable(doc, path);
    if (node == nullptr) {
        Value seq = Value::array();
        seq.push_back(std::move(value));
        set_value(doc, path, std::move(seq));
        return;
    }
    if (!node->is_array()) {
        throw PathError(format_dot_path(path), "not an array");
    }
    node->push_back(std::move(value));
}

Value pop_value(Value& doc, const Path& path) {
    Value* node = find_mutable(doc, path);
    if (node == nullptr) {
        throw NotFoundError(format_dot_path(path));
    }
    if (!node->is_array()) {
        throw PathError(format_dot_path(path), "not an array");
    }
    if (node->empty()) {
        throw PathError(format_dot_path(path), "empty array");
    }

    Value last = node->back();
    node->erase(node->size() - 1);
    return last;
}

} // namespace confstore
