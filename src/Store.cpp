/**
 * @file Store.cpp
 * @brief ConfigStore implementation
 */

#include "confstore/Store.hpp"
#include "confstore/DotPath.hpp"
#include "confstore/Errors.hpp"
#include "confstore/FileLock.hpp"
#include "confstore/Parse.hpp"
#include "confstore/Patch.hpp"
#include "confstore/Tree.hpp"
#include "confstore/Util.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace confstore {

// ============================================================================
// Built-in templates
// ============================================================================

namespace {

const char* const kPlanningTemplate = R"(# confstore configuration
# Created from template: planning

helper:
  script: llm-support
  llm: gemini
  llm_cmd: "-p"
  max_lines: 2000

project:
  type: ""
  framework: ""
  package_manager: ""
  source_directory: src/

testing:
  runner: ""
  directory: ""
  cmd: ""
  coverage_cmd: ""

commands:
  lint: ""
  types: ""
  build: ""

tools:
  html2text: html2text
  clarification_script: ""
)";

const char* const kMinimalTemplate = R"(# confstore configuration
# Created from template: minimal

config: {}
)";

/**
 * @brief Apply one update to @p doc and report it
 *
 * The old value is looked up in @p before, which may be @p doc itself.
 */
Change apply_update(Value& doc, const Value& before, const std::string& key,
                    const Value& value) {
    const Path path = resolve_negative_indices(doc, parse_dot_path(key));
    Change change{key, get_value(before, path), value};
    set_value(doc, path, value);
    return change;
}

/**
 * @brief Apply updates in order, stopping at the first failure (S4)
 *
 * Old values are read from the document as it was before the batch, so a
 * key named twice reports the file's value both times.
 *
 * @throws BatchError wrapping the failing pair; @p doc may be partially
 *         updated and must be discarded
 */
std::vector<Change> apply_batch(Value& doc,
                                const std::vector<std::pair<std::string, Value>>& updates) {
    const Value original = doc;
    std::vector<Change> changes;
    changes.reserve(updates.size());
    for (size_t i = 0; i < updates.size(); ++i) {
        const auto& [key, value] = updates[i];
        try {
            changes.push_back(apply_update(doc, original, key, value));
        } catch (const StoreError& e) {
            throw BatchError(i, key, e.what());
        }
    }
    return changes;
}

std::vector<std::pair<std::string, Value>> coerce_pairs(
    const std::vector<std::pair<std::string, std::string>>& pairs) {
    std::vector<std::pair<std::string, Value>> updates;
    updates.reserve(pairs.size());
    for (const auto& [key, raw] : pairs) {
        updates.emplace_back(key, coerce_value(raw));
    }
    return updates;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

} // anonymous namespace

// ============================================================================
// Construction and file access
// ============================================================================

ConfigStore::ConfigStore(std::string file, StoreOptions options)
    : file_(std::move(file))
    , options_(std::move(options))
    , format_(detect_format(file_, options_.format))
{}

std::string ConfigStore::read_source(bool create_missing) const {
    // S6
    if (!file_exists(file_)) {
        if (create_missing) {
            return "";
        }
        throw FileNotFoundError(file_);
    }
    return read_text_file(file_);
}

Value ConfigStore::decode(const std::string& text) const {
    return decode_document(text, format_, file_);
}

void ConfigStore::persist(const std::string& content) const {
    write_file_atomic(file_, content, options_.write);
}

Value ConfigStore::peek(bool create_missing) const {
    return decode(read_source(create_missing));
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Value> ConfigStore::get(const std::string& key) const {
    FileLock lock(file_, FileLock::Mode::Shared, options_.lock_timeout);
    const Value doc = decode(read_source(false));
    return get_value(doc, parse_dot_path(key));
}

Value ConfigStore::get_or(const std::string& key, const Value& fallback) const {
    auto value = get(key);
    return value ? *value : fallback;
}

std::vector<std::pair<std::string, Value>> ConfigStore::multiget(
    const std::vector<std::string>& keys,
    const std::map<std::string, Value>& defaults) const {
    FileLock lock(file_, FileLock::Mode::Shared, options_.lock_timeout);
    const Value doc = decode(read_source(false));

    std::vector<std::pair<std::string, Value>> out;
    for (const auto& key : unique_keys(keys)) {
        if (auto value = get_value(doc, parse_dot_path(key))) {
            out.emplace_back(key, std::move(*value));
            continue;
        }
        auto it = defaults.find(key);
        if (it == defaults.end()) {
            throw NotFoundError(key);
        }
        out.emplace_back(key, it->second);
    }
    return out;
}

std::vector<std::pair<std::string, Value>> ConfigStore::list(const std::string& prefix) const {
    FileLock lock(file_, FileLock::Mode::Shared, options_.lock_timeout);
    const Value doc = decode(read_source(false));

    if (prefix.empty()) {
        return flatten_to_dotpaths(doc);
    }
    const Value* node = find_node(doc, parse_dot_path(prefix));
    if (node == nullptr) {
        throw NotFoundError(prefix);
    }
    return flatten_to_dotpaths(*node, prefix);
}

ValidationReport ConfigStore::validate(const std::vector<std::string>& required) const {
    FileLock lock(file_, FileLock::Mode::Shared, options_.lock_timeout);
    const Value doc = decode(read_source(false));

    std::vector<std::string> missing;
    for (const auto& raw : required) {
        const std::string key = trim(raw);
        if (key.empty()) continue;
        if (find_node(doc, parse_dot_path(key)) == nullptr) {
            missing.push_back(key);
        }
    }
    if (!missing.empty()) {
        throw MissingKeysError(std::move(missing));
    }

    ValidationReport report;
    report.key_count = count_keys(doc);
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        report.sections.push_back(it.key());
    }
    std::sort(report.sections.begin(), report.sections.end());
    return report;
}

// ============================================================================
// Mutations
// ============================================================================

std::vector<Change> ConfigStore::set(const std::string& key, const Value& value,
                                     const MutationOptions& options) {
    if (options.dry_run) {
        // S5
        Value doc = peek(options.create_missing);
        return {apply_update(doc, doc, key, value)};
    }

    FileLock lock(file_, FileLock::Mode::Exclusive, options_.lock_timeout);
    const std::string source = read_source(options.create_missing);
    Value doc = decode(source);

    const Path path = resolve_negative_indices(doc, parse_dot_path(key));
    Change change{key, get_value(doc, path), value};
    set_value(doc, path, value);

    std::optional<std::string> content;
    if (format_ == Format::Yaml && change.old_value) {
        // S2
        content = patch_document(source, path, value);
    }
    if (!content) {
        if (format_ == Format::Yaml && source.find('#') != std::string::npos) {
            LOG(WARNING) << "Re-serializing " << file_ << " to set '" << key
                         << "'; comments will not be kept";
        }
        content = encode_document(doc, format_);
    }

    persist(*content);
    return {change};
}

std::vector<Change> ConfigStore::multiset(
    const std::vector<std::pair<std::string, std::string>>& pairs,
    const MutationOptions& options) {
    const auto updates = coerce_pairs(pairs);

    if (options.dry_run) {
        Value doc = peek(options.create_missing);
        return apply_batch(doc, updates);
    }

    FileLock lock(file_, FileLock::Mode::Exclusive, options_.lock_timeout);
    Value doc = decode(read_source(options.create_missing));
    auto changes = apply_batch(doc, updates);

    persist(encode_document(doc, format_));
    VLOG(1) << "Set " << changes.size() << " keys in " << file_;
    return changes;
}

bool ConfigStore::erase(const std::string& key) {
    FileLock lock(file_, FileLock::Mode::Exclusive, options_.lock_timeout);
    Value doc = decode(read_source(false));

    const Path path = resolve_negative_indices(doc, parse_dot_path(key));
    if (!erase_value(doc, path)) {
        VLOG(1) << "'" << key << "' not present in " << file_ << "; nothing to delete";
        return false;
    }
    persist(encode_document(doc, format_));
    return true;
}

void ConfigStore::push(const std::string& key, const Value& value, bool create_missing) {
    FileLock lock(file_, FileLock::Mode::Exclusive, options_.lock_timeout);
    Value doc = decode(read_source(create_missing));

    push_value(doc, resolve_negative_indices(doc, parse_dot_path(key)), value);
    persist(encode_document(doc, format_));
}

Value ConfigStore::pop(const std::string& key) {
    FileLock lock(file_, FileLock::Mode::Exclusive, options_.lock_timeout);
    Value doc = decode(read_source(false));

    Value last = pop_value(doc, resolve_negative_indices(doc, parse_dot_path(key)));
    persist(encode_document(doc, format_));
    return last;
}

// ============================================================================
// Creation
// ============================================================================

std::optional<std::string> ConfigStore::builtin_template(const std::string& name) {
    if (name.empty() || name == "planning") {
        return std::string(kPlanningTemplate);
    }
    if (name == "minimal") {
        return std::string(kMinimalTemplate);
    }
    return std::nullopt;
}

InitResult ConfigStore::init(const std::string& file, const std::string& template_name,
                             bool force, StoreOptions options) {
    const Format format = detect_format(file, options.format);

    // Built-in templates are YAML; other formats get a re-encoded copy
    std::string content;
    Value doc;
    if (auto builtin = builtin_template(template_name)) {
        content = *builtin;
        doc = decode_document(content, Format::Yaml, template_name);
        if (format != Format::Yaml) {
            content = encode_document(doc, format);
        }
    } else {
        content = read_text_file(template_name);
        doc = decode_document(content, format, template_name);
    }

    const fs::path parent = fs::path(file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw IoError(parent.string(), "create directory", ec.message());
        }
    }

    FileLock lock(file, FileLock::Mode::Exclusive, options.lock_timeout);
    if (file_exists(file) && !force) {
        const Value existing = decode_document(read_text_file(file), format, file);
        return {InitStatus::Exists, count_keys(existing)};
    }

    write_file_atomic(file, content, options.write);
    return {InitStatus::Created, count_keys(doc)};
}

} // namespace confstore
