#include "confstore/Util.hpp"
#include "confstore/DotPath.hpp"
#include "confstore/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace confstore {

std::string read_text_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw FileNotFoundError(path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError(path, "read", std::strerror(errno));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw IoError(path, "read", "stream error");
    }
    return buf.str();
}

namespace {

void flatten_into(const Value& node, Path& path,
                  std::vector<std::pair<std::string, Value>>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        path.push_back(Segment::key(it.key()));
        if (it.value().is_object()) {
            flatten_into(it.value(), path, out);
        } else {
            out.emplace_back(format_dot_path(path), it.value());
        }
        path.pop_back();
    }
}

} // anonymous namespace

std::vector<std::pair<std::string, Value>> flatten_to_dotpaths(
    const Value& data, const std::string& prefix) {
    std::vector<std::pair<std::string, Value>> out;
    if (!data.is_object()) {
        out.emplace_back(prefix, data);
        return out;
    }
    Path path;
    flatten_into(data, path, out);
    if (!prefix.empty()) {
        for (auto& entry : out) {
            entry.first = prefix + "." + entry.first;
        }
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

std::size_t count_keys(const Value& data) {
    if (!data.is_object()) {
        return 0;
    }
    std::size_t n = 0;
    for (const auto& item : data) {
        n += item.is_object() ? count_keys(item) : 1;
    }
    return n;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::vector<std::string> read_keys_file(const std::string& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        throw FileNotFoundError(path);
    }
    if (fs::is_symlink(status)) {
        throw IoError(path, "read keys from", "refusing to follow symlink");
    }
    if (!fs::is_regular_file(status)) {
        throw IoError(path, "read keys from", "not a regular file");
    }

    std::vector<std::string> keys;
    std::istringstream lines(read_text_file(path));
    std::string line;
    while (std::getline(lines, line)) {
        const std::string key = trim(line);
        if (key.empty() || key[0] == '#') continue;
        keys.push_back(key);
    }
    return keys;
}

std::vector<std::string> unique_keys(const std::vector<std::string>& keys) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& k : keys) {
        if (seen.insert(k).second) {
            out.push_back(k);
        }
    }
    return out;
}

} // namespace confstore
