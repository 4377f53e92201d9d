#include "pathguard/normalizer.hpp"

#include <algorithm>

namespace pathguard {

namespace {

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

std::string join_segments(const std::vector<std::string>& segments) {
    std::string out;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += segments[i];
    }
    return out;
}

} // namespace

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

bool is_absolute_path(const std::string& path) {
    return !path.empty() && is_separator(path[0]);
}

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (is_separator(c)) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::string normalize(const std::string& path) {
    bool absolute = is_absolute_path(path);

    std::vector<std::string> normalized;
    for (const auto& part : split_segments(path)) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!normalized.empty() && normalized.back() != "..") {
                normalized.pop_back();
            } else if (!absolute) {
                normalized.push_back(part);
            }
            // ".." at the filesystem root stays at the root
        } else {
            normalized.push_back(part);
        }
    }

    if (absolute) {
        return "/" + join_segments(normalized);
    }
    if (normalized.empty()) {
        return ".";
    }
    return join_segments(normalized);
}

} // namespace pathguard
