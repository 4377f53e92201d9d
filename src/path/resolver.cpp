#include "pathguard/resolver.hpp"
#include "pathguard/normalizer.hpp"

#include <cctype>
#include <utility>

namespace pathguard {

namespace {

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string strip_leading_separators(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && (s[start] == '/' || s[start] == '\\')) {
        ++start;
    }
    return s.substr(start);
}

} // namespace

TrustedRoot::TrustedRoot(std::string path)
    : path_(std::move(path)), segments_(split_segments(path_)) {}

TrustedRootResult make_trusted_root(const std::string& path) {
    TrustedRootResult result;
    if (path.empty() || contains_nul(path) || !is_absolute_path(path)) {
        result.error = PathError::InvalidRoot;
        return result;
    }
    result.ok = true;
    result.root = TrustedRoot(normalize(path));
    return result;
}

ResolveResult resolve(const TrustedRoot& root,
                      const std::string& fragment,
                      const ResolveOptions& options) {
    if (contains_nul(fragment)) {
        return {false, {}, PathError::NormalizationFailed};
    }
    if (is_blank(fragment)) {
        return {false, {}, PathError::EmptyInput};
    }

    std::string normalized = normalize(fragment);
    if (is_absolute_path(normalized)) {
        if (!options.allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        normalized = strip_leading_separators(normalized);
    }

    // join_path normalizes the joined result, collapsing leading ".."
    // segments of the fragment against the root.
    return {true, join_path(root.path(), normalized), PathError::None};
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty() || base == ".") {
        return normalize(rel.empty() ? "." : rel);
    }
    if (rel.empty()) {
        return normalize(base);
    }

    std::string joined = base;
    if (joined.back() != '/' && joined.back() != '\\') {
        joined += '/';
    }
    joined += strip_leading_separators(rel);
    return normalize(joined);
}

std::string parent_directory(const std::string& path) {
    std::string portable = to_portable_path(path);
    while (portable.size() > 1 && portable.back() == '/') {
        portable.pop_back();
    }
    auto last_slash = portable.rfind('/');
    if (last_slash == std::string::npos) {
        return ".";
    }
    if (last_slash == 0) {
        return "/";
    }
    return normalize(portable.substr(0, last_slash));
}

std::string filename(const std::string& path) {
    std::string portable = to_portable_path(path);
    while (!portable.empty() && portable.back() == '/') {
        portable.pop_back();
    }
    auto last_slash = portable.rfind('/');
    if (last_slash == std::string::npos) {
        return portable;
    }
    return portable.substr(last_slash + 1);
}

std::optional<std::string> relative_path(const std::string& base, const std::string& target) {
    std::string norm_base = normalize(base);
    std::string norm_target = normalize(target);
    if (is_absolute_path(norm_base) != is_absolute_path(norm_target)) {
        return std::nullopt;
    }

    auto base_segs = split_segments(norm_base);
    auto target_segs = split_segments(norm_target);
    if (base_segs.size() == 1 && base_segs[0] == ".") base_segs.clear();
    if (target_segs.size() == 1 && target_segs[0] == ".") target_segs.clear();

    size_t common = 0;
    while (common < base_segs.size() && common < target_segs.size() &&
           base_segs[common] == target_segs[common]) {
        ++common;
    }

    std::string out;
    for (size_t i = common; i < base_segs.size(); ++i) {
        // Cannot climb out of an unknown parent
        if (base_segs[i] == "..") {
            return std::nullopt;
        }
        if (!out.empty()) out += '/';
        out += "..";
    }
    for (size_t i = common; i < target_segs.size(); ++i) {
        if (!out.empty()) out += '/';
        out += target_segs[i];
    }

    if (out.empty()) {
        return std::string(".");
    }
    return out;
}

} // namespace pathguard
