#include "pathguard/file_processor.hpp"
#include "pathguard/extensions.hpp"
#include "pathguard/normalizer.hpp"
#include "pathguard/resolver.hpp"

#include <type_traits>

namespace pathguard {

namespace {

template <class>
inline constexpr bool always_false = false;

// Rebuild a path from its directory and a new filename.
// Keeps relative inputs relative ("report.pdf" stays without "./").
// Returns an empty string when name is not exactly one component.
std::string with_filename(const std::string& original_path, const std::string& name) {
    if (name.empty() || name == "." || name == ".." || !is_single_component(name)) {
        return {};
    }
    if (to_portable_path(original_path).find('/') == std::string::npos) {
        return name;
    }
    return join_path(parent_directory(original_path), name);
}

std::string rewrite_extension(const ExtensionRewrite& p, const std::string& original_path) {
    SplitName split = split_extensions(original_path);

    std::string suffix = p.new_suffix;
    if (!suffix.empty() && suffix[0] != '.') {
        suffix.insert(suffix.begin(), '.');
    }

    ExtensionChain chain = split.chain;
    if (!chain.empty()) {
        chain.pop_back();
    }
    if (!suffix.empty()) {
        chain.push_back(suffix);
    }

    SplitName renamed{split.stem, chain};
    return with_filename(original_path, renamed.filename());
}

std::string relocate(const Relocate& p, const std::string& original_path) {
    return join_path(p.target_dir, filename(original_path));
}

std::string rotate(const TimestampRotate& p, const std::string& original_path) {
    SplitName split = split_extensions(original_path);
    std::string token = p.clock ? p.clock() : std::string();
    if (token.empty()) {
        return with_filename(original_path, split.filename());
    }
    SplitName rotated{split.stem + p.separator + token, split.chain};
    return with_filename(original_path, rotated.filename());
}

} // namespace

bool is_single_component(const std::string& text) {
    return text.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

bool renames_in_place(const FileProcessor& processor) {
    return !std::holds_alternative<Relocate>(processor);
}

std::string apply_processor(const FileProcessor& processor, const std::string& original_path) {
    return std::visit([&](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ExtensionRewrite>) {
            return rewrite_extension(p, original_path);
        } else if constexpr (std::is_same_v<T, Relocate>) {
            return relocate(p, original_path);
        } else if constexpr (std::is_same_v<T, TimestampRotate>) {
            return rotate(p, original_path);
        } else {
            static_assert(always_false<T>, "unhandled file processor");
        }
    }, processor);
}

std::string describe(const FileProcessor& processor) {
    return std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ExtensionRewrite>) {
            if (p.new_suffix.empty()) {
                return "extension rewrite (drops last suffix)";
            }
            return "extension rewrite (to " + p.new_suffix + ")";
        } else if constexpr (std::is_same_v<T, Relocate>) {
            return "relocate (to " + p.target_dir + ")";
        } else if constexpr (std::is_same_v<T, TimestampRotate>) {
            return "timestamp rotate (inserts timestamp before first suffix)";
        } else {
            static_assert(always_false<T>, "unhandled file processor");
        }
    }, processor);
}

const char* processor_kind(const FileProcessor& processor) {
    return std::visit([](const auto& p) -> const char* {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ExtensionRewrite>) {
            return "extension_rewrite";
        } else if constexpr (std::is_same_v<T, Relocate>) {
            return "relocate";
        } else if constexpr (std::is_same_v<T, TimestampRotate>) {
            return "timestamp_rotate";
        } else {
            static_assert(always_false<T>, "unhandled file processor");
        }
    }, processor);
}

} // namespace pathguard
