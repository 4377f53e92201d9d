#pragma once

#include "pathguard/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// Trusted Root
// ============================================================================

struct TrustedRootResult;

// Rejects empty or relative paths and paths containing NUL (InvalidRoot)
TrustedRootResult make_trusted_root(const std::string& path);

// An absolute, normalized directory beyond which no resolved path may escape.
// Immutable once created; obtain one through make_trusted_root().
class TrustedRoot {
public:
    const std::string& path() const { return path_; }
    const std::vector<std::string>& segments() const { return segments_; }

    bool operator==(const TrustedRoot& other) const { return path_ == other.path_; }
    bool operator!=(const TrustedRoot& other) const { return path_ != other.path_; }

private:
    friend TrustedRootResult make_trusted_root(const std::string& path);

    explicit TrustedRoot(std::string path);

    std::string path_;
    std::vector<std::string> segments_;
};

struct TrustedRootResult {
    bool ok = false;
    std::optional<TrustedRoot> root;
    PathError error = PathError::None;
};

// ============================================================================
// Resolution
// ============================================================================

struct ResolveOptions {
    // Anchor absolute-looking fragments at the root when true,
    // reject them with AbsoluteNotAllowed when false
    bool allow_absolute = true;
};

// Join the root with a caller-supplied fragment.
// - NUL in fragment -> NormalizationFailed
// - Empty or whitespace-only fragment -> EmptyInput
// The returned candidate is normalized but NOT validated: it may lie
// outside the root. Use validate() before touching the filesystem.
ResolveResult resolve(const TrustedRoot& root,
                      const std::string& fragment,
                      const ResolveOptions& options = {});

// ============================================================================
// Path Helpers
// ============================================================================

// Join two paths with exactly one separator and normalize.
// An empty or "." base yields the normalized rel.
std::string join_path(const std::string& base, const std::string& rel);

// Directory part of a path ("." when there is none)
std::string parent_directory(const std::string& path);

// Last component of a path (empty for "/" or an empty path)
std::string filename(const std::string& path);

// Lexical path of target relative to base.
// Returns nullopt when one path is absolute and the other relative,
// or when base has unresolvable leading ".." segments.
std::optional<std::string> relative_path(const std::string& base, const std::string& target);

} // namespace pathguard
