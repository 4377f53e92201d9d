#pragma once

#include <string>
#include <vector>

namespace pathguard {

// Convert a path to use forward slashes.
// pathguard uses '/' internally regardless of the host convention; callers
// convert back at the I/O boundary.
std::string to_portable_path(const std::string& path);

// True if the path starts with a separator ('/' or '\')
bool is_absolute_path(const std::string& path);

// True if the string contains an embedded NUL byte
bool contains_nul(const std::string& s);

// Split on separators, dropping empty segments
std::vector<std::string> split_segments(const std::string& path);

// Lexically normalize a path without touching the filesystem.
// - Converts '\' to '/' and collapses repeated separators
// - Drops "." segments
// - Resolves ".." against the preceding non-".." segment
// - Keeps unresolvable leading ".." in relative paths; drops them at "/"
// - Returns "." for an empty relative result and "/" for an empty absolute one
// Total and idempotent: normalize(normalize(p)) == normalize(p).
std::string normalize(const std::string& path);

} // namespace pathguard
