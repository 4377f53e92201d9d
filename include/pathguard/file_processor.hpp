#pragma once

#include "pathguard/clock.hpp"

#include <string>
#include <variant>

namespace pathguard {

// ============================================================================
// Transformation Policies
// ============================================================================

// Replace the last suffix ("archive.tar.gz" -> "archive.tar.zip"),
// or append one when the name has none. A suffix without a leading dot
// gets one; an empty suffix drops the last suffix.
struct ExtensionRewrite {
    std::string new_suffix;
};

// Move the file under target_dir, keeping its full name
struct Relocate {
    std::string target_dir;
};

// Insert separator + clock() between the stem and the first suffix:
// "app.log" -> "app_2025-01-04.log"
struct TimestampRotate {
    TimestampClock clock;
    std::string separator = "_";
};

using FileProcessor = std::variant<ExtensionRewrite, Relocate, TimestampRotate>;

// Compute the new path for original_path. Pure: performs no I/O.
// ExtensionRewrite and TimestampRotate only rename the last component; when
// the new name would not be a single component (it contains a separator or
// NUL, or is "." or "..") the result is empty.
std::string apply_processor(const FileProcessor& processor, const std::string& original_path);

// True when text holds no '/', '\\' or NUL and so cannot add path segments
// to a filename it is spliced into
bool is_single_component(const std::string& text);

// True for policies that rename in place and keep the directory
bool renames_in_place(const FileProcessor& processor);

// Human-readable description ("extension rewrite (to .mp3)")
std::string describe(const FileProcessor& processor);

// Short kind name: "extension_rewrite", "relocate" or "timestamp_rotate"
const char* processor_kind(const FileProcessor& processor);

} // namespace pathguard
