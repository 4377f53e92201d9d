#pragma once

#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Path Errors
// ============================================================================

enum class PathError {
    None,
    EmptyInput,            // fragment empty or all whitespace
    EscapesRoot,           // candidate lies outside the trusted root
    NormalizationFailed,   // unsupported characters (embedded NUL)
    AbsoluteNotAllowed,    // absolute fragment under the strict policy
    InvalidRoot,           // trusted root is empty, relative or contains NUL
    InvalidFilename,       // a policy produced a name that is not one component
};

// Convert error to its canonical lowercase snake_case key
inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::EmptyInput: return "empty_input";
        case PathError::EscapesRoot: return "escapes_root";
        case PathError::NormalizationFailed: return "normalization_failed";
        case PathError::AbsoluteNotAllowed: return "absolute_not_allowed";
        case PathError::InvalidRoot: return "invalid_root";
        case PathError::InvalidFilename: return "invalid_filename";
        default: return "unknown";
    }
}

// Parse an error key (case-insensitive)
std::optional<PathError> parse_path_error(const std::string& key);

// ============================================================================
// Results
// ============================================================================

// Candidate produced by joining the trusted root with a fragment.
// A candidate is not yet validated and may lie outside the root.
struct ResolveResult {
    bool ok = false;
    std::string path;
    PathError error = PathError::None;
};

// Safe(path) when safe is true, Blocked(reason) otherwise
struct ValidationVerdict {
    bool safe = false;
    std::string path;
    PathError reason = PathError::None;
};

// ============================================================================
// Pipeline Stages
// ============================================================================

enum class PipelineStage {
    Start,
    Normalized,
    Resolved,
    Validated,
    Transformed,
    Done
};

inline const char* pipeline_stage_to_string(PipelineStage s) {
    switch (s) {
        case PipelineStage::Start: return "start";
        case PipelineStage::Normalized: return "normalized";
        case PipelineStage::Resolved: return "resolved";
        case PipelineStage::Validated: return "validated";
        case PipelineStage::Transformed: return "transformed";
        case PipelineStage::Done: return "done";
        default: return "unknown";
    }
}

} // namespace pathguard
