#include "pathguard/types.hpp"

#include <algorithm>
#include <cctype>

namespace pathguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<PathError> parse_path_error(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "none") return PathError::None;
    if (lower == "empty_input") return PathError::EmptyInput;
    if (lower == "escapes_root") return PathError::EscapesRoot;
    if (lower == "normalization_failed") return PathError::NormalizationFailed;
    if (lower == "absolute_not_allowed") return PathError::AbsoluteNotAllowed;
    if (lower == "invalid_root") return PathError::InvalidRoot;
    if (lower == "invalid_filename") return PathError::InvalidFilename;

    return std::nullopt;
}

} // namespace pathguard
