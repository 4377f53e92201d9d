#include "pathguard/sandbox.hpp"
#include "pathguard/normalizer.hpp"

namespace pathguard {

ValidationVerdict validate(const TrustedRoot& root, const std::string& candidate) {
    if (contains_nul(candidate)) {
        return {false, {}, PathError::NormalizationFailed};
    }
    if (candidate.empty()) {
        return {false, {}, PathError::EmptyInput};
    }

    std::string normalized = normalize(candidate);
    if (!is_absolute_path(normalized)) {
        return {false, {}, PathError::EscapesRoot};
    }

    const auto& root_segs = root.segments();
    auto cand_segs = split_segments(normalized);
    if (cand_segs.size() < root_segs.size()) {
        return {false, {}, PathError::EscapesRoot};
    }

    // Compare whole segments so "/home/user2" never matches "/home/user"
    for (size_t i = 0; i < root_segs.size(); ++i) {
        if (cand_segs[i] != root_segs[i]) {
            return {false, {}, PathError::EscapesRoot};
        }
    }

    return {true, normalized, PathError::None};
}

bool is_within_root(const TrustedRoot& root, const std::string& candidate) {
    return validate(root, candidate).safe;
}

} // namespace pathguard
