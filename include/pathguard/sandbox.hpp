#pragma once

#include "pathguard/resolver.hpp"
#include "pathguard/types.hpp"

#include <string>

namespace pathguard {

// Decide whether a candidate lies within the trusted root.
//
// The comparison is done on path segments, never on raw characters, so root
// "/home/user" does not contain "/home/user2" or "/home/user-evil". The
// candidate is normalized first; relative candidates are always blocked.
//
// Lexical only: a symlink inside the root that points outside it is not
// detected. Deployments must re-check the physical target before writing.
ValidationVerdict validate(const TrustedRoot& root, const std::string& candidate);

bool is_within_root(const TrustedRoot& root, const std::string& candidate);

} // namespace pathguard
