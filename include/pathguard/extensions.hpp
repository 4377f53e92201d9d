#pragma once

#include <string>
#include <vector>

namespace pathguard {

// Ordered suffixes, each with its leading dot: {".tar", ".gz"}
using ExtensionChain = std::vector<std::string>;

struct SplitName {
    std::string stem;
    ExtensionChain chain;

    // stem followed by every suffix
    std::string filename() const;

    // Last suffix, or empty when the chain is empty
    std::string extension() const;

    // All suffixes joined: ".tar.gz"
    std::string full_extension() const;
};

// Decompose the last component of a path into stem and suffixes.
//
//   "archive.tar.gz" -> {"archive", {".tar", ".gz"}}
//   ".gitignore"     -> {".gitignore", {}}   leading dots belong to the stem
//   "file."          -> {"file.", {}}        empty suffixes are not split
//
// The split is greedy: "name.with.dots.txt" yields three suffixes. It is a
// naming heuristic, not content detection. The stem never contains a
// separator.
SplitName split_extensions(const std::string& filename);

} // namespace pathguard
