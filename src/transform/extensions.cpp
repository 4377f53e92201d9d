#include "pathguard/extensions.hpp"
#include "pathguard/resolver.hpp"

#include <algorithm>

namespace pathguard {

std::string SplitName::filename() const {
    return stem + full_extension();
}

std::string SplitName::extension() const {
    if (chain.empty()) {
        return {};
    }
    return chain.back();
}

std::string SplitName::full_extension() const {
    std::string out;
    for (const auto& suffix : chain) {
        out += suffix;
    }
    return out;
}

SplitName split_extensions(const std::string& name) {
    SplitName result;
    result.stem = pathguard::filename(name);

    // Dots in the leading run (".bashrc", "..foo") never start a suffix
    size_t leading = 0;
    while (leading < result.stem.size() && result.stem[leading] == '.') {
        ++leading;
    }

    while (true) {
        auto dot = result.stem.rfind('.');
        if (dot == std::string::npos || dot < leading) {
            break;
        }
        if (dot + 1 == result.stem.size()) {
            break;
        }
        result.chain.push_back(result.stem.substr(dot));
        result.stem.erase(dot);
    }

    std::reverse(result.chain.begin(), result.chain.end());
    return result;
}

} // namespace pathguard
