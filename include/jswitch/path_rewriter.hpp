#pragma once

#include <string>

namespace jswitch {

struct PathRules {
    char list_separator = ':';
    char dir_separator = '/';
    bool case_insensitive = false;
};

// ';' and '\' with case-insensitive matching on Windows, ':' and '/' elsewhere.
PathRules NativePathRules();

// <install_dir><dir_separator>bin
std::string BinDirFor(const std::string& install_dir, const PathRules& rules);

// True if `segment` is "<base_root>/<something>/bin", optionally with a trailing separator.
bool IsManagedBinSegment(const std::string& segment, const std::string& base_root, const PathRules& rules);

/**
 * Drop every managed bin segment from `current` and prepend the bin directory
 * of `selection`. Unrelated segments keep their order and spelling.
 * Applying it twice with the same selection gives the same result as once.
 */
std::string RewriteSearchPath(const std::string& current,
                              const std::string& base_root,
                              const std::string& selection,
                              const PathRules& rules);

} // namespace jswitch
