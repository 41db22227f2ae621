#pragma once

#include "jswitch/result.hpp"

#include <string>
#include <vector>

namespace jswitch {

// One installed runtime: an immediate subdirectory of the base directory.
struct Candidate {
    std::string name; // directory name, used as the version label
    std::string path; // full path
};

/**
 * Enumerate the immediate subdirectories of base_dir, sorted by name
 * (byte-wise lexicographic, so "17" < "21" < "8").
 *
 * Fails with BaseDirectoryNotFound if base_dir is missing or not a directory,
 * and NoInstallationsFound if it has no subdirectories.
 */
Result DiscoverInstallations(const std::string& base_dir, std::vector<Candidate>& out);

} // namespace jswitch
