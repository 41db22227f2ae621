#pragma once

#include "jswitch/discovery.hpp"
#include "jswitch/result.hpp"

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace jswitch {

/**
 * Resolve one line of user input to a candidate.
 *
 * - empty (after trimming): the candidate named default_version, if set and
 *   present, else NoSelectionAndNoDefault
 * - otherwise a decimal integer in [1, candidates.size()], else InvalidSelection
 */
Result ResolveSelection(const std::string& input,
                        const std::vector<Candidate>& candidates,
                        const std::optional<std::string>& default_version,
                        Candidate& out);

// Reads a single line from `in` (EOF counts as an empty line) and resolves it.
Result ReadSelection(std::istream& in,
                     const std::vector<Candidate>& candidates,
                     const std::optional<std::string>& default_version,
                     Candidate& out);

} // namespace jswitch
