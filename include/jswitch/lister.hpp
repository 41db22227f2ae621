#pragma once

#include "jswitch/discovery.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jswitch {

inline constexpr const char* kDefaultMarker = "(default)";

// "  1) 17\n  2) 21 (default)\n ..." with 1-based indices.
std::string FormatListing(const std::vector<Candidate>& candidates,
                          const std::optional<std::string>& default_version);

void PrintListing(std::ostream& os,
                  const std::vector<Candidate>& candidates,
                  const std::optional<std::string>& default_version);

} // namespace jswitch
