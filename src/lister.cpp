#include "jswitch/lister.hpp"

#include <sstream>

namespace jswitch {

std::string FormatListing(const std::vector<Candidate>& candidates,
                          const std::optional<std::string>& default_version) {
    std::ostringstream ss;
    for (size_t i = 0; i < candidates.size(); ++i) {
        ss << "  " << (i + 1) << ") " << candidates[i].name;
        if (default_version && candidates[i].name == *default_version) {
            ss << ' ' << kDefaultMarker;
        }
        ss << '\n';
    }
    return ss.str();
}

void PrintListing(std::ostream& os,
                  const std::vector<Candidate>& candidates,
                  const std::optional<std::string>& default_version) {
    os << "Installed versions:\n" << FormatListing(candidates, default_version);
    os.flush();
}

} // namespace jswitch
