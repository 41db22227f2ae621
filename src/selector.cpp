#include "jswitch/selector.hpp"
#include "jswitch/logger.hpp"

#include <cctype>
#include <charconv>
#include <string_view>

namespace jswitch {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

Result ResolveSelection(const std::string& input,
                        const std::vector<Candidate>& candidates,
                        const std::optional<std::string>& default_version,
                        Candidate& out) {
    const std::string_view text = Trim(input);

    if (text.empty()) {
        if (default_version) {
            for (const auto& c : candidates) {
                if (c.name == *default_version) {
                    LogDebug("Empty input, using default version %s", c.name.c_str());
                    out = c;
                    return Result::Ok();
                }
            }
        }
        return Result::Fail(ErrorKind::NoSelectionAndNoDefault,
                            default_version
                                ? "No selection made and default version '" + *default_version +
                                      "' is not installed"
                                : std::string("No selection made and no default version configured"));
    }

    size_t index = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc() || ptr != last || index < 1 || index > candidates.size()) {
        return Result::Fail(ErrorKind::InvalidSelection,
                            "Invalid selection '" + std::string(text) + "': expected a number between 1 and " +
                                std::to_string(candidates.size()));
    }

    out = candidates[index - 1];
    return Result::Ok();
}

Result ReadSelection(std::istream& in,
                     const std::vector<Candidate>& candidates,
                     const std::optional<std::string>& default_version,
                     Candidate& out) {
    std::string line;
    if (!std::getline(in, line)) line.clear();
    return ResolveSelection(line, candidates, default_version, out);
}

} // namespace jswitch
