#include "jswitch/path_rewriter.hpp"

#include <cctype>
#include <string_view>
#include <vector>

namespace jswitch {

namespace {

bool CharEquals(char a, char b, const PathRules& rules) {
    if (!rules.case_insensitive) return a == b;
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool StartsWith(std::string_view s, std::string_view prefix, const PathRules& rules) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (!CharEquals(s[i], prefix[i], rules)) return false;
    }
    return true;
}

bool EndsWith(std::string_view s, std::string_view suffix, const PathRules& rules) {
    if (s.size() < suffix.size()) return false;
    return StartsWith(s.substr(s.size() - suffix.size()), suffix, rules);
}

std::vector<std::string> Split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

} // namespace

PathRules NativePathRules() {
#ifdef _WIN32
    return PathRules{';', '\\', true};
#else
    return PathRules{':', '/', false};
#endif
}

std::string BinDirFor(const std::string& install_dir, const PathRules& rules) {
    std::string dir = install_dir;
    while (dir.size() > 1 && dir.back() == rules.dir_separator) dir.pop_back();
    return dir + rules.dir_separator + "bin";
}

bool IsManagedBinSegment(const std::string& segment, const std::string& base_root, const PathRules& rules) {
    std::string_view base(base_root);
    while (base.size() > 1 && base.back() == rules.dir_separator) base.remove_suffix(1);
    if (base.empty()) return false;

    std::string_view seg(segment);
    if (!seg.empty() && seg.back() == rules.dir_separator) seg.remove_suffix(1);

    // <base><sep><version...><sep>bin
    if (!StartsWith(seg, base, rules)) return false;
    seg.remove_prefix(base.size());
    // A root base ("/") already ends in the separator.
    if (base.back() != rules.dir_separator) {
        if (seg.empty() || seg.front() != rules.dir_separator) return false;
        seg.remove_prefix(1);
    }

    const std::string bin_suffix = std::string(1, rules.dir_separator) + "bin";
    if (!EndsWith(seg, bin_suffix, rules)) return false;
    seg.remove_suffix(bin_suffix.size());

    return !seg.empty();
}

std::string RewriteSearchPath(const std::string& current,
                              const std::string& base_root,
                              const std::string& selection,
                              const PathRules& rules) {
    std::string out = BinDirFor(selection, rules);
    if (current.empty()) return out;

    for (const auto& segment : Split(current, rules.list_separator)) {
        if (IsManagedBinSegment(segment, base_root, rules)) continue;
        out += rules.list_separator;
        out += segment;
    }
    return out;
}

} // namespace jswitch
