#include "jswitch/discovery.hpp"
#include "jswitch/logger.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace jswitch {

Result DiscoverInstallations(const std::string& base_dir, std::vector<Candidate>& out) {
    out.clear();

    std::error_code ec;
    if (base_dir.empty() || !fs::is_directory(base_dir, ec)) {
        return Result::Fail(ErrorKind::BaseDirectoryNotFound, ec.value(),
                            "Base directory not found: " + base_dir);
    }

    std::vector<Candidate> found;
    fs::directory_iterator it(base_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::BaseDirectoryNotFound, ec.value(),
                            "Cannot read base directory " + base_dir + ": " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;
        found.push_back({it->path().filename().string(), it->path().string()});
    }
    if (ec) {
        return Result::Fail(ErrorKind::BaseDirectoryNotFound, ec.value(),
                            "Failed while listing " + base_dir + ": " + ec.message());
    }

    if (found.empty()) {
        return Result::Fail(ErrorKind::NoInstallationsFound,
                            "No installations found under " + base_dir);
    }

    std::sort(found.begin(), found.end(),
              [](const Candidate& a, const Candidate& b) { return a.name < b.name; });

    LogDebug("Discovered %zu installation(s) under %s", found.size(), base_dir.c_str());
    out = std::move(found);
    return Result::Ok();
}

} // namespace jswitch
