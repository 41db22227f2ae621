#include "jswitch/config.hpp"
#include "jswitch/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace jswitch {

namespace {

constexpr const char* kFieldJavaBase = "JavaBase";
constexpr const char* kFieldLogPath = "LogPath";
constexpr const char* kFieldDefaultVersion = "DefaultVersion";

// Reads an optional string field. Absent, null and "" all mean "not set".
Result ReadOptionalString(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    out.reset();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return Result::Ok();
    if (!it->is_string()) {
        return Result::Fail(ErrorKind::ConfigParseError,
                            std::string("Field '") + key + "' must be a string");
    }
    auto value = it->get<std::string>();
    if (!value.empty()) out = std::move(value);
    return Result::Ok();
}

fs::path ExecutablePath(const char* argv0) {
    std::error_code ec;
#ifdef _WIN32
    char buf[MAX_PATH];
    DWORD n = ::GetModuleFileNameA(nullptr, buf, MAX_PATH);
    if (n > 0 && n < MAX_PATH) return fs::path(std::string(buf, n));
#else
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) return self;
#endif
    if (argv0 == nullptr || *argv0 == '\0') return fs::path();
    fs::path p(argv0);
    auto abs = fs::absolute(p, ec);
    return ec ? p : abs;
}

} // namespace

Result ParseConfig(const std::string& text, Config& out) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result::Fail(ErrorKind::ConfigParseError, std::string("Invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        return Result::Fail(ErrorKind::ConfigParseError, "Configuration must be a JSON object");
    }

    Config cfg;

    std::optional<std::string> base;
    if (auto r = ReadOptionalString(j, kFieldJavaBase, base); !r.ok) return r;
    if (!base) {
        return Result::Fail(ErrorKind::MissingRequiredField,
                            std::string("Missing required field '") + kFieldJavaBase + "'");
    }
    cfg.base_directory = std::move(*base);

    if (auto r = ReadOptionalString(j, kFieldLogPath, cfg.log_directory); !r.ok) return r;
    if (auto r = ReadOptionalString(j, kFieldDefaultVersion, cfg.default_version); !r.ok) return r;

    out = std::move(cfg);
    return Result::Ok();
}

Result LoadConfig(const std::string& path, Config& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result::Fail(ErrorKind::ConfigNotFound, "Configuration file not found: " + path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    LogDebug("Loading configuration: %s", path.c_str());
    auto r = ParseConfig(ss.str(), out);
    if (!r.ok) {
        r.msg = path + ": " + r.msg;
        return r;
    }

    LogDebug("JavaBase=%s LogPath=%s DefaultVersion=%s",
             out.base_directory.c_str(),
             out.log_directory.value_or("<none>").c_str(),
             out.default_version.value_or("<none>").c_str());
    return Result::Ok();
}

std::string DefaultConfigPath(const char* argv0) {
    fs::path exe = ExecutablePath(argv0);
    return (exe.parent_path() / kConfigRelativePath).lexically_normal().string();
}

} // namespace jswitch
