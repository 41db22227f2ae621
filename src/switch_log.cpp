#include "jswitch/switch_log.hpp"
#include "jswitch/logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace jswitch {

std::string FormatSwitchLogLine(std::time_t when, const std::string& selection) {
    std::tm tm{};
#ifdef _WIN32
    ::localtime_s(&tm, &when);
#else
    ::localtime_r(&when, &tm);
#endif
    char stamp[32];
    const size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(stamp, n) + " | JAVA_HOME set to " + selection;
}

Result AppendSwitchLog(const std::string& log_dir, const std::string& selection, std::time_t when) {
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::LogWriteFailed, ec.value(),
                            "Cannot create log directory " + log_dir + ": " + ec.message());
    }

    const fs::path file = fs::path(log_dir) / kSwitchLogFileName;
    errno = 0;
    std::ofstream out(file, std::ios::app);
    if (!out.is_open()) {
        const int err = errno;
        return Result::Fail(ErrorKind::LogWriteFailed, err,
                            "Cannot open " + file.string() + (err ? std::string(": ") + std::strerror(err) : ""));
    }

    out << FormatSwitchLogLine(when, selection) << '\n';
    out.flush();
    if (!out) {
        return Result::Fail(ErrorKind::LogWriteFailed, "Write to " + file.string() + " failed");
    }

    LogDebug("Appended switch record to %s", file.string().c_str());
    return Result::Ok();
}

} // namespace jswitch
