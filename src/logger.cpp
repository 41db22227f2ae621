#include "jswitch/logger.hpp"

#include <cstdarg>
#include <cstdio>

namespace jswitch {

namespace {

bool g_verbose = false;

void VLog(const char* level, const char* fmt, va_list ap) {
    std::fprintf(stderr, "[%s] ", level);
    std::vfprintf(stderr, fmt, ap);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

} // namespace

void SetVerbose(bool enabled) { g_verbose = enabled; }
bool IsVerbose() { return g_verbose; }

void LogDebug(const char* fmt, ...) {
    if (!g_verbose) return;
    va_list ap;
    va_start(ap, fmt);
    VLog("DEBUG", fmt, ap);
    va_end(ap);
}

void LogInfo(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLog("INFO ", fmt, ap);
    va_end(ap);
}

void LogWarn(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLog("WARN ", fmt, ap);
    va_end(ap);
}

void LogError(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLog("ERROR", fmt, ap);
    va_end(ap);
}

} // namespace jswitch
