#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define JSWITCH_PRINTF_FORMAT(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define JSWITCH_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

namespace jswitch {

void SetVerbose(bool enabled);
bool IsVerbose();

// printf-style console diagnostics, written to stderr.
void LogDebug(const char* fmt, ...) JSWITCH_PRINTF_FORMAT(1, 2);
void LogInfo(const char* fmt, ...) JSWITCH_PRINTF_FORMAT(1, 2);
void LogWarn(const char* fmt, ...) JSWITCH_PRINTF_FORMAT(1, 2);
void LogError(const char* fmt, ...) JSWITCH_PRINTF_FORMAT(1, 2);

} // namespace jswitch
