#pragma once

#include "jswitch/result.hpp"

#include <ctime>
#include <string>

namespace jswitch {

inline constexpr const char* kSwitchLogFileName = "java-switcher.log";

// "yyyy-MM-dd HH:mm:ss | JAVA_HOME set to <selection>" in local time, no newline.
std::string FormatSwitchLogLine(std::time_t when, const std::string& selection);

/**
 * Append one line for `selection` to <log_dir>/java-switcher.log, creating
 * log_dir if needed. Any failure is LogWriteFailed.
 */
Result AppendSwitchLog(const std::string& log_dir, const std::string& selection, std::time_t when);

} // namespace jswitch
