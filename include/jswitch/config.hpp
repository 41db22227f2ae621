#pragma once

#include "jswitch/result.hpp"

#include <optional>
#include <string>

namespace jswitch {

inline constexpr const char* kConfigRelativePath = "../config/config.json";

// Contents of config.json. Loaded once, never modified afterwards.
struct Config {
    std::string base_directory;                 // "JavaBase", required
    std::optional<std::string> log_directory;   // "LogPath"
    std::optional<std::string> default_version; // "DefaultVersion"
};

/**
 * Load and validate the configuration file.
 *
 * Fails with ConfigNotFound if the file cannot be opened, ConfigParseError if it
 * is not a JSON object (or a known field has the wrong type), and
 * MissingRequiredField if "JavaBase" is absent or empty.
 */
Result LoadConfig(const std::string& path, Config& out);

// Same validation as LoadConfig, for text already in memory.
Result ParseConfig(const std::string& text, Config& out);

// <directory of the running executable>/../config/config.json
std::string DefaultConfigPath(const char* argv0);

} // namespace jswitch
