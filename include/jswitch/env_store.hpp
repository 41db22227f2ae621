#pragma once

#include "jswitch/result.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace jswitch {

enum class EnvScope { Process, User, Machine };

const char* ToString(EnvScope scope);

/**
 * Access to persistent environment variables.
 *
 * Writes are durable but only reach processes started afterwards. A missing
 * variable is reported as Ok with an empty optional, not as an error.
 */
class IEnvironmentStore {
public:
    virtual ~IEnvironmentStore() = default;

    virtual Result GetVariable(EnvScope scope, const std::string& name, std::optional<std::string>& value) = 0;
    virtual Result SetVariable(EnvScope scope, const std::string& name, const std::string& value) = 0;
    virtual Result UnsetVariable(EnvScope scope, const std::string& name) = 0;
};

// In-memory store for tests.
class MemoryEnvironmentStore final : public IEnvironmentStore {
public:
    Result GetVariable(EnvScope scope, const std::string& name, std::optional<std::string>& value) override;
    Result SetVariable(EnvScope scope, const std::string& name, const std::string& value) override;
    Result UnsetVariable(EnvScope scope, const std::string& name) override;

    // Makes the next SetVariable of `name` fail with the given error.
    void FailWritesTo(const std::string& name, ErrorKind kind = ErrorKind::EnvironmentWritePermissionDenied);

    size_t WriteCount() const { return writes_; }

private:
    std::map<std::pair<EnvScope, std::string>, std::string> vars_;
    std::map<std::string, ErrorKind> failing_;
    size_t writes_ = 0;
};

// getenv/setenv on the running process. Only EnvScope::Process is supported.
class ProcessEnvironmentStore final : public IEnvironmentStore {
public:
    Result GetVariable(EnvScope scope, const std::string& name, std::optional<std::string>& value) override;
    Result SetVariable(EnvScope scope, const std::string& name, const std::string& value) override;
    Result UnsetVariable(EnvScope scope, const std::string& name) override;
};

#ifndef _WIN32
inline constexpr const char* kDefaultEnvironmentFile = "/etc/environment";

// EACCES, EPERM and EROFS are EnvironmentWritePermissionDenied, anything else EnvironmentStoreError.
ErrorKind KindForErrno(int err);

/**
 * Machine scope backed by a pam_env style file (KEY=value or KEY="value" per line).
 *
 * Comments and unrelated lines are preserved. Each write replaces the file
 * atomically through a temporary file and rename(). Values containing a
 * double quote or a line break are rejected. Variables listed with
 * FallbackToProcess() read the process value when the file has no entry.
 */
class EnvironmentFileStore final : public IEnvironmentStore {
public:
    explicit EnvironmentFileStore(std::string path = kDefaultEnvironmentFile);

    void FallbackToProcess(const std::string& name);

    Result GetVariable(EnvScope scope, const std::string& name, std::optional<std::string>& value) override;
    Result SetVariable(EnvScope scope, const std::string& name, const std::string& value) override;
    Result UnsetVariable(EnvScope scope, const std::string& name) override;

    const std::string& Path() const { return path_; }

private:
    Result Rewrite(const std::string& name, const std::optional<std::string>& value);

    std::string path_;
    std::set<std::string> process_fallback_;
};
#endif

/**
 * The store for machine-scope variables on this platform: the registry on
 * Windows, `env_file` (default /etc/environment) elsewhere.
 */
std::unique_ptr<IEnvironmentStore> MakeSystemEnvironmentStore(const std::string& env_file,
                                                              const std::string& path_variable);

} // namespace jswitch
