#pragma once

#include "jswitch/env_store.hpp"
#include "jswitch/path_rewriter.hpp"
#include "jswitch/result.hpp"

#include <optional>
#include <string>

namespace jswitch {

inline constexpr const char* kHomeVariable = "JAVA_HOME";
#ifdef _WIN32
inline constexpr const char* kPathVariable = "Path";
#else
inline constexpr const char* kPathVariable = "PATH";
#endif

struct MutatorOptions {
    EnvScope scope = EnvScope::Machine;
    std::string home_variable = kHomeVariable;
    std::string path_variable = kPathVariable;
    PathRules rules = NativePathRules();
};

/**
 * Writes the selected installation into the environment store.
 *
 * The two writes are independent: nothing is undone if the second one fails,
 * unless the caller restores the snapshot taken by SnapshotHome().
 */
class EnvironmentMutator {
public:
    EnvironmentMutator(IEnvironmentStore& store, MutatorOptions opt = {});

    // Remembers the current home value so RestoreHome() can put it back.
    Result SnapshotHome();
    Result RestoreHome();

    Result SetHome(const std::string& selection);

    // Replaces every <base_root>/<version>/bin entry with <selection>/bin at the front.
    Result UpdatePath(const std::string& base_root, const std::string& selection);

    const MutatorOptions& Options() const { return opt_; }

private:
    IEnvironmentStore& store_;
    MutatorOptions opt_;
    bool have_snapshot_ = false;
    std::optional<std::string> previous_home_;
};

} // namespace jswitch
