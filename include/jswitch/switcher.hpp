#pragma once

#include "jswitch/config.hpp"
#include "jswitch/env_mutator.hpp"
#include "jswitch/env_store.hpp"
#include "jswitch/result.hpp"

#include <ctime>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jswitch {

// Forward-only progress of one run. A failed run stops at the last state it reached.
enum class RunState {
    Start,
    Loaded,
    Listed,
    Selected,
    HomeSet,
    PathUpdated,
    Logged,
    Done
};

const char* ToString(RunState state);

struct RunReport {
    RunState state = RunState::Start;
    Result result;                        // first fatal error, Ok on success
    std::optional<std::string> selection; // set once a candidate was chosen
    std::vector<Result> warnings;         // non-fatal, e.g. LogWriteFailed

    // Home variable was changed but the path variable was not.
    bool inconsistent = false;
    // Outcome of restoring the home variable, when that was attempted.
    std::optional<Result> restore;

    bool ok() const { return result.ok; }
    int ExitCode() const;
};

struct SwitchOptions {
    MutatorOptions mutator;
    // Put the previous home value back if the path update fails.
    bool restore_on_failure = false;
    std::function<std::time_t()> clock = [] { return std::time(nullptr); };
};

/**
 * Config -> list -> prompt -> JAVA_HOME -> PATH -> switch log.
 *
 * User-facing text (listing, prompt, confirmation) goes to `out`; the choice
 * is read from `in`. Fatal errors are returned in the RunReport for the caller
 * to print. Progress and non-fatal warnings go to the console logger.
 */
class Switcher {
public:
    Switcher(std::unique_ptr<IEnvironmentStore> store, std::istream& in, std::ostream& out,
             SwitchOptions opt = {});

    RunReport Run(const std::string& config_path);
    RunReport RunWithConfig(const Config& config);

private:
    void PrintPrompt(size_t count, const std::optional<std::string>& default_version);
    void PrintConfirmation(const RunReport& report);

    std::unique_ptr<IEnvironmentStore> m_store;
    std::istream& m_in;
    std::ostream& m_out;
    SwitchOptions m_opt;
};

} // namespace jswitch
