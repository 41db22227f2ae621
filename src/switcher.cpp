#include "jswitch/switcher.hpp"
#include "jswitch/discovery.hpp"
#include "jswitch/lister.hpp"
#include "jswitch/logger.hpp"
#include "jswitch/selector.hpp"
#include "jswitch/switch_log.hpp"

namespace jswitch {

const char* ToString(RunState state) {
    switch (state) {
        case RunState::Start:       return "Start";
        case RunState::Loaded:      return "Loaded";
        case RunState::Listed:      return "Listed";
        case RunState::Selected:    return "Selected";
        case RunState::HomeSet:     return "HomeSet";
        case RunState::PathUpdated: return "PathUpdated";
        case RunState::Logged:      return "Logged";
        case RunState::Done:        return "Done";
    }
    return "Unknown";
}

int RunReport::ExitCode() const {
    if (result.ok) return kExitOk;
    if (inconsistent) return kExitPartialUpdate;
    return ExitCodeFor(result.kind);
}

Switcher::Switcher(std::unique_ptr<IEnvironmentStore> store, std::istream& in, std::ostream& out,
                   SwitchOptions opt)
    : m_store(std::move(store)), m_in(in), m_out(out), m_opt(std::move(opt)) {}

RunReport Switcher::Run(const std::string& config_path) {
    Config config;
    if (auto r = LoadConfig(config_path, config); !r.ok) {
        RunReport report;
        report.result = std::move(r);
        return report;
    }
    return RunWithConfig(config);
}

RunReport Switcher::RunWithConfig(const Config& config) {
    RunReport report;
    report.state = RunState::Loaded;

    // 1. Discovery + listing
    std::vector<Candidate> candidates;
    if (auto r = DiscoverInstallations(config.base_directory, candidates); !r.ok) {
        report.result = std::move(r);
        return report;
    }
    PrintListing(m_out, candidates, config.default_version);
    report.state = RunState::Listed;

    // 2. Selection
    PrintPrompt(candidates.size(), config.default_version);
    Candidate chosen;
    if (auto r = ReadSelection(m_in, candidates, config.default_version, chosen); !r.ok) {
        report.result = std::move(r);
        return report;
    }
    const std::string selection = chosen.path;
    report.selection = selection;
    report.state = RunState::Selected;
    LogInfo("Selected %s (%s)", chosen.name.c_str(), selection.c_str());

    // 3. Environment
    EnvironmentMutator mutator(*m_store, m_opt.mutator);
    if (m_opt.restore_on_failure) {
        if (auto r = mutator.SnapshotHome(); !r.ok) {
            report.result = std::move(r);
            return report;
        }
    }

    if (auto r = mutator.SetHome(selection); !r.ok) {
        report.result = std::move(r);
        return report;
    }
    report.state = RunState::HomeSet;

    if (auto r = mutator.UpdatePath(config.base_directory, selection); !r.ok) {
        report.result = std::move(r);
        report.inconsistent = true;
        if (m_opt.restore_on_failure) {
            report.restore = mutator.RestoreHome();
            report.inconsistent = !report.restore->ok;
            // Home value is back to what it was before the run.
            if (report.restore->ok) report.state = RunState::Selected;
        }
        return report;
    }
    report.state = RunState::PathUpdated;

    // 4. Switch log, failures are warnings only
    if (config.log_directory) {
        if (auto r = AppendSwitchLog(*config.log_directory, selection, m_opt.clock()); !r.ok) {
            LogWarn("Switch was applied but could not be logged: %s", r.msg.c_str());
            report.warnings.push_back(std::move(r));
        }
    }
    report.state = RunState::Logged;

    PrintConfirmation(report);
    report.state = RunState::Done;
    return report;
}

void Switcher::PrintPrompt(size_t count, const std::optional<std::string>& default_version) {
    m_out << "Select a version [1-" << count << "]";
    if (default_version) {
        m_out << " (Enter for default " << *default_version << ")";
    }
    m_out << ": ";
    m_out.flush();
}

void Switcher::PrintConfirmation(const RunReport& report) {
    const auto& mo = m_opt.mutator;
    m_out << mo.home_variable << " set to " << *report.selection << '\n'
          << mo.path_variable << " now starts with " << BinDirFor(*report.selection, mo.rules) << '\n'
          << "Open a new terminal for the change to take effect; running shells keep the old values.\n";
    m_out.flush();
}

} // namespace jswitch
