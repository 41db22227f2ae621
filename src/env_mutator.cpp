#include "jswitch/env_mutator.hpp"
#include "jswitch/logger.hpp"

namespace jswitch {

EnvironmentMutator::EnvironmentMutator(IEnvironmentStore& store, MutatorOptions opt)
    : store_(store), opt_(std::move(opt)) {}

Result EnvironmentMutator::SnapshotHome() {
    auto r = store_.GetVariable(opt_.scope, opt_.home_variable, previous_home_);
    if (!r.ok) return r;
    have_snapshot_ = true;
    LogDebug("Snapshot %s=%s", opt_.home_variable.c_str(), previous_home_.value_or("<unset>").c_str());
    return Result::Ok();
}

Result EnvironmentMutator::RestoreHome() {
    if (!have_snapshot_) {
        return Result::Fail(ErrorKind::EnvironmentStoreError, "No snapshot of " + opt_.home_variable + " to restore");
    }
    if (previous_home_) {
        return store_.SetVariable(opt_.scope, opt_.home_variable, *previous_home_);
    }
    return store_.UnsetVariable(opt_.scope, opt_.home_variable);
}

Result EnvironmentMutator::SetHome(const std::string& selection) {
    LogDebug("Setting %s (%s scope) to %s", opt_.home_variable.c_str(), ToString(opt_.scope), selection.c_str());
    auto r = store_.SetVariable(opt_.scope, opt_.home_variable, selection);
    if (!r.ok) {
        r.msg = "Failed to set " + opt_.home_variable + ": " + r.msg;
    }
    return r;
}

Result EnvironmentMutator::UpdatePath(const std::string& base_root, const std::string& selection) {
    std::optional<std::string> current;
    auto r = store_.GetVariable(opt_.scope, opt_.path_variable, current);
    if (!r.ok) {
        r.msg = "Failed to read " + opt_.path_variable + ": " + r.msg;
        return r;
    }

    const std::string updated = RewriteSearchPath(current.value_or(""), base_root, selection, opt_.rules);
    LogDebug("%s: %s -> %s", opt_.path_variable.c_str(), current.value_or("<unset>").c_str(), updated.c_str());

    r = store_.SetVariable(opt_.scope, opt_.path_variable, updated);
    if (!r.ok) {
        r.msg = "Failed to set " + opt_.path_variable + ": " + r.msg;
    }
    return r;
}

} // namespace jswitch
