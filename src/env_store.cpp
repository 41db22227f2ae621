#include "jswitch/env_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace jswitch {

const char* ToString(EnvScope scope) {
    switch (scope) {
        case EnvScope::Process: return "process";
        case EnvScope::User:    return "user";
        case EnvScope::Machine: return "machine";
    }
    return "unknown";
}

Result MemoryEnvironmentStore::GetVariable(EnvScope scope, const std::string& name,
                                           std::optional<std::string>& value) {
    auto it = vars_.find({scope, name});
    if (it == vars_.end()) {
        value.reset();
    } else {
        value = it->second;
    }
    return Result::Ok();
}

Result MemoryEnvironmentStore::SetVariable(EnvScope scope, const std::string& name, const std::string& value) {
    if (auto it = failing_.find(name); it != failing_.end()) {
        const ErrorKind kind = it->second;
        failing_.erase(it);
        return Result::Fail(kind, EACCES, "Injected write failure for " + name);
    }
    vars_[{scope, name}] = value;
    ++writes_;
    return Result::Ok();
}

Result MemoryEnvironmentStore::UnsetVariable(EnvScope scope, const std::string& name) {
    vars_.erase({scope, name});
    ++writes_;
    return Result::Ok();
}

void MemoryEnvironmentStore::FailWritesTo(const std::string& name, ErrorKind kind) {
    failing_[name] = kind;
}

Result ProcessEnvironmentStore::GetVariable(EnvScope scope, const std::string& name,
                                            std::optional<std::string>& value) {
    if (scope != EnvScope::Process) {
        return Result::Fail(ErrorKind::EnvironmentStoreError,
                            std::string("Unsupported scope for process store: ") + ToString(scope));
    }
    const char* v = std::getenv(name.c_str());
    if (v) {
        value = v;
    } else {
        value.reset();
    }
    return Result::Ok();
}

Result ProcessEnvironmentStore::SetVariable(EnvScope scope, const std::string& name, const std::string& value) {
    if (scope != EnvScope::Process) {
        return Result::Fail(ErrorKind::EnvironmentStoreError,
                            std::string("Unsupported scope for process store: ") + ToString(scope));
    }
#ifdef _WIN32
    if (::_putenv_s(name.c_str(), value.c_str()) != 0) {
#else
    if (::setenv(name.c_str(), value.c_str(), 1) != 0) {
#endif
        const int err = errno;
        return Result::Fail(ErrorKind::EnvironmentStoreError, err,
                            "setenv " + name + " failed: " + std::strerror(err));
    }
    return Result::Ok();
}

Result ProcessEnvironmentStore::UnsetVariable(EnvScope scope, const std::string& name) {
    if (scope != EnvScope::Process) {
        return Result::Fail(ErrorKind::EnvironmentStoreError,
                            std::string("Unsupported scope for process store: ") + ToString(scope));
    }
#ifdef _WIN32
    if (::_putenv_s(name.c_str(), "") != 0) {
#else
    if (::unsetenv(name.c_str()) != 0) {
#endif
        const int err = errno;
        return Result::Fail(ErrorKind::EnvironmentStoreError, err,
                            "unsetenv " + name + " failed: " + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace jswitch
