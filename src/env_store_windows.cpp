#include "jswitch/env_store.hpp"
#include "jswitch/logger.hpp"

#include <windows.h>

#include <cstring>
#include <memory>
#include <type_traits>
#include <vector>

namespace jswitch {

namespace {

constexpr const char* kMachineKey = "SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment";
constexpr const char* kUserKey = "Environment";

struct HKeyDeleter {
    void operator()(HKEY k) const {
        if (k) ::RegCloseKey(k);
    }
};
using UniqueHKey = std::unique_ptr<std::remove_pointer_t<HKEY>, HKeyDeleter>;

Result FailWin32(LONG err, const std::string& what) {
    const ErrorKind kind = (err == ERROR_ACCESS_DENIED) ? ErrorKind::EnvironmentWritePermissionDenied
                                                        : ErrorKind::EnvironmentStoreError;
    return Result::Fail(kind, static_cast<int>(err), what + " (Win32 error " + std::to_string(err) + ")");
}

Result OpenKey(EnvScope scope, REGSAM access, UniqueHKey& out) {
    HKEY root = nullptr;
    const char* sub = nullptr;
    switch (scope) {
        case EnvScope::Machine: root = HKEY_LOCAL_MACHINE; sub = kMachineKey; break;
        case EnvScope::User:    root = HKEY_CURRENT_USER;  sub = kUserKey;    break;
        case EnvScope::Process:
            return Result::Fail(ErrorKind::EnvironmentStoreError, "Registry store does not hold process scope");
    }

    HKEY key = nullptr;
    const LONG rc = ::RegOpenKeyExA(root, sub, 0, access, &key);
    if (rc != ERROR_SUCCESS) {
        return FailWin32(rc, std::string("RegOpenKeyEx ") + sub + " failed");
    }
    out.reset(key);
    return Result::Ok();
}

void BroadcastEnvironmentChange() {
    DWORD_PTR unused = 0;
    ::SendMessageTimeoutA(HWND_BROADCAST, WM_SETTINGCHANGE, 0,
                          reinterpret_cast<LPARAM>("Environment"),
                          SMTO_ABORTIFHUNG, 5000, &unused);
}

// Windows keeps Path as REG_EXPAND_SZ; keep that type for variables holding '%'.
DWORD ValueTypeFor(const std::string& name, const std::string& value) {
    if (_stricmp(name.c_str(), "Path") == 0) return REG_EXPAND_SZ;
    return value.find('%') != std::string::npos ? REG_EXPAND_SZ : REG_SZ;
}

class RegistryEnvironmentStore final : public IEnvironmentStore {
public:
    Result GetVariable(EnvScope scope, const std::string& name, std::optional<std::string>& value) override {
        value.reset();
        UniqueHKey key;
        if (auto r = OpenKey(scope, KEY_QUERY_VALUE, key); !r.ok) return r;

        DWORD type = 0;
        DWORD size = 0;
        LONG rc = ::RegQueryValueExA(key.get(), name.c_str(), nullptr, &type, nullptr, &size);
        if (rc == ERROR_FILE_NOT_FOUND) return Result::Ok();
        if (rc != ERROR_SUCCESS) return FailWin32(rc, "RegQueryValueEx " + name + " failed");

        std::vector<char> buf(size + 1, '\0');
        rc = ::RegQueryValueExA(key.get(), name.c_str(), nullptr, &type,
                                reinterpret_cast<LPBYTE>(buf.data()), &size);
        if (rc != ERROR_SUCCESS) return FailWin32(rc, "RegQueryValueEx " + name + " failed");

        // Stored strings include their terminator.
        value = std::string(buf.data());
        return Result::Ok();
    }

    Result SetVariable(EnvScope scope, const std::string& name, const std::string& value) override {
        UniqueHKey key;
        if (auto r = OpenKey(scope, KEY_SET_VALUE, key); !r.ok) return r;

        const LONG rc = ::RegSetValueExA(key.get(), name.c_str(), 0, ValueTypeFor(name, value),
                                         reinterpret_cast<const BYTE*>(value.c_str()),
                                         static_cast<DWORD>(value.size() + 1));
        if (rc != ERROR_SUCCESS) return FailWin32(rc, "RegSetValueEx " + name + " failed");

        BroadcastEnvironmentChange();
        LogDebug("Set %s (%s scope) in registry", name.c_str(), ToString(scope));
        return Result::Ok();
    }

    Result UnsetVariable(EnvScope scope, const std::string& name) override {
        UniqueHKey key;
        if (auto r = OpenKey(scope, KEY_SET_VALUE, key); !r.ok) return r;

        const LONG rc = ::RegDeleteValueA(key.get(), name.c_str());
        if (rc != ERROR_SUCCESS && rc != ERROR_FILE_NOT_FOUND) {
            return FailWin32(rc, "RegDeleteValue " + name + " failed");
        }

        BroadcastEnvironmentChange();
        return Result::Ok();
    }
};

} // namespace

std::unique_ptr<IEnvironmentStore> MakeSystemEnvironmentStore(const std::string& env_file,
                                                              const std::string& /*path_variable*/) {
    if (!env_file.empty()) {
        LogWarn("--env-file is ignored on Windows; using the registry");
    }
    return std::make_unique<RegistryEnvironmentStore>();
}

} // namespace jswitch
