#pragma once

#include <string>
#include <utility>

namespace jswitch {

enum class ErrorKind {
    None,
    ConfigNotFound,
    ConfigParseError,
    MissingRequiredField,
    BaseDirectoryNotFound,
    NoInstallationsFound,
    InvalidSelection,
    NoSelectionAndNoDefault,
    EnvironmentWritePermissionDenied,
    EnvironmentStoreError,
    LogWriteFailed, // warning only
};

const char* ToString(ErrorKind kind);

// Process exit code for a failed run, grouped by error family.
int ExitCodeFor(ErrorKind kind);

inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitConfig = 3;
inline constexpr int kExitDiscovery = 4;
inline constexpr int kExitSelection = 5;
inline constexpr int kExitEnvironment = 6;
inline constexpr int kExitPartialUpdate = 7;

struct Result {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    int code = 0; // errno or Win32 error, 0 if not applicable
    std::string msg;

    static Result Ok() { return Result{}; }

    static Result Fail(ErrorKind kind, std::string msg) {
        return Fail(kind, 0, std::move(msg));
    }

    static Result Fail(ErrorKind kind, int code, std::string msg) {
        Result r;
        r.ok = false;
        r.kind = kind;
        r.code = code;
        r.msg = std::move(msg);
        return r;
    }

    bool is_ok() const { return ok; }
};

} // namespace jswitch
