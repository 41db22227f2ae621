#include "jswitch/result.hpp"

namespace jswitch {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                             return "None";
        case ErrorKind::ConfigNotFound:                   return "ConfigNotFound";
        case ErrorKind::ConfigParseError:                 return "ConfigParseError";
        case ErrorKind::MissingRequiredField:             return "MissingRequiredField";
        case ErrorKind::BaseDirectoryNotFound:            return "BaseDirectoryNotFound";
        case ErrorKind::NoInstallationsFound:             return "NoInstallationsFound";
        case ErrorKind::InvalidSelection:                 return "InvalidSelection";
        case ErrorKind::NoSelectionAndNoDefault:          return "NoSelectionAndNoDefault";
        case ErrorKind::EnvironmentWritePermissionDenied: return "EnvironmentWritePermissionDenied";
        case ErrorKind::EnvironmentStoreError:            return "EnvironmentStoreError";
        case ErrorKind::LogWriteFailed:                   return "LogWriteFailed";
    }
    return "Unknown";
}

int ExitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
        case ErrorKind::LogWriteFailed:
            return kExitOk;
        case ErrorKind::ConfigNotFound:
        case ErrorKind::ConfigParseError:
        case ErrorKind::MissingRequiredField:
            return kExitConfig;
        case ErrorKind::BaseDirectoryNotFound:
        case ErrorKind::NoInstallationsFound:
            return kExitDiscovery;
        case ErrorKind::InvalidSelection:
        case ErrorKind::NoSelectionAndNoDefault:
            return kExitSelection;
        case ErrorKind::EnvironmentWritePermissionDenied:
        case ErrorKind::EnvironmentStoreError:
            return kExitEnvironment;
    }
    return 1;
}

} // namespace jswitch
