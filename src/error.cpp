#include "mcpconf/error.hpp"

namespace mcpconf {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                         return "None";
        case ErrorKind::CorruptConfig:                return "CorruptConfig";
        case ErrorKind::BackupFailed:                 return "BackupFailed";
        case ErrorKind::PackageInstallFailed:         return "PackageInstallFailed";
        case ErrorKind::RegisteredAfterInstallFailed: return "RegisteredAfterInstallFailed";
        case ErrorKind::LockTimeout:                  return "LockTimeout";
        case ErrorKind::SaveFailed:                   return "SaveFailed";
        case ErrorKind::InvalidEntry:                 return "InvalidEntry";
        case ErrorKind::SnapshotNotFound:             return "SnapshotNotFound";
    }
    return "Unknown";
}

const char* to_string(Step step) {
    switch (step) {
        case Step::None:     return "none";
        case Step::Validate: return "validate";
        case Step::Lock:     return "lock";
        case Step::Backup:   return "backup";
        case Step::Load:     return "load";
        case Step::Install:  return "install";
        case Step::Mutate:   return "mutate";
        case Step::Save:     return "save";
    }
    return "unknown";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                         return exit_code::Success;
        case ErrorKind::CorruptConfig:                return exit_code::CorruptConfig;
        case ErrorKind::BackupFailed:                 return exit_code::BackupFailed;
        case ErrorKind::PackageInstallFailed:         return exit_code::PackageInstallFailed;
        case ErrorKind::RegisteredAfterInstallFailed: return exit_code::RegisteredAfterInstallFailed;
        case ErrorKind::LockTimeout:                  return exit_code::LockTimeout;
        case ErrorKind::SaveFailed:                   return exit_code::SaveFailed;
        case ErrorKind::InvalidEntry:                 return exit_code::InvalidEntry;
        case ErrorKind::SnapshotNotFound:             return exit_code::SnapshotNotFound;
    }
    return exit_code::Failure;
}

} // namespace mcpconf
