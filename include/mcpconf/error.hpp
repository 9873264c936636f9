#pragma once
#include <stdexcept>
#include <string>

namespace mcpconf {

enum class ErrorKind {
    None,
    CorruptConfig,
    BackupFailed,
    PackageInstallFailed,
    RegisteredAfterInstallFailed,
    LockTimeout,
    SaveFailed,
    InvalidEntry,
    SnapshotNotFound
};

/// The step of an operation that produced a failure.
enum class Step {
    None,
    Validate,
    Lock,
    Backup,
    Load,
    Install,
    Mutate,
    Save
};

const char* to_string(ErrorKind kind);
const char* to_string(Step step);

class ConfigError : public std::runtime_error {
public:
    ErrorKind kind;
    ConfigError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind(kind) {}
};

class CorruptConfigError : public ConfigError {
public:
    explicit CorruptConfigError(const std::string& msg)
        : ConfigError(ErrorKind::CorruptConfig, msg) {}
};

class BackupFailedError : public ConfigError {
public:
    explicit BackupFailedError(const std::string& msg)
        : ConfigError(ErrorKind::BackupFailed, msg) {}
};

class SaveFailedError : public ConfigError {
public:
    explicit SaveFailedError(const std::string& msg)
        : ConfigError(ErrorKind::SaveFailed, msg) {}
};

class LockTimeoutError : public ConfigError {
public:
    explicit LockTimeoutError(const std::string& msg)
        : ConfigError(ErrorKind::LockTimeout, msg) {}
};

class PackageInstallError : public ConfigError {
public:
    explicit PackageInstallError(const std::string& msg)
        : ConfigError(ErrorKind::PackageInstallFailed, msg) {}
};

class InvalidEntryError : public ConfigError {
public:
    explicit InvalidEntryError(const std::string& msg)
        : ConfigError(ErrorKind::InvalidEntry, msg) {}
};

class SnapshotNotFoundError : public ConfigError {
public:
    explicit SnapshotNotFoundError(const std::string& msg)
        : ConfigError(ErrorKind::SnapshotNotFound, msg) {}
};

/// Process exit codes of the command-line front end, one range per error kind.
namespace exit_code {
    constexpr int Success                      = 0;
    constexpr int Failure                      = 1;
    constexpr int Usage                        = 2;
    constexpr int CorruptConfig                = 10;
    constexpr int BackupFailed                 = 20;
    constexpr int PackageInstallFailed         = 30;
    constexpr int RegisteredAfterInstallFailed = 40;
    constexpr int LockTimeout                  = 50;
    constexpr int SaveFailed                   = 60;
    constexpr int InvalidEntry                 = 70;
    constexpr int SnapshotNotFound             = 80;
    constexpr int LaunchFailed                 = 90;
} // namespace exit_code

int exit_code_for(ErrorKind kind);

} // namespace mcpconf
